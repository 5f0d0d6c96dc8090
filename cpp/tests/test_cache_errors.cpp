/**
 * Error handling: rejected misuse and rollback of abandoned passes.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <recache/runtime/cache.h>

#include <stdexcept>
#include <string>

using namespace recache;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("Cache errors - a pass cannot start while another runs", "[errors][reentrancy]") {
    Cache cache;
    REQUIRE_THROWS_AS(cache.run_pass([&](CacheContext &) { cache.run_pass([](CacheContext &) {}); }),
                      ReentrancyError);
    REQUIRE_FALSE(cache.in_pass());
    REQUIRE(cache.generation() == 0);

    cache.run_pass([](CacheContext &) {});
    REQUIRE(cache.generation() == 1);
}

TEST_CASE("Cache errors - state handles are readable only during their pass", "[errors][stale]") {
    Cache cache;
    StateHandle<int> handle;
    cache.run_pass([&](CacheContext &ctx) {
        handle = ctx.state(CallSiteId{1}, [] { return 4; });
        REQUIRE(handle.readable());
        REQUIRE(*handle == 4);
    });

    REQUIRE_FALSE(handle.readable());
    REQUIRE_THROWS_AS(handle.get(), StaleHandleError);
    REQUIRE_THROWS_AS(cache.run_pass([&](CacheContext &) { return handle.get(); }), StaleHandleError);

    SECTION("writes through an old handle are still queued") {
        handle.set(9);
        auto value = cache.run_pass([](CacheContext &ctx) { return ctx.state(CallSiteId{1}, [] { return 4; }).get(); });
        REQUIRE(value == 9);
    }
}

TEST_CASE("Cache errors - unterminated groups", "[errors][usage]") {
    Cache cache;

    SECTION("at the end of the pass") {
        REQUIRE_THROWS_WITH(cache.run_pass([](CacheContext &ctx) { ctx.begin_group(CallSiteId{1}); }),
                            ContainsSubstring("[UsageError]") && ContainsSubstring("not closed"));
    }

    SECTION("at the end of a group body") {
        REQUIRE_THROWS_AS(cache.run_pass([](CacheContext &ctx) {
                              ctx.group(CallSiteId{1}, [](CacheContext &c) { c.begin_group(CallSiteId{2}); });
                          }),
                          UsageError);
    }

    REQUIRE(cache.slot_count() == 0);
    REQUIRE(cache.group_count() == 0);
    REQUIRE(cache.generation() == 0);
}

TEST_CASE("Cache errors - an abandoned pass leaves no trace", "[errors][rollback]") {
    Cache cache;
    StateSetter<int> setter;
    bool fail = false;
    int hooks = 0;
    auto root = [&](CacheContext &ctx) {
        auto value = ctx.state(CallSiteId{1}, [] { return 0; });
        setter = value.setter();
        ctx.memoize(CallSiteId{2}, fail, [&](CacheContext &c) {
            if (!fail) {
                c.group(CallSiteId{3}, [&](CacheContext &g) { g.on_teardown([&] { ++hooks; }); });
            } else {
                c.group(CallSiteId{4}, [](CacheContext &g) { g.state(CallSiteId{5}, [] { return 1.5; }); });
            }
        });
        auto result = ctx.group(CallSiteId{6}, [value](CacheContext &) { return value.get(); });
        if (fail) { throw std::runtime_error("abort"); }
        return result;
    };

    REQUIRE(cache.run_pass(root) == 0);
    auto before = cache.dump_string();
    auto groups = cache.group_count();
    auto cells = cache.cell_count();

    setter.set(5);
    fail = true;
    REQUIRE_THROWS_WITH(cache.run_pass(root), "abort");

    REQUIRE(cache.dump_string() == before);
    REQUIRE(cache.generation() == 1);
    REQUIRE(cache.group_count() == groups);
    REQUIRE(cache.cell_count() == cells);
    REQUIRE(hooks == 0);
    REQUIRE(cache.has_pending_mutations());

    fail = false;
    REQUIRE(cache.run_pass(root) == 5);
    REQUIRE(cache.generation() == 2);
    REQUIRE(hooks == 0);
    REQUIRE(cache.last_pass_statistics().skipped == 1);
}

TEST_CASE("Cache errors - the error taxonomy", "[errors]") {
    UsageError usage{"bad"};
    ReentrancyError reentrancy{"again"};
    StaleHandleError stale{"old"};

    REQUIRE(usage.kind() == CacheErrorKind::Usage);
    REQUIRE(reentrancy.kind() == CacheErrorKind::Reentrancy);
    REQUIRE(stale.kind() == CacheErrorKind::StaleHandle);
    REQUIRE(std::string{usage.what()} == "[UsageError] bad");
    REQUIRE(fmt::format("{}", CacheErrorKind::StaleHandle) == "StaleHandleError");

    const CacheError &base = stale;
    REQUIRE(dynamic_cast<const std::runtime_error *>(&base) != nullptr);
}
