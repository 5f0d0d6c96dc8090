/**
 * Tests of the CacheContext API: state, groups, memoization, identity.
 */

#include <catch2/catch_test_macros.hpp>
#include <recache/runtime/cache.h>

#include <map>
#include <string>
#include <vector>

using namespace recache;

TEST_CASE("CacheContext - state survives passes and is initialised once", "[context][state]") {
    Cache cache;
    int inits = 0;
    StateSetter<int> setter;
    auto root = [&](CacheContext &ctx) {
        auto count = ctx.state(CallSiteId{1}, [&] {
            ++inits;
            return 10;
        });
        setter = count.setter();
        return count.get();
    };

    REQUIRE(cache.run_pass(root) == 10);
    REQUIRE(cache.run_pass(root) == 10);
    REQUIRE(inits == 1);
    REQUIRE(cache.cell_count() == 1);

    setter.set(11);
    REQUIRE(cache.has_pending_mutations());
    REQUIRE(cache.run_pass(root) == 11);
    REQUIRE_FALSE(cache.has_pending_mutations());
    REQUIRE(cache.last_pass_statistics().mutations_applied == 1);

    setter.update([](int &v) { v += 5; });
    REQUIRE(cache.run_pass(root) == 16);
    REQUIRE(inits == 1);
}

TEST_CASE("CacheContext - writes made during a pass are seen by the next pass", "[context][state]") {
    Cache cache;
    auto root = [](CacheContext &ctx) {
        auto counter = ctx.state(CallSiteId{1}, [] { return 0; });
        int seen = counter.get();
        if (seen < 3) { counter.set(seen + 1); }
        // Never visible in the pass that wrote it
        REQUIRE(counter.get() == seen);
        return seen;
    };

    REQUIRE(cache.run_pass(root) == 0);
    REQUIRE(cache.run_pass(root) == 1);
    REQUIRE(cache.run_until_settled(root) == 3);
    REQUIRE_FALSE(cache.has_pending_mutations());
    REQUIRE(cache.generation() == 4);

    SECTION("run_until_settled stops at max_passes") {
        auto restless = [](CacheContext &ctx) {
            auto counter = ctx.state(CallSiteId{1}, [] { return 0; });
            counter.set(counter.get() + 1);
            return counter.get();
        };
        Cache other;
        REQUIRE(other.run_until_settled(restless, 3) == 2);
        REQUIRE(other.has_pending_mutations());
        REQUIRE(other.generation() == 3);
    }
}

TEST_CASE("CacheContext - state type change creates a fresh cell", "[context][state][schema]") {
    Cache cache;
    bool as_text = false;
    int inits = 0;
    auto root = [&](CacheContext &ctx) -> std::string {
        if (as_text) {
            return ctx.state(CallSiteId{1}, [&] {
                ++inits;
                return std::string{"text"};
            }).get();
        }
        return std::to_string(ctx.state(CallSiteId{1}, [&] {
            ++inits;
            return 7;
        }).get());
    };

    REQUIRE(cache.run_pass(root) == "7");
    as_text = true;
    REQUIRE(cache.run_pass(root) == "text");
    REQUIRE(inits == 2);
    REQUIRE(cache.cell_count() == 1);
}

TEST_CASE("CacheContext - changed compares with the previous pass", "[context][changed]") {
    Cache cache;
    int input = 1;
    auto root = [&](CacheContext &ctx) { return ctx.changed(CallSiteId{1}, input); };

    REQUIRE(cache.run_pass(root));
    REQUIRE_FALSE(cache.run_pass(root));
    input = 2;
    REQUIRE(cache.run_pass(root));
    REQUIRE_FALSE(cache.run_pass(root));
}

TEST_CASE("CacheContext - unchanged groups are skipped", "[context][group]") {
    Cache cache;
    int runs = 0;
    auto root = [&](CacheContext &ctx) {
        return ctx.group(CallSiteId{1}, [&](CacheContext &) {
            ++runs;
            return 5;
        });
    };

    REQUIRE(cache.run_pass(root) == 5);
    REQUIRE(cache.last_pass_statistics().evaluated == 1);
    REQUIRE(cache.last_pass_statistics().created == 1);

    REQUIRE(cache.run_pass(root) == 5);
    REQUIRE(runs == 1);
    REQUIRE(cache.last_pass_statistics().evaluated == 0);
    REQUIRE(cache.last_pass_statistics().skipped == 1);
}

TEST_CASE("CacheContext - a group re-runs when a state it read is written", "[context][group]") {
    Cache cache;
    int runs = 0;
    StateSetter<int> setter;
    auto root = [&](CacheContext &ctx) {
        auto value = ctx.state(CallSiteId{1}, [] { return 1; });
        setter = value.setter();
        return ctx.group(CallSiteId{2}, [&runs, value](CacheContext &) {
            ++runs;
            return value.get() * 2;
        });
    };

    REQUIRE(cache.run_pass(root) == 2);
    REQUIRE(cache.run_pass(root) == 2);
    REQUIRE(runs == 1);

    setter.set(5);
    REQUIRE(cache.run_pass(root) == 10);
    REQUIRE(runs == 2);
    REQUIRE(cache.run_pass(root) == 10);
    REQUIRE(runs == 2);
}

TEST_CASE("CacheContext - memoize re-runs on different arguments", "[context][memoize]") {
    Cache cache;
    int n = 3;
    int outer = 0;
    int inner = 0;
    auto root = [&](CacheContext &ctx) {
        return ctx.memoize(CallSiteId{1}, n, [&](CacheContext &c) {
            ++outer;
            c.group(CallSiteId{2}, [&](CacheContext &) { ++inner; });
            return n * n;
        });
    };

    REQUIRE(cache.run_pass(root) == 9);
    REQUIRE(cache.run_pass(root) == 9);
    REQUIRE(outer == 1);

    n = 4;
    REQUIRE(cache.run_pass(root) == 16);
    REQUIRE(outer == 2);
    // A new argument is not a dirty mark, the nested group is still clean
    REQUIRE(inner == 1);
}

TEST_CASE("CacheContext - keyed calls keep their identity when reordered", "[context][keyed]") {
    Cache cache;
    std::vector<std::string> rows{"a", "b", "c"};
    std::map<std::string, CellId> keyed_cells;
    std::vector<std::string> positional_values;
    auto root = [&](CacheContext &ctx) {
        positional_values.clear();
        for (const auto &row : rows) {
            keyed_cells[row] = ctx.keyed_state(CallSiteId{1}, row, [&] { return row; }).cell();
            positional_values.push_back(ctx.state(CallSiteId{2}, [&] { return row; }).get());
            ctx.keyed_group(CallSiteId{3}, row, [&](CacheContext &) { return row; });
        }
    };

    cache.run_pass(root);
    auto first = keyed_cells;
    REQUIRE(positional_values == std::vector<std::string>{"a", "b", "c"});

    rows = {"z", "c", "a", "b"};
    cache.run_pass(root);
    REQUIRE(keyed_cells["a"] == first["a"]);
    REQUIRE(keyed_cells["b"] == first["b"]);
    REQUIRE(keyed_cells["c"] == first["c"]);
    // Positional state follows the position, not the row
    REQUIRE(positional_values == std::vector<std::string>{"a", "b", "c", "b"});

    auto &stats = cache.last_pass_statistics();
    REQUIRE(stats.created == 1);
    REQUIRE(stats.skipped == 3);
    REQUIRE(stats.torn_down == 0);
}

TEST_CASE("CacheContext - a key used twice in one group is rejected", "[context][keyed]") {
    Cache cache;
    auto root = [](CacheContext &ctx) {
        ctx.keyed_group(CallSiteId{1}, 7, [](CacheContext &) {});
        ctx.keyed_group(CallSiteId{1}, 7, [](CacheContext &) {});
    };
    REQUIRE_THROWS_AS(cache.run_pass(root), UsageError);

    SECTION("the same key in different groups or sites is fine") {
        auto ok = [](CacheContext &ctx) {
            ctx.keyed_group(CallSiteId{1}, 7, [](CacheContext &c) {
                c.keyed_group(CallSiteId{1}, 7, [](CacheContext &) {});
            });
            ctx.keyed_group(CallSiteId{2}, 7, [](CacheContext &) {});
        };
        REQUIRE_NOTHROW(cache.run_pass(ok));
    }
}

TEST_CASE("CacheContext - a result type change rebuilds the group", "[context][schema]") {
    Cache cache;
    bool as_text = false;
    int torn_down = 0;
    int nested_runs = 0;
    auto root = [&](CacheContext &ctx) {
        if (as_text) {
            ctx.group(CallSiteId{1}, [](CacheContext &) { return std::string{"x"}; });
        } else {
            ctx.group(CallSiteId{1}, [&](CacheContext &c) {
                c.on_teardown([&] { ++torn_down; });
                c.group(CallSiteId{2}, [&](CacheContext &) { ++nested_runs; });
                return 1;
            });
        }
    };

    cache.run_pass(root);
    REQUIRE(cache.group_count() == 3);

    as_text = true;
    cache.run_pass(root);
    REQUIRE(torn_down == 1);
    REQUIRE(cache.group_count() == 2);
    REQUIRE(cache.last_pass_statistics().created == 1);
    REQUIRE(cache.last_pass_statistics().torn_down == 2);
}

TEST_CASE("CacheContext - explicit group brackets", "[context][group]") {
    Cache cache;
    int runs = 0;
    auto root = [&](CacheContext &ctx) {
        if (ctx.begin_group(CallSiteId{1})) {
            ++runs;
            ctx.state(CallSiteId{2}, [] { return 3; });
        } else {
            ctx.skip_to_end();
        }
        ctx.end_group();
    };

    cache.run_pass(root);
    auto slots = cache.slot_count();
    cache.run_pass(root);
    REQUIRE(runs == 1);
    REQUIRE(cache.slot_count() == slots);
    REQUIRE(cache.cell_count() == 1);

    SECTION("skip_to_end and end_group only apply to explicit groups") {
        REQUIRE_THROWS_AS(cache.run_pass([](CacheContext &ctx) { ctx.end_group(); }), UsageError);
        REQUIRE_THROWS_AS(cache.run_pass([](CacheContext &ctx) { ctx.skip_to_end(); }), UsageError);
    }
}

TEST_CASE("CacheContext - call keys and generations", "[context]") {
    Cache cache;
    CallKey root_key;
    CallKey group_key;
    generation_t seen_generation = NO_GENERATION;
    auto root = [&](CacheContext &ctx) {
        root_key = ctx.current_call_key();
        seen_generation = ctx.generation();
        ctx.group(CallSiteId{1}, [&](CacheContext &c) { group_key = c.current_call_key(); });
    };

    cache.run_pass(root);
    REQUIRE(seen_generation == 1);
    REQUIRE(root_key != group_key);
    auto first_key = group_key;

    cache.run_pass(root);
    REQUIRE(seen_generation == 2);
    REQUIRE(group_key == first_key);
}

TEST_CASE("CacheContext - reserved call sites are rejected", "[context]") {
    Cache cache;
    REQUIRE_THROWS_AS(cache.run_pass([](CacheContext &ctx) { ctx.state(CallSiteId::memo_result(), [] { return 1; }); }),
                      UsageError);
}

TEST_CASE("CacheContext - skip_to_end is rejected for a group that has to run", "[context][group]") {
    Cache cache;
    int runs = 0;
    bool skip_anyway = false;
    InvalidationToken token;
    auto root = [&](CacheContext &ctx) {
        if (ctx.begin_group(CallSiteId{1}) && !skip_anyway) {
            ++runs;
            token = ctx.invalidation_token();
        } else {
            ctx.skip_to_end();
        }
        ctx.end_group();
    };

    cache.run_pass(root);
    REQUIRE(token.invalidate());
    skip_anyway = true;
    REQUIRE_THROWS_AS(cache.run_pass(root), UsageError);
    REQUIRE(cache.generation() == 1);
    REQUIRE(cache.has_pending_mutations());

    skip_anyway = false;
    cache.run_pass(root);
    REQUIRE(runs == 2);
    REQUIRE(cache.last_pass_statistics().evaluated == 1);

    cache.run_pass(root);
    REQUIRE(runs == 2);
    REQUIRE(cache.last_pass_statistics().evaluated == 0);
}

TEST_CASE("CacheContext - keyed state and keyed groups have separate keys", "[context][keyed]") {
    Cache cache;
    auto root = [](CacheContext &ctx) {
        auto count = ctx.keyed_state(CallSiteId{1}, 7, [] { return 3; });
        return ctx.keyed_group(CallSiteId{1}, 7, [count](CacheContext &) { return count.get(); });
    };

    REQUIRE(cache.run_pass(root) == 3);
    REQUIRE(cache.run_pass(root) == 3);
    REQUIRE(cache.cell_count() == 1);
    REQUIRE(cache.last_pass_statistics().skipped == 1);

    SECTION("keyed groups and keyed memoize share their keys") {
        REQUIRE_THROWS_AS(cache.run_pass([](CacheContext &ctx) {
            ctx.keyed_group(CallSiteId{1}, 7, [](CacheContext &) {});
            ctx.keyed_memoize(CallSiteId{1}, 7, 1, [](CacheContext &) {});
        }),
                          UsageError);
    }
}
