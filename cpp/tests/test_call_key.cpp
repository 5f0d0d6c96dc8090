#include <catch2/catch_test_macros.hpp>
#include <recache/types/call_key.h>

#include <string>

using namespace recache;

TEST_CASE("CallSiteId - construction", "[call_key]") {
    SECTION("from integers") {
        REQUIRE(CallSiteId{1} == CallSiteId{1});
        REQUIRE(CallSiteId{1} != CallSiteId{2});
    }

    SECTION("names hash the same at compile time and run time") {
        constexpr CallSiteId compile_time{std::string_view{"row"}};
        std::string name = "row";
        REQUIRE(compile_time == CallSiteId{std::string_view{name}});
        REQUIRE(compile_time != CallSiteId{std::string_view{"column"}});
    }

    SECTION("here() distinguishes lines") {
        auto a = CallSiteId::here();
        auto b = CallSiteId::here();
        REQUIRE(a != b);
        REQUIRE_FALSE(a.is_reserved());
    }

    SECTION("the same source location gives the same id") {
        auto make = [] { return CallSiteId::here(); };
        REQUIRE(make() == make());
    }
}

TEST_CASE("CallSiteId - reserved ids", "[call_key]") {
    REQUIRE(CallSiteId::root().is_reserved());
    REQUIRE(CallSiteId::memo_args().is_reserved());
    REQUIRE(CallSiteId::memo_result().is_reserved());
    REQUIRE_FALSE(CallSiteId{42}.is_reserved());
}

TEST_CASE("CallTag - equality covers site, discriminator and strategy", "[call_key]") {
    auto site = CallSiteId{7};
    REQUIRE(CallTag::positional(site, 0) == CallTag::positional(site, 0));
    REQUIRE(CallTag::positional(site, 0) != CallTag::positional(site, 1));
    REQUIRE(CallTag::positional(site, 3) != CallTag::keyed(site, 3));
    REQUIRE(CallTag::keyed(site, key_hash(std::string{"a"})) == CallTag::keyed(site, key_hash(std::string{"a"})));
    REQUIRE(CallTagHash{}(CallTag::keyed(site, 9)) == CallTagHash{}(CallTag::keyed(site, 9)));
}

TEST_CASE("CallTag - formatting", "[call_key]") {
    REQUIRE(fmt::format("{}", CallTag::positional(CallSiteId::root(), 0)) == "<root>");
    REQUIRE(fmt::format("{}", CallTag::positional(CallSiteId{0x10}, 2)) == "0000000000000010#2");
    REQUIRE(fmt::format("{}", CallTag::keyed(CallSiteId{0x10}, 0xFF)) == "0000000000000010[key=00000000000000FF]");
}

TEST_CASE("CallKey - chains depend on the whole path", "[call_key]") {
    auto a = CallTag::positional(CallSiteId{1}, 0);
    auto b = CallTag::positional(CallSiteId{2}, 0);
    auto ab = CallKey::chain(CallKey::chain({}, a), b);
    auto ba = CallKey::chain(CallKey::chain({}, b), a);
    REQUIRE(ab == CallKey::chain(CallKey::chain({}, a), b));
    REQUIRE(ab != ba);
}
