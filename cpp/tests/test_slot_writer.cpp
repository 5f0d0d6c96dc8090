#include <catch2/catch_test_macros.hpp>
#include <recache/runtime/slot_writer.h>

#include <string>
#include <vector>

using namespace recache;

namespace {
    CallTag tag(std::uint64_t site) { return CallTag::positional(CallSiteId{site}, 0); }

    const CallTag root_tag = CallTag::positional(CallSiteId::root(), 0);

    struct Fixture {
        SlotTable table;
        InvalidationTracker tracker;
        std::size_t max_search_distance{1024};

        // Runs a pass producing one empty child group per site under a root group
        std::vector<GroupId> pass(const std::vector<std::uint64_t> &sites) {
            SlotWriter writer(table, tracker, max_search_distance);
            std::vector<GroupId> ids;
            writer.begin_group(root_tag);
            for (auto site : sites) {
                ids.push_back(writer.begin_group(tag(site)).group);
                writer.end_group();
            }
            writer.end_group();
            writer.truncate_unused_tail();
            table.commit();
            tracker.commit();
            return ids;
        }
    };
} // namespace

TEST_CASE("SlotWriter - groups keep their identity across passes", "[slot_writer]") {
    Fixture f;
    auto first = f.pass({1, 2, 3});
    REQUIRE(f.table.size() == 8);
    REQUIRE(f.tracker.group_count() == 4);

    SECTION("same order") {
        REQUIRE(f.pass({1, 2, 3}) == first);
        REQUIRE(f.table.size() == 8);
    }

    SECTION("reordered calls find their groups") {
        auto second = f.pass({3, 1, 2});
        REQUIRE(second == std::vector<GroupId>{first[2], first[0], first[1]});
        REQUIRE(f.tracker.group_count() == 4);
    }

    SECTION("calls no longer made are removed") {
        auto second = f.pass({1, 3});
        REQUIRE(second == std::vector<GroupId>{first[0], first[2]});
        REQUIRE(f.table.size() == 6);
        REQUIRE_FALSE(f.tracker.contains_group(first[1]));
    }

    SECTION("new calls are inserted where they are made") {
        auto second = f.pass({1, 4, 3});
        REQUIRE(second[0] == first[0]);
        REQUIRE(second[2] == first[2]);
        REQUIRE(second[1] != first[1]);
        REQUIRE(f.tracker.group_count() == 4);
        REQUIRE(std::get<GroupStartSlot>(f.table.at(3)).tag == tag(4));
    }
}

TEST_CASE("SlotWriter - the search for moved calls is bounded", "[slot_writer]") {
    Fixture f;
    f.max_search_distance = 0;
    auto first = f.pass({1, 2});
    auto second = f.pass({2, 1});
    // Group 2 is not at the cursor and may not be looked for; group 1 is at the cursor once 2 was inserted
    REQUIRE(second[0] != first[1]);
    REQUIRE(second[1] == first[0]);
    REQUIRE(f.tracker.group_count() == 3);
}

TEST_CASE("SlotWriter - values", "[slot_writer]") {
    SlotTable table;
    InvalidationTracker tracker;
    SlotWriter writer(table, tracker, 1024);
    writer.begin_group(root_tag);

    auto index = writer.claim_value(tag(5));
    REQUIRE(writer.position() == index + 1);
    REQUIRE(writer.read_value<int>(index) == nullptr);
    REQUIRE_FALSE(writer.has_value(index));

    writer.write_value(index, value::TypedValue::of(3), 1);
    REQUIRE(writer.has_value(index));
    REQUIRE(*writer.read_value<int>(index) == 3);
    REQUIRE(writer.value_meta(index) == value::scalar_type_meta<int>());
    REQUIRE_THROWS_AS(writer.read_value<std::string>(index), UsageError);

    writer.reset_value(index);
    REQUIRE_FALSE(writer.has_value(index));

    writer.end_group();
    REQUIRE(table.size() == 3);
    REQUIRE(std::get<GroupStartSlot>(table.at(0)).length == 3);
}

TEST_CASE("SlotWriter - skipping keeps the recorded content", "[slot_writer]") {
    SlotTable table;
    InvalidationTracker tracker;
    {
        SlotWriter writer(table, tracker, 1024);
        writer.begin_group(root_tag);
        writer.begin_group(tag(1));
        writer.write_value(writer.claim_value(tag(2)), value::TypedValue::of(std::string{"kept"}), 1);
        writer.begin_group(tag(3));
        writer.end_group();
        writer.end_group();
        writer.end_group();
        table.commit();
        tracker.commit();
    }
    REQUIRE(table.size() == 7);

    SlotWriter writer(table, tracker, 1024);
    writer.begin_group(root_tag);
    auto entry = writer.begin_group(tag(1));
    REQUIRE_FALSE(entry.created);
    writer.skip_to_matching_end();
    REQUIRE(writer.position() == 5);
    writer.end_group();
    writer.end_group();
    REQUIRE(table.size() == 7);
    REQUIRE(tracker.group_count() == 3);
    REQUIRE(std::get<ValueSlot>(table.at(2)).value.as<std::string>() == "kept");
}

TEST_CASE("SlotWriter - recreating a group retires its content", "[slot_writer]") {
    SlotTable table;
    InvalidationTracker tracker;
    SlotWriter writer(table, tracker, 1024);
    writer.begin_group(root_tag);
    auto old_group = writer.begin_group(tag(1)).group;
    writer.begin_group(tag(2));
    writer.end_group();
    writer.claim_value(tag(3));

    auto new_group = writer.recreate_current_group();
    REQUIRE(new_group != old_group);
    REQUIRE(writer.current_group() == new_group);
    REQUIRE_FALSE(tracker.contains_group(old_group));
    REQUIRE(tracker.group_count() == 2);
    writer.end_group();
    writer.end_group();
    REQUIRE(table.size() == 4);
}

TEST_CASE("SlotWriter - misuse", "[slot_writer]") {
    SlotTable table;
    InvalidationTracker tracker;
    SlotWriter writer(table, tracker, 1024);
    REQUIRE_THROWS_AS(writer.end_group(), UsageError);
    REQUIRE_THROWS_AS(writer.skip_to_matching_end(), UsageError);

    writer.begin_group(root_tag);
    REQUIRE_THROWS_AS(writer.write_value(0, value::TypedValue::of(1), 1), UsageError);
}
