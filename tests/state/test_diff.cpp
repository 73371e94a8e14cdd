// keystone_state diff engine tests

#include <catch2/catch_test_macros.hpp>
#include <keystone/state/diff.hpp>
#include <keystone/state/mutation.hpp>

using namespace keystone_state;

TEST_CASE("Diff of identical trees", "[state][diff]") {
    Value state = parse_value(R"({"turn": 1, "party": [{"hp": 20}]})");

    SECTION("same tree") {
        REQUIRE(compute_diff(state, state).empty());
    }

    SECTION("structurally identical copies") {
        Value copy = parse_value(R"({"turn": 1, "party": [{"hp": 20}]})");
        REQUIRE_FALSE(copy.same(state));
        REQUIRE(compute_diff(state, copy).empty());
    }

    SECTION("setting a value to itself") {
        Value next = set("turn", 1).apply(state);
        REQUIRE(compute_diff(state, next).empty());
    }
}

TEST_CASE("Diff of scalar changes", "[state][diff]") {
    Value before = parse_value(R"({"turn": 1, "score": 0, "party": [{"id": "alice", "hp": 20}]})");
    Value after = set("party.0.hp", 12).apply(set("turn", 2).apply(before));

    Diff diff = compute_diff(before, after);
    REQUIRE(diff.size() == 2);
    REQUIRE(diff.entries[0] == DiffEntry{"turn", Value(1), Value(2)});
    REQUIRE(diff.entries[1] == DiffEntry{"party.0.hp", Value(20), Value(12)});

    const DiffEntry* hp = diff.find("party.0.hp");
    REQUIRE(hp != nullptr);
    REQUIRE(hp->from.as_number() == 20);
    REQUIRE(diff.find("score") == nullptr);
}

TEST_CASE("Diff of mapping keys", "[state][diff]") {
    Value before = parse_value(R"({"a": 1, "b": 2})");
    Value after = parse_value(R"({"c": 3, "b": 2})");

    Diff diff = compute_diff(before, after);
    REQUIRE(diff.size() == 2);

    SECTION("removed keys first, in before order") {
        REQUIRE(diff.entries[0].path == "a");
        REQUIRE(diff.entries[0].from.as_number() == 1);
        REQUIRE(diff.entries[0].to.is_undefined());
    }

    SECTION("added keys after") {
        REQUIRE(diff.entries[1].path == "c");
        REQUIRE(diff.entries[1].from.is_undefined());
        REQUIRE(diff.entries[1].to.as_number() == 3);
    }
}

TEST_CASE("Diff of sequences", "[state][diff]") {
    SECTION("push reports the element then the length") {
        Value before = parse_value(R"({"log": ["a"]})");
        Value after = push("log", "b").apply(before);

        Diff diff = compute_diff(before, after);
        REQUIRE(diff.size() == 2);
        REQUIRE(diff.entries[0] == DiffEntry{"log.1", Value(), Value("b")});
        REQUIRE(diff.entries[1] == DiffEntry{"log.length", Value(1), Value(2)});
    }

    SECTION("shrinking reports removed indices") {
        Value before = Value::array({1, 2, 3});
        Value after = Value::array({1});

        Diff diff = compute_diff(before, after);
        REQUIRE(diff.size() == 3);
        REQUIRE(diff.entries[0] == DiffEntry{"1", Value(2), Value()});
        REQUIRE(diff.entries[1] == DiffEntry{"2", Value(3), Value()});
        REQUIRE(diff.entries[2] == DiffEntry{"length", Value(3), Value(1)});
    }

    SECTION("nested element changes recurse") {
        Value before = parse_value(R"([{"hp": 1}, {"hp": 2}])");
        Value after = parse_value(R"([{"hp": 1}, {"hp": 5}])");

        Diff diff = compute_diff(before, after);
        REQUIRE(diff.size() == 1);
        REQUIRE(diff.entries[0].path == "1.hp");
    }
}

TEST_CASE("Diff of kind changes", "[state][diff]") {
    SECTION("container replaced by scalar") {
        Value before = parse_value(R"({"slot": {"item": "sword"}})");
        Value after = parse_value(R"({"slot": null})");

        Diff diff = compute_diff(before, after);
        REQUIRE(diff.size() == 1);
        REQUIRE(diff.entries[0].path == "slot");
        REQUIRE(diff.entries[0].from.is_mapping());
        REQUIRE(diff.entries[0].to.is_null());
    }

    SECTION("sequence replaced by mapping") {
        Value before = parse_value(R"({"x": []})");
        Value after = parse_value(R"({"x": {}})");
        REQUIRE(compute_diff(before, after).size() == 1);
    }

    SECTION("scalar root uses the root path") {
        Diff diff = compute_diff(Value(1), Value(2));
        REQUIRE(diff.size() == 1);
        REQUIRE(diff.entries[0].path == "root");
    }
}
