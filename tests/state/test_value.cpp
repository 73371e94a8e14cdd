// keystone_state Value model tests

#include <catch2/catch_test_macros.hpp>
#include <keystone/state/value.hpp>

#include <string>

using namespace keystone_state;

TEST_CASE("Value construction", "[state][value]") {
    SECTION("default is undefined") {
        Value v;
        REQUIRE(v.is_undefined());
        REQUIRE(v.kind() == ValueKind::Undefined);
        REQUIRE(Value(undefined).is_undefined());
    }

    SECTION("primitives") {
        REQUIRE(Value(nullptr).is_null());
        REQUIRE(Value(true).is_bool());
        REQUIRE(Value(3).is_number());
        REQUIRE(Value(2.5f).as_number() == 2.5);
        REQUIRE(Value("text").as_string() == "text");
        REQUIRE(Value(std::string("text")).is_string());
    }

    SECTION("integers become numbers") {
        Value v(std::uint32_t{4000000000u});
        REQUIRE(v.as_number() == 4000000000.0);
        REQUIRE(v.as_int() == 4000000000LL);
    }

    SECTION("containers") {
        Value seq = Value::array({1, "two", true});
        REQUIRE(seq.is_sequence());
        REQUIRE(seq.size() == 3);
        REQUIRE(seq.item(1).as_string() == "two");
        REQUIRE(seq.item(5).is_undefined());

        Value obj = Value::object({{"hp", 20}, {"name", "alice"}});
        REQUIRE(obj.is_mapping());
        REQUIRE(obj.is_container());
        REQUIRE(obj.field("hp").as_number() == 20);
        REQUIRE(obj.field("missing").is_undefined());
    }

    SECTION("null container pointers become empty containers") {
        Value seq(Value::SequencePtr{});
        REQUIRE(seq.is_sequence());
        REQUIRE(seq.size() == 0);
    }
}

TEST_CASE("Value typed access", "[state][value]") {
    Value v(42);

    SECTION("matching kind") {
        REQUIRE(v.as_number() == 42.0);
        REQUIRE(v.as_int() == 42);
    }

    SECTION("wrong kind throws ValueError") {
        REQUIRE_THROWS_AS(v.as_string(), ValueError);
        REQUIRE_THROWS_AS(v.as_sequence(), ValueError);
        REQUIRE_THROWS_AS(Value().as_bool(), ValueError);
    }

    SECTION("field and item on primitives are undefined") {
        REQUIRE(v.field("x").is_undefined());
        REQUIRE(v.item(0).is_undefined());
        REQUIRE(v.size() == 0);
    }
}

TEST_CASE("Mapping ordering", "[state][value]") {
    Mapping m;
    m.set("b", 1);
    m.set("a", 2);
    m.set("b", 3);

    SECTION("replace keeps position") {
        auto it = m.begin();
        REQUIRE(it->first == "b");
        REQUIRE(it->second.as_number() == 3);
        ++it;
        REQUIRE(it->first == "a");
        REQUIRE(m.size() == 2);
    }

    SECTION("erase removes the entry") {
        REQUIRE(m.erase("b"));
        REQUIRE_FALSE(m.contains("b"));
        REQUIRE_FALSE(m.erase("b"));
        REQUIRE(m.size() == 1);
    }

    SECTION("later duplicates in object() win") {
        Value obj = Value::object({{"k", 1}, {"k", 2}});
        REQUIRE(obj.size() == 1);
        REQUIRE(obj.field("k").as_number() == 2);
    }
}

TEST_CASE("Value equality and identity", "[state][value]") {
    Value a = parse_value(R"({"party": [{"id": "alice", "hp": 20}], "turn": 1})");
    Value b = parse_value(R"({"turn": 1, "party": [{"hp": 20, "id": "alice"}]})");

    SECTION("deep equality ignores key order") {
        REQUIRE(a == b);
    }

    SECTION("identity compares containers by pointer") {
        REQUIRE_FALSE(a.same(b));
        Value copy = a;
        REQUIRE(copy.same(a));
        REQUIRE(Value(5).same(Value(5)));
        REQUIRE(Value("x").same(Value("x")));
    }

    SECTION("kinds never compare equal") {
        REQUIRE_FALSE(Value(0) == Value(false));
        REQUIRE_FALSE(Value(nullptr) == Value());
        REQUIRE_FALSE(Value::array({}) == Value::object({}));
    }

    SECTION("sequences compare in order") {
        REQUIRE(Value::array({1, 2}) == Value::array({1, 2}));
        REQUIRE_FALSE(Value::array({1, 2}) == Value::array({2, 1}));
    }
}

TEST_CASE("Value JSON conversion", "[state][value]") {
    SECTION("parse preserves key order") {
        Value v = parse_value(R"({"z": 1, "a": [true, null, "s", 1.5]})");
        REQUIRE(v.to_string() == R"({"z":1,"a":[true,null,"s",1.5]})");
    }

    SECTION("integral numbers print without a fraction") {
        REQUIRE(Value(100).to_string() == "100");
        REQUIRE(Value(-3.0).to_string() == "-3");
        REQUIRE(Value(0.25).to_string() == "0.25");
    }

    SECTION("undefined") {
        REQUIRE(Value().to_string() == "undefined");
        REQUIRE(Value().to_json().is_null());
    }

    SECTION("from unordered json") {
        nlohmann::json j = {{"hp", 10}, {"tags", {"a", "b"}}};
        Value v = Value::from_json(j);
        REQUIRE(v.field("hp").as_number() == 10);
        REQUIRE(v.field("tags").size() == 2);
    }

    SECTION("malformed text throws") {
        REQUIRE_THROWS_AS(parse_value("{not json"), nlohmann::json::parse_error);
    }

    SECTION("kind names") {
        REQUIRE(std::string(value_kind_name(ValueKind::Sequence)) == "sequence");
        REQUIRE(std::string(value_kind_name(ValueKind::Mapping)) == "mapping");
    }
}
