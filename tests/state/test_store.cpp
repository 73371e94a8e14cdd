// keystone_state GameStore tests

#include <catch2/catch_test_macros.hpp>
#include <keystone/state/store.hpp>
#include <keystone/core/log.hpp>
#include <spdlog/sinks/ostream_sink.h>

#include <algorithm>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <vector>

using namespace keystone_state;

namespace {

Value party_state() {
    return parse_value(R"({
        "turn": 1,
        "party": [{"id": "alice", "hp": 20}, {"id": "bob", "hp": 15}]
    })");
}

Value world_state() {
    return parse_value(R"({
        "entities": {
            "e1": {"pos": {"x": 0, "y": 0}, "health": 10},
            "e2": {"pos": {"x": 5, "y": 5}},
            "e3": {"health": 3, "ai": "wander"}
        }
    })");
}

/// Copies everything a logger writes while in scope
class CapturedLog {
public:
    explicit CapturedLog(std::shared_ptr<spdlog::logger> logger)
        : m_logger(std::move(logger))
        , m_sink(std::make_shared<spdlog::sinks::ostream_sink_mt>(m_out)) {
        m_sink->set_pattern("%l|%v");
        m_logger->sinks().push_back(m_sink);
    }

    ~CapturedLog() {
        auto& sinks = m_logger->sinks();
        sinks.erase(std::remove(sinks.begin(), sinks.end(), m_sink), sinks.end());

        keystone_core::LogConfig config;
        config.console_enabled = false;
        keystone_core::configure_logging(config);
    }

    std::string text() {
        m_logger->flush();
        return m_out.str();
    }

private:
    std::ostringstream m_out;
    std::shared_ptr<spdlog::logger> m_logger;
    std::shared_ptr<spdlog::sinks::ostream_sink_mt> m_sink;
};

} // anonymous namespace

// =============================================================================
// Dispatch
// =============================================================================

TEST_CASE("GameStore dispatch commits valid batches", "[state][store]") {
    GameStore store = create_store(party_state());

    auto result = store.dispatch({set("turn", 2), set("score", 100)});

    REQUIRE(result.valid);
    REQUIRE(store.get("turn").as_number() == 2);
    REQUIRE(store.get("score").as_number() == 100);
    REQUIRE(store.get_state().same(result.state));

    const DiffEntry* turn = result.diff.find("turn");
    REQUIRE(turn != nullptr);
    REQUIRE(turn->from.as_number() == 1);
    REQUIRE(turn->to.as_number() == 2);

    REQUIRE(store.get_history().size() == 1);
    REQUIRE(store.get_history()[0].mutations.size() == 2);
    REQUIRE(store.get_history()[0].diff.size() == 2);
}

TEST_CASE("GameStore dispatch is atomic", "[state][store]") {
    GameStore store = create_store(party_state());
    Value before = store.get_state();
    int notifications = 0;
    auto unsubscribe = store.observe("*", [&](const Value&, const Value&, const ObserverContext&) {
        ++notifications;
    });

    auto result = store.dispatch({set("turn", 2), push("turn", "invalid")});

    REQUIRE_FALSE(result.valid);
    REQUIRE(result.error.has_value());
    REQUIRE(result.error->code() == keystone_core::ErrorCode::TransactionFailed);
    REQUIRE(store.get("turn").as_number() == 1);
    REQUIRE(store.get_state().same(before));
    REQUIRE(store.get_history().empty());
    REQUIRE(notifications == 0);
}

TEST_CASE("GameStore queries the live tree", "[state][store]") {
    GameStore store = create_store(party_state());

    REQUIRE(store.dispatch({set("party.1.hp", 8)}).valid);

    auto hurt = store.query("party", {{"hp", lt(10)}});
    REQUIRE(hurt.size() == 1);
    REQUIRE(hurt[0].field("id").as_string() == "bob");

    REQUIRE(store.has("party.1"));
    REQUIRE(store.has("party.0.hp", gte(20)));
    REQUIRE_FALSE(store.has("party.2"));
    REQUIRE(store.get("party.*.id") == Value::array({"alice", "bob"}));
}

// =============================================================================
// Observers
// =============================================================================

TEST_CASE("GameStore notifies observers after commit", "[state][store]") {
    GameStore store = create_store(party_state());

    SECTION("update fires once with new, old and path") {
        std::vector<std::string> calls;
        auto unsubscribe = store.observe("party.0.hp",
            [&](const Value& now, const Value& old, const ObserverContext& ctx) {
                calls.push_back(now.to_string() + "," + old.to_string() + "," + ctx.path);
            });

        auto result = store.dispatch({update("party.0.hp", [](const Value& hp) {
            return Value(hp.as_number() - 5);
        })});

        REQUIRE(result.valid);
        REQUIRE(calls == std::vector<std::string>{"15,20,party.0.hp"});
    }

    SECTION("observers see the committed state and history") {
        double seen_turn = 0;
        std::size_t seen_history = 0;
        auto unsubscribe = store.observe("turn", [&](const Value&, const Value&, const ObserverContext&) {
            seen_turn = store.get("turn").as_number();
            seen_history = store.get_history().size();
        });

        REQUIRE(store.dispatch({set("turn", 2)}).valid);
        REQUIRE(seen_turn == 2);
        REQUIRE(seen_history == 1);
    }

    SECTION("wildcard observers fire per member") {
        std::vector<std::string> paths;
        std::vector<std::string> changes;
        auto unsubscribe = store.observe("party.*.hp",
            [&](const Value& now, const Value& old, const ObserverContext& ctx) {
                paths.push_back(ctx.path);
                changes.push_back(now.to_string() + "<-" + old.to_string());
            });

        REQUIRE(store.dispatch({set("party.0.hp", 1), set("party.1.hp", 2)}).valid);
        REQUIRE(paths == std::vector<std::string>{"party.0.hp", "party.1.hp"});
        REQUIRE(changes == std::vector<std::string>{"1<-20", "2<-15"});
        REQUIRE(store.observer_count() == 1);
    }

    SECTION("length changes are observable") {
        std::vector<double> lengths;
        auto unsubscribe = store.observe("party.length",
            [&](const Value& now, const Value&, const ObserverContext&) { lengths.push_back(now.as_number()); });

        REQUIRE(store.dispatch({push("party", Value::object({{"id", "carol"}, {"hp", 9}}))}).valid);
        REQUIRE(lengths == std::vector<double>{3});
    }
}

TEST_CASE("GameStore reentrant dispatch", "[state][store]") {
    GameStore store = create_store(party_state());
    std::vector<std::string> order;

    auto on_turn = store.observe("turn", [&](const Value& now, const Value&, const ObserverContext&) {
        order.push_back("turn");
        if (now.as_number() == 2) {
            REQUIRE(store.dispatch({set("phase", "combat")}).valid);
        }
    });
    auto on_phase = store.observe("phase", [&](const Value&, const Value&, const ObserverContext&) {
        order.push_back("phase");
    });
    auto on_score = store.observe("score", [&](const Value&, const Value&, const ObserverContext&) {
        order.push_back("score");
    });

    auto result = store.dispatch({set("turn", 2), set("score", 10)});

    REQUIRE(result.valid);
    REQUIRE(order == std::vector<std::string>{"turn", "phase", "score"});

    SECTION("outer record precedes the nested record") {
        const auto& history = store.get_history();
        REQUIRE(history.size() == 2);
        REQUIRE(history[0].diff.find("turn") != nullptr);
        REQUIRE(history[0].diff.find("phase") == nullptr);
        REQUIRE(history[1].diff.find("phase") != nullptr);
    }

    SECTION("final state holds both changes") {
        REQUIRE(store.get("turn").as_number() == 2);
        REQUIRE(store.get("phase").as_string() == "combat");
        REQUIRE(store.get("score").as_number() == 10);
    }

    SECTION("the returned result describes only the outer batch") {
        REQUIRE(result.diff.size() == 2);
        REQUIRE(result.state.field("phase").is_undefined());
    }
}

// =============================================================================
// Snapshots & History
// =============================================================================

TEST_CASE("GameStore replace_state", "[state][store]") {
    GameStore store = create_store(party_state());
    int notifications = 0;
    auto unsubscribe = store.observe("turn", [&](const Value&, const Value&, const ObserverContext&) {
        ++notifications;
    });

    REQUIRE(store.dispatch({set("turn", 2)}).valid);
    Value snapshot = store.get_state();
    REQUIRE(store.dispatch({set("turn", 3), push("party", "carol")}).valid);
    REQUIRE(notifications == 2);

    store.replace_state(snapshot);

    SECTION("restores the snapshot exactly") {
        REQUIRE(store.get_state() == snapshot);
        REQUIRE(store.get_state().same(snapshot));
        REQUIRE(store.get("party.length").as_number() == 2);
    }

    SECTION("leaves history and observers alone") {
        REQUIRE(store.get_history().size() == 2);
        REQUIRE(notifications == 2);
    }

    SECTION("later dispatches diff against the replaced tree") {
        auto result = store.dispatch({set("turn", 4)});
        REQUIRE(result.diff.entries[0] == DiffEntry{"turn", Value(2), Value(4)});
    }
}

TEST_CASE("GameStore history records mutations", "[state][store]") {
    GameStore store = create_store(party_state());

    REQUIRE(store.dispatch({set("turn", 2)}).valid);
    REQUIRE_FALSE(store.dispatch({push("turn", 1)}).valid);
    REQUIRE(store.dispatch({remove_where("party", [](const Value& m) { return m.field("id") == Value("bob"); })}).valid);

    const auto& history = store.get_history();
    REQUIRE(history.size() == 2);
    REQUIRE(history[0].mutations[0].description() == "Set turn to 2");
    REQUIRE(history[1].mutations[0].type() == MutationType::Remove);

    SECTION("replaying history reproduces the state") {
        Value replayed = party_state();
        for (const auto& record : history) {
            auto result = transaction(replayed, record.mutations);
            REQUIRE(result.valid);
            replayed = result.state;
        }
        REQUIRE(replayed == store.get_state());
    }
}

// =============================================================================
// Component Index
// =============================================================================

TEST_CASE("GameStore component index", "[state][store]") {
    GameStore store = create_store(world_state());

    SECTION("disabled index knows nothing") {
        REQUIRE_FALSE(store.component_index_enabled());
        REQUIRE(store.entities_with_component("health").empty());
    }

    SECTION("enabled index maps components to entities") {
        store.enable_component_index("entities");
        REQUIRE(store.component_index_enabled());
        REQUIRE(store.entities_with_component("health") == std::set<std::string>{"e1", "e3"});
        REQUIRE(store.entities_with_component("pos") == std::set<std::string>{"e1", "e2"});
        REQUIRE(store.entities_with_component("ai") == std::set<std::string>{"e3"});
        REQUIRE(store.entities_with_component("inventory").empty());
    }

    SECTION("dispatch refreshes the index") {
        store.enable_component_index("entities");
        REQUIRE(store.dispatch({set("entities.e2.health", 7), remove_key("entities.e3.ai")}).valid);
        REQUIRE(store.entities_with_component("health") == std::set<std::string>{"e1", "e2", "e3"});
        REQUIRE(store.entities_with_component("ai").empty());

        REQUIRE(store.dispatch({remove_key("entities.e1")}).valid);
        REQUIRE(store.entities_with_component("pos") == std::set<std::string>{"e2"});
    }

    SECTION("removing an ancestor of the collection clears the index") {
        GameStore nested = create_store(parse_value(
            R"({"world": {"entities": {"e1": {"hp": 3}, "e2": {"hp": 4, "ai": "idle"}}}, "turn": 1})"));
        nested.enable_component_index("world.entities");
        REQUIRE(nested.entities_with_component("hp").size() == 2);

        REQUIRE(nested.dispatch({set("turn", 2)}).valid);
        REQUIRE(nested.entities_with_component("hp").size() == 2);

        REQUIRE(nested.dispatch({remove_key("world")}).valid);
        REQUIRE(nested.get("world").is_undefined());
        REQUIRE(nested.entities_with_component("hp").empty());
        REQUIRE(nested.entities_with_component("ai").empty());
    }

    SECTION("overwriting an ancestor with a scalar clears the index") {
        GameStore nested = create_store(parse_value(R"({"world": {"entities": {"e1": {"hp": 3}}}})"));
        nested.enable_component_index("world.entities");
        REQUIRE(nested.dispatch({set("world", 0)}).valid);
        REQUIRE(nested.entities_with_component("hp").empty());
    }

    SECTION("returned ids outlive later rebuilds") {
        store.enable_component_index("entities");
        std::set<std::string> ids = store.entities_with_component("health");
        REQUIRE(store.dispatch({set("entities.e2.health", 1), remove_key("entities.e1")}).valid);
        REQUIRE(ids == std::set<std::string>{"e1", "e3"});
        REQUIRE(store.entities_with_component("health") == std::set<std::string>{"e2", "e3"});
    }

    SECTION("replace_state rebuilds the index") {
        store.enable_component_index("entities");
        store.replace_state(parse_value(R"({"entities": {"e9": {"ai": "guard"}}})"));
        REQUIRE(store.entities_with_component("ai") == std::set<std::string>{"e9"});
        REQUIRE(store.entities_with_component("health").empty());
    }

    SECTION("configured at creation") {
        StoreConfig config;
        config.component_index = "entities";
        GameStore indexed = create_store(world_state(), config);
        REQUIRE(indexed.component_index_enabled());
        REQUIRE(indexed.entities_with_component("health").size() == 2);
    }
}

// =============================================================================
// Logging
// =============================================================================

TEST_CASE("GameStore logging", "[state][store]") {
    keystone_core::LogConfig log_config;
    log_config.console_enabled = false;
    log_config.level = spdlog::level::debug;
    keystone_core::configure_logging(log_config);

    CapturedLog captured(keystone_core::state_logger());

    StoreConfig config;
    config.name = "dungeon";
    config.log_dispatches = true;
    GameStore store = create_store(party_state(), config);

    SECTION("committed dispatches at debug") {
        REQUIRE(store.dispatch({set("turn", 2)}).valid);
        std::string text = captured.text();
        REQUIRE(text.find("debug|Dispatch committed") != std::string::npos);
        REQUIRE(text.find("store=\"dungeon\"") != std::string::npos);
    }

    SECTION("failed dispatches at warn") {
        REQUIRE_FALSE(store.dispatch({push("turn", 1)}).valid);
        std::string text = captured.text();
        REQUIRE(text.find("[dungeon] Dispatch rejected: [TransactionFailed]") != std::string::npos);
        REQUIRE(text.find("failed_mutation: Push item onto turn") != std::string::npos);
    }

    SECTION("failure logging can be disabled") {
        StoreConfig silent;
        silent.log_failures = false;
        GameStore quiet = create_store(party_state(), silent);
        REQUIRE_FALSE(quiet.dispatch({push("turn", 1)}).valid);
        REQUIRE(captured.text().find("Dispatch rejected") == std::string::npos);
    }
}
