// tests/test_engine.cpp
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "planflow/core/engine.h"
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace planflow;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;
using Catch::Matchers::EndsWith;

namespace {

const std::string kDataDir = PLANFLOW_TEST_DATA_DIR;

struct CapturedLog {
    std::vector<std::pair<LogLevel, std::string>> lines;

    LogSink sink() {
        return [this](LogLevel level, const std::string& msg) { lines.emplace_back(level, msg); };
    }

    bool has(const std::string& needle) const {
        for (const auto& line : lines) {
            if (line.second.find(needle) != std::string::npos) return true;
        }
        return false;
    }
};

TurnRecord user(std::string text) { return {TurnRole::USER, std::move(text), std::nullopt}; }
TurnRecord agent(std::string text) { return {TurnRole::AGENT, std::move(text), std::nullopt}; }
TurnRecord tool(std::string text) { return {TurnRole::TOOL, std::move(text), std::string("code_execution")}; }

TurnInput coding_turn(TurnHistory history) {
    TurnInput input;
    input.domain = "coding";
    input.history = std::move(history);
    return input;
}

std::unique_ptr<PlanFlowEngine> fixture_engine(CapturedLog& log, EngineConfig config = {}) {
    auto library = PlanLibrary::from_file(kDataDir + "/plan_library.yaml");
    return std::make_unique<PlanFlowEngine>(std::move(library), config, log.sink());
}

} // namespace

TEST_CASE("Unmatched messages pass through untouched", "[engine]") {
    CapturedLog log;
    auto engine = fixture_engine(log);
    SessionState session;

    auto out = engine->on_turn(session, coding_turn({user("What's the weather like?")}));
    REQUIRE(out.status == TraversalStatus::IDLE);
    REQUIRE_FALSE(out.injection.has_value());
    REQUIRE_FALSE(out.activated_plan.has_value());
    REQUIRE_FALSE(session.has_active_plan());

    REQUIRE(engine->on_turn(session, coding_turn({})).status == TraversalStatus::IDLE);
}

TEST_CASE("Full session drives a test-fix loop to completion", "[engine][session]") {
    CapturedLog log;
    auto engine = fixture_engine(log);
    SessionState session;

    TurnHistory history{user("My unit test is failing, can you fix it?")};
    auto out = engine->on_turn(session, coding_turn(history));
    REQUIRE(out.status == TraversalStatus::AWAITING_OUTPUT);
    REQUIRE(out.activated_plan == std::optional<PlanId>("fix_failing_tests"));
    REQUIRE_THAT(*out.injection, StartsWith("[WORKFLOW: Fix Failing Tests]"));
    REQUIRE_THAT(*out.injection, ContainsSubstring("Run Tests << CURRENT (attempt 1/2) >>"));
    REQUIRE(log.has("Graph plan activated: Fix Failing Tests (2 nodes)"));

    // agent replied without running a tool: nothing to verify
    history.push_back(agent("Let me look at the suite first."));
    out = engine->on_turn(session, coding_turn(history));
    REQUIRE(session.traversal->current_node == "run_tests");
    REQUIRE(session.traversal->turns_since_transition == 1);

    history.push_back(tool("collected 5 items ... 2 FAILED"));
    out = engine->on_turn(session, coding_turn(history));
    REQUIRE(session.traversal->current_node == "apply_fix");
    REQUIRE_THAT(*out.injection, ContainsSubstring("Apply Fix << CURRENT >>"));
    REQUIRE_FALSE(out.activated_plan.has_value());

    history.push_back(tool("patched src/parser.cpp"));
    out = engine->on_turn(session, coding_turn(history));
    REQUIRE(session.traversal->current_node == "run_tests");
    REQUIRE(session.traversal->visited.at("run_tests").attempts == 0);
    REQUIRE_THAT(*out.injection, ContainsSubstring("Apply Fix [DONE]"));

    history.push_back(tool("5 passed in 0.4s"));
    out = engine->on_turn(session, coding_turn(history));
    REQUIRE(out.status == TraversalStatus::COMPLETED);
    REQUIRE_FALSE(out.injection.has_value());
    REQUIRE_FALSE(session.has_active_plan());
    REQUIRE(out.finished_state->completed_nodes == 2);
    REQUIRE(log.has("completed! (2/2 nodes)"));
}

TEST_CASE("Traversal state persists across engine instances", "[engine][session][json]") {
    CapturedLog log;
    nlohmann::json saved;
    TurnHistory history{user("the login test keeps failing, please fix"), tool("1 failed")};
    {
        auto engine = fixture_engine(log);
        SessionState session;
        engine->on_turn(session, coding_turn({history[0]}));
        engine->on_turn(session, coding_turn(history));
        REQUIRE(session.traversal->current_node == "apply_fix");
        saved = nlohmann::json::parse(nlohmann::json(*session.traversal).dump());
    }

    auto engine = fixture_engine(log);
    SessionState session;
    session.traversal = saved.get<TraversalState>();

    history.push_back(tool("fixed the null check"));
    auto out = engine->on_turn(session, coding_turn(history));
    REQUIRE(out.status == TraversalStatus::AWAITING_OUTPUT);
    REQUIRE(session.traversal->current_node == "run_tests");
    REQUIRE(session.traversal->steps_completed == std::vector<NodeId>{"apply_fix"});
    REQUIRE(session.traversal->path == std::vector<NodeId>{"begin", "run_tests", "apply_fix", "run_tests"});
}

TEST_CASE("Escalation sets the PACE level and replaces the status block", "[engine][escalation]") {
    auto library = PlanLibrary::from_yaml_string(R"(
plans:
  risky_migration:
    name: Risky Migration
    triggers: [migrate, database]
    graph:
      start: s
      nodes:
        s: {type: start}
        migrate: {type: task, name: Run Migration, verify: {type: output_not_contains, value: error}}
        halt: {type: escalate, pace_level: emergency, reason: Migration failed}
        done: {type: exit}
      edges:
        - {from: s, to: migrate}
        - {from: migrate, to: done, condition: on_success}
        - {from: migrate, to: halt, condition: on_fail}
)");
    CapturedLog log;
    PlanFlowEngine engine(std::move(library), EngineConfig{}, log.sink());
    SessionState session;

    TurnHistory history{user("Migrate the database to v2")};
    REQUIRE(engine.on_turn(session, coding_turn(history)).activated_plan.has_value());

    history.push_back(tool("ERROR: relation \"users\" already exists"));
    auto out = engine.on_turn(session, coding_turn(history));
    REQUIRE(out.status == TraversalStatus::ESCALATED);
    REQUIRE(out.escalation.has_value());
    REQUIRE(out.escalation->pace_level == "emergency");
    REQUIRE(out.escalation->plan_id == "risky_migration");
    REQUIRE(session.pace_level == std::optional<std::string>("emergency"));
    REQUIRE_FALSE(session.has_active_plan());
    REQUIRE_THAT(*out.injection, StartsWith("[WORKFLOW ESCALATED: Risky Migration]"));
    REQUIRE_THAT(*out.injection, ContainsSubstring("Completed: 0/1 nodes"));
    REQUIRE_THAT(*out.injection, EndsWith("Change strategy or ask the user for guidance."));
}

TEST_CASE("Plans without a graph are matched but not activated", "[engine][activation]") {
    CapturedLog log;
    auto engine = fixture_engine(log);
    SessionState session;

    auto out = engine->on_turn(session, coding_turn({user("write a report with a summary")}));
    REQUIRE(out.status == TraversalStatus::IDLE);
    REQUIRE_FALSE(session.has_active_plan());
    REQUIRE(log.has("Matched plan 'write_report' has no graph, not activated"));
}

TEST_CASE("Allow-list keeps the host in control of selection", "[engine][activation]") {
    CapturedLog log;
    auto engine = fixture_engine(log);
    SessionState session;

    auto input = coding_turn({user("my test is failing, fix it")});
    input.allowed_plans = PlanAllowList{"write_report"};
    REQUIRE(engine->on_turn(session, input).status == TraversalStatus::IDLE);
    REQUIRE_FALSE(session.has_active_plan());
}

TEST_CASE("Traversal of a vanished plan is abandoned", "[engine][defect]") {
    CapturedLog log;
    auto engine = fixture_engine(log);
    SessionState session;
    session.traversal = TraversalState{};
    session.traversal->plan_id = "retired";
    session.traversal->plan_name = "Retired";
    session.traversal->current_node = "x";

    auto out = engine->on_turn(session, coding_turn({user("hello"), tool("output")}));
    REQUIRE(out.status == TraversalStatus::ABANDONED);
    REQUIRE_FALSE(session.has_active_plan());
    REQUIRE(log.has("Abandoning plan 'Retired'"));
}

TEST_CASE("Strict external checks need host confirmation", "[engine][verify][policy]") {
    EngineConfig config;
    config.permissive_external_checks = false;

    auto run = [&config](bool confirmed) {
        CapturedLog log;
        PlanFlowEngine engine(PlanLibrary::from_file(kDataDir + "/plan_library.json"), config, log.sink());
        SessionState session;
        TurnInput input;
        input.domain = "ops";
        input.history = {user("deploy the payments service")};
        engine.on_turn(session, input);
        REQUIRE(session.traversal->current_node == "build");

        input.history.push_back(tool("image pushed to registry"));
        engine.on_turn(session, input);
        REQUIRE(session.traversal->current_node == "ship");

        input.history.push_back(tool("rollout finished"));
        input.external_confirmation = confirmed;
        return engine.on_turn(session, input);
    };

    auto unconfirmed = run(false);
    REQUIRE(unconfirmed.status == TraversalStatus::COMPLETED);
    REQUIRE(unconfirmed.finished_state->steps_failed == std::vector<NodeId>{"ship"});
    REQUIRE(unconfirmed.finished_state->completed_nodes == 1);

    auto confirmed = run(true);
    REQUIRE(confirmed.status == TraversalStatus::COMPLETED);
    REQUIRE(confirmed.finished_state->steps_failed.empty());
    REQUIRE(confirmed.finished_state->completed_nodes == 2);
}

TEST_CASE("Engine config file drives library loading and limits", "[engine][config]") {
    CapturedLog log;
    auto engine = PlanFlowEngine::from_config_file(kDataDir + "/planflow_config.json", log.sink());

    const EngineConfig& config = engine->config();
    REQUIRE(config.max_events == 20);
    REQUIRE(config.max_route_depth == 8);
    REQUIRE(config.default_stale_after_turns == 10);
    REQUIRE_FALSE(config.permissive_external_checks);
    REQUIRE(config.log_level == LogLevel::WARNING);
    REQUIRE_THAT(config.plan_library_path, EndsWith("plan_library.yaml"));

    // library defaults only fill what the plan leaves out
    REQUIRE(engine->library().find("write_report")->trigger_threshold == 3);
    REQUIRE(engine->library().find("write_report")->stale_after_turns == 10);
    REQUIRE(engine->library().find("fix_failing_tests")->trigger_threshold == 2);
    REQUIRE(log.has("Plan library loaded: 2 plans (1 graph), 0 rejected"));
}

TEST_CASE("Config loading errors", "[engine][config][error]") {
    auto defaults = load_engine_config(kDataDir + "/no_such_config.json");
    REQUIRE(defaults.plan_library_path == "plan_library.yaml");
    REQUIRE(defaults.max_events == 50);
    REQUIRE(defaults.permissive_external_checks);

    REQUIRE_THROWS_AS(load_engine_config(kDataDir + "/bad_config.json"), ConfigError);
    REQUIRE_THROWS_AS(load_engine_config(kDataDir + "/plan_library.yaml"), ConfigError);

    EngineConfig missing_library;
    missing_library.plan_library_path = kDataDir + "/no_such_library.yaml";
    REQUIRE_THROWS_AS(PlanFlowEngine::from_config(missing_library, [](LogLevel, const std::string&) {}),
                      PlanLibraryError);
}

TEST_CASE("Tool results are recognised in the turn history", "[engine][history]") {
    TurnHistory history{
        user("  Run The Tests  "),
        tool("first run"),
        agent("[tool_result code_execution] second run"),
        agent("done, anything else?"),
    };
    REQUIRE(last_tool_output(history) == std::optional<std::string>("[tool_result code_execution] second run"));
    REQUIRE(last_user_message(history) == "run the tests");
    REQUIRE_FALSE(last_tool_output({user("hi")}).has_value());

    auto record = nlohmann::json{{"role", "assistant"}, {"content", "ok"}}.get<TurnRecord>();
    REQUIRE(record.role == TurnRole::AGENT);
    REQUIRE_THROWS(nlohmann::json{{"role", "narrator"}}.get<TurnRecord>());
}

TEST_CASE("on_turn degrades to passthrough when a turn throws", "[engine][error]") {
    std::vector<std::string> warnings;
    PlanFlowEngine engine(PlanLibrary::from_file(kDataDir + "/plan_library.yaml"), EngineConfig{},
                          [&warnings](LogLevel level, const std::string& msg) {
                              if (level == LogLevel::DEBUG) throw std::runtime_error("debug channel closed");
                              if (level == LogLevel::WARNING) warnings.push_back(msg);
                          });
    SessionState session;

    TurnOutput out;
    REQUIRE_NOTHROW(out = engine.on_turn(session, coding_turn({user("my test is failing, fix it")})));
    REQUIRE(out.status == TraversalStatus::IDLE);
    REQUIRE_FALSE(out.injection.has_value());
    REQUIRE_FALSE(out.activated_plan.has_value());
    REQUIRE_FALSE(session.has_active_plan());
    REQUIRE(warnings.size() == 1);
    REQUIRE_THAT(warnings[0], ContainsSubstring("Error (passthrough): debug channel closed"));
}

TEST_CASE("A log sink that always throws never reaches the host loop", "[engine][error]") {
    PlanFlowEngine engine(PlanLibrary::from_file(kDataDir + "/plan_library.yaml"), EngineConfig{},
                          [](LogLevel, const std::string&) { throw std::runtime_error("log disk full"); });

    SECTION("while selecting a plan") {
        SessionState session;
        TurnOutput out;
        REQUIRE_NOTHROW(out = engine.on_turn(session, coding_turn({user("my test is failing, fix it")})));
        REQUIRE(out.status == TraversalStatus::IDLE);
        REQUIRE_FALSE(session.has_active_plan());
    }

    SECTION("while advancing an active plan") {
        SessionState session;
        session.traversal = engine.traversal().activate(*engine.library().find("fix_failing_tests"));
        const nlohmann::json before = *session.traversal;

        TurnOutput out;
        REQUIRE_NOTHROW(out = engine.on_turn(session,
            coding_turn({user("my test is failing, fix it"), tool("2 FAILED")})));
        REQUIRE(out.status == TraversalStatus::AWAITING_OUTPUT);
        REQUIRE_FALSE(out.injection.has_value());
        REQUIRE(nlohmann::json(*session.traversal) == before);
    }
}
