// main.cpp
#include <iostream>
#include <fstream>
#include <nlohmann/json.hpp>
#include "planflow/core/engine.h"

namespace {

void print_output(std::size_t turn, const planflow::TurnOutput& out) {
    std::cout << "--- turn " << turn << ": " << planflow::to_string(out.status);
    if (out.activated_plan) {
        std::cout << " (activated " << *out.activated_plan << ")";
    }
    std::cout << "\n";
    if (out.injection) {
        std::cout << *out.injection << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc != 3) {
        std::cerr << "Usage: " << argv[0] << " <plan_library.yaml|json> <script.json>\n";
        return 1;
    }

    try {
        // 1. 加载计划库
        planflow::EngineConfig config;
        config.plan_library_path = argv[1];
        auto engine = planflow::PlanFlowEngine::from_config(config);

        // 2. 读取对话脚本
        std::ifstream script_file(argv[2]);
        if (!script_file.is_open()) {
            std::cerr << "[ERROR] Cannot open script: " << argv[2] << "\n";
            return 1;
        }
        nlohmann::json script = nlohmann::json::parse(script_file);

        planflow::TurnInput input;
        input.domain = script.value("domain", std::string("general"));
        planflow::SessionState session;
        std::optional<planflow::TraversalState> last_finished;

        // 3. 逐轮回放
        std::size_t turn = 0;
        for (const auto& entry : script.at("turns")) {
            input.history.push_back(entry.get<planflow::TurnRecord>());
            input.external_confirmation = entry.value("confirmed", false);

            auto out = engine->on_turn(session, input);
            print_output(++turn, out);
            if (out.finished_state) {
                last_finished = std::move(out.finished_state);
            }
        }

        if (session.pace_level) {
            std::cout << "PACE level: " << *session.pace_level << "\n";
        }

        // 4. 导出 Trace 到文件
        nlohmann::json trace_json = nlohmann::json::object();
        if (session.traversal) {
            trace_json["active"] = *session.traversal;
        }
        if (last_finished) {
            trace_json["finished"] = *last_finished;
        }
        std::ofstream trace_file("traversal_trace.json");
        trace_file << trace_json.dump(2) << std::endl;
        std::cout << "Trace exported to traversal_trace.json\n";

    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
