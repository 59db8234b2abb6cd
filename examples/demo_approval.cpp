/**
 * Loom Approval Demo
 *
 * Shows a run that pauses on a confirmable tool, serializes the paused
 * state, and resumes it after a decision from the terminal. The model is
 * a scripted transport, so no network access or credentials are needed.
 *
 * Usage:
 *   ./demo_approval [options]
 *
 * Options:
 *   --path <file>           File the agent is asked to delete (default: /tmp/report.txt)
 *   --stream                Print streaming events while resuming
 *   --log-file <path>       Write library logs to a file
 *   --log-level <level>     trace, debug, info, warn, error (default: info)
 *   --help                  Show this help message
 */

#include "loom/loom.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <variant>

// ============================================================================
// Scripted model
// ============================================================================

/**
 * Asks to delete the file named in the last user message, then reports
 * back once the tool result is in the conversation.
 */
class ScriptedTransport : public loom::backend::ITransport {
public:
    loom::Expected<loom::backend::ModelResponse> send(const loom::backend::ModelRequest& request) override {
        loom::backend::ModelResponse response;
        response.usage = loom::TokenUsage{40, 12, 52};

        const auto& last = request.messages.back();
        if (last.role == loom::Role::Tool) {
            response.text = "Done: " + last.content + ".";
            return response;
        }

        std::string path = last.content.substr(last.content.rfind(' ') + 1);
        nlohmann::json args = {{"path", path}};
        response.tool_calls.push_back(loom::ToolCall{"fc_1", "call_1", "delete_file", args.dump()});
        return response;
    }
};

struct CLIArgs {
    std::string path = "/tmp/report.txt";
    bool stream = false;
    std::string log_file;
    std::string log_level = "info";
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cout << "Loom Approval Demo\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << program_name << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --path <file>           File the agent is asked to delete (default: /tmp/report.txt)\n";
    std::cout << "  --stream                Print streaming events while resuming\n";
    std::cout << "  --log-file <path>       Write library logs to a file\n";
    std::cout << "  --log-level <level>     trace, debug, info, warn, error (default: info)\n";
    std::cout << "  --help                  Show this help message\n";
}

CLIArgs parse_args(int argc, char** argv) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            args.help = true;
            return args;
        }
        else if (arg == "--path" && i + 1 < argc) {
            args.path = argv[++i];
        }
        else if (arg == "--stream") {
            args.stream = true;
        }
        else if (arg == "--log-file" && i + 1 < argc) {
            args.log_file = argv[++i];
        }
        else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            args.help = true;
            return args;
        }
    }
    return args;
}

void print_separator() {
    std::cout << std::string(60, '-') << "\n";
}

void print_result(const loom::RunResult& result) {
    print_separator();
    if (result.is_success()) {
        std::cout << "Assistant: " << result.output() << "\n";
    } else if (result.is_error()) {
        std::cout << "Error: " << result.error()->to_string() << "\n";
    } else if (result.is_paused()) {
        std::cout << "Paused again on " << result.paused_state()->pending_tool_call().name << "\n";
    }
    std::cout << "Turns used: " << result.turns_used()
              << ", tokens: " << result.usage().total_tokens << "\n";
    for (const auto& execution : result.tool_executions()) {
        std::cout << "  " << execution.tool_name << " -> " << execution.output
                  << (execution.success ? "" : " (failed)") << "\n";
    }
    print_separator();
}

// Streaming consumer for the resumed run
loom::RunResult consume(loom::stream::StreamingSession& session) {
    while (auto event = session.next()) {
        if (const auto* executed = std::get_if<loom::stream::ToolExecuted>(&*event)) {
            std::cout << "[tool] " << executed->execution.tool_name << ": " << executed->execution.output << "\n";
        } else if (const auto* turn = std::get_if<loom::stream::TurnStarted>(&*event)) {
            std::cout << "[turn " << turn->turn << "]\n";
        } else if (const auto* delta = std::get_if<loom::stream::TextDelta>(&*event)) {
            std::cout << delta->text << std::flush;
        }
    }
    std::cout << "\n";
    return session.result();
}

int main(int argc, char** argv) {
    CLIArgs args = parse_args(argc, argv);
    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    if (!args.log_file.empty()) {
        if (auto logging = loom::log::init_log(args.log_file, args.log_level); !logging) {
            std::cerr << "Error: " << logging.error().to_string() << "\n";
            return 1;
        }
    }

    auto tools = std::make_shared<loom::engine::ToolRegistry>();
    tools->register_tool("delete_file", "Delete a file from disk",
        nlohmann::json{
            {"type", "object"},
            {"properties", {{"path", {{"type", "string"}}}}},
            {"required", nlohmann::json::array({"path"})}
        },
        loom::engine::SimpleToolHandler([](const nlohmann::json& a) -> loom::Expected<nlohmann::json> {
            // Pretend to delete; the demo never touches the filesystem
            return nlohmann::json("deleted " + a.at("path").get<std::string>());
        }));
    if (auto marked = tools->require_confirmation("delete_file"); !marked) {
        std::cerr << "Error: " << marked.error().to_string() << "\n";
        return 1;
    }

    loom::AgentConfig config;
    config.name = "FileJanitor";
    config.model = "scripted";
    config.instructions = "You clean up files the user no longer needs.";
    config.tools = tools;

    auto agent = loom::Agent::create(config, std::make_shared<ScriptedTransport>());
    if (!agent) {
        std::cerr << "Error: " << agent.error().to_string() << "\n";
        return 1;
    }

    auto first = (*agent)->run("Please delete " + args.path);
    if (!first.is_paused()) {
        print_result(first);
        return first.is_success() ? 0 : 1;
    }

    // Persist the paused run as a document, as a server would between requests
    const std::string document = first.paused_state()->to_json().dump(2);
    std::cout << "Run paused. Stored state is " << document.size() << " bytes.\n";

    auto restored = loom::PausedRunState::from_json(nlohmann::json::parse(document));
    if (!restored) {
        std::cerr << "Error: " << restored.error().to_string() << "\n";
        return 1;
    }

    const auto& call = restored->pending_tool_call();
    std::cout << "Agent wants to call " << call.name << " with " << call.arguments << "\n";
    std::cout << "Approve? [y/N] " << std::flush;

    std::string answer;
    std::getline(std::cin, answer);
    auto decided = (answer == "y" || answer == "Y")
        ? restored->approve()
        : restored->reject("The user declined");
    if (!decided) {
        std::cerr << "Error: " << decided.error().to_string() << "\n";
        return 1;
    }

    loom::RunResult final_result = first;
    if (args.stream) {
        auto session = (*agent)->resume_streaming(*restored);
        if (!session) {
            std::cerr << "Error: " << session.error().to_string() << "\n";
            return 1;
        }
        final_result = consume(**session);
    } else {
        auto resumed = (*agent)->resume(*restored);
        if (!resumed) {
            std::cerr << "Error: " << resumed.error().to_string() << "\n";
            return 1;
        }
        final_result = std::move(*resumed);
    }

    print_result(final_result);
    return final_result.is_error() ? 1 : 0;
}
