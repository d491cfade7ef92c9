#include <algorithm>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <pthread.h>
#include "app/cli_parser.hpp"
#include "core/config/agent_settings.hpp"
#include "core/errors/agent_errors.hpp"
#include "core/logging/logger.hpp"
#include "providers/anthropic_provider.hpp"
#include "providers/http_client.hpp"
#include "providers/openai_compatible_provider.hpp"
#include "runtime/turn_controller.hpp"
#include "session/event_log_writer.hpp"
#include "skills/skill_catalog.hpp"
#include "tools/todo_store.hpp"
#include "tools/tool_host.hpp"
#include "tools/tool_registry.hpp"

namespace {

    namespace errors = helm::core::errors;
    namespace logging = helm::core::logging;

    constexpr const char* kDefaultOpenAiUrl = "https://api.openai.com/v1";
    constexpr const char* kDefaultAnthropicUrl = "https://api.anthropic.com/v1";

    void report_error(const std::string& what, const errors::AgentError& err) {
        HELM_LOG_ERROR(what + " [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            HELM_LOG_INFO("Hint: " + err.hint);
        }
    }

    std::optional<std::string> read_project_instructions(const std::filesystem::path& root) {
        const auto path = root / "AGENTS.md";
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec) || ec) {
            return std::nullopt;
        }
        std::ifstream in(path);
        if (!in.is_open()) {
            HELM_LOG_WARN("Unable to read " + path.string());
            return std::nullopt;
        }
        std::ostringstream content;
        content << in.rdbuf();
        HELM_LOG_DEBUG("Loaded project instructions from " + path.string());
        return content.str();
    }

    std::shared_ptr<helm::providers::IProvider> make_provider(
        helm::core::config::AgentSettings& settings) {
        auto http = std::make_shared<helm::providers::CurlHttpClient>();
        if (settings.native_format == helm::core::config::NativeFormat::Anthropic) {
            if (settings.provider.base_url == kDefaultOpenAiUrl) {
                settings.provider.base_url = kDefaultAnthropicUrl;
            }
            return std::make_shared<helm::providers::AnthropicProvider>(
                settings.provider, settings.native_tools, http);
        }
        return std::make_shared<helm::providers::OpenAiCompatibleProvider>(
            settings.provider, settings.native_tools, http);
    }

    // Prompts on stderr and reads one line from stdin; anything but y/yes declines.
    bool ask_user(const std::string& kind, const std::string& details) {
        if (kind == "shell") {
            std::cerr << "\nRun shell command?\n  " << details << "\n[y/N] " << std::flush;
        } else {
            std::cerr << "\n" << details << " [y/N] " << std::flush;
        }
        std::string answer;
        if (!std::getline(std::cin, answer)) {
            return false;
        }
        return answer == "y" || answer == "Y" || answer == "yes";
    }

    // SIGINT is blocked in every thread; this thread receives it with sigwait and
    // aborts the running turn. With no turn running, Ctrl-C exits the process.
    class SignalWatcher {
    public:
        explicit SignalWatcher(helm::runtime::TurnController& controller) : controller_(controller) {
            sigemptyset(&set_);
            sigaddset(&set_, SIGINT);
            pthread_sigmask(SIG_BLOCK, &set_, nullptr);
            thread_ = std::thread([this] { run(); });
        }

        ~SignalWatcher() {
            stopping_.store(true);
            pthread_kill(thread_.native_handle(), SIGINT);
            thread_.join();
        }

        SignalWatcher(const SignalWatcher&) = delete;
        SignalWatcher& operator=(const SignalWatcher&) = delete;

    private:
        void run() {
            while (true) {
                int signal_number = 0;
                if (sigwait(&set_, &signal_number) != 0) {
                    continue;
                }
                if (stopping_.load()) {
                    return;
                }
                if (!controller_.request_abort()) {
                    std::cerr << "\nInterrupted." << std::endl;
                    std::_Exit(130);
                }
                std::cerr << "\nAborting the current turn..." << std::endl;
            }
        }

        helm::runtime::TurnController& controller_;
        sigset_t set_;
        std::atomic_bool stopping_{false};
        std::thread thread_;
    };

    helm::protocol::EventSink make_event_sink(const helm::core::config::AgentSettings& settings,
                                              const bool verbose) {
        auto writer = settings.log_events
                          ? std::make_shared<helm::session::EventLogWriter>(settings.workspace_root)
                          : nullptr;
        auto turn_id = std::make_shared<std::string>();
        return [writer, turn_id, verbose](const helm::protocol::AgentEvent& event) {
            if (const auto* start = std::get_if<helm::protocol::TurnStartEvent>(&event)) {
                *turn_id = start->turn_id;
            }
            if (verbose) {
                if (const auto* tool = std::get_if<helm::protocol::ToolStartEvent>(&event)) {
                    HELM_LOG_INFO("tool " + tool->tool + " " + tool->input.dump());
                } else {
                    HELM_LOG_DEBUG("event " + helm::protocol::event_name(event));
                }
            }
            if (writer && !turn_id->empty()) {
                auto written = writer->write_event(*turn_id, event);
                if (errors::is_error(written)) {
                    report_error("Failed to write event log", errors::get_error(written));
                }
            }
        };
    }

    // Enables skills mentioned as $name or triggered by the request before it runs.
    void enable_requested_skills(const std::string& input, const helm::skills::SkillIndex& index,
                                 helm::runtime::SessionContext& session) {
        auto active = session.snapshot().active_skills;
        const auto enabled = helm::skills::auto_enable_skills(input, index, active);
        if (enabled.empty()) {
            return;
        }
        for (const auto& name : enabled) {
            HELM_LOG_INFO("Enabled skill " + name);
        }
        session.set_active_skills(std::move(active));
    }

    void handle_skill_command(const std::string& line, const helm::skills::SkillIndex& index,
                              helm::runtime::SessionContext& session) {
        auto active = session.snapshot().active_skills;
        if (line == "/skills") {
            std::cerr << "Active:";
            for (const auto& skill : active) {
                std::cerr << " " << skill.name;
            }
            std::cerr << "\nAvailable:";
            for (const auto& entry : index) {
                std::cerr << "\n  " << entry.first << " - " << entry.second.description;
            }
            std::cerr << std::endl;
            return;
        }

        const std::string name = line.size() > 7 ? line.substr(7) : "";
        auto selection = helm::skills::select_skills(index, {name});
        if (!selection.missing.empty() || selection.active.empty()) {
            std::cerr << "Unknown skill: " << name << std::endl;
            return;
        }
        const auto& skill = selection.active.front();
        if (std::none_of(active.begin(), active.end(),
                         [&skill](const auto& current) { return current.name == skill.name; })) {
            active.push_back(skill);
            session.set_active_skills(std::move(active));
        }
        std::cerr << "Skill enabled: " << skill.name << std::endl;
    }

    int run_once(helm::runtime::TurnController& controller, const std::string& task) {
        auto outcome = controller.run_turn(task);
        if (errors::is_error(outcome)) {
            const auto& err = errors::get_error(outcome);
            if (errors::is_cancellation(err)) {
                std::cerr << "Turn aborted." << std::endl;
                return 130;
            }
            report_error("Turn failed", err);
            return 1;
        }
        std::cout << errors::get_value(outcome) << std::endl;
        return 0;
    }

    int run_chat(helm::runtime::TurnController& controller,
                 const std::shared_ptr<helm::tools::TodoStore>& todos,
                 const helm::skills::SkillIndex& skill_index,
                 helm::runtime::SessionContext& session) {
        std::cerr << "helm chat. Commands: /compact /clear /skills /skill NAME /exit" << std::endl;
        std::string line;
        while (true) {
            std::cerr << "\n> " << std::flush;
            if (!std::getline(std::cin, line)) {
                break;
            }
            if (line.find_first_not_of(" \t\r") == std::string::npos) {
                continue;
            }
            if (line == "/exit") {
                break;
            }
            if (line == "/clear") {
                controller.clear_history();
                todos->clear();
                std::cerr << "History cleared." << std::endl;
                continue;
            }
            if (line == "/skills" || line.rfind("/skill ", 0) == 0) {
                handle_skill_command(line, skill_index, session);
                continue;
            }
            if (line == "/compact") {
                auto compacted = controller.compact_history();
                if (errors::is_error(compacted)) {
                    report_error("Compaction failed", errors::get_error(compacted));
                    continue;
                }
                const auto& result = errors::get_value(compacted);
                std::cerr << "History: " << result.before_messages << " -> "
                          << result.after_messages << " messages"
                          << (result.used_fallback ? " (fallback summary)" : "") << std::endl;
                continue;
            }

            enable_requested_skills(line, skill_index, session);
            auto outcome = controller.run_turn(line);
            if (errors::is_error(outcome)) {
                const auto& err = errors::get_error(outcome);
                if (errors::is_cancellation(err)) {
                    std::cerr << "Turn aborted." << std::endl;
                } else {
                    report_error("Turn failed", err);
                }
                continue;
            }
            std::cout << errors::get_value(outcome) << std::endl;
        }
        return 0;
    }

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Defaults, then environment, then flags
    auto environment = helm::core::config::apply_environment(helm::core::config::AgentSettings{});
    if (errors::is_error(environment)) {
        report_error("Input error", errors::get_error(environment));
        return 2;
    }

    auto parsed = helm::app::cli::parse_and_validate(argc, argv, errors::get_value(environment));
    if (errors::is_error(parsed)) {
        report_error("Input error", errors::get_error(parsed));
        return 2;
    }
    auto req = errors::get_value(parsed);

    // 2. Logging threshold: --verbose, overridden by HELM_LOG_LEVEL
    if (req.verbose) {
        logging::Logger::get().set_min_level(logging::LogLevel::INFO);
    }
    if (const char* level_text = std::getenv("HELM_LOG_LEVEL")) {
        logging::LogLevel level = logging::LogLevel::WARN;
        if (!logging::Logger::parse_level(level_text, level)) {
            report_error("Input error",
                         errors::AgentError{errors::ErrorCategory::Input,
                                            std::string("Unknown HELM_LOG_LEVEL: ") + level_text,
                                            "invalid_log_level", "Use debug, info, warn or error."});
            return 2;
        }
        logging::Logger::get().set_min_level(level);
    }

    auto& settings = req.settings;
    HELM_LOG_INFO("Workspace: " + settings.workspace_root.string());

    // 3. Wire the controller
    auto provider = make_provider(settings);
    HELM_LOG_INFO("Provider: " + provider->kind() + " model " + provider->model() + " at " +
                  settings.provider.base_url);

    auto todos = std::make_shared<helm::tools::TodoStore>();
    auto host = std::make_shared<const helm::tools::ToolHost>();
    auto registry = std::make_shared<const helm::tools::ToolRegistry>(
        helm::tools::make_builtin_registry(host, todos));

    auto session = std::make_shared<helm::runtime::SessionContext>();
    session->set_auto_approve(settings.auto_approve);
    session->set_project_instructions(read_project_instructions(settings.workspace_root));

    const auto skill_index = helm::skills::discover_skills(helm::skills::skill_roots(
        settings.skill_dirs, settings.workspace_root, std::getenv("HOME")));
    auto selection = helm::skills::select_skills(skill_index, settings.skills);
    for (const auto& name : selection.missing) {
        HELM_LOG_WARN("Skill not found: " + name);
    }
    session->set_active_skills(std::move(selection.active));

    helm::runtime::TurnControllerDeps deps;
    deps.provider = provider;
    deps.tools = registry;
    deps.session = session;
    deps.approve = &ask_user;
    deps.on_event = make_event_sink(settings, req.verbose);

    helm::runtime::TurnController controller(settings, std::move(deps));
    SignalWatcher watcher(controller);

    // 4. Run
    if (req.command == helm::app::cli::Command::Run) {
        enable_requested_skills(req.task.value(), skill_index, *session);
        return run_once(controller, req.task.value());
    }
    return run_chat(controller, todos, skill_index, *session);
}
