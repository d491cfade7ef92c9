#include "cli_parser.hpp"
#include <algorithm>
#include <charconv>
#include <filesystem>
#include <system_error>
#include <vector>

namespace helm::app::cli {

    using namespace helm::core::errors;
    using helm::core::config::AgentSettings;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> task;
        std::optional<std::string> cwd;
        std::optional<std::string> model;
        std::optional<std::string> base_url;
        std::optional<std::string> format;
        std::optional<std::string> planning;
        std::optional<std::string> max_iterations;
        std::optional<std::string> checkpoint;
        std::vector<std::string> skills;
        bool native_tools = false;
        bool auto_approve = false;
        bool log_events = false;
        bool verbose = false;
    };

    std::string usage() {
        return "Usage: helm run --task \"...\" [flags] | helm chat [flags]\n"
               "Flags: --cwd DIR --model NAME --base-url URL --native-tools\n"
               "       --format openai|anthropic --planning off|auto|always\n"
               "       --max-iterations N --checkpoint N --skill NAME (repeatable)\n"
               "       --auto-approve --log-events --verbose";
    }

    namespace {

        // Exception-free integer parsing
        Result<uint32_t> parse_bounded(const std::string& flag, const std::string& text) {
            uint32_t value = 0;
            const char* begin = text.data();
            const char* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (ec != std::errc() || ptr != end) {
                return AgentError{ErrorCategory::Input, "Invalid number for " + flag, "invalid_integer", "Provide a positive integer."};
            }
            if (value == 0 || value > 1000) {
                return AgentError{ErrorCategory::Input, flag + " out of bounds", "bounds_error", "Must be between 1 and 1000."};
            }
            return value;
        }

        bool takes_value(const std::string& arg, std::optional<std::string>*& slot, RawCliOptions& raw) {
            if (arg == "--task") slot = &raw.task;
            else if (arg == "--cwd") slot = &raw.cwd;
            else if (arg == "--model") slot = &raw.model;
            else if (arg == "--base-url") slot = &raw.base_url;
            else if (arg == "--format") slot = &raw.format;
            else if (arg == "--planning") slot = &raw.planning;
            else if (arg == "--max-iterations") slot = &raw.max_iterations;
            else if (arg == "--checkpoint") slot = &raw.checkpoint;
            else return false;
            return true;
        }

    }

    Result<CliRequest> parse_and_validate(int argc, char* argv[], AgentSettings base) {
        if (argc < 2) {
            return AgentError{ErrorCategory::Input, "No command provided.", "missing_command", usage()};
        }

        CliRequest req;
        std::string command = argv[1];
        if (command == "run") {
            req.command = Command::Run;
        } else if (command == "chat") {
            req.command = Command::Chat;
        } else {
            return AgentError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Supported commands are 'run' and 'chat'."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            std::optional<std::string>* slot = nullptr;
            if (takes_value(args[i], slot, raw)) {
                if (i + 1 < args.size()) *slot = args[++i];
                else return AgentError{ErrorCategory::Input, "Missing value for " + args[i], "missing_value"};
            } else if (args[i] == "--skill") {
                if (i + 1 < args.size()) raw.skills.push_back(args[++i]);
                else return AgentError{ErrorCategory::Input, "Missing value for --skill", "missing_value"};
            } else if (args[i] == "--native-tools") {
                raw.native_tools = true;
            } else if (args[i] == "--auto-approve") {
                raw.auto_approve = true;
            } else if (args[i] == "--log-events") {
                raw.log_events = true;
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return AgentError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        req.verbose = raw.verbose;
        AgentSettings& settings = base;

        if (req.command == Command::Run) {
            if (!raw.task.has_value() || raw.task->find_first_not_of(" \t\r\n") == std::string::npos) {
                return AgentError{ErrorCategory::Input, "Must provide a non-empty --task", "missing_required_flag"};
            }
            req.task = raw.task.value();
        } else if (raw.task.has_value()) {
            return AgentError{ErrorCategory::Input, "--task is only valid with 'run'", "conflicting_flags", "In chat mode, type the request at the prompt."};
        }

        if (raw.model) {
            if (raw.model->empty()) {
                return AgentError{ErrorCategory::Input, "--model cannot be empty", "invalid_value"};
            }
            settings.provider.model = raw.model.value();
        }
        if (raw.base_url) {
            if (raw.base_url->rfind("http://", 0) != 0 && raw.base_url->rfind("https://", 0) != 0) {
                return AgentError{ErrorCategory::Input, "--base-url must start with http:// or https://", "invalid_url"};
            }
            settings.provider.base_url = raw.base_url.value();
        }
        if (raw.format) {
            auto format = helm::core::config::parse_native_format(raw.format.value());
            if (is_error(format)) return get_error(format);
            settings.native_format = get_value(format);
        }
        if (raw.planning) {
            auto planning = helm::core::config::parse_planning_mode(raw.planning.value());
            if (is_error(planning)) return get_error(planning);
            settings.planning = get_value(planning);
        }
        if (raw.max_iterations) {
            auto value = parse_bounded("--max-iterations", raw.max_iterations.value());
            if (is_error(value)) return get_error(value);
            settings.max_iterations = get_value(value);
        }
        if (raw.checkpoint) {
            auto value = parse_bounded("--checkpoint", raw.checkpoint.value());
            if (is_error(value)) return get_error(value);
            settings.checkpoint_interval = get_value(value);
        }
        for (const auto& skill : raw.skills) {
            if (skill.find_first_not_of(" \t") == std::string::npos) {
                return AgentError{ErrorCategory::Input, "--skill cannot be empty", "invalid_value"};
            }
            if (std::find(settings.skills.begin(), settings.skills.end(), skill) == settings.skills.end()) {
                settings.skills.push_back(skill);
            }
        }
        if (raw.native_tools) settings.native_tools = true;
        if (raw.auto_approve) settings.auto_approve = true;
        if (raw.log_events) settings.log_events = true;

        // Path validation
        if (raw.cwd) {
            std::filesystem::path p(raw.cwd.value());
            std::error_code path_ec;
            const bool is_dir = std::filesystem::is_directory(p, path_ec);
            if (path_ec || !is_dir) {
                return AgentError{ErrorCategory::Input, "Working directory does not exist or is not a directory", "invalid_path"};
            }

            std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
            if (path_ec) {
                return AgentError{ErrorCategory::Input, "Failed to canonicalize working directory", "invalid_path"};
            }
            settings.workspace_root = std::move(canonical_path);
        }

        req.settings = std::move(settings);
        return req;
    }

} // namespace helm::app::cli
