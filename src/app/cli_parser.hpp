#pragma once
#include <optional>
#include <string>
#include "core/config/agent_settings.hpp"
#include "core/errors/agent_errors.hpp"

namespace helm::app::cli {

    enum class Command {
        Run,   // One turn, answer on stdout
        Chat   // Interactive loop over stdin
    };

    struct CliRequest {
        Command command = Command::Run;
        std::optional<std::string> task;
        bool verbose = false;
        helm::core::config::AgentSettings settings;
    };

    // Flags are layered on top of the given settings (defaults plus environment).
    helm::core::errors::Result<CliRequest> parse_and_validate(
        int argc, char* argv[], helm::core::config::AgentSettings base);

    std::string usage();
}
