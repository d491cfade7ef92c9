#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace helm::protocol {

    // A SKILL.md document enabled for the session.
    struct Skill {
        std::string name;
        std::filesystem::path path;
        std::string description;
        // Markdown after the frontmatter block.
        std::string body;
        // Lowercased keywords and phrases that auto-enable the skill.
        std::vector<std::string> triggers;
    };

} // namespace helm::protocol
