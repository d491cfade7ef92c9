#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "protocol/skill_contract.hpp"

namespace helm::skills {

// Skills by name; the directory holding SKILL.md names the skill.
using SkillIndex = std::map<std::string, protocol::Skill>;

struct SkillDocument {
    std::string description;
    std::string body;
    std::vector<std::string> triggers;
};

// Reads `description` and `triggers` from a leading "---" block. Items listed
// under a "When to Apply", "Triggers" or "Apply when" heading are triggers too.
// Without a description the first non-heading line of the body is used.
SkillDocument parse_skill_document(const std::string& content);

// Explicit directories first, then <workspace>/.helm/skills and
// $HOME/.agents/skills. Duplicates are dropped.
std::vector<std::filesystem::path> skill_roots(const std::vector<std::filesystem::path>& extra,
                                               const std::filesystem::path& workspace_root,
                                               const char* home);

// Walks each root for SKILL.md files. The first root defining a name wins.
SkillIndex discover_skills(const std::vector<std::filesystem::path>& roots);

struct SkillSelection {
    std::vector<protocol::Skill> active;
    std::vector<std::string> missing;
};

SkillSelection select_skills(const SkillIndex& index, const std::vector<std::string>& names);

// Skills named as "$name" in the input.
std::vector<protocol::Skill> find_mentioned_skills(const std::string& input,
                                                   const SkillIndex& index,
                                                   const std::vector<protocol::Skill>& active);

// Skills whose triggers appear in the input. Single-word triggers match whole
// words only; phrases match as substrings.
std::vector<protocol::Skill> find_triggered_skills(const std::string& input,
                                                   const SkillIndex& index,
                                                   const std::vector<protocol::Skill>& active);

// Appends mentioned and triggered skills to `active` and returns their names.
std::vector<std::string> auto_enable_skills(const std::string& input, const SkillIndex& index,
                                            std::vector<protocol::Skill>& active);

}  // namespace helm::skills
