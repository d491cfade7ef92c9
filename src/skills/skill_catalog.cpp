#include "skills/skill_catalog.hpp"

#include <algorithm>
#include <cctype>
#include <deque>
#include <fstream>
#include <optional>
#include <sstream>
#include <system_error>
#include <yaml-cpp/yaml.h>
#include "core/logging/logger.hpp"

namespace helm::skills {

namespace {

constexpr const char* kSkillFileName = "SKILL.md";
constexpr std::size_t kMaxSkillFiles = 500;
constexpr int kMaxWalkDepth = 5;

std::string trim(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

std::vector<std::string> split_commas(const std::string& value) {
    std::vector<std::string> items;
    std::istringstream in(value);
    std::string item;
    while (std::getline(in, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

// Reads `description` and `triggers` (sequence or comma string).
void read_frontmatter(const std::string& text, SkillDocument& document) {
    YAML::Node front;
    try {
        front = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        HELM_LOG_WARN(std::string("SkillCatalog: ignoring invalid frontmatter: ") + e.what());
        return;
    }
    if (!front.IsMap()) {
        return;
    }

    const YAML::Node description = front["description"];
    if (description && description.IsScalar()) {
        document.description = trim(description.Scalar());
    }

    const YAML::Node triggers = front["triggers"];
    if (!triggers) {
        return;
    }
    if (triggers.IsSequence()) {
        for (const auto& item : triggers) {
            if (item.IsScalar()) {
                document.triggers.push_back(item.Scalar());
            }
        }
    } else if (triggers.IsScalar()) {
        for (auto& trigger : split_commas(triggers.Scalar())) {
            document.triggers.push_back(std::move(trigger));
        }
    }
}

bool is_list_item(const std::string& trimmed) {
    return trimmed.size() >= 2 && (trimmed[0] == '-' || trimmed[0] == '*') && trimmed[1] == ' ';
}

bool is_trigger_heading(const std::string& trimmed) {
    if (trimmed.empty() || trimmed.front() != '#') {
        return false;
    }
    const auto text_start = trimmed.find_first_not_of('#');
    if (text_start == std::string::npos) {
        return false;
    }
    const std::string title = lowercase(trim(trimmed.substr(text_start)));
    return title.rfind("when to apply", 0) == 0 || title.rfind("triggers", 0) == 0 ||
           title.rfind("apply when", 0) == 0;
}

bool is_word_char(const char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool contains_word(const std::string& text, const std::string& word) {
    for (auto pos = text.find(word); pos != std::string::npos; pos = text.find(word, pos + 1)) {
        const bool starts = pos == 0 || !is_word_char(text[pos - 1]);
        const std::size_t end = pos + word.size();
        const bool ends = end == text.size() || !is_word_char(text[end]);
        if (starts && ends) {
            return true;
        }
    }
    return false;
}

bool is_active(const std::vector<protocol::Skill>& active, const std::string& name) {
    return std::any_of(active.begin(), active.end(),
                       [&name](const protocol::Skill& skill) { return skill.name == name; });
}

std::optional<std::string> read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::ostringstream content;
    content << in.rdbuf();
    return content.str();
}

bool skipped_directory(const std::string& name) {
    return name == ".git" || name == "node_modules" || name == ".next" || name == "dist" ||
           name == "build";
}

std::vector<std::filesystem::path> find_skill_files(const std::filesystem::path& root) {
    std::vector<std::filesystem::path> found;
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec) || ec) {
        return found;
    }

    std::deque<std::pair<std::filesystem::path, int>> queue = {{root, 0}};
    while (!queue.empty() && found.size() < kMaxSkillFiles) {
        const auto [dir, depth] = queue.front();
        queue.pop_front();

        std::vector<std::filesystem::directory_entry> entries;
        for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end;
             it.increment(ec)) {
            entries.push_back(*it);
        }
        if (ec) {
            HELM_LOG_DEBUG("SkillCatalog: cannot read " + dir.string() + ": " + ec.message());
            ec.clear();
            continue;
        }
        std::sort(entries.begin(), entries.end(),
                  [](const auto& lhs, const auto& rhs) { return lhs.path() < rhs.path(); });

        for (const auto& entry : entries) {
            const std::string name = entry.path().filename().string();
            if (entry.is_directory(ec) && !ec) {
                if (depth < kMaxWalkDepth && !skipped_directory(name)) {
                    queue.emplace_back(entry.path(), depth + 1);
                }
                continue;
            }
            ec.clear();
            if (name == kSkillFileName && entry.is_regular_file(ec) && !ec) {
                found.push_back(entry.path());
                if (found.size() >= kMaxSkillFiles) {
                    break;
                }
            }
            ec.clear();
        }
    }
    return found;
}

}  // namespace

SkillDocument parse_skill_document(const std::string& content) {
    SkillDocument document;
    const std::vector<std::string> lines = split_lines(trim(content));

    std::size_t body_start = 0;
    if (!lines.empty() && trim(lines[0]) == "---") {
        std::size_t close = 1;
        while (close < lines.size() && trim(lines[close]) != "---") {
            ++close;
        }
        if (close < lines.size()) {
            std::string front;
            for (std::size_t i = 1; i < close; ++i) {
                front += lines[i] + "\n";
            }
            read_frontmatter(front, document);
            body_start = close + 1;
        }
    }

    std::ostringstream body;
    bool in_trigger_section = false;
    for (std::size_t i = body_start; i < lines.size(); ++i) {
        if (i > body_start) {
            body << "\n";
        }
        body << lines[i];

        const std::string trimmed = trim(lines[i]);
        if (!trimmed.empty() && trimmed.front() == '#') {
            in_trigger_section = is_trigger_heading(trimmed);
            continue;
        }
        if (in_trigger_section && is_list_item(trimmed)) {
            document.triggers.push_back(trim(trimmed.substr(2)));
        }
        if (document.description.empty() && !trimmed.empty()) {
            document.description = trimmed;
        }
    }
    document.body = trim(body.str());

    std::vector<std::string> unique;
    for (const auto& trigger : document.triggers) {
        const std::string lowered = lowercase(trim(trigger));
        if (!lowered.empty() && std::find(unique.begin(), unique.end(), lowered) == unique.end()) {
            unique.push_back(lowered);
        }
    }
    document.triggers = std::move(unique);
    return document;
}

std::vector<std::filesystem::path> skill_roots(const std::vector<std::filesystem::path>& extra,
                                               const std::filesystem::path& workspace_root,
                                               const char* home) {
    std::vector<std::filesystem::path> candidates = extra;
    candidates.push_back(workspace_root / ".helm" / "skills");
    if (home != nullptr && *home != '\0') {
        candidates.push_back(std::filesystem::path(home) / ".agents" / "skills");
    }

    std::vector<std::filesystem::path> roots;
    for (const auto& candidate : candidates) {
        const auto normalized = std::filesystem::absolute(candidate).lexically_normal();
        if (std::find(roots.begin(), roots.end(), normalized) == roots.end()) {
            roots.push_back(normalized);
        }
    }
    return roots;
}

SkillIndex discover_skills(const std::vector<std::filesystem::path>& roots) {
    SkillIndex index;
    for (const auto& root : roots) {
        for (const auto& file : find_skill_files(root)) {
            const std::string name = file.parent_path().filename().string();
            if (name.empty() || index.count(name) > 0) {
                continue;
            }
            const auto content = read_file(file);
            if (!content.has_value()) {
                HELM_LOG_WARN("SkillCatalog: unable to read " + file.string());
                continue;
            }
            SkillDocument document = parse_skill_document(content.value());
            index.emplace(name, protocol::Skill{name, file, std::move(document.description),
                                                std::move(document.body),
                                                std::move(document.triggers)});
        }
    }
    HELM_LOG_DEBUG("SkillCatalog: " + std::to_string(index.size()) + " skills discovered");
    return index;
}

SkillSelection select_skills(const SkillIndex& index, const std::vector<std::string>& names) {
    SkillSelection selection;
    for (const auto& raw : names) {
        const std::string name = trim(raw);
        if (name.empty() || is_active(selection.active, name)) {
            continue;
        }
        const auto it = index.find(name);
        if (it == index.end()) {
            selection.missing.push_back(name);
            continue;
        }
        selection.active.push_back(it->second);
    }
    return selection;
}

std::vector<protocol::Skill> find_mentioned_skills(const std::string& input,
                                                   const SkillIndex& index,
                                                   const std::vector<protocol::Skill>& active) {
    std::vector<protocol::Skill> mentioned;
    for (std::size_t pos = input.find('$'); pos != std::string::npos;
         pos = input.find('$', pos + 1)) {
        std::size_t end = pos + 1;
        while (end < input.size() &&
               (std::isalnum(static_cast<unsigned char>(input[end])) != 0 || input[end] == '.' ||
                input[end] == '_' || input[end] == '-')) {
            ++end;
        }
        const std::string name = input.substr(pos + 1, end - pos - 1);
        const auto it = index.find(name);
        if (it != index.end() && !is_active(active, name) && !is_active(mentioned, name)) {
            mentioned.push_back(it->second);
        }
    }
    return mentioned;
}

std::vector<protocol::Skill> find_triggered_skills(const std::string& input,
                                                   const SkillIndex& index,
                                                   const std::vector<protocol::Skill>& active) {
    const std::string lowered = lowercase(input);
    std::vector<protocol::Skill> triggered;
    for (const auto& [name, skill] : index) {
        if (is_active(active, name)) {
            continue;
        }
        const bool matches = std::any_of(
            skill.triggers.begin(), skill.triggers.end(), [&lowered](const std::string& trigger) {
                if (trigger.find(' ') != std::string::npos) {
                    return lowered.find(trigger) != std::string::npos;
                }
                return contains_word(lowered, trigger);
            });
        if (matches) {
            triggered.push_back(skill);
        }
    }
    return triggered;
}

std::vector<std::string> auto_enable_skills(const std::string& input, const SkillIndex& index,
                                            std::vector<protocol::Skill>& active) {
    std::vector<std::string> enabled;
    for (auto& skill : find_mentioned_skills(input, index, active)) {
        enabled.push_back(skill.name);
        active.push_back(std::move(skill));
    }
    for (auto& skill : find_triggered_skills(input, index, active)) {
        enabled.push_back(skill.name);
        active.push_back(std::move(skill));
    }
    return enabled;
}

}  // namespace helm::skills
