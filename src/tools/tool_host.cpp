#include "tools/tool_host.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cerrno>
#include <fcntl.h>
#include <fnmatch.h>
#include <fstream>
#include <poll.h>
#include <regex>
#include <signal.h>
#include <sstream>
#include <string>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>
#include <vector>
#include "core/logging/logger.hpp"
#include "policy/policy_guard.hpp"

namespace helm::tools {

using core::errors::AgentError;
using core::errors::ErrorCategory;

namespace {

constexpr std::size_t kMaxStreamChars = 100000;
constexpr std::size_t kMaxListEntries = 2000;
constexpr std::size_t kMaxSearchMatches = 200;

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

bool is_probably_binary(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }

    constexpr std::size_t kProbeSize = 1024;
    char buffer[kProbeSize];
    in.read(buffer, static_cast<std::streamsize>(kProbeSize));
    const std::streamsize read_bytes = in.gcount();
    for (std::streamsize i = 0; i < read_bytes; ++i) {
        if (buffer[i] == '\0') {
            return true;
        }
    }
    return false;
}

bool is_skipped_directory(const std::filesystem::path& path) {
    const std::string name = path.filename().string();
    return name == ".git" || name == "node_modules" || name == "dist" || name == "build" ||
           name == ".helm_runs";
}

std::string trim_line(const std::string& line) {
    constexpr std::size_t kMaxLineLength = 240;
    if (line.size() <= kMaxLineLength) {
        return line;
    }
    return line.substr(0, kMaxLineLength) + "...";
}

std::string cap_stream(const std::string& text) {
    if (text.size() <= kMaxStreamChars) {
        return text;
    }
    return text.substr(0, kMaxStreamChars) + "\n[output truncated]";
}

std::string relative_to(const std::filesystem::path& root, const std::filesystem::path& path) {
    std::error_code ec;
    const auto relative = std::filesystem::relative(path, root, ec);
    if (ec || relative.empty()) {
        return path.string();
    }
    return relative.generic_string();
}

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void drain_pipe(const int fd, bool& is_open, std::string& out) {
    if (!is_open) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            is_open = false;
            static_cast<void>(close(fd));
            return;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        is_open = false;
        static_cast<void>(close(fd));
        return;
    }
}

core::errors::Result<ProcessCapture> run_shell_command(
    const std::string& command, const std::filesystem::path& cwd,
    const std::uint32_t timeout_ms,
    const std::shared_ptr<std::atomic_bool>& cancel_token) {
    if (cancel_token && cancel_token->load()) {
        ProcessCapture capture;
        capture.cancelled = true;
        return capture;
    }

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe(stdout_pipe) != 0) {
        return AgentError{ErrorCategory::Internal, "Failed to create process pipes.",
                          "pipe_creation_failed"};
    }
    if (pipe(stderr_pipe) != 0) {
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stdout_pipe[1]));
        return AgentError{ErrorCategory::Internal, "Failed to create process pipes.",
                          "pipe_creation_failed"};
    }

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stdout_pipe[1]));
        static_cast<void>(close(stderr_pipe[0]));
        static_cast<void>(close(stderr_pipe[1]));
        return AgentError{ErrorCategory::Internal, "Failed to fork process.", "fork_failed"};
    }

    if (pid == 0) {
        // Own process group, so a kill reaches every descendant.
        static_cast<void>(setpgid(0, 0));
        sigset_t unblock;
        sigemptyset(&unblock);
        static_cast<void>(sigprocmask(SIG_SETMASK, &unblock, nullptr));
        if (chdir(cwd.c_str()) != 0) {
            _exit(126);
        }
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stdout_pipe[1]));
        static_cast<void>(close(stderr_pipe[0]));
        static_cast<void>(close(stderr_pipe[1]));
        execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    static_cast<void>(setpgid(pid, pid));
    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    ProcessCapture capture;
    bool stdout_open = true;
    bool stderr_open = true;
    bool child_exited = false;
    bool killed = false;
    int status = 0;

    while (stdout_open || stderr_open || !child_exited) {
        if (cancel_token && cancel_token->load() && !killed) {
            capture.cancelled = true;
            killed = true;
            static_cast<void>(kill(-pid, SIGKILL));
        }

        const auto now = std::chrono::steady_clock::now();
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 now - started)
                                 .count();
        if (!killed && timeout_ms > 0 && elapsed > static_cast<std::int64_t>(timeout_ms)) {
            capture.timed_out = true;
            killed = true;
            static_cast<void>(kill(-pid, SIGKILL));
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_open) {
            fds[nfds].fd = stdout_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_open) {
            fds[nfds].fd = stderr_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }

        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        } else {
            static_cast<void>(usleep(20000));
        }

        drain_pipe(stdout_pipe[0], stdout_open, capture.stdout_text);
        drain_pipe(stderr_pipe[0], stderr_open, capture.stderr_text);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
            }
        }

        // A background grandchild may hold the pipes open after the shell exits.
        if (child_exited && killed) {
            break;
        }
        if (child_exited && !stdout_open && !stderr_open) {
            break;
        }
    }

    if (stdout_open) {
        static_cast<void>(close(stdout_pipe[0]));
    }
    if (stderr_open) {
        static_cast<void>(close(stderr_pipe[0]));
    }
    if (!child_exited) {
        static_cast<void>(waitpid(pid, &status, 0));
    }

    if (WIFEXITED(status)) {
        capture.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        capture.exit_code = 128 + WTERMSIG(status);
    } else {
        capture.exit_code = -1;
    }

    const auto ended = std::chrono::steady_clock::now();
    capture.duration_ms =
        std::chrono::duration<double, std::milli>(ended - started).count();
    return capture;
}

std::string format_capture(const ProcessCapture& capture, const std::uint32_t timeout_ms) {
    std::ostringstream out;
    if (capture.timed_out) {
        out << "Command timed out after " << timeout_ms << " ms.\n\n";
    }
    out << "exit_code: " << capture.exit_code << "\n\n"
        << "stdout:\n"
        << (capture.stdout_text.empty() ? "<empty>" : cap_stream(capture.stdout_text))
        << "\n\nstderr:\n"
        << (capture.stderr_text.empty() ? "<empty>" : cap_stream(capture.stderr_text));
    return out.str();
}

}  // namespace

core::errors::Result<ToolOutput> ToolHost::read_file(
    const std::filesystem::path& workspace_root,
    const std::filesystem::path& path) const {
    const policy::PolicyGuard policy_guard;
    auto resolved = policy_guard.validate_path_in_workspace(workspace_root, path);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path file_path = core::errors::get_value(resolved);

    std::error_code ec;
    if (!std::filesystem::exists(file_path, ec) || ec) {
        return AgentError{ErrorCategory::Execution,
                          "File does not exist: " + path.string(), "file_not_found"};
    }
    if (!std::filesystem::is_regular_file(file_path, ec) || ec) {
        return AgentError{ErrorCategory::Execution,
                          "Path is not a regular file: " + path.string(), "not_a_file"};
    }
    if (is_probably_binary(file_path)) {
        return AgentError{ErrorCategory::Execution,
                          "Refusing to read binary file: " + path.string(), "binary_file"};
    }

    std::ifstream in(file_path);
    if (!in.is_open()) {
        return AgentError{ErrorCategory::Execution,
                          "Failed to open file: " + path.string(), "file_open_failed"};
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (!in.good() && !in.eof()) {
        return AgentError{ErrorCategory::Execution,
                          "I/O error while reading file: " + path.string(), "file_read_failed"};
    }
    return ToolOutput{buffer.str(), false};
}

core::errors::Result<ToolOutput> ToolHost::write_file(
    const std::filesystem::path& workspace_root,
    const std::filesystem::path& path, const std::string& content) const {
    const policy::PolicyGuard policy_guard;
    auto resolved = policy_guard.validate_path_in_workspace(workspace_root, path);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path file_path = core::errors::get_value(resolved);

    std::error_code ec;
    if (std::filesystem::is_directory(file_path, ec)) {
        return AgentError{ErrorCategory::Execution,
                          "Path is a directory: " + path.string(), "not_a_file"};
    }
    std::filesystem::create_directories(file_path.parent_path(), ec);
    if (ec) {
        return AgentError{ErrorCategory::Execution,
                          "Unable to create parent directories for: " + path.string(),
                          "mkdir_failed"};
    }

    std::ofstream out(file_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return AgentError{ErrorCategory::Execution,
                          "Failed to open file for writing: " + path.string(),
                          "file_open_failed"};
    }
    out << content;
    if (!out.good()) {
        return AgentError{ErrorCategory::Execution,
                          "I/O error while writing file: " + path.string(), "file_write_failed"};
    }
    return ToolOutput{"Wrote " + std::to_string(content.size()) + " bytes to " + path.string(),
                      false};
}

core::errors::Result<ToolOutput> ToolHost::list_files(
    const std::filesystem::path& workspace_root,
    const ListRequest& request) const {
    const policy::PolicyGuard policy_guard;
    auto resolved = policy_guard.validate_path_in_workspace(workspace_root, request.path);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path dir = core::errors::get_value(resolved);

    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec) || ec) {
        return AgentError{ErrorCategory::Execution,
                          "Not a directory: " + request.path.string(), "not_a_directory"};
    }

    const auto canonical_root = std::filesystem::weakly_canonical(workspace_root, ec);
    const std::size_t cap =
        std::min(std::max<std::size_t>(request.max_entries, 1), kMaxListEntries);

    std::vector<std::string> out;
    std::vector<std::filesystem::path> pending = {dir};
    while (!pending.empty() && out.size() < cap) {
        const auto current = pending.back();
        pending.pop_back();

        std::vector<std::filesystem::directory_entry> entries;
        for (const auto& entry : std::filesystem::directory_iterator(
                 current, std::filesystem::directory_options::skip_permission_denied, ec)) {
            entries.push_back(entry);
        }
        std::sort(entries.begin(), entries.end(),
                  [](const auto& lhs, const auto& rhs) { return lhs.path() < rhs.path(); });

        std::vector<std::filesystem::path> subdirs;
        for (const auto& entry : entries) {
            if (out.size() >= cap) {
                break;
            }
            std::error_code entry_ec;
            const bool is_dir = entry.is_directory(entry_ec) && !entry_ec;
            if (is_dir && entry.path().filename() == ".git") {
                continue;
            }
            const std::string rel = relative_to(canonical_root, entry.path());
            out.push_back(is_dir ? rel + "/" : rel);
            if (is_dir) {
                subdirs.push_back(entry.path());
            }
        }
        // Depth-first in name order.
        for (auto it = subdirs.rbegin(); it != subdirs.rend(); ++it) {
            pending.push_back(*it);
        }
    }

    std::string text;
    for (const auto& line : out) {
        if (!text.empty()) {
            text += "\n";
        }
        text += line;
    }
    if (text.empty()) {
        text = "<empty directory>";
    }
    return ToolOutput{text, false};
}

core::errors::Result<ToolOutput> ToolHost::search(
    const std::filesystem::path& workspace_root,
    const SearchRequest& request) const {
    if (request.regex.empty()) {
        return AgentError{ErrorCategory::Input, "Search pattern cannot be empty.",
                          "empty_search_pattern"};
    }
    if (request.max_matches == 0) {
        return AgentError{ErrorCategory::Input, "max_results must be greater than zero.",
                          "invalid_search_limit"};
    }

    std::regex pattern;
    try {
        auto flags = std::regex::ECMAScript;
        if (!request.case_sensitive) {
            flags |= std::regex::icase;
        }
        pattern = std::regex(request.regex, flags);
    } catch (const std::regex_error& e) {
        return AgentError{ErrorCategory::Input,
                          "Invalid search pattern: " + std::string(e.what()),
                          "invalid_search_pattern"};
    }

    const policy::PolicyGuard policy_guard;
    auto resolved = policy_guard.validate_path_in_workspace(workspace_root, request.scope);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path scope_path = core::errors::get_value(resolved);

    std::error_code ec;
    if (!std::filesystem::exists(scope_path, ec) || ec) {
        return AgentError{ErrorCategory::Execution,
                          "Scope does not exist: " + request.scope.string(), "scope_not_found"};
    }

    std::vector<std::filesystem::path> files;
    if (std::filesystem::is_regular_file(scope_path, ec) && !ec) {
        files.push_back(scope_path);
    } else if (std::filesystem::is_directory(scope_path, ec) && !ec) {
        const auto options = std::filesystem::directory_options::skip_permission_denied;
        auto it = std::filesystem::recursive_directory_iterator(scope_path, options, ec);
        for (; !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
            std::error_code entry_ec;
            if (it->is_directory(entry_ec) && is_skipped_directory(it->path())) {
                it.disable_recursion_pending();
                continue;
            }
            if (!it->is_regular_file(entry_ec) || entry_ec) {
                continue;
            }
            if (!request.file_pattern.empty() &&
                fnmatch(request.file_pattern.c_str(), it->path().filename().c_str(), 0) != 0) {
                continue;
            }
            files.push_back(it->path());
        }
        std::sort(files.begin(), files.end());
    } else {
        return AgentError{ErrorCategory::Execution,
                          "Scope is neither a file nor directory: " + request.scope.string(),
                          "invalid_scope"};
    }

    const auto canonical_root = std::filesystem::weakly_canonical(workspace_root, ec);
    const std::size_t limit = std::min(request.max_matches, kMaxSearchMatches);
    constexpr std::uintmax_t kMaxFileBytes = 1024 * 1024;
    std::ostringstream out;
    std::size_t matches = 0;
    for (const auto& file : files) {
        if (matches >= limit) {
            break;
        }

        std::error_code size_ec;
        const auto size = std::filesystem::file_size(file, size_ec);
        if (size_ec || size > kMaxFileBytes) {
            continue;
        }
        if (is_probably_binary(file)) {
            continue;
        }

        std::ifstream in(file);
        if (!in.is_open()) {
            continue;
        }

        std::string line;
        std::size_t line_no = 0;
        while (std::getline(in, line)) {
            ++line_no;
            if (!std::regex_search(line, pattern)) {
                continue;
            }
            out << relative_to(canonical_root, file) << ":" << line_no << ":"
                << trim_line(line) << "\n";
            ++matches;
            if (matches >= limit) {
                break;
            }
        }
    }

    std::ostringstream header;
    header << "pattern=\"" << request.regex << "\" scope=\"" << request.scope.string()
           << "\" matches=" << matches << "\n";
    if (matches == 0) {
        header << "No matches found.";
    } else {
        header << out.str();
    }
    return ToolOutput{header.str(), false};
}

core::errors::Result<ToolOutput> ToolHost::run_command(
    const std::filesystem::path& workspace_root,
    const CommandRequest& request) const {
    const policy::PolicyGuard policy_guard;
    auto validated_command = policy_guard.validate_command(request.command);
    if (core::errors::is_error(validated_command)) {
        return core::errors::get_error(validated_command);
    }

    auto validated_cwd = policy_guard.validate_path_in_workspace(
        workspace_root, request.working_directory);
    if (core::errors::is_error(validated_cwd)) {
        return core::errors::get_error(validated_cwd);
    }

    HELM_LOG_DEBUG("ToolHost: running `" + request.command + "`");
    auto capture_result = run_shell_command(
        core::errors::get_value(validated_command),
        core::errors::get_value(validated_cwd), request.timeout_ms,
        request.cancel_token);
    if (core::errors::is_error(capture_result)) {
        return core::errors::get_error(capture_result);
    }
    const auto& capture = core::errors::get_value(capture_result);

    if (capture.cancelled) {
        return core::errors::task_aborted("shell command");
    }
    return ToolOutput{format_capture(capture, request.timeout_ms), false};
}

}  // namespace helm::tools
