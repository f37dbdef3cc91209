#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/gym_errors.hpp"

namespace compgym::policy {

// Substrings a shell session may never launch or receive, matched
// case-insensitively.
struct ShellPolicy {
    std::vector<std::string> blocked_substrings = {
        "sudo",
        "rm -rf /",
        "shutdown",
        "reboot",
        "mkfs",
        "dd if=",
        ":(){ :|:& };:"};
};

// Confines channel paths to a root directory and screens shell traffic.
class PolicyGuard {
public:
    explicit PolicyGuard(ShellPolicy shell_policy = {});

    // Absolute targets are interpreted relative to the root, so "/a/b.txt"
    // and "a/b.txt" resolve to the same file.
    core::errors::Result<std::filesystem::path> resolve_in_root(
        const std::filesystem::path& root,
        const std::filesystem::path& target_path) const;

    // The executable a shell session is launched with.
    core::errors::Status screen_executable(const std::string& executable) const;
    // Text written to a running session; every line is checked.
    core::errors::Status screen_shell_input(const std::string& text) const;

private:
    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);
    static std::string lowercase(std::string value);
    core::errors::Status screen_line(const std::string& line) const;

    ShellPolicy shell_policy_;
};

}  // namespace compgym::policy
