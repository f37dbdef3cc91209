#include "policy/policy_guard.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>
#include <utility>

namespace compgym::policy {

using core::errors::ErrorCategory;
using core::errors::GymError;

PolicyGuard::PolicyGuard(ShellPolicy shell_policy)
    : shell_policy_(std::move(shell_policy)) {}

bool PolicyGuard::is_within_root(const std::filesystem::path& root,
                                 const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        if (*root_it != *child_it) {
            return false;
        }
    }
    return root_it == root.end();
}

std::string PolicyGuard::lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

core::errors::Result<std::filesystem::path> PolicyGuard::resolve_in_root(
    const std::filesystem::path& root,
    const std::filesystem::path& target_path) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec) || ec) {
        return GymError{ErrorCategory::Input,
                        "Channel root is not a directory: " + root.string(),
                        "invalid_channel_root"};
    }

    const std::filesystem::path canonical_root = std::filesystem::weakly_canonical(root, ec);
    if (ec) {
        return GymError{ErrorCategory::Input,
                        "Unable to resolve channel root: " + root.string(),
                        "invalid_channel_root"};
    }

    if (target_path.empty()) {
        return GymError{ErrorCategory::Input, "Path cannot be empty.", "invalid_path"};
    }

    const std::filesystem::path candidate =
        canonical_root / (target_path.is_absolute() ? target_path.relative_path()
                                                    : target_path);

    const std::filesystem::path canonical_candidate =
        std::filesystem::weakly_canonical(candidate, ec);
    if (ec) {
        return GymError{ErrorCategory::Input,
                        "Unable to resolve path: " + target_path.string(),
                        "invalid_path"};
    }

    if (!is_within_root(canonical_root, canonical_candidate)) {
        return GymError{ErrorCategory::Input,
                        "Path escapes channel root: " + canonical_candidate.string(),
                        "path_outside_root"};
    }

    return canonical_candidate;
}

core::errors::Status PolicyGuard::screen_line(const std::string& line) const {
    const std::string lowered = lowercase(line);
    for (const auto& blocked : shell_policy_.blocked_substrings) {
        if (!blocked.empty() && lowered.find(lowercase(blocked)) != std::string::npos) {
            return GymError{ErrorCategory::Input,
                            "Shell text contains blocked operation '" + blocked + "': " + line,
                            "blocked_command"};
        }
    }
    return core::errors::ok();
}

core::errors::Status PolicyGuard::screen_executable(const std::string& executable) const {
    if (executable.empty()) {
        return GymError{ErrorCategory::Input, "Shell executable cannot be empty.",
                        "empty_command"};
    }
    return screen_line(executable);
}

core::errors::Status PolicyGuard::screen_shell_input(const std::string& text) const {
    std::size_t start = 0;
    while (start <= text.size()) {
        const auto end = text.find('\n', start);
        const std::string line =
            text.substr(start, end == std::string::npos ? std::string::npos : end - start);
        auto screened = screen_line(line);
        if (core::errors::is_error(screened)) {
            return screened;
        }
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
    return core::errors::ok();
}

}  // namespace compgym::policy
