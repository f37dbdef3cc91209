#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/gym_errors.hpp"

namespace compgym::computer {

// Kernel-side view of a shell session. Shell variables are not part of it;
// they are only visible to commands run inside the session.
struct ProcessInfo {
    std::filesystem::path cwd;
};

// Control channel to the machine that owns remote files and shells, e.g. a
// daemon client or a container exec channel. The resource bridge only ever
// talks to a machine through these primitives.
class RemoteChannel {
public:
    virtual ~RemoteChannel() = default;

    // Local directory that holds cache copies of remote files.
    virtual core::errors::Result<std::filesystem::path> local_cache_dir() = 0;

    virtual core::errors::Result<bool> remote_exists(
        const std::filesystem::path& remote_path) = 0;
    virtual core::errors::Status copy_from_remote(
        const std::filesystem::path& remote_path,
        const std::filesystem::path& local_path) = 0;
    virtual core::errors::Status copy_to_remote(
        const std::filesystem::path& local_path,
        const std::filesystem::path& remote_path) = 0;
    virtual core::errors::Status make_remote_dirs(
        const std::filesystem::path& remote_dir) = 0;

    // Starts a long-lived shell session and returns its pid.
    virtual core::errors::Result<int> launch_process(const std::string& executable) = 0;
    virtual core::errors::Status terminate_process(int pid) = 0;

    // Returns what is buffered, waiting up to `timeout` (forever if unset) for
    // at least one byte. An expired wait yields an empty string.
    virtual core::errors::Result<std::string> read_process_output(
        int pid, std::optional<std::chrono::milliseconds> timeout) = 0;
    virtual core::errors::Status write_process_input(int pid, const std::string& text) = 0;
    virtual core::errors::Result<ProcessInfo> query_process_info(int pid) = 0;
};

}  // namespace compgym::computer
