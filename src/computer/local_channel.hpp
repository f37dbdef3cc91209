#pragma once

#include <atomic>
#include <filesystem>
#include <mutex>
#include <unordered_map>
#include "computer/remote_channel.hpp"
#include "policy/policy_guard.hpp"

namespace compgym::computer {

// RemoteChannel backed by the local machine. "Remote" paths live under
// `root`; shells are /bin/sh sessions driven over a socket (stdin) and a
// pipe (stdout and stderr merged).
class LocalChannel : public RemoteChannel {
public:
    // An empty cache_dir means a private temporary directory is created on
    // first use and removed when the channel is destroyed.
    explicit LocalChannel(std::filesystem::path root,
                          std::filesystem::path cache_dir = {},
                          policy::ShellPolicy shell_policy = {});
    ~LocalChannel() override;

    LocalChannel(const LocalChannel&) = delete;
    LocalChannel& operator=(const LocalChannel&) = delete;

    // Offline channels fail every operation, like a dropped daemon link.
    void set_online(bool online);
    bool online() const;

    const std::filesystem::path& root() const { return root_; }

    core::errors::Result<std::filesystem::path> local_cache_dir() override;

    core::errors::Result<bool> remote_exists(
        const std::filesystem::path& remote_path) override;
    core::errors::Status copy_from_remote(
        const std::filesystem::path& remote_path,
        const std::filesystem::path& local_path) override;
    core::errors::Status copy_to_remote(
        const std::filesystem::path& local_path,
        const std::filesystem::path& remote_path) override;
    core::errors::Status make_remote_dirs(
        const std::filesystem::path& remote_dir) override;

    core::errors::Result<int> launch_process(const std::string& executable) override;
    core::errors::Status terminate_process(int pid) override;
    core::errors::Result<std::string> read_process_output(
        int pid, std::optional<std::chrono::milliseconds> timeout) override;
    core::errors::Status write_process_input(int pid, const std::string& text) override;
    core::errors::Result<ProcessInfo> query_process_info(int pid) override;

private:
    struct ShellSession {
        int pid = -1;
        int input_fd = -1;
        int output_fd = -1;
        bool output_open = true;
    };

    core::errors::Status check_online(const std::string& operation) const;
    core::errors::Result<std::filesystem::path> resolve(
        const std::filesystem::path& remote_path) const;
    core::errors::Result<ShellSession> find_session(int pid) const;

    std::filesystem::path root_;
    std::filesystem::path cache_dir_;
    bool owns_cache_dir_ = false;
    std::atomic_bool online_{true};
    policy::PolicyGuard guard_;

    mutable std::mutex mutex_;
    std::unordered_map<int, ShellSession> sessions_;
};

}  // namespace compgym::computer
