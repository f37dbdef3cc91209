#include "computer/local_channel.hpp"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <string>
#include <sys/socket.h>
#include <sys/wait.h>
#include <system_error>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"

namespace compgym::computer {

using core::errors::ErrorCategory;
using core::errors::GymError;

namespace {

constexpr auto kTerminateGrace = std::chrono::milliseconds(1000);

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

// Reads everything currently available. Returns false once the writer side
// has closed, after closing fd.
bool drain_pipe(const int fd, std::string& out) {
    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            static_cast<void>(close(fd));
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return true;
        }
        static_cast<void>(close(fd));
        return false;
    }
}

void close_quietly(const int fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
    }
}

bool wait_for_exit(const pid_t pid, const std::chrono::milliseconds grace) {
    const auto deadline = std::chrono::steady_clock::now() + grace;
    int status = 0;
    while (std::chrono::steady_clock::now() < deadline) {
        const pid_t waited = waitpid(pid, &status, WNOHANG);
        if (waited == pid || (waited < 0 && errno == ECHILD)) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
}

GymError offline_error(const std::string& operation) {
    return GymError{ErrorCategory::Resource,
                    "Channel is offline, cannot " + operation + ".",
                    "channel_offline",
                    "Bring the channel back online and retry."};
}

}  // namespace

LocalChannel::LocalChannel(std::filesystem::path root, std::filesystem::path cache_dir,
                           policy::ShellPolicy shell_policy)
    : root_(std::move(root)),
      cache_dir_(std::move(cache_dir)),
      guard_(std::move(shell_policy)) {
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec) {
        LOG_ERROR("LocalChannel: unable to create root " + root_.string() + ": " +
                  ec.message());
    }
}

LocalChannel::~LocalChannel() {
    std::vector<int> pids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : sessions_) {
            pids.push_back(entry.first);
        }
    }
    for (const int pid : pids) {
        auto stopped = terminate_process(pid);
        if (core::errors::is_error(stopped)) {
            LOG_WARN("LocalChannel: failed to stop shell " + std::to_string(pid) + ": " +
                     core::errors::get_error(stopped).message);
        }
    }

    if (owns_cache_dir_) {
        std::error_code ec;
        std::filesystem::remove_all(cache_dir_, ec);
    }
}

void LocalChannel::set_online(const bool online) {
    online_.store(online);
    LOG_INFO(std::string("LocalChannel: channel ") + (online ? "online" : "offline"));
}

bool LocalChannel::online() const {
    return online_.load();
}

core::errors::Status LocalChannel::check_online(const std::string& operation) const {
    if (!online_.load()) {
        return offline_error(operation);
    }
    return core::errors::ok();
}

core::errors::Result<std::filesystem::path> LocalChannel::resolve(
    const std::filesystem::path& remote_path) const {
    return guard_.resolve_in_root(root_, remote_path);
}

core::errors::Result<std::filesystem::path> LocalChannel::local_cache_dir() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!cache_dir_.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(cache_dir_, ec);
        if (ec) {
            return GymError{ErrorCategory::Internal,
                            "Unable to create cache directory: " + cache_dir_.string(),
                            "cache_dir_create_failed"};
        }
        return cache_dir_;
    }

    std::error_code ec;
    const auto base = std::filesystem::temp_directory_path(ec);
    if (ec) {
        return GymError{ErrorCategory::Internal, "No temporary directory available.",
                        "cache_dir_create_failed"};
    }
    std::string pattern = (base / "compgym-cache-XXXXXX").string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (mkdtemp(buffer.data()) == nullptr) {
        return GymError{ErrorCategory::Internal,
                        "Unable to create cache directory: " + pattern,
                        "cache_dir_create_failed"};
    }
    cache_dir_ = std::filesystem::path(buffer.data());
    owns_cache_dir_ = true;
    return cache_dir_;
}

core::errors::Result<bool> LocalChannel::remote_exists(
    const std::filesystem::path& remote_path) {
    auto online = check_online("stat " + remote_path.string());
    if (core::errors::is_error(online)) {
        return core::errors::get_error(online);
    }
    auto resolved = resolve(remote_path);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    std::error_code ec;
    const bool exists = std::filesystem::exists(core::errors::get_value(resolved), ec);
    return exists && !ec;
}

core::errors::Status LocalChannel::copy_from_remote(
    const std::filesystem::path& remote_path, const std::filesystem::path& local_path) {
    auto online = check_online("copy " + remote_path.string() + " from remote");
    if (core::errors::is_error(online)) {
        return online;
    }
    auto resolved = resolve(remote_path);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const auto& source = core::errors::get_value(resolved);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(source, ec) || ec) {
        return GymError{ErrorCategory::Resource,
                        "Remote path is not a regular file: " + remote_path.string(),
                        "copy_failed"};
    }
    if (local_path.has_parent_path()) {
        std::filesystem::create_directories(local_path.parent_path(), ec);
    }
    std::filesystem::copy_file(source, local_path,
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        return GymError{ErrorCategory::Resource,
                        "Unable to copy " + remote_path.string() + " from remote: " +
                            ec.message(),
                        "copy_failed"};
    }
    return core::errors::ok();
}

core::errors::Status LocalChannel::copy_to_remote(
    const std::filesystem::path& local_path, const std::filesystem::path& remote_path) {
    auto online = check_online("copy " + remote_path.string() + " to remote");
    if (core::errors::is_error(online)) {
        return online;
    }
    auto resolved = resolve(remote_path);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }

    std::error_code ec;
    std::filesystem::copy_file(local_path, core::errors::get_value(resolved),
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        return GymError{ErrorCategory::Resource,
                        "Unable to copy " + remote_path.string() + " to remote: " +
                            ec.message(),
                        "copy_failed"};
    }
    return core::errors::ok();
}

core::errors::Status LocalChannel::make_remote_dirs(const std::filesystem::path& remote_dir) {
    auto online = check_online("create " + remote_dir.string());
    if (core::errors::is_error(online)) {
        return online;
    }
    auto resolved = resolve(remote_dir);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }

    std::error_code ec;
    std::filesystem::create_directories(core::errors::get_value(resolved), ec);
    if (ec) {
        return GymError{ErrorCategory::Resource,
                        "Unable to create remote directory " + remote_dir.string() +
                            ": " + ec.message(),
                        "mkdir_failed"};
    }
    return core::errors::ok();
}

core::errors::Result<int> LocalChannel::launch_process(const std::string& executable) {
    auto online = check_online("launch " + executable);
    if (core::errors::is_error(online)) {
        return core::errors::get_error(online);
    }
    auto screened = guard_.screen_executable(executable);
    if (core::errors::is_error(screened)) {
        return core::errors::get_error(screened);
    }

    int input_pair[2] = {-1, -1};
    int output_pipe[2] = {-1, -1};
    if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, input_pair) != 0) {
        return GymError{ErrorCategory::Internal, "Failed to create shell input socket.",
                        "pipe_creation_failed"};
    }
    if (pipe2(output_pipe, O_CLOEXEC) != 0) {
        close_quietly(input_pair[0]);
        close_quietly(input_pair[1]);
        return GymError{ErrorCategory::Internal, "Failed to create shell output pipe.",
                        "pipe_creation_failed"};
    }

    // Built before fork; the child must not allocate.
    const std::string command = "exec " + executable;
    const std::string cwd = root_.string();

    const pid_t pid = fork();
    if (pid < 0) {
        close_quietly(input_pair[0]);
        close_quietly(input_pair[1]);
        close_quietly(output_pipe[0]);
        close_quietly(output_pipe[1]);
        return GymError{ErrorCategory::Internal, "Failed to fork shell process.",
                        "fork_failed"};
    }

    if (pid == 0) {
        if (chdir(cwd.c_str()) != 0) {
            _exit(126);
        }
        static_cast<void>(dup2(input_pair[1], STDIN_FILENO));
        static_cast<void>(dup2(output_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(output_pipe[1], STDERR_FILENO));
        execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    close_quietly(input_pair[1]);
    close_quietly(output_pipe[1]);
    set_nonblocking(output_pipe[0]);

    ShellSession session;
    session.pid = pid;
    session.input_fd = input_pair[0];
    session.output_fd = output_pipe[0];
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_[pid] = session;
    }
    LOG_INFO("LocalChannel: launched '" + executable + "' as pid " + std::to_string(pid));
    return static_cast<int>(pid);
}

core::errors::Result<LocalChannel::ShellSession> LocalChannel::find_session(
    const int pid) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(pid);
    if (it == sessions_.end()) {
        return GymError{ErrorCategory::Lookup,
                        "No shell session with pid " + std::to_string(pid),
                        "not_found"};
    }
    return it->second;
}

core::errors::Status LocalChannel::terminate_process(const int pid) {
    ShellSession session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(pid);
        if (it == sessions_.end()) {
            return GymError{ErrorCategory::Lookup,
                            "No shell session with pid " + std::to_string(pid),
                            "not_found"};
        }
        session = it->second;
        sessions_.erase(it);
    }

    close_quietly(session.input_fd);
    static_cast<void>(kill(session.pid, SIGTERM));
    if (!wait_for_exit(session.pid, kTerminateGrace)) {
        static_cast<void>(kill(session.pid, SIGKILL));
        int status = 0;
        static_cast<void>(waitpid(session.pid, &status, 0));
    }
    if (session.output_open) {
        close_quietly(session.output_fd);
    }
    LOG_INFO("LocalChannel: stopped pid " + std::to_string(pid));
    return core::errors::ok();
}

core::errors::Result<std::string> LocalChannel::read_process_output(
    const int pid, const std::optional<std::chrono::milliseconds> timeout) {
    auto online = check_online("read shell output");
    if (core::errors::is_error(online)) {
        return core::errors::get_error(online);
    }
    auto found = find_session(pid);
    if (core::errors::is_error(found)) {
        return core::errors::get_error(found);
    }
    const auto session = core::errors::get_value(found);
    if (!session.output_open) {
        return std::string();
    }

    pollfd fds[1];
    fds[0].fd = session.output_fd;
    fds[0].events = POLLIN;
    const int wait_ms = timeout.has_value() ? static_cast<int>(timeout->count()) : -1;
    int ready = 0;
    do {
        ready = poll(fds, 1, wait_ms);
    } while (ready < 0 && errno == EINTR);

    if (ready == 0) {
        return std::string();
    }
    if (ready < 0) {
        return GymError{ErrorCategory::Resource,
                        "Failed to wait for shell output: " +
                            std::string(std::strerror(errno)),
                        "process_output_failed"};
    }

    std::string output;
    if (!drain_pipe(session.output_fd, output)) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(pid);
        if (it != sessions_.end()) {
            it->second.output_open = false;
        }
    }
    return output;
}

core::errors::Status LocalChannel::write_process_input(const int pid,
                                                       const std::string& text) {
    auto online = check_online("write shell input");
    if (core::errors::is_error(online)) {
        return online;
    }
    auto found = find_session(pid);
    if (core::errors::is_error(found)) {
        return core::errors::get_error(found);
    }
    auto screened = guard_.screen_shell_input(text);
    if (core::errors::is_error(screened)) {
        LOG_WARN("LocalChannel: refused input for pid " + std::to_string(pid) + ": " +
                 core::errors::get_error(screened).message);
        return screened;
    }
    const int fd = core::errors::get_value(found).input_fd;

    std::size_t written = 0;
    while (written < text.size()) {
        const ssize_t n =
            send(fd, text.data() + written, text.size() - written, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return GymError{ErrorCategory::Resource,
                            "Failed to write shell input: " +
                                std::string(std::strerror(errno)),
                            "process_input_failed"};
        }
        written += static_cast<std::size_t>(n);
    }
    return core::errors::ok();
}

core::errors::Result<ProcessInfo> LocalChannel::query_process_info(const int pid) {
    auto online = check_online("query shell state");
    if (core::errors::is_error(online)) {
        return core::errors::get_error(online);
    }
    auto found = find_session(pid);
    if (core::errors::is_error(found)) {
        return core::errors::get_error(found);
    }

    const std::filesystem::path proc_dir =
        std::filesystem::path("/proc") / std::to_string(pid);
    ProcessInfo info;

    std::error_code ec;
    info.cwd = std::filesystem::read_symlink(proc_dir / "cwd", ec);
    if (ec) {
        return GymError{ErrorCategory::Resource,
                        "Unable to read cwd of pid " + std::to_string(pid) + ": " +
                            ec.message(),
                        "process_info_failed"};
    }

    return info;
}

}  // namespace compgym::computer
