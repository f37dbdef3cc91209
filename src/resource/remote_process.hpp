#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include "computer/remote_channel.hpp"
#include "core/errors/gym_errors.hpp"

namespace compgym::resource {

struct ProcessHandle {
    int pid = -1;
    std::string executable;
    std::filesystem::path last_known_cwd;
    std::map<std::string, std::string> last_known_env;
};

struct CommandResult {
    // stdout and stderr as the shell interleaved them.
    std::string output;
    int exit_code = 0;
};

// A shell session on the far side of a RemoteChannel. Launch and terminate
// failures are reported as false and logged; the session is stopped on
// destruction.
//
// execute() and the helpers built on it run their command inside the
// session and wait for an end marker, so they see the shell's live state.
// Output the session produced before such a call is kept for read_output().
class RemoteProcess {
public:
    explicit RemoteProcess(computer::RemoteChannel& channel,
                           std::string executable = "/bin/sh");
    ~RemoteProcess();

    RemoteProcess(const RemoteProcess&) = delete;
    RemoteProcess& operator=(const RemoteProcess&) = delete;

    bool start();
    bool stop();
    bool running() const { return handle_.pid >= 0; }

    // Empty when nothing arrived within `timeout`.
    core::errors::Result<std::string> read_output(
        std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    bool send_input(const std::string& text);

    // Runs one command in the session. An unset timeout waits until the
    // command finishes; an expired one is command_timeout.
    core::errors::Result<CommandResult> execute(
        const std::string& command,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    core::errors::Status change_directory(const std::filesystem::path& path);
    // Exports `name` in the session.
    core::errors::Status set_envvar(const std::string& name, const std::string& value);
    // nullopt when the variable is not exported.
    core::errors::Result<std::optional<std::string>> get_envvar(const std::string& name);

    // Fetched from the remote shell on every call.
    core::errors::Result<std::filesystem::path> cwd();
    core::errors::Result<std::map<std::string, std::string>> env();

    const ProcessHandle& handle() const { return handle_; }

private:
    core::errors::Status require_running(const std::string& operation) const;
    core::errors::Status stash_pending_output();

    computer::RemoteChannel& channel_;
    ProcessHandle handle_;
    std::string pending_output_;
};

}  // namespace compgym::resource
