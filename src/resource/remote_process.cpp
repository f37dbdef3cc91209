#include "resource/remote_process.hpp"

#include <cctype>
#include <charconv>
#include <system_error>
#include <utility>
#include "core/config/episode_id.hpp"
#include "core/logging/logger.hpp"

namespace compgym::resource {

using core::errors::ErrorCategory;
using core::errors::GymError;

namespace {

std::string shell_quote(const std::string& value) {
    std::string quoted = "'";
    for (const char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(c);
        }
    }
    quoted += "'";
    return quoted;
}

bool is_envvar_name(const std::string& name) {
    if (name.empty() || std::isdigit(static_cast<unsigned char>(name[0])) != 0) {
        return false;
    }
    for (const unsigned char c : name) {
        if (std::isalnum(c) == 0 && c != '_') {
            return false;
        }
    }
    return true;
}

GymError invalid_envvar_name(const std::string& name) {
    return GymError{ErrorCategory::Input, "Invalid environment variable name: '" + name + "'",
                    "invalid_envvar_name"};
}

}  // namespace

RemoteProcess::RemoteProcess(computer::RemoteChannel& channel, std::string executable)
    : channel_(channel) {
    handle_.executable = std::move(executable);
}

RemoteProcess::~RemoteProcess() {
    if (running()) {
        static_cast<void>(stop());
    }
}

bool RemoteProcess::start() {
    if (running()) {
        LOG_WARN("RemoteProcess: " + handle_.executable + " already running as pid " +
                 std::to_string(handle_.pid));
        return true;
    }

    auto launched = channel_.launch_process(handle_.executable);
    if (core::errors::is_error(launched)) {
        LOG_ERROR("RemoteProcess: failed to start " + handle_.executable + ": " +
                  core::errors::get_error(launched).message);
        return false;
    }
    handle_.pid = core::errors::get_value(launched);
    LOG_INFO("RemoteProcess: started " + handle_.executable + " as pid " +
             std::to_string(handle_.pid));
    return true;
}

bool RemoteProcess::stop() {
    if (!running()) {
        return true;
    }

    auto stopped = channel_.terminate_process(handle_.pid);
    if (core::errors::is_error(stopped)) {
        LOG_ERROR("RemoteProcess: failed to stop pid " + std::to_string(handle_.pid) +
                  ": " + core::errors::get_error(stopped).message);
        return false;
    }
    LOG_INFO("RemoteProcess: stopped pid " + std::to_string(handle_.pid));
    handle_.pid = -1;
    return true;
}

core::errors::Status RemoteProcess::require_running(const std::string& operation) const {
    if (!running()) {
        return GymError{ErrorCategory::Input,
                        "Cannot " + operation + ": " + handle_.executable +
                            " is not running.",
                        "handle_closed"};
    }
    return core::errors::ok();
}

core::errors::Result<std::string> RemoteProcess::read_output(
    const std::optional<std::chrono::milliseconds> timeout) {
    auto ready = require_running("read output");
    if (core::errors::is_error(ready)) {
        return core::errors::get_error(ready);
    }
    if (!pending_output_.empty()) {
        std::string output;
        output.swap(pending_output_);
        return output;
    }
    return channel_.read_process_output(handle_.pid, timeout);
}

core::errors::Status RemoteProcess::stash_pending_output() {
    while (true) {
        auto chunk = channel_.read_process_output(handle_.pid, std::chrono::milliseconds(0));
        if (core::errors::is_error(chunk)) {
            return core::errors::get_error(chunk);
        }
        if (core::errors::get_value(chunk).empty()) {
            return core::errors::ok();
        }
        pending_output_ += core::errors::get_value(chunk);
    }
}

core::errors::Result<CommandResult> RemoteProcess::execute(
    const std::string& command, const std::optional<std::chrono::milliseconds> timeout) {
    auto ready = require_running("execute a command");
    if (core::errors::is_error(ready)) {
        return core::errors::get_error(ready);
    }
    auto stashed = stash_pending_output();
    if (core::errors::is_error(stashed)) {
        return core::errors::get_error(stashed);
    }

    // The marker line is "\n<marker> <exit code>\n"; it never appears in the
    // input echo because the session does not echo.
    const std::string marker = "__compgym_done_" + core::config::random_hex_suffix() + "__";
    auto sent = channel_.write_process_input(
        handle_.pid, command + "\nprintf '\\n%s %d\\n' '" + marker + "' \"$?\"\n");
    if (core::errors::is_error(sent)) {
        return core::errors::get_error(sent);
    }
    LOG_DEBUG("RemoteProcess: pid " + std::to_string(handle_.pid) + " executing: " + command);

    const std::string terminator = "\n" + marker + " ";
    const auto deadline = timeout.has_value()
                              ? std::optional<std::chrono::steady_clock::time_point>(
                                    std::chrono::steady_clock::now() + timeout.value())
                              : std::nullopt;
    std::string collected;
    while (true) {
        const auto at = collected.find(terminator);
        const auto end_of_marker =
            at == std::string::npos ? std::string::npos
                                    : collected.find('\n', at + terminator.size());
        if (end_of_marker != std::string::npos) {
            const std::string code_text = collected.substr(
                at + terminator.size(), end_of_marker - at - terminator.size());
            CommandResult result;
            auto [ptr, ec] = std::from_chars(code_text.data(),
                                             code_text.data() + code_text.size(),
                                             result.exit_code);
            if (ec != std::errc() || ptr != code_text.data() + code_text.size()) {
                return GymError{ErrorCategory::Execution,
                                "Unreadable exit status '" + code_text + "' from shell",
                                "command_failed"};
            }
            result.output = collected.substr(0, at);
            pending_output_ += collected.substr(end_of_marker + 1);
            return result;
        }

        std::optional<std::chrono::milliseconds> wait;
        if (deadline.has_value()) {
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline.value() - std::chrono::steady_clock::now());
            if (left.count() <= 0) {
                pending_output_ += collected;
                return GymError{ErrorCategory::Execution,
                                "Command did not finish within " +
                                    std::to_string(timeout->count()) + "ms: " + command,
                                "command_timeout"};
            }
            wait = left;
        }

        auto chunk = channel_.read_process_output(handle_.pid, wait);
        if (core::errors::is_error(chunk)) {
            return core::errors::get_error(chunk);
        }
        if (core::errors::get_value(chunk).empty() && !deadline.has_value()) {
            // An unbounded wait only comes back empty once the output is closed.
            return GymError{ErrorCategory::Execution,
                            "Shell closed its output while running: " + command,
                            "command_failed"};
        }
        collected += core::errors::get_value(chunk);
    }
}

core::errors::Status RemoteProcess::change_directory(const std::filesystem::path& path) {
    auto executed = execute("cd " + shell_quote(path.string()));
    if (core::errors::is_error(executed)) {
        return core::errors::get_error(executed);
    }
    const auto& result = core::errors::get_value(executed);
    if (result.exit_code != 0) {
        return GymError{ErrorCategory::Execution,
                        "cd " + path.string() + " failed: " + result.output,
                        "change_directory_failed"};
    }
    auto moved = cwd();
    if (core::errors::is_error(moved)) {
        return core::errors::get_error(moved);
    }
    return core::errors::ok();
}

core::errors::Status RemoteProcess::set_envvar(const std::string& name,
                                               const std::string& value) {
    if (!is_envvar_name(name)) {
        return invalid_envvar_name(name);
    }
    auto executed = execute("export " + name + "=" + shell_quote(value));
    if (core::errors::is_error(executed)) {
        return core::errors::get_error(executed);
    }
    if (core::errors::get_value(executed).exit_code != 0) {
        return GymError{ErrorCategory::Execution, "export " + name + " failed: " +
                                                      core::errors::get_value(executed).output,
                        "command_failed"};
    }
    handle_.last_known_env[name] = value;
    return core::errors::ok();
}

core::errors::Result<std::optional<std::string>> RemoteProcess::get_envvar(
    const std::string& name) {
    if (!is_envvar_name(name)) {
        return invalid_envvar_name(name);
    }
    auto executed = execute("printenv " + name);
    if (core::errors::is_error(executed)) {
        return core::errors::get_error(executed);
    }
    const auto& result = core::errors::get_value(executed);
    if (result.exit_code != 0) {
        handle_.last_known_env.erase(name);
        return std::optional<std::string>();
    }
    std::string value = result.output;
    if (!value.empty() && value.back() == '\n') {
        value.pop_back();
    }
    handle_.last_known_env[name] = value;
    return std::optional<std::string>(value);
}

bool RemoteProcess::send_input(const std::string& text) {
    auto ready = require_running("send input");
    if (core::errors::is_error(ready)) {
        LOG_WARN("RemoteProcess: " + core::errors::get_error(ready).message);
        return false;
    }
    auto sent = channel_.write_process_input(handle_.pid, text);
    if (core::errors::is_error(sent)) {
        LOG_ERROR("RemoteProcess: failed to send input to pid " +
                  std::to_string(handle_.pid) + ": " +
                  core::errors::get_error(sent).message);
        return false;
    }
    return true;
}

core::errors::Result<std::filesystem::path> RemoteProcess::cwd() {
    auto ready = require_running("query cwd");
    if (core::errors::is_error(ready)) {
        return core::errors::get_error(ready);
    }
    auto info = channel_.query_process_info(handle_.pid);
    if (core::errors::is_error(info)) {
        return core::errors::get_error(info);
    }
    handle_.last_known_cwd = core::errors::get_value(info).cwd;
    return handle_.last_known_cwd;
}

core::errors::Result<std::map<std::string, std::string>> RemoteProcess::env() {
    auto executed = execute("env -0");
    if (core::errors::is_error(executed)) {
        return core::errors::get_error(executed);
    }
    const auto& result = core::errors::get_value(executed);
    if (result.exit_code != 0) {
        return GymError{ErrorCategory::Execution,
                        "Unable to list the shell environment: " + result.output,
                        "command_failed"};
    }

    std::map<std::string, std::string> env;
    std::size_t start = 0;
    while (start < result.output.size()) {
        auto end = result.output.find('\0', start);
        if (end == std::string::npos) {
            end = result.output.size();
        }
        const std::string entry = result.output.substr(start, end - start);
        const auto eq = entry.find('=');
        if (eq != std::string::npos && eq > 0) {
            env[entry.substr(0, eq)] = entry.substr(eq + 1);
        }
        start = end + 1;
    }
    handle_.last_known_env = env;
    return env;
}

}  // namespace compgym::resource
