#include "resource/remote_file.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <utility>
#include "core/config/episode_id.hpp"
#include "core/logging/logger.hpp"

namespace compgym::resource {

using core::errors::ErrorCategory;
using core::errors::GymError;

namespace {

struct OpenMode {
    bool readable = false;
    bool writable = false;
    bool truncate = false;
    bool append = false;
    // Copy the remote file into the cache before opening.
    bool pull = false;
    bool must_exist = false;
};

std::optional<OpenMode> parse_mode(std::string mode) {
    mode.erase(std::remove(mode.begin(), mode.end(), 'b'), mode.end());

    OpenMode parsed;
    if (mode == "r") {
        parsed.readable = true;
        parsed.pull = true;
        parsed.must_exist = true;
    } else if (mode == "r+") {
        parsed.readable = true;
        parsed.writable = true;
        parsed.pull = true;
        parsed.must_exist = true;
    } else if (mode == "w" || mode == "w+") {
        parsed.readable = mode == "w+";
        parsed.writable = true;
        parsed.truncate = true;
    } else if (mode == "a" || mode == "a+") {
        parsed.readable = mode == "a+";
        parsed.writable = true;
        parsed.append = true;
        parsed.pull = true;
    } else {
        return std::nullopt;
    }
    return parsed;
}

std::string fnv1a_hex(const std::string& text) {
    std::uint64_t hash = 1469598103934665603ULL;
    for (const unsigned char c : text) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    std::ostringstream out;
    out << std::hex << std::setw(16) << std::setfill('0') << hash;
    return out.str();
}

bool create_empty_file(const std::filesystem::path& path) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    return out.is_open();
}

std::ios::openmode stream_flags(const OpenMode& mode) {
    std::ios::openmode flags = std::ios::binary;
    if (mode.readable) {
        flags |= std::ios::in;
    }
    if (mode.writable) {
        flags |= std::ios::out;
    }
    if (mode.truncate) {
        flags |= std::ios::trunc;
    }
    if (mode.append) {
        flags |= std::ios::app;
    }
    return flags;
}

GymError sync_error(const std::string& message, const GymError& cause) {
    return GymError{ErrorCategory::Resource, message + ": " + cause.message,
                    "resource_sync_failed", "Check the channel and retry."};
}

}  // namespace

core::errors::Result<std::unique_ptr<RemoteFile>> RemoteFile::open(
    computer::RemoteChannel& channel, const std::filesystem::path& remote_path,
    const std::string& mode) {
    const auto parsed = parse_mode(mode);
    if (!parsed.has_value()) {
        return GymError{ErrorCategory::Input, "Unsupported file mode: '" + mode + "'",
                        "invalid_mode"};
    }
    const bool read_only = parsed->readable && !parsed->writable;

    auto cache_dir = channel.local_cache_dir();
    if (core::errors::is_error(cache_dir)) {
        return core::errors::get_error(cache_dir);
    }

    // Hash of the full remote path keeps same-named files apart; the random
    // part keeps concurrent handles on one path from sharing a cache file.
    const auto cache_path =
        core::errors::get_value(cache_dir) /
        (fnv1a_hex(remote_path.generic_string()) + "-" +
         core::config::random_hex_suffix() + "-" + remote_path.filename().string());
    std::error_code ec;
    std::filesystem::remove(cache_path, ec);

    bool pulled = false;
    if (parsed->pull) {
        auto exists = channel.remote_exists(remote_path);
        if (core::errors::is_error(exists)) {
            if (read_only) {
                return sync_error("Unable to stat " + remote_path.string(),
                                  core::errors::get_error(exists));
            }
            LOG_WARN("RemoteFile: cannot stat " + remote_path.string() +
                     ", starting from an empty file");
        } else if (!core::errors::get_value(exists)) {
            if (parsed->must_exist) {
                return GymError{ErrorCategory::Lookup,
                                "Remote file not found: " + remote_path.string(),
                                "not_found"};
            }
        } else {
            auto copied = channel.copy_from_remote(remote_path, cache_path);
            if (core::errors::is_error(copied)) {
                if (read_only) {
                    return sync_error("Unable to fetch " + remote_path.string(),
                                      core::errors::get_error(copied));
                }
                LOG_WARN("RemoteFile: fetch of " + remote_path.string() +
                         " failed, starting from an empty file");
            } else {
                pulled = true;
            }
        }
    }

    if (!pulled && !create_empty_file(cache_path)) {
        return GymError{ErrorCategory::Internal,
                        "Unable to create cache file: " + cache_path.string(),
                        "cache_open_failed"};
    }

    ResourceHandle handle{remote_path, mode, cache_path, false};
    std::unique_ptr<RemoteFile> file(
        new RemoteFile(channel, std::move(handle), parsed->readable, parsed->writable));
    file->stream_.open(cache_path, stream_flags(*parsed));
    if (!file->stream_.is_open()) {
        file->closed_ = true;
        std::filesystem::remove(cache_path, ec);
        return GymError{ErrorCategory::Internal,
                        "Unable to open cache file: " + cache_path.string(),
                        "cache_open_failed"};
    }

    LOG_DEBUG("RemoteFile: opened " + remote_path.string() + " (" + mode + ")");
    return std::move(file);
}

RemoteFile::RemoteFile(computer::RemoteChannel& channel, ResourceHandle handle,
                       const bool readable, const bool writable)
    : channel_(channel),
      handle_(std::move(handle)),
      readable_(readable),
      writable_(writable) {}

RemoteFile::~RemoteFile() {
    if (closed_) {
        return;
    }
    auto closed = close();
    if (core::errors::is_error(closed)) {
        LOG_ERROR("RemoteFile: unsynced changes to " + handle_.remote_path.string() +
                  " kept at " + handle_.local_cache_path.string() + ": " +
                  core::errors::get_error(closed).message);
        stream_.close();
    }
}

core::errors::Status RemoteFile::require_open(const std::string& operation) const {
    if (closed_) {
        return GymError{ErrorCategory::Input,
                        "Cannot " + operation + " a closed file: " +
                            handle_.remote_path.string(),
                        "handle_closed"};
    }
    return core::errors::ok();
}

core::errors::Status RemoteFile::require_readable(const std::string& operation) {
    auto open = require_open(operation);
    if (core::errors::is_error(open)) {
        return open;
    }
    if (!readable_) {
        return GymError{ErrorCategory::Input,
                        "File not open for reading (mode '" + handle_.mode + "')",
                        "unsupported_operation"};
    }
    stream_.clear();
    if (last_op_ == LastOp::Write) {
        stream_.flush();
        const auto pos = stream_.rdbuf()->pubseekoff(0, std::ios::cur);
        stream_.rdbuf()->pubseekpos(pos);
    }
    last_op_ = LastOp::Read;
    return core::errors::ok();
}

core::errors::Status RemoteFile::require_writable(const std::string& operation) {
    auto open = require_open(operation);
    if (core::errors::is_error(open)) {
        return open;
    }
    if (!writable_) {
        return GymError{ErrorCategory::Input,
                        "File not open for writing (mode '" + handle_.mode + "')",
                        "unsupported_operation"};
    }
    stream_.clear();
    if (last_op_ == LastOp::Read) {
        const auto pos = stream_.rdbuf()->pubseekoff(0, std::ios::cur);
        stream_.rdbuf()->pubseekpos(pos);
    }
    last_op_ = LastOp::Write;
    return core::errors::ok();
}

core::errors::Result<std::string> RemoteFile::read(const std::optional<std::size_t> size) {
    auto ready = require_readable("read");
    if (core::errors::is_error(ready)) {
        return core::errors::get_error(ready);
    }

    // Bounded chunks, so a large request costs no more than the file holds.
    std::string data;
    char buffer[4096];
    while (!size.has_value() || data.size() < *size) {
        std::size_t want = sizeof(buffer);
        if (size.has_value()) {
            want = std::min(want, *size - data.size());
        }
        stream_.read(buffer, static_cast<std::streamsize>(want));
        const auto got = static_cast<std::size_t>(stream_.gcount());
        data.append(buffer, got);
        if (got < want || !stream_) {
            break;
        }
    }
    return data;
}

core::errors::Result<std::string> RemoteFile::readline() {
    auto ready = require_readable("read");
    if (core::errors::is_error(ready)) {
        return core::errors::get_error(ready);
    }

    std::string line;
    if (!std::getline(stream_, line)) {
        return std::string();
    }
    if (!stream_.eof()) {
        line.push_back('\n');
    }
    return line;
}

core::errors::Result<std::vector<std::string>> RemoteFile::readlines() {
    std::vector<std::string> lines;
    while (true) {
        auto line = readline();
        if (core::errors::is_error(line)) {
            return core::errors::get_error(line);
        }
        if (core::errors::get_value(line).empty()) {
            break;
        }
        lines.push_back(std::move(core::errors::get_value(line)));
    }
    return lines;
}

core::errors::Result<std::size_t> RemoteFile::write(const std::string& data) {
    auto ready = require_writable("write");
    if (core::errors::is_error(ready)) {
        return core::errors::get_error(ready);
    }

    handle_.dirty = true;
    stream_.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!stream_.good()) {
        return GymError{ErrorCategory::Internal,
                        "Unable to write cache file: " + handle_.local_cache_path.string(),
                        "cache_write_failed"};
    }
    return data.size();
}

core::errors::Status RemoteFile::writelines(const std::vector<std::string>& lines) {
    for (const auto& line : lines) {
        auto written = write(line);
        if (core::errors::is_error(written)) {
            return core::errors::get_error(written);
        }
    }
    return core::errors::ok();
}

core::errors::Result<std::int64_t> RemoteFile::seek(const std::int64_t offset,
                                                    const SeekOrigin origin) {
    auto open = require_open("seek");
    if (core::errors::is_error(open)) {
        return core::errors::get_error(open);
    }

    std::ios::seekdir dir = std::ios::beg;
    if (origin == SeekOrigin::Current) {
        dir = std::ios::cur;
    } else if (origin == SeekOrigin::End) {
        dir = std::ios::end;
    }

    stream_.clear();
    const auto pos = stream_.rdbuf()->pubseekoff(offset, dir);
    if (pos == std::streampos(std::streamoff(-1))) {
        return GymError{ErrorCategory::Input,
                        "Invalid seek to offset " + std::to_string(offset),
                        "invalid_seek"};
    }
    last_op_ = LastOp::None;
    return static_cast<std::int64_t>(pos);
}

core::errors::Result<std::int64_t> RemoteFile::tell() {
    auto open = require_open("tell");
    if (core::errors::is_error(open)) {
        return core::errors::get_error(open);
    }
    stream_.clear();
    return static_cast<std::int64_t>(stream_.rdbuf()->pubseekoff(0, std::ios::cur));
}

core::errors::Status RemoteFile::flush() {
    auto open = require_open("flush");
    if (core::errors::is_error(open)) {
        return open;
    }

    stream_.clear();
    stream_.flush();
    if (!writable_ || !handle_.dirty) {
        return core::errors::ok();
    }

    const auto parent = handle_.remote_path.parent_path();
    if (!parent.empty() && parent != handle_.remote_path.root_path()) {
        auto made = channel_.make_remote_dirs(parent);
        if (core::errors::is_error(made)) {
            LOG_ERROR("RemoteFile: sync of " + handle_.remote_path.string() +
                      " failed: " + core::errors::get_error(made).message);
            return sync_error("Unable to create " + parent.string(),
                              core::errors::get_error(made));
        }
    }

    auto copied = channel_.copy_to_remote(handle_.local_cache_path, handle_.remote_path);
    if (core::errors::is_error(copied)) {
        LOG_ERROR("RemoteFile: sync of " + handle_.remote_path.string() + " failed: " +
                  core::errors::get_error(copied).message);
        return sync_error("Unable to sync " + handle_.remote_path.string(),
                          core::errors::get_error(copied));
    }

    handle_.dirty = false;
    LOG_DEBUG("RemoteFile: synced " + handle_.remote_path.string());
    return core::errors::ok();
}

core::errors::Status RemoteFile::close() {
    if (closed_) {
        return core::errors::ok();
    }

    auto flushed = flush();
    if (core::errors::is_error(flushed)) {
        return flushed;
    }

    stream_.close();
    closed_ = true;
    std::error_code ec;
    std::filesystem::remove(handle_.local_cache_path, ec);
    LOG_DEBUG("RemoteFile: closed " + handle_.remote_path.string());
    return core::errors::ok();
}

RemoteFile::LineIterator::LineIterator(RemoteFile* file) : file_(file) {
    advance();
}

RemoteFile::LineIterator& RemoteFile::LineIterator::operator++() {
    advance();
    return *this;
}

void RemoteFile::LineIterator::advance() {
    if (file_ == nullptr) {
        return;
    }
    auto line = file_->readline();
    if (core::errors::is_error(line)) {
        LOG_WARN("RemoteFile: line iteration stopped: " +
                 core::errors::get_error(line).message);
        file_ = nullptr;
        return;
    }
    if (core::errors::get_value(line).empty()) {
        file_ = nullptr;
        return;
    }
    line_ = std::move(core::errors::get_value(line));
}

}  // namespace compgym::resource
