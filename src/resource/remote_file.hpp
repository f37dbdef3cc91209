#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "computer/remote_channel.hpp"
#include "core/errors/gym_errors.hpp"

namespace compgym::resource {

enum class SeekOrigin {
    Begin,
    Current,
    End
};

struct ResourceHandle {
    std::filesystem::path remote_path;
    std::string mode;
    std::filesystem::path local_cache_path;
    bool dirty = false;
};

// File-like access to a file that lives behind a RemoteChannel. All I/O goes
// to a local cache copy; flush() pushes the cache back when it is dirty.
//
// dirty is set by every write and cleared only by a successful sync. A failed
// flush or close leaves the handle open and dirty so it can be retried.
class RemoteFile {
public:
    // Modes follow fopen: "r", "w", "a", "r+", "w+", "a+", each optionally
    // with "b". Read and append modes pull the remote copy first.
    static core::errors::Result<std::unique_ptr<RemoteFile>> open(
        computer::RemoteChannel& channel, const std::filesystem::path& remote_path,
        const std::string& mode = "r");

    ~RemoteFile();

    RemoteFile(const RemoteFile&) = delete;
    RemoteFile& operator=(const RemoteFile&) = delete;

    // Reads `size` bytes, or up to end of file when unset.
    core::errors::Result<std::string> read(std::optional<std::size_t> size = std::nullopt);
    // Next line including its '\n'; empty at end of file.
    core::errors::Result<std::string> readline();
    core::errors::Result<std::vector<std::string>> readlines();

    core::errors::Result<std::size_t> write(const std::string& data);
    core::errors::Status writelines(const std::vector<std::string>& lines);

    core::errors::Result<std::int64_t> seek(std::int64_t offset,
                                            SeekOrigin origin = SeekOrigin::Begin);
    core::errors::Result<std::int64_t> tell();

    core::errors::Status flush();
    core::errors::Status close();

    bool readable() const { return readable_; }
    bool writable() const { return writable_; }
    bool closed() const { return closed_; }
    bool dirty() const { return handle_.dirty; }
    const ResourceHandle& handle() const { return handle_; }

    class LineIterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = std::string;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::string*;
        using reference = const std::string&;

        LineIterator() = default;
        explicit LineIterator(RemoteFile* file);

        reference operator*() const { return line_; }
        pointer operator->() const { return &line_; }
        LineIterator& operator++();

        bool operator==(const LineIterator& other) const { return file_ == other.file_; }
        bool operator!=(const LineIterator& other) const { return !(*this == other); }

    private:
        void advance();

        RemoteFile* file_ = nullptr;
        std::string line_;
    };

    // Iterates the remaining lines from the current position.
    LineIterator begin() { return LineIterator(this); }
    LineIterator end() { return LineIterator(); }

private:
    enum class LastOp {
        None,
        Read,
        Write
    };

    RemoteFile(computer::RemoteChannel& channel, ResourceHandle handle, bool readable,
               bool writable);

    core::errors::Status require_open(const std::string& operation) const;
    core::errors::Status require_readable(const std::string& operation);
    core::errors::Status require_writable(const std::string& operation);

    computer::RemoteChannel& channel_;
    ResourceHandle handle_;
    std::fstream stream_;
    bool readable_ = false;
    bool writable_ = false;
    bool closed_ = false;
    LastOp last_op_ = LastOp::None;
};

}  // namespace compgym::resource
