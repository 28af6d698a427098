#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include "core/errors/agent_errors.hpp"

namespace warden::tools {

struct FileIoConfig {
    // Files up to this size are read or written in one call.
    std::uintmax_t small_file_threshold = 1024 * 1024;
    // Files up to this size are streamed through a buffer; larger ones are
    // read in chunks and capped at max_content_bytes.
    std::uintmax_t medium_file_threshold = 50ULL * 1024 * 1024;
    std::size_t buffer_size = 64 * 1024;
    std::size_t chunk_size = 8192;
    std::size_t max_content_bytes = 10 * 1024 * 1024;
};

enum class FileKind {
    Missing,
    RegularFile,
    Directory,
    Symlink,
    Other
};

struct FileInfo {
    std::filesystem::path path;
    std::uintmax_t size = 0;
    FileKind kind = FileKind::Missing;

    // "512 B", "1.50 KB", "2.00 MB"
    std::string format_size() const;
};

// Returning an error from the handler stops the stream.
using LineHandler = std::function<core::errors::Status(const std::string& line)>;

class FileIo {
public:
    explicit FileIo(FileIoConfig config = {});

    // Picks a strategy by size. Content past max_content_bytes in the chunked
    // tier is dropped and logged, not reported as an error.
    core::errors::Result<std::string> read(const std::filesystem::path& path) const;

    // Returns the number of bytes written.
    core::errors::Result<std::uintmax_t> write(const std::filesystem::path& path,
                                               const std::string& content) const;

    // Returns the number of lines handed to `handler`.
    core::errors::Result<std::size_t> line_stream(const std::filesystem::path& path,
                                                  const LineHandler& handler) const;

    core::errors::Result<FileInfo> file_info(const std::filesystem::path& path) const;

    const FileIoConfig& config() const { return config_; }

private:
    core::errors::Result<std::string> read_small(const std::filesystem::path& path) const;
    core::errors::Result<std::string> read_medium(const std::filesystem::path& path) const;
    core::errors::Result<std::string> read_large(const std::filesystem::path& path) const;

    core::errors::Result<std::uintmax_t> write_small(const std::filesystem::path& path,
                                                     const std::string& content) const;
    core::errors::Result<std::uintmax_t> write_large(const std::filesystem::path& path,
                                                     const std::string& content) const;

    FileIoConfig config_;
};

}  // namespace warden::tools
