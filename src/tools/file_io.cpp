#include "tools/file_io.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"
#include "core/text/utf8.hpp"

namespace warden::tools {

using core::errors::AgentError;
using core::errors::ErrorCategory;

namespace {

constexpr std::uintmax_t kOneMiB = 1024 * 1024;

AgentError io_error(const std::string& what, const std::filesystem::path& path,
                    const std::string& code, const std::string& cause = "") {
    std::string message = what + ": " + path.string();
    if (!cause.empty()) {
        message += " (" + cause + ")";
    }
    return AgentError{ErrorCategory::Execution, message, code};
}

core::errors::Result<std::string> require_utf8(std::string content,
                                               const std::filesystem::path& path) {
    if (!core::text::is_valid_utf8(content)) {
        return AgentError{ErrorCategory::Execution,
                          "File contains invalid UTF-8: " + path.string(),
                          "invalid_utf8",
                          "Only UTF-8 text files can be read."};
    }
    return content;
}

}  // namespace

std::string FileInfo::format_size() const {
    static const char* const kUnits[] = {"B", "KB", "MB", "GB", "TB"};
    constexpr int kUnitCount = 5;

    double scaled = static_cast<double>(size);
    int unit = 0;
    while (scaled >= 1024.0 && unit < kUnitCount - 1) {
        scaled /= 1024.0;
        ++unit;
    }

    std::ostringstream out;
    if (unit == 0) {
        out << size << " " << kUnits[0];
    } else {
        out << std::fixed << std::setprecision(2) << scaled << " " << kUnits[unit];
    }
    return out.str();
}

FileIo::FileIo(FileIoConfig config) : config_(std::move(config)) {}

core::errors::Result<std::string> FileIo::read(const std::filesystem::path& path) const {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        return io_error("Path is a directory, not a file", path, "not_a_file");
    }
    const std::uintmax_t size = std::filesystem::file_size(path, ec);
    if (ec) {
        return io_error("Failed to get metadata for", path, "metadata_failed", ec.message());
    }

    if (size == 0) {
        return std::string();
    }
    if (size <= config_.small_file_threshold) {
        WARDEN_LOG_DEBUG("Reading small file: " + path.string());
        return read_small(path);
    }
    if (size <= config_.medium_file_threshold) {
        WARDEN_LOG_DEBUG("Reading medium file with buffering: " + path.string());
        return read_medium(path);
    }
    WARDEN_LOG_WARN("File is very large (" + std::to_string(size) +
                    " bytes), reading in chunks: " + path.string());
    return read_large(path);
}

core::errors::Result<std::string> FileIo::read_small(const std::filesystem::path& path) const {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return io_error("Failed to open small file", path, "open_failed");
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return io_error("I/O error while reading small file", path, "read_failed");
    }
    return require_utf8(buffer.str(), path);
}

core::errors::Result<std::string> FileIo::read_medium(const std::filesystem::path& path) const {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return io_error("Failed to open medium file", path, "open_failed");
    }

    std::string content;
    std::error_code ec;
    const auto expected = std::filesystem::file_size(path, ec);
    if (!ec) {
        content.reserve(static_cast<std::size_t>(expected));
    }

    std::vector<char> buffer(config_.buffer_size);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const std::streamsize got = in.gcount();
        if (got > 0) {
            content.append(buffer.data(), static_cast<std::size_t>(got));
        }
    }
    if (in.bad()) {
        return io_error("I/O error while reading medium file", path, "read_failed");
    }
    return require_utf8(std::move(content), path);
}

core::errors::Result<std::string> FileIo::read_large(const std::filesystem::path& path) const {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return io_error("Failed to open large file", path, "open_failed");
    }

    std::string content;
    content.reserve(config_.max_content_bytes);
    std::vector<char> chunk(config_.chunk_size);
    bool truncated = false;
    std::uintmax_t next_progress_mark = kOneMiB;

    while (in) {
        in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        const std::streamsize got = in.gcount();
        if (got <= 0) {
            break;
        }
        content.append(chunk.data(), static_cast<std::size_t>(got));

        if (content.size() >= config_.max_content_bytes) {
            truncated = content.size() > config_.max_content_bytes ||
                        in.peek() != std::char_traits<char>::eof();
            content.resize(config_.max_content_bytes);
            break;
        }
        if (content.size() >= next_progress_mark) {
            WARDEN_LOG_DEBUG("Read " + std::to_string(content.size() / kOneMiB) +
                             " MB so far from " + path.string());
            next_progress_mark += kOneMiB;
        }
    }
    if (in.bad()) {
        return io_error("Failed to read chunk from", path, "read_failed");
    }

    if (truncated) {
        // The cap may split a multi-byte character.
        content.resize(content.size() - core::text::incomplete_tail_length(content));
        WARDEN_LOG_WARN("File truncated at " + std::to_string(content.size()) +
                        " bytes: " + path.string());
    }
    return require_utf8(std::move(content), path);
}

core::errors::Result<std::uintmax_t> FileIo::write(const std::filesystem::path& path,
                                                   const std::string& content) const {
    WARDEN_LOG_DEBUG("Writing " + std::to_string(content.size()) + " bytes to: " +
                     path.string());
    if (content.size() <= config_.small_file_threshold) {
        return write_small(path, content);
    }
    return write_large(path, content);
}

core::errors::Result<std::uintmax_t> FileIo::write_small(const std::filesystem::path& path,
                                                         const std::string& content) const {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return io_error("Failed to open file for writing", path, "open_failed");
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out.good()) {
        return io_error("Failed to write small file", path, "write_failed");
    }
    return static_cast<std::uintmax_t>(content.size());
}

core::errors::Result<std::uintmax_t> FileIo::write_large(const std::filesystem::path& path,
                                                         const std::string& content) const {
    std::error_code ec;
    const auto parent = path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return io_error("Failed to create parent directory", parent,
                            "create_directory_failed", ec.message());
        }
    }

    std::vector<char> stream_buffer(config_.buffer_size);
    std::ofstream out;
    out.rdbuf()->pubsetbuf(stream_buffer.data(),
                           static_cast<std::streamsize>(stream_buffer.size()));
    out.open(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return io_error("Failed to create file", path, "open_failed");
    }

    std::uintmax_t written = 0;
    std::uintmax_t next_progress_mark = kOneMiB;
    while (written < content.size()) {
        const std::size_t remaining = content.size() - static_cast<std::size_t>(written);
        const std::size_t length =
            remaining < config_.chunk_size ? remaining : config_.chunk_size;
        out.write(content.data() + static_cast<std::size_t>(written),
                  static_cast<std::streamsize>(length));
        if (!out.good()) {
            return io_error("Failed to write chunk to", path, "write_failed");
        }
        written += length;
        if (written >= next_progress_mark) {
            WARDEN_LOG_DEBUG("Written " + std::to_string(written / kOneMiB) +
                             " MB so far to " + path.string());
            next_progress_mark += kOneMiB;
        }
    }

    out.flush();
    if (!out.good()) {
        return io_error("Failed to flush file", path, "write_failed");
    }
    return written;
}

core::errors::Result<std::size_t> FileIo::line_stream(const std::filesystem::path& path,
                                                      const LineHandler& handler) const {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return io_error("Failed to open file for line processing", path, "open_failed");
    }

    std::string line;
    std::size_t line_count = 0;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!core::text::is_valid_utf8(line)) {
            return AgentError{ErrorCategory::Execution,
                              "Invalid UTF-8 on line " + std::to_string(line_count + 1) +
                                  " of " + path.string(),
                              "invalid_utf8"};
        }

        auto handled = handler(line);
        if (handled.has_value()) {
            return *handled;
        }
        ++line_count;
        if (line_count % 10000 == 0) {
            WARDEN_LOG_DEBUG("Processed " + std::to_string(line_count) + " lines");
        }
    }
    if (in.bad()) {
        return io_error("Failed to read line from", path, "read_failed");
    }

    WARDEN_LOG_DEBUG("Processed " + std::to_string(line_count) + " lines total from " +
                     path.string());
    return line_count;
}

core::errors::Result<FileInfo> FileIo::file_info(const std::filesystem::path& path) const {
    std::error_code ec;
    const auto status = std::filesystem::symlink_status(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return io_error("Failed to get metadata for", path, "metadata_failed", ec.message());
    }

    FileInfo info;
    info.path = path;
    if (!std::filesystem::exists(status)) {
        info.kind = FileKind::Missing;
        return info;
    }
    if (std::filesystem::is_symlink(status)) {
        info.kind = FileKind::Symlink;
    } else if (std::filesystem::is_regular_file(status)) {
        info.kind = FileKind::RegularFile;
        info.size = std::filesystem::file_size(path, ec);
        if (ec) {
            return io_error("Failed to get size of", path, "metadata_failed", ec.message());
        }
    } else if (std::filesystem::is_directory(status)) {
        info.kind = FileKind::Directory;
    } else {
        info.kind = FileKind::Other;
    }
    return info;
}

}  // namespace warden::tools
