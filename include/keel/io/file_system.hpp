#pragma once

/// @file file_system.hpp
/// @brief File system contract used by the document store

#include <keel/async/io_task.hpp>
#include <keel/core/error.hpp>

#include <memory>
#include <string>

namespace keel_io {

/// Readable file opened by IFileSystem::open_read
class IReadStream {
public:
    virtual ~IReadStream() = default;

    /// Read the remaining contents
    [[nodiscard]] virtual keel_async::IoTask<std::string> read_to_end_async() = 0;

    /// Release the underlying handle
    virtual void close() = 0;
};

/// Writable file opened by IFileSystem::open_write
class IWriteStream {
public:
    virtual ~IWriteStream() = default;

    /// Queue text for writing
    [[nodiscard]] virtual keel_async::IoTask<void> write_async(std::string text) = 0;

    /// Push written text to storage
    [[nodiscard]] virtual keel_async::IoTask<void> flush_async() = 0;

    /// Release the underlying handle. Safe to call more than once.
    virtual void close() = 0;

    [[nodiscard]] virtual bool is_open() const = 0;
};

/// Host file system
class IFileSystem {
public:
    virtual ~IFileSystem() = default;

    [[nodiscard]] virtual bool exists(const std::string& path) const = 0;

    /// Open an existing file for reading
    [[nodiscard]] virtual keel_core::Result<std::unique_ptr<IReadStream>> open_read(const std::string& path) = 0;

    /// Create or truncate a file for writing
    [[nodiscard]] virtual keel_core::Result<std::unique_ptr<IWriteStream>> open_write(const std::string& path) = 0;
};

} // namespace keel_io
