#pragma once

/// @file memory_file_system.hpp
/// @brief In-memory file system with fault injection

#include "file_system.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace keel_io {

/// Faults injected into subsequent MemoryFileSystem operations.
/// A set message makes the step fault; a cancel flag makes its task
/// complete without a value.
struct MemoryFaults {
    std::optional<std::string> open_read;
    std::optional<std::string> read;
    std::optional<std::string> open_write;
    std::optional<std::string> write;
    std::optional<std::string> flush;
    bool cancel_read = false;
    bool cancel_write = false;
    bool cancel_flush = false;
};

/// File system holding file contents in memory.
///
/// Written text becomes visible on flush or close. Tasks complete
/// immediately. Thread-safe.
class MemoryFileSystem : public IFileSystem {
public:
    MemoryFileSystem() = default;

    [[nodiscard]] bool exists(const std::string& path) const override;
    [[nodiscard]] keel_core::Result<std::unique_ptr<IReadStream>> open_read(const std::string& path) override;
    [[nodiscard]] keel_core::Result<std::unique_ptr<IWriteStream>> open_write(const std::string& path) override;

    /// Create or replace a file
    void set_file(const std::string& path, std::string contents);

    /// Remove a file; returns false if absent
    bool remove(const std::string& path);

    /// Get file contents
    [[nodiscard]] std::optional<std::string> file(const std::string& path) const;

    /// Paths of all files
    [[nodiscard]] std::vector<std::string> paths() const;

    /// Replace the injected faults
    void set_faults(MemoryFaults faults);

    /// Remove all injected faults
    void clear_faults();

    /// Number of streams currently open
    [[nodiscard]] std::size_t open_handle_count() const;

    /// Number of streams currently open for writing on @p path
    [[nodiscard]] std::size_t open_writers(const std::string& path) const;

    /// Number of open_read / open_write calls so far
    [[nodiscard]] std::size_t open_read_count() const;
    [[nodiscard]] std::size_t open_write_count() const;

private:
    friend class MemoryReadStream;
    friend class MemoryWriteStream;

    void release_handle(const std::string& path, bool writer);
    void commit(const std::string& path, const std::string& contents);

    mutable std::mutex m_mutex;
    std::map<std::string, std::string> m_files;
    std::map<std::string, std::size_t> m_writers;
    MemoryFaults m_faults;
    std::size_t m_open_handles = 0;
    std::size_t m_open_reads = 0;
    std::size_t m_open_writes = 0;
};

} // namespace keel_io
