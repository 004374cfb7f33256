#pragma once

/// @file local_file_system.hpp
/// @brief Disk-backed file system running I/O on worker threads

#include "file_system.hpp"
#include <keel/async/task_pool.hpp>

#include <memory>

namespace keel_io {

/// File system over std::fstream.
///
/// Opening is synchronous; reads, writes and flushes run on the worker pool.
/// Flushing pushes the stream buffer to the operating system.
class LocalFileSystem : public IFileSystem {
public:
    explicit LocalFileSystem(std::shared_ptr<keel_async::IoWorkerPool> pool);

    [[nodiscard]] bool exists(const std::string& path) const override;
    [[nodiscard]] keel_core::Result<std::unique_ptr<IReadStream>> open_read(const std::string& path) override;
    [[nodiscard]] keel_core::Result<std::unique_ptr<IWriteStream>> open_write(const std::string& path) override;

    [[nodiscard]] const std::shared_ptr<keel_async::IoWorkerPool>& pool() const noexcept { return m_pool; }

private:
    std::shared_ptr<keel_async::IoWorkerPool> m_pool;
};

// =============================================================================
// Shared Instance
// =============================================================================

/// Process-wide local file system on a shared worker pool
std::shared_ptr<IFileSystem> default_file_system();

/// Process-wide worker pool used by default_file_system()
std::shared_ptr<keel_async::IoWorkerPool> default_io_pool();

/// Create the shared pool with a configuration. Fails if it already exists.
keel_core::Result<void> configure_default_io(const keel_async::IoConfig& config);

} // namespace keel_io
