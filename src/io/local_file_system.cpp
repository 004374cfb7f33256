/// @file local_file_system.cpp
/// @brief LocalFileSystem implementation

#include <keel/io/local_file_system.hpp>
#include <keel/core/log.hpp>

#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace keel_io {

namespace {

// =============================================================================
// LocalReadStream
// =============================================================================

class LocalReadStream : public IReadStream {
public:
    LocalReadStream(std::string path, std::shared_ptr<std::ifstream> file,
                    std::shared_ptr<keel_async::IoWorkerPool> pool)
        : m_path(std::move(path))
        , m_file(std::move(file))
        , m_pool(std::move(pool)) {}

    ~LocalReadStream() override { close(); }

    keel_async::IoTask<std::string> read_to_end_async() override {
        if (!m_file) {
            return keel_async::IoTask<std::string>::faulted("Cannot read closed file " + m_path);
        }
        return m_pool->submit_task([file = m_file, path = m_path]() -> std::string {
            std::ostringstream buffer;
            buffer << file->rdbuf();
            if (file->bad()) {
                throw std::runtime_error("Read error on " + path);
            }
            return buffer.str();
        });
    }

    void close() override {
        // The worker keeps its own reference until a pending read finishes
        m_file.reset();
    }

private:
    std::string m_path;
    std::shared_ptr<std::ifstream> m_file;
    std::shared_ptr<keel_async::IoWorkerPool> m_pool;
};

// =============================================================================
// LocalWriteStream
// =============================================================================

struct WriteState {
    std::mutex mutex;
    std::ofstream file;
};

class LocalWriteStream : public IWriteStream {
public:
    LocalWriteStream(std::string path, std::shared_ptr<WriteState> state,
                     std::shared_ptr<keel_async::IoWorkerPool> pool)
        : m_path(std::move(path))
        , m_state(std::move(state))
        , m_pool(std::move(pool)) {}

    ~LocalWriteStream() override { close(); }

    keel_async::IoTask<void> write_async(std::string text) override {
        if (!m_state) {
            return keel_async::IoTask<void>::faulted("Cannot write to closed file " + m_path);
        }
        return m_pool->submit_task([state = m_state, path = m_path, text = std::move(text)]() {
            std::lock_guard lock(state->mutex);
            if (!state->file.is_open()) {
                throw std::runtime_error("Cannot write to closed file " + path);
            }
            state->file.write(text.data(), static_cast<std::streamsize>(text.size()));
            if (!state->file) {
                throw std::runtime_error("Write error on " + path);
            }
        });
    }

    keel_async::IoTask<void> flush_async() override {
        if (!m_state) {
            return keel_async::IoTask<void>::faulted("Cannot flush closed file " + m_path);
        }
        return m_pool->submit_task([state = m_state, path = m_path]() {
            std::lock_guard lock(state->mutex);
            if (!state->file.is_open()) {
                throw std::runtime_error("Cannot flush closed file " + path);
            }
            state->file.flush();
            if (!state->file) {
                throw std::runtime_error("Flush error on " + path);
            }
        });
    }

    void close() override {
        if (!m_state) {
            return;
        }
        {
            std::lock_guard lock(m_state->mutex);
            if (m_state->file.is_open()) {
                m_state->file.close();
            }
        }
        m_state.reset();
    }

    bool is_open() const override {
        if (!m_state) {
            return false;
        }
        std::lock_guard lock(m_state->mutex);
        return m_state->file.is_open();
    }

private:
    std::string m_path;
    std::shared_ptr<WriteState> m_state;
    std::shared_ptr<keel_async::IoWorkerPool> m_pool;
};

} // anonymous namespace

// =============================================================================
// LocalFileSystem
// =============================================================================

LocalFileSystem::LocalFileSystem(std::shared_ptr<keel_async::IoWorkerPool> pool)
    : m_pool(std::move(pool)) {}

bool LocalFileSystem::exists(const std::string& path) const {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

keel_core::Result<std::unique_ptr<IReadStream>> LocalFileSystem::open_read(const std::string& path) {
    auto file = std::make_shared<std::ifstream>(path, std::ios::binary);
    if (!file->is_open()) {
        return keel_core::Err<std::unique_ptr<IReadStream>>(
            keel_core::ResourceError::io_fault(path, "Could not open '" + path + "' for reading"));
    }

    keel_core::io_logger()->trace("Opened {} for reading", path);
    std::unique_ptr<IReadStream> stream = std::make_unique<LocalReadStream>(path, std::move(file), m_pool);
    return keel_core::Ok(std::move(stream));
}

keel_core::Result<std::unique_ptr<IWriteStream>> LocalFileSystem::open_write(const std::string& path) {
    auto state = std::make_shared<WriteState>();
    state->file.open(path, std::ios::binary | std::ios::trunc);
    if (!state->file.is_open()) {
        return keel_core::Err<std::unique_ptr<IWriteStream>>(
            keel_core::ResourceError::io_fault(path, "Could not open '" + path + "' for writing"));
    }

    keel_core::io_logger()->trace("Opened {} for writing", path);
    std::unique_ptr<IWriteStream> stream = std::make_unique<LocalWriteStream>(path, std::move(state), m_pool);
    return keel_core::Ok(std::move(stream));
}

// =============================================================================
// Shared Instance
// =============================================================================

namespace {

struct DefaultIo {
    std::mutex mutex;
    std::shared_ptr<keel_async::IoWorkerPool> pool;
    std::shared_ptr<IFileSystem> file_system;
};

DefaultIo& default_io() {
    static DefaultIo s_io;
    return s_io;
}

} // anonymous namespace

std::shared_ptr<keel_async::IoWorkerPool> default_io_pool() {
    auto& io = default_io();
    std::lock_guard lock(io.mutex);
    if (!io.pool) {
        io.pool = std::make_shared<keel_async::IoWorkerPool>(keel_async::IoConfig{}.worker_threads);
    }
    return io.pool;
}

std::shared_ptr<IFileSystem> default_file_system() {
    auto pool = default_io_pool();

    auto& io = default_io();
    std::lock_guard lock(io.mutex);
    if (!io.file_system) {
        io.file_system = std::make_shared<LocalFileSystem>(std::move(pool));
    }
    return io.file_system;
}

keel_core::Result<void> configure_default_io(const keel_async::IoConfig& config) {
    auto& io = default_io();
    std::lock_guard lock(io.mutex);
    if (io.pool) {
        return keel_core::Err(keel_core::Error(keel_core::ErrorCode::InvalidState,
            "Default I/O pool already created"));
    }
    io.pool = std::make_shared<keel_async::IoWorkerPool>(config.worker_threads);
    return keel_core::Ok();
}

} // namespace keel_io
