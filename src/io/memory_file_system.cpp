/// @file memory_file_system.cpp
/// @brief MemoryFileSystem implementation

#include <keel/io/memory_file_system.hpp>
#include <keel/core/log.hpp>

namespace keel_io {

// =============================================================================
// Streams
// =============================================================================

class MemoryReadStream : public IReadStream {
public:
    MemoryReadStream(MemoryFileSystem& fs, std::string path, std::string contents,
                     std::optional<std::string> fault, bool cancel)
        : m_fs(&fs)
        , m_path(std::move(path))
        , m_contents(std::move(contents))
        , m_fault(std::move(fault))
        , m_cancel(cancel) {}

    ~MemoryReadStream() override { close(); }

    keel_async::IoTask<std::string> read_to_end_async() override {
        if (m_fault) {
            return keel_async::IoTask<std::string>::faulted(*m_fault);
        }
        if (m_cancel) {
            return keel_async::IoTask<std::string>::cancelled();
        }
        return keel_async::IoTask<std::string>::completed(m_contents);
    }

    void close() override {
        if (m_fs) {
            m_fs->release_handle(m_path, false);
            m_fs = nullptr;
        }
    }

private:
    MemoryFileSystem* m_fs;
    std::string m_path;
    std::string m_contents;
    std::optional<std::string> m_fault;
    bool m_cancel;
};

class MemoryWriteStream : public IWriteStream {
public:
    MemoryWriteStream(MemoryFileSystem& fs, std::string path, MemoryFaults faults)
        : m_fs(&fs)
        , m_path(std::move(path))
        , m_faults(std::move(faults)) {}

    ~MemoryWriteStream() override { close(); }

    keel_async::IoTask<void> write_async(std::string text) override {
        if (!m_fs) {
            return keel_async::IoTask<void>::faulted("Cannot write to closed file " + m_path);
        }
        if (m_faults.write) {
            return keel_async::IoTask<void>::faulted(*m_faults.write);
        }
        if (m_faults.cancel_write) {
            return keel_async::IoTask<void>::cancelled();
        }
        m_buffer += text;
        return keel_async::IoTask<void>::completed();
    }

    keel_async::IoTask<void> flush_async() override {
        if (!m_fs) {
            return keel_async::IoTask<void>::faulted("Cannot flush closed file " + m_path);
        }
        if (m_faults.flush) {
            return keel_async::IoTask<void>::faulted(*m_faults.flush);
        }
        if (m_faults.cancel_flush) {
            return keel_async::IoTask<void>::cancelled();
        }
        m_fs->commit(m_path, m_buffer);
        return keel_async::IoTask<void>::completed();
    }

    void close() override {
        if (!m_fs) {
            return;
        }
        // Closing a stream pushes out whatever was written
        if (!m_buffer.empty()) {
            m_fs->commit(m_path, m_buffer);
        }
        m_fs->release_handle(m_path, true);
        m_fs = nullptr;
    }

    bool is_open() const override { return m_fs != nullptr; }

private:
    MemoryFileSystem* m_fs;
    std::string m_path;
    MemoryFaults m_faults;
    std::string m_buffer;
};

// =============================================================================
// MemoryFileSystem
// =============================================================================

bool MemoryFileSystem::exists(const std::string& path) const {
    std::lock_guard lock(m_mutex);
    return m_files.find(path) != m_files.end();
}

keel_core::Result<std::unique_ptr<IReadStream>> MemoryFileSystem::open_read(const std::string& path) {
    std::lock_guard lock(m_mutex);
    ++m_open_reads;

    if (m_faults.open_read) {
        return keel_core::Err<std::unique_ptr<IReadStream>>(
            keel_core::ResourceError::io_fault(path, *m_faults.open_read));
    }

    auto it = m_files.find(path);
    if (it == m_files.end()) {
        return keel_core::Err<std::unique_ptr<IReadStream>>(
            keel_core::ResourceError::io_fault(path, "Could not open '" + path + "' for reading"));
    }

    ++m_open_handles;
    std::unique_ptr<IReadStream> stream = std::make_unique<MemoryReadStream>(
        *this, path, it->second, m_faults.read, m_faults.cancel_read);
    return keel_core::Ok(std::move(stream));
}

keel_core::Result<std::unique_ptr<IWriteStream>> MemoryFileSystem::open_write(const std::string& path) {
    std::lock_guard lock(m_mutex);
    ++m_open_writes;

    if (m_faults.open_write) {
        return keel_core::Err<std::unique_ptr<IWriteStream>>(
            keel_core::ResourceError::io_fault(path, *m_faults.open_write));
    }
    if (m_writers[path] > 0) {
        return keel_core::Err<std::unique_ptr<IWriteStream>>(
            keel_core::ResourceError::io_fault(path, "File '" + path + "' is already open for writing"));
    }

    m_files[path].clear();
    ++m_writers[path];
    ++m_open_handles;

    keel_core::io_logger()->trace("Opened memory file {} for writing", path);
    std::unique_ptr<IWriteStream> stream = std::make_unique<MemoryWriteStream>(*this, path, m_faults);
    return keel_core::Ok(std::move(stream));
}

void MemoryFileSystem::set_file(const std::string& path, std::string contents) {
    std::lock_guard lock(m_mutex);
    m_files[path] = std::move(contents);
}

bool MemoryFileSystem::remove(const std::string& path) {
    std::lock_guard lock(m_mutex);
    return m_files.erase(path) > 0;
}

std::optional<std::string> MemoryFileSystem::file(const std::string& path) const {
    std::lock_guard lock(m_mutex);
    auto it = m_files.find(path);
    if (it == m_files.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> MemoryFileSystem::paths() const {
    std::lock_guard lock(m_mutex);
    std::vector<std::string> result;
    result.reserve(m_files.size());
    for (const auto& [path, contents] : m_files) {
        result.push_back(path);
    }
    return result;
}

void MemoryFileSystem::set_faults(MemoryFaults faults) {
    std::lock_guard lock(m_mutex);
    m_faults = std::move(faults);
}

void MemoryFileSystem::clear_faults() {
    std::lock_guard lock(m_mutex);
    m_faults = MemoryFaults{};
}

std::size_t MemoryFileSystem::open_handle_count() const {
    std::lock_guard lock(m_mutex);
    return m_open_handles;
}

std::size_t MemoryFileSystem::open_writers(const std::string& path) const {
    std::lock_guard lock(m_mutex);
    auto it = m_writers.find(path);
    return it != m_writers.end() ? it->second : 0;
}

std::size_t MemoryFileSystem::open_read_count() const {
    std::lock_guard lock(m_mutex);
    return m_open_reads;
}

std::size_t MemoryFileSystem::open_write_count() const {
    std::lock_guard lock(m_mutex);
    return m_open_writes;
}

void MemoryFileSystem::release_handle(const std::string& path, bool writer) {
    std::lock_guard lock(m_mutex);
    if (m_open_handles > 0) {
        --m_open_handles;
    }
    if (writer) {
        auto it = m_writers.find(path);
        if (it != m_writers.end() && it->second > 0) {
            --it->second;
        }
    }
}

void MemoryFileSystem::commit(const std::string& path, const std::string& contents) {
    std::lock_guard lock(m_mutex);
    m_files[path] = contents;
}

} // namespace keel_io
