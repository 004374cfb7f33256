#pragma once

/// @file document_store.hpp
/// @brief Typed JSON document persisted on a file system

#include "document_codec.hpp"
#include <keel/async/completion.hpp>
#include <keel/async/io_task.hpp>
#include <keel/async/operation.hpp>
#include <keel/core/error.hpp>
#include <keel/core/log.hpp>
#include <keel/io/file_system.hpp>
#include <keel/io/local_file_system.hpp>

#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace keel_document {

using CompletionCallback = keel_async::CompletionCallback;
using DocumentErrorCallback = std::function<void(const std::string&)>;

template<typename T> class DocumentStore;

namespace detail {

template<typename T> class LoadStrictOperation;
template<typename T> class LoadOrInitOperation;
template<typename T> class SaveOperation;

using DocumentCompletion = keel_async::Completion<const std::string&>;

/// Record and log a failure, then fire the error callback
inline keel_async::OperationState report_failure(
    DocumentCompletion& completion, keel_core::Error error, const std::string& operation)
{
    error.with_context("operation", operation);
    keel_core::debug::record_error(error);
    keel_core::document_logger()->warn("{} failed: {}", operation, error.message());
    return completion.fail(error.message());
}

} // namespace detail

// =============================================================================
// DocumentStore<T>
// =============================================================================

/// Value of type T persisted as {"content": value} at a fixed location.
///
/// The value is default-constructed until loaded or set. Operations keep a
/// reference to the store, so the store must outlive them. Running a load
/// and a save of the same store at once is a caller error.
template<typename T>
class DocumentStore {
public:
    using value_type = T;

    explicit DocumentStore(std::string location,
                           std::shared_ptr<keel_io::IFileSystem> file_system = keel_io::default_file_system())
        : m_location(std::move(location))
        , m_file_system(std::move(file_system)) {}

    DocumentStore(const DocumentStore&) = delete;
    DocumentStore& operator=(const DocumentStore&) = delete;

    [[nodiscard]] const std::string& location() const noexcept { return m_location; }
    [[nodiscard]] const T& value() const noexcept { return m_value; }
    [[nodiscard]] T& value() noexcept { return m_value; }
    [[nodiscard]] const std::shared_ptr<keel_io::IFileSystem>& file_system() const noexcept { return m_file_system; }

    /// Replace the in-memory value (not persisted until save)
    void set_value(T value) { m_value = std::move(value); }

    /// Load the document. A missing file is an error and leaves the value as it is;
    /// other failures reset the value to T{}.
    [[nodiscard]] std::unique_ptr<keel_async::Operation> load_strict(
        CompletionCallback on_complete, DocumentErrorCallback on_error = nullptr)
    {
        return std::make_unique<detail::LoadStrictOperation<T>>(*this, std::move(on_complete), std::move(on_error));
    }

    /// Load the document, first saving T{} if the file is missing
    [[nodiscard]] std::unique_ptr<keel_async::Operation> load_or_init(
        CompletionCallback on_complete, DocumentErrorCallback on_error = nullptr)
    {
        return std::make_unique<detail::LoadOrInitOperation<T>>(*this, std::move(on_complete), std::move(on_error));
    }

    /// Write the current value, replacing the file
    [[nodiscard]] std::unique_ptr<keel_async::Operation> save(
        CompletionCallback on_complete = nullptr, DocumentErrorCallback on_error = nullptr)
    {
        return std::make_unique<detail::SaveOperation<T>>(*this, std::move(on_complete), std::move(on_error));
    }

private:
    template<typename U> friend class detail::LoadStrictOperation;
    template<typename U> friend class detail::LoadOrInitOperation;

    void assign_value(T value) { m_value = std::move(value); }
    void reset_value() { m_value = T{}; }

    std::string m_location;
    std::shared_ptr<keel_io::IFileSystem> m_file_system;
    T m_value{};
};

namespace detail {

// =============================================================================
// SaveOperation
// =============================================================================

template<typename T>
class SaveOperation : public keel_async::Operation {
public:
    SaveOperation(DocumentStore<T>& store, CompletionCallback on_complete, DocumentErrorCallback on_error)
        : Operation("save " + store.location())
        , m_store(store)
        , m_completion(std::move(on_complete), std::move(on_error), name()) {}

protected:
    keel_async::OperationState step() override {
        switch (m_phase) {
            case Phase::Start:
                return start();
            case Phase::Writing:
                return await_write();
            case Phase::Flushing:
                return await_flush();
        }
        return keel_async::OperationState::Failed;
    }

private:
    enum class Phase { Start, Writing, Flushing };

    keel_async::OperationState start() {
        const std::string& location = m_store.location();

        auto text = DocumentCodec<T>::serialize(m_store.value(), location);
        if (!text) {
            return fail(text.error());
        }

        auto writer = m_store.file_system()->open_write(location);
        if (!writer) {
            return fail(writer.error());
        }
        m_writer = std::move(writer).value();

        keel_core::document_logger()->debug("Writing {}", location);
        m_write = m_writer->write_async(std::move(text).value());
        m_phase = Phase::Writing;
        return await_write();
    }

    keel_async::OperationState await_write() {
        if (!m_write.is_completed()) {
            return keel_async::OperationState::Awaiting;
        }

        switch (m_write.status()) {
            case keel_async::TaskStatus::Succeeded:
                break;
            case keel_async::TaskStatus::Faulted:
                close_writer();
                return fail(keel_core::ResourceError::io_fault(m_store.location(), m_write.fault_message()));
            default:
                close_writer();
                return fail(keel_core::ResourceError::write_indeterminate(m_store.location()));
        }

        m_flush = m_writer->flush_async();
        m_phase = Phase::Flushing;
        return await_flush();
    }

    keel_async::OperationState await_flush() {
        if (!m_flush.is_completed()) {
            return keel_async::OperationState::Awaiting;
        }

        close_writer();

        switch (m_flush.status()) {
            case keel_async::TaskStatus::Succeeded:
                break;
            case keel_async::TaskStatus::Faulted:
                return fail(keel_core::ResourceError::io_fault(m_store.location(), m_flush.fault_message()));
            default:
                return fail(keel_core::ResourceError::flush_indeterminate(m_store.location()));
        }

        keel_core::document_logger()->debug("Saved {}", m_store.location());
        return m_completion.succeed();
    }

    void close_writer() {
        if (m_writer) {
            m_writer->close();
            m_writer.reset();
        }
    }

    keel_async::OperationState fail(keel_core::Error error) {
        return report_failure(m_completion, std::move(error), name());
    }

    DocumentStore<T>& m_store;
    DocumentCompletion m_completion;
    Phase m_phase = Phase::Start;
    std::unique_ptr<keel_io::IWriteStream> m_writer;
    keel_async::IoTask<void> m_write;
    keel_async::IoTask<void> m_flush;
};

// =============================================================================
// LoadStrictOperation
// =============================================================================

template<typename T>
class LoadStrictOperation : public keel_async::Operation {
public:
    LoadStrictOperation(DocumentStore<T>& store, CompletionCallback on_complete, DocumentErrorCallback on_error)
        : Operation("load " + store.location())
        , m_store(store)
        , m_completion(std::move(on_complete), std::move(on_error), name()) {}

protected:
    keel_async::OperationState step() override {
        if (!m_reader) {
            return start();
        }
        return await_read();
    }

private:
    keel_async::OperationState start() {
        const std::string& location = m_store.location();

        // The only failure that keeps the previous value
        if (!m_store.file_system()->exists(location)) {
            return fail(keel_core::ResourceError::file_absent(location), false);
        }

        auto reader = m_store.file_system()->open_read(location);
        if (!reader) {
            return fail(reader.error(), true);
        }
        m_reader = std::move(reader).value();

        keel_core::document_logger()->debug("Reading {}", location);
        m_read = m_reader->read_to_end_async();
        return await_read();
    }

    keel_async::OperationState await_read() {
        if (!m_read.is_completed()) {
            return keel_async::OperationState::Awaiting;
        }

        const std::string& location = m_store.location();

        switch (m_read.status()) {
            case keel_async::TaskStatus::Succeeded:
                break;
            case keel_async::TaskStatus::Faulted:
                m_reader->close();
                return fail(keel_core::ResourceError::io_fault(location, m_read.fault_message()), true);
            default:
                m_reader->close();
                return fail(keel_core::ResourceError::read_indeterminate(location), true);
        }

        std::string text = m_read.take();
        m_reader->close();

        auto decoded = DocumentCodec<T>::deserialize(text, location);
        if (!decoded) {
            return fail(decoded.error(), true);
        }

        m_store.assign_value(std::move(decoded).value());
        keel_core::document_logger()->debug("Loaded {}", location);
        return m_completion.succeed();
    }

    keel_async::OperationState fail(keel_core::Error error, bool reset) {
        if (reset) {
            m_store.reset_value();
        }
        return report_failure(m_completion, std::move(error), name());
    }

    DocumentStore<T>& m_store;
    DocumentCompletion m_completion;
    std::unique_ptr<keel_io::IReadStream> m_reader;
    keel_async::IoTask<std::string> m_read;
};

// =============================================================================
// LoadOrInitOperation
// =============================================================================

/// Saves T{} when the file is missing, then loads it back.
/// Both steps report through this operation's single completion.
template<typename T>
class LoadOrInitOperation : public keel_async::Operation {
public:
    LoadOrInitOperation(DocumentStore<T>& store, CompletionCallback on_complete, DocumentErrorCallback on_error)
        : Operation("load or init " + store.location())
        , m_store(store)
        , m_completion(std::move(on_complete), std::move(on_error), name()) {}

protected:
    keel_async::OperationState step() override {
        switch (m_phase) {
            case Phase::Start:
                return start();
            case Phase::Initializing:
                return await_init();
            case Phase::Loading:
                return await_load();
        }
        return keel_async::OperationState::Failed;
    }

private:
    enum class Phase { Start, Initializing, Loading };

    keel_async::OperationState start() {
        if (m_store.file_system()->exists(m_store.location())) {
            return begin_load();
        }

        keel_core::document_logger()->info("Creating {} with a default value", m_store.location());
        m_store.reset_value();
        m_child = m_store.save(nullptr, [this](const std::string& message) { m_child_error = message; });
        m_phase = Phase::Initializing;
        return await_init();
    }

    keel_async::OperationState await_init() {
        auto state = m_child->resume();
        if (!keel_async::is_finished(state)) {
            return keel_async::OperationState::Awaiting;
        }
        if (state == keel_async::OperationState::Failed) {
            m_child.reset();
            return m_completion.fail(m_child_error);
        }
        return begin_load();
    }

    keel_async::OperationState begin_load() {
        m_child = m_store.load_strict(nullptr, [this](const std::string& message) { m_child_error = message; });
        m_phase = Phase::Loading;
        return await_load();
    }

    keel_async::OperationState await_load() {
        auto state = m_child->resume();
        if (!keel_async::is_finished(state)) {
            return keel_async::OperationState::Awaiting;
        }
        m_child.reset();
        if (state == keel_async::OperationState::Failed) {
            return m_completion.fail(m_child_error);
        }
        return m_completion.succeed();
    }

    DocumentStore<T>& m_store;
    DocumentCompletion m_completion;
    Phase m_phase = Phase::Start;
    std::unique_ptr<keel_async::Operation> m_child;
    std::string m_child_error;
};

} // namespace detail

} // namespace keel_document
