/// @file test_io_task.cpp
/// @brief Tests for keel_async IoTask and IoWorkerPool

#include <catch2/catch_test_macros.hpp>
#include <keel/async/io_task.hpp>
#include <keel/async/task_pool.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>

using namespace keel_async;

// =============================================================================
// IoTask Tests
// =============================================================================

TEST_CASE("IoTask: ready-made states", "[async][task]") {
    SECTION("completed") {
        auto task = IoTask<std::string>::completed("text");
        REQUIRE(task.is_completed());
        REQUIRE(task.status() == TaskStatus::Succeeded);
        REQUIRE(task.result() == "text");
    }

    SECTION("completed void") {
        auto task = IoTask<void>::completed();
        REQUIRE(task.is_completed_successfully());
    }

    SECTION("faulted keeps the message") {
        auto task = IoTask<int>::faulted("disk on fire");
        REQUIRE(task.status() == TaskStatus::Faulted);
        REQUIRE(task.fault_message() == "disk on fire");
    }

    SECTION("cancelled") {
        auto task = IoTask<int>::cancelled();
        REQUIRE(task.is_completed());
        REQUIRE(task.status() == TaskStatus::Cancelled);
        REQUIRE(task.fault_message().empty());
    }

    SECTION("default task is unbound") {
        IoTask<int> task;
        REQUIRE_FALSE(task.valid());
        REQUIRE_FALSE(task.is_completed());
    }
}

TEST_CASE("IoTask: polls a pending producer", "[async][task]") {
    std::promise<int> promise;
    IoTask<int> task(promise.get_future());

    REQUIRE(task.valid());
    REQUIRE_FALSE(task.is_completed());
    REQUIRE(task.status() == TaskStatus::Pending);

    promise.set_value(7);
    REQUIRE(task.is_completed());
    REQUIRE(task.take() == 7);
}

TEST_CASE("IoTask: broken promise reads as cancelled", "[async][task]") {
    std::future<std::string> future;
    {
        std::promise<std::string> promise;
        future = promise.get_future();
    }
    IoTask<std::string> task(std::move(future));
    REQUIRE(task.status() == TaskStatus::Cancelled);
}

TEST_CASE("IoTask: non-standard exceptions read as faults", "[async][task]") {
    std::promise<int> promise;
    IoTask<int> task(promise.get_future());

    promise.set_exception(std::make_exception_ptr(42));
    REQUIRE_NOTHROW(task.is_completed());
    REQUIRE(task.status() == TaskStatus::Faulted);
    REQUIRE(task.fault_message() == "unknown exception");
}

TEST_CASE("Task status names", "[async][task]") {
    REQUIRE(std::string(task_status_name(TaskStatus::Pending)) == "Pending");
    REQUIRE(std::string(task_status_name(TaskStatus::Faulted)) == "Faulted");
}

// =============================================================================
// IoWorkerPool Tests
// =============================================================================

namespace {

template<typename T>
TaskStatus wait_for_task(IoTask<T>& task) {
    while (!task.is_completed()) {
        std::this_thread::yield();
    }
    return task.status();
}

} // anonymous namespace

TEST_CASE("IoWorkerPool: runs jobs", "[async][pool]") {
    IoWorkerPool pool(2);
    REQUIRE(pool.thread_count() == 2);

    auto task = pool.submit_task([] { return 6 * 7; });
    REQUIRE(wait_for_task(task) == TaskStatus::Succeeded);
    REQUIRE(task.result() == 42);

    std::atomic<int> counter{0};
    for (int i = 0; i < 16; ++i) {
        pool.submit([&counter] { ++counter; });
    }
    pool.wait_all();
    REQUIRE(counter == 16);
    REQUIRE(pool.pending_count() == 0);
}

TEST_CASE("IoWorkerPool: exceptions become faults", "[async][pool]") {
    IoWorkerPool pool(1);

    auto task = pool.submit_task([]() -> std::string {
        throw std::runtime_error("read failed");
    });
    REQUIRE(wait_for_task(task) == TaskStatus::Faulted);
    REQUIRE(task.fault_message() == "read failed");

    auto odd = pool.submit_task([]() -> int {
        throw 7;
    });
    REQUIRE(wait_for_task(odd) == TaskStatus::Faulted);
    REQUIRE(odd.fault_message() == "unknown exception");
}

TEST_CASE("IoWorkerPool: shutdown without drain cancels queued work", "[async][pool]") {
    IoWorkerPool pool(1);

    std::promise<void> started;
    std::promise<void> gate;
    auto gate_future = gate.get_future().share();
    auto blocker = pool.submit_task([&started, gate_future] {
        started.set_value();
        gate_future.wait();
    });
    auto queued = pool.submit_task([] { return 1; });
    started.get_future().wait();

    std::thread releaser([&gate] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        gate.set_value();
    });
    pool.shutdown(false);
    releaser.join();

    REQUIRE(wait_for_task(blocker) == TaskStatus::Succeeded);
    REQUIRE(wait_for_task(queued) == TaskStatus::Cancelled);

    auto late = pool.submit_task([] { return 2; });
    REQUIRE(wait_for_task(late) == TaskStatus::Cancelled);
}

TEST_CASE("IoConfig: from_json", "[async][pool]") {
    auto config = IoConfig::from_json({{"worker_threads", 4}});
    REQUIRE(config.is_ok());
    REQUIRE(config.value().worker_threads == 4);

    REQUIRE(IoConfig::from_json({{"worker_threads", 0}}).is_err());
    REQUIRE(IoConfig::from_json({{"worker_threads", "many"}}).is_err());
    REQUIRE(IoConfig::from_json(nlohmann::json::object()).value().worker_threads == 2);
}
