/// @file test_scheduler.cpp
/// @brief Tests for keel_async operations, completions and the scheduler

#include <catch2/catch_test_macros.hpp>
#include <keel/async/completion.hpp>
#include <keel/async/operation.hpp>
#include <keel/async/scheduler.hpp>

#include <memory>
#include <stdexcept>
#include <string>

using namespace keel_async;

namespace {

/// Finishes after a fixed number of resumes
class CountdownOperation : public Operation {
public:
    CountdownOperation(int steps, bool succeed, CompletionCallback on_complete,
                       std::function<void(const std::string&)> on_error)
        : Operation("countdown")
        , m_remaining(steps)
        , m_succeed(succeed)
        , m_completion(std::move(on_complete), std::move(on_error), name()) {}

    int resumes = 0;

protected:
    OperationState step() override {
        ++resumes;
        if (m_remaining-- > 0) {
            return OperationState::Awaiting;
        }
        if (m_succeed) {
            return m_completion.succeed();
        }
        return m_completion.fail("countdown failed");
    }

private:
    int m_remaining;
    bool m_succeed;
    Completion<const std::string&> m_completion;
};

} // anonymous namespace

// =============================================================================
// Completion Tests
// =============================================================================

TEST_CASE("Completion: fires at most once", "[async][completion]") {
    int completes = 0;
    int errors = 0;
    Completion<const std::string&> completion(
        [&] { ++completes; },
        [&](const std::string&) { ++errors; },
        "test");

    REQUIRE_FALSE(completion.is_resolved());
    REQUIRE(completion.succeed() == OperationState::Completed);
    REQUIRE(completion.is_resolved());

    completion.succeed();
    completion.fail("late");
    REQUIRE(completes == 1);
    REQUIRE(errors == 0);
}

TEST_CASE("Completion: missing error handler", "[async][completion]") {
    int completes = 0;
    Completion<const std::string&> completion([&] { ++completes; }, nullptr, "test");

    REQUIRE_FALSE(completion.has_error_handler());
    REQUIRE(completion.fail("nobody listens") == OperationState::Failed);
    REQUIRE(completion.is_resolved());
    REQUIRE(completes == 0);
}

TEST_CASE("Completion: throwing callback still resolves", "[async][completion]") {
    Completion<const std::string&> completion(
        [] { throw std::runtime_error("callback"); }, nullptr, "test");

    REQUIRE_THROWS_AS(completion.succeed(), std::runtime_error);
    REQUIRE(completion.is_resolved());
}

// =============================================================================
// Operation Tests
// =============================================================================

TEST_CASE("Operation: finished operations ignore resume", "[async][operation]") {
    int completes = 0;
    CountdownOperation op(0, true, [&] { ++completes; }, nullptr);

    REQUIRE(op.state() == OperationState::Idle);
    REQUIRE(op.resume() == OperationState::Completed);
    REQUIRE(op.resume() == OperationState::Completed);
    REQUIRE(op.resumes == 1);
    REQUIRE(completes == 1);
    REQUIRE(op.is_finished());
}

// =============================================================================
// CooperativeScheduler Tests
// =============================================================================

TEST_CASE("CooperativeScheduler: synchronous completion", "[async][scheduler]") {
    CooperativeScheduler scheduler;
    int completes = 0;

    auto id = scheduler.spawn(std::make_unique<CountdownOperation>(0, true, [&] { ++completes; }, nullptr));
    REQUIRE(id == 0);
    REQUIRE(completes == 1);
    REQUIRE(scheduler.is_idle());
}

TEST_CASE("CooperativeScheduler: resumes until finished", "[async][scheduler]") {
    CooperativeScheduler scheduler;
    int completes = 0;
    std::string error;

    auto ok = scheduler.spawn(std::make_unique<CountdownOperation>(2, true, [&] { ++completes; }, nullptr));
    auto bad = scheduler.spawn(std::make_unique<CountdownOperation>(1, false, nullptr,
        [&](const std::string& message) { error = message; }));

    REQUIRE(ok != 0);
    REQUIRE(bad != 0);
    REQUIRE(scheduler.active_count() == 2);

    REQUIRE(scheduler.tick() == 1);
    REQUIRE(error == "countdown failed");
    REQUIRE_FALSE(scheduler.is_active(bad));
    REQUIRE(scheduler.is_active(ok));

    REQUIRE(scheduler.tick() == 0);
    REQUIRE(completes == 1);
    REQUIRE(scheduler.tick_count() == 2);
}

TEST_CASE("CooperativeScheduler: run_until_idle", "[async][scheduler]") {
    CooperativeScheduler scheduler;
    int completes = 0;

    for (int i = 0; i < 5; ++i) {
        scheduler.spawn(std::make_unique<CountdownOperation>(i, true, [&] { ++completes; }, nullptr));
    }

    REQUIRE(scheduler.run_until_idle());
    REQUIRE(completes == 5);
}

TEST_CASE("CooperativeScheduler: callback may spawn", "[async][scheduler]") {
    CooperativeScheduler scheduler;
    int completes = 0;

    scheduler.spawn(std::make_unique<CountdownOperation>(1, true, [&] {
        ++completes;
        scheduler.spawn(std::make_unique<CountdownOperation>(1, true, [&] { ++completes; }, nullptr));
    }, nullptr));

    REQUIRE(scheduler.run_until_idle());
    REQUIRE(completes == 2);
}

TEST_CASE("CooperativeScheduler: callback exception propagates", "[async][scheduler]") {
    CooperativeScheduler scheduler;

    scheduler.spawn(std::make_unique<CountdownOperation>(1, true,
        [] { throw std::runtime_error("from callback"); }, nullptr));

    REQUIRE_THROWS_AS(scheduler.tick(), std::runtime_error);
    REQUIRE(scheduler.is_idle());
}

TEST_CASE("CooperativeScheduler: abandon_all drops live operations", "[async][scheduler]") {
    CooperativeScheduler scheduler;
    int completes = 0;

    scheduler.spawn(std::make_unique<CountdownOperation>(10, true, [&] { ++completes; }, nullptr));
    scheduler.spawn(std::make_unique<CountdownOperation>(10, true, [&] { ++completes; }, nullptr));

    REQUIRE(scheduler.abandon_all() == 2);
    REQUIRE(scheduler.tick() == 0);
    REQUIRE(completes == 0);
}
