/**
 * @file test_concurrency.cpp
 * @brief Concurrency tests for the task orchestrator
 *
 * This file contains tests for:
 * - Concurrent enqueue under admission ceilings
 * - Racing cancel against executor completion
 * - Concurrent enqueue of the same task id
 * - Concurrent pause and cancel of parallel downloads
 */

#include "test_fixtures.h"

#include <atomic>
#include <chrono>
#include <latch>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace kcenon::background_transfer::test {

// =============================================================================
// Concurrency Test Fixtures
// =============================================================================

/**
 * @brief Orchestrator fixture with a thread that completes live transfers
 */
class ConcurrentOrchestratorTest : public OrchestratorFixture {
protected:
    void TearDown() override {
        stop_completer();
        OrchestratorFixture::TearDown();
    }

    void start_completer() {
        running_ = true;
        completer_ = std::thread([this] {
            while (running_) {
                for (auto handle : executor_->live_handles()) {
                    executor_->emit_status(handle, task_status::running);
                    executor_->emit_status(handle, task_status::complete);
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
        });
    }

    void stop_completer() {
        running_ = false;
        if (completer_.joinable()) {
            completer_.join();
        }
    }

    /**
     * @brief Number of terminal statuses the host saw for a task
     */
    auto terminal_count(const std::string& id) const -> int {
        int count = 0;
        for (auto status : listener_->statuses_for(id)) {
            if (is_terminal_status(status)) ++count;
        }
        return count;
    }

    std::atomic<bool> running_{false};
    std::thread completer_;
};

// =============================================================================
// Admission
// =============================================================================

TEST_F(ConcurrentOrchestratorTest, ConcurrentEnqueue_NeverExceedsGlobalCeiling) {
    constexpr int num_threads = 8;
    constexpr int tasks_per_thread = 25;
    constexpr int ceiling = 3;

    ASSERT_TRUE(orchestrator_->configure_holding_queue(ceiling, 0, 0).has_value());
    start_completer();

    std::latch ready(num_threads);
    std::vector<std::thread> threads;
    std::atomic<int> accepted{0};
    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([&, i] {
            ready.arrive_and_wait();
            for (int j = 0; j < tasks_per_thread; ++j) {
                auto id = "t" + std::to_string(i) + "_" + std::to_string(j);
                if (orchestrator_->enqueue(make_download(id))) ++accepted;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(accepted.load(), num_threads * tasks_per_thread);
    ASSERT_TRUE(wait_until(
        [&] {
            for (int i = 0; i < num_threads; ++i) {
                for (int j = 0; j < tasks_per_thread; ++j) {
                    if (terminal_count("t" + std::to_string(i) + "_" + std::to_string(j)) == 0) {
                        return false;
                    }
                }
            }
            return true;
        },
        std::chrono::milliseconds(10000)));
    stop_completer();

    EXPECT_LE(executor_->max_live(), static_cast<std::size_t>(ceiling));
    EXPECT_EQ(executor_->submission_count(),
              static_cast<std::size_t>(num_threads * tasks_per_thread));
    for (int i = 0; i < num_threads; ++i) {
        for (int j = 0; j < tasks_per_thread; ++j) {
            auto id = "t" + std::to_string(i) + "_" + std::to_string(j);
            EXPECT_EQ(terminal_count(id), 1) << id;
        }
    }
}

TEST_F(ConcurrentOrchestratorTest, PerHostCeiling_DoesNotStarveOtherHosts) {
    ASSERT_TRUE(orchestrator_->configure_holding_queue(2, 1, 0).has_value());

    ASSERT_TRUE(orchestrator_->enqueue(make_download("a1", "https://a.example.com/1")));
    ASSERT_TRUE(orchestrator_->enqueue(make_download("a2", "https://a.example.com/2")));
    ASSERT_TRUE(orchestrator_->enqueue(make_download("a3", "https://a.example.com/3")));
    ASSERT_TRUE(orchestrator_->enqueue(make_download("b1", "https://b.example.com/1")));

    EXPECT_EQ(executor_->submissions_for("a1").size(), 1u);
    EXPECT_EQ(executor_->submissions_for("b1").size(), 1u);
    EXPECT_TRUE(executor_->submissions_for("a2").empty());
    EXPECT_EQ(executor_->max_live(), 2u);
}

// =============================================================================
// Races
// =============================================================================

TEST_F(ConcurrentOrchestratorTest, CancelRacingCompletion_OneTerminalStatus) {
    constexpr int num_tasks = 100;
    for (int i = 0; i < num_tasks; ++i) {
        ASSERT_TRUE(orchestrator_->enqueue(make_download("r" + std::to_string(i))));
    }

    std::latch go(2);
    std::thread canceler([&] {
        go.arrive_and_wait();
        for (int i = 0; i < num_tasks; ++i) {
            orchestrator_->cancel_tasks_with_ids({"r" + std::to_string(i)});
        }
    });
    std::thread completer([&] {
        go.arrive_and_wait();
        for (int i = num_tasks - 1; i >= 0; --i) {
            auto handle = executor_->handle_for("r" + std::to_string(i));
            if (handle) executor_->emit_status(*handle, task_status::complete);
        }
    });
    canceler.join();
    completer.join();

    for (int i = 0; i < num_tasks; ++i) {
        auto id = "r" + std::to_string(i);
        EXPECT_TRUE(wait_until([&] { return terminal_count(id) >= 1; })) << id;
        EXPECT_EQ(terminal_count(id), 1) << id;
    }
    EXPECT_TRUE(orchestrator_->all_tasks().empty());
}

TEST_F(ConcurrentOrchestratorTest, SameIdFromManyThreads_AcceptedOnce) {
    constexpr int num_threads = 16;
    std::latch ready(num_threads);
    std::atomic<int> accepted{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([&] {
            ready.arrive_and_wait();
            if (orchestrator_->enqueue(make_download("shared"))) ++accepted;
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(accepted.load(), 1);
    EXPECT_EQ(executor_->submissions_for("shared").size(), 1u);
}

TEST_F(ConcurrentOrchestratorTest, ParallelDownloads_CompleteUnderLoad) {
    constexpr int num_parents = 10;
    executor_->set_probe_result(content_metadata{1000, true});
    ASSERT_TRUE(orchestrator_->configure_holding_queue(4, 0, 0).has_value());
    start_completer();

    std::vector<task> parents;
    for (int i = 0; i < num_parents; ++i) {
        parents.push_back(make_parallel("p" + std::to_string(i), 3));
    }
    auto results = orchestrator_->enqueue_all(parents).get();
    ASSERT_EQ(results.size(), static_cast<std::size_t>(num_parents));

    for (int i = 0; i < num_parents; ++i) {
        auto id = "p" + std::to_string(i);
        EXPECT_TRUE(results[i]);
        EXPECT_TRUE(wait_for_status(id, task_status::complete, std::chrono::milliseconds(10000)))
            << id;
        EXPECT_EQ(terminal_count(id), 1) << id;
    }
    EXPECT_LE(executor_->max_live(), 4u);
}

TEST_F(ConcurrentOrchestratorTest, PauseAndCancelParallel_OneOutcome) {
    constexpr int num_parents = 8;
    executor_->set_probe_result(content_metadata{800, true});
    executor_->set_resume_token(std::nullopt);

    for (int i = 0; i < num_parents; ++i) {
        ASSERT_TRUE(orchestrator_->enqueue(make_parallel("p" + std::to_string(i), 2)));
    }
    for (int i = 0; i < num_parents; ++i) {
        ASSERT_TRUE(wait_for_submission("p" + std::to_string(i) + ".chunk1"));
    }

    std::latch go(2);
    std::thread pauser([&] {
        go.arrive_and_wait();
        for (int i = 0; i < num_parents; ++i) {
            orchestrator_->pause("p" + std::to_string(i));
        }
    });
    std::thread canceler([&] {
        go.arrive_and_wait();
        for (int i = num_parents - 1; i >= 0; --i) {
            orchestrator_->cancel_tasks_with_ids({"p" + std::to_string(i)});
        }
    });
    pauser.join();
    canceler.join();

    for (int i = 0; i < num_parents; ++i) {
        auto id = "p" + std::to_string(i);
        EXPECT_TRUE(wait_until([&] {
            return listener_->has_status(id, task_status::paused) ||
                   listener_->has_status(id, task_status::canceled);
        })) << id;
    }
    EXPECT_TRUE(wait_until([&] { return executor_->live_handles().empty(); }));
}

}  // namespace kcenon::background_transfer::test
