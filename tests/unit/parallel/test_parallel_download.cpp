/**
 * @file test_parallel_download.cpp
 * @brief Unit tests for the parallel download coordinator
 *
 * This file contains tests for:
 * - Splitting a parent into ranged chunk tasks after a probe
 * - Folding chunk statuses into one parent status
 * - Parent progress reporting
 * - Pause into a composite resume token and resume from it
 * - Cancellation and orphan chunk events
 */

#include <gtest/gtest.h>

#include <kcenon/background_transfer/parallel/parallel_download.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace kcenon::background_transfer::test {

namespace {

template <typename Pred>
auto wait_until(Pred pred,
                std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) -> bool {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}

/**
 * @brief Transport that records what the coordinator asks for
 */
class fake_transport : public chunk_transport {
public:
    struct enqueued_chunk {
        task chunk;
        std::optional<simple_resume_token> token;
    };

    auto enqueue_chunk(const task& chunk, const std::optional<simple_resume_token>& token)
        -> bool override {
        std::lock_guard lock(mutex_);
        enqueued_.push_back({chunk, token});
        return accept_;
    }

    void cancel_chunk(const task& chunk) override {
        parallel_download_coordinator* coordinator = nullptr;
        {
            std::lock_guard lock(mutex_);
            canceled_.push_back(chunk.task_id);
            if (report_cancel_) coordinator = coordinator_;
        }
        if (coordinator) {
            coordinator->chunk_status_update(chunk.parent_task_id, chunk.task_id,
                                             task_status::canceled);
        }
    }

    auto pause_chunk(const task& chunk) -> std::optional<simple_resume_token> override {
        std::chrono::milliseconds delay{0};
        std::optional<simple_resume_token> token;
        {
            std::lock_guard lock(mutex_);
            paused_.push_back(chunk.task_id);
            auto d = pause_delays_.find(chunk.task_id);
            if (d != pause_delays_.end()) delay = d->second;
            auto t = pause_tokens_.find(chunk.task_id);
            if (t != pause_tokens_.end()) token = t->second;
        }
        if (delay.count() > 0) std::this_thread::sleep_for(delay);
        return token;
    }

    auto probe(const task&) -> result<content_metadata> override {
        std::lock_guard lock(mutex_);
        ++probe_count_;
        return probe_result_;
    }

    void set_coordinator(parallel_download_coordinator* c) {
        std::lock_guard lock(mutex_);
        coordinator_ = c;
    }
    void set_accept(bool accept) {
        std::lock_guard lock(mutex_);
        accept_ = accept;
    }
    void set_report_cancel(bool report) {
        std::lock_guard lock(mutex_);
        report_cancel_ = report;
    }
    void set_probe_result(result<content_metadata> r) {
        std::lock_guard lock(mutex_);
        probe_result_ = std::move(r);
    }
    void set_pause_token(const std::string& chunk_id, simple_resume_token token) {
        std::lock_guard lock(mutex_);
        pause_tokens_[chunk_id] = std::move(token);
    }
    void set_pause_delay(const std::string& chunk_id, std::chrono::milliseconds delay) {
        std::lock_guard lock(mutex_);
        pause_delays_[chunk_id] = delay;
    }

    auto enqueued() const -> std::vector<enqueued_chunk> {
        std::lock_guard lock(mutex_);
        return enqueued_;
    }
    auto enqueued_count() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return enqueued_.size();
    }
    auto canceled() const -> std::vector<std::string> {
        std::lock_guard lock(mutex_);
        return canceled_;
    }
    auto paused_count() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return paused_.size();
    }
    auto probe_count() const -> int {
        std::lock_guard lock(mutex_);
        return probe_count_;
    }

private:
    mutable std::mutex mutex_;
    parallel_download_coordinator* coordinator_ = nullptr;
    bool accept_ = true;
    bool report_cancel_ = true;
    result<content_metadata> probe_result_ = content_metadata{200, true};
    std::map<std::string, simple_resume_token> pause_tokens_;
    std::map<std::string, std::chrono::milliseconds> pause_delays_;
    std::vector<enqueued_chunk> enqueued_;
    std::vector<std::string> canceled_;
    std::vector<std::string> paused_;
    int probe_count_ = 0;
};

/**
 * @brief Sink that records parent events
 */
class recording_sink : public parent_update_sink {
public:
    void on_parent_status(const status_update& update) override {
        std::lock_guard lock(mutex_);
        statuses_.push_back(update);
    }

    void on_parent_progress(const progress_update& update) override {
        std::lock_guard lock(mutex_);
        progress_.push_back(update.progress);
    }

    auto statuses() const -> std::vector<task_status> {
        std::lock_guard lock(mutex_);
        std::vector<task_status> out;
        for (const auto& s : statuses_) out.push_back(s.status);
        return out;
    }

    auto last_update() const -> std::optional<status_update> {
        std::lock_guard lock(mutex_);
        if (statuses_.empty()) return std::nullopt;
        return statuses_.back();
    }

    auto count(task_status status) const -> int {
        auto all = statuses();
        return static_cast<int>(std::count(all.begin(), all.end(), status));
    }

    auto progress() const -> std::vector<double> {
        std::lock_guard lock(mutex_);
        return progress_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<status_update> statuses_;
    std::vector<double> progress_;
};

}  // namespace

// =============================================================================
// Fixture
// =============================================================================

class ParallelDownloadTest : public ::testing::Test {
protected:
    void SetUp() override {
        pool_ = std::make_shared<adapters::standalone_transfer_pool>(2);
        create_coordinator(default_config());
    }

    void TearDown() override {
        transport_.set_coordinator(nullptr);
        coordinator_.reset();
        pool_->shutdown();
    }

    static auto default_config() -> parallel_config {
        parallel_config config;
        config.pause_timeout = std::chrono::milliseconds(300);
        config.cancel_timeout = std::chrono::milliseconds(300);
        return config;
    }

    void create_coordinator(parallel_config config) {
        transport_.set_coordinator(nullptr);
        coordinator_ = std::make_unique<parallel_download_coordinator>(transport_, sink_, pool_,
                                                                       config);
        transport_.set_coordinator(coordinator_.get());
    }

    static auto make_parent(const std::string& id = "p1", int chunks = 2) -> task {
        task t;
        t.task_id = id;
        t.kind = task_kind::parallel_download;
        t.url = "https://files.example.com/big.bin";
        t.chunk_count = chunks;
        return t;
    }

    // Starts a parent and waits until all of its chunks were handed out
    void start_and_split(const task& parent, std::size_t expected_chunks) {
        ASSERT_TRUE(coordinator_->start(parent).has_value());
        ASSERT_TRUE(wait_until([&] { return transport_.enqueued_count() >= expected_chunks; }));
    }

    void chunk_status(const std::string& chunk_id, task_status status,
                      std::optional<task_exception> ex = std::nullopt,
                      std::optional<std::string> body = std::nullopt) {
        coordinator_->chunk_status_update("p1", chunk_id, status, std::move(ex),
                                          std::move(body));
    }

    auto collect_pause(const std::string& id = "p1")
        -> std::optional<std::optional<composite_resume_token>> {
        std::mutex m;
        std::optional<std::optional<composite_resume_token>> outcome;
        if (!coordinator_->pause(id, [&](const task&, std::optional<composite_resume_token> t) {
                std::lock_guard lock(m);
                outcome = std::move(t);
            })) {
            return std::nullopt;
        }
        wait_until([&] {
            std::lock_guard lock(m);
            return outcome.has_value();
        });
        std::lock_guard lock(m);
        return outcome;
    }

    fake_transport transport_;
    recording_sink sink_;
    std::shared_ptr<adapters::standalone_transfer_pool> pool_;
    std::unique_ptr<parallel_download_coordinator> coordinator_;
};

// =============================================================================
// Start
// =============================================================================

TEST_F(ParallelDownloadTest, Start_ProbesAndSplitsIntoRangedChunks) {
    start_and_split(make_parent(), 2);

    auto chunks = transport_.enqueued();
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].chunk.task_id, "p1.chunk0");
    EXPECT_EQ(chunks[0].chunk.headers.at("Range"), "bytes=0-99");
    EXPECT_EQ(chunks[1].chunk.headers.at("Range"), "bytes=100-199");
    EXPECT_EQ(chunks[1].chunk.parent_task_id, "p1");
    EXPECT_FALSE(chunks[0].token.has_value());

    EXPECT_EQ(transport_.probe_count(), 1);
    EXPECT_EQ(sink_.statuses(), std::vector<task_status>{task_status::running});
    EXPECT_TRUE(coordinator_->is_active("p1"));
    EXPECT_EQ(coordinator_->parent_of("p1.chunk1"), std::string("p1"));
}

TEST_F(ParallelDownloadTest, Start_MirrorsShareChunks) {
    auto parent = make_parent("p1", 1);
    parent.mirror_urls = {"https://mirror.example.com/big.bin"};
    start_and_split(parent, 2);

    auto chunks = transport_.enqueued();
    EXPECT_EQ(chunks[0].chunk.url, "https://files.example.com/big.bin");
    EXPECT_EQ(chunks[1].chunk.url, "https://mirror.example.com/big.bin");
}

TEST_F(ParallelDownloadTest, Start_UnknownLengthUsesOneOpenChunk) {
    transport_.set_probe_result(content_metadata{std::nullopt, false});
    start_and_split(make_parent("p1", 4), 1);

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    auto chunks = transport_.enqueued();
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].chunk.headers.count("Range"), 0u);
}

TEST_F(ParallelDownloadTest, Start_ProbeFailureFailsParent) {
    transport_.set_probe_result(unexpected(error{error_code::probe_failed, "HEAD timed out"}));
    ASSERT_TRUE(coordinator_->start(make_parent()).has_value());

    ASSERT_TRUE(wait_until([&] { return sink_.count(task_status::failed) == 1; }));
    auto last = sink_.last_update();
    ASSERT_TRUE(last->exception.has_value());
    EXPECT_EQ(last->exception->type, exception_type::connection);
    EXPECT_EQ(transport_.enqueued_count(), 0u);
    EXPECT_FALSE(coordinator_->is_active("p1"));
}

TEST_F(ParallelDownloadTest, Start_RejectsInvalidRequests) {
    auto plain = make_parent();
    plain.kind = task_kind::download;
    EXPECT_EQ(coordinator_->start(plain).error().code, error_code::invalid_request);

    EXPECT_EQ(coordinator_->start(make_parent(), composite_resume_token{}).error().code,
              error_code::resume_state_invalid);

    start_and_split(make_parent(), 2);
    EXPECT_EQ(coordinator_->start(make_parent()).error().code, error_code::duplicate_task);
}

TEST_F(ParallelDownloadTest, Start_RefusedChunkFailsParent) {
    transport_.set_accept(false);
    ASSERT_TRUE(coordinator_->start(make_parent()).has_value());

    ASSERT_TRUE(wait_until([&] { return sink_.count(task_status::failed) == 1; }));
    EXPECT_FALSE(coordinator_->is_active("p1"));
}

// =============================================================================
// Aggregation
// =============================================================================

TEST_F(ParallelDownloadTest, Aggregation_CompleteOnlyWhenAllChunksComplete) {
    start_and_split(make_parent("p1", 3), 3);

    chunk_status("p1.chunk0", task_status::running);
    chunk_status("p1.chunk0", task_status::complete);
    chunk_status("p1.chunk1", task_status::running);
    ASSERT_TRUE(wait_until([&] {
        auto c = coordinator_->chunks("p1");
        return c.size() == 3 && c[1].status == task_status::running;
    }));
    EXPECT_EQ(sink_.statuses(), std::vector<task_status>{task_status::running});

    chunk_status("p1.chunk1", task_status::complete);
    chunk_status("p1.chunk2", task_status::complete);
    ASSERT_TRUE(wait_until([&] { return sink_.count(task_status::complete) == 1; }));

    // Late events for the finished parent are dropped
    chunk_status("p1.chunk2", task_status::complete);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_EQ(sink_.count(task_status::complete), 1);
    EXPECT_FALSE(coordinator_->is_active("p1"));
}

TEST_F(ParallelDownloadTest, Aggregation_CompleteConcatenatesBodies) {
    start_and_split(make_parent(), 2);

    chunk_status("p1.chunk1", task_status::complete, std::nullopt, std::string("cd"));
    chunk_status("p1.chunk0", task_status::complete, std::nullopt, std::string("ab"));

    ASSERT_TRUE(wait_until([&] { return sink_.count(task_status::complete) == 1; }));
    EXPECT_EQ(sink_.last_update()->response_body, std::string("abcd"));
}

TEST_F(ParallelDownloadTest, Aggregation_ChunkFailureFailsParentAndCancelsRest) {
    start_and_split(make_parent("p1", 3), 3);

    chunk_status("p1.chunk0", task_status::complete);
    chunk_status("p1.chunk1", task_status::failed,
                 task_exception{exception_type::http_response, "Gone", 410});

    ASSERT_TRUE(wait_until([&] { return sink_.count(task_status::failed) == 1; }));
    auto last = sink_.last_update();
    ASSERT_TRUE(last->exception.has_value());
    EXPECT_EQ(last->exception->http_response_code, 410);

    ASSERT_TRUE(wait_until([&] { return !transport_.canceled().empty(); }));
    EXPECT_EQ(transport_.canceled(), std::vector<std::string>{"p1.chunk2"});
    EXPECT_EQ(sink_.count(task_status::canceled), 0);
}

TEST_F(ParallelDownloadTest, Aggregation_RetryingChunkKeepsParentRunning) {
    start_and_split(make_parent(), 2);

    chunk_status("p1.chunk0", task_status::running);
    chunk_status("p1.chunk0", task_status::waiting_to_retry);
    chunk_status("p1.chunk0", task_status::enqueued);
    chunk_status("p1.chunk0", task_status::running);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    EXPECT_EQ(sink_.statuses(), std::vector<task_status>{task_status::running});
    EXPECT_TRUE(coordinator_->is_active("p1"));
}

// =============================================================================
// Progress
// =============================================================================

TEST_F(ParallelDownloadTest, Progress_ByteWeightedAndMonotonic) {
    start_and_split(make_parent(), 2);

    coordinator_->chunk_progress_update("p1", "p1.chunk0", 0.5);
    coordinator_->chunk_progress_update("p1", "p1.chunk1", 0.1);
    coordinator_->chunk_progress_update("p1", "p1.chunk0", 0.4);
    chunk_status("p1.chunk0", task_status::complete);

    ASSERT_TRUE(wait_until([&] { return sink_.progress().size() >= 3; }));
    auto progress = sink_.progress();
    EXPECT_DOUBLE_EQ(progress[0], 0.25);
    EXPECT_DOUBLE_EQ(progress[1], 0.30);
    EXPECT_DOUBLE_EQ(progress[2], 0.55);
    EXPECT_TRUE(std::is_sorted(progress.begin(), progress.end()));
    for (double p : progress) {
        EXPECT_LT(p, 1.0);
    }
}

TEST_F(ParallelDownloadTest, Progress_OrphanProgressIgnored) {
    coordinator_->chunk_progress_update("ghost", "ghost.chunk0", 0.5);
    coordinator_->chunk_status_update("ghost", "ghost.chunk0", task_status::complete);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    EXPECT_TRUE(sink_.progress().empty());
    EXPECT_TRUE(sink_.statuses().empty());
}

// =============================================================================
// Pause and Resume
// =============================================================================

TEST_F(ParallelDownloadTest, Pause_CollectsCompositeToken) {
    start_and_split(make_parent(), 2);
    coordinator_->chunk_progress_update("p1", "p1.chunk0", 0.5);
    ASSERT_TRUE(wait_until([&] { return !sink_.progress().empty(); }));

    auto outcome = collect_pause();
    ASSERT_TRUE(outcome.has_value());
    ASSERT_TRUE(outcome->has_value());

    const auto& token = **outcome;
    EXPECT_EQ(token.total_size, 200u);
    ASSERT_EQ(token.chunks.size(), 2u);
    EXPECT_EQ(token.chunks[0].range_start, 0u);
    EXPECT_EQ(token.chunks[0].range_end, 99u);
    EXPECT_EQ(token.chunks[0].bytes_transferred, 50u);
    EXPECT_EQ(token.chunks[1].range_start, 100u);
    EXPECT_EQ(token.chunks[1].bytes_transferred, 0u);
    EXPECT_EQ(transport_.paused_count(), 2u);
    EXPECT_FALSE(coordinator_->is_active("p1"));
}

TEST_F(ParallelDownloadTest, Resume_ContinuesFromRecordedOffsets) {
    composite_resume_token token;
    token.total_size = 200;
    token.chunks.push_back({"p1.chunk0", "https://files.example.com/big.bin", 0, 99, 50,
                            std::nullopt});
    token.chunks.push_back({"p1.chunk1", "https://files.example.com/big.bin", 100, 199, 0,
                            std::nullopt});

    ASSERT_TRUE(coordinator_->start(make_parent(), token).has_value());
    ASSERT_TRUE(wait_until([&] { return transport_.enqueued_count() == 2; }));

    auto chunks = transport_.enqueued();
    EXPECT_EQ(chunks[0].chunk.headers.at("Range"), "bytes=50-99");
    EXPECT_EQ(chunks[1].chunk.headers.at("Range"), "bytes=100-199");
    EXPECT_EQ(chunks[0].chunk.byte_range_start, 0u);
    EXPECT_EQ(transport_.probe_count(), 0);

    auto snapshot = coordinator_->chunks("p1");
    ASSERT_EQ(snapshot.size(), 2u);
    EXPECT_EQ(snapshot[0].bytes_done, 50u);

    // Progress of the resumed request is scaled to the remaining bytes
    coordinator_->chunk_progress_update("p1", "p1.chunk0", 0.5);
    ASSERT_TRUE(wait_until([&] { return !sink_.progress().empty(); }));
    EXPECT_DOUBLE_EQ(sink_.progress().back(), 75.0 / 200.0);
}

TEST_F(ParallelDownloadTest, Resume_SkipsCompletedChunksAndUsesChildTokens) {
    composite_resume_token token;
    token.total_size = 300;
    token.chunks.push_back({"p1.chunk0", "", 0, 99, 100, std::nullopt});
    token.chunks.push_back({"p1.chunk1", "", 100, 199, 30,
                            simple_resume_token{{std::byte{9}}, 30, "\"e\""}});
    token.chunks.push_back({"p1.chunk2", "", 200, 299, 0, std::nullopt});

    ASSERT_TRUE(coordinator_->start(make_parent("p1", 3), token).has_value());
    ASSERT_TRUE(wait_until([&] { return transport_.enqueued_count() == 2; }));

    auto chunks = transport_.enqueued();
    EXPECT_EQ(chunks[0].chunk.task_id, "p1.chunk1");
    ASSERT_TRUE(chunks[0].token.has_value());
    EXPECT_EQ(chunks[0].token->data.size(), 1u);
    EXPECT_EQ(chunks[0].chunk.headers.at("Range"), "bytes=100-199");
    EXPECT_EQ(chunks[1].chunk.task_id, "p1.chunk2");
    EXPECT_EQ(chunks[1].chunk.url, "https://files.example.com/big.bin");

    chunk_status("p1.chunk1", task_status::complete);
    chunk_status("p1.chunk2", task_status::complete);
    ASSERT_TRUE(wait_until([&] { return sink_.count(task_status::complete) == 1; }));
}

TEST_F(ParallelDownloadTest, Resume_AllChunksCompleteFinishesImmediately) {
    composite_resume_token token;
    token.total_size = 100;
    token.chunks.push_back({"p1.chunk0", "", 0, 99, 100, std::nullopt});

    ASSERT_TRUE(coordinator_->start(make_parent("p1", 1), token).has_value());
    ASSERT_TRUE(wait_until([&] { return sink_.count(task_status::complete) == 1; }));
    EXPECT_EQ(transport_.enqueued_count(), 0u);
}

TEST_F(ParallelDownloadTest, PauseThenResume_RoundTripsProgress) {
    start_and_split(make_parent(), 2);
    transport_.set_pause_token("p1.chunk1",
                               simple_resume_token{{std::byte{1}, std::byte{2}}, 20, ""});
    coordinator_->chunk_progress_update("p1", "p1.chunk0", 0.5);

    auto outcome = collect_pause();
    ASSERT_TRUE(outcome.has_value() && outcome->has_value());
    EXPECT_EQ((*outcome)->chunks[1].bytes_transferred, 20u);
    ASSERT_TRUE((*outcome)->chunks[1].child_token.has_value());

    ASSERT_TRUE(coordinator_->start(make_parent(), **outcome).has_value());
    ASSERT_TRUE(wait_until([&] { return transport_.enqueued_count() == 4; }));

    auto chunks = transport_.enqueued();
    EXPECT_EQ(chunks[2].chunk.headers.at("Range"), "bytes=50-99");
    EXPECT_FALSE(chunks[2].token.has_value());
    EXPECT_TRUE(chunks[3].token.has_value());
    EXPECT_EQ(sink_.count(task_status::running), 2);
}

TEST_F(ParallelDownloadTest, PauseResumeTwice_KeepsBytesFromEarlierRuns) {
    start_and_split(make_parent(), 2);
    coordinator_->chunk_progress_update("p1", "p1.chunk0", 0.5);
    ASSERT_TRUE(wait_until([&] { return !sink_.progress().empty(); }));

    auto first = collect_pause();
    ASSERT_TRUE(first.has_value() && first->has_value());
    EXPECT_EQ((*first)->chunks[0].bytes_transferred, 50u);

    ASSERT_TRUE(coordinator_->start(make_parent(), **first).has_value());
    ASSERT_TRUE(wait_until([&] { return transport_.enqueued_count() == 4; }));
    EXPECT_EQ(transport_.enqueued()[2].chunk.headers.at("Range"), "bytes=50-99");

    // The executor's token for the second run covers 20 bytes of bytes=50-99
    transport_.set_pause_token("p1.chunk0",
                               simple_resume_token{{std::byte{7}}, 20, "\"v2\""});
    auto second = collect_pause();
    ASSERT_TRUE(second.has_value() && second->has_value());

    const auto& entry = (*second)->chunks[0];
    EXPECT_EQ(entry.range_start, 0u);
    EXPECT_EQ(entry.range_end, 99u);
    EXPECT_EQ(entry.bytes_transferred, 70u);
    EXPECT_EQ(entry.child_range_start, 50u);
    ASSERT_TRUE(entry.child_token.has_value());

    ASSERT_TRUE(coordinator_->start(make_parent(), **second).has_value());
    ASSERT_TRUE(wait_until([&] { return transport_.enqueued_count() == 6; }));

    auto third = transport_.enqueued()[4];
    EXPECT_EQ(third.chunk.task_id, "p1.chunk0");
    EXPECT_EQ(third.chunk.headers.at("Range"), "bytes=50-99");
    ASSERT_TRUE(third.token.has_value());
    EXPECT_EQ(third.token->etag, "\"v2\"");

    auto snapshot = coordinator_->chunks("p1");
    ASSERT_EQ(snapshot.size(), 2u);
    EXPECT_EQ(snapshot[0].bytes_done, 70u);
}

TEST_F(ParallelDownloadTest, Pause_CompletedChunkReportsFullRange) {
    start_and_split(make_parent(), 2);
    chunk_status("p1.chunk1", task_status::complete);
    ASSERT_TRUE(wait_until([&] {
        auto c = coordinator_->chunks("p1");
        return c.size() == 2 && c[1].status == task_status::complete;
    }));

    auto outcome = collect_pause();
    ASSERT_TRUE(outcome.has_value() && outcome->has_value());
    EXPECT_EQ((*outcome)->chunks[1].bytes_transferred, 100u);
    EXPECT_EQ(transport_.paused_count(), 1u);
}

TEST_F(ParallelDownloadTest, Pause_UnreportedChunkRestartsAfterTimeout) {
    start_and_split(make_parent(), 2);
    coordinator_->chunk_progress_update("p1", "p1.chunk1", 0.5);
    transport_.set_pause_delay("p1.chunk1", std::chrono::milliseconds(800));

    auto outcome = collect_pause();
    ASSERT_TRUE(outcome.has_value() && outcome->has_value());
    EXPECT_EQ((*outcome)->chunks[1].bytes_transferred, 0u);
}

TEST_F(ParallelDownloadTest, Pause_RejectedWhenNotAllowed) {
    EXPECT_FALSE(coordinator_->pause("unknown", nullptr));

    auto parent = make_parent();
    parent.allow_pause = false;
    start_and_split(parent, 2);
    EXPECT_FALSE(coordinator_->pause("p1", nullptr));
    EXPECT_TRUE(coordinator_->is_active("p1"));
}

// =============================================================================
// Cancel
// =============================================================================

TEST_F(ParallelDownloadTest, Cancel_CancelsLiveChunksAndReportsOnce) {
    start_and_split(make_parent("p1", 3), 3);
    chunk_status("p1.chunk0", task_status::complete);

    EXPECT_TRUE(coordinator_->cancel("p1"));

    ASSERT_TRUE(wait_until([&] { return sink_.count(task_status::canceled) == 1; }));
    auto canceled = transport_.canceled();
    std::sort(canceled.begin(), canceled.end());
    EXPECT_EQ(canceled, (std::vector<std::string>{"p1.chunk1", "p1.chunk2"}));

    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    EXPECT_EQ(sink_.count(task_status::canceled), 1);
    EXPECT_FALSE(coordinator_->cancel("p1"));
}

TEST_F(ParallelDownloadTest, Cancel_FinalizesAfterTimeoutWithoutConfirmation) {
    transport_.set_report_cancel(false);
    start_and_split(make_parent(), 2);

    EXPECT_TRUE(coordinator_->cancel("p1"));
    EXPECT_TRUE(coordinator_->cancel("p1"));
    EXPECT_EQ(sink_.count(task_status::canceled), 0);
    ASSERT_TRUE(wait_until([&] { return sink_.count(task_status::canceled) == 1; }));
    EXPECT_FALSE(coordinator_->is_active("p1"));
}

TEST_F(ParallelDownloadTest, Cancel_DuringPauseWins) {
    start_and_split(make_parent(), 2);
    transport_.set_pause_delay("p1.chunk0", std::chrono::milliseconds(200));
    transport_.set_pause_delay("p1.chunk1", std::chrono::milliseconds(200));

    std::atomic<bool> paused_called{false};
    ASSERT_TRUE(coordinator_->pause(
        "p1", [&](const task&, std::optional<composite_resume_token>) { paused_called = true; }));
    EXPECT_TRUE(coordinator_->cancel("p1"));

    ASSERT_TRUE(wait_until([&] { return sink_.count(task_status::canceled) == 1; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    EXPECT_FALSE(paused_called);
}

// =============================================================================
// Configuration
// =============================================================================

TEST_F(ParallelDownloadTest, ConfigValidation) {
    EXPECT_TRUE(parallel_config{}.validate().has_value());

    parallel_config zero_timeout;
    zero_timeout.pause_timeout = std::chrono::milliseconds(0);
    EXPECT_FALSE(zero_timeout.validate().has_value());

    parallel_config bad_step;
    bad_step.min_progress_step = 1.0;
    EXPECT_FALSE(bad_step.validate().has_value());

    parallel_config bad_chunks;
    bad_chunks.chunking = chunk_plan_config{0};
    EXPECT_EQ(bad_chunks.validate().error().code, error_code::invalid_configuration);
}

TEST_F(ParallelDownloadTest, SnapshotsDescribeChunks) {
    start_and_split(make_parent(), 2);
    coordinator_->chunk_progress_update("p1", "p1.chunk1", 0.25);

    ASSERT_TRUE(wait_until([&] {
        auto c = coordinator_->chunks("p1");
        return c.size() == 2 && c[1].bytes_done == 25;
    }));
    EXPECT_EQ(coordinator_->active_parents().size(), 1u);
    EXPECT_EQ(coordinator_->parent_task("p1")->chunk_count, 2);
    EXPECT_FALSE(coordinator_->parent_of("other.chunk0").has_value());
}

}  // namespace kcenon::background_transfer::test
