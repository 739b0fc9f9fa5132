/**
 * @file background_download_example.cpp
 * @brief Running simple and parallel downloads through the orchestrator
 *
 * This example demonstrates:
 * - Building a task_orchestrator around a transfer executor
 * - Receiving status and progress updates through a host listener
 * - Splitting a large download into parallel range requests
 * - Limiting concurrency with the holding queue
 *
 * The executor here is simulated: it serves byte ranges of an in-memory
 * payload instead of talking to a real platform service.
 */

#include <kcenon/background_transfer/background_transfer.h>
#include <kcenon/background_transfer/core/logging.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace kcenon::background_transfer;

namespace {

constexpr uint64_t payload_size = 4 * 1024 * 1024;
constexpr uint64_t step_size = 256 * 1024;

/**
 * @brief Executor that "downloads" by sleeping a little per step
 */
class simulated_executor : public transfer_executor {
public:
    ~simulated_executor() override { shutdown(); }

    void set_listener(std::shared_ptr<executor_listener> listener) override {
        std::lock_guard lock(mutex_);
        listener_ = std::move(listener);
    }

    auto submit(const transfer_request& request,
                const std::optional<simple_resume_token>& token) -> result<void> override {
        std::lock_guard lock(mutex_);
        if (stopping_) {
            return unexpected(error{error_code::executor_error, "executor is shutting down"});
        }
        uint64_t resume_from = token ? token->bytes_transferred : 0;
        workers_.emplace_back([this, request, resume_from] { run(request, resume_from); });
        return {};
    }

    auto cancel(transfer_handle handle, bool produce_resume_data)
        -> std::optional<simple_resume_token> override {
        std::lock_guard lock(mutex_);
        canceled_.insert(handle);
        if (!produce_resume_data) {
            return std::nullopt;
        }
        auto done = progress_[handle];
        return simple_resume_token{{std::byte{1}}, done, "\"simulated\""};
    }

    auto probe(const task&) -> result<content_metadata> override {
        return content_metadata{payload_size, true};
    }

    void shutdown() {
        std::vector<std::thread> workers;
        {
            std::lock_guard lock(mutex_);
            stopping_ = true;
            workers.swap(workers_);
        }
        for (auto& w : workers) {
            if (w.joinable()) w.join();
        }
    }

private:
    // Length of the request: the Range header for chunks, the payload otherwise
    static auto request_length(const task& t) -> uint64_t {
        auto it = t.headers.find("Range");
        if (it == t.headers.end()) {
            return payload_size;
        }
        unsigned long long first = 0;
        unsigned long long last = payload_size - 1;
        if (std::sscanf(it->second.c_str(), "bytes=%llu-%llu", &first, &last) < 1) {
            return payload_size;
        }
        return last - first + 1;
    }

    void run(const transfer_request& request, uint64_t done) {
        auto total = request_length(request.t);
        emit_status(request.handle, task_status::running);

        while (done < total) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            {
                std::lock_guard lock(mutex_);
                if (canceled_.count(request.handle) != 0 || stopping_) {
                    break;
                }
                done = std::min(total, done + step_size);
                progress_[request.handle] = done;
            }
            emit_progress(request.handle, done, static_cast<int64_t>(total));
        }

        emit_status(request.handle,
                    done >= total ? task_status::complete : task_status::canceled);
    }

    void emit_status(transfer_handle handle, task_status status) {
        std::shared_ptr<executor_listener> listener;
        {
            std::lock_guard lock(mutex_);
            listener = listener_;
        }
        executor_status_event event;
        event.status = status;
        if (listener) listener->on_status_change(handle, event);
    }

    void emit_progress(transfer_handle handle, uint64_t bytes, int64_t total) {
        std::shared_ptr<executor_listener> listener;
        {
            std::lock_guard lock(mutex_);
            listener = listener_;
        }
        if (listener) listener->on_progress(handle, bytes, total);
    }

    std::mutex mutex_;
    std::shared_ptr<executor_listener> listener_;
    std::vector<std::thread> workers_;
    std::set<transfer_handle> canceled_;
    std::map<transfer_handle, uint64_t> progress_;
    bool stopping_ = false;
};

/**
 * @brief Prints updates and remembers which tasks finished
 */
class console_listener : public host_listener {
public:
    auto on_status_update(const status_update& update) -> bool override {
        std::lock_guard lock(mutex_);
        std::cout << "[" << update.t.task_id << "] " << to_string(update.status);
        if (update.exception) {
            std::cout << " (" << update.exception->description << ")";
        }
        std::cout << "\n";
        if (is_terminal_status(update.status)) {
            finished_.insert(update.t.task_id);
            cv_.notify_all();
        }
        return true;
    }

    auto on_progress_update(const progress_update& update) -> bool override {
        if (update.progress < 0.0 || update.progress >= 1.0) {
            return true;
        }
        std::lock_guard lock(mutex_);
        std::cout << "[" << update.t.task_id << "] " << std::fixed << std::setprecision(1)
                  << update.progress * 100.0 << "%\n";
        return true;
    }

    auto on_resume_data(const resume_data_update& update) -> bool override {
        std::lock_guard lock(mutex_);
        std::cout << "[" << update.t.task_id << "] resume data available\n";
        return true;
    }

    auto wait_for(std::size_t count, std::chrono::seconds timeout) -> bool {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return finished_.size() >= count; });
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::set<std::string> finished_;
};

}  // namespace

int main() {
    get_logger().initialize();
    get_logger().set_level(log_level::info);

    std::cout << "background_transfer " << version::to_string() << "\n\n";

    auto executor = std::make_shared<simulated_executor>();
    auto listener = std::make_shared<console_listener>();

    auto built = task_orchestrator::builder()
                     .with_executor(executor)
                     .with_progress_coalescing(std::chrono::milliseconds(100), 0.1)
                     .with_holding_queue({4, 2, 0})
                     .with_default_chunk_count(4)
                     .build();
    if (!built) {
        std::cerr << "Failed to create orchestrator: " << built.error().message << "\n";
        return 1;
    }
    auto& orchestrator = built.value();
    orchestrator.attach_listener(listener);

    task simple;
    simple.task_id = "report";
    simple.url = "https://downloads.example.com/report.pdf";
    simple.filename = "report.pdf";
    simple.directory = "downloads";

    task parallel;
    parallel.task_id = "disk-image";
    parallel.kind = task_kind::parallel_download;
    parallel.url = "https://downloads.example.com/disk.img";
    parallel.mirror_urls = {"https://mirror.example.com/disk.img"};
    parallel.filename = "disk.img";
    parallel.chunk_count = 2;

    for (const auto& t : {simple, parallel}) {
        if (!orchestrator.enqueue(t)) {
            std::cerr << "Could not enqueue " << t.task_id << "\n";
            return 1;
        }
    }

    bool finished = listener->wait_for(2, std::chrono::seconds(30));
    executor->shutdown();

    if (!finished) {
        std::cerr << "Transfers did not finish in time\n";
        return 1;
    }
    std::cout << "\nAll transfers finished\n";
    return 0;
}
