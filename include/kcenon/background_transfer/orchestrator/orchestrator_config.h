/**
 * @file orchestrator_config.h
 * @brief Settings of the task orchestrator
 */

#ifndef KCENON_BACKGROUND_TRANSFER_ORCHESTRATOR_ORCHESTRATOR_CONFIG_H
#define KCENON_BACKGROUND_TRANSFER_ORCHESTRATOR_ORCHESTRATOR_CONFIG_H

#include <kcenon/background_transfer/core/types.h>
#include <kcenon/background_transfer/parallel/chunk_plan.h>
#include <kcenon/background_transfer/queue/holding_queue.h>

#include <chrono>
#include <cstddef>
#include <filesystem>

namespace kcenon::background_transfer {

/**
 * @brief Orchestrator configuration
 */
struct orchestrator_config {
    /// Where buffered updates and settings are kept across restarts
    std::filesystem::path state_directory;

    std::chrono::milliseconds progress_min_interval{500};
    double progress_min_delta = 0.02;

    /// Bound on waiting for a pause to produce resume data
    std::chrono::milliseconds pause_timeout{500};
    /// Bound on waiting for chunks to acknowledge a parent cancel
    std::chrono::milliseconds cancel_timeout{2000};

    /// First retry delay; doubled for every retry already used
    std::chrono::milliseconds retry_base_delay{1000};

    /// Worker threads of the internal pool (0 = hardware concurrency)
    std::size_t worker_count = 0;

    /// Chunks per URL for parallel downloads that do not set chunk_count
    int default_chunk_count = chunk_plan_config::default_chunks_per_url;

    holding_queue_config holding_queue;

    [[nodiscard]] auto validate() const -> result<void> {
        if (progress_min_interval.count() < 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "progress_min_interval must not be negative"});
        }
        if (progress_min_delta < 0.0 || progress_min_delta >= 1.0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "progress_min_delta must be in [0, 1)"});
        }
        if (pause_timeout.count() <= 0 || cancel_timeout.count() <= 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "pause and cancel timeouts must be positive"});
        }
        if (retry_base_delay.count() < 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "retry_base_delay must not be negative"});
        }
        auto chunks = chunk_plan_config{default_chunk_count}.validate();
        if (!chunks) {
            return chunks;
        }
        return holding_queue.validate();
    }
};

}  // namespace kcenon::background_transfer

#endif  // KCENON_BACKGROUND_TRANSFER_ORCHESTRATOR_ORCHESTRATOR_CONFIG_H
