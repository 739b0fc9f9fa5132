/**
 * @file background_transfer.h
 * @brief Main header for the background_transfer library
 * @version 0.1.0
 *
 * Include this header to access the orchestrator and everything it is
 * configured with.
 *
 * @code
 * #include <kcenon/background_transfer/background_transfer.h>
 *
 * using namespace kcenon::background_transfer;
 *
 * auto orchestrator = task_orchestrator::builder()
 *     .with_executor(my_executor)
 *     .with_state_directory("/path/to/state")
 *     .build();
 * @endcode
 */

#ifndef KCENON_BACKGROUND_TRANSFER_BACKGROUND_TRANSFER_H
#define KCENON_BACKGROUND_TRANSFER_BACKGROUND_TRANSFER_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/background_transfer/core/types.h"
#include "kcenon/background_transfer/core/task.h"
#include "kcenon/background_transfer/core/resume_token.h"
#include "kcenon/background_transfer/core/task_update.h"
#include "kcenon/background_transfer/core/enqueue_request.h"

// Executor boundary
#include "kcenon/background_transfer/executor/transfer_executor.h"

// Orchestrator
#include "kcenon/background_transfer/orchestrator/orchestrator_config.h"
#include "kcenon/background_transfer/orchestrator/task_orchestrator.h"

// Adapters
#include "kcenon/background_transfer/adapters/thread_pool_adapter.h"

namespace kcenon::background_transfer {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::background_transfer

#endif  // KCENON_BACKGROUND_TRANSFER_BACKGROUND_TRANSFER_H
