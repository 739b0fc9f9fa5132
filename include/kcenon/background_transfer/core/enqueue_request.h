/**
 * @file enqueue_request.h
 * @brief A task together with what the host supplied when enqueueing it
 */

#ifndef KCENON_BACKGROUND_TRANSFER_CORE_ENQUEUE_REQUEST_H
#define KCENON_BACKGROUND_TRANSFER_CORE_ENQUEUE_REQUEST_H

#include <kcenon/background_transfer/core/resume_token.h>
#include <kcenon/background_transfer/core/task.h>

#include <optional>

namespace kcenon::background_transfer {

struct enqueue_request {
    task t;
    std::optional<notification_config> notification;
    std::optional<resume_token> token;
    /// Unmetered-network requirement that the global policy never overrides
    std::optional<bool> unmetered_override;
};

}  // namespace kcenon::background_transfer

#endif  // KCENON_BACKGROUND_TRANSFER_CORE_ENQUEUE_REQUEST_H
