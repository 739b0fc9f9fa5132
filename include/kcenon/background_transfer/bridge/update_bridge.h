/**
 * @file update_bridge.h
 * @brief Delivers status, progress and resume data to the host, buffering
 *        durably whatever the host cannot receive
 */

#ifndef KCENON_BACKGROUND_TRANSFER_BRIDGE_UPDATE_BRIDGE_H
#define KCENON_BACKGROUND_TRANSFER_BRIDGE_UPDATE_BRIDGE_H

#include <kcenon/background_transfer/core/task_update.h>
#include <kcenon/background_transfer/core/types.h>
#include <kcenon/background_transfer/storage/persistent_store.h>

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace kcenon::background_transfer {

/**
 * @brief Host side of the update stream
 *
 * Each callback returns true if the host accepted the update. Returning
 * false (for example while the host UI is suspended) makes the bridge
 * buffer the update instead.
 *
 * Callbacks may call back into the orchestrator from the same thread.
 */
class host_listener {
public:
    virtual ~host_listener() = default;

    virtual auto on_status_update(const status_update& update) -> bool = 0;
    virtual auto on_progress_update(const progress_update& update) -> bool = 0;
    virtual auto on_resume_data(const resume_data_update& update) -> bool = 0;
};

/**
 * @brief Progress coalescing settings
 */
struct update_bridge_config {
    /// Minimum time between two delivered progress values of one task
    std::chrono::milliseconds progress_min_interval{500};
    /// Minimum growth between two delivered progress values of one task
    double progress_min_delta = 0.02;
};

/**
 * @brief Normalizes and delivers task updates
 *
 * - Status updates are checked against the task state machine and
 *   delivered unconditionally; terminal and paused statuses also produce
 *   the matching sentinel progress value.
 * - Progress updates are coalesced per task.
 * - Anything the listener refuses (or that arrives with no listener
 *   attached) is written to the persistent store, last write wins per
 *   task and kind.
 *
 * @note Thread-safe.
 */
class update_bridge {
public:
    update_bridge(std::shared_ptr<persistent_store> store,
                  update_bridge_config config = {});
    ~update_bridge();

    update_bridge(const update_bridge&) = delete;
    auto operator=(const update_bridge&) -> update_bridge& = delete;

    void attach_listener(std::shared_ptr<host_listener> listener);
    void detach_listener();
    [[nodiscard]] auto has_listener() const -> bool;

    /**
     * @brief Make every push fail as if no listener were attached
     */
    void force_fail_delivery(bool fail);

    /**
     * @brief Deliver a status update
     * @return true if the host received it, false if buffered or rejected
     */
    auto deliver_status(const status_update& update) -> bool;

    /**
     * @brief Deliver a progress update, subject to coalescing
     * @return true if the host received it
     */
    auto deliver_progress(const progress_update& update) -> bool;

    /**
     * @brief Deliver resume data for a paused task
     * @return true if the host received it
     */
    auto deliver_resume_data(const resume_data_update& update) -> bool;

    /**
     * @brief Last status delivered or buffered for a live task
     */
    [[nodiscard]] auto last_status(const std::string& task_id) const
        -> std::optional<task_status>;

    /**
     * @brief Drop per-task ordering and coalescing state
     */
    void forget(const std::string& task_id);

    [[nodiscard]] auto pop_buffered_status_updates() -> std::map<std::string, status_update>;
    [[nodiscard]] auto pop_buffered_progress_updates()
        -> std::map<std::string, progress_update>;
    [[nodiscard]] auto pop_buffered_resume_data()
        -> std::map<std::string, resume_data_update>;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::background_transfer

#endif  // KCENON_BACKGROUND_TRANSFER_BRIDGE_UPDATE_BRIDGE_H
