/**
 * @file persistent_store.h
 * @brief Durable per-task record store for buffered updates and settings
 */

#ifndef KCENON_BACKGROUND_TRANSFER_STORAGE_PERSISTENT_STORE_H
#define KCENON_BACKGROUND_TRANSFER_STORAGE_PERSISTENT_STORE_H

#include <kcenon/background_transfer/core/task_update.h>
#include <kcenon/background_transfer/core/types.h>

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace kcenon::background_transfer {

/**
 * @brief Stores one record per (kind, task id) on disk
 *
 * Layout:
 * @code
 * <root>/status/<hex task id>.rec
 * <root>/progress/<hex task id>.rec
 * <root>/resume/<hex task id>.rec
 * <root>/settings/<name>.rec
 * @endcode
 *
 * Each record is written to a temporary file and renamed into place, and
 * starts with a CRC32 of its payload. Records that fail the check are
 * deleted on read and reported as absent.
 *
 * @note Thread-safe. take_all() is atomic with respect to put().
 */
class persistent_store {
public:
    explicit persistent_store(std::filesystem::path root);
    ~persistent_store();

    persistent_store(const persistent_store&) = delete;
    auto operator=(const persistent_store&) -> persistent_store& = delete;
    persistent_store(persistent_store&&) noexcept;
    auto operator=(persistent_store&&) noexcept -> persistent_store&;

    /**
     * @brief Create the directory layout
     */
    [[nodiscard]] auto initialize() -> result<void>;

    /**
     * @brief Write or replace the record of a task
     */
    [[nodiscard]] auto put(update_kind kind, const std::string& task_id,
                           const std::string& payload) -> result<void>;

    /**
     * @brief Read the record of a task without removing it
     */
    [[nodiscard]] auto get(update_kind kind, const std::string& task_id) const
        -> result<std::optional<std::string>>;

    /**
     * @brief Remove the record of a task if present
     */
    [[nodiscard]] auto remove(update_kind kind, const std::string& task_id) -> result<void>;

    /**
     * @brief Read and delete every record of a kind
     * @return Map of task id to payload
     */
    [[nodiscard]] auto take_all(update_kind kind)
        -> result<std::map<std::string, std::string>>;

    [[nodiscard]] auto count(update_kind kind) const -> std::size_t;

    [[nodiscard]] auto save_setting(const std::string& name, const std::string& value)
        -> result<void>;

    [[nodiscard]] auto load_setting(const std::string& name) const
        -> result<std::optional<std::string>>;

    [[nodiscard]] auto root() const -> const std::filesystem::path&;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::background_transfer

#endif  // KCENON_BACKGROUND_TRANSFER_STORAGE_PERSISTENT_STORE_H
