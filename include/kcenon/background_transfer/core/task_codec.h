/**
 * @file task_codec.h
 * @brief Text encoding of tasks, resume tokens and updates for durable state
 *
 * Records are flat JSON objects. Nested values (headers, chunk entries,
 * the task inside an update) are encoded as flat objects of their own and
 * stored as escaped string values, so a single-level reader suffices.
 */

#ifndef KCENON_BACKGROUND_TRANSFER_CORE_TASK_CODEC_H
#define KCENON_BACKGROUND_TRANSFER_CORE_TASK_CODEC_H

#include <kcenon/background_transfer/core/resume_token.h>
#include <kcenon/background_transfer/core/task.h>
#include <kcenon/background_transfer/core/task_update.h>
#include <kcenon/background_transfer/core/types.h>

#include <map>
#include <string>

namespace kcenon::background_transfer {

/**
 * @brief Builder for a flat JSON object
 */
class flat_json_writer {
public:
    auto add(const std::string& key, const std::string& value) -> flat_json_writer&;
    auto add(const std::string& key, const char* value) -> flat_json_writer&;
    auto add(const std::string& key, int64_t value) -> flat_json_writer&;
    auto add(const std::string& key, uint64_t value) -> flat_json_writer&;
    auto add(const std::string& key, int value) -> flat_json_writer&;
    auto add(const std::string& key, double value) -> flat_json_writer&;
    auto add(const std::string& key, bool value) -> flat_json_writer&;

    [[nodiscard]] auto str() const -> std::string;

private:
    void add_raw(const std::string& key, const std::string& raw);

    std::string body_;
};

/**
 * @brief Parsed flat JSON object
 *
 * String values are unescaped; numbers and literals are kept as text.
 */
class flat_json_reader {
public:
    [[nodiscard]] static auto parse(const std::string& json) -> result<flat_json_reader>;

    [[nodiscard]] auto has(const std::string& key) const -> bool;
    [[nodiscard]] auto get_string(const std::string& key) const -> result<std::string>;
    [[nodiscard]] auto get_string_or(const std::string& key,
                                     const std::string& fallback) const -> std::string;
    [[nodiscard]] auto get_int64(const std::string& key) const -> result<int64_t>;
    [[nodiscard]] auto get_uint64(const std::string& key) const -> result<uint64_t>;
    [[nodiscard]] auto get_double(const std::string& key) const -> result<double>;
    [[nodiscard]] auto get_bool(const std::string& key) const -> result<bool>;

    [[nodiscard]] auto values() const -> const std::map<std::string, std::string>& {
        return values_;
    }

private:
    std::map<std::string, std::string> values_;
};

[[nodiscard]] auto encode_task(const task& t) -> std::string;
[[nodiscard]] auto decode_task(const std::string& text) -> result<task>;

[[nodiscard]] auto encode_resume_token(const resume_token& token) -> std::string;
[[nodiscard]] auto decode_resume_token(const std::string& text) -> result<resume_token>;

[[nodiscard]] auto encode_update(const status_update& update) -> std::string;
[[nodiscard]] auto encode_update(const progress_update& update) -> std::string;
[[nodiscard]] auto encode_update(const resume_data_update& update) -> std::string;

[[nodiscard]] auto decode_status_update(const std::string& text) -> result<status_update>;
[[nodiscard]] auto decode_progress_update(const std::string& text) -> result<progress_update>;
[[nodiscard]] auto decode_resume_data_update(const std::string& text)
    -> result<resume_data_update>;

}  // namespace kcenon::background_transfer

#endif  // KCENON_BACKGROUND_TRANSFER_CORE_TASK_CODEC_H
