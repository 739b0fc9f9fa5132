/**
 * @file persistent_store.cpp
 * @brief Implementation of the durable record store
 */

#include <kcenon/background_transfer/storage/persistent_store.h>
#include <kcenon/background_transfer/core/checksum.h>
#include <kcenon/background_transfer/core/logging.h>

#include <cstdio>
#include <fstream>
#include <mutex>
#include <sstream>

namespace kcenon::background_transfer {

namespace {

constexpr const char* record_magic = "BTR1";
constexpr const char* record_extension = ".rec";
constexpr const char* temp_extension = ".tmp";

auto subdirectory_for(update_kind kind) -> const char* {
    switch (kind) {
        case update_kind::status: return "status";
        case update_kind::progress: return "progress";
        case update_kind::resume_data: return "resume";
        default: return "unknown";
    }
}

// Task ids are host-assigned and may contain path separators,
// so file names are the hex encoding of the id.
auto encode_file_stem(const std::string& id) -> std::string {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(id.size() * 2);
    for (unsigned char c : id) {
        out += digits[c >> 4];
        out += digits[c & 0x0F];
    }
    return out;
}

auto decode_file_stem(const std::string& stem) -> std::optional<std::string> {
    if (stem.size() % 2 != 0) {
        return std::nullopt;
    }
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        return -1;
    };
    std::string out;
    out.reserve(stem.size() / 2);
    for (std::size_t i = 0; i < stem.size(); i += 2) {
        int hi = nibble(stem[i]);
        int lo = nibble(stem[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out += static_cast<char>((hi << 4) | lo);
    }
    return out;
}

auto frame_record(const std::string& payload) -> std::string {
    char header[48];
    std::snprintf(header, sizeof(header), "%s %08x %zu\n", record_magic,
                  checksum::crc32(payload), payload.size());
    return std::string(header) + payload;
}

auto unframe_record(const std::string& contents) -> result<std::string> {
    auto newline = contents.find('\n');
    if (newline == std::string::npos) {
        return unexpected(error{error_code::state_corrupted, "missing record header"});
    }

    std::istringstream header(contents.substr(0, newline));
    std::string magic;
    std::string crc_hex;
    std::size_t length = 0;
    header >> magic >> crc_hex >> length;
    if (!header || magic != record_magic) {
        return unexpected(error{error_code::state_corrupted, "bad record header"});
    }

    auto payload = contents.substr(newline + 1);
    if (payload.size() != length) {
        return unexpected(error{error_code::state_corrupted, "truncated record"});
    }

    uint32_t expected = 0;
    try {
        expected = static_cast<uint32_t>(std::stoul(crc_hex, nullptr, 16));
    } catch (const std::exception&) {
        return unexpected(error{error_code::state_corrupted, "bad record checksum field"});
    }
    if (checksum::crc32(payload) != expected) {
        return unexpected(error{error_code::state_corrupted, "record checksum mismatch"});
    }
    return payload;
}

auto read_file(const std::filesystem::path& path) -> result<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected(error{error_code::state_read_error,
                                "failed to open record: " + path.string()});
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

auto write_atomically(const std::filesystem::path& path, const std::string& contents)
    -> result<void> {
    auto temp = path;
    temp += temp_extension;

    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        if (!file) {
            return unexpected(error{error_code::state_write_error,
                                    "failed to open for writing: " + temp.string()});
        }
        file << contents;
        file.flush();
        if (!file) {
            return unexpected(error{error_code::state_write_error,
                                    "failed to write: " + temp.string()});
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp, path, ec);
    if (ec) {
        std::filesystem::remove(temp, ec);
        return unexpected(error{error_code::state_write_error,
                                "failed to commit record: " + path.string()});
    }
    return {};
}

}  // namespace

struct persistent_store::impl {
    std::filesystem::path root;
    mutable std::mutex mutex;

    explicit impl(std::filesystem::path r) : root(std::move(r)) {}

    auto directory(update_kind kind) const -> std::filesystem::path {
        return root / subdirectory_for(kind);
    }

    auto record_path(update_kind kind, const std::string& task_id) const
        -> std::filesystem::path {
        return directory(kind) / (encode_file_stem(task_id) + record_extension);
    }

    auto settings_path(const std::string& name) const -> std::filesystem::path {
        return root / "settings" / (encode_file_stem(name) + record_extension);
    }

    // Reads a record; a corrupted one is deleted and reported as absent.
    auto load_record(const std::filesystem::path& path) const
        -> result<std::optional<std::string>> {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return std::optional<std::string>{};
        }

        auto contents = read_file(path);
        if (!contents) {
            return unexpected(contents.error());
        }

        auto payload = unframe_record(contents.value());
        if (!payload) {
            BT_LOG_WARN(log_category::store,
                        "Discarding corrupted record " + path.filename().string() +
                        ": " + payload.error().message);
            std::filesystem::remove(path, ec);
            return std::optional<std::string>{};
        }
        return std::optional<std::string>{std::move(payload.value())};
    }
};

persistent_store::persistent_store(std::filesystem::path root)
    : impl_(std::make_unique<impl>(std::move(root))) {}

persistent_store::~persistent_store() = default;

persistent_store::persistent_store(persistent_store&&) noexcept = default;
auto persistent_store::operator=(persistent_store&&) noexcept -> persistent_store& = default;

auto persistent_store::initialize() -> result<void> {
    std::lock_guard lock(impl_->mutex);

    for (auto kind : {update_kind::status, update_kind::progress, update_kind::resume_data}) {
        std::error_code ec;
        std::filesystem::create_directories(impl_->directory(kind), ec);
        if (ec) {
            return unexpected(error{error_code::state_write_error,
                                    "failed to create " + impl_->directory(kind).string() +
                                    ": " + ec.message()});
        }
    }

    std::error_code ec;
    std::filesystem::create_directories(impl_->root / "settings", ec);
    if (ec) {
        return unexpected(error{error_code::state_write_error,
                                "failed to create settings directory: " + ec.message()});
    }

    BT_LOG_DEBUG(log_category::store, "State directory ready: " + impl_->root.string());
    return {};
}

auto persistent_store::put(update_kind kind, const std::string& task_id,
                           const std::string& payload) -> result<void> {
    std::lock_guard lock(impl_->mutex);

    auto written = write_atomically(impl_->record_path(kind, task_id), frame_record(payload));
    if (!written) {
        BT_LOG_ERROR(log_category::store,
                     std::string("Failed to buffer ") + to_string(kind) +
                     " record for " + task_id + ": " + written.error().message);
    }
    return written;
}

auto persistent_store::get(update_kind kind, const std::string& task_id) const
    -> result<std::optional<std::string>> {
    std::lock_guard lock(impl_->mutex);
    return impl_->load_record(impl_->record_path(kind, task_id));
}

auto persistent_store::remove(update_kind kind, const std::string& task_id) -> result<void> {
    std::lock_guard lock(impl_->mutex);

    std::error_code ec;
    std::filesystem::remove(impl_->record_path(kind, task_id), ec);
    if (ec) {
        return unexpected(error{error_code::state_write_error,
                                "failed to remove record for " + task_id});
    }
    return {};
}

auto persistent_store::take_all(update_kind kind)
    -> result<std::map<std::string, std::string>> {
    std::lock_guard lock(impl_->mutex);

    std::map<std::string, std::string> records;
    auto dir = impl_->directory(kind);

    std::error_code ec;
    if (!std::filesystem::exists(dir, ec)) {
        return records;
    }

    std::vector<std::filesystem::path> consumed;
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        const auto& path = entry.path();
        if (path.extension() != record_extension) {
            continue;
        }

        auto task_id = decode_file_stem(path.stem().string());
        if (!task_id) {
            BT_LOG_WARN(log_category::store, "Ignoring foreign file " + path.string());
            continue;
        }

        auto payload = impl_->load_record(path);
        if (!payload) {
            return unexpected(payload.error());
        }
        if (payload.value()) {
            records[*task_id] = std::move(*payload.value());
            consumed.push_back(path);
        }
    }
    if (ec) {
        return unexpected(error{error_code::state_read_error,
                                "failed to list " + dir.string() + ": " + ec.message()});
    }

    for (const auto& path : consumed) {
        std::filesystem::remove(path, ec);
        if (ec) {
            BT_LOG_WARN(log_category::store,
                        "Failed to remove consumed record " + path.string());
        }
    }

    return records;
}

auto persistent_store::count(update_kind kind) const -> std::size_t {
    std::lock_guard lock(impl_->mutex);

    std::size_t n = 0;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(impl_->directory(kind), ec)) {
        if (entry.path().extension() == record_extension) {
            ++n;
        }
    }
    return n;
}

auto persistent_store::save_setting(const std::string& name, const std::string& value)
    -> result<void> {
    std::lock_guard lock(impl_->mutex);
    return write_atomically(impl_->settings_path(name), frame_record(value));
}

auto persistent_store::load_setting(const std::string& name) const
    -> result<std::optional<std::string>> {
    std::lock_guard lock(impl_->mutex);
    return impl_->load_record(impl_->settings_path(name));
}

auto persistent_store::root() const -> const std::filesystem::path& {
    return impl_->root;
}

}  // namespace kcenon::background_transfer
