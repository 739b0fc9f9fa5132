/**
 * @file task_codec.cpp
 * @brief Flat JSON encoding of durable records
 */

#include <kcenon/background_transfer/core/task_codec.h>

#include <cstdio>
#include <iomanip>
#include <limits>
#include <sstream>

namespace kcenon::background_transfer {

// ============================================================================
// JSON string helpers
// ============================================================================

namespace {

auto escape_json_string(const std::string& s) -> std::string {
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    return out;
}

auto corrupted(const std::string& what) -> unexpected {
    return unexpected(error{error_code::state_corrupted, what});
}

auto skip_ws(const std::string& s, std::size_t pos) -> std::size_t {
    while (pos < s.size() && (s[pos] == ' ' || s[pos] == '\n' ||
                              s[pos] == '\t' || s[pos] == '\r')) {
        ++pos;
    }
    return pos;
}

// Reads a quoted string starting at pos (which must point at '"').
// On success pos is left just past the closing quote.
auto read_string(const std::string& s, std::size_t& pos) -> result<std::string> {
    if (pos >= s.size() || s[pos] != '"') {
        return corrupted("expected string");
    }
    ++pos;

    std::string out;
    while (pos < s.size()) {
        char c = s[pos++];
        if (c == '"') {
            return out;
        }
        if (c != '\\') {
            out += c;
            continue;
        }
        if (pos >= s.size()) {
            break;
        }
        char esc = s[pos++];
        switch (esc) {
            case '"': out += '"'; break;
            case '\\': out += '\\'; break;
            case '/': out += '/'; break;
            case 'b': out += '\b'; break;
            case 'f': out += '\f'; break;
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            case 't': out += '\t'; break;
            case 'u': {
                if (pos + 4 > s.size()) {
                    return corrupted("truncated escape");
                }
                unsigned int code = 0;
                for (int i = 0; i < 4; ++i) {
                    char h = s[pos++];
                    code <<= 4;
                    if (h >= '0' && h <= '9') code |= static_cast<unsigned>(h - '0');
                    else if (h >= 'a' && h <= 'f') code |= static_cast<unsigned>(h - 'a' + 10);
                    else if (h >= 'A' && h <= 'F') code |= static_cast<unsigned>(h - 'A' + 10);
                    else return corrupted("bad escape");
                }
                // Only control characters are written as \u escapes
                out += static_cast<char>(code & 0xFF);
                break;
            }
            default:
                return corrupted("bad escape");
        }
    }
    return corrupted("unterminated string");
}

auto to_hex(const std::vector<std::byte>& data) -> std::string {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (auto b : data) {
        auto v = static_cast<uint8_t>(b);
        out += digits[v >> 4];
        out += digits[v & 0x0F];
    }
    return out;
}

auto from_hex(const std::string& hex) -> result<std::vector<std::byte>> {
    if (hex.size() % 2 != 0) {
        return corrupted("odd hex length");
    }
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    std::vector<std::byte> out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int hi = nibble(hex[i]);
        int lo = nibble(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return corrupted("bad hex digit");
        }
        out.push_back(static_cast<std::byte>((hi << 4) | lo));
    }
    return out;
}

auto time_point_to_ms(std::chrono::system_clock::time_point tp) -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

auto ms_to_time_point(int64_t ms) -> std::chrono::system_clock::time_point {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

}  // namespace

// ============================================================================
// flat_json_writer
// ============================================================================

void flat_json_writer::add_raw(const std::string& key, const std::string& raw) {
    if (!body_.empty()) {
        body_ += ",\n";
    }
    body_ += "  \"" + escape_json_string(key) + "\": " + raw;
}

auto flat_json_writer::add(const std::string& key, const std::string& value)
    -> flat_json_writer& {
    add_raw(key, "\"" + escape_json_string(value) + "\"");
    return *this;
}

auto flat_json_writer::add(const std::string& key, const char* value) -> flat_json_writer& {
    return add(key, std::string(value));
}

auto flat_json_writer::add(const std::string& key, int64_t value) -> flat_json_writer& {
    add_raw(key, std::to_string(value));
    return *this;
}

auto flat_json_writer::add(const std::string& key, uint64_t value) -> flat_json_writer& {
    add_raw(key, std::to_string(value));
    return *this;
}

auto flat_json_writer::add(const std::string& key, int value) -> flat_json_writer& {
    add_raw(key, std::to_string(value));
    return *this;
}

auto flat_json_writer::add(const std::string& key, double value) -> flat_json_writer& {
    std::ostringstream oss;
    oss << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
    add_raw(key, oss.str());
    return *this;
}

auto flat_json_writer::add(const std::string& key, bool value) -> flat_json_writer& {
    add_raw(key, value ? "true" : "false");
    return *this;
}

auto flat_json_writer::str() const -> std::string {
    return "{\n" + body_ + "\n}";
}

// ============================================================================
// flat_json_reader
// ============================================================================

auto flat_json_reader::parse(const std::string& json) -> result<flat_json_reader> {
    flat_json_reader reader;
    std::size_t pos = skip_ws(json, 0);
    if (pos >= json.size() || json[pos] != '{') {
        return corrupted("expected object");
    }
    pos = skip_ws(json, pos + 1);

    if (pos < json.size() && json[pos] == '}') {
        return reader;
    }

    while (pos < json.size()) {
        auto key = read_string(json, pos);
        if (!key) {
            return unexpected(key.error());
        }

        pos = skip_ws(json, pos);
        if (pos >= json.size() || json[pos] != ':') {
            return corrupted("expected ':' after " + key.value());
        }
        pos = skip_ws(json, pos + 1);

        if (pos < json.size() && json[pos] == '"') {
            auto value = read_string(json, pos);
            if (!value) {
                return unexpected(value.error());
            }
            reader.values_[key.value()] = std::move(value.value());
        } else {
            auto start = pos;
            while (pos < json.size() && json[pos] != ',' && json[pos] != '}' &&
                   json[pos] != '\n' && json[pos] != ' ') {
                ++pos;
            }
            if (pos == start) {
                return corrupted("missing value for " + key.value());
            }
            reader.values_[key.value()] = json.substr(start, pos - start);
        }

        pos = skip_ws(json, pos);
        if (pos >= json.size()) {
            break;
        }
        if (json[pos] == ',') {
            pos = skip_ws(json, pos + 1);
            continue;
        }
        if (json[pos] == '}') {
            return reader;
        }
        return corrupted("unexpected character in object");
    }
    return corrupted("unterminated object");
}

auto flat_json_reader::has(const std::string& key) const -> bool {
    return values_.count(key) > 0;
}

auto flat_json_reader::get_string(const std::string& key) const -> result<std::string> {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return corrupted("missing field " + key);
    }
    return it->second;
}

auto flat_json_reader::get_string_or(const std::string& key,
                                     const std::string& fallback) const -> std::string {
    auto it = values_.find(key);
    return it == values_.end() ? fallback : it->second;
}

auto flat_json_reader::get_int64(const std::string& key) const -> result<int64_t> {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return corrupted("missing field " + key);
    }
    try {
        std::size_t used = 0;
        auto value = std::stoll(it->second, &used);
        if (used != it->second.size()) {
            return corrupted("invalid integer in " + key);
        }
        return static_cast<int64_t>(value);
    } catch (const std::exception&) {
        return corrupted("invalid integer in " + key);
    }
}

auto flat_json_reader::get_uint64(const std::string& key) const -> result<uint64_t> {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return corrupted("missing field " + key);
    }
    if (it->second.empty() || it->second[0] == '-') {
        return corrupted("invalid unsigned integer in " + key);
    }
    try {
        std::size_t used = 0;
        auto value = std::stoull(it->second, &used);
        if (used != it->second.size()) {
            return corrupted("invalid unsigned integer in " + key);
        }
        return static_cast<uint64_t>(value);
    } catch (const std::exception&) {
        return corrupted("invalid unsigned integer in " + key);
    }
}

auto flat_json_reader::get_double(const std::string& key) const -> result<double> {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return corrupted("missing field " + key);
    }
    try {
        return std::stod(it->second);
    } catch (const std::exception&) {
        return corrupted("invalid number in " + key);
    }
}

auto flat_json_reader::get_bool(const std::string& key) const -> result<bool> {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return corrupted("missing field " + key);
    }
    if (it->second == "true") return true;
    if (it->second == "false") return false;
    return corrupted("invalid boolean in " + key);
}

// ============================================================================
// task
// ============================================================================

namespace {

// Propagates a failed field read out of the enclosing decode function
#define BT_CODEC_READ(var, expr)            \
    auto var##_result = (expr);             \
    if (!var##_result) {                    \
        return unexpected(var##_result.error()); \
    }                                       \
    auto var = std::move(var##_result.value())

auto encode_headers(const std::map<std::string, std::string>& headers) -> std::string {
    flat_json_writer w;
    for (const auto& [name, value] : headers) {
        w.add(name, value);
    }
    return w.str();
}

auto encode_string_list(const std::vector<std::string>& items) -> std::string {
    flat_json_writer w;
    w.add("count", static_cast<uint64_t>(items.size()));
    for (std::size_t i = 0; i < items.size(); ++i) {
        w.add(std::to_string(i), items[i]);
    }
    return w.str();
}

auto decode_string_list(const std::string& text) -> result<std::vector<std::string>> {
    BT_CODEC_READ(reader, flat_json_reader::parse(text));
    BT_CODEC_READ(count, reader.get_uint64("count"));
    std::vector<std::string> items;
    items.reserve(count);
    for (uint64_t i = 0; i < count; ++i) {
        BT_CODEC_READ(item, reader.get_string(std::to_string(i)));
        items.push_back(std::move(item));
    }
    return items;
}

auto task_kind_from_int(int64_t v) -> result<task_kind> {
    if (v < 0 || v > static_cast<int64_t>(task_kind::parallel_download)) {
        return corrupted("unknown task kind");
    }
    return static_cast<task_kind>(v);
}

auto task_status_from_int(int64_t v) -> result<task_status> {
    if (v < 0 || v > static_cast<int64_t>(task_status::paused)) {
        return corrupted("unknown task status");
    }
    return static_cast<task_status>(v);
}

}  // namespace

auto encode_task(const task& t) -> std::string {
    flat_json_writer w;
    w.add("task_id", t.task_id)
        .add("kind", static_cast<int>(t.kind))
        .add("url", t.url)
        .add("mirror_urls", encode_string_list(t.mirror_urls))
        .add("headers", encode_headers(t.headers))
        .add("http_method", t.http_method)
        .add("has_post", t.post.has_value())
        .add("post", t.post.value_or(""))
        .add("filename", t.filename)
        .add("directory", t.directory)
        .add("mime_type", t.mime_type)
        .add("priority", t.priority)
        .add("group", t.group)
        .add("requires_unmetered_network", t.requires_unmetered_network)
        .add("retries", t.retries)
        .add("retries_remaining", t.retries_remaining)
        .add("allow_pause", t.allow_pause)
        .add("chunk_count", t.chunk_count)
        .add("creation_time", time_point_to_ms(t.creation_time))
        .add("parent_task_id", t.parent_task_id)
        .add("byte_range_start", t.byte_range_start);
    if (t.byte_range_end) {
        w.add("byte_range_end", *t.byte_range_end);
    }
    return w.str();
}

auto decode_task(const std::string& text) -> result<task> {
    BT_CODEC_READ(r, flat_json_reader::parse(text));

    task t;
    BT_CODEC_READ(task_id, r.get_string("task_id"));
    BT_CODEC_READ(kind_value, r.get_int64("kind"));
    BT_CODEC_READ(kind, task_kind_from_int(kind_value));
    BT_CODEC_READ(url, r.get_string("url"));
    BT_CODEC_READ(priority, r.get_int64("priority"));
    BT_CODEC_READ(retries, r.get_int64("retries"));
    BT_CODEC_READ(retries_remaining, r.get_int64("retries_remaining"));

    t.task_id = std::move(task_id);
    t.kind = kind;
    t.url = std::move(url);
    t.priority = static_cast<int>(priority);
    t.retries = static_cast<int>(retries);
    t.retries_remaining = static_cast<int>(retries_remaining);

    if (r.has("mirror_urls")) {
        BT_CODEC_READ(mirrors, decode_string_list(r.get_string_or("mirror_urls", "")));
        t.mirror_urls = std::move(mirrors);
    }
    if (r.has("headers")) {
        BT_CODEC_READ(headers, flat_json_reader::parse(r.get_string_or("headers", "")));
        t.headers = headers.values();
    }

    t.http_method = r.get_string_or("http_method", "GET");
    if (r.get_string_or("has_post", "false") == "true") {
        t.post = r.get_string_or("post", "");
    }
    t.filename = r.get_string_or("filename", "");
    t.directory = r.get_string_or("directory", "");
    t.mime_type = r.get_string_or("mime_type", "");
    t.group = r.get_string_or("group", "default");
    t.requires_unmetered_network =
        r.get_string_or("requires_unmetered_network", "false") == "true";
    t.allow_pause = r.get_string_or("allow_pause", "true") == "true";

    if (r.has("chunk_count")) {
        BT_CODEC_READ(chunk_count, r.get_int64("chunk_count"));
        t.chunk_count = static_cast<int>(chunk_count);
    }
    if (r.has("creation_time")) {
        BT_CODEC_READ(created, r.get_int64("creation_time"));
        t.creation_time = ms_to_time_point(created);
    }
    t.parent_task_id = r.get_string_or("parent_task_id", "");
    if (r.has("byte_range_start")) {
        BT_CODEC_READ(start, r.get_uint64("byte_range_start"));
        t.byte_range_start = start;
    }
    if (r.has("byte_range_end")) {
        BT_CODEC_READ(end, r.get_uint64("byte_range_end"));
        t.byte_range_end = end;
    }
    return t;
}

// ============================================================================
// resume_token
// ============================================================================

namespace {

auto encode_simple_token(const simple_resume_token& token) -> std::string {
    flat_json_writer w;
    w.add("type", "simple")
        .add("data", to_hex(token.data))
        .add("bytes_transferred", token.bytes_transferred)
        .add("etag", token.etag);
    return w.str();
}

auto decode_simple_token(const flat_json_reader& r) -> result<simple_resume_token> {
    simple_resume_token token;
    BT_CODEC_READ(data_hex, r.get_string("data"));
    BT_CODEC_READ(data, from_hex(data_hex));
    BT_CODEC_READ(bytes, r.get_uint64("bytes_transferred"));
    token.data = std::move(data);
    token.bytes_transferred = bytes;
    token.etag = r.get_string_or("etag", "");
    return token;
}

auto encode_chunk_entry(const chunk_resume_entry& entry) -> std::string {
    flat_json_writer w;
    w.add("chunk_task_id", entry.chunk_task_id)
        .add("url", entry.url)
        .add("range_start", entry.range_start)
        .add("bytes_transferred", entry.bytes_transferred);
    if (entry.range_end) {
        w.add("range_end", *entry.range_end);
    }
    if (entry.child_token) {
        w.add("child_token", encode_simple_token(*entry.child_token));
    }
    if (entry.child_range_start) {
        w.add("child_range_start", *entry.child_range_start);
    }
    return w.str();
}

auto decode_chunk_entry(const std::string& text) -> result<chunk_resume_entry> {
    BT_CODEC_READ(r, flat_json_reader::parse(text));

    chunk_resume_entry entry;
    BT_CODEC_READ(id, r.get_string("chunk_task_id"));
    BT_CODEC_READ(start, r.get_uint64("range_start"));
    BT_CODEC_READ(bytes, r.get_uint64("bytes_transferred"));
    entry.chunk_task_id = std::move(id);
    entry.url = r.get_string_or("url", "");
    entry.range_start = start;
    entry.bytes_transferred = bytes;

    if (r.has("range_end")) {
        BT_CODEC_READ(end, r.get_uint64("range_end"));
        if (end < start) {
            return corrupted("chunk range end precedes start");
        }
        entry.range_end = end;
    }
    if (r.has("child_token")) {
        BT_CODEC_READ(child_reader, flat_json_reader::parse(r.get_string_or("child_token", "")));
        BT_CODEC_READ(child, decode_simple_token(child_reader));
        entry.child_token = std::move(child);
    }
    if (r.has("child_range_start")) {
        BT_CODEC_READ(child_start, r.get_uint64("child_range_start"));
        if (child_start < start || (entry.range_end && child_start > *entry.range_end)) {
            return corrupted("child token range lies outside the chunk range");
        }
        entry.child_range_start = child_start;
    }
    return entry;
}

}  // namespace

auto encode_resume_token(const resume_token& token) -> std::string {
    if (const auto* simple = std::get_if<simple_resume_token>(&token)) {
        return encode_simple_token(*simple);
    }

    const auto& composite = std::get<composite_resume_token>(token);
    flat_json_writer w;
    w.add("type", "composite")
        .add("chunk_count", static_cast<uint64_t>(composite.chunks.size()));
    if (composite.total_size) {
        w.add("total_size", *composite.total_size);
    }
    for (std::size_t i = 0; i < composite.chunks.size(); ++i) {
        w.add("chunk" + std::to_string(i), encode_chunk_entry(composite.chunks[i]));
    }
    return w.str();
}

auto decode_resume_token(const std::string& text) -> result<resume_token> {
    BT_CODEC_READ(r, flat_json_reader::parse(text));
    BT_CODEC_READ(type, r.get_string("type"));

    if (type == "simple") {
        BT_CODEC_READ(simple, decode_simple_token(r));
        return resume_token{std::move(simple)};
    }
    if (type != "composite") {
        return corrupted("unknown resume token type: " + type);
    }

    composite_resume_token composite;
    BT_CODEC_READ(count, r.get_uint64("chunk_count"));
    if (r.has("total_size")) {
        BT_CODEC_READ(total, r.get_uint64("total_size"));
        composite.total_size = total;
    }
    for (uint64_t i = 0; i < count; ++i) {
        BT_CODEC_READ(entry_text, r.get_string("chunk" + std::to_string(i)));
        BT_CODEC_READ(entry, decode_chunk_entry(entry_text));
        composite.chunks.push_back(std::move(entry));
    }
    return resume_token{std::move(composite)};
}

// ============================================================================
// updates
// ============================================================================

auto encode_update(const status_update& update) -> std::string {
    flat_json_writer w;
    w.add("task", encode_task(update.t))
        .add("status", static_cast<int>(update.status));
    if (update.exception) {
        w.add("exception_type", static_cast<int>(update.exception->type))
            .add("exception_description", update.exception->description)
            .add("exception_http_code", update.exception->http_response_code);
    }
    if (update.response_body) {
        w.add("response_body", *update.response_body);
    }
    if (update.response_status_code) {
        w.add("response_status_code", *update.response_status_code);
    }
    return w.str();
}

auto encode_update(const progress_update& update) -> std::string {
    flat_json_writer w;
    w.add("task", encode_task(update.t))
        .add("progress", update.progress)
        .add("expected_file_size", update.expected_file_size)
        .add("network_speed", update.network_speed)
        .add("time_remaining_ms", update.time_remaining_ms);
    return w.str();
}

auto encode_update(const resume_data_update& update) -> std::string {
    flat_json_writer w;
    w.add("task", encode_task(update.t))
        .add("token", encode_resume_token(update.token));
    return w.str();
}

auto decode_status_update(const std::string& text) -> result<status_update> {
    BT_CODEC_READ(r, flat_json_reader::parse(text));
    BT_CODEC_READ(task_text, r.get_string("task"));
    BT_CODEC_READ(t, decode_task(task_text));
    BT_CODEC_READ(status_value, r.get_int64("status"));
    BT_CODEC_READ(status, task_status_from_int(status_value));

    status_update update;
    update.t = std::move(t);
    update.status = status;

    if (r.has("exception_type")) {
        BT_CODEC_READ(type_value, r.get_int64("exception_type"));
        if (type_value < 0 ||
            type_value > static_cast<int64_t>(exception_type::http_response)) {
            return corrupted("unknown exception type");
        }
        BT_CODEC_READ(http_code, r.get_int64("exception_http_code"));
        task_exception ex;
        ex.type = static_cast<exception_type>(type_value);
        ex.description = r.get_string_or("exception_description", "");
        ex.http_response_code = static_cast<int>(http_code);
        update.exception = std::move(ex);
    }
    if (r.has("response_body")) {
        update.response_body = r.get_string_or("response_body", "");
    }
    if (r.has("response_status_code")) {
        BT_CODEC_READ(code, r.get_int64("response_status_code"));
        update.response_status_code = static_cast<int>(code);
    }
    return update;
}

auto decode_progress_update(const std::string& text) -> result<progress_update> {
    BT_CODEC_READ(r, flat_json_reader::parse(text));
    BT_CODEC_READ(task_text, r.get_string("task"));
    BT_CODEC_READ(t, decode_task(task_text));
    BT_CODEC_READ(progress, r.get_double("progress"));
    BT_CODEC_READ(size, r.get_int64("expected_file_size"));
    BT_CODEC_READ(speed, r.get_double("network_speed"));
    BT_CODEC_READ(remaining, r.get_int64("time_remaining_ms"));

    progress_update update;
    update.t = std::move(t);
    update.progress = progress;
    update.expected_file_size = size;
    update.network_speed = speed;
    update.time_remaining_ms = remaining;
    return update;
}

auto decode_resume_data_update(const std::string& text) -> result<resume_data_update> {
    BT_CODEC_READ(r, flat_json_reader::parse(text));
    BT_CODEC_READ(task_text, r.get_string("task"));
    BT_CODEC_READ(t, decode_task(task_text));
    BT_CODEC_READ(token_text, r.get_string("token"));
    BT_CODEC_READ(token, decode_resume_token(token_text));
    return resume_data_update{std::move(t), std::move(token)};
}

#undef BT_CODEC_READ

}  // namespace kcenon::background_transfer
