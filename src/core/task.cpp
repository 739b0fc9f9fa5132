/**
 * @file task.cpp
 * @brief URL parsing and task validation
 */

#include <kcenon/background_transfer/core/task.h>

#include <algorithm>
#include <cctype>
#include <regex>

namespace kcenon::background_transfer {

namespace {

auto to_lower(std::string s) -> std::string {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

}  // namespace

auto parse_url(const std::string& url) -> result<parsed_url> {
    // scheme://[userinfo@]host[:port][/path][?query][#fragment]
    static const std::regex url_pattern(
        R"(^([A-Za-z][A-Za-z0-9+.\-]*)://(?:[^@/?#]*@)?(\[[0-9A-Fa-f:.]+\]|[^:/?#\[\]@]+)(?::([0-9]{1,5}))?([^?#]*)(?:\?[^#]*)?(?:#.*)?$)");

    std::smatch match;
    if (!std::regex_match(url, match, url_pattern)) {
        return unexpected(error{error_code::invalid_url, "not an absolute url: " + url});
    }

    parsed_url parsed;
    parsed.scheme = to_lower(match[1].str());
    if (parsed.scheme != "http" && parsed.scheme != "https") {
        return unexpected(error{error_code::invalid_url,
                                "unsupported scheme: " + parsed.scheme});
    }

    parsed.host = to_lower(match[2].str());
    if (parsed.host.empty()) {
        return unexpected(error{error_code::invalid_url, "missing host: " + url});
    }

    if (match[3].matched) {
        auto port = std::stoul(match[3].str());
        if (port == 0 || port > 65535) {
            return unexpected(error{error_code::invalid_url, "invalid port: " + url});
        }
        parsed.port = static_cast<uint16_t>(port);
    } else {
        parsed.port = parsed.scheme == "https" ? 443 : 80;
    }

    parsed.path = match[4].str().empty() ? "/" : match[4].str();
    return parsed;
}

auto host_of(const task& t) -> std::string {
    auto parsed = parse_url(t.url);
    if (!parsed) {
        return {};
    }
    return parsed.value().host;
}

auto validate_task(const task& t) -> result<void> {
    if (t.task_id.empty()) {
        return unexpected(error{error_code::invalid_request, "task id is empty"});
    }

    auto url_result = parse_url(t.url);
    if (!url_result) {
        return unexpected(url_result.error());
    }

    for (const auto& mirror : t.mirror_urls) {
        auto mirror_result = parse_url(mirror);
        if (!mirror_result) {
            return unexpected(mirror_result.error());
        }
    }

    if (t.priority < 0 || t.priority > 10) {
        return unexpected(error{error_code::invalid_request,
                                "priority must be between 0 and 10"});
    }

    if (t.retries < 0 || t.retries_remaining < 0 || t.retries_remaining > t.retries) {
        return unexpected(error{error_code::invalid_request,
                                "retries_remaining must be between 0 and retries"});
    }

    if (t.chunk_count < 0) {
        return unexpected(error{error_code::invalid_request,
                                "chunk_count must not be negative"});
    }

    if (t.byte_range_end && *t.byte_range_end < t.byte_range_start) {
        return unexpected(error{error_code::invalid_request,
                                "byte range end precedes start"});
    }

    return {};
}

}  // namespace kcenon::background_transfer
