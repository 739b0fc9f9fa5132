/**
 * @file test_task_codec.cpp
 * @brief Unit tests for the durable record encoding
 */

#include <gtest/gtest.h>

#include <kcenon/background_transfer/core/task_codec.h>

#include <string>

namespace kcenon::background_transfer::test {

// =============================================================================
// Flat JSON
// =============================================================================

class FlatJsonTest : public ::testing::Test {};

TEST_F(FlatJsonTest, WriterAndReaderAgreeOnTypes) {
    flat_json_writer w;
    w.add("name", "quote\" and \\ slash")
        .add("count", static_cast<uint64_t>(18446744073709551615ull))
        .add("offset", static_cast<int64_t>(-42))
        .add("ratio", 0.25)
        .add("flag", true);

    auto reader = flat_json_reader::parse(w.str());
    ASSERT_TRUE(reader.has_value());
    const auto& r = reader.value();

    EXPECT_EQ(r.get_string("name").value(), "quote\" and \\ slash");
    EXPECT_EQ(r.get_uint64("count").value(), 18446744073709551615ull);
    EXPECT_EQ(r.get_int64("offset").value(), -42);
    EXPECT_DOUBLE_EQ(r.get_double("ratio").value(), 0.25);
    EXPECT_TRUE(r.get_bool("flag").value());
}

TEST_F(FlatJsonTest, ControlCharactersSurvive) {
    flat_json_writer w;
    w.add("text", std::string("a\nb\tc\x01", 6));

    auto reader = flat_json_reader::parse(w.str());
    ASSERT_TRUE(reader.has_value());
    EXPECT_EQ(reader.value().get_string("text").value(), std::string("a\nb\tc\x01", 6));
}

TEST_F(FlatJsonTest, EmptyObject) {
    auto reader = flat_json_reader::parse("{ }");
    ASSERT_TRUE(reader.has_value());
    EXPECT_TRUE(reader.value().values().empty());
}

TEST_F(FlatJsonTest, MissingFieldIsCorruption) {
    auto reader = flat_json_reader::parse(R"({"a": 1})");
    ASSERT_TRUE(reader.has_value());
    EXPECT_EQ(reader.value().get_string("b").error().code, error_code::state_corrupted);
    EXPECT_EQ(reader.value().get_string_or("b", "fallback"), "fallback");
}

TEST_F(FlatJsonTest, RejectsMalformedInput) {
    EXPECT_FALSE(flat_json_reader::parse("").has_value());
    EXPECT_FALSE(flat_json_reader::parse("[1, 2]").has_value());
    EXPECT_FALSE(flat_json_reader::parse(R"({"a" 1})").has_value());
    EXPECT_FALSE(flat_json_reader::parse(R"({"a": "unterminated)").has_value());
    EXPECT_FALSE(flat_json_reader::parse(R"({"a": 1)").has_value());
}

TEST_F(FlatJsonTest, RejectsBadNumbers) {
    auto reader = flat_json_reader::parse(R"({"n": 12abc, "neg": -5, "b": maybe})");
    ASSERT_TRUE(reader.has_value());
    const auto& r = reader.value();
    EXPECT_FALSE(r.get_int64("n").has_value());
    EXPECT_FALSE(r.get_uint64("neg").has_value());
    EXPECT_EQ(r.get_int64("neg").value(), -5);
    EXPECT_FALSE(r.get_bool("b").has_value());
}

// =============================================================================
// Task Encoding
// =============================================================================

class TaskCodecTest : public ::testing::Test {
protected:
    static auto make_chunk_task() -> task {
        task t;
        t.task_id = "p1.chunk1";
        t.kind = task_kind::download;
        t.url = "https://cdn.example.com/big.iso?sig=a\"b";
        t.mirror_urls = {"https://m1.example.com/big.iso", "https://m2.example.com/big.iso"};
        t.headers = {{"Authorization", "Bearer x"}, {"Range", "bytes=100-199"}};
        t.http_method = "GET";
        t.filename = "big.iso";
        t.directory = "downloads/iso";
        t.priority = 2;
        t.group = "isos";
        t.requires_unmetered_network = true;
        t.retries = 3;
        t.retries_remaining = 1;
        t.allow_pause = false;
        t.creation_time = std::chrono::system_clock::time_point(
            std::chrono::milliseconds(1700000000123));
        t.parent_task_id = "p1";
        t.byte_range_start = 100;
        t.byte_range_end = 199;
        return t;
    }
};

TEST_F(TaskCodecTest, NestedFieldsSurviveEncoding) {
    auto original = make_chunk_task();

    auto decoded = decode_task(encode_task(original));
    ASSERT_TRUE(decoded.has_value()) << decoded.error().message;
    const auto& t = decoded.value();

    EXPECT_EQ(t.task_id, original.task_id);
    EXPECT_EQ(t.url, original.url);
    EXPECT_EQ(t.mirror_urls, original.mirror_urls);
    EXPECT_EQ(t.headers, original.headers);
    EXPECT_EQ(t.directory, original.directory);
    EXPECT_EQ(t.priority, 2);
    EXPECT_EQ(t.group, "isos");
    EXPECT_TRUE(t.requires_unmetered_network);
    EXPECT_EQ(t.retries_remaining, 1);
    EXPECT_FALSE(t.allow_pause);
    EXPECT_EQ(t.creation_time, original.creation_time);
    EXPECT_EQ(t.parent_task_id, "p1");
    EXPECT_EQ(t.byte_range_start, 100u);
    EXPECT_EQ(t.byte_range_end, 199u);
    EXPECT_FALSE(t.post.has_value());
}

TEST_F(TaskCodecTest, PostBodyAndOpenRange) {
    task original;
    original.task_id = "req";
    original.kind = task_kind::data_request;
    original.url = "https://api.example.com/v1";
    original.http_method = "POST";
    original.post = "";

    auto decoded = decode_task(encode_task(original));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value().kind, task_kind::data_request);
    ASSERT_TRUE(decoded.value().post.has_value());
    EXPECT_TRUE(decoded.value().post->empty());
    EXPECT_FALSE(decoded.value().byte_range_end.has_value());
}

TEST_F(TaskCodecTest, RejectsUnknownKind) {
    auto text = encode_task(make_chunk_task());
    auto pos = text.find("\"kind\": 0");
    ASSERT_NE(pos, std::string::npos);
    text.replace(pos, 9, "\"kind\": 9");

    auto decoded = decode_task(text);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code, error_code::state_corrupted);
}

TEST_F(TaskCodecTest, RejectsMissingIdentity) {
    EXPECT_FALSE(decode_task(R"({"kind": 0, "url": "https://a.example.com"})").has_value());
}

// =============================================================================
// Resume Token Encoding
// =============================================================================

class ResumeTokenCodecTest : public ::testing::Test {};

TEST_F(ResumeTokenCodecTest, SimpleTokenBytesPreserved) {
    simple_resume_token token{{std::byte{0x00}, std::byte{0xAB}, std::byte{0xFF}}, 4096,
                              "\"v1\""};

    auto decoded = decode_resume_token(encode_resume_token(token));
    ASSERT_TRUE(decoded.has_value());
    ASSERT_FALSE(is_composite(decoded.value()));

    const auto& simple = std::get<simple_resume_token>(decoded.value());
    EXPECT_EQ(simple.data, token.data);
    EXPECT_EQ(simple.bytes_transferred, 4096u);
    EXPECT_EQ(simple.etag, "\"v1\"");
}

TEST_F(ResumeTokenCodecTest, CompositeTokenKeepsChunkOrderAndChildTokens) {
    composite_resume_token token;
    token.total_size = 200;
    token.chunks.push_back({"p.chunk0", "https://a.example.com/x", 0, 99, 50,
                            simple_resume_token{{std::byte{7}}, 50, ""}});
    token.chunks.push_back({"p.chunk1", "https://a.example.com/x", 100, 199, 0, std::nullopt});
    token.chunks[0].child_range_start = 30;

    auto decoded = decode_resume_token(encode_resume_token(token));
    ASSERT_TRUE(decoded.has_value()) << decoded.error().message;
    ASSERT_TRUE(is_composite(decoded.value()));

    const auto& composite = std::get<composite_resume_token>(decoded.value());
    EXPECT_EQ(composite.total_size, 200u);
    ASSERT_EQ(composite.chunks.size(), 2u);
    EXPECT_EQ(composite.chunks[0].chunk_task_id, "p.chunk0");
    EXPECT_EQ(composite.chunks[0].bytes_transferred, 50u);
    ASSERT_TRUE(composite.chunks[0].child_token.has_value());
    EXPECT_EQ(composite.chunks[0].child_token->data.size(), 1u);
    EXPECT_EQ(composite.chunks[0].child_range_start, 30u);
    EXPECT_EQ(composite.chunks[1].range_start, 100u);
    EXPECT_EQ(composite.chunks[1].range_end, 199u);
    EXPECT_FALSE(composite.chunks[1].child_token.has_value());
    EXPECT_FALSE(composite.chunks[1].child_range_start.has_value());
}

TEST_F(ResumeTokenCodecTest, RejectsCorruptTokens) {
    EXPECT_FALSE(decode_resume_token(R"({"type": "mystery"})").has_value());
    EXPECT_FALSE(
        decode_resume_token(R"({"type": "simple", "data": "abc", "bytes_transferred": 1})")
            .has_value());
    EXPECT_FALSE(
        decode_resume_token(R"({"type": "simple", "data": "zz", "bytes_transferred": 1})")
            .has_value());
    EXPECT_FALSE(decode_resume_token(R"({"type": "composite", "chunk_count": 1})").has_value());
}

TEST_F(ResumeTokenCodecTest, RejectsInvertedChunkRange) {
    flat_json_writer entry;
    entry.add("chunk_task_id", "p.chunk0")
        .add("range_start", static_cast<uint64_t>(100))
        .add("range_end", static_cast<uint64_t>(10))
        .add("bytes_transferred", static_cast<uint64_t>(0));
    flat_json_writer w;
    w.add("type", "composite")
        .add("chunk_count", static_cast<uint64_t>(1))
        .add("chunk0", entry.str());

    EXPECT_FALSE(decode_resume_token(w.str()).has_value());
}

TEST_F(ResumeTokenCodecTest, RejectsChildRangeOutsideChunk) {
    flat_json_writer entry;
    entry.add("chunk_task_id", "p.chunk0")
        .add("range_start", static_cast<uint64_t>(100))
        .add("range_end", static_cast<uint64_t>(199))
        .add("bytes_transferred", static_cast<uint64_t>(0))
        .add("child_range_start", static_cast<uint64_t>(250));
    flat_json_writer w;
    w.add("type", "composite")
        .add("chunk_count", static_cast<uint64_t>(1))
        .add("chunk0", entry.str());

    EXPECT_FALSE(decode_resume_token(w.str()).has_value());
}

// =============================================================================
// Update Encoding
// =============================================================================

class UpdateCodecTest : public ::testing::Test {
protected:
    static auto make_task() -> task {
        task t;
        t.task_id = "t1";
        t.url = "https://files.example.com/a.bin";
        return t;
    }
};

TEST_F(UpdateCodecTest, StatusUpdateWithException) {
    status_update update;
    update.t = make_task();
    update.status = task_status::failed;
    update.exception = task_exception{exception_type::http_response, "Gone", 410};
    update.response_status_code = 410;
    update.response_body = "{\"error\":\"gone\"}";

    auto decoded = decode_status_update(encode_update(update));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value().t.task_id, "t1");
    EXPECT_EQ(decoded.value().status, task_status::failed);
    ASSERT_TRUE(decoded.value().exception.has_value());
    EXPECT_EQ(decoded.value().exception->type, exception_type::http_response);
    EXPECT_EQ(decoded.value().exception->http_response_code, 410);
    EXPECT_EQ(decoded.value().response_body, update.response_body);
    EXPECT_EQ(decoded.value().response_status_code, 410);
}

TEST_F(UpdateCodecTest, StatusUpdateWithoutOptionals) {
    status_update update;
    update.t = make_task();
    update.status = task_status::running;

    auto decoded = decode_status_update(encode_update(update));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_FALSE(decoded.value().exception.has_value());
    EXPECT_FALSE(decoded.value().response_body.has_value());
    EXPECT_FALSE(decoded.value().response_status_code.has_value());
}

TEST_F(UpdateCodecTest, ProgressUpdateKeepsSentinel) {
    progress_update update;
    update.t = make_task();
    update.progress = progress_sentinel::waiting_to_retry;
    update.expected_file_size = 1 << 20;

    auto decoded = decode_progress_update(encode_update(update));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_DOUBLE_EQ(decoded.value().progress, -4.0);
    EXPECT_EQ(decoded.value().expected_file_size, 1 << 20);
    EXPECT_DOUBLE_EQ(decoded.value().network_speed, -1.0);
    EXPECT_EQ(decoded.value().time_remaining_ms, -1);
}

TEST_F(UpdateCodecTest, ResumeDataUpdate) {
    resume_data_update update{make_task(), simple_resume_token{{std::byte{42}}, 10, ""}};

    auto decoded = decode_resume_data_update(encode_update(update));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value().t.task_id, "t1");
    ASSERT_FALSE(is_composite(decoded.value().token));
    EXPECT_EQ(std::get<simple_resume_token>(decoded.value().token).data.front(),
              std::byte{42});
}

TEST_F(UpdateCodecTest, RejectsUnknownStatus) {
    flat_json_writer w;
    w.add("task", encode_task(make_task())).add("status", 99);

    auto decoded = decode_status_update(w.str());
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code, error_code::state_corrupted);
}

}  // namespace kcenon::background_transfer::test
