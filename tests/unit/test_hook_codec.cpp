#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/guard_errors.hpp"
#include "policy/verdict.hpp"
#include "protocol/hook_codec.hpp"

namespace {

using prompt_guard::core::errors::ErrorCategory;
using prompt_guard::core::errors::get_error;
using prompt_guard::core::errors::get_value;
using prompt_guard::core::errors::is_error;
using prompt_guard::protocol::encode_response;
using prompt_guard::protocol::HookResponse;
using prompt_guard::protocol::parse_request;
using prompt_guard::protocol::to_response;
using nlohmann::json;

TEST(HookCodecTest, ReadsPromptAndIgnoresOtherFields) {
    auto result = parse_request(
        R"({"prompt": "hello", "conversation_id": "c-1", "attachments": []})");
    ASSERT_FALSE(is_error(result));
    ASSERT_TRUE(get_value(result).prompt.has_value());
    EXPECT_EQ(get_value(result).prompt.value(), "hello");
}

TEST(HookCodecTest, MissingOrNullPromptIsNotAnError) {
    auto missing = parse_request(R"({"hook_event_name": "beforeSubmitPrompt"})");
    ASSERT_FALSE(is_error(missing));
    EXPECT_FALSE(get_value(missing).prompt.has_value());

    auto null_prompt = parse_request(R"({"prompt": null})");
    ASSERT_FALSE(is_error(null_prompt));
    EXPECT_FALSE(get_value(null_prompt).prompt.has_value());
}

TEST(HookCodecTest, FalsyPromptValuesAreAbsent) {
    for (const char* payload : {R"({"prompt": 0})", R"({"prompt": false})",
                                R"({"prompt": []})", R"({"prompt": {}})"}) {
        auto result = parse_request(payload);
        ASSERT_FALSE(is_error(result)) << payload;
        EXPECT_FALSE(get_value(result).prompt.has_value()) << payload;
    }

    auto truthy = parse_request(R"({"prompt": [0]})");
    ASSERT_TRUE(is_error(truthy));
    EXPECT_EQ(get_error(truthy).code, "invalid_prompt_type");
}

TEST(HookCodecTest, ReadsUtf8Prompt) {
    auto result = parse_request(u8R"({"prompt": "密碼: abc123"})");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).prompt.value(), u8"密碼: abc123");
}

TEST(HookCodecTest, RejectsMalformedJson) {
    auto result = parse_request("{\"prompt\": ");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Framing);
    EXPECT_EQ(get_error(result).code, "json_parse_error");
    EXPECT_FALSE(get_error(result).message.empty());
}

TEST(HookCodecTest, RejectsEmptyInput) {
    auto result = parse_request("");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "json_parse_error");
}

TEST(HookCodecTest, RejectsNonObjectRoot) {
    auto result = parse_request(R"(["prompt", "hello"])");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_payload");
}

TEST(HookCodecTest, RejectsNonStringPrompt) {
    auto result = parse_request(R"({"prompt": 42})");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_prompt_type");
}

TEST(HookCodecTest, RejectsInvalidUtf8) {
    auto result = parse_request(std::string("{\"prompt\": \"a\xff\"}"));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "json_parse_error");
}

TEST(HookCodecTest, OmitsUserMessageWhenAbsent) {
    HookResponse response;
    response.continue_submission = true;
    EXPECT_EQ(encode_response(response), R"({"continue":true})");
}

TEST(HookCodecTest, KeepsNonAsciiMessageUnescaped) {
    HookResponse response;
    response.continue_submission = false;
    response.user_message = u8"檢測到密碼資訊";

    const std::string encoded = encode_response(response);
    EXPECT_NE(encoded.find(u8"檢測到密碼資訊"), std::string::npos);

    const auto decoded = json::parse(encoded);
    EXPECT_FALSE(decoded.at("continue").get<bool>());
    EXPECT_EQ(decoded.at("user_message").get<std::string>(), u8"檢測到密碼資訊");
}

TEST(HookCodecTest, EncodesInvalidUtf8MessageWithoutThrowing) {
    HookResponse response;
    response.user_message = std::string("bad byte \xff here");
    std::string encoded;
    EXPECT_NO_THROW(encoded = encode_response(response));
    EXPECT_NO_THROW(json::parse(encoded));
}

TEST(HookCodecTest, MapsVerdictsToResponses) {
    const auto allowed = to_response(prompt_guard::policy::Allowed{});
    EXPECT_TRUE(allowed.continue_submission);
    EXPECT_FALSE(allowed.user_message.has_value());

    const auto notice =
        to_response(prompt_guard::policy::AllowedWithNotice{"could not read"});
    EXPECT_TRUE(notice.continue_submission);
    EXPECT_EQ(notice.user_message, std::string("could not read"));
}

}  // namespace
