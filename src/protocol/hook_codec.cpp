#include "protocol/hook_codec.hpp"

#include <nlohmann/json.hpp>

namespace prompt_guard::protocol {

using core::errors::ErrorCategory;
using core::errors::GuardError;
using nlohmann::json;

namespace {

// null, false, zero and empty containers carry nothing to check.
bool is_blank(const json& value) {
    if (value.is_null()) {
        return true;
    }
    if (value.is_boolean()) {
        return !value.get<bool>();
    }
    if (value.is_number()) {
        return value.get<double>() == 0.0;
    }
    if (value.is_array() || value.is_object()) {
        return value.empty();
    }
    return false;
}

}  // namespace

core::errors::Result<HookRequest> parse_request(const std::string& raw) {
    json payload;
    try {
        payload = json::parse(raw);
    } catch (const json::parse_error& e) {
        return GuardError{ErrorCategory::Framing, e.what(), "json_parse_error"};
    }

    if (!payload.is_object()) {
        return GuardError{ErrorCategory::Framing,
                          std::string("Hook payload must be a JSON object, got ") +
                              payload.type_name(),
                          "invalid_payload"};
    }

    HookRequest request;
    const auto it = payload.find(fields::kPrompt);
    if (it == payload.end() || (!it->is_string() && is_blank(*it))) {
        return request;
    }
    if (!it->is_string()) {
        return GuardError{ErrorCategory::Framing,
                          std::string("Field 'prompt' must be a string, got ") +
                              it->type_name(),
                          "invalid_prompt_type"};
    }

    request.prompt = it->get<std::string>();
    return request;
}

std::string encode_response(const HookResponse& response) {
    json payload;
    payload[fields::kContinue] = response.continue_submission;
    if (response.user_message.has_value()) {
        payload[fields::kUserMessage] = response.user_message.value();
    }
    // Messages may quote parser output built from raw input bytes.
    return payload.dump(-1, ' ', false, json::error_handler_t::replace);
}

HookResponse to_response(const policy::Verdict& verdict) {
    HookResponse response;
    response.continue_submission = policy::allows_submission(verdict);
    response.user_message = policy::message_of(verdict);
    return response;
}

}  // namespace prompt_guard::protocol
