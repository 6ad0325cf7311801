#pragma once

#include <string>
#include "core/errors/guard_errors.hpp"
#include "policy/verdict.hpp"
#include "protocol/hook_contract.hpp"

namespace prompt_guard::protocol {

core::errors::Result<HookRequest> parse_request(const std::string& raw);

std::string encode_response(const HookResponse& response);

HookResponse to_response(const policy::Verdict& verdict);

}  // namespace prompt_guard::protocol
