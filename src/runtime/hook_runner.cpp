#include "runtime/hook_runner.hpp"

#include <exception>
#include <iterator>
#include "core/logging/logger.hpp"
#include "protocol/hook_codec.hpp"

namespace prompt_guard::runtime {

using core::errors::ErrorCategory;
using core::errors::GuardError;
using policy::Allowed;
using policy::AllowedWithNotice;
using policy::Verdict;

namespace {

const std::string kParseErrorPrefix = u8"JSON 解析錯誤: ";
const std::string kInternalErrorPrefix = u8"檢查過程中發生錯誤: ";

}  // namespace

core::errors::Result<std::string> read_payload(std::istream& in) {
    std::string raw{std::istreambuf_iterator<char>(in),
                    std::istreambuf_iterator<char>()};
    if (in.bad()) {
        return GuardError{ErrorCategory::Internal,
                          "Unable to read hook payload from input stream.",
                          "read_failed"};
    }
    return raw;
}

Verdict make_failure_verdict(const GuardError& error) {
    if (error.code == "json_parse_error") {
        return AllowedWithNotice{kParseErrorPrefix + error.message};
    }
    return AllowedWithNotice{kInternalErrorPrefix + error.message};
}

Verdict make_exception_verdict(std::exception_ptr failure) {
    GuardError err{ErrorCategory::Internal, "no exception", "unhandled_exception"};
    try {
        if (failure) {
            std::rethrow_exception(failure);
        }
    } catch (const std::exception& e) {
        err.message = e.what();
    } catch (...) {
        err.message = "exception of unknown type";
    }
    LOG_ERROR("Unhandled failure [" + err.code + "]: " + err.message);
    return make_failure_verdict(err);
}

HookRunner::HookRunner(const policy::DetectorBattery& battery)
    : engine_(battery) {}

Verdict HookRunner::run_payload(const std::string& raw) const {
    auto parsed = protocol::parse_request(raw);
    if (core::errors::is_error(parsed)) {
        const auto& err = core::errors::get_error(parsed);
        LOG_WARN("Payload rejected [" + err.code + "]: " + err.message);
        return make_failure_verdict(err);
    }

    const auto& request = core::errors::get_value(parsed);
    if (!request.prompt.has_value() || request.prompt->empty()) {
        LOG_DEBUG("No prompt in payload.");
        return Allowed{};
    }

    try {
        return engine_.evaluate(request.prompt.value());
    } catch (const std::exception& e) {
        const GuardError err{ErrorCategory::Internal, e.what(),
                             "detector_failed"};
        LOG_ERROR("Detector evaluation failed [" + err.code + "]: " + err.message);
        return make_failure_verdict(err);
    }
}

Verdict HookRunner::run(std::istream& in) const {
    auto payload = read_payload(in);
    if (core::errors::is_error(payload)) {
        const auto& err = core::errors::get_error(payload);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        return make_failure_verdict(err);
    }
    return run_payload(core::errors::get_value(payload));
}

bool HookRunner::respond(std::istream& in, std::ostream& out) const {
    return write_response(run(in), out);
}

bool write_response(const Verdict& verdict, std::ostream& out) {
    LOG_DEBUG("Verdict: " + policy::to_string(verdict));
    out << protocol::encode_response(protocol::to_response(verdict));
    out.flush();
    if (!out.good()) {
        LOG_ERROR("Unable to write hook response.");
        return false;
    }
    return true;
}

}  // namespace prompt_guard::runtime
