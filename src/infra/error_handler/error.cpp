#include "error.hpp"
#include <fmt/core.h>
#include <cstdlib>

namespace grace::infra {

bool Error::is_fatal() const {
    switch (code) {
        case ErrorCode::SignalSetupFailed:
        case ErrorCode::SignalSourceBusy:
        case ErrorCode::UnsupportedSignal:
        case ErrorCode::ConfigParse:
        case ErrorCode::InvalidArgument:
            return true;
        default:
            return false;
    }
}

int Error::to_exit_code() const {
    switch (code) {
        case ErrorCode::ConfigParse:          return 2;
        case ErrorCode::InvalidArgument:      return 64; // EX_USAGE
        case ErrorCode::SignalSetupFailed:
        case ErrorCode::SignalSourceBusy:
        case ErrorCode::UnsupportedSignal:    return 71; // EX_OSERR
        default:                              return EXIT_FAILURE;
    }
}

const char* Error::what() const {
    return message.c_str();
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, std::string(message), loc};
}

Error make_system_error(ErrorCode code, std::string_view context,
                        std::error_code ec, const std::source_location& loc) {
    return Error{code, fmt::format("{}: {}", context, ec.message()), loc};
}

Error log_and_return(Error&& err) {
    auto level = err.is_fatal() ? spdlog::level::err : spdlog::level::warn;
    spdlog::log(level,
        "[{}:{} in {}] {}: {}",
        err.file, err.line, err.function,
        to_string(err.code), err.message
    );
    return std::move(err);
}

std::string_view to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::SignalSetupFailed:    return "SignalSetupFailed";
        case ErrorCode::SignalSourceBusy:     return "SignalSourceBusy";
        case ErrorCode::UnsupportedSignal:    return "UnsupportedSignal";
        case ErrorCode::ConfigParse:          return "ConfigParse";
        case ErrorCode::InvalidArgument:      return "InvalidArgument";
        case ErrorCode::ResourceOpenFailure:  return "ResourceOpenFailure";
        case ErrorCode::ResourceCloseFailure: return "ResourceCloseFailure";
        case ErrorCode::QueueClosed:          return "QueueClosed";
        case ErrorCode::Unknown:              return "Unknown";
    }
    return "Unknown";
}

} // namespace grace::infra
