// result.cpp - Error code names and formatting

#include <jsonrfc/result.h>

namespace jsonrfc {

std::string_view error_code_name(ErrorCode code) noexcept
{
    switch (code) {
    case ErrorCode::InvalidPointer:   return "invalid_pointer";
    case ErrorCode::InvalidPath:      return "invalid_path";
    case ErrorCode::InvalidTarget:    return "invalid_target";
    case ErrorCode::InvalidOperation: return "invalid_operation";
    case ErrorCode::Rejected:         return "rejected";
    }
    return "unknown";
}

std::string to_string(const Error& error)
{
    std::string out{error_code_name(error.code)};
    if (!error.message.empty()) {
        out += ": ";
        out += error.message;
    }
    return out;
}

} // namespace jsonrfc
