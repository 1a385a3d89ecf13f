#include <nocturne/core/error.hpp>
#include <unordered_map>

namespace nocturne::core {

namespace {
    // Map untuk error messages
    const std::unordered_map<ErrorCode, const char*> ERROR_MESSAGES = {
        // System errors
        {ErrorCode::Success, "Success"},
        {ErrorCode::Unknown, "Unknown error"},
        {ErrorCode::InvalidArgument, "Invalid argument"},
        {ErrorCode::InvalidState, "Invalid state"},
        {ErrorCode::NotSupported, "Not supported"},
        {ErrorCode::Cancelled, "Cancelled"},

        // Transport errors
        {ErrorCode::NotConnected, "Not connected"},
        {ErrorCode::ConnectionFailed, "Connection failed"},
        {ErrorCode::ConnectionClosed, "Connection closed"},
        {ErrorCode::IoError, "I/O error"},
        {ErrorCode::InvalidAddress, "Invalid address"},
        {ErrorCode::PermissionDenied, "Permission denied"},

        // Codec errors
        {ErrorCode::DecodeError, "Decode error"},
        {ErrorCode::FrameTooLarge, "Frame too large"},

        // Command errors
        {ErrorCode::InvalidCommand, "Invalid command"},
        {ErrorCode::MissingField, "Missing field"},
        {ErrorCode::UnknownCommand, "Unknown command"},
        {ErrorCode::NoMediaTarget, "No media target"},

        // Resource errors
        {ErrorCode::FileNotFound, "File not found"},
        {ErrorCode::FileAccessDenied, "File access denied"},
        {ErrorCode::ResourceNotFound, "Resource not found"},
        {ErrorCode::InvalidData, "Invalid data"}
    };

    // Map untuk error conditions
    const std::unordered_map<ErrorCode, std::errc> ERROR_CONDITIONS = {
        {ErrorCode::Cancelled, std::errc::operation_canceled},
        {ErrorCode::NotConnected, std::errc::not_connected},
        {ErrorCode::ConnectionFailed, std::errc::connection_refused},
        {ErrorCode::ConnectionClosed, std::errc::connection_reset},
        {ErrorCode::IoError, std::errc::io_error},
        {ErrorCode::InvalidAddress, std::errc::address_not_available},
        {ErrorCode::PermissionDenied, std::errc::permission_denied},
        {ErrorCode::FrameTooLarge, std::errc::message_size},
        {ErrorCode::FileNotFound, std::errc::no_such_file_or_directory},
        {ErrorCode::FileAccessDenied, std::errc::permission_denied},
        {ErrorCode::InvalidData, std::errc::invalid_argument}
    };
}

std::string ErrorCategory::message(int ev) const {
    auto code = static_cast<ErrorCode>(ev);
    auto it = ERROR_MESSAGES.find(code);
    return it != ERROR_MESSAGES.end() ? it->second : "Unknown error";
}

std::error_condition ErrorCategory::default_error_condition(int ev) const noexcept {
    auto code = static_cast<ErrorCode>(ev);
    auto it = ERROR_CONDITIONS.find(code);
    return it != ERROR_CONDITIONS.end() ? std::make_error_condition(it->second)
                                        : std::error_condition(ev, *this);
}

} // namespace nocturne::core
