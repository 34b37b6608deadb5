/**
 * @file Error.cpp
 * @brief Error code names.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "rpl/core/Error.hpp"

namespace rpl::core {

std::string_view toString(ErrorCode code) noexcept
{
    switch (code)
    {
    case ErrorCode::kNone:                  return "None";
    case ErrorCode::kBufferOverflow:        return "BufferOverflow";
    case ErrorCode::kBufferUnderflow:       return "BufferUnderflow";
    case ErrorCode::kInvalidArgument:       return "InvalidArgument";
    case ErrorCode::kInvalidState:          return "InvalidState";
    case ErrorCode::kNotFound:              return "NotFound";
    case ErrorCode::kAlreadyExists:         return "AlreadyExists";
    case ErrorCode::kOutOfRange:            return "OutOfRange";
    case ErrorCode::kNetworkSendFailed:     return "NetworkSendFailed";
    case ErrorCode::kNetworkDisconnected:   return "NetworkDisconnected";
    case ErrorCode::kProtocolViolation:     return "ProtocolViolation";
    case ErrorCode::kSerializationFailed:   return "SerializationFailed";
    case ErrorCode::kDeserializationFailed: return "DeserializationFailed";
    case ErrorCode::kInternalError:         return "InternalError";
    }
    return "Unknown";
}

std::string Error::describe() const
{
    std::string out{toString(_code)};
    out += ": ";
    out += _message;
    return out;
}

} // namespace rpl::core
