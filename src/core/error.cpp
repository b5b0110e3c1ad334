// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <sstream>

namespace core {

// ---------------------------------------------------------------------------
// error_code_name: human-readable label for every ErrorCode variant
// ---------------------------------------------------------------------------
std::string_view error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NONE:              return "NONE";

        case ErrorCode::STREAM_ERROR:      return "STREAM_ERROR";
        case ErrorCode::STREAM_CLOSED:     return "STREAM_CLOSED";
        case ErrorCode::STREAM_IO:         return "STREAM_IO";

        case ErrorCode::PRODUCER_ERROR:    return "PRODUCER_ERROR";
        case ErrorCode::PRODUCER_FAULT:    return "PRODUCER_FAULT";

        case ErrorCode::HANDLER_ERROR:     return "HANDLER_ERROR";
        case ErrorCode::HANDLER_FAULT:     return "HANDLER_FAULT";

        case ErrorCode::CONTEXT_CANCELLED: return "CONTEXT_CANCELLED";
        case ErrorCode::CONTEXT_DEADLINE:  return "CONTEXT_DEADLINE";

        case ErrorCode::CONFIG_ERROR:      return "CONFIG_ERROR";
        case ErrorCode::CONFIG_INVALID:    return "CONFIG_INVALID";

        case ErrorCode::IO_ERROR:          return "IO_ERROR";
        case ErrorCode::IO_NOT_FOUND:      return "IO_NOT_FOUND";

        case ErrorCode::CRYPTO_ERROR:      return "CRYPTO_ERROR";

        case ErrorCode::INTERNAL_ERROR:    return "INTERNAL_ERROR";
        case ErrorCode::NOT_IMPLEMENTED:   return "NOT_IMPLEMENTED";
        case ErrorCode::OUT_OF_MEMORY:     return "OUT_OF_MEMORY";
    }

    return "UNKNOWN";
}

std::string Error::format() const {
    if (code_ == ErrorCode::NONE) {
        return "no error";
    }

    std::ostringstream oss;
    oss << error_code_name(code_)
        << '(' << static_cast<uint16_t>(code_) << ')';

    if (!message_.empty()) {
        oss << ": " << message_;
    }

    const char* file = location_.file_name();
    if (file && file[0] != '\0') {
        oss << " [" << file
            << ':' << location_.line()
            << ':' << location_.column() << ']';
    }

    return oss.str();
}

} // namespace core
