// Copyright (c) 2024-2026 The Chainboard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <sstream>

namespace core {

std::string_view error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NONE:              return "NONE";

        case ErrorCode::PARSE_ERROR:       return "PARSE_ERROR";
        case ErrorCode::PARSE_OVERFLOW:    return "PARSE_OVERFLOW";
        case ErrorCode::PARSE_BAD_FORMAT:  return "PARSE_BAD_FORMAT";

        case ErrorCode::VALIDATION_ERROR:  return "VALIDATION_ERROR";
        case ErrorCode::VALIDATION_RANGE:  return "VALIDATION_RANGE";

        case ErrorCode::NETWORK_ERROR:     return "NETWORK_ERROR";
        case ErrorCode::NETWORK_TIMEOUT:   return "NETWORK_TIMEOUT";
        case ErrorCode::NETWORK_REFUSED:   return "NETWORK_REFUSED";
        case ErrorCode::NETWORK_CLOSED:    return "NETWORK_CLOSED";
        case ErrorCode::NETWORK_TLS:       return "NETWORK_TLS";

        case ErrorCode::CRYPTO_ERROR:      return "CRYPTO_ERROR";
        case ErrorCode::CRYPTO_SIG_FAIL:   return "CRYPTO_SIG_FAIL";
        case ErrorCode::CRYPTO_KEY_FAIL:   return "CRYPTO_KEY_FAIL";

        case ErrorCode::STORAGE_ERROR:     return "STORAGE_ERROR";
        case ErrorCode::STORAGE_NOT_FOUND: return "STORAGE_NOT_FOUND";
        case ErrorCode::STORAGE_CORRUPT:   return "STORAGE_CORRUPT";
        case ErrorCode::STORAGE_LOCKED:    return "STORAGE_LOCKED";

        case ErrorCode::RPC_BAD_RESPONSE:  return "RPC_BAD_RESPONSE";
        case ErrorCode::RPC_REMOTE_ERROR:  return "RPC_REMOTE_ERROR";

        case ErrorCode::TX_ERROR:          return "TX_ERROR";

        case ErrorCode::CONFIG_ERROR:      return "CONFIG_ERROR";
        case ErrorCode::CONFIG_MISSING:    return "CONFIG_MISSING";

        case ErrorCode::INTERNAL_ERROR:    return "INTERNAL_ERROR";
    }

    return "UNKNOWN";
}

// "CODE(n): message [file:line]"
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
            << ':' << location_.line() << ']';
    }

    return oss.str();
}

} // namespace core
