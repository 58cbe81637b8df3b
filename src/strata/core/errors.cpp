/**
 * @file errors.cpp
 * @brief Labels for codec errors and the debug byte formatter.
 */
#include "strata/core/errors.hpp"
#include "strata/core/bytes.hpp"

#include <cstdio>

namespace strata {

const char* to_string(CodecError e) noexcept {
    switch (e) {
        case CodecError::NeedData:            return "need_data";
        case CodecError::Malformed:           return "malformed";
        case CodecError::PackFailed:          return "pack_failed";
        case CodecError::BodyHandlerAttached: return "body_handler_attached";
        case CodecError::UnknownField:        return "unknown_field";
        case CodecError::FieldKindMismatch:   return "field_kind_mismatch";
        case CodecError::DuplicateField:      return "duplicate_field";
        case CodecError::NullLayer:           return "null_layer";
        case CodecError::InvalidArgument:     return "invalid_argument";
    }
    return "unknown";
}

std::string byte2hex(ByteView buf) {
    std::string out;
    out.reserve(buf.size() * 4);
    char tmp[5];
    for (auto b : buf) {
        std::snprintf(tmp, sizeof(tmp), "\\x%02X", static_cast<unsigned>(b));
        out += tmp;
    }
    return out;
}

} // namespace strata
