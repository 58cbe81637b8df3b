/**
 * @file errors.hpp
 * @brief Error codes for decode/encode/composition and result aliases.
 *
 * Errors travel as values (expected/unexpected), never as exceptions:
 *  - NeedData / Malformed form the "unpack error" family. NeedData is
 *    recoverable by supplying more bytes (streaming reassembly); Malformed
 *    means the bytes are there but structurally invalid.
 *  - PackFailed means a field value cannot be encoded in its declared format
 *    (caller bug: wrong type or width assigned to a field).
 *  - The remaining codes report misuse of the field/body API.
 */
#pragma once

#include <cstdint>

#include "strata/compat/expected.hpp"

namespace strata {

/// Codec, field and composition failures.
enum class CodecError : std::uint8_t {
    NeedData = 1,        ///< Buffer shorter than the currently active header
    Malformed,           ///< Bytes present but structurally invalid
    PackFailed,          ///< Value does not fit its declared format
    BodyHandlerAttached, ///< Raw body write while a nested layer is attached
    UnknownField,        ///< No field with that name in this instance
    FieldKindMismatch,   ///< Operation not valid for this field's kind
    DuplicateField,      ///< Dynamic field name already taken
    NullLayer,           ///< Attaching a null layer as body
    InvalidArgument      ///< Unparsable textual input (addresses etc.)
};

/// True for the decode-failure family (NeedData is a kind of unpack error).
constexpr bool is_unpack_error(CodecError e) noexcept {
    return e == CodecError::NeedData || e == CodecError::Malformed;
}

/// Stable lowercase label for logs.
const char* to_string(CodecError e) noexcept;

/// Result of an operation that yields nothing on success.
using Status = strata_detail::expected<void, CodecError>;

/// Result of an operation that yields a value on success.
template <class T>
using Result = strata_detail::expected<T, CodecError>;

/// Shorthand for the error branch of Status/Result.
inline strata_detail::unexpected<CodecError> fail(CodecError e) {
    return strata_detail::unexpected<CodecError>(e);
}

} // namespace strata
