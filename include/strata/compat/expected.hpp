/**
* @file expected.hpp
 * @brief Compatibility shim for std::expected (C++23) and tl::expected (C++20).
 *
 * This header provides a unified alias for expected/unexpected so the rest
 * of the codebase does not depend directly on a specific implementation.
 *
 * - When the standard library ships <expected>: uses std::expected.
 * - Otherwise: falls back to <tl/expected.hpp>, a header-only
 *   backport by TartanLlama (https://github.com/TartanLlama/expected).
 *
 * Only the subset common to both is used in strata (no monadic operations),
 * so the 202202L revision of the library feature is sufficient.
 */
#pragma once

#include <version>

#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202202L
  #include <expected>
  namespace strata_detail {
      template<class T, class E> using expected   = std::expected<T,E>;
      template<class E>          using unexpected = std::unexpected<E>;
  }
#else
#include <tl/expected.hpp>
namespace strata_detail {
      template<class T, class E> using expected   = tl::expected<T,E>;
      template<class E>          using unexpected = tl::unexpected<E>;
  }
#endif
