#pragma once

/// @file result.h
/// @brief Result<T, E> type alias for sl::expected (Rust-style naming)
///
/// Example usage:
/// @code
/// sl::Result<void> r = list.insert("c", 2);
/// if (!r.ok()) {
///     SL_WARN("insert failed: " << r.message());
/// }
/// @endcode

#include "sl/expected.h"

namespace sl {

template <typename T, typename E = ResultError>
using Result = expected<T, E>;

} // namespace sl
