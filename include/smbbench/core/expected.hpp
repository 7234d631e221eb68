#pragma once

#include <string>
#include <utility>

#include "smbbench/core/error.hpp"

#if SMBBENCH_HAVE_STD_EXPECTED
#include <expected>
#else
#include <tl/expected.hpp>
#endif

namespace smbbench {

#if SMBBENCH_HAVE_STD_EXPECTED

template <class T>
using Expected = std::expected<T, Error>;

template <class E>
using unexpected = std::unexpected<E>;

#else

template <class T>
using Expected = tl::expected<T, Error>;

template <class E>
using unexpected = tl::unexpected<E>;

#endif

inline unexpected<Error> make_error(ErrorCode code, std::string message) {
  return unexpected<Error>(Error{code, std::move(message)});
}

inline unexpected<Error> forward_error(const Error& e) {
  return unexpected<Error>(e);
}

}  // namespace smbbench
