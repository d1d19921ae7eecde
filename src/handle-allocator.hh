// SPDX-License-Identifier: Apache 2.0
// Copyright 2022-Present Light Transport Entertainment Inc.
#pragma once

#include <cstdint>
#include <limits>

namespace tinyescn {

///
/// Document scoped resource id issuer.
/// Assume T is an unsigned integer type.
/// Ids are issued in ascending order and never reused(resources registered
/// to a document are not removed).
///
template<typename T = uint32_t>
class HandleAllocator {
public:
  // id = 0 is reserved(invalid id).
  HandleAllocator() : counter_(static_cast<T>(1)){}

  /// Allocates handle object. Returns false when ids are exhausted.
  bool Allocate(T *dst) {

    if (!dst) {
      return false;
    }

    T handle = counter_;
    if ((handle >= static_cast<T>(1)) && (handle < std::numeric_limits<T>::max())) {
      counter_++;
      (*dst) = handle;
      return true;
    }

    return false;
  }

private:
  T counter_{};
};

} // namespace tinyescn
