// SPDX-License-Identifier: Apache 2.0
// Copyright 2022 - Present, Light Transport Entertainment, Inc.
//
// Value types used by the source scene model and the escn document.
//
// NOTE: matrix4d uses row-major format(row-vector convention).
// Translation is stored in m[3][0..2].
//
#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "nonstd/optional.hpp"

namespace tinyescn {
namespace value {

using double3 = std::array<double, 3>;
using double4 = std::array<double, 4>;

struct color3f {
  float r, g, b;

  // C++11 or later, struct is tightly packed, so use the pointer offset is
  // valid.
  float operator[](size_t idx) const { return *(&r + idx); }
  float &operator[](size_t idx) { return *(&r + idx); }
};

struct quatd {
  double real;
  double3 imag;
};

struct matrix4d {
  matrix4d() {
    m[0][0] = 1.0;
    m[0][1] = 0.0;
    m[0][2] = 0.0;
    m[0][3] = 0.0;

    m[1][0] = 0.0;
    m[1][1] = 1.0;
    m[1][2] = 0.0;
    m[1][3] = 0.0;

    m[2][0] = 0.0;
    m[2][1] = 0.0;
    m[2][2] = 1.0;
    m[2][3] = 0.0;

    m[3][0] = 0.0;
    m[3][1] = 0.0;
    m[3][2] = 0.0;
    m[3][3] = 1.0;
  }

  static matrix4d identity() { return matrix4d(); }

  double m[4][4];
};

matrix4d Mult(const matrix4d &a, const matrix4d &b);

inline matrix4d operator*(const matrix4d &a, const matrix4d &b) {
  return Mult(a, b);
}

bool operator==(const matrix4d &a, const matrix4d &b);

///
/// Reference to a resource registered to a document.
/// `External` = ext_resource(linked file), `Sub` = sub_resource(embedded).
///
struct ResourceRef {
  enum class Kind { External, Sub };

  Kind kind{Kind::External};
  uint32_t id{0};
};

enum class ValueType {
  None,
  Bool,
  Int,
  Float,
  Double,
  Color3f,
  Matrix4d,
  String,
  ResourceRef
};

template <class T>
struct TypeTrait;

#define TINYESCN_DEFINE_TYPE_TRAIT(__ty, __name, __tyid)     \
  template <>                                               \
  struct TypeTrait<__ty> {                                  \
    static ValueType type_id() { return ValueType::__tyid; } \
    static const char *type_name() { return __name; }       \
  }

TINYESCN_DEFINE_TYPE_TRAIT(bool, "bool", Bool);
TINYESCN_DEFINE_TYPE_TRAIT(int, "int", Int);
TINYESCN_DEFINE_TYPE_TRAIT(float, "float", Float);
TINYESCN_DEFINE_TYPE_TRAIT(double, "double", Double);
TINYESCN_DEFINE_TYPE_TRAIT(color3f, "color3f", Color3f);
TINYESCN_DEFINE_TYPE_TRAIT(matrix4d, "matrix4d", Matrix4d);
TINYESCN_DEFINE_TYPE_TRAIT(std::string, "string", String);
TINYESCN_DEFINE_TYPE_TRAIT(ResourceRef, "ResourceRef", ResourceRef);

#undef TINYESCN_DEFINE_TYPE_TRAIT

///
/// Tagged value for attribute values.
/// The set of types is closed. `as<T>()` returns nullptr on type mismatch.
///
class Value {
 public:
  Value() = default;

  Value(bool v) : type_(ValueType::Bool) { scalar_.b = v; }
  Value(int v) : type_(ValueType::Int) { scalar_.i = v; }
  Value(float v) : type_(ValueType::Float) { scalar_.f = v; }
  Value(double v) : type_(ValueType::Double) { scalar_.d = v; }
  Value(const color3f &v) : type_(ValueType::Color3f) { scalar_.c = v; }
  Value(const matrix4d &v) : type_(ValueType::Matrix4d), mat_(v) {}
  Value(const std::string &v) : type_(ValueType::String), str_(v) {}
  Value(const char *v) : type_(ValueType::String), str_(v) {}
  Value(const ResourceRef &v) : type_(ValueType::ResourceRef) {
    scalar_.r = v;
  }

  ValueType type_id() const { return type_; }
  std::string type_name() const;

  bool is_none() const { return type_ == ValueType::None; }

  // Return nullptr when type mismatch.
  template <class T>
  const T *as() const {
    if (TypeTrait<T>::type_id() != type_) {
      return nullptr;
    }
    return reinterpret_cast<const T *>(storage());
  }

  // Type-safe way to get concrete value.
  template <class T>
  nonstd::optional<T> get_value() const {
    if (const T *p = as<T>()) {
      return *p;
    }
    return nonstd::nullopt;
  }

  ///
  /// Number of scalar channels(e.g. 3 for color3f, 1 for float).
  /// Non-numeric types have no channel.
  ///
  size_t num_channels() const;

  nonstd::optional<double> channel(size_t idx) const;

  ///
  /// Overwrite a scalar channel. Returns false when `idx` is out of range or
  /// the value has no channel.
  ///
  bool set_channel(size_t idx, double v);

 private:
  const void *storage() const;

  ValueType type_{ValueType::None};

  union Scalar {
    Scalar() : d(0.0) {}
    bool b;
    int i;
    float f;
    double d;
    color3f c;
    ResourceRef r;
  } scalar_;

  matrix4d mat_;
  std::string str_;
};

bool operator==(const Value &a, const Value &b);

inline bool operator!=(const Value &a, const Value &b) { return !(a == b); }

std::string to_string(const color3f &v);
std::string to_string(const matrix4d &m);
std::string to_string(const ResourceRef &r);

// escn representation of the value.
std::string to_string(const Value &v);

}  // namespace value
}  // namespace tinyescn
