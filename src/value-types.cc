// SPDX-License-Identifier: Apache 2.0
// Copyright 2022 - Present, Light Transport Entertainment, Inc.
#include "value-types.hh"

#include <cmath>
#include <sstream>

#include "str-util.hh"

namespace tinyescn {
namespace value {

namespace {

// Godot style float formatting: integral values keep a trailing `.0`.
std::string format_real(double v) {
  std::ostringstream ss;
  if (std::isfinite(v) && (std::fabs(v) < 1.0e15) && (std::floor(v) == v)) {
    ss << static_cast<long long>(v) << ".0";
  } else {
    ss.precision(15);
    ss << v;
  }
  return ss.str();
}

}  // namespace

matrix4d Mult(const matrix4d &a, const matrix4d &b) {
  matrix4d ret;
  for (size_t i = 0; i < 4; i++) {
    for (size_t j = 0; j < 4; j++) {
      double v = 0.0;
      for (size_t k = 0; k < 4; k++) {
        v += a.m[i][k] * b.m[k][j];
      }
      ret.m[i][j] = v;
    }
  }
  return ret;
}

bool operator==(const matrix4d &a, const matrix4d &b) {
  for (size_t i = 0; i < 4; i++) {
    for (size_t j = 0; j < 4; j++) {
      if (a.m[i][j] != b.m[i][j]) {
        return false;
      }
    }
  }
  return true;
}

std::string Value::type_name() const {
  switch (type_) {
    case ValueType::None:
      return "none";
    case ValueType::Bool:
      return TypeTrait<bool>::type_name();
    case ValueType::Int:
      return TypeTrait<int>::type_name();
    case ValueType::Float:
      return TypeTrait<float>::type_name();
    case ValueType::Double:
      return TypeTrait<double>::type_name();
    case ValueType::Color3f:
      return TypeTrait<color3f>::type_name();
    case ValueType::Matrix4d:
      return TypeTrait<matrix4d>::type_name();
    case ValueType::String:
      return TypeTrait<std::string>::type_name();
    case ValueType::ResourceRef:
      return TypeTrait<ResourceRef>::type_name();
  }
  return "[[InvalidValueType]]";
}

const void *Value::storage() const {
  switch (type_) {
    case ValueType::None:
      return nullptr;
    case ValueType::Bool:
      return &scalar_.b;
    case ValueType::Int:
      return &scalar_.i;
    case ValueType::Float:
      return &scalar_.f;
    case ValueType::Double:
      return &scalar_.d;
    case ValueType::Color3f:
      return &scalar_.c;
    case ValueType::Matrix4d:
      return &mat_;
    case ValueType::String:
      return &str_;
    case ValueType::ResourceRef:
      return &scalar_.r;
  }
  return nullptr;
}

size_t Value::num_channels() const {
  switch (type_) {
    case ValueType::Bool:
    case ValueType::Int:
    case ValueType::Float:
    case ValueType::Double:
      return 1;
    case ValueType::Color3f:
      return 3;
    case ValueType::None:
    case ValueType::Matrix4d:
    case ValueType::String:
    case ValueType::ResourceRef:
      return 0;
  }
  return 0;
}

nonstd::optional<double> Value::channel(size_t idx) const {
  if (idx >= num_channels()) {
    return nonstd::nullopt;
  }

  switch (type_) {
    case ValueType::Bool:
      return scalar_.b ? 1.0 : 0.0;
    case ValueType::Int:
      return double(scalar_.i);
    case ValueType::Float:
      return double(scalar_.f);
    case ValueType::Double:
      return scalar_.d;
    case ValueType::Color3f:
      return double(scalar_.c[idx]);
    default:
      break;
  }
  return nonstd::nullopt;
}

bool Value::set_channel(size_t idx, double v) {
  if (idx >= num_channels()) {
    return false;
  }

  switch (type_) {
    case ValueType::Bool:
      // Blender evaluates boolean fcurves as "value >= 0.5"
      scalar_.b = (v >= 0.5);
      return true;
    case ValueType::Int:
      scalar_.i = int(std::lround(v));
      return true;
    case ValueType::Float:
      scalar_.f = float(v);
      return true;
    case ValueType::Double:
      scalar_.d = v;
      return true;
    case ValueType::Color3f:
      scalar_.c[idx] = float(v);
      return true;
    default:
      break;
  }
  return false;
}

bool operator==(const Value &a, const Value &b) {
  if (a.type_id() != b.type_id()) {
    return false;
  }

  switch (a.type_id()) {
    case ValueType::None:
      return true;
    case ValueType::Bool:
      return *a.as<bool>() == *b.as<bool>();
    case ValueType::Int:
      return *a.as<int>() == *b.as<int>();
    case ValueType::Float:
      return *a.as<float>() == *b.as<float>();
    case ValueType::Double:
      return *a.as<double>() == *b.as<double>();
    case ValueType::Color3f: {
      const color3f &ca = *a.as<color3f>();
      const color3f &cb = *b.as<color3f>();
      return (ca.r == cb.r) && (ca.g == cb.g) && (ca.b == cb.b);
    }
    case ValueType::Matrix4d:
      return *a.as<matrix4d>() == *b.as<matrix4d>();
    case ValueType::String:
      return *a.as<std::string>() == *b.as<std::string>();
    case ValueType::ResourceRef: {
      const ResourceRef &ra = *a.as<ResourceRef>();
      const ResourceRef &rb = *b.as<ResourceRef>();
      return (ra.kind == rb.kind) && (ra.id == rb.id);
    }
  }
  return false;
}

std::string to_string(const color3f &v) {
  std::stringstream ss;
  ss << "Color( " << format_real(double(v.r)) << ", " << format_real(double(v.g))
     << ", " << format_real(double(v.b)) << ", 1 )";
  return ss.str();
}

// Basis then origin. Basis row `i` holds component `i` of the X, Y and Z
// axes. Axes are rows in matrix4d(row-vector convention), so the basis is
// written transposed.
std::string to_string(const matrix4d &m) {
  std::stringstream ss;
  ss << "Transform( ";
  for (size_t i = 0; i < 3; i++) {
    for (size_t j = 0; j < 3; j++) {
      ss << format_real(m.m[j][i]) << ", ";
    }
  }
  ss << format_real(m.m[3][0]) << ", " << format_real(m.m[3][1]) << ", "
     << format_real(m.m[3][2]) << " )";
  return ss.str();
}

std::string to_string(const ResourceRef &r) {
  std::stringstream ss;
  if (r.kind == ResourceRef::Kind::External) {
    ss << "ExtResource(" << r.id << ")";
  } else {
    ss << "SubResource(" << r.id << ")";
  }
  return ss.str();
}

std::string to_string(const Value &v) {
  switch (v.type_id()) {
    case ValueType::None:
      return "null";
    case ValueType::Bool:
      return (*v.as<bool>()) ? "true" : "false";
    case ValueType::Int:
      return std::to_string(*v.as<int>());
    case ValueType::Float:
      return format_real(double(*v.as<float>()));
    case ValueType::Double:
      return format_real(*v.as<double>());
    case ValueType::Color3f:
      return to_string(*v.as<color3f>());
    case ValueType::Matrix4d:
      return to_string(*v.as<matrix4d>());
    case ValueType::String:
      return quote(escapeString(*v.as<std::string>()));
    case ValueType::ResourceRef:
      return to_string(*v.as<ResourceRef>());
  }
  return "[[InvalidValueType]]";
}

}  // namespace value
}  // namespace tinyescn
