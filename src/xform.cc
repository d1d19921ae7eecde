// SPDX-License-Identifier: Apache 2.0
// Copyright 2022 - Present, Light Transport Entertainment, Inc.

#ifdef __clang__
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Weverything"
#endif

#include "linalg.h"

#ifdef __clang__
#pragma clang diagnostic pop
#endif

#include <cmath>

#include "escn-types.hh"
#include "xform.hh"

namespace tinyescn {

using double3x3 = linalg::aliases::double3x3;

// linalg quat: (x, y, z, w)

value::matrix4d to_matrix(const value::quatd &q) {
  double3x3 m33 = linalg::qmat<double>({q.imag[0], q.imag[1], q.imag[2], q.real});

  // linalg is column-major(column vector convention), so copying its storage
  // as is gives the row-vector form.
  value::matrix4d m;

  m.m[0][0] = m33[0][0];
  m.m[0][1] = m33[0][1];
  m.m[0][2] = m33[0][2];
  m.m[1][0] = m33[1][0];
  m.m[1][1] = m33[1][1];
  m.m[1][2] = m33[1][2];
  m.m[2][0] = m33[2][0];
  m.m[2][1] = m33[2][1];
  m.m[2][2] = m33[2][2];

  return m;
}

value::quatd axis_angle(const value::double3 &axis, double angle) {
  linalg::aliases::double4 q = linalg::rotation_quat(
      linalg::normalize(linalg::aliases::double3{axis[0], axis[1], axis[2]}),
      angle);

  value::quatd ret;
  ret.imag[0] = q.x;
  ret.imag[1] = q.y;
  ret.imag[2] = q.z;
  ret.real = q.w;
  return ret;
}

value::matrix4d FixDirectionalTransform(const value::matrix4d &m) {
  static const value::matrix4d kCorrection =
      to_matrix(axis_angle({1.0, 0.0, 0.0}, to_radians(-90.0)));

  // Row-vector convention: the correction is applied first(local space).
  return kCorrection * m;
}

bool IsForwardEmittingKind(const std::string &node_kind) {
  return (node_kind == kNodeCamera) || (node_kind == kNodeDirectionalLight) ||
         (node_kind == kNodeSpotLight);
}

value::matrix4d NormalizeTransform(const value::matrix4d &m,
                                   const std::string &node_kind) {
  if (IsForwardEmittingKind(node_kind)) {
    return FixDirectionalTransform(m);
  }
  return m;
}

}  // namespace tinyescn
