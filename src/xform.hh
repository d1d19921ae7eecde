// SPDX-License-Identifier: Apache 2.0
// Copyright 2022 - Present, Light Transport Entertainment, Inc.

//
// NOTE: Use row-major format(row-vector convention) for matrix:
// p' = p * M
//
#pragma once

#include <string>

#include "value-types.hh"

namespace tinyescn {

constexpr double kPi = 3.14159265358979323846;

inline double to_degrees(double rad) { return rad * (180.0 / kPi); }
inline double to_radians(double deg) { return deg * (kPi / 180.0); }

value::matrix4d to_matrix(const value::quatd &q);

// Rotation of `angle` radians around `axis`.
value::quatd axis_angle(const value::double3 &axis, double angle);

///
/// Source scene nodes emit along local -Z and are Z-up, whereas target nodes
/// emit along the Y-forward basis the writer expects. Apply the fixed -90
/// degree rotation around local X in local space so that the emission
/// direction is preserved.
///
value::matrix4d FixDirectionalTransform(const value::matrix4d &m);

///
/// True for node kinds whose semantics depend on a facing axis
/// (Camera, DirectionalLight, SpotLight).
///
bool IsForwardEmittingKind(const std::string &node_kind);

///
/// Apply `FixDirectionalTransform` for forward emitting node kinds.
/// Return `m` unchanged for other kinds.
///
value::matrix4d NormalizeTransform(const value::matrix4d &m,
                                   const std::string &node_kind);

}  // namespace tinyescn
