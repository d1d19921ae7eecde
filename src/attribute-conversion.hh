// SPDX-License-Identifier: Apache 2.0
// Copyright 2022 - Present, Light Transport Entertainment, Inc.
//
// Declarative attribute conversion tables(source attribute -> escn attribute)
//
#pragma once

#include <string>
#include <vector>

#include "source-scene.hh"
#include "value-types.hh"

namespace tinyescn {

///
/// One row of an attribute conversion table.
///
/// `get` reads the source attribute from the data block `T` and `convert`
/// maps it to the target attribute value. `convert` must be pure: it is also
/// used to convert sampled values during animation export.
///
template <typename T>
struct AttributeConvertInfo {
  using Getter = value::Value (*)(const T &);
  using Converter = value::Value (*)(const value::Value &);

  const char *source_attr;  // Also the `data_path` of animation curves.
  const char *target_attr;
  Getter get;
  Converter convert;

  value::Value Apply(const T &data) const { return convert(get(data)); }
};

using CameraAttributeConversion =
    std::vector<AttributeConvertInfo<source::CameraData>>;
using LightAttributeConversion =
    std::vector<AttributeConvertInfo<source::LightData>>;

namespace convert {

value::Value Identity(const value::Value &v);

// Linear to sRGB(gamma 2.2) for color3f or a single color channel.
value::Value GammaCorrect(const value::Value &v);

// abs(x / 100)
value::Value PointEnergy(const value::Value &v);

// abs(x)
value::Value SunEnergy(const value::Value &v);

// Full cone angle in radians -> half angle in degrees.
value::Value SpotAngle(const value::Value &v);

// 0.2 / (x + 0.01). Blend factor [0, 1] -> attenuation exponent.
value::Value SpotAngleAttenuation(const value::Value &v);

}  // namespace convert

///
/// clip_end -> far, clip_start -> near, ortho_scale -> size
/// `fov` is not in the table since it is not animated.
///
const CameraAttributeConversion &GetCameraAttributeConversion();

// Entries shared by all light kinds.
const LightAttributeConversion &GetLightCommonAttributeConversion();

///
/// Attribute conversion for the light node kind(`OmniLight`, `SpotLight` or
/// `DirectionalLight`). Common entries come first, then the kind specific
/// ones, so kind specific entries win when target names collide.
/// Unknown kind gets the common entries only.
///
const LightAttributeConversion &GetLightAttributeConversion(
    const std::string &node_kind);

}  // namespace tinyescn
