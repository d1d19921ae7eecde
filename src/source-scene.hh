// SPDX-License-Identifier: Apache 2.0
// Copyright 2022 - Present, Light Transport Entertainment, Inc.
//
// Source(DCC side) scene data model consumed by the converters.
//
#pragma once

#include <string>
#include <vector>

#include "nonstd/optional.hpp"
#include "value-types.hh"

namespace tinyescn {
namespace source {

constexpr auto kObjectEmpty = "EMPTY";
constexpr auto kObjectCamera = "CAMERA";
constexpr auto kObjectLight = "LIGHT";
constexpr auto kObjectMesh = "MESH";
constexpr auto kObjectArmature = "ARMATURE";

constexpr auto kCameraPerspective = "PERSP";
constexpr auto kCameraOrthographic = "ORTHO";
constexpr auto kCameraPanoramic = "PANO";

constexpr auto kLightPoint = "POINT";
constexpr auto kLightSpot = "SPOT";
constexpr auto kLightSun = "SUN";
constexpr auto kLightArea = "AREA";

struct Keyframe {
  double frame{0.0};
  float value{0.0f};
};

///
/// Animation curve for one channel(`array_index`) of a property(`data_path`).
///
struct FCurve {
  std::string data_path;
  int array_index{0};
  std::vector<Keyframe> keyframes;  // Assume sorted by frame

  ///
  /// Evaluate the curve at `frame`.
  /// Linear interpolation between keys, constant outside of the key range.
  /// Returns nullopt when the curve has no key.
  ///
  nonstd::optional<float> Evaluate(double frame) const;
};

struct Action {
  std::string name;
  std::vector<FCurve> fcurves;

  // Curves animating `data_path`(all channels).
  std::vector<const FCurve *> FindFCurves(const std::string &data_path) const;
};

struct AnimationData {
  nonstd::optional<Action> action;
};

struct CameraData {
  std::string type{kCameraPerspective};

  float clip_start{0.1f};
  float clip_end{100.0f};
  float ortho_scale{6.0f};
  float angle{0.6911112f};  // full field of view in radians

  AnimationData animation_data;
};

// Cycles render engine settings of a light.
struct CyclesLightSettings {
  bool cast_shadow{true};
};

struct LightData {
  std::string type{kLightPoint};

  float energy{10.0f};
  value::color3f color{1.0f, 1.0f, 1.0f};
  value::color3f shadow_color{0.0f, 0.0f, 0.0f};
  float specular_factor{1.0f};
  float cutoff_distance{40.0f};

  // Spot only
  float spot_size{0.785398f};  // full cone angle in radians
  float spot_blend{0.15f};     // [0, 1]

  bool use_shadow{true};
  CyclesLightSettings cycles;

  AnimationData animation_data;
};

///
/// Scene object. `camera` is set for CAMERA object and `light` is set for
/// LIGHT object.
///
struct Object {
  std::string name;
  std::string type{kObjectEmpty};
  value::matrix4d matrix_local;

  nonstd::optional<CameraData> camera;
  nonstd::optional<LightData> light;
};

}  // namespace source
}  // namespace tinyescn
