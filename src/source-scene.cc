// SPDX-License-Identifier: Apache 2.0
// Copyright 2022 - Present, Light Transport Entertainment, Inc.
#include "source-scene.hh"

#include <algorithm>

namespace tinyescn {
namespace source {

nonstd::optional<float> FCurve::Evaluate(double frame) const {
  if (keyframes.empty()) {
    return nonstd::nullopt;
  }

  if (frame <= keyframes.front().frame) {
    return keyframes.front().value;
  }

  if (frame >= keyframes.back().frame) {
    return keyframes.back().value;
  }

  auto it = std::lower_bound(
      keyframes.begin(), keyframes.end(), frame,
      [](const Keyframe &k, double f) { return k.frame < f; });

  // keyframes.front().frame < frame < keyframes.back().frame here.
  const Keyframe &k1 = *it;
  const Keyframe &k0 = *(it - 1);

  double span = k1.frame - k0.frame;
  if (span <= 0.0) {
    return k1.value;
  }

  double t = (frame - k0.frame) / span;
  return float((1.0 - t) * double(k0.value) + t * double(k1.value));
}

std::vector<const FCurve *> Action::FindFCurves(
    const std::string &data_path) const {
  std::vector<const FCurve *> curves;
  for (const auto &fcurve : fcurves) {
    if (fcurve.data_path == data_path) {
      curves.push_back(&fcurve);
    }
  }
  return curves;
}

}  // namespace source
}  // namespace tinyescn
