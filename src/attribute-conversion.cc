// SPDX-License-Identifier: Apache 2.0
// Copyright 2022 - Present, Light Transport Entertainment, Inc.
#include "attribute-conversion.hh"

#include <cmath>

#include "escn-types.hh"
#include "xform.hh"

namespace tinyescn {

namespace {

nonstd::optional<double> as_real(const value::Value &v) {
  if (const float *f = v.as<float>()) {
    return double(*f);
  } else if (const double *d = v.as<double>()) {
    return *d;
  } else if (const int *i = v.as<int>()) {
    return double(*i);
  }
  return nonstd::nullopt;
}

float gamma_correct(float c) { return std::pow(c, 1.0f / 2.2f); }

LightAttributeConversion concat(const LightAttributeConversion &a,
                                const LightAttributeConversion &b) {
  LightAttributeConversion ret = a;
  ret.insert(ret.end(), b.begin(), b.end());
  return ret;
}

const LightAttributeConversion &GetOmniLightAttributeConversion() {
  static const LightAttributeConversion table = {
      {"energy", "light_energy",
       [](const source::LightData &l) { return value::Value(l.energy); },
       convert::PointEnergy},
      {"cutoff_distance", "omni_range",
       [](const source::LightData &l) {
         return value::Value(l.cutoff_distance);
       },
       convert::Identity},
  };
  return table;
}

const LightAttributeConversion &GetSpotLightAttributeConversion() {
  static const LightAttributeConversion table = {
      {"energy", "light_energy",
       [](const source::LightData &l) { return value::Value(l.energy); },
       convert::PointEnergy},
      {"spot_size", "spot_angle",
       [](const source::LightData &l) { return value::Value(l.spot_size); },
       convert::SpotAngle},
      {"spot_blend", "spot_angle_attenuation",
       [](const source::LightData &l) { return value::Value(l.spot_blend); },
       convert::SpotAngleAttenuation},
      {"cutoff_distance", "spot_range",
       [](const source::LightData &l) {
         return value::Value(l.cutoff_distance);
       },
       convert::Identity},
  };
  return table;
}

const LightAttributeConversion &GetDirectionalLightAttributeConversion() {
  static const LightAttributeConversion table = {
      {"energy", "light_energy",
       [](const source::LightData &l) { return value::Value(l.energy); },
       convert::SunEnergy},
  };
  return table;
}

}  // namespace

namespace convert {

value::Value Identity(const value::Value &v) { return v; }

value::Value GammaCorrect(const value::Value &v) {
  if (const value::color3f *c = v.as<value::color3f>()) {
    value::color3f ret;
    ret.r = gamma_correct(c->r);
    ret.g = gamma_correct(c->g);
    ret.b = gamma_correct(c->b);
    return ret;
  } else if (auto x = as_real(v)) {
    return std::pow(x.value(), 1.0 / 2.2);
  }
  return value::Value();
}

value::Value PointEnergy(const value::Value &v) {
  if (auto x = as_real(v)) {
    return std::fabs(x.value() / 100.0);
  }
  return value::Value();
}

value::Value SunEnergy(const value::Value &v) {
  if (auto x = as_real(v)) {
    return std::fabs(x.value());
  }
  return value::Value();
}

value::Value SpotAngle(const value::Value &v) {
  if (auto x = as_real(v)) {
    return to_degrees(x.value() / 2.0);
  }
  return value::Value();
}

value::Value SpotAngleAttenuation(const value::Value &v) {
  if (auto x = as_real(v)) {
    // 0.01: avoid zero division at blend = 0
    return 0.2 / (x.value() + 0.01);
  }
  return value::Value();
}

}  // namespace convert

const CameraAttributeConversion &GetCameraAttributeConversion() {
  static const CameraAttributeConversion table = {
      {"clip_end", "far",
       [](const source::CameraData &c) { return value::Value(c.clip_end); },
       convert::Identity},
      {"clip_start", "near",
       [](const source::CameraData &c) { return value::Value(c.clip_start); },
       convert::Identity},
      {"ortho_scale", "size",
       [](const source::CameraData &c) {
         return value::Value(c.ortho_scale);
       },
       convert::Identity},
  };
  return table;
}

const LightAttributeConversion &GetLightCommonAttributeConversion() {
  static const LightAttributeConversion table = {
      {"specular_factor", "light_specular",
       [](const source::LightData &l) {
         return value::Value(l.specular_factor);
       },
       convert::Identity},
      {"color", "light_color",
       [](const source::LightData &l) { return value::Value(l.color); },
       convert::GammaCorrect},
      {"shadow_color", "shadow_color",
       [](const source::LightData &l) { return value::Value(l.shadow_color); },
       convert::GammaCorrect},
  };
  return table;
}

const LightAttributeConversion &GetLightAttributeConversion(
    const std::string &node_kind) {
  static const LightAttributeConversion omni = concat(
      GetLightCommonAttributeConversion(), GetOmniLightAttributeConversion());
  static const LightAttributeConversion spot = concat(
      GetLightCommonAttributeConversion(), GetSpotLightAttributeConversion());
  static const LightAttributeConversion directional =
      concat(GetLightCommonAttributeConversion(),
             GetDirectionalLightAttributeConversion());

  if (node_kind == kNodeOmniLight) {
    return omni;
  } else if (node_kind == kNodeSpotLight) {
    return spot;
  } else if (node_kind == kNodeDirectionalLight) {
    return directional;
  }
  return GetLightCommonAttributeConversion();
}

}  // namespace tinyescn
