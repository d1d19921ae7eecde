#ifdef _MSC_VER
#define NOMINMAX
#endif

#include <cmath>
#include <cstring>

#define TEST_NO_MAIN
#include "acutest.h"

#include "attribute-conversion.hh"
#include "escn-types.hh"
#include "unit-attribute-conversion.h"
#include "unit-common.hh"
#include "xform.hh"

using namespace tinyescn;
using namespace tinyescn_test;

namespace {

template <typename T>
const AttributeConvertInfo<T> *find_entry(
    const std::vector<AttributeConvertInfo<T>> &table, const char *target) {
  const AttributeConvertInfo<T> *found = nullptr;
  // Last one wins.
  for (const auto &item : table) {
    if (std::strcmp(item.target_attr, target) == 0) {
      found = &item;
    }
  }
  return found;
}

double real(const value::Value &v) {
  if (const double *d = v.as<double>()) {
    return *d;
  } else if (const float *f = v.as<float>()) {
    return double(*f);
  }
  return 0.0;
}

}  // namespace

void attribute_conversion_test(void) {
  // Energy
  {
    // Omni/Spot: abs(x / 100)
    TEST_CHECK(float_equals(real(convert::PointEnergy(-250.0f)), 2.5));
    TEST_CHECK(float_equals(real(convert::PointEnergy(1000.0f)), 10.0));

    // Directional: abs(x), no scaling
    TEST_CHECK(float_equals(real(convert::SunEnergy(-3.5f)), 3.5));
    TEST_CHECK(float_equals(real(convert::SunEnergy(3.5f)), 3.5));

    // Pure
    TEST_CHECK(convert::PointEnergy(42.0f) == convert::PointEnergy(42.0f));
    TEST_CHECK(convert::SunEnergy(-7.0f) == convert::SunEnergy(-7.0f));
  }

  // Spot
  {
    TEST_CHECK(float_equals(real(convert::SpotAngle(kPi / 2.0)), 45.0));
    TEST_CHECK(float_equals(real(convert::SpotAngle(float(kPi / 2.0))), 45.0, 1.0e-4));

    TEST_CHECK(float_equals(real(convert::SpotAngleAttenuation(0.0f)), 20.0, 1.0e-9));
    TEST_CHECK(float_equals(real(convert::SpotAngleAttenuation(1.0f)), 0.2 / 1.01, 1.0e-9));
    TEST_CHECK(float_equals(real(convert::SpotAngleAttenuation(1.0f)), 0.198, 1.0e-3));

    // Strictly decreasing in [0, 1]
    double prev = real(convert::SpotAngleAttenuation(0.0));
    for (int i = 1; i <= 10; i++) {
      double cur = real(convert::SpotAngleAttenuation(double(i) / 10.0));
      TEST_CHECK(cur < prev);
      prev = cur;
    }
  }

  // Gamma
  {
    value::color3f c{1.0f, 0.5f, 0.0f};
    value::Value v = convert::GammaCorrect(c);
    const value::color3f *gc = v.as<value::color3f>();
    TEST_CHECK(gc != nullptr);
    if (gc) {
      TEST_CHECK(float_equals(double(gc->r), 1.0));
      TEST_CHECK(float_equals(double(gc->g), std::pow(0.5, 1.0 / 2.2), 1.0e-5));
      TEST_CHECK(float_equals(double(gc->b), 0.0));
    }

    TEST_CHECK(float_equals(real(convert::GammaCorrect(0.5)), std::pow(0.5, 1.0 / 2.2)));

    // Not a color or a number.
    TEST_CHECK(convert::GammaCorrect(value::Value("bora")).is_none());
  }

  {
    TEST_CHECK(convert::Identity(3.0f) == value::Value(3.0f));
  }

  // Camera table
  {
    const CameraAttributeConversion &table = GetCameraAttributeConversion();
    TEST_CHECK(table.size() == 3);

    source::CameraData cam;
    cam.clip_start = 0.5f;
    cam.clip_end = 250.0f;
    cam.ortho_scale = 8.0f;

    const auto *far_entry = find_entry(table, "far");
    TEST_CHECK(far_entry != nullptr);
    if (far_entry) {
      TEST_CHECK(std::strcmp(far_entry->source_attr, "clip_end") == 0);
      TEST_CHECK(float_equals(real(far_entry->Apply(cam)), 250.0));
    }

    const auto *near_entry = find_entry(table, "near");
    TEST_CHECK(near_entry != nullptr);
    if (near_entry) {
      TEST_CHECK(float_equals(real(near_entry->Apply(cam)), 0.5));
    }

    const auto *size_entry = find_entry(table, "size");
    TEST_CHECK(size_entry != nullptr);
    if (size_entry) {
      TEST_CHECK(float_equals(real(size_entry->Apply(cam)), 8.0));
    }

    // fov is not in the table.
    TEST_CHECK(find_entry(table, "fov") == nullptr);
  }

  // Light tables
  {
    const LightAttributeConversion &common = GetLightCommonAttributeConversion();
    const LightAttributeConversion &omni = GetLightAttributeConversion(kNodeOmniLight);
    const LightAttributeConversion &spot = GetLightAttributeConversion(kNodeSpotLight);
    const LightAttributeConversion &sun = GetLightAttributeConversion(kNodeDirectionalLight);

    TEST_CHECK(common.size() == 3);
    TEST_CHECK(omni.size() == common.size() + 2);
    TEST_CHECK(spot.size() == common.size() + 4);
    TEST_CHECK(sun.size() == common.size() + 1);

    // Common entries come first.
    for (size_t i = 0; i < common.size(); i++) {
      TEST_CHECK(std::strcmp(omni[i].target_attr, common[i].target_attr) == 0);
      TEST_CHECK(std::strcmp(spot[i].target_attr, common[i].target_attr) == 0);
      TEST_CHECK(std::strcmp(sun[i].target_attr, common[i].target_attr) == 0);
    }

    // Unknown kind: common entries only.
    TEST_CHECK(GetLightAttributeConversion("AreaLight").size() == common.size());

    source::LightData light;
    light.energy = -250.0f;
    light.spot_size = float(kPi / 2.0);
    light.spot_blend = 0.0f;
    light.cutoff_distance = 12.0f;

    TEST_CHECK(float_equals(real(find_entry(omni, "light_energy")->Apply(light)), 2.5));
    TEST_CHECK(float_equals(real(find_entry(omni, "omni_range")->Apply(light)), 12.0));
    TEST_CHECK(float_equals(real(find_entry(spot, "light_energy")->Apply(light)), 2.5));
    TEST_CHECK(float_equals(real(find_entry(spot, "spot_angle")->Apply(light)), 45.0, 1.0e-4));
    TEST_CHECK(float_equals(real(find_entry(spot, "spot_angle_attenuation")->Apply(light)), 20.0, 1.0e-6));
    TEST_CHECK(float_equals(real(find_entry(spot, "spot_range")->Apply(light)), 12.0));
    TEST_CHECK(float_equals(real(find_entry(sun, "light_energy")->Apply(light)), 250.0));

    TEST_CHECK(find_entry(sun, "omni_range") == nullptr);
    TEST_CHECK(find_entry(omni, "spot_angle") == nullptr);
  }
}
