#ifdef _MSC_VER
#define NOMINMAX
#endif

#define TEST_NO_MAIN
#include "acutest.h"

#include "unit-value-types.h"
#include "unit-common.hh"
#include "value-types.hh"

using namespace tinyescn;
using namespace tinyescn_test;

void value_types_test(void) {
  {
    value::Value v(1.5f);
    TEST_CHECK(v.type_id() == value::ValueType::Float);
    TEST_CHECK(v.type_name() == "float");
    TEST_CHECK(v.as<float>() != nullptr);
    TEST_CHECK(v.as<double>() == nullptr);
    TEST_CHECK(v.get_value<float>().value() == 1.5f);
    TEST_CHECK(!v.get_value<int>());
    TEST_CHECK(v.num_channels() == 1);
  }

  {
    value::Value v;
    TEST_CHECK(v.is_none());
    TEST_CHECK(v.num_channels() == 0);
    TEST_CHECK(!v.channel(0));
  }

  {
    value::color3f c{0.25f, 0.5f, 1.0f};
    value::Value v(c);
    TEST_CHECK(v.num_channels() == 3);
    TEST_CHECK(float_equals(v.channel(1).value(), 0.5));

    TEST_CHECK(v.set_channel(2, 0.75));
    TEST_CHECK(float_equals(double(v.as<value::color3f>()->b), 0.75));
    TEST_CHECK(!v.set_channel(3, 0.0));
  }

  {
    value::Value v(false);
    TEST_CHECK(v.set_channel(0, 1.0));
    TEST_CHECK(*v.as<bool>() == true);
    TEST_CHECK(v.set_channel(0, 0.2));
    TEST_CHECK(*v.as<bool>() == false);
  }

  {
    value::Value v("bora");
    TEST_CHECK(v.type_id() == value::ValueType::String);
    TEST_CHECK(!v.set_channel(0, 1.0));
    TEST_CHECK(value::to_string(v) == "\"bora\"");
  }

  // escn representation
  {
    TEST_CHECK(value::to_string(value::Value(true)) == "true");
    TEST_CHECK(value::to_string(value::Value(1)) == "1");
    TEST_CHECK(value::to_string(value::Value(100.0f)) == "100.0");
    TEST_CHECK(value::to_string(value::Value(-2.0)) == "-2.0");
    TEST_CHECK(value::to_string(value::Value(0.5)) == "0.5");

    value::color3f c{1.0f, 0.0f, 0.5f};
    TEST_CHECK(value::to_string(value::Value(c)) == "Color( 1.0, 0.0, 0.5, 1 )");

    value::ResourceRef ext;
    ext.kind = value::ResourceRef::Kind::External;
    ext.id = 3;
    TEST_CHECK(value::to_string(value::Value(ext)) == "ExtResource(3)");

    value::ResourceRef sub;
    sub.kind = value::ResourceRef::Kind::Sub;
    sub.id = 1;
    TEST_CHECK(value::to_string(value::Value(sub)) == "SubResource(1)");

    value::matrix4d m;
    m.m[3][0] = 1.0;
    m.m[3][1] = 2.0;
    m.m[3][2] = 3.0;
    TEST_CHECK(value::to_string(m) ==
               "Transform( 1.0, 0.0, 0.0, 0.0, 1.0, 0.0, 0.0, 0.0, 1.0, 1.0, "
               "2.0, 3.0 )");

    // 90 degree around Z: local X axis -> +Y. Basis rows are components, so
    // the first row is the X components of the (X, Y, Z) axes.
    value::matrix4d r;
    r.m[0][0] = 0.0;
    r.m[0][1] = 1.0;
    r.m[1][0] = -1.0;
    r.m[1][1] = 0.0;
    r.m[3][0] = 1.0;
    r.m[3][1] = 2.0;
    r.m[3][2] = 3.0;
    TEST_CHECK(value::to_string(r) ==
               "Transform( 0.0, -1.0, 0.0, 1.0, 0.0, 0.0, 0.0, 0.0, 1.0, 1.0, "
               "2.0, 3.0 )");
    TEST_MSG("%s", value::to_string(r).c_str());
  }

  // matrix
  {
    value::matrix4d a;
    a.m[3][0] = 1.0;

    value::matrix4d b;
    b.m[0][0] = 2.0;

    // row-vector convention: translation of `a` is scaled by `b`.
    value::matrix4d c = a * b;
    TEST_CHECK(float_equals(c.m[0][0], 2.0));
    TEST_CHECK(float_equals(c.m[3][0], 2.0));

    TEST_CHECK(value::matrix4d::identity() == value::matrix4d());
    TEST_CHECK(!(c == value::matrix4d()));
  }

  {
    TEST_CHECK(value::Value(1.0) == value::Value(1.0));
    TEST_CHECK(value::Value(1.0) != value::Value(1.0f));
    TEST_CHECK(value::Value("a") != value::Value("b"));
    TEST_CHECK(value::Value() == value::Value());
  }
}
