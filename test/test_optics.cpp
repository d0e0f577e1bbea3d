#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <memory>
#include <stdexcept>

#include "config/scene_config.hpp"
#include "core/math.hpp"
#include "core/optics.hpp"

using namespace optray;

namespace {

class TestOptics : public ::testing::Test {
 protected:
  void SetUp() override {
    mirror_ = std::make_unique<Mirror>(300, 100, -100, math::kPi_2, "M1");
    flat_mirror_ = std::make_unique<Mirror>(100, 0, 0, 0);
  }

  static constexpr double kTol = 1e-9;

  std::unique_ptr<Mirror> mirror_;       // horizontal, lies on y = -100, from x = -50 to x = 250
  std::unique_ptr<Mirror> flat_mirror_;  // vertical, lies on x = 0, from y = -50 to y = 50
};


TEST_F(TestOptics, RayStateTerminated) {
  RayState r{ 1.0, 2.0, 0.5 };
  EXPECT_FALSE(r.IsTerminated());

  r.angle = std::numeric_limits<double>::quiet_NaN();
  EXPECT_TRUE(r.IsTerminated());

  auto t = RayState::Terminated();
  EXPECT_TRUE(t.IsTerminated());
  EXPECT_TRUE(std::isnan(t.x));
  EXPECT_TRUE(std::isnan(t.y));
}


TEST_F(TestOptics, ElementProperties) {
  EXPECT_EQ(mirror_->GetType(), ElementType::kMirror);
  EXPECT_EQ(mirror_->GetName(), "M1");
  EXPECT_EQ(flat_mirror_->GetName(), "Mirror");
  EXPECT_DOUBLE_EQ(mirror_->GetAperture(), 300);
  EXPECT_DOUBLE_EQ(mirror_->GetX(), 100);
  EXPECT_DOUBLE_EQ(mirror_->GetY(), -100);
  EXPECT_DOUBLE_EQ(mirror_->GetOrientation(), math::kPi_2);
}


TEST_F(TestOptics, TransformsAreInverse) {
  const Element* elements[]{ mirror_.get(), flat_mirror_.get() };
  for (const auto* e : elements) {
    EXPECT_TRUE(MatrixEqual(e->GetTransform() * e->GetInverseTransform(), Mat3::Identity(), kTol));
    EXPECT_TRUE(MatrixEqual(e->GetInverseTransform() * e->GetTransform(), Mat3::Identity(), kTol));
  }
}


TEST_F(TestOptics, ApertureEnds) {
  double xy[4]{};
  mirror_->GetApertureEnds(xy);
  EXPECT_NEAR(xy[0], -50.0, kTol);
  EXPECT_NEAR(xy[1], -100.0, kTol);
  EXPECT_NEAR(xy[2], 250.0, kTol);
  EXPECT_NEAR(xy[3], -100.0, kTol);

  flat_mirror_->GetApertureEnds(xy);
  EXPECT_NEAR(xy[0], 0.0, kTol);
  EXPECT_NEAR(xy[1], -50.0, kTol);
  EXPECT_NEAR(xy[2], 0.0, kTol);
  EXPECT_NEAR(xy[3], 50.0, kTol);
}


TEST_F(TestOptics, IntersectHit) {
  auto hit = mirror_->Intersect(RayState{ 125, 100, -math::kPi_3 });
  EXPECT_FALSE(hit.missed);
  EXPECT_NEAR(hit.local_y, 25.0 + 200.0 / std::sqrt(3.0), kTol);
  EXPECT_NEAR(hit.x, 125.0 + 200.0 / std::sqrt(3.0), kTol);
  EXPECT_NEAR(hit.y, -100.0, kTol);
}


TEST_F(TestOptics, IntersectMissKeepsPosition) {
  Mirror m{ 300, 300, 0, 0 };
  auto hit = m.Intersect(RayState{ -40.47005383792509, -100.00000000000001, 2.094395102393195 });
  EXPECT_TRUE(hit.missed);
  EXPECT_NEAR(hit.local_y, -689.7114317029982, 1e-6);
  EXPECT_NEAR(hit.x, 300.0, kTol);
  EXPECT_NEAR(hit.y, -689.7114317029982, 1e-6);
}


TEST_F(TestOptics, IntersectTerminated) {
  auto hit = mirror_->Intersect(RayState::Terminated());
  EXPECT_TRUE(hit.missed);
  EXPECT_TRUE(std::isnan(hit.x));
  EXPECT_TRUE(std::isnan(hit.y));

  // Only the angle decides whether a ray is terminated
  hit = mirror_->Intersect(RayState{ 125, 100, std::numeric_limits<double>::quiet_NaN() });
  EXPECT_TRUE(hit.missed);
  EXPECT_TRUE(std::isnan(hit.x));
}


TEST_F(TestOptics, ApertureBoundaryIsMiss) {
  // Local frame equals global frame for this mirror, so local y is exact.
  auto upper = flat_mirror_->Propagate(RayState{ -10, 50, 0 });
  EXPECT_TRUE(upper.IsTerminated());
  EXPECT_DOUBLE_EQ(upper.x, 0.0);
  EXPECT_DOUBLE_EQ(upper.y, 50.0);

  auto lower = flat_mirror_->Propagate(RayState{ -10, -50, 0 });
  EXPECT_TRUE(lower.IsTerminated());
  EXPECT_DOUBLE_EQ(lower.y, -50.0);

  auto inside = flat_mirror_->Propagate(RayState{ -10, 49.9, 0 });
  EXPECT_FALSE(inside.IsTerminated());
  EXPECT_DOUBLE_EQ(inside.y, 49.9);
  EXPECT_NEAR(inside.angle, math::kPi, kTol);
}


TEST_F(TestOptics, DegenerateApertureRejectsAll) {
  Mirror zero{ 0, 0, 0, 0 };
  Mirror negative{ -10, 0, 0, 0 };
  for (const auto& y : { 0.0, 1e-6, -3.0 }) {
    EXPECT_TRUE(zero.Propagate(RayState{ -10, y, 0 }).IsTerminated());
    EXPECT_TRUE(negative.Propagate(RayState{ -10, y, 0 }).IsTerminated());
  }
}


TEST_F(TestOptics, MirrorReflection) {
  RayState in{ 125, 100, -math::kPi_3 };
  auto out = mirror_->Propagate(in);
  ASSERT_FALSE(out.IsTerminated());
  EXPECT_NEAR(out.x, 240.47005383792515, 1e-9);
  EXPECT_NEAR(out.y, -100.0, 1e-9);
  EXPECT_NEAR(out.angle, AngleWrap(math::kPi - in.angle - 2 * math::kPi_2), kTol);
  EXPECT_NEAR(out.angle, math::kPi_3, kTol);
}


TEST_F(TestOptics, MirrorReflectionWrapped) {
  // pi - (-3pi/4) - 0 = 7pi/4, wraps to -pi/4
  Mirror m{ 1000, 0, 0, 0 };
  auto out = m.Propagate(RayState{ -10, 10, -3 * math::kPi_4 });
  ASSERT_FALSE(out.IsTerminated());
  EXPECT_NEAR(out.y, 20.0, kTol);
  EXPECT_NEAR(out.angle, -math::kPi_4, kTol);

  // Incoming angle is not required to be wrapped
  auto out2 = m.Propagate(RayState{ -10, 10, -3 * math::kPi_4 + 4 * math::kPi });
  EXPECT_NEAR(out2.angle, -math::kPi_4, kTol);
}


// Intersection uses theta_in + theta_element, while the mirror law uses plain theta_in.
TEST_F(TestOptics, TiltedMirrorAngleConvention) {
  Mirror m{ 50, 0, 0, math::kPi_4 };  // lies on y = x

  auto hit = m.Intersect(RayState{ -100, 10, 0 });
  EXPECT_FALSE(hit.missed);
  EXPECT_NEAR(hit.local_y, 10.0 * std::sqrt(2.0), kTol);
  EXPECT_NEAR(hit.x, 10.0, kTol);
  EXPECT_NEAR(hit.y, 10.0, kTol);

  auto out = m.Propagate(RayState{ -100, 10, 0 });
  EXPECT_NEAR(out.angle, math::kPi - 0.0 - 2 * math::kPi_4, kTol);
  EXPECT_NEAR(out.angle, math::kPi_2, kTol);
}


TEST_F(TestOptics, WavelengthIgnoredByMirror) {
  RayState in{ 125, 100, -math::kPi_3 };
  auto a = mirror_->Propagate(in);
  auto b = mirror_->Propagate(in, 633e-9);
  EXPECT_EQ(a.x, b.x);
  EXPECT_EQ(a.y, b.y);
  EXPECT_EQ(a.angle, b.angle);
}


TEST_F(TestOptics, CreateFromConfig) {
  ElementConfig config{ ElementType::kMirror, 200, { 100, -100 }, math::kPi_2, "from config" };
  auto e = Element::Create(config);
  ASSERT_TRUE(e);
  EXPECT_EQ(e->GetType(), ElementType::kMirror);
  EXPECT_EQ(e->GetName(), "from config");
  EXPECT_DOUBLE_EQ(e->GetAperture(), 200);

  auto out = e->Propagate(RayState{ -20, 100, -math::kPi_3 });
  EXPECT_FALSE(out.IsTerminated());
}

}  // namespace
