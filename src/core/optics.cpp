#include "core/optics.hpp"

#include <cmath>
#include <limits>
#include <memory>
#include <stdexcept>
#include <utility>

#include "config/scene_config.hpp"
#include "util/log.hpp"

namespace optray {

bool RayState::IsTerminated() const {
  return std::isnan(angle);
}


RayState RayState::Terminated() {
  constexpr double kNan = std::numeric_limits<double>::quiet_NaN();
  return RayState{ kNan, kNan, kNan };
}


ElementPtrU Element::Create(const ElementConfig& config) {
  switch (config.type_) {
    case ElementType::kMirror:
      return std::make_unique<Mirror>(config.aperture_, config.position_[0], config.position_[1], config.orientation_,
                                      config.name_);
  }
  throw std::invalid_argument("unsupported element type!");
}


Element::Element(double aperture, double x, double y, double orientation, std::string name)
    : aperture_(aperture), x_(x), y_(y), orientation_(orientation), name_(std::move(name)),
      transform_(MakeLocalTransform(orientation, x, y)), inverse_transform_(transform_.Inverse()) {
  if (!(aperture > 0)) {
    LOG_WARNING("Element %s has non-positive aperture %.6f. All rays will miss it.", name_.c_str(), aperture);
  }
}


RayState Element::Propagate(const RayState& ray, double wavelength) const {
  if (ray.IsTerminated()) {
    return RayState::Terminated();
  }

  auto hit = Intersect(ray);
  if (hit.missed) {
    LOG_DEBUG("ray (%.4f, %.4f, %.4f) misses %s at local y %.4f", ray.x, ray.y, ray.angle, name_.c_str(),
              hit.local_y);
    return RayState{ hit.x, hit.y, std::numeric_limits<double>::quiet_NaN() };
  }

  return RayState{ hit.x, hit.y, AngleLaw(ray, hit, wavelength) };
}


ElementHit Element::Intersect(const RayState& ray) const {
  if (ray.IsTerminated()) {
    auto t = RayState::Terminated();
    return ElementHit{ t.x, t.y, t.angle, true };
  }

  double p[2]{ ray.x, ray.y };
  transform_.Apply(p, p);

  // Ray angle in local frame
  double theta = ray.angle + orientation_;

  // Crossing of x_local = 0
  double local_y = p[1] - p[0] * std::tan(theta);
  bool missed = !(std::abs(local_y) < aperture_ / 2.0);

  double q[2]{ 0.0, local_y };
  inverse_transform_.Apply(q, q);

  return ElementHit{ q[0], q[1], local_y, missed };
}


void Element::GetApertureEnds(double* xy) const {
  double p0[2]{ 0.0, -aperture_ / 2.0 };
  double p1[2]{ 0.0, aperture_ / 2.0 };
  inverse_transform_.Apply(p0, xy);
  inverse_transform_.Apply(p1, xy + 2);
}


double Element::GetAperture() const {
  return aperture_;
}


double Element::GetX() const {
  return x_;
}


double Element::GetY() const {
  return y_;
}


double Element::GetOrientation() const {
  return orientation_;
}


const std::string& Element::GetName() const {
  return name_;
}


const Mat3& Element::GetTransform() const {
  return transform_;
}


const Mat3& Element::GetInverseTransform() const {
  return inverse_transform_;
}


Mirror::Mirror(double aperture, double x, double y, double orientation, std::string name)
    : Element(aperture, x, y, orientation, std::move(name)) {}


ElementType Mirror::GetType() const {
  return ElementType::kMirror;
}


double Mirror::AngleLaw(const RayState& ray, const ElementHit& /* hit */, double /* wavelength */) const {
  return AngleWrap(math::kPi - ray.angle - 2.0 * orientation_);
}

}  // namespace optray
