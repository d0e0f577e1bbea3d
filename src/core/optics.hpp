#ifndef SRC_CORE_OPTICS_H_
#define SRC_CORE_OPTICS_H_

#include <string>

#include "core/def.hpp"
#include "core/math.hpp"

namespace optray {

/**
 * @brief State of a ray at one point of its path: global position and direction.
 *
 * The direction is an angle w.r.t. global x-axis, in rad. A NaN angle marks a terminated ray. Use
 * IsTerminated() to check it, never compare against NaN.
 */
struct RayState {
  double x;
  double y;
  double angle;

  bool IsTerminated() const;

  static RayState Terminated();
};


/**
 * @brief Result of intersecting a ray with the plane of an element.
 */
struct ElementHit {
  double x;        //!< Intersection point, global.
  double y;        //!< Intersection point, global.
  double local_y;  //!< Intersection point on the element, local frame.
  bool missed;     //!< True if the ray is terminated or falls outside the aperture.
};


enum class ElementType {
  kMirror,
};


/**
 * @brief Common part of all optical elements.
 *
 * An element is a line segment of length `aperture`, centered at `position`, tilted by `orientation`
 * w.r.t. global Y axis. Its local frame is centered at `position` and the element plane is x_local = 0.
 *
 * Transforms are computed at construction and never change. Variants only supply AngleLaw(); the
 * intersection, aperture test and frame changes are done here.
 */
class Element {
 public:
  /**
   * @brief Create a concrete element from its config.
   *
   * @throw std::invalid_argument if the element type is not supported.
   */
  static ElementPtrU Create(const ElementConfig& config);

  Element(double aperture, double x, double y, double orientation, std::string name = "");
  Element(const Element& other) = default;
  virtual ~Element() = default;

  Element& operator=(const Element& other) = delete;

  /**
   * @brief Propagate a ray to this element.
   *
   * @param ray        incoming ray state, global.
   * @param wavelength wavelength of the ray, in m. Only used by wavelength dependent elements.
   * @return outgoing state at the element plane. If the incoming ray is already terminated, the result
   *         is RayState::Terminated(). If the ray misses the aperture, the result keeps the intersection
   *         position but has a NaN angle.
   */
  RayState Propagate(const RayState& ray, double wavelength = kDefaultWavelength) const;

  /**
   * @brief Find where a ray crosses the plane of this element, and test it against the aperture.
   *
   * A ray hits the element iff |y_local| < aperture / 2. A ray exactly on the edge is a miss.
   */
  ElementHit Intersect(const RayState& ray) const;

  /**
   * @brief Global coordinates of both ends of the aperture.
   *
   * @param xy [output] 4 doubles, [x0, y0, x1, y1]. Local (0, -aperture/2) and (0, aperture/2).
   */
  void GetApertureEnds(double* xy) const;

  virtual ElementType GetType() const = 0;

  double GetAperture() const;
  double GetX() const;
  double GetY() const;
  double GetOrientation() const;
  const std::string& GetName() const;
  const Mat3& GetTransform() const;
  const Mat3& GetInverseTransform() const;

 protected:
  /**
   * @brief Compute the outgoing angle for a ray that hits this element.
   *
   * @param ray        the incoming ray, global. Its angle is NOT offset by element orientation.
   * @param hit        intersection result. Never missed.
   * @param wavelength wavelength, in m.
   * @return outgoing angle, global, in (-pi, pi].
   */
  virtual double AngleLaw(const RayState& ray, const ElementHit& hit, double wavelength) const = 0;

  const double aperture_;
  const double x_;
  const double y_;
  const double orientation_;
  const std::string name_;
  const Mat3 transform_;          //!< global -> local
  const Mat3 inverse_transform_;  //!< local -> global
};


class Mirror : public Element {
 public:
  Mirror(double aperture, double x, double y, double orientation, std::string name = "Mirror");

  ElementType GetType() const override;

 protected:
  /**
   * theta_out = pi - theta_in - 2 * theta_element, wrapped to (-pi, pi]
   *
   * theta_in here is the un-offset incoming angle, while Intersect() uses theta_in + theta_element.
   */
  double AngleLaw(const RayState& ray, const ElementHit& hit, double wavelength) const override;
};

}  // namespace optray

#endif  // SRC_CORE_OPTICS_H_
