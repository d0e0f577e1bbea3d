#ifndef SRC_CORE_POLYLINE_H_
#define SRC_CORE_POLYLINE_H_

#include <cstddef>
#include <vector>

#include "core/def.hpp"
#include "core/math.hpp"
#include "core/optics.hpp"

namespace optray {

struct RayColor {
  double r;
  double g;
  double b;
};


/**
 * @brief Drawable form of a ray history.
 *
 * `xy` holds points [x0, y0, x1, y1, ...]. Consecutive points form the line segments of the ray.
 */
struct RayPolyline {
  std::vector<double> xy;
  RayColor color;

  size_t PointNum() const;
};


/**
 * @brief Convert a ray history into a polyline.
 *
 * Points are taken in order until the first state without a finite position. If the last kept state
 * still has a valid angle, the ray leaves the system there, and one extra point is added at distance
 * `extend_length` along that angle.
 */
RayPolyline BuildPolyline(const RayHistory& history, double extend_length);

/**
 * @brief Convert all ray histories, one color for each.
 *
 * @throw std::invalid_argument if colors and histories have different sizes.
 */
std::vector<RayPolyline> BuildPolylines(const std::vector<RayHistory>& histories, const std::vector<RayColor>& colors,
                                        double extend_length);

std::vector<RayColor> MakeRandomColors(size_t num, RandomNumberGenerator& rng);

/**
 * @brief Length of the diagonal of a view box. Long enough for an exit ray to leave the box.
 *
 * @param xlim [xmin, xmax]
 * @param ylim [ymin, ymax]
 */
double CanvasDiagonal(const double* xlim, const double* ylim);

}  // namespace optray

#endif  // SRC_CORE_POLYLINE_H_
