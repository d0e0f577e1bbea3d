#include "core/polyline.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

#include "util/log.hpp"

namespace optray {

size_t RayPolyline::PointNum() const {
  return xy.size() / 2;
}


RayPolyline BuildPolyline(const RayHistory& history, double extend_length) {
  RayPolyline line{ {}, RayColor{ 0, 0, 0 } };
  line.xy.reserve(history.size() * 2 + 2);

  const RayState* last = nullptr;
  for (const auto& s : history) {
    if (!std::isfinite(s.x) || !std::isfinite(s.y)) {
      break;
    }
    line.xy.emplace_back(s.x);
    line.xy.emplace_back(s.y);
    last = &s;
  }

  if (last && !last->IsTerminated()) {
    line.xy.emplace_back(last->x + extend_length * std::cos(last->angle));
    line.xy.emplace_back(last->y + extend_length * std::sin(last->angle));
  }
  return line;
}


std::vector<RayPolyline> BuildPolylines(const std::vector<RayHistory>& histories, const std::vector<RayColor>& colors,
                                        double extend_length) {
  if (histories.size() != colors.size()) {
    LOG_ERROR("Need same number of colors as rays! rays: %zu, colors: %zu", histories.size(), colors.size());
    throw std::invalid_argument("need same number of colors as rays, got " + std::to_string(histories.size()) +
                                " rays and " + std::to_string(colors.size()) + " colors");
  }

  std::vector<RayPolyline> lines;
  lines.reserve(histories.size());
  for (size_t i = 0; i < histories.size(); i++) {
    lines.emplace_back(BuildPolyline(histories[i], extend_length));
    lines.back().color = colors[i];
  }
  return lines;
}


std::vector<RayColor> MakeRandomColors(size_t num, RandomNumberGenerator& rng) {
  std::vector<RayColor> colors;
  colors.reserve(num);
  for (size_t i = 0; i < num; i++) {
    double r = rng.GetUniform();
    double g = rng.GetUniform();
    double b = rng.GetUniform();
    colors.emplace_back(RayColor{ r, g, b });
  }
  return colors;
}


double CanvasDiagonal(const double* xlim, const double* ylim) {
  return std::hypot(xlim[1] - xlim[0], ylim[1] - ylim[0]);
}

}  // namespace optray
