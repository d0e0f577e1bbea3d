#include "core/tracer.hpp"

#include <cstddef>

#include "util/log.hpp"

namespace optray {

RayHistory PropagateRay(const std::vector<ElementPtrU>& elements, const RayState& ray, double wavelength) {
  RayHistory history;
  history.reserve(elements.size() + 1);
  history.emplace_back(ray);
  for (const auto& e : elements) {
    RayState next = e->Propagate(history.back(), wavelength);
    history.emplace_back(next);
  }
  return history;
}


std::vector<RayHistory> PropagateRays(const std::vector<ElementPtrU>& elements, const std::vector<RayState>& rays,
                                      double wavelength) {
  LOG_VERBOSE("propagate %zu rays through %zu elements, wavelength %.3fnm", rays.size(), elements.size(),
              wavelength * 1e9);

  std::vector<RayHistory> histories;
  histories.reserve(rays.size());
  size_t terminated_cnt = 0;
  for (const auto& r : rays) {
    histories.emplace_back(PropagateRay(elements, r, wavelength));
    if (histories.back().back().IsTerminated()) {
      terminated_cnt++;
    }
  }

  LOG_VERBOSE("%zu of %zu rays terminated before leaving the system", terminated_cnt, rays.size());
  return histories;
}

}  // namespace optray
