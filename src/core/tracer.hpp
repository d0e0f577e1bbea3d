#ifndef SRC_CORE_TRACER_H_
#define SRC_CORE_TRACER_H_

#include <vector>

#include "core/def.hpp"
#include "core/optics.hpp"

namespace optray {

/**
 * @brief Propagate one ray through an ordered list of elements.
 *
 * @param elements   elements, in the order a ray meets them.
 * @param ray        input ray, global. Its angle need not be wrapped.
 * @param wavelength in m.
 * @return history of N+1 states for N elements. State 0 is the input ray, state i is the ray right after
 *         element i. Once terminated, all later states are RayState::Terminated().
 */
RayHistory PropagateRay(const std::vector<ElementPtrU>& elements, const RayState& ray,
                        double wavelength = kDefaultWavelength);

/**
 * @brief Propagate each ray independently. Output order follows input order.
 */
std::vector<RayHistory> PropagateRays(const std::vector<ElementPtrU>& elements, const std::vector<RayState>& rays,
                                      double wavelength = kDefaultWavelength);

}  // namespace optray

#endif  // SRC_CORE_TRACER_H_
