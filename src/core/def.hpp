#ifndef SRC_CORE_DEF_H_
#define SRC_CORE_DEF_H_

#include <memory>
#include <vector>

namespace optray {

constexpr double kDefaultWavelength = 525e-9;  // metres, green light

struct RayState;
using RayHistory = std::vector<RayState>;

class Element;
using ElementPtrU = std::unique_ptr<Element>;

struct ElementConfig;
struct SceneConfig;

}  // namespace optray

#endif  // SRC_CORE_DEF_H_
