#ifndef SRC_CONFIG_SCENE_CONFIG_H_
#define SRC_CONFIG_SCENE_CONFIG_H_

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "core/def.hpp"
#include "core/math.hpp"
#include "core/optics.hpp"
#include "core/polyline.hpp"

namespace optray {

struct ElementConfig {
  ElementType type_;
  double aperture_;
  double position_[2];
  double orientation_;  // rad
  std::string name_;
};


struct SceneConfig {
  double wavelength_;
  AngleUnit angle_unit_;  // unit used in the json document. Values here are always rad.
  std::vector<ElementConfig> elements_;
  std::vector<RayState> rays_;
  std::vector<RayColor> colors_;  // empty, or one for each ray
  uint32_t color_seed_;           // for random colors, when colors_ is empty
  double extend_length_;

  static constexpr double kDefaultExtendLength = 1000.0;
  static constexpr uint32_t kDefaultColorSeed = 1;
};


ElementConfig ParseElementConfig(const nlohmann::json& j, AngleUnit unit);
RayState ParseRayState(const nlohmann::json& j, AngleUnit unit);

// convert to/from json object
void to_json(nlohmann::json& j, const RayState& r);
void from_json(const nlohmann::json& j, RayState& r);

void to_json(nlohmann::json& j, const RayColor& c);
void from_json(const nlohmann::json& j, RayColor& c);

void to_json(nlohmann::json& j, const RayPolyline& l);

void to_json(nlohmann::json& j, const ElementConfig& e);
void from_json(const nlohmann::json& j, ElementConfig& e);

void to_json(nlohmann::json& j, const SceneConfig& s);
void from_json(const nlohmann::json& j, SceneConfig& s);

}  // namespace optray

#endif  // SRC_CONFIG_SCENE_CONFIG_H_
