#include "config/scene_config.hpp"

#include <stdexcept>
#include <string>

#include "io/json_util.hpp"
#include "util/log.hpp"

namespace optray {

namespace {

AngleUnit ParseAngleUnit(const nlohmann::json& j) {
  auto s = j.get<std::string>();
  if (s == "rad") {
    return AngleUnit::kRad;
  } else if (s == "degree" || s == "deg") {
    return AngleUnit::kDegree;
  }
  throw std::invalid_argument("unknown angle unit: " + s);
}


ElementType ParseElementType(const nlohmann::json& j) {
  auto s = j.get<std::string>();
  if (s == "mirror") {
    return ElementType::kMirror;
  }
  throw std::invalid_argument("unknown element type: " + s);
}


const char* ElementTypeName(ElementType type) {
  switch (type) {
    case ElementType::kMirror:
      return "mirror";
  }
  return "";
}

}  // namespace


ElementConfig ParseElementConfig(const nlohmann::json& j, AngleUnit unit) {
  if (!j.is_object()) {
    throw std::invalid_argument("element must be an object, got " + j.dump());
  }
  ElementConfig e{};
  e.type_ = ParseElementType(j.at("type"));
  j.at("aperture").get_to(e.aperture_);
  JsonGetNumberArray(j.at("position"), "element position", e.position_, 2);
  e.orientation_ = ToRad(j.at("orientation").get<double>(), unit);

  e.name_ = "";
  JSON_CHECK_AND_UPDATE_SIMPLE_VALUE(j, "name", e.name_)  // default ""
  return e;
}


RayState ParseRayState(const nlohmann::json& j, AngleUnit unit) {
  double v[3]{};
  JsonGetNumberArray(j, "ray", v, 3);
  return RayState{ v[0], v[1], ToRad(v[2], unit) };
}


void to_json(nlohmann::json& j, const RayState& r) {
  // NaN is dumped as null
  j = nlohmann::json::array({ r.x, r.y, r.angle });
}


void from_json(const nlohmann::json& j, RayState& r) {
  r = ParseRayState(j, AngleUnit::kRad);
}


void to_json(nlohmann::json& j, const RayColor& c) {
  j = nlohmann::json::array({ c.r, c.g, c.b });
}


void from_json(const nlohmann::json& j, RayColor& c) {
  double v[3]{};
  JsonGetNumberArray(j, "color", v, 3);
  c = RayColor{ v[0], v[1], v[2] };
}


void to_json(nlohmann::json& j, const RayPolyline& l) {
  j["color"] = l.color;
  auto& j_pts = j["points"];
  j_pts = nlohmann::json::array();
  for (size_t i = 0; i < l.PointNum(); i++) {
    j_pts.emplace_back(nlohmann::json::array({ l.xy[i * 2 + 0], l.xy[i * 2 + 1] }));
  }
}


void to_json(nlohmann::json& j, const ElementConfig& e) {
  j["type"] = ElementTypeName(e.type_);
  j["aperture"] = e.aperture_;
  j["position"] = e.position_;
  j["orientation"] = e.orientation_;
  if (!e.name_.empty()) {
    j["name"] = e.name_;
  }
}


void from_json(const nlohmann::json& j, ElementConfig& e) {
  e = ParseElementConfig(j, AngleUnit::kRad);
}


void to_json(nlohmann::json& j, const SceneConfig& s) {
  j["wavelength"] = s.wavelength_;
  j["angle_unit"] = "rad";
  j["elements"] = s.elements_;
  j["rays"] = s.rays_;
  if (!s.colors_.empty()) {
    j["colors"] = s.colors_;
  }
  j["color_seed"] = s.color_seed_;
  j["extend_length"] = s.extend_length_;
}


void from_json(const nlohmann::json& j, SceneConfig& s) {
  s.wavelength_ = kDefaultWavelength;
  JSON_CHECK_AND_UPDATE_SIMPLE_VALUE(j, "wavelength", s.wavelength_)  // default 525nm
  if (!(s.wavelength_ > 0)) {
    throw std::invalid_argument("wavelength must be positive, got " + std::to_string(s.wavelength_));
  }

  s.angle_unit_ = AngleUnit::kRad;
  JSON_CHECK_AND_APPLY_SIMPLE_VALUE(j, "angle_unit", nlohmann::json,
                                    [&s](const nlohmann::json& u) { s.angle_unit_ = ParseAngleUnit(u); })

  s.elements_.clear();
  if (j.contains("elements")) {
    for (const auto& j_element : JsonGetArray(j, "elements")) {
      s.elements_.emplace_back(ParseElementConfig(j_element, s.angle_unit_));
    }
  } else {
    LOG_VERBOSE("missing key elements. no element in scene.");
  }

  s.rays_.clear();
  for (const auto& j_ray : JsonGetArray(j, "rays")) {
    s.rays_.emplace_back(ParseRayState(j_ray, s.angle_unit_));
  }

  s.colors_.clear();  // default empty, use random colors
  if (j.contains("colors")) {
    JsonGetArray(j, "colors").get_to(s.colors_);
  }
  if (!s.colors_.empty() && s.colors_.size() != s.rays_.size()) {
    throw std::invalid_argument("need same number of colors as rays, got " + std::to_string(s.rays_.size()) +
                                " rays and " + std::to_string(s.colors_.size()) + " colors");
  }

  s.color_seed_ = SceneConfig::kDefaultColorSeed;
  JSON_CHECK_AND_UPDATE_SIMPLE_VALUE(j, "color_seed", s.color_seed_)  // default 1

  s.extend_length_ = SceneConfig::kDefaultExtendLength;
  JSON_CHECK_AND_UPDATE_SIMPLE_VALUE(j, "extend_length", s.extend_length_)  // default 1000
}

}  // namespace optray
