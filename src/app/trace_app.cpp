#include "app/trace_app.hpp"

#include <exception>
#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>

#include "config/scene_config.hpp"
#include "core/math.hpp"
#include "core/tracer.hpp"
#include "util/arg_parser.hpp"
#include "util/log.hpp"

namespace optray {

nlohmann::json MakeTraceResult(const std::vector<ElementPtrU>& elements, const std::vector<RayHistory>& histories,
                               const std::vector<RayPolyline>& polylines) {
  nlohmann::json result;

  auto& j_elements = result["elements"];
  j_elements = nlohmann::json::array();
  for (const auto& e : elements) {
    double xy[4]{};
    e->GetApertureEnds(xy);
    nlohmann::json j_element;
    j_element["name"] = e->GetName();
    j_element["ends"] = nlohmann::json::array({ nlohmann::json::array({ xy[0], xy[1] }),  //
                                                nlohmann::json::array({ xy[2], xy[3] }) });
    j_elements.emplace_back(std::move(j_element));
  }

  result["histories"] = histories;
  result["polylines"] = polylines;
  return result;
}


int RunTrace(int argc, char** argv, std::ostream& os) {
  // Setup argument parser and parse arguments
  ArgParser parser;
  parser.AddArgument("-v", 0, "verbose", "make output verbose");
  parser.AddArgument("-d", 0, "debug", "display debug info");
  parser.AddArgument("-f", 1, "config-file", "scene config file");
  ArgParseResult arg_parse_result;
  try {
    arg_parse_result = parser.Parse(argc, argv);
  } catch (const std::invalid_argument& e) {
    LOG_ERROR("%s", e.what());
    return -1;
  }

  // Setup log levels. Logs go to stderr, leaving the output stream for the result document.
  auto* logger = Logger::GetInstance();
  if (arg_parse_result.count("-d")) {
    logger->AddDestination(LogFilter::MakeThresholdFilter(LogLevel::kDebug), LogFileDest::Stderr());
    logger->EnableSourceLocation(true);
  } else if (arg_parse_result.count("-v")) {
    logger->AddDestination(LogFilter::MakeThresholdFilter(LogLevel::kVerbose), LogFileDest::Stderr());
  }

  // Load scene
  const auto& config_filename = arg_parse_result.at("-f")[0];
  std::ifstream config_file(config_filename);
  if (!config_file.is_open()) {
    LOG_ERROR("Cannot open config file %s", config_filename.c_str());
    return -1;
  }

  SceneConfig scene{};
  std::vector<ElementPtrU> elements;
  try {
    nlohmann::json j;
    config_file >> j;
    j.get_to(scene);
    for (const auto& e : scene.elements_) {
      elements.emplace_back(Element::Create(e));
    }
  } catch (const std::exception& e) {
    LOG_ERROR("Invalid scene config %s: %s", config_filename.c_str(), e.what());
    return -1;
  }
  LOG_VERBOSE("scene loaded: %zu elements, %zu rays", elements.size(), scene.rays_.size());

  // Trace
  auto histories = PropagateRays(elements, scene.rays_, scene.wavelength_);

  auto colors = scene.colors_;
  if (colors.empty()) {
    RandomNumberGenerator rng{ scene.color_seed_ };
    colors = MakeRandomColors(histories.size(), rng);
  }
  auto polylines = BuildPolylines(histories, colors, scene.extend_length_);

  os << MakeTraceResult(elements, histories, polylines).dump(2) << "\n";
  return 0;
}

}  // namespace optray
