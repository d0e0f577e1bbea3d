#ifndef SRC_APP_TRACE_APP_H_
#define SRC_APP_TRACE_APP_H_

#include <nlohmann/json.hpp>
#include <ostream>
#include <vector>

#include "core/def.hpp"
#include "core/optics.hpp"
#include "core/polyline.hpp"

namespace optray {

/**
 * @brief Build the result document of a trace.
 *
 * ~~~json
 * {
 *   "elements": [ { "name": "M1", "ends": [[x0, y0], [x1, y1]] } ],
 *   "histories": [ [[x, y, angle], ...] ],
 *   "polylines": [ { "color": [r, g, b], "points": [[x, y], ...] } ]
 * }
 * ~~~
 * Terminated coordinates are written as null.
 */
nlohmann::json MakeTraceResult(const std::vector<ElementPtrU>& elements, const std::vector<RayHistory>& histories,
                               const std::vector<RayPolyline>& polylines);

/**
 * @brief Run the command line tracer: `optray_trace -f scene.json [-v] [-d]`.
 *
 * The result document goes to `os`. Logs never do.
 *
 * @return 0 on success, -1 on argument or scene errors.
 */
int RunTrace(int argc, char** argv, std::ostream& os);

}  // namespace optray

#endif  // SRC_APP_TRACE_APP_H_
