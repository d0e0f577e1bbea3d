#ifndef SRC_IO_JSON_UTIL_H_
#define SRC_IO_JSON_UTIL_H_

#include <cstddef>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

#include "util/log.hpp"

namespace optray {

/**
 * @brief Get `obj[key]` as an array. Throw std::invalid_argument if it is any other json type.
 */
inline const nlohmann::json& JsonGetArray(const nlohmann::json& obj, const char* key) {
  const auto& arr = obj.at(key);
  if (!arr.is_array()) {
    throw std::invalid_argument(std::string(key) + " must be an array, got " + arr.dump());
  }
  return arr;
}


/**
 * @brief Read a fixed-length numeric array. Throw std::invalid_argument if the value is not an array of
 *        exactly `n` numbers.
 */
template <typename T>
void JsonGetNumberArray(const nlohmann::json& obj, const char* what, T* dst, size_t n) {
  if (!obj.is_array() || obj.size() != n) {
    throw std::invalid_argument(std::string(what) + " must be an array of " + std::to_string(n) + " numbers, got " +
                                obj.dump());
  }
  for (size_t i = 0; i < n; i++) {
    if (!obj[i].is_number()) {
      throw std::invalid_argument(std::string(what) + " must contain numbers only, got " + obj.dump());
    }
    obj[i].get_to(dst[i]);
  }
}

}  // namespace optray

#define JSON_CHECK_AND_UPDATE_SIMPLE_VALUE(obj, key, dst)   \
  if (obj.contains(key)) {                                  \
    obj.at(key).get_to(dst);                                \
  } else {                                                  \
    LOG_VERBOSE("missing key %s. use default value.", key); \
  }

#define JSON_CHECK_AND_APPLY_SIMPLE_VALUE(obj, key, type, f) \
  if (obj.contains(key)) {                                   \
    auto tmp = obj.at(key).get<type>();                      \
    f(tmp);                                                  \
  } else {                                                   \
    LOG_VERBOSE("missing key %s. do nothing.", key);         \
  }

#endif  // SRC_IO_JSON_UTIL_H_
