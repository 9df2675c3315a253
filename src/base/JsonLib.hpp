#pragma once

#include "nlohmann/json.hpp"

using json = nlohmann::json;

namespace oc {
/** @brief True if @p obj is an object holding a string member @p key. */
inline bool hasStringField(const json& obj, const char* key) {
  auto it = obj.find(key);
  return it != obj.end() && it->is_string();
}

/** @brief True if @p obj is an object holding a numeric member @p key. */
inline bool hasNumberField(const json& obj, const char* key) {
  auto it = obj.find(key);
  return it != obj.end() && it->is_number();
}
}  // namespace oc
