#pragma once
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <nlohmann/json.hpp>

#include "common/errors.hpp"

namespace runway::io {

inline std::string ReadAllText(const std::filesystem::path& p) {
  std::ifstream ifs(p, std::ios::in | std::ios::binary);
  if (!ifs) {
    throw ConfigError("Failed to open file: " + p.string());
  }
  std::ostringstream oss;
  oss << ifs.rdbuf();
  return oss.str();
}

inline nlohmann::json ParseJson(const std::string& text, const std::string& hint) {
  try {
    return nlohmann::json::parse(text);
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError("JSON parse failed for " + hint + ": " + std::string(e.what()));
  }
}

// 取可为 null / 缺省的数值字段；存在但不是数值 -> ConfigError
inline std::optional<double> OptionalNumber(const nlohmann::json& obj, const char* key,
                                            const std::string& hint) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) return std::nullopt;
  if (!it->is_number()) {
    throw ConfigError(hint + ": field '" + key + "' must be a number or null");
  }
  return it->get<double>();
}

} // namespace runway::io
