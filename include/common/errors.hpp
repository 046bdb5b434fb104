#pragma once
#include <stdexcept>
#include <string>

namespace runway {

// 跑道多边形配置非法（顶点不足 / 自交 / 非有限值 / 面积为 0）。启动即失败。
class InvalidGeometryError : public std::runtime_error {
public:
  explicit InvalidGeometryError(const std::string& what)
      : std::runtime_error("invalid runway polygon: " + what) {}
};

// 期望有报点却拿到空数据集
class EmptyDatasetError : public std::runtime_error {
public:
  explicit EmptyDatasetError(const std::string& what)
      : std::runtime_error("empty dataset: " + what) {}
};

// 配置 / 输入文件无法读取或格式不对
class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace runway
