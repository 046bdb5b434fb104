#pragma once
#include <optional>
#include "common/types.hpp"

namespace runway {

// ======================
// 跑道邻近区判定：点在多边形内（边界算在内） 且 高度 < 上限
//
// 约定：
//   - 构造时校验多边形，非法直接抛 InvalidGeometryError
//   - Contains 对单个报点永不抛异常：缺高度 / 缺坐标 / NaN / Inf 一律返回 false
//   - 构造后只读，可在多个 worker 之间共享
// ======================
class GeoPredicate {
public:
  GeoPredicate(const RunwayPolygon& polygon, double altitude_ceiling);

  bool Contains(const std::optional<GeoPoint>& point,
                const std::optional<double>& altitude) const noexcept;

  // 只做平面点-多边形测试（经纬度直接当平面坐标，与原数据集的 st_intersects 一致）
  bool ContainsPoint(const GeoPoint& p) const noexcept;

  const std::vector<GeoPoint>& ring() const { return ring_; }
  double altitude_ceiling() const { return altitude_ceiling_; }

  // 校验并规整顶点环：去掉与首点重复的闭合点；不满足条件抛 InvalidGeometryError
  static std::vector<GeoPoint> NormalizeRing(const RunwayPolygon& polygon);

private:
  std::vector<GeoPoint> ring_;
  double altitude_ceiling_{5000.0};

  // 外包框，先做快速排除
  double min_lon_{0.0}, max_lon_{0.0};
  double min_lat_{0.0}, max_lat_{0.0};
};

} // namespace runway
