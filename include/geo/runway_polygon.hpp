#pragma once
#include "common/types.hpp"

namespace runway {

// 内置跑道邻近区：Toulouse-Blagnac (LFBO) 双跑道及其进近走廊，[lon, lat] 顺序
RunwayPolygon DefaultRunwayPolygon();

struct RunwayZoneParams {
  GeoPoint center{1.3642, 43.6287}; // 跑道中心
  double azimuth_deg{143.0};        // 跑道轴向（真北顺时针）
  double long_axis_m{10000.0};      // 中心到两端的距离
  double short_axis_m{350.0};       // 轴线两侧的半宽
};

// 沿跑道轴线两端各外推 long_axis_m，再向两侧各偏 short_axis_m，得到四角矩形区。
// 顶点顺序：远端(逆向)左、右 -> 近端(正向)左、右，构成不自交的环。
RunwayPolygon MakeRunwayZone(const RunwayZoneParams& params);

// 球面大圆正算：从 start 沿 azimuth_deg 走 distance_m
GeoPoint ForwardGeodesic(const GeoPoint& start, double azimuth_deg, double distance_m);

} // namespace runway
