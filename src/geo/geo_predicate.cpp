#include "geo/geo_predicate.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "common/errors.hpp"

namespace runway {

namespace {

static const double EPS = 1e-12;

struct Vec2 {
  double x = 0.0;
  double y = 0.0;
};

static inline Vec2 operator-(const Vec2& a, const Vec2& b){ return {a.x-b.x, a.y-b.y}; }
static inline double cross(const Vec2& a, const Vec2& b){ return a.x*b.y - a.y*b.x; }
static inline Vec2 ToVec2(const GeoPoint& p){ return {p.lon_deg, p.lat_deg}; }

static int orient(const Vec2& a, const Vec2& b, const Vec2& c){
  const double v = cross(b-a, c-a);
  if (std::fabs(v) < EPS) return 0;
  return (v>0)?1:-1;
}

// 调用方保证 a,b,p 共线，这里只看包围盒
static bool onseg(const Vec2& a, const Vec2& b, const Vec2& p){
  return std::min(a.x,b.x)-EPS <= p.x && p.x <= std::max(a.x,b.x)+EPS &&
         std::min(a.y,b.y)-EPS <= p.y && p.y <= std::max(a.y,b.y)+EPS;
}

static bool seg_intersect(const Vec2& a, const Vec2& b, const Vec2& c, const Vec2& d){
  const int o1=orient(a,b,c), o2=orient(a,b,d), o3=orient(c,d,a), o4=orient(c,d,b);
  if (o1==0 && onseg(a,b,c)) return true;
  if (o2==0 && onseg(a,b,d)) return true;
  if (o3==0 && onseg(c,d,a)) return true;
  if (o4==0 && onseg(c,d,b)) return true;
  return (o1*o2<0 && o3*o4<0);
}

static double signed_area2(const std::vector<GeoPoint>& ring){
  double s = 0.0;
  const std::size_t n = ring.size();
  for (std::size_t i = 0, j = n - 1; i < n; j = i++) {
    s += cross(ToVec2(ring[j]), ToVec2(ring[i]));
  }
  return s;
}

static bool SamePoint(const GeoPoint& a, const GeoPoint& b){
  return a.lon_deg == b.lon_deg && a.lat_deg == b.lat_deg;
}

} // namespace

std::vector<GeoPoint> GeoPredicate::NormalizeRing(const RunwayPolygon& polygon) {
  std::vector<GeoPoint> ring = polygon.ring;

  // WKT 风格的闭合点（末点 == 首点）去掉
  if (ring.size() >= 2 && SamePoint(ring.front(), ring.back())) {
    ring.pop_back();
  }

  for (std::size_t i = 0; i < ring.size(); ++i) {
    if (!std::isfinite(ring[i].lon_deg) || !std::isfinite(ring[i].lat_deg)) {
      std::ostringstream oss;
      oss << "vertex " << i << " is not finite";
      throw InvalidGeometryError(oss.str());
    }
  }

  if (ring.size() < 3) {
    std::ostringstream oss;
    oss << "need at least 3 vertices, got " << ring.size();
    throw InvalidGeometryError(oss.str());
  }

  const std::size_t n = ring.size();
  for (std::size_t i = 0; i < n; ++i) {
    if (SamePoint(ring[i], ring[(i + 1) % n])) {
      std::ostringstream oss;
      oss << "duplicate consecutive vertex at " << i;
      throw InvalidGeometryError(oss.str());
    }
  }

  if (std::fabs(signed_area2(ring)) < EPS) {
    throw InvalidGeometryError("ring has zero area");
  }

  // 非相邻边两两求交：简单多边形不允许自交
  for (std::size_t i = 0; i < n; ++i) {
    const Vec2 a = ToVec2(ring[i]);
    const Vec2 b = ToVec2(ring[(i + 1) % n]);
    for (std::size_t j = i + 1; j < n; ++j) {
      // 跳过相邻边（共享一个端点）
      if (j == i + 1 || (i == 0 && j == n - 1)) continue;
      const Vec2 c = ToVec2(ring[j]);
      const Vec2 d = ToVec2(ring[(j + 1) % n]);
      if (seg_intersect(a, b, c, d)) {
        std::ostringstream oss;
        oss << "edges " << i << " and " << j << " intersect";
        throw InvalidGeometryError(oss.str());
      }
    }
  }

  return ring;
}

GeoPredicate::GeoPredicate(const RunwayPolygon& polygon, double altitude_ceiling)
    : ring_(NormalizeRing(polygon)), altitude_ceiling_(altitude_ceiling) {
  if (!std::isfinite(altitude_ceiling_)) {
    throw InvalidGeometryError("altitude ceiling is not finite");
  }

  min_lon_ = max_lon_ = ring_.front().lon_deg;
  min_lat_ = max_lat_ = ring_.front().lat_deg;
  for (const auto& v : ring_) {
    min_lon_ = std::min(min_lon_, v.lon_deg);
    max_lon_ = std::max(max_lon_, v.lon_deg);
    min_lat_ = std::min(min_lat_, v.lat_deg);
    max_lat_ = std::max(max_lat_, v.lat_deg);
  }
}

bool GeoPredicate::ContainsPoint(const GeoPoint& gp) const noexcept {
  if (!std::isfinite(gp.lon_deg) || !std::isfinite(gp.lat_deg)) return false;
  if (gp.lon_deg < min_lon_ || gp.lon_deg > max_lon_ ||
      gp.lat_deg < min_lat_ || gp.lat_deg > max_lat_) {
    return false;
  }

  // ray casting；落在边上算在内
  const Vec2 p = ToVec2(gp);
  bool inside = false;
  const std::size_t n = ring_.size();
  for (std::size_t i = 0, j = n - 1; i < n; j = i++) {
    const Vec2 a = ToVec2(ring_[i]);
    const Vec2 b = ToVec2(ring_[j]);
    if (orient(a, b, p) == 0 && onseg(a, b, p)) return true;
    const bool cond = (a.y > p.y) != (b.y > p.y);
    if (cond) {
      const double xint = (b.x-a.x)*(p.y-a.y)/(b.y-a.y) + a.x;
      if (xint > p.x) inside = !inside;
    }
  }
  return inside;
}

bool GeoPredicate::Contains(const std::optional<GeoPoint>& point,
                            const std::optional<double>& altitude) const noexcept {
  // 任一缺失都按“不在区内”处理，NaN 的比较本身也是 false
  if (!point || !altitude) return false;
  if (!(*altitude < altitude_ceiling_)) return false;
  return ContainsPoint(*point);
}

} // namespace runway
