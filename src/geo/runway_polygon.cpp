#include "geo/runway_polygon.hpp"

#include <cmath>

namespace runway {

namespace {

static const double PI = 3.1415926535897932384626433832795;
// 与坐标转换保持同一个地球半径
constexpr double kEarthRadiusM = 6378137.0;

static inline double deg2rad(double d){ return d * PI / 180.0; }
static inline double rad2deg(double r){ return r * 180.0 / PI; }

static inline double NormalizeAzimuth(double az_deg) {
  double a = std::fmod(az_deg, 360.0);
  if (a < 0.0) a += 360.0;
  return a;
}

} // namespace

RunwayPolygon DefaultRunwayPolygon() {
  RunwayPolygon poly;
  poly.ring = {
      {1.374827, 43.610997}, {1.357907, 43.612130}, {1.345193, 43.631459},
      {1.341770, 43.642005}, {1.340938, 43.644966}, {1.315268, 43.669529},
      {1.323170, 43.673883}, {1.345539, 43.652474}, {1.352039, 43.654319},
      {1.362308, 43.655522}, {1.363580, 43.643775}, {1.390182, 43.623388},
      {1.393312, 43.616874}, {1.385374, 43.614351}, {1.413062, 43.587853},
      {1.405172, 43.583499}, {1.376035, 43.611381},
  };
  return poly;
}

GeoPoint ForwardGeodesic(const GeoPoint& start, double azimuth_deg, double distance_m) {
  const double lat1 = deg2rad(start.lat_deg);
  const double lon1 = deg2rad(start.lon_deg);
  const double az = deg2rad(azimuth_deg);
  const double d = distance_m / kEarthRadiusM;

  const double sin_lat2 = std::sin(lat1) * std::cos(d) + std::cos(lat1) * std::sin(d) * std::cos(az);
  const double lat2 = std::asin(sin_lat2);
  const double lon2 = lon1 + std::atan2(std::sin(az) * std::sin(d) * std::cos(lat1),
                                        std::cos(d) - std::sin(lat1) * sin_lat2);

  GeoPoint out;
  out.lat_deg = rad2deg(lat2);
  // 归一到 [-180, 180)
  out.lon_deg = std::fmod(rad2deg(lon2) + 540.0, 360.0) - 180.0;
  return out;
}

RunwayPolygon MakeRunwayZone(const RunwayZoneParams& params) {
  const double az = NormalizeAzimuth(params.azimuth_deg);
  const double opp = NormalizeAzimuth(az + 180.0);

  const GeoPoint far_end = ForwardGeodesic(params.center, opp, params.long_axis_m);
  const GeoPoint near_end = ForwardGeodesic(params.center, az, params.long_axis_m);

  RunwayPolygon poly;
  poly.ring = {
      ForwardGeodesic(far_end, opp + 90.0, params.short_axis_m),
      ForwardGeodesic(far_end, opp - 90.0, params.short_axis_m),
      ForwardGeodesic(near_end, az + 90.0, params.short_axis_m),
      ForwardGeodesic(near_end, az - 90.0, params.short_axis_m),
  };
  return poly;
}

} // namespace runway
