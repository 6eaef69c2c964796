#pragma once
#include <cstdint>

namespace fogmap {

// 入力 fix: EPSG:4326 の lon/lat (deg) と、そこで塗る半径 (m)
struct Fix {
    double longitude = 0.0;
    double latitude = 0.0;
    std::int64_t timestamp_ms = 0;
    double buffer_radius_m = 0.0;
};

// Web Mercator (EPSG:3857) の m
struct PlanarPoint {
    double x = 0.0;
    double y = 0.0;
};

struct GeoPoint {
    double lon = 0.0;
    double lat = 0.0;
};

// 最後に受け付けた fix。次の fix と corridor でつなぐために持っておく
struct TrackCursor {
    PlanarPoint point;
    std::int64_t timestamp_ms = 0;
};

// 判定された gap。表示用で、探索済み region には入らない
struct TunnelSegment {
    PlanarPoint from;
    PlanarPoint to;
};

} // namespace fogmap
