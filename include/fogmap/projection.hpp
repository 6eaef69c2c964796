#pragma once
#include <mutex>
#include <optional>
#include <string>

#include <proj.h>

#include <fogmap/types.hpp>

namespace fogmap {

// EPSG:4326 (lon, lat 度) <-> EPSG:3857 (m)。
//
// 可視化向けに正規化してあるので、CRS の軸定義に関係なく常に
// (lon, lat) / (easting, northing)。PJ は reentrant ではないので 1 インスタンス
// への呼び出しは直列化する。
class WebMercator {
public:
    // PROJ が変換を作れなければ std::runtime_error
    WebMercator();
    ~WebMercator();

    WebMercator(const WebMercator&) = delete;
    WebMercator& operator=(const WebMercator&) = delete;

    // 非有限 / |lat| >= 90 / |lon| > 180 / PROJ エラーは nullopt
    std::optional<PlanarPoint> to_planar(double lon, double lat) const;

    GeoPoint to_geographic(double x, double y) const;

private:
    PJ_CONTEXT* ctx_ = nullptr;
    PJ* transform_ = nullptr;
    mutable std::mutex mutex_;
};

// 平面 (EPSG:3857) 上の直線距離
double planar_distance(const PlanarPoint& a, const PlanarPoint& b);

} // namespace fogmap
