#pragma once
#include <mutex>
#include <vector>

#include <boost/geometry.hpp>
#include <boost/geometry/geometries/point_xy.hpp>
#include <boost/geometry/geometries/polygon.hpp>
#include <boost/geometry/geometries/ring.hpp>

#include <nlohmann/json.hpp>

#include <fogmap/geos_context.hpp>
#include <fogmap/projection.hpp>
#include <fogmap/region.hpp>
#include <fogmap/types.hpp>

namespace fogmap {

namespace bg = boost::geometry;

// x = lon, y = lat (度)。反時計回り・閉じたリング: 外周は shoelace 面積が正、
// 穴はすべて負。
using LonLat = bg::model::d2::point_xy<double>;
using LonLatRing = bg::model::ring<LonLat, false, true>;
using FogPolygon = bg::model::polygon<LonLat, false, true>;

// lon/lat 空間での符号付き shoelace 面積（反時計回り = 正）
double signed_area(const LonLatRing& ring);

// 全世界 (-180,-90) .. (180,90)、閉じたリング
LonLatRing world_ring();

// 「世界 - 探索済み」: 外周は世界リング、region の polygon 1 つにつき
// 穴 1 つ（その exterior ring を lon/lat に戻したもの）。
//
// polygon の interior ring（未探索の飛び地）は出さない。GeoJSON Polygon は
// 穴の中に外周を入れ子にできない。
class PolygonExporter {
public:
    explicit PolygonExporter(const WebMercator& projection);

    FogPolygon to_renderable_polygon(const Region& region) const;

private:
    LonLatRing ring_to_lonlat(const GEOSGeometry* ring) const;

    const WebMercator& projection_;
    GeosContextPtr ctx_;
    mutable std::mutex mutex_;  // ctx_ はシングルスレッド
};

// GeoJSON Polygon geometry: {"type":"Polygon","coordinates":[[...],...]}
nlohmann::json to_geojson(const FogPolygon& poly);

// tunnel gap の GeoJSON MultiLineString (lon/lat)
nlohmann::json tunnels_to_geojson(const std::vector<TunnelSegment>& segments, const WebMercator& projection);

} // namespace fogmap
