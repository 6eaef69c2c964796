#include <fogmap/polygon_exporter.hpp>

#include <algorithm>
#include <utility>

using nlohmann::json;

namespace fogmap {

double signed_area(const LonLatRing& ring) {
    // 反時計回りで宣言した ring なので bg::area は「反時計回り = 正」
    return bg::area(ring);
}

LonLatRing world_ring() {
    LonLatRing r;
    r.push_back(LonLat(-180.0, -90.0));
    r.push_back(LonLat(180.0, -90.0));
    r.push_back(LonLat(180.0, 90.0));
    r.push_back(LonLat(-180.0, 90.0));
    r.push_back(LonLat(-180.0, -90.0));
    return r;
}

PolygonExporter::PolygonExporter(const WebMercator& projection)
    : projection_(projection), ctx_(make_geos_context()) {}

// GEOSリング（LinearRing）の座標列を取り出して、EPSG:4326 (lon,lat) に戻す
LonLatRing PolygonExporter::ring_to_lonlat(const GEOSGeometry* ring) const {
    GEOSContextHandle_t h = ctx_->handle();
    LonLatRing out;

    const GEOSCoordSequence* cs = GEOSGeom_getCoordSeq_r(h, ring);
    if (!cs) return out;

    unsigned int n = 0;
    if (!GEOSCoordSeq_getSize_r(h, cs, &n)) return out;
    out.reserve(n);

    for (unsigned int i = 0; i < n; i++) {
        double x = 0.0, y = 0.0;
        GEOSCoordSeq_getX_r(h, cs, i, &x);
        GEOSCoordSeq_getY_r(h, cs, i, &y);
        const GeoPoint g = projection_.to_geographic(x, y);
        out.push_back(LonLat(g.lon, g.lat));
    }
    return out;
}

FogPolygon PolygonExporter::to_renderable_polygon(const Region& region) const {
    FogPolygon poly;

    poly.outer() = world_ring();
    if (signed_area(poly.outer()) < 0) std::reverse(poly.outer().begin(), poly.outer().end());

    if (region.empty()) return poly;

    std::lock_guard<std::mutex> lock(mutex_);
    GEOSContextHandle_t h = ctx_->handle();
    const GEOSGeometry* geom = region.geometry();
    const int n = GEOSGetNumGeometries_r(h, geom);
    for (int i = 0; i < n; i++) {
        const GEOSGeometry* part = GEOSGetGeometryN_r(h, geom, i); // 内部参照（freeしない）
        if (!part || GEOSGeomTypeId_r(h, part) != GEOS_POLYGON) continue;

        const GEOSGeometry* ext = GEOSGetExteriorRing_r(h, part);
        if (!ext) continue;

        LonLatRing hole = ring_to_lonlat(ext);
        if (hole.size() < 4) continue;
        if (signed_area(hole) > 0) std::reverse(hole.begin(), hole.end());
        poly.inners().push_back(std::move(hole));
    }
    return poly;
}

static json ring_to_geojson_coords(const LonLatRing& ring) {
    json coords = json::array();
    // json自体に reserve() はないので、内部の array_t 参照を取得して reserve する
    coords.get_ref<json::array_t&>().reserve(ring.size());
    for (const auto& p : ring) coords.push_back(json::array({p.x(), p.y()}));
    return coords;
}

json to_geojson(const FogPolygon& poly) {
    json rings = json::array();
    rings.push_back(ring_to_geojson_coords(poly.outer()));
    for (const auto& in : poly.inners()) rings.push_back(ring_to_geojson_coords(in));

    return json{
        {"type", "Polygon"},
        {"coordinates", rings}
    };
}

json tunnels_to_geojson(const std::vector<TunnelSegment>& segments, const WebMercator& projection) {
    json lines = json::array();
    for (const auto& s : segments) {
        const GeoPoint a = projection.to_geographic(s.from.x, s.from.y);
        const GeoPoint b = projection.to_geographic(s.to.x, s.to.y);
        lines.push_back(json::array({json::array({a.lon, a.lat}), json::array({b.lon, b.lat})}));
    }
    return json{
        {"type", "MultiLineString"},
        {"coordinates", lines}
    };
}

} // namespace fogmap
