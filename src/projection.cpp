#include <fogmap/projection.hpp>

#include <cmath>
#include <stdexcept>

namespace fogmap {

// PROJ: CRS->CRS 変換を作り、可視化向け（lon,lat / easting,northing）に正規化する
static PJ* make_norm_transform(PJ_CONTEXT* ctx, const char* src, const char* dst) {
    PJ* P = proj_create_crs_to_crs(ctx, src, dst, nullptr);
    if (!P) return nullptr;
    PJ* N = proj_normalize_for_visualization(ctx, P);
    proj_destroy(P);
    return N;
}

static constexpr const char* GEOGRAPHIC_CRS = "EPSG:4326";
static constexpr const char* PLANAR_CRS = "EPSG:3857";

WebMercator::WebMercator() {
    ctx_ = proj_context_create();
    if (!ctx_) throw std::runtime_error("proj_context_create failed");

    transform_ = make_norm_transform(ctx_, GEOGRAPHIC_CRS, PLANAR_CRS);
    if (!transform_) {
        const char* reason = proj_context_errno_string(ctx_, proj_context_errno(ctx_));
        const std::string msg = std::string("proj_create_crs_to_crs / normalize failed for ") +
                                GEOGRAPHIC_CRS + " -> " + PLANAR_CRS + ": " + (reason ? reason : "unknown error");
        proj_context_destroy(ctx_);
        ctx_ = nullptr;
        throw std::runtime_error(msg);
    }
}

WebMercator::~WebMercator() {
    if (transform_) proj_destroy(transform_);
    if (ctx_) proj_context_destroy(ctx_);
}

std::optional<PlanarPoint> WebMercator::to_planar(double lon, double lat) const {
    if (!std::isfinite(lon) || !std::isfinite(lat)) return std::nullopt;
    // 極は Web Mercator の定義域外
    if (lat <= -90.0 || lat >= 90.0) return std::nullopt;
    if (lon < -180.0 || lon > 180.0) return std::nullopt;

    PJ_COORD out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        proj_errno_reset(transform_);
        out = proj_trans(transform_, PJ_FWD, proj_coord(lon, lat, 0, 0));
        if (proj_errno(transform_) != 0) return std::nullopt;
    }

    if (!std::isfinite(out.xy.x) || !std::isfinite(out.xy.y)) return std::nullopt;
    return PlanarPoint{out.xy.x, out.xy.y};
}

GeoPoint WebMercator::to_geographic(double x, double y) const {
    PJ_COORD out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // 逆変換: planar -> EPSG:4326
        out = proj_trans(transform_, PJ_INV, proj_coord(x, y, 0, 0));
    }
    return GeoPoint{out.xy.x, out.xy.y};
}

double planar_distance(const PlanarPoint& a, const PlanarPoint& b) {
    return std::hypot(b.x - a.x, b.y - a.y);
}

} // namespace fogmap
