#include <fogmap/region.hpp>

namespace fogmap {

Region Region::adopt(GeomPtr geom) {
    if (!geom) return Region();

    const GeosContextPtr ctx = geom.get_deleter().ctx;
    if (GEOSisEmpty_r(ctx->handle(), geom.get()) == 1) return Region();

    GeomDeleter deleter = geom.get_deleter();
    return Region(std::shared_ptr<const GEOSGeometry>(geom.release(), deleter));
}

int Region::component_count(GEOSContextHandle_t h) const {
    if (!geom_) return 0;

    int count = 0;
    const int n = GEOSGetNumGeometries_r(h, geom_.get());
    for (int i = 0; i < n; i++) {
        const GEOSGeometry* g = GEOSGetGeometryN_r(h, geom_.get(), i); // 内部参照
        if (g && GEOSGeomTypeId_r(h, g) == GEOS_POLYGON && GEOSisEmpty_r(h, g) == 0) count++;
    }
    return count;
}

} // namespace fogmap
