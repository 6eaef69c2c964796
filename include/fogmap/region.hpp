#pragma once
#include <memory>
#include <utility>

#include <fogmap/geos_context.hpp>

namespace fogmap {

// 探索済み region の immutable なスナップショット（EPSG:3857, m）。
//
// コピーは 1 つの GEOS geometry を共有する。公開した geometry は変更しないので、
// accumulator が先へ進んでもスナップショットは一貫したまま。デフォルト構築は空。
class Region {
public:
    Region() = default;

    // 所有権を受け取る。null / 空の geometry なら空の Region
    static Region adopt(GeomPtr geom);

    bool empty() const { return !geom_; }

    // 空なら null。この Region（かそのコピー）が生きている間は有効
    const GEOSGeometry* geometry() const { return geom_.get(); }

    // polygon の個数（空なら 0）
    int component_count(GEOSContextHandle_t h) const;

private:
    explicit Region(std::shared_ptr<const GEOSGeometry> g) : geom_(std::move(g)) {}

    std::shared_ptr<const GEOSGeometry> geom_;
};

} // namespace fogmap
