#include <fogmap/area_accumulator.hpp>

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

#include <fogmap/log.hpp>

namespace fogmap {

std::vector<Fix> downsample_fixes(const std::vector<Fix>& fixes, std::size_t max_fixes) {
    if (max_fixes == 0 || fixes.size() <= max_fixes) return fixes;

    const std::size_t step = fixes.size() / max_fixes;
    std::vector<Fix> out;
    out.reserve(fixes.size() / step + 1);
    for (std::size_t i = 0; i < fixes.size(); i++) {
        if (i % step == 0) out.push_back(fixes[i]);
    }
    return out;
}

AreaAccumulator::AreaAccumulator(const WebMercator& projection, const GapThresholds& thresholds, int quad_segs)
    : projection_(projection),
      classifier_(thresholds),
      quad_segs_(quad_segs),
      ctx_(make_geos_context()) {}

GeomPtr AreaAccumulator::buffer_point(const PlanarPoint& p, double radius) {
    GEOSContextHandle_t h = ctx_->handle();

    GEOSCoordSequence* cs = GEOSCoordSeq_create_r(h, 1, 2);
    if (!cs) return make_geom(ctx_, nullptr);
    GEOSCoordSeq_setX_r(h, cs, 0, p.x);
    GEOSCoordSeq_setY_r(h, cs, 0, p.y);

    GeomPtr pt = make_geom(ctx_, GEOSGeom_createPoint_r(h, cs)); // cs の所有権は pt へ
    if (!pt) return pt;
    return make_geom(ctx_, GEOSBuffer_r(h, pt.get(), radius, quad_segs_));
}

GeomPtr AreaAccumulator::buffer_corridor(const PlanarPoint& a, const PlanarPoint& b, double radius) {
    // 長さ 0 の線分は GEOS が空として buffer するので、点の buffer にする
    if (a.x == b.x && a.y == b.y) return buffer_point(b, radius);

    GEOSContextHandle_t h = ctx_->handle();

    GEOSCoordSequence* cs = GEOSCoordSeq_create_r(h, 2, 2);
    if (!cs) return make_geom(ctx_, nullptr);
    GEOSCoordSeq_setX_r(h, cs, 0, a.x);
    GEOSCoordSeq_setY_r(h, cs, 0, a.y);
    GEOSCoordSeq_setX_r(h, cs, 1, b.x);
    GEOSCoordSeq_setY_r(h, cs, 1, b.y);

    GeomPtr line = make_geom(ctx_, GEOSGeom_createLineString_r(h, cs));
    if (!line) return line;
    return make_geom(ctx_, GEOSBuffer_r(h, line.get(), radius, quad_segs_));
}

AddFixResult AreaAccumulator::add_fix(const Fix& fix) {
    std::lock_guard<std::mutex> lock(mutex_);
    return add_fix_locked(fix);
}

AddFixResult AreaAccumulator::add_fix_locked(const Fix& fix) {
    AddFixResult res;

    auto reject = [&](const std::string& why) {
        std::ostringstream oss;
        oss << "fix rejected (lon=" << fix.longitude << ", lat=" << fix.latitude
            << ", t=" << fix.timestamp_ms << "): " << why;
        res.ok = false;
        res.connected = false;
        res.tunnel_gap = false;
        res.error = oss.str();
        log_warn(res.error);
        return res;
    };

    if (!std::isfinite(fix.buffer_radius_m) || fix.buffer_radius_m <= 0.0) {
        return reject("buffer radius must be a positive number");
    }

    const std::optional<PlanarPoint> p = projection_.to_planar(fix.longitude, fix.latitude);
    if (!p) return reject("coordinates outside the projection domain");

    const TrackCursor cur{*p, fix.timestamp_ms};

    ctx_->clear_error();
    GeomPtr shape;
    if (classifier_.should_connect(cursor_, cur)) {
        shape = buffer_corridor(cursor_->point, cur.point, fix.buffer_radius_m);
        res.connected = true;
    } else {
        shape = buffer_point(cur.point, fix.buffer_radius_m);
        res.tunnel_gap = classifier_.is_teleport_gap(cursor_, cur);
    }

    GEOSContextHandle_t h = ctx_->handle();
    if (!shape || GEOSisEmpty_r(h, shape.get()) != 0 || GEOSisValid_r(h, shape.get()) != 1) {
        return reject("degenerate buffered shape " + ctx_->last_error());
    }

    GeomPtr merged;
    if (region_.empty()) {
        merged = std::move(shape);
    } else {
        merged = make_geom(ctx_, GEOSUnion_r(h, region_.geometry(), shape.get()));
        if (!merged) return reject("union failed: " + ctx_->last_error());
    }

    // ここから先は失敗しない: region と cursor を同時に差し替える
    if (res.tunnel_gap) tunnels_.push_back(TunnelSegment{cursor_->point, cur.point});
    region_ = Region::adopt(std::move(merged));
    cursor_ = cur;
    generation_++;
    return res;
}

void AreaAccumulator::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    reset_locked();
}

void AreaAccumulator::reset_locked() {
    region_ = Region();
    cursor_.reset();
    tunnels_.clear();
    generation_++;
}

RebuildResult AreaAccumulator::rebuild_from_fixes(const std::vector<Fix>& fixes,
                                                  const BufferRadiusFn& buffer_radius,
                                                  std::size_t batch_size,
                                                  std::size_t max_fixes) {
    std::lock_guard<std::mutex> lock(mutex_);
    return rebuild_locked(fixes, buffer_radius, batch_size, max_fixes);
}

std::optional<RebuildResult> AreaAccumulator::rebuild_if_empty(const std::vector<Fix>& fixes,
                                                               const BufferRadiusFn& buffer_radius,
                                                               std::size_t batch_size,
                                                               std::size_t max_fixes) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!region_.empty() || fixes.empty()) return std::nullopt;
    return rebuild_locked(fixes, buffer_radius, batch_size, max_fixes);
}

RebuildResult AreaAccumulator::rebuild_locked(const std::vector<Fix>& fixes,
                                              const BufferRadiusFn& buffer_radius,
                                              std::size_t batch_size,
                                              std::size_t max_fixes) {
    reset_locked();

    RebuildResult out;
    out.fixes_in = fixes.size();

    const std::vector<Fix> sampled = downsample_fixes(fixes, max_fixes);
    out.fixes_used = sampled.size();
    if (sampled.size() != fixes.size()) {
        log_info("rebuild: downsampled " + std::to_string(fixes.size()) + " fixes to " +
                 std::to_string(sampled.size()));
    }

    if (batch_size == 0) batch_size = sampled.size();
    std::size_t idx = 0;
    while (idx < sampled.size()) {
        const std::size_t end = std::min(sampled.size(), idx + batch_size);
        for (std::size_t i = idx; i < end; i++) {
            Fix f = sampled[i];
            if (buffer_radius) f.buffer_radius_m = buffer_radius(f);
            if (!add_fix_locked(f).ok) out.fixes_rejected++;
        }
        idx = end;
    }

    log_info("rebuild: replayed " + std::to_string(out.fixes_used) + " fixes, " +
             std::to_string(out.fixes_rejected) + " rejected");
    return out;
}

bool AreaAccumulator::replace(Region region) {
    std::lock_guard<std::mutex> lock(mutex_);
    ctx_->clear_error();
    if (!region.empty() && GEOSisValid_r(ctx_->handle(), region.geometry()) != 1) {
        log_warn("replace: refusing an invalid region " + ctx_->last_error());
        return false;
    }
    region_ = std::move(region);
    cursor_.reset();
    tunnels_.clear();
    generation_++;
    return true;
}

Region AreaAccumulator::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return region_;
}

std::optional<TrackCursor> AreaAccumulator::cursor() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cursor_;
}

std::vector<TunnelSegment> AreaAccumulator::tunnel_segments() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tunnels_;
}

std::uint64_t AreaAccumulator::generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

} // namespace fogmap
