#include <fogmap/gap_classifier.hpp>

#include <fogmap/projection.hpp>

namespace fogmap {

static double elapsed_s(const TrackCursor& prev, const TrackCursor& cur) {
    return static_cast<double>(cur.timestamp_ms - prev.timestamp_ms) / 1000.0;
}

bool GapClassifier::is_teleport_gap(const TrackCursor& prev, const TrackCursor& cur) const {
    return elapsed_s(prev, cur) >= t_.max_no_fix_interval_s &&
           planar_distance(prev.point, cur.point) >= t_.min_teleport_distance_m;
}

bool GapClassifier::is_teleport_gap(const std::optional<TrackCursor>& prev, const TrackCursor& cur) const {
    return prev && is_teleport_gap(*prev, cur);
}

bool GapClassifier::should_connect(const std::optional<TrackCursor>& prev, const TrackCursor& cur) const {
    if (!prev) return false;
    const bool within_range = planar_distance(prev->point, cur.point) <= t_.max_connect_distance_m;
    return within_range && !is_teleport_gap(*prev, cur);
}

} // namespace fogmap
