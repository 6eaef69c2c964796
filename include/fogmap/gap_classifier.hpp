#pragma once
#include <optional>

#include <fogmap/types.hpp>

namespace fogmap {

struct GapThresholds {
    double max_connect_distance_m = 10000.0;
    double max_no_fix_interval_s = 30.0;
    double min_teleport_distance_m = 100.0;
};

// 連続する 2 つの fix を corridor でつなぐかどうかを決める。
//
// teleport gap = 長い無測位 + 実際の移動（GNSS の入らない地下鉄など）。
// これはつながない。max_connect_distance_m を超える飛びもつながない。
class GapClassifier {
public:
    GapClassifier() = default;
    explicit GapClassifier(const GapThresholds& t) : t_(t) {}

    bool is_teleport_gap(const TrackCursor& prev, const TrackCursor& cur) const;
    bool is_teleport_gap(const std::optional<TrackCursor>& prev, const TrackCursor& cur) const;

    bool should_connect(const std::optional<TrackCursor>& prev, const TrackCursor& cur) const;

    const GapThresholds& thresholds() const { return t_; }

private:
    GapThresholds t_;
};

} // namespace fogmap
