#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <fogmap/gap_classifier.hpp>
#include <fogmap/geos_context.hpp>
#include <fogmap/projection.hpp>
#include <fogmap/region.hpp>
#include <fogmap/types.hpp>

namespace fogmap {

struct AddFixResult {
    bool ok = true;
    bool connected = false;   // 直前の fix から corridor を引いた
    bool tunnel_gap = false;  // TunnelSegment を記録した
    std::string error;
};

struct RebuildResult {
    std::size_t fixes_in = 0;
    std::size_t fixes_used = 0;      // 間引き後
    std::size_t fixes_rejected = 0;  // add_fix が ok=false を返した数
};

using BufferRadiusFn = std::function<double(const Fix&)>;

// 固定間隔の間引き: fixes.size() > max_fixes のとき、index 0 から
// (size / max_fixes) 個おきに残す。順序はそのまま。
std::vector<Fix> downsample_fixes(const std::vector<Fix>& fixes, std::size_t max_fixes);

// 探索済み region と track cursor を持つ。
//
// 変更（判定 / buffer / union / cursor 更新）はすべて 1 つの critical section
// の中で行う。複数の producer が割り込み合うことはなく、region と cursor が
// ずれて見えることもない。失敗した fix はどちらも変えない。
class AreaAccumulator {
public:
    AreaAccumulator(const WebMercator& projection, const GapThresholds& thresholds, int quad_segs = 8);

    AreaAccumulator(const AreaAccumulator&) = delete;
    AreaAccumulator& operator=(const AreaAccumulator&) = delete;

    AddFixResult add_fix(const Fix& fix);

    void reset();

    // 実行中はずっと排他。並行する add_fix は待たされる。
    RebuildResult rebuild_from_fixes(const std::vector<Fix>& fixes,
                                     const BufferRadiusFn& buffer_radius = nullptr,
                                     std::size_t batch_size = 200,
                                     std::size_t max_fixes = 20000);

    // region が空で fixes が空でないときだけ rebuild_from_fixes する。
    // 判定も同じ critical section の中。やらなかったときは nullopt。
    std::optional<RebuildResult> rebuild_if_empty(const std::vector<Fix>& fixes,
                                                  const BufferRadiusFn& buffer_radius = nullptr,
                                                  std::size_t batch_size = 200,
                                                  std::size_t max_fixes = 20000);

    // 読み込んだ region に差し替え、cursor と tunnel 履歴は消す。
    // invalid な geometry は拒否（warn を出して false）し、何も変えない。
    bool replace(Region region);

    Region snapshot() const;
    std::optional<TrackCursor> cursor() const;
    std::vector<TunnelSegment> tunnel_segments() const;

    // region が変わるたびに 1 増える
    std::uint64_t generation() const;

private:
    AddFixResult add_fix_locked(const Fix& fix);
    void reset_locked();
    RebuildResult rebuild_locked(const std::vector<Fix>& fixes, const BufferRadiusFn& buffer_radius,
                                 std::size_t batch_size, std::size_t max_fixes);
    GeomPtr buffer_point(const PlanarPoint& p, double radius);
    GeomPtr buffer_corridor(const PlanarPoint& a, const PlanarPoint& b, double radius);

    const WebMercator& projection_;
    GapClassifier classifier_;
    int quad_segs_;
    GeosContextPtr ctx_;

    mutable std::mutex mutex_;
    Region region_;
    std::optional<TrackCursor> cursor_;
    std::vector<TunnelSegment> tunnels_;
    std::uint64_t generation_ = 0;
};

} // namespace fogmap
