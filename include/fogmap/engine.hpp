#pragma once
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include <fogmap/area_accumulator.hpp>
#include <fogmap/config.hpp>
#include <fogmap/persistence.hpp>
#include <fogmap/polygon_exporter.hpp>
#include <fogmap/projection.hpp>
#include <fogmap/statistics.hpp>

namespace fogmap {

struct StartupResult {
    LoadStatus load_status = LoadStatus::missing;
    bool needs_rebuild = false;  // ディスク上に使えるものが無い
    std::string error;
};

// 探索済み領域のサービス。プロセスに 1 つ作り、各 producer に渡す。
//
// start()  スナップショットを読み、autosave スレッドを起動する。
// stop()   スレッドを join して最終スナップショットを書く（デストラクタでも実行）。
//          autosave 中のディスクフルは次の add_fix / save_now / stop で投げ直す。
//          スレッドは止まらず、stop() は投げ直す前に最終保存を試みる。
class ExplorerEngine {
public:
    // config が不正なら std::invalid_argument、PROJ / GEOS の初期化に
    // 失敗したら std::runtime_error。
    explicit ExplorerEngine(EngineConfig config = EngineConfig());
    ~ExplorerEngine();

    ExplorerEngine(const ExplorerEngine&) = delete;
    ExplorerEngine& operator=(const ExplorerEngine&) = delete;

    StartupResult start();
    void stop();

    AddFixResult add_fix(double longitude, double latitude, std::int64_t timestamp_ms, double buffer_m);
    AddFixResult add_fix(const Fix& fix);

    RebuildResult rebuild_from_fixes(const std::vector<Fix>& ordered_fixes,
                                     const BufferRadiusFn& buffer_radius = nullptr);

    // まだ何も探索しておらず、履歴があるときだけ rebuild する
    bool bootstrap_from_history(const std::vector<Fix>& ordered_fixes,
                                const BufferRadiusFn& buffer_radius = nullptr);

    void reset();

    SaveResult save_now();

    FogPolygon to_renderable_polygon() const;
    nlohmann::json to_geojson() const;
    nlohmann::json tunnels_geojson() const;
    std::vector<TunnelSegment> tunnel_segments() const;

    double explored_area_meters() const;
    double explored_percent_of_earth() const;
    double explored_percent_of_land() const;

    Region snapshot() const { return accumulator_.snapshot(); }
    const EngineConfig& config() const { return config_; }

private:
    void autosave_loop();
    SaveResult save_if_changed();
    void store_fatal(std::exception_ptr e);
    void rethrow_fatal();

    EngineConfig config_;
    WebMercator projection_;
    AreaAccumulator accumulator_;
    SnapshotStore store_;
    PolygonExporter exporter_;
    StatisticsCalculator stats_;

    std::mutex save_mutex_;              // スナップショットの書き手は 1 つ
    std::uint64_t saved_generation_ = 0;
    bool has_saved_ = false;

    std::mutex thread_mutex_;
    std::condition_variable wake_;
    bool stopping_ = false;
    bool running_ = false;
    std::thread autosave_;

    std::mutex fatal_mutex_;
    std::exception_ptr fatal_;
};

} // namespace fogmap
