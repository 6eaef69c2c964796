#include <fogmap/engine.hpp>

#include <chrono>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <fogmap/log.hpp>

using nlohmann::json;

namespace fogmap {

static EngineConfig validated(EngineConfig c) {
    const std::string err = validate(c);
    if (!err.empty()) throw std::invalid_argument("invalid EngineConfig: " + err);
    return c;
}

static GapThresholds thresholds_of(const EngineConfig& c) {
    GapThresholds t;
    t.max_connect_distance_m = c.max_connect_distance_m;
    t.max_no_fix_interval_s = c.max_no_fix_interval_s;
    t.min_teleport_distance_m = c.min_teleport_distance_m;
    return t;
}

ExplorerEngine::ExplorerEngine(EngineConfig config)
    : config_(validated(std::move(config))),
      accumulator_(projection_, thresholds_of(config_), config_.quad_segs),
      store_(config_.snapshot_path),
      exporter_(projection_) {}

ExplorerEngine::~ExplorerEngine() {
    try {
        stop();
    } catch (const std::exception& e) {
        log_warn(std::string("final save failed during shutdown: ") + e.what());
    }
}

StartupResult ExplorerEngine::start() {
    StartupResult res;
    {
        std::lock_guard<std::mutex> lock(thread_mutex_);
        if (running_) {
            res.error = "engine already started";
            log_warn(res.error);
            return res;
        }
        running_ = true;
        stopping_ = false;
    }

    if (config_.snapshot_path.empty()) {
        res.load_status = LoadStatus::missing;
        res.needs_rebuild = true;
        return res;
    }

    LoadResult loaded = store_.load();
    res.load_status = loaded.status;
    res.error = loaded.error;

    const bool empty = loaded.region.empty();
    if (loaded.status == LoadStatus::loaded) {
        if (!accumulator_.replace(std::move(loaded.region))) {
            res.load_status = LoadStatus::corrupt;
            res.error = "snapshot " + store_.path() + " holds an invalid region";
        }
    }

    if (res.load_status == LoadStatus::loaded) {
        {
            std::lock_guard<std::mutex> lock(save_mutex_);
            saved_generation_ = accumulator_.generation();
            has_saved_ = true;
        }
        res.needs_rebuild = empty;
        log_info("loaded snapshot " + store_.path() + ", area " +
                 to_plain_decimal(explored_area_meters()) + " m2");
    } else {
        res.needs_rebuild = true;
        if (res.load_status == LoadStatus::corrupt) {
            log_warn("discarding snapshot " + store_.path() + ", starting from an empty region");
        }
    }

    if (config_.autosave_interval_s > 0.0) {
        autosave_ = std::thread(&ExplorerEngine::autosave_loop, this);
    }
    return res;
}

void ExplorerEngine::stop() {
    {
        std::lock_guard<std::mutex> lock(thread_mutex_);
        if (!running_) {
            rethrow_fatal();
            return;
        }
        stopping_ = true;
    }
    wake_.notify_all();
    if (autosave_.joinable()) autosave_.join();

    {
        std::lock_guard<std::mutex> lock(thread_mutex_);
        running_ = false;
    }

    // 保存済みの致命的エラーがあっても、最後の保存は必ず試みる
    if (!config_.snapshot_path.empty()) {
        try {
            save_if_changed();
        } catch (const std::exception& e) {
            log_warn(std::string("final save failed: ") + e.what());
            store_fatal(std::current_exception());
        }
    }
    rethrow_fatal();
}

void ExplorerEngine::autosave_loop() {
    const auto interval = std::chrono::duration<double>(config_.autosave_interval_s);

    std::unique_lock<std::mutex> lock(thread_mutex_);
    while (!stopping_) {
        if (wake_.wait_for(lock, interval, [this] { return stopping_; })) break;

        lock.unlock();
        try {
            save_if_changed();
        } catch (const std::exception& e) {
            // ディスクフル / メモリ不足: 次の呼び出し側へ投げ直し、ループは続ける
            log_warn(std::string("autosave failed: ") + e.what());
            store_fatal(std::current_exception());
        }
        lock.lock();
    }
}

// 先に起きたエラーを優先し、まだ投げ直していないものは上書きしない
void ExplorerEngine::store_fatal(std::exception_ptr e) {
    std::lock_guard<std::mutex> lock(fatal_mutex_);
    if (!fatal_) fatal_ = std::move(e);
}

void ExplorerEngine::rethrow_fatal() {
    std::exception_ptr e;
    {
        std::lock_guard<std::mutex> lock(fatal_mutex_);
        std::swap(e, fatal_);
    }
    if (e) std::rethrow_exception(e);
}

SaveResult ExplorerEngine::save_if_changed() {
    std::lock_guard<std::mutex> lock(save_mutex_);

    const std::uint64_t gen = accumulator_.generation();
    if (has_saved_ && gen == saved_generation_) return SaveResult{};

    const Region region = accumulator_.snapshot();
    if (!has_saved_ && region.empty()) return SaveResult{};

    SaveResult res = store_.save(region);
    if (res.ok) {
        saved_generation_ = gen;
        has_saved_ = true;
    }
    return res;
}

SaveResult ExplorerEngine::save_now() {
    rethrow_fatal();

    if (config_.snapshot_path.empty()) {
        SaveResult res;
        res.ok = false;
        res.error = "no snapshot_path configured";
        return res;
    }

    std::lock_guard<std::mutex> lock(save_mutex_);
    const std::uint64_t gen = accumulator_.generation();
    SaveResult res = store_.save(accumulator_.snapshot());
    if (res.ok) {
        saved_generation_ = gen;
        has_saved_ = true;
    }
    return res;
}

AddFixResult ExplorerEngine::add_fix(double longitude, double latitude, std::int64_t timestamp_ms, double buffer_m) {
    return add_fix(Fix{longitude, latitude, timestamp_ms, buffer_m});
}

AddFixResult ExplorerEngine::add_fix(const Fix& fix) {
    rethrow_fatal();
    return accumulator_.add_fix(fix);
}

RebuildResult ExplorerEngine::rebuild_from_fixes(const std::vector<Fix>& ordered_fixes,
                                                 const BufferRadiusFn& buffer_radius) {
    return accumulator_.rebuild_from_fixes(ordered_fixes, buffer_radius,
                                           config_.rebuild_batch_size, config_.rebuild_max_fixes);
}

bool ExplorerEngine::bootstrap_from_history(const std::vector<Fix>& ordered_fixes,
                                            const BufferRadiusFn& buffer_radius) {
    const std::optional<RebuildResult> r = accumulator_.rebuild_if_empty(
        ordered_fixes, buffer_radius, config_.rebuild_batch_size, config_.rebuild_max_fixes);
    return r.has_value();
}

void ExplorerEngine::reset() { accumulator_.reset(); }

FogPolygon ExplorerEngine::to_renderable_polygon() const {
    return exporter_.to_renderable_polygon(accumulator_.snapshot());
}

json ExplorerEngine::to_geojson() const {
    return fogmap::to_geojson(to_renderable_polygon());
}

json ExplorerEngine::tunnels_geojson() const {
    return tunnels_to_geojson(accumulator_.tunnel_segments(), projection_);
}

std::vector<TunnelSegment> ExplorerEngine::tunnel_segments() const {
    return accumulator_.tunnel_segments();
}

double ExplorerEngine::explored_area_meters() const {
    return stats_.area_m2(accumulator_.snapshot());
}

double ExplorerEngine::explored_percent_of_earth() const {
    return stats_.percent_of_earth(accumulator_.snapshot());
}

double ExplorerEngine::explored_percent_of_land() const {
    return stats_.percent_of_land(accumulator_.snapshot());
}

} // namespace fogmap
