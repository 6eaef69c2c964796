#include <fogmap/config.hpp>

#include <cmath>
#include <fstream>
#include <stdexcept>

#include <fogmap/log.hpp>

using nlohmann::json;

namespace fogmap {

// size_t へ直接読むと -1 が SIZE_MAX になるので、符号付きで読んでから検査する
static std::size_t count_value(const json& j, const char* key, std::size_t def) {
    const long long v = j.value(key, static_cast<long long>(def));
    if (v < 0) throw std::invalid_argument(std::string(key) + " must not be negative");
    return static_cast<std::size_t>(v);
}

EngineConfig config_from_json(const json& j) {
    EngineConfig c;
    if (!j.is_object()) return c;

    c.default_buffer_m = j.value("default_buffer_m", c.default_buffer_m);
    c.max_connect_distance_m = j.value("max_connect_distance_m", c.max_connect_distance_m);
    c.max_no_fix_interval_s = j.value("max_no_fix_interval_s", c.max_no_fix_interval_s);
    c.min_teleport_distance_m = j.value("min_teleport_distance_m", c.min_teleport_distance_m);
    c.quad_segs = j.value("quad_segs", c.quad_segs);
    c.snapshot_path = j.value("snapshot_path", c.snapshot_path);
    c.autosave_interval_s = j.value("autosave_interval_s", c.autosave_interval_s);
    c.rebuild_max_fixes = count_value(j, "rebuild_max_fixes", c.rebuild_max_fixes);
    c.rebuild_batch_size = count_value(j, "rebuild_batch_size", c.rebuild_batch_size);
    return c;
}

json config_to_json(const EngineConfig& c) {
    return json{
        {"default_buffer_m", c.default_buffer_m},
        {"max_connect_distance_m", c.max_connect_distance_m},
        {"max_no_fix_interval_s", c.max_no_fix_interval_s},
        {"min_teleport_distance_m", c.min_teleport_distance_m},
        {"quad_segs", c.quad_segs},
        {"snapshot_path", c.snapshot_path},
        {"autosave_interval_s", c.autosave_interval_s},
        {"rebuild_max_fixes", c.rebuild_max_fixes},
        {"rebuild_batch_size", c.rebuild_batch_size}
    };
}

static bool positive(double v) { return std::isfinite(v) && v > 0.0; }

std::string validate(const EngineConfig& c) {
    if (!positive(c.default_buffer_m)) return "default_buffer_m must be > 0";
    if (!positive(c.max_connect_distance_m)) return "max_connect_distance_m must be > 0";
    if (!positive(c.max_no_fix_interval_s)) return "max_no_fix_interval_s must be > 0";
    if (!positive(c.min_teleport_distance_m)) return "min_teleport_distance_m must be > 0";
    if (c.quad_segs < 1) return "quad_segs must be >= 1";
    if (!std::isfinite(c.autosave_interval_s) || c.autosave_interval_s < 0.0) {
        return "autosave_interval_s must be >= 0";
    }
    if (c.rebuild_max_fixes == 0) return "rebuild_max_fixes must be > 0";
    if (c.rebuild_batch_size == 0) return "rebuild_batch_size must be > 0";
    return "";
}

std::optional<EngineConfig> load_config_file(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        log_warn("Failed to open config: " + path);
        return std::nullopt;
    }

    EngineConfig c;
    try {
        json j;
        ifs >> j;
        c = config_from_json(j);
    } catch (const json::exception& e) {
        log_warn(std::string("Failed to parse config: ") + e.what());
        return std::nullopt;
    } catch (const std::invalid_argument& e) {
        log_warn("Invalid config " + path + ": " + e.what());
        return std::nullopt;
    }

    const std::string err = validate(c);
    if (!err.empty()) {
        log_warn("Invalid config " + path + ": " + err);
        return std::nullopt;
    }
    return c;
}

} // namespace fogmap
