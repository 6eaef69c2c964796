#pragma once
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace fogmap {

struct EngineConfig {
    double default_buffer_m = 15.0;
    double max_connect_distance_m = 10000.0;
    double max_no_fix_interval_s = 30.0;
    double min_teleport_distance_m = 100.0;
    int quad_segs = 8;                      // バッファ円弧の細かさ
    std::string snapshot_path = "explored.wkb";
    double autosave_interval_s = 30.0;      // 0 なら autosave スレッドを起動しない
    std::size_t rebuild_max_fixes = 20000;
    std::size_t rebuild_batch_size = 200;
};

// 無いキーはデフォルト値のまま。型違いは nlohmann::json::exception、
// 負の件数（rebuild_max_fixes, rebuild_batch_size）は std::invalid_argument。
EngineConfig config_from_json(const nlohmann::json& j);
nlohmann::json config_to_json(const EngineConfig& c);

// 問題があればエラーメッセージ、使える config なら空文字列
std::string validate(const EngineConfig& c);

// ファイルが無い / parse できない / 値が不正なら warn を出して nullopt
std::optional<EngineConfig> load_config_file(const std::string& path);

} // namespace fogmap
