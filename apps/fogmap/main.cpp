#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <fogmap/config.hpp>
#include <fogmap/engine.hpp>
#include <fogmap/fix_log.hpp>
#include <fogmap/log.hpp>
#include <fogmap/statistics.hpp>

using nlohmann::json;

// ------------------------------------------------------------
// fogmap: fix log -> explored region -> fog polygon (GeoJSON)
//
// 入力
//   --fixes <csv>      : longitude,latitude,timestamp_ms[,speed_mps]
//   [--state <wkb>]    : 永続化スナップショット（起動時に読み、終了時に書き戻す）
//   [--config <json>]  : EngineConfig（省略時はデフォルト値）
//   [--rebuild]        : スナップショットを無視して fix log から作り直す
//   [--emit-tunnels]   : tunnel gap を MultiLineString feature として出力
//   [--compact]        : JSON を1行で出力
//
// 出力
//   GeoJSON FeatureCollection は stdout、診断は stderr
//
// --state が無い、または壊れている場合は fix log 全体から rebuild する。
// 読めた場合は fix log を追記として流し込む。
// ------------------------------------------------------------

struct Args {
    std::string fixes;
    std::string state;
    std::string config;
    bool rebuild = false;
    bool emit_tunnels = false;
    bool pretty = true;
};

static void die(const std::string& msg, int code = 2) {
    std::cerr << msg << "\n";
    std::exit(code);
}

static Args parse_args(int argc, char** argv) {
    Args a;
    for (int i = 1; i < argc; i++) {
        std::string k = argv[i];
        auto need = [&](const char* name) -> std::string {
            if (i + 1 >= argc) die(std::string("Missing value for ") + name);
            return std::string(argv[++i]);
        };

        if (k == "--fixes") a.fixes = need("--fixes");
        else if (k == "--state") a.state = need("--state");
        else if (k == "--config") a.config = need("--config");
        else if (k == "--rebuild") a.rebuild = true;
        else if (k == "--emit-tunnels") a.emit_tunnels = true;
        else if (k == "--compact") a.pretty = false;
        else if (k == "--help") {
            std::cout
                << "Usage: fogmap --fixes <csv> [--state <wkb>] [--config <json>] [--rebuild]\n"
                << "              [--emit-tunnels] [--compact]\n";
            std::exit(0);
        } else {
            die("Unknown option: " + k);
        }
    }
    if (a.fixes.empty()) die("--fixes is required. Try --help");
    return a;
}

int main(int argc, char** argv) {
    const Args args = parse_args(argc, argv);

    fogmap::EngineConfig cfg;
    if (!args.config.empty()) {
        auto loaded = fogmap::load_config_file(args.config);
        if (!loaded) die("Failed to load config: " + args.config);
        cfg = *loaded;
    }
    cfg.snapshot_path = args.state;
    cfg.autosave_interval_s = 0.0; // 1 回きりの実行なので、保存は stop() の最終保存だけ

    const auto fixes = fogmap::load_fixes_csv(args.fixes, cfg.default_buffer_m);
    if (!fixes) die("Failed to open fix log: " + args.fixes);

    json out;
    try {
        fogmap::ExplorerEngine engine(cfg);
        const fogmap::StartupResult started = engine.start();

        std::size_t rejected = 0;
        if (args.rebuild || started.needs_rebuild) {
            const fogmap::RebuildResult r = engine.rebuild_from_fixes(*fixes);
            rejected = r.fixes_rejected;
            fogmap::log_info("rebuilt from " + std::to_string(r.fixes_used) + " of " +
                             std::to_string(r.fixes_in) + " fixes");
        } else {
            for (const auto& f : *fixes) {
                if (!engine.add_fix(f).ok) rejected++;
            }
        }

        const double area = engine.explored_area_meters();

        json feature = {
            {"type", "Feature"},
            {"properties", {
                {"kind", "fog"},
                {"explored_area_m2", area},
                {"explored_percent_of_earth", fogmap::to_plain_decimal(engine.explored_percent_of_earth())},
                {"explored_percent_of_land", fogmap::to_plain_decimal(engine.explored_percent_of_land())},
                {"fixes_total", fixes->size()},
                {"fixes_rejected", rejected},
                {"assumption", "Area is planar EPSG:3857 (Web Mercator), not geodesic."}
            }},
            {"geometry", engine.to_geojson()}
        };

        json features = json::array({feature});
        if (args.emit_tunnels) {
            features.push_back({
                {"type", "Feature"},
                {"properties", {{"kind", "tunnels"}}},
                {"geometry", engine.tunnels_geojson()}
            });
        }
        out = json{{"type", "FeatureCollection"}, {"features", features}};

        // --state があれば最終スナップショットを書く
        engine.stop();
    } catch (const std::exception& e) {
        die(std::string("fogmap: ") + e.what(), 1);
    }

    if (args.pretty) std::cout << out.dump(2) << "\n";
    else std::cout << out.dump() << "\n";
    return 0;
}
