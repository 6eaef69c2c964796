#include <fogmap/fix_log.hpp>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fogmap {

double buffer_radius_for_speed(double speed_mps) {
    const double safe = (std::isfinite(speed_mps) && speed_mps >= 0.0) ? speed_mps : 0.0;
    const double kmh = safe * 3.6;

    double radius = 8.0;                // 電車・高速
    if (kmh < 6.0) radius = 40.0;       // 徒歩・停止
    else if (kmh < 25.0) radius = 28.0; // 自転車
    else if (kmh < 70.0) radius = 18.0; // 一般道
    else if (kmh < 130.0) radius = 12.0;

    return std::max(3.0, radius);
}

static std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

static std::vector<std::string> split_csv(const std::string& line) {
    std::vector<std::string> out;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) out.push_back(trim(field));
    return out;
}

static bool parse_double(const std::string& s, double& out) {
    if (s.empty()) return false;
    try {
        std::size_t used = 0;
        out = std::stod(s, &used);
        return used == s.size() && std::isfinite(out);
    } catch (const std::exception&) {
        return false;
    }
}

static bool parse_int64(const std::string& s, std::int64_t& out) {
    if (s.empty()) return false;
    try {
        std::size_t used = 0;
        out = std::stoll(s, &used);
        return used == s.size();
    } catch (const std::exception&) {
        return false;
    }
}

std::vector<Fix> fixes_from_csv_stream(std::istream& in, double default_buffer_m) {
    std::vector<Fix> out;
    std::string line;
    while (std::getline(in, line)) {
        const std::string t = trim(line);
        if (t.empty() || t[0] == '#') continue;

        const auto cols = split_csv(t);
        if (cols.size() < 3) continue;

        Fix f;
        if (!parse_double(cols[0], f.longitude)) continue; // ヘッダ行はここで落ちる
        if (!parse_double(cols[1], f.latitude)) continue;
        if (!parse_int64(cols[2], f.timestamp_ms)) continue;

        f.buffer_radius_m = default_buffer_m;
        if (cols.size() >= 4 && !cols[3].empty()) {
            double speed = 0.0;
            if (!parse_double(cols[3], speed)) continue;
            f.buffer_radius_m = buffer_radius_for_speed(speed);
        }
        out.push_back(f);
    }
    return out;
}

std::optional<std::vector<Fix>> load_fixes_csv(const std::string& path, double default_buffer_m) {
    std::ifstream ifs(path);
    if (!ifs) return std::nullopt;
    return fixes_from_csv_stream(ifs, default_buffer_m);
}

} // namespace fogmap
