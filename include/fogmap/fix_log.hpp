#pragma once
#include <istream>
#include <optional>
#include <string>
#include <vector>

#include <fogmap/types.hpp>

namespace fogmap {

// 速度 (m/s) -> buffer 半径 (m)。km/h で区切る:
//   < 6 -> 40, < 25 -> 28, < 70 -> 18, < 130 -> 12, それ以上 8
// 遅いほど太く塗る。非有限・負の速度は停止扱い。3 m 未満にはしない。
double buffer_radius_for_speed(double speed_mps);

// 生の fix log。1 行 1 fix: longitude,latitude,timestamp_ms[,speed_mps]
// ヘッダ行はあってもよい。'#' で始まる行と空行は無視、前後の空白は trim、
// 不正な行は読み飛ばす。速度列が無い行は default_buffer_m。
std::vector<Fix> fixes_from_csv_stream(std::istream& in, double default_buffer_m = 15.0);

// ファイル版。開けなければ nullopt
std::optional<std::vector<Fix>> load_fixes_csv(const std::string& path, double default_buffer_m = 15.0);

} // namespace fogmap
