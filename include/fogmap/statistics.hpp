#pragma once
#include <mutex>
#include <string>

#include <fogmap/geos_context.hpp>
#include <fogmap/region.hpp>

namespace fogmap {

constexpr double EARTH_SURFACE_AREA_M2 = 5.10072e14;
constexpr double EARTH_LAND_AREA_M2 = 1.4894e14;

// 平面 (Web Mercator) 面積。測地線補正なし: 実面積より約 1/cos^2(lat) 倍
// 大きく出るので、比べられるのは緯度の近い region 同士だけ。
class StatisticsCalculator {
public:
    StatisticsCalculator();

    double area_m2(const Region& region) const;
    double percent_of_earth(const Region& region) const;
    double percent_of_land(const Region& region) const;

private:
    GeosContextPtr ctx_;
    mutable std::mutex mutex_;  // ctx_ はシングルスレッド
};

// 指数表記なしの固定小数点。有効桁は significant_digits 以上、末尾の 0 は落とす。
// 例: 1.234e-7 -> "0.0000001234", 42.5 -> "42.5"
std::string to_plain_decimal(double value, int significant_digits = 4);

} // namespace fogmap
