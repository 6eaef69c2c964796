#include <fogmap/statistics.hpp>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

#include <fogmap/log.hpp>

namespace fogmap {

StatisticsCalculator::StatisticsCalculator() : ctx_(make_geos_context()) {}

double StatisticsCalculator::area_m2(const Region& region) const {
    if (region.empty()) return 0.0;

    std::lock_guard<std::mutex> lock(mutex_);
    double a = 0.0;
    if (!GEOSArea_r(ctx_->handle(), region.geometry(), &a)) {
        log_warn("GEOSArea_r failed: " + ctx_->last_error());
        return 0.0;
    }
    return a;
}

double StatisticsCalculator::percent_of_earth(const Region& region) const {
    return area_m2(region) / EARTH_SURFACE_AREA_M2 * 100.0;
}

double StatisticsCalculator::percent_of_land(const Region& region) const {
    return area_m2(region) / EARTH_LAND_AREA_M2 * 100.0;
}

std::string to_plain_decimal(double value, int significant_digits) {
    if (!std::isfinite(value)) return std::isnan(value) ? "nan" : (value > 0 ? "inf" : "-inf");
    if (value == 0.0) return "0";
    if (significant_digits < 1) significant_digits = 1;

    // 小数点以下の桁数 = 有効桁 - 整数部の桁位置
    const int magnitude = static_cast<int>(std::floor(std::log10(std::abs(value))));
    const int decimals = std::max(0, significant_digits - 1 - magnitude);

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(decimals) << value;
    std::string s = oss.str();

    if (s.find('.') != std::string::npos) {
        while (!s.empty() && s.back() == '0') s.pop_back();
        if (!s.empty() && s.back() == '.') s.pop_back();
    }
    return s;
}

} // namespace fogmap
