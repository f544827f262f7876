#include "TimeUtils.hpp"
#include <cmath>
#include <fmt/format.h>

namespace gridbind {
namespace utils {

namespace {

constexpr long long kSecondsPerDay = 86400;

// 1899-12-31 与 1904-01-01 相对 1970-01-01 的天数
constexpr long long kEpoch1900 = -25568;
constexpr long long kEpoch1904 = -24107;

} // namespace

void TimeUtils::civilFromDays(long long days, int& year, int& month, int& day) {
    days += 719468;
    const long long era = (days >= 0 ? days : days - 146096) / 146097;
    const long long doe = days - era * 146097;
    const long long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const long long mp = (5 * doy + 2) / 153;
    const long long d = doy - (153 * mp + 2) / 5 + 1;
    const long long m = mp < 10 ? mp + 3 : mp - 9;
    year = static_cast<int>(yoe + era * 400 + (m <= 2 ? 1 : 0));
    month = static_cast<int>(m);
    day = static_cast<int>(d);
}

std::optional<ExcelDateTime> TimeUtils::fromExcelSerial(double serial, bool date1904) {
    if (!std::isfinite(serial) || serial < 0.0 || serial > 2958465.0) {
        return std::nullopt;
    }

    const long long total_seconds = std::llround(serial * static_cast<double>(kSecondsPerDay));
    long long whole_days = total_seconds / kSecondsPerDay;
    const long long seconds = total_seconds % kSecondsPerDay;

    ExcelDateTime dt;
    dt.hour = static_cast<int>(seconds / 3600);
    dt.minute = static_cast<int>((seconds % 3600) / 60);
    dt.second = static_cast<int>(seconds % 60);

    if (date1904) {
        civilFromDays(kEpoch1904 + whole_days, dt.year, dt.month, dt.day);
        return dt;
    }

    if (whole_days == 0) {
        // 纯时间值：Excel 显示为 1900-01-00，这里取 1899-12-31
        dt.year = 1899;
        dt.month = 12;
        dt.day = 31;
        return dt;
    }

    if (whole_days == 60) {
        dt.year = 1900;
        dt.month = 2;
        dt.day = 29;
        return dt;
    }

    // 1900-03-01 之后的序列号多算了一个不存在的 2 月 29 日
    if (whole_days > 60) {
        --whole_days;
    }
    civilFromDays(kEpoch1900 + whole_days, dt.year, dt.month, dt.day);
    return dt;
}

std::string TimeUtils::formatDate(const ExcelDateTime& dt) {
    return fmt::format("{:04d}-{:02d}-{:02d}", dt.year, dt.month, dt.day);
}

std::string TimeUtils::formatTime(const ExcelDateTime& dt) {
    return fmt::format("{:02d}:{:02d}:{:02d}", dt.hour, dt.minute, dt.second);
}

std::string TimeUtils::formatDateTime(const ExcelDateTime& dt) {
    return formatDate(dt) + " " + formatTime(dt);
}

}} // namespace gridbind::utils
