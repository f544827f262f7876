#pragma once

#include <optional>
#include <string>

namespace gridbind {
namespace utils {

/**
 * @brief 日期时间分量（由 Excel 序列号换算而来）
 */
struct ExcelDateTime {
    int year = 1900;
    int month = 1;
    int day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;
};

/**
 * @brief 时间工具类 - Excel 序列号与显示文本
 */
class TimeUtils {
public:
    /**
     * @brief 将Excel序列号转换为日期时间
     *
     * 1900 日期系统沿用 Excel 的闰年错误：序列号 60 对应 1900-02-29。
     * 时间部分四舍五入到秒。
     *
     * @param serial Excel序列号
     * @param date1904 工作簿是否使用 1904 日期系统
     * @return 日期时间，负数或非有限值返回空
     */
    static std::optional<ExcelDateTime> fromExcelSerial(double serial, bool date1904 = false);

    /// "YYYY-MM-DD"
    static std::string formatDate(const ExcelDateTime& dt);

    /// "HH:MM:SS"
    static std::string formatTime(const ExcelDateTime& dt);

    /// "YYYY-MM-DD HH:MM:SS"
    static std::string formatDateTime(const ExcelDateTime& dt);

private:
    // 自 1970-01-01 起的天数 -> 公历日期
    static void civilFromDays(long long days, int& year, int& month, int& day);
};

}} // namespace gridbind::utils
