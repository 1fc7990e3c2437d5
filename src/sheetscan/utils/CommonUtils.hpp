#pragma once

#include <string>
#include <vector>
#include <functional>
#include <chrono>
#include <optional>
#include <utility>

namespace sheetscan {
namespace utils {

/**
 * @brief 通用工具类 - 坐标换算与字符串辅助函数
 *
 * 所有行列坐标均为 1 开始。
 */
class CommonUtils {
public:
    // ========== 坐标工具 ==========

    /**
     * @brief 列号转换为字母表示（1 -> A, 26 -> Z, 27 -> AA）
     * @param col 列号（1开始）
     */
    static std::string columnToLetter(int col);

    /**
     * @brief 字母列名转换为列号（A -> 1），非法输入返回 0
     */
    static int letterToColumn(const std::string& letters);

    /**
     * @brief 生成单元格引用（如A1, B2等）
     */
    static std::string cellReference(int row, int col) {
        return columnToLetter(col) + std::to_string(row);
    }

    /**
     * @brief 生成范围引用（如A1:B2）
     */
    static std::string rangeReference(int first_row, int first_col, int last_row, int last_col) {
        return cellReference(first_row, first_col) + ":" + cellReference(last_row, last_col);
    }

    /**
     * @brief 解析单元格引用（如B3 -> (3, 2)），允许 $ 绝对引用标记
     * @return std::pair<int, int> 行列坐标（1开始）
     * @throws core::GridException 引用格式不正确
     */
    static std::pair<int, int> parseReference(const std::string& reference);

    /**
     * @brief 验证范围是否有效
     */
    static bool isValidRange(int first_row, int first_col, int last_row, int last_col) {
        return first_row >= 1 && first_col >= 1 &&
               first_row <= last_row && first_col <= last_col;
    }

    // ========== 字符串工具 ==========

    static std::string trim(const std::string& s);
    static std::string toLower(const std::string& s);

    /**
     * @brief 不区分大小写的子串查找
     */
    static bool containsIgnoreCase(const std::string& haystack, const std::string& needle);

    /**
     * @brief 按非字母数字字符切分为词元
     */
    static std::vector<std::string> tokenize(const std::string& s);

    /**
     * @brief 是否包含至少一个字母
     */
    static bool hasLetter(const std::string& s);

    /**
     * @brief 是否只由数字、标点和空白组成
     */
    static bool isDigitsOrPunctuation(const std::string& s);

    /**
     * @brief 整个字符串解析为 double（允许首尾空白），失败返回空
     */
    static std::optional<double> parseDouble(const std::string& s);

    /**
     * @brief 整个字符串解析为 long long（允许首尾空白、正负号），失败返回空
     */
    static std::optional<long long> parseInteger(const std::string& s);

    /**
     * @brief 数值渲染：整数值不带小数部分，其他使用最短表示
     */
    static std::string formatNumber(double value);

    /**
     * @brief RAII计时器
     */
    class ScopedTimer {
    private:
        std::chrono::steady_clock::time_point start_;
        std::function<void(double)> callback_;

    public:
        explicit ScopedTimer(std::function<void(double)> callback)
            : start_(std::chrono::steady_clock::now()), callback_(std::move(callback)) {}

        ~ScopedTimer() {
            auto end = std::chrono::steady_clock::now();
            auto duration = std::chrono::duration<double, std::milli>(end - start_);
            if (callback_) {
                callback_(duration.count());
            }
        }

        ScopedTimer(const ScopedTimer&) = delete;
        ScopedTimer& operator=(const ScopedTimer&) = delete;
    };
};

}} // namespace sheetscan::utils
