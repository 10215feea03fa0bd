#pragma once

#include <fmt/core.h>
#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace fmt {
template <>
struct formatter<std::filesystem::path> {
    template <typename ParseContext>
    constexpr auto parse(ParseContext &ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(const std::filesystem::path &p, FormatContext &ctx) const {
        return format_to(ctx.out(), "{}", p.string());
    }
};
}  // namespace fmt

namespace runbox {

/**
 * @brief 抛出带 errno 的 std::system_error
 * @param err errno
 * @param format_str 错误信息的格式，参见 fmt::format
 */
template <typename... Args>
[[noreturn]] void system_failure(int err, const char *format_str, Args &&... args) {
    throw std::system_error(err, std::system_category(), fmt::format(format_str, std::forward<Args>(args)...));
}

/**
 * @brief 判断字符串是否全部由数字组成
 */
bool is_number(const std::string &s);

/**
 * @brief 读取整个文件
 * @throw std::system_error 当文件无法打开时
 */
std::string read_file(const std::filesystem::path &path);

/**
 * @brief 写入整个文件（不截断、不创建），用于写 /proc 下的文件
 * @throw std::system_error 当文件无法打开或者写入失败时
 */
void write_file(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 关闭除 keep 以外的所有文件描述符，只在子进程中使用
 * @return 成功时返回 0，否则返回 errno
 */
int close_descriptors_except(std::vector<int> keep) noexcept;

struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

    /**
     * @brief 经过的时间，单位为秒
     */
    double seconds() const;

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace runbox
