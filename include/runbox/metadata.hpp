#pragma once

#include <filesystem>
#include <map>
#include <string>
#include "runbox/result.hpp"

namespace runbox {

/**
 * @brief 将运行结果格式化为 meta 文件的内容，每行一个 "key: value"
 *
 * 字段：status、exitcode（正常退出时）、signal（被信号杀死时）、limit（超限时）、
 * wall-time、user-time、sys-time、cpu-time（单位为秒，保留三位小数）、memory-bytes、
 * internal-error（内部错误时）、strategy、reduced-guarantees、cancelled。
 */
std::string format_metadata(const sandbox_result &result);

/**
 * @brief 将运行结果写入 meta 文件
 * @throw std::system_error 当文件无法写入时
 */
void write_metadata(const std::filesystem::path &metafile, const sandbox_result &result);

/**
 * @brief 读取 meta 文件中所有的键值对
 */
std::map<std::string, std::string> read_metadata(const std::filesystem::path &metafile);

/**
 * @brief 从 meta 文件中读回运行结果
 * 时间只保留了三位小数。
 * @throw std::invalid_argument 当 status 字段不存在或无法识别时
 */
sandbox_result read_result_metadata(const std::filesystem::path &metafile);

}  // namespace runbox
