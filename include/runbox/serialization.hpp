#pragma once

#include <nlohmann/json.hpp>
#include "runbox/configuration.hpp"
#include "runbox/result.hpp"
#include "runbox/syscall_filter.hpp"

namespace runbox {

void to_json(nlohmann::json &j, const mount_rule &value);
void from_json(const nlohmann::json &j, mount_rule &value);

void to_json(nlohmann::json &j, const stream_target &value);
void from_json(const nlohmann::json &j, stream_target &value);

void to_json(nlohmann::json &j, const resource_limits &value);
void from_json(const nlohmann::json &j, resource_limits &value);

void to_json(nlohmann::json &j, const syscall_action &value);
void from_json(const nlohmann::json &j, syscall_action &value);

void to_json(nlohmann::json &j, const syscall_filter &value);
void from_json(const nlohmann::json &j, syscall_filter &value);

/**
 * @brief 沙箱配置的 JSON 表示
 * 除了 executable 以外的字段都可以省略，省略时保持原值，
 * 因此可以先读入配置文件，再用命令行参数覆盖。
 */
void to_json(nlohmann::json &j, const sandbox_configuration &value);
void from_json(const nlohmann::json &j, sandbox_configuration &value);

void to_json(nlohmann::json &j, const resource_usage &value);
void from_json(const nlohmann::json &j, resource_usage &value);

void to_json(nlohmann::json &j, const sandbox_status &value);
void from_json(const nlohmann::json &j, sandbox_status &value);

void to_json(nlohmann::json &j, const sandbox_result &value);

}  // namespace runbox

namespace nlohmann {

/**
 * @brief sandbox_result 没有默认构造函数，只能通过 adl_serializer 反序列化
 */
template <>
struct adl_serializer<runbox::sandbox_result> {
    static runbox::sandbox_result from_json(const json &j);
    static void to_json(json &j, const runbox::sandbox_result &value);
};

}  // namespace nlohmann
