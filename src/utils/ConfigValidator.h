#ifndef CONFIG_VALIDATOR_H
#define CONFIG_VALIDATOR_H

#include <json/json.h>
#include <string>
#include <vector>

/**
 * @brief 启动时的配置检查
 *
 * errors 表示服务无法按配置运行，warnings 仅记录日志。
 */
class ConfigValidator {
public:
    struct ValidationResult {
        bool valid = true;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
    };

    static ValidationResult validate(const Json::Value& config);
};

#endif
