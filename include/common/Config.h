#pragma once

#include <string>
#include <mutex>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"

namespace liqhunter {
namespace common {

// 설정 로드/검증 단계에서만 던짐 (요청 처리 중에는 발생하지 않음)
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace common

class Config {
public:
    static Config& getInstance();

    // Missing file => defaults. Invalid values => common::ConfigError.
    void load(const std::string& config_path);
    void loadFromJson(const nlohmann::json& j);

    engine::EngineConfig getEngineConfig() const;
    void setSymbols(const std::vector<std::string>& symbols);

    std::string getLogLevel() const;
    std::string getLogDir() const;

    // Throws common::ConfigError on the first invalid field.
    static void validate(const engine::EngineConfig& config);

private:
    Config() = default;

    mutable std::mutex mutex_;
    engine::EngineConfig engine_config_;
    std::string log_level_ = "info";
    std::string log_dir_ = "logs";
};

} // namespace liqhunter
