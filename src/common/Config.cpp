#include "common/Config.h"
#include "common/Logger.h"
#include "common/PathUtils.h"
#include "liquidation/LeverageCalculator.h"
#include "liquidation/ClusterBuilder.h"
#include "strategy/SignalGenerator.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace liqhunter {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string toUpperCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return trimCopy(s);
}

std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
}

void readClusterSection(const nlohmann::json& c, liquidation::ClusterBuilderConfig& out) {
    out.bucket_width_pct = c.value("bucket_width_pct", out.bucket_width_pct);
    out.strength_k = c.value("strength_k", out.strength_k);
    out.min_members = c.value("min_members", out.min_members);
    out.min_weight_fraction = c.value("min_weight_fraction", out.min_weight_fraction);
}

void requireNonNegative(double value, const char* name) {
    if (!std::isfinite(value) || value < 0.0) {
        throw common::ConfigError(std::string(name) + " must be a finite value >= 0");
    }
}

void requirePositive(double value, const char* name) {
    if (!std::isfinite(value) || value <= 0.0) {
        throw common::ConfigError(std::string(name) + " must be > 0");
    }
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::load(const std::string& path) {
    std::filesystem::path config_path;
    if (std::filesystem::path(path).is_absolute()) {
        config_path = path;
    } else {
        config_path = utils::PathUtils::resolveRelativePath(path);
        if (!std::filesystem::exists(config_path) && std::filesystem::exists(path)) {
            config_path = path;
        }
    }

    std::cout << "설정 파일 경로: " << config_path << std::endl;

    if (!std::filesystem::exists(config_path)) {
        std::cout << "경고: 설정 파일을 찾을 수 없습니다: " << config_path << std::endl;
        std::cout << "기본값을 사용합니다." << std::endl;
        loadFromJson(nlohmann::json::object());
        return;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw common::ConfigError("cannot open config file: " + config_path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw common::ConfigError("malformed config file " + config_path.string() + ": " + e.what());
    }

    loadFromJson(j);
}

void Config::loadFromJson(const nlohmann::json& j) {
    engine::EngineConfig cfg;
    std::string log_level = "info";
    std::string log_dir = "logs";

    try {
        if (j.contains("engine")) {
            const auto& e = j["engine"];

            const std::string mode_str = toUpperCopy(e.value("mode", std::string("PREDICTIVE")));
            if (mode_str == "PREDICTIVE") {
                cfg.mode = ClusterMode::PREDICTIVE;
            } else if (mode_str == "REACTIVE") {
                cfg.mode = ClusterMode::REACTIVE;
            } else {
                throw common::ConfigError("unknown engine mode: " + mode_str);
            }

            if (e.contains("symbols")) {
                cfg.symbols.clear();
                for (const auto& s : e["symbols"]) {
                    cfg.symbols.push_back(toUpperCopy(s.get<std::string>()));
                }
            }

            cfg.price_ttl_sec = e.value("price_ttl_sec", cfg.price_ttl_sec);
            cfg.open_interest_ttl_sec = e.value("open_interest_ttl_sec", cfg.open_interest_ttl_sec);
            cfg.cluster_ttl_sec = e.value("cluster_ttl_sec", cfg.cluster_ttl_sec);
            cfg.reactive_rebuild_sec = e.value("reactive_rebuild_sec", cfg.reactive_rebuild_sec);
            cfg.stale_ceiling_sec = e.value("stale_ceiling_sec", cfg.stale_ceiling_sec);
            cfg.jitter_fraction = e.value("jitter_fraction", cfg.jitter_fraction);
            cfg.jitter_seed = e.value("jitter_seed", cfg.jitter_seed);
            cfg.request_timeout_ms = e.value("request_timeout_ms", cfg.request_timeout_ms);
            cfg.rate_limit_per_sec = e.value("rate_limit_per_sec", cfg.rate_limit_per_sec);
            cfg.rate_limit_burst = e.value("rate_limit_burst", cfg.rate_limit_burst);
            cfg.max_retries = e.value("max_retries", cfg.max_retries);
        }

        if (j.contains("leverage")) {
            const auto& l = j["leverage"];
            if (l.contains("tiers")) {
                cfg.leverage.tiers = l["tiers"].get<std::vector<double>>();
            }
            cfg.leverage.distribution_exponent = l.value("distribution_exponent", cfg.leverage.distribution_exponent);
            cfg.leverage.min_level_oi_usd = l.value("min_level_oi_usd", cfg.leverage.min_level_oi_usd);
            cfg.leverage.min_level_oi_pct = l.value("min_level_oi_pct", cfg.leverage.min_level_oi_pct);
        }

        if (j.contains("cluster")) {
            const auto& c = j["cluster"];
            if (c.contains("predictive")) {
                readClusterSection(c["predictive"], cfg.predictive_cluster);
            }
            if (c.contains("reactive")) {
                readClusterSection(c["reactive"], cfg.reactive_cluster);
            }
        }

        if (j.contains("reactive")) {
            const auto& r = j["reactive"];
            cfg.reactive.buffer_capacity = r.value("buffer_capacity", cfg.reactive.buffer_capacity);
            cfg.reactive.decay_half_life_sec = r.value("decay_half_life_sec", cfg.reactive.decay_half_life_sec);
            cfg.reactive.lookback_sec = r.value("lookback_sec", cfg.reactive.lookback_sec);
        }

        if (j.contains("signal")) {
            const auto& s = j["signal"];
            cfg.signal.min_strength = s.value("min_strength", cfg.signal.min_strength);
            cfg.signal.max_distance_pct = s.value("max_distance_pct", cfg.signal.max_distance_pct);
            cfg.signal.min_take_profit_pct = s.value("min_take_profit_pct", cfg.signal.min_take_profit_pct);
            cfg.signal.stop_loss_pct = s.value("stop_loss_pct", cfg.signal.stop_loss_pct);
            cfg.signal.take_profit_buffer_pct = s.value("take_profit_buffer_pct", cfg.signal.take_profit_buffer_pct);
        }

        if (j.contains("levels")) {
            const auto& lv = j["levels"];
            cfg.levels.max_levels = lv.value("max_levels", cfg.levels.max_levels);
            cfg.levels.min_strength = lv.value("min_strength", cfg.levels.min_strength);
            cfg.levels.max_distance_pct = lv.value("max_distance_pct", cfg.levels.max_distance_pct);
        }

        if (j.contains("sentiment")) {
            const auto& st = j["sentiment"];
            cfg.sentiment.base_deviation = st.value("base_deviation", cfg.sentiment.base_deviation);
            cfg.sentiment.high_multiplier = st.value("high_multiplier", cfg.sentiment.high_multiplier);
        }

        if (j.contains("logging")) {
            log_level = j["logging"].value("level", log_level);
            log_dir = j["logging"].value("dir", log_dir);
        }
    } catch (const nlohmann::json::exception& e) {
        throw common::ConfigError(std::string("config type error: ") + e.what());
    }

    const std::string env_level = readEnvVar("LIQHUNTER_LOG_LEVEL");
    if (!env_level.empty()) {
        log_level = env_level;
    }

    try {
        validate(cfg);
    } catch (const common::ConfigError& e) {
        LOG_ERROR("설정 검증 실패: {}", e.what());
        throw;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    engine_config_ = cfg;
    log_level_ = log_level;
    log_dir_ = log_dir;
}

void Config::validate(const engine::EngineConfig& config) {
    if (config.symbols.empty()) {
        throw common::ConfigError("engine.symbols must not be empty");
    }

    requirePositive(config.price_ttl_sec, "engine.price_ttl_sec");
    requirePositive(config.open_interest_ttl_sec, "engine.open_interest_ttl_sec");
    requirePositive(config.cluster_ttl_sec, "engine.cluster_ttl_sec");
    requirePositive(config.reactive_rebuild_sec, "engine.reactive_rebuild_sec");
    requirePositive(config.stale_ceiling_sec, "engine.stale_ceiling_sec");
    if (!(config.jitter_fraction >= 0.0 && config.jitter_fraction < 1.0)) {
        throw common::ConfigError("engine.jitter_fraction must be in [0, 1)");
    }
    if (config.request_timeout_ms <= 0) {
        throw common::ConfigError("engine.request_timeout_ms must be > 0");
    }
    requirePositive(config.rate_limit_per_sec, "engine.rate_limit_per_sec");
    if (config.rate_limit_burst < 1) {
        throw common::ConfigError("engine.rate_limit_burst must be >= 1");
    }
    if (config.max_retries < 0 || config.max_retries > 1) {
        throw common::ConfigError("engine.max_retries must be 0 or 1");
    }

    liquidation::LeverageCalculator::validateTiers(config.leverage.tiers);
    requireNonNegative(config.leverage.distribution_exponent, "leverage.distribution_exponent");
    requireNonNegative(config.leverage.min_level_oi_usd, "leverage.min_level_oi_usd");
    requireNonNegative(config.leverage.min_level_oi_pct, "leverage.min_level_oi_pct");

    liquidation::ClusterBuilder::validate(config.predictive_cluster);
    liquidation::ClusterBuilder::validate(config.reactive_cluster);

    if (config.reactive.buffer_capacity <= 0) {
        throw common::ConfigError("reactive.buffer_capacity must be > 0");
    }
    requirePositive(config.reactive.decay_half_life_sec, "reactive.decay_half_life_sec");
    requirePositive(config.reactive.lookback_sec, "reactive.lookback_sec");

    strategy::SignalGenerator::validate(config.signal);

    if (config.levels.max_levels < 0) {
        throw common::ConfigError("levels.max_levels must be >= 0");
    }
    requireNonNegative(config.levels.min_strength, "levels.min_strength");
    requireNonNegative(config.levels.max_distance_pct, "levels.max_distance_pct");

    if (!(config.sentiment.base_deviation > 0.0 && config.sentiment.base_deviation < 1.0)) {
        throw common::ConfigError("sentiment.base_deviation must be in (0, 1)");
    }
    if (!(config.sentiment.high_multiplier >= 1.0) ||
        config.sentiment.base_deviation * config.sentiment.high_multiplier >= 1.0) {
        throw common::ConfigError("sentiment.high_multiplier must be >= 1 and keep the band below 1");
    }
}

engine::EngineConfig Config::getEngineConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return engine_config_;
}

void Config::setSymbols(const std::vector<std::string>& symbols) {
    if (symbols.empty()) {
        throw common::ConfigError("symbol list must not be empty");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    engine_config_.symbols.clear();
    for (const auto& s : symbols) {
        engine_config_.symbols.push_back(toUpperCopy(s));
    }
}

std::string Config::getLogLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_level_;
}

std::string Config::getLogDir() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_dir_;
}

} // namespace liqhunter
