#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace liqhunter {

// initialize() 이전 호출은 무시됨 (테스트는 로그 디렉토리가 필요 없음)
class Logger {
public:
    static Logger& getInstance();
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");

    // "trace" | "debug" | "info" | "warn" | "error" | "off"
    void setLevel(const std::string& level);

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->error(fmt, std::forward<Args>(args)...);
        }
    }

    // signals.log CSV: symbol,direction,entry,stop,target,confidence,rr
    void logSignal(const std::string& symbol, const std::string& direction,
                   double entry, double stop_loss, double take_profit,
                   double confidence, double risk_reward);

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> signal_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) liqhunter::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) liqhunter::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) liqhunter::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) liqhunter::Logger::getInstance().error(__VA_ARGS__)

} // namespace liqhunter
