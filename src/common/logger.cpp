/**
 * @file logger.cpp
 * @brief Logger implementation
 */

#include "common/logger.hpp"

namespace pagewise {

std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;
std::mutex Logger::mutex_;

void Logger::init(const std::string& name, spdlog::level::level_enum level) {
    std::lock_guard<std::mutex> lock(mutex_);
    init_locked(name, level);
}

void Logger::init_locked(const std::string& name,
                         spdlog::level::level_enum level) {
    if (logger_ == nullptr) {
        // Reuse a logger already registered under this name
        logger_ = spdlog::get(name);
        if (logger_ == nullptr) {
            logger_ = spdlog::stdout_color_mt(name);
        }
        logger_->set_level(level);
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v");
    }
}

std::shared_ptr<spdlog::logger>& Logger::get() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logger_ == nullptr) {
        init_locked("pagewise", spdlog::level::info);
    }
    return logger_;
}

void Logger::set_level(spdlog::level::level_enum level) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logger_ != nullptr) {
        logger_->set_level(level);
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logger_ != nullptr) {
        spdlog::drop(logger_->name());
        logger_.reset();
    }
}

}  // namespace pagewise
