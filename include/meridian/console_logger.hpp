#pragma once

#include <meridian/logger.hpp>

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

namespace meridian {

// Thread-safe console logger. Lines are prefixed with a wall-clock timestamp
// and the component name; error and critical go to stderr.
class console_logger {
public:
    explicit console_logger(std::string component = "meridian", log_level min_level = log_level::info)
        : _component(std::move(component))
        , _min_level(min_level) {}

    console_logger(console_logger&& other) noexcept
        : _component(std::move(other._component))
        , _min_level(other._min_level.load()) {}

    console_logger& operator=(console_logger&& other) noexcept {
        if (this != &other) {
            _component = std::move(other._component);
            _min_level = other._min_level.load();
        }
        return *this;
    }

    console_logger(const console_logger&) = delete;
    console_logger& operator=(const console_logger&) = delete;

    auto log(log_level level, std::string_view message) -> void {
        if (level < _min_level.load()) {
            return;
        }

        std::lock_guard<std::mutex> lock(_mutex);
        auto& stream = get_stream(level);
        stream << format_timestamp() << " "
               << to_string(level) << " [" << _component << "] "
               << message << "\n";
        stream.flush();
    }

    auto log(log_level level, std::string_view message, const log_fields& key_value_pairs) -> void {
        if (level < _min_level.load()) {
            return;
        }

        std::lock_guard<std::mutex> lock(_mutex);
        auto& stream = get_stream(level);
        stream << format_timestamp() << " "
               << to_string(level) << " [" << _component << "] "
               << message;

        for (const auto& [key, value] : key_value_pairs) {
            stream << " [" << key << "=" << value << "]";
        }

        stream << "\n";
        stream.flush();
    }

    auto trace(std::string_view message) -> void { log(log_level::trace, message); }
    auto trace(std::string_view message, const log_fields& fields) -> void { log(log_level::trace, message, fields); }

    auto debug(std::string_view message) -> void { log(log_level::debug, message); }
    auto debug(std::string_view message, const log_fields& fields) -> void { log(log_level::debug, message, fields); }

    auto info(std::string_view message) -> void { log(log_level::info, message); }
    auto info(std::string_view message, const log_fields& fields) -> void { log(log_level::info, message, fields); }

    auto warning(std::string_view message) -> void { log(log_level::warning, message); }
    auto warning(std::string_view message, const log_fields& fields) -> void { log(log_level::warning, message, fields); }

    auto error(std::string_view message) -> void { log(log_level::error, message); }
    auto error(std::string_view message, const log_fields& fields) -> void { log(log_level::error, message, fields); }

    auto critical(std::string_view message) -> void { log(log_level::critical, message); }
    auto critical(std::string_view message, const log_fields& fields) -> void { log(log_level::critical, message, fields); }

    auto set_min_level(log_level level) -> void {
        _min_level.store(level);
    }

    [[nodiscard]] auto get_min_level() const -> log_level {
        return _min_level.load();
    }

    [[nodiscard]] auto component() const -> const std::string& {
        return _component;
    }

private:
    std::string _component;
    std::atomic<log_level> _min_level;
    mutable std::mutex _mutex;

    [[nodiscard]] static auto get_stream(log_level level) -> std::ostream& {
        if (level >= log_level::error) {
            return std::cerr;
        }
        return std::cout;
    }

    [[nodiscard]] static auto format_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()
        ) % 1000;

        std::tm local_tm{};
        localtime_r(&time_t_now, &local_tm);

        std::ostringstream oss;
        oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }
};

static_assert(diagnostic_logger<console_logger>,
    "console_logger must satisfy diagnostic_logger concept");

} // namespace meridian
