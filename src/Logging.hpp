#pragma once

#include <cstdio>
#include <string_view>

#include <fmt/core.h>

// Operator log channels. Info and Performance are always written, the others only when
// switched on by configuration.
enum class LogChannel { Info, Debug, Cancellations, TimerChanges, Performance };

class Logger {
public:
    explicit Logger(std::FILE *out = stderr);
    Logger(Logger &&) = delete;
    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger &operator=(Logger &&) = delete;

    void enable(const LogChannel channel, const bool enabled = true);
    [[nodiscard]] bool is_enabled(const LogChannel channel) const noexcept;

    void bug(std::string_view message) const;
    template <typename... Args>
    void bug(fmt::string_view format, Args &&...args) const {
        bug(fmt::format(fmt::runtime(format), args...));
    }
    void log_new(std::string_view str, const LogChannel channel) const;
    // Formats only when the channel is enabled; hot paths log through this.
    template <typename... Args>
    void log_new(const LogChannel channel, fmt::string_view format, Args &&...args) const {
        if (is_enabled(channel))
            log_new(fmt::format(fmt::runtime(format), args...), channel);
    }
    void log_string(std::string_view str) const { log_new(str, LogChannel::Info); }
    template <typename... Args>
    void log_string(fmt::string_view str, Args &&...args) const {
        log_new(fmt::format(fmt::runtime(str), args...), LogChannel::Info);
    }

private:
    std::FILE *out_;
    unsigned int enabled_;
};
