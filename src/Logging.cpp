#include "Logging.hpp"

#include "common/Time.hpp"

#include <magic_enum.hpp>

namespace {

constexpr unsigned int channel_bit(const LogChannel channel) { return 1u << magic_enum::enum_integer(channel); }

constexpr unsigned int AlwaysOn = channel_bit(LogChannel::Info) | channel_bit(LogChannel::Performance);

}

Logger::Logger(std::FILE *out) : out_(out), enabled_(AlwaysOn) {}

void Logger::enable(const LogChannel channel, const bool enabled) {
    if (enabled)
        enabled_ |= channel_bit(channel);
    else
        enabled_ &= ~channel_bit(channel) | AlwaysOn;
}

bool Logger::is_enabled(const LogChannel channel) const noexcept { return enabled_ & channel_bit(channel); }

void Logger::bug(std::string_view message) const { log_string("[*****] BUG: {}", message); }

void Logger::log_new(std::string_view str, const LogChannel channel) const {
    if (!is_enabled(channel))
        return;
    if (channel == LogChannel::Info)
        fmt::print(out_, "{} :: {}\n", formatted_time(Clock::now()), str);
    else
        fmt::print(out_, "{} :: [{}] {}\n", formatted_time(Clock::now()), magic_enum::enum_name(channel), str);
    std::fflush(out_);
}
