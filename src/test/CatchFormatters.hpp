#pragma once

#include <catch2/catch.hpp>
#include <fmt/format.h>
#include <magic_enum.hpp>

#include <string>
#include <type_traits>

template <typename T>
requires fmt::has_formatter<T, fmt::format_context>::value struct Catch::StringMaker<T> {
    static std::string convert(const T &value) { return fmt::to_string(value); }
};

// Failures show CastStatus::Delaying as "Delaying" rather than a number.
template <typename T>
requires(std::is_enum_v<T> && !fmt::has_formatter<T, fmt::format_context>::value) struct Catch::StringMaker<T> {
    static std::string convert(const T value) { return std::string(magic_enum::enum_name(value)); }
};
