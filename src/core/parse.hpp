#pragma once

/// @file parse.hpp
/// @brief Small text helpers shared by the CSV loader, unit parser and command line.

#include "core/types.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <string>
#include <string_view>

namespace nearstars::core
{
    /// @brief Trim leading and trailing whitespace (space, tab, CR, LF).
    [[nodiscard]] inline std::string_view trim(std::string_view sv)
    {
        while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t' ||
                               sv.front() == '\r' || sv.front() == '\n'))
        {
            sv.remove_prefix(1);
        }
        while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' ||
                               sv.back() == '\r' || sv.back() == '\n'))
        {
            sv.remove_suffix(1);
        }
        return sv;
    }

    /// @brief Parse a whole string_view as f64.
    /// @return The parsed value, or std::nullopt on empty input or trailing characters.
    [[nodiscard]] inline std::optional<f64> parse_f64(std::string_view sv)
    {
        if (sv.empty())
        {
            return std::nullopt;
        }

        f64 value = 0.0;
        const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);

        if (ec != std::errc{} || ptr != sv.data() + sv.size())
        {
            return std::nullopt;
        }

        return value;
    }

    /// @brief Parse a whole string_view as u64.
    [[nodiscard]] inline std::optional<u64> parse_u64(std::string_view sv)
    {
        if (sv.empty())
        {
            return std::nullopt;
        }

        u64 value = 0;
        const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);

        if (ec != std::errc{} || ptr != sv.data() + sv.size())
        {
            return std::nullopt;
        }

        return value;
    }

    /// @brief ASCII lower-case copy.
    [[nodiscard]] inline std::string to_lower(std::string_view sv)
    {
        std::string out(sv);
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

} // namespace nearstars::core
