#pragma once

/// @file units.hpp
/// @brief Length units and conversion of user-supplied distances to parsecs.

#include "core/types.hpp"

#include <optional>
#include <string_view>

namespace nearstars::astro
{
    /// @brief Length units accepted for the maximum distance.
    enum class LengthUnit : u8
    {
        Metre,
        Kilometre,
        AstronomicalUnit,
        LightYear,
        Parsec,
        Kiloparsec,
        Megaparsec,
    };

    /// @brief A distance exactly as the user entered it (value + unit).
    ///
    /// Kept alongside the parsec value so the plot title can echo the
    /// original input.
    struct DistanceInput
    {
        f64 value;          ///< Positive, finite
        LengthUnit unit;
    };

    /// @brief Static utility class for length-unit handling.
    ///
    /// Every failure is an invalid distance: the functions log the reason and
    /// return std::nullopt. No state, no side effects beyond logging.
    class Units
    {
    public:
        Units() = delete;

        /// @brief Look up a unit by name or symbol, case-insensitive.
        /// Accepts e.g. "pc", "parsecs", "ly", "lyr", "light-years", "au", "km", "kpc", "Mpc".
        [[nodiscard]] static std::optional<LengthUnit> parse_unit(std::string_view name);

        /// @brief Short symbol used in titles and logs ("ly", "pc", ...).
        [[nodiscard]] static std::string_view symbol(LengthUnit unit);

        /// @brief Number of metres in one @p unit.
        [[nodiscard]] static f64 metres_per(LengthUnit unit);

        /// @brief Convert a length to parsecs.
        /// @return Parsecs, or std::nullopt if @p value is not a positive finite number
        ///         or the result overflows or underflows to a non-normal double.
        [[nodiscard]] static std::optional<f64> to_parsecs(f64 value, LengthUnit unit);

        /// @brief Convert a length with a textual unit to parsecs.
        /// @return Parsecs, or std::nullopt if the value is invalid or the unit unknown.
        [[nodiscard]] static std::optional<f64> to_parsecs(f64 value, std::string_view unit_name);

        /// @brief Validate raw user text ("12.5", " 4e2 ") as a positive distance.
        /// One leading '+' is accepted.
        /// @return The distance, or std::nullopt for non-numeric, non-finite or non-positive text.
        [[nodiscard]] static std::optional<DistanceInput> parse_distance(std::string_view text,
                                                                         LengthUnit unit);
    };

} // namespace nearstars::astro
