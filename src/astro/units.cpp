/// @file units.cpp
/// @brief Length unit lookup and parsec conversion.

#include "astro/units.hpp"

#include "core/logger.hpp"
#include "core/parse.hpp"

#include <array>
#include <cmath>
#include <string>
#include <utility>

namespace nearstars::astro
{

namespace
{

using astro_constants::kMetresPerAu;
using astro_constants::kMetresPerLightYear;
using astro_constants::kMetresPerParsec;

// Lower-case aliases accepted by parse_unit()
constexpr std::array<std::pair<std::string_view, LengthUnit>, 25> kUnitAliases{{
    {"m",             LengthUnit::Metre},
    {"metre",         LengthUnit::Metre},
    {"metres",        LengthUnit::Metre},
    {"meter",         LengthUnit::Metre},
    {"meters",        LengthUnit::Metre},
    {"km",            LengthUnit::Kilometre},
    {"kilometre",     LengthUnit::Kilometre},
    {"kilometres",    LengthUnit::Kilometre},
    {"kilometer",     LengthUnit::Kilometre},
    {"kilometers",    LengthUnit::Kilometre},
    {"au",            LengthUnit::AstronomicalUnit},
    {"ly",            LengthUnit::LightYear},
    {"lyr",           LengthUnit::LightYear},
    {"lightyear",     LengthUnit::LightYear},
    {"lightyears",    LengthUnit::LightYear},
    {"light-year",    LengthUnit::LightYear},
    {"light-years",   LengthUnit::LightYear},
    {"pc",            LengthUnit::Parsec},
    {"parsec",        LengthUnit::Parsec},
    {"parsecs",       LengthUnit::Parsec},
    {"kpc",           LengthUnit::Kiloparsec},
    {"kiloparsec",    LengthUnit::Kiloparsec},
    {"kiloparsecs",   LengthUnit::Kiloparsec},
    {"mpc",           LengthUnit::Megaparsec},
    {"megaparsec",    LengthUnit::Megaparsec},
}};

} // anonymous namespace

std::optional<LengthUnit> Units::parse_unit(std::string_view name)
{
    const std::string key = core::to_lower(core::trim(name));

    for (const auto& [alias, unit] : kUnitAliases)
    {
        if (key == alias)
        {
            return unit;
        }
    }

    NST_CORE_ERROR("Units: unrecognized length unit '{}'", name);
    return std::nullopt;
}

std::string_view Units::symbol(LengthUnit unit)
{
    switch (unit)
    {
        case LengthUnit::Metre:            return "m";
        case LengthUnit::Kilometre:        return "km";
        case LengthUnit::AstronomicalUnit: return "AU";
        case LengthUnit::LightYear:        return "lyr";
        case LengthUnit::Parsec:           return "pc";
        case LengthUnit::Kiloparsec:       return "kpc";
        case LengthUnit::Megaparsec:       return "Mpc";
    }
    return "?";
}

f64 Units::metres_per(LengthUnit unit)
{
    switch (unit)
    {
        case LengthUnit::Metre:            return 1.0;
        case LengthUnit::Kilometre:        return 1.0e3;
        case LengthUnit::AstronomicalUnit: return kMetresPerAu;
        case LengthUnit::LightYear:        return kMetresPerLightYear;
        case LengthUnit::Parsec:           return kMetresPerParsec;
        case LengthUnit::Kiloparsec:       return kMetresPerParsec * 1.0e3;
        case LengthUnit::Megaparsec:       return kMetresPerParsec * 1.0e6;
    }
    return 0.0;
}

std::optional<f64> Units::to_parsecs(f64 value, LengthUnit unit)
{
    if (!std::isfinite(value) || value <= 0.0)
    {
        NST_CORE_ERROR("Units: distance must be a positive number, got {}", value);
        return std::nullopt;
    }

    // Parsec-family units convert without a round trip through metres
    f64 parsecs = 0.0;
    switch (unit)
    {
        case LengthUnit::Parsec:     parsecs = value;          break;
        case LengthUnit::Kiloparsec: parsecs = value * 1.0e3;  break;
        case LengthUnit::Megaparsec: parsecs = value * 1.0e6;  break;
        default:
            parsecs = value * metres_per(unit) / kMetresPerParsec;
            break;
    }

    // Overflow to inf, or underflow to zero / a denormal, has no usable reciprocal
    if (!std::isfinite(parsecs) || !std::isnormal(parsecs))
    {
        NST_CORE_ERROR("Units: {} {} is outside the representable distance range",
                       value, symbol(unit));
        return std::nullopt;
    }
    return parsecs;
}

std::optional<f64> Units::to_parsecs(f64 value, std::string_view unit_name)
{
    const auto unit = parse_unit(unit_name);
    if (!unit)
    {
        return std::nullopt;
    }
    return to_parsecs(value, *unit);
}

std::optional<DistanceInput> Units::parse_distance(std::string_view text, LengthUnit unit)
{
    std::string_view number = core::trim(text);

    // from_chars rejects an explicit sign; accept a single leading '+'
    if (!number.empty() && number.front() == '+')
    {
        number.remove_prefix(1);
    }

    const auto value = core::parse_f64(number);
    if (!value)
    {
        NST_CORE_ERROR("Units: '{}' is not a number", text);
        return std::nullopt;
    }

    if (!std::isfinite(*value) || *value <= 0.0)
    {
        NST_CORE_ERROR("Units: distance must be a positive number, got '{}'", text);
        return std::nullopt;
    }

    return DistanceInput{
        .value = *value,
        .unit  = unit,
    };
}

} // namespace nearstars::astro
