#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include <cstdint>

namespace nearstars
{
    // Precision aliases
    using f32 = float;
    using f64 = double;
    using u8  = uint8_t;
    using u16 = uint16_t;
    using u32 = uint32_t;
    using u64 = uint64_t;
    using i32 = int32_t;
    using i64 = int64_t;

    // Vector types (double precision for astronomy)
    using Vec2d = glm::dvec2;
    using Vec3d = glm::dvec3;

    // Vector types (float for rendering)
    using Vec2f = glm::vec2;
    using Vec3f = glm::vec3;
    using Vec4f = glm::vec4;

    // Astronomical constants
    namespace astro_constants
    {
        constexpr f64 kPi          = glm::pi<f64>();
        constexpr f64 kDegToRad    = kPi / 180.0;
        constexpr f64 kRadToDeg    = 180.0 / kPi;
        constexpr f64 kMasPerArcsec = 1000.0;                 // Gaia publishes parallax in mas

        // IAU 2012 Resolution B2 / IAU 2015 Resolution B2
        constexpr f64 kMetresPerAu    = 149'597'870'700.0;
        constexpr f64 kMetresPerParsec = kMetresPerAu * 648'000.0 / kPi;
        constexpr f64 kMetresPerLightYear = 9'460'730'472'580'800.0;
    }
}
