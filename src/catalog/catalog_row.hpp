#pragma once

/// @file catalog_row.hpp
/// @brief Raw astrometric row as returned by a catalog query.

#include "core/types.hpp"

#include <optional>
#include <vector>

namespace nearstars::catalog
{
    /// @brief One row of a catalog result table.
    ///
    /// Values are kept in the catalog's own units: degrees for position and
    /// milliarcseconds for parallax. Parallax is absent when the catalog has
    /// no astrometric solution for the source; it may also be zero or negative
    /// (measurement noise).
    struct CatalogRow
    {
        u64 source_id;                      ///< Catalog source identifier
        f64 ra;                             ///< Right ascension (degrees, 0..360)
        f64 dec;                            ///< Declination (degrees, -90..+90)
        std::optional<f64> parallax_mas;    ///< Parallax (milliarcseconds), may be absent
    };

    /// @brief Ordered result of one catalog query. May be empty.
    using ResultSet = std::vector<CatalogRow>;

} // namespace nearstars::catalog
