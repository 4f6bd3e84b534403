#pragma once

/// @file query_builder.hpp
/// @brief Builds the ADQL query that selects stars closer than a distance limit.

#include "core/types.hpp"

#include <optional>
#include <string>

namespace nearstars::catalog
{
    /// @brief Tunables for the generated query.
    struct QueryOptions
    {
        std::string table = "gaiadr2.gaia_source";
        u32 row_limit = 0;      ///< 0 = no TOP clause
    };

    /// @brief A fully resolved catalog query.
    struct QueryDescriptor
    {
        f64 max_distance_pc;        ///< Distance limit the query was built for
        f64 min_parallax_arcsec;    ///< 1 / max_distance_pc
        f64 min_parallax_mas;       ///< Same threshold in the catalog's unit
        std::string table;
        u32 row_limit;
        std::string adql;           ///< Query text sent to the catalog
    };

    /// @brief Static utility class turning a distance limit into a parallax-cut query.
    ///
    /// The query is a coarse narrowing only: it also excludes null and
    /// non-positive parallaxes, but the projection step filters again.
    class QueryBuilder
    {
    public:
        QueryBuilder() = delete;

        /// @brief Build the descriptor for stars within @p max_distance_pc.
        ///
        /// +infinity is accepted and yields a zero threshold.
        ///
        /// @param max_distance_pc Distance limit in parsecs, must be > 0.
        /// @param options Table name and optional row limit.
        /// @return The descriptor, or std::nullopt if the distance is not positive
        ///         or so small that the parallax threshold overflows.
        [[nodiscard]] static std::optional<QueryDescriptor> build_query(
            f64 max_distance_pc,
            const QueryOptions& options = {});

        /// @brief Minimum parallax (arcseconds) of a star within @p max_distance_pc.
        [[nodiscard]] static f64 min_parallax_arcsec(f64 max_distance_pc);
    };

} // namespace nearstars::catalog
