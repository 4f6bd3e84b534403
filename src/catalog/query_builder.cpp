/// @file query_builder.cpp
/// @brief ADQL generation for the parallax cut.

#include "catalog/query_builder.hpp"

#include "core/logger.hpp"

#include <spdlog/fmt/fmt.h>

#include <cmath>
#include <utility>

namespace nearstars::catalog
{

f64 QueryBuilder::min_parallax_arcsec(f64 max_distance_pc)
{
    return 1.0 / max_distance_pc;
}

// -----------------------------------------------------------------
// SELECT [TOP n] source_id, ra, dec, parallax
// FROM <table>
// WHERE parallax >= <p_min> AND parallax > 0 AND parallax IS NOT NULL
//
// p_min is printed with %.17g so thresholds near zero survive the
// round trip through text.
// -----------------------------------------------------------------

std::optional<QueryDescriptor> QueryBuilder::build_query(f64 max_distance_pc,
                                                         const QueryOptions& options)
{
    if (std::isnan(max_distance_pc) || max_distance_pc <= 0.0)
    {
        NST_CORE_ERROR("QueryBuilder: max distance must be positive, got {}", max_distance_pc);
        return std::nullopt;
    }

    const f64 p_min_arcsec = min_parallax_arcsec(max_distance_pc);
    const f64 p_min_mas = p_min_arcsec * astro_constants::kMasPerArcsec;

    // Distances near the bottom of the double range have no finite threshold
    if (!std::isfinite(p_min_mas))
    {
        NST_CORE_ERROR("QueryBuilder: max distance {} pc is too small to query", max_distance_pc);
        return std::nullopt;
    }

    const std::string top = options.row_limit > 0
        ? fmt::format("TOP {} ", options.row_limit)
        : std::string{};

    std::string adql = fmt::format(
        "SELECT {}source_id, ra, dec, parallax "
        "FROM {} "
        "WHERE parallax >= {:.17g} AND parallax > 0 AND parallax IS NOT NULL",
        top, options.table, p_min_mas);

    NST_CORE_DEBUG("QueryBuilder: {:.4f} pc -> parallax >= {:.6g} mas", max_distance_pc, p_min_mas);

    return QueryDescriptor{
        .max_distance_pc     = max_distance_pc,
        .min_parallax_arcsec = p_min_arcsec,
        .min_parallax_mas    = p_min_mas,
        .table               = options.table,
        .row_limit           = options.row_limit,
        .adql                = std::move(adql),
    };
}

} // namespace nearstars::catalog
