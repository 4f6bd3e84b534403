/// @file file_catalog_client.cpp
/// @brief Local CSV catalog source.

#include "catalog/file_catalog_client.hpp"

#include "catalog/catalog_loader.hpp"
#include "core/logger.hpp"

#include <utility>

namespace nearstars::catalog
{

FileCatalogClient::FileCatalogClient(std::filesystem::path path)
    : m_path{std::move(path)}
{
}

CatalogResult FileCatalogClient::execute(const QueryDescriptor& query)
{
    auto table = CatalogLoader::load_csv(m_path);
    if (!table)
    {
        return CatalogResult{
            .status  = CatalogStatus::Unavailable,
            .rows    = {},
            .message = "cannot read catalog file " + m_path.string(),
        };
    }

    // Same predicate as the ADQL WHERE clause
    ResultSet selected;
    for (const auto& row : *table)
    {
        if (!row.parallax_mas || *row.parallax_mas <= 0.0 ||
            *row.parallax_mas < query.min_parallax_mas)
        {
            continue;
        }

        selected.push_back(row);
        if (query.row_limit > 0 && selected.size() >= query.row_limit)
        {
            break;
        }
    }

    NST_CORE_INFO("FileCatalogClient: {} of {} rows match parallax >= {:.6g} mas",
                  selected.size(), table->size(), query.min_parallax_mas);

    return CatalogResult{
        .status  = CatalogStatus::Ok,
        .rows    = std::move(selected),
        .message = {},
    };
}

std::string_view FileCatalogClient::name() const
{
    return "CSV file";
}

} // namespace nearstars::catalog
