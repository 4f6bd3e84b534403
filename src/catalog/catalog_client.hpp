#pragma once

/// @file catalog_client.hpp
/// @brief Abstract catalog source: executes a query, returns rows or a failure kind.

#include "catalog/catalog_row.hpp"
#include "catalog/query_builder.hpp"

#include <string>
#include <string_view>

namespace nearstars::catalog
{
    /// @brief Outcome classification of a catalog request.
    enum class CatalogStatus : u8
    {
        Ok,
        Unavailable,        ///< Transport failure, server error, unreadable source
        QuerySyntaxError,   ///< Catalog rejected the query text
    };

    /// @brief Rows plus status. @c rows is meaningful only when status is Ok.
    struct CatalogResult
    {
        CatalogStatus status = CatalogStatus::Ok;
        ResultSet rows;
        std::string message;    ///< Human-readable failure reason
    };

    /// @brief Interface for anything that can answer a QueryDescriptor.
    ///
    /// Calls are synchronous. Failures are returned, never thrown.
    class CatalogClient
    {
    public:
        CatalogClient() = default;
        virtual ~CatalogClient() = default;

        CatalogClient(const CatalogClient&) = delete;
        CatalogClient& operator=(const CatalogClient&) = delete;
        CatalogClient(CatalogClient&&) = delete;
        CatalogClient& operator=(CatalogClient&&) = delete;

        /// @brief Run @p query to completion.
        [[nodiscard]] virtual CatalogResult execute(const QueryDescriptor& query) = 0;

        /// @brief Short name for logs ("Gaia TAP", "CSV file").
        [[nodiscard]] virtual std::string_view name() const = 0;
    };

    /// @brief Printable name of a status value.
    [[nodiscard]] std::string_view to_string(CatalogStatus status);

} // namespace nearstars::catalog
