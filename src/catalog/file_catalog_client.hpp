#pragma once

/// @file file_catalog_client.hpp
/// @brief Offline catalog source backed by a local CSV table.

#include "catalog/catalog_client.hpp"

#include <filesystem>

namespace nearstars::catalog
{
    /// @brief Answers queries from a CSV file with the TAP column layout.
    ///
    /// The file is re-read on every execute() call so edits are picked up
    /// between requests. The parallax cut and row limit of the descriptor are
    /// applied locally, mirroring what the remote service does.
    class FileCatalogClient final : public CatalogClient
    {
    public:
        explicit FileCatalogClient(std::filesystem::path path);

        [[nodiscard]] CatalogResult execute(const QueryDescriptor& query) override;
        [[nodiscard]] std::string_view name() const override;

    private:
        std::filesystem::path m_path;
    };

} // namespace nearstars::catalog
