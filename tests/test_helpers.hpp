#pragma once

/// @file test_helpers.hpp
/// @brief Fixtures shared by several suites.

#include "catalog/catalog_client.hpp"
#include "catalog/catalog_row.hpp"
#include "rendering/renderer.hpp"

#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace test
{

// =================================================================
// Temporary files removed on scope exit
// =================================================================

/// Path in the temp directory; whatever is written there is removed with it.
class TempPath
{
public:
    explicit TempPath(const std::string& filename)
        : m_path(std::filesystem::temp_directory_path() / filename)
    {
        std::error_code ec;
        std::filesystem::remove(m_path, ec);
    }

    ~TempPath()
    {
        std::error_code ec;
        std::filesystem::remove(m_path, ec);
    }

    [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

    TempPath(const TempPath&) = delete;
    TempPath& operator=(const TempPath&) = delete;

private:
    std::filesystem::path m_path;
};

class TempCsvFile
{
public:
    explicit TempCsvFile(const std::string& filename, const std::string& content)
        : m_file(filename)
    {
        std::ofstream file(m_file.path());
        file << content;
    }

    [[nodiscard]] const std::filesystem::path& path() const { return m_file.path(); }

private:
    TempPath m_file;
};

// =================================================================
// Catalog stand-in returning a canned result and recording queries
// =================================================================

class FakeCatalogClient final : public nearstars::catalog::CatalogClient
{
public:
    explicit FakeCatalogClient(nearstars::catalog::CatalogResult result)
        : m_result(std::move(result))
    {
    }

    [[nodiscard]] nearstars::catalog::CatalogResult execute(
        const nearstars::catalog::QueryDescriptor& query) override
    {
        queries.push_back(query);
        return m_result;
    }

    [[nodiscard]] std::string_view name() const override { return "fake"; }

    std::vector<nearstars::catalog::QueryDescriptor> queries;

private:
    nearstars::catalog::CatalogResult m_result;
};

// =================================================================
// Renderer stand-in keeping the scenes it was given
// =================================================================

class RecordingRenderer final : public nearstars::rendering::Renderer
{
public:
    explicit RecordingRenderer(bool succeed = true) : m_succeed(succeed) {}

    [[nodiscard]] bool render(const nearstars::rendering::Scene& scene) override
    {
        scenes.push_back(scene);
        return m_succeed;
    }

    std::vector<nearstars::rendering::Scene> scenes;

private:
    bool m_succeed;
};

inline nearstars::catalog::CatalogRow make_row(nearstars::u64 id, nearstars::f64 ra, nearstars::f64 dec,
                                               std::optional<nearstars::f64> parallax_mas)
{
    return nearstars::catalog::CatalogRow{
        .source_id    = id,
        .ra           = ra,
        .dec          = dec,
        .parallax_mas = parallax_mas,
    };
}

} // namespace test
