#pragma once

/// @file gaia_tap_client.hpp
/// @brief Gaia archive client using the TAP synchronous query endpoint (libcurl).

#include "catalog/catalog_client.hpp"

#include <curl/curl.h>

#include <memory>
#include <optional>
#include <string>

namespace nearstars::catalog
{
    /// @brief Connection settings for the TAP service.
    struct GaiaTapConfig
    {
        std::string url = "https://gea.esac.esa.int/tap-server/tap/sync";
        long timeout_sec = 120;     ///< Whole-transfer timeout, 0 = none
    };

    /// @brief Runs ADQL queries against the Gaia archive and decodes CSV replies.
    ///
    /// Request: POST REQUEST=doQuery&LANG=ADQL&FORMAT=csv&QUERY=<escaped adql>.
    ///
    /// Failure mapping:
    /// - curl transport error, HTTP 5xx, unreadable body, unencodable query -> Unavailable
    /// - HTTP 400 or a VOTable document with QUERY_STATUS=ERROR -> QuerySyntaxError
    ///
    /// Owns one CURL easy handle for its lifetime. Not thread-safe.
    class GaiaTapClient final : public CatalogClient
    {
    public:
        explicit GaiaTapClient(GaiaTapConfig config = {});
        ~GaiaTapClient() override;

        [[nodiscard]] CatalogResult execute(const QueryDescriptor& query) override;
        [[nodiscard]] std::string_view name() const override;

        /// @brief Pull the error text out of a TAP VOTable error document.
        /// @return The QUERY_STATUS message, or an empty string if none is present.
        [[nodiscard]] static std::string extract_votable_error(const std::string& body);

        /// @brief URL-encode the POST body for @p adql.
        /// @return The form body, or std::nullopt if the query is empty or cannot be escaped.
        [[nodiscard]] std::optional<std::string> build_post_fields(const std::string& adql) const;

    private:
        /// @brief libcurl write callback appending into a std::string.
        static size_t write_callback(char* data, size_t size, size_t nmemb, void* user);

        GaiaTapConfig m_config;
        std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> m_curl{nullptr, &curl_easy_cleanup};
    };

} // namespace nearstars::catalog
