/// @file gaia_tap_client.cpp
/// @brief TAP sync client implementation.

#include "catalog/gaia_tap_client.hpp"

#include "catalog/catalog_loader.hpp"
#include "core/logger.hpp"

#include <climits>
#include <utility>

namespace nearstars::catalog
{

GaiaTapClient::GaiaTapClient(GaiaTapConfig config)
    : m_config{std::move(config)}
{
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
    {
        NST_CORE_CRITICAL("GaiaTapClient: curl_global_init failed");
        return;
    }

    m_curl.reset(curl_easy_init());
    if (!m_curl)
    {
        NST_CORE_CRITICAL("GaiaTapClient: curl_easy_init failed");
        return;
    }

    NST_CORE_INFO("GaiaTapClient: endpoint {} (timeout {} s)", m_config.url, m_config.timeout_sec);
}

GaiaTapClient::~GaiaTapClient()
{
    m_curl.reset();
    curl_global_cleanup();
}

std::string_view GaiaTapClient::name() const
{
    return "Gaia TAP";
}

// -----------------------------------------------------------------
// Execute: POST the query, classify the reply, parse CSV
// -----------------------------------------------------------------

CatalogResult GaiaTapClient::execute(const QueryDescriptor& query)
{
    if (!m_curl)
    {
        return CatalogResult{
            .status  = CatalogStatus::Unavailable,
            .rows    = {},
            .message = "HTTP client failed to initialize",
        };
    }

    const auto post_fields = build_post_fields(query.adql);
    if (!post_fields)
    {
        return CatalogResult{
            .status  = CatalogStatus::Unavailable,
            .rows    = {},
            .message = "query could not be encoded for the TAP request",
        };
    }

    CURL* curl = m_curl.get();
    curl_easy_reset(curl);

    std::string body;
    char error_buffer[CURL_ERROR_SIZE] = {};

    curl_easy_setopt(curl, CURLOPT_URL, m_config.url.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, post_fields->c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &GaiaTapClient::write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, m_config.timeout_sec);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "nearstars/1.0");

    NST_CORE_INFO("GaiaTapClient: submitting query");
    NST_CORE_DEBUG("GaiaTapClient: {}", query.adql);

    const CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK)
    {
        const std::string reason = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(res);
        NST_CORE_ERROR("GaiaTapClient: request failed: {}", reason);
        return CatalogResult{
            .status  = CatalogStatus::Unavailable,
            .rows    = {},
            .message = reason,
        };
    }

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    std::string votable_error = extract_votable_error(body);

    if (http_code == 400 || !votable_error.empty())
    {
        if (votable_error.empty())
        {
            votable_error = "HTTP 400 from TAP service";
        }
        NST_CORE_ERROR("GaiaTapClient: query rejected: {}", votable_error);
        return CatalogResult{
            .status  = CatalogStatus::QuerySyntaxError,
            .rows    = {},
            .message = std::move(votable_error),
        };
    }

    if (http_code < 200 || http_code >= 300)
    {
        NST_CORE_ERROR("GaiaTapClient: HTTP {} from {}", http_code, m_config.url);
        return CatalogResult{
            .status  = CatalogStatus::Unavailable,
            .rows    = {},
            .message = "HTTP " + std::to_string(http_code) + " from TAP service",
        };
    }

    auto rows = CatalogLoader::parse_csv(body);
    if (!rows)
    {
        return CatalogResult{
            .status  = CatalogStatus::Unavailable,
            .rows    = {},
            .message = "unreadable reply from TAP service",
        };
    }

    NST_CORE_INFO("GaiaTapClient: received {} rows ({} bytes)", rows->size(), body.size());

    return CatalogResult{
        .status  = CatalogStatus::Ok,
        .rows    = std::move(*rows),
        .message = {},
    };
}

// -----------------------------------------------------------------
// TAP error document:
//   <INFO name="QUERY_STATUS" value="ERROR">message</INFO>
// -----------------------------------------------------------------

std::string GaiaTapClient::extract_votable_error(const std::string& body)
{
    const std::size_t info = body.find("name=\"QUERY_STATUS\"");
    if (info == std::string::npos)
    {
        return {};
    }

    const std::size_t tag_end = body.find('>', info);
    if (tag_end == std::string::npos)
    {
        return {};
    }

    const std::string_view tag(body.data() + info, tag_end - info);
    if (tag.find("value=\"ERROR\"") == std::string_view::npos)
    {
        return {};
    }

    // Self-closing tag carries no text
    if (body[tag_end - 1] == '/')
    {
        return "query failed";
    }

    const std::size_t close = body.find("</INFO>", tag_end);
    std::string message = body.substr(tag_end + 1,
                                      close == std::string::npos ? std::string::npos
                                                                 : close - tag_end - 1);

    const std::size_t first = message.find_first_not_of(" \t\r\n");
    const std::size_t last = message.find_last_not_of(" \t\r\n");
    if (first == std::string::npos)
    {
        return "query failed";
    }
    return message.substr(first, last - first + 1);
}

size_t GaiaTapClient::write_callback(char* data, size_t size, size_t nmemb, void* user)
{
    auto* body = static_cast<std::string*>(user);
    body->append(data, size * nmemb);
    return size * nmemb;
}

std::optional<std::string> GaiaTapClient::build_post_fields(const std::string& adql) const
{
    // curl_easy_escape takes an int length; 0 would mean strlen()
    if (adql.empty() || adql.size() > static_cast<std::size_t>(INT_MAX))
    {
        NST_CORE_ERROR("GaiaTapClient: cannot encode a query of {} bytes", adql.size());
        return std::nullopt;
    }

    char* escaped = curl_easy_escape(m_curl.get(), adql.c_str(), static_cast<int>(adql.size()));
    if (escaped == nullptr)
    {
        NST_CORE_ERROR("GaiaTapClient: failed to URL-encode query");
        return std::nullopt;
    }

    std::string fields = "REQUEST=doQuery&LANG=ADQL&FORMAT=csv&QUERY=";
    fields += escaped;
    curl_free(escaped);
    return fields;
}

} // namespace nearstars::catalog
