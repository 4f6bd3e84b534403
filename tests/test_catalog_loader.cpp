/// @file test_catalog_loader.cpp
/// @brief Unit tests for CSV table parsing and the file-backed catalog.
///
/// Verifies:
/// - Header-driven column mapping (order free, extra columns ignored)
/// - Absent parallax markers
/// - Malformed-line skipping
/// - FileCatalogClient applying the query's parallax cut and row limit
/// - TAP error document extraction

#include <doctest/doctest.h>

#include "catalog/catalog_loader.hpp"
#include "catalog/file_catalog_client.hpp"
#include "catalog/gaia_tap_client.hpp"
#include "catalog/query_builder.hpp"
#include "test_helpers.hpp"

using namespace nearstars;
using namespace nearstars::catalog;

// =================================================================
// parse_csv
// =================================================================

TEST_CASE("TAP csv output parses")
{
    const auto rows = CatalogLoader::parse_csv(
        "source_id,ra,dec,parallax\n"
        "5853498713190525696,217.39232147200883,-62.67607511676666,768.0665391873573\n"
        "4472832130942575872,269.44850252543836,4.739420051112412,546.975939730948\n");

    REQUIRE(rows.has_value());
    REQUIRE(rows->size() == 2);

    CHECK((*rows)[0].source_id == 5853498713190525696ULL);
    CHECK((*rows)[0].ra == doctest::Approx(217.39232147200883));
    CHECK((*rows)[0].dec == doctest::Approx(-62.67607511676666));
    REQUIRE((*rows)[0].parallax_mas.has_value());
    CHECK(*(*rows)[0].parallax_mas == doctest::Approx(768.0665391873573));
}

TEST_CASE("Column order follows the header, extra columns ignored")
{
    const auto rows = CatalogLoader::parse_csv(
        "\"parallax\",\"phot_g_mean_mag\",\"dec\",\"ra\",\"source_id\"\r\n"
        "\"100.5\",\"11.2\",\"-3.25\",\"45.5\",\"42\"\r\n");

    REQUIRE(rows.has_value());
    REQUIRE(rows->size() == 1);
    CHECK((*rows)[0].source_id == 42);
    CHECK((*rows)[0].ra == doctest::Approx(45.5));
    CHECK((*rows)[0].dec == doctest::Approx(-3.25));
    CHECK(*(*rows)[0].parallax_mas == doctest::Approx(100.5));
}

TEST_CASE("Missing parallax markers read as absent")
{
    const auto rows = CatalogLoader::parse_csv(
        "source_id,ra,dec,parallax\n"
        "1,10.0,20.0,\n"
        "2,10.0,20.0,null\n"
        "3,10.0,20.0,NaN\n"
        "4,10.0,20.0,--\n"
        "5,10.0,20.0,-1.5\n");

    REQUIRE(rows.has_value());
    REQUIRE(rows->size() == 5);
    for (std::size_t i = 0; i < 4; ++i)
    {
        CHECK_FALSE((*rows)[i].parallax_mas.has_value());
    }
    // Negative parallax is a measurement, kept for the projection step to drop
    REQUIRE((*rows)[4].parallax_mas.has_value());
    CHECK(*(*rows)[4].parallax_mas == doctest::Approx(-1.5));
}

TEST_CASE("Malformed lines are skipped")
{
    const auto rows = CatalogLoader::parse_csv(
        "source_id,ra,dec,parallax\n"
        "1,10.0,20.0,5.0\n"
        "not_a_number,10.0,20.0,5.0\n"
        "3,10.0\n"
        "\n"
        "4,11.0,21.0,6.0\n");

    REQUIRE(rows.has_value());
    REQUIRE(rows->size() == 2);
    CHECK((*rows)[0].source_id == 1);
    CHECK((*rows)[1].source_id == 4);
}

TEST_CASE("Header-only table is an empty result")
{
    const auto rows = CatalogLoader::parse_csv("source_id,ra,dec,parallax\n");
    REQUIRE(rows.has_value());
    CHECK(rows->empty());
}

TEST_CASE("Missing header or column is an error")
{
    CHECK_FALSE(CatalogLoader::parse_csv("").has_value());
    CHECK_FALSE(CatalogLoader::parse_csv("source_id,ra,dec\n1,2,3\n").has_value());
    CHECK_FALSE(CatalogLoader::parse_csv("<html>Service unavailable</html>").has_value());
}

TEST_CASE("load_csv reads from disk and reports missing files")
{
    test::TempCsvFile file("nearstars_test_load.csv",
                           "source_id,ra,dec,parallax\n"
                           "1,0.0,0.0,100.0\n");

    const auto rows = CatalogLoader::load_csv(file.path());
    REQUIRE(rows.has_value());
    CHECK(rows->size() == 1);

    CHECK_FALSE(CatalogLoader::load_csv("/nonexistent/nearstars.csv").has_value());
}

// =================================================================
// FileCatalogClient
// =================================================================

TEST_CASE("File catalog applies the parallax cut")
{
    test::TempCsvFile file("nearstars_test_client.csv",
                           "source_id,ra,dec,parallax\n"
                           "1,0.0,0.0,768.07\n"      // 1.3 pc
                           "2,0.0,0.0,100.0\n"       // 10 pc
                           "3,0.0,0.0,99.0\n"        // beyond 10 pc
                           "4,0.0,0.0,\n"
                           "5,0.0,0.0,-20.0\n");

    FileCatalogClient client(file.path());
    const auto query = QueryBuilder::build_query(10.0);
    REQUIRE(query.has_value());

    const CatalogResult result = client.execute(*query);
    REQUIRE(result.status == CatalogStatus::Ok);
    REQUIRE(result.rows.size() == 2);
    CHECK(result.rows[0].source_id == 1);
    CHECK(result.rows[1].source_id == 2);
}

TEST_CASE("File catalog honours the row limit")
{
    test::TempCsvFile file("nearstars_test_limit.csv",
                           "source_id,ra,dec,parallax\n"
                           "1,0.0,0.0,500.0\n"
                           "2,0.0,0.0,500.0\n"
                           "3,0.0,0.0,500.0\n");

    FileCatalogClient client(file.path());
    const auto query = QueryBuilder::build_query(10.0, QueryOptions{.table = "gaiadr2.gaia_source", .row_limit = 2});
    REQUIRE(query.has_value());

    const CatalogResult result = client.execute(*query);
    REQUIRE(result.status == CatalogStatus::Ok);
    CHECK(result.rows.size() == 2);
}

TEST_CASE("Unreadable file is reported as unavailable")
{
    FileCatalogClient client("/nonexistent/nearstars.csv");
    const auto query = QueryBuilder::build_query(10.0);
    REQUIRE(query.has_value());

    const CatalogResult result = client.execute(*query);
    CHECK(result.status == CatalogStatus::Unavailable);
    CHECK_FALSE(result.message.empty());
}

// =================================================================
// TAP error documents
// =================================================================

TEST_CASE("VOTable QUERY_STATUS ERROR message is extracted")
{
    const std::string body =
        "<?xml version=\"1.0\"?>\n"
        "<VOTABLE version=\"1.3\"><RESOURCE type=\"results\">\n"
        "<INFO name=\"QUERY_STATUS\" value=\"ERROR\">\n"
        "  Cannot parse query: unexpected token \"FORM\"\n"
        "</INFO>\n"
        "</RESOURCE></VOTABLE>\n";

    CHECK(GaiaTapClient::extract_votable_error(body) ==
          "Cannot parse query: unexpected token \"FORM\"");
}

TEST_CASE("Non-error documents yield no message")
{
    CHECK(GaiaTapClient::extract_votable_error("source_id,ra,dec,parallax\n1,2,3,4\n").empty());
    CHECK(GaiaTapClient::extract_votable_error(
              "<INFO name=\"QUERY_STATUS\" value=\"OK\"/>").empty());
    CHECK(GaiaTapClient::extract_votable_error(
              "<INFO name=\"QUERY_STATUS\" value=\"ERROR\"/>") == "query failed");
}

// =================================================================
// TAP request encoding (no network: execute() fails before any transfer)
// =================================================================

TEST_CASE("TAP POST body carries the escaped query")
{
    GaiaTapClient client;
    const auto fields = client.build_post_fields("SELECT a FROM t WHERE p >= 1");
    REQUIRE(fields.has_value());
    CHECK(fields->rfind("REQUEST=doQuery&LANG=ADQL&FORMAT=csv&QUERY=", 0) == 0);
    CHECK(fields->find("SELECT%20a%20FROM%20t%20WHERE%20p%20%3E%3D%201") != std::string::npos);

    CHECK_FALSE(client.build_post_fields("").has_value());
}

TEST_CASE("Unencodable query is reported as unavailable before any request")
{
    GaiaTapClient client(GaiaTapConfig{.url = "http://127.0.0.1:9/tap/sync", .timeout_sec = 1});
    auto query = QueryBuilder::build_query(10.0);
    REQUIRE(query.has_value());
    query->adql.clear();

    const CatalogResult result = client.execute(*query);
    CHECK(result.status == CatalogStatus::Unavailable);
    CHECK(result.message == "query could not be encoded for the TAP request");
}

TEST_CASE("Status names")
{
    CHECK(to_string(CatalogStatus::Ok) == "ok");
    CHECK(to_string(CatalogStatus::QuerySyntaxError) != to_string(CatalogStatus::Unavailable));
}
