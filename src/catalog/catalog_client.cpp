/// @file catalog_client.cpp

#include "catalog/catalog_client.hpp"

namespace nearstars::catalog
{

std::string_view to_string(CatalogStatus status)
{
    switch (status)
    {
        case CatalogStatus::Ok:               return "ok";
        case CatalogStatus::Unavailable:      return "catalog unavailable";
        case CatalogStatus::QuerySyntaxError: return "query syntax error";
    }
    return "unknown";
}

} // namespace nearstars::catalog
