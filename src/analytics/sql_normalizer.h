#pragma once

/// @file sql_normalizer.h
/// @brief SQL statement classification and literal normalization

#include <string>
#include <string_view>

namespace pglogstats::analytics {

/// @brief Coarse statement class used for the query type distribution
enum class QueryType {
    kSelect,
    kInsert,
    kUpdate,
    kDelete,
    kDdl,     ///< CREATE, ALTER, DROP, TRUNCATE
    kOther
};

/// @brief Distribution key for a query type ("SELECT", "DDL", "OTHER", ...)
std::string_view QueryTypeToString(QueryType type);

/// @brief Classify a statement by its first keyword (case-insensitive)
QueryType ClassifyQuery(std::string_view sql);

/// @brief Reduce a statement to its aggregation key
///
/// - `$1`, `$2`, ... become `?`
/// - string literals (`'...'`, `E'...'`) become `S`
/// - numeric literals that are not part of an identifier become `N`
/// - whitespace runs collapse to one space, outer whitespace is trimmed
///
/// Double-quoted identifiers are copied verbatim. Applying the function to
/// its own output returns the same string.
std::string NormalizeQuery(std::string_view sql);

}  // namespace pglogstats::analytics
