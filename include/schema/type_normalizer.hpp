#pragma once

#include "core/types.hpp"
#include <optional>
#include <string>

namespace tempo {

/**
 * @brief Canonicalizes dialect spellings so that a declared schema and the
 * schema read back from the catalog compare equal when they mean the same
 *
 * Pure functions, no I/O. Every normalize_* function is idempotent.
 */
class TypeNormalizer {
public:
    /**
     * @brief One canonical spelling per type, case-insensitive input
     *
     * "float8", "double", "DOUBLE PRECISION" -> "double precision";
     * "int4", "INTEGER" -> "integer"; "character varying(255)" ->
     * "varchar(255)"; "_text" -> "text[]".
     */
    [[nodiscard]] static std::string normalize_native_type(const std::string& raw);

    /**
     * @brief Logical type implied by a native spelling (UNKNOWN if unmapped)
     */
    [[nodiscard]] static LogicalType logical_type_of(const std::string& raw);

    /**
     * @brief Canonical default expression; absent stays absent
     *
     * Strips casts ('x'::character varying -> 'x'), folds now() and
     * CURRENT_TIMESTAMP, unquotes numeric literals, and maps boolean
     * literals (f/0/false/t/1/true, any case) to "false"/"true" for boolean
     * (or unknown) columns. A NULL default is no default.
     */
    [[nodiscard]] static std::optional<std::string> normalize_default(
        const std::optional<std::string>& raw,
        LogicalType type = LogicalType::UNKNOWN);

    /**
     * @brief Canonical partial-index predicate; absent/blank -> absent
     *
     * Trims, strips balanced outer parentheses (repeatedly, only when the
     * first '(' closes at the last character) and collapses whitespace.
     * Inner parenthesized sub-expressions are left as they are.
     */
    [[nodiscard]] static std::optional<std::string> normalize_predicate(
        const std::optional<std::string>& raw);

    /**
     * @brief Column with native type, default and logical type canonicalized
     */
    [[nodiscard]] static ColumnDefinition normalize_column(const ColumnDefinition& column);

    /**
     * @brief Index with predicate, method and column names canonicalized
     */
    [[nodiscard]] static IndexDefinition normalize_index(const IndexDefinition& index);

    /**
     * @brief Name, normalized native type, normalized default and nullability
     */
    [[nodiscard]] static bool columns_equal(const ColumnDefinition& a, const ColumnDefinition& b);

    /**
     * @brief Column list, uniqueness, method and normalized predicate
     */
    [[nodiscard]] static bool indexes_equal(const IndexDefinition& a, const IndexDefinition& b);

    /**
     * @brief True if the whole text is wrapped by one balanced pair
     */
    [[nodiscard]] static bool is_wrapped_in_parens(const std::string& text);
};

} // namespace tempo
