#pragma once

#include "core/field_value.hpp"
#include "core/types.hpp"
#include "db/idb_connection.hpp"
#include <optional>
#include <string>

namespace tempo {

/**
 * @brief Conversion between field values, statement parameters and result text
 *
 * Every value bound by QueryBuilder goes through coerce() first, so a
 * decimal aimed at a floating-point column leaves as a native double and a
 * value that cannot fit its column never reaches the driver.
 */
class ValueCodec {
public:
    /**
     * @brief Convert a value to the representation its column expects
     * @throws EngineError VALIDATION_BYPASS if the value cannot be coerced
     */
    [[nodiscard]] static FieldValue coerce(const ColumnDefinition& column, const FieldValue& value,
                                           const std::string& table = "");

    /**
     * @brief Coerce, then render as a text-format parameter (nullopt = NULL)
     */
    [[nodiscard]] static DbParam encode(const ColumnDefinition& column, const FieldValue& value,
                                        const std::string& table = "");

    /**
     * @brief Decode one text-format result cell
     * @throws EngineError DATABASE_ERROR if the text does not parse as the type
     */
    [[nodiscard]] static FieldValue decode(LogicalType type, const std::optional<std::string>& text);

    /**
     * @brief Decode one result row; unknown result columns use the wire type
     */
    [[nodiscard]] static Record decode_row(const TableDefinition& table, const DbResultSet& rs,
                                           size_t row);

    /**
     * @brief Semantic equality: decimals numerically, JSON structurally
     */
    [[nodiscard]] static bool values_equal(LogicalType type, const FieldValue& a, const FieldValue& b);

    /**
     * @brief "0010.500" -> "10.5"; input unchanged if not a plain decimal
     */
    [[nodiscard]] static std::string canonical_decimal(const std::string& text);

    /**
     * @brief Compact JSON text with sorted keys; input unchanged if invalid
     */
    [[nodiscard]] static std::string canonical_json(const std::string& text);
};

} // namespace tempo
