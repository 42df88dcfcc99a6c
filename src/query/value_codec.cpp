#include "query/value_codec.hpp"
#include "core/error.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"
#include "db/postgresql/pg_array.hpp"

#include <charconv>
#include <cmath>
#include <format>
#include <type_traits>

namespace tempo {

namespace {

[[noreturn]] void reject(const ColumnDefinition& column, const std::string& table,
                         const FieldValue& value, const char* expected) {
    throw EngineError(ErrorCategory::VALIDATION_BYPASS,
        std::format("value '{}' is not a valid {} for column '{}'",
                    field_value_to_string(value), expected, column.name),
        {table, column.name, "coerce"});
}

std::optional<double> parse_wire_double(const std::string& text) {
    if (text == "NaN") return std::nan("");
    if (text == "Infinity") return HUGE_VAL;
    if (text == "-Infinity") return -HUGE_VAL;
    return utils::try_parse_double(text);
}

FieldValue coerce_floating(const ColumnDefinition& column, const std::string& table,
                           const FieldValue& value) {
    if (const auto* d = std::get_if<double>(&value)) return *d;
    if (const auto* i = std::get_if<int64_t>(&value)) return static_cast<double>(*i);
    if (const auto* dec = std::get_if<Decimal>(&value)) {
        if (auto parsed = utils::try_parse_double(utils::trim(dec->text))) return *parsed;
    }
    if (const auto* s = std::get_if<std::string>(&value)) {
        if (auto parsed = utils::try_parse_double(utils::trim(*s))) return *parsed;
    }
    reject(column, table, value, "floating-point number");
}

FieldValue coerce_integral(const ColumnDefinition& column, const std::string& table,
                           const FieldValue& value) {
    if (const auto* i = std::get_if<int64_t>(&value)) return *i;
    if (const auto* d = std::get_if<double>(&value)) {
        // [-2^63, 2^63) is exactly representable; anything outside cannot be cast
        if (std::isfinite(*d) && *d == std::trunc(*d)
            && *d >= -9223372036854775808.0 && *d < 9223372036854775808.0) {
            return static_cast<int64_t>(*d);
        }
    }
    if (const auto* dec = std::get_if<Decimal>(&value)) {
        const auto canonical = ValueCodec::canonical_decimal(dec->text);
        if (auto parsed = utils::try_parse_int<int64_t>(canonical)) return *parsed;
    }
    if (const auto* s = std::get_if<std::string>(&value)) {
        if (auto parsed = utils::try_parse_int<int64_t>(utils::trim(*s))) return *parsed;
    }
    reject(column, table, value, "integer");
}

FieldValue coerce_decimal(const ColumnDefinition& column, const std::string& table,
                          const FieldValue& value) {
    if (const auto* dec = std::get_if<Decimal>(&value)) {
        if (utils::try_parse_double(utils::trim(dec->text))) return Decimal{utils::trim(dec->text)};
    }
    if (const auto* i = std::get_if<int64_t>(&value)) return Decimal{std::to_string(*i)};
    if (const auto* d = std::get_if<double>(&value)) {
        if (std::isfinite(*d)) return Decimal{std::format("{}", *d)};
    }
    if (const auto* s = std::get_if<std::string>(&value)) {
        if (utils::try_parse_double(utils::trim(*s))) return Decimal{utils::trim(*s)};
    }
    reject(column, table, value, "decimal");
}

FieldValue coerce_json(const ColumnDefinition& column, const std::string& table,
                       const FieldValue& value) {
    if (const auto* j = std::get_if<Json>(&value)) {
        try {
            return Json{JsonValue::parse(j->text).dump()};
        } catch (const JsonValue::parse_error&) {
            reject(column, table, value, "JSON document");
        }
    }
    return Json{field_value_to_json(value)};
}

} // anonymous namespace

// ============================================================================
// Coercion / Encoding
// ============================================================================

FieldValue ValueCodec::coerce(const ColumnDefinition& column, const FieldValue& value,
                              const std::string& table) {
    if (is_null(value)) {
        if (!column.nullable) {
            throw EngineError(ErrorCategory::VALIDATION_BYPASS,
                std::format("column '{}' does not accept NULL", column.name),
                {table, column.name, "coerce"});
        }
        return value;
    }

    switch (column.logical_type) {
        case LogicalType::FLOAT:
        case LogicalType::REAL:
            return coerce_floating(column, table, value);

        case LogicalType::SMALLINT:
        case LogicalType::INTEGER:
        case LogicalType::BIGINT:
            return coerce_integral(column, table, value);

        case LogicalType::DECIMAL:
            return coerce_decimal(column, table, value);

        case LogicalType::BOOLEAN:
            if (std::holds_alternative<bool>(value)) return value;
            reject(column, table, value, "boolean");

        case LogicalType::JSON:
            return coerce_json(column, table, value);

        case LogicalType::STRING_ARRAY:
            if (std::holds_alternative<StringArray>(value)) return value;
            reject(column, table, value, "string array");

        case LogicalType::STRING:
        case LogicalType::CHAR:
            if (const auto* s = std::get_if<std::string>(&value)) {
                if (column.max_length
                    && utils::utf8_length(*s) > static_cast<size_t>(*column.max_length)) {
                    throw EngineError(ErrorCategory::VALIDATION_BYPASS,
                        std::format("value for column '{}' exceeds {} characters",
                                    column.name, *column.max_length),
                        {table, column.name, "coerce"});
                }
                return value;
            }
            reject(column, table, value, "string");

        default:
            if (std::holds_alternative<std::string>(value)) return value;
            reject(column, table, value, logical_type_to_string(column.logical_type));
    }
}

DbParam ValueCodec::encode(const ColumnDefinition& column, const FieldValue& value,
                           const std::string& table) {
    const auto coerced = coerce(column, value, table);

    return std::visit([](const auto& v) -> DbParam {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return std::nullopt;
        } else if constexpr (std::is_same_v<T, bool>) {
            return std::string(utils::booltostr(v));
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            return std::format("{}", v);
        } else if constexpr (std::is_same_v<T, Decimal> || std::is_same_v<T, Json>) {
            return v.text;
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            return pg::encode_text_array(v);
        }
    }, coerced);
}

// ============================================================================
// Decoding
// ============================================================================

FieldValue ValueCodec::decode(LogicalType type, const std::optional<std::string>& text) {
    if (!text) return std::monostate{};
    const auto& s = *text;

    switch (type) {
        case LogicalType::BOOLEAN:
            if (s == "t" || s == "true") return true;
            if (s == "f" || s == "false") return false;
            break;

        case LogicalType::SMALLINT:
        case LogicalType::INTEGER:
        case LogicalType::BIGINT:
            if (auto i = utils::try_parse_int<int64_t>(s)) return *i;
            break;

        case LogicalType::FLOAT:
        case LogicalType::REAL:
            if (auto d = parse_wire_double(s)) return *d;
            break;

        case LogicalType::DECIMAL:
            return Decimal{s};

        case LogicalType::JSON:
            return Json{s};

        case LogicalType::STRING_ARRAY:
            return pg::decode_text_array(s);

        default:
            return s;
    }

    throw EngineError(ErrorCategory::DATABASE_ERROR,
        std::format("cannot decode '{}' as {}", s, logical_type_to_string(type)),
        {"", "", "decode"});
}

Record ValueCodec::decode_row(const TableDefinition& table, const DbResultSet& rs, size_t row) {
    Record record;
    const auto& cells = rs.rows.at(row);
    for (size_t i = 0; i < rs.column_names.size() && i < cells.size(); ++i) {
        const auto& name = rs.column_names[i];
        LogicalType type = LogicalType::UNKNOWN;
        if (const auto* col = table.find_column(name)) {
            type = col->logical_type;
        } else if (i < rs.column_types.size()) {
            type = rs.column_types[i].logical_type;
        }
        record[name] = decode(type, cells[i]);
    }
    return record;
}

// ============================================================================
// Comparison
// ============================================================================

std::string ValueCodec::canonical_decimal(const std::string& text) {
    auto s = utils::trim(text);
    if (!utils::try_parse_double(s) || s.find_first_of("eE") != std::string::npos) {
        return s;
    }

    bool negative = false;
    if (!s.empty() && (s.front() == '-' || s.front() == '+')) {
        negative = s.front() == '-';
        s.erase(0, 1);
    }

    std::string int_part = s;
    std::string frac_part;
    if (const auto dot = s.find('.'); dot != std::string::npos) {
        int_part = s.substr(0, dot);
        frac_part = s.substr(dot + 1);
    }
    while (int_part.size() > 1 && int_part.front() == '0') int_part.erase(0, 1);
    if (int_part.empty()) int_part = "0";
    while (!frac_part.empty() && frac_part.back() == '0') frac_part.pop_back();

    auto out = frac_part.empty() ? int_part : int_part + "." + frac_part;
    if (negative && out != "0") out = "-" + out;
    return out;
}

std::string ValueCodec::canonical_json(const std::string& text) {
    try {
        return JsonValue::parse(text).dump();
    } catch (const JsonValue::parse_error&) {
        return text;
    }
}

bool ValueCodec::values_equal(LogicalType type, const FieldValue& a, const FieldValue& b) {
    if (is_null(a) || is_null(b)) return is_null(a) && is_null(b);

    if (type == LogicalType::DECIMAL) {
        auto text_of = [](const FieldValue& v) -> std::optional<std::string> {
            if (const auto* d = std::get_if<Decimal>(&v)) return d->text;
            if (const auto* s = std::get_if<std::string>(&v)) return *s;
            if (const auto* i = std::get_if<int64_t>(&v)) return std::to_string(*i);
            if (const auto* f = std::get_if<double>(&v)) return std::format("{}", *f);
            return std::nullopt;
        };
        const auto ta = text_of(a);
        const auto tb = text_of(b);
        if (ta && tb) return canonical_decimal(*ta) == canonical_decimal(*tb);
        return a == b;
    }

    if (type == LogicalType::JSON) {
        const auto* ja = std::get_if<Json>(&a);
        const auto* jb = std::get_if<Json>(&b);
        if (ja && jb) return canonical_json(ja->text) == canonical_json(jb->text);
        return a == b;
    }

    if (is_floating_point(type)) {
        const auto* da = std::get_if<double>(&a);
        const auto* db = std::get_if<double>(&b);
        if (da && db) return *da == *db;
        return a == b;
    }

    if (type == LogicalType::UUID) {
        const auto* sa = std::get_if<std::string>(&a);
        const auto* sb = std::get_if<std::string>(&b);
        if (sa && sb) return utils::to_lower(*sa) == utils::to_lower(*sb);
    }

    return a == b;
}

} // namespace tempo
