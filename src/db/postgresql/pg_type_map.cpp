#include "db/postgresql/pg_type_map.hpp"
#include "core/error.hpp"
#include <format>
#include <unordered_map>

namespace tempo {

LogicalType PgTypeMap::oid_to_logical_type(uint32_t oid) {
    static const std::unordered_map<uint32_t, LogicalType> OID_TO_LOGICAL = {
        {21, LogicalType::SMALLINT},
        {23, LogicalType::INTEGER},
        {20, LogicalType::BIGINT},
        {700, LogicalType::REAL},
        {701, LogicalType::FLOAT},
        {1700, LogicalType::DECIMAL},
        {25, LogicalType::TEXT},
        {1043, LogicalType::STRING},
        {1042, LogicalType::CHAR},
        {16, LogicalType::BOOLEAN},
        {1082, LogicalType::DATE},
        {1114, LogicalType::TIMESTAMP_NAIVE},
        {1184, LogicalType::TIMESTAMP},
        {17, LogicalType::BYTES},
        {114, LogicalType::JSON},
        {3802, LogicalType::JSON},
        {2950, LogicalType::UUID},
        {1009, LogicalType::STRING_ARRAY},   // text[]
        {1015, LogicalType::STRING_ARRAY},   // varchar[]
    };

    auto it = OID_TO_LOGICAL.find(oid);
    return it != OID_TO_LOGICAL.end() ? it->second : LogicalType::UNKNOWN;
}

std::string PgTypeMap::canonical_type_name(const std::string& type_name) {
    static const std::unordered_map<std::string, std::string> ALIASES = {
        {"int", "integer"},         {"int4", "integer"},       {"integer", "integer"},
        {"serial", "integer"},      {"serial4", "integer"},
        {"int8", "bigint"},         {"bigint", "bigint"},
        {"bigserial", "bigint"},    {"serial8", "bigint"},
        {"int2", "smallint"},       {"smallint", "smallint"},
        {"float8", "double precision"}, {"double", "double precision"},
        {"double precision", "double precision"}, {"float", "double precision"},
        {"float4", "real"},         {"real", "real"},
        {"decimal", "numeric"},     {"numeric", "numeric"},
        {"bool", "boolean"},        {"boolean", "boolean"},
        {"varchar", "varchar"},     {"character varying", "varchar"},
        {"char", "char"},           {"character", "char"},     {"bpchar", "char"},
        {"text", "text"},
        {"timestamptz", "timestamptz"},
        {"timestamp with time zone", "timestamptz"},
        {"timestamp", "timestamp"},
        {"timestamp without time zone", "timestamp"},
        {"date", "date"},
        {"uuid", "uuid"},
        {"json", "json"},           {"jsonb", "jsonb"},
        {"bytea", "bytea"},
        {"_text", "text[]"},        {"text[]", "text[]"},
        {"_varchar", "varchar[]"},  {"varchar[]", "varchar[]"},
        {"character varying[]", "varchar[]"},
    };

    auto it = ALIASES.find(type_name);
    return it != ALIASES.end() ? it->second : type_name;
}

LogicalType PgTypeMap::canonical_to_logical(const std::string& canonical) {
    static const std::unordered_map<std::string, LogicalType> LOGICAL = {
        {"smallint", LogicalType::SMALLINT},
        {"integer", LogicalType::INTEGER},
        {"bigint", LogicalType::BIGINT},
        {"double precision", LogicalType::FLOAT},
        {"real", LogicalType::REAL},
        {"numeric", LogicalType::DECIMAL},
        {"varchar", LogicalType::STRING},
        {"char", LogicalType::CHAR},
        {"text", LogicalType::TEXT},
        {"boolean", LogicalType::BOOLEAN},
        {"timestamptz", LogicalType::TIMESTAMP},
        {"timestamp", LogicalType::TIMESTAMP_NAIVE},
        {"date", LogicalType::DATE},
        {"uuid", LogicalType::UUID},
        {"json", LogicalType::JSON},
        {"jsonb", LogicalType::JSON},
        {"bytea", LogicalType::BYTES},
        {"text[]", LogicalType::STRING_ARRAY},
        {"varchar[]", LogicalType::STRING_ARRAY},
    };

    auto it = LOGICAL.find(canonical);
    return it != LOGICAL.end() ? it->second : LogicalType::UNKNOWN;
}

std::string PgTypeMap::native_type_for(const ColumnDefinition& column) {
    switch (column.logical_type) {
        case LogicalType::SMALLINT:        return "SMALLINT";
        case LogicalType::INTEGER:         return "INTEGER";
        case LogicalType::BIGINT:          return "BIGINT";
        case LogicalType::FLOAT:           return "DOUBLE PRECISION";
        case LogicalType::REAL:            return "REAL";
        case LogicalType::DECIMAL:
            return std::format("NUMERIC({},{})", column.precision.value_or(15),
                               column.scale.value_or(2));
        case LogicalType::STRING:
            return std::format("VARCHAR({})", column.max_length.value_or(255));
        case LogicalType::TEXT:            return "TEXT";
        case LogicalType::CHAR:
            return std::format("CHAR({})", column.max_length.value_or(1));
        case LogicalType::BOOLEAN:         return "BOOLEAN";
        case LogicalType::DATE:            return "DATE";
        case LogicalType::TIMESTAMP:       return "TIMESTAMP WITH TIME ZONE";
        case LogicalType::TIMESTAMP_NAIVE: return "TIMESTAMP";
        case LogicalType::UUID:            return "UUID";
        case LogicalType::JSON:            return "JSONB";
        case LogicalType::BYTES:           return "BYTEA";
        case LogicalType::STRING_ARRAY:    return "TEXT[]";
        default:
            throw EngineError(ErrorCategory::UNSUPPORTED_TYPE,
                std::format("column '{}' has no PostgreSQL type mapping", column.name),
                {"", column.name, "declare"});
    }
}

} // namespace tempo
