#include <catch2/catch_test_macros.hpp>
#include "query/value_codec.hpp"
#include "core/error.hpp"

#include <cmath>
#include <limits>

using namespace tempo;

namespace {

ColumnDefinition col(const std::string& name, LogicalType type, bool nullable = true) {
    return ColumnDefinition(name, type, nullable);
}

} // anonymous namespace

// ============================================================================
// Coercion
// ============================================================================

TEST_CASE("ValueCodec: decimals bound to floating columns become doubles", "[codec]") {
    const auto score = col("score", LogicalType::FLOAT);

    const auto coerced = ValueCodec::coerce(score, Decimal{"19.99"});
    REQUIRE(std::holds_alternative<double>(coerced));
    REQUIRE(std::get<double>(coerced) == 19.99);

    REQUIRE(std::get<double>(ValueCodec::coerce(score, int64_t{3})) == 3.0);
    REQUIRE(std::get<double>(ValueCodec::coerce(score, std::string(" 2.5 "))) == 2.5);
}

TEST_CASE("ValueCodec: integral coercion", "[codec]") {
    const auto qty = col("qty", LogicalType::INTEGER);

    REQUIRE(std::get<int64_t>(ValueCodec::coerce(qty, Decimal{"42.000"})) == 42);
    REQUIRE(std::get<int64_t>(ValueCodec::coerce(qty, 7.0)) == 7);
    REQUIRE_THROWS_AS(ValueCodec::coerce(qty, Decimal{"42.5"}), EngineError);
    REQUIRE_THROWS_AS(ValueCodec::coerce(qty, 7.25), EngineError);
    REQUIRE_THROWS_AS(ValueCodec::coerce(qty, true), EngineError);
}

TEST_CASE("ValueCodec: doubles outside the int64 range are rejected", "[codec]") {
    const auto qty = col("qty", LogicalType::BIGINT);

    REQUIRE_THROWS_AS(ValueCodec::coerce(qty, 1e19), EngineError);
    REQUIRE_THROWS_AS(ValueCodec::coerce(qty, -1e19), EngineError);
    REQUIRE_THROWS_AS(ValueCodec::coerce(qty, 9223372036854775808.0), EngineError);
    REQUIRE(std::get<int64_t>(ValueCodec::coerce(qty, -9223372036854775808.0))
            == std::numeric_limits<int64_t>::min());
    REQUIRE(std::get<int64_t>(ValueCodec::coerce(qty, 4503599627370496.0)) == 4503599627370496);
}

TEST_CASE("ValueCodec: decimal coercion keeps the text", "[codec]") {
    const auto price = col("price", LogicalType::DECIMAL);

    REQUIRE(std::get<Decimal>(ValueCodec::coerce(price, Decimal{" 10.50 "})).text == "10.50");
    REQUIRE(std::get<Decimal>(ValueCodec::coerce(price, int64_t{12})).text == "12");
    REQUIRE_THROWS_AS(ValueCodec::coerce(price, std::string("cheap")), EngineError);
}

TEST_CASE("ValueCodec: rejection carries the column", "[codec]") {
    auto name = col("name", LogicalType::STRING);
    name.max_length = 3;

    try {
        (void)ValueCodec::coerce(name, std::string("abcd"), "products");
        FAIL("expected EngineError");
    } catch (const EngineError& e) {
        REQUIRE(e.category() == ErrorCategory::VALIDATION_BYPASS);
        REQUIRE(e.context().table == "products");
        REQUIRE(e.context().subject == "name");
    }
}

TEST_CASE("ValueCodec: length limits count characters, not bytes", "[codec]") {
    auto name = col("name", LogicalType::STRING);
    name.max_length = 50;

    std::string accented;
    for (int i = 0; i < 50; ++i) accented += "\xC3\xA9";   // U+00E9
    REQUIRE(accented.size() == 100);
    REQUIRE(std::get<std::string>(ValueCodec::coerce(name, accented)) == accented);

    REQUIRE_THROWS_AS(ValueCodec::coerce(name, accented + "x"), EngineError);

    auto code = col("code", LogicalType::CHAR);
    code.max_length = 2;
    REQUIRE_NOTHROW((void)ValueCodec::coerce(code, std::string("\xE2\x82\xAC\xE2\x82\xAC")));   // two euro signs
    REQUIRE_THROWS_AS(ValueCodec::coerce(code, std::string("abc")), EngineError);
}

TEST_CASE("ValueCodec: NULL handling", "[codec]") {
    REQUIRE_FALSE(ValueCodec::encode(col("a", LogicalType::TEXT), std::monostate{}).has_value());
    REQUIRE_THROWS_AS(ValueCodec::encode(col("a", LogicalType::TEXT, false), std::monostate{}),
                      EngineError);
}

TEST_CASE("ValueCodec: JSON payloads are validated and compacted", "[codec]") {
    const auto meta = col("meta", LogicalType::JSON);

    const auto coerced = ValueCodec::coerce(meta, Json{"{ \"b\": \"x\", \"a\": [true, null] }"});
    REQUIRE(std::get<Json>(coerced).text == "{\"a\":[true,null],\"b\":\"x\"}");

    REQUIRE_THROWS_AS(ValueCodec::coerce(meta, Json{"{not json"}), EngineError);

    // Scalars are wrapped as JSON documents
    REQUIRE(std::get<Json>(ValueCodec::coerce(meta, std::string("hi"))).text == "\"hi\"");
}

TEST_CASE("ValueCodec: text-format parameters", "[codec]") {
    REQUIRE(ValueCodec::encode(col("flag", LogicalType::BOOLEAN), true) == "true");
    REQUIRE(ValueCodec::encode(col("n", LogicalType::BIGINT), int64_t{-5}) == "-5");
    REQUIRE(ValueCodec::encode(col("tags", LogicalType::STRING_ARRAY),
                               StringArray{"a", "b\"c"}) == "{\"a\",\"b\\\"c\"}");
    REQUIRE_THROWS_AS(ValueCodec::encode(col("flag", LogicalType::BOOLEAN), std::string("yes")),
                      EngineError);
}

// ============================================================================
// Decoding
// ============================================================================

TEST_CASE("ValueCodec: decode result cells", "[codec]") {
    REQUIRE(std::get<bool>(ValueCodec::decode(LogicalType::BOOLEAN, std::string("t"))));
    REQUIRE(std::get<int64_t>(ValueCodec::decode(LogicalType::INTEGER, std::string("12"))) == 12);
    REQUIRE(std::get<Decimal>(ValueCodec::decode(LogicalType::DECIMAL, std::string("10.50"))).text == "10.50");
    REQUIRE(std::isnan(std::get<double>(ValueCodec::decode(LogicalType::FLOAT, std::string("NaN")))));
    REQUIRE(is_null(ValueCodec::decode(LogicalType::TEXT, std::nullopt)));
    REQUIRE(std::get<std::string>(ValueCodec::decode(LogicalType::TEXT, std::string(""))).empty());

    const auto tags = std::get<StringArray>(
        ValueCodec::decode(LogicalType::STRING_ARRAY, std::string("{a,\"b c\"}")));
    REQUIRE(tags == StringArray{"a", "b c"});

    REQUIRE_THROWS_AS(ValueCodec::decode(LogicalType::INTEGER, std::string("abc")), EngineError);
}

TEST_CASE("ValueCodec: decode_row uses declared column types", "[codec]") {
    TableDefinition t;
    t.name = "products";
    t.columns.push_back(col("price", LogicalType::DECIMAL));
    t.columns.push_back(col("stock", LogicalType::INTEGER));

    DbResultSet rs;
    rs.success = true;
    rs.has_rows = true;
    rs.column_names = {"price", "stock", "extra"};
    rs.rows = {{std::string("9.90"), std::nullopt, std::string("x")}};

    const auto row = ValueCodec::decode_row(t, rs, 0);
    REQUIRE(std::get<Decimal>(row.at("price")).text == "9.90");
    REQUIRE(is_null(row.at("stock")));
    REQUIRE(std::get<std::string>(row.at("extra")) == "x");
}

// ============================================================================
// Comparison
// ============================================================================

TEST_CASE("ValueCodec: semantic equality", "[codec]") {
    REQUIRE(ValueCodec::values_equal(LogicalType::DECIMAL, Decimal{"10.50"}, Decimal{"10.5"}));
    REQUIRE(ValueCodec::values_equal(LogicalType::DECIMAL, Decimal{"10.00"}, int64_t{10}));
    REQUIRE_FALSE(ValueCodec::values_equal(LogicalType::DECIMAL, Decimal{"10.01"}, Decimal{"10.1"}));

    REQUIRE(ValueCodec::values_equal(LogicalType::JSON, Json{"{\"a\":1,\"b\":2}"},
                                     Json{"{ \"b\": 2, \"a\": 1 }"}));

    REQUIRE(ValueCodec::values_equal(LogicalType::UUID,
                                     std::string("7F0C3A52-2F4E-4B8A-9F7E-3F1E2D4C5B6A"),
                                     std::string("7f0c3a52-2f4e-4b8a-9f7e-3f1e2d4c5b6a")));

    REQUIRE(ValueCodec::values_equal(LogicalType::TEXT, std::monostate{}, std::monostate{}));
    REQUIRE_FALSE(ValueCodec::values_equal(LogicalType::TEXT, std::monostate{}, std::string("")));
}

TEST_CASE("ValueCodec: canonical decimal text", "[codec]") {
    REQUIRE(ValueCodec::canonical_decimal("0010.500") == "10.5");
    REQUIRE(ValueCodec::canonical_decimal("-0.00") == "0");
    REQUIRE(ValueCodec::canonical_decimal("-1.50") == "-1.5");
    REQUIRE(ValueCodec::canonical_decimal("abc") == "abc");
}
