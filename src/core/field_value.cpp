#include "core/field_value.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#include <format>
#include <type_traits>

namespace tempo {

std::string field_value_to_string(const FieldValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "NULL";
        } else if constexpr (std::is_same_v<T, bool>) {
            return utils::booltostr(v);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            return std::format("{}", v);
        } else if constexpr (std::is_same_v<T, Decimal> || std::is_same_v<T, Json>) {
            return v.text;
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            std::string out = "[";
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) out += ", ";
                out += v[i];
            }
            out += "]";
            return out;
        }
    }, value);
}

std::string field_value_to_json(const FieldValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            return utils::booltostr(v);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            return std::format("{}", v);
        } else if constexpr (std::is_same_v<T, Decimal>) {
            // quoted so the digits survive a round trip through a double
            return std::format("\"{}\"", utils::escape_json(v.text));
        } else if constexpr (std::is_same_v<T, Json>) {
            return v.text;
        } else if constexpr (std::is_same_v<T, std::string>) {
            return std::format("\"{}\"", utils::escape_json(v));
        } else {
            std::string out = "[";
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) out += ",";
                out += std::format("\"{}\"", utils::escape_json(v[i]));
            }
            out += "]";
            return out;
        }
    }, value);
}

std::string record_to_json(const Record& record) {
    std::string out = "{";
    bool first = true;
    for (const auto& [name, value] : record) {
        if (!first) out += ",";
        first = false;
        out += std::format("\"{}\":{}", utils::escape_json(name), field_value_to_json(value));
    }
    out += "}";
    return out;
}

FieldValue field_value_from_json(const JsonValue& json, LogicalType type) {
    if (json.is_null()) {
        return std::monostate{};
    }

    if (type == LogicalType::JSON) {
        return Json{json.dump()};
    }

    if (json.is_boolean()) {
        return json.get<bool>();
    }

    if (json.is_number()) {
        if (is_integral(type)) {
            return json.get<int64_t>();
        }
        if (type == LogicalType::DECIMAL) {
            return Decimal{json.dump()};
        }
        return json.get<double>();
    }

    if (json.is_string()) {
        auto s = json.get<std::string>();
        if (type == LogicalType::DECIMAL) {
            return Decimal{std::move(s)};
        }
        if (is_integral(type)) {
            if (auto i = utils::try_parse_int<int64_t>(s)) return *i;
        }
        if (is_floating_point(type)) {
            if (auto d = utils::try_parse_double(s)) return *d;
        }
        return s;
    }

    if (json.is_array() && type == LogicalType::STRING_ARRAY) {
        StringArray out;
        for (const auto& e : json.elements()) {
            out.push_back(e.is_string() ? e.get<std::string>() : e.dump());
        }
        return out;
    }

    return Json{json.dump()};
}

} // namespace tempo
