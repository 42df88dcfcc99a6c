#include "schema/type_normalizer.hpp"
#include "db/postgresql/pg_type_map.hpp"
#include "core/utils.hpp"

#include <cctype>
#include <unordered_set>

namespace tempo {

namespace {

// PostgreSQL truncates identifiers to NAMEDATALEN - 1 bytes
constexpr size_t kMaxIdentifierLength = 63;

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '"';
}

/**
 * @brief Remove "::type" casts outside single-quoted literals
 *
 * Consumes multi-word type names ("character varying"), array suffixes and
 * numeric modifiers; leaves any enclosing parentheses alone.
 */
std::string strip_casts(const std::string& expr) {
    std::string out;
    out.reserve(expr.size());
    bool in_quote = false;
    size_t i = 0;
    while (i < expr.size()) {
        const char c = expr[i];
        if (c == '\'') {
            in_quote = !in_quote;
            out += c;
            ++i;
            continue;
        }
        if (in_quote || c != ':' || i + 1 >= expr.size() || expr[i + 1] != ':') {
            out += c;
            ++i;
            continue;
        }

        i += 2;
        while (i < expr.size() && expr[i] == ' ') ++i;
        while (i < expr.size()) {
            const char t = expr[i];
            if (is_ident_char(t)) {
                ++i;
            } else if (t == ' ' && i + 1 < expr.size()
                       && std::isalpha(static_cast<unsigned char>(expr[i + 1]))) {
                ++i;
            } else if (t == '[' && i + 1 < expr.size() && expr[i + 1] == ']') {
                i += 2;
            } else if (t == '(') {
                size_t j = i + 1;
                while (j < expr.size() && (std::isdigit(static_cast<unsigned char>(expr[j]))
                                           || expr[j] == ',' || expr[j] == ' ')) {
                    ++j;
                }
                if (j < expr.size() && expr[j] == ')') {
                    i = j + 1;
                } else {
                    break;
                }
            } else {
                break;
            }
        }
    }
    return utils::trim(out);
}

std::string strip_outer_parens(std::string text) {
    text = utils::trim(text);
    while (TypeNormalizer::is_wrapped_in_parens(text)) {
        text = utils::trim(text.substr(1, text.size() - 2));
    }
    return text;
}

/**
 * @brief Drop spaces just inside parentheses: "( a )" -> "(a)"
 */
std::string tighten_parens(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool in_quote = false;
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '\'') in_quote = !in_quote;
        if (!in_quote && c == ' ') {
            const bool after_open = !out.empty() && out.back() == '(';
            const bool before_close = i + 1 < text.size() && text[i + 1] == ')';
            if (after_open || before_close) continue;
        }
        out += c;
    }
    return out;
}

bool is_quoted_literal(const std::string& s) {
    return s.size() >= 2 && s.front() == '\'' && s.back() == '\''
        && s.find('\'', 1) == s.size() - 1;
}

/**
 * @brief "010.500" -> "10.5", "-0.0" -> "0"; non-numbers unchanged
 */
std::string canonical_number(const std::string& s) {
    if (!utils::try_parse_double(s)) return s;
    if (s.find_first_of("eE") != std::string::npos) return s;

    std::string sign;
    std::string digits = s;
    if (!digits.empty() && (digits.front() == '-' || digits.front() == '+')) {
        if (digits.front() == '-') sign = "-";
        digits.erase(0, 1);
    }

    std::string int_part = digits;
    std::string frac_part;
    if (const auto dot = digits.find('.'); dot != std::string::npos) {
        int_part = digits.substr(0, dot);
        frac_part = digits.substr(dot + 1);
    }
    while (int_part.size() > 1 && int_part.front() == '0') int_part.erase(0, 1);
    if (int_part.empty()) int_part = "0";
    while (!frac_part.empty() && frac_part.back() == '0') frac_part.pop_back();

    std::string out = int_part;
    if (!frac_part.empty()) out += "." + frac_part;
    if (out == "0") return out;
    return sign + out;
}

std::optional<std::string> canonical_boolean(const std::string& lowered) {
    static const std::unordered_set<std::string> TRUE_LITERALS = {
        "t", "true", "1", "y", "yes", "on"};
    static const std::unordered_set<std::string> FALSE_LITERALS = {
        "f", "false", "0", "n", "no", "off"};

    if (TRUE_LITERALS.contains(lowered)) return "true";
    if (FALSE_LITERALS.contains(lowered)) return "false";
    return std::nullopt;
}

std::string unquote_identifier(const std::string& name) {
    auto s = utils::trim(name);
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
        std::string out;
        for (size_t i = 0; i < s.size(); ++i) {
            out += s[i];
            if (s[i] == '"' && i + 1 < s.size() && s[i + 1] == '"') ++i;
        }
        return out;
    }
    return s;
}

} // anonymous namespace

// ============================================================================
// Types
// ============================================================================

std::string TypeNormalizer::normalize_native_type(const std::string& raw) {
    auto s = utils::to_lower(utils::collapse_whitespace(utils::trim(raw)));

    bool is_array = false;
    while (s.size() >= 2 && s.ends_with("[]")) {
        is_array = true;
        s = utils::trim(s.substr(0, s.size() - 2));
    }

    // Split off the modifier list, which may sit mid-name ("timestamp(3) with time zone")
    std::string mods;
    if (const auto open = s.find('('); open != std::string::npos) {
        const auto close = s.find(')', open);
        if (close != std::string::npos) {
            for (size_t i = open; i <= close; ++i) {
                if (s[i] != ' ') mods += s[i];
            }
            s = utils::collapse_whitespace(
                utils::trim(s.substr(0, open) + " " + s.substr(close + 1)));
        }
    }

    auto canonical = PgTypeMap::canonical_type_name(s);
    if (canonical.ends_with("[]")) {
        is_array = true;
        canonical = canonical.substr(0, canonical.size() - 2);
    }

    return canonical + mods + (is_array ? "[]" : "");
}

LogicalType TypeNormalizer::logical_type_of(const std::string& raw) {
    auto s = normalize_native_type(raw);
    const bool is_array = s.ends_with("[]");
    if (is_array) s = s.substr(0, s.size() - 2);
    if (const auto open = s.find('('); open != std::string::npos) {
        s = s.substr(0, open);
    }
    if (is_array) {
        return (s == "text" || s == "varchar") ? LogicalType::STRING_ARRAY : LogicalType::UNKNOWN;
    }
    return PgTypeMap::canonical_to_logical(s);
}

// ============================================================================
// Defaults
// ============================================================================

std::optional<std::string> TypeNormalizer::normalize_default(
    const std::optional<std::string>& raw, LogicalType type) {

    if (!raw) return std::nullopt;

    auto s = strip_outer_parens(strip_casts(utils::trim(*raw)));
    if (s.empty()) return std::nullopt;

    // Unquoted expressions are case-insensitive
    if (s.find('\'') == std::string::npos) {
        s = utils::to_lower(utils::collapse_whitespace(s));
    }

    if (s == "null") return std::nullopt;

    if (s == "now()" || s == "current_timestamp" || s == "current_timestamp()"
        || s == "transaction_timestamp()") {
        return "now()";
    }

    if (type == LogicalType::BOOLEAN || type == LogicalType::UNKNOWN) {
        const auto bare = is_quoted_literal(s) ? s.substr(1, s.size() - 2) : s;
        if (auto b = canonical_boolean(utils::to_lower(bare))) {
            return b;
        }
    }

    if (is_quoted_literal(s)) {
        const auto inner = s.substr(1, s.size() - 2);
        if (utils::try_parse_double(inner)) {
            return canonical_number(inner);
        }
        return s;
    }

    return canonical_number(s);
}

// ============================================================================
// Predicates
// ============================================================================

bool TypeNormalizer::is_wrapped_in_parens(const std::string& text) {
    if (text.size() < 2 || text.front() != '(' || text.back() != ')') {
        return false;
    }

    int depth = 0;
    bool in_quote = false;
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '\'') {
            in_quote = !in_quote;
            continue;
        }
        if (in_quote) continue;
        if (c == '(') {
            ++depth;
        } else if (c == ')') {
            --depth;
            if (depth == 0) return i == text.size() - 1;
            if (depth < 0) return false;
        }
    }
    return false;
}

std::optional<std::string> TypeNormalizer::normalize_predicate(
    const std::optional<std::string>& raw) {

    if (!raw) return std::nullopt;

    auto s = tighten_parens(utils::collapse_whitespace(utils::trim(*raw)));
    s = strip_outer_parens(s);
    if (s.empty()) return std::nullopt;
    return s;
}

// ============================================================================
// Columns / Indexes
// ============================================================================

ColumnDefinition TypeNormalizer::normalize_column(const ColumnDefinition& column) {
    ColumnDefinition out = column;

    if (out.native_type.empty() && out.logical_type != LogicalType::UNKNOWN) {
        out.native_type = PgTypeMap::native_type_for(out);
    }
    out.native_type = normalize_native_type(out.native_type);

    if (out.logical_type == LogicalType::UNKNOWN) {
        out.logical_type = logical_type_of(out.native_type);
    }
    out.default_value = normalize_default(out.default_value, out.logical_type);
    return out;
}

IndexDefinition TypeNormalizer::normalize_index(const IndexDefinition& index) {
    IndexDefinition out = index;

    if (out.name.size() > kMaxIdentifierLength) {
        out.name.resize(kMaxIdentifierLength);
    }
    out.method = out.method.empty() ? "btree" : utils::to_lower(out.method);
    for (auto& col : out.columns) {
        col = unquote_identifier(col);
    }
    out.where = normalize_predicate(out.where);
    return out;
}

bool TypeNormalizer::columns_equal(const ColumnDefinition& a, const ColumnDefinition& b) {
    if (a.name != b.name || a.nullable != b.nullable) return false;

    const auto na = normalize_column(a);
    const auto nb = normalize_column(b);
    return na.native_type == nb.native_type && na.default_value == nb.default_value;
}

bool TypeNormalizer::indexes_equal(const IndexDefinition& a, const IndexDefinition& b) {
    const auto na = normalize_index(a);
    const auto nb = normalize_index(b);
    return na.name == nb.name
        && na.columns == nb.columns
        && na.unique == nb.unique
        && na.method == nb.method
        && na.where == nb.where;
}

} // namespace tempo
