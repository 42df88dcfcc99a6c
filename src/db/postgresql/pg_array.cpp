#include "db/postgresql/pg_array.hpp"

namespace tempo::pg {

std::string encode_text_array(const std::vector<std::string>& items) {
    std::string out = "{";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ',';
        out += '"';
        for (const char c : items[i]) {
            if (c == '"' || c == '\\') out += '\\';
            out += c;
        }
        out += '"';
    }
    out += '}';
    return out;
}

std::vector<std::string> decode_text_array(const std::string& literal) {
    std::vector<std::string> result;
    if (literal.size() < 2 || literal.front() != '{' || literal.back() != '}') {
        return result;
    }

    const size_t end = literal.size() - 1;
    size_t i = 1;
    while (i < end) {
        std::string item;
        bool quoted = false;

        if (literal[i] == '"') {
            quoted = true;
            ++i;
            while (i < end && literal[i] != '"') {
                if (literal[i] == '\\' && i + 1 < end) ++i;
                item += literal[i++];
            }
            ++i;  // closing quote
        } else {
            while (i < end && literal[i] != ',') {
                item += literal[i++];
            }
        }

        if (quoted || item != "NULL") {
            result.push_back(std::move(item));
        }

        if (i < end && literal[i] == ',') ++i;
    }
    return result;
}

} // namespace tempo::pg
