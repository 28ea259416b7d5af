#include "core/toml_document.hpp"

#include "core/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <iomanip>
#include <set>
#include <sstream>

namespace mpwrd::toml {

namespace {
bool is_bare_key_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

void append_utf8(std::string& out, unsigned long code_point) {
    if (code_point < 0x80) {
        out += static_cast<char>(code_point);
    } else if (code_point < 0x800) {
        out += static_cast<char>(0xC0 | (code_point >> 6));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else if (code_point < 0x10000) {
        out += static_cast<char>(0xE0 | (code_point >> 12));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (code_point >> 18));
        out += static_cast<char>(0x80 | ((code_point >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    }
}

std::string quote(const std::string& value) {
    std::string out = "\"";
    for (char c : value) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\t':
                out += "\\t";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\b':
                out += "\\b";
                break;
            case '\f':
                out += "\\f";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20 || c == 0x7F) {
                    std::ostringstream escaped;
                    escaped << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                            << static_cast<int>(static_cast<unsigned char>(c));
                    out += escaped.str();
                } else {
                    out += c;
                }
        }
    }
    out += '"';
    return out;
}

bool starts_with(const std::vector<std::string>& path, const std::vector<std::string>& prefix) {
    return path.size() >= prefix.size() && std::equal(prefix.begin(), prefix.end(), path.begin());
}

bool is_header(const Entry& entry) {
    return entry.kind == Entry::Kind::Table || entry.kind == Entry::Kind::ArrayTable;
}

bool is_blank(const Entry& entry) {
    return entry.kind == Entry::Kind::Trivia &&
           entry.raw.find_first_not_of(" \t\r") == std::string::npos;
}

class Parser {
public:
    explicit Parser(const std::string& text) : m_text(text) {}

    std::vector<Entry> parse_entries() {
        std::vector<Entry> entries;
        while (!at_end()) {
            entries.push_back(parse_entry());
            if (peek() == '\n') {
                advance();
            }
        }
        return entries;
    }

private:
    [[noreturn]] void fail(const std::string& message) const {
        throw ParseError(message, m_line, m_pos - m_line_start + 1);
    }

    bool at_end() const { return m_pos >= m_text.size(); }

    char peek(std::size_t offset = 0) const {
        return m_pos + offset < m_text.size() ? m_text[m_pos + offset] : '\0';
    }

    void advance() {
        if (m_text[m_pos] == '\n') {
            ++m_line;
            m_line_start = m_pos + 1;
        }
        ++m_pos;
    }

    bool at_line_end() const {
        return at_end() || peek() == '\n' || (peek() == '\r' && peek(1) == '\n');
    }

    void skip_ws() {
        while (peek() == ' ' || peek() == '\t') {
            ++m_pos;
        }
    }

    void skip_comment() {
        while (!at_end() && peek() != '\n') {
            ++m_pos;
        }
    }

    void skip_ws_newlines_comments() {
        while (!at_end()) {
            char c = peek();
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
                advance();
            } else if (c == '#') {
                skip_comment();
            } else {
                break;
            }
        }
    }

    void expect_line_end() {
        skip_ws();
        if (peek() == '#') {
            skip_comment();
            return;
        }
        if (peek() == '\r' && peek(1) == '\n') {
            ++m_pos;
        }
        if (!at_end() && peek() != '\n') {
            fail("unexpected text after value");
        }
    }

    Entry parse_entry() {
        Entry entry;
        const std::size_t start = m_pos;
        entry.line = m_line;
        skip_ws();

        char c = peek();
        if (at_line_end() || c == '#') {
            entry.kind = Entry::Kind::Trivia;
            if (c == '#') {
                skip_comment();
            } else if (c == '\r') {
                ++m_pos;
            }
        } else if (c == '[') {
            const bool array = peek(1) == '[';
            m_pos += array ? 2 : 1;
            skip_ws();
            entry.key = parse_dotted_key();
            skip_ws();
            if (array) {
                if (peek() != ']' || peek(1) != ']') {
                    fail("expected ']]' to close array table header");
                }
                m_pos += 2;
            } else {
                if (peek() != ']') {
                    fail("expected ']' to close table header");
                }
                ++m_pos;
            }
            entry.kind = array ? Entry::Kind::ArrayTable : Entry::Kind::Table;
            expect_line_end();
        } else {
            entry.kind = Entry::Kind::KeyValue;
            entry.key = parse_dotted_key();
            skip_ws();
            if (peek() != '=') {
                fail("expected '=' after key");
            }
            ++m_pos;
            skip_ws();
            if (at_line_end() || peek() == '#') {
                fail("missing value");
            }
            entry.column = m_pos - m_line_start + 1;
            entry.value_begin = m_pos - start;
            entry.value = parse_value();
            entry.value_end = m_pos - start;
            expect_line_end();
        }

        entry.raw = m_text.substr(start, m_pos - start);
        return entry;
    }

    std::string parse_simple_key() {
        if (peek() == '"') {
            return parse_basic_string();
        }
        if (peek() == '\'') {
            return parse_literal_string();
        }
        std::string key;
        while (is_bare_key_char(peek())) {
            key += peek();
            ++m_pos;
        }
        if (key.empty()) {
            fail("invalid key");
        }
        return key;
    }

    std::vector<std::string> parse_dotted_key() {
        std::vector<std::string> parts{parse_simple_key()};
        while (true) {
            skip_ws();
            if (peek() != '.') {
                break;
            }
            ++m_pos;
            skip_ws();
            parts.push_back(parse_simple_key());
        }
        return parts;
    }

    void parse_escape(std::string& out) {
        ++m_pos;
        char c = peek();
        switch (c) {
            case 'b':
                out += '\b';
                break;
            case 't':
                out += '\t';
                break;
            case 'n':
                out += '\n';
                break;
            case 'f':
                out += '\f';
                break;
            case 'r':
                out += '\r';
                break;
            case '"':
                out += '"';
                break;
            case '\\':
                out += '\\';
                break;
            case 'u':
            case 'U': {
                const std::size_t digits = c == 'u' ? 4 : 8;
                if (m_pos + digits >= m_text.size()) {
                    fail("truncated unicode escape");
                }
                const std::string hex = m_text.substr(m_pos + 1, digits);
                if (!std::all_of(hex.begin(), hex.end(),
                                 [](unsigned char ch) { return std::isxdigit(ch) != 0; })) {
                    fail("invalid unicode escape");
                }
                append_utf8(out, std::strtoul(hex.c_str(), nullptr, 16));
                m_pos += digits;
                break;
            }
            default:
                fail("invalid escape sequence");
        }
        ++m_pos;
    }

    std::string parse_basic_string() {
        ++m_pos;
        std::string out;
        while (true) {
            if (at_end() || peek() == '\n') {
                fail("unterminated string");
            }
            char c = peek();
            if (c == '"') {
                ++m_pos;
                return out;
            }
            if (c == '\\') {
                parse_escape(out);
            } else {
                out += c;
                ++m_pos;
            }
        }
    }

    std::string parse_multiline_basic_string() {
        m_pos += 3;
        if (peek() == '\r' && peek(1) == '\n') {
            ++m_pos;
        }
        if (peek() == '\n') {
            advance();
        }
        std::string out;
        while (true) {
            if (at_end()) {
                fail("unterminated multi-line string");
            }
            if (peek() == '"' && peek(1) == '"' && peek(2) == '"') {
                m_pos += 3;
                return out;
            }
            if (peek() == '\\') {
                std::size_t look = m_pos + 1;
                while (look < m_text.size() && (m_text[look] == ' ' || m_text[look] == '\t')) {
                    ++look;
                }
                if (look < m_text.size() && (m_text[look] == '\n' || m_text[look] == '\r')) {
                    ++m_pos;
                    skip_ws_newlines();
                    continue;
                }
                parse_escape(out);
                continue;
            }
            out += peek();
            advance();
        }
    }

    void skip_ws_newlines() {
        while (!at_end() && (peek() == ' ' || peek() == '\t' || peek() == '\r' || peek() == '\n')) {
            advance();
        }
    }

    std::string parse_literal_string() {
        ++m_pos;
        std::string out;
        while (true) {
            if (at_end() || peek() == '\n') {
                fail("unterminated string");
            }
            if (peek() == '\'') {
                ++m_pos;
                return out;
            }
            out += peek();
            ++m_pos;
        }
    }

    std::string parse_multiline_literal_string() {
        m_pos += 3;
        if (peek() == '\r' && peek(1) == '\n') {
            ++m_pos;
        }
        if (peek() == '\n') {
            advance();
        }
        std::string out;
        while (true) {
            if (at_end()) {
                fail("unterminated multi-line string");
            }
            if (peek() == '\'' && peek(1) == '\'' && peek(2) == '\'') {
                m_pos += 3;
                return out;
            }
            out += peek();
            advance();
        }
    }

    Value parse_value() {
        char c = peek();
        if (c == '"') {
            if (peek(1) == '"' && peek(2) == '"') {
                return Value::string(parse_multiline_basic_string());
            }
            return Value::string(parse_basic_string());
        }
        if (c == '\'') {
            if (peek(1) == '\'' && peek(2) == '\'') {
                return Value::string(parse_multiline_literal_string());
            }
            return Value::string(parse_literal_string());
        }
        if (c == '[') {
            return parse_array();
        }
        if (c == '{') {
            return parse_inline_table();
        }
        if (m_text.compare(m_pos, 4, "true") == 0 && !is_bare_key_char(peek(4))) {
            m_pos += 4;
            return Value::boolean_value(true);
        }
        if (m_text.compare(m_pos, 5, "false") == 0 && !is_bare_key_char(peek(5))) {
            m_pos += 5;
            return Value::boolean_value(false);
        }
        return parse_scalar();
    }

    Value parse_array() {
        ++m_pos;
        std::vector<Value> items;
        while (true) {
            skip_ws_newlines_comments();
            if (at_end()) {
                fail("unterminated array");
            }
            if (peek() == ']') {
                ++m_pos;
                break;
            }
            items.push_back(parse_value());
            skip_ws_newlines_comments();
            if (peek() == ',') {
                ++m_pos;
                continue;
            }
            if (peek() == ']') {
                ++m_pos;
                break;
            }
            fail("expected ',' or ']' in array");
        }
        return Value::array(std::move(items));
    }

    void insert_member(std::vector<std::pair<std::string, Value>>& members,
                       const std::vector<std::string>& key, std::size_t depth, Value value) {
        auto it = std::find_if(members.begin(), members.end(),
                               [&](const auto& member) { return member.first == key[depth]; });
        if (depth + 1 == key.size()) {
            if (it != members.end()) {
                fail("duplicate key '" + key[depth] + "' in inline table");
            }
            members.emplace_back(key[depth], std::move(value));
            return;
        }
        if (it == members.end()) {
            members.emplace_back(key[depth], Value::table({}));
            it = members.end() - 1;
        } else if (!it->second.is_table()) {
            fail("key '" + key[depth] + "' is not a table");
        }
        insert_member(it->second.members, key, depth + 1, std::move(value));
    }

    Value parse_inline_table() {
        ++m_pos;
        std::vector<std::pair<std::string, Value>> members;
        skip_ws();
        if (peek() == '}') {
            ++m_pos;
            return Value::table(std::move(members));
        }
        while (true) {
            skip_ws();
            auto key = parse_dotted_key();
            skip_ws();
            if (peek() != '=') {
                fail("expected '=' in inline table");
            }
            ++m_pos;
            skip_ws();
            insert_member(members, key, 0, parse_value());
            skip_ws();
            if (peek() == ',') {
                ++m_pos;
                continue;
            }
            if (peek() == '}') {
                ++m_pos;
                break;
            }
            fail("expected ',' or '}' in inline table");
        }
        return Value::table(std::move(members));
    }

    Value parse_scalar() {
        const std::size_t begin = m_pos;
        while (!at_end()) {
            char c = peek();
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == ',' || c == ']' || c == '}' ||
                c == '#') {
                break;
            }
            ++m_pos;
        }
        std::string token = m_text.substr(begin, m_pos - begin);
        if (token.empty()) {
            fail("expected a value");
        }

        Value value;
        if (token == "inf" || token == "+inf" || token == "-inf" || token == "nan" || token == "+nan" ||
            token == "-nan") {
            value.type = Value::Type::Float;
            value.text = token;
            value.floating = std::strtod(token.c_str(), nullptr);
            return value;
        }

        const bool looks_like_date = token.size() >= 10 && token[4] == '-' &&
                                     std::isdigit(static_cast<unsigned char>(token[0]));
        const bool looks_like_time = token.size() >= 8 && token[2] == ':' &&
                                     std::isdigit(static_cast<unsigned char>(token[0]));
        if (looks_like_date || looks_like_time) {
            value.type = Value::Type::Datetime;
            value.text = token;
            return value;
        }

        std::string digits;
        for (char c : token) {
            if (c != '_') {
                digits += c;
            }
        }

        const bool prefixed = digits.size() > 2 && digits[0] == '0' &&
                              (digits[1] == 'x' || digits[1] == 'o' || digits[1] == 'b');
        if (!prefixed && (digits.find_first_of(".eE") != std::string::npos)) {
            char* end = nullptr;
            const double parsed = std::strtod(digits.c_str(), &end);
            if (end == nullptr || *end != '\0') {
                m_pos = begin;
                fail("invalid number '" + token + "'");
            }
            value.type = Value::Type::Float;
            value.text = token;
            value.floating = parsed;
            return value;
        }

        int base = 10;
        std::string body = digits;
        if (prefixed) {
            base = digits[1] == 'x' ? 16 : (digits[1] == 'o' ? 8 : 2);
            body = digits.substr(2);
        } else {
            const std::size_t first = (body[0] == '+' || body[0] == '-') ? 1 : 0;
            if (body.size() > first + 1 && body[first] == '0') {
                m_pos = begin;
                fail("leading zeros are not allowed in '" + token + "'");
            }
        }

        char* end = nullptr;
        errno = 0;
        const long long parsed = std::strtoll(body.c_str(), &end, base);
        if (body.empty() || end == nullptr || *end != '\0' || errno == ERANGE) {
            m_pos = begin;
            fail("invalid value '" + token + "'");
        }
        value.type = Value::Type::Integer;
        value.integer = parsed;
        return value;
    }

    const std::string& m_text;
    std::size_t m_pos = 0;
    std::size_t m_line = 1;
    std::size_t m_line_start = 0;
};
}  // namespace

Value Value::string(std::string value) {
    Value v;
    v.type = Type::String;
    v.text = std::move(value);
    return v;
}

Value Value::integer_value(long long value) {
    Value v;
    v.type = Type::Integer;
    v.integer = value;
    return v;
}

Value Value::boolean_value(bool value) {
    Value v;
    v.type = Type::Boolean;
    v.boolean = value;
    return v;
}

Value Value::array(std::vector<Value> items) {
    Value v;
    v.type = Type::Array;
    v.items = std::move(items);
    return v;
}

Value Value::table(std::vector<std::pair<std::string, Value>> members) {
    Value v;
    v.type = Type::Table;
    v.members = std::move(members);
    return v;
}

const Value* Value::member(const std::string& key) const {
    for (const auto& member : members) {
        if (member.first == key) {
            return &member.second;
        }
    }
    return nullptr;
}

std::string Value::to_toml() const {
    switch (type) {
        case Type::String:
            return quote(text);
        case Type::Integer:
            return std::to_string(integer);
        case Type::Float: {
            if (!text.empty()) {
                return text;
            }
            std::ostringstream out;
            out << std::setprecision(17) << floating;
            std::string formatted = out.str();
            if (formatted.find_first_of(".eEn") == std::string::npos) {
                formatted += ".0";
            }
            return formatted;
        }
        case Type::Boolean:
            return boolean ? "true" : "false";
        case Type::Datetime:
            return text;
        case Type::Array: {
            std::string out = "[";
            for (std::size_t i = 0; i < items.size(); ++i) {
                if (i > 0) {
                    out += ", ";
                }
                out += items[i].to_toml();
            }
            return out + "]";
        }
        case Type::Table: {
            if (members.empty()) {
                return "{}";
            }
            std::string out = "{ ";
            for (std::size_t i = 0; i < members.size(); ++i) {
                if (i > 0) {
                    out += ", ";
                }
                out += format_key(members[i].first) + " = " + members[i].second.to_toml();
            }
            return out + " }";
        }
    }
    return "";
}

bool Value::operator==(const Value& other) const {
    if (type != other.type) {
        return false;
    }
    switch (type) {
        case Type::String:
        case Type::Datetime:
            return text == other.text;
        case Type::Integer:
            return integer == other.integer;
        case Type::Float:
            return floating == other.floating;
        case Type::Boolean:
            return boolean == other.boolean;
        case Type::Array:
            return items == other.items;
        case Type::Table:
            if (members.size() != other.members.size()) {
                return false;
            }
            for (const auto& member : members) {
                const Value* counterpart = other.member(member.first);
                if (!counterpart || *counterpart != member.second) {
                    return false;
                }
            }
            return true;
    }
    return false;
}

std::string type_name(Value::Type type) {
    switch (type) {
        case Value::Type::String:
            return "string";
        case Value::Type::Integer:
            return "integer";
        case Value::Type::Float:
            return "float";
        case Value::Type::Boolean:
            return "boolean";
        case Value::Type::Datetime:
            return "datetime";
        case Value::Type::Array:
            return "array";
        case Value::Type::Table:
            return "table";
    }
    return "value";
}

std::string format_key(const std::string& key) {
    if (!key.empty() && std::all_of(key.begin(), key.end(), is_bare_key_char)) {
        return key;
    }
    return quote(key);
}

TableId root_table() {
    return TableId{};
}

TableId table(std::vector<std::string> path) {
    return TableId{std::move(path), false, 0};
}

TableId array_table(std::vector<std::string> path, std::size_t index) {
    return TableId{std::move(path), true, index};
}

Document Document::parse(const std::string& text) {
    Document doc;
    doc.m_entries = Parser(text).parse_entries();
    doc.m_trailing_newline = text.empty() || text.back() == '\n';
    doc.reindex();

    std::set<std::vector<std::string>> headers;
    std::set<std::vector<std::string>> array_headers;
    std::vector<std::pair<TableId, std::vector<std::string>>> keys;
    // Full paths of the values under plain tables, and the tables their dotted keys open.
    std::vector<std::pair<std::vector<std::string>, const Entry*>> value_paths;
    std::set<std::vector<std::string>> dotted_tables;
    for (const auto& entry : doc.m_entries) {
        if (entry.kind == Entry::Kind::Table) {
            if (!headers.insert(entry.key).second || array_headers.count(entry.key) > 0) {
                throw ParseError("table defined more than once", entry.line, 1);
            }
        } else if (entry.kind == Entry::Kind::ArrayTable) {
            if (headers.count(entry.key) > 0) {
                throw ParseError("array table redefines a table", entry.line, 1);
            }
            array_headers.insert(entry.key);
        } else if (entry.kind == Entry::Kind::KeyValue) {
            for (const auto& seen : keys) {
                if (seen.first == entry.owner &&
                    (starts_with(seen.second, entry.key) || starts_with(entry.key, seen.second))) {
                    throw ParseError("duplicate key '" + entry.key.back() + "'", entry.line, 1);
                }
            }
            keys.emplace_back(entry.owner, entry.key);

            if (!entry.owner.array) {
                std::vector<std::string> path = entry.owner.path;
                for (std::size_t i = 0; i + 1 < entry.key.size(); ++i) {
                    path.push_back(entry.key[i]);
                    dotted_tables.insert(path);
                }
                path.push_back(entry.key.back());
                value_paths.emplace_back(std::move(path), &entry);
            }
        }
    }

    for (const auto& entry : doc.m_entries) {
        if (!is_header(entry)) {
            continue;
        }
        if (dotted_tables.count(entry.key) > 0) {
            throw ParseError("table already defined by dotted keys", entry.line, 1);
        }
        for (const auto& [path, value] : value_paths) {
            if (starts_with(entry.key, path)) {
                throw ParseError("key '" + path.back() + "' is also defined as a table", value->line, 1);
            }
        }
    }
    for (const auto& [path, entry] : value_paths) {
        for (const auto& seen : value_paths) {
            if (seen.second != entry && starts_with(seen.first, path)) {
                throw ParseError("duplicate key '" + path.back() + "'", std::max(entry->line, seen.second->line), 1);
            }
        }
    }
    return doc;
}

std::string Document::str() const {
    std::string out;
    for (std::size_t i = 0; i < m_entries.size(); ++i) {
        if (i > 0) {
            out += '\n';
        }
        out += m_entries[i].raw;
    }
    if (!m_entries.empty() && m_trailing_newline) {
        out += '\n';
    }
    return out;
}

void Document::reindex() {
    TableId current = root_table();
    std::vector<std::pair<std::vector<std::string>, std::size_t>> counters;
    for (auto& entry : m_entries) {
        if (entry.kind == Entry::Kind::Table) {
            current = table(entry.key);
        } else if (entry.kind == Entry::Kind::ArrayTable) {
            auto it = std::find_if(counters.begin(), counters.end(),
                                   [&](const auto& counter) { return counter.first == entry.key; });
            if (it == counters.end()) {
                counters.emplace_back(entry.key, 0);
                it = counters.end() - 1;
            }
            current = array_table(entry.key, it->second++);
        }
        entry.owner = current;
    }
}

std::vector<TableId> Document::tables() const {
    std::vector<TableId> result;
    for (const auto& entry : m_entries) {
        if (is_header(entry)) {
            result.push_back(entry.owner);
        }
    }
    return result;
}

bool Document::has_table(const TableId& id) const {
    return id.path.empty() || header_position(id) != std::string::npos;
}

std::size_t Document::array_size(const std::vector<std::string>& path) const {
    return static_cast<std::size_t>(std::count_if(m_entries.begin(), m_entries.end(), [&](const Entry& entry) {
        return entry.kind == Entry::Kind::ArrayTable && entry.key == path;
    }));
}

const Entry* Document::find(const TableId& id, const std::string& key) const {
    for (const auto& entry : m_entries) {
        if (entry.kind == Entry::Kind::KeyValue && entry.owner == id && entry.key.size() == 1 &&
            entry.key.front() == key) {
            return &entry;
        }
    }
    return nullptr;
}

std::vector<const Entry*> Document::entries_of(const TableId& id) const {
    std::vector<const Entry*> result;
    for (const auto& entry : m_entries) {
        if (entry.kind == Entry::Kind::KeyValue && entry.owner == id) {
            result.push_back(&entry);
        }
    }
    return result;
}

std::size_t Document::header_position(const TableId& id) const {
    for (std::size_t i = 0; i < m_entries.size(); ++i) {
        if (is_header(m_entries[i]) && m_entries[i].owner == id) {
            return i;
        }
    }
    return std::string::npos;
}

std::size_t Document::insertion_point(const TableId& id) const {
    std::size_t start = 0;
    if (!id.path.empty()) {
        start = header_position(id) + 1;
    }
    std::size_t last_key = std::string::npos;
    for (std::size_t i = start; i < m_entries.size() && !is_header(m_entries[i]); ++i) {
        if (m_entries[i].kind == Entry::Kind::KeyValue) {
            last_key = i;
        }
    }
    return last_key == std::string::npos ? start : last_key + 1;
}

std::size_t Document::group_end(const std::vector<std::string>& prefix) const {
    if (prefix.empty()) {
        return m_entries.size();
    }
    std::size_t last = std::string::npos;
    for (std::size_t i = 0; i < m_entries.size(); ++i) {
        const Entry& entry = m_entries[i];
        if (entry.kind != Entry::Kind::Trivia && starts_with(entry.owner.path, prefix)) {
            last = i;
        }
    }
    return last == std::string::npos ? std::string::npos : last + 1;
}

void Document::add_table(const TableId& id) {
    if (has_table(id)) {
        return;
    }

    std::vector<std::string> prefix = id.path;
    if (!id.array) {
        prefix.pop_back();
    }
    // After the closest existing relative, else at the end.
    std::size_t position = group_end(prefix);
    while (position == std::string::npos) {
        prefix.pop_back();
        position = group_end(prefix);
    }

    Entry header;
    header.kind = id.array ? Entry::Kind::ArrayTable : Entry::Kind::Table;
    header.key = id.path;
    std::string path_text;
    for (const auto& part : id.path) {
        if (!path_text.empty()) {
            path_text += '.';
        }
        path_text += format_key(part);
    }
    header.raw = id.array ? "[[" + path_text + "]]" : "[" + path_text + "]";

    if (position > 0 && !is_blank(m_entries[position - 1])) {
        Entry blank;
        m_entries.insert(m_entries.begin() + static_cast<std::ptrdiff_t>(position), blank);
        ++position;
    }
    m_entries.insert(m_entries.begin() + static_cast<std::ptrdiff_t>(position), header);
    reindex();
}

bool Document::set(const TableId& id, const std::string& key, const Value& value) {
    for (auto& entry : m_entries) {
        if (entry.kind != Entry::Kind::KeyValue || entry.owner != id || entry.key.size() != 1 ||
            entry.key.front() != key) {
            continue;
        }
        if (entry.value == value) {
            return false;
        }
        const std::string text = value.to_toml();
        entry.raw.replace(entry.value_begin, entry.value_end - entry.value_begin, text);
        entry.value_end = entry.value_begin + text.size();
        entry.value = value;
        return true;
    }

    if (!has_table(id)) {
        add_table(id);
    }

    const std::size_t position = insertion_point(id);
    std::string indent;
    if (position > 0 && m_entries[position - 1].kind == Entry::Kind::KeyValue) {
        const std::string& previous = m_entries[position - 1].raw;
        indent = previous.substr(0, previous.find_first_not_of(" \t"));
    }

    Entry entry;
    entry.kind = Entry::Kind::KeyValue;
    entry.key = {key};
    entry.value = value;
    const std::string prefix = indent + format_key(key) + " = ";
    entry.raw = prefix + value.to_toml();
    entry.value_begin = prefix.size();
    entry.value_end = entry.raw.size();
    m_entries.insert(m_entries.begin() + static_cast<std::ptrdiff_t>(position), entry);
    reindex();
    return true;
}

bool Document::remove(const TableId& id, const std::string& key) {
    for (auto it = m_entries.begin(); it != m_entries.end(); ++it) {
        if (it->kind == Entry::Kind::KeyValue && it->owner == id && it->key.size() == 1 &&
            it->key.front() == key) {
            m_entries.erase(it);
            reindex();
            return true;
        }
    }
    return false;
}

bool Document::remove_table(const TableId& id) {
    if (id.path.empty()) {
        return false;
    }
    const std::size_t header = header_position(id);
    if (header == std::string::npos) {
        return false;
    }

    std::size_t last_owned = header;
    for (std::size_t i = header + 1; i < m_entries.size() && !is_header(m_entries[i]); ++i) {
        if (m_entries[i].kind != Entry::Kind::Trivia) {
            last_owned = i;
        }
    }

    std::size_t begin = header;
    const std::size_t end = last_owned + 1;
    const bool followed_by_blank = end >= m_entries.size() || is_blank(m_entries[end]);
    if (begin > 0 && is_blank(m_entries[begin - 1]) && followed_by_blank) {
        --begin;
    }
    m_entries.erase(m_entries.begin() + static_cast<std::ptrdiff_t>(begin),
                    m_entries.begin() + static_cast<std::ptrdiff_t>(end));
    reindex();
    return true;
}

}  // namespace mpwrd::toml
