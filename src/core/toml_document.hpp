#ifndef CORE_TOML_DOCUMENT_HPP
#define CORE_TOML_DOCUMENT_HPP

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace mpwrd::toml {

struct Value {
    enum class Type {
        String,
        Integer,
        Float,
        Boolean,
        Datetime,
        Array,
        Table
    };

    Type type = Type::String;
    std::string text;  // string payload, or the source text of floats and datetimes
    long long integer = 0;
    double floating = 0.0;
    bool boolean = false;
    std::vector<Value> items;
    std::vector<std::pair<std::string, Value>> members;

    static Value string(std::string value);
    static Value integer_value(long long value);
    static Value boolean_value(bool value);
    static Value array(std::vector<Value> items);
    static Value table(std::vector<std::pair<std::string, Value>> members);

    bool is_string() const { return type == Type::String; }
    bool is_integer() const { return type == Type::Integer; }
    bool is_boolean() const { return type == Type::Boolean; }
    bool is_array() const { return type == Type::Array; }
    bool is_table() const { return type == Type::Table; }

    const Value* member(const std::string& key) const;

    std::string to_toml() const;

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }
};

std::string type_name(Value::Type type);
std::string format_key(const std::string& key);

// One [table] or [[array.table]] instance. The root table has an empty path.
struct TableId {
    std::vector<std::string> path;
    bool array = false;
    std::size_t index = 0;

    bool operator==(const TableId& other) const {
        return path == other.path && array == other.array && index == other.index;
    }
    bool operator!=(const TableId& other) const { return !(*this == other); }
};

TableId root_table();
TableId table(std::vector<std::string> path);
TableId array_table(std::vector<std::string> path, std::size_t index);

struct Entry {
    enum class Kind {
        Trivia,
        Table,
        ArrayTable,
        KeyValue
    };

    Kind kind = Kind::Trivia;
    std::string raw;  // source text without the final newline, may span lines
    std::vector<std::string> key;  // header path, or the dotted key of a key/value
    Value value;
    std::size_t value_begin = 0;
    std::size_t value_end = 0;
    std::size_t line = 0;
    std::size_t column = 0;  // column of the value for key/values
    TableId owner;
};

// Comment- and layout-preserving TOML document. Edits touch only the value span
// of the affected line; every other byte of the source is written back as read.
class Document {
public:
    static Document parse(const std::string& text);

    std::string str() const;
    bool empty() const { return m_entries.empty(); }

    std::vector<TableId> tables() const;
    bool has_table(const TableId& id) const;
    std::size_t array_size(const std::vector<std::string>& path) const;

    const Entry* find(const TableId& id, const std::string& key) const;
    std::vector<const Entry*> entries_of(const TableId& id) const;

    // Returns true when the document changed.
    bool set(const TableId& id, const std::string& key, const Value& value);
    bool remove(const TableId& id, const std::string& key);
    bool remove_table(const TableId& id);
    void add_table(const TableId& id);

private:
    void reindex();
    std::size_t header_position(const TableId& id) const;
    std::size_t insertion_point(const TableId& id) const;
    std::size_t group_end(const std::vector<std::string>& prefix) const;

    std::vector<Entry> m_entries;
    bool m_trailing_newline = true;
};

}  // namespace mpwrd::toml

#endif
