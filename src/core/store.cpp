#include "core/store.hpp"

#include "core/errors.hpp"
#include "core/toml_document.hpp"

#include <algorithm>
#include <glib.h>
#include <map>
#include <set>

namespace mpwrd {

namespace {
using toml::Document;
using toml::Entry;
using toml::TableId;
using toml::Value;

constexpr const char* kFileHeader = "# Canonical device configuration, managed by mpwrd-config.\n";

struct Field {
    const Value* value = nullptr;
    std::size_t line = 0;
    std::size_t column = 0;
};

using Fields = std::map<std::string, Field>;

std::string dotted(const std::vector<std::string>& path) {
    std::string text;
    for (const auto& part : path) {
        if (!text.empty()) {
            text += '.';
        }
        text += part;
    }
    return text;
}

bool is_owned_section(const std::string& name) {
    return name == "networking" || name == "services" || name == "hardware";
}

// Model-owned keys are read and written one table level at a time, so they
// may not be spelled as dotted keys. Unowned sections are left alone.
void check_owned_layout(const Document& doc) {
    for (const Entry* entry : doc.entries_of(toml::root_table())) {
        const std::string& head = entry->key.front();
        if (is_owned_section(head)) {
            throw ParseError(dotted(entry->key) + ": must be written under a [" + head + "] table", entry->line,
                             entry->column);
        }
    }
    for (const TableId& id : doc.tables()) {
        if (!is_owned_section(id.path.front())) {
            continue;
        }
        for (const Entry* entry : doc.entries_of(id)) {
            if (entry->key.size() > 1) {
                std::vector<std::string> path = id.path;
                path.insert(path.end(), entry->key.begin(), entry->key.end());
                throw ParseError(dotted(path) + ": dotted keys are not supported here", entry->line,
                                 entry->column);
            }
        }
    }
}

Fields fields_of_table(const Document& doc, const TableId& id) {
    Fields fields;
    for (const Entry* entry : doc.entries_of(id)) {
        fields[entry->key.front()] = Field{&entry->value, entry->line, entry->column};
    }
    return fields;
}

Fields fields_of_inline(const Value& value, std::size_t line, std::size_t column) {
    Fields fields;
    for (const auto& member : value.members) {
        fields[member.first] = Field{&member.second, line, column};
    }
    return fields;
}

[[noreturn]] void wrong_type(const std::string& field, const Field& found, Value::Type expected) {
    throw ParseError(field + ": expected " + toml::type_name(expected) + ", found " +
                         toml::type_name(found.value->type),
                     found.line, found.column);
}

const Field* lookup(const Fields& fields, const std::string& key) {
    auto it = fields.find(key);
    return it == fields.end() ? nullptr : &it->second;
}

std::optional<std::string> get_string(const Fields& fields, const std::string& prefix, const std::string& key) {
    const Field* field = lookup(fields, key);
    if (!field) {
        return std::nullopt;
    }
    if (!field->value->is_string()) {
        wrong_type(prefix + "." + key, *field, Value::Type::String);
    }
    return field->value->text;
}

std::optional<bool> get_bool(const Fields& fields, const std::string& prefix, const std::string& key) {
    const Field* field = lookup(fields, key);
    if (!field) {
        return std::nullopt;
    }
    if (!field->value->is_boolean()) {
        wrong_type(prefix + "." + key, *field, Value::Type::Boolean);
    }
    return field->value->boolean;
}

std::optional<long long> get_integer(const Fields& fields, const std::string& prefix, const std::string& key) {
    const Field* field = lookup(fields, key);
    if (!field) {
        return std::nullopt;
    }
    if (!field->value->is_integer()) {
        wrong_type(prefix + "." + key, *field, Value::Type::Integer);
    }
    return field->value->integer;
}

WifiNetwork decode_wifi(const Fields& fields, const std::string& prefix) {
    WifiNetwork network;
    network.ssid = get_string(fields, prefix, "ssid").value_or("");
    network.psk = get_string(fields, prefix, "psk").value_or("");
    return network;
}

void decode_networking(const Document& doc, NetworkingConfig& networking) {
    const TableId id = toml::table({"networking"});
    const Fields fields = fields_of_table(doc, id);
    const std::string prefix = "networking";

    networking.hostname = get_string(fields, prefix, "hostname").value_or(kDefaultHostname);
    networking.wifi_enabled = get_bool(fields, prefix, "wifi_enabled").value_or(false);
    networking.country_code = get_string(fields, prefix, "country_code").value_or(kDefaultCountryCode);
    networking.wifi_interface = get_string(fields, prefix, "wifi_interface");
    networking.ethernet_interface = get_string(fields, prefix, "ethernet_interface");

    const std::vector<std::string> wifi_path{"networking", "wifi"};
    const std::size_t tables = doc.array_size(wifi_path);

    if (const Field* inline_wifi = lookup(fields, "wifi")) {
        if (!inline_wifi->value->is_array()) {
            wrong_type("networking.wifi", *inline_wifi, Value::Type::Array);
        }
        const auto& items = inline_wifi->value->items;
        for (std::size_t i = 0; i < items.size(); ++i) {
            const std::string item_prefix = "networking.wifi[" + std::to_string(i) + "]";
            if (!items[i].is_table()) {
                wrong_type(item_prefix, Field{&items[i], inline_wifi->line, inline_wifi->column},
                           Value::Type::Table);
            }
            networking.wifi.push_back(
                decode_wifi(fields_of_inline(items[i], inline_wifi->line, inline_wifi->column), item_prefix));
        }
        return;
    }

    for (std::size_t i = 0; i < tables; ++i) {
        networking.wifi.push_back(decode_wifi(fields_of_table(doc, toml::array_table(wifi_path, i)),
                                              "networking.wifi[" + std::to_string(i) + "]"));
    }
}

// Sub-tables [<section>.<name>] and inline `<name> = { ... }` entries of [<section>].
std::vector<std::pair<std::string, Fields>> keyed_entries(const Document& doc, const std::string& section) {
    std::vector<std::pair<std::string, Fields>> result;

    for (const Entry* entry : doc.entries_of(toml::table({section}))) {
        const std::string& name = entry->key.front();
        Field field{&entry->value, entry->line, entry->column};
        if (!entry->value.is_table()) {
            wrong_type(section + "." + name, field, Value::Type::Table);
        }
        result.emplace_back(name, fields_of_inline(entry->value, entry->line, entry->column));
    }

    for (const TableId& id : doc.tables()) {
        if (id.array || id.path.size() != 2 || id.path.front() != section) {
            continue;
        }
        // The parser rejects a name defined both inline and as a table.
        result.emplace_back(id.path[1], fields_of_table(doc, id));
    }
    return result;
}

PeripheralConfig decode_peripheral(const std::string& name, const Fields& fields) {
    const std::string prefix = "hardware." + name;
    if (const Field* mode_field = lookup(fields, "mode")) {
        const std::string text = *get_string(fields, prefix, "mode");
        auto mode = parse_led_mode(text);
        if (!mode) {
            throw ParseError(prefix + ".mode: unknown LED mode '" + text + "'", mode_field->line,
                             mode_field->column);
        }
        return LedConfig{*mode};
    }
    if (lookup(fields, "enabled") || lookup(fields, "speed") || is_bus_peripheral(name)) {
        BusConfig bus;
        bus.enabled = get_bool(fields, prefix, "enabled").value_or(false);
        bus.speed = get_integer(fields, prefix, "speed");
        return bus;
    }
    return LedConfig{};
}

bool has_section(const Document& doc, const std::string& section) {
    for (const TableId& id : doc.tables()) {
        if (!id.array && id.path.front() == section) {
            return true;
        }
    }
    return false;
}

void upsert(std::vector<std::pair<std::string, Value>>& members, const std::string& key, Value value) {
    for (auto& member : members) {
        if (member.first == key) {
            member.second = std::move(value);
            return;
        }
    }
    members.emplace_back(key, std::move(value));
}

void erase(std::vector<std::pair<std::string, Value>>& members, const std::string& key) {
    members.erase(std::remove_if(members.begin(), members.end(),
                                 [&](const auto& member) { return member.first == key; }),
                  members.end());
}

void set_optional(Document& doc, const TableId& id, const std::string& key,
                  const std::optional<std::string>& value) {
    if (value) {
        doc.set(id, key, Value::string(*value));
    } else {
        doc.remove(id, key);
    }
}

void write_networking(Document& doc, const NetworkingConfig& networking) {
    const TableId id = toml::table({"networking"});
    doc.set(id, "hostname", Value::string(networking.hostname));
    doc.set(id, "wifi_enabled", Value::boolean_value(networking.wifi_enabled));
    doc.set(id, "country_code", Value::string(networking.country_code));
    set_optional(doc, id, "wifi_interface", networking.wifi_interface);
    set_optional(doc, id, "ethernet_interface", networking.ethernet_interface);

    if (doc.find(id, "wifi")) {
        std::vector<Value> items;
        for (const auto& network : networking.wifi) {
            items.push_back(Value::table({{"ssid", Value::string(network.ssid)},
                                          {"psk", Value::string(network.psk)}}));
        }
        doc.set(id, "wifi", Value::array(std::move(items)));
        return;
    }

    const std::vector<std::string> path{"networking", "wifi"};
    const std::size_t existing = doc.array_size(path);
    for (std::size_t i = 0; i < networking.wifi.size(); ++i) {
        const TableId entry = toml::array_table(path, i);
        const WifiNetwork& network = networking.wifi[i];
        doc.set(entry, "ssid", Value::string(network.ssid));
        if (!network.psk.empty() || doc.find(entry, "psk")) {
            doc.set(entry, "psk", Value::string(network.psk));
        }
    }
    // From the back, so the indices of the earlier instances stay valid.
    for (std::size_t i = existing; i-- > networking.wifi.size();) {
        doc.remove_table(toml::array_table(path, i));
    }
}

// Inline names of [<section>] and names of [<section>.<name>] tables.
void existing_names(const Document& doc, const std::string& section, std::set<std::string>& inline_names,
                    std::set<std::string>& table_names) {
    for (const Entry* entry : doc.entries_of(toml::table({section}))) {
        if (entry->key.size() == 1 && entry->value.is_table()) {
            inline_names.insert(entry->key.front());
        }
    }
    for (const TableId& id : doc.tables()) {
        if (!id.array && id.path.size() == 2 && id.path.front() == section) {
            table_names.insert(id.path[1]);
        }
    }
}

template <typename Map>
void drop_stale(Document& doc, const std::string& section, const Map& entries,
                const std::set<std::string>& inline_names, const std::set<std::string>& table_names) {
    for (const auto& name : inline_names) {
        if (entries.count(name) == 0) {
            doc.remove(toml::table({section}), name);
        }
    }
    for (const auto& name : table_names) {
        if (entries.count(name) == 0) {
            doc.remove_table(toml::table({section, name}));
        }
    }
}

void write_services(Document& doc, const ServicesConfig& services) {
    std::set<std::string> inline_names;
    std::set<std::string> table_names;
    existing_names(doc, "services", inline_names, table_names);
    drop_stale(doc, "services", services, inline_names, table_names);

    const TableId parent = toml::table({"services"});
    if (!services.empty() && !has_section(doc, "services")) {
        doc.add_table(parent);
    }

    for (const auto& [name, state] : services) {
        if (inline_names.count(name) > 0) {
            const Entry* entry = doc.find(parent, name);
            auto members = entry->value.members;
            upsert(members, "enabled", Value::boolean_value(state.enabled));
            if (entry->value.member("running") || state.is_running() != state.enabled) {
                upsert(members, "running", Value::boolean_value(state.is_running()));
            }
            doc.set(parent, name, Value::table(std::move(members)));
            continue;
        }
        const TableId id = toml::table({"services", name});
        doc.set(id, "enabled", Value::boolean_value(state.enabled));
        if (state.is_running() != state.enabled || doc.find(id, "running")) {
            doc.set(id, "running", Value::boolean_value(state.is_running()));
        }
    }
}

void write_hardware(Document& doc, const HardwareConfig& hardware) {
    std::set<std::string> inline_names;
    std::set<std::string> table_names;
    existing_names(doc, "hardware", inline_names, table_names);
    drop_stale(doc, "hardware", hardware, inline_names, table_names);

    const TableId parent = toml::table({"hardware"});
    if (!hardware.empty() && !has_section(doc, "hardware")) {
        doc.add_table(parent);
    }

    for (const auto& [name, peripheral] : hardware) {
        const auto* led = std::get_if<LedConfig>(&peripheral);
        const auto* bus = std::get_if<BusConfig>(&peripheral);

        if (inline_names.count(name) > 0) {
            auto members = doc.find(parent, name)->value.members;
            if (led) {
                erase(members, "enabled");
                erase(members, "speed");
                upsert(members, "mode", Value::string(to_string(led->mode)));
            } else {
                erase(members, "mode");
                upsert(members, "enabled", Value::boolean_value(bus->enabled));
                if (bus->speed) {
                    upsert(members, "speed", Value::integer_value(*bus->speed));
                } else {
                    erase(members, "speed");
                }
            }
            doc.set(parent, name, Value::table(std::move(members)));
            continue;
        }

        const TableId id = toml::table({"hardware", name});
        if (led) {
            doc.remove(id, "enabled");
            doc.remove(id, "speed");
            doc.set(id, "mode", Value::string(to_string(led->mode)));
        } else {
            doc.remove(id, "mode");
            doc.set(id, "enabled", Value::boolean_value(bus->enabled));
            if (bus->speed) {
                doc.set(id, "speed", Value::integer_value(*bus->speed));
            } else {
                doc.remove(id, "speed");
            }
        }
    }
}
}  // namespace

Store::Store(std::filesystem::path path) : m_path(std::move(path)) {}

ConfigModel Store::decode(const std::string& text) {
    const Document doc = Document::parse(text);
    check_owned_layout(doc);

    ConfigModel model;
    decode_networking(doc, model.networking);

    for (const auto& [name, fields] : keyed_entries(doc, "services")) {
        const std::string prefix = "services." + name;
        ServiceState state;
        state.enabled = get_bool(fields, prefix, "enabled").value_or(false);
        state.running = get_bool(fields, prefix, "running");
        model.services[name] = state;
    }

    for (const auto& [name, fields] : keyed_entries(doc, "hardware")) {
        model.hardware[name] = decode_peripheral(name, fields);
    }
    return model;
}

std::string Store::serialize(const ConfigModel& model, const std::string& existing_text) {
    Document doc = Document::parse(existing_text);
    check_owned_layout(doc);
    write_networking(doc, model.networking);
    write_services(doc, model.services);
    write_hardware(doc, model.hardware);
    return doc.str();
}

ConfigModel Store::load() const {
    const auto text = ConfigIO::read_text(m_path);
    if (!text) {
        throw NotFoundError("configuration file not found: " + m_path.string());
    }
    return decode(*text);
}

bool Store::save(const ConfigModel& model) const {
    validate(model);

    FileLock lock(m_path);
    const auto existing = ConfigIO::read_text(m_path);
    const std::string text = serialize(model, existing.value_or(""));
    if (existing && *existing == text) {
        g_debug("%s is already up to date", m_path.c_str());
        return false;
    }

    ConfigIO::write_atomic(m_path, text, m_before_rename);
    g_message("Saved configuration to %s", m_path.c_str());
    return true;
}

void Store::init(bool force) const {
    FileLock lock(m_path);
    if (ConfigIO::read_text(m_path) && !force) {
        throw Error(m_path.string() + " already exists");
    }
    ConfigIO::write_atomic(m_path, serialize(ConfigModel{}, kFileHeader), m_before_rename);
    g_message("Initialized %s with defaults", m_path.c_str());
}

}  // namespace mpwrd
