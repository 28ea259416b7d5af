#include "platform/iproute_json.hpp"

#include "core/errors.hpp"

#include <algorithm>
#include <json-glib/json-glib.h>

namespace mpwrd {

namespace {
std::string json_string_member_if_string(JsonObject* obj, const char* member) {
    if (!json_object_has_member(obj, member)) {
        return "";
    }

    JsonNode* node = json_object_get_member(obj, member);
    if (!node || !JSON_NODE_HOLDS_VALUE(node)) {
        return "";
    }

    if (json_node_get_value_type(node) != G_TYPE_STRING) {
        return "";
    }

    return json_object_get_string_member(obj, member);
}

std::vector<std::string> json_string_array_member(JsonObject* obj, const char* member) {
    std::vector<std::string> values;
    if (!json_object_has_member(obj, member)) {
        return values;
    }

    JsonNode* node = json_object_get_member(obj, member);
    if (!node || !JSON_NODE_HOLDS_ARRAY(node)) {
        return values;
    }

    JsonArray* array = json_node_get_array(node);
    guint length = json_array_get_length(array);
    for (guint i = 0; i < length; ++i) {
        JsonNode* element = json_array_get_element(array, i);
        if (element && JSON_NODE_HOLDS_VALUE(element) && json_node_get_value_type(element) == G_TYPE_STRING) {
            values.emplace_back(json_node_get_string(element));
        }
    }
    return values;
}
}  // namespace

bool LinkInfo::administratively_up() const {
    return std::find(flags.begin(), flags.end(), "UP") != flags.end();
}

std::vector<LinkInfo> parse_links(const std::string& json_output) {
    std::vector<LinkInfo> links;

    GError* error = nullptr;
    JsonParser* parser = json_parser_new();
    bool parsed = json_parser_load_from_data(parser, json_output.c_str(), -1, &error);
    if (!parsed) {
        std::string message = error ? error->message : "unknown error";
        if (error) {
            g_error_free(error);
        }
        g_object_unref(parser);
        throw ReadError("cannot parse ip link output: " + message);
    }

    JsonNode* root = json_parser_get_root(parser);
    if (!root || !JSON_NODE_HOLDS_ARRAY(root)) {
        g_object_unref(parser);
        throw ReadError("cannot parse ip link output: expected a JSON array");
    }

    JsonArray* array = json_node_get_array(root);
    guint length = json_array_get_length(array);

    for (guint i = 0; i < length; ++i) {
        JsonNode* element = json_array_get_element(array, i);
        if (!element || !JSON_NODE_HOLDS_OBJECT(element)) {
            continue;
        }
        JsonObject* obj = json_node_get_object(element);

        LinkInfo link;
        link.name = json_string_member_if_string(obj, "ifname");
        if (link.name.empty()) {
            continue;
        }
        link.flags = json_string_array_member(obj, "flags");
        link.operstate = json_string_member_if_string(obj, "operstate");
        links.push_back(std::move(link));
    }

    g_object_unref(parser);
    return links;
}

}  // namespace mpwrd
