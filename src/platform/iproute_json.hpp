#ifndef IPROUTE_JSON_HPP
#define IPROUTE_JSON_HPP

#include <string>
#include <vector>

namespace mpwrd {

struct LinkInfo {
    std::string name;
    std::vector<std::string> flags;
    std::string operstate;

    bool administratively_up() const;
};

// Parses the output of `ip -j link show [dev <iface>]`. Throws ReadError on
// malformed JSON.
std::vector<LinkInfo> parse_links(const std::string& json_output);

}  // namespace mpwrd

#endif
