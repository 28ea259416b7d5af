#include "core/errors.hpp"
#include "core/models.hpp"

#include <cassert>
#include <string>

using namespace mpwrd;

namespace {
bool contains(const std::vector<std::string>& violations, const std::string& needle) {
    for (const auto& violation : violations) {
        if (violation.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}
}  // namespace

int main() {
    {
        ConfigModel model;
        assert(model.networking.hostname == "mpwrd");
        assert(model.networking.country_code == "US");
        assert(!model.networking.wifi_enabled);
        assert(model.networking.wifi.empty());
        assert(collect_violations(model).empty());
        validate(model);
    }

    {
        ConfigModel model;
        model.networking.hostname = "bad_host!";
        model.networking.country_code = "usa";
        try {
            validate(model);
            assert(false);
        } catch (const ValidationError& e) {
            assert(e.violations().size() == 2);
            assert(contains(e.violations(), "networking.hostname"));
            assert(contains(e.violations(), "networking.country_code"));
            assert(std::string(e.what()).find("invalid configuration") == 0);
        }
    }

    {
        ConfigModel model;
        model.networking.wifi = {{"home", "password1"}, {"home", ""}, {"home", "password3"}, {"", "password4"}};
        auto violations = collect_violations(model);
        assert(violations.size() == 2);
        assert(contains(violations, "duplicate ssid 'home'"));
        assert(contains(violations, "networking.wifi[3]"));
    }

    {
        ConfigModel model;
        model.networking.wifi = {{"home", "pa\"ss word"},
                                 {"hashed", std::string(64, 'f')},
                                 {"open", ""},
                                 {"short", "seven77"},
                                 {"split", "pa\"ss\nword"},
                                 {"nothex", std::string(63, 'f') + "g"},
                                 {"line\nbreak", ""},
                                 {std::string(33, 's'), ""}};
        auto violations = collect_violations(model);
        assert(violations.size() == 5);
        assert(contains(violations, "networking.wifi[3].psk"));
        assert(contains(violations, "networking.wifi[4].psk"));
        assert(contains(violations, "networking.wifi[5].psk"));
        assert(contains(violations, "networking.wifi[6].ssid: contains control characters"));
        assert(contains(violations, "networking.wifi[7].ssid: longer than 32 bytes"));
        // The passphrase itself is never echoed.
        assert(!contains(violations, "seven77"));
    }

    {
        assert(is_valid_hostname("femtofox-01"));
        assert(!is_valid_hostname("-leading"));
        assert(!is_valid_hostname("trailing-"));
        assert(!is_valid_hostname(""));
        assert(!is_valid_hostname(std::string(64, 'a')));
        assert(is_valid_hostname(std::string(63, 'a')));
        assert(!is_valid_country_code("U"));
        assert(!is_valid_country_code("us"));
        assert(is_valid_service_name("serial-getty@ttyS0.service"));
        assert(!is_valid_service_name("bad unit"));
    }

    {
        ConfigModel model;
        model.networking.wifi_interface = "";
        model.networking.ethernet_interface = "eth 0";
        model.services["ok.service"] = ServiceState{true, true};
        model.services["no/slash"] = ServiceState{};
        auto violations = collect_violations(model);
        assert(violations.size() == 3);
        assert(contains(violations, "networking.wifi_interface"));
        assert(contains(violations, "networking.ethernet_interface"));
        assert(contains(violations, "'no/slash'"));
    }

    {
        ConfigModel model;
        model.hardware["spi0"] = BusConfig{true, 1000000};
        model.hardware["i2c3"] = BusConfig{true, std::nullopt};
        model.hardware["work"] = LedConfig{LedMode::Heartbeat};
        assert(collect_violations(model).empty());

        model.hardware["uart3"] = BusConfig{true, 115200};
        model.hardware["spi0"] = BusConfig{true, 0};
        model.hardware["can0"] = BusConfig{true, std::nullopt};
        model.hardware["uart4"] = LedConfig{LedMode::Enable};
        model.hardware["bad/led"] = LedConfig{LedMode::Disable};
        model.hardware[".."] = LedConfig{LedMode::Disable};
        model.hardware["."] = LedConfig{LedMode::Disable};
        model.hardware[".hidden"] = LedConfig{LedMode::Disable};
        auto violations = collect_violations(model);
        assert(violations.size() == 7);
        assert(contains(violations, "'..' is not a valid LED name"));
        assert(contains(violations, "'.' is not a valid LED name"));
        assert(contains(violations, "hardware.uart3.speed"));
        assert(contains(violations, "hardware.spi0.speed"));
        assert(contains(violations, "hardware.can0: unknown bus"));
        assert(contains(violations, "hardware.uart4: bus configured with an LED mode"));
        assert(contains(violations, "'bad/led'"));
    }

    {
        assert(find_bus("spi0") && std::string(find_bus("spi0")->speed_key) == "SPI0_M0_SPEED");
        assert(find_bus("uart4") && find_bus("uart4")->speed_key == nullptr);
        assert(!find_bus("work"));
        assert(known_buses().size() == 4);
    }

    {
        assert(parse_led_mode("heartbeat") == LedMode::Heartbeat);
        assert(!parse_led_mode("blink"));
        assert(to_string(LedMode::Disable) == "disable");
        assert(describe(PeripheralConfig{BusConfig{true, 400000}}) == "enabled, speed 400000");
        assert(describe(PeripheralConfig{LedConfig{LedMode::Enable}}) == "mode enable");
        assert(describe(ServiceState{true, false}) == "enabled, stopped");
    }

    {
        ConfigModel a;
        ConfigModel b;
        assert(a == b);
        b.hardware["work"] = LedConfig{};
        assert(a != b);
        a.hardware["work"] = LedConfig{LedMode::Enable};
        assert(a == b);
        b.networking.wifi_interface = "wlan0";
        assert(a != b);
    }

    return 0;
}
