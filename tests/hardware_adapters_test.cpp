#include "platform/hardware_adapters.hpp"
#include "test_support.hpp"

#include <cassert>
#include <string>

using namespace mpwrd;

int main() {
    {
        assert(LedAdapter::active_trigger("none rc-feedback [activity] heartbeat\n") == "activity");
        assert(LedAdapter::active_trigger("heartbeat\n") == "heartbeat");
        assert(LedAdapter::active_trigger("none timer").empty());
        assert(LedAdapter::mode_for_trigger("none") == LedMode::Disable);
        assert(!LedAdapter::mode_for_trigger("timer"));
        assert(LedAdapter::trigger_for_mode(LedMode::Enable) == "activity");
    }

    {
        test::TempDir root;
        root.write("sys/class/leds/work/trigger", "none rc-feedback [activity] heartbeat\n");
        root.write("sys/class/leds/user/trigger", "[timer] none activity\n");
        LedAdapter adapter(SystemPaths(root.path()));

        ConfigModel desired;
        desired.hardware["work"] = LedConfig{LedMode::Heartbeat};
        desired.hardware["user"] = LedConfig{LedMode::Disable};
        desired.hardware["ghost"] = LedConfig{LedMode::Disable};
        desired.hardware["spi0"] = BusConfig{true, std::nullopt};

        const ConfigModel current = adapter.read(desired);
        assert(current.hardware.size() == 2);
        assert(std::get<LedConfig>(current.hardware.at("work")).mode == LedMode::Enable);
        assert(current.hardware.count("user") == 0);
        assert(std::get<LedConfig>(current.hardware.at("ghost")).mode == LedMode::Enable);

        const auto diffs = adapter.diff(desired, current);
        assert(diffs.size() == 3);
        assert(diffs[0].field == "hardware.ghost");
        assert(diffs[1].field == "hardware.user" && diffs[1].current == "unmanaged trigger");
        assert(diffs[2].field == "hardware.work" && diffs[2].current == "mode enable" &&
               diffs[2].desired == "mode heartbeat");

        const ApplyResult result = adapter.apply(desired, current);
        assert(result.failures.size() == 1);
        assert(result.failures[0].field == "hardware.ghost");
        assert(result.failures[0].cause.find("LED 'ghost' not found") == 0);
        assert(result.changes.size() == 2);
        assert(root.read("sys/class/leds/user/trigger") == "none");
        assert(root.read("sys/class/leds/work/trigger") == "heartbeat");

        ConfigModel reachable = desired;
        reachable.hardware.erase("ghost");
        assert(adapter.diff(reachable, adapter.read(reachable)).empty());
    }

    {
        const auto values = BusAdapter::parse_kv("# c\n  SPI0_M0_STATUS = \"1\"\nBROKEN\nI2C3_M1_SPEED='400000'\n");
        assert(values.size() == 2);
        assert(values.at("SPI0_M0_STATUS") == "1");
        assert(values.at("I2C3_M1_SPEED") == "400000");

        assert(BusAdapter::update_kv("  SPI0_M0_STATUS = 0\n# tail\n", {{"SPI0_M0_STATUS", "1"}, {"NEW_KEY", "x"}}) ==
               "  SPI0_M0_STATUS=1\n# tail\nNEW_KEY=x\n");
    }

    {
        test::TempDir root;
        root.write("etc/luckfox.cfg", "# board\nSPI0_M0_STATUS=0\nI2C3_M1_STATUS=1\nI2C3_M1_SPEED=100000\n");
        BusAdapter adapter(SystemPaths(root.path()));

        ConfigModel desired;
        desired.hardware["spi0"] = BusConfig{true, 1000000};
        desired.hardware["i2c3"] = BusConfig{true, std::nullopt};
        desired.hardware["work"] = LedConfig{LedMode::Enable};

        const ConfigModel current = adapter.read(desired);
        assert(current.hardware.size() == 2);
        assert(std::get<BusConfig>(current.hardware.at("spi0")) == (BusConfig{false, std::nullopt}));
        assert(std::get<BusConfig>(current.hardware.at("i2c3")) == (BusConfig{true, 100000}));

        // i2c3 without a speed keeps the board's 100 kHz.
        const auto diffs = adapter.diff(desired, current);
        assert(diffs.size() == 1);
        assert(diffs[0].field == "hardware.spi0");
        assert(diffs[0].current == "disabled" && diffs[0].desired == "enabled, speed 1000000");

        const ApplyResult result = adapter.apply(desired, current);
        assert(result.failures.empty());
        assert(result.changes.size() == 1);
        assert(result.changes[0].description == "spi0 enabled, speed 1000000 (effective after reboot)");
        assert(root.read("etc/luckfox.cfg") ==
               "# board\nSPI0_M0_STATUS=1\nI2C3_M1_STATUS=1\nI2C3_M1_SPEED=100000\nSPI0_M0_SPEED=1000000\n");

        assert(adapter.diff(desired, adapter.read(desired)).empty());
    }

    {
        test::TempDir root;
        BusAdapter adapter(SystemPaths(root.path()));
        ConfigModel desired;
        desired.hardware["uart3"] = BusConfig{true, std::nullopt};
        const ApplyResult result = adapter.apply(desired, adapter.read(desired));
        assert(result.changes.size() == 1);
        assert(root.read("etc/luckfox.cfg") == "UART3_M1_STATUS=1\n");
    }

    return 0;
}
