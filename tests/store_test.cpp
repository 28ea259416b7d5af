#include "config_io.hpp"
#include "core/errors.hpp"
#include "core/store.hpp"
#include "test_support.hpp"

#include <cassert>
#include <cerrno>
#include <fcntl.h>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <sys/file.h>
#include <unistd.h>

using namespace mpwrd;

namespace {
ConfigModel sample_model() {
    ConfigModel model;
    model.networking.hostname = "femtofox";
    model.networking.wifi_enabled = true;
    model.networking.country_code = "DE";
    model.networking.wifi = {{"home", "secret123"}, {"open", ""}};
    model.networking.wifi_interface = "wlan0";
    model.services["foo.service"] = ServiceState{false, true};
    model.services["meshtasticd"] = ServiceState{true, true};
    model.hardware["spi0"] = BusConfig{true, 1000000};
    model.hardware["uart3"] = BusConfig{false, std::nullopt};
    model.hardware["work"] = LedConfig{LedMode::Heartbeat};
    return model;
}

// Tries to take the lock through a separate open file description.
bool can_lock(const std::filesystem::path& lock_file) {
    const int fd = ::open(lock_file.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    assert(fd >= 0);
    const bool locked = ::flock(fd, LOCK_EX | LOCK_NB) == 0;
    if (!locked) {
        assert(errno == EWOULDBLOCK);
    }
    ::close(fd);
    return locked;
}

std::size_t count_temporaries(const std::filesystem::path& directory) {
    std::size_t count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(directory)) {
        if (entry.path().filename().string().rfind(".mpwrd-config.toml.", 0) == 0) {
            ++count;
        }
    }
    return count;
}
}  // namespace

int main() {
    {
        test::TempDir dir;
        Store store(dir / "mpwrd-config.toml");
        const ConfigModel model = sample_model();

        assert(store.save(model));
        assert(store.load() == model);
        assert(!store.save(model));

        const std::string text = dir.read("mpwrd-config.toml");
        assert(text.find("[[networking.wifi]]\nssid = \"home\"\npsk = \"secret123\"\n") != std::string::npos);
        assert(text.find("[[networking.wifi]]\nssid = \"open\"\n\n") != std::string::npos);
        assert(text.find("[services.\"foo.service\"]\nenabled = false\nrunning = true\n") != std::string::npos);
        assert(text.find("[services.meshtasticd]\nenabled = true\n") != std::string::npos);
        assert(text.find("[hardware.uart3]\nenabled = false\n") != std::string::npos);
        assert(text.find("[hardware.work]\nmode = \"heartbeat\"\n") != std::string::npos);

        ConfigModel fewer = model;
        fewer.networking.wifi.pop_back();
        fewer.services.erase("foo.service");
        fewer.hardware.erase("uart3");
        fewer.networking.wifi_interface.reset();
        assert(store.save(fewer));
        assert(store.load() == fewer);
        const std::string trimmed = dir.read("mpwrd-config.toml");
        assert(trimmed.find("\"open\"") == std::string::npos);
        assert(trimmed.find("foo.service") == std::string::npos);
        assert(trimmed.find("uart3") == std::string::npos);
        assert(trimmed.find("wifi_interface") == std::string::npos);
    }

    {
        test::TempDir dir;
        const std::string original =
            "# managed by hand\n"
            "[networking]\n"
            "hostname = \"alpha\"  # device name\n"
            "wifi_enabled = true\n"
            "country_code = \"US\"\n"
            "\n"
            "[experimental]\n"
            "feature = \"on\"  # keep\n";
        dir.write("mpwrd-config.toml", original);
        Store store(dir / "mpwrd-config.toml");

        ConfigModel model = store.load();
        assert(model.networking.hostname == "alpha");
        assert(model.networking.wifi_enabled);
        model.networking.hostname = "beta";
        assert(store.save(model));

        std::string expected = original;
        expected.replace(expected.find("alpha"), 5, "beta");
        assert(dir.read("mpwrd-config.toml") == expected);
    }

    {
        test::TempDir dir;
        dir.write("mpwrd-config.toml", "[networking]\nhostname = \"before\"\n");
        Store store(dir / "mpwrd-config.toml");
        std::string staged;
        bool held_while_writing = false;
        store.set_before_rename([&](const std::filesystem::path& temporary) {
            staged = test::TempDir::slurp(temporary);
            held_while_writing = !can_lock(dir / "mpwrd-config.toml.lock");
            throw std::runtime_error("simulated crash");
        });

        ConfigModel model = store.load();
        model.networking.hostname = "after";
        try {
            store.save(model);
            assert(false);
        } catch (const std::runtime_error& e) {
            assert(std::string(e.what()) == "simulated crash");
        }
        assert(staged.find("hostname = \"after\"") != std::string::npos);
        assert(dir.read("mpwrd-config.toml") == "[networking]\nhostname = \"before\"\n");
        assert(count_temporaries(dir.path()) == 0);
        assert(held_while_writing);
        // The failed save released the lock.
        assert(can_lock(dir / "mpwrd-config.toml.lock"));
    }

    {
        test::TempDir dir;
        const auto target = dir / "mpwrd-config.toml";
        {
            FileLock lock(target);
            assert(!can_lock(dir / "mpwrd-config.toml.lock"));
        }
        assert(can_lock(dir / "mpwrd-config.toml.lock"));
    }

    {
        test::TempDir dir;
        dir.write("mpwrd-config.toml", "[networking]\nhostname = 5\n");
        Store store(dir / "mpwrd-config.toml");
        try {
            store.load();
            assert(false);
        } catch (const ParseError& e) {
            assert(e.line() == 2);
            assert(e.column() == 12);
            assert(e.detail().find("networking.hostname: expected string, found integer") == 0);
        }
    }

    {
        try {
            Store::decode("[hardware.work]\nmode = \"blink\"\n");
            assert(false);
        } catch (const ParseError& e) {
            assert(e.detail().find("unknown LED mode 'blink'") != std::string::npos);
        }
        try {
            Store::decode("[networking]\nwifi = []\n\n[[networking.wifi]]\nssid = \"x\"\n");
            assert(false);
        } catch (const ParseError&) {
        }
        try {
            Store::decode("[services]\nmeshtasticd = { enabled = true }\n\n[services.meshtasticd]\nenabled = false\n");
            assert(false);
        } catch (const ParseError& e) {
            assert(e.line() == 2);
        }
        try {
            Store::decode("networking.hostname = \"node7\"\n");
            assert(false);
        } catch (const ParseError& e) {
            assert(e.line() == 1);
            assert(e.detail().find("networking.hostname: must be written under a [networking] table") == 0);
        }
        try {
            Store::decode("[services]\nmeshtasticd.enabled = true\n");
            assert(false);
        } catch (const ParseError& e) {
            assert(e.line() == 2);
            assert(e.detail().find("services.meshtasticd.enabled") == 0);
        }
        try {
            Store::serialize(ConfigModel{}, "hardware.work.mode = \"disable\"\n");
            assert(false);
        } catch (const ParseError&) {
        }
        // Dotted keys outside the model's sections are kept as written.
        const std::string foreign = "tools.editor = \"vi\"\n";
        assert(Store::decode(foreign) == ConfigModel{});
        const std::string written = Store::serialize(ConfigModel{}, foreign);
        assert(written.rfind(foreign, 0) == 0);
        assert(Store::decode(written) == ConfigModel{});
    }

    {
        const std::string text =
            "[networking]\nhostname = \"node\"\nwifi = [{ ssid = \"a\", psk = \"password1\" }]\n\n"
            "[services]\nmeshtasticd = { enabled = true }  # radio\n\n"
            "[hardware]\ni2c3 = { enabled = true, speed = 400000 }\n";
        ConfigModel model = Store::decode(text);
        assert(model.networking.wifi.size() == 1 && model.networking.wifi[0].psk == "password1");
        assert(model.services.at("meshtasticd").is_running());
        assert(!model.services.at("meshtasticd").running.has_value());
        assert(std::get<BusConfig>(model.hardware.at("i2c3")).speed == 400000);

        model.services["meshtasticd"] = ServiceState{false, false};
        model.hardware["i2c3"] = BusConfig{true, 100000};
        const std::string written = Store::serialize(model, text);
        assert(written.find("meshtasticd = { enabled = false }  # radio\n") != std::string::npos);
        assert(written.find("i2c3 = { enabled = true, speed = 100000 }") != std::string::npos);
        assert(written.find("[services.meshtasticd]") == std::string::npos);
        assert(written.find("wifi = [{ ssid = \"a\", psk = \"password1\" }]") != std::string::npos);
        assert(Store::decode(written) == model);
    }

    {
        test::TempDir dir;
        Store store(dir / "etc" / "mpwrd-config.toml");
        try {
            store.load();
            assert(false);
        } catch (const NotFoundError&) {
        }

        store.init(false);
        assert(store.load() == ConfigModel{});
        assert(dir.read("etc/mpwrd-config.toml").rfind("# Canonical device configuration", 0) == 0);
        try {
            store.init(false);
            assert(false);
        } catch (const Error& e) {
            assert(std::string(e.what()).find("already exists") != std::string::npos);
        }

        ConfigModel model;
        model.networking.hostname = "custom";
        store.save(model);
        store.init(true);
        assert(store.load().networking.hostname == "mpwrd");
    }

    {
        test::TempDir dir;
        Store store(dir / "mpwrd-config.toml");
        ConfigModel model;
        model.networking.hostname = "not a hostname";
        try {
            store.save(model);
            assert(false);
        } catch (const ValidationError& e) {
            assert(e.violations().size() == 1);
        }
        assert(!dir.exists("mpwrd-config.toml"));
    }

    return 0;
}
