#ifndef CONFIG_SERVICE_HPP
#define CONFIG_SERVICE_HPP

#include "core/models.hpp"
#include "core/settings.hpp"
#include "core/store.hpp"
#include "features/reconciler.hpp"
#include "platform/command_runner.hpp"

#include <string>
#include <vector>

namespace mpwrd {

// The entry points shared by the command line, the TUI and the systemd
// consumers. Nothing else talks to the Store or the Reconciler directly.
class ConfigService {
public:
    ConfigService(Settings settings, CommandRunner& runner);

    ConfigModel load_model() const;
    void validate_model(const ConfigModel& model) const;
    ReconcileReport reconcile(const ConfigModel& desired, const ReconcileOptions& options = {}) const;
    ConfigModel current_state(std::vector<std::string>* read_errors = nullptr) const;

    bool save_model(const ConfigModel& model) const;
    void init(bool force) const;

    const Settings& settings() const { return m_settings; }
    const Store& store() const { return m_store; }
    Store& store() { return m_store; }

private:
    Settings m_settings;
    Store m_store;
    Reconciler m_reconciler;
};

}  // namespace mpwrd

#endif
