#include "features/config_service.hpp"

#include "config_io.hpp"
#include "core/errors.hpp"

#include <glib.h>
#include <memory>
#include <utility>

namespace mpwrd {

ConfigService::ConfigService(Settings settings, CommandRunner& runner)
    : m_settings(std::move(settings)),
      m_store(m_settings.config_path),
      m_reconciler(make_adapters(SystemPaths(m_settings.sysroot), runner)) {}

ConfigModel ConfigService::load_model() const {
    return m_store.load();
}

void ConfigService::validate_model(const ConfigModel& model) const {
    validate(model);
}

ReconcileReport ConfigService::reconcile(const ConfigModel& desired, const ReconcileOptions& options) const {
    // One run at a time per store file. A dry run touches nothing.
    std::unique_ptr<FileLock> lock;
    if (!options.dry_run) {
        lock = std::make_unique<FileLock>(m_store.path());
    }
    return m_reconciler.run(desired, options);
}

ConfigModel ConfigService::current_state(std::vector<std::string>* read_errors) const {
    ConfigModel scope;
    try {
        scope = m_store.load();
    } catch (const NotFoundError&) {
        g_debug("%s not found, reading the default scope", m_store.path().c_str());
    }
    return m_reconciler.current_state(scope, read_errors);
}

bool ConfigService::save_model(const ConfigModel& model) const {
    return m_store.save(model);
}

void ConfigService::init(bool force) const {
    m_store.init(force);
}

}  // namespace mpwrd
