#ifndef CORE_STORE_HPP
#define CORE_STORE_HPP

#include "config_io.hpp"
#include "core/models.hpp"

#include <filesystem>
#include <string>
#include <utility>

namespace mpwrd {

// Typed view of the canonical TOML file. Keys, tables and comments the model
// does not own are carried through every save untouched.
class Store {
public:
    explicit Store(std::filesystem::path path);

    const std::filesystem::path& path() const { return m_path; }

    // Throws NotFoundError when the file is absent, ParseError on malformed
    // TOML or on a model-owned key holding the wrong type.
    ConfigModel load() const;

    // Validates, then rewrites the file atomically under the store lock.
    // Returns false when the file already holds exactly this content.
    bool save(const ConfigModel& model) const;

    // Writes a default model. Throws Error if the file exists and !force.
    void init(bool force) const;

    static ConfigModel decode(const std::string& text);
    static std::string serialize(const ConfigModel& model, const std::string& existing_text = "");

    // Called after the temporary file is complete and before it replaces the store.
    void set_before_rename(ConfigIO::RenameHook hook) { m_before_rename = std::move(hook); }

private:
    std::filesystem::path m_path;
    ConfigIO::RenameHook m_before_rename;
};

}  // namespace mpwrd

#endif
