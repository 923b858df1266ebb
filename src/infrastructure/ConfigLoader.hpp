/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving engine configuration (settings.json).
 *
 * Every threshold and sampling limit of the engine has a default in
 * domain::EngineConfig; settings.json only needs to list overrides.
 */

#pragma once

#include <string>

#include "domain/EngineConfig.hpp"

namespace notedrift::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json at path.
     *
     * A missing file yields defaults. Unparseable JSON is logged and yields
     * defaults. Individual out-of-range values are logged and keep their default.
     */
    static domain::EngineConfig Load(const std::string& path);

    /** @brief Writes the full configuration, e.g. to seed a settings.json with defaults. */
    static bool Save(const std::string& path, const domain::EngineConfig& config);

    /** @brief $XDG_CONFIG_HOME/NoteDrift/settings.json */
    static std::string DefaultPath();
};

} // namespace notedrift::infrastructure
