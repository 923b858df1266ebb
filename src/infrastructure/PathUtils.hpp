// PathUtils Header
#pragma once
#include <filesystem>
#include <string>

namespace notedrift::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();

    /** @brief $XDG_DATA_HOME/NoteDrift/notedrift.db, creating the directory on demand. */
    static std::filesystem::path GetDefaultDatabasePath();
};

} // namespace notedrift::infrastructure
