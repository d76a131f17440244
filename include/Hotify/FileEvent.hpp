// =================================================================
// include/Hotify/FileEvent.hpp
// =================================================================
// The "file appeared" event consumed by the engine.

#pragma once

#include <string>

namespace Hotify {

/**
 * @brief A newly complete file under a watched hot-folder tree
 */
struct FileEvent {
    std::string path;        ///< Absolute path of the file
    std::string hot_folder;  ///< Top-level hot folder (environment directory name)
    std::string instance;    ///< Directory the file landed in, relative to the hot-folder root
};

/**
 * @brief True for names the watcher never reports: hidden files and
 *        partial-write artifacts (*.tmp, *.part, *.crdownload, *.swp, *~)
 */
bool isIgnoredFileName(const std::string& file_name);

} // namespace Hotify
