// =================================================================
// include/Hotify/HotFolderLayout.hpp
// =================================================================
// On-disk scaffolding: the hot-folder tree, one directory per
// environment, and the shared output folder.

#pragma once

#include "Hotify/Environment.hpp"
#include "Hotify/FileEvent.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace Hotify {

/**
 * @brief Owns the directory layout below the base path
 *
 *   <base>/<hot_folder_name>/<environment>/   files are dropped here
 *   <base>/<output_folder_name>/              derived out_file paths
 */
class HotFolderLayout {
public:
    HotFolderLayout(const std::filesystem::path& base_path, const std::string& hot_folder_name,
                    const std::string& output_folder_name);

    /**
     * @brief Create the hot-folder root, one folder per environment and the output folder
     * @throws std::filesystem::filesystem_error if a directory cannot be created
     */
    void prepare(const EnvironmentRegistry& registry) const;

    const std::filesystem::path& getHotFolderRoot() const { return m_hot_root; }
    const std::filesystem::path& getOutputFolder() const { return m_output_folder; }
    std::filesystem::path getEnvironmentFolder(const std::string& environment) const;

    /**
     * @brief Derive out_file for an invocation
     *
     * Single-file: <output>/<basename(in_file)>.
     * Batch: <output>/multiple--<basename(first in_files)>.
     */
    std::string outputPathFor(const std::vector<std::string>& inputs, TriggerMode mode) const;

    /**
     * @brief Build the event for a file below the hot-folder root
     * @return The event, or nothing if the path is outside the tree or sits directly in the root
     */
    std::optional<FileEvent> eventFor(const std::filesystem::path& file_path) const;

    /**
     * @brief Files already waiting in environment folders, oldest first
     *
     * Hidden and temporary files are skipped. Used for the initial run so
     * leftovers of a previous run are re-evaluated.
     */
    std::vector<FileEvent> existingFiles(const EnvironmentRegistry& registry) const;

    /**
     * @brief Remove the whole hot-folder tree (the output folder is kept)
     * @return True if the tree is gone afterwards
     */
    bool clean() const;

private:
    std::filesystem::path m_hot_root;
    std::filesystem::path m_output_folder;
};

} // namespace Hotify
