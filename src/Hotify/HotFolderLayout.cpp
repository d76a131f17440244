// =================================================================
// src/Hotify/HotFolderLayout.cpp
// =================================================================
// Implementation for hot-folder scaffolding.

#include "Hotify/HotFolderLayout.hpp"
#include "Hotify/Logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace fs = std::filesystem;

namespace Hotify {

bool isIgnoredFileName(const std::string& file_name) {
    if (file_name.empty() || file_name[0] == '.') {
        return true;
    }
    if (file_name.back() == '~') {
        return true;
    }
    
    static const char* const kPartialSuffixes[] = {".tmp", ".part", ".crdownload", ".swp"};
    for (const char* suffix : kPartialSuffixes) {
        const std::string ending(suffix);
        if (file_name.size() > ending.size() &&
            file_name.compare(file_name.size() - ending.size(), ending.size(), ending) == 0) {
            return true;
        }
    }
    return false;
}

HotFolderLayout::HotFolderLayout(const fs::path& base_path, const std::string& hot_folder_name,
                                 const std::string& output_folder_name)
    : m_hot_root(fs::absolute(base_path / hot_folder_name).lexically_normal()),
      m_output_folder(fs::absolute(base_path / output_folder_name).lexically_normal())
{
    if (hot_folder_name.empty() || output_folder_name.empty()) {
        throw std::invalid_argument("Hot folder and output folder names must not be empty");
    }
}

void HotFolderLayout::prepare(const EnvironmentRegistry& registry) const {
    fs::create_directories(m_hot_root);
    fs::create_directories(m_output_folder);
    
    for (const auto& environment : registry.getEnvironments()) {
        fs::path folder = getEnvironmentFolder(environment.getName());
        fs::create_directories(folder);
        LOG_DEBUG("Layout", "Hot folder ready: " + folder.string());
    }
}

fs::path HotFolderLayout::getEnvironmentFolder(const std::string& environment) const {
    return m_hot_root / environment;
}

std::string HotFolderLayout::outputPathFor(const std::vector<std::string>& inputs, TriggerMode mode) const {
    if (inputs.empty()) {
        throw std::invalid_argument("Cannot derive an output path without inputs");
    }
    
    const std::string first_name = fs::path(inputs.front()).filename().string();
    if (mode == TriggerMode::Batch) {
        return (m_output_folder / ("multiple--" + first_name)).string();
    }
    return (m_output_folder / first_name).string();
}

std::optional<FileEvent> HotFolderLayout::eventFor(const fs::path& file_path) const {
    fs::path absolute_path = fs::absolute(file_path).lexically_normal();
    fs::path relative = absolute_path.lexically_relative(m_hot_root);
    
    if (relative.empty() || *relative.begin() == "..") {
        return std::nullopt;
    }
    
    // Files directly in the hot-folder root belong to no environment
    fs::path parent = relative.parent_path();
    if (parent.empty()) {
        return std::nullopt;
    }
    
    FileEvent event;
    event.path = absolute_path.string();
    event.hot_folder = relative.begin()->string();
    event.instance = parent.generic_string();
    return event;
}

std::vector<FileEvent> HotFolderLayout::existingFiles(const EnvironmentRegistry& registry) const {
    struct Found {
        FileEvent event;
        fs::file_time_type modified;
    };
    std::vector<Found> found;
    
    for (const auto& environment : registry.getEnvironments()) {
        fs::path folder = getEnvironmentFolder(environment.getName());
        std::error_code ec;
        if (!fs::is_directory(folder, ec)) {
            continue;
        }
        
        fs::recursive_directory_iterator it(folder, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            Logger::getInstance().warning("Layout", "Cannot scan hot folder", folder.string() + ": " + ec.message());
            continue;
        }
        
        for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (ec) {
                Logger::getInstance().warning("Layout", "Scan interrupted", ec.message());
                break;
            }
            const std::string name = it->path().filename().string();
            if (it->is_directory(ec)) {
                if (isIgnoredFileName(name)) {
                    it.disable_recursion_pending();
                }
                continue;
            }
            if (!it->is_regular_file(ec) || isIgnoredFileName(name)) {
                continue;
            }
            
            auto event = eventFor(it->path());
            if (event) {
                found.push_back(Found{*event, it->last_write_time(ec)});
            }
        }
    }
    
    std::sort(found.begin(), found.end(), [](const Found& a, const Found& b) {
        if (a.modified != b.modified) {
            return a.modified < b.modified;
        }
        return a.event.path < b.event.path;
    });
    
    std::vector<FileEvent> events;
    events.reserve(found.size());
    for (auto& item : found) {
        events.push_back(std::move(item.event));
    }
    return events;
}

bool HotFolderLayout::clean() const {
    std::error_code ec;
    fs::remove_all(m_hot_root, ec);
    if (ec) {
        Logger::getInstance().error("Layout", "Failed to clean hot folder", m_hot_root.string() + ": " + ec.message());
        return false;
    }
    Logger::getInstance().info("Layout", "Cleaned hot folder", m_hot_root.string());
    return true;
}

} // namespace Hotify
