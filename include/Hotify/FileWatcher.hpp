// =================================================================
// include/Hotify/FileWatcher.hpp
// =================================================================
// Linux inotify source of "file appeared" events for the hot-folder tree.

#pragma once

#include "Hotify/FileEvent.hpp"
#include "Hotify/HotFolderLayout.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

struct inotify_event;

namespace Hotify {

/**
 * @brief Watches every environment folder and reports complete files
 *
 * Reports regular files on IN_CLOSE_WRITE and IN_MOVED_TO, after their
 * size has stayed unchanged for one settle interval. Directories, hidden
 * files and partial-write artifacts are never reported. Sub-directories
 * created later are watched as they appear. Events are delivered from a
 * single background thread in arrival order. A path is delivered again
 * only after its size or modification time changed, or after it was
 * deleted or moved away.
 */
class FileWatcher {
public:
    using EventCallback = std::function<void(const FileEvent&)>;

    /**
     * @brief Create the inotify instance
     * @param layout Hot-folder layout used to map paths to events
     * @param settle_interval Size-stability window before a file is reported
     * @throws std::runtime_error if inotify or the shutdown pipe cannot be created
     */
    FileWatcher(const HotFolderLayout& layout, std::chrono::milliseconds settle_interval);

    ~FileWatcher();

    // Non-copyable
    FileWatcher(const FileWatcher&) = delete;
    FileWatcher& operator=(const FileWatcher&) = delete;

    /**
     * @brief Watch a directory and all of its sub-directories
     * @param path Directory to watch
     * @return False if the directory itself could not be watched
     */
    bool addWatchRecursive(const std::filesystem::path& path);

    /**
     * @brief Start delivering events on a background thread
     * @param callback Receives every complete file
     */
    void start(EventCallback callback);

    /**
     * @brief Stop the background thread. Blocks until it has exited.
     */
    void stop();

    bool isRunning() const { return m_running.load(); }

    /**
     * @brief Report files that were already waiting before the watcher started
     *
     * Runs on the calling thread. Each file passes the same write-completion
     * check as a notified file, and a file the background thread reports
     * meanwhile is delivered only once. Does nothing unless started.
     */
    void reportWaitingFiles(const std::vector<FileEvent>& waiting);

    /**
     * @brief Wait until a file's size is unchanged across one interval
     * @return False if the file disappeared or the watcher is stopping
     */
    bool waitUntilWriteFinished(const std::filesystem::path& path) const;

private:
    void watchLoop();
    void handleEvent(const struct inotify_event* event);
    bool addSingleWatch(const std::filesystem::path& path);

    /**
     * @brief Report files that arrived inside a directory moved into the tree
     */
    void reportExistingFiles(const std::filesystem::path& directory);

    void reportFile(const std::filesystem::path& path);

    /**
     * @brief Record a finished file
     * @return False if the same size and modification time were reported before
     */
    bool markReported(const std::filesystem::path& path);
    void forgetReported(const std::filesystem::path& path);

    const HotFolderLayout& m_layout;
    std::chrono::milliseconds m_settle_interval;

    int m_inotify_fd = -1;
    int m_pipe_fd[2] = {-1, -1};  // Self-pipe for shutdown

    std::atomic<bool> m_running{false};
    std::atomic<bool> m_stop_requested{false};
    std::thread m_watch_thread;

    std::mutex m_watch_mutex;
    std::unordered_map<int, std::filesystem::path> m_wd_to_path;

    struct ReportedState {
        std::uintmax_t size = 0;
        std::filesystem::file_time_type modified;
    };

    std::mutex m_reported_mutex;
    std::unordered_map<std::string, ReportedState> m_reported;

    EventCallback m_callback;
};

} // namespace Hotify
