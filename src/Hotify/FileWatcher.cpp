// =================================================================
// src/Hotify/FileWatcher.cpp
// =================================================================
// Implementation for the inotify hot-folder watcher.

#include "Hotify/FileWatcher.hpp"
#include "Hotify/Logger.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <stdexcept>
#include <sys/inotify.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace Hotify {

namespace {

constexpr uint32_t kWatchMask = IN_CLOSE_WRITE | IN_MOVED_TO | IN_CREATE | IN_DELETE | IN_MOVED_FROM |
                                 IN_DELETE_SELF | IN_MOVE_SELF;

} // namespace

FileWatcher::FileWatcher(const HotFolderLayout& layout, std::chrono::milliseconds settle_interval)
    : m_layout(layout),
      m_settle_interval(settle_interval)
{
    m_inotify_fd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (m_inotify_fd < 0) {
        throw std::runtime_error(std::string("inotify_init1 failed: ") + std::strerror(errno));
    }
    if (pipe2(m_pipe_fd, O_NONBLOCK | O_CLOEXEC) != 0) {
        int saved_errno = errno;
        close(m_inotify_fd);
        m_inotify_fd = -1;
        throw std::runtime_error(std::string("pipe2 failed: ") + std::strerror(saved_errno));
    }
}

FileWatcher::~FileWatcher() {
    stop();
    if (m_inotify_fd >= 0) {
        close(m_inotify_fd);
    }
    for (int fd : m_pipe_fd) {
        if (fd >= 0) {
            close(fd);
        }
    }
}

bool FileWatcher::addWatchRecursive(const fs::path& path) {
    if (!addSingleWatch(path)) {
        return false;
    }
    
    std::error_code ec;
    fs::recursive_directory_iterator it(path, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        Logger::getInstance().warning("Watcher", "Cannot walk directory", path.string() + ": " + ec.message());
        return true;
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        if (it->is_directory(ec)) {
            if (isIgnoredFileName(it->path().filename().string())) {
                it.disable_recursion_pending();
                continue;
            }
            addSingleWatch(it->path());
        }
    }
    return true;
}

bool FileWatcher::addSingleWatch(const fs::path& path) {
    int wd = inotify_add_watch(m_inotify_fd, path.c_str(), kWatchMask);
    if (wd < 0) {
        Logger::getInstance().error("Watcher", "Failed to watch directory",
                                    path.string() + ": " + std::strerror(errno));
        return false;
    }
    
    std::lock_guard<std::mutex> lock(m_watch_mutex);
    m_wd_to_path[wd] = path;
    LOG_DEBUG("Watcher", "Watching " + path.string());
    return true;
}

void FileWatcher::start(EventCallback callback) {
    if (m_running.load()) {
        return;
    }
    m_callback = std::move(callback);
    m_stop_requested.store(false);
    m_running.store(true);
    m_watch_thread = std::thread(&FileWatcher::watchLoop, this);
    
    LOG_INFO("Watcher", "Watching " + m_layout.getHotFolderRoot().string());
}

void FileWatcher::stop() {
    if (!m_watch_thread.joinable()) {
        return;
    }
    
    m_stop_requested.store(true);
    const char wake = 'x';
    if (write(m_pipe_fd[1], &wake, 1) < 0 && errno != EAGAIN) {
        Logger::getInstance().warning("Watcher", "Failed to signal watch thread", std::strerror(errno));
    }
    m_watch_thread.join();
    m_running.store(false);
    LOG_DEBUG("Watcher", "Watcher stopped");
}

void FileWatcher::watchLoop() {
    alignas(struct inotify_event) char buffer[16 * 1024];
    
    while (!m_stop_requested.load()) {
        struct pollfd fds[2];
        fds[0].fd = m_inotify_fd;
        fds[0].events = POLLIN;
        fds[1].fd = m_pipe_fd[0];
        fds[1].events = POLLIN;
        
        int ready = poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            Logger::getInstance().critical("Watcher", "poll failed, watcher stops", std::strerror(errno));
            break;
        }
        if (fds[1].revents & POLLIN) {
            break;
        }
        if (!(fds[0].revents & POLLIN)) {
            continue;
        }
        
        for (;;) {
            ssize_t length = read(m_inotify_fd, buffer, sizeof(buffer));
            if (length <= 0) {
                if (length < 0 && errno != EAGAIN && errno != EINTR) {
                    Logger::getInstance().error("Watcher", "read from inotify failed", std::strerror(errno));
                }
                break;
            }
            
            for (char* ptr = buffer; ptr < buffer + length;) {
                const auto* event = reinterpret_cast<const struct inotify_event*>(ptr);
                handleEvent(event);
                ptr += sizeof(struct inotify_event) + event->len;
                if (m_stop_requested.load()) {
                    break;
                }
            }
        }
    }
    
    m_running.store(false);
}

void FileWatcher::handleEvent(const struct inotify_event* event) {
    if (event->mask & IN_Q_OVERFLOW) {
        Logger::getInstance().warning("Watcher", "Event queue overflowed, some arrivals were missed",
                                      "Restart to rediscover waiting files");
        return;
    }
    
    fs::path directory;
    {
        std::lock_guard<std::mutex> lock(m_watch_mutex);
        auto it = m_wd_to_path.find(event->wd);
        if (it == m_wd_to_path.end()) {
            return;
        }
        directory = it->second;
        if (event->mask & IN_IGNORED) {
            m_wd_to_path.erase(it);
            return;
        }
    }
    
    if (event->mask & (IN_DELETE_SELF | IN_MOVE_SELF)) {
        LOG_DEBUG("Watcher", "Watched directory went away: " + directory.string());
        return;
    }
    if (event->len == 0) {
        return;
    }
    
    const std::string name(event->name);
    if (isIgnoredFileName(name)) {
        return;
    }
    fs::path path = directory / name;
    
    if (event->mask & IN_ISDIR) {
        if (event->mask & (IN_CREATE | IN_MOVED_TO)) {
            addWatchRecursive(path);
            reportExistingFiles(path);
        }
        return;
    }
    
    if (event->mask & (IN_DELETE | IN_MOVED_FROM)) {
        forgetReported(path);
    } else if (event->mask & (IN_CLOSE_WRITE | IN_MOVED_TO)) {
        reportFile(path);
    }
}

void FileWatcher::reportWaitingFiles(const std::vector<FileEvent>& waiting) {
    if (!m_running.load()) {
        return;
    }
    for (const auto& event : waiting) {
        if (m_stop_requested.load()) {
            break;
        }
        reportFile(event.path);
    }
}

void FileWatcher::reportExistingFiles(const fs::path& directory) {
    std::error_code ec;
    fs::recursive_directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (isIgnoredFileName(name)) {
            if (it->is_directory(ec)) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (it->is_regular_file(ec)) {
            reportFile(it->path());
        }
    }
}

void FileWatcher::reportFile(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return;
    }
    
    LOG_DEBUG("Watcher", "File created: " + path.string());
    if (!waitUntilWriteFinished(path)) {
        return;
    }
    LOG_DEBUG("Watcher", "File modification finished: " + path.string());
    
    auto event = m_layout.eventFor(path);
    if (!event) {
        LOG_DEBUG("Watcher", "Outside any environment folder, ignored: " + path.string());
        return;
    }
    if (!markReported(path)) {
        LOG_DEBUG("Watcher", "Unchanged since last report, ignored: " + path.string());
        return;
    }
    
    try {
        m_callback(*event);
    } catch (const std::exception& e) {
        Logger::getInstance().error("Watcher", "Event handler failed: " + std::string(e.what()), path.string());
    }
}

bool FileWatcher::markReported(const fs::path& path) {
    std::error_code ec;
    ReportedState state;
    state.size = fs::file_size(path, ec);
    if (ec) {
        return false;
    }
    state.modified = fs::last_write_time(path, ec);
    if (ec) {
        return false;
    }
    
    std::lock_guard<std::mutex> lock(m_reported_mutex);
    auto result = m_reported.try_emplace(path.string(), state);
    if (result.second) {
        return true;
    }
    auto it = result.first;
    if (it->second.size == state.size && it->second.modified == state.modified) {
        return false;
    }
    it->second = state;
    return true;
}

void FileWatcher::forgetReported(const fs::path& path) {
    std::lock_guard<std::mutex> lock(m_reported_mutex);
    m_reported.erase(path.string());
}

bool FileWatcher::waitUntilWriteFinished(const fs::path& path) const {
    std::error_code ec;
    auto previous_size = fs::file_size(path, ec);
    if (ec) {
        return false;
    }
    
    for (;;) {
        std::this_thread::sleep_for(m_settle_interval);
        if (m_stop_requested.load()) {
            return false;
        }
        auto current_size = fs::file_size(path, ec);
        if (ec) {
            return false;
        }
        if (current_size == previous_size) {
            return true;
        }
        previous_size = current_size;
    }
}

} // namespace Hotify
