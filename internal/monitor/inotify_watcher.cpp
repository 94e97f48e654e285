#include "inotify_watcher.hpp"

#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <system_error>

#include "internal/model/watch_rule.hpp"
#include "internal/observability/logging.hpp"

namespace logship::monitor {

using logship::observability::StringField;

namespace {

constexpr uint32_t kWatchMask = IN_CLOSE_WRITE | IN_MODIFY | IN_CREATE | IN_MOVED_TO | IN_DELETE | IN_MOVED_FROM | IN_ATTRIB;

} // namespace

InotifyWatcher::InotifyWatcher() : fd_(::inotify_init1(IN_NONBLOCK | IN_CLOEXEC)) {
  if (fd_ < 0) {
    throw std::system_error(errno, std::generic_category(), "inotify_init1");
  }
}

InotifyWatcher::~InotifyWatcher() {
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

void InotifyWatcher::AddWatch(const std::filesystem::path& dir, bool recursive) {
  const int wd = ::inotify_add_watch(fd_, dir.c_str(), kWatchMask);
  if (wd < 0) {
    LOGSHIP_LOG_WARN("inotify_add_watch failed", {StringField("path", dir.string()), StringField("error", std::strerror(errno))});
    return;
  }
  watches_[wd] = Watch{dir, recursive};
}

void InotifyWatcher::AddTree(const std::filesystem::path& root, bool recursive) {
  AddWatch(root, recursive);
  if (!recursive) {
    return;
  }

  std::error_code ec;
  const auto      options = std::filesystem::directory_options::skip_permission_denied;
  for (std::filesystem::recursive_directory_iterator it(root, options, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code dir_ec;
    if (!it->is_directory(dir_ec) || it->is_symlink(dir_ec)) {
      continue;
    }
    if (model::IsHidden(it->path())) {
      it.disable_recursion_pending();
      continue;
    }
    AddWatch(it->path(), true);
  }
}

void InotifyWatcher::PollOnce(std::chrono::milliseconds timeout, const Callback& callback) {
  pollfd pfd{fd_, POLLIN, 0};
  const int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
  if (ready <= 0) {
    return;
  }

  alignas(inotify_event) char buffer[16 * 1024];
  for (;;) {
    const auto length = ::read(fd_, buffer, sizeof(buffer));
    if (length <= 0) {
      return;
    }

    for (char* ptr = buffer; ptr < buffer + length;) {
      const auto* event = reinterpret_cast<const inotify_event*>(ptr);
      ptr += sizeof(inotify_event) + event->len;

      if (event->mask & IN_IGNORED) {
        watches_.erase(event->wd);
        continue;
      }

      auto it = watches_.find(event->wd);
      if (it == watches_.end() || event->len == 0) {
        continue;
      }

      const auto path      = it->second.dir / event->name;
      const bool recursive = it->second.recursive;

      if (event->mask & IN_ISDIR) {
        if ((event->mask & (IN_CREATE | IN_MOVED_TO)) && recursive && !model::IsHidden(path)) {
          AddTree(path, true);
          callback(path, EventType::kDirectoryCreated);
        }
        continue;
      }

      if (event->mask & (IN_DELETE | IN_MOVED_FROM)) {
        callback(path, EventType::kRemoved);
      } else {
        callback(path, EventType::kChanged);
      }
    }
  }
}

} // namespace logship::monitor
