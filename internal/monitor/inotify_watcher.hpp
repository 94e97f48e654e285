#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <unordered_map>

namespace logship::monitor {

/*
  Thin wrapper over Linux inotify(7). Watches whole trees for recursive
  roots and picks up directories created later.
*/
class InotifyWatcher {
 public:
  enum class EventType {
    kChanged,
    kRemoved,
    kDirectoryCreated,
  };

  using Callback = std::function<void(const std::filesystem::path&, EventType)>;

  InotifyWatcher();
  ~InotifyWatcher();

  InotifyWatcher(const InotifyWatcher&)            = delete;
  InotifyWatcher& operator=(const InotifyWatcher&) = delete;

  void AddTree(const std::filesystem::path& root, bool recursive);

  // Waits up to timeout and delivers whatever events arrived.
  void PollOnce(std::chrono::milliseconds timeout, const Callback& callback);

  size_t WatchCount() const {
    return watches_.size();
  }

 private:
  struct Watch {
    std::filesystem::path dir;
    bool                  recursive;
  };

  void AddWatch(const std::filesystem::path& dir, bool recursive);

  int                            fd_{-1};
  std::unordered_map<int, Watch> watches_;
};

} // namespace logship::monitor
