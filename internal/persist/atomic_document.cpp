#include "atomic_document.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"

namespace logship::persist {

namespace {

[[noreturn]] void ThrowErrno(const std::string& what, const std::filesystem::path& path) {
  throw std::system_error(errno, std::generic_category(), what + " " + path.string());
}

class FileDescriptor {
 public:
  explicit FileDescriptor(int fd) : fd_(fd) {
  }
  ~FileDescriptor() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  FileDescriptor(const FileDescriptor&)            = delete;
  FileDescriptor& operator=(const FileDescriptor&) = delete;

  int get() const {
    return fd_;
  }

  int release() {
    int fd = fd_;
    fd_    = -1;
    return fd;
  }

 private:
  int fd_;
};

void WriteAll(int fd, const std::string& contents, const std::filesystem::path& path) {
  size_t offset = 0;
  while (offset < contents.size()) {
    const auto written = ::write(fd, contents.data() + offset, contents.size() - offset);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      ThrowErrno("write", path);
    }
    offset += static_cast<size_t>(written);
  }
}

void SyncDirectory(const std::filesystem::path& dir) {
  FileDescriptor fd(::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
  if (fd.get() < 0) {
    ThrowErrno("open directory", dir);
  }
  if (::fsync(fd.get()) != 0) {
    ThrowErrno("fsync directory", dir);
  }
}

} // namespace

void WriteFileAtomically(const std::filesystem::path& path, const std::filesystem::path& tmp_path, const std::string& contents) {
  auto dir = path.parent_path();
  if (dir.empty()) {
    dir = ".";
  }
  std::filesystem::create_directories(dir);

  {
    FileDescriptor fd(::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
    if (fd.get() < 0) {
      ThrowErrno("open", tmp_path);
    }
    WriteAll(fd.get(), contents, tmp_path);
    if (::fsync(fd.get()) != 0) {
      ThrowErrno("fsync", tmp_path);
    }
    if (::close(fd.release()) != 0) {
      ThrowErrno("close", tmp_path);
    }
  }

  std::filesystem::rename(tmp_path, path);
  SyncDirectory(dir);
}

AtomicDocument::AtomicDocument(std::filesystem::path path) : path_(std::move(path)) {
}

std::filesystem::path AtomicDocument::TempPath() const {
  return path_.parent_path() / ("." + path_.filename().string() + ".tmp");
}

bool AtomicDocument::Read(google::protobuf::Message* message) const {
  std::ifstream in(path_, std::ios::binary);
  if (!in) {
    if (!std::filesystem::exists(path_)) {
      return false;
    }
    throw util::StorageCorrupted("cannot open " + path_.string() + ": " + std::strerror(errno));
  }

  std::ostringstream buffer;
  buffer << in.rdbuf();
  const auto json = buffer.str();
  if (in.bad()) {
    throw util::StorageCorrupted("cannot read " + path_.string());
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  message->Clear();
  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    throw util::StorageCorrupted("corrupt document " + path_.string() + ": " + std::string(status.message()));
  }
  return true;
}

void AtomicDocument::Write(const google::protobuf::Message& message) const {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("cannot serialize " + path_.string() + ": " + std::string(status.message()));
  }

  WriteFileAtomically(path_, TempPath(), json);
}

} // namespace logship::persist
