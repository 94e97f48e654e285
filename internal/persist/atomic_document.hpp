#pragma once

#include <filesystem>
#include <string>

#include <google/protobuf/message.h>

namespace logship::persist {

/*
  A protobuf message persisted as a JSON document.

  Write is atomic:
      write .<name>.tmp -> fsync -> rename over <name> -> fsync dir
  so a reader never observes a partially written document.
*/
class AtomicDocument {
 public:
  explicit AtomicDocument(std::filesystem::path path);

  // false when the document does not exist yet. Throws util::StorageCorrupted
  // when it exists but cannot be read or parsed.
  bool Read(google::protobuf::Message* message) const;

  void Write(const google::protobuf::Message& message) const;

  const std::filesystem::path& path() const {
    return path_;
  }

  std::filesystem::path TempPath() const;

 private:
  std::filesystem::path path_;
};

// Raw atomic replace, exposed for tests and for the document writer.
void WriteFileAtomically(const std::filesystem::path& path, const std::filesystem::path& tmp_path, const std::string& contents);

} // namespace logship::persist
