#pragma once

#include <stdexcept>
#include <string>

namespace archiver::util {

/*
  Central error types.

  Everything raised by the archiver derives from std::runtime_error so the
  policy runner and main() can report it uniformly.
*/

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A buffered file ended in the middle of a record.
class CorruptRecord : public std::runtime_error {
 public:
  explicit CorruptRecord(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A local buffered file or its checksum sibling could not be created or removed.
class LocalFileError : public std::runtime_error {
 public:
  explicit LocalFileError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UploadFailed : public std::runtime_error {
 public:
  explicit UploadFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CommitFailed : public std::runtime_error {
 public:
  explicit CommitFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Raised by ApplyPolicy after every partition was visited and at least one failed.
class PolicyFailed : public std::runtime_error {
 public:
  explicit PolicyFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace archiver::util
