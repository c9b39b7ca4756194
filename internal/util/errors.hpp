#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tierbridge::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Unknown source id, or a source unmounted mid-operation. Never retried.
class SourceNotFound : public NotFound {
 public:
  explicit SourceNotFound(const std::string& source_id) : NotFound("source not found: " + source_id), source_id_(source_id) {
  }

  const std::string& source_id() const {
    return source_id_;
  }

 private:
  std::string source_id_;
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ClipboardEmpty : public InvalidState {
 public:
  ClipboardEmpty() : InvalidState("clipboard is empty") {
  }
};

class PermissionDenied : public std::runtime_error {
 public:
  explicit PermissionDenied(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DestinationFull : public ResourceExhausted {
 public:
  explicit DestinationFull(const std::string& msg) : ResourceExhausted(msg) {
  }
};

// Raised only when copy-name disambiguation runs out of candidates.
class NameConflict : public std::runtime_error {
 public:
  explicit NameConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  The file sits on a cold tier and the caller did not allow a blocking wait
  (or the estimated wait exceeds the configured blocking limit).
*/
class RetrievalRequired : public std::runtime_error {
 public:
  explicit RetrievalRequired(std::uint64_t estimated_retrieval_sec)
      : std::runtime_error("retrieval required: file is not resident; estimated retrieval " + std::to_string(estimated_retrieval_sec) + "s"),
        estimated_retrieval_sec_(estimated_retrieval_sec) {
  }

  std::uint64_t estimated_retrieval_sec() const {
    return estimated_retrieval_sec_;
  }

 private:
  std::uint64_t estimated_retrieval_sec_;
};

class PartialFailure : public std::runtime_error {
 public:
  PartialFailure(std::vector<std::string> succeeded, std::vector<std::string> errors)
      : std::runtime_error(std::to_string(succeeded.size()) + " succeeded, " + std::to_string(errors.size()) + " failed"),
        succeeded_(std::move(succeeded)),
        errors_(std::move(errors)) {
  }

  const std::vector<std::string>& succeeded() const {
    return succeeded_;
  }
  const std::vector<std::string>& errors() const {
    return errors_;
  }

 private:
  std::vector<std::string> succeeded_;
  std::vector<std::string> errors_;
};

// Transient backend failures are retried at part level; everything else is terminal.
inline bool IsPermanent(const std::exception& e) {
  return dynamic_cast<const NotFound*>(&e) || dynamic_cast<const PermissionDenied*>(&e) || dynamic_cast<const InvalidState*>(&e) ||
         dynamic_cast<const DestinationFull*>(&e) || dynamic_cast<const std::invalid_argument*>(&e);
}

} // namespace tierbridge::util
