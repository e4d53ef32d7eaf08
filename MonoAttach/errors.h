#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

namespace monoattach {

class BridgeError : public std::runtime_error {
 public:
  explicit BridgeError(const std::string& message) : std::runtime_error(message) {}
};

// Module discovery timed out or a one-shot lookup came back empty.
class ModuleNotFoundError : public BridgeError {
 public:
  ModuleNotFoundError(const std::string& message, std::vector<std::string> candidates,
                      std::vector<std::string> loaded_modules);

  const std::vector<std::string>& candidates() const { return candidates_; }
  const std::vector<std::string>& loaded_modules() const { return loaded_modules_; }

 private:
  std::vector<std::string> candidates_;
  std::vector<std::string> loaded_modules_;
};

// Synchronous access before the gate reached the ready state.
class RuntimeNotReadyError : public BridgeError {
 public:
  explicit RuntimeNotReadyError(const std::string& message) : BridgeError(message) {}
};

// Any failure during discovery or the root-domain poll. Keeps the cause.
class InitializationError : public BridgeError {
 public:
  InitializationError(const std::string& message, std::exception_ptr cause)
    : BridgeError(message), cause_(cause) {}

  std::exception_ptr cause() const { return cause_; }

 private:
  std::exception_ptr cause_;
};

class AttachmentError : public BridgeError {
 public:
  explicit AttachmentError(const std::string& message) : BridgeError(message) {}
};

// Never leaves the component that raised it; logged and dropped.
class DetachError : public BridgeError {
 public:
  explicit DetachError(const std::string& message) : BridgeError(message) {}
};

class ConfigError : public BridgeError {
 public:
  explicit ConfigError(const std::string& message) : BridgeError(message) {}
};

// Best-effort text for an exception_ptr, for logs.
std::string DescribeException(std::exception_ptr error);

}  // namespace monoattach
