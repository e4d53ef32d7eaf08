#include "pch.h"

#include "errors.h"

#include <sstream>
#include <utility>

namespace monoattach {

namespace {
  std::string JoinNames(const std::vector<std::string>& names) {
    std::ostringstream oss;
    for (size_t i = 0; i < names.size(); ++i) {
      if (i) oss << ", ";
      oss << names[i];
    }
    return oss.str();
  }

  std::string DescribeNotFound(const std::string& message, const std::vector<std::string>& candidates,
                               const std::vector<std::string>& loaded) {
    std::ostringstream oss;
    oss << message;
    if (!candidates.empty()) oss << " (candidates: " << JoinNames(candidates) << ")";
    if (!loaded.empty()) oss << " (loaded modules: " << loaded.size() << ")";
    return oss.str();
  }
}  // namespace

ModuleNotFoundError::ModuleNotFoundError(const std::string& message,
                                         std::vector<std::string> candidates,
                                         std::vector<std::string> loaded_modules)
  : BridgeError(DescribeNotFound(message, candidates, loaded_modules)),
    candidates_(std::move(candidates)),
    loaded_modules_(std::move(loaded_modules)) {}

std::string DescribeException(std::exception_ptr error) {
  if (!error) return "<none>";
  try {
    std::rethrow_exception(error);
  }
  catch (const std::exception& e) {
    return e.what();
  }
  catch (...) {
    return "<non-standard exception>";
  }
}

}  // namespace monoattach
