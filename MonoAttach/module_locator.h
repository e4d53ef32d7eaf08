#pragma once

#include <string>
#include <vector>

#include "native_api.h"

namespace monoattach {

struct ModuleDescriptor {
  enum class Method : int { kExplicit = 0, kCommonName = 1, kExportHeuristic = 2 };

  std::string name;
  std::string path;
  uintptr_t base = 0;
  size_t size = 0;
  Method method = Method::kExplicit;

  ModuleInfo ToModuleInfo() const { return ModuleInfo{name, path, base, size}; }
};

// Polls the process module table for the Mono runtime module.
class ModuleLocator {
 public:
  explicit ModuleLocator(NativeRuntimeApi& api, int poll_interval_ms = 50)
    : api_(api), poll_interval_ms_(poll_interval_ms) {}

  // One pass: explicit candidates in order, then the common names (only when
  // no candidates were given), then the export heuristic.
  bool TryFindModule(const std::vector<std::string>& candidates, ModuleDescriptor& out_module);

  // Same as TryFindModule but throws ModuleNotFoundError.
  ModuleDescriptor FindModule(const std::vector<std::string>& candidates);

  // Polls until found. Logs one warning after |warn_after_ms| and throws
  // ModuleNotFoundError after |timeout_ms|.
  ModuleDescriptor WaitForModule(const std::vector<std::string>& candidates, int timeout_ms,
                                 int warn_after_ms);

  static const std::vector<std::string>& CommonModuleNames();

 private:
  bool FindByExportHeuristic(const std::vector<ModuleInfo>& modules, ModuleDescriptor& out_module);
  std::vector<std::string> LoadedModuleNames();

  NativeRuntimeApi& api_;
  int poll_interval_ms_;
};

}  // namespace monoattach
