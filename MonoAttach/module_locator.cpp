#include "pch.h"

#include "module_locator.h"

#include <chrono>
#include <sstream>
#include <thread>

#include "config.h"
#include "errors.h"
#include "log.h"

namespace monoattach {

namespace {
  bool EndsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
      s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
  }

  bool ModuleMatches(const ModuleInfo& m, const std::string& name) {
    return m.name == name || EndsWith(m.path, "/" + name) || EndsWith(m.path, "\\" + name);
  }

  const ModuleInfo* FindByName(const std::vector<ModuleInfo>& modules, const std::string& name) {
    for (const auto& m : modules) {
      if (ModuleMatches(m, name)) return &m;
    }
    return nullptr;
  }

  ModuleDescriptor Describe(const ModuleInfo& m, ModuleDescriptor::Method method) {
    ModuleDescriptor d;
    d.name = m.name;
    d.path = m.path;
    d.base = m.base;
    d.size = m.size;
    d.method = method;
    return d;
  }

  std::string JoinCandidates(const std::vector<std::string>& names) {
    std::ostringstream oss;
    for (size_t i = 0; i < names.size(); ++i) {
      if (i) oss << ", ";
      oss << names[i];
    }
    return oss.str();
  }
}  // namespace

const std::vector<std::string>& ModuleLocator::CommonModuleNames() {
  // Unity builds first.
  static const std::vector<std::string> kNames = {
      "mono-2.0-bdwgc.dll",
      "mono-2.0-sgen.dll",
      "monosgen-2.0.dll",
      "mono-2.0.dll",
      "mono.dll",
      "libmonosgen-2.0.so",
      "libmonosgen-2.0.dylib",
      "libmono-2.0.so",
      "libmono.so",
      "libmono-2.0.dylib",
  };
  return kNames;
}

bool ModuleLocator::TryFindModule(const std::vector<std::string>& candidates,
                                  ModuleDescriptor& out_module) {
  std::vector<ModuleInfo> modules = api_.EnumerateModules();

  for (const auto& name : candidates) {
    if (const ModuleInfo* m = FindByName(modules, name)) {
      out_module = Describe(*m, ModuleDescriptor::Method::kExplicit);
      return true;
    }
  }
  if (!candidates.empty()) return false;

  for (const auto& name : CommonModuleNames()) {
    if (const ModuleInfo* m = FindByName(modules, name)) {
      out_module = Describe(*m, ModuleDescriptor::Method::kCommonName);
      return true;
    }
  }
  return FindByExportHeuristic(modules, out_module);
}

bool ModuleLocator::FindByExportHeuristic(const std::vector<ModuleInfo>& modules,
                                          ModuleDescriptor& out_module) {
  const ModuleInfo* best = nullptr;
  int best_hits = 0;
  for (const auto& m : modules) {
    int hits = 0;
    for (const char* name : config::kMarkerExports) {
      if (api_.ModuleHasExport(m, name)) ++hits;
    }
    if (hits > best_hits) {
      best_hits = hits;
      best = &m;
    }
  }
  if (!best) return false;

  std::ostringstream oss;
  oss << "Mono module " << best->name << " matched by exports (" << best_hits << "/"
      << (sizeof(config::kMarkerExports) / sizeof(config::kMarkerExports[0])) << ")";
  AppendLogInternal(LogLevel::kDebug, "module", oss.str());
  out_module = Describe(*best, ModuleDescriptor::Method::kExportHeuristic);
  return true;
}

std::vector<std::string> ModuleLocator::LoadedModuleNames() {
  std::vector<std::string> names;
  for (const auto& m : api_.EnumerateModules()) names.push_back(m.name);
  return names;
}

ModuleDescriptor ModuleLocator::FindModule(const std::vector<std::string>& candidates) {
  ModuleDescriptor found;
  if (TryFindModule(candidates, found)) return found;
  throw ModuleNotFoundError(
    "Failed to discover Mono runtime module. Specify the module name or ensure Mono is loaded "
    "before the bridge attaches",
    candidates, LoadedModuleNames());
}

ModuleDescriptor ModuleLocator::WaitForModule(const std::vector<std::string>& candidates,
                                              int timeout_ms, int warn_after_ms) {
  using Clock = std::chrono::steady_clock;
  const auto start = Clock::now();
  const auto deadline = start + std::chrono::milliseconds(timeout_ms);
  const auto warn_at = start + std::chrono::milliseconds(warn_after_ms);
  bool warned = false;

  for (;;) {
    ModuleDescriptor found;
    if (TryFindModule(candidates, found)) {
      AppendLogInternal(LogLevel::kInfo, "module", "Found Mono module: " + found.name);
      return found;
    }
    auto now = Clock::now();
    if (now >= deadline) break;
    if (!warned && now >= warn_at) {
      warned = true;
      std::string hint =
        candidates.empty() ? std::string() : " (candidates: " + JoinCandidates(candidates) + ")";
      AppendLogInternal(LogLevel::kWarn, "module", "Waiting for Mono module to load" + hint);
    }
    auto nap = std::chrono::milliseconds(poll_interval_ms_);
    if (now + nap > deadline) nap = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    std::this_thread::sleep_for(nap);
  }

  AppendLogInternal(LogLevel::kError, "module", "Mono module not found before timeout");
  throw ModuleNotFoundError(
    "Timed out waiting for Mono module to load. Ensure Mono is loaded before the bridge attaches "
    "or configure the module name",
    candidates, LoadedModuleNames());
}

}  // namespace monoattach
