// File: tests/test_module_locator.cpp
// Purpose: Mono module discovery by explicit name, common name and exports.

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

#include "errors.h"
#include "fake_runtime_api.h"
#include "log.h"
#include "module_locator.h"

using namespace monoattach;
using monoattach::fakes::FakeRuntimeApi;

namespace {

class ModuleLocatorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    SetLogFileEnabled(false);
    ClearLog();
    SetLogLevel(LogLevel::kInfo);
  }

  static bool SnapshotContains(const std::string& needle) {
    std::vector<std::string> lines;
    GetLogSnapshot(256, lines);
    for (const auto& line : lines) {
      if (line.find(needle) != std::string::npos) return true;
    }
    return false;
  }

  FakeRuntimeApi api_;
  ModuleLocator locator_{api_, 5};
};

}  // namespace

TEST_F(ModuleLocatorTest, ExplicitCandidatesFirstMatchWins) {
  api_.AddModule("libmono-2.0.so", "/usr/lib/libmono-2.0.so");
  api_.AddModule("libmonosgen-2.0.so", "/opt/game/libmonosgen-2.0.so");

  ModuleDescriptor found = locator_.FindModule({"libmonosgen-2.0.so", "libmono-2.0.so"});
  EXPECT_EQ(found.name, "libmonosgen-2.0.so");
  EXPECT_EQ(found.method, ModuleDescriptor::Method::kExplicit);
}

TEST_F(ModuleLocatorTest, MatchesByPathSuffix) {
  api_.AddModule("mono", "C:\\Game\\MonoBleedingEdge\\EmbedRuntime\\mono-2.0-bdwgc.dll");
  ModuleDescriptor found;
  ASSERT_TRUE(locator_.TryFindModule({"mono-2.0-bdwgc.dll"}, found));
  EXPECT_EQ(found.name, "mono");
}

TEST_F(ModuleLocatorTest, ExplicitCandidatesDoNotFallBack) {
  api_.AddModule("libmonosgen-2.0.so", "/opt/game/libmonosgen-2.0.so");
  ModuleDescriptor found;
  EXPECT_FALSE(locator_.TryFindModule({"mono-2.0-bdwgc.dll"}, found));
}

TEST_F(ModuleLocatorTest, AutoDetectsCommonName) {
  api_.AddModule("libc.so.6", "/lib/libc.so.6");
  api_.AddModule("libmonosgen-2.0.so", "/opt/game/libmonosgen-2.0.so");

  ModuleDescriptor found = locator_.FindModule({});
  EXPECT_EQ(found.name, "libmonosgen-2.0.so");
  EXPECT_EQ(found.method, ModuleDescriptor::Method::kCommonName);
}

TEST_F(ModuleLocatorTest, FallsBackToExportHeuristic) {
  api_.AddModule("libc.so.6", "/lib/libc.so.6");
  api_.AddModule("libcustom.so", "/opt/game/libcustom.so");
  api_.AddModule("libpartial.so", "/opt/game/libpartial.so");
  api_.AddExport("libpartial.so", "mono_thread_attach");
  api_.AddExport("libcustom.so", "mono_runtime_invoke");
  api_.AddExport("libcustom.so", "mono_thread_attach");
  api_.AddExport("libcustom.so", "mono_get_root_domain");

  ModuleDescriptor found = locator_.FindModule({});
  EXPECT_EQ(found.name, "libcustom.so");
  EXPECT_EQ(found.method, ModuleDescriptor::Method::kExportHeuristic);
}

TEST_F(ModuleLocatorTest, FindModuleReportsCandidates) {
  api_.AddModule("libc.so.6", "/lib/libc.so.6");
  try {
    locator_.FindModule({"mono-2.0-bdwgc.dll", "mono.dll"});
    FAIL() << "expected ModuleNotFoundError";
  }
  catch (const ModuleNotFoundError& e) {
    ASSERT_EQ(e.candidates().size(), 2u);
    EXPECT_EQ(e.candidates()[0], "mono-2.0-bdwgc.dll");
    EXPECT_EQ(e.loaded_modules().size(), 1u);
    EXPECT_NE(std::string(e.what()).find("candidates: mono-2.0-bdwgc.dll, mono.dll"),
              std::string::npos);
  }
}

TEST_F(ModuleLocatorTest, WaitReturnsOnceModuleLoads) {
  api_.AddModule("libmonosgen-2.0.so", "/opt/game/libmonosgen-2.0.so");
  api_.HideModulesFor(std::chrono::milliseconds(40));

  ModuleDescriptor found = locator_.WaitForModule({"libmonosgen-2.0.so"}, 2000, 1000);
  EXPECT_EQ(found.name, "libmonosgen-2.0.so");
  EXPECT_GT(api_.enumerate_calls.load(), 1);
  EXPECT_FALSE(SnapshotContains("Waiting for Mono module"));
}

TEST_F(ModuleLocatorTest, WaitWarnsThenTimesOut) {
  auto start = std::chrono::steady_clock::now();
  EXPECT_THROW(locator_.WaitForModule({"mono-2.0-bdwgc.dll"}, 60, 10), ModuleNotFoundError);
  auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_GE(elapsed, std::chrono::milliseconds(60));
  EXPECT_TRUE(SnapshotContains("Waiting for Mono module to load (candidates: mono-2.0-bdwgc.dll)"));
  EXPECT_TRUE(SnapshotContains("Mono module not found before timeout"));
}
