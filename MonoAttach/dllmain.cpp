#include "pch.h"

#include "log.h"
#include "mono_bridge.h"

// Library teardown is the host's unload signal: run the cleanup that
// bind-mode Perform() registered. Nothing heavy happens on load.

namespace {
  void OnLibraryUnload() {
    monoattach::AppendLogInternal(monoattach::LogLevel::kInfo, "host", "Library unloading");
    monoattach::MonoShutdown();
  }
}  // namespace

#if defined(_WIN32)
BOOL APIENTRY DllMain(HMODULE module, DWORD reason, LPVOID reserved) {
  switch (reason) {
    case DLL_PROCESS_ATTACH:
      DisableThreadLibraryCalls(module);
      break;
    case DLL_PROCESS_DETACH:
      // reserved != nullptr: the process is exiting and other threads are gone.
      if (reserved == nullptr) OnLibraryUnload();
      break;
    default:
      break;
  }
  return TRUE;
}
#else
__attribute__((destructor)) static void MonoAttachUnload() {
  OnLibraryUnload();
}
#endif
