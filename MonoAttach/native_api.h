#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#if defined(_WIN32)
#define MONOATTACH_CDECL __cdecl
#else
#define MONOATTACH_CDECL
#endif

namespace monoattach {

using MonoDomain = void;
using MonoThread = void;

struct ModuleInfo {
  std::string name;
  std::string path;
  uintptr_t base = 0;
  size_t size = 0;
};

// Everything the bridge needs from the target process and the Mono exports.
// MonoNativeApi is the in-process implementation; tests substitute fakes.
class NativeRuntimeApi {
 public:
  virtual ~NativeRuntimeApi() = default;

  virtual std::vector<ModuleInfo> EnumerateModules() = 0;
  virtual bool ModuleHasExport(const ModuleInfo& module, const char* export_name) = 0;

  // Resolves the domain/thread exports from |module|. Throws BridgeError when a
  // required export is missing. Unbind() forgets them again.
  virtual void Bind(const ModuleInfo& module) = 0;
  virtual void Unbind() = 0;

  // mono_get_root_domain; null until the runtime built its root domain.
  virtual MonoDomain* GetRootDomain() = 0;
  // mono_thread_attach for the calling thread; null on failure.
  virtual MonoThread* ThreadAttach(MonoDomain* domain) = 0;
  // mono_thread_detach. May throw; callers treat failures as DetachError.
  virtual void ThreadDetach(MonoThread* thread) = 0;
  // mono_thread_detach_if_exiting for the calling thread.
  virtual bool ThreadDetachIfExiting() = 0;
  // Handle of the calling thread if the runtime already knows it, else null.
  virtual MonoThread* CurrentAttachedThread() = 0;
};

std::unique_ptr<NativeRuntimeApi> CreateMonoNativeApi();

}  // namespace monoattach
