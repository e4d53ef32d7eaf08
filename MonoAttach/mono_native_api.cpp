#include "pch.h"

#include "native_api.h"

#include <mutex>
#include <sstream>

#if defined(_WIN32)
#include <psapi.h>
#else
#include <dlfcn.h>
#include <link.h>
#endif

#include "errors.h"
#include "log.h"

namespace monoattach {

namespace {
#if defined(_WIN32)
  using NativeModule = HMODULE;
#else
  using NativeModule = void*;
#endif

  struct MonoApi {
    NativeModule module = nullptr;
    MonoDomain* (MONOATTACH_CDECL* mono_get_root_domain)() = nullptr;
    MonoThread* (MONOATTACH_CDECL* mono_thread_attach)(MonoDomain*) = nullptr;
    void(MONOATTACH_CDECL* mono_thread_detach)(MonoThread*) = nullptr;
    int(MONOATTACH_CDECL* mono_thread_detach_if_exiting)() = nullptr;
    MonoThread* (MONOATTACH_CDECL* mono_thread_current)() = nullptr;
    MonoDomain* (MONOATTACH_CDECL* mono_domain_get)() = nullptr;
  };

  std::string BaseName(const std::string& path) {
    size_t pos = path.find_last_of("/\\");
    return pos == std::string::npos ? path : path.substr(pos + 1);
  }

  bool AddressInModule(const ModuleInfo& module, const void* address) {
    uintptr_t p = reinterpret_cast<uintptr_t>(address);
#if !defined(_WIN32)
    Dl_info info = {};
    if (dladdr(address, &info) && info.dli_fbase) {
      if (reinterpret_cast<uintptr_t>(info.dli_fbase) == module.base) return true;
    }
#endif
    if (module.size == 0) return false;
    return p >= module.base && p - module.base < module.size;
  }

#if defined(_WIN32)
  template <typename T>
  bool ResolveProc(NativeModule module, const char* name, T& out) {
    out = reinterpret_cast<T>(GetProcAddress(module, name));
    return out != nullptr;
  }

  NativeModule OpenLoaded(const ModuleInfo& info) {
    return GetModuleHandleA(info.path.empty() ? info.name.c_str() : info.path.c_str());
  }

  void CloseLoaded(NativeModule) {}
#else
  template <typename T>
  bool ResolveProc(NativeModule module, const char* name, T& out) {
    out = reinterpret_cast<T>(dlsym(module, name));
    return out != nullptr;
  }

  // RTLD_NOLOAD: never load anything, only reference what is mapped already.
  NativeModule OpenLoaded(const ModuleInfo& info) {
    const std::string& target = info.path.empty() ? info.name : info.path;
    return dlopen(target.c_str(), RTLD_NOW | RTLD_NOLOAD);
  }

  void CloseLoaded(NativeModule module) {
    if (module) dlclose(module);
  }

  int CollectModule(struct dl_phdr_info* info, size_t, void* user_data) {
    auto* out = static_cast<std::vector<ModuleInfo>*>(user_data);
    if (!info->dlpi_name || !*info->dlpi_name) return 0;
    uintptr_t lo = UINTPTR_MAX;
    uintptr_t hi = 0;
    for (int i = 0; i < info->dlpi_phnum; ++i) {
      const auto& ph = info->dlpi_phdr[i];
      if (ph.p_type != PT_LOAD) continue;
      uintptr_t start = static_cast<uintptr_t>(info->dlpi_addr + ph.p_vaddr);
      uintptr_t end = start + static_cast<uintptr_t>(ph.p_memsz);
      if (start < lo) lo = start;
      if (end > hi) hi = end;
    }
    ModuleInfo m;
    m.path = info->dlpi_name;
    m.name = BaseName(m.path);
    m.base = lo == UINTPTR_MAX ? static_cast<uintptr_t>(info->dlpi_addr) : lo;
    m.size = hi > lo ? static_cast<size_t>(hi - lo) : 0;
    out->push_back(m);
    return 0;
  }
#endif

  class MonoNativeApi final : public NativeRuntimeApi {
   public:
    ~MonoNativeApi() override { Unbind(); }

    std::vector<ModuleInfo> EnumerateModules() override {
      std::vector<ModuleInfo> modules;
#if defined(_WIN32)
      HANDLE process = GetCurrentProcess();
      DWORD needed = 0;
      if (!EnumProcessModules(process, nullptr, 0, &needed) || needed == 0) {
        AppendLogInternal(LogLevel::kWarn, "native", "EnumProcessModules failed");
        return modules;
      }
      std::vector<HMODULE> handles(needed / sizeof(HMODULE));
      if (!EnumProcessModules(process, handles.data(), needed, &needed)) {
        AppendLogInternal(LogLevel::kWarn, "native", "EnumProcessModules failed");
        return modules;
      }
      handles.resize(needed / sizeof(HMODULE));
      for (HMODULE h : handles) {
        char path[MAX_PATH] = {};
        MODULEINFO mi{};
        if (!GetModuleFileNameExA(process, h, path, MAX_PATH)) continue;
        if (!GetModuleInformation(process, h, &mi, sizeof(mi))) continue;
        ModuleInfo m;
        m.path = path;
        m.name = BaseName(m.path);
        m.base = reinterpret_cast<uintptr_t>(mi.lpBaseOfDll);
        m.size = mi.SizeOfImage;
        modules.push_back(m);
      }
#else
      dl_iterate_phdr(CollectModule, &modules);
#endif
      return modules;
    }

    bool ModuleHasExport(const ModuleInfo& module, const char* export_name) override {
      NativeModule handle = OpenLoaded(module);
      if (!handle) return false;
      void* sym = nullptr;
      bool found = ResolveProc(handle, export_name, sym);
      CloseLoaded(handle);
      // dlsym also searches the handle's dependencies; a library that merely
      // links against Mono must not score. Same for forwarded PE exports.
      return found && AddressInModule(module, sym);
    }

    void Bind(const ModuleInfo& module) override {
      std::lock_guard<std::mutex> lock(mutex_);
      if (api_.module) return;

      NativeModule handle = OpenLoaded(module);
      if (!handle) {
        throw BridgeError("Mono module " + module.name + " is not mapped in this process");
      }

      MonoApi api = {};
      api.module = handle;
      std::ostringstream missing;
      if (!ResolveProc(handle, "mono_get_root_domain", api.mono_get_root_domain))
        missing << " mono_get_root_domain";
      if (!ResolveProc(handle, "mono_thread_attach", api.mono_thread_attach))
        missing << " mono_thread_attach";
      if (!ResolveProc(handle, "mono_thread_detach", api.mono_thread_detach))
        missing << " mono_thread_detach";
      if (!missing.str().empty()) {
        CloseLoaded(handle);
        AppendLogInternal(LogLevel::kError, "native",
          "Failed to resolve Mono exports:" + missing.str());
        throw BridgeError("Failed to resolve Mono exports from " + module.name + ":" + missing.str());
      }
      ResolveProc(handle, "mono_thread_detach_if_exiting", api.mono_thread_detach_if_exiting);
      ResolveProc(handle, "mono_thread_current", api.mono_thread_current);
      ResolveProc(handle, "mono_domain_get", api.mono_domain_get);

      api_ = api;
      AppendLogInternal(LogLevel::kInfo, "native", "Resolved Mono exports from " + module.name);
    }

    void Unbind() override {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!api_.module) return;
      CloseLoaded(api_.module);
      api_ = {};
    }

    MonoDomain* GetRootDomain() override {
      MonoApi api = Snapshot();
      if (!api.mono_get_root_domain) return nullptr;
      return api.mono_get_root_domain();
    }

    MonoThread* ThreadAttach(MonoDomain* domain) override {
      MonoApi api = Snapshot();
      if (!api.mono_thread_attach || !domain) return nullptr;
      return api.mono_thread_attach(domain);
    }

    void ThreadDetach(MonoThread* thread) override {
      MonoApi api = Snapshot();
      if (!api.mono_thread_detach) throw DetachError("mono_thread_detach is not resolved");
      if (!thread) throw DetachError("mono_thread_detach called with a null thread");
      api.mono_thread_detach(thread);
    }

    bool ThreadDetachIfExiting() override {
      MonoApi api = Snapshot();
      if (!api.mono_thread_detach_if_exiting) {
        AppendLogOnce("native_no_detach_if_exiting",
          "mono_thread_detach_if_exiting is not exported by this runtime");
        return false;
      }
      return api.mono_thread_detach_if_exiting() != 0;
    }

    MonoThread* CurrentAttachedThread() override {
      MonoApi api = Snapshot();
      // mono_domain_get reads the calling thread's TLS; null means not attached.
      if (!api.mono_domain_get || !api.mono_thread_current) return nullptr;
      if (!api.mono_domain_get()) return nullptr;
      return api.mono_thread_current();
    }

   private:
    MonoApi Snapshot() {
      std::lock_guard<std::mutex> lock(mutex_);
      return api_;
    }

    std::mutex mutex_;
    MonoApi api_;
  };
}  // namespace

std::unique_ptr<NativeRuntimeApi> CreateMonoNativeApi() {
  return std::unique_ptr<NativeRuntimeApi>(new MonoNativeApi());
}

}  // namespace monoattach
