#include "pch.h"

#include "perform_scheduler.h"

#include "errors.h"
#include "log.h"

namespace monoattach {

bool PerformScheduler::Prepare(PerformMode mode) {
  gate_.Initialize().get();

  bool attached_by_this_call = false;
  if (!threads_.IsAttached()) {
    ThreadManager::AttachResult attach = threads_.EnsureAttached();
    if (attach.performed_attach) {
      threads_.MarkBridgeOwned();
      attached_by_this_call = true;
    }
  }

  if (mode == PerformMode::kBind) unload_hook_.Install();
  return attached_by_this_call;
}

void PerformScheduler::ReportFailure(std::exception_ptr error) {
  AppendLogInternal(LogLevel::kError, "perform",
    "Unhandled error in Perform callback: " + DescribeException(error));
  // TODO: drop the second delivery once callers confirm they always observe
  // the returned future.
  try {
    host_.ScheduleTick([error]() { std::rethrow_exception(error); });
  }
  catch (const std::exception& e) {
    AppendLogInternal(LogLevel::kWarn, "perform", std::string("Could not schedule error tick: ") + e.what());
  }
}

void PerformScheduler::Cleanup(PerformMode mode, bool attached_by_this_call) {
  switch (mode) {
    case PerformMode::kBind:
      // Stays attached until the unload hook disposes the context.
      break;
    case PerformMode::kFree:
      if (!attached_by_this_call) break;
      try {
        threads_.DetachBridgeOwned();
      }
      catch (const std::exception& e) {
        AppendLogInternal(LogLevel::kWarn, "perform", std::string("Detach after Perform failed: ") + e.what());
      }
      break;
    case PerformMode::kLeak:
      break;
  }
}

}  // namespace monoattach
