#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "ie_types.hpp"

namespace ie {

class INTEREDIT_API EditEventService {
 public:
  enum class Kind { TempDirCreated, EditorLaunched, EditorExited, CleanupFailed };

  struct EditEvent {
    Kind kind;
    std::string detail;
  };

  void push(Kind kind, const std::string& detail);
  std::vector<EditEvent> drain();

 private:
  std::mutex mutex_;
  std::vector<EditEvent> buffer_;
};

INTEREDIT_API const char* event_kind_name(EditEventService::Kind kind);

}  // namespace ie
