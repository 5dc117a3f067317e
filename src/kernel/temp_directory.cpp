#include "kernel/temp_directory.hpp"

#include "kernel/host.hpp"
#include "kernel/services/edit_event_service.hpp"

namespace ie {

ScopedTempDirectory::ScopedTempDirectory(FileSystem& fs,
                                         const std::string& prefix,
                                         EditEventService* events)
    : fs_(fs), events_(events), path_(fs.create_temporary_directory(prefix)) {
  if (events_) {
    events_->push(EditEventService::Kind::TempDirCreated, path_.string());
  }
}

ScopedTempDirectory::~ScopedTempDirectory() {
  try {
    fs_.remove_recursive(path_);
  } catch (const std::exception& e) {
    if (events_) {
      events_->push(EditEventService::Kind::CleanupFailed, e.what());
    }
  }
}

}  // namespace ie
