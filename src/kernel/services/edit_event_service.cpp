#include "kernel/services/edit_event_service.hpp"

namespace ie {

void EditEventService::push(Kind kind, const std::string& detail) {
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_.push_back(EditEvent{ kind, detail });
}

std::vector<EditEventService::EditEvent> EditEventService::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<EditEvent> out;
    out.swap(buffer_);
    return out;
}

const char* event_kind_name(EditEventService::Kind kind) {
    switch (kind) {
        case EditEventService::Kind::TempDirCreated: return "temp_dir_created";
        case EditEventService::Kind::EditorLaunched: return "editor_launched";
        case EditEventService::Kind::EditorExited: return "editor_exited";
        case EditEventService::Kind::CleanupFailed: return "cleanup_failed";
    }
    return "unknown";
}

} // namespace ie
