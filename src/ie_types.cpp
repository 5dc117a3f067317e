#include "ie_types.hpp"

namespace ie {

const char* errc_name(EditErrc code) {
    switch (code) {
        case EditErrc::Unknown: return "unknown";
        case EditErrc::Io: return "io";
        case EditErrc::EditorExit: return "editor_exit";
        case EditErrc::Spawn: return "spawn";
        case EditErrc::InvalidConfig: return "invalid_config";
    }
    return "unknown";
}

} // namespace ie
