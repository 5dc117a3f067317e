#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "ie_types.hpp"
#include "kernel/services/edit_event_service.hpp"

struct EditReport {
    std::string status;  // "edited", "cancelled" or "error"
    std::string name;
    std::string editor;
    int line_offset = 0;
    std::optional<int> exit_code;
    std::optional<ie::EditErrc> error_code;
    std::string error;
    std::string content;
    bool changed = false;
    std::vector<ie::EditEventService::EditEvent> events;
};

nlohmann::json edit_report_to_json(const EditReport& report);
