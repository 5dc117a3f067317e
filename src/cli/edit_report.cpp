// FILE: src/cli/edit_report.cpp
#include "cli/edit_report.hpp"

nlohmann::json edit_report_to_json(const EditReport& report) {
    nlohmann::json j = {
        {"status", report.status},
        {"name", report.name},
        {"editor", report.editor},
        {"line_offset", report.line_offset},
        {"changed", report.changed},
    };
    if (report.exit_code) j["exit_code"] = *report.exit_code;
    if (report.error_code) j["error_code"] = ie::errc_name(*report.error_code);
    if (!report.error.empty()) j["error"] = report.error;
    if (report.status == "edited") j["content"] = report.content;

    nlohmann::json events = nlohmann::json::array();
    for (const auto& e : report.events) {
        events.push_back({{"kind", ie::event_kind_name(e.kind)}, {"detail", e.detail}});
    }
    j["events"] = events;
    return j;
}
