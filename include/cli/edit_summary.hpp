#pragma once

#include <ostream>
#include <string>

struct EditSummary {
    std::string name;
    std::string editor;
    std::string original;
    std::string edited;
};

// Renders a bordered box with the edited document and a status line.
// At most `max_lines` lines of the document are shown.
std::string render_edit_summary(const EditSummary& summary, int width,
                                int max_lines = 20);
void print_edit_summary(std::ostream& os, const EditSummary& summary);
