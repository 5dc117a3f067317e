// FILE: src/cli/edit_summary.cpp
#include "cli/edit_summary.hpp"

#include <algorithm>
#include <sstream>
#include <vector>

#include "ftxui/dom/elements.hpp"
#include "ftxui/screen/screen.hpp"
#include "ftxui/screen/terminal.hpp"

using namespace ftxui;

namespace {

std::vector<std::string> split_lines(const std::string& s) {
    std::vector<std::string> lines;
    std::istringstream iss(s);
    std::string line;
    while (std::getline(iss, line)) lines.push_back(line);
    return lines;
}

} // namespace

std::string render_edit_summary(const EditSummary& summary, int width, int max_lines) {
    auto lines = split_lines(summary.edited);
    const int shown = std::min<int>(max_lines, static_cast<int>(lines.size()));

    Elements body;
    for (int i = 0; i < shown; ++i) {
        std::string num = std::to_string(i + 1);
        if (num.size() < 4) num.insert(0, 4 - num.size(), ' ');
        body.push_back(hbox({ text(num + " ") | dim, text(lines[i]) }));
    }
    if (static_cast<int>(lines.size()) > shown) {
        body.push_back(text("... " + std::to_string(lines.size() - shown) + " more lines") | dim);
    }
    if (lines.empty()) body.push_back(text("(empty)") | dim);

    const bool changed = summary.edited != summary.original;
    auto status = hbox({
        text(changed ? "modified" : "unchanged") | bold,
        filler(),
        text(std::to_string(summary.edited.size()) + " bytes, " +
             std::to_string(lines.size()) + " lines") | dim,
    });

    auto doc = window(text(" " + summary.name + " (" + summary.editor + ") "),
                      vbox({ vbox(std::move(body)), separator(), status }));

    auto screen = Screen::Create(Dimension::Fixed(width), Dimension::Fit(doc));
    Render(screen, doc);
    return screen.ToString();
}

void print_edit_summary(std::ostream& os, const EditSummary& summary) {
    int width = Terminal::Size().dimx;
    if (width <= 0) width = 80;
    os << render_edit_summary(summary, width) << std::endl;
}
