// FILE: src/cli/ask_yesno.cpp
#include <iostream>
#include "cli/ask_yesno.hpp"

bool ask_yesno(const std::string& q, bool def) {
    const char* hint = def ? " [Y/n]: " : " [y/N]: ";
    while (true) {
        std::cerr << q << hint << std::flush;
        std::string s;
        if (!std::getline(std::cin, s)) return def;
        if (s.empty()) return def;
        if (s == "Y" || s == "y" || s == "yes") return true;
        if (s == "N" || s == "n" || s == "no") return false;
        std::cerr << "Please answer y or n.\n";
    }
}
