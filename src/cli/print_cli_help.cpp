// FILE: src/cli/print_cli_help.cpp
#include "cli/print_cli_help.hpp"

#include <iostream>

void print_cli_help() {
  std::cout
      << "Usage: interedit [options] [FILE]\n\n"
      << "Opens FILE (or --text) in $EDITOR and writes the result back.\n\n"
      << "Options:\n"
      << "  -h, --help                 Show this help message\n"
      << "  -n, --name <name>          Document name shown to the editor\n"
      << "  -l, --line <n>             Line to place the cursor on\n"
      << "  -e, --fallback-editor <c>  Editor used when $EDITOR is unset and\n"
      << "                             there is no `editor` on the PATH\n"
      << "  -t, --text <text>          Edit <text> instead of FILE\n"
      << "  -o, --output <file>        Write the result to <file> (default: FILE,\n"
      << "                             or stdout with --text)\n"
      << "      --config <file>        Use a specific configuration file\n"
      << "      --init-config <file>   Write a default configuration file\n"
      << "      --print-editor         Print the editor command line and exit\n"
      << "      --summary              Show a summary box after editing\n"
      << "      --confirm              Ask before writing the result\n"
      << "      --json                 Print a JSON report instead of the text\n"
      << "  -v, --verbose              Report what the edit session did\n\n"
      << "Exit status: 0 edited, 1 edit cancelled, 2 error.\n"
      << std::endl;
}
