#include "kernel/invocation_rules.hpp"

#include <cctype>
#include <regex>
#include <sstream>

namespace ie {

namespace {

std::string substitute(const std::string& element, const std::string& line,
                       const std::string& path) {
  std::string out;
  out.reserve(element.size() + path.size());
  size_t i = 0;
  while (i < element.size()) {
    if (element.compare(i, 6, "{line}") == 0) {
      out += line;
      i += 6;
    } else if (element.compare(i, 6, "{path}") == 0) {
      out += path;
      i += 6;
    } else {
      out += element[i++];
    }
  }
  return out;
}

bool matches(const std::string& pattern, const std::string& editor) {
  std::regex re(pattern, std::regex::ECMAScript);
  return std::regex_search(editor, re,
                           std::regex_constants::match_continuous);
}

}  // namespace

std::vector<std::string> EditorInvocation::argv() const {
  std::vector<std::string> out;
  out.reserve(args.size() + 1);
  out.push_back(program);
  out.insert(out.end(), args.begin(), args.end());
  return out;
}

std::string EditorInvocation::display() const {
  std::string out = shell_quote(program);
  for (const auto& a : args) {
    out += ' ';
    out += shell_quote(a);
  }
  return out;
}

EditorInvocationRules EditorInvocationRules::defaults() {
  EditorInvocationRules table;
  table.rules_.push_back({"^mate", {"-l", "{line}", "{path}"}});
  return table;
}

EditorInvocationRules& EditorInvocationRules::add_rule(
    const EditorInvocationRule& rule) {
  if (rule.pattern.empty()) {
    throw EditError(EditErrc::InvalidConfig, "Editor rule has an empty pattern.");
  }
  try {
    std::regex probe(rule.pattern, std::regex::ECMAScript);
    (void)probe;
  } catch (const std::regex_error& e) {
    throw EditError(EditErrc::InvalidConfig,
                    "Invalid editor rule pattern '" + rule.pattern + "': " + e.what());
  }
  rules_.insert(rules_.begin(), rule);
  return *this;
}

const EditorInvocationRule* EditorInvocationRules::match(
    const std::string& editor) const {
  for (const auto& rule : rules_) {
    if (matches(rule.pattern, editor)) return &rule;
  }
  return nullptr;
}

EditorInvocation EditorInvocationRules::build(const std::string& editor,
                                              int line_offset,
                                              const fs::path& path) const {
  std::vector<std::string> words = split_editor_command(editor);
  if (words.empty()) {
    throw EditError(EditErrc::InvalidConfig, "Editor command is empty.");
  }

  const EditorInvocationRule* rule = match(editor);
  const auto& tmpl = rule ? rule->arg_template : fallback_template_;

  EditorInvocation inv;
  inv.program = words.front();
  inv.args.assign(words.begin() + 1, words.end());
  const std::string line = std::to_string(line_offset);
  const std::string path_str = path.string();
  for (const auto& element : tmpl) {
    inv.args.push_back(substitute(element, line, path_str));
  }
  return inv;
}

std::vector<std::string> split_editor_command(const std::string& editor) {
  std::vector<std::string> words;
  std::istringstream iss(editor);
  std::string w;
  while (iss >> w) words.push_back(w);
  return words;
}

std::string shell_quote(const std::string& arg) {
  if (!arg.empty()) {
    bool plain = true;
    for (unsigned char c : arg) {
      if (!(std::isalnum(c) || c == '_' || c == '-' || c == '.' || c == '/' ||
            c == '+' || c == ':' || c == '=' || c == ',')) {
        plain = false;
        break;
      }
    }
    if (plain) return arg;
  }
  std::string out = "'";
  for (char c : arg) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out += c;
    }
  }
  out += '\'';
  return out;
}

}  // namespace ie
