#pragma once
#include <string>

// Prompts on stderr so that stdout can carry the edited document.
bool ask_yesno(const std::string& q, bool def);
