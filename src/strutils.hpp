#pragma once

#include <string>

bool startswith(const std::string& fullString, const std::string& start);
bool endswith(const std::string& fullString, const std::string& ending);
