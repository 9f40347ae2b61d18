#pragma once

#include <string>
#include <vector>

namespace StringUtils {
std::vector<std::string> split(const std::string& str, char delimiter);

// Splits on runs of whitespace; double quotes group words ("my file.txt").
std::vector<std::string> split_args(const std::string& str);

std::string trim(const std::string& str);
}
