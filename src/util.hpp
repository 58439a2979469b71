#pragma once
#include <istream>
#include <string>

namespace genai {

// Trim whitespace
std::string trim(const std::string& s);

// Remove every trailing occurrence of c
std::string strip_trailing(const std::string& s, char c);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Read a stream to EOF
std::string read_all(std::istream& in);

} // namespace genai
