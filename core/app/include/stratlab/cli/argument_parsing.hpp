#pragma once

#include <string>

namespace stratlab {

// -----------------------------------------------------------------------------
// Command-line argument parsing
// -----------------------------------------------------------------------------
// Strict conversions for stratlab_cli arguments. The whole argument must be
// the value: "100abc", "" and " 5" are rejected, unlike plain std::stod /
// std::stoi which stop at the first bad character.
//
// Every function throws std::invalid_argument naming `what` and the text.
// -----------------------------------------------------------------------------
double parseDoubleArgument(const std::string& text, const char* what);

int parseIntArgument(const std::string& text, const char* what);

// "true" | "1" | "american" → true, "false" | "0" | "european" → false.
bool parseBoolArgument(const std::string& text, const char* what);

}  // namespace stratlab
