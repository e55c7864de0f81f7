#include "stratlab/cli/argument_parsing.hpp"

#include <cctype>
#include <cstddef>
#include <stdexcept>

namespace stratlab {

namespace {

[[noreturn]] void reject(const std::string& text, const char* what) {
  throw std::invalid_argument(std::string("Invalid ") + what + ": '" + text +
                              "'");
}

// std::sto* skip leading whitespace; an argument never has any.
void requireNoLeadingSpace(const std::string& text, const char* what) {
  if (text.empty() || std::isspace(static_cast<unsigned char>(text.front()))) {
    reject(text, what);
  }
}

}  // namespace

double parseDoubleArgument(const std::string& text, const char* what) {
  requireNoLeadingSpace(text, what);
  std::size_t used = 0;
  double value = 0.0;
  try {
    value = std::stod(text, &used);
  } catch (const std::logic_error&) {
    // std::invalid_argument or std::out_of_range from std::stod.
    reject(text, what);
  }
  if (used != text.size()) {
    reject(text, what);
  }
  return value;
}

int parseIntArgument(const std::string& text, const char* what) {
  requireNoLeadingSpace(text, what);
  std::size_t used = 0;
  int value = 0;
  try {
    value = std::stoi(text, &used);
  } catch (const std::logic_error&) {
    reject(text, what);
  }
  if (used != text.size()) {
    reject(text, what);
  }
  return value;
}

bool parseBoolArgument(const std::string& text, const char* what) {
  if (text == "true" || text == "1" || text == "american") {
    return true;
  }
  if (text == "false" || text == "0" || text == "european") {
    return false;
  }
  reject(text, what);
}

}  // namespace stratlab
