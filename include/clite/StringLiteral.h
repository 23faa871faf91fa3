#pragma once

#include <string>

namespace clite {

// Decodes a double-quoted literal lexeme (quotes included) into its value.
inline bool decodeStringLiteralText(const std::string &literal, std::string &decoded, std::string &error) {
  if (literal.size() < 2 || literal.front() != '"' || literal.back() != '"') {
    error = "invalid string literal";
    return false;
  }
  decoded.clear();
  decoded.reserve(literal.size() - 2);
  for (size_t i = 1; i + 1 < literal.size(); ++i) {
    char c = literal[i];
    if (c == '\\' && i + 2 < literal.size()) {
      char next = literal[++i];
      switch (next) {
        case 'n':
          decoded.push_back('\n');
          break;
        case 'r':
          decoded.push_back('\r');
          break;
        case 't':
          decoded.push_back('\t');
          break;
        case '0':
          decoded.push_back('\0');
          break;
        default:
          decoded.push_back(next);
          break;
      }
    } else {
      decoded.push_back(c);
    }
  }
  return true;
}

// Inverse of decodeStringLiteralText, used when printing trees.
inline std::string quoteStringLiteral(const std::string &value) {
  std::string out = "\"";
  for (char c : value) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      case '\0':
        out += "\\0";
        break;
      default:
        out.push_back(c);
        break;
    }
  }
  out.push_back('"');
  return out;
}

} // namespace clite
