#pragma once

#include <string>
#include <vector>

#include "pyduino/Token.h"

namespace pyduino {

class Lexer {
public:
  explicit Lexer(const std::string &source);

  std::vector<Token> tokenize();

private:
  bool isIdentifierStart(char c) const;
  bool isIdentifierBody(char c) const;
  bool atLineStart() const;
  bool handleIndentation(std::vector<Token> &tokens);
  void skipInlineWhitespace();
  void advance();

  Token readIdentifier();
  Token readNumber();
  Token readString(size_t prefixLength);
  Token readComment();
  Token readPunct();

  std::string source_;
  size_t pos_ = 0;
  int line_ = 1;
  int column_ = 1;
  int nesting_ = 0;
  bool lineHasCode_ = false;
  std::vector<int> indents_ = {0};
};

} // namespace pyduino
