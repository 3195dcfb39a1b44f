#include "pyduino/Lexer.h"

#include <cctype>
#include <unordered_map>

namespace pyduino {

namespace {
const std::unordered_map<std::string, TokenKind> &keywordTable() {
  static const std::unordered_map<std::string, TokenKind> table = {
      {"def", TokenKind::KeywordDef},         {"if", TokenKind::KeywordIf},
      {"elif", TokenKind::KeywordElif},       {"else", TokenKind::KeywordElse},
      {"while", TokenKind::KeywordWhile},     {"for", TokenKind::KeywordFor},
      {"in", TokenKind::KeywordIn},           {"break", TokenKind::KeywordBreak},
      {"continue", TokenKind::KeywordContinue}, {"pass", TokenKind::KeywordPass},
      {"return", TokenKind::KeywordReturn},   {"import", TokenKind::KeywordImport},
      {"from", TokenKind::KeywordFrom},       {"as", TokenKind::KeywordAs},
      {"and", TokenKind::KeywordAnd},         {"or", TokenKind::KeywordOr},
      {"not", TokenKind::KeywordNot},         {"is", TokenKind::KeywordIs},
      {"lambda", TokenKind::KeywordLambda},   {"True", TokenKind::KeywordTrue},
      {"False", TokenKind::KeywordFalse},     {"None", TokenKind::KeywordNone},
  };
  return table;
}

bool isAsciiAlpha(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

bool isAsciiDigit(char c) {
  return c >= '0' && c <= '9';
}

std::string describeCharacter(char c) {
  unsigned char byte = static_cast<unsigned char>(c);
  if (byte >= 0x20 && byte < 0x7F) {
    return std::string(1, c);
  }
  static const char *hex = "0123456789abcdef";
  return std::string("\\x") + hex[byte >> 4] + hex[byte & 0xF];
}

bool isStringPrefixChar(char c) {
  switch (c) {
  case 'r':
  case 'R':
  case 'b':
  case 'B':
  case 'u':
  case 'U':
  case 'f':
  case 'F':
    return true;
  default:
    return false;
  }
}

bool isQuote(char c) {
  return c == '"' || c == '\'';
}
} // namespace

const char *tokenKindName(TokenKind kind) {
  switch (kind) {
  case TokenKind::Identifier:
    return "Identifier";
  case TokenKind::Number:
    return "Number";
  case TokenKind::String:
    return "String";
  case TokenKind::Newline:
    return "Newline";
  case TokenKind::Indent:
    return "Indent";
  case TokenKind::Dedent:
    return "Dedent";
  case TokenKind::Comment:
    return "Comment";
  case TokenKind::Invalid:
    return "Invalid";
  case TokenKind::End:
    return "End";
  case TokenKind::KeywordDef:
  case TokenKind::KeywordIf:
  case TokenKind::KeywordElif:
  case TokenKind::KeywordElse:
  case TokenKind::KeywordWhile:
  case TokenKind::KeywordFor:
  case TokenKind::KeywordIn:
  case TokenKind::KeywordBreak:
  case TokenKind::KeywordContinue:
  case TokenKind::KeywordPass:
  case TokenKind::KeywordReturn:
  case TokenKind::KeywordImport:
  case TokenKind::KeywordFrom:
  case TokenKind::KeywordAs:
  case TokenKind::KeywordAnd:
  case TokenKind::KeywordOr:
  case TokenKind::KeywordNot:
  case TokenKind::KeywordIs:
  case TokenKind::KeywordLambda:
  case TokenKind::KeywordTrue:
  case TokenKind::KeywordFalse:
  case TokenKind::KeywordNone:
    return "Keyword";
  default:
    return "Punct";
  }
}

Lexer::Lexer(const std::string &source) : source_(source) {
  if (source_.compare(0, 3, "\xEF\xBB\xBF") == 0) {
    pos_ = 3;
  }
}

std::vector<Token> Lexer::tokenize() {
  std::vector<Token> tokens;
  while (true) {
    if (nesting_ == 0 && !lineHasCode_ && atLineStart()) {
      if (!handleIndentation(tokens)) {
        tokens.push_back({TokenKind::End, "", line_, column_});
        return tokens;
      }
    }
    skipInlineWhitespace();
    if (pos_ >= source_.size()) {
      if (lineHasCode_) {
        tokens.push_back({TokenKind::Newline, "", line_, column_});
        lineHasCode_ = false;
      }
      while (indents_.size() > 1) {
        indents_.pop_back();
        tokens.push_back({TokenKind::Dedent, "", line_, column_});
      }
      tokens.push_back({TokenKind::End, "", line_, column_});
      break;
    }
    char c = source_[pos_];
    if (c == '\n' || c == '\r') {
      if (nesting_ == 0 && lineHasCode_) {
        tokens.push_back({TokenKind::Newline, "", line_, column_});
        lineHasCode_ = false;
      }
      if (c == '\r' && pos_ + 1 < source_.size() && source_[pos_ + 1] == '\n') {
        ++pos_;
      }
      advance();
      continue;
    }
    if (c == '#') {
      tokens.push_back(readComment());
      continue;
    }
    if (c == '\\') {
      size_t next = pos_ + 1;
      if (next < source_.size() && source_[next] == '\r') {
        ++next;
      }
      if (next < source_.size() && source_[next] == '\n') {
        while (pos_ < next) {
          ++pos_;
          ++column_;
        }
        advance();
        continue;
      }
      tokens.push_back({TokenKind::Invalid, "unexpected character after line continuation", line_, column_});
      tokens.push_back({TokenKind::End, "", line_, column_});
      return tokens;
    }
    Token token;
    if (isIdentifierStart(c)) {
      size_t prefixLength = 0;
      while (pos_ + prefixLength < source_.size() && prefixLength < 2 &&
             isStringPrefixChar(source_[pos_ + prefixLength])) {
        ++prefixLength;
      }
      if (prefixLength > 0 && pos_ + prefixLength < source_.size() && isQuote(source_[pos_ + prefixLength])) {
        token = readString(prefixLength);
      } else {
        token = readIdentifier();
      }
    } else if (isQuote(c)) {
      token = readString(0);
    } else if (isAsciiDigit(c) || (c == '.' && pos_ + 1 < source_.size() && isAsciiDigit(source_[pos_ + 1]))) {
      token = readNumber();
    } else {
      token = readPunct();
    }
    lineHasCode_ = true;
    const bool invalid = token.kind == TokenKind::Invalid;
    tokens.push_back(std::move(token));
    if (invalid) {
      tokens.push_back({TokenKind::End, "", line_, column_});
      return tokens;
    }
  }
  return tokens;
}

// Bytes of multi-byte UTF-8 sequences are accepted so non-ASCII identifiers pass through unchanged.
bool Lexer::isIdentifierStart(char c) const {
  return isAsciiAlpha(c) || c == '_' || static_cast<unsigned char>(c) >= 0x80;
}

bool Lexer::isIdentifierBody(char c) const {
  return isIdentifierStart(c) || isAsciiDigit(c);
}

bool Lexer::atLineStart() const {
  return column_ == 1;
}

bool Lexer::handleIndentation(std::vector<Token> &tokens) {
  int width = 0;
  while (pos_ < source_.size()) {
    char c = source_[pos_];
    if (c == ' ') {
      ++width;
    } else if (c == '\t') {
      width = (width / 8 + 1) * 8;
    } else if (c == '\f') {
      width = 0;
    } else {
      break;
    }
    advance();
  }
  if (pos_ >= source_.size()) {
    return true;
  }
  char c = source_[pos_];
  if (c == '\n' || c == '\r' || c == '#') {
    return true;
  }
  if (c == '\\' && pos_ + 1 < source_.size() && (source_[pos_ + 1] == '\n' || source_[pos_ + 1] == '\r')) {
    return true;
  }
  lineHasCode_ = true;
  if (width > indents_.back()) {
    indents_.push_back(width);
    tokens.push_back({TokenKind::Indent, "", line_, column_});
    return true;
  }
  while (width < indents_.back()) {
    indents_.pop_back();
    tokens.push_back({TokenKind::Dedent, "", line_, column_});
  }
  if (width != indents_.back()) {
    tokens.push_back({TokenKind::Invalid, "unindent does not match any outer indentation level", line_, column_});
    return false;
  }
  return true;
}

void Lexer::skipInlineWhitespace() {
  while (pos_ < source_.size()) {
    char c = source_[pos_];
    if (c != ' ' && c != '\t' && c != '\f') {
      break;
    }
    advance();
  }
}

void Lexer::advance() {
  if (pos_ >= source_.size()) {
    return;
  }
  if (source_[pos_] == '\n') {
    ++line_;
    column_ = 1;
  } else {
    ++column_;
  }
  ++pos_;
}

Token Lexer::readIdentifier() {
  int startLine = line_;
  int startColumn = column_;
  size_t start = pos_;
  while (pos_ < source_.size() && isIdentifierBody(source_[pos_])) {
    advance();
  }
  std::string text = source_.substr(start, pos_ - start);
  auto it = keywordTable().find(text);
  if (it != keywordTable().end()) {
    return {it->second, text, startLine, startColumn};
  }
  return {TokenKind::Identifier, text, startLine, startColumn};
}

Token Lexer::readNumber() {
  int startLine = line_;
  int startColumn = column_;
  size_t start = pos_;
  auto digitsWhile = [&](auto predicate) {
    while (pos_ < source_.size() && (predicate(source_[pos_]) || source_[pos_] == '_')) {
      advance();
    }
  };
  if (source_[pos_] == '0' && pos_ + 1 < source_.size() &&
      (source_[pos_ + 1] == 'x' || source_[pos_ + 1] == 'X' || source_[pos_ + 1] == 'o' ||
       source_[pos_ + 1] == 'O' || source_[pos_ + 1] == 'b' || source_[pos_ + 1] == 'B')) {
    advance();
    advance();
    digitsWhile([](char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; });
    return {TokenKind::Number, source_.substr(start, pos_ - start), startLine, startColumn};
  }
  digitsWhile(isAsciiDigit);
  if (pos_ < source_.size() && source_[pos_] == '.') {
    advance();
    digitsWhile(isAsciiDigit);
  }
  if (pos_ < source_.size() && (source_[pos_] == 'e' || source_[pos_] == 'E')) {
    size_t scan = pos_ + 1;
    if (scan < source_.size() && (source_[scan] == '+' || source_[scan] == '-')) {
      ++scan;
    }
    if (scan < source_.size() && isAsciiDigit(source_[scan])) {
      while (pos_ < scan) {
        advance();
      }
      digitsWhile(isAsciiDigit);
    }
  }
  if (pos_ < source_.size() && (source_[pos_] == 'j' || source_[pos_] == 'J')) {
    advance();
  }
  if (pos_ < source_.size() && isIdentifierStart(source_[pos_])) {
    return {TokenKind::Invalid, "invalid numeric literal", startLine, startColumn};
  }
  return {TokenKind::Number, source_.substr(start, pos_ - start), startLine, startColumn};
}

Token Lexer::readString(size_t prefixLength) {
  int startLine = line_;
  int startColumn = column_;
  size_t start = pos_;
  for (size_t i = 0; i < prefixLength; ++i) {
    advance();
  }
  char quote = source_[pos_];
  bool triple = pos_ + 2 < source_.size() && source_[pos_ + 1] == quote && source_[pos_ + 2] == quote;
  size_t quoteLength = triple ? 3 : 1;
  for (size_t i = 0; i < quoteLength; ++i) {
    advance();
  }
  while (pos_ < source_.size()) {
    char c = source_[pos_];
    if (c == '\\') {
      advance();
      if (pos_ < source_.size()) {
        advance();
      }
      continue;
    }
    if (!triple && (c == '\n' || c == '\r')) {
      break;
    }
    if (c == quote) {
      if (!triple) {
        advance();
        return {TokenKind::String, source_.substr(start, pos_ - start), startLine, startColumn};
      }
      if (pos_ + 2 < source_.size() && source_[pos_ + 1] == quote && source_[pos_ + 2] == quote) {
        advance();
        advance();
        advance();
        return {TokenKind::String, source_.substr(start, pos_ - start), startLine, startColumn};
      }
    }
    advance();
  }
  return {TokenKind::Invalid, "unterminated string literal", startLine, startColumn};
}

Token Lexer::readComment() {
  int startLine = line_;
  int startColumn = column_;
  advance();
  size_t start = pos_;
  while (pos_ < source_.size() && source_[pos_] != '\n' && source_[pos_] != '\r') {
    advance();
  }
  return {TokenKind::Comment, source_.substr(start, pos_ - start), startLine, startColumn};
}

Token Lexer::readPunct() {
  int startLine = line_;
  int startColumn = column_;
  auto take = [&](size_t count, TokenKind kind) -> Token {
    std::string text = source_.substr(pos_, count);
    for (size_t i = 0; i < count; ++i) {
      advance();
    }
    return {kind, text, startLine, startColumn};
  };
  auto startsWith = [&](const char *text) {
    return source_.compare(pos_, std::char_traits<char>::length(text), text) == 0;
  };

  if (startsWith("**=") || startsWith("//=") || startsWith(">>=") || startsWith("<<=")) {
    return take(3, TokenKind::AugAssign);
  }
  if (startsWith("...")) {
    return take(3, TokenKind::Ellipsis);
  }
  if (startsWith("+=") || startsWith("-=") || startsWith("*=") || startsWith("/=") || startsWith("%=") ||
      startsWith("&=") || startsWith("|=") || startsWith("^=") || startsWith("@=")) {
    return take(2, TokenKind::AugAssign);
  }
  if (startsWith("->")) {
    return take(2, TokenKind::Arrow);
  }
  if (startsWith("**")) {
    return take(2, TokenKind::DoubleStar);
  }
  if (startsWith("//")) {
    return take(2, TokenKind::DoubleSlash);
  }
  if (startsWith("<<")) {
    return take(2, TokenKind::LeftShift);
  }
  if (startsWith(">>")) {
    return take(2, TokenKind::RightShift);
  }
  if (startsWith("==")) {
    return take(2, TokenKind::EqualEqual);
  }
  if (startsWith("!=")) {
    return take(2, TokenKind::NotEqual);
  }
  if (startsWith("<=")) {
    return take(2, TokenKind::LessEqual);
  }
  if (startsWith(">=")) {
    return take(2, TokenKind::GreaterEqual);
  }
  if (startsWith(":=")) {
    return {TokenKind::Invalid, "assignment expressions are not supported", startLine, startColumn};
  }

  char c = source_[pos_];
  switch (c) {
  case '(':
    ++nesting_;
    return take(1, TokenKind::LParen);
  case ')':
    if (nesting_ > 0) {
      --nesting_;
    }
    return take(1, TokenKind::RParen);
  case '[':
    ++nesting_;
    return take(1, TokenKind::LBracket);
  case ']':
    if (nesting_ > 0) {
      --nesting_;
    }
    return take(1, TokenKind::RBracket);
  case '{':
    ++nesting_;
    return take(1, TokenKind::LBrace);
  case '}':
    if (nesting_ > 0) {
      --nesting_;
    }
    return take(1, TokenKind::RBrace);
  case ',':
    return take(1, TokenKind::Comma);
  case ':':
    return take(1, TokenKind::Colon);
  case ';':
    return take(1, TokenKind::Semicolon);
  case '.':
    return take(1, TokenKind::Dot);
  case '@':
    return take(1, TokenKind::At);
  case '=':
    return take(1, TokenKind::Equal);
  case '+':
    return take(1, TokenKind::Plus);
  case '-':
    return take(1, TokenKind::Minus);
  case '*':
    return take(1, TokenKind::Star);
  case '/':
    return take(1, TokenKind::Slash);
  case '%':
    return take(1, TokenKind::Percent);
  case '&':
    return take(1, TokenKind::Ampersand);
  case '|':
    return take(1, TokenKind::Pipe);
  case '^':
    return take(1, TokenKind::Caret);
  case '~':
    return take(1, TokenKind::Tilde);
  case '<':
    return take(1, TokenKind::Less);
  case '>':
    return take(1, TokenKind::Greater);
  default:
    return {TokenKind::Invalid, "unexpected character '" + describeCharacter(c) + "'", startLine, startColumn};
  }
}

} // namespace pyduino
