#pragma once

#include <string>

namespace pyduino {

enum class TokenKind {
  Identifier,
  Number,
  String,
  LParen,
  RParen,
  LBracket,
  RBracket,
  LBrace,
  RBrace,
  Comma,
  Colon,
  Semicolon,
  Dot,
  Arrow,
  At,
  Ellipsis,
  Equal,
  AugAssign,
  Plus,
  Minus,
  Star,
  DoubleStar,
  Slash,
  DoubleSlash,
  Percent,
  Ampersand,
  Pipe,
  Caret,
  Tilde,
  LeftShift,
  RightShift,
  EqualEqual,
  NotEqual,
  Less,
  LessEqual,
  Greater,
  GreaterEqual,
  KeywordDef,
  KeywordIf,
  KeywordElif,
  KeywordElse,
  KeywordWhile,
  KeywordFor,
  KeywordIn,
  KeywordBreak,
  KeywordContinue,
  KeywordPass,
  KeywordReturn,
  KeywordImport,
  KeywordFrom,
  KeywordAs,
  KeywordAnd,
  KeywordOr,
  KeywordNot,
  KeywordIs,
  KeywordLambda,
  KeywordTrue,
  KeywordFalse,
  KeywordNone,
  Newline,
  Indent,
  Dedent,
  Comment,
  Invalid,
  End
};

struct Token {
  TokenKind kind = TokenKind::End;
  std::string text;
  int line = 1;
  int column = 1;
};

const char *tokenKindName(TokenKind kind);

} // namespace pyduino
