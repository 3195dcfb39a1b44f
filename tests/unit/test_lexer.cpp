#include "pyduino/Lexer.h"

#include <doctest/doctest.h>

namespace {
std::vector<pyduino::Token> lex(const std::string &source) {
  pyduino::Lexer lexer(source);
  return lexer.tokenize();
}

std::vector<pyduino::TokenKind> kinds(const std::vector<pyduino::Token> &tokens) {
  std::vector<pyduino::TokenKind> out;
  for (const auto &token : tokens) {
    out.push_back(token.kind);
  }
  return out;
}
} // namespace

TEST_SUITE_BEGIN("pyduino.lexer");

TEST_CASE("lexes indentation into indent and dedent tokens") {
  using pyduino::TokenKind;
  const auto tokens = lex("if x:\n    y = 1\nz = 2\n");
  const std::vector<TokenKind> expected = {TokenKind::KeywordIf, TokenKind::Identifier, TokenKind::Colon,
                                           TokenKind::Newline,   TokenKind::Indent,     TokenKind::Identifier,
                                           TokenKind::Equal,     TokenKind::Number,     TokenKind::Newline,
                                           TokenKind::Dedent,    TokenKind::Identifier, TokenKind::Equal,
                                           TokenKind::Number,    TokenKind::Newline,    TokenKind::End};
  CHECK(kinds(tokens) == expected);
  CHECK(tokens[4].line == 2);
  CHECK(tokens[4].column == 5);
}

TEST_CASE("closes open indentation at end of input") {
  using pyduino::TokenKind;
  const auto tokens = lex("def f():\n    if x:\n        pass");
  REQUIRE(tokens.size() >= 3);
  CHECK(tokens[tokens.size() - 1].kind == TokenKind::End);
  CHECK(tokens[tokens.size() - 2].kind == TokenKind::Dedent);
  CHECK(tokens[tokens.size() - 3].kind == TokenKind::Dedent);
  CHECK(tokens[tokens.size() - 4].kind == TokenKind::Newline);
}

TEST_CASE("blank and comment-only lines do not affect layout") {
  using pyduino::TokenKind;
  const auto tokens = lex("x = 1\n\n    # note\ny = 2\n");
  const std::vector<TokenKind> expected = {TokenKind::Identifier, TokenKind::Equal,   TokenKind::Number,
                                           TokenKind::Newline,    TokenKind::Comment, TokenKind::Identifier,
                                           TokenKind::Equal,      TokenKind::Number,  TokenKind::Newline,
                                           TokenKind::End};
  CHECK(kinds(tokens) == expected);
  CHECK(tokens[4].text == " note");
  CHECK(tokens[4].line == 3);
}

TEST_CASE("joins lines inside brackets") {
  using pyduino::TokenKind;
  const auto tokens = lex("foo(1,\n    2)\n");
  const std::vector<TokenKind> expected = {TokenKind::Identifier, TokenKind::LParen, TokenKind::Number,
                                           TokenKind::Comma,      TokenKind::Number, TokenKind::RParen,
                                           TokenKind::Newline,    TokenKind::End};
  CHECK(kinds(tokens) == expected);
  CHECK(tokens[4].line == 2);
}

TEST_CASE("joins lines after a backslash") {
  using pyduino::TokenKind;
  const auto tokens = lex("x = 1 + \\\n    2\n");
  const std::vector<TokenKind> expected = {TokenKind::Identifier, TokenKind::Equal,   TokenKind::Number,
                                           TokenKind::Plus,       TokenKind::Number,  TokenKind::Newline,
                                           TokenKind::End};
  CHECK(kinds(tokens) == expected);
}

TEST_CASE("expands tabs to multiples of eight") {
  using pyduino::TokenKind;
  const auto tokens = lex("if x:\n\ty = 1\n        z = 2\n");
  int indents = 0;
  for (const auto &token : tokens) {
    CHECK(token.kind != TokenKind::Invalid);
    if (token.kind == TokenKind::Indent) {
      ++indents;
    }
  }
  CHECK(indents == 1);
}

TEST_CASE("reports inconsistent dedent as invalid token") {
  const auto tokens = lex("if x:\n    y\n  z\n");
  REQUIRE(tokens.size() >= 2);
  CHECK(tokens.back().kind == pyduino::TokenKind::End);
  const auto &invalid = tokens[tokens.size() - 2];
  CHECK(invalid.kind == pyduino::TokenKind::Invalid);
  CHECK(invalid.text.find("unindent does not match") != std::string::npos);
  CHECK(invalid.line == 3);
}

TEST_CASE("lexes numeric literal forms") {
  const auto tokens = lex("0x1F 0o17 0b101 1_000 3.5 .5 1e3 2j");
  REQUIRE(tokens.size() >= 8);
  const std::vector<std::string> expected = {"0x1F", "0o17", "0b101", "1_000", "3.5", ".5", "1e3", "2j"};
  for (size_t i = 0; i < expected.size(); ++i) {
    CHECK(tokens[i].kind == pyduino::TokenKind::Number);
    CHECK(tokens[i].text == expected[i]);
  }
}

TEST_CASE("rejects identifier glued to number") {
  const auto tokens = lex("x = 12abc");
  REQUIRE(tokens.size() >= 2);
  CHECK(tokens[tokens.size() - 2].kind == pyduino::TokenKind::Invalid);
  CHECK(tokens[tokens.size() - 2].text == "invalid numeric literal");
}

TEST_CASE("lexes prefixed and triple-quoted strings") {
  const auto tokens = lex("r\"a\\n\" b'x' \"\"\"multi\nline\"\"\" f\"{v}\"");
  REQUIRE(tokens.size() >= 4);
  CHECK(tokens[0].kind == pyduino::TokenKind::String);
  CHECK(tokens[0].text == "r\"a\\n\"");
  CHECK(tokens[1].text == "b'x'");
  CHECK(tokens[2].text == "\"\"\"multi\nline\"\"\"");
  CHECK(tokens[2].line == 1);
  CHECK(tokens[3].text == "f\"{v}\"");
}

TEST_CASE("treats hash inside strings as text") {
  const auto tokens = lex("msg = \"a # b\"\n");
  for (const auto &token : tokens) {
    CHECK(token.kind != pyduino::TokenKind::Comment);
  }
}

TEST_CASE("lexes unterminated string literal as invalid token") {
  const auto tokens = lex("x = \"hello\n");
  REQUIRE(tokens.size() >= 2);
  const auto &invalid = tokens[tokens.size() - 2];
  CHECK(invalid.kind == pyduino::TokenKind::Invalid);
  CHECK(invalid.text == "unterminated string literal");
  CHECK(invalid.column == 5);
}

TEST_CASE("lexes operators longest first") {
  using pyduino::TokenKind;
  const auto tokens = lex("a **= b ** c // d << e >= f != g -> h");
  const std::vector<TokenKind> expected = {
      TokenKind::Identifier, TokenKind::AugAssign,   TokenKind::Identifier, TokenKind::DoubleStar,
      TokenKind::Identifier, TokenKind::DoubleSlash, TokenKind::Identifier, TokenKind::LeftShift,
      TokenKind::Identifier, TokenKind::GreaterEqual, TokenKind::Identifier, TokenKind::NotEqual,
      TokenKind::Identifier, TokenKind::Arrow,       TokenKind::Identifier, TokenKind::Newline,
      TokenKind::End};
  CHECK(kinds(tokens) == expected);
  CHECK(tokens[1].text == "**=");
}

TEST_CASE("rejects assignment expressions") {
  const auto tokens = lex("if (n := 3):\n    pass\n");
  bool sawInvalid = false;
  for (const auto &token : tokens) {
    if (token.kind == pyduino::TokenKind::Invalid) {
      sawInvalid = true;
      CHECK(token.text == "assignment expressions are not supported");
    }
  }
  CHECK(sawInvalid);
}

TEST_CASE("keeps trailing comment text and line") {
  const auto tokens = lex("x = 1  # hello\n");
  REQUIRE(tokens.size() >= 4);
  CHECK(tokens[3].kind == pyduino::TokenKind::Comment);
  CHECK(tokens[3].text == " hello");
  CHECK(tokens[3].line == 1);
  CHECK(tokens[4].kind == pyduino::TokenKind::Newline);
}

TEST_CASE("skips a leading byte order mark") {
  using pyduino::TokenKind;
  const auto tokens = lex("\xEF\xBB\xBFX = 1\n");
  const std::vector<TokenKind> expected = {TokenKind::Identifier, TokenKind::Equal, TokenKind::Number,
                                           TokenKind::Newline, TokenKind::End};
  CHECK(kinds(tokens) == expected);
  CHECK(tokens[0].text == "X");
  CHECK(tokens[0].column == 1);
}

TEST_CASE("accepts non-ascii identifiers") {
  const auto tokens = lex("caf\xC3\xA9 = 1\n");
  REQUIRE(tokens.size() >= 2);
  CHECK(tokens[0].kind == pyduino::TokenKind::Identifier);
  CHECK(tokens[0].text == "caf\xC3\xA9");
  CHECK(tokens[1].kind == pyduino::TokenKind::Equal);
}

TEST_CASE("reports control characters as hex escapes") {
  const auto tokens = lex("x = \x01\n");
  REQUIRE(tokens.size() >= 3);
  CHECK(tokens[2].kind == pyduino::TokenKind::Invalid);
  CHECK(tokens[2].text == "unexpected character '\\x01'");
  CHECK(tokens[2].column == 5);
}

TEST_CASE("names token kinds for dumps") {
  CHECK(std::string(pyduino::tokenKindName(pyduino::TokenKind::KeywordDef)) == "Keyword");
  CHECK(std::string(pyduino::tokenKindName(pyduino::TokenKind::Plus)) == "Punct");
  CHECK(std::string(pyduino::tokenKindName(pyduino::TokenKind::Indent)) == "Indent");
}

TEST_SUITE_END();
