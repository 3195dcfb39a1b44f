#pragma once

#include <cstdint>
#include <string>

namespace pyduino {

struct ParsedStringLiteral {
  std::string prefix;
  std::string decoded;
  bool isFormatted = false;
};

inline void appendUtf8(std::string &out, uint32_t codePoint) {
  if (codePoint < 0x80) {
    out.push_back(static_cast<char>(codePoint));
  } else if (codePoint < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (codePoint >> 6)));
    out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
  } else if (codePoint < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (codePoint >> 12)));
    out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (codePoint >> 18)));
    out.push_back(static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
  }
}

inline int hexDigitValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

// Splits a lexed string token into prefix and body and decodes escapes unless the prefix is raw.
inline bool parseStringLiteralToken(const std::string &token, ParsedStringLiteral &out, std::string &error) {
  size_t quotePos = token.find_first_of("\"'");
  if (quotePos == std::string::npos) {
    error = "invalid string literal";
    return false;
  }
  out.prefix = token.substr(0, quotePos);
  bool raw = false;
  out.isFormatted = false;
  for (char c : out.prefix) {
    if (c == 'r' || c == 'R') {
      raw = true;
    } else if (c == 'f' || c == 'F') {
      out.isFormatted = true;
    }
  }
  char quote = token[quotePos];
  size_t quoteLength = 1;
  if (token.size() >= quotePos + 6 && token[quotePos + 1] == quote && token[quotePos + 2] == quote) {
    quoteLength = 3;
  }
  if (token.size() < quotePos + 2 * quoteLength) {
    error = "invalid string literal";
    return false;
  }
  const std::string body = token.substr(quotePos + quoteLength, token.size() - quotePos - 2 * quoteLength);
  out.decoded.clear();
  out.decoded.reserve(body.size());
  if (raw) {
    out.decoded = body;
    return true;
  }
  for (size_t i = 0; i < body.size(); ++i) {
    char c = body[i];
    if (c != '\\' || i + 1 >= body.size()) {
      out.decoded.push_back(c);
      continue;
    }
    char next = body[++i];
    switch (next) {
    case '\n':
      break;
    case 'n':
      out.decoded.push_back('\n');
      break;
    case 'r':
      out.decoded.push_back('\r');
      break;
    case 't':
      out.decoded.push_back('\t');
      break;
    case 'a':
      out.decoded.push_back('\a');
      break;
    case 'b':
      out.decoded.push_back('\b');
      break;
    case 'f':
      out.decoded.push_back('\f');
      break;
    case 'v':
      out.decoded.push_back('\v');
      break;
    case '\\':
    case '\'':
    case '"':
      out.decoded.push_back(next);
      break;
    case 'x': {
      if (i + 2 < body.size() && hexDigitValue(body[i + 1]) >= 0 && hexDigitValue(body[i + 2]) >= 0) {
        out.decoded.push_back(static_cast<char>(hexDigitValue(body[i + 1]) * 16 + hexDigitValue(body[i + 2])));
        i += 2;
      } else {
        error = "truncated \\x escape in string literal";
        return false;
      }
      break;
    }
    case 'u':
    case 'U': {
      size_t digits = next == 'u' ? 4 : 8;
      if (i + digits >= body.size()) {
        error = "truncated \\" + std::string(1, next) + " escape in string literal";
        return false;
      }
      uint32_t codePoint = 0;
      for (size_t d = 1; d <= digits; ++d) {
        int value = hexDigitValue(body[i + d]);
        if (value < 0) {
          error = "truncated \\" + std::string(1, next) + " escape in string literal";
          return false;
        }
        codePoint = codePoint * 16 + static_cast<uint32_t>(value);
      }
      appendUtf8(out.decoded, codePoint);
      i += digits;
      break;
    }
    default:
      if (next >= '0' && next <= '7') {
        int value = next - '0';
        size_t count = 1;
        while (count < 3 && i + 1 < body.size() && body[i + 1] >= '0' && body[i + 1] <= '7') {
          value = value * 8 + (body[++i] - '0');
          ++count;
        }
        out.decoded.push_back(static_cast<char>(value & 0xFF));
      } else {
        out.decoded.push_back('\\');
        out.decoded.push_back(next);
      }
      break;
    }
  }
  return true;
}

// Length of the well-formed UTF-8 sequence starting at `pos`, or 0.
inline size_t utf8SequenceLength(const std::string &text, size_t pos) {
  unsigned char lead = static_cast<unsigned char>(text[pos]);
  size_t length = 0;
  uint32_t minimum = 0;
  if (lead >= 0xC2 && lead <= 0xDF) {
    length = 2;
    minimum = 0x80;
  } else if (lead >= 0xE0 && lead <= 0xEF) {
    length = 3;
    minimum = 0x800;
  } else if (lead >= 0xF0 && lead <= 0xF4) {
    length = 4;
    minimum = 0x10000;
  } else {
    return 0;
  }
  if (pos + length > text.size()) {
    return 0;
  }
  uint32_t codePoint = lead & (0xFF >> (length + 1));
  for (size_t i = 1; i < length; ++i) {
    unsigned char next = static_cast<unsigned char>(text[pos + i]);
    if ((next & 0xC0) != 0x80) {
      return 0;
    }
    codePoint = (codePoint << 6) | (next & 0x3F);
  }
  if (codePoint < minimum || codePoint > 0x10FFFF || (codePoint >= 0xD800 && codePoint <= 0xDFFF)) {
    return 0;
  }
  return length;
}

// Renders decoded text as a double-quoted C string literal. Bytes outside well-formed UTF-8 are
// written as octal escapes so the sketch stays valid UTF-8.
inline std::string quoteCString(const std::string &text) {
  static const char *octal = "01234567";
  std::string out = "\"";
  for (size_t i = 0; i < text.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(text[i]);
    switch (c) {
    case '\\':
      out += "\\\\";
      break;
    case '"':
      out += "\\\"";
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
    default:
      if (c >= 0x80) {
        size_t length = utf8SequenceLength(text, i);
        if (length > 0) {
          out.append(text, i, length);
          i += length - 1;
          break;
        }
      }
      if (c < 0x20 || c >= 0x7F) {
        out.push_back('\\');
        out.push_back(octal[(c >> 6) & 7]);
        out.push_back(octal[(c >> 3) & 7]);
        out.push_back(octal[c & 7]);
      } else {
        out.push_back(static_cast<char>(c));
      }
      break;
    }
  }
  out += "\"";
  return out;
}

} // namespace pyduino
