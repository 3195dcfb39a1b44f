#include "pyduino/TranslationContext.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace pyduino {

namespace {
std::string trimComment(const std::string &text) {
  size_t start = 0;
  while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) {
    ++start;
  }
  size_t end = text.size();
  while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
    --end;
  }
  return text.substr(start, end - start);
}
} // namespace

void CommentTable::add(int line, const std::string &text) {
  std::string trimmed = trimComment(text);
  if (trimmed.empty()) {
    return;
  }
  comments_[line] = trimmed;
}

bool CommentTable::empty() const {
  return comments_.empty();
}

const std::string *CommentTable::find(int line) const {
  auto it = comments_.find(line);
  if (it == comments_.end()) {
    return nullptr;
  }
  return &it->second;
}

bool CommentTable::isEmitted(int line) const {
  return emitted_.count(line) > 0;
}

void CommentTable::markEmitted(int line) {
  emitted_.insert(line);
}

std::vector<int> CommentTable::pendingBetween(int first, int last) const {
  std::vector<int> lines;
  for (auto it = comments_.lower_bound(first); it != comments_.end() && it->first <= last; ++it) {
    if (!isEmitted(it->first)) {
      lines.push_back(it->first);
    }
  }
  return lines;
}

std::vector<int> CommentTable::pendingBefore(int line) const {
  return pendingBetween(0, line - 1);
}

CommentTable collectComments(const std::vector<Token> &tokens) {
  CommentTable table;
  for (const auto &token : tokens) {
    if (token.kind == TokenKind::Comment) {
      table.add(token.line, token.text);
    }
  }
  return table;
}

TranslationContext::TranslationContext(TranslateOptions translateOptions) : options(std::move(translateOptions)) {
  for (const auto &name : options.constructibleTypes) {
    constructibleTypes[name] = name;
  }
}

bool TranslationContext::isConstructible(const std::string &name) const {
  return constructibleTypes.count(name) > 0;
}

std::string TranslationContext::constructibleTypeName(const std::string &name) const {
  auto it = constructibleTypes.find(name);
  return it == constructibleTypes.end() ? name : it->second;
}

void TranslationContext::registerConstructible(const std::string &name, const std::string &typeName) {
  constructibleTypes[name] = typeName;
}

bool TranslationContext::addInclude(const std::string &header) {
  if (std::find(includes.begin(), includes.end(), header) != includes.end()) {
    return false;
  }
  includes.push_back(header);
  return true;
}

} // namespace pyduino
