#pragma once

#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "pyduino/Options.h"
#include "pyduino/Token.h"

namespace pyduino {

struct EmittedLine {
  // 1-based source line the text was generated from, 0 for synthesized lines.
  int sourceLine = 0;
  std::string text;
};

class CommentTable {
public:
  void add(int line, const std::string &text);
  bool empty() const;
  const std::string *find(int line) const;
  bool isEmitted(int line) const;
  void markEmitted(int line);
  // Unemitted comment lines in [first, last], ascending.
  std::vector<int> pendingBetween(int first, int last) const;
  std::vector<int> pendingBefore(int line) const;

private:
  std::map<int, std::string> comments_;
  std::set<int> emitted_;
};

CommentTable collectComments(const std::vector<Token> &tokens);

struct TranslationContext {
  TranslateOptions options;
  CommentTable comments;
  // Callable name -> declared type name.
  std::unordered_map<std::string, std::string> constructibleTypes;
  // Header names in first-seen order.
  std::vector<std::string> includes;
  std::unordered_set<std::string> renderedIncludes;
  int functionDepth = 0;
  // Enclosing if/while/for bodies.
  int blockDepth = 0;

  explicit TranslationContext(TranslateOptions translateOptions = {});

  bool isConstructible(const std::string &name) const;
  std::string constructibleTypeName(const std::string &name) const;
  void registerConstructible(const std::string &name, const std::string &typeName);
  bool addInclude(const std::string &header);
  bool atModuleLevel() const { return functionDepth == 0 && blockDepth == 0; }
};

} // namespace pyduino
