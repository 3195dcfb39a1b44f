#pragma once

#include <string>
#include <vector>

#include "pyduino/Ast.h"
#include "pyduino/Options.h"
#include "pyduino/TranslationContext.h"
#include "pyduino/TranslationUnit.h"

namespace pyduino {

class Emitter {
public:
  explicit Emitter(TranslateOptions options = {});

  TranslationUnit buildUnit(const Module &module, const CommentTable &comments) const;
  std::string serialize(const TranslationUnit &unit) const;
  std::string emitSketch(const Module &module, const CommentTable &comments) const;

private:
  TranslateOptions options_;
};

// Lexes, parses and emits a whole source file. Fails only on malformed input.
bool transpileSource(const std::string &source, const TranslateOptions &options, std::string &sketch, std::string &error);

// <input dir>/<input stem>.ino
std::string defaultSketchPath(const std::string &inputPath);

// Writes to a temporary sibling and renames it into place.
bool writeSketch(const std::string &path, const std::string &contents, std::string &error);

} // namespace pyduino
