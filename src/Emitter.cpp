#include "pyduino/Emitter.h"

#include "pyduino/DeclarationClassifier.h"
#include "pyduino/EntryPoints.h"
#include "pyduino/Lexer.h"
#include "pyduino/Parser.h"
#include "pyduino/StmtTranslator.h"

#include <climits>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

namespace pyduino {

namespace {
enum class Section { Includes, Macros, Statements, Function };

std::vector<std::string> lineTexts(const std::vector<EmittedLine> &lines) {
  std::vector<std::string> texts;
  texts.reserve(lines.size());
  for (const auto &line : lines) {
    texts.push_back(line.text);
  }
  return texts;
}

void appendTexts(std::vector<std::string> &section, const std::vector<EmittedLine> &lines) {
  for (const auto &line : lines) {
    section.push_back(line.text);
  }
}

void writeSection(std::ostringstream &out, const std::vector<std::string> &lines) {
  for (const auto &line : lines) {
    out << line << "\n";
  }
  out << "\n";
}
} // namespace

Emitter::Emitter(TranslateOptions options) : options_(std::move(options)) {}

TranslationUnit Emitter::buildUnit(const Module &module, const CommentTable &comments) const {
  TranslationContext context(options_);
  if (options_.emitComments) {
    context.comments = comments;
  }
  TranslationUnit unit;
  Section lastSection = Section::Statements;
  std::string lastFunction;

  for (const auto &stmt : module.body) {
    std::vector<EmittedLine> lines;
    renderStmtWithComments(stmt, 0, context, lines);
    switch (stmt.kind) {
    case Stmt::Kind::Import:
      appendTexts(unit.includes, lines);
      lastSection = Section::Includes;
      break;
    case Stmt::Kind::Assign:
      if (classifyAssignment(stmt, context).kind == DeclarationKind::Macro) {
        appendTexts(unit.macros, lines);
        lastSection = Section::Macros;
      } else {
        appendTexts(unit.statements, lines);
        lastSection = Section::Statements;
      }
      break;
    case Stmt::Kind::FunctionDef: {
      FunctionBlock block;
      block.name = stmt.name;
      block.lines = lineTexts(lines);
      unit.defineFunction(std::move(block));
      lastSection = Section::Function;
      lastFunction = stmt.name;
      break;
    }
    default:
      appendTexts(unit.statements, lines);
      lastSection = Section::Statements;
      break;
    }
  }

  for (const auto &header : context.includes) {
    if (context.renderedIncludes.count(header) == 0) {
      unit.includes.push_back("#include \"" + header + "\"");
    }
  }

  std::vector<std::string> trailing;
  for (int line : context.comments.pendingBetween(1, INT_MAX)) {
    trailing.push_back("// " + *context.comments.find(line));
    context.comments.markEmitted(line);
  }
  if (!trailing.empty()) {
    std::vector<std::string> *target = &unit.statements;
    if (lastSection == Section::Includes) {
      target = &unit.includes;
    } else if (lastSection == Section::Macros) {
      target = &unit.macros;
    } else if (lastSection == Section::Function) {
      for (auto &block : unit.functions) {
        if (block.name == lastFunction) {
          target = &block.lines;
        }
      }
    }
    target->insert(target->end(), trailing.begin(), trailing.end());
  }

  synthesizeEntryPoints(unit, options_);
  return unit;
}

std::string Emitter::serialize(const TranslationUnit &unit) const {
  std::ostringstream out;
  writeSection(out, unit.includes);
  writeSection(out, unit.macros);
  writeSection(out, unit.statements);
  std::vector<const FunctionBlock *> functions = orderedFunctions(unit);
  for (size_t i = 0; i < functions.size(); ++i) {
    if (i > 0) {
      out << "\n";
    }
    for (const auto &line : functions[i]->lines) {
      out << line << "\n";
    }
  }
  return out.str();
}

std::string Emitter::emitSketch(const Module &module, const CommentTable &comments) const {
  return serialize(buildUnit(module, comments));
}

bool transpileSource(const std::string &source, const TranslateOptions &options, std::string &sketch, std::string &error) {
  Lexer lexer(source);
  std::vector<Token> tokens = lexer.tokenize();
  CommentTable comments = collectComments(tokens);
  Parser parser(std::move(tokens));
  Module module;
  if (!parser.parse(module, error)) {
    return false;
  }
  Emitter emitter(options);
  sketch = emitter.emitSketch(module, comments);
  return true;
}

std::string defaultSketchPath(const std::string &inputPath) {
  std::filesystem::path input(inputPath);
  std::string stem = input.stem().string();
  if (stem.empty()) {
    stem = input.filename().string();
  }
  return (input.parent_path() / (stem + ".ino")).string();
}

bool writeSketch(const std::string &path, const std::string &contents, std::string &error) {
  std::filesystem::path target(path);
  std::filesystem::path temp = target;
  temp += ".tmp";
  {
    std::ofstream file(temp, std::ios::binary);
    if (!file) {
      error = "failed to open " + temp.string();
      return false;
    }
    file << contents;
    file.close();
    if (!file) {
      error = "failed to write " + temp.string();
      std::error_code ignored;
      std::filesystem::remove(temp, ignored);
      return false;
    }
  }
  std::error_code ec;
  std::filesystem::rename(temp, target, ec);
  if (ec) {
    error = "failed to replace " + target.string() + ": " + ec.message();
    std::error_code ignored;
    std::filesystem::remove(temp, ignored);
    return false;
  }
  return true;
}

} // namespace pyduino
