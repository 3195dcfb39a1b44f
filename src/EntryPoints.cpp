#include "pyduino/EntryPoints.h"

namespace pyduino {

const char *const kSetupName = "setup";
const char *const kLoopName = "loop";

namespace {
bool isEntryPoint(const std::string &name) {
  return name == kSetupName || name == kLoopName;
}

FunctionBlock makeEntryPoint(const std::string &name, const std::vector<std::string> &calls) {
  FunctionBlock block;
  block.name = name;
  block.synthesized = true;
  block.lines.push_back("void " + name + "() {");
  for (const auto &call : calls) {
    block.lines.push_back("  " + call + "();");
  }
  block.lines.push_back("}");
  return block;
}
} // namespace

void synthesizeEntryPoints(TranslationUnit &unit, const TranslateOptions &options) {
  if (!unit.findFunction(kSetupName)) {
    unit.defineFunction(makeEntryPoint(kSetupName, {}));
  }
  if (!unit.findFunction(kLoopName)) {
    std::vector<std::string> calls;
    if (options.autoLoop) {
      for (const auto &block : unit.functions) {
        if (!isEntryPoint(block.name)) {
          calls.push_back(block.name);
        }
      }
    }
    unit.defineFunction(makeEntryPoint(kLoopName, calls));
  }
}

std::vector<const FunctionBlock *> orderedFunctions(const TranslationUnit &unit) {
  std::vector<const FunctionBlock *> ordered;
  if (const FunctionBlock *setup = unit.findFunction(kSetupName)) {
    ordered.push_back(setup);
  }
  for (const auto &block : unit.functions) {
    if (!isEntryPoint(block.name)) {
      ordered.push_back(&block);
    }
  }
  if (const FunctionBlock *loop = unit.findFunction(kLoopName)) {
    ordered.push_back(loop);
  }
  return ordered;
}

} // namespace pyduino
