#include "pyduino/AstPrinter.h"
#include "pyduino/Emitter.h"
#include "pyduino/Lexer.h"
#include "pyduino/Options.h"
#include "pyduino/Parser.h"
#include "pyduino/SketchBuilder.h"
#include "pyduino/TranslationContext.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace {
const char *kUsage =
    "Usage: pyduino <command> [options]\n"
    "  to-ino <file.py> [-o <out.ino>] [--auto-loop] [--no-comments] [--class <Name>]... "
    "[--construct-any-call] [--dump-stage tokens|ast]\n"
    "  upload <file.py> [--auto-loop] [--no-comments] [--class <Name>]... [--port <port>] [--fqbn <fqbn>] "
    "[--arduino-cli <path>]\n"
    "  list-ports [--arduino-cli <path>]\n"
    "  setup-avr [--arduino-cli <path>]\n"
    "  create <name>\n";

const char *kStarterProgram = "from lib.CheapStepper import CheapStepper\n"
                              "\n"
                              "def setup():\n"
                              "    pass\n"
                              "\n"
                              "def loop():\n"
                              "    pass\n";

bool takesInput(const std::string &command) {
  return command == "to-ino" || command == "upload";
}

bool parseArgs(int argc, char **argv, pyduino::Options &out, std::string &error) {
  if (argc < 2) {
    return false;
  }
  out.command = argv[1];
  if (out.command != "to-ino" && out.command != "upload" && out.command != "list-ports" &&
      out.command != "setup-avr" && out.command != "setupavr" && out.command != "create") {
    error = "unknown command: " + out.command;
    return false;
  }
  if (out.command == "setupavr") {
    out.command = "setup-avr";
  }
  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-o" && i + 1 < argc) {
      out.outputPath = argv[++i];
    } else if (arg == "--auto-loop") {
      out.translate.autoLoop = true;
    } else if (arg == "--no-comments") {
      out.translate.emitComments = false;
    } else if (arg == "--construct-any-call") {
      out.translate.constructAnyCall = true;
    } else if (arg == "--class" && i + 1 < argc) {
      out.translate.constructibleTypes.push_back(argv[++i]);
    } else if (arg.rfind("--class=", 0) == 0) {
      out.translate.constructibleTypes.push_back(arg.substr(std::string("--class=").size()));
    } else if (arg == "--dump-stage" && i + 1 < argc) {
      out.dumpStage = argv[++i];
    } else if (arg.rfind("--dump-stage=", 0) == 0) {
      out.dumpStage = arg.substr(std::string("--dump-stage=").size());
    } else if (arg == "--port" && i + 1 < argc) {
      out.port = argv[++i];
    } else if (arg.rfind("--port=", 0) == 0) {
      out.port = arg.substr(std::string("--port=").size());
    } else if (arg == "--fqbn" && i + 1 < argc) {
      out.fqbn = argv[++i];
    } else if (arg.rfind("--fqbn=", 0) == 0) {
      out.fqbn = arg.substr(std::string("--fqbn=").size());
    } else if (arg == "--arduino-cli" && i + 1 < argc) {
      out.arduinoCli = argv[++i];
    } else if (arg.rfind("--arduino-cli=", 0) == 0) {
      out.arduinoCli = arg.substr(std::string("--arduino-cli=").size());
    } else if (!arg.empty() && arg[0] == '-') {
      error = "unknown option: " + arg;
      return false;
    } else {
      if (out.command == "create" && out.projectName.empty()) {
        out.projectName = arg;
      } else if (takesInput(out.command) && out.inputPath.empty()) {
        out.inputPath = arg;
      } else {
        error = "unexpected argument: " + arg;
        return false;
      }
    }
  }
  if (takesInput(out.command) && out.inputPath.empty()) {
    error = "missing input file";
    return false;
  }
  if (out.command == "create" && out.projectName.empty()) {
    error = "missing project name";
    return false;
  }
  if (!out.dumpStage.empty() && out.dumpStage != "tokens" && out.dumpStage != "ast") {
    error = "unsupported dump stage: " + out.dumpStage;
    return false;
  }
  if (takesInput(out.command) && out.outputPath.empty()) {
    out.outputPath = pyduino::defaultSketchPath(out.inputPath);
  }
  return true;
}

bool readFile(const std::string &path, std::string &out) {
  std::ifstream file(path);
  if (!file) {
    return false;
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  out = buffer.str();
  return true;
}

bool writeFile(const std::string &path, const std::string &contents) {
  std::ofstream file(path);
  if (!file) {
    return false;
  }
  file << contents;
  return file.good();
}

std::string dumpTokens(const std::vector<pyduino::Token> &tokens) {
  std::ostringstream out;
  for (const auto &token : tokens) {
    out << token.line << ":" << token.column << " " << pyduino::tokenKindName(token.kind);
    if (!token.text.empty()) {
      out << " " << token.text;
    }
    out << "\n";
  }
  return out.str();
}

int createProject(const std::string &name) {
  std::filesystem::path root = std::filesystem::current_path() / name;
  std::error_code ec;
  if (std::filesystem::exists(root, ec)) {
    std::cerr << "Create error: " << root.string() << " already exists\n";
    return 2;
  }
  std::filesystem::create_directories(root / "lib", ec);
  if (!ec) {
    std::filesystem::create_directories(root / "deps", ec);
  }
  if (ec) {
    std::cerr << "Create error: failed to create " << root.string() << ": " << ec.message() << "\n";
    return 2;
  }
  std::filesystem::path mainPath = root / "main.py";
  if (!writeFile(mainPath.string(), kStarterProgram)) {
    std::cerr << "Create error: failed to write " << mainPath.string() << "\n";
    return 2;
  }
  std::cout << "Created project " << root.string() << "\n";
  return 0;
}
} // namespace

int main(int argc, char **argv) {
  pyduino::Options options;
  std::string argError;
  if (!parseArgs(argc, argv, options, argError)) {
    if (!argError.empty()) {
      std::cerr << "Argument error: " << argError << "\n";
    }
    std::cerr << kUsage;
    return 2;
  }

  if (options.command == "create") {
    return createProject(options.projectName);
  }

  std::string error;
  if (options.command == "list-ports" || options.command == "setup-avr") {
    pyduino::SketchBuilder builder(options.arduinoCli);
    std::string output;
    bool ok = options.command == "list-ports" ? builder.listPorts(output, error) : builder.setupAvr(output, error);
    std::cout << output;
    if (!ok) {
      std::cerr << "Arduino CLI error: " << error << "\n";
      return 3;
    }
    return 0;
  }

  std::string source;
  if (!readFile(options.inputPath, source)) {
    std::cerr << "Input error: failed to read input: " << options.inputPath << "\n";
    return 2;
  }

  pyduino::Lexer lexer(source);
  std::vector<pyduino::Token> tokens = lexer.tokenize();
  if (options.dumpStage == "tokens") {
    std::cout << dumpTokens(tokens);
    return 0;
  }
  pyduino::CommentTable comments = pyduino::collectComments(tokens);
  pyduino::Parser parser(std::move(tokens));
  pyduino::Module module;
  if (!parser.parse(module, error)) {
    std::cerr << "Parse error: " << error << "\n";
    return 2;
  }
  if (options.dumpStage == "ast") {
    pyduino::AstPrinter printer;
    std::cout << printer.print(module);
    return 0;
  }

  pyduino::Emitter emitter(options.translate);
  std::string sketch = emitter.emitSketch(module, comments);
  if (!pyduino::writeSketch(options.outputPath, sketch, error)) {
    std::cerr << "Output error: " << error << "\n";
    return 2;
  }
  std::cout << "Transpiled " << options.inputPath << " -> " << options.outputPath << "\n";

  if (options.command == "upload") {
    pyduino::SketchBuilder builder(options.arduinoCli);
    pyduino::UploadResult result;
    if (!builder.upload(options.inputPath, sketch, options.port, options.fqbn, result, error)) {
      if (!result.output.empty()) {
        std::cerr << result.output;
      }
      std::cerr << "Upload error: " << error << "\n";
      return 3;
    }
    std::cout << "Uploaded " << result.sketchDir << " to " << result.port << " (log: " << result.logPath << ")\n";
  }
  return 0;
}
