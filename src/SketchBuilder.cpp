#include "pyduino/SketchBuilder.h"

#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <sys/wait.h>
#include <utility>

namespace pyduino {

namespace {
bool copyIfPresent(const std::filesystem::path &source, const std::filesystem::path &dir, std::string &error) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(source, ec)) {
    return true;
  }
  std::filesystem::copy_file(source, dir / source.filename(), std::filesystem::copy_options::overwrite_existing, ec);
  if (ec) {
    error = "failed to copy " + source.string() + ": " + ec.message();
    return false;
  }
  return true;
}

bool writeLog(const std::string &path, const std::string &contents, std::string &error) {
  std::error_code ec;
  std::filesystem::create_directories(std::filesystem::path(path).parent_path(), ec);
  if (ec) {
    error = "failed to create log directory for " + path;
    return false;
  }
  std::ofstream file(path);
  if (!file) {
    error = "failed to open log " + path;
    return false;
  }
  file << contents;
  if (!file.good()) {
    error = "failed to write log " + path;
    return false;
  }
  return true;
}

bool looksLikePort(const std::string &word) {
  return word.rfind("COM", 0) == 0 || word.rfind("/dev/tty", 0) == 0 || word.rfind("/dev/cu.", 0) == 0;
}
} // namespace

SketchBuilder::SketchBuilder(std::string arduinoCli) : arduinoCli_(std::move(arduinoCli)) {
  if (arduinoCli_.empty()) {
    arduinoCli_ = defaultArduinoCli();
  }
}

bool SketchBuilder::stageSketch(const std::string &inputPath,
                                const std::string &sketch,
                                std::string &sketchDir,
                                std::string &error) const {
  std::filesystem::path input(inputPath);
  std::filesystem::path base = input.parent_path();
  std::string stem = input.stem().string();
  if (stem.empty()) {
    error = "cannot derive sketch name from " + inputPath;
    return false;
  }
  std::filesystem::path dir = base / stem;
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    error = "failed to create sketch directory: " + dir.string();
    return false;
  }
  std::filesystem::path inoPath = dir / (stem + ".ino");
  std::ofstream file(inoPath);
  if (!file) {
    error = "failed to open " + inoPath.string();
    return false;
  }
  file << sketch;
  file.close();
  if (!file) {
    error = "failed to write " + inoPath.string();
    return false;
  }
  for (const auto &header : includedHeaders(sketch)) {
    std::filesystem::path headerPath = base / "lib" / header;
    std::filesystem::path sourcePath = headerPath;
    sourcePath.replace_extension(".cpp");
    if (!copyIfPresent(headerPath, dir, error) || !copyIfPresent(sourcePath, dir, error)) {
      return false;
    }
  }
  sketchDir = dir.string();
  return true;
}

bool SketchBuilder::detectPort(std::string &port, std::string &error) const {
  CommandResult result;
  if (!runTool({"board", "list"}, result, error)) {
    return false;
  }
  if (result.exitCode != 0) {
    error = "board list failed:\n" + result.output;
    return false;
  }
  port = findPortInBoardList(result.output);
  if (port.empty()) {
    error = "no board port detected; pass --port";
    return false;
  }
  return true;
}

bool SketchBuilder::upload(const std::string &inputPath,
                           const std::string &sketch,
                           const std::string &port,
                           const std::string &fqbn,
                           UploadResult &result,
                           std::string &error) const {
  if (!stageSketch(inputPath, sketch, result.sketchDir, error)) {
    return false;
  }
  result.port = port;
  if (result.port.empty() && !detectPort(result.port, error)) {
    return false;
  }
  CommandResult compile;
  if (!runTool({"compile", "--fqbn", fqbn, result.sketchDir}, compile, error)) {
    return false;
  }
  result.output = compile.output;
  CommandResult flash;
  if (compile.exitCode == 0) {
    if (!runTool({"upload", "-p", result.port, "--fqbn", fqbn, result.sketchDir}, flash, error)) {
      return false;
    }
    result.output += flash.output;
  }
  result.logPath = uploadLogPath(result.sketchDir, currentTimestamp());
  if (!writeLog(result.logPath, result.output, error)) {
    return false;
  }
  if (compile.exitCode != 0) {
    error = "compile failed (exit " + std::to_string(compile.exitCode) + "), see " + result.logPath;
    return false;
  }
  if (flash.exitCode != 0) {
    error = "upload failed (exit " + std::to_string(flash.exitCode) + "), see " + result.logPath;
    return false;
  }
  return true;
}

bool SketchBuilder::listPorts(std::string &output, std::string &error) const {
  CommandResult result;
  if (!runTool({"board", "list"}, result, error)) {
    return false;
  }
  output = result.output;
  if (result.exitCode != 0) {
    error = "board list failed:\n" + result.output;
    return false;
  }
  return true;
}

bool SketchBuilder::setupAvr(std::string &output, std::string &error) const {
  CommandResult result;
  if (!runTool({"core", "install", "arduino:avr"}, result, error)) {
    return false;
  }
  output = result.output;
  if (result.exitCode != 0) {
    error = "core install failed:\n" + result.output;
    return false;
  }
  return true;
}

bool SketchBuilder::runTool(const std::vector<std::string> &args, CommandResult &result, std::string &error) const {
  std::string command = quoteShellArg(arduinoCli_);
  for (const auto &arg : args) {
    command += " " + quoteShellArg(arg);
  }
  return runCapture(command, result, error);
}

bool runCapture(const std::string &command, CommandResult &result, std::string &error) {
  std::string full = command + " 2>&1";
  FILE *pipe = popen(full.c_str(), "r");
  if (!pipe) {
    error = "failed to run: " + command;
    return false;
  }
  result.output.clear();
  char buffer[4096];
  size_t bytesRead = 0;
  while ((bytesRead = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
    result.output.append(buffer, bytesRead);
  }
  int status = pclose(pipe);
  if (status == -1) {
    error = "failed to wait for: " + command;
    return false;
  }
  result.exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  if (result.exitCode == 127) {
    error = "command not found: " + command + "\n" + result.output;
    return false;
  }
  return true;
}

std::string quoteShellArg(const std::string &text) {
  std::string quoted = "'";
  for (char c : text) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  quoted += "'";
  return quoted;
}

std::string findPortInBoardList(const std::string &listing) {
  std::istringstream lines(listing);
  std::string line;
  while (std::getline(lines, line)) {
    std::istringstream words(line);
    std::string first;
    if (words >> first && looksLikePort(first)) {
      return first;
    }
  }
  return "";
}

std::vector<std::string> includedHeaders(const std::string &sketch) {
  const std::string prefix = "#include \"";
  std::vector<std::string> headers;
  std::istringstream lines(sketch);
  std::string line;
  while (std::getline(lines, line)) {
    if (line.compare(0, prefix.size(), prefix) != 0) {
      continue;
    }
    size_t end = line.find('"', prefix.size());
    if (end != std::string::npos && end > prefix.size()) {
      headers.push_back(line.substr(prefix.size(), end - prefix.size()));
    }
  }
  return headers;
}

std::string uploadLogPath(const std::string &sketchDir, const std::string &timestamp) {
  return (std::filesystem::path(sketchDir) / "logs" / ("upload_" + timestamp + ".log")).string();
}

std::string currentTimestamp() {
  std::time_t now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  char buffer[32];
  if (std::strftime(buffer, sizeof(buffer), "%Y%m%d_%H%M%S", &local) == 0) {
    return std::to_string(static_cast<long long>(now));
  }
  return buffer;
}

std::string defaultArduinoCli() {
  std::error_code ec;
  std::filesystem::path local = std::filesystem::current_path(ec) / "deps" / "arduino-cli";
  if (!ec && std::filesystem::is_regular_file(local, ec)) {
    return local.string();
  }
  return "arduino-cli";
}

} // namespace pyduino
