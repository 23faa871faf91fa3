#include "clite/AstPrinter.h"
#include "clite/Diagnostics.h"
#include "clite/Interpreter.h"
#include "clite/Lexer.h"
#include "clite/Options.h"
#include "clite/Parser.h"

#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>

namespace {
bool readSource(const std::string &path, std::string &out) {
  std::ifstream file(path);
  if (!file) {
    return false;
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  out = buffer.str();
  return true;
}

bool parsePositiveInt(const std::string &text, int &out) {
  if (text.empty() || text.size() > 9) {
    return false;
  }
  int value = 0;
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return false;
    }
    value = value * 10 + (c - '0');
  }
  if (value <= 0) {
    return false;
  }
  out = value;
  return true;
}

bool parseArgs(int argc, char **argv, clite::RunOptions &out, std::string &error) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    std::string depthText;
    bool hasDepth = false;
    std::string parseDepthText;
    bool hasParseDepth = false;
    if ((arg == "--entry" || arg == "-e") && i + 1 < argc) {
      out.entryName = argv[++i];
    } else if (arg.rfind("--entry=", 0) == 0) {
      out.entryName = arg.substr(std::string("--entry=").size());
    } else if (arg == "--no-entry") {
      out.callEntry = false;
    } else if (arg == "--dump-stage" && i + 1 < argc) {
      out.dumpStage = argv[++i];
    } else if (arg.rfind("--dump-stage=", 0) == 0) {
      out.dumpStage = arg.substr(std::string("--dump-stage=").size());
    } else if (arg == "--max-depth" && i + 1 < argc) {
      depthText = argv[++i];
      hasDepth = true;
    } else if (arg.rfind("--max-depth=", 0) == 0) {
      depthText = arg.substr(std::string("--max-depth=").size());
      hasDepth = true;
    } else if (arg == "--max-parse-depth" && i + 1 < argc) {
      parseDepthText = argv[++i];
      hasParseDepth = true;
    } else if (arg.rfind("--max-parse-depth=", 0) == 0) {
      parseDepthText = arg.substr(std::string("--max-parse-depth=").size());
      hasParseDepth = true;
    } else if (!arg.empty() && arg[0] == '-') {
      error = "unknown option: " + arg;
      return false;
    } else {
      if (!out.inputPath.empty()) {
        error = "only one input file is accepted";
        return false;
      }
      out.inputPath = arg;
    }
    if (hasDepth && !parsePositiveInt(depthText, out.maxCallDepth)) {
      error = "--max-depth expects a positive integer: " + depthText;
      return false;
    }
    if (hasParseDepth && !parsePositiveInt(parseDepthText, out.maxParseDepth)) {
      error = "--max-parse-depth expects a positive integer: " + parseDepthText;
      return false;
    }
  }
  if (out.entryName.empty()) {
    error = "entry function name cannot be empty";
    return false;
  }
  if (!out.dumpStage.empty() && out.dumpStage != "tokens" && out.dumpStage != "ast") {
    error = "unsupported dump stage: " + out.dumpStage;
    return false;
  }
  return !out.inputPath.empty();
}

void dumpTokens(const std::vector<clite::Token> &tokens) {
  for (const auto &token : tokens) {
    std::cout << token.line << ":" << token.column << " " << clite::tokenKindName(token.kind) << " '" << token.text
              << "'\n";
  }
}
} // namespace

int main(int argc, char **argv) {
  clite::RunOptions options;
  std::string argError;
  if (!parseArgs(argc, argv, options, argError)) {
    if (!argError.empty()) {
      std::cerr << "Argument error: " << argError << "\n";
    }
    std::cerr << "Usage: clite <input.cl> [--entry <name>] [--no-entry] [--dump-stage tokens|ast] "
                 "[--max-depth <n>] [--max-parse-depth <n>]\n";
    return 2;
  }

  std::string source;
  if (!readSource(options.inputPath, source)) {
    std::cerr << options.inputPath << ": error: failed to read input file\n";
    return 2;
  }

  clite::Lexer lexer(source);
  std::vector<clite::Token> tokens;
  clite::LexError lexError;
  if (!lexer.tokenize(tokens, lexError)) {
    std::cerr << clite::formatDiagnostic(options.inputPath, lexError.line, lexError.column, "lex", lexError.message)
              << "\n";
    return 2;
  }
  if (options.dumpStage == "tokens") {
    dumpTokens(tokens);
    return 0;
  }

  clite::Parser parser(std::move(tokens), options.maxParseDepth);
  clite::Program program;
  clite::ParseError parseError;
  if (!parser.parse(program, parseError)) {
    std::cerr << clite::formatDiagnostic(
                     options.inputPath, parseError.line, parseError.column, "parse", parseError.message())
              << "\n";
    return 2;
  }
  if (options.dumpStage == "ast") {
    clite::AstPrinter printer;
    std::cout << printer.print(program);
    return 0;
  }

  clite::InterpreterOptions runOptions;
  runOptions.entryName = options.entryName;
  runOptions.callEntry = options.callEntry;
  runOptions.maxDepth = options.maxCallDepth;
  clite::Interpreter interpreter(std::cout);
  clite::Value result;
  clite::RuntimeError runtimeError;
  if (!interpreter.run(program, runOptions, result, runtimeError)) {
    std::cout.flush();
    std::cerr << clite::formatDiagnostic(options.inputPath,
                                         runtimeError.line,
                                         runtimeError.column,
                                         "runtime",
                                         std::string(clite::runtimeErrorKindName(runtimeError.kind)) + ": " +
                                             runtimeError.message)
              << "\n";
    return 3;
  }
  if (result.kind != clite::Value::Kind::Void) {
    std::cout << clite::renderValue(result) << "\n";
  }
  return 0;
}
