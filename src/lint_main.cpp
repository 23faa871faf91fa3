#include "clite/Linter.h"
#include "clite/Options.h"

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace {
bool parseArgs(int argc, char **argv, clite::LintOptions &out, std::string &error) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--fail-on-warn") {
      out.failOnWarn = true;
    } else if (!arg.empty() && arg[0] == '-') {
      error = "unknown option: " + arg;
      return false;
    } else {
      out.inputPaths.push_back(arg);
    }
  }
  return !out.inputPaths.empty();
}
} // namespace

int main(int argc, char **argv) {
  clite::LintOptions options;
  std::string argError;
  if (!parseArgs(argc, argv, options, argError)) {
    if (!argError.empty()) {
      std::cerr << "Argument error: " << argError << "\n";
    }
    std::cerr << "Usage: clite-lint <file.cl>... [--fail-on-warn]\n";
    return 2;
  }

  clite::Linter linter;
  size_t warningCount = 0;
  for (const auto &path : options.inputPaths) {
    std::ifstream file(path);
    if (!file) {
      std::cerr << path << ": error: failed to read input file\n";
      return 2;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    std::vector<clite::LintWarning> warnings;
    linter.lintSource(path, buffer.str(), warnings);
    for (const auto &warning : warnings) {
      std::cout << clite::formatLintWarning(warning) << "\n";
    }
    warningCount += warnings.size();
  }
  if (options.failOnWarn && warningCount > 0) {
    return 1;
  }
  return 0;
}
