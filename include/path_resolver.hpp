#pragma once

#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

enum class OutputTarget {
  Directory,     // --output named an existing directory
  ExistingFile,  // --output named an existing file, which gets overwritten
  NewFile,       // --output named a path that does not exist yet
  Default        // <program dir>/output/<base>.md
};

struct ResolvedPaths {
  std::filesystem::path inputPath;
  std::filesystem::path outputPath;
  OutputTarget target = OutputTarget::Default;
};

// Usage text printed on --help and on usage errors. programName is shown as-is.
std::string usageText(const std::string& programName);

// True if args contain -h or --help.
bool wantsHelp(const std::vector<std::string>& args);

// Resolves input and output paths from the full argument vector (args[0] is
// the program path). Informational lines describing the chosen output are
// written to info.
// Throws UsageError, InputNotFoundError or DefaultOutputDirMissingError.
ResolvedPaths resolvePaths(const std::vector<std::string>& args, std::ostream& info);
