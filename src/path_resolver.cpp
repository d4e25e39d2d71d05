#include "path_resolver.hpp"

#include "errors.hpp"

#include <optional>
#include <system_error>

namespace fs = std::filesystem;

namespace {

const std::string kOutputFlag = "--output";
const std::string kOutputFlagEq = "--output=";

struct ParsedArgs {
  std::optional<std::string> inputPath;
  std::optional<std::string> outputValue;
};

ParsedArgs parseArgs(const std::vector<std::string>& args) {
  ParsedArgs parsed;
  for (size_t i = 1; i < args.size(); ++i) {
    const std::string& arg = args[i];
    if (arg == kOutputFlag) {
      // A trailing --output without a value falls back to the default location.
      if (i + 1 < args.size()) {
        if (!parsed.outputValue) parsed.outputValue = args[i + 1];
        ++i;
      }
    } else if (arg.rfind(kOutputFlagEq, 0) == 0) {
      std::string value = arg.substr(kOutputFlagEq.size());
      if (value.empty()) {
        throw UsageError("--output requires a value\n" + usageText(args[0]));
      }
      if (!parsed.outputValue) parsed.outputValue = value;
    } else if (arg.rfind("--", 0) == 0) {
      throw UsageError("Unknown option: " + arg + "\n" + usageText(args[0]));
    } else if (!parsed.inputPath) {
      parsed.inputPath = arg;
    }
  }
  return parsed;
}

bool isExistingDirectory(const fs::path& p) {
  std::error_code ec;
  return fs::is_directory(p, ec);
}

bool pathExists(const fs::path& p) {
  std::error_code ec;
  return fs::exists(p, ec);
}

} // namespace

std::string usageText(const std::string& programName) {
  return "Usage: " + programName + " <input.pdf> [--output <output_dir_or_file.md>]\n"
         "  " + programName + " input.pdf                          -> <program dir>/output/input.md\n"
         "  " + programName + " input.pdf --output ./my_output/    -> ./my_output/input.md\n"
         "  " + programName + " input.pdf --output ./specific.md   -> ./specific.md\n";
}

bool wantsHelp(const std::vector<std::string>& args) {
  for (size_t i = 1; i < args.size(); ++i) {
    if (args[i] == "-h" || args[i] == "--help") return true;
    // The value of --output is never an option.
    if (args[i] == kOutputFlag) ++i;
  }
  return false;
}

ResolvedPaths resolvePaths(const std::vector<std::string>& args, std::ostream& info) {
  const std::string programName = args.empty() ? std::string("pdf2md") : args[0];
  if (args.size() < 2) {
    throw UsageError("Missing input PDF path\n" + usageText(programName));
  }

  ParsedArgs parsed = parseArgs(args);
  if (!parsed.inputPath) {
    throw UsageError("Missing input PDF path\n" + usageText(programName));
  }

  ResolvedPaths resolved;
  resolved.inputPath = *parsed.inputPath;

  std::error_code ec;
  if (!fs::exists(resolved.inputPath, ec)) {
    throw InputNotFoundError("Input file '" + resolved.inputPath.string() + "' not found");
  }
  if (!fs::is_regular_file(resolved.inputPath, ec)) {
    throw InputNotFoundError("Input path '" + resolved.inputPath.string() + "' is not a regular file");
  }

  // stem() drops only the final extension: "a.tar.pdf" -> "a.tar".
  const std::string fileName = resolved.inputPath.stem().string() + ".md";

  if (parsed.outputValue) {
    fs::path requested = *parsed.outputValue;
    if (isExistingDirectory(requested)) {
      resolved.outputPath = requested / fileName;
      resolved.target = OutputTarget::Directory;
      info << "INFO: Output directory given: '" << requested.string() << "'\n";
      info << "INFO: Output file: '" << resolved.outputPath.string() << "'\n";
    } else if (pathExists(requested)) {
      resolved.outputPath = requested;
      resolved.target = OutputTarget::ExistingFile;
      info << "INFO: Output file given (existing file, will be overwritten): '"
           << resolved.outputPath.string() << "'\n";
    } else {
      resolved.outputPath = requested;
      resolved.target = OutputTarget::NewFile;
      info << "INFO: New output file given: '" << resolved.outputPath.string() << "'\n";
    }
    return resolved;
  }

  fs::path outputDir = fs::path(programName).parent_path() / "output";
  if (!isExistingDirectory(outputDir)) {
    throw DefaultOutputDirMissingError(
      "Default output directory '" + outputDir.string() + "' is missing or not a directory.\n"
      "Create a directory named 'output' next to the program, or pass --output <dir-or-file>.");
  }
  resolved.outputPath = outputDir / fileName;
  resolved.target = OutputTarget::Default;
  info << "INFO: Default output file: '" << resolved.outputPath.string() << "'\n";
  return resolved;
}
