#include "extractor.hpp"
#include "path_resolver.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv)
{
  std::vector<std::string> args(argv, argv + argc);
  if (args.empty()) args.push_back("pdf2md");

  if (wantsHelp(args)) {
    std::cout << usageText(args[0]);
    return 0;
  }

  try {
    ResolvedPaths paths = resolvePaths(args, std::cout);
    extractPdfToMarkdown(paths.inputPath, paths.outputPath);
    std::cout << "Saved Markdown to: " << paths.outputPath.string() << "\n";
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }
}
