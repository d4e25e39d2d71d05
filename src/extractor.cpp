#include "extractor.hpp"

#include "errors.hpp"
#include "markdown_writer.hpp"

#include <cstdio>
#include <cstdlib>
#include <regex>
#include <stdexcept>
#include <string>

namespace {

bool commandExists(const std::string& command) {
  std::string test = "command -v " + command + " >/dev/null 2>&1";
  int rc = std::system(test.c_str());
  return rc == 0;
}

// Single-quotes a path for /bin/sh.
std::string shellQuote(const std::string& s) {
  std::string quoted = "'";
  for (char ch : s) {
    if (ch == '\'') quoted += "'\\''";
    else quoted += ch;
  }
  quoted += "'";
  return quoted;
}

// Runs cmd and captures its stdout. Returns std::nullopt if the pipe cannot
// be opened or the command exits non-zero.
std::optional<std::string> runCaptureStdout(const std::string& cmd) {
  FILE* pipe = popen(cmd.c_str(), "r");
  if (!pipe) return std::nullopt;

  std::string output;
  char buffer[4096];
  while (true) {
    size_t n = std::fread(buffer, 1, sizeof(buffer), pipe);
    if (n > 0) output.append(buffer, n);
    if (n < sizeof(buffer)) break;
  }

  int rc = pclose(pipe);
  if (rc != 0) return std::nullopt;
  return output;
}

// pdftotext ends every line with a newline; the section layout adds its own.
std::string trimTrailingNewlines(std::string s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
  return s;
}

void requireTool(const std::string& tool, const std::filesystem::path& pdfPath) {
  if (!commandExists(tool)) {
    throw OpenError(
      "Could not open PDF: " + pdfPath.string() + ": " + tool +
      " not found. Please install poppler-utils (e.g., apt-get install -y poppler-utils).");
  }
}

// Path argument for poppler tools, quoted for the shell. A leading '-' would
// be read as an option.
std::string toolPath(const std::filesystem::path& p) {
  std::string s = p.string();
  if (!s.empty() && s[0] == '-') s = "./" + s;
  return shellQuote(s);
}

} // namespace

std::optional<int> parsePageCount(const std::string& pdfinfoOutput) {
  std::regex pagesLine("(^|\\n)Pages:\\s*([0-9]+)");
  std::smatch m;
  if (!std::regex_search(pdfinfoOutput, m, pagesLine)) return std::nullopt;
  try {
    return std::stoi(m[2].str());
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

PdfDocument openPdf(const std::filesystem::path& pdfPath) {
  requireTool("pdfinfo", pdfPath);
  requireTool("pdftotext", pdfPath);

  std::optional<std::string> info =
    runCaptureStdout("pdfinfo " + toolPath(pdfPath) + " 2>/dev/null");
  if (!info) {
    throw OpenError("Could not open PDF: " + pdfPath.string());
  }
  std::optional<int> pages = parsePageCount(*info);
  if (!pages) {
    throw OpenError("Could not read page count of PDF: " + pdfPath.string());
  }

  PdfDocument doc;
  doc.path = pdfPath;
  doc.pageCount = *pages;
  return doc;
}

std::optional<std::string> extractPageText(const PdfDocument& doc, int pageIndex) {
  if (pageIndex < 0 || pageIndex >= doc.pageCount) return std::nullopt;
  const std::string pageNumber = std::to_string(pageIndex + 1);
  std::string cmd = "pdftotext -f " + pageNumber + " -l " + pageNumber +
                    " -enc UTF-8 -nopgbrk -q " + toolPath(doc.path) + " -";
  std::optional<std::string> text = runCaptureStdout(cmd);
  if (!text) return std::nullopt;
  return trimTrailingNewlines(*text);
}

void extractPdfToMarkdown(const std::filesystem::path& inputPath,
                          const std::filesystem::path& outputPath) {
  PdfDocument doc = openPdf(inputPath);

  MarkdownBuffer markdown;
  for (int i = 0; i < doc.pageCount; ++i) {
    std::optional<std::string> text = extractPageText(doc, i);
    if (!text) continue;
    markdown.appendPage(i + 1, *text);
  }

  writeFileAtomically(outputPath, markdown.str());
}
