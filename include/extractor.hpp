#pragma once

#include <filesystem>
#include <optional>
#include <string>

struct PdfDocument {
  std::filesystem::path path;
  int pageCount = 0;
};

// Opens the PDF by querying its page count with `pdfinfo`.
// Throws OpenError if the tool is missing or the file cannot be parsed.
PdfDocument openPdf(const std::filesystem::path& pdfPath);

// Plain text of the page at the 0-based index, extracted with `pdftotext`.
// Returns std::nullopt if the page cannot be retrieved.
std::optional<std::string> extractPageText(const PdfDocument& doc, int pageIndex);

// Reads the "Pages:" field of pdfinfo output.
std::optional<int> parsePageCount(const std::string& pdfinfoOutput);

// Extracts every page of inputPath and writes the Markdown to outputPath.
// Throws OpenError or WriteError.
void extractPdfToMarkdown(const std::filesystem::path& inputPath,
                          const std::filesystem::path& outputPath);
