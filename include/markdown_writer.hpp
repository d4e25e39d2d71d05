#pragma once

#include <filesystem>
#include <string>
#include <vector>

// Title line every generated document starts with, followed by a blank line.
extern const char* const kMarkdownTitle;

// Append-only Markdown document. Segments are joined once by str().
class MarkdownBuffer {
 public:
  MarkdownBuffer();

  // Appends "## Page <pageNumber>\n\n<text>\n\n---\n\n". pageNumber is 1-based.
  void appendPage(int pageNumber, const std::string& text);

  size_t pageCount() const { return pageCount_; }
  std::string str() const;

 private:
  std::vector<std::string> segments_;
  size_t pageCount_ = 0;
};

// Writes content to path as UTF-8 bytes through a temporary file in the same
// directory that is renamed over path. On failure path is left untouched.
// Throws WriteError.
void writeFileAtomically(const std::filesystem::path& path, const std::string& content);
