#include "markdown_writer.hpp"

#include "errors.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>

#include <unistd.h>

const char* const kMarkdownTitle = "# PDFから抽出されたテキスト";

MarkdownBuffer::MarkdownBuffer() {
  segments_.push_back(std::string(kMarkdownTitle) + "\n\n");
}

void MarkdownBuffer::appendPage(int pageNumber, const std::string& text) {
  segments_.push_back("## Page " + std::to_string(pageNumber) + "\n\n");
  segments_.push_back(text);
  segments_.push_back("\n\n---\n\n");
  pageCount_++;
}

std::string MarkdownBuffer::str() const {
  size_t total = 0;
  for (const auto& s : segments_) total += s.size();
  std::string out;
  out.reserve(total);
  for (const auto& s : segments_) out += s;
  return out;
}

void writeFileAtomically(const std::filesystem::path& path, const std::string& content) {
  namespace fs = std::filesystem;

  fs::path tmpPath = path;
  tmpPath += ".tmp." + std::to_string(::getpid());

  {
    std::ofstream ofs(tmpPath, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      throw WriteError("Failed to write '" + path.string() + "': " + std::strerror(errno));
    }
    ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
    ofs.flush();
    if (!ofs) {
      int err = errno;
      ofs.close();
      std::error_code ignored;
      fs::remove(tmpPath, ignored);
      throw WriteError("Failed to write '" + path.string() + "': " + std::strerror(err));
    }
  }

  std::error_code ec;
  fs::rename(tmpPath, path, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tmpPath, ignored);
    throw WriteError("Failed to write '" + path.string() + "': " + ec.message());
  }
}
