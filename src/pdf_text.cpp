#include "pdf_text.hpp"

#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

namespace {

bool commandExists(const std::string& command) {
  std::string test = "command -v " + command + " >/dev/null 2>&1";
  int rc = std::system(test.c_str());
  return rc == 0;
}

} // namespace

std::string pageRangeOptions(int firstPage, int lastPage) {
  std::string opts;
  if (firstPage > 0) {
    opts += " -f " + std::to_string(firstPage);
  }
  if (lastPage > 0 && lastPage >= firstPage) {
    opts += " -l " + std::to_string(lastPage);
  }
  return opts;
}

std::string runPdftotext(const std::string& options, const std::string& pdfPath) {
  if (!commandExists("pdftotext")) {
    throw std::runtime_error(
      "pdftotext not found. Please install poppler-utils (e.g., apt-get install -y poppler-utils)."
    );
  }
  std::string cmd = "pdftotext " + options + " -q \"" + pdfPath + "\" -";
  spdlog::debug("Running: {}", cmd);

  FILE* pipe = popen(cmd.c_str(), "r");
  if (!pipe) {
    throw std::runtime_error("Failed to open pipe to pdftotext");
  }

  std::string output;
  char buffer[8192];
  while (true) {
    size_t n = std::fread(buffer, 1, sizeof(buffer), pipe);
    if (n > 0) output.append(buffer, n);
    if (n < sizeof(buffer)) break;
  }

  int rc = pclose(pipe);
  if (rc != 0) {
    throw std::runtime_error("pdftotext returned non-zero exit code for " + pdfPath);
  }

  return output;
}

std::string extractPdfText(const std::string& pdfPath, int firstPage, int lastPage) {
  return runPdftotext("-layout" + pageRangeOptions(firstPage, lastPage), pdfPath);
}

std::vector<std::string> splitPageTexts(const std::string& text) {
  std::vector<std::string> pages;
  size_t start = 0;
  while (start < text.size()) {
    size_t end = text.find('\f', start);
    if (end == std::string::npos) {
      pages.push_back(text.substr(start));
      break;
    }
    pages.push_back(text.substr(start, end - start));
    start = end + 1;
  }
  return pages;
}
