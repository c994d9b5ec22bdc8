#include "extraction_config.hpp"
#include "extraction_engine.hpp"
#include "json_export.hpp"
#include "logging.hpp"
#include "pdf_reader.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void printUsage(const char* argv0) {
  std::cerr << "Usage: " << argv0
            << " [--config=file] [--out=file.json | --out-dir=dir] [--no-json]"
               " [--tables-out=dir] [--first-page=N] [--last-page=N]"
               " [--log-level=none|error|warning|information|debug] [--log-file=path] <pdf_path>\n";
}

bool takeValue(const std::string& arg, const std::string& flag, std::string& value) {
  if (arg.rfind(flag, 0) != 0) return false;
  value = arg.substr(flag.size());
  return true;
}

int pageOption(const std::string& flag, const std::string& value) {
  try {
    size_t used = 0;
    int n = std::stoi(value, &used);
    if (used == value.size() && n > 0) return n;
  } catch (const std::exception&) {
  }
  throw std::runtime_error("Invalid value for " + flag + value);
}

} // namespace

int main(int argc, char** argv)
{
  try {
    std::string pdfPath;
    std::string configPath;
    std::string outPath;
    std::string outDir = "extracted_data";
    std::string tablesOutDir;
    std::string logLevel = "information";
    std::string logFile;
    std::string value;
    bool writeJson = true;
    int firstPage = 1;
    int lastPage = -1;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--no-json") {
        writeJson = false;
      } else if (arg == "--help" || arg == "-h") {
        printUsage(argv[0]);
        return 0;
      } else if (takeValue(arg, "--config=", configPath) ||
                 takeValue(arg, "--out=", outPath) ||
                 takeValue(arg, "--out-dir=", outDir) ||
                 takeValue(arg, "--tables-out=", tablesOutDir) ||
                 takeValue(arg, "--log-level=", logLevel) ||
                 takeValue(arg, "--log-file=", logFile)) {
        continue;
      } else if (takeValue(arg, "--first-page=", value)) {
        firstPage = pageOption("--first-page=", value);
      } else if (takeValue(arg, "--last-page=", value)) {
        lastPage = pageOption("--last-page=", value);
      } else if (arg.rfind("--", 0) == 0) {
        std::cerr << "Unknown option: " << arg << "\n";
        printUsage(argv[0]);
        return 2;
      } else if (pdfPath.empty()) {
        pdfPath = arg;
      }
    }

    configureLogging(logLevel, logFile);

    if (pdfPath.empty() || !std::filesystem::exists(pdfPath)) {
      std::cerr << "PDF not found: " << pdfPath << "\n";
      printUsage(argv[0]);
      return 2;
    }

    ExtractionConfig config = configPath.empty() ? ExtractionConfig() : loadExtractionConfig(configPath);
    ExtractionEngine engine(std::move(config));

    std::vector<Page> pages = readPdfDocument(pdfPath, firstPage, lastPage);

    if (!tablesOutDir.empty()) {
      std::vector<Table> tables;
      for (const auto& page : pages) {
        tables.insert(tables.end(), page.tables.begin(), page.tables.end());
      }
      writeTablesAsCsv(tables, tablesOutDir);
      std::cerr << "Extracted " << tables.size() << " table(s) to '" << tablesOutDir << "'\n";
    }

    ExtractionResult result = engine.extract(pages);

    nlohmann::json summary{
      {"filename", std::filesystem::path(pdfPath).filename().string()},
      {"stats", statisticsToJson(result.statistics)},
      {"rows", countersToJson(result.counters)},
      {"json_file", nullptr},
    };

    if (writeJson) {
      if (outPath.empty()) {
        outPath = (std::filesystem::path(outDir) /
                   makeOutputFileName(pdfPath, std::chrono::system_clock::now())).string();
      }
      saveDocumentJson(result.document, outPath);
      summary["json_file"] = outPath;
    }

    std::cout << summary.dump(2) << "\n";
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }
}
