#pragma once

#include <iostream>
#include <string>
#include <vector>

namespace FJS {
namespace Utils {

/**
 * Command-line argument parser for the fjs-analyze tool
 */
class ArgumentParser {
public:
    ArgumentParser(int argc, char* argv[]) {
        programName_ = argv[0];

        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];

            if (arg[0] == '-') {
                // Flag or option
                if ((arg == "-j" || arg == "--jobs") && i + 1 < argc) {
                    // Files per batch
                    parseJobs(argv[++i]);
                }
                else if (arg.rfind("-j", 0) == 0 && arg.size() > 2 && arg[2] != '-') {
                    parseJobs(arg.substr(2));
                }
                else if (arg == "--cache-dir" && i + 1 < argc) {
                    cacheDir_ = argv[++i];
                }
                else if (arg == "--no-cache") {
                    enableCache_ = false;
                }
                else if (arg == "--clear-cache") {
                    clearCache_ = true;
                }
                else if (arg == "--source-dir" && i + 1 < argc) {
                    sourceDir_ = argv[++i];
                }
                else if (arg == "--print-graph") {
                    printGraph_ = true;
                }
                else if (arg == "--print-structure") {
                    printStructure_ = true;
                }
                else if (arg == "-W" || arg == "--warnings") {
                    showWarnings_ = true;
                }
                else if (arg == "-v" || arg == "--verbose") {
                    verbose_ = true;
                }
                else if (arg == "--help" || arg == "-h") {
                    showHelp_ = true;
                }
                else {
                    unknownFlags_.push_back(arg);
                }
            }
            else {
                // Positional argument: the project root
                if (projectRoot_.empty()) {
                    projectRoot_ = arg;
                }
                else {
                    unknownArgs_.push_back(arg);
                }
            }
        }
    }

    std::string programName() const { return programName_; }
    std::string projectRoot() const { return projectRoot_.empty() ? std::string(".") : projectRoot_; }
    std::string cacheDir() const { return cacheDir_; }
    std::string sourceDir() const { return sourceDir_; }

    size_t jobs() const { return jobs_; }
    bool enableCache() const { return enableCache_; }
    bool clearCache() const { return clearCache_; }
    bool printGraph() const { return printGraph_; }
    bool printStructure() const { return printStructure_; }
    bool showWarnings() const { return showWarnings_; }
    bool verbose() const { return verbose_; }
    bool showHelp() const { return showHelp_; }

    const std::vector<std::string>& unknownFlags() const { return unknownFlags_; }
    const std::vector<std::string>& unknownArgs() const { return unknownArgs_; }

    bool hasErrors() const {
        return !unknownFlags_.empty() || !unknownArgs_.empty() || !invalidValues_.empty();
    }

    void printHelp() const {
        std::cout << "FJS Project Analyzer\n";
        std::cout << "====================\n\n";
        std::cout << "Usage: " << programName_ << " [options] [project-root]\n\n";
        std::cout << "Options:\n";
        std::cout << "  -j, --jobs <n>       Files analyzed in parallel per batch (default: 4)\n";
        std::cout << "  --source-dir <dir>   Source root relative to the project (default: lib)\n";
        std::cout << "  --cache-dir <dir>    Cache directory (default: <project>/.fjs_cache)\n";
        std::cout << "  --no-cache           Analyze every file, do not read or write the cache\n";
        std::cout << "  --clear-cache        Delete the cache before analyzing\n";
        std::cout << "  --print-graph        Print the import graph\n";
        std::cout << "  --print-structure    Print the declarations of every file\n";
        std::cout << "  -W, --warnings       Print validation warnings\n";
        std::cout << "  -v, --verbose        Verbose output\n";
        std::cout << "  -h, --help           Show this help message\n\n";
        std::cout << "Examples:\n";
        std::cout << "  " << programName_ << " my_app               # Analyze my_app/lib\n";
        std::cout << "  " << programName_ << " my_app -j 8 -v       # Eight files per batch, verbose\n";
        std::cout << "  " << programName_ << " my_app --no-cache -W # Full analysis with warnings\n";
    }

    void printErrors() const {
        if (!unknownFlags_.empty()) {
            std::cerr << "Error: Unknown flags:";
            for (const auto& flag : unknownFlags_) {
                std::cerr << " " << flag;
            }
            std::cerr << "\n";
        }

        if (!unknownArgs_.empty()) {
            std::cerr << "Error: Unknown arguments:";
            for (const auto& arg : unknownArgs_) {
                std::cerr << " " << arg;
            }
            std::cerr << "\n";
        }

        for (const auto& value : invalidValues_) {
            std::cerr << "Error: Invalid job count: " << value << "\n";
        }

        std::cerr << "Use --help for usage information\n";
    }

private:
    std::string programName_;
    std::string projectRoot_;
    std::string cacheDir_;
    std::string sourceDir_ = "lib";

    size_t jobs_ = 4;
    bool enableCache_ = true;
    bool clearCache_ = false;
    bool printGraph_ = false;
    bool printStructure_ = false;
    bool showWarnings_ = false;
    bool verbose_ = false;
    bool showHelp_ = false;

    std::vector<std::string> unknownFlags_;
    std::vector<std::string> unknownArgs_;
    std::vector<std::string> invalidValues_;

    void parseJobs(const std::string& value) {
        size_t parsed = 0;
        for (char c : value) {
            if (c < '0' || c > '9') {
                invalidValues_.push_back(value);
                return;
            }
            parsed = parsed * 10 + static_cast<size_t>(c - '0');
        }
        if (value.empty() || parsed == 0) {
            invalidValues_.push_back(value);
            return;
        }
        jobs_ = parsed;
    }
};

} // namespace Utils
} // namespace FJS
