#include <iostream>
#include <string>
#include "FJS.h"
#include "Utils/ArgumentParser.h"

using namespace FJS;

namespace {

void printStructure(const IR::ApplicationDeclaration& app, const std::string& root) {
    std::cout << "\nFile structure:\n";
    for (const auto& [file, entries] : app.fileStructure) {
        std::cout << "  " << Import::FileIdentity::relativeTo(file, root) << "\n";
        for (const auto& entry : entries) {
            std::cout << "    " << entry << "\n";
        }
    }
}

void printIssues(const std::vector<Analysis::ValidationIssue>& issues, const char* label) {
    for (const auto& issue : issues) {
        std::cerr << "  " << label << ": " << issue.toString() << "\n";
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    Utils::ArgumentParser args(argc, argv);

    if (args.showHelp()) {
        args.printHelp();
        return 0;
    }
    if (args.hasErrors()) {
        args.printErrors();
        return 1;
    }

    std::cout << "FJS Project Analyzer\n";
    std::cout << "====================\n\n";

    Driver::AnalyzerConfig config;
    config.projectRoot = args.projectRoot();
    config.sourceDirName = args.sourceDir();
    config.cacheDir = args.cacheDir();
    config.maxParallelism = args.jobs();
    config.enableCache = args.enableCache();
    config.verbose = args.verbose();

    try {
        Driver::ProjectAnalyzer analyzer(config);
        analyzer.initialize();

        if (args.clearCache() && analyzer.cache()) {
            analyzer.cache()->clear();
            std::cout << "✓ Cache cleared\n";
        }

        Driver::ProjectAnalysisResult result = analyzer.analyze();
        if (!result.success()) {
            std::cerr << "✗ Analysis failed: " << result.errorMessage << "\n";
            return 1;
        }

        if (args.printGraph()) {
            analyzer.graph().print();
        }
        if (args.printStructure()) {
            printStructure(result.application, analyzer.sourceRoot());
        }

        for (const auto& failure : result.failures) {
            std::cerr << "  failed: " << failure.file << ": " << failure.message << "\n";
        }
        printIssues(result.validation.errors, "error");
        if (args.showWarnings()) {
            printIssues(result.validation.warnings, "warning");
        }

        const auto& app = result.application;
        std::cout << "\n" << (result.validation.isValid ? "✓ " : "✗ ") << result.validation.getSummary() << "\n";
        std::cout << "  Files: " << result.statistics.totalFiles
                  << " (" << result.statistics.changedFiles << " changed, "
                  << result.statistics.cachedFiles << " cached, "
                  << result.statistics.failedFiles << " failed)\n";
        std::cout << "  Components: " << app.components.size()
                  << ", state holders: " << app.stateHolders.size()
                  << ", observables: " << app.observables.size()
                  << ", types: " << app.plainTypes.size()
                  << ", functions: " << app.functions.size() << "\n";
        std::cout << "  Time: " << result.statistics.durationMs << "ms\n";

        return (result.validation.isValid && result.failures.empty()) ? 0 : 1;

    } catch (const Common::FatalError& e) {
        std::cerr << "Fatal error: [" << Common::errorCodeName(e.code()) << "] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
