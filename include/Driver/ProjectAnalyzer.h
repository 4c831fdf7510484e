#pragma once

#include <string>
#include <vector>
#include <map>
#include <set>
#include <memory>
#include <mutex>
#include <functional>
#include <cstdint>
#include "BatchScheduler.h"
#include "../Analysis/DeclarationValidator.h"
#include "../Cache/IncrementalCache.h"
#include "../Common/Error.h"
#include "../IR/ApplicationDeclaration.h"
#include "../Import/DependencyGraph.h"
#include "../Import/DependencyResolver.h"
#include "../Parser/SourceParser.h"
#include "../Semantic/SymbolRegistry.h"

namespace FJS {
namespace Driver {

/**
 * Pipeline state. Each phase advances the state once; any unrecoverable
 * failure moves to Error.
 */
enum class AnalyzerState {
    Idle,
    GraphBuilt,
    ChangesDetected,
    SymbolsResolved,
    IRGenerated,
    Linked,
    CachePersisted,
    Complete,
    Error
};

std::string analyzerStateToString(AnalyzerState state);

/**
 * Progress notification
 */
struct ProgressEvent {
    int phase;             // 1-6
    size_t current;
    size_t total;
    std::string message;
};

/**
 * Analyzer configuration
 */
struct AnalyzerConfig {
    std::string projectRoot;
    std::string sourceDirName = "lib";         // Source root, relative to projectRoot
    std::string manifestName = "pubspec.yaml";
    std::string cacheDir;                      // Empty: <projectRoot>/.fjs_cache

    size_t maxParallelism = 4;                 // Files per batch
    bool enableCache = true;
    bool verbose = false;                      // Print detailed pipeline steps
    size_t cacheMemoryCapacity = 256;          // LRU entries

    std::function<void(const ProgressEvent&)> progress;
    std::shared_ptr<Parser::ISourceParser> parser;  // Null: DartSourceParser
};

/**
 * Analysis statistics
 */
struct AnalysisStatistics {
    size_t totalFiles = 0;
    size_t processedFiles = 0;  // Freshly extracted
    size_t cachedFiles = 0;     // Reused from the cache
    size_t failedFiles = 0;
    size_t changedFiles = 0;    // Size of the dirty set
    int64_t durationMs = 0;

    double cacheHitRate() const {
        return totalFiles > 0 ? static_cast<double>(cachedFiles) / static_cast<double>(totalFiles) : 0.0;
    }
    double averageTimePerFile() const {
        return processedFiles > 0 ? static_cast<double>(durationMs) / static_cast<double>(processedFiles) : 0.0;
    }
    std::string toString() const;
};

/**
 * Analysis result
 */
struct ProjectAnalysisResult {
    AnalyzerState state = AnalyzerState::Idle;
    IR::ApplicationDeclaration application;
    Analysis::ValidationResult validation;

    std::vector<std::string> analysisOrder;          // Topological order
    std::set<std::string> dirtyFiles;
    std::vector<std::vector<std::string>> batches;   // Extraction batches, in run order
    std::vector<TaskFailure> failures;               // Per-file failures, one per file
    AnalysisStatistics statistics;

    // Set when state is Error
    Common::ErrorCode errorCode = Common::ErrorCode::InternalError;
    std::string errorMessage;

    bool success() const { return state == AnalyzerState::Complete; }
    bool isValid() const { return success() && validation.isValid; }
};

/**
 * Incremental project analyzer.
 * Runs the six-phase pipeline:
 *   1. dependency graph        4. IR generation (dirty files, batched)
 *   2. change detection        5. link and validate
 *   3. symbol resolution       6. cache persistence
 * The symbol registry and the cache survive between analyze() calls on the
 * same instance; the cache also survives between processes.
 */
class ProjectAnalyzer {
public:
    explicit ProjectAnalyzer(const AnalyzerConfig& config);
    ~ProjectAnalyzer() = default;

    /**
     * Validate the project layout and open the cache
     * @throws Common::FatalError when the project root, source root or
     *         manifest is missing
     */
    void initialize();

    /**
     * Run the full pipeline. Initializes first if needed. Fatal failures are
     * reported through the result (state Error) rather than thrown.
     */
    ProjectAnalysisResult analyze();

    /**
     * Parse and extract one file against the current registry and graph,
     * replacing its registry entries
     * @throws Analysis::ExtractionError on parse errors
     */
    IR::FileDeclaration analyzeFile(const std::string& file);

    AnalyzerState state() const { return state_; }
    const Semantic::SymbolRegistry& registry() const { return registry_; }
    const Import::DependencyGraph& graph() const;
    const std::string& packageName() const { return packageName_; }
    const std::string& sourceRoot() const { return sourceRoot_; }

    // Null when caching is disabled or the cache directory is unusable
    Cache::IncrementalCache* cache() { return cache_.get(); }

private:
    // Working data of one analyze() call
    struct PipelineRun {
        std::vector<std::string> order;
        std::set<std::string> dirty;
        std::map<std::string, std::string> hashes;
        std::map<std::string, std::shared_ptr<const IR::FileDeclaration>> cached;

        std::mutex mutex;  // Guards the three members below
        std::map<std::string, Parser::ParseResult> parsed;
        std::map<std::string, IR::FileDeclaration> fresh;
        std::map<std::string, std::string> failures;
    };

    AnalyzerConfig config_;
    AnalyzerState state_;
    bool initialized_;

    std::string projectRoot_;
    std::string sourceRoot_;
    std::string packageName_;

    std::shared_ptr<Parser::ISourceParser> parser_;
    std::unique_ptr<Import::DependencyResolver> resolver_;
    std::unique_ptr<Cache::IncrementalCache> cache_;
    Semantic::SymbolRegistry registry_;
    BatchScheduler scheduler_;

    std::set<std::string> knownFiles_;  // Graph nodes of the previous run

    mutable std::mutex logMutex_;

    // Pipeline stages
    void buildDependencyGraph(PipelineRun& run, ProjectAnalysisResult& result);
    void detectChanges(PipelineRun& run, ProjectAnalysisResult& result);
    void resolveSymbols(PipelineRun& run, ProjectAnalysisResult& result);
    void generateIR(PipelineRun& run, ProjectAnalysisResult& result);
    void linkAndValidate(PipelineRun& run, ProjectAnalysisResult& result);
    void persistCache(PipelineRun& run, ProjectAnalysisResult& result);

    // Helper methods
    void recordFailures(PipelineRun& run, const std::vector<TaskFailure>& failures);
    void logVerbose(const std::string& message) const;
    void logWarning(const std::string& message) const;
    void reportProgress(int phase, size_t current, size_t total, const std::string& message) const;
};

} // namespace Driver
} // namespace FJS
