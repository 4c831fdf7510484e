#include "Driver/ProjectAnalyzer.h"
#include "Analysis/AnalysisContext.h"
#include "Analysis/DeclarationExtractor.h"
#include "Analysis/DeclarationLinker.h"
#include "Common/Debug.h"
#include "Common/Hash.h"
#include "Import/FileIdentity.h"
#include "Utils/FileUtils.h"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <sstream>
#include <iomanip>

namespace FJS {
namespace Driver {

std::string analyzerStateToString(AnalyzerState state) {
    switch (state) {
        case AnalyzerState::Idle: return "Idle";
        case AnalyzerState::GraphBuilt: return "GraphBuilt";
        case AnalyzerState::ChangesDetected: return "ChangesDetected";
        case AnalyzerState::SymbolsResolved: return "SymbolsResolved";
        case AnalyzerState::IRGenerated: return "IRGenerated";
        case AnalyzerState::Linked: return "Linked";
        case AnalyzerState::CachePersisted: return "CachePersisted";
        case AnalyzerState::Complete: return "Complete";
        case AnalyzerState::Error: return "Error";
        default: return "Unknown";
    }
}

std::string AnalysisStatistics::toString() const {
    std::ostringstream out;
    out << "total: " << totalFiles
        << ", processed: " << processedFiles
        << ", cached: " << cachedFiles
        << ", failed: " << failedFiles
        << ", changed: " << changedFiles
        << ", duration: " << durationMs << "ms"
        << ", cache hit rate: " << std::fixed << std::setprecision(1) << (cacheHitRate() * 100.0) << "%"
        << ", avg: " << std::setprecision(1) << averageTimePerFile() << "ms/file";
    return out.str();
}

ProjectAnalyzer::ProjectAnalyzer(const AnalyzerConfig& config)
    : config_(config),
      state_(AnalyzerState::Idle),
      initialized_(false),
      parser_(config.parser),
      scheduler_(config.maxParallelism) {
    if (!parser_) {
        parser_ = std::make_shared<Parser::DartSourceParser>();
    }
}

void ProjectAnalyzer::initialize() {
    if (config_.projectRoot.empty() || !Utils::FileUtils::directoryExists(config_.projectRoot)) {
        throw Common::FatalError(Common::ErrorCode::ProjectRootNotFound,
                                 "Project root not found: " + config_.projectRoot);
    }
    projectRoot_ = Import::FileIdentity::of(config_.projectRoot);

    sourceRoot_ = Import::FileIdentity::of(Utils::FileUtils::joinPath({projectRoot_, config_.sourceDirName}));
    if (!Utils::FileUtils::directoryExists(sourceRoot_)) {
        throw Common::FatalError(Common::ErrorCode::ProjectRootNotFound,
                                 config_.sourceDirName + " directory not found at " + projectRoot_);
    }

    std::string manifestPath = Utils::FileUtils::joinPath({projectRoot_, config_.manifestName});
    if (!Utils::FileUtils::fileExists(manifestPath)) {
        throw Common::FatalError(Common::ErrorCode::ManifestNotFound,
                                 config_.manifestName + " not found at " + projectRoot_);
    }
    try {
        packageName_ = Import::DependencyResolver::readPackageName(Utils::FileUtils::readFile(manifestPath));
    } catch (const std::runtime_error& e) {
        throw Common::FatalError(Common::ErrorCode::IOError, e.what());
    }

    resolver_ = std::make_unique<Import::DependencyResolver>(projectRoot_, sourceRoot_, packageName_);

    cache_.reset();
    if (config_.enableCache) {
        std::string cacheDir = config_.cacheDir.empty()
            ? Utils::FileUtils::joinPath({projectRoot_, ".fjs_cache"})
            : config_.cacheDir;
        auto cache = std::make_unique<Cache::IncrementalCache>(cacheDir, config_.cacheMemoryCapacity);
        if (cache->initialize()) {
            cache_ = std::move(cache);
        } else {
            logWarning("Cache disabled for this run");
        }
    }

    logVerbose("=== FJS Project Analyzer ===");
    logVerbose("Project: " + projectRoot_);
    logVerbose("Package: " + (packageName_.empty() ? std::string("<unnamed>") : packageName_));
    logVerbose("Cache: " + (cache_ ? cache_->directory() : std::string("disabled")));
    logVerbose("");

    initialized_ = true;
}

const Import::DependencyGraph& ProjectAnalyzer::graph() const {
    static const Import::DependencyGraph empty;
    return resolver_ ? resolver_->getGraph() : empty;
}

ProjectAnalysisResult ProjectAnalyzer::analyze() {
    ProjectAnalysisResult result;
    PipelineRun run;
    auto start = std::chrono::steady_clock::now();

    try {
        if (!initialized_) {
            initialize();
        }
        state_ = AnalyzerState::Idle;

        // Phase 1: Dependency graph
        logVerbose("[1/6] Building dependency graph...");
        buildDependencyGraph(run, result);
        state_ = AnalyzerState::GraphBuilt;
        logVerbose("✓ Dependency graph built: " + std::to_string(run.order.size()) + " files, " +
                   std::to_string(graph().edgeCount()) + " imports");

        // Phase 2: Change detection
        logVerbose("[2/6] Detecting changes...");
        detectChanges(run, result);
        state_ = AnalyzerState::ChangesDetected;
        logVerbose("✓ " + std::to_string(run.dirty.size()) + " of " + std::to_string(run.order.size()) +
                   " files need analysis");

        // Phase 3: Symbol resolution
        logVerbose("[3/6] Resolving symbols...");
        resolveSymbols(run, result);
        state_ = AnalyzerState::SymbolsResolved;
        logVerbose("✓ Symbols resolved: " + std::to_string(registry_.size()) + " types registered");

        // Phase 4: IR generation
        logVerbose("[4/6] Generating IR...");
        generateIR(run, result);
        state_ = AnalyzerState::IRGenerated;
        logVerbose("✓ IR generated: " + std::to_string(run.fresh.size()) + " extracted, " +
                   std::to_string(run.cached.size()) + " from cache");

        // Phase 5: Link and validate
        logVerbose("[5/6] Linking and validating...");
        linkAndValidate(run, result);
        state_ = AnalyzerState::Linked;
        logVerbose("✓ " + result.validation.getSummary());

        // Phase 6: Cache persistence
        logVerbose("[6/6] Persisting cache...");
        persistCache(run, result);
        state_ = AnalyzerState::CachePersisted;

        state_ = AnalyzerState::Complete;
    } catch (const Common::FatalError& e) {
        state_ = AnalyzerState::Error;
        result.errorCode = e.code();
        result.errorMessage = e.what();
        std::cerr << "Error: [" << Common::errorCodeName(e.code()) << "] " << e.what() << std::endl;
    } catch (const std::exception& e) {
        state_ = AnalyzerState::Error;
        result.errorCode = Common::ErrorCode::InternalError;
        result.errorMessage = e.what();
        std::cerr << "Error: [" << Common::errorCodeName(Common::ErrorCode::InternalError) << "] "
                  << e.what() << std::endl;
    }

    for (const auto& [file, message] : run.failures) {
        result.failures.push_back({file, message});
    }

    auto elapsed = std::chrono::steady_clock::now() - start;
    result.statistics.durationMs = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    result.statistics.totalFiles = run.order.size();
    result.statistics.changedFiles = run.dirty.size();
    result.statistics.processedFiles = run.fresh.size();
    result.statistics.cachedFiles = run.cached.size();
    result.statistics.failedFiles = run.failures.size();
    result.state = state_;

    if (state_ == AnalyzerState::Complete) {
        logVerbose("");
        logVerbose("=== Analysis complete ===");
        logVerbose(result.statistics.toString());
    }
    return result;
}

//==============================================================================
// Phase 1: Dependency graph
//==============================================================================

void ProjectAnalyzer::buildDependencyGraph(PipelineRun& run, ProjectAnalysisResult& result) {
    std::vector<std::string> files;
    for (const auto& path : Utils::FileUtils::listFilesRecursive(sourceRoot_, ".dart")) {
        files.push_back(Import::FileIdentity::of(path));
    }
    reportProgress(1, 0, files.size(), "Scanning imports");

    // A fresh resolver per run so added and deleted files resolve correctly
    resolver_ = std::make_unique<Import::DependencyResolver>(projectRoot_, sourceRoot_, packageName_);
    const Import::DependencyGraph& deps = resolver_->buildGraph(files);

    Import::CycleCheckResult cycles = deps.checkCycles();
    if (!cycles.isAcyclic()) {
        logWarning("Found " + std::to_string(cycles.cycles.size()) + " circular dependencies");
        const size_t shown = std::min<size_t>(cycles.cycles.size(), 5);
        for (size_t i = 0; i < shown; ++i) {
            std::string line;
            for (const auto& file : cycles.cycles[i]) {
                if (!line.empty()) line += " -> ";
                line += Import::FileIdentity::baseName(file);
            }
            logVerbose("  Cycle: " + line);
        }
        if (cycles.cycles.size() > shown) {
            logVerbose("  ... and " + std::to_string(cycles.cycles.size() - shown) + " more cycles");
        }
    }

    try {
        run.order = deps.topologicalSort();
    } catch (const Import::CircularDependencyError& e) {
        throw Common::FatalError(Common::ErrorCode::CircularImport, e.what());
    }
    result.analysisOrder = run.order;

    // Symbols of files that disappeared since the previous run
    for (const auto& file : knownFiles_) {
        if (!deps.contains(file)) {
            registry_.removeAllForFile(file);
        }
    }
    knownFiles_ = deps.nodes();

    reportProgress(1, files.size(), files.size(), "Dependency graph built");
}

//==============================================================================
// Phase 2: Change detection
//==============================================================================

void ProjectAnalyzer::detectChanges(PipelineRun& run, ProjectAnalysisResult& result) {
    const Import::DependencyGraph& deps = graph();
    size_t index = 0;

    for (const auto& file : run.order) {
        reportProgress(2, ++index, run.order.size(), Import::FileIdentity::baseName(file));

        bool changed = true;
        try {
            std::string hash = Common::contentHash(Utils::FileUtils::readFile(file));
            run.hashes[file] = hash;

            if (cache_) {
                auto previous = cache_->hashOf(file);
                if (previous && *previous == hash) {
                    auto declaration = cache_->getDeclaration(file);
                    if (declaration) {
                        run.cached[file] = declaration;
                        changed = false;
                    } else {
                        logVerbose("  Cache miss for unchanged file " + Import::FileIdentity::baseName(file));
                    }
                }
            }
        } catch (const std::exception& e) {
            logVerbose("  Cannot hash " + file + ": " + e.what());
        }

        if (changed) {
            run.dirty.insert(file);
            for (const auto& dependent : deps.transitiveDependentsOf(file)) {
                run.dirty.insert(dependent);
            }
        }
    }

    // Dependents promoted to dirty must not reuse their cached IR
    for (const auto& file : run.dirty) {
        run.cached.erase(file);
    }
    result.dirtyFiles = run.dirty;
}

//==============================================================================
// Phase 3: Symbol resolution
//==============================================================================

void ProjectAnalyzer::resolveSymbols(PipelineRun& run, ProjectAnalysisResult& result) {
    const Import::DependencyGraph& deps = graph();

    // Unchanged files restore their symbols from the cached IR, dependencies first
    for (const auto& file : run.order) {
        if (run.dirty.count(file) > 0 || registry_.hasEntriesForFile(file)) {
            continue;
        }
        auto cached = run.cached.find(file);
        if (cached != run.cached.end()) {
            registry_.replaceFile(file, cached->second->typeDescriptors());
        }
    }

    result.batches = scheduler_.schedule(run.order, run.dirty, deps);
    size_t done = 0;

    for (const auto& batch : result.batches) {
        DEBUG_OUT("Symbol batch of " << batch.size() << " files" << std::endl);
        auto failures = scheduler_.run(batch, [&](const std::string& file) {
            Parser::ParseResult parsed = parser_->parseFile(file);
            if (parsed.hasErrors() || !parsed.unit) {
                registry_.removeAllForFile(file);
                throw Analysis::ExtractionError(Common::ErrorCode::ParseFailure, file,
                                                parsed.hasErrors() ? parsed.firstError() : "cannot read " + file);
            }

            Analysis::AnalysisContext context(file, registry_, deps);
            Analysis::DeclarationExtractor extractor(context);
            IR::FileDeclaration declaration = extractor.extract(*parsed.unit);
            registry_.replaceFile(file, declaration.typeDescriptors());

            std::lock_guard<std::mutex> lock(run.mutex);
            run.parsed.emplace(file, std::move(parsed));
        });
        recordFailures(run, failures);
        done += batch.size();
        reportProgress(3, done, run.dirty.size(), "Symbols resolved");
    }
}

//==============================================================================
// Phase 4: IR generation
//==============================================================================

void ProjectAnalyzer::generateIR(PipelineRun& run, ProjectAnalysisResult& result) {
    const Import::DependencyGraph& deps = graph();
    size_t done = 0;

    for (const auto& batch : result.batches) {
        auto failures = scheduler_.run(batch, [&](const std::string& file) {
            const Parser::CompilationUnit* unit = nullptr;
            {
                std::lock_guard<std::mutex> lock(run.mutex);
                auto parsed = run.parsed.find(file);
                if (parsed == run.parsed.end()) {
                    return;  // Failed during symbol resolution, already counted
                }
                unit = parsed->second.unit.get();
            }

            Analysis::AnalysisContext context(file, registry_, deps);
            Analysis::DeclarationExtractor extractor(context);
            IR::FileDeclaration declaration = extractor.extract(*unit);

            std::lock_guard<std::mutex> lock(run.mutex);
            run.fresh[file] = std::move(declaration);
        });
        recordFailures(run, failures);
        done += batch.size();
        reportProgress(4, done, run.dirty.size(), "IR generated");
    }

    // Syntax trees are no longer needed
    std::lock_guard<std::mutex> lock(run.mutex);
    run.parsed.clear();
}

//==============================================================================
// Phase 5: Link and validate
//==============================================================================

void ProjectAnalyzer::linkAndValidate(PipelineRun& run, ProjectAnalysisResult& result) {
    reportProgress(5, 0, 2, "Linking");

    std::map<std::string, IR::FileDeclaration> declarations;
    for (const auto& [file, declaration] : run.cached) {
        declarations.emplace(file, *declaration);
    }
    for (const auto& [file, declaration] : run.fresh) {
        declarations[file] = declaration;
    }

    Analysis::DeclarationLinker linker;
    result.application = linker.link(declarations, graph(), registry_);
    logVerbose("  Linked " + std::to_string(result.application.components.size()) + " components, " +
               std::to_string(result.application.stateHolders.size()) + " state holders, " +
               std::to_string(result.application.observables.size()) + " observables");

    reportProgress(5, 1, 2, "Validating");
    Analysis::DeclarationValidator validator(registry_);
    result.validation = validator.validate(result.application);

    for (const auto& error : result.validation.errors) {
        logWarning(error.toString());
    }
    for (const auto& warning : result.validation.warnings) {
        logVerbose("  " + warning.toString());
    }
    reportProgress(5, 2, 2, result.validation.getSummary());
}

//==============================================================================
// Phase 6: Cache persistence
//==============================================================================

void ProjectAnalyzer::persistCache(PipelineRun& run, ProjectAnalysisResult& result) {
    if (!cache_) {
        logVerbose("  Cache disabled, nothing to persist");
        return;
    }
    reportProgress(6, 0, run.fresh.size(), "Persisting cache");

    // A hash is recorded only next to a blob that was written
    auto savedFiles = cache_->saveAll(run.fresh);
    for (const auto& file : savedFiles) {
        auto hash = run.hashes.find(file);
        if (hash != run.hashes.end()) {
            cache_->setHash(file, hash->second);
        }
    }

    std::set<std::string> existing(result.analysisOrder.begin(), result.analysisOrder.end());
    size_t pruned = cache_->prune(existing);
    bool indexSaved = cache_->saveIndex();

    logVerbose("✓ Cache persisted: " + std::to_string(savedFiles.size()) + " of " + std::to_string(run.fresh.size()) +
               " declarations saved, " + std::to_string(pruned) + " stale entries pruned" +
               (indexSaved ? "" : " (index not written)"));
    reportProgress(6, run.fresh.size(), run.fresh.size(), "Cache persisted");
}

//==============================================================================
// Single file
//==============================================================================

IR::FileDeclaration ProjectAnalyzer::analyzeFile(const std::string& file) {
    if (!initialized_) {
        initialize();
    }
    std::string identity = Import::FileIdentity::of(file);

    Parser::ParseResult parsed = parser_->parseFile(identity);
    if (parsed.hasErrors() || !parsed.unit) {
        throw Analysis::ExtractionError(Common::ErrorCode::ParseFailure, identity,
                                        parsed.hasErrors() ? parsed.firstError() : "cannot read " + identity);
    }

    Analysis::AnalysisContext context(identity, registry_, graph());
    Analysis::DeclarationExtractor extractor(context);
    IR::FileDeclaration declaration = extractor.extract(*parsed.unit);
    registry_.replaceFile(identity, declaration.typeDescriptors());
    return declaration;
}

//==============================================================================
// Helpers
//==============================================================================

void ProjectAnalyzer::recordFailures(PipelineRun& run, const std::vector<TaskFailure>& failures) {
    for (const auto& failure : failures) {
        {
            std::lock_guard<std::mutex> lock(run.mutex);
            run.failures.emplace(failure.file, failure.message);
        }
        logWarning("Failed to analyze " + failure.file + ": " + failure.message);
    }
}

void ProjectAnalyzer::logVerbose(const std::string& message) const {
    if (config_.verbose) {
        std::lock_guard<std::mutex> lock(logMutex_);
        std::cout << message << std::endl;
    }
}

void ProjectAnalyzer::logWarning(const std::string& message) const {
    std::lock_guard<std::mutex> lock(logMutex_);
    std::cerr << "Warning: " << message << std::endl;
}

void ProjectAnalyzer::reportProgress(int phase, size_t current, size_t total, const std::string& message) const {
    if (config_.progress) {
        std::lock_guard<std::mutex> lock(logMutex_);
        config_.progress(ProgressEvent{phase, current, total, message});
    }
}

} // namespace Driver
} // namespace FJS
