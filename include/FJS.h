#pragma once

/**
 * @file FJS.h
 * @brief Public API of the FJS incremental project analyzer
 *
 * ## Example Usage:
 *
 * @code{.cpp}
 * #include <FJS.h>
 *
 * int main() {
 *     FJS::Driver::AnalyzerConfig config;
 *     config.projectRoot = "my_app";
 *     config.maxParallelism = 8;
 *
 *     FJS::Driver::ProjectAnalyzer analyzer(config);
 *     auto result = analyzer.analyze();
 *     if (!result.isValid()) {
 *         // result.errorMessage, result.failures, result.validation.errors
 *     }
 *
 *     for (const auto& component : result.application.components) {
 *         // component.build->tree, component.stateHolderId, ...
 *     }
 * }
 * @endcode
 */

// Common
#include "Common/Error.h"
#include "Common/Hash.h"
#include "Common/SourceLocation.h"

// Frontend
#include "Parser/SourceParser.h"

// Project model
#include "Import/FileIdentity.h"
#include "Import/DependencyGraph.h"
#include "Import/DependencyResolver.h"
#include "Semantic/SymbolRegistry.h"

// IR
#include "IR/Declarations.h"
#include "IR/ApplicationDeclaration.h"
#include "IR/IRPrinter.h"

// Analysis passes
#include "Analysis/DeclarationExtractor.h"
#include "Analysis/DeclarationLinker.h"
#include "Analysis/DeclarationValidator.h"

// Cache
#include "Cache/IncrementalCache.h"

// Driver
#include "Driver/ProjectAnalyzer.h"
