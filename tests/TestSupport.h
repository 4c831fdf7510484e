#pragma once
#include <string>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include "Parser/SourceParser.h"
#include "Analysis/AnalysisContext.h"
#include "Analysis/DeclarationExtractor.h"
#include "Import/DependencyGraph.h"
#include "Import/FileIdentity.h"
#include "Semantic/SymbolRegistry.h"
#include "IR/Declarations.h"

namespace FJS {
namespace TestSupport {

/**
 * Scratch directory removed when the fixture goes out of scope. The name
 * carries the running test's name so parallel test processes never collide.
 */
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = "fjs_";
        if (info) {
            name += std::string(info->test_suite_name()) + "_" + info->name();
        }
        name += "_" + std::to_string(counter++);
        path_ = std::filesystem::temp_directory_path() / name;
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string path() const { return path_.string(); }

    // Writes relativePath under the directory and returns its file identity
    std::string write(const std::string& relativePath, const std::string& contents) const {
        std::filesystem::path target = path_ / relativePath;
        std::filesystem::create_directories(target.parent_path());
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        out << contents;
        out.close();
        return Import::FileIdentity::of(target.string());
    }

    std::string identity(const std::string& relativePath) const {
        return Import::FileIdentity::of((path_ / relativePath).string());
    }

private:
    std::filesystem::path path_;
};

/**
 * Parse source as `file`, extract it against registry and graph, and
 * register the resulting type descriptors.
 */
inline IR::FileDeclaration extractSource(const std::string& source, const std::string& file,
                                         Semantic::SymbolRegistry& registry,
                                         const Import::DependencyGraph& graph) {
    Parser::DartSourceParser parser;
    Parser::ParseResult parsed = parser.parseSource(source, file);
    EXPECT_FALSE(parsed.hasErrors()) << parsed.firstError();

    Analysis::AnalysisContext context(file, registry, graph);
    Analysis::DeclarationExtractor extractor(context);
    IR::FileDeclaration declaration = extractor.extract(parsed);
    registry.replaceFile(file, declaration.typeDescriptors());
    return declaration;
}

inline IR::FileDeclaration extractSource(const std::string& source, const std::string& file) {
    Semantic::SymbolRegistry registry;
    Import::DependencyGraph graph;
    return extractSource(source, file, registry, graph);
}

} // namespace TestSupport
} // namespace FJS
