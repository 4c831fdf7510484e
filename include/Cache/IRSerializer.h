#pragma once
#include <string>
#include <cstdint>
#include "BinaryStream.h"
#include "../IR/Declarations.h"

namespace FJS {
namespace Cache {

/**
 * Binary codec for per-file IR. A blob is the magic "FJIR", a u32 format
 * version, then the FileDeclaration. Node references are tagged with their
 * kind (0 for null).
 */
class IRSerializer {
public:
    static constexpr uint32_t kFormatVersion = 2;

    static std::string serialize(const IR::FileDeclaration& decl);

    // Throws SerializationError on a bad header, unknown tag or truncation
    static IR::FileDeclaration deserialize(const std::string& data);

private:
    // Writing
    static void writeLocation(BinaryWriter& out, const Common::SourceLocation& location);
    static void writeExpr(BinaryWriter& out, const IR::ExprRef& expression);
    static void writeStmt(BinaryWriter& out, const IR::StmtRef& statement);
    static void writeExprs(BinaryWriter& out, const std::vector<IR::ExprRef>& expressions);
    static void writeStmts(BinaryWriter& out, const std::vector<IR::StmtRef>& statements);
    static void writeArguments(BinaryWriter& out, const std::vector<IR::Argument>& arguments);
    static void writeParameters(BinaryWriter& out, const std::vector<IR::ParameterDeclaration>& parameters);
    static void writeField(BinaryWriter& out, const IR::FieldDeclaration& field);
    static void writeConstructor(BinaryWriter& out, const IR::ConstructorDeclaration& ctor);
    static void writeFunction(BinaryWriter& out, const IR::FunctionDeclaration& function);
    static void writeOptionalFunction(BinaryWriter& out, const std::optional<IR::FunctionDeclaration>& function);
    static void writeComponentNode(BinaryWriter& out, const IR::ComponentNode& node);
    static void writeBuild(BinaryWriter& out, const std::optional<IR::BuildDeclaration>& build);
    static void writeComponent(BinaryWriter& out, const IR::ComponentDeclaration& component);
    static void writeStateHolder(BinaryWriter& out, const IR::StateHolderDeclaration& holder);
    static void writePlainType(BinaryWriter& out, const IR::PlainTypeDeclaration& type);
    static void writeImport(BinaryWriter& out, const IR::ImportRecord& import);

    // Reading
    static Common::SourceLocation readLocation(BinaryReader& in);
    static IR::ExprRef readExpr(BinaryReader& in, int depth);
    static IR::StmtRef readStmt(BinaryReader& in, int depth);
    static std::vector<IR::ExprRef> readExprs(BinaryReader& in, int depth);
    static std::vector<IR::StmtRef> readStmts(BinaryReader& in, int depth);
    static std::vector<IR::Argument> readArguments(BinaryReader& in, int depth);
    static std::vector<IR::ParameterDeclaration> readParameters(BinaryReader& in, int depth);
    static IR::FieldDeclaration readField(BinaryReader& in);
    static IR::ConstructorDeclaration readConstructor(BinaryReader& in);
    static IR::FunctionDeclaration readFunction(BinaryReader& in);
    static std::optional<IR::FunctionDeclaration> readOptionalFunction(BinaryReader& in);
    static IR::ComponentNode readComponentNode(BinaryReader& in, int depth);
    static std::optional<IR::BuildDeclaration> readBuild(BinaryReader& in);
    static IR::ComponentDeclaration readComponent(BinaryReader& in);
    static IR::StateHolderDeclaration readStateHolder(BinaryReader& in);
    static IR::PlainTypeDeclaration readPlainType(BinaryReader& in);
    static IR::ImportRecord readImport(BinaryReader& in);

    template <typename Enum>
    static Enum readEnum(BinaryReader& in, Enum last, const char* what);
};

} // namespace Cache
} // namespace FJS
