#include "Cache/IRSerializer.h"

namespace FJS {
namespace Cache {

namespace {

const char kMagic[] = "FJIR";
constexpr int kMaxDepth = 1000;

} // anonymous namespace

template <typename Enum>
Enum IRSerializer::readEnum(BinaryReader& in, Enum last, const char* what) {
    uint8_t value = in.readU8();
    if (value > static_cast<uint8_t>(last)) {
        throw SerializationError(std::string("invalid ") + what + " " + std::to_string(value));
    }
    return static_cast<Enum>(value);
}

//==============================================================================
// Top level
//==============================================================================

std::string IRSerializer::serialize(const IR::FileDeclaration& decl) {
    BinaryWriter out;
    out.writeRaw(kMagic);
    out.writeU32(kFormatVersion);

    out.writeString(decl.file);
    out.writeString(decl.libraryName);
    out.writeU32(static_cast<uint32_t>(decl.imports.size()));
    for (const auto& import : decl.imports) writeImport(out, import);
    out.writeStrings(decl.exports);
    out.writeStrings(decl.parts);
    out.writeU32(static_cast<uint32_t>(decl.components.size()));
    for (const auto& component : decl.components) writeComponent(out, component);
    out.writeU32(static_cast<uint32_t>(decl.stateHolders.size()));
    for (const auto& holder : decl.stateHolders) writeStateHolder(out, holder);
    out.writeU32(static_cast<uint32_t>(decl.plainTypes.size()));
    for (const auto& type : decl.plainTypes) writePlainType(out, type);
    out.writeU32(static_cast<uint32_t>(decl.functions.size()));
    for (const auto& function : decl.functions) writeFunction(out, function);
    out.writeU32(static_cast<uint32_t>(decl.topLevelVariables.size()));
    for (const auto& variable : decl.topLevelVariables) writeField(out, variable);

    return out.take();
}

IR::FileDeclaration IRSerializer::deserialize(const std::string& data) {
    BinaryReader in(data);
    if (in.readRaw(4) != kMagic) {
        throw SerializationError("bad magic");
    }
    uint32_t version = in.readU32();
    if (version != kFormatVersion) {
        throw SerializationError("unsupported format version " + std::to_string(version));
    }

    IR::FileDeclaration decl;
    decl.file = in.readString();
    decl.libraryName = in.readString();
    for (uint32_t i = 0, n = in.readCount(); i < n; ++i) decl.imports.push_back(readImport(in));
    decl.exports = in.readStrings();
    decl.parts = in.readStrings();
    for (uint32_t i = 0, n = in.readCount(); i < n; ++i) decl.components.push_back(readComponent(in));
    for (uint32_t i = 0, n = in.readCount(); i < n; ++i) decl.stateHolders.push_back(readStateHolder(in));
    for (uint32_t i = 0, n = in.readCount(); i < n; ++i) decl.plainTypes.push_back(readPlainType(in));
    for (uint32_t i = 0, n = in.readCount(); i < n; ++i) decl.functions.push_back(readFunction(in));
    for (uint32_t i = 0, n = in.readCount(); i < n; ++i) decl.topLevelVariables.push_back(readField(in));

    if (!in.atEnd()) {
        throw SerializationError("trailing bytes after declaration");
    }
    return decl;
}

//==============================================================================
// Shared pieces
//==============================================================================

void IRSerializer::writeLocation(BinaryWriter& out, const Common::SourceLocation& location) {
    out.writeString(location.filename);
    out.writeU64(location.line);
    out.writeU64(location.column);
    out.writeU64(location.position);
}

Common::SourceLocation IRSerializer::readLocation(BinaryReader& in) {
    Common::SourceLocation location;
    location.filename = in.readString();
    location.line = static_cast<size_t>(in.readU64());
    location.column = static_cast<size_t>(in.readU64());
    location.position = static_cast<size_t>(in.readU64());
    return location;
}

void IRSerializer::writeExprs(BinaryWriter& out, const std::vector<IR::ExprRef>& expressions) {
    out.writeU32(static_cast<uint32_t>(expressions.size()));
    for (const auto& expression : expressions) writeExpr(out, expression);
}

std::vector<IR::ExprRef> IRSerializer::readExprs(BinaryReader& in, int depth) {
    std::vector<IR::ExprRef> expressions;
    for (uint32_t i = 0, n = in.readCount(); i < n; ++i) expressions.push_back(readExpr(in, depth));
    return expressions;
}

void IRSerializer::writeStmts(BinaryWriter& out, const std::vector<IR::StmtRef>& statements) {
    out.writeU32(static_cast<uint32_t>(statements.size()));
    for (const auto& statement : statements) writeStmt(out, statement);
}

std::vector<IR::StmtRef> IRSerializer::readStmts(BinaryReader& in, int depth) {
    std::vector<IR::StmtRef> statements;
    for (uint32_t i = 0, n = in.readCount(); i < n; ++i) statements.push_back(readStmt(in, depth));
    return statements;
}

void IRSerializer::writeArguments(BinaryWriter& out, const std::vector<IR::Argument>& arguments) {
    out.writeU32(static_cast<uint32_t>(arguments.size()));
    for (const auto& argument : arguments) {
        out.writeString(argument.name);
        writeExpr(out, argument.value);
    }
}

std::vector<IR::Argument> IRSerializer::readArguments(BinaryReader& in, int depth) {
    std::vector<IR::Argument> arguments;
    for (uint32_t i = 0, n = in.readCount(); i < n; ++i) {
        IR::Argument argument;
        argument.name = in.readString();
        argument.value = readExpr(in, depth);
        arguments.push_back(std::move(argument));
    }
    return arguments;
}

void IRSerializer::writeParameters(BinaryWriter& out, const std::vector<IR::ParameterDeclaration>& parameters) {
    out.writeU32(static_cast<uint32_t>(parameters.size()));
    for (const auto& parameter : parameters) {
        out.writeString(parameter.name);
        out.writeString(parameter.typeName);
        out.writeBool(parameter.isRequired);
        out.writeBool(parameter.isNamed);
        out.writeBool(parameter.isOptionalPositional);
        out.writeBool(parameter.isFieldFormal);
        out.writeBool(parameter.isSuperFormal);
        writeExpr(out, parameter.defaultValue);
        writeLocation(out, parameter.location);
    }
}

std::vector<IR::ParameterDeclaration> IRSerializer::readParameters(BinaryReader& in, int depth) {
    std::vector<IR::ParameterDeclaration> parameters;
    for (uint32_t i = 0, n = in.readCount(); i < n; ++i) {
        IR::ParameterDeclaration parameter;
        parameter.name = in.readString();
        parameter.typeName = in.readString();
        parameter.isRequired = in.readBool();
        parameter.isNamed = in.readBool();
        parameter.isOptionalPositional = in.readBool();
        parameter.isFieldFormal = in.readBool();
        parameter.isSuperFormal = in.readBool();
        parameter.defaultValue = readExpr(in, depth);
        parameter.location = readLocation(in);
        parameters.push_back(std::move(parameter));
    }
    return parameters;
}

//==============================================================================
// Expressions
//==============================================================================

void IRSerializer::writeExpr(BinaryWriter& out, const IR::ExprRef& expression) {
    if (!expression) {
        out.writeU8(0);
        return;
    }
    out.writeU8(static_cast<uint8_t>(expression->kind()) + 1);

    using IR::ExprKind;
    switch (expression->kind()) {
        case ExprKind::Literal: {
            const auto& n = static_cast<const IR::LiteralExpr&>(*expression);
            out.writeU8(static_cast<uint8_t>(n.literalKind));
            out.writeString(n.value);
            break;
        }
        case ExprKind::Identifier:
            out.writeString(static_cast<const IR::IdentifierExpr&>(*expression).name);
            break;
        case ExprKind::This:
        case ExprKind::Super:
            break;
        case ExprKind::Binary: {
            const auto& n = static_cast<const IR::BinaryExpr&>(*expression);
            writeExpr(out, n.left);
            out.writeString(n.op);
            writeExpr(out, n.right);
            break;
        }
        case ExprKind::Unary: {
            const auto& n = static_cast<const IR::UnaryExpr&>(*expression);
            out.writeString(n.op);
            writeExpr(out, n.operand);
            out.writeBool(n.isPrefix);
            break;
        }
        case ExprKind::Assignment: {
            const auto& n = static_cast<const IR::AssignmentExpr&>(*expression);
            writeExpr(out, n.target);
            out.writeString(n.op);
            writeExpr(out, n.value);
            break;
        }
        case ExprKind::Call: {
            const auto& n = static_cast<const IR::CallExpr&>(*expression);
            writeExpr(out, n.target);
            out.writeString(n.method);
            out.writeStrings(n.typeArguments);
            writeArguments(out, n.arguments);
            out.writeBool(n.isNullAware);
            break;
        }
        case ExprKind::PropertyAccess: {
            const auto& n = static_cast<const IR::PropertyAccessExpr&>(*expression);
            writeExpr(out, n.target);
            out.writeString(n.name);
            out.writeBool(n.isNullAware);
            break;
        }
        case ExprKind::Index: {
            const auto& n = static_cast<const IR::IndexExpr&>(*expression);
            writeExpr(out, n.target);
            writeExpr(out, n.index);
            out.writeBool(n.isNullAware);
            break;
        }
        case ExprKind::Conditional: {
            const auto& n = static_cast<const IR::ConditionalExpr&>(*expression);
            writeExpr(out, n.condition);
            writeExpr(out, n.thenExpr);
            writeExpr(out, n.elseExpr);
            break;
        }
        case ExprKind::CollectionLiteral: {
            const auto& n = static_cast<const IR::CollectionLiteralExpr&>(*expression);
            out.writeU8(static_cast<uint8_t>(n.collectionKind));
            out.writeStrings(n.typeArguments);
            writeExprs(out, n.elements);
            out.writeBool(n.isConst);
            break;
        }
        case ExprKind::MapEntry: {
            const auto& n = static_cast<const IR::MapEntryExpr&>(*expression);
            writeExpr(out, n.key);
            writeExpr(out, n.value);
            break;
        }
        case ExprKind::Spread: {
            const auto& n = static_cast<const IR::SpreadExpr&>(*expression);
            writeExpr(out, n.expression);
            out.writeBool(n.isNullAware);
            break;
        }
        case ExprKind::IfElement: {
            const auto& n = static_cast<const IR::IfElementExpr&>(*expression);
            writeExpr(out, n.condition);
            writeExpr(out, n.thenElement);
            writeExpr(out, n.elseElement);
            break;
        }
        case ExprKind::ForElement: {
            const auto& n = static_cast<const IR::ForElementExpr&>(*expression);
            out.writeString(n.variableType);
            out.writeString(n.variableName);
            writeExpr(out, n.iterable);
            writeExpr(out, n.body);
            break;
        }
        case ExprKind::StringInterpolation:
            writeExprs(out, static_cast<const IR::StringInterpolationExpr&>(*expression).parts);
            break;
        case ExprKind::Await:
            writeExpr(out, static_cast<const IR::AwaitExpr&>(*expression).expression);
            break;
        case ExprKind::Throw:
            writeExpr(out, static_cast<const IR::ThrowExpr&>(*expression).expression);
            break;
        case ExprKind::Cast: {
            const auto& n = static_cast<const IR::CastExpr&>(*expression);
            writeExpr(out, n.expression);
            out.writeString(n.typeName);
            break;
        }
        case ExprKind::TypeTest: {
            const auto& n = static_cast<const IR::TypeTestExpr&>(*expression);
            writeExpr(out, n.expression);
            out.writeString(n.typeName);
            out.writeBool(n.isNegated);
            break;
        }
        case ExprKind::InstanceCreation: {
            const auto& n = static_cast<const IR::InstanceCreationExpr&>(*expression);
            out.writeString(n.typeName);
            out.writeStrings(n.typeArguments);
            out.writeString(n.constructorName);
            out.writeBool(n.isConst);
            writeArguments(out, n.arguments);
            break;
        }
        case ExprKind::FunctionExpression: {
            const auto& n = static_cast<const IR::FunctionExpr&>(*expression);
            out.writeStrings(n.typeParameters);
            writeParameters(out, n.parameters);
            writeStmt(out, n.body);
            writeExpr(out, n.expressionBody);
            out.writeBool(n.isAsync);
            out.writeBool(n.isGenerator);
            break;
        }
        case ExprKind::Parenthesized:
            writeExpr(out, static_cast<const IR::ParenthesizedExpr&>(*expression).expression);
            break;
        case ExprKind::Cascade: {
            const auto& n = static_cast<const IR::CascadeExpr&>(*expression);
            writeExpr(out, n.target);
            writeExprs(out, n.sections);
            out.writeBool(n.isNullAware);
            break;
        }
    }
}

IR::ExprRef IRSerializer::readExpr(BinaryReader& in, int depth) {
    if (depth > kMaxDepth) {
        throw SerializationError("expression nesting too deep");
    }
    uint8_t tag = in.readU8();
    if (tag == 0) {
        return nullptr;
    }
    if (tag - 1 > static_cast<int>(IR::ExprKind::Cascade)) {
        throw SerializationError("unknown expression tag " + std::to_string(tag));
    }

    const int next = depth + 1;
    using IR::ExprKind;
    switch (static_cast<ExprKind>(tag - 1)) {
        case ExprKind::Literal: {
            auto n = std::make_shared<IR::LiteralExpr>();
            n->literalKind = readEnum(in, IR::LiteralKind::String, "literal kind");
            n->value = in.readString();
            return n;
        }
        case ExprKind::Identifier: {
            auto n = std::make_shared<IR::IdentifierExpr>();
            n->name = in.readString();
            return n;
        }
        case ExprKind::This:
            return std::make_shared<IR::ThisExpr>();
        case ExprKind::Super:
            return std::make_shared<IR::SuperExpr>();
        case ExprKind::Binary: {
            auto n = std::make_shared<IR::BinaryExpr>();
            n->left = readExpr(in, next);
            n->op = in.readString();
            n->right = readExpr(in, next);
            return n;
        }
        case ExprKind::Unary: {
            auto n = std::make_shared<IR::UnaryExpr>();
            n->op = in.readString();
            n->operand = readExpr(in, next);
            n->isPrefix = in.readBool();
            return n;
        }
        case ExprKind::Assignment: {
            auto n = std::make_shared<IR::AssignmentExpr>();
            n->target = readExpr(in, next);
            n->op = in.readString();
            n->value = readExpr(in, next);
            return n;
        }
        case ExprKind::Call: {
            auto n = std::make_shared<IR::CallExpr>();
            n->target = readExpr(in, next);
            n->method = in.readString();
            n->typeArguments = in.readStrings();
            n->arguments = readArguments(in, next);
            n->isNullAware = in.readBool();
            return n;
        }
        case ExprKind::PropertyAccess: {
            auto n = std::make_shared<IR::PropertyAccessExpr>();
            n->target = readExpr(in, next);
            n->name = in.readString();
            n->isNullAware = in.readBool();
            return n;
        }
        case ExprKind::Index: {
            auto n = std::make_shared<IR::IndexExpr>();
            n->target = readExpr(in, next);
            n->index = readExpr(in, next);
            n->isNullAware = in.readBool();
            return n;
        }
        case ExprKind::Conditional: {
            auto n = std::make_shared<IR::ConditionalExpr>();
            n->condition = readExpr(in, next);
            n->thenExpr = readExpr(in, next);
            n->elseExpr = readExpr(in, next);
            return n;
        }
        case ExprKind::CollectionLiteral: {
            auto n = std::make_shared<IR::CollectionLiteralExpr>();
            n->collectionKind = readEnum(in, IR::CollectionKind::Map, "collection kind");
            n->typeArguments = in.readStrings();
            n->elements = readExprs(in, next);
            n->isConst = in.readBool();
            return n;
        }
        case ExprKind::MapEntry: {
            auto n = std::make_shared<IR::MapEntryExpr>();
            n->key = readExpr(in, next);
            n->value = readExpr(in, next);
            return n;
        }
        case ExprKind::Spread: {
            auto n = std::make_shared<IR::SpreadExpr>();
            n->expression = readExpr(in, next);
            n->isNullAware = in.readBool();
            return n;
        }
        case ExprKind::IfElement: {
            auto n = std::make_shared<IR::IfElementExpr>();
            n->condition = readExpr(in, next);
            n->thenElement = readExpr(in, next);
            n->elseElement = readExpr(in, next);
            return n;
        }
        case ExprKind::ForElement: {
            auto n = std::make_shared<IR::ForElementExpr>();
            n->variableType = in.readString();
            n->variableName = in.readString();
            n->iterable = readExpr(in, next);
            n->body = readExpr(in, next);
            return n;
        }
        case ExprKind::StringInterpolation: {
            auto n = std::make_shared<IR::StringInterpolationExpr>();
            n->parts = readExprs(in, next);
            return n;
        }
        case ExprKind::Await: {
            auto n = std::make_shared<IR::AwaitExpr>();
            n->expression = readExpr(in, next);
            return n;
        }
        case ExprKind::Throw: {
            auto n = std::make_shared<IR::ThrowExpr>();
            n->expression = readExpr(in, next);
            return n;
        }
        case ExprKind::Cast: {
            auto n = std::make_shared<IR::CastExpr>();
            n->expression = readExpr(in, next);
            n->typeName = in.readString();
            return n;
        }
        case ExprKind::TypeTest: {
            auto n = std::make_shared<IR::TypeTestExpr>();
            n->expression = readExpr(in, next);
            n->typeName = in.readString();
            n->isNegated = in.readBool();
            return n;
        }
        case ExprKind::InstanceCreation: {
            auto n = std::make_shared<IR::InstanceCreationExpr>();
            n->typeName = in.readString();
            n->typeArguments = in.readStrings();
            n->constructorName = in.readString();
            n->isConst = in.readBool();
            n->arguments = readArguments(in, next);
            return n;
        }
        case ExprKind::FunctionExpression: {
            auto n = std::make_shared<IR::FunctionExpr>();
            n->typeParameters = in.readStrings();
            n->parameters = readParameters(in, next);
            n->body = readStmt(in, next);
            n->expressionBody = readExpr(in, next);
            n->isAsync = in.readBool();
            n->isGenerator = in.readBool();
            return n;
        }
        case ExprKind::Parenthesized: {
            auto n = std::make_shared<IR::ParenthesizedExpr>();
            n->expression = readExpr(in, next);
            return n;
        }
        case ExprKind::Cascade: {
            auto n = std::make_shared<IR::CascadeExpr>();
            n->target = readExpr(in, next);
            n->sections = readExprs(in, next);
            n->isNullAware = in.readBool();
            return n;
        }
    }
    throw SerializationError("unhandled expression tag " + std::to_string(tag));
}

//==============================================================================
// Statements
//==============================================================================

void IRSerializer::writeStmt(BinaryWriter& out, const IR::StmtRef& statement) {
    if (!statement) {
        out.writeU8(0);
        return;
    }
    out.writeU8(static_cast<uint8_t>(statement->kind()) + 1);

    using IR::StmtKind;
    switch (statement->kind()) {
        case StmtKind::Block:
            writeStmts(out, static_cast<const IR::BlockStmt&>(*statement).statements);
            break;
        case StmtKind::Expression:
            writeExpr(out, static_cast<const IR::ExpressionStmt&>(*statement).expression);
            break;
        case StmtKind::VariableDecl: {
            const auto& n = static_cast<const IR::VariableDeclStmt&>(*statement);
            out.writeString(n.typeName);
            out.writeBool(n.isFinal);
            out.writeBool(n.isConst);
            out.writeBool(n.isLate);
            out.writeU32(static_cast<uint32_t>(n.variables.size()));
            for (const auto& variable : n.variables) {
                out.writeString(variable.name);
                writeExpr(out, variable.initializer);
            }
            break;
        }
        case StmtKind::If: {
            const auto& n = static_cast<const IR::IfStmt&>(*statement);
            writeExpr(out, n.condition);
            writeStmt(out, n.thenBranch);
            writeStmt(out, n.elseBranch);
            break;
        }
        case StmtKind::For: {
            const auto& n = static_cast<const IR::ForStmt&>(*statement);
            writeStmt(out, n.initializer);
            writeExpr(out, n.condition);
            writeExprs(out, n.updaters);
            writeStmt(out, n.body);
            break;
        }
        case StmtKind::ForEach: {
            const auto& n = static_cast<const IR::ForEachStmt&>(*statement);
            out.writeString(n.variableType);
            out.writeString(n.variableName);
            out.writeBool(n.isFinal);
            out.writeBool(n.isAwait);
            writeExpr(out, n.iterable);
            writeStmt(out, n.body);
            break;
        }
        case StmtKind::While: {
            const auto& n = static_cast<const IR::WhileStmt&>(*statement);
            writeExpr(out, n.condition);
            writeStmt(out, n.body);
            break;
        }
        case StmtKind::DoWhile: {
            const auto& n = static_cast<const IR::DoWhileStmt&>(*statement);
            writeStmt(out, n.body);
            writeExpr(out, n.condition);
            break;
        }
        case StmtKind::Switch: {
            const auto& n = static_cast<const IR::SwitchStmt&>(*statement);
            writeExpr(out, n.subject);
            out.writeU32(static_cast<uint32_t>(n.cases.size()));
            for (const auto& switchCase : n.cases) {
                writeExprs(out, switchCase.labels);
                out.writeBool(switchCase.isDefault);
                writeStmts(out, switchCase.statements);
            }
            break;
        }
        case StmtKind::Try: {
            const auto& n = static_cast<const IR::TryStmt&>(*statement);
            writeStmt(out, n.body);
            out.writeU32(static_cast<uint32_t>(n.catches.size()));
            for (const auto& clause : n.catches) {
                out.writeString(clause.exceptionType);
                out.writeString(clause.exceptionName);
                out.writeString(clause.stackTraceName);
                writeStmt(out, clause.body);
            }
            writeStmt(out, n.finallyBlock);
            break;
        }
        case StmtKind::Return:
            writeExpr(out, static_cast<const IR::ReturnStmt&>(*statement).value);
            break;
        case StmtKind::Break:
            out.writeString(static_cast<const IR::BreakStmt&>(*statement).label);
            break;
        case StmtKind::Continue:
            out.writeString(static_cast<const IR::ContinueStmt&>(*statement).label);
            break;
        case StmtKind::Yield: {
            const auto& n = static_cast<const IR::YieldStmt&>(*statement);
            writeExpr(out, n.value);
            out.writeBool(n.isStar);
            break;
        }
    }
}

IR::StmtRef IRSerializer::readStmt(BinaryReader& in, int depth) {
    if (depth > kMaxDepth) {
        throw SerializationError("statement nesting too deep");
    }
    uint8_t tag = in.readU8();
    if (tag == 0) {
        return nullptr;
    }
    if (tag - 1 > static_cast<int>(IR::StmtKind::Yield)) {
        throw SerializationError("unknown statement tag " + std::to_string(tag));
    }

    const int next = depth + 1;
    using IR::StmtKind;
    switch (static_cast<StmtKind>(tag - 1)) {
        case StmtKind::Block: {
            auto n = std::make_shared<IR::BlockStmt>();
            n->statements = readStmts(in, next);
            return n;
        }
        case StmtKind::Expression: {
            auto n = std::make_shared<IR::ExpressionStmt>();
            n->expression = readExpr(in, next);
            return n;
        }
        case StmtKind::VariableDecl: {
            auto n = std::make_shared<IR::VariableDeclStmt>();
            n->typeName = in.readString();
            n->isFinal = in.readBool();
            n->isConst = in.readBool();
            n->isLate = in.readBool();
            for (uint32_t i = 0, count = in.readCount(); i < count; ++i) {
                IR::VariableBinding binding;
                binding.name = in.readString();
                binding.initializer = readExpr(in, next);
                n->variables.push_back(std::move(binding));
            }
            return n;
        }
        case StmtKind::If: {
            auto n = std::make_shared<IR::IfStmt>();
            n->condition = readExpr(in, next);
            n->thenBranch = readStmt(in, next);
            n->elseBranch = readStmt(in, next);
            return n;
        }
        case StmtKind::For: {
            auto n = std::make_shared<IR::ForStmt>();
            n->initializer = readStmt(in, next);
            n->condition = readExpr(in, next);
            n->updaters = readExprs(in, next);
            n->body = readStmt(in, next);
            return n;
        }
        case StmtKind::ForEach: {
            auto n = std::make_shared<IR::ForEachStmt>();
            n->variableType = in.readString();
            n->variableName = in.readString();
            n->isFinal = in.readBool();
            n->isAwait = in.readBool();
            n->iterable = readExpr(in, next);
            n->body = readStmt(in, next);
            return n;
        }
        case StmtKind::While: {
            auto n = std::make_shared<IR::WhileStmt>();
            n->condition = readExpr(in, next);
            n->body = readStmt(in, next);
            return n;
        }
        case StmtKind::DoWhile: {
            auto n = std::make_shared<IR::DoWhileStmt>();
            n->body = readStmt(in, next);
            n->condition = readExpr(in, next);
            return n;
        }
        case StmtKind::Switch: {
            auto n = std::make_shared<IR::SwitchStmt>();
            n->subject = readExpr(in, next);
            for (uint32_t i = 0, count = in.readCount(); i < count; ++i) {
                IR::SwitchCase switchCase;
                switchCase.labels = readExprs(in, next);
                switchCase.isDefault = in.readBool();
                switchCase.statements = readStmts(in, next);
                n->cases.push_back(std::move(switchCase));
            }
            return n;
        }
        case StmtKind::Try: {
            auto n = std::make_shared<IR::TryStmt>();
            n->body = readStmt(in, next);
            for (uint32_t i = 0, count = in.readCount(); i < count; ++i) {
                IR::CatchClause clause;
                clause.exceptionType = in.readString();
                clause.exceptionName = in.readString();
                clause.stackTraceName = in.readString();
                clause.body = readStmt(in, next);
                n->catches.push_back(std::move(clause));
            }
            n->finallyBlock = readStmt(in, next);
            return n;
        }
        case StmtKind::Return: {
            auto n = std::make_shared<IR::ReturnStmt>();
            n->value = readExpr(in, next);
            return n;
        }
        case StmtKind::Break: {
            auto n = std::make_shared<IR::BreakStmt>();
            n->label = in.readString();
            return n;
        }
        case StmtKind::Continue: {
            auto n = std::make_shared<IR::ContinueStmt>();
            n->label = in.readString();
            return n;
        }
        case StmtKind::Yield: {
            auto n = std::make_shared<IR::YieldStmt>();
            n->value = readExpr(in, next);
            n->isStar = in.readBool();
            return n;
        }
    }
    throw SerializationError("unhandled statement tag " + std::to_string(tag));
}

//==============================================================================
// Declarations
//==============================================================================

void IRSerializer::writeField(BinaryWriter& out, const IR::FieldDeclaration& field) {
    out.writeString(field.name);
    out.writeString(field.typeName);
    out.writeBool(field.isFinal);
    out.writeBool(field.isConst);
    out.writeBool(field.isLate);
    out.writeBool(field.isStatic);
    writeExpr(out, field.initializer);
    writeLocation(out, field.location);
}

IR::FieldDeclaration IRSerializer::readField(BinaryReader& in) {
    IR::FieldDeclaration field;
    field.name = in.readString();
    field.typeName = in.readString();
    field.isFinal = in.readBool();
    field.isConst = in.readBool();
    field.isLate = in.readBool();
    field.isStatic = in.readBool();
    field.initializer = readExpr(in, 0);
    field.location = readLocation(in);
    return field;
}

void IRSerializer::writeConstructor(BinaryWriter& out, const IR::ConstructorDeclaration& ctor) {
    out.writeString(ctor.name);
    writeParameters(out, ctor.parameters);
    out.writeBool(ctor.isConst);
    out.writeBool(ctor.isFactory);
    writeExprs(out, ctor.initializers);
    out.writeString(ctor.redirectTarget);
    writeStmt(out, ctor.body);
    writeLocation(out, ctor.location);
}

IR::ConstructorDeclaration IRSerializer::readConstructor(BinaryReader& in) {
    IR::ConstructorDeclaration ctor;
    ctor.name = in.readString();
    ctor.parameters = readParameters(in, 0);
    ctor.isConst = in.readBool();
    ctor.isFactory = in.readBool();
    ctor.initializers = readExprs(in, 0);
    ctor.redirectTarget = in.readString();
    ctor.body = readStmt(in, 0);
    ctor.location = readLocation(in);
    return ctor;
}

void IRSerializer::writeFunction(BinaryWriter& out, const IR::FunctionDeclaration& function) {
    out.writeString(function.name);
    out.writeU8(static_cast<uint8_t>(function.kind));
    out.writeString(function.returnType);
    writeParameters(out, function.parameters);
    out.writeStrings(function.typeParameters);
    writeStmt(out, function.body);
    writeExpr(out, function.expressionBody);
    out.writeBool(function.isAsync);
    out.writeBool(function.isGenerator);
    out.writeBool(function.isStatic);
    out.writeBool(function.isAbstract);
    out.writeStrings(function.annotations);
    writeLocation(out, function.location);
}

IR::FunctionDeclaration IRSerializer::readFunction(BinaryReader& in) {
    IR::FunctionDeclaration function;
    function.name = in.readString();
    function.kind = readEnum(in, IR::FunctionKind::Operator, "function kind");
    function.returnType = in.readString();
    function.parameters = readParameters(in, 0);
    function.typeParameters = in.readStrings();
    function.body = readStmt(in, 0);
    function.expressionBody = readExpr(in, 0);
    function.isAsync = in.readBool();
    function.isGenerator = in.readBool();
    function.isStatic = in.readBool();
    function.isAbstract = in.readBool();
    function.annotations = in.readStrings();
    function.location = readLocation(in);
    return function;
}

void IRSerializer::writeOptionalFunction(BinaryWriter& out, const std::optional<IR::FunctionDeclaration>& function) {
    out.writeBool(function.has_value());
    if (function) writeFunction(out, *function);
}

std::optional<IR::FunctionDeclaration> IRSerializer::readOptionalFunction(BinaryReader& in) {
    if (!in.readBool()) return std::nullopt;
    return readFunction(in);
}

void IRSerializer::writeComponentNode(BinaryWriter& out, const IR::ComponentNode& node) {
    out.writeString(node.typeName);
    out.writeString(node.constructorName);
    out.writeBool(node.isConst);
    out.writeString(node.slot);
    out.writeU32(static_cast<uint32_t>(node.properties.size()));
    for (const auto& [name, value] : node.properties) {
        out.writeString(name);
        out.writeString(value);
    }
    out.writeU32(static_cast<uint32_t>(node.children.size()));
    for (const auto& child : node.children) writeComponentNode(out, child);
}

IR::ComponentNode IRSerializer::readComponentNode(BinaryReader& in, int depth) {
    if (depth > kMaxDepth) {
        throw SerializationError("component tree too deep");
    }
    IR::ComponentNode node;
    node.typeName = in.readString();
    node.constructorName = in.readString();
    node.isConst = in.readBool();
    node.slot = in.readString();
    for (uint32_t i = 0, n = in.readCount(); i < n; ++i) {
        std::string name = in.readString();
        std::string value = in.readString();
        node.properties.emplace_back(std::move(name), std::move(value));
    }
    for (uint32_t i = 0, n = in.readCount(); i < n; ++i) {
        node.children.push_back(readComponentNode(in, depth + 1));
    }
    return node;
}

void IRSerializer::writeBuild(BinaryWriter& out, const std::optional<IR::BuildDeclaration>& build) {
    out.writeBool(build.has_value());
    if (!build) return;
    out.writeString(build->contextName);
    writeStmt(out, build->body);
    writeExpr(out, build->expressionBody);
    out.writeBool(build->tree.has_value());
    if (build->tree) writeComponentNode(out, *build->tree);
    out.writeU32(static_cast<uint32_t>(build->alternatives.size()));
    for (const auto& alternative : build->alternatives) writeComponentNode(out, alternative);
    out.writeStrings(build->conditionalNotes);
    writeLocation(out, build->location);
}

std::optional<IR::BuildDeclaration> IRSerializer::readBuild(BinaryReader& in) {
    if (!in.readBool()) return std::nullopt;
    IR::BuildDeclaration build;
    build.contextName = in.readString();
    build.body = readStmt(in, 0);
    build.expressionBody = readExpr(in, 0);
    if (in.readBool()) build.tree = readComponentNode(in, 0);
    for (uint32_t i = 0, n = in.readCount(); i < n; ++i) build.alternatives.push_back(readComponentNode(in, 0));
    build.conditionalNotes = in.readStrings();
    build.location = readLocation(in);
    return build;
}

void IRSerializer::writeComponent(BinaryWriter& out, const IR::ComponentDeclaration& component) {
    out.writeString(component.id);
    out.writeString(component.name);
    out.writeU8(static_cast<uint8_t>(component.kind));
    out.writeString(component.file);
    out.writeString(component.superType);
    out.writeU32(static_cast<uint32_t>(component.properties.size()));
    for (const auto& property : component.properties) {
        out.writeString(property.name);
        out.writeString(property.typeName);
        out.writeBool(property.isFinal);
        out.writeBool(property.isRequired);
        out.writeBool(property.isNamed);
        writeExpr(out, property.defaultValue);
        writeLocation(out, property.location);
    }
    out.writeU32(static_cast<uint32_t>(component.constructors.size()));
    for (const auto& ctor : component.constructors) writeConstructor(out, ctor);
    writeBuild(out, component.build);
    out.writeU32(static_cast<uint32_t>(component.methods.size()));
    for (const auto& method : component.methods) writeFunction(out, method);
    out.writeStrings(component.mixins);
    out.writeStrings(component.interfaces);
    out.writeString(component.stateHolderName);
    out.writeString(component.stateHolderId);
    writeLocation(out, component.location);
}

IR::ComponentDeclaration IRSerializer::readComponent(BinaryReader& in) {
    IR::ComponentDeclaration component;
    component.id = in.readString();
    component.name = in.readString();
    component.kind = readEnum(in, IR::ComponentKind::Stateful, "component kind");
    component.file = in.readString();
    component.superType = in.readString();
    for (uint32_t i = 0, n = in.readCount(); i < n; ++i) {
        IR::PropertyDeclaration property;
        property.name = in.readString();
        property.typeName = in.readString();
        property.isFinal = in.readBool();
        property.isRequired = in.readBool();
        property.isNamed = in.readBool();
        property.defaultValue = readExpr(in, 0);
        property.location = readLocation(in);
        component.properties.push_back(std::move(property));
    }
    for (uint32_t i = 0, n = in.readCount(); i < n; ++i) component.constructors.push_back(readConstructor(in));
    component.build = readBuild(in);
    for (uint32_t i = 0, n = in.readCount(); i < n; ++i) component.methods.push_back(readFunction(in));
    component.mixins = in.readStrings();
    component.interfaces = in.readStrings();
    component.stateHolderName = in.readString();
    component.stateHolderId = in.readString();
    component.location = readLocation(in);
    return component;
}

void IRSerializer::writeStateHolder(BinaryWriter& out, const IR::StateHolderDeclaration& holder) {
    out.writeString(holder.id);
    out.writeString(holder.name);
    out.writeString(holder.file);
    out.writeString(holder.componentName);
    out.writeU32(static_cast<uint32_t>(holder.fields.size()));
    for (const auto& field : holder.fields) writeField(out, field);
    writeOptionalFunction(out, holder.initState);
    writeOptionalFunction(out, holder.dispose);
    writeOptionalFunction(out, holder.didUpdateWidget);
    writeOptionalFunction(out, holder.didChangeDependencies);
    writeBuild(out, holder.build);
    out.writeU32(static_cast<uint32_t>(holder.methods.size()));
    for (const auto& method : holder.methods) writeFunction(out, method);
    out.writeStrings(holder.controllers);
    out.writeStrings(holder.mixins);
    writeLocation(out, holder.location);
}

IR::StateHolderDeclaration IRSerializer::readStateHolder(BinaryReader& in) {
    IR::StateHolderDeclaration holder;
    holder.id = in.readString();
    holder.name = in.readString();
    holder.file = in.readString();
    holder.componentName = in.readString();
    for (uint32_t i = 0, n = in.readCount(); i < n; ++i) holder.fields.push_back(readField(in));
    holder.initState = readOptionalFunction(in);
    holder.dispose = readOptionalFunction(in);
    holder.didUpdateWidget = readOptionalFunction(in);
    holder.didChangeDependencies = readOptionalFunction(in);
    holder.build = readBuild(in);
    for (uint32_t i = 0, n = in.readCount(); i < n; ++i) holder.methods.push_back(readFunction(in));
    holder.controllers = in.readStrings();
    holder.mixins = in.readStrings();
    holder.location = readLocation(in);
    return holder;
}

void IRSerializer::writePlainType(BinaryWriter& out, const IR::PlainTypeDeclaration& type) {
    out.writeString(type.id);
    out.writeString(type.name);
    out.writeString(type.file);
    out.writeU8(static_cast<uint8_t>(type.kind));
    out.writeString(type.superType);
    out.writeStrings(type.interfaces);
    out.writeStrings(type.mixins);
    out.writeStrings(type.typeParameters);
    out.writeU32(static_cast<uint32_t>(type.fields.size()));
    for (const auto& field : type.fields) writeField(out, field);
    out.writeU32(static_cast<uint32_t>(type.constructors.size()));
    for (const auto& ctor : type.constructors) writeConstructor(out, ctor);
    out.writeU32(static_cast<uint32_t>(type.methods.size()));
    for (const auto& method : type.methods) writeFunction(out, method);
    out.writeStrings(type.enumValues);
    out.writeString(type.aliasedType);
    out.writeString(type.extendedType);
    writeLocation(out, type.location);
}

IR::PlainTypeDeclaration IRSerializer::readPlainType(BinaryReader& in) {
    IR::PlainTypeDeclaration type;
    type.id = in.readString();
    type.name = in.readString();
    type.file = in.readString();
    type.kind = readEnum(in, Semantic::TypeKind::Extension, "type kind");
    type.superType = in.readString();
    type.interfaces = in.readStrings();
    type.mixins = in.readStrings();
    type.typeParameters = in.readStrings();
    for (uint32_t i = 0, n = in.readCount(); i < n; ++i) type.fields.push_back(readField(in));
    for (uint32_t i = 0, n = in.readCount(); i < n; ++i) type.constructors.push_back(readConstructor(in));
    for (uint32_t i = 0, n = in.readCount(); i < n; ++i) type.methods.push_back(readFunction(in));
    type.enumValues = in.readStrings();
    type.aliasedType = in.readString();
    type.extendedType = in.readString();
    type.location = readLocation(in);
    return type;
}

void IRSerializer::writeImport(BinaryWriter& out, const IR::ImportRecord& import) {
    out.writeString(import.uri);
    out.writeString(import.prefix);
    out.writeBool(import.isDeferred);
    out.writeStrings(import.show);
    out.writeStrings(import.hide);
    writeLocation(out, import.location);
}

IR::ImportRecord IRSerializer::readImport(BinaryReader& in) {
    IR::ImportRecord import;
    import.uri = in.readString();
    import.prefix = in.readString();
    import.isDeferred = in.readBool();
    import.show = in.readStrings();
    import.hide = in.readStrings();
    import.location = readLocation(in);
    return import;
}

} // namespace Cache
} // namespace FJS
