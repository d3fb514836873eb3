/**
 * @file SourceTree.hpp
 * @brief Editable declaration-level view of a parsed source file.
 *
 * The tree is a partition of the original text into slices. Rendering an
 * unedited tree reproduces the input byte for byte; edited nodes re-render
 * from the slices that remain.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

namespace archmend::domain {

/**
 * @enum MemberKind
 * @brief Kinds of type members recognised by the parser.
 */
enum class MemberKind {
    Field,
    Method,
    Constructor,
    Initializer,
    NestedType,
    EnumConstants
};

/**
 * @struct Statement
 * @brief A top-level statement of a method body.
 */
struct Statement {
    std::string text;            ///< Leading trivia plus the statement.
    bool isConditional = false;  ///< True for if statements.
    std::string condition;       ///< Text between the if parentheses.
};

/**
 * @struct Member
 * @brief A member of a type declaration.
 */
struct Member {
    MemberKind kind = MemberKind::Field;
    std::string name;
    std::string text;                  ///< Original slice, leading trivia included.

    bool hasBody = false;              ///< Methods and constructors with a block body.
    std::string bodyHead;              ///< Slice up to and including the opening brace.
    std::vector<Statement> statements;
    std::string bodyTail;              ///< Trivia before and the closing brace.
    bool edited = false;

    std::string render() const;
    bool isCallable() const { return kind == MemberKind::Method || kind == MemberKind::Constructor; }
};

/**
 * @struct TypeDeclaration
 * @brief A class, interface, enum, record or annotation declaration.
 */
struct TypeDeclaration {
    std::string keyword;          ///< "class", "interface", "enum", "record" or "@interface".
    std::string name;
    std::string text;             ///< Original slice, leading trivia included.
    std::string head;             ///< Slice up to and including the opening brace.
    std::vector<Member> members;
    std::string tail;             ///< Trivia before and the closing brace.
    bool edited = false;

    std::string render() const;

    /** @brief First callable member with the given name, or nullptr. */
    const Member* findCallable(const std::string& memberName) const;
};

/**
 * @struct ParsedUnit
 * @brief A parsed compilation unit.
 */
struct ParsedUnit {
    std::optional<std::string> packageName;
    std::vector<std::string> imports;
    std::string preamble;         ///< Package and import region.
    std::vector<TypeDeclaration> types;
    std::string trailer;          ///< Anything after the last type declaration.

    std::string render() const;

    TypeDeclaration* findType(const std::string& typeName);
};

} // namespace archmend::domain
