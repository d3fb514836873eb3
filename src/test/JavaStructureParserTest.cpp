#include <cassert>
#include <iostream>
#include <string>

#include "infrastructure/JavaStructureParser.hpp"
#include "TestDoubles.hpp"

using namespace archmend::domain;
using archmend::infrastructure::JavaStructureParser;

static void TestParsesCompilationUnit() {
    JavaStructureParser parser;
    const std::string source = InventoryRepositorySource();
    auto outcome = parser.parse(source);
    assert(outcome && "fixture should parse");

    const ParsedUnit& unit = *outcome.unit;
    assert(unit.packageName && *unit.packageName == "com.example.legacy");
    assert(unit.types.size() == 1);
    assert(unit.types[0].keyword == "class");
    assert(unit.types[0].name == "InventoryRepository");
    assert(unit.render() == source);

    const Member* load = unit.types[0].findCallable("loadAggregate");
    assert(load && load->kind == MemberKind::Method && load->hasBody);
    assert(load->statements.size() == 3);
    assert(load->statements[1].isConditional);
    assert(load->statements[1].condition == "agg.getStock() > 1000");
    std::cout << "[PASS] Package, type, members and statements recognised." << std::endl;
}

static void TestMemberKinds() {
    JavaStructureParser parser;
    const std::string source =
        "import java.util.List;\n"
        "import static java.util.Objects.requireNonNull;\n"
        "@Entity\n"
        "public final class Order<T> extends Base implements Comparable<Order<T>> {\n"
        "    private static final int LIMIT = 10;\n"
        "    private final List<String> items = List.of(\"a\", \"b\");\n"
        "    static { System.out.println(\"init\"); }\n"
        "    public Order() { super(); }\n"
        "    @Override\n"
        "    public int compareTo(Order<T> other) { return 0; }\n"
        "    abstract void pending();\n"
        "    enum State { OPEN, CLOSED; State next() { return CLOSED; } }\n"
        "    record Line(String sku, int qty) { Line { requireNonNull(sku); } }\n"
        "}\n"
        "interface Priced { default long price() { return 0L; } }\n";
    auto outcome = parser.parse(source);
    assert(outcome);

    const ParsedUnit& unit = *outcome.unit;
    assert(!unit.packageName);
    assert(unit.imports.size() == 2);
    assert(unit.types.size() == 2);
    assert(unit.types[1].keyword == "interface");

    const auto& members = unit.types[0].members;
    assert(members.size() == 8);
    assert(members[0].kind == MemberKind::Field && members[0].name == "LIMIT");
    assert(members[1].kind == MemberKind::Field && members[1].name == "items");
    assert(members[2].kind == MemberKind::Initializer);
    assert(members[3].kind == MemberKind::Constructor);
    assert(members[4].kind == MemberKind::Method && members[4].name == "compareTo");
    assert(members[5].kind == MemberKind::Method && !members[5].hasBody);
    assert(members[6].kind == MemberKind::NestedType && members[6].name == "State");
    assert(members[7].kind == MemberKind::NestedType && members[7].name == "Line");
    assert(unit.render() == source);
    std::cout << "[PASS] Fields, initializers, constructors, methods and nested types." << std::endl;
}

static void TestRejectsBrokenSource() {
    JavaStructureParser parser;

    auto unbalanced = parser.parse("class Broken {\n    void f() {\n        if (x) {\n    }\n}\n");
    assert(!unbalanced);
    assert(unbalanced.error.line > 0);

    auto unterminated = parser.parse("class S { String s = \"open; }");
    assert(!unterminated);

    auto danglingElse = parser.parse("class E { void f() { else { } } }");
    assert(!danglingElse);
    assert(danglingElse.error.message.find("else") != std::string::npos);

    auto missingSemicolon = parser.parse("class M { void f() { int a = 1 } }");
    assert(!missingSemicolon);

    auto lateImport = parser.parse("class A {}\nimport java.util.List;\n");
    assert(!lateImport);

    auto bareStatement = parser.parse("int x = 5;");
    assert(!bareStatement);

    auto prose = parser.parse("Here is the refactored code: class A {}");
    assert(!prose);

    assert(!parser.accepts("import java.util.List;\n"));
    auto headerOnly = parser.parse("package com.example;\n\nimport java.util.List;\n// no types\n");
    assert(!headerOnly);
    assert(headerOnly.error.message == "no type declaration");
    assert(headerOnly.error.line == 1);
    assert(!parser.accepts(";"));

    std::cout << "[PASS] Structural errors reported with position: " << unbalanced.error.toString() << std::endl;
}

static void TestCommentOnlyText() {
    JavaStructureParser parser;
    auto outcome = parser.parse("// nothing to see\n/* block */\n");
    assert(outcome);
    assert(outcome.unit->types.empty());
    assert(parser.accepts(""));
    std::cout << "[PASS] Comment-only text parses with zero types." << std::endl;
}

static void TestEditedRender() {
    JavaStructureParser parser;
    auto outcome = parser.parse(InventoryRepositorySource());
    assert(outcome);

    ParsedUnit unit = *outcome.unit;
    TypeDeclaration* type = unit.findType("InventoryRepository");
    assert(type);
    Member& load = type->members[0];
    load.statements.erase(load.statements.begin() + 1);
    load.edited = true;
    type->edited = true;

    std::string rendered = unit.render();
    assert(rendered.find("Huge stock") == std::string::npos);
    assert(rendered.find("return agg;") != std::string::npos);
    assert(rendered.find("Cannot have negative stock") != std::string::npos);
    assert(parser.accepts(rendered));
    std::cout << "[PASS] Edited tree re-renders and still parses." << std::endl;
}

int main() {
    std::cout << "[Test] Starting JavaStructureParser Test..." << std::endl;
    TestParsesCompilationUnit();
    TestMemberKinds();
    TestRejectsBrokenSource();
    TestCommentOnlyText();
    TestEditedRender();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
