#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "application/ValidationLoop.hpp"
#include "infrastructure/JavaStructureParser.hpp"
#include "TestDoubles.hpp"

using namespace archmend;
using application::LoopPrompts;
using application::ValidationLoop;
using Role = TestChatMessage::Role;

static LoopPrompts TestPrompts() {
    LoopPrompts prompts;
    prompts.systemPrompt = "system";
    prompts.basePolicy = "policy";
    prompts.unavailableFeedback = "no answer, try again";
    prompts.malformedFeedback = "reply with the verdict object only";
    prompts.unparseableFeedback = "fix does not parse: {error}";
    return prompts;
}

static domain::Chunk MakeChunk(const std::string& text, int index = 1) {
    domain::Chunk chunk;
    chunk.unitId = "Legacy.java";
    chunk.index = index;
    chunk.text = text;
    chunk.label = "member";
    return chunk;
}

static void TestAcceptsParsableFix() {
    auto model = std::make_shared<ScriptedTransformer>();
    model->addRule("class A", {VerdictJson(true, "db call in domain", "class A { void f() { } }")});
    ValidationLoop loop(model, std::make_shared<infrastructure::JavaStructureParser>(), TestPrompts());

    auto verdict = loop.run(MakeChunk("class A { void f() { db(); } }"), "", 3);
    assert(verdict.kind == domain::ChunkVerdictKind::Accepted);
    assert(verdict.violation);
    assert(verdict.reason == "db call in domain");
    assert(verdict.fix == "class A { void f() { } }");
    assert(verdict.attempts == 1);
    assert(model->calls() == 1);

    auto history = model->histories().front();
    assert(history.size() == 2);
    assert(history[0].role == Role::System && history[0].content == "system");
    assert(history[1].content.find("policy") == 0);
    assert(history[1].content.find("//=== Legacy Code Chunk ===\nclass A") != std::string::npos);
    std::cout << "[PASS] Parsable fix accepted on first attempt." << std::endl;
}

static void TestRetriesAfterUnparseableFix() {
    auto model = std::make_shared<ScriptedTransformer>();
    model->addRule("class B", {
        VerdictJson(true, "leak", "class B { void f() { int x = 1 } }"),
        "```json\n" + VerdictJson(true, "leak", "class B { void f() { int x = 1; } }") + "\n```"
    });
    ValidationLoop loop(model, std::make_shared<infrastructure::JavaStructureParser>(), TestPrompts());

    auto verdict = loop.run(MakeChunk("class B { }", 2), "ctx", 3);
    assert(verdict.kind == domain::ChunkVerdictKind::Accepted);
    assert(verdict.chunkIndex == 2);
    assert(verdict.attempts == 2);
    assert(verdict.fix == "class B { void f() { int x = 1; } }");

    // Second request carries the rejected reply and the parse error.
    auto histories = model->histories();
    assert(histories.size() == 2);
    const auto& retry = histories[1];
    assert(retry.size() == 4);
    assert(retry[2].role == Role::Assistant);
    assert(retry[2].content.find("int x = 1 }") != std::string::npos);
    assert(retry[3].role == Role::User);
    assert(retry[3].content.find("fix does not parse: missing ';'") == 0);
    std::cout << "[PASS] Unparseable fix triggers corrective retry." << std::endl;
}

static void TestExhaustsOnMalformedReplies() {
    auto model = std::make_shared<ScriptedTransformer>();
    model->setDefault(std::string("I think the code is fine, no JSON for you."));
    ValidationLoop loop(model, std::make_shared<infrastructure::JavaStructureParser>(), TestPrompts());

    const std::string text = "class C { /* note */ }";
    auto verdict = loop.run(MakeChunk(text), "", 3);
    assert(verdict.isFallback());
    assert(verdict.violation);
    assert(verdict.reason == ValidationLoop::kExhaustedReason);
    assert(verdict.attempts == 3);
    assert(model->calls() == 3);
    assert(verdict.fix == ValidationLoop::FallbackFix(text));
    assert(verdict.fix.find("needs manual attention") != std::string::npos);
    assert(verdict.fix.find("/* note *\\/") != std::string::npos);

    auto last = model->histories().back();
    assert(last.back().content == "reply with the verdict object only");
    std::cout << "[PASS] Malformed replies exhaust into the fallback after 3 calls." << std::endl;
}

static void TestUnavailableModel() {
    auto model = std::make_shared<ScriptedTransformer>();
    model->setDefault(std::nullopt);
    ValidationLoop loop(model, std::make_shared<infrastructure::JavaStructureParser>(), TestPrompts());

    auto verdict = loop.run(MakeChunk("class D { }"), "", 2);
    assert(verdict.isFallback());
    assert(model->calls() == 2);

    auto last = model->histories().back();
    assert(last.size() == 3);
    assert(last[2].role == Role::User && last[2].content == "no answer, try again");
    std::cout << "[PASS] Unavailable model counts against the attempt budget." << std::endl;
}

static void TestNoViolationSkipsParse() {
    auto model = std::make_shared<ScriptedTransformer>();
    model->setDefault(VerdictJson(false, "clean", "this is not java {"));
    ValidationLoop loop(model, std::make_shared<infrastructure::JavaStructureParser>(), TestPrompts());

    auto verdict = loop.run(MakeChunk("class E { }"), "", 3);
    assert(verdict.kind == domain::ChunkVerdictKind::Accepted);
    assert(!verdict.violation);
    assert(verdict.fix.empty());
    assert(verdict.attempts == 1);

    auto zero = loop.run(MakeChunk("class E { }"), "", 0);
    assert(zero.isFallback() && zero.attempts == 0);
    std::cout << "[PASS] No-violation verdict accepted without parsing." << std::endl;
}

static void TestParseVerdict() {
    std::string error;

    auto wrapped = ValidationLoop::ParseVerdict("Sure! {\"violation\": true, \"reason\": \"r\", \"fix\": \"class X {}\"} done", error);
    assert(wrapped && wrapped->violation && wrapped->fix == "class X {}");

    auto minimal = ValidationLoop::ParseVerdict("{\"violation\": false}", error);
    assert(minimal && !minimal->violation && minimal->reason.empty());

    assert(!ValidationLoop::ParseVerdict("no braces here", error));
    assert(!ValidationLoop::ParseVerdict("{\"violation\": \"yes\"}", error));
    assert(error.find("violation") != std::string::npos);
    assert(!ValidationLoop::ParseVerdict("{\"violation\": true, \"reason\": 7}", error));
    assert(!ValidationLoop::ParseVerdict("{\"violation\": true, \"suggestedFix\": [1]}", error));
    assert(!ValidationLoop::ParseVerdict("{violation: true}", error));
    std::cout << "[PASS] Verdict extraction and field validation." << std::endl;
}

int main() {
    std::cout << "[Test] Starting ValidationLoop Test..." << std::endl;
    TestAcceptsParsableFix();
    TestRetriesAfterUnparseableFix();
    TestExhaustsOnMalformedReplies();
    TestUnavailableModel();
    TestNoViolationSkipsParse();
    TestParseVerdict();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
