/**
 * @file JavaStructureParser.cpp
 * @brief Implementation of the JavaStructureParser.
 */

#include "infrastructure/JavaStructureParser.hpp"
#include <cctype>
#include <stdexcept>
#include <unordered_set>
#include <vector>

namespace archmend::infrastructure {

namespace {

enum class TokenKind { Identifier, Number, Literal, Symbol };

struct Token {
    TokenKind kind = TokenKind::Symbol;
    std::string text;
    size_t begin = 0;
    size_t end = 0;
    int line = 1;
    int column = 1;
};

class SyntaxError : public std::runtime_error {
public:
    SyntaxError(const std::string& message, int line, int column)
        : std::runtime_error(message), m_line(line), m_column(column) {}

    int line() const { return m_line; }
    int column() const { return m_column; }

private:
    int m_line;
    int m_column;
};

bool IsIdentStart(unsigned char c) {
    return std::isalpha(c) || c == '_' || c == '$' || c >= 0x80;
}

bool IsIdentPart(unsigned char c) {
    return IsIdentStart(c) || std::isdigit(c);
}

class Lexer {
public:
    explicit Lexer(const std::string& src) : m_src(src) {}

    std::vector<Token> run() {
        std::vector<Token> tokens;
        while (true) {
            skipTrivia();
            if (m_pos >= m_src.size()) break;
            tokens.push_back(next());
        }
        return tokens;
    }

private:
    char peek(size_t offset = 0) const {
        return m_pos + offset < m_src.size() ? m_src[m_pos + offset] : '\0';
    }

    void advance() {
        if (m_pos >= m_src.size()) return;
        if (m_src[m_pos] == '\n') {
            ++m_line;
            m_column = 1;
        } else {
            ++m_column;
        }
        ++m_pos;
    }

    void skipTrivia() {
        while (m_pos < m_src.size()) {
            char c = m_src[m_pos];
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f') {
                advance();
                continue;
            }
            if (c == '/' && peek(1) == '/') {
                while (m_pos < m_src.size() && m_src[m_pos] != '\n') advance();
                continue;
            }
            if (c == '/' && peek(1) == '*') {
                int line = m_line;
                int column = m_column;
                advance();
                advance();
                while (true) {
                    if (m_pos >= m_src.size()) {
                        throw SyntaxError("unterminated comment", line, column);
                    }
                    if (m_src[m_pos] == '*' && peek(1) == '/') {
                        advance();
                        advance();
                        break;
                    }
                    advance();
                }
                continue;
            }
            break;
        }
    }

    void readQuoted(char quote, const Token& start, const char* what) {
        advance();
        while (true) {
            if (m_pos >= m_src.size() || m_src[m_pos] == '\n') {
                throw SyntaxError(std::string("unterminated ") + what, start.line, start.column);
            }
            char c = m_src[m_pos];
            if (c == '\\') {
                advance();
                advance();
                continue;
            }
            advance();
            if (c == quote) return;
        }
    }

    void readTextBlock(const Token& start) {
        advance();
        advance();
        advance();
        while (true) {
            if (m_pos >= m_src.size()) {
                throw SyntaxError("unterminated text block", start.line, start.column);
            }
            if (m_src[m_pos] == '\\') {
                advance();
                advance();
                continue;
            }
            if (m_src[m_pos] == '"' && peek(1) == '"' && peek(2) == '"') {
                advance();
                advance();
                advance();
                return;
            }
            advance();
        }
    }

    Token next() {
        Token tok;
        tok.begin = m_pos;
        tok.line = m_line;
        tok.column = m_column;

        unsigned char c = static_cast<unsigned char>(m_src[m_pos]);
        if (IsIdentStart(c)) {
            tok.kind = TokenKind::Identifier;
            while (m_pos < m_src.size() && IsIdentPart(static_cast<unsigned char>(m_src[m_pos]))) advance();
        } else if (std::isdigit(c) || (c == '.' && std::isdigit(static_cast<unsigned char>(peek(1))))) {
            tok.kind = TokenKind::Number;
            while (m_pos < m_src.size()) {
                char d = m_src[m_pos];
                if (std::isalnum(static_cast<unsigned char>(d)) || d == '_' || d == '.') {
                    advance();
                    continue;
                }
                char prev = m_src[m_pos - 1];
                if ((d == '+' || d == '-') && (prev == 'e' || prev == 'E')) {
                    advance();
                    continue;
                }
                break;
            }
        } else if (c == '"') {
            tok.kind = TokenKind::Literal;
            if (peek(1) == '"' && peek(2) == '"') {
                readTextBlock(tok);
            } else {
                readQuoted('"', tok, "string literal");
            }
        } else if (c == '\'') {
            tok.kind = TokenKind::Literal;
            readQuoted('\'', tok, "character literal");
        } else if (std::ispunct(c) && c != '\\' && c != '#' && c != '`') {
            tok.kind = TokenKind::Symbol;
            advance();
        } else {
            throw SyntaxError(std::string("unexpected character '") + static_cast<char>(c) + "'", tok.line, tok.column);
        }

        tok.end = m_pos;
        tok.text = m_src.substr(tok.begin, tok.end - tok.begin);
        return tok;
    }

    const std::string& m_src;
    size_t m_pos = 0;
    int m_line = 1;
    int m_column = 1;
};

const std::unordered_set<std::string>& Modifiers() {
    static const std::unordered_set<std::string> kModifiers = {
        "public", "protected", "private", "static", "final", "abstract", "sealed", "strictfp",
        "transient", "volatile", "synchronized", "native", "default"
    };
    return kModifiers;
}

class Parser {
public:
    Parser(const std::string& src, std::vector<Token> tokens)
        : m_src(src), m_tokens(std::move(tokens)) {}

    domain::ParsedUnit parseUnit() {
        domain::ParsedUnit unit;
        size_t i = 0;
        size_t preambleEnd = 0;

        if (isWord(0, "package")) {
            size_t j = 1;
            std::string name;
            while (!isSymbol(j, ';')) {
                if (atEnd(j)) fail("expected ';' after package declaration", j);
                name += tok(j).text;
                ++j;
            }
            unit.packageName = name;
            preambleEnd = tok(j).end;
            i = j + 1;
        }

        while (isWord(i, "import")) {
            size_t j = i + 1;
            std::string name;
            while (!isSymbol(j, ';')) {
                if (atEnd(j)) fail("expected ';' after import declaration", j);
                if (isWord(j, "static") && j == i + 1) {
                    name += "static ";
                } else {
                    name += tok(j).text;
                }
                ++j;
            }
            unit.imports.push_back(name);
            preambleEnd = tok(j).end;
            i = j + 1;
        }

        unit.preamble = slice(0, preambleEnd);
        size_t sliceStart = preambleEnd;

        while (!atEnd(i)) {
            if (isSymbol(i, ';')) {
                ++i;
                continue;
            }
            if (isWord(i, "package")) fail("package declaration must come first", i);
            if (isWord(i, "import")) fail("import declaration after type declaration", i);

            domain::TypeDeclaration decl;
            i = parseType(i, sliceStart, decl);
            sliceStart = tok(i - 1).end;
            unit.types.push_back(std::move(decl));
        }
        if (unit.types.empty() && !m_tokens.empty()) {
            fail("no type declaration", 0);
        }

        unit.trailer = slice(sliceStart, m_src.size());
        return unit;
    }

private:
    bool atEnd(size_t i) const { return i >= m_tokens.size(); }
    const Token& tok(size_t i) const { return m_tokens[i]; }

    bool isSymbol(size_t i, char c) const {
        return !atEnd(i) && m_tokens[i].kind == TokenKind::Symbol && m_tokens[i].text[0] == c;
    }

    bool isWord(size_t i, const char* word) const {
        return !atEnd(i) && m_tokens[i].kind == TokenKind::Identifier && m_tokens[i].text == word;
    }

    bool isIdentifier(size_t i) const {
        return !atEnd(i) && m_tokens[i].kind == TokenKind::Identifier;
    }

    std::string slice(size_t from, size_t to) const {
        return m_src.substr(from, to - from);
    }

    [[noreturn]] void fail(const std::string& message, size_t i) const {
        if (!atEnd(i)) {
            throw SyntaxError(message, tok(i).line, tok(i).column);
        }
        int line = 1;
        int column = 1;
        for (char c : m_src) {
            if (c == '\n') {
                ++line;
                column = 1;
            } else {
                ++column;
            }
        }
        throw SyntaxError(message + " (end of input)", line, column);
    }

    void expectSymbol(size_t i, char c, const char* message) const {
        if (!isSymbol(i, c)) fail(message, i);
    }

    /** Index just past the delimiter that closes the opener at i. */
    size_t skipBalanced(size_t i) const {
        std::vector<char> stack;
        size_t j = i;
        do {
            if (atEnd(j)) fail(std::string("unbalanced '") + tok(i).text + "'", i);
            const Token& t = tok(j);
            if (t.kind == TokenKind::Symbol) {
                char c = t.text[0];
                if (c == '(' || c == '[' || c == '{') {
                    stack.push_back(c);
                } else if (c == ')' || c == ']' || c == '}') {
                    if (stack.empty()) fail(std::string("unexpected '") + c + "'", j);
                    char open = stack.back();
                    char expected = open == '(' ? ')' : (open == '[' ? ']' : '}');
                    if (c != expected) fail(std::string("mismatched '") + c + "'", j);
                    stack.pop_back();
                }
            }
            ++j;
        } while (!stack.empty());
        return j;
    }

    size_t skipModifiers(size_t i) const {
        size_t j = i;
        while (true) {
            if (isSymbol(j, '@') && !isWord(j + 1, "interface")) {
                ++j;
                if (!isIdentifier(j)) fail("expected annotation name", j);
                ++j;
                while (isSymbol(j, '.') && isIdentifier(j + 1)) j += 2;
                if (isSymbol(j, '(')) j = skipBalanced(j);
                continue;
            }
            if (isIdentifier(j) && Modifiers().count(tok(j).text) > 0) {
                ++j;
                continue;
            }
            if (isWord(j, "non") && isSymbol(j + 1, '-') && isWord(j + 2, "sealed")) {
                j += 3;
                continue;
            }
            return j;
        }
    }

    bool startsNestedType(size_t j) const {
        if (isSymbol(j, '@') && isWord(j + 1, "interface")) return true;
        if (isWord(j, "class") || isWord(j, "interface") || isWord(j, "enum")) return true;
        return isWord(j, "record") && isIdentifier(j + 1) && (isSymbol(j + 2, '(') || isSymbol(j + 2, '<'));
    }

    size_t parseType(size_t i, size_t sliceStart, domain::TypeDeclaration& out) {
        size_t j = skipModifiers(i);

        if (isSymbol(j, '@') && isWord(j + 1, "interface")) {
            out.keyword = "@interface";
            j += 2;
        } else if (isWord(j, "class") || isWord(j, "interface") || isWord(j, "enum") || isWord(j, "record")) {
            out.keyword = tok(j).text;
            ++j;
        } else {
            fail("expected a type declaration", atEnd(j) ? i : j);
        }

        if (!isIdentifier(j)) fail("expected type name", j);
        out.name = tok(j).text;
        ++j;

        while (!isSymbol(j, '{')) {
            if (atEnd(j)) fail("expected '{' after type header of '" + out.name + "'", j);
            if (isSymbol(j, '(') || isSymbol(j, '[')) {
                j = skipBalanced(j);
                continue;
            }
            if (isSymbol(j, ';') || isSymbol(j, '}') || isSymbol(j, ')') || isSymbol(j, ']') || isSymbol(j, '=')) {
                fail("unexpected '" + tok(j).text + "' in type header", j);
            }
            ++j;
        }

        out.head = slice(sliceStart, tok(j).end);
        size_t close = parseTypeBody(j + 1, tok(j).end, out);
        out.text = slice(sliceStart, tok(close - 1).end);
        return close;
    }

    size_t parseTypeBody(size_t i, size_t sliceStart, domain::TypeDeclaration& out) {
        size_t pos = sliceStart;
        size_t j = i;

        if (out.keyword == "enum") {
            size_t k = j;
            while (!atEnd(k) && !isSymbol(k, ';') && !isSymbol(k, '}')) {
                if (isSymbol(k, '(') || isSymbol(k, '[') || isSymbol(k, '{')) {
                    k = skipBalanced(k);
                    continue;
                }
                if (isSymbol(k, ')') || isSymbol(k, ']')) fail("unexpected '" + tok(k).text + "' in enum constants", k);
                ++k;
            }
            if (atEnd(k)) fail("unterminated body of '" + out.name + "'", k);
            size_t endIdx = isSymbol(k, ';') ? k + 1 : k;
            if (endIdx > j) {
                domain::Member constants;
                constants.kind = domain::MemberKind::EnumConstants;
                constants.text = slice(pos, tok(endIdx - 1).end);
                pos = tok(endIdx - 1).end;
                out.members.push_back(std::move(constants));
            }
            j = endIdx;
        }

        while (true) {
            if (atEnd(j)) fail("unterminated body of '" + out.name + "'", j);
            if (isSymbol(j, '}')) {
                out.tail = slice(pos, tok(j).end);
                return j + 1;
            }
            if (isSymbol(j, ';')) {
                ++j;
                continue;
            }
            domain::Member member;
            j = parseMember(j, pos, out.name, member);
            pos = tok(j - 1).end;
            out.members.push_back(std::move(member));
        }
    }

    size_t parseMember(size_t i, size_t sliceStart, const std::string& typeName, domain::Member& out) {
        size_t j = i;

        if (isSymbol(j, '{') || (isWord(j, "static") && isSymbol(j + 1, '{'))) {
            if (!isSymbol(j, '{')) ++j;
            size_t end = skipBalanced(j);
            out.kind = domain::MemberKind::Initializer;
            out.text = slice(sliceStart, tok(end - 1).end);
            return end;
        }

        j = skipModifiers(j);
        if (startsNestedType(j)) {
            domain::TypeDeclaration nested;
            size_t end = parseType(i, sliceStart, nested);
            out.kind = domain::MemberKind::NestedType;
            out.name = nested.name;
            out.text = nested.text;
            return end;
        }

        bool sawAssign = false;
        bool hasParams = false;
        std::string lastIdent;
        std::string fieldName;

        while (true) {
            if (atEnd(j)) fail("unterminated declaration in '" + typeName + "'", j);
            const Token& t = tok(j);
            if (t.kind == TokenKind::Identifier) {
                lastIdent = t.text;
                ++j;
                continue;
            }
            if (t.kind != TokenKind::Symbol) {
                ++j;
                continue;
            }

            char c = t.text[0];
            if (c == '(') {
                if (!sawAssign && !hasParams) {
                    hasParams = true;
                    out.name = isIdentifier(j - 1) ? tok(j - 1).text : "";
                }
                j = skipBalanced(j);
                continue;
            }
            if (c == '[') {
                j = skipBalanced(j);
                continue;
            }
            if (c == '=') {
                if (!sawAssign && !hasParams) fieldName = lastIdent;
                sawAssign = true;
                ++j;
                continue;
            }
            if (c == '{') {
                if (sawAssign || isWord(j - 1, "default")) {
                    j = skipBalanced(j);
                    continue;
                }
                if (!hasParams) {
                    if (isIdentifier(j - 1) && tok(j - 1).text == typeName) {
                        out.name = typeName; // compact record constructor
                    } else {
                        fail("unexpected '{' in member declaration", j);
                    }
                }
                out.kind = out.name == typeName ? domain::MemberKind::Constructor : domain::MemberKind::Method;
                out.hasBody = true;
                out.bodyHead = slice(sliceStart, t.end);
                size_t end = parseBlockStatements(j, out);
                out.text = slice(sliceStart, tok(end - 1).end);
                return end;
            }
            if (c == ';') {
                if (hasParams && !sawAssign) {
                    out.kind = out.name == typeName ? domain::MemberKind::Constructor : domain::MemberKind::Method;
                } else {
                    out.kind = domain::MemberKind::Field;
                    out.name = fieldName.empty() ? lastIdent : fieldName;
                }
                out.text = slice(sliceStart, t.end);
                return j + 1;
            }
            if (c == '}' || c == ')' || c == ']') {
                fail("unexpected '" + t.text + "' in declaration", j);
            }
            ++j;
        }
    }

    size_t parseBlockStatements(size_t open, domain::Member& out) {
        size_t j = open + 1;
        size_t pos = tok(open).end;
        while (true) {
            if (atEnd(j)) fail("unterminated body of '" + out.name + "'", open);
            if (isSymbol(j, '}')) {
                out.bodyTail = slice(pos, tok(j).end);
                return j + 1;
            }
            domain::Statement statement;
            size_t end = parseStatement(j, &statement);
            statement.text = slice(pos, tok(end - 1).end);
            pos = tok(end - 1).end;
            out.statements.push_back(std::move(statement));
            j = end;
        }
    }

    size_t parseStatement(size_t j, domain::Statement* info) const {
        if (atEnd(j)) fail("expected statement", j);
        const Token& t = tok(j);

        if (isSymbol(j, '{')) return skipBalanced(j);
        if (isSymbol(j, ';')) return j + 1;

        if (t.kind == TokenKind::Identifier) {
            const std::string& word = t.text;
            if (word == "if") {
                expectSymbol(j + 1, '(', "expected '(' after 'if'");
                size_t condEnd = skipBalanced(j + 1);
                if (info) {
                    info->isConditional = true;
                    info->condition = slice(tok(j + 1).end, tok(condEnd - 1).begin);
                }
                size_t k = parseStatement(condEnd, nullptr);
                if (isWord(k, "else")) k = parseStatement(k + 1, nullptr);
                return k;
            }
            if (word == "else") fail("'else' without 'if'", j);
            if (word == "for" || word == "while" || word == "synchronized") {
                expectSymbol(j + 1, '(', "expected '(' after loop keyword");
                return parseStatement(skipBalanced(j + 1), nullptr);
            }
            if (word == "switch") {
                expectSymbol(j + 1, '(', "expected '(' after 'switch'");
                size_t k = skipBalanced(j + 1);
                expectSymbol(k, '{', "expected '{' after switch selector");
                return skipBalanced(k);
            }
            if (word == "do") {
                size_t k = parseStatement(j + 1, nullptr);
                if (!isWord(k, "while")) fail("expected 'while' after do body", k);
                expectSymbol(k + 1, '(', "expected '(' after 'while'");
                k = skipBalanced(k + 1);
                expectSymbol(k, ';', "expected ';' after do-while");
                return k + 1;
            }
            if (word == "try") {
                size_t k = j + 1;
                bool hasResources = false;
                if (isSymbol(k, '(')) {
                    k = skipBalanced(k);
                    hasResources = true;
                }
                expectSymbol(k, '{', "expected '{' after 'try'");
                k = skipBalanced(k);
                bool handled = false;
                while (isWord(k, "catch")) {
                    expectSymbol(k + 1, '(', "expected '(' after 'catch'");
                    k = skipBalanced(k + 1);
                    expectSymbol(k, '{', "expected '{' after catch clause");
                    k = skipBalanced(k);
                    handled = true;
                }
                if (isWord(k, "finally")) {
                    expectSymbol(k + 1, '{', "expected '{' after 'finally'");
                    k = skipBalanced(k + 1);
                    handled = true;
                }
                if (!handled && !hasResources) fail("'try' without 'catch' or 'finally'", k);
                return k;
            }
            if ((word == "class" || word == "interface" || word == "enum") && isIdentifier(j + 1)) {
                size_t k = j + 2;
                while (!isSymbol(k, '{')) {
                    if (atEnd(k) || isSymbol(k, ';')) fail("expected '{' in local type declaration", k);
                    if (isSymbol(k, '(') || isSymbol(k, '[')) {
                        k = skipBalanced(k);
                        continue;
                    }
                    ++k;
                }
                return skipBalanced(k);
            }
            if (isSymbol(j + 1, ':') && !isSymbol(j + 2, ':')) {
                return parseStatement(j + 2, nullptr); // labeled statement
            }
        }

        size_t k = j;
        while (true) {
            if (atEnd(k)) fail("missing ';'", k);
            const Token& u = tok(k);
            if (u.kind == TokenKind::Symbol) {
                char c = u.text[0];
                if (c == '(' || c == '[' || c == '{') {
                    k = skipBalanced(k);
                    continue;
                }
                if (c == ';') return k + 1;
                if (c == '}' || c == ')' || c == ']') fail("missing ';' before '" + u.text + "'", k);
            }
            ++k;
        }
    }

    const std::string& m_src;
    std::vector<Token> m_tokens;
};

} // namespace

domain::ParseOutcome JavaStructureParser::parse(const std::string& text) const {
    domain::ParseOutcome outcome;
    try {
        Lexer lexer(text);
        Parser parser(text, lexer.run());
        outcome.unit = parser.parseUnit();
    } catch (const SyntaxError& e) {
        outcome.error.message = e.what();
        outcome.error.line = e.line();
        outcome.error.column = e.column();
    }
    return outcome;
}

} // namespace archmend::infrastructure
