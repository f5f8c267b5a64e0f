#include "ChunkParser.h"

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace WorkerHost {

    namespace {
        const std::unordered_set<std::string> kKeywords = {
            "and", "break", "do", "else", "elseif", "end", "false", "for", "function", "goto", "if",
            "in", "local", "nil", "not", "or", "repeat", "return", "then", "true", "until", "while"
        };

        const char* const kMultiCharSymbols[] = { "...", "..", "==", "~=", "<=", ">=", "<<", ">>", "//", "::" };

        bool IsNameStart(char c) {
            return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
        }

        bool IsNameChar(char c) {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
        }

        bool IsDigit(char c) {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
        }

        // Level of a long bracket "[==[" starting at pos, -1 if there is none.
        int LongBracketLevel(const std::string& s, size_t pos) {
            if (pos >= s.size() || s[pos] != '[') return -1;
            size_t p = pos + 1;
            int level = 0;
            while (p < s.size() && s[p] == '=') {
                ++level;
                ++p;
            }
            if (p < s.size() && s[p] == '[') return level;
            return -1;
        }

        // One past the matching "]==]", npos when unterminated.
        size_t FindLongBracketClose(const std::string& s, size_t from, int level) {
            const std::string close = "]" + std::string(static_cast<size_t>(level), '=') + "]";
            size_t p = s.find(close, from);
            return p == std::string::npos ? std::string::npos : p + close.size();
        }

        bool IsOpener(const Token& t) {
            return t.kind == TokenKind::Keyword &&
                (t.text == "function" || t.text == "do" || t.text == "if" || t.text == "repeat");
        }

        bool IsCloser(const Token& t) {
            return t.kind == TokenKind::Keyword && (t.text == "end" || t.text == "until");
        }

        bool IsSymbol(const Token& t, const char* text) {
            return t.kind == TokenKind::Symbol && t.text == text;
        }

        bool IsNamed(const Token& t, const char* text) {
            return t.kind == TokenKind::Name && t.text == text;
        }

        bool IsKeywordToken(const Token& t, const char* text) {
            return t.kind == TokenKind::Keyword && t.text == text;
        }

        class LineIndex {
        public:
            explicit LineIndex(const std::string& source) {
                for (size_t i = 0; i < source.size(); ++i) {
                    if (source[i] == '\n') m_newlines.push_back(i);
                }
            }

            int LineOf(size_t offset) const {
                auto it = std::lower_bound(m_newlines.begin(), m_newlines.end(), offset);
                return 1 + static_cast<int>(it - m_newlines.begin());
            }

        private:
            std::vector<size_t> m_newlines;
        };

        // Index of the token closing the block opened at 'open', npos if unbalanced.
        size_t FindBlockEnd(const std::vector<Token>& tokens, size_t open) {
            int depth = 0;
            for (size_t j = open; j < tokens.size(); ++j) {
                if (IsOpener(tokens[j])) {
                    ++depth;
                }
                else if (IsCloser(tokens[j])) {
                    --depth;
                    if (depth == 0) return j;
                }
            }
            return std::string::npos;
        }

        TopLevelNode ParseImport(const std::vector<Token>& tokens, size_t& i, const LineIndex& lines) {
            const Token& importTok = tokens[i];
            const size_t count = tokens.size();
            size_t j = i + 1;

            auto fail = [&](const std::string& what) {
                throw ChunkParseError("Malformed import declaration at line " + std::to_string(importTok.line) + ": " + what);
            };

            ImportDeclaration decl;
            if (IsSymbol(tokens[j], "*")) {
                decl.isNamespace = true;
                ++j;
                if (j >= count || !IsNamed(tokens[j], "as")) fail("expected 'as'");
                ++j;
                if (j >= count || tokens[j].kind != TokenKind::Name) fail("expected a namespace name");
                decl.namespaceName = tokens[j].text;
                ++j;
            }
            else {
                ++j; // '{'
                while (true) {
                    if (j >= count) fail("expected '}'");
                    if (IsSymbol(tokens[j], "}")) {
                        ++j;
                        break;
                    }
                    if (tokens[j].kind != TokenKind::Name) fail("expected a function name");
                    decl.names.push_back(tokens[j].text);
                    ++j;
                    if (j < count && IsSymbol(tokens[j], ",")) {
                        ++j;
                        continue;
                    }
                    if (j < count && IsSymbol(tokens[j], "}")) {
                        ++j;
                        break;
                    }
                    fail("expected ',' or '}'");
                }
                if (decl.names.empty()) fail("empty import list");
            }

            if (j >= count || !IsNamed(tokens[j], "from")) fail("expected 'from'");
            ++j;
            if (j >= count || tokens[j].kind != TokenKind::String) fail("expected a script name");
            decl.source = tokens[j].text;
            size_t last = j;
            ++j;
            if (j < count && IsSymbol(tokens[j], ";")) {
                last = j;
                ++j;
            }

            TopLevelNode node;
            node.kind = NodeKind::Import;
            node.begin = importTok.begin;
            node.end = tokens[last].end;
            node.firstLine = importTok.line;
            node.lastLine = lines.LineOf(node.end - 1);
            node.import = std::move(decl);

            i = j;
            return node;
        }
    }

    bool ParsedChunk::HasImports() const {
        for (const auto& node : body) {
            if (node.kind == NodeKind::Import) return true;
        }
        return false;
    }

    const TopLevelNode* ParsedChunk::FindFunction(const std::string& name) const {
        for (const auto& node : body) {
            if (node.kind == NodeKind::Function && node.functionName == name) return &node;
        }
        return nullptr;
    }

    bool ChunkParser::IsKeyword(const std::string& word) {
        return kKeywords.count(word) != 0;
    }

    std::vector<Token> ChunkParser::Tokenize(const std::string& source) {
        std::vector<Token> tokens;
        const size_t n = source.size();
        size_t i = 0;
        int line = 1;

        auto countLines = [&](size_t from, size_t to) {
            for (size_t k = from; k < to && k < n; ++k) {
                if (source[k] == '\n') ++line;
            }
        };

        while (i < n) {
            const char c = source[i];

            if (c == '\n') {
                ++line;
                ++i;
                continue;
            }
            if (std::isspace(static_cast<unsigned char>(c))) {
                ++i;
                continue;
            }

            // comments
            if (c == '-' && i + 1 < n && source[i + 1] == '-') {
                int level = LongBracketLevel(source, i + 2);
                if (level >= 0) {
                    size_t close = FindLongBracketClose(source, i + 2 + static_cast<size_t>(level) + 2, level);
                    if (close == std::string::npos) {
                        throw ChunkParseError("unfinished long comment at line " + std::to_string(line));
                    }
                    countLines(i, close);
                    i = close;
                    continue;
                }
                while (i < n && source[i] != '\n') ++i;
                continue;
            }

            // long strings
            if (c == '[') {
                int level = LongBracketLevel(source, i);
                if (level >= 0) {
                    const int startLine = line;
                    size_t contentBegin = i + static_cast<size_t>(level) + 2;
                    size_t close = FindLongBracketClose(source, contentBegin, level);
                    if (close == std::string::npos) {
                        throw ChunkParseError("unfinished long string at line " + std::to_string(startLine));
                    }
                    size_t contentEnd = close - static_cast<size_t>(level) - 2;
                    std::string value = source.substr(contentBegin, contentEnd - contentBegin);
                    if (!value.empty() && value[0] == '\n') value.erase(0, 1);
                    tokens.push_back(Token{ TokenKind::String, value, i, close, startLine });
                    countLines(i, close);
                    i = close;
                    continue;
                }
            }

            // quoted strings
            if (c == '"' || c == '\'') {
                const int startLine = line;
                size_t j = i + 1;
                std::string value;
                bool closed = false;
                while (j < n) {
                    const char d = source[j];
                    if (d == c) {
                        closed = true;
                        ++j;
                        break;
                    }
                    if (d == '\n') break;
                    if (d == '\\' && j + 1 < n) {
                        const char e = source[j + 1];
                        switch (e) {
                        case 'n': value += '\n'; break;
                        case 't': value += '\t'; break;
                        case 'r': value += '\r'; break;
                        case '\n': value += '\n'; ++line; break;
                        default: value += e; break;
                        }
                        j += 2;
                        continue;
                    }
                    value += d;
                    ++j;
                }
                if (!closed) {
                    throw ChunkParseError("unfinished string at line " + std::to_string(startLine));
                }
                tokens.push_back(Token{ TokenKind::String, value, i, j, startLine });
                i = j;
                continue;
            }

            // numbers
            if (IsDigit(c) || (c == '.' && i + 1 < n && IsDigit(source[i + 1]))) {
                size_t j = i;
                while (j < n) {
                    const char d = source[j];
                    if (IsNameChar(d) || d == '.') {
                        ++j;
                        continue;
                    }
                    const char prev = source[j - 1];
                    if ((d == '+' || d == '-') && (prev == 'e' || prev == 'E' || prev == 'p' || prev == 'P')) {
                        ++j;
                        continue;
                    }
                    break;
                }
                tokens.push_back(Token{ TokenKind::Number, source.substr(i, j - i), i, j, line });
                i = j;
                continue;
            }

            // names and keywords
            if (IsNameStart(c)) {
                size_t j = i + 1;
                while (j < n && IsNameChar(source[j])) ++j;
                std::string word = source.substr(i, j - i);
                TokenKind kind = IsKeyword(word) ? TokenKind::Keyword : TokenKind::Name;
                tokens.push_back(Token{ kind, std::move(word), i, j, line });
                i = j;
                continue;
            }

            // symbols
            size_t len = 1;
            for (const char* sym : kMultiCharSymbols) {
                size_t symLen = std::char_traits<char>::length(sym);
                if (source.compare(i, symLen, sym) == 0) {
                    len = symLen;
                    break;
                }
            }
            tokens.push_back(Token{ TokenKind::Symbol, source.substr(i, len), i, i + len, line });
            i += len;
        }

        return tokens;
    }

    ParsedChunk ChunkParser::Parse(const std::string& source) {
        ParsedChunk chunk;
        chunk.source = source;

        std::vector<Token> tokens;
        try {
            tokens = Tokenize(source);
        }
        catch (const ChunkParseError& e) {
            chunk.malformed = e.what();
            return chunk;
        }

        const LineIndex lines(source);
        const size_t count = tokens.size();
        int depth = 0;
        int openStatement = -1;
        size_t i = 0;

        while (i < count) {
            const Token& t = tokens[i];

            if (depth == 0) {
                if (IsNamed(t, "import") && i + 1 < count &&
                    (IsSymbol(tokens[i + 1], "*") || IsSymbol(tokens[i + 1], "{"))) {
                    openStatement = -1;
                    chunk.body.push_back(ParseImport(tokens, i, lines));
                    continue;
                }

                const bool isGlobalFn = IsKeywordToken(t, "function") && i + 2 < count &&
                    tokens[i + 1].kind == TokenKind::Name && IsSymbol(tokens[i + 2], "(");
                const bool isLocalFn = IsKeywordToken(t, "local") && i + 3 < count &&
                    IsKeywordToken(tokens[i + 1], "function") && tokens[i + 2].kind == TokenKind::Name &&
                    IsSymbol(tokens[i + 3], "(");

                if (isGlobalFn || isLocalFn) {
                    const size_t keyword = isLocalFn ? i + 1 : i;
                    const size_t close = FindBlockEnd(tokens, keyword);
                    if (close == std::string::npos) {
                        chunk.malformed = "'end' expected to close function '" + tokens[keyword + 1].text +
                            "' at line " + std::to_string(tokens[keyword].line);
                        return chunk;
                    }

                    TopLevelNode node;
                    node.kind = NodeKind::Function;
                    node.begin = t.begin;
                    node.end = tokens[close].end;
                    node.firstLine = t.line;
                    node.lastLine = lines.LineOf(node.end - 1);
                    node.functionName = tokens[keyword + 1].text;
                    node.isLocal = isLocalFn;
                    node.keywordBegin = tokens[keyword].begin;
                    chunk.body.push_back(std::move(node));

                    openStatement = -1;
                    i = close + 1;
                    continue;
                }
            }

            if (IsOpener(t)) {
                ++depth;
            }
            else if (IsCloser(t)) {
                --depth;
                if (depth < 0) {
                    chunk.malformed = "unexpected '" + t.text + "' at line " + std::to_string(t.line);
                    return chunk;
                }
            }

            if (openStatement < 0) {
                TopLevelNode node;
                node.kind = NodeKind::Statement;
                node.begin = t.begin;
                node.firstLine = t.line;
                chunk.body.push_back(std::move(node));
                openStatement = static_cast<int>(chunk.body.size() - 1);
            }
            TopLevelNode& stmt = chunk.body[static_cast<size_t>(openStatement)];
            stmt.end = t.end;
            stmt.lastLine = lines.LineOf(t.end - 1);
            ++i;
        }

        if (depth != 0) {
            chunk.malformed = "'end' expected (unclosed block at end of chunk)";
        }
        return chunk;
    }

} // namespace WorkerHost
