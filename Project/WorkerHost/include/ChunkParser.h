#pragma once
// ChunkParser.h
//
// Lightweight structural parser for legacy script chunks. It does not build a full syntax tree;
// it tokenizes the source and splits the top level into:
//   - import declarations   import * as NS from "lib.script"
//                           import { f, g } from "lib.script"
//   - function declarations function name(...) ... end / local function name(...) ... end
//   - other statements
// Block depth is tracked with the openers function/do/if/repeat and the closers end/until.
//
// A chunk the parser cannot follow (unterminated string/comment, unbalanced blocks) is returned
// with 'malformed' set instead of throwing; only a broken import declaration throws, since no
// later stage could make sense of it.

#include <stdexcept>
#include <string>
#include <vector>

namespace WorkerHost {

    class ChunkParseError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    enum class TokenKind : uint8_t {
        Name = 0,
        Keyword,
        String,
        Number,
        Symbol
    };

    struct Token {
        TokenKind kind;
        std::string text;   // raw source text (strings: unquoted value)
        size_t begin;
        size_t end;         // one past the last character
        int line;
    };

    enum class NodeKind : uint8_t {
        Import = 0,
        Function,
        Statement
    };

    struct ImportDeclaration {
        bool isNamespace = false;
        std::string namespaceName;        // import * as <namespaceName>
        std::vector<std::string> names;   // import { <names> }
        std::string source;               // from "<source>"
    };

    struct TopLevelNode {
        NodeKind kind = NodeKind::Statement;
        size_t begin = 0;
        size_t end = 0;
        int firstLine = 1;
        int lastLine = 1;

        // Function
        std::string functionName;
        bool isLocal = false;
        size_t keywordBegin = 0; // position of the 'function' keyword

        // Import
        ImportDeclaration import;
    };

    struct ParsedChunk {
        std::string source;
        std::vector<TopLevelNode> body;
        std::string malformed; // non-empty when the structure could not be determined

        bool HasImports() const;
        const TopLevelNode* FindFunction(const std::string& name) const;
    };

    class ChunkParser {
    public:
        // Throws ChunkParseError on a malformed import declaration.
        static ParsedChunk Parse(const std::string& source);

        // Throws ChunkParseError on unterminated strings / comments.
        static std::vector<Token> Tokenize(const std::string& source);

        static bool IsKeyword(const std::string& word);
    };

} // namespace WorkerHost
