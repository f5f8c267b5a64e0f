#include "ImportResolver.h"
#include "ChunkParser.h"
#include "Server.h"

#include <algorithm>
#include <cctype>
#include <vector>

namespace WorkerHost {

    namespace {
        int CountNewlines(const std::string& s, size_t begin, size_t end) {
            return static_cast<int>(std::count(s.begin() + static_cast<std::ptrdiff_t>(begin),
                                               s.begin() + static_cast<std::ptrdiff_t>(end), '\n'));
        }

        bool IsBlank(const std::string& s, size_t begin, size_t end) {
            for (size_t i = begin; i < end; ++i) {
                if (!std::isspace(static_cast<unsigned char>(s[i]))) return false;
            }
            return true;
        }

        std::string FunctionText(const ParsedChunk& lib, const TopLevelNode& fn, bool dropLocal) {
            size_t begin = dropLocal ? fn.keywordBegin : fn.begin;
            return lib.source.substr(begin, fn.end - begin);
        }
    }

    std::string ImportResolver::NormalizeReference(const std::string& reference) {
        if (reference.compare(0, 2, "./") == 0) return reference.substr(2);
        return reference;
    }

    const Script& ImportResolver::LookupScript(const std::string& reference) const {
        const std::string filename = NormalizeReference(reference);
        const Script* script = m_lookup ? m_lookup(filename) : nullptr;
        if (!script) {
            throw ImportError("'Import' failed due to invalid script: " + filename);
        }
        return *script;
    }

    std::string ImportResolver::RemoveImports(const ParsedChunk& chunk, int& removedLines) {
        const std::string& src = chunk.source;
        std::string out;
        size_t cursor = 0;
        removedLines = 0;

        for (const auto& node : chunk.body) {
            if (node.kind != NodeKind::Import) continue;

            size_t lineStart = 0;
            if (node.begin > 0) {
                size_t newline = src.rfind('\n', node.begin - 1);
                if (newline != std::string::npos) lineStart = newline + 1;
            }
            size_t lineEnd = src.find('\n', node.end);
            if (lineEnd == std::string::npos) lineEnd = src.size();

            size_t removeBegin = node.begin;
            size_t removeEnd = node.end;
            if (lineStart >= cursor && IsBlank(src, lineStart, node.begin) && IsBlank(src, node.end, lineEnd)) {
                // whole lines go, including the trailing newline
                removeBegin = lineStart;
                removeEnd = lineEnd < src.size() ? lineEnd + 1 : lineEnd;
            }

            out += src.substr(cursor, removeBegin - cursor);
            removedLines += CountNewlines(src, removeBegin, removeEnd);
            cursor = removeEnd;
        }
        out += src.substr(cursor);
        return out;
    }

    ImportResolution ImportResolver::Resolve(const std::string& code) const {
        ParsedChunk chunk;
        try {
            chunk = ChunkParser::Parse(code);
        }
        catch (const ChunkParseError& e) {
            throw ImportError(e.what());
        }

        if (!chunk.HasImports()) {
            return ImportResolution{ code, 0 };
        }
        if (!chunk.malformed.empty()) {
            throw ImportError("Code could not be properly parsed: " + chunk.malformed);
        }

        std::string generated;
        for (const auto& node : chunk.body) {
            if (node.kind != NodeKind::Import) continue;
            const ImportDeclaration& decl = node.import;

            const Script& lib = LookupScript(decl.source);
            ParsedChunk libChunk;
            try {
                libChunk = ChunkParser::Parse(lib.code);
            }
            catch (const ChunkParseError& e) {
                throw ImportError("Could not parse imported script " + lib.filename + ": " + e.what());
            }
            if (!libChunk.malformed.empty()) {
                throw ImportError("Could not parse imported script " + lib.filename + ": " + libChunk.malformed);
            }

            if (decl.isNamespace) {
                std::vector<const TopLevelNode*> fns;
                for (const auto& libNode : libChunk.body) {
                    if (libNode.kind == NodeKind::Function) fns.push_back(&libNode);
                }

                generated += "local " + decl.namespaceName + " = {}\ndo\n";
                if (!fns.empty()) {
                    generated += "local ";
                    for (size_t i = 0; i < fns.size(); ++i) {
                        if (i > 0) generated += ", ";
                        generated += fns[i]->functionName;
                    }
                    generated += "\n";
                }
                for (const TopLevelNode* fn : fns) {
                    generated += FunctionText(libChunk, *fn, true) + "\n";
                }
                for (const TopLevelNode* fn : fns) {
                    generated += decl.namespaceName + "." + fn->functionName + " = " + fn->functionName + "\n";
                }
                generated += "end\n";
            }
            else {
                for (const auto& name : decl.names) {
                    if (!libChunk.FindFunction(name)) {
                        throw ImportError("'Import' failed: function '" + name + "' not found in script " + lib.filename);
                    }
                }
                for (const auto& libNode : libChunk.body) {
                    if (libNode.kind != NodeKind::Function) continue;
                    if (std::find(decl.names.begin(), decl.names.end(), libNode.functionName) == decl.names.end()) continue;
                    generated += FunctionText(libChunk, libNode, false) + "\n";
                }
            }
        }

        int removedLines = 0;
        std::string remaining = RemoveImports(chunk, removedLines);

        ImportResolution result;
        result.code = generated + remaining;
        result.lineOffset = CountNewlines(generated, 0, generated.size()) - removedLines;
        return result;
    }

} // namespace WorkerHost
