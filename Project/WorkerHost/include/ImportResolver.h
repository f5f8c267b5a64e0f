#pragma once
// ImportResolver.h
//
// Rewrites a legacy script so its import declarations are replaced by the imported function
// definitions, prepended to the script:
//
//   import * as lib from "lib.script"   ->  local lib = {}
//                                            do
//                                            local f, g
//                                            function f(...) ... end
//                                            function g(...) ... end
//                                            lib.f = f
//                                            lib.g = g
//                                            end
//
//   import { f } from "lib.script"      ->  function f(...) ... end   (as declared in lib.script)
//
// lineOffset = (lines of generated prefix) - (lines removed with the import declarations); it is
// subtracted from runtime error line numbers so they point into the original source.
// Code without imports comes back unchanged with offset 0.

#include <functional>
#include <stdexcept>
#include <string>

namespace WorkerHost {

    struct Script;
    struct ParsedChunk;

    class ImportError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    struct ImportResolution {
        std::string code;
        int lineOffset = 0;
    };

    class ImportResolver {
    public:
        using ScriptLookup = std::function<const Script*(const std::string& filename)>;

        explicit ImportResolver(ScriptLookup lookup) : m_lookup(std::move(lookup)) {}

        // Throws ImportError on unparsable code, a missing script or a missing function.
        ImportResolution Resolve(const std::string& code) const;

        // "./lib.script" -> "lib.script"
        static std::string NormalizeReference(const std::string& reference);

    private:
        const Script& LookupScript(const std::string& reference) const;
        static std::string RemoveImports(const ParsedChunk& chunk, int& removedLines);

        ScriptLookup m_lookup;
    };

} // namespace WorkerHost
