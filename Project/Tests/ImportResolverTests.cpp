// File: Tests/ImportResolverTests.cpp
// Purpose: Import inlining for legacy scripts and the structural chunk parser behind it.
// Key invariants: Code without imports is returned untouched with offset 0; lineOffset maps
//                 resolved line numbers back onto the original source.

#include <gtest/gtest.h>

#include "ChunkParser.h"
#include "ImportResolver.h"
#include "Server.h"

#include <string>

using namespace WorkerHost;

namespace {

    const char* const kLibrary =
        "function double(x)\n"
        "  return x * 2\n"
        "end\n"
        "local function triple(x) return x * 3 end\n";

    struct ResolverFixture {
        Server server{ "home", 64.0 };

        ResolverFixture() {
            server.AddScript(Script{ "lib.script", kLibrary, 1.0 });
        }

        ImportResolver Resolver() {
            return ImportResolver([this](const std::string& name) { return server.FindScript(name); });
        }
    };

    int CountLines(const std::string& s) {
        int n = 0;
        for (char c : s) n += c == '\n' ? 1 : 0;
        return n;
    }

} // namespace

TEST(ChunkParser, SplitsTopLevelIntoImportsFunctionsAndStatements) {
    ParsedChunk chunk = ChunkParser::Parse(
        "import { a, b } from \"lib.script\";\n"
        "local x = 1\n"
        "function f()\n  if x then return 1 end\nend\n"
        "print(f())\n");

    ASSERT_TRUE(chunk.malformed.empty()) << chunk.malformed;
    ASSERT_EQ(chunk.body.size(), 4u);
    EXPECT_EQ(chunk.body[0].kind, NodeKind::Import);
    EXPECT_EQ(chunk.body[0].import.names, (std::vector<std::string>{ "a", "b" }));
    EXPECT_EQ(chunk.body[0].import.source, "lib.script");
    EXPECT_EQ(chunk.body[1].kind, NodeKind::Statement);
    EXPECT_EQ(chunk.body[2].kind, NodeKind::Function);
    EXPECT_EQ(chunk.body[2].functionName, "f");
    EXPECT_EQ(chunk.body[2].firstLine, 3);
    EXPECT_EQ(chunk.body[2].lastLine, 5);
    ASSERT_NE(chunk.FindFunction("f"), nullptr);
}

TEST(ChunkParser, KeywordsInsideStringsAndCommentsAreIgnored) {
    ParsedChunk chunk = ChunkParser::Parse(
        "-- function broken(\n"
        "local s = \"end end\"\n"
        "local t = [[ do if ]]\n"
        "--[==[ repeat ]==]\n");
    EXPECT_TRUE(chunk.malformed.empty()) << chunk.malformed;
    EXPECT_FALSE(chunk.HasImports());
}

TEST(ChunkParser, UnbalancedBlocksAreReportedNotThrown) {
    EXPECT_FALSE(ChunkParser::Parse("function f()\n  return 1\n").malformed.empty());
    EXPECT_FALSE(ChunkParser::Parse("end\n").malformed.empty());
    EXPECT_FALSE(ChunkParser::Parse("local s = \"open\n").malformed.empty());
}

TEST(ImportResolver, CodeWithoutImportsIsUnchanged) {
    ResolverFixture fx;
    const std::string code = "local x = 1\nprint(x)\n";
    ImportResolution r = fx.Resolver().Resolve(code);
    EXPECT_EQ(r.code, code);
    EXPECT_EQ(r.lineOffset, 0);
}

TEST(ImportResolver, NamedImportInlinesDeclarationsAndComputesOffset) {
    ResolverFixture fx;
    ImportResolution r = fx.Resolver().Resolve(
        "import { double } from \"lib.script\"\n"
        "print(double(2))\n");

    const std::string expectedPrefix = "function double(x)\n  return x * 2\nend\n";
    EXPECT_EQ(r.code, expectedPrefix + "print(double(2))\n");
    // three generated lines, one import line removed
    EXPECT_EQ(r.lineOffset, 2);
    EXPECT_EQ(r.code.find("triple"), std::string::npos);
}

TEST(ImportResolver, NamespaceImportWrapsFunctionsInATable) {
    ResolverFixture fx;
    const std::string body = "print(lib.double(1), lib.triple(1))\n";
    ImportResolution r = fx.Resolver().Resolve("import * as lib from \"./lib.script\"\n" + body);

    EXPECT_EQ(r.code.rfind("local lib = {}\ndo\nlocal double, triple\n", 0), 0u);
    EXPECT_NE(r.code.find("\nfunction triple(x)"), std::string::npos);
    EXPECT_EQ(r.code.find("local function triple"), std::string::npos);
    EXPECT_NE(r.code.find("lib.double = double\nlib.triple = triple\nend\n"), std::string::npos);

    const std::string generated = r.code.substr(0, r.code.size() - body.size());
    EXPECT_EQ(r.lineOffset, CountLines(generated) - 1);
    EXPECT_EQ(r.code.substr(generated.size()), body);
}

TEST(ImportResolver, ImportLineSharedWithCodeKeepsTheRest) {
    ResolverFixture fx;
    ImportResolution r = fx.Resolver().Resolve("import { double } from \"lib.script\"; print(double(3))\n");
    EXPECT_NE(r.code.find(" print(double(3))\n"), std::string::npos);
    EXPECT_EQ(r.lineOffset, 3);
}

TEST(ImportResolver, MissingScriptOrFunctionFails) {
    ResolverFixture fx;
    try {
        fx.Resolver().Resolve("import { double } from \"nothere.script\"\n");
        FAIL() << "expected ImportError";
    }
    catch (const ImportError& e) {
        EXPECT_STREQ(e.what(), "'Import' failed due to invalid script: nothere.script");
    }

    try {
        fx.Resolver().Resolve("import { quadruple } from \"lib.script\"\n");
        FAIL() << "expected ImportError";
    }
    catch (const ImportError& e) {
        EXPECT_STREQ(e.what(), "'Import' failed: function 'quadruple' not found in script lib.script");
    }
}

TEST(ImportResolver, MalformedDeclarationFails) {
    ResolverFixture fx;
    try {
        fx.Resolver().Resolve("import * lib from \"lib.script\"\n");
        FAIL() << "expected ImportError";
    }
    catch (const ImportError& e) {
        EXPECT_NE(std::string(e.what()).find("Malformed import declaration at line 1"), std::string::npos);
    }
    EXPECT_THROW(fx.Resolver().Resolve("import { double } from \"lib.script\"\nfunction f()\n"), ImportError);
}

TEST(ImportResolver, NormalizeReferenceStripsCurrentDirectory) {
    EXPECT_EQ(ImportResolver::NormalizeReference("./lib.script"), "lib.script");
    EXPECT_EQ(ImportResolver::NormalizeReference("lib.script"), "lib.script");
}
