// Copyright (C) 2023 The jmf Contributors.
//
// This file is part of jmf.
//
// jmf is free software; you can redistribute it and/or modify it under  the terms of the GNU General Public License
// as published by the Free Software Foundation; either version 3, or (at your option) any later version.
//
// jmf is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty
// of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License along with jmf; see the file LICENSE.txt.  If not
// see <http://www.gnu.org/licenses/>.

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <catch2/matchers/catch_matchers_all.hpp>

#include <llvm/ADT/ScopeExit.h>
#include <llvm/ADT/SmallString.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/Path.h>
#include <llvm/Support/raw_ostream.h>

#include <jmf/scanner/TreeScanner.hpp>

#include <algorithm>
#include <string>

#include "ClassFileBuilder.hpp"
#include "TestSupport.hpp"

using namespace jmf;
using namespace Catch::Matchers;

namespace
{
const TargetMethod target{"com.example.TargetClass", "targetMethod"};

/// Unique directory that is deleted with all its contents on destruction.
class TempDirectory
{
    llvm::SmallString<128> m_path;

public:
    TempDirectory()
    {
        std::error_code ec = llvm::sys::fs::createUniqueDirectory("jmf-test", m_path);
        REQUIRE_FALSE(ec);
    }

    ~TempDirectory()
    {
        llvm::sys::fs::remove_directories(m_path);
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    llvm::StringRef path() const
    {
        return m_path;
    }

    /// Writes 'bytes' to 'relativePath', creating parent directories as needed. Returns the full path.
    std::string writeFile(llvm::StringRef relativePath, llvm::ArrayRef<char> bytes) const
    {
        llvm::SmallString<128> fullPath = m_path;
        llvm::sys::path::append(fullPath, relativePath);
        REQUIRE_FALSE(llvm::sys::fs::create_directories(llvm::sys::path::parent_path(fullPath)));

        std::error_code ec;
        llvm::raw_fd_ostream os(fullPath, ec);
        REQUIRE_FALSE(ec);
        os.write(bytes.data(), bytes.size());
        return std::string(fullPath);
    }
};

/// Class 'com.example.Caller' calling the target from two methods.
std::vector<char> callerClass()
{
    test::ClassFileBuilder builder("com/example/Caller");
    std::uint16_t ref = builder.addMethodRef("com/example/TargetClass", "targetMethod", "()V");
    std::vector<char> code = test::concat({test::invoke(OpCodes::InvokeStatic, ref), {static_cast<char>(OpCodes::Return)}});
    builder.addMethod("second", "()V", code, test::LineNumbers{{0, 20}});
    builder.addMethod("first", "()V", code, test::LineNumbers{{0, 10}});
    return builder.build();
}

/// Class without any calls of the target.
std::vector<char> unrelatedClass()
{
    test::ClassFileBuilder builder("com/example/Unrelated");
    std::uint16_t ref = builder.addMethodRef("java/io/PrintStream", "println", "(Ljava/lang/String;)V");
    builder.addMethod("print", "()V",
                      test::concat({test::invoke(OpCodes::InvokeVirtual, ref), {static_cast<char>(OpCodes::Return)}}));
    return builder.build();
}

} // namespace

TEST_CASE("scan fault isolation", "[scanner][tree]")
{
    TempDirectory directory;
    directory.writeFile("com/example/Caller.class", callerClass());
    directory.writeFile("com/example/Unrelated.class", unrelatedClass());
    std::vector<char> truncated = callerClass();
    truncated.resize(truncated.size() / 2);
    std::string brokenPath = directory.writeFile("com/example/broken/Broken.class", truncated);
    directory.writeFile("com/example/notes.txt", callerClass());

    unsigned threads = GENERATE(0u, 1u, 4u);
    ScanResult result = test::requireValue(scan(directory.path(), target, {.threads = threads}));

    std::vector<MethodCall> expected = {{"com.example.Caller", "first", 10}, {"com.example.Caller", "second", 20}};
    CHECK(result.calls == expected);
    REQUIRE(result.warnings.size() == 1);
    CHECK(result.warnings[0].path == brokenPath);
    CHECK_THAT(result.warnings[0].message, StartsWith("failed to parse class file: unexpected end of file"));
}

TEST_CASE("scan is idempotent", "[scanner][tree]")
{
    TempDirectory directory;
    for (int i = 0; i < 8; i++)
    {
        directory.writeFile("pkg" + std::to_string(i) + "/Caller.class", callerClass());
    }
    directory.writeFile("Broken.class", {'\xCA', '\xFE'});

    ScanResult first = test::requireValue(scan(directory.path(), target));
    ScanResult second = test::requireValue(scan(directory.path(), target));
    CHECK(first.calls.size() == 16);
    CHECK(first.calls == second.calls);
    CHECK(first.warnings == second.warnings);
    CHECK(std::is_sorted(first.calls.begin(), first.calls.end()));
}

TEST_CASE("scan empty directory", "[scanner][tree]")
{
    TempDirectory directory;
    ScanResult result = test::requireValue(scan(directory.path(), target));
    CHECK(result.calls.empty());
    CHECK(result.warnings.empty());
}

TEST_CASE("scan invalid input", "[scanner][tree]")
{
    TempDirectory directory;
    std::string file = directory.writeFile("Caller.class", callerClass());
    llvm::SmallString<128> missing = directory.path();
    llvm::sys::path::append(missing, "missing");

    auto check = [](llvm::Expected<ScanResult> result, llvm::StringRef message)
    {
        test::requireErrorOf<InputError>(std::move(result), [&](const InputError& error)
                                         { CHECK_THAT(error.message(), StartsWith(message.str())); });
    };

    check(scan(missing, target), "scan folder does not exist");
    check(scan(file, target), "scan path is not a directory");
    check(scan(directory.path(), {"", "targetMethod"}), "target class name must not be empty");
    check(scan(directory.path(), {"com.example.TargetClass", ""}), "target method name must not be empty");
}

TEST_CASE("scan progress log", "[scanner][tree]")
{
    TempDirectory directory;
    directory.writeFile("Caller.class", callerClass());

    std::string log;
    llvm::raw_string_ostream logStream(log);
    test::requireValue(scan(directory.path(), target, {.log = &logStream}));

    CHECK_THAT(logStream.str(), ContainsSubstring("debug: Start scanning folder: "));
    CHECK_THAT(logStream.str(), ContainsSubstring("debug: Analyzing class file: "));
    CHECK_THAT(logStream.str(), ContainsSubstring("debug: Visiting class: com.example.Caller\n"));
    CHECK_THAT(logStream.str(), ContainsSubstring("debug: Visiting method: com.example.Caller#first\n"));
    CHECK_THAT(logStream.str(), ContainsSubstring("debug: Visiting method: com.example.Caller#second\n"));
    CHECK_THAT(logStream.str(), ContainsSubstring("debug: Found method call: com.example.Caller#first"));
}

TEST_CASE("discoverClassFiles", "[scanner][tree]")
{
    TempDirectory directory;
    std::string top = directory.writeFile("Top.class", {});
    std::string nested = directory.writeFile("a/b/c/Nested.class", {});
    directory.writeFile("a/Readme.md", {});
    directory.writeFile("a/b/Data.classes", {});

    std::vector<ScanWarning> warnings;
    std::vector<std::string> files = discoverClassFiles(directory.path(), warnings);
    CHECK(warnings.empty());
    CHECK_THAT(files, UnorderedEquals(std::vector<std::string>{top, nested}));
}

TEST_CASE("discoverClassFiles missing root", "[scanner][tree]")
{
    TempDirectory directory;
    llvm::SmallString<128> missing = directory.path();
    llvm::sys::path::append(missing, "missing");

    std::vector<ScanWarning> warnings;
    std::vector<std::string> files = discoverClassFiles(missing, warnings);
    CHECK(files.empty());
    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0].path == std::string(missing));
    CHECK_THAT(warnings[0].message, StartsWith("cannot read directory: "));
}

TEST_CASE("discoverClassFiles unreadable directory", "[scanner][tree]")
{
    TempDirectory directory;
    std::string first = directory.writeFile("a/Caller.class", callerClass());
    std::string locked = directory.writeFile("locked/Hidden.class", callerClass());
    std::string last = directory.writeFile("z/Unrelated.class", unrelatedClass());
    std::string lockedDirectory(llvm::sys::path::parent_path(locked));

    REQUIRE_FALSE(llvm::sys::fs::setPermissions(lockedDirectory, llvm::sys::fs::no_perms));
    auto restore = llvm::make_scope_exit([&] { llvm::sys::fs::setPermissions(lockedDirectory, llvm::sys::fs::all_all); });
    {
        std::error_code ec;
        llvm::sys::fs::directory_iterator iter(lockedDirectory, ec);
        if (!ec)
        {
            WARN("directory permissions are not enforced for this user");
            return;
        }
    }

    SECTION("discovery")
    {
        std::vector<ScanWarning> warnings;
        std::vector<std::string> files = discoverClassFiles(directory.path(), warnings);
        CHECK_THAT(files, UnorderedEquals(std::vector<std::string>{first, last}));
        REQUIRE(warnings.size() == 1);
        CHECK(warnings[0].path == lockedDirectory);
        CHECK_THAT(warnings[0].message, StartsWith("cannot read directory: "));
    }

    SECTION("scan")
    {
        ScanResult result = test::requireValue(scan(directory.path(), target));
        std::vector<MethodCall> expected = {{"com.example.Caller", "first", 10}, {"com.example.Caller", "second", 20}};
        CHECK(result.calls == expected);
        REQUIRE(result.warnings.size() == 1);
        CHECK(result.warnings[0].path == lockedDirectory);
        CHECK_THAT(result.warnings[0].message, StartsWith("cannot read directory: "));
    }
}

TEST_CASE("scanClassBytes", "[scanner]")
{
    InvocationScanner scanner(target);
    std::vector<char> bytes = callerClass();
    ClassScanResult result = test::requireValue(scanClassBytes(bytes, scanner));
    CHECK(result.calls.size() == 2);

    bytes[3] = 0;
    test::requireErrorOf<ClassFileError>(scanClassBytes(bytes, scanner), [](const ClassFileError& error)
                                         { CHECK(error.getKind() == ClassFileError::InvalidMagic); });
}
