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

#include <llvm/ADT/STLExtras.h>
#include <llvm/Support/raw_ostream.h>

#include <jmf/scanner/InvocationScanner.hpp>
#include <jmf/scanner/TreeScanner.hpp>

#include "ClassFileBuilder.hpp"
#include "TestSupport.hpp"

using namespace jmf;
using namespace Catch::Matchers;

namespace
{
const TargetMethod target{"com.example.TargetClass", "targetMethod"};

ClassScanResult scanBuilder(const test::ClassFileBuilder& builder, bool includeSelfCalls = false)
{
    std::vector<char> bytes = builder.build();
    return test::requireValue(scanClassBytes(bytes, InvocationScanner(target, includeSelfCalls)));
}

std::vector<char> ops(std::initializer_list<OpCodes> opCodes)
{
    std::vector<char> result;
    for (OpCodes opCode : opCodes)
    {
        test::write(result, opCode);
    }
    return result;
}

} // namespace

TEST_CASE("InvocationScanner end to end", "[scanner]")
{
    test::ClassFileBuilder builder("com/example/CallerClass");
    std::uint16_t ref = builder.addMethodRef("com/example/TargetClass", "targetMethod", "()V");
    builder.addMethod("callerMethod", "()V",
                      test::concat({ops({OpCodes::ALoad0}), test::invoke(OpCodes::InvokeVirtual, ref),
                                    ops({OpCodes::Return})}),
                      test::LineNumbers{{0, 123}, {4, 124}});

    ClassScanResult result = scanBuilder(builder);
    CHECK(result.warnings.empty());
    REQUIRE(result.calls.size() == 1);
    CHECK(result.calls[0] == MethodCall{"com.example.CallerClass", "callerMethod", 123});
}

TEST_CASE("InvocationScanner invoke kinds", "[scanner]")
{
    OpCodes opCode = GENERATE(OpCodes::InvokeVirtual, OpCodes::InvokeSpecial, OpCodes::InvokeStatic,
                              OpCodes::InvokeInterface);

    test::ClassFileBuilder builder("Caller");
    std::uint16_t ref = opCode == OpCodes::InvokeInterface ?
                            builder.addInterfaceMethodRef("com/example/TargetClass", "targetMethod", "()V") :
                            builder.addMethodRef("com/example/TargetClass", "targetMethod", "()V");
    builder.addMethod("run", "()V", test::concat({test::invoke(opCode, ref), ops({OpCodes::Return})}));

    ClassScanResult result = scanBuilder(builder);
    REQUIRE(result.calls.size() == 1);
    CHECK(result.calls[0] == MethodCall{"Caller", "run", std::nullopt});
}

TEST_CASE("InvocationScanner matches names only", "[scanner]")
{
    test::ClassFileBuilder builder("Caller");
    std::uint16_t first = builder.addMethodRef("com/example/TargetClass", "targetMethod", "()V");
    std::uint16_t overload = builder.addMethodRef("com/example/TargetClass", "targetMethod", "(ILjava/lang/String;)J");
    std::uint16_t otherClass = builder.addMethodRef("com/example/OtherClass", "targetMethod", "()V");
    std::uint16_t otherMethod = builder.addMethodRef("com/example/TargetClass", "otherMethod", "()V");
    std::uint16_t otherCase = builder.addMethodRef("com/example/targetclass", "targetMethod", "()V");
    std::uint16_t field = builder.addFieldRef("com/example/TargetClass", "targetMethod", "I");

    builder.addMethod("run", "()V",
                      test::concat({
                          test::invoke(OpCodes::InvokeStatic, first),       // 0
                          test::invoke(OpCodes::InvokeStatic, otherClass),  // 3
                          test::invoke(OpCodes::InvokeStatic, otherMethod), // 6
                          test::invoke(OpCodes::InvokeStatic, otherCase),   // 9
                          test::invoke(OpCodes::GetStatic, field),          // 12
                          test::invoke(OpCodes::InvokeStatic, overload),    // 15
                          ops({OpCodes::Return}),
                      }),
                      test::LineNumbers{{0, 10}, {5, 11}, {12, 13}});

    ClassScanResult result = scanBuilder(builder);
    CHECK(result.warnings.empty());
    std::vector<MethodCall> expected = {{"Caller", "run", 10}, {"Caller", "run", 13}};
    CHECK(result.calls == expected);
}

TEST_CASE("InvocationScanner line numbers", "[scanner]")
{
    test::ClassFileBuilder builder("Caller");
    std::uint16_t ref = builder.addMethodRef("com/example/TargetClass", "targetMethod", "()V");

    // Calls at offsets 0, 7 and 20.
    std::vector<char> code = test::concat({
        test::invoke(OpCodes::InvokeStatic, ref),
        ops({OpCodes::Nop, OpCodes::Nop, OpCodes::Nop, OpCodes::Nop}),
        test::invoke(OpCodes::InvokeStatic, ref),
        std::vector<char>(10, static_cast<char>(OpCodes::Nop)),
        test::invoke(OpCodes::InvokeStatic, ref),
        ops({OpCodes::Return}),
    });

    SECTION("With table")
    {
        builder.addMethod("run", "()V", code, test::LineNumbers{{0, 10}, {5, 11}, {12, 13}});
        std::vector<MethodCall> expected = {{"Caller", "run", 10}, {"Caller", "run", 11}, {"Caller", "run", 13}};
        CHECK(scanBuilder(builder).calls == expected);
    }
    SECTION("Offset before first entry")
    {
        builder.addMethod("run", "()V", code, test::LineNumbers{{5, 11}});
        std::vector<MethodCall> expected = {
            {"Caller", "run", std::nullopt}, {"Caller", "run", 11}, {"Caller", "run", 11}};
        CHECK(scanBuilder(builder).calls == expected);
    }
    SECTION("Without table")
    {
        builder.addMethod("run", "()V", code);
        std::vector<MethodCall> expected = {
            {"Caller", "run", std::nullopt}, {"Caller", "run", std::nullopt}, {"Caller", "run", std::nullopt}};
        CHECK(scanBuilder(builder).calls == expected);
    }
}

TEST_CASE("InvocationScanner unresolvable references", "[scanner]")
{
    test::ClassFileBuilder builder("Caller");
    std::uint16_t ref = builder.addMethodRef("com/example/TargetClass", "targetMethod", "()V");
    std::uint16_t broken = builder.addRawMethodRef(ref, 999);
    builder.addMethod("run", "()V",
                      test::concat({
                          test::invoke(OpCodes::InvokeVirtual, 0),
                          test::invoke(OpCodes::InvokeVirtual, 5000),
                          test::invoke(OpCodes::InvokeVirtual, broken),
                          test::invoke(OpCodes::InvokeVirtual, ref),
                          ops({OpCodes::Return}),
                      }),
                      test::LineNumbers{{0, 1}, {9, 2}});

    ClassScanResult result = scanBuilder(builder);
    CHECK(result.warnings.empty());
    REQUIRE(result.calls.size() == 1);
    CHECK(result.calls[0].lineNumber == 2);
}

TEST_CASE("InvocationScanner malformed method", "[scanner]")
{
    test::ClassFileBuilder builder("com/example/Caller");
    std::uint16_t ref = builder.addMethodRef("com/example/TargetClass", "targetMethod", "()V");
    builder.addMethod("broken", "()V",
                      test::concat({test::invoke(OpCodes::InvokeStatic, ref), std::vector<char>{'\xFF'}}),
                      test::LineNumbers{{0, 5}});
    builder.addMethod("good", "()V", test::concat({test::invoke(OpCodes::InvokeStatic, ref), ops({OpCodes::Return})}),
                      test::LineNumbers{{0, 9}});

    ClassScanResult result = scanBuilder(builder);

    // The call before the malformed instruction is kept.
    std::vector<MethodCall> expected = {{"com.example.Caller", "broken", 5}, {"com.example.Caller", "good", 9}};
    CHECK(result.calls == expected);
    REQUIRE(result.warnings.size() == 1);
    CHECK_THAT(result.warnings[0], StartsWith("com.example.Caller#broken: "));
    CHECK_THAT(result.warnings[0], ContainsSubstring("unknown opcode"));
}

TEST_CASE("InvocationScanner methods without code", "[scanner]")
{
    test::ClassFileBuilder builder("Caller");
    builder.addMethodWithoutCode("abstractMethod", "()V", AccessFlag::Public | AccessFlag::Abstract);
    builder.addMethodWithoutCode("nativeMethod", "()V", AccessFlag::Public | AccessFlag::Native);
    builder.addMethodWithoutCode("missingCode", "()V", AccessFlag::Public);

    ClassScanResult result = scanBuilder(builder);
    CHECK(result.calls.empty());
    REQUIRE(result.warnings.size() == 1);
    CHECK_THAT(result.warnings[0], StartsWith("Caller#missingCode: "));
}

TEST_CASE("InvocationScanner self calls", "[scanner]")
{
    test::ClassFileBuilder builder("com/example/TargetClass");
    std::uint16_t ref = builder.addMethodRef("com/example/TargetClass", "targetMethod", "()V");
    builder.addMethod("recurse", "()V", test::concat({test::invoke(OpCodes::InvokeStatic, ref), ops({OpCodes::Return})}),
                      test::LineNumbers{{0, 3}});

    SECTION("Skipped by default")
    {
        CHECK(scanBuilder(builder).calls.empty());
    }
    SECTION("Included on request")
    {
        std::vector<MethodCall> expected = {{"com.example.TargetClass", "recurse", 3}};
        CHECK(scanBuilder(builder, /*includeSelfCalls=*/true).calls == expected);
    }
}

TEST_CASE("InvocationScanner progress log", "[scanner]")
{
    test::ClassFileBuilder builder("com/example/Caller");
    std::uint16_t ref = builder.addMethodRef("com/example/TargetClass", "targetMethod", "()V");
    builder.addMethod("call", "()V", test::concat({test::invoke(OpCodes::InvokeStatic, ref), ops({OpCodes::Return})}));
    builder.addMethod("idle", "()V", ops({OpCodes::Return}));
    std::vector<char> bytes = builder.build();

    std::string output;
    llvm::raw_string_ostream os(output);
    ProgressLog log(&os);
    test::requireValue(scanClassBytes(bytes, InvocationScanner(target, /*includeSelfCalls=*/false, &log)));

    CHECK_THAT(os.str(), ContainsSubstring("debug: Visiting class: com.example.Caller\n"));
    CHECK_THAT(os.str(), ContainsSubstring("debug: Visiting method: com.example.Caller#call\n"));
    CHECK_THAT(os.str(), ContainsSubstring("debug: Visiting method: com.example.Caller#idle\n"));
    CHECK_THAT(os.str(), ContainsSubstring("debug: Found method call: com.example.Caller#call\n"));
    CHECK_THAT(os.str(), !ContainsSubstring("Found method call: com.example.Caller#idle"));
}

TEST_CASE("InvocationScanner unresolvable class name", "[scanner]")
{
    ClassFile classFile;
    test::requireErrorOf<ResolutionError>(InvocationScanner(target).scanClass(classFile), [](const ResolutionError&) {});
}

TEST_CASE("MethodCall ordering", "[scanner]")
{
    std::vector<MethodCall> calls = {
        {"B", "a", 1}, {"A", "b", 2}, {"A", "a", 7}, {"A", "a", std::nullopt}, {"A", "a", 3},
    };
    llvm::sort(calls);
    std::vector<MethodCall> expected = {
        {"A", "a", std::nullopt}, {"A", "a", 3}, {"A", "a", 7}, {"A", "b", 2}, {"B", "a", 1},
    };
    CHECK(calls == expected);
}
