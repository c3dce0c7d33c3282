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

#include <llvm/Support/Allocator.h>
#include <llvm/Support/StringSaver.h>

#include <jmf/class/ConstantPool.hpp>

#include "ClassFileBuilder.hpp"
#include "TestSupport.hpp"

using namespace jmf;
using namespace Catch::Matchers;

namespace
{
// Serialized pool: count followed by the entries.
std::vector<char> poolBytes(std::uint16_t count, std::initializer_list<std::vector<char>> entries)
{
    std::vector<char> result;
    test::write<std::uint16_t>(result, count);
    for (const std::vector<char>& entry : entries)
    {
        result.insert(result.end(), entry.begin(), entry.end());
    }
    return result;
}

std::vector<char> utf8Entry(llvm::StringRef text)
{
    std::vector<char> result;
    test::write<std::uint8_t>(result, 1);
    test::write<std::uint16_t>(result, text.size());
    result.insert(result.end(), text.begin(), text.end());
    return result;
}

std::vector<char> longEntry(std::uint64_t value)
{
    std::vector<char> result;
    test::write<std::uint8_t>(result, 5);
    test::write<std::uint64_t>(result, value);
    return result;
}

std::vector<char> classEntry(std::uint16_t nameIndex)
{
    std::vector<char> result;
    test::write<std::uint8_t>(result, 7);
    test::write<std::uint16_t>(result, nameIndex);
    return result;
}

} // namespace

TEST_CASE("ConstantPool parse", "[class][pool]")
{
    llvm::BumpPtrAllocator allocator;
    llvm::StringSaver stringSaver(allocator);

    std::vector<char> bytes = poolBytes(5, {utf8Entry("Test"), longEntry(0x0102030405060708), classEntry(1)});
    ByteReader reader(bytes);
    ConstantPool pool = test::requireValue(ConstantPool::parse(reader, stringSaver));

    CHECK(pool.size() == 5);
    CHECK(reader.remaining() == 0);

    CHECK_FALSE(pool.isAddressable(0));
    CHECK(pool.isAddressable(1));
    CHECK(pool.isAddressable(2));
    // Slot following the Long.
    CHECK_FALSE(pool.isAddressable(3));
    CHECK(pool.isAddressable(4));
    CHECK_FALSE(pool.isAddressable(5));

    CHECK(test::requireValue(pool.getUtf8(1)) == "Test");
    CHECK(test::requireValue(pool.getClassName(4)) == "Test");

    const LongInfo* longInfo = test::requireValue(PoolIndex<LongInfo>(2).resolve(pool));
    CHECK(longInfo->value == 0x0102030405060708);
}

TEST_CASE("ConstantPool wide entries occupy two slots", "[class][pool]")
{
    test::ClassFileBuilder builder("Wide");
    builder.addDouble(0x3FF0000000000000);
    std::uint16_t afterDouble = builder.addUtf8("after");
    builder.addLong(-1);
    std::uint16_t afterLong = builder.addInteger(42);

    llvm::BumpPtrAllocator allocator;
    llvm::StringSaver stringSaver(allocator);
    std::vector<char> bytes = builder.build();
    ClassFile classFile = test::requireValue(ClassFile::parseFromFile(bytes, stringSaver));
    const ConstantPool& pool = classFile.getConstantPool();

    CHECK(test::requireValue(pool.getUtf8(afterDouble)) == "after");
    CHECK(test::requireValue(PoolIndex<IntegerInfo>(afterLong).resolve(pool))->value == 42);
    CHECK(test::requireValue(PoolIndex<DoubleInfo>(afterDouble - 2).resolve(pool))->value == 1.0);
    CHECK(test::requireValue(PoolIndex<LongInfo>(afterLong - 2).resolve(pool))->value == -1);
    CHECK_FALSE(pool.isAddressable(afterDouble - 1));
    CHECK_FALSE(pool.isAddressable(afterLong - 1));
}

TEST_CASE("ConstantPool invalid tag", "[class][pool]")
{
    llvm::BumpPtrAllocator allocator;
    llvm::StringSaver stringSaver(allocator);

    std::uint8_t tag = GENERATE(0, 2, 13, 14, 21, 255);
    std::vector<char> bytes = poolBytes(3, {utf8Entry("A"), {static_cast<char>(tag), 0, 0}});
    ByteReader reader(bytes);
    test::requireErrorOf<ClassFileError>(ConstantPool::parse(reader, stringSaver),
                                         [&](const ClassFileError& error)
                                         {
                                             CHECK(error.getKind() == ClassFileError::InvalidConstantTag);
                                             CHECK_THAT(error.message(), ContainsSubstring("at index 2"));
                                         });
}

TEST_CASE("ConstantPool truncated", "[class][pool]")
{
    llvm::BumpPtrAllocator allocator;
    llvm::StringSaver stringSaver(allocator);

    std::vector<char> bytes = poolBytes(3, {utf8Entry("Complete"), utf8Entry("Truncated")});
    bytes.resize(bytes.size() - 3);
    ByteReader reader(bytes);
    test::requireErrorOf<ClassFileError>(ConstantPool::parse(reader, stringSaver), [](const ClassFileError& error)
                                         { CHECK(error.getKind() == ClassFileError::UnexpectedEof); });
}

TEST_CASE("ConstantPool modified UTF-8", "[class][pool]")
{
    llvm::BumpPtrAllocator allocator;
    llvm::StringSaver stringSaver(allocator);

    auto [raw, expected] = GENERATE(table<std::string, std::string>({
        {"plain", "plain"},
        {"a\xC0\x80"
         "b",
         std::string("a\0b", 3)},
        {"\xC3\xA4", "\xC3\xA4"},
        {"\xE2\x82\xAC", "\xE2\x82\xAC"},
        // U+1F600 as surrogate pair.
        {"\xED\xA0\xBD\xED\xB8\x80", "\xF0\x9F\x98\x80"},
        // Malformed sequences are kept as is.
        {"\xC3", "\xC3"},
        {"\xFF", "\xFF"},
    }));

    std::vector<char> bytes = poolBytes(2, {utf8Entry(raw)});
    ByteReader reader(bytes);
    ConstantPool pool = test::requireValue(ConstantPool::parse(reader, stringSaver));
    CHECK(test::requireValue(pool.getUtf8(1)).str() == expected);
}

TEST_CASE("ConstantPool resolution errors", "[class][pool]")
{
    ConstantPool pool;
    pool.push_back(Utf8Info{"Name"});
    pool.push_back(ClassInfo{1});
    pool.push_back(LongInfo{5});
    pool.push_back(ClassInfo{2});

    REQUIRE(pool.size() == 6);

    SECTION("Index zero")
    {
        test::requireErrorOf<ResolutionError>(pool.getEntry(0), [](const ResolutionError& error)
                                              { CHECK(error.getKind() == ResolutionError::IndexOutOfBounds); });
    }
    SECTION("Past the end")
    {
        test::requireErrorOf<ResolutionError>(pool.getEntry(6),
                                              [](const ResolutionError& error)
                                              {
                                                  CHECK(error.getKind() == ResolutionError::IndexOutOfBounds);
                                                  CHECK(error.getIndex() == 6);
                                              });
    }
    SECTION("Slot after wide entry")
    {
        test::requireErrorOf<ResolutionError>(pool.getEntry(4), [](const ResolutionError& error)
                                              { CHECK(error.getKind() == ResolutionError::IndexOutOfBounds); });
    }
    SECTION("Utf8 expected")
    {
        test::requireErrorOf<ResolutionError>(pool.getUtf8(2), [](const ResolutionError& error)
                                              { CHECK(error.getKind() == ResolutionError::Utf8Expected); });
    }
    SECTION("Wrong kind")
    {
        test::requireErrorOf<ResolutionError>(PoolIndex<ClassInfo>(3).resolve(pool),
                                              [](const ResolutionError& error)
                                              {
                                                  CHECK(error.getKind() == ResolutionError::WrongEntryKind);
                                                  CHECK_THAT(error.message(), ContainsSubstring("Long"));
                                              });
    }
    SECTION("Class name pointing at class")
    {
        test::requireErrorOf<ResolutionError>(pool.getClassName(5), [](const ResolutionError& error)
                                              { CHECK(error.getKind() == ResolutionError::Utf8Expected); });
    }
}

TEST_CASE("ConstantPool multi kind index", "[class][pool]")
{
    ConstantPool pool;
    pool.push_back(MethodRefInfo{{1, 2}});
    pool.push_back(InterfaceMethodRefInfo{{1, 2}});
    pool.push_back(FieldRefInfo{{1, 2}});

    using Index = PoolIndex<MethodRefInfo, InterfaceMethodRefInfo>;
    CHECK(swl::holds_alternative<const MethodRefInfo*>(test::requireValue(Index(1).resolve(pool))));
    CHECK(swl::holds_alternative<const InterfaceMethodRefInfo*>(test::requireValue(Index(2).resolve(pool))));
    test::requireErrorOf<ResolutionError>(Index(3).resolve(pool), [](const ResolutionError& error)
                                          { CHECK(error.getKind() == ResolutionError::WrongEntryKind); });
}
