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

#pragma once

#include <llvm/ADT/STLExtras.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/StringSaver.h>

#include <jmf/support/Bytes.hpp>
#include <jmf/support/Error.hpp>
#include <jmf/support/Variant.hpp>

#include <cstdint>
#include <type_traits>
#include <variant>
#include <vector>

#include <swl/variant.hpp>

namespace jmf
{
class ConstantPool;

/// Convenience class for strong typing of indices within the constant pool of a class file.
/// Class files contain a lot of indices into the constant pool that are usually restricted to only ever being
/// one kind of constant. This class records the expected kinds in its type and checks them on resolution.
///
/// Internally this class is simply a 16 bit unsigned integer as that is the index type for the constant pool.
/// The template parameters must be one of the alternatives in 'ConstantPoolInfo'.
template <class First, class... Rest>
class PoolIndex
{
    std::uint16_t m_index{};

public:
    /// Pointer to the resolved entry if this index may only refer to one kind of entry, otherwise a variant of
    /// pointers to each possible kind.
    using Result = std::conditional_t<(sizeof...(Rest) > 0), swl::variant<const First*, const Rest*...>, const First*>;

    /// Default constructed pool index. This never refers to any entries within the constant pool.
    PoolIndex() = default;

    /// Implicit constructor from a pool index.
    /*implicit*/ PoolIndex(std::uint16_t index) : m_index(index) {}

    /// Resolves the entry in 'pool'. Fails with a 'ResolutionError' if the index is not addressable or refers to an
    /// entry of a kind other than 'First, Rest...'.
    llvm::Expected<Result> resolve(const ConstantPool& pool) const;

    /// Returns the raw index.
    std::uint16_t getIndex() const
    {
        return m_index;
    }

    /// Returns true if this pool index refers to an entry in a class files constant pool.
    explicit operator bool() const
    {
        return m_index != 0;
    }

    auto operator<=>(const PoolIndex& rhs) const = default;
};

struct Utf8Info;
struct NameAndTypeInfo;

/// Constant pool object representing a class name.
struct ClassInfo
{
    PoolIndex<Utf8Info> nameIndex;
};

/// Base class for constant pool objects representing references.
struct RefInfo
{
    PoolIndex<ClassInfo> classIndex;
    PoolIndex<NameAndTypeInfo> nameAndTypeIndex;
};

/// Constant pool object representing a reference to a field.
struct FieldRefInfo : RefInfo
{
};

/// Constant pool object representing a reference to a method.
struct MethodRefInfo : RefInfo
{
};

/// Constant pool object representing a reference to an interface method.
struct InterfaceMethodRefInfo : RefInfo
{
};

/// Constant pool object representing a Java string object.
struct StringInfo
{
    PoolIndex<Utf8Info> stringValue;
};

/// Constant pool object representing a 32 bit integer.
struct IntegerInfo
{
    std::int32_t value;
};

/// Constant pool object representing a single precision float.
struct FloatInfo
{
    float value;
};

/// Constant pool object representing a 64 bit integer. Occupies two slots in the pool.
struct LongInfo
{
    std::int64_t value;
};

/// Constant pool object representing a double precision float. Occupies two slots in the pool.
struct DoubleInfo
{
    double value;
};

/// Constant pool object representing a pair of a name and a descriptor.
/// This is used by the various reference object entries, where the name is the name of the member
/// and the descriptor represents its type.
struct NameAndTypeInfo
{
    PoolIndex<Utf8Info> nameIndex;
    PoolIndex<Utf8Info> descriptorIndex;
};

/// Constant pool object representing a UTF-8 string. The text has already been converted from the JVM's modified
/// UTF-8.
struct Utf8Info
{
    llvm::StringRef text;
};

/// Method handle constant. Recognized for pool bookkeeping only.
struct MethodHandleInfo
{
    std::uint8_t referenceKind;
    std::uint16_t referenceIndex;
};

/// Method type constant. Recognized for pool bookkeeping only.
struct MethodTypeInfo
{
    PoolIndex<Utf8Info> descriptorIndex;
};

/// Dynamically computed constant. Recognized for pool bookkeeping only.
struct DynamicInfo
{
    std::uint16_t bootStrapMethodIndex;
    PoolIndex<NameAndTypeInfo> nameAndTypeIndex;
};

/// Call site of an 'invokedynamic' instruction. Recognized for pool bookkeeping only.
struct InvokeDynamicInfo
{
    std::uint16_t bootStrapMethodIndex;
    PoolIndex<NameAndTypeInfo> nameAndTypeIndex;
};

struct ModuleInfo
{
    PoolIndex<Utf8Info> nameIndex;
};

struct PackageInfo
{
    PoolIndex<Utf8Info> nameIndex;
};

/// Variant of all the possible kinds of constant pool entries.
/// Note the 'std::monostate' is used for index 0 and for the "empty" constant pool entries following
/// any 'LongInfo' and 'DoubleInfo' entries as required by the JVM specification. These are never addressable.
using ConstantPoolInfo =
    swl::variant<std::monostate, ClassInfo, FieldRefInfo, MethodRefInfo, InterfaceMethodRefInfo, StringInfo,
                 IntegerInfo, FloatInfo, LongInfo, DoubleInfo, NameAndTypeInfo, Utf8Info, MethodHandleInfo,
                 MethodTypeInfo, DynamicInfo, InvokeDynamicInfo, ModuleInfo, PackageInfo>;

/// Tag byte preceding every entry of the constant pool.
enum class ConstantPoolTag : std::uint8_t
{
    Utf8 = 1,
    Integer = 3,
    Float = 4,
    Long = 5,
    Double = 6,
    Class = 7,
    String = 8,
    FieldRef = 9,
    MethodRef = 10,
    InterfaceMethodRef = 11,
    NameAndType = 12,
    MethodHandle = 15,
    MethodType = 16,
    Dynamic = 17,
    InvokeDynamic = 18,
    Module = 19,
    Package = 20
};

/// Constant pool of a class file. Indices are 1-based as in the class file itself.
class ConstantPool
{
    std::vector<ConstantPoolInfo> m_entries;

public:
    ConstantPool() = default;

    /// Parses the constant pool starting at the 'constant_pool_count' field of a class file.
    /// 'stringSaver' owns the converted text of all 'Utf8Info' entries.
    /// Fails with a 'ClassFileError' if an entry is truncated or has an unknown tag.
    static llvm::Expected<ConstantPool> parse(ByteReader& reader, llvm::StringSaver& stringSaver);

    /// Returns the 'constant_pool_count' of the class file, that is one more than the largest valid index.
    std::size_t size() const
    {
        return m_entries.size();
    }

    /// Returns true if 'index' refers to an actual entry, excluding index 0 and slots following wide entries.
    bool isAddressable(std::uint16_t index) const
    {
        return index < m_entries.size() && !swl::holds_alternative<std::monostate>(m_entries[index]);
    }

    /// Returns the entry at 'index' or a 'ResolutionError' of kind 'IndexOutOfBounds' if it is not addressable.
    llvm::Expected<const ConstantPoolInfo&> getEntry(std::uint16_t index) const;

    /// Convenience function returning the text of the 'Utf8Info' at 'index'.
    llvm::Expected<llvm::StringRef> getUtf8(PoolIndex<Utf8Info> index) const;

    /// Convenience function returning the internal (slash separated) name of the 'ClassInfo' at 'index'.
    llvm::Expected<llvm::StringRef> getClassName(PoolIndex<ClassInfo> index) const;

    /// Appends an entry. Wide entries automatically occupy a second slot. Used to construct pools in memory.
    void push_back(ConstantPoolInfo info);
};

/// Returns a human readable name of the kind of 'info', e.g. "Methodref".
llvm::StringRef getKindName(const ConstantPoolInfo& info);

template <class First, class... Rest>
llvm::Expected<typename PoolIndex<First, Rest...>::Result>
    PoolIndex<First, Rest...>::resolve(const ConstantPool& pool) const
{
    llvm::Expected<const ConstantPoolInfo&> entry = pool.getEntry(m_index);
    if (!entry)
    {
        return entry.takeError();
    }
    return match(
        *entry,
        [&](const auto& alt) -> llvm::Expected<Result>
        {
            if constexpr (llvm::is_one_of<std::decay_t<decltype(alt)>, First, Rest...>::value)
            {
                return Result(&alt);
            }
            else
            {
                constexpr bool onlyUtf8 = sizeof...(Rest) == 0 && std::is_same_v<First, Utf8Info>;
                return llvm::make_error<ResolutionError>(onlyUtf8 ? ResolutionError::Utf8Expected :
                                                                    ResolutionError::WrongEntryKind,
                                                         m_index,
                                                         ("unexpected " + getKindName(*entry) + " entry").str());
            }
        });
}

} // namespace jmf
