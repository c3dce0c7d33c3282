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

#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

#include <jmf/support/Bytes.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "ConstantPool.hpp"

namespace jmf
{

/// Convenience class for accessing the attributes of an entity.
/// This is essentially a list of attribute names with the attributes themselves.
///
/// Attributes are contained in their unparsed raw byte form and only deserialized on lookup. See 'find' for more
/// details. Attributes whose name could not be resolved through the constant pool are kept with an empty name and
/// are never found.
class AttributeMap
{
    using AttributePointer = std::unique_ptr<void, void (*)(void*)>;

    struct Entry
    {
        llvm::StringRef name;
        llvm::ArrayRef<char> bytes;
        mutable AttributePointer parsed{nullptr, nullptr};
    };

    std::vector<Entry> m_entries;

public:
    AttributeMap() = default;
    ~AttributeMap() = default;
    AttributeMap(const AttributeMap&) = delete;
    AttributeMap& operator=(const AttributeMap&) = delete;
    AttributeMap(AttributeMap&&) noexcept = default;
    AttributeMap& operator=(AttributeMap&&) noexcept = default;

    /// Reads an 'attributes_count' followed by that many 'attribute_info' structures from 'reader'.
    /// Attribute names are looked up in 'pool'. Only fails if 'reader' runs out of bytes.
    static llvm::Expected<AttributeMap> parse(ByteReader& reader, const ConstantPool& pool);

    void insert(llvm::StringRef name, llvm::ArrayRef<char> bytes)
    {
        m_entries.push_back({name, bytes});
    }

    /// Returns the amount of attributes, including ones with unresolved names.
    std::size_t size() const
    {
        return m_entries.size();
    }

    /// Returns true if an attribute called 'name' exists.
    bool contains(llvm::StringRef name) const
    {
        return llvm::any_of(m_entries, [&](const Entry& entry) { return entry.name == name; });
    }

    /// Returns the raw bytes of the first attribute called 'name' or an empty optional.
    std::optional<llvm::ArrayRef<char>> getRaw(llvm::StringRef name) const
    {
        auto iter = llvm::find_if(m_entries, [&](const Entry& entry) { return entry.name == name; });
        if (iter == m_entries.end())
        {
            return std::nullopt;
        }
        return iter->bytes;
    }

    /// Looks up an attribute in the attribute map and parses it if present.
    ///
    /// Attributes are represented by types which are required to have following structure:
    ///     * a static constexpr string called 'identifier' which is the name of the attribute
    ///     * a static 'parse(ArrayRef<char>, const ConstantPool&)' method which returns an
    ///       'llvm::Expected' of the attribute class.
    ///
    /// 'T' of this method must be such a class. If the attribute is not present a null pointer is returned.
    /// If it is present but malformed, the error of 'T::parse' is returned. Successful parses are cached.
    template <class T>
    llvm::Expected<const T*> find(const ConstantPool& pool) const
    {
        auto result = llvm::find_if(m_entries, [](const Entry& entry) { return entry.name == T::identifier; });
        if (result == m_entries.end())
        {
            return nullptr;
        }

        if (!result->parsed)
        {
            llvm::Expected<T> parsed = T::parse(result->bytes, pool);
            if (!parsed)
            {
                return parsed.takeError();
            }
            result->parsed = AttributePointer(new T(std::move(*parsed)),
                                              +[](void* pointer) { delete reinterpret_cast<T*>(pointer); });
        }
        return reinterpret_cast<const T*>(result->parsed.get());
    }
};

/// 'LineNumberTable' attribute nested within a 'Code' attribute, mapping bytecode offsets to source lines.
class LineNumberTable
{
public:
    constexpr static llvm::StringRef identifier = "LineNumberTable";

    static llvm::Expected<LineNumberTable> parse(llvm::ArrayRef<char> bytes, const ConstantPool& pool);

    struct Entry
    {
        /// Offset of the first instruction in 'code' belonging to the line.
        std::uint16_t startPc{};
        /// Line number in the original source file.
        std::uint16_t lineNumber{};
    };

private:
    std::vector<Entry> m_entries;

public:
    LineNumberTable() = default;

    explicit LineNumberTable(std::vector<Entry> entries) : m_entries(std::move(entries)) {}

    /// Returns the entries in the order they appear in the class file.
    llvm::ArrayRef<Entry> getEntries() const
    {
        return m_entries;
    }

    /// Returns the line of the entry with the greatest 'startPc' that is less or equal to 'offset'.
    /// Returns an empty optional if there is no such entry.
    std::optional<std::uint16_t> lookup(std::size_t offset) const;
};

/// 'Code' attribute attached to methods containing the JVM Bytecode.
class Code
{
public:
    constexpr static llvm::StringRef identifier = "Code";

    static llvm::Expected<Code> parse(llvm::ArrayRef<char> bytes, const ConstantPool& pool);

    /// Exception table entry. Used to mark a range of JVM Bytecode instructions as "guarded" by an exception handler.
    /// Note that order of these is significant.
    struct ExceptionTable
    {
        /// Offset of the first op in 'code' that is guarded by this exception handler.
        std::uint16_t startPc{};
        /// Offset of the first op in 'code' that is no longer guarded by this exception handler.
        std::uint16_t endPc{};
        /// Offset to the exception handler executed if an exception with matching type was thrown.
        std::uint16_t handlerPc{};
        /// Index into the pool representing the class objects whose instances can be caught by this handler.
        PoolIndex<ClassInfo> catchType{};
    };

private:
    std::uint16_t m_maxStack{};
    std::uint16_t m_maxLocals{};
    llvm::ArrayRef<char> m_code;
    std::vector<ExceptionTable> m_exceptionTable;
    AttributeMap m_attributes;

public:
    /// Returns the maximum size the operand stack required by the bytecode.
    std::uint16_t getMaxStack() const
    {
        return m_maxStack;
    }

    /// Returns the maximum amount of locals required by the bytecode.
    std::uint16_t getMaxLocals() const
    {
        return m_maxLocals;
    }

    /// Returns the serialized JVM bytecode of the containing method.
    llvm::ArrayRef<char> getCode() const
    {
        return m_code;
    }

    /// Returns the exception table of the containing method.
    llvm::ArrayRef<ExceptionTable> getExceptionTable() const
    {
        return m_exceptionTable;
    }

    /// Returns the attributes nested within the code attribute, e.g. the 'LineNumberTable'.
    const AttributeMap& getAttributes() const
    {
        return m_attributes;
    }
};

} // namespace jmf
