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

#include <jmf/class/ByteCodeIterator.hpp>
#include <jmf/class/ClassFile.hpp>
#include <jmf/class/ConstantPool.hpp>

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace jmf::test
{

/// Appends 'value' in big endian to 'out'.
template <class T>
void write(std::vector<char>& out, T value)
{
    for (std::size_t i = sizeof(T); i-- > 0;)
    {
        out.push_back(static_cast<char>((static_cast<std::uint64_t>(value) >> (i * 8)) & 0xFF));
    }
}

/// Appends the opcode byte of 'opCode' to 'out'.
inline void write(std::vector<char>& out, OpCodes opCode)
{
    out.push_back(static_cast<char>(opCode));
}

/// Returns the bytes of an 'invokevirtual', 'invokespecial', 'invokestatic' or 'invokeinterface' instruction.
inline std::vector<char> invoke(OpCodes opCode, std::uint16_t poolIndex)
{
    std::vector<char> result;
    write(result, opCode);
    write(result, poolIndex);
    if (opCode == OpCodes::InvokeInterface)
    {
        write<std::uint8_t>(result, 1);
        write<std::uint8_t>(result, 0);
    }
    return result;
}

/// Concatenates instruction byte sequences.
inline std::vector<char> concat(std::initializer_list<std::vector<char>> parts)
{
    std::vector<char> result;
    for (const std::vector<char>& part : parts)
    {
        result.insert(result.end(), part.begin(), part.end());
    }
    return result;
}

/// '(startPc, lineNumber)' pairs of a 'LineNumberTable'.
using LineNumbers = std::vector<std::pair<std::uint16_t, std::uint16_t>>;

/// Assembles the bytes of a class file. Constant pool entries are appended in call order so that tests can refer to
/// the returned indices.
class ClassFileBuilder
{
    std::vector<char> m_pool;
    std::uint16_t m_poolCount = 1;
    std::uint16_t m_thisClass = 0;
    std::uint16_t m_superClass = 0;
    std::uint16_t m_methodCount = 0;
    std::vector<char> m_methods;

    std::uint16_t addEntry(ConstantPoolTag tag, llvm::ArrayRef<char> payload, bool wide = false)
    {
        write(m_pool, static_cast<std::uint8_t>(tag));
        m_pool.insert(m_pool.end(), payload.begin(), payload.end());
        std::uint16_t index = m_poolCount;
        m_poolCount += wide ? 2 : 1;
        return index;
    }

    template <class... Args>
    std::uint16_t addIndices(ConstantPoolTag tag, Args... indices)
    {
        std::vector<char> payload;
        (write<std::uint16_t>(payload, indices), ...);
        return addEntry(tag, payload);
    }

public:
    /// Creates a builder for the class with the given internal name, extending 'java/lang/Object'.
    explicit ClassFileBuilder(llvm::StringRef thisClass)
    {
        m_thisClass = addClass(thisClass);
        m_superClass = addClass("java/lang/Object");
    }

    std::uint16_t addUtf8(llvm::StringRef text)
    {
        std::vector<char> payload;
        write<std::uint16_t>(payload, text.size());
        payload.insert(payload.end(), text.begin(), text.end());
        return addEntry(ConstantPoolTag::Utf8, payload);
    }

    std::uint16_t addClass(llvm::StringRef internalName)
    {
        return addIndices(ConstantPoolTag::Class, addUtf8(internalName));
    }

    std::uint16_t addNameAndType(llvm::StringRef name, llvm::StringRef descriptor)
    {
        std::uint16_t nameIndex = addUtf8(name);
        return addIndices(ConstantPoolTag::NameAndType, nameIndex, addUtf8(descriptor));
    }

    std::uint16_t addMethodRef(llvm::StringRef className, llvm::StringRef name, llvm::StringRef descriptor)
    {
        std::uint16_t classIndex = addClass(className);
        return addIndices(ConstantPoolTag::MethodRef, classIndex, addNameAndType(name, descriptor));
    }

    std::uint16_t addInterfaceMethodRef(llvm::StringRef className, llvm::StringRef name, llvm::StringRef descriptor)
    {
        std::uint16_t classIndex = addClass(className);
        return addIndices(ConstantPoolTag::InterfaceMethodRef, classIndex, addNameAndType(name, descriptor));
    }

    std::uint16_t addFieldRef(llvm::StringRef className, llvm::StringRef name, llvm::StringRef descriptor)
    {
        std::uint16_t classIndex = addClass(className);
        return addIndices(ConstantPoolTag::FieldRef, classIndex, addNameAndType(name, descriptor));
    }

    /// Adds a 'Methodref' with raw class and name-and-type indices which may not be valid.
    std::uint16_t addRawMethodRef(std::uint16_t classIndex, std::uint16_t nameAndTypeIndex)
    {
        return addIndices(ConstantPoolTag::MethodRef, classIndex, nameAndTypeIndex);
    }

    std::uint16_t addInteger(std::int32_t value)
    {
        std::vector<char> payload;
        write<std::uint32_t>(payload, static_cast<std::uint32_t>(value));
        return addEntry(ConstantPoolTag::Integer, payload);
    }

    std::uint16_t addLong(std::int64_t value)
    {
        std::vector<char> payload;
        write<std::uint64_t>(payload, static_cast<std::uint64_t>(value));
        return addEntry(ConstantPoolTag::Long, payload, /*wide=*/true);
    }

    std::uint16_t addDouble(std::uint64_t bits)
    {
        std::vector<char> payload;
        write<std::uint64_t>(payload, bits);
        return addEntry(ConstantPoolTag::Double, payload, /*wide=*/true);
    }

    /// Adds a method whose 'Code' attribute contains 'code'. If 'lineNumbers' is present a nested 'LineNumberTable'
    /// is added as well.
    void addMethod(llvm::StringRef name, llvm::StringRef descriptor, std::vector<char> code,
                   std::optional<LineNumbers> lineNumbers = std::nullopt,
                   AccessFlag accessFlags = AccessFlag::Public)
    {
        std::uint16_t nameIndex = addUtf8(name);
        std::uint16_t descriptorIndex = addUtf8(descriptor);
        std::uint16_t codeName = addUtf8("Code");

        std::vector<char> nested;
        std::uint16_t nestedCount = 0;
        if (lineNumbers)
        {
            std::uint16_t lineNumberTableName = addUtf8("LineNumberTable");
            write<std::uint16_t>(nested, lineNumberTableName);
            write<std::uint32_t>(nested, 2 + 4 * lineNumbers->size());
            write<std::uint16_t>(nested, lineNumbers->size());
            for (auto [startPc, line] : *lineNumbers)
            {
                write<std::uint16_t>(nested, startPc);
                write<std::uint16_t>(nested, line);
            }
            nestedCount++;
        }

        std::vector<char> codeAttribute;
        write<std::uint16_t>(codeAttribute, 4); // max_stack
        write<std::uint16_t>(codeAttribute, 4); // max_locals
        write<std::uint32_t>(codeAttribute, code.size());
        codeAttribute.insert(codeAttribute.end(), code.begin(), code.end());
        write<std::uint16_t>(codeAttribute, 0); // exception_table_length
        write<std::uint16_t>(codeAttribute, nestedCount);
        codeAttribute.insert(codeAttribute.end(), nested.begin(), nested.end());

        write<std::uint16_t>(m_methods, static_cast<std::uint16_t>(accessFlags));
        write<std::uint16_t>(m_methods, nameIndex);
        write<std::uint16_t>(m_methods, descriptorIndex);
        write<std::uint16_t>(m_methods, 1);
        write<std::uint16_t>(m_methods, codeName);
        write<std::uint32_t>(m_methods, codeAttribute.size());
        m_methods.insert(m_methods.end(), codeAttribute.begin(), codeAttribute.end());
        m_methodCount++;
    }

    /// Adds a method without any attributes, e.g. an abstract or native method.
    void addMethodWithoutCode(llvm::StringRef name, llvm::StringRef descriptor, AccessFlag accessFlags)
    {
        std::uint16_t nameIndex = addUtf8(name);
        std::uint16_t descriptorIndex = addUtf8(descriptor);
        write<std::uint16_t>(m_methods, static_cast<std::uint16_t>(accessFlags));
        write<std::uint16_t>(m_methods, nameIndex);
        write<std::uint16_t>(m_methods, descriptorIndex);
        write<std::uint16_t>(m_methods, 0);
        m_methodCount++;
    }

    /// Returns the bytes of the complete class file.
    std::vector<char> build() const
    {
        std::vector<char> result;
        write<std::uint32_t>(result, ClassFileMagic);
        write<std::uint16_t>(result, 0);  // minor
        write<std::uint16_t>(result, 61); // major
        write<std::uint16_t>(result, m_poolCount);
        result.insert(result.end(), m_pool.begin(), m_pool.end());
        write<std::uint16_t>(result, static_cast<std::uint16_t>(AccessFlag::Public | AccessFlag::Super));
        write<std::uint16_t>(result, m_thisClass);
        write<std::uint16_t>(result, m_superClass);
        write<std::uint16_t>(result, 0); // interfaces
        write<std::uint16_t>(result, 0); // fields
        write<std::uint16_t>(result, m_methodCount);
        result.insert(result.end(), m_methods.begin(), m_methods.end());
        write<std::uint16_t>(result, 0); // attributes
        return result;
    }
};

} // namespace jmf::test
