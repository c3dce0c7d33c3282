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
#include <llvm/ADT/BitmaskEnum.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/StringSaver.h>

#include <cstdint>
#include <optional>
#include <vector>

#include "Attributes.hpp"
#include "ConstantPool.hpp"

namespace jmf
{

/// Magic number every class file starts with.
constexpr std::uint32_t ClassFileMagic = 0xCAFEBABE;

/// Access flags of classes, fields and methods. Several values are shared between different meanings depending on
/// the entity they are attached to, e.g. 'Super' and 'Synchronized'.
enum class AccessFlag : std::uint16_t
{
    None = 0,
    Public = 0x0001,
    Private = 0x0002,
    Protected = 0x0004,
    Static = 0x0008,
    Final = 0x0010,
    Super = 0x0020,
    Bridge = 0x0040,
    Varargs = 0x0080,
    Native = 0x0100,
    Interface = 0x0200,
    Abstract = 0x0400,
    Strict = 0x0800,
    Synthetic = 0x1000,
    Annotation = 0x2000,
    Enum = 0x4000,
    Module = 0x8000,
    LLVM_MARK_AS_BITMASK_ENUM(Module)
};

LLVM_ENABLE_BITMASK_ENUMS_IN_NAMESPACE();

class ClassFile;

/// Info object of a field of the class represented by the class file.
class FieldInfo
{
    AccessFlag m_accessFlags{};
    PoolIndex<Utf8Info> m_nameIndex{};
    PoolIndex<Utf8Info> m_descriptorIndex{};
    AttributeMap m_attributes;

public:
    FieldInfo() = default;

    FieldInfo(AccessFlag accessFlags, PoolIndex<Utf8Info> nameIndex, PoolIndex<Utf8Info> descriptorIndex,
              AttributeMap&& attributes)
        : m_accessFlags(accessFlags),
          m_nameIndex(nameIndex),
          m_descriptorIndex(descriptorIndex),
          m_attributes(std::move(attributes))
    {
    }

    /// Returns the name of this field.
    llvm::Expected<llvm::StringRef> getName(const ClassFile& classFile) const;

    /// Returns the field descriptor of this field, indicating its type.
    llvm::Expected<llvm::StringRef> getDescriptor(const ClassFile& classFile) const;

    /// Returns the attributes of this field.
    const AttributeMap& getAttributes() const
    {
        return m_attributes;
    }

    /// Returns the access flags of this field.
    AccessFlag getAccessFlags() const
    {
        return m_accessFlags;
    }
};

/// Info object of a method of the class represented by the class file.
class MethodInfo
{
    AccessFlag m_accessFlags{};
    PoolIndex<Utf8Info> m_nameIndex{};
    PoolIndex<Utf8Info> m_descriptorIndex{};
    AttributeMap m_attributes;

public:
    MethodInfo() = default;

    MethodInfo(AccessFlag accessFlags, PoolIndex<Utf8Info> nameIndex, PoolIndex<Utf8Info> descriptorIndex,
               AttributeMap&& attributes)
        : m_accessFlags(accessFlags),
          m_nameIndex(nameIndex),
          m_descriptorIndex(descriptorIndex),
          m_attributes(std::move(attributes))
    {
    }

    /// Returns true if this method is native.
    bool isNative() const
    {
        return (m_accessFlags & AccessFlag::Native) != AccessFlag::None;
    }

    /// Returns true if this method is abstract.
    bool isAbstract() const
    {
        return (m_accessFlags & AccessFlag::Abstract) != AccessFlag::None;
    }

    /// Returns the name of this method.
    llvm::Expected<llvm::StringRef> getName(const ClassFile& classFile) const;

    /// Returns the method descriptor of this method, indicating its type.
    llvm::Expected<llvm::StringRef> getDescriptor(const ClassFile& classFile) const;

    /// Returns the 'Code' attribute of this method, a null pointer for methods without one or an error if the
    /// attribute is malformed.
    llvm::Expected<const Code*> getCode(const ClassFile& classFile) const;

    /// Returns the attributes of this method.
    const AttributeMap& getAttributes() const
    {
        return m_attributes;
    }

    /// Returns the access flags of this method.
    AccessFlag getAccessFlags() const
    {
        return m_accessFlags;
    }
};

/// Top level class representing a class file.
///
/// Indices into the constant pool, e.g. the names of methods and of this class, are not validated while parsing.
/// Accessors resolving them therefore return an 'llvm::Expected'.
class ClassFile
{
    std::uint16_t m_minorVersion{};
    std::uint16_t m_majorVersion{};
    ConstantPool m_constantPool;
    AccessFlag m_accessFlags{};
    PoolIndex<ClassInfo> m_thisClass;
    PoolIndex<ClassInfo> m_superClass;
    std::vector<PoolIndex<ClassInfo>> m_interfaces;
    std::vector<FieldInfo> m_fields;
    std::vector<MethodInfo> m_methods;
    AttributeMap m_attributes;

public:
    /// Parses a class file from 'bytes'. 'stringSaver' is used additionally to manage the lifetimes of any strings
    /// created during parsing. This is currently used for UTF-8 constant pool entries.
    /// Fails with a 'ClassFileError' if the magic is wrong or the file is truncated.
    /// Note: The returned class file contains references into the underlying array of 'bytes' and must not outlive
    /// its backing storage.
    static llvm::Expected<ClassFile> parseFromFile(llvm::ArrayRef<char> bytes, llvm::StringSaver& stringSaver);

    /// Returns the minor version of the class file format.
    std::uint16_t getMinorVersion() const
    {
        return m_minorVersion;
    }

    /// Returns the major version of the class file format, e.g. 61 for Java 17.
    std::uint16_t getMajorVersion() const
    {
        return m_majorVersion;
    }

    /// Returns the constant pool of the class file.
    const ConstantPool& getConstantPool() const
    {
        return m_constantPool;
    }

    /// Returns the access flags of the class.
    AccessFlag getAccessFlags() const
    {
        return m_accessFlags;
    }

    /// Returns the internal name of the class defined by this class file, e.g. 'java/lang/Object'.
    llvm::Expected<llvm::StringRef> getThisClass() const;

    /// Returns the internal name of the super class of this class. Note, this is an empty optional for
    /// java/lang/Object.
    llvm::Expected<std::optional<llvm::StringRef>> getSuperClass() const;

    /// Returns the pool indices of the interfaces implemented by this class.
    llvm::ArrayRef<PoolIndex<ClassInfo>> getInterfaces() const
    {
        return m_interfaces;
    }

    /// Returns the fields of this class.
    llvm::ArrayRef<FieldInfo> getFields() const
    {
        return m_fields;
    }

    /// Returns the methods of this class.
    llvm::ArrayRef<MethodInfo> getMethods() const
    {
        return m_methods;
    }

    /// Returns the attributes of this class.
    const AttributeMap& getAttributes() const
    {
        return m_attributes;
    }
};

} // namespace jmf
