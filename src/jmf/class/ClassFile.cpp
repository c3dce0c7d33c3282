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

#include "ClassFile.hpp"

#include <llvm/ADT/STLExtras.h>
#include <llvm/Support/Debug.h>
#include <llvm/Support/FormatVariadic.h>

#include <algorithm>

#define DEBUG_TYPE "jmf-class"

using namespace jmf;

namespace
{

template <class T>
concept FieldOrMethodInfo = llvm::is_one_of<T, FieldInfo, MethodInfo>::value;

template <FieldOrMethodInfo T>
llvm::Expected<std::vector<T>> parseFieldOrMethodInfos(ByteReader& reader, const ConstantPool& pool)
{
    std::vector<T> result(reader.consume<std::uint16_t>());
    for (T& iter : result)
    {
        auto accessFlags = reader.consume<AccessFlag>();
        auto nameIndex = reader.consume<std::uint16_t>();
        auto descriptorIndex = reader.consume<std::uint16_t>();
        llvm::Expected<AttributeMap> attributes = AttributeMap::parse(reader, pool);
        if (!attributes)
        {
            return attributes.takeError();
        }
        iter = T(accessFlags, nameIndex, descriptorIndex, std::move(*attributes));
    }
    if (llvm::Error error = reader.takeError())
    {
        return error;
    }
    return result;
}

} // namespace

llvm::Expected<jmf::ClassFile> jmf::ClassFile::parseFromFile(llvm::ArrayRef<char> bytes,
                                                             llvm::StringSaver& stringSaver)
{
    jmf::ClassFile result;
    ByteReader reader(bytes);

    auto magic = reader.consume<std::uint32_t>();
    if (reader.hasError())
    {
        return reader.takeError();
    }
    if (magic != ClassFileMagic)
    {
        return llvm::make_error<ClassFileError>(ClassFileError::InvalidMagic,
                                                llvm::formatv("found {0:x8}", magic).str());
    }
    result.m_minorVersion = reader.consume<std::uint16_t>();
    result.m_majorVersion = reader.consume<std::uint16_t>();

    llvm::Expected<ConstantPool> constantPool = ConstantPool::parse(reader, stringSaver);
    if (!constantPool)
    {
        return constantPool.takeError();
    }
    result.m_constantPool = std::move(*constantPool);

    result.m_accessFlags = reader.consume<AccessFlag>();
    result.m_thisClass = reader.consume<std::uint16_t>();
    result.m_superClass = reader.consume<std::uint16_t>();

    result.m_interfaces.resize(reader.consume<std::uint16_t>());
    std::generate(result.m_interfaces.begin(), result.m_interfaces.end(),
                  [&] { return PoolIndex<ClassInfo>(reader.consume<std::uint16_t>()); });
    if (llvm::Error error = reader.takeError())
    {
        return error;
    }

    llvm::Expected<std::vector<FieldInfo>> fields = parseFieldOrMethodInfos<FieldInfo>(reader, result.m_constantPool);
    if (!fields)
    {
        return fields.takeError();
    }
    result.m_fields = std::move(*fields);

    llvm::Expected<std::vector<MethodInfo>> methods =
        parseFieldOrMethodInfos<MethodInfo>(reader, result.m_constantPool);
    if (!methods)
    {
        return methods.takeError();
    }
    result.m_methods = std::move(*methods);

    llvm::Expected<AttributeMap> attributes = AttributeMap::parse(reader, result.m_constantPool);
    if (!attributes)
    {
        return attributes.takeError();
    }
    result.m_attributes = std::move(*attributes);

    LLVM_DEBUG({
        llvm::dbgs() << "Parsed class file version " << result.m_majorVersion << '.' << result.m_minorVersion << " with "
                     << result.m_methods.size() << " methods and " << reader.remaining() << " trailing bytes\n";
    });

    return result;
}

llvm::Expected<llvm::StringRef> jmf::ClassFile::getThisClass() const
{
    return m_constantPool.getClassName(m_thisClass);
}

llvm::Expected<std::optional<llvm::StringRef>> jmf::ClassFile::getSuperClass() const
{
    if (!m_superClass)
    {
        return std::nullopt;
    }
    llvm::Expected<llvm::StringRef> name = m_constantPool.getClassName(m_superClass);
    if (!name)
    {
        return name.takeError();
    }
    return *name;
}

llvm::Expected<llvm::StringRef> FieldInfo::getName(const ClassFile& classFile) const
{
    return classFile.getConstantPool().getUtf8(m_nameIndex);
}

llvm::Expected<llvm::StringRef> FieldInfo::getDescriptor(const ClassFile& classFile) const
{
    return classFile.getConstantPool().getUtf8(m_descriptorIndex);
}

llvm::Expected<llvm::StringRef> MethodInfo::getName(const ClassFile& classFile) const
{
    return classFile.getConstantPool().getUtf8(m_nameIndex);
}

llvm::Expected<llvm::StringRef> MethodInfo::getDescriptor(const ClassFile& classFile) const
{
    return classFile.getConstantPool().getUtf8(m_descriptorIndex);
}

llvm::Expected<const Code*> MethodInfo::getCode(const ClassFile& classFile) const
{
    return m_attributes.find<Code>(classFile.getConstantPool());
}
