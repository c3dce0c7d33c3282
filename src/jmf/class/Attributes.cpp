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

#include "Attributes.hpp"

#include <llvm/Support/Debug.h>

#define DEBUG_TYPE "jmf-class"

llvm::Expected<jmf::AttributeMap> jmf::AttributeMap::parse(ByteReader& reader, const ConstantPool& pool)
{
    AttributeMap result;
    auto attributeCount = reader.consume<std::uint16_t>();
    for (std::size_t i = 0; i < attributeCount && !reader.hasError(); i++)
    {
        auto nameIndex = reader.consume<std::uint16_t>();
        auto length = reader.consume<std::uint32_t>();
        llvm::ArrayRef<char> bytes = reader.consumeBytes(length);
        if (reader.hasError())
        {
            break;
        }

        llvm::StringRef name;
        if (llvm::Expected<llvm::StringRef> resolved = pool.getUtf8(nameIndex))
        {
            name = *resolved;
        }
        else
        {
            // Kept as anonymous attribute. Only interpreted attributes ever need their name.
            llvm::Error error = resolved.takeError();
            LLVM_DEBUG({ llvm::dbgs() << "Unnamed attribute: " << error << '\n'; });
            llvm::consumeError(std::move(error));
        }
        result.insert(name, bytes);
    }
    if (llvm::Error error = reader.takeError())
    {
        return error;
    }
    return result;
}

llvm::Expected<jmf::LineNumberTable> jmf::LineNumberTable::parse(llvm::ArrayRef<char> bytes, const ConstantPool&)
{
    ByteReader reader(bytes);
    std::vector<Entry> entries(reader.consume<std::uint16_t>());
    for (Entry& iter : entries)
    {
        auto startPc = reader.consume<std::uint16_t>();
        iter = {startPc, reader.consume<std::uint16_t>()};
    }
    if (llvm::Error error = reader.takeError())
    {
        return error;
    }
    return LineNumberTable(std::move(entries));
}

std::optional<std::uint16_t> jmf::LineNumberTable::lookup(std::size_t offset) const
{
    // Linear scan instead of a binary search as the table is not guaranteed to be sorted.
    const Entry* best = nullptr;
    for (const Entry& entry : m_entries)
    {
        if (entry.startPc <= offset && (!best || entry.startPc >= best->startPc))
        {
            best = &entry;
        }
    }
    if (!best)
    {
        return std::nullopt;
    }
    return best->lineNumber;
}

llvm::Expected<jmf::Code> jmf::Code::parse(llvm::ArrayRef<char> bytes, const ConstantPool& pool)
{
    Code result;
    ByteReader reader(bytes);
    result.m_maxStack = reader.consume<std::uint16_t>();
    result.m_maxLocals = reader.consume<std::uint16_t>();
    auto codeCount = reader.consume<std::uint32_t>();
    result.m_code = reader.consumeBytes(codeCount);
    auto exceptionTableCount = reader.consume<std::uint16_t>();
    result.m_exceptionTable.resize(exceptionTableCount);
    for (auto& iter : result.m_exceptionTable)
    {
        auto startPc = reader.consume<std::uint16_t>();
        auto endPc = reader.consume<std::uint16_t>();
        auto handlerPc = reader.consume<std::uint16_t>();
        iter = {startPc, endPc, handlerPc, reader.consume<std::uint16_t>()};
    }
    if (llvm::Error error = reader.takeError())
    {
        return error;
    }

    llvm::Expected<AttributeMap> attributes = AttributeMap::parse(reader, pool);
    if (!attributes)
    {
        return attributes.takeError();
    }
    result.m_attributes = std::move(*attributes);
    return result;
}
