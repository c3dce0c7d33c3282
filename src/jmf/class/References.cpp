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

#include "References.hpp"

#include <algorithm>

llvm::Expected<jmf::SymbolicMethodRef> jmf::resolveMethodRef(const ConstantPool& pool, std::uint16_t index)
{
    llvm::Expected<PoolIndex<MethodRefInfo, InterfaceMethodRefInfo>::Result> ref =
        PoolIndex<MethodRefInfo, InterfaceMethodRefInfo>(index).resolve(pool);
    if (!ref)
    {
        return ref.takeError();
    }
    // Both kinds share the same layout.
    const RefInfo* refInfo = match(*ref, [](const auto* info) -> const RefInfo* { return info; });

    llvm::Expected<llvm::StringRef> className = pool.getClassName(refInfo->classIndex);
    if (!className)
    {
        return className.takeError();
    }

    llvm::Expected<const NameAndTypeInfo*> nameAndType = refInfo->nameAndTypeIndex.resolve(pool);
    if (!nameAndType)
    {
        return nameAndType.takeError();
    }

    llvm::Expected<llvm::StringRef> methodName = pool.getUtf8((*nameAndType)->nameIndex);
    if (!methodName)
    {
        return methodName.takeError();
    }

    llvm::Expected<llvm::StringRef> descriptor = pool.getUtf8((*nameAndType)->descriptorIndex);
    if (!descriptor)
    {
        return descriptor.takeError();
    }

    return SymbolicMethodRef{toDottedName(*className), *methodName, *descriptor};
}

std::string jmf::toDottedName(llvm::StringRef internalName)
{
    std::string result = internalName.str();
    std::replace(result.begin(), result.end(), '/', '.');
    return result;
}

std::string jmf::toInternalName(llvm::StringRef dottedName)
{
    std::string result = dottedName.str();
    std::replace(result.begin(), result.end(), '.', '/');
    return result;
}
