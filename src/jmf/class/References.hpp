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

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

#include <string>

#include "ConstantPool.hpp"

namespace jmf
{

/// Symbolic form of a 'Methodref' or 'InterfaceMethodref' constant.
struct SymbolicMethodRef
{
    /// Name of the class declaring the method in dotted form, e.g. 'java.lang.String'.
    std::string className;
    /// Name of the method, e.g. 'toString' or '<init>'.
    llvm::StringRef methodName;
    /// Method descriptor, e.g. '()Ljava/lang/String;'.
    llvm::StringRef descriptor;
};

/// Resolves the 'Methodref' or 'InterfaceMethodref' entry at 'index' of 'pool' by following its class and
/// name-and-type entries down to their 'Utf8' strings.
/// Fails with a 'ResolutionError' if any entry in the chain is missing, out of range or of the wrong kind.
llvm::Expected<SymbolicMethodRef> resolveMethodRef(const ConstantPool& pool, std::uint16_t index);

/// Converts an internal class name such as 'com/example/Foo' to its dotted form 'com.example.Foo'.
std::string toDottedName(llvm::StringRef internalName);

/// Converts a dotted class name such as 'com.example.Foo' to its internal form 'com/example/Foo'.
std::string toInternalName(llvm::StringRef dottedName);

} // namespace jmf
