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

#include <jmf/class/ClassFile.hpp>

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "ProgressLog.hpp"

namespace jmf
{

/// Method whose call sites are searched for.
struct TargetMethod
{
    /// Name of the class declaring the method in dotted form, e.g. 'java.lang.String'.
    std::string className;
    /// Name of the method. All overloads of the name match.
    std::string methodName;
};

/// A call site of the target method.
struct MethodCall
{
    /// Dotted name of the class containing the call.
    std::string className;
    /// Name of the method containing the call.
    std::string methodName;
    /// Source line of the call or an empty optional if the method has no line number information for it.
    std::optional<std::uint16_t> lineNumber;

    bool operator==(const MethodCall&) const = default;

    // Calls without line numbers sort before calls with line numbers.
    std::strong_ordering operator<=>(const MethodCall&) const = default;
};

/// Calls and non-fatal problems found in one class file.
struct ClassScanResult
{
    std::vector<MethodCall> calls;
    /// One message per method whose scan had to be aborted.
    std::vector<std::string> warnings;
};

/// Finds the invoke instructions calling a 'TargetMethod' within class files.
///
/// The target is matched purely by the class and method name of the 'Methodref' or 'InterfaceMethodref' operand of
/// 'invokevirtual', 'invokespecial', 'invokestatic' and 'invokeinterface'. Descriptors and the class hierarchy are
/// not taken into account.
class InvocationScanner
{
    TargetMethod m_target;
    bool m_includeSelfCalls;
    ProgressLog* m_log;

    void note(const llvm::Twine& message) const;

public:
    /// Creates a scanner for calls of 'target'. Unless 'includeSelfCalls' is true, calls made from within the target
    /// class itself are not reported. Visited classes, methods and found calls are reported to 'log' if non-null.
    explicit InvocationScanner(TargetMethod target, bool includeSelfCalls = false, ProgressLog* log = nullptr)
        : m_target(std::move(target)), m_includeSelfCalls(includeSelfCalls), m_log(log)
    {
    }

    const TargetMethod& getTarget() const
    {
        return m_target;
    }

    /// Scans every method of 'classFile'. Problems with single methods are returned as warnings in the result.
    /// Fails only if the name of the class itself cannot be resolved.
    llvm::Expected<ClassScanResult> scanClass(const ClassFile& classFile) const;

    /// Scans the bytecode of 'method' and appends every call of the target to 'calls'. 'callerClass' is the dotted
    /// name of 'classFile'.
    /// Calls whose operand cannot be resolved are skipped. Returns an error if the bytecode or the attributes of the
    /// method are malformed. Calls found before the malformed instruction are kept in 'calls'.
    llvm::Error scanMethod(const ClassFile& classFile, llvm::StringRef callerClass, const MethodInfo& method,
                           std::vector<MethodCall>& calls) const;
};

} // namespace jmf
