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

#include "InvocationScanner.hpp"

#include <llvm/Support/Debug.h>
#include <llvm/Support/FormatVariadic.h>

#include <jmf/class/ByteCodeIterator.hpp>
#include <jmf/class/References.hpp>

#define DEBUG_TYPE "jmf-scanner"

void jmf::InvocationScanner::note(const llvm::Twine& message) const
{
    if (m_log)
    {
        m_log->note(message);
    }
}

llvm::Expected<jmf::ClassScanResult> jmf::InvocationScanner::scanClass(const ClassFile& classFile) const
{
    llvm::Expected<llvm::StringRef> thisClass = classFile.getThisClass();
    if (!thisClass)
    {
        return thisClass.takeError();
    }
    std::string callerClass = toDottedName(*thisClass);
    note("Visiting class: " + callerClass);

    ClassScanResult result;
    if (!m_includeSelfCalls && callerClass == m_target.className)
    {
        LLVM_DEBUG({ llvm::dbgs() << "Skipping target class " << callerClass << '\n'; });
        return result;
    }

    for (const MethodInfo& method : classFile.getMethods())
    {
        if (llvm::Error error = scanMethod(classFile, callerClass, method, result.calls))
        {
            llvm::Expected<llvm::StringRef> name = method.getName(classFile);
            std::string methodName = name ? name->str() : "<unknown>";
            if (!name)
            {
                llvm::consumeError(name.takeError());
            }
            result.warnings.push_back(
                llvm::formatv("{0}#{1}: {2}", callerClass, methodName, llvm::toString(std::move(error))).str());
        }
    }
    return result;
}

llvm::Error jmf::InvocationScanner::scanMethod(const ClassFile& classFile, llvm::StringRef callerClass,
                                               const MethodInfo& method, std::vector<MethodCall>& calls) const
{
    llvm::Expected<llvm::StringRef> methodName = method.getName(classFile);
    if (!methodName)
    {
        return methodName.takeError();
    }

    llvm::Expected<const Code*> code = method.getCode(classFile);
    if (!code)
    {
        return code.takeError();
    }
    if (!*code)
    {
        if (method.isAbstract() || method.isNative())
        {
            return llvm::Error::success();
        }
        return llvm::createStringError(std::errc::invalid_argument, "method has no Code attribute");
    }

    const ConstantPool& pool = classFile.getConstantPool();
    llvm::Expected<const LineNumberTable*> lineNumberTable =
        (*code)->getAttributes().find<LineNumberTable>(pool);
    if (!lineNumberTable)
    {
        return lineNumberTable.takeError();
    }

    note("Visiting method: " + callerClass + "#" + *methodName);

    llvm::Error err = llvm::Error::success();
    for (const ByteCodeOp& op : byteCodeRange((*code)->getCode(), err))
    {
        if (!isMethodInvocation(op.opCode))
        {
            continue;
        }

        llvm::Expected<SymbolicMethodRef> ref = resolveMethodRef(pool, op.getPoolIndex());
        if (!ref)
        {
            // Unresolvable operands are expected in hand-crafted or obfuscated class files and are never reported.
            llvm::Error error = ref.takeError();
            LLVM_DEBUG({ llvm::dbgs() << "Skipping " << getOpCodeName(op.opCode) << " at " << op.offset << ": " << error
                                      << '\n'; });
            llvm::consumeError(std::move(error));
            continue;
        }

        if (ref->methodName != m_target.methodName || ref->className != m_target.className)
        {
            continue;
        }

        std::optional<std::uint16_t> line;
        if (*lineNumberTable)
        {
            line = (*lineNumberTable)->lookup(op.offset);
        }
        calls.push_back({callerClass.str(), methodName->str(), line});
        note("Found method call: " + callerClass + "#" + *methodName);
        LLVM_DEBUG({
            llvm::dbgs() << "Found call of " << ref->className << '#' << ref->methodName << ref->descriptor << " in "
                         << callerClass << '#' << *methodName << " at offset " << op.offset << '\n';
        });
    }
    return err;
}
