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

#include "Report.hpp"

#include <llvm/Support/JSON.h>
#include <llvm/Support/WithColor.h>

namespace
{
// 'llvm::json' requires valid UTF-8. Names decoded leniently from broken class files might not be.
std::string toJsonString(llvm::StringRef text)
{
    return llvm::json::isUTF8(text) ? text.str() : llvm::json::fixUTF8(text);
}
} // namespace

std::string jmf::formatTarget(const TargetMethod& target)
{
    return target.className + "#" + target.methodName;
}

std::string jmf::formatCall(const MethodCall& call)
{
    std::string result = call.className + "#" + call.methodName;
    if (call.lineNumber)
    {
        result += " (L" + std::to_string(*call.lineNumber) + ")";
    }
    return result;
}

void jmf::writeTextReport(llvm::raw_ostream& os, const TargetMethod& target, llvm::ArrayRef<MethodCall> calls)
{
    os << formatTarget(target) << '\n';
    if (calls.empty())
    {
        os << "No results\n";
        return;
    }
    for (const MethodCall& call : calls)
    {
        os << " - " << formatCall(call) << '\n';
    }
}

void jmf::writeJsonReport(llvm::raw_ostream& os, const TargetMethod& target, llvm::ArrayRef<MethodCall> calls)
{
    llvm::json::OStream json(os, /*IndentSize=*/2);
    json.object(
        [&]
        {
            json.attribute("target", toJsonString(formatTarget(target)));
            json.attributeArray("calls",
                                [&]
                                {
                                    for (const MethodCall& call : calls)
                                    {
                                        json.object(
                                            [&]
                                            {
                                                json.attribute("class_name", toJsonString(call.className));
                                                json.attribute("method_name", toJsonString(call.methodName));
                                                if (call.lineNumber)
                                                {
                                                    json.attribute("line_number",
                                                                   static_cast<std::int64_t>(*call.lineNumber));
                                                }
                                                else
                                                {
                                                    json.attribute("line_number", nullptr);
                                                }
                                            });
                                    }
                                });
        });
    os << '\n';
}

void jmf::writeReport(llvm::raw_ostream& os, OutputFormat format, const TargetMethod& target,
                      llvm::ArrayRef<MethodCall> calls)
{
    switch (format)
    {
        case OutputFormat::Text: writeTextReport(os, target, calls); break;
        case OutputFormat::Json: writeJsonReport(os, target, calls); break;
    }
}

void jmf::writeWarnings(llvm::raw_ostream& os, llvm::ArrayRef<ScanWarning> warnings)
{
    for (const ScanWarning& warning : warnings)
    {
        llvm::WithColor::warning(os) << warning.path << ": " << warning.message << '\n';
    }
}
