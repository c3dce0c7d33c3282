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

#include "CommandLine.hpp"

#include <llvm/Support/CommandLine.h>

namespace
{
llvm::cl::OptionCategory jmfCategory("jmf options");

llvm::cl::opt<std::string> targetClass("class", llvm::cl::desc("Fully qualified name of the target class"),
                                       llvm::cl::value_desc("class"), llvm::cl::Required,
                                       llvm::cl::cat(jmfCategory));
llvm::cl::alias targetClassShort("c", llvm::cl::desc("Alias for --class"), llvm::cl::aliasopt(targetClass),
                                 llvm::cl::NotHidden);

llvm::cl::opt<std::string> targetMethod("method", llvm::cl::desc("Name of the target method"),
                                        llvm::cl::value_desc("method"), llvm::cl::Required,
                                        llvm::cl::cat(jmfCategory));
llvm::cl::alias targetMethodShort("m", llvm::cl::desc("Alias for --method"), llvm::cl::aliasopt(targetMethod),
                                  llvm::cl::NotHidden);

llvm::cl::opt<std::string> scanFolder("scan", llvm::cl::desc("Directory containing the class files to scan"),
                                      llvm::cl::value_desc("dir"), llvm::cl::init("./target/classes"),
                                      llvm::cl::cat(jmfCategory));
llvm::cl::alias scanFolderShort("s", llvm::cl::desc("Alias for --scan"), llvm::cl::aliasopt(scanFolder),
                                llvm::cl::NotHidden);

llvm::cl::opt<jmf::OutputFormat>
    format("format", llvm::cl::desc("Output format"), llvm::cl::init(jmf::OutputFormat::Text),
           llvm::cl::values(clEnumValN(jmf::OutputFormat::Text, "txt", "Human readable list of calls"),
                            clEnumValN(jmf::OutputFormat::Json, "json", "JSON object")),
           llvm::cl::cat(jmfCategory));
llvm::cl::alias formatShort("f", llvm::cl::desc("Alias for --format"), llvm::cl::aliasopt(format),
                            llvm::cl::NotHidden);

llvm::cl::opt<bool> verbose("verbose", llvm::cl::desc("Print progress messages to stderr"),
                            llvm::cl::cat(jmfCategory));
llvm::cl::alias verboseShort("v", llvm::cl::desc("Alias for --verbose"), llvm::cl::aliasopt(verbose),
                             llvm::cl::NotHidden);

llvm::cl::opt<unsigned> threads("threads", llvm::cl::desc("Amount of worker threads, 0 for one per core"),
                                llvm::cl::init(0), llvm::cl::cat(jmfCategory));
llvm::cl::alias threadsShort("j", llvm::cl::desc("Alias for --threads"), llvm::cl::aliasopt(threads),
                             llvm::cl::NotHidden);

llvm::cl::opt<bool> includeSelfCalls("include-self-calls",
                                     llvm::cl::desc("Also report calls made from within the target class"),
                                     llvm::cl::cat(jmfCategory));

} // namespace

std::optional<jmf::CommandLineOptions> jmf::parseCommandLine(llvm::ArrayRef<char*> args, llvm::raw_ostream& errs)
{
    llvm::cl::HideUnrelatedOptions(jmfCategory);
    if (!llvm::cl::ParseCommandLineOptions(static_cast<int>(args.size()), args.data(),
                                           "jmf - Java Method Finder\n\n"
                                           "  Lists every call of a method within a directory of class files.\n",
                                           &errs))
    {
        return std::nullopt;
    }

    return CommandLineOptions{
        .target = {.className = targetClass, .methodName = targetMethod},
        .scanFolder = scanFolder,
        .format = format,
        .verbose = verbose,
        .threads = threads,
        .includeSelfCalls = includeSelfCalls,
    };
}
