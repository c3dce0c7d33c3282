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

#include "TreeScanner.hpp"

#include <llvm/ADT/STLExtras.h>
#include <llvm/Support/Allocator.h>
#include <llvm/Support/Debug.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/Path.h>
#include <llvm/Support/StringSaver.h>
#include <llvm/Support/ThreadPool.h>
#include <llvm/Support/Threading.h>

#include <jmf/support/Error.hpp>

#include <algorithm>
#include <iterator>
#include <mutex>

#include "ProgressLog.hpp"

#define DEBUG_TYPE "jmf-scanner"

namespace
{
using namespace jmf;

llvm::sys::fs::file_type getEntryType(const llvm::sys::fs::directory_entry& entry)
{
    // Some file systems do not report the type while listing a directory.
    if (entry.type() != llvm::sys::fs::file_type::type_unknown)
    {
        return entry.type();
    }
    llvm::ErrorOr<llvm::sys::fs::basic_file_status> status = entry.status();
    if (!status)
    {
        return llvm::sys::fs::file_type::type_unknown;
    }
    return status->type();
}

llvm::Error validateInput(llvm::StringRef root, const TargetMethod& target)
{
    if (target.className.empty())
    {
        return llvm::make_error<InputError>("target class name must not be empty");
    }
    if (target.methodName.empty())
    {
        return llvm::make_error<InputError>("target method name must not be empty");
    }
    if (!llvm::sys::fs::exists(root))
    {
        return llvm::make_error<InputError>(("scan folder does not exist: " + root).str());
    }
    if (!llvm::sys::fs::is_directory(root))
    {
        return llvm::make_error<InputError>(("scan path is not a directory: " + root).str());
    }
    return llvm::Error::success();
}

} // namespace

llvm::Expected<jmf::ClassScanResult> jmf::scanClassBytes(llvm::ArrayRef<char> bytes, const InvocationScanner& scanner)
{
    llvm::BumpPtrAllocator allocator;
    llvm::StringSaver stringSaver(allocator);
    llvm::Expected<ClassFile> classFile = ClassFile::parseFromFile(bytes, stringSaver);
    if (!classFile)
    {
        return classFile.takeError();
    }
    // All strings in the result are copies. Nothing refers to the allocator once we return.
    return scanner.scanClass(*classFile);
}

std::vector<std::string> jmf::discoverClassFiles(llvm::StringRef root, std::vector<ScanWarning>& warnings)
{
    std::vector<std::string> result;
    std::vector<std::string> pending{root.str()};
    while (!pending.empty())
    {
        std::string directory = std::move(pending.back());
        pending.pop_back();

        std::error_code ec;
        for (llvm::sys::fs::directory_iterator iter(directory, ec, /*follow_symlinks=*/false), end;
             iter != end && !ec; iter = iter.increment(ec))
        {
            switch (getEntryType(*iter))
            {
                case llvm::sys::fs::file_type::directory_file: pending.push_back(iter->path()); break;
                case llvm::sys::fs::file_type::regular_file:
                    if (llvm::sys::path::extension(iter->path()) == ".class")
                    {
                        result.push_back(iter->path());
                    }
                    break;
                default: break;
            }
        }
        if (ec)
        {
            // Siblings of an unreadable directory are still scanned.
            warnings.push_back({directory, "cannot read directory: " + ec.message()});
        }
    }
    return result;
}

llvm::Expected<jmf::ScanResult> jmf::scan(llvm::StringRef root, const TargetMethod& target,
                                          const ScanOptions& options)
{
    if (llvm::Error error = validateInput(root, target))
    {
        return error;
    }

    ProgressLog log(options.log);
    log.note("Start scanning folder: " + root);

    ScanResult result;
    std::vector<std::string> classFiles = discoverClassFiles(root, result.warnings);
    LLVM_DEBUG({ llvm::dbgs() << "Discovered " << classFiles.size() << " class files below " << root << '\n'; });

    InvocationScanner scanner(target, options.includeSelfCalls, &log);
    std::mutex resultMutex;
    {
        llvm::ThreadPool threadPool(llvm::hardware_concurrency(options.threads));
        for (const std::string& path : classFiles)
        {
            threadPool.async(
                [&, path = llvm::StringRef(path)]
                {
                    log.note("Analyzing class file: " + path);

                    ClassScanResult fileResult;
                    std::vector<ScanWarning> fileWarnings;
                    llvm::ErrorOr<std::unique_ptr<llvm::MemoryBuffer>> buffer =
                        llvm::MemoryBuffer::getFile(path, /*IsText=*/false, /*RequiresNullTerminator=*/false);
                    if (!buffer)
                    {
                        fileWarnings.push_back({path.str(), "failed to read class file: " + buffer.getError().message()});
                    }
                    else if (llvm::Expected<ClassScanResult> scanned = scanClassBytes(
                                 llvm::ArrayRef<char>((*buffer)->getBufferStart(), (*buffer)->getBufferSize()), scanner))
                    {
                        fileResult = std::move(*scanned);
                        for (std::string& message : fileResult.warnings)
                        {
                            fileWarnings.push_back({path.str(), std::move(message)});
                        }
                    }
                    else
                    {
                        fileWarnings.push_back(
                            {path.str(), "failed to parse class file: " + llvm::toString(scanned.takeError())});
                    }

                    std::lock_guard lock{resultMutex};
                    std::move(fileResult.calls.begin(), fileResult.calls.end(), std::back_inserter(result.calls));
                    std::move(fileWarnings.begin(), fileWarnings.end(), std::back_inserter(result.warnings));
                });
        }
        threadPool.wait();
    }

    llvm::sort(result.calls);
    llvm::sort(result.warnings);
    return result;
}
