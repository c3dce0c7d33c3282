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
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/raw_ostream.h>

#include <string>
#include <vector>

#include "InvocationScanner.hpp"

namespace jmf
{

/// Problem that caused a file, or a method within it, to be skipped.
struct ScanWarning
{
    /// Path of the class file or directory the problem occurred in.
    std::string path;
    std::string message;

    bool operator==(const ScanWarning&) const = default;
    auto operator<=>(const ScanWarning&) const = default;
};

/// Options of a tree scan.
struct ScanOptions
{
    /// Amount of worker threads. 0 uses one thread per hardware thread.
    unsigned threads = 0;
    /// Report calls made from within the target class itself.
    bool includeSelfCalls = false;
    /// Stream receiving progress messages. No messages are written if null.
    llvm::raw_ostream* log = nullptr;
};

/// Aggregated result of a tree scan.
struct ScanResult
{
    /// Calls sorted by class name, method name and line number.
    std::vector<MethodCall> calls;
    /// Warnings sorted by path, then by message.
    std::vector<ScanWarning> warnings;
};

/// Scans every '.class' file below 'root' for calls of 'target'.
///
/// Files are parsed and scanned in parallel. Files that cannot be read or parsed, and methods that cannot be scanned,
/// are skipped and reported as warnings. Fails with an 'InputError' before looking at any file if 'target' has an
/// empty class or method name or if 'root' is not an existing directory.
llvm::Expected<ScanResult> scan(llvm::StringRef root, const TargetMethod& target, const ScanOptions& options = {});

/// Parses the class file contained in 'bytes' and scans it with 'scanner'.
/// Fails if the class file is malformed.
llvm::Expected<ClassScanResult> scanClassBytes(llvm::ArrayRef<char> bytes, const InvocationScanner& scanner);

/// Returns the paths of all regular files with a '.class' extension below 'root' in unspecified order. Symbolic links
/// are not followed. Every directory that cannot be read adds one warning naming it to 'warnings' and the traversal
/// continues with the remaining directories.
std::vector<std::string> discoverClassFiles(llvm::StringRef root, std::vector<ScanWarning>& warnings);

} // namespace jmf
