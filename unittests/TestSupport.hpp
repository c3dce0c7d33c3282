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

#include <llvm/Support/Error.h>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <utility>

namespace jmf::test
{

/// Returns the value of 'expected'. Fails the current test with the error message otherwise.
template <class T>
T requireValue(llvm::Expected<T> expected)
{
    if (!expected)
    {
        FAIL(llvm::toString(expected.takeError()));
    }
    return std::move(*expected);
}

/// Fails the current test with the error message if 'error' is a failure.
inline void requireSuccess(llvm::Error error)
{
    if (error)
    {
        FAIL(llvm::toString(std::move(error)));
    }
}

/// Requires 'error' to be an 'ErrorT' and calls 'check' with it.
template <class ErrorT, class F>
void requireErrorOf(llvm::Error error, F&& check)
{
    if (!error.isA<ErrorT>())
    {
        FAIL("unexpected error: " << (error ? llvm::toString(std::move(error)) : std::string("success")));
    }
    llvm::handleAllErrors(std::move(error), [&](const ErrorT& errorInfo) { check(errorInfo); });
}

/// Requires 'expected' to contain an 'ErrorT' and calls 'check' with it.
template <class ErrorT, class T, class F>
void requireErrorOf(llvm::Expected<T> expected, F&& check)
{
    REQUIRE_FALSE(static_cast<bool>(expected));
    requireErrorOf<ErrorT>(expected.takeError(), std::forward<F>(check));
}

/// Returns the message of 'error'.
inline std::string errorMessage(llvm::Error error)
{
    return llvm::toString(std::move(error));
}

} // namespace jmf::test
