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

#include <llvm/ADT/STLExtras.h>

#include <type_traits>
#include <utility>

#include <swl/variant.hpp>

namespace jmf
{

namespace detail
{
template <class... Ts>
struct Overload : Ts...
{
    using Ts::operator()...;
};
template <class... Ts>
Overload(Ts...) -> Overload<Ts...>;

} // namespace detail

/// Convenience function for matching on the contained types of a variant.
/// 'matchers' must be a list of lambdas or other callable classes which together accept every alternative of the
/// variant. Use a '[](const auto&){}' lambda as a catch-all.
template <typename Variant, typename... Matchers>
constexpr decltype(auto) match(Variant&& variant, Matchers&&... matchers)
{
    return swl::visit(detail::Overload{std::forward<Matchers>(matchers)...}, std::forward<Variant>(variant));
}

/// Returns true if 'variant' currently holds any of the alternatives 'Ts'.
template <class... Ts, typename Variant>
constexpr bool holdsAnyOf(const Variant& variant)
{
    return swl::visit([](const auto& alt)
                      { return llvm::is_one_of<std::decay_t<decltype(alt)>, Ts...>::value; },
                      variant);
}

} // namespace jmf
