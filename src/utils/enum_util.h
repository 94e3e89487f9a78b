#pragma once
// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <type_traits>

// converts enum class value to its underlying type (used to index the name tables)
template<typename _EnumClass>
constexpr auto to_integral_type(const _EnumClass e) noexcept
{
    return static_cast<std::underlying_type_t<_EnumClass>>(e);
}
