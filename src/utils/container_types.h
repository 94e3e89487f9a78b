#pragma once
// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <string>
#include <vector>
#include <map>

using v_strings = std::vector<std::string>;
using m_strings = std::map<std::string, std::string>;
