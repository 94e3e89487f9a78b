#pragma once
// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <cstdint>

// 10000 basis points = 100%
constexpr uint32_t MAX_FEE_BPS = 10'000;
constexpr uint32_t DEFAULT_PLATFORM_FEE_BPS = 250;

// component kinds used for address derivation
constexpr auto COMPONENT_KIND_REGISTRY      = "registry";
constexpr auto COMPONENT_KIND_FACTORY       = "factory";
constexpr auto COMPONENT_KIND_ORGANIZATION  = "organization";
constexpr auto COMPONENT_KIND_SERIES        = "series";
constexpr auto COMPONENT_KIND_TOKEN         = "token";

// ticket series template
constexpr auto TICKET_SERIES_NAME           = "Eventix Ticket";
constexpr auto TICKET_SERIES_SYMBOL         = "ETIX";
constexpr uint16_t TICKET_SERIES_VERSION    = 1;

// log categories
constexpr auto LOG_CATEGORY_PLATFORM        = "platform";
constexpr auto LOG_CATEGORY_PAYMENT         = "payment";
constexpr auto LOG_CATEGORY_REPLAY          = "replay";
