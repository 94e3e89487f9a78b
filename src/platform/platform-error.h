#pragma once
// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>

#include <utils/enum_util.h>

/**
 * Platform error categories.
 */
enum class PlatformErrorType : uint8_t
{
    Authorization = 0, // wrong caller for a guarded operation
    Validation,        // zero address, non-positive price or supply, non-future deadline, fee out of range
    State,             // wrong lifecycle state: already closed, already initialized, not found, not active
    Payment,           // insufficient allowance, failed token transfer, zero balance on withdrawal

    COUNT
};

static constexpr std::array<const char*, to_integral_type<PlatformErrorType>(PlatformErrorType::COUNT)> PLATFORM_ERROR_NAMES =
    { "AuthorizationError", "ValidationError", "StateError", "PaymentError" };

std::string GetPlatformErrorName(const PlatformErrorType errorType) noexcept;

/**
 * Base class for all errors that abort a platform operation.
 */
class platform_error : public std::runtime_error
{
public:
    platform_error(const PlatformErrorType errorType, const std::string& sMessage) :
        std::runtime_error(sMessage),
        m_errorType(errorType)
    {}

    PlatformErrorType GetErrorType() const noexcept { return m_errorType; }
    std::string GetErrorName() const noexcept { return GetPlatformErrorName(m_errorType); }

protected:
    PlatformErrorType m_errorType;
};

class authorization_error : public platform_error
{
public:
    explicit authorization_error(const std::string& sMessage) :
        platform_error(PlatformErrorType::Authorization, sMessage)
    {}
};

class validation_error : public platform_error
{
public:
    explicit validation_error(const std::string& sMessage) :
        platform_error(PlatformErrorType::Validation, sMessage)
    {}
};

class state_error : public platform_error
{
public:
    explicit state_error(const std::string& sMessage) :
        platform_error(PlatformErrorType::State, sMessage)
    {}
};

class payment_error : public platform_error
{
public:
    explicit payment_error(const std::string& sMessage) :
        platform_error(PlatformErrorType::Payment, sMessage)
    {}
};
