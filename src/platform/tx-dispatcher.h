#pragma once
// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include <utils/container_types.h>
#include <ledger/address.h>
#include <ledger/token-ledger.h>

class CPlatformContext;

/**
 * Executes platform transactions described as JSON objects.
 * 
	{
		"op": string,        // operation name (createOrganization, mint, setTime, ...)
		"from": string,      // acting identity
		"as": string,        // optional alias to store the returned address under
		...                  // operation parameters
	}
 * String parameters starting with '$' are replaced by the aliased address
 * ($owner, $registry, $factory are predefined).
 * Deadline parameters may be given relative to the current time as "+<seconds>".
 */
class CTxDispatcher
{
public:
    explicit CTxDispatcher(CPlatformContext& context);

    /**
     * Execute one transaction.
     * Failed transactions are reported in the result, they never throw.
     *
     * \param jTx - transaction object
     * \return result object: index, op, status ("ok" or "error"), result or error {type, message}
     */
    nlohmann::json Execute(const nlohmann::json& jTx);
    // execute transactions in order, failures do not stop the run
    nlohmann::json ExecuteAll(const nlohmann::json& jTxs);

    bool IsOpSupported(const std::string& sOp) const noexcept;
    v_strings GetSupportedOps() const;

    void SetAlias(const std::string& sAlias, const address_t& address);
    // resolve "$alias" to an address, other values are returned as is
    address_t Resolve(const std::string& sValue) const;
    const m_strings& GetAliases() const noexcept { return m_mapAliases; }

    std::shared_ptr<CTokenLedger> FindToken(const address_t& address) const;
    nlohmann::json getTokensJSON() const;

    size_t GetExecutedCount() const noexcept { return m_nExecuted; }
    size_t GetFailedCount() const noexcept { return m_nFailed; }

protected:
    using handler_t = nlohmann::json (CTxDispatcher::*)(const nlohmann::json& jTx);

    CPlatformContext& m_context;
    std::unordered_map<std::string, handler_t> m_mapHandlers;
    m_strings m_mapAliases;
    std::map<address_t, std::shared_ptr<CTokenLedger>> m_mapTokens;
    size_t m_nExecuted = 0;
    size_t m_nFailed = 0;

    // parameter helpers, throw invalid_argument for missing or malformed parameters
    address_t GetAddressParam(const nlohmann::json& jTx, const char* szName) const;
    std::string GetStringParam(const nlohmann::json& jTx, const char* szName) const;
    int64_t GetInt64Param(const nlohmann::json& jTx, const char* szName) const;
    uint64_t GetUInt64Param(const nlohmann::json& jTx, const char* szName) const;
    bool GetBoolParam(const nlohmann::json& jTx, const char* szName) const;
    int64_t GetTimeParam(const nlohmann::json& jTx, const char* szName) const;
    CTokenLedger& GetToken(const nlohmann::json& jTx) const;

    // platform registry
    nlohmann::json CreateOrganization(const nlohmann::json& jTx);
    nlohmann::json TransferOrganizationOwnership(const nlohmann::json& jTx);
    nlohmann::json SetOrganizerStatus(const nlohmann::json& jTx);
    nlohmann::json SetOrganizationStatus(const nlohmann::json& jTx);
    nlohmann::json UpdatePlatformFee(const nlohmann::json& jTx);
    nlohmann::json UpdatePaymentToken(const nlohmann::json& jTx);
    nlohmann::json PausePlatform(const nlohmann::json& jTx);
    nlohmann::json UnpausePlatform(const nlohmann::json& jTx);
    nlohmann::json TransferPlatformOwnership(const nlohmann::json& jTx);
    nlohmann::json WithdrawPlatformTokens(const nlohmann::json& jTx);
    // organization
    nlohmann::json UpdateBanner(const nlohmann::json& jTx);
    nlohmann::json CreateEvent(const nlohmann::json& jTx);
    nlohmann::json CloseEvent(const nlohmann::json& jTx);
    nlohmann::json SetTicketPrice(const nlohmann::json& jTx);
    nlohmann::json SetDeadline(const nlohmann::json& jTx);
    nlohmann::json WithdrawTokens(const nlohmann::json& jTx);
    // ticket series
    nlohmann::json Mint(const nlohmann::json& jTx);
    nlohmann::json Resell(const nlohmann::json& jTx);
    nlohmann::json TransferTicket(const nlohmann::json& jTx);
    nlohmann::json ValidateTicket(const nlohmann::json& jTx);
    // payment tokens
    nlohmann::json CreateToken(const nlohmann::json& jTx);
    nlohmann::json MintTokens(const nlohmann::json& jTx);
    nlohmann::json Approve(const nlohmann::json& jTx);
    nlohmann::json BalanceOf(const nlohmann::json& jTx);
    // environment
    nlohmann::json SetTime(const nlohmann::json& jTx);
    nlohmann::json AdvanceTime(const nlohmann::json& jTx);
    nlohmann::json GetState(const nlohmann::json& jTx);
};
