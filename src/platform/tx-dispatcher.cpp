// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <algorithm>
#include <stdexcept>

#include <utils/str_utils.h>
#include <utils/sync.h>
#include <utils/util.h>
#include <platform/platform-consts.h>
#include <platform/platform-error.h>
#include <platform/platform-context.h>
#include <platform/platform-registry.h>
#include <platform/organization.h>
#include <platform/ticket-factory.h>
#include <platform/ticket-series.h>
#include <platform/tx-dispatcher.h>

using json = nlohmann::json;
using namespace std;

constexpr auto SCRIPT_ERROR_NAME = "ScriptError";
constexpr auto INTERNAL_ERROR_NAME = "InternalError";

CTxDispatcher::CTxDispatcher(CPlatformContext& context) :
    m_context(context)
{
    m_mapHandlers = 
    {
        { "createOrganization",            &CTxDispatcher::CreateOrganization },
        { "transferOrganizationOwnership", &CTxDispatcher::TransferOrganizationOwnership },
        { "setOrganizerStatus",            &CTxDispatcher::SetOrganizerStatus },
        { "setOrganizationStatus",         &CTxDispatcher::SetOrganizationStatus },
        { "updatePlatformFee",             &CTxDispatcher::UpdatePlatformFee },
        { "updatePaymentToken",            &CTxDispatcher::UpdatePaymentToken },
        { "pause",                         &CTxDispatcher::PausePlatform },
        { "unpause",                       &CTxDispatcher::UnpausePlatform },
        { "transferPlatformOwnership",     &CTxDispatcher::TransferPlatformOwnership },
        { "withdrawPlatformTokens",        &CTxDispatcher::WithdrawPlatformTokens },
        { "updateBanner",                  &CTxDispatcher::UpdateBanner },
        { "createEvent",                   &CTxDispatcher::CreateEvent },
        { "closeEvent",                    &CTxDispatcher::CloseEvent },
        { "setTicketPrice",                &CTxDispatcher::SetTicketPrice },
        { "setDeadline",                   &CTxDispatcher::SetDeadline },
        { "withdrawTokens",                &CTxDispatcher::WithdrawTokens },
        { "mint",                          &CTxDispatcher::Mint },
        { "resell",                        &CTxDispatcher::Resell },
        { "transferTicket",                &CTxDispatcher::TransferTicket },
        { "validateTicket",                &CTxDispatcher::ValidateTicket },
        { "createToken",                   &CTxDispatcher::CreateToken },
        { "mintTokens",                    &CTxDispatcher::MintTokens },
        { "approve",                       &CTxDispatcher::Approve },
        { "balanceOf",                     &CTxDispatcher::BalanceOf },
        { "setTime",                       &CTxDispatcher::SetTime },
        { "advanceTime",                   &CTxDispatcher::AdvanceTime },
        { "state",                         &CTxDispatcher::GetState }
    };
    const auto& registry = m_context.GetRegistry();
    m_mapAliases.emplace("owner", registry.GetOwner());
    m_mapAliases.emplace("registry", registry.GetAddress());
    m_mapAliases.emplace("factory", m_context.GetFactory().GetAddress());
}

bool CTxDispatcher::IsOpSupported(const string& sOp) const noexcept
{
    return m_mapHandlers.count(sOp) > 0;
}

v_strings CTxDispatcher::GetSupportedOps() const
{
    v_strings vOps;
    for (const auto& [sOp, handler] : m_mapHandlers)
        vOps.push_back(sOp);
    sort(vOps.begin(), vOps.end());
    return vOps;
}

void CTxDispatcher::SetAlias(const string& sAlias, const address_t& address)
{
    string sName(sAlias);
    if (!sName.empty() && sName[0] == '$')
        sName.erase(0, 1);
    if (sName.empty())
        throw invalid_argument("alias name cannot be empty");
    m_mapAliases[sName] = address;
}

address_t CTxDispatcher::Resolve(const string& sValue) const
{
    if (sValue.empty() || sValue[0] != '$')
        return sValue;
    const auto it = m_mapAliases.find(sValue.substr(1));
    if (it == m_mapAliases.cend())
        throw invalid_argument(strprintf("unknown alias [%s]", sValue));
    return it->second;
}

shared_ptr<CTokenLedger> CTxDispatcher::FindToken(const address_t& address) const
{
    const auto it = m_mapTokens.find(Resolve(address));
    return it == m_mapTokens.cend() ? nullptr : it->second;
}

json CTxDispatcher::getTokensJSON() const
{
    json jTokens = json::array();
    for (const auto& [address, pToken] : m_mapTokens)
        jTokens.push_back(pToken->getJSON());
    return jTokens;
}

json CTxDispatcher::ExecuteAll(const json& jTxs)
{
    json jResults = json::array();
    if (!jTxs.is_array())
        throw invalid_argument("transactions must be a JSON array");
    for (const auto& jTx : jTxs)
        jResults.push_back(Execute(jTx));
    return jResults;
}

json CTxDispatcher::Execute(const json& jTx)
{
    const size_t nIndex = m_nExecuted++;
    json jResult = { { "index", nIndex } };
    string sOp;
    try
    {
        if (!jTx.is_object())
            throw invalid_argument("transaction must be a JSON object");
        sOp = GetStringParam(jTx, "op");
        jResult["op"] = sOp;
        const auto it = m_mapHandlers.find(sOp);
        if (it == m_mapHandlers.cend())
            throw invalid_argument(strprintf("unsupported operation [%s], supported: %s", sOp, str_join(GetSupportedOps(), ", ")));

        json jOpResult = (this->*(it->second))(jTx);
        if (jTx.contains("as"))
        {
            if (!jOpResult.is_string())
                throw invalid_argument(strprintf("operation [%s] does not return an address", sOp));
            SetAlias(jTx.at("as").get<string>(), jOpResult.get<string>());
        }
        jResult["status"] = "ok";
        if (!jOpResult.is_null())
            jResult["result"] = std::move(jOpResult);
        LogFnPrint("replay", "#%zu %s: ok", nIndex, sOp);
        return jResult;
    } catch (const platform_error& e)
    {
        jResult["error"] = { { "type", e.GetErrorName() }, { "message", e.what() } };
    } catch (const json::exception& e)
    {
        jResult["error"] = { { "type", SCRIPT_ERROR_NAME }, { "message", e.what() } };
    } catch (const logic_error& e)
    {
        jResult["error"] = { { "type", SCRIPT_ERROR_NAME }, { "message", e.what() } };
    } catch (const exception& e)
    {
        jResult["error"] = { { "type", INTERNAL_ERROR_NAME }, { "message", e.what() } };
    }
    ++m_nFailed;
    jResult["status"] = "error";
    LogFnPrint("replay", "#%zu %s: %s", nIndex, sOp, jResult["error"]["message"].get<string>());
    return jResult;
}

string CTxDispatcher::GetStringParam(const json& jTx, const char* szName) const
{
    const auto it = jTx.find(szName);
    if (it == jTx.cend() || !it->is_string())
        throw invalid_argument(strprintf("string parameter '%s' is required", szName));
    return it->get<string>();
}

address_t CTxDispatcher::GetAddressParam(const json& jTx, const char* szName) const
{
    string sValue = GetStringParam(jTx, szName);
    trim(sValue);
    return Resolve(sValue);
}

int64_t CTxDispatcher::GetInt64Param(const json& jTx, const char* szName) const
{
    const auto it = jTx.find(szName);
    if (it == jTx.cend() || !it->is_number_integer())
        throw invalid_argument(strprintf("integer parameter '%s' is required", szName));
    return it->get<int64_t>();
}

uint64_t CTxDispatcher::GetUInt64Param(const json& jTx, const char* szName) const
{
    const auto it = jTx.find(szName);
    if (it == jTx.cend() || !it->is_number_integer())
        throw invalid_argument(strprintf("integer parameter '%s' is required", szName));
    if (it->is_number_unsigned())
        return it->get<uint64_t>();
    const int64_t nValue = it->get<int64_t>();
    if (nValue < 0)
        throw validation_error(strprintf("parameter '%s' cannot be negative (%d)", szName, nValue));
    return static_cast<uint64_t>(nValue);
}

bool CTxDispatcher::GetBoolParam(const json& jTx, const char* szName) const
{
    const auto it = jTx.find(szName);
    if (it == jTx.cend())
        throw invalid_argument(strprintf("boolean parameter '%s' is required", szName));
    if (it->is_boolean())
        return it->get<bool>();
    bool bValue = false;
    if (it->is_string() && str_tobool(it->get<string>(), bValue))
        return bValue;
    throw invalid_argument(strprintf("parameter '%s' is not a boolean", szName));
}

int64_t CTxDispatcher::GetTimeParam(const json& jTx, const char* szName) const
{
    const auto it = jTx.find(szName);
    if (it != jTx.cend() && it->is_string())
    {
        // relative time: "+<seconds>"
        string sValue = it->get<string>();
        trim(sValue);
        if (sValue.size() < 2 || sValue[0] != '+' ||
            !all_of(sValue.cbegin() + 1, sValue.cend(), [](const char ch) { return ch >= '0' && ch <= '9'; }))
            throw invalid_argument(strprintf("parameter '%s' value [%s] is not a time", szName, sValue));
        return GetTime() + stoll(sValue.substr(1));
    }
    return GetInt64Param(jTx, szName);
}

CTokenLedger& CTxDispatcher::GetToken(const json& jTx) const
{
    const address_t token = GetAddressParam(jTx, "token");
    const auto pToken = FindToken(token);
    if (!pToken)
        throw invalid_argument(strprintf("token [%s] was not created by this script", token));
    return *pToken;
}

json CTxDispatcher::CreateOrganization(const json& jTx)
{
    return m_context.GetRegistry().CreateOrganization(GetAddressParam(jTx, "from"));
}

json CTxDispatcher::TransferOrganizationOwnership(const json& jTx)
{
    m_context.GetRegistry().TransferOrganizationOwnership(GetAddressParam(jTx, "from"), GetAddressParam(jTx, "newOwner"));
    return nullptr;
}

json CTxDispatcher::SetOrganizerStatus(const json& jTx)
{
    m_context.GetRegistry().SetOrganizerStatus(GetAddressParam(jTx, "from"), GetAddressParam(jTx, "organizer"),
        GetBoolParam(jTx, "allowed"));
    return nullptr;
}

json CTxDispatcher::SetOrganizationStatus(const json& jTx)
{
    m_context.GetRegistry().SetOrganizationStatus(GetAddressParam(jTx, "from"), GetAddressParam(jTx, "organization"),
        GetBoolParam(jTx, "active"));
    return nullptr;
}

json CTxDispatcher::UpdatePlatformFee(const json& jTx)
{
    m_context.GetRegistry().UpdatePlatformFee(GetAddressParam(jTx, "from"), GetInt64Param(jTx, "feeBps"));
    return nullptr;
}

json CTxDispatcher::UpdatePaymentToken(const json& jTx)
{
    m_context.GetRegistry().UpdatePaymentToken(GetAddressParam(jTx, "from"), GetAddressParam(jTx, "token"));
    return nullptr;
}

json CTxDispatcher::PausePlatform(const json& jTx)
{
    m_context.GetRegistry().Pause(GetAddressParam(jTx, "from"));
    return nullptr;
}

json CTxDispatcher::UnpausePlatform(const json& jTx)
{
    m_context.GetRegistry().Unpause(GetAddressParam(jTx, "from"));
    return nullptr;
}

json CTxDispatcher::TransferPlatformOwnership(const json& jTx)
{
    const address_t newOwner = GetAddressParam(jTx, "newOwner");
    m_context.GetRegistry().TransferPlatformOwnership(GetAddressParam(jTx, "from"), newOwner);
    m_mapAliases["owner"] = newOwner;
    return nullptr;
}

json CTxDispatcher::WithdrawPlatformTokens(const json& jTx)
{
    return m_context.GetRegistry().WithdrawTokens(GetAddressParam(jTx, "from"), GetAddressParam(jTx, "token"));
}

json CTxDispatcher::UpdateBanner(const json& jTx)
{
    m_context.GetOrganization(GetAddressParam(jTx, "organization"))
        .UpdateBanner(GetAddressParam(jTx, "from"), GetStringParam(jTx, "uri"));
    return nullptr;
}

json CTxDispatcher::CreateEvent(const json& jTx)
{
    auto& organization = m_context.GetOrganization(GetAddressParam(jTx, "organization"));
    return organization.CreateEvent(GetAddressParam(jTx, "from"), GetStringParam(jTx, "uri"),
        GetInt64Param(jTx, "price"), GetTimeParam(jTx, "deadline"), GetUInt64Param(jTx, "maxSupply"));
}

json CTxDispatcher::CloseEvent(const json& jTx)
{
    m_context.GetOrganization(GetAddressParam(jTx, "organization"))
        .CloseEvent(GetAddressParam(jTx, "from"), GetAddressParam(jTx, "event"));
    return nullptr;
}

json CTxDispatcher::SetTicketPrice(const json& jTx)
{
    m_context.GetOrganization(GetAddressParam(jTx, "organization"))
        .SetTicketPrice(GetAddressParam(jTx, "from"), GetAddressParam(jTx, "event"), GetInt64Param(jTx, "price"));
    return nullptr;
}

json CTxDispatcher::SetDeadline(const json& jTx)
{
    m_context.GetOrganization(GetAddressParam(jTx, "organization"))
        .SetDeadline(GetAddressParam(jTx, "from"), GetAddressParam(jTx, "event"), GetTimeParam(jTx, "deadline"));
    return nullptr;
}

json CTxDispatcher::WithdrawTokens(const json& jTx)
{
    return m_context.GetOrganization(GetAddressParam(jTx, "organization"))
        .WithdrawTokens(GetAddressParam(jTx, "from"), GetAddressParam(jTx, "token"));
}

json CTxDispatcher::Mint(const json& jTx)
{
    return m_context.GetSeries(GetAddressParam(jTx, "event")).Mint(GetAddressParam(jTx, "from"));
}

json CTxDispatcher::Resell(const json& jTx)
{
    m_context.GetSeries(GetAddressParam(jTx, "event")).Resell(GetAddressParam(jTx, "from"),
        GetUInt64Param(jTx, "ticketId"), GetAddressParam(jTx, "to"), GetInt64Param(jTx, "price"));
    return nullptr;
}

json CTxDispatcher::TransferTicket(const json& jTx)
{
    m_context.GetSeries(GetAddressParam(jTx, "event")).TransferTicket(GetAddressParam(jTx, "from"),
        GetAddressParam(jTx, "to"), GetUInt64Param(jTx, "ticketId"));
    return nullptr;
}

json CTxDispatcher::ValidateTicket(const json& jTx)
{
    return m_context.GetSeries(GetAddressParam(jTx, "event")).ValidateTicket(GetUInt64Param(jTx, "ticketId"));
}

json CTxDispatcher::CreateToken(const json& jTx)
{
    const address_t from = GetAddressParam(jTx, "from");
    const string sSymbol = GetStringParam(jTx, "symbol");

    CLedgerNotifyScope notifyScope(m_context.GetEventLog());
    LOCK(m_context.cs_ledger);
    CStateTransaction tx(m_context.GetTxManager(), "createToken");
    const address_t token = m_context.GenerateAddress(tx, from, COMPONENT_KIND_TOKEN);
    auto pToken = make_shared<CTokenLedger>(token, sSymbol);
    string error;
    if (!m_context.RegisterToken(pToken, error))
        throw state_error(error);
    tx.Commit();
    m_mapTokens.emplace(token, std::move(pToken));
    return token;
}

json CTxDispatcher::MintTokens(const json& jTx)
{
    auto& token = GetToken(jTx);
    string error;
    if (!token.Mint(GetAddressParam(jTx, "to"), GetInt64Param(jTx, "amount"), error))
        throw validation_error(error);
    return nullptr;
}

json CTxDispatcher::Approve(const json& jTx)
{
    auto& token = GetToken(jTx);
    string error;
    if (!token.Approve(GetAddressParam(jTx, "from"), GetAddressParam(jTx, "spender"), GetInt64Param(jTx, "amount"), error))
        throw validation_error(error);
    return nullptr;
}

json CTxDispatcher::BalanceOf(const json& jTx)
{
    return GetToken(jTx).balanceOf(GetAddressParam(jTx, "holder"));
}

json CTxDispatcher::SetTime(const json& jTx)
{
    const int64_t nTime = GetInt64Param(jTx, "time");
    if (nTime <= 0)
        throw invalid_argument(strprintf("time %d must be positive", nTime));
    SetMockTime(nTime);
    return nTime;
}

json CTxDispatcher::AdvanceTime(const json& jTx)
{
    const int64_t nSeconds = GetInt64Param(jTx, "seconds");
    if (nSeconds < 0)
        throw invalid_argument(strprintf("cannot move time back by %d seconds", -nSeconds));
    const int64_t nTime = GetTime() + nSeconds;
    SetMockTime(nTime);
    return nTime;
}

json CTxDispatcher::GetState(const json& /*jTx*/)
{
    return m_context.getStateJSON();
}
