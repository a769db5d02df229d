// Copyright 2018 The Beam Team
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once
#include "core/common.h"
#include <stdexcept>

namespace yieldproxy::proxy
{
    #define YP_PROXY_ERRORS(macro) \
    macro(1001, ZeroAddressAsset,        "Asset address is zero.")              \
    macro(1002, ZeroDepositAmount,       "Deposit amount is zero.")             \
    macro(1003, ZeroSharesWithdrawal,    "Withdrawal shares amount is zero.")   \
    macro(1004, InvalidFeeRate,          "Invalid fee rate.")                   \
    macro(1005, CalldataTooShort,        "Calldata is too short.")              \
    macro(1006, AlreadyInitialized,      "Proxy is already initialized.")       \
    macro(1007, NotInitialized,          "Proxy is not initialized.")           \
    macro(1008, ZeroClient,              "Client address is zero.")             \
    macro(2001, UnauthorizedCaller,      "Unauthorized caller.")                \
    macro(2002, CalldataNotAllowed,      "Calldata is not allowed.")            \
    macro(2003, ReentrantCall,           "Reentrant call.")                     \
    macro(3001, NothingClaimed,          "Nothing claimed.")                    \
    macro(3002, InvalidSignature,        "Invalid signature.")

    enum class ProxyError
    {
        #define ERROR_ITEM(code, item, _) item = code,
        YP_PROXY_ERRORS(ERROR_ITEM)
        #undef ERROR_ITEM
    };

    const char* getErrorMessage(ProxyError);
    const char* getErrorName(ProxyError);

    class ProxyException : public std::runtime_error
    {
    public:
        explicit ProxyException(ProxyError code);
        ProxyException(ProxyError code, const std::string& msg);

        [[nodiscard]] ProxyError code() const { return m_code; }

    private:
        ProxyError m_code;
    };

    class UnauthorizedCallerException : public ProxyException
    {
    public:
        UnauthorizedCallerException(const Address& caller, const Address& expected);

        const Address& get_Caller() const { return m_caller; }
        const Address& get_Expected() const { return m_expected; }

    private:
        Address m_caller;
        Address m_expected;
    };
}
