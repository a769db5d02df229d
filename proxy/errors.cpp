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

#include "errors.h"
#include <sstream>

namespace yieldproxy::proxy
{
    const char* getErrorMessage(ProxyError code)
    {
        switch (code)
        {
        #define ERROR_ITEM(_, item, info) case ProxyError::item: return info;
        YP_PROXY_ERRORS(ERROR_ITEM)
        #undef ERROR_ITEM
        }
        return "Unknown error.";
    }

    const char* getErrorName(ProxyError code)
    {
        switch (code)
        {
        #define ERROR_ITEM(_, item, info) case ProxyError::item: return #item;
        YP_PROXY_ERRORS(ERROR_ITEM)
        #undef ERROR_ITEM
        }
        return "Unknown";
    }

    ProxyException::ProxyException(ProxyError code)
        : std::runtime_error(getErrorMessage(code))
        , m_code(code)
    {
    }

    ProxyException::ProxyException(ProxyError code, const std::string& msg)
        : std::runtime_error(msg)
        , m_code(code)
    {
    }

    namespace
    {
        std::string formatUnauthorized(const Address& caller, const Address& expected)
        {
            std::ostringstream ss;
            ss << getErrorMessage(ProxyError::UnauthorizedCaller) << " caller=" << caller << " expected=" << expected;
            return ss.str();
        }
    }

    UnauthorizedCallerException::UnauthorizedCallerException(const Address& caller, const Address& expected)
        : ProxyException(ProxyError::UnauthorizedCaller, formatUnauthorized(caller, expected))
        , m_caller(caller)
        , m_expected(expected)
    {
    }
}
