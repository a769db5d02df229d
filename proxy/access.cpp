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

#include "access.h"

namespace yieldproxy::proxy
{
	AccessController::AccessController(const Address& factory, const ProxyLedger& ledger)
		:m_Factory(factory)
		,m_Ledger(ledger)
	{
	}

	void AccessController::EnsureFactory(const Address& caller) const
	{
		if (caller != m_Factory)
			throw UnauthorizedCallerException(caller, m_Factory);
	}

	bool AccessController::IsClient(const Address& caller) const
	{
		ProxyLedger::Params pars = m_Ledger.get_Params();
		return pars.m_Initialized && (caller == pars.m_Client);
	}

	void AccessController::EnsureClient(const Address& caller) const
	{
		if (!IsClient(caller))
			throw UnauthorizedCallerException(caller, m_Ledger.get_Client());
	}

	ReentrancyGuard::Scope::Scope(ReentrancyGuard& g)
		:m_Guard(g)
	{
		if (m_Guard.m_Entered)
			throw ProxyException(ProxyError::ReentrantCall);
		m_Guard.m_Entered = true;
	}

	ReentrancyGuard::Scope::~Scope()
	{
		m_Guard.m_Entered = false;
	}

} // namespace yieldproxy::proxy
