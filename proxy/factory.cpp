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

#include "factory.h"

namespace yieldproxy::proxy
{
	using namespace chain;

	ProxyFactory::ProxyFactory(Host& h, const Address& addr, const Settings& s)
		:Contract(h, addr)
		,m_Settings(s)
	{
	}

	void ProxyFactory::EnsureOwner() const
	{
		const Address& caller = get_Caller();
		if (caller != m_Settings.m_Owner)
			throw UnauthorizedCallerException(caller, m_Settings.m_Owner);
	}

	void ProxyFactory::DeriveProxyAddress(Address& res, const Address& factory, const Address& client)
	{
		Hash::Processor()
			<< "yp.proxy"
			<< factory
			<< client
			>> res;
	}

	bool ProxyFactory::get_Proxy(Address& res, const Address& client) const
	{
		AccountKey key;
		key.m_Tag = Tags::Proxy;
		key.m_Account = client;
		return LoadVar_T(key, res);
	}

	Address ProxyFactory::CreateProxy(const Address& client, uint32_t feeBps)
	{
		EnsureOwner();

		Address addr;
		DeriveProxyAddress(addr, get_Address(), client);

		YieldProxy::Immutables imm;
		imm.m_Executor = m_Settings.m_Executor;
		imm.m_Factory = get_Address();
		imm.m_Treasury = m_Settings.m_Treasury;
		imm.m_Permit = m_Settings.m_Permit;
		imm.m_Verifier = m_Settings.m_Verifier;

		get_Host().Deploy<YieldProxy>(addr, imm);
		Far<YieldProxy>(addr)->Initialize(client, feeBps);

		AccountKey key;
		key.m_Tag = Tags::Proxy;
		key.m_Account = client;
		SaveVar_T(key, addr);

		LOG_INFO() << "Proxy " << addr << " created for " << client;
		return addr;
	}

	void ProxyFactory::Deposit(const Address& proxy, const Address& target, const Blob& payload, const PermitAuthorization& auth)
	{
		Address caller = get_Caller();
		Address client = Far<YieldProxy>(proxy)->get_Client();

		if ((caller != client) && !IsClaimOperator(caller))
			throw UnauthorizedCallerException(caller, client);

		Selector sel;
		if (!Abi::ReadSelector(payload, sel))
			throw ProxyException(ProxyError::CalldataTooShort);

		if (!CheckCalldata(target, sel, payload.Tail(Abi::s_SelectorSize), CallKind::Deposit))
			throw ProxyException(ProxyError::CalldataNotAllowed);

		Far<YieldProxy>(proxy)->Deposit(target, payload, auth);
	}

	void ProxyFactory::SetOperator(const Address& addr, bool bEnabled)
	{
		EnsureOwner();

		AccountKey key;
		key.m_Tag = Tags::Operator;
		key.m_Account = addr;

		if (bEnabled)
		{
			uint8_t val = 1;
			SaveVar_T(key, val);
		}
		else
			DelVar_T(key);
	}

	bool ProxyFactory::IsClaimOperator(const Address& addr) const
	{
		AccountKey key;
		key.m_Tag = Tags::Operator;
		key.m_Account = addr;

		uint8_t val;
		return LoadVar_T(key, val);
	}

	bool ProxyFactory::CheckCalldata(const Address& target, Selector sel, const Blob& remainder, CallKind kind) const
	{
		return Far<IAllowListChecker>(m_Settings.m_AllowList)->Check(target, sel, remainder, kind);
	}

} // namespace yieldproxy::proxy
