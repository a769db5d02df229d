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
#include "yield_proxy.h"

namespace yieldproxy::proxy
{
	// Deploys and initializes one proxy per client, routes deposits, owns the claim operators list
	class ProxyFactory
		:public chain::Contract
		,public IProxyFactory
	{
	public:
		struct Settings
		{
			Address m_Owner;
			Address m_Executor;
			Address m_Treasury;
			Address m_Permit;
			Address m_Verifier;
			Address m_AllowList;
		};

		ProxyFactory(chain::Host&, const Address& addr, const Settings&);

		// owner only. Returns the address of the new proxy
		Address CreateProxy(const Address& client, uint32_t feeBps);

		// proxy client or a claim operator. The payload must be allowed for the deposit kind
		void Deposit(const Address& proxy, const Address& target, const Blob& payload, const PermitAuthorization&);

		// owner only
		void SetOperator(const Address&, bool bEnabled);

		bool IsClaimOperator(const Address&) const override;
		bool CheckCalldata(const Address& target, Selector, const Blob& remainder, CallKind) const override;

		bool get_Proxy(Address& res, const Address& client) const;
		const Settings& get_Settings() const { return m_Settings; }

		// deterministic, depends on the factory and the client only
		static void DeriveProxyAddress(Address&, const Address& factory, const Address& client);

	private:
		const Settings m_Settings;

		struct Tags
		{
			static const uint8_t Proxy = 0;
			static const uint8_t Operator = 1;
		};

#pragma pack (push, 1)
		struct AccountKey {
			uint8_t m_Tag;
			Address m_Account;
		};
#pragma pack (pop)

		void EnsureOwner() const;
	};

} // namespace yieldproxy::proxy
