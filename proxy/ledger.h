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
#include "chain/host.h"

namespace yieldproxy::proxy
{
	// Per-asset cumulative totals and the identity set once at initialization.
	// Lives in the proxy's host vars, so it's reverted together with the rest of a failed operation.
	class ProxyLedger
	{
	public:
#pragma pack (push, 1)
		struct Params
		{
			Address m_Client;
			uint16_t m_FeeBps;
			uint8_t m_Initialized;
		};
#pragma pack (pop)

		explicit ProxyLedger(chain::VarStore&);

		Amount get_Deposited(const Address& asset) const;
		Amount get_Withdrawn(const Address& asset) const;

		// max(0, withdrawn - deposited)
		Amount get_RealizedProfit(const Address& asset) const;

		// returns the new total
		Amount RecordDeposit(const Address& asset, Amount);
		Amount RecordWithdrawal(const Address& asset, Amount);

		Params get_Params() const;
		bool IsInitialized() const { return get_Params().m_Initialized != 0; }
		Address get_Client() const { return get_Params().m_Client; }
		uint16_t get_FeeBps() const { return get_Params().m_FeeBps; }

		void SetParams(const Address& client, uint16_t feeBps);

	private:
		chain::VarStore& m_Vars;

		struct Tags
		{
			static const uint8_t Settings = 0;
			static const uint8_t Deposited = 1;
			static const uint8_t Withdrawn = 2;
		};

#pragma pack (push, 1)
		struct TotalKey {
			uint8_t m_Tag;
			Address m_Asset;
		};
#pragma pack (pop)

		Amount LoadTotal(uint8_t nTag, const Address& asset) const;
		Amount AddTotal(uint8_t nTag, const Address& asset, Amount);
	};

} // namespace yieldproxy::proxy
