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

#include "ledger.h"

namespace yieldproxy::proxy
{
	ProxyLedger::ProxyLedger(chain::VarStore& vars)
		:m_Vars(vars)
	{
	}

	Amount ProxyLedger::LoadTotal(uint8_t nTag, const Address& asset) const
	{
		TotalKey key;
		key.m_Tag = nTag;
		key.m_Asset = asset;

		Amount ret;
		return m_Vars.Load_T(key, ret) ? ret : 0;
	}

	Amount ProxyLedger::AddTotal(uint8_t nTag, const Address& asset, Amount val)
	{
		TotalKey key;
		key.m_Tag = nTag;
		key.m_Asset = asset;

		Amount total = LoadTotal(nTag, asset);
		Strict::Add(total, val);

		m_Vars.Save_T(key, total);
		return total;
	}

	Amount ProxyLedger::get_Deposited(const Address& asset) const
	{
		return LoadTotal(Tags::Deposited, asset);
	}

	Amount ProxyLedger::get_Withdrawn(const Address& asset) const
	{
		return LoadTotal(Tags::Withdrawn, asset);
	}

	Amount ProxyLedger::get_RealizedProfit(const Address& asset) const
	{
		Amount deposited = get_Deposited(asset);
		Amount withdrawn = get_Withdrawn(asset);
		return (withdrawn > deposited) ? (withdrawn - deposited) : 0;
	}

	Amount ProxyLedger::RecordDeposit(const Address& asset, Amount val)
	{
		return AddTotal(Tags::Deposited, asset, val);
	}

	Amount ProxyLedger::RecordWithdrawal(const Address& asset, Amount val)
	{
		return AddTotal(Tags::Withdrawn, asset, val);
	}

	ProxyLedger::Params ProxyLedger::get_Params() const
	{
		Params ret;
		uint8_t key = Tags::Settings;
		if (!m_Vars.Load_T(key, ret))
			ZeroObject(ret);
		return ret;
	}

	void ProxyLedger::SetParams(const Address& client, uint16_t feeBps)
	{
		Params pars;
		pars.m_Client = client;
		pars.m_FeeBps = feeBps;
		pars.m_Initialized = 1;

		uint8_t key = Tags::Settings;
		m_Vars.Save_T(key, pars);
	}

} // namespace yieldproxy::proxy
