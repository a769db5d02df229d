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

#include "reward_distributor.h"

namespace yieldproxy::chain
{
	RewardDistributor::RewardDistributor(Host& h, const Address& addr, const Address& owner)
		:Contract(h, addr)
		,m_Owner(owner)
	{
	}

	void RewardDistributor::SetRoot(const Merkle::HashValue& hv)
	{
		if (get_Caller() != m_Owner)
			throw RevertException("not the owner");

		uint8_t key = Tags::Root;
		SaveVar_T(key, hv);
	}

	bool RewardDistributor::get_Root(Merkle::HashValue& hv) const
	{
		uint8_t key = Tags::Root;
		return LoadVar_T(key, hv);
	}

	void RewardDistributor::get_LeafHash(Merkle::HashValue& hv, const Address& account, const Address& reward, Amount claimable)
	{
		Hash::Processor()
			<< "urd.leaf"
			<< account
			<< reward
			<< claimable
			>> hv;
	}

	Amount RewardDistributor::get_Claimed(const Address& account, const Address& reward) const
	{
		ClaimedKey key;
		key.m_Account = account;
		key.m_Reward = reward;

		Amount ret;
		return LoadVar_T(key, ret) ? ret : 0;
	}

	Amount RewardDistributor::Claim(const Address& account, const Address& reward, Amount claimable, const Merkle::Proof& proof)
	{
		Merkle::HashValue hvRoot;
		if (!get_Root(hvRoot))
			throw RevertException("root not set");

		Merkle::HashValue hv;
		get_LeafHash(hv, account, reward, claimable);
		Merkle::Interpret(hv, proof);

		if (hv != hvRoot)
			throw RevertException("invalid proof");

		ClaimedKey key;
		key.m_Account = account;
		key.m_Reward = reward;

		Amount claimed = get_Claimed(account, reward);
		if (claimable < claimed)
			throw RevertException("claimable below claimed");

		Amount val = claimable - claimed;
		if (val)
		{
			SaveVar_T(key, claimable);
			Far<IToken>(reward)->Transfer(account, val);
		}

		return val;
	}

} // namespace yieldproxy::chain
