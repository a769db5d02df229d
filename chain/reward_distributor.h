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
#include "interfaces.h"

namespace yieldproxy::chain
{
	// Cumulative rewards committed by a merkle root. Each leaf grants the total amount claimable so far,
	// claims pay out the difference with what was already claimed. Pays from its own balance.
	class RewardDistributor
		:public Contract
		,public IRewardDistributor
	{
	public:
		RewardDistributor(Host&, const Address& addr, const Address& owner);

		void SetRoot(const Merkle::HashValue&); // owner only
		bool get_Root(Merkle::HashValue&) const;

		Amount Claim(const Address& account, const Address& reward, Amount claimable, const Merkle::Proof&) override;
		Amount get_Claimed(const Address& account, const Address& reward) const override;

		static void get_LeafHash(Merkle::HashValue&, const Address& account, const Address& reward, Amount claimable);

	private:
		const Address m_Owner;

#pragma pack (push, 1)

		struct Tags
		{
			static const uint8_t Root = 0;
			static const uint8_t Claimed = 1;
		};

		struct ClaimedKey {
			uint8_t m_Tag = Tags::Claimed;
			Address m_Account;
			Address m_Reward;
		};

#pragma pack (pop)
	};

} // namespace yieldproxy::chain
