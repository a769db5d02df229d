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

#include "fee_split.h"

namespace yieldproxy::proxy::FeeSplit
{
	namespace
	{
		Amount ProfitAt(Amount withdrawn, Amount deposited)
		{
			return (withdrawn > deposited) ? (withdrawn - deposited) : 0;
		}
	}

	bool IsValidFeeRate(uint64_t feeBps)
	{
		return feeBps && (feeBps <= s_BpsMax);
	}

	Amount get_Fee(Amount base, uint32_t feeBps)
	{
		if (!IsValidFeeRate(feeBps))
			throw std::invalid_argument("fee rate out of range");

		return MulDiv(base, s_BpsMax - feeBps, s_BpsMax);
	}

	Result ForWithdrawal(Amount deposited, Amount withdrawnBefore, Amount newAmount, uint32_t feeBps)
	{
		Amount withdrawnAfter = withdrawnBefore;
		Strict::Add(withdrawnAfter, newAmount);

		Result res;
		res.m_NewProfit = ProfitAt(withdrawnAfter, deposited) - ProfitAt(withdrawnBefore, deposited);
		res.m_Fee = get_Fee(res.m_NewProfit, feeBps);
		res.m_Client = newAmount - res.m_Fee; // fee <= newProfit <= newAmount
		return res;
	}

	Result ForReward(Amount claimed, uint32_t feeBps)
	{
		Result res;
		res.m_NewProfit = claimed;
		res.m_Fee = get_Fee(claimed, feeBps);
		res.m_Client = claimed - res.m_Fee;
		return res;
	}

} // namespace yieldproxy::proxy::FeeSplit
