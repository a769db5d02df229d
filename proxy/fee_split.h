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

namespace yieldproxy::proxy
{
	// Fee rate is the client share in basis points, the treasury takes the complement
	namespace FeeSplit
	{
		static const uint32_t s_BpsMax = 10000;

		// (0, s_BpsMax]
		bool IsValidFeeRate(uint64_t feeBps);

		struct Result
		{
			Amount m_NewProfit = 0;
			Amount m_Fee = 0; // to the treasury
			Amount m_Client = 0;
		};

		// floor(base * (s_BpsMax - feeBps) / s_BpsMax)
		Amount get_Fee(Amount base, uint32_t feeBps);

		// Only the part of newAmount that raises the cumulative realized profit is charged.
		// Profit is charged once in total regardless of how the withdrawal is split.
		Result ForWithdrawal(Amount deposited, Amount withdrawnBefore, Amount newAmount, uint32_t feeBps);

		// Flat: the whole claimed amount is charged
		Result ForReward(Amount claimed, uint32_t feeBps);

	} // namespace FeeSplit

} // namespace yieldproxy::proxy
