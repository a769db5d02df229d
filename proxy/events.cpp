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

#include "events.h"
#include <sstream>

namespace yieldproxy::proxy::Events
{
	std::string Describe(const chain::Host::LogEntry& e, const Address& proxy)
	{
		std::ostringstream os;

		{
			Initialized ev;
			if (Read(e, proxy, ev))
			{
				os << "Initialized client=" << ev.m_Client << " feeBps=" << ev.m_FeeBps;
				return os.str();
			}
		}
		{
			Deposited ev;
			if (Read(e, proxy, ev))
			{
				os << "Deposited target=" << ev.m_Target
					<< " asset=" << ev.m_Asset
					<< " amount=" << ev.m_Amount
					<< " totalDeposited=" << ev.m_TotalDeposited;
				return os.str();
			}
		}
		{
			Withdrawn ev;
			if (Read(e, proxy, ev))
			{
				os << "Withdrawn target=" << ev.m_Target
					<< " vault=" << ev.m_Vault
					<< " asset=" << ev.m_Asset
					<< " shares=" << ev.m_Shares
					<< " released=" << ev.m_Released
					<< " totalWithdrawn=" << ev.m_TotalWithdrawn
					<< " newProfit=" << ev.m_NewProfit
					<< " fee=" << ev.m_Fee
					<< " client=" << ev.m_Client;
				return os.str();
			}
		}
		{
			CalledAsAnyFunction ev;
			if (Read(e, proxy, ev))
			{
				os << "CalledAsAnyFunction target=" << ev.m_Target;
				return os.str();
			}
		}
		{
			ClaimedReward ev;
			if (Read(e, proxy, ev))
			{
				os << "ClaimedReward distributor=" << ev.m_Distributor
					<< " reward=" << ev.m_Reward
					<< " claimed=" << ev.m_Claimed
					<< " fee=" << ev.m_Fee
					<< " client=" << ev.m_Client;
				return os.str();
			}
		}

		return std::string();
	}

} // namespace yieldproxy::proxy::Events
