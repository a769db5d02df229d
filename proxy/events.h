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
#include <string>

namespace yieldproxy::proxy
{
	// Log entries emitted by the proxy. Key is the 1-byte tag, value is the packed struct
	namespace Events
	{
#pragma pack (push, 1)

		struct Initialized {
			static const uint8_t s_Tag = 0x20;
			Address m_Client;
			uint16_t m_FeeBps;
		};

		struct Deposited {
			static const uint8_t s_Tag = 0x21;
			Address m_Target;
			Address m_Asset;
			Amount m_Amount;
			Amount m_TotalDeposited;
		};

		struct Withdrawn {
			static const uint8_t s_Tag = 0x22;
			Address m_Target;
			Address m_Vault;
			Address m_Asset;
			Amount m_Shares;
			Amount m_Released;
			Amount m_TotalWithdrawn;
			Amount m_NewProfit;
			Amount m_Fee;
			Amount m_Client;
		};

		struct CalledAsAnyFunction {
			static const uint8_t s_Tag = 0x23;
			Address m_Target;
		};

		struct ClaimedReward {
			static const uint8_t s_Tag = 0x24;
			Address m_Distributor;
			Address m_Reward;
			Amount m_Claimed;
			Amount m_Fee;
			Amount m_Client;
		};

#pragma pack (pop)

		// decodes the entry if it's of type T, emitted by the given proxy
		template <typename T>
		bool Read(const chain::Host::LogEntry& e, const Address& proxy, T& res)
		{
			if (e.m_Emitter != proxy)
				return false;
			if ((e.m_Key.size() != 1) || (e.m_Key[0] != T::s_Tag) || (e.m_Val.size() != sizeof(T)))
				return false;

			memcpy(&res, e.m_Val.data(), sizeof(T));
			return true;
		}

		// human-readable form, empty if the entry isn't an event of this proxy
		std::string Describe(const chain::Host::LogEntry&, const Address& proxy);

	} // namespace Events

} // namespace yieldproxy::proxy
