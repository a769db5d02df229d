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
#include "chain/host.h"

namespace yieldproxy::proxy
{
	// Exact-match table of (target, selector, kind). The remainder of the payload is not inspected
	class SelectorAllowList
		:public chain::Contract
		,public IAllowListChecker
	{
	public:
		SelectorAllowList(chain::Host&, const Address& addr, const Address& owner);

		// owner only
		void SetRule(const Address& target, Selector, CallKind, bool bAllowed);

		bool Check(const Address& target, Selector, const Blob& remainder, CallKind) const override;

	private:
		const Address m_Owner;

#pragma pack (push, 1)
		struct RuleKey {
			Address m_Target;
			Selector m_Selector;
			uint8_t m_Kind;
		};
#pragma pack (pop)

		static RuleKey MakeKey(const Address& target, Selector, CallKind);
	};

} // namespace yieldproxy::proxy
