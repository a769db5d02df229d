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

#include "allow_list.h"
#include "errors.h"

namespace yieldproxy::proxy
{
	const char* get_CallKindName(CallKind kind)
	{
		switch (kind)
		{
		case CallKind::Deposit: return "deposit";
		case CallKind::Withdrawal: return "withdrawal";
		case CallKind::Unrestricted: return "unrestricted";
		}
		return "unknown";
	}

	SelectorAllowList::SelectorAllowList(chain::Host& h, const Address& addr, const Address& owner)
		:Contract(h, addr)
		,m_Owner(owner)
	{
	}

	SelectorAllowList::RuleKey SelectorAllowList::MakeKey(const Address& target, Selector sel, CallKind kind)
	{
		RuleKey key;
		key.m_Target = target;
		key.m_Selector = sel;
		key.m_Kind = static_cast<uint8_t>(kind);
		return key;
	}

	void SelectorAllowList::SetRule(const Address& target, Selector sel, CallKind kind, bool bAllowed)
	{
		const Address& caller = get_Caller();
		if (caller != m_Owner)
			throw UnauthorizedCallerException(caller, m_Owner);

		RuleKey key = MakeKey(target, sel, kind);
		if (bAllowed)
		{
			uint8_t val = 1;
			SaveVar_T(key, val);
		}
		else
			DelVar_T(key);

		LOG_DEBUG() << "Allow-list rule " << target << ":" << std::hex << sel << std::dec << " " << get_CallKindName(kind) << " = " << bAllowed;
	}

	bool SelectorAllowList::Check(const Address& target, Selector sel, const Blob&, CallKind kind) const
	{
		uint8_t val;
		return LoadVar_T(MakeKey(target, sel, kind), val);
	}

} // namespace yieldproxy::proxy
