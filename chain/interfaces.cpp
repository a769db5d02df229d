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

#include "interfaces.h"

namespace yieldproxy::chain
{
	void PermitSingle::get_Hash(Hash::Value& hv, const Address& domain) const
	{
		Hash::Processor()
			<< "permit.single"
			<< domain
			<< m_Token
			<< m_Amount
			<< m_Expiration
			<< m_Nonce
			<< m_Spender
			<< m_SigDeadline
			>> hv;
	}

	void Bundle::Encode(ByteBuffer& res) const
	{
		Method::Multicall args;
		args.m_Calls = static_cast<uint32_t>(m_vCalls.size());
		Abi::Encode(res, args);

		for (const auto& c : m_vCalls)
		{
			res.insert(res.end(), c.m_Target.m_pData, c.m_Target.m_pData + c.m_Target.nBytes);

			uint32_t nLen = static_cast<uint32_t>(c.m_Payload.size());
			const uint8_t* pLen = reinterpret_cast<const uint8_t*>(&nLen);
			res.insert(res.end(), pLen, pLen + sizeof(nLen));

			res.insert(res.end(), c.m_Payload.begin(), c.m_Payload.end());
		}
	}

	void Bundle::Decode(Abi::Reader& r)
	{
		uint32_t nCalls = r.Read<uint32_t>();

		m_vCalls.clear();
		for (uint32_t i = 0; i < nCalls; i++)
		{
			auto& c = m_vCalls.emplace_back();
			c.m_Target = Blob(r.Consume(c.m_Target.nBytes), c.m_Target.nBytes);

			uint32_t nLen = r.Read<uint32_t>();
			Blob(r.Consume(nLen), nLen).Export(c.m_Payload);
		}

		r.EnsureEnd();
	}

} // namespace yieldproxy::chain
