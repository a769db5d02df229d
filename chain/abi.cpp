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

#include "abi.h"

namespace yieldproxy::chain::Abi
{
	void WriteSelector(ByteBuffer& res, Selector sel)
	{
		uintBigFor<Selector>::Type x(sel);
		res.insert(res.end(), x.m_pData, x.m_pData + x.nBytes);
	}

	bool ReadSelector(const Blob& payload, Selector& sel)
	{
		if (payload.n < s_SelectorSize)
			return false;

		uintBigFor<Selector>::Type x(Blob(payload.p, s_SelectorSize));
		x.Export(sel);
		return true;
	}

	const uint8_t* Reader::Consume(uint32_t n)
	{
		if (m_Data.n < n)
			throw RevertException("payload underflow");

		const uint8_t* p = static_cast<const uint8_t*>(m_Data.p);
		m_Data.p = p + n;
		m_Data.n -= n;
		return p;
	}

	void Reader::EnsureEnd() const
	{
		if (m_Data.n)
			throw RevertException("unexpected payload tail");
	}

} // namespace yieldproxy::chain::Abi
