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

#include "uintBig.h"
#include "utility/hex.h"

namespace yieldproxy {

	char ChFromHex(uint8_t v)
	{
		return v + ((v < 10) ? '0' : ('a' - 10));
	}

	void uintBigImpl::_Print(const uint8_t* pDst, uint32_t nDst, std::ostream& s)
	{
		// enough for addresses, longer values are truncated
		const uint32_t nDigitsMax = 20;
		if (nDst > nDigitsMax)
			nDst = nDigitsMax;

		char sz[nDigitsMax * 2 + 1];

		_Print(pDst, nDst, sz);
		s << "0x" << sz;
	}

	void uintBigImpl::_Print(const uint8_t* pDst, uint32_t nDst, char* sz)
	{
		for (uint32_t i = 0; i < nDst; i++)
		{
			sz[i * 2] = ChFromHex(pDst[i] >> 4);
			sz[i * 2 + 1] = ChFromHex(pDst[i] & 0xf);
		}

		sz[nDst << 1] = 0;
	}

	bool uintBigImpl::_Scan(uint8_t* pDst, uint32_t nDst, std::string_view sz)
	{
		if ((sz.size() >= 2) && (sz[0] == '0') && ((sz[1] == 'x') || (sz[1] == 'X')))
			sz.remove_prefix(2);

		if (sz.size() != (nDst << 1))
			return false;

		bool bValid = false;
		auto v = from_hex(sz, &bValid);
		if (!bValid)
			return false;

		memcpy(pDst, v.data(), nDst);
		return true;
	}

	void uintBigImpl::_Assign(uint8_t* pDst, uint32_t nDst, const uint8_t* pSrc, uint32_t nSrc)
	{
		if (nSrc >= nDst)
			memcpy(pDst, pSrc + nSrc - nDst, nDst);
		else
		{
			memset0(pDst, nDst - nSrc);
			memcpy(pDst + nDst - nSrc, pSrc, nSrc);
		}
	}

	int uintBigImpl::_Cmp(const uint8_t* pSrc0, uint32_t nSrc0, const uint8_t* pSrc1, uint32_t nSrc1)
	{
		if (nSrc0 > nSrc1)
		{
			uint32_t diff = nSrc0 - nSrc1;
			if (!memis0(pSrc0, diff))
				return 1;

			pSrc0 += diff;
			nSrc0 = nSrc1;
		} else
			if (nSrc0 < nSrc1)
			{
				uint32_t diff = nSrc1 - nSrc0;
				if (!memis0(pSrc1, diff))
					return -1;

				pSrc1 += diff;
			}

		return memcmp(pSrc0, pSrc1, nSrc0);
	}

} // namespace yieldproxy
