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
#include "utility/common.h"
#include <string_view>

namespace yieldproxy
{
	// Syntactic sugar!
	enum Zero_ { Zero };

	// Fixed-size big-endian byte strings: addresses, hashes, keys.
	class uintBigImpl {
	protected:
		static void _Assign(uint8_t* pDst, uint32_t nDst, const uint8_t* pSrc, uint32_t nSrc);
		static int _Cmp(const uint8_t* pSrc0, uint32_t nSrc0, const uint8_t* pSrc1, uint32_t nSrc1);
		static void _Print(const uint8_t* pDst, uint32_t nDst, std::ostream&);
		static void _Print(const uint8_t* pDst, uint32_t nDst, char*);
		static bool _Scan(uint8_t* pDst, uint32_t nDst, std::string_view sz);

		template <typename T>
		static void _AssignRangeAligned(uint8_t* pDst, uint32_t nDst, T x, uint32_t nOffsetBytes, uint32_t nBytesX)
		{
			static_assert(T(-1) > 0, "must be unsigned");

			assert(nDst >= nBytesX + nOffsetBytes);
			nDst -= (nOffsetBytes + nBytesX);

			for (uint32_t i = nBytesX; i--; x >>= 8)
				pDst[nDst + i] = (uint8_t) x;
		}

		template <typename T>
		static void _ExportAligned(T& out, const uint8_t* pDst, uint32_t nDst)
		{
			static_assert(T(-1) > 0, "must be unsigned");

			out = pDst[0];
			for (uint32_t i = 1; i < nDst; i++)
				out = (out << 8) | pDst[i];
		}
	};

	template <uint32_t nBytes_>
	struct uintBig_t
		:public uintBigImpl
	{
		static const uint32_t nBits = nBytes_ << 3;
		static const uint32_t nBytes = nBytes_;

		uintBig_t()
		{
		}

		uintBig_t(Zero_)
		{
			ZeroObject(m_pData);
		}

		uintBig_t(const uint8_t p[nBytes])
		{
			memcpy(m_pData, p, nBytes);
		}

		uintBig_t(const std::initializer_list<uint8_t>& v)
		{
			_Assign(m_pData, nBytes, v.begin(), static_cast<uint32_t>(v.size()));
		}

		uintBig_t(const Blob& v)
		{
			operator = (v);
		}

		template <typename T>
		uintBig_t(T x)
		{
			AssignOrdinal(x);
		}

		// in Big-Endian representation
		uint8_t m_pData[nBytes];

		uintBig_t& operator = (Zero_)
		{
			ZeroObject(m_pData);
			return *this;
		}

		template <uint32_t nBytesOther_>
		uintBig_t& operator = (const uintBig_t<nBytesOther_>& v)
		{
			_Assign(m_pData, nBytes, v.m_pData, v.nBytes);
			return *this;
		}

		uintBig_t& operator = (const Blob& v)
		{
			_Assign(m_pData, nBytes, static_cast<const uint8_t*>(v.p), v.n);
			return *this;
		}

		bool operator == (Zero_) const
		{
			return memis0(m_pData, nBytes);
		}

		bool operator != (Zero_) const
		{
			return !memis0(m_pData, nBytes);
		}

		template <typename T>
		void AssignOrdinal(T x)
		{
			static_assert(nBytes >= sizeof(x), "too small");
			memset0(m_pData, nBytes - sizeof(x));
			_AssignRangeAligned<T>(m_pData, nBytes, x, 0, sizeof(x));
		}

		// from ordinal types (unsigned)
		template <typename T>
		uintBig_t& operator = (T x)
		{
			AssignOrdinal(x);
			return *this;
		}

		template <typename T>
		void Export(T& x) const
		{
			static_assert(sizeof(T) >= nBytes, "");
			_ExportAligned(x, m_pData, nBytes);
		}

		template <uint32_t nBytesOther_>
		int cmp(const uintBig_t<nBytesOther_>& x) const
		{
			return _Cmp(m_pData, nBytes, x.m_pData, x.nBytes);
		}

		COMPARISON_VIA_CMP

		static const uint32_t nTxtLen = nBytes * 2; // not including 0-term

		void Print(char* sz) const
		{
			_Print(m_pData, nBytes, sz);
		}

		std::string str() const
		{
			char sz[nTxtLen + 1];
			Print(sz);
			return sz;
		}

		// exactly nTxtLen hex digits, optional "0x" prefix
		bool Scan(std::string_view sz)
		{
			return _Scan(m_pData, nBytes, sz);
		}

		friend std::ostream& operator << (std::ostream& s, const uintBig_t& x)
		{
			_Print(x.m_pData, x.nBytes, s);
			return s;
		}
	};

	template <typename T>
	struct uintBigFor {
		typedef uintBig_t<sizeof(T)> Type;
	};

	// big-endian bytes of an unsigned ordinal
	template <typename T>
	inline typename uintBigFor<T>::Type uintBigFrom(T x)
	{
		typename uintBigFor<T>::Type res;
		res.AssignOrdinal(x);
		return res;
	}

} // namespace yieldproxy
