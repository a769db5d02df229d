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
#include "host.h"

namespace yieldproxy::chain
{
	typedef uint32_t Selector;

	// Payload layout: [selector, big-endian][packed method struct][optional variable-size tail]
	namespace Abi
	{
		static const uint32_t s_SelectorSize = sizeof(Selector);

		void WriteSelector(ByteBuffer&, Selector);

		// returns false if the payload is too short
		bool ReadSelector(const Blob& payload, Selector&);

		template <typename TMethod>
		void Encode(ByteBuffer& res, const TMethod& args, const Blob& tail = Blob())
		{
			static_assert(std::is_trivially_copyable_v<TMethod>);

			WriteSelector(res, TMethod::s_Selector);

			const uint8_t* p = reinterpret_cast<const uint8_t*>(&args);
			res.insert(res.end(), p, p + sizeof(args));

			if (tail.n)
			{
				const uint8_t* pTail = static_cast<const uint8_t*>(tail.p);
				res.insert(res.end(), pTail, pTail + tail.n);
			}
		}

		template <typename TMethod>
		ByteBuffer Encode(const TMethod& args, const Blob& tail = Blob())
		{
			ByteBuffer res;
			Encode(res, args, tail);
			return res;
		}

		// Selector is assumed to be checked by the caller. If pTail is null - the payload must match exactly
		template <typename TMethod>
		const TMethod& Decode(const Blob& payload, Blob* pTail = nullptr)
		{
			static_assert(alignof(TMethod) == 1, "method args must be packed");

			uint32_t nSize = s_SelectorSize + sizeof(TMethod);
			if ((payload.n < nSize) || (!pTail && (payload.n != nSize)))
				throw RevertException("malformed call arguments");

			if (pTail)
				*pTail = payload.Tail(nSize);

			return *reinterpret_cast<const TMethod*>(static_cast<const uint8_t*>(payload.p) + s_SelectorSize);
		}

		// Sequential reader for variable-size tails
		struct Reader
		{
			Blob m_Data;

			explicit Reader(const Blob& d) :m_Data(d) {}

			const uint8_t* Consume(uint32_t n);

			template <typename T>
			T Read()
			{
				static_assert(std::is_trivially_copyable_v<T>);
				T x;
				memcpy(&x, Consume(sizeof(T)), sizeof(T));
				return x;
			}

			void EnsureEnd() const;
		};

	} // namespace Abi

} // namespace yieldproxy::chain
