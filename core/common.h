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
#include "uintBig.h"
#include <stdexcept>

namespace yieldproxy
{
	typedef uintBig_t<20> Address;

	static const Amount s_AmountMax = static_cast<Amount>(-1);

	namespace Strict
	{
		template <typename T>
		inline void Add(T& a, const T& b)
		{
			a += b;
			if (a < b)
				throw std::overflow_error("amount overflow");
		}

		template <typename T>
		inline void Sub(T& a, const T& b)
		{
			if (a < b)
				throw std::underflow_error("amount underflow");
			a -= b;
		}

	} // namespace Strict

	// floor(a * b / c), the product is evaluated in 128 bits. Throws if c is zero or the result doesn't fit
	Amount MulDiv(Amount a, Amount b, Amount c);

} // namespace yieldproxy
