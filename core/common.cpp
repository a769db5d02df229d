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

#include "common.h"
#include <boost/multiprecision/cpp_int.hpp>

namespace yieldproxy
{
	Amount MulDiv(Amount a, Amount b, Amount c)
	{
		if (!c)
			throw std::domain_error("division by zero");

		boost::multiprecision::uint128_t x = a;
		x *= b;
		x /= c;

		if (x > s_AmountMax)
			throw std::overflow_error("amount overflow");

		return static_cast<Amount>(x);
	}

} // namespace yieldproxy
