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

namespace yieldproxy::proxy
{
	// Executes an opaque call on behalf of the proxy. No validation here: a failure of the target aborts the enclosing operation.
	class CalldataForwarder
	{
	public:
		CalldataForwarder(chain::Host&, const Address& self);

		void Forward(const Address& target, const Blob& payload) const;

	private:
		chain::Host& m_Host;
		const Address& m_Self;
	};

} // namespace yieldproxy::proxy
