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

#include "forwarder.h"

namespace yieldproxy::proxy
{
	CalldataForwarder::CalldataForwarder(chain::Host& h, const Address& self)
		:m_Host(h)
		,m_Self(self)
	{
	}

	void CalldataForwarder::Forward(const Address& target, const Blob& payload) const
	{
		LOG_DEBUG() << "Forwarding " << payload.n << " bytes from " << m_Self << " to " << target;
		m_Host.CallFar(m_Self, target, payload);
	}

} // namespace yieldproxy::proxy
