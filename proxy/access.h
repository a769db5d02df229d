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
#include "ledger.h"
#include "errors.h"

namespace yieldproxy::proxy
{
	// Role predicates. Failures carry the actual and the expected identity
	class AccessController
	{
	public:
		AccessController(const Address& factory, const ProxyLedger&);

		void EnsureFactory(const Address& caller) const;
		void EnsureClient(const Address& caller) const;

		bool IsClient(const Address& caller) const;

		const Address& get_Factory() const { return m_Factory; }

	private:
		const Address& m_Factory;
		const ProxyLedger& m_Ledger;
	};

	// Flag set for the duration of a guarded operation. Not a host var: it never outlives the call.
	class ReentrancyGuard
	{
	public:
		bool IsEntered() const { return m_Entered; }

		class Scope
		{
		public:
			explicit Scope(ReentrancyGuard&);
			~Scope();

			Scope(const Scope&) = delete;
			Scope& operator = (const Scope&) = delete;

		private:
			ReentrancyGuard& m_Guard;
		};

	private:
		bool m_Entered = false;
	};

} // namespace yieldproxy::proxy
