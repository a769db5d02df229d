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
#include "chain/interfaces.h"

namespace yieldproxy::proxy
{
	using chain::Selector;

	enum class CallKind : uint8_t
	{
		Deposit,
		Withdrawal,
		Unrestricted,
	};

	const char* get_CallKindName(CallKind);

	// Decides whether an opaque call may be forwarded. Rules are opaque to the proxy
	struct IAllowListChecker
	{
		virtual ~IAllowListChecker() = default;

		virtual bool Check(const Address& target, Selector, const Blob& remainder, CallKind) const = 0;
	};

	// What the proxy consumes from the factory that deployed it
	struct IProxyFactory
	{
		virtual ~IProxyFactory() = default;

		virtual bool CheckCalldata(const Address& target, Selector, const Blob& remainder, CallKind) const = 0;
		virtual bool IsClaimOperator(const Address&) const = 0;
	};

	// Signed authorization to pull the deposit from the client
	struct PermitAuthorization
	{
		chain::PermitSingle m_Permit;
		ByteBuffer m_Signature;
	};

	struct InterfaceId
	{
		static const uint32_t YieldProxy = 0x5ab1e7d2;
		static const uint32_t SignatureValidator = chain::ISignatureValidator::s_MagicValue;
	};

} // namespace yieldproxy::proxy
