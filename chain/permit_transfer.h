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
#include "interfaces.h"

namespace yieldproxy::chain
{
	// Signature-based token movement. Holders approve this contract once on the token,
	// then grant per-spender allowances by signed PermitSingle messages.
	class PermitTransfer
		:public Contract
		,public IPermitTransfer
	{
	public:
		PermitTransfer(Host&, const Address& addr, const Address& verifier);

		void Permit(const Address& owner, const PermitSingle&, const Blob& signature) override;
		void TransferFrom(const Address& from, const Address& to, Amount, const Address& token) override;
		Allowance get_Allowance(const Address& owner, const Address& token, const Address& spender) const override;

	private:
		const Address m_Verifier;

#pragma pack (push, 1)
		struct AllowanceKey {
			Address m_Owner;
			Address m_Token;
			Address m_Spender;
		};
#pragma pack (pop)
	};

} // namespace yieldproxy::chain
