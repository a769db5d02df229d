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
	// Plain fungible token. Balances, allowances and supply are host vars
	class Token
		:public Contract
		,public IToken
	{
	public:
		// minter may be zero, then Mint() is disabled
		Token(Host&, const Address& addr, const Address& minter);

		Amount get_BalanceOf(const Address&) const override;
		Amount get_Allowance(const Address& owner, const Address& spender) const override;
		Amount get_TotalSupply() const override;

		void Transfer(const Address& to, Amount) override;
		void Approve(const Address& spender, Amount) override;
		void TransferFrom(const Address& from, const Address& to, Amount) override;

		void Mint(const Address& to, Amount);

		void OnCall(const Blob& payload) override;

#pragma pack (push, 1)

		struct Tags
		{
			static const uint8_t Balance = 0;
			static const uint8_t Allowance = 1;
			static const uint8_t Supply = 2;
		};

		// event payloads
		struct Events
		{
			static const uint8_t Transfer = 0x10;
			static const uint8_t Approval = 0x11;

			struct TransferData {
				Address m_From; // zero for mint
				Address m_To; // zero for burn
				Amount m_Amount;
			};

			struct ApprovalData {
				Address m_Owner;
				Address m_Spender;
				Amount m_Amount;
			};
		};

#pragma pack (pop)

	protected:
		void MoveFunds(const Address& from, const Address& to, Amount);
		void MintRaw(const Address& to, Amount);
		void BurnRaw(const Address& from, Amount);
		void SpendAllowance(const Address& owner, const Address& spender, Amount);

	private:
		const Address m_Minter;

#pragma pack (push, 1)

		struct BalanceKey {
			uint8_t m_Tag = Tags::Balance;
			Address m_Account;
		};

		struct AllowanceKey {
			uint8_t m_Tag = Tags::Allowance;
			Address m_Owner;
			Address m_Spender;
		};

#pragma pack (pop)

		void SaveBalance(const Address&, Amount);
		void SaveAllowance(const Address& owner, const Address& spender, Amount);
		void SaveSupply(Amount);
		void EmitTransfer(const Address& from, const Address& to, Amount);
	};

} // namespace yieldproxy::chain
