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

#include "token.h"

namespace yieldproxy::chain
{
	Token::Token(Host& h, const Address& addr, const Address& minter)
		:Contract(h, addr)
		,m_Minter(minter)
	{
	}

	Amount Token::get_BalanceOf(const Address& addr) const
	{
		BalanceKey key;
		key.m_Account = addr;

		Amount ret;
		return LoadVar_T(key, ret) ? ret : 0;
	}

	Amount Token::get_Allowance(const Address& owner, const Address& spender) const
	{
		AllowanceKey key;
		key.m_Owner = owner;
		key.m_Spender = spender;

		Amount ret;
		return LoadVar_T(key, ret) ? ret : 0;
	}

	Amount Token::get_TotalSupply() const
	{
		uint8_t key = Tags::Supply;

		Amount ret;
		return LoadVar_T(key, ret) ? ret : 0;
	}

	void Token::SaveBalance(const Address& addr, Amount val)
	{
		BalanceKey key;
		key.m_Account = addr;

		if (val)
			SaveVar_T(key, val);
		else
			DelVar_T(key);
	}

	void Token::SaveAllowance(const Address& owner, const Address& spender, Amount val)
	{
		AllowanceKey key;
		key.m_Owner = owner;
		key.m_Spender = spender;

		if (val)
			SaveVar_T(key, val);
		else
			DelVar_T(key);
	}

	void Token::SaveSupply(Amount val)
	{
		uint8_t key = Tags::Supply;
		SaveVar_T(key, val);
	}

	void Token::EmitTransfer(const Address& from, const Address& to, Amount amount)
	{
		Events::TransferData ev;
		ev.m_From = from;
		ev.m_To = to;
		ev.m_Amount = amount;
		EmitLog_T(Events::Transfer, ev);
	}

	void Token::MoveFunds(const Address& from, const Address& to, Amount amount)
	{
		if (to == Zero)
			throw RevertException("transfer to zero address");

		Amount valFrom = get_BalanceOf(from);
		if (valFrom < amount)
			throw RevertException("insufficient balance");

		if (from != to)
		{
			SaveBalance(from, valFrom - amount);

			Amount valTo = get_BalanceOf(to);
			Strict::Add(valTo, amount);
			SaveBalance(to, valTo);
		}

		EmitTransfer(from, to, amount);
	}

	void Token::MintRaw(const Address& to, Amount amount)
	{
		if (to == Zero)
			throw RevertException("mint to zero address");

		Amount supply = get_TotalSupply();
		Strict::Add(supply, amount);
		SaveSupply(supply);

		Amount val = get_BalanceOf(to);
		val += amount; // can't overflow, bounded by the supply
		SaveBalance(to, val);

		EmitTransfer(Zero, to, amount);
	}

	void Token::BurnRaw(const Address& from, Amount amount)
	{
		Amount val = get_BalanceOf(from);
		if (val < amount)
			throw RevertException("insufficient balance");
		SaveBalance(from, val - amount);

		SaveSupply(get_TotalSupply() - amount);

		EmitTransfer(from, Zero, amount);
	}

	void Token::SpendAllowance(const Address& owner, const Address& spender, Amount amount)
	{
		Amount val = get_Allowance(owner, spender);
		if (s_AmountMax == val)
			return; // unlimited

		if (val < amount)
			throw RevertException("insufficient allowance");

		SaveAllowance(owner, spender, val - amount);
	}

	void Token::Transfer(const Address& to, Amount amount)
	{
		MoveFunds(get_Caller(), to, amount);
	}

	void Token::Approve(const Address& spender, Amount amount)
	{
		if (spender == Zero)
			throw RevertException("approve to zero address");

		const Address& owner = get_Caller();
		SaveAllowance(owner, spender, amount);

		Events::ApprovalData ev;
		ev.m_Owner = owner;
		ev.m_Spender = spender;
		ev.m_Amount = amount;
		EmitLog_T(Events::Approval, ev);
	}

	void Token::TransferFrom(const Address& from, const Address& to, Amount amount)
	{
		SpendAllowance(from, get_Caller(), amount);
		MoveFunds(from, to, amount);
	}

	void Token::Mint(const Address& to, Amount amount)
	{
		if ((m_Minter == Zero) || (get_Caller() != m_Minter))
			throw RevertException("not the minter");

		MintRaw(to, amount);
	}

	void Token::OnCall(const Blob& payload)
	{
		Selector sel;
		if (!Abi::ReadSelector(payload, sel))
			throw RevertException("payload too short");

		switch (sel)
		{
		case Method::Transfer::s_Selector:
			{
				const auto& r = Abi::Decode<Method::Transfer>(payload);
				Transfer(r.m_To, r.m_Amount);
			}
			break;

		case Method::Approve::s_Selector:
			{
				const auto& r = Abi::Decode<Method::Approve>(payload);
				Approve(r.m_Spender, r.m_Amount);
			}
			break;

		case Method::TransferFrom::s_Selector:
			{
				const auto& r = Abi::Decode<Method::TransferFrom>(payload);
				TransferFrom(r.m_From, r.m_To, r.m_Amount);
			}
			break;

		default:
			Contract::OnCall(payload);
		}
	}

} // namespace yieldproxy::chain
