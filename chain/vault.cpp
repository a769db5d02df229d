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

#include "vault.h"

namespace yieldproxy::chain
{
	Vault::Vault(Host& h, const Address& addr, const Address& asset)
		:Token(h, addr, Zero)
		,m_Asset(asset)
	{
	}

	Amount Vault::get_TotalAssets() const
	{
		return Far<IToken>(m_Asset)->get_BalanceOf(get_Address());
	}

	Amount Vault::ConvertToAssets(Amount shares) const
	{
		Amount supply = get_TotalSupply();
		if (!supply)
			return shares;

		return MulDiv(shares, get_TotalAssets(), supply);
	}

	Amount Vault::ConvertToShares(Amount assets) const
	{
		Amount supply = get_TotalSupply();
		Amount total = get_TotalAssets();
		if (!supply || !total)
			return assets;

		return MulDiv(assets, supply, total);
	}

	Amount Vault::Deposit(Amount assets, const Address& receiver)
	{
		Address caller = get_Caller();

		Amount shares = ConvertToShares(assets);
		if (!shares)
			throw RevertException("zero shares");

		Far<IToken>(m_Asset)->TransferFrom(caller, get_Address(), assets);
		MintRaw(receiver, shares);

		LOG_DEBUG() << "Vault " << get_Address() << " deposit " << assets << " -> " << shares << " shares";
		return shares;
	}

	Amount Vault::Redeem(Amount shares, const Address& receiver, const Address& owner)
	{
		Address caller = get_Caller();
		if (caller != owner)
			SpendAllowance(owner, caller, shares);

		Amount assets = ConvertToAssets(shares);
		BurnRaw(owner, shares);

		Far<IToken>(m_Asset)->Transfer(receiver, assets);

		LOG_DEBUG() << "Vault " << get_Address() << " redeem " << shares << " shares -> " << assets;
		return assets;
	}

	void Vault::OnCall(const Blob& payload)
	{
		Selector sel;
		if (!Abi::ReadSelector(payload, sel))
			throw RevertException("payload too short");

		switch (sel)
		{
		case Method::VaultDeposit::s_Selector:
			{
				const auto& r = Abi::Decode<Method::VaultDeposit>(payload);
				Deposit(r.m_Assets, r.m_Receiver);
			}
			break;

		case Method::VaultRedeem::s_Selector:
			{
				const auto& r = Abi::Decode<Method::VaultRedeem>(payload);
				Redeem(r.m_Shares, r.m_Receiver, r.m_Owner);
			}
			break;

		default:
			Token::OnCall(payload);
		}
	}

} // namespace yieldproxy::chain
