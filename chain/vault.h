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
#include "token.h"

namespace yieldproxy::chain
{
	// Share vault over a single underlying asset. Shares are the vault's own token.
	// Assets transferred to the vault directly are treated as yield and raise the share price.
	class Vault
		:public Token
		,public IVault
	{
	public:
		Vault(Host&, const Address& addr, const Address& asset);

		Address get_Asset() const override { return m_Asset; }
		Amount get_TotalAssets() const override;
		Amount ConvertToAssets(Amount shares) const override;
		Amount ConvertToShares(Amount assets) const;

		Amount Deposit(Amount assets, const Address& receiver) override;
		Amount Redeem(Amount shares, const Address& receiver, const Address& owner) override;

		void OnCall(const Blob& payload) override;

	private:
		const Address m_Asset;
	};

} // namespace yieldproxy::chain
