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
#include "proxy/factory.h"
#include "proxy/allow_list.h"
#include "chain/token.h"
#include "chain/vault.h"
#include "chain/executor.h"
#include "chain/permit_transfer.h"
#include "chain/reward_distributor.h"
#include "chain/signature_checker.h"
#include "core/ecdsa.h"

namespace yieldproxy::sim
{
	// deterministic address for a named actor or contract
	Address MakeAddress(const char* szName);

	// Fresh host with the factory and all its collaborators deployed, and one key-owned client.
	// All the mutations are submitted as host transactions.
	class World
	{
	public:
		chain::Host m_Host;

		struct Addresses
		{
			Address m_Owner;
			Address m_Treasury;
			Address m_Operator;
			Address m_Minter;
			Address m_Asset;
			Address m_RewardToken;
			Address m_Vault;
			Address m_Executor;
			Address m_Permit;
			Address m_Verifier;
			Address m_AllowList;
			Address m_Factory;
			Address m_Distributor;
		} m_Addr;

		Ecdsa::PrivateKey m_ClientKey;
		Address m_Client;

		World();

		// factory owner creates the proxy for m_Client
		Address CreateProxy(uint32_t feeBps);

		void Mint(const Address& token, const Address& to, Amount);
		void AddYield(Amount); // assets sent directly to the vault
		Amount get_Balance(const Address& token, const Address& addr) const;
		Amount get_Shares(const Address& addr) const { return get_Balance(m_Addr.m_Vault, addr); }

		void AllowCall(const Address& target, chain::Selector, proxy::CallKind, bool bAllowed = true);

		proxy::PermitAuthorization SignPermit(const Address& spender, const Address& token, Amount);

		// executor bundles
		ByteBuffer BuildDepositBundle(const Address& receiver, Amount assets) const;
		ByteBuffer BuildRedeemBundle(const Address& receiver, Amount shares) const;

		// submitted by the client via the factory
		void Deposit(const Address& proxy, Amount);
		// submitted by the client
		void Withdraw(const Address& proxy, Amount shares);

		// publishes the cumulative rewards tree, keeps the proofs
		void PublishRewards(const std::vector<std::pair<Address, Amount> >&);
		void get_RewardProof(Merkle::Proof&, const Address& account, Amount& claimable) const;
		void ClaimReward(const Address& proxy, const Address& caller);

		proxy::YieldProxy& get_Proxy(const Address& proxy) const { return m_Host.get_Contract<proxy::YieldProxy>(proxy); }

	private:
		std::vector<std::pair<Address, Amount> > m_vRewards;
	};

} // namespace yieldproxy::sim
