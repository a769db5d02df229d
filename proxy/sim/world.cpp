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

#include "world.h"

namespace yieldproxy::sim
{
	using namespace chain;
	using namespace proxy;

	Address MakeAddress(const char* szName)
	{
		Address res;
		Hash::Processor()
			<< "yp.sim.addr"
			<< std::string(szName)
			>> res;
		return res;
	}

	World::World()
	{
		m_Addr.m_Owner = MakeAddress("owner");
		m_Addr.m_Treasury = MakeAddress("treasury");
		m_Addr.m_Operator = MakeAddress("operator");
		m_Addr.m_Minter = MakeAddress("minter");
		m_Addr.m_Asset = MakeAddress("asset");
		m_Addr.m_RewardToken = MakeAddress("reward");
		m_Addr.m_Vault = MakeAddress("vault");
		m_Addr.m_Executor = MakeAddress("executor");
		m_Addr.m_Permit = MakeAddress("permit");
		m_Addr.m_Verifier = MakeAddress("verifier");
		m_Addr.m_AllowList = MakeAddress("allow-list");
		m_Addr.m_Factory = MakeAddress("factory");
		m_Addr.m_Distributor = MakeAddress("distributor");

		m_ClientKey.Generate();
		m_ClientKey.get_Address(m_Client);

		m_Host.Deploy<Token>(m_Addr.m_Asset, m_Addr.m_Minter);
		m_Host.Deploy<Token>(m_Addr.m_RewardToken, m_Addr.m_Minter);
		m_Host.Deploy<Vault>(m_Addr.m_Vault, m_Addr.m_Asset);
		m_Host.Deploy<Executor>(m_Addr.m_Executor);
		m_Host.Deploy<SignatureChecker>(m_Addr.m_Verifier);
		m_Host.Deploy<PermitTransfer>(m_Addr.m_Permit, m_Addr.m_Verifier);
		m_Host.Deploy<SelectorAllowList>(m_Addr.m_AllowList, m_Addr.m_Owner);
		m_Host.Deploy<RewardDistributor>(m_Addr.m_Distributor, m_Addr.m_Owner);

		ProxyFactory::Settings s;
		s.m_Owner = m_Addr.m_Owner;
		s.m_Executor = m_Addr.m_Executor;
		s.m_Treasury = m_Addr.m_Treasury;
		s.m_Permit = m_Addr.m_Permit;
		s.m_Verifier = m_Addr.m_Verifier;
		s.m_AllowList = m_Addr.m_AllowList;
		m_Host.Deploy<ProxyFactory>(m_Addr.m_Factory, s);

		// all the proxy traffic goes through the executor bundles
		AllowCall(m_Addr.m_Executor, Method::Multicall::s_Selector, CallKind::Deposit);
		AllowCall(m_Addr.m_Executor, Method::Multicall::s_Selector, CallKind::Withdrawal);

		m_Host.Transact<ProxyFactory>(m_Addr.m_Owner, m_Addr.m_Factory, [this](ProxyFactory& f) {
			f.SetOperator(m_Addr.m_Operator, true);
		});

		// the client approves the permit contract once
		m_Host.Transact<Token>(m_Client, m_Addr.m_Asset, [this](Token& t) {
			t.Approve(m_Addr.m_Permit, s_AmountMax);
		});
	}

	Address World::CreateProxy(uint32_t feeBps)
	{
		Address res;
		m_Host.Transact<ProxyFactory>(m_Addr.m_Owner, m_Addr.m_Factory, [&](ProxyFactory& f) {
			res = f.CreateProxy(m_Client, feeBps);
		});
		return res;
	}

	void World::Mint(const Address& token, const Address& to, Amount val)
	{
		m_Host.Transact<Token>(m_Addr.m_Minter, token, [&](Token& t) {
			t.Mint(to, val);
		});
	}

	void World::AddYield(Amount val)
	{
		Mint(m_Addr.m_Asset, m_Addr.m_Vault, val);
	}

	Amount World::get_Balance(const Address& token, const Address& addr) const
	{
		return m_Host.get_Contract<IToken>(token).get_BalanceOf(addr);
	}

	void World::AllowCall(const Address& target, Selector sel, CallKind kind, bool bAllowed)
	{
		m_Host.Transact<SelectorAllowList>(m_Addr.m_Owner, m_Addr.m_AllowList, [&](SelectorAllowList& x) {
			x.SetRule(target, sel, kind, bAllowed);
		});
	}

	PermitAuthorization World::SignPermit(const Address& spender, const Address& token, Amount val)
	{
		auto& permit = m_Host.get_Contract<PermitTransfer>(m_Addr.m_Permit);

		PermitAuthorization res;
		PermitSingle& ps = res.m_Permit;
		ps.m_Token = token;
		ps.m_Amount = val;
		ps.m_Expiration = 0;
		ps.m_Nonce = permit.get_Allowance(m_Client, token, spender).m_Nonce;
		ps.m_Spender = spender;
		ps.m_SigDeadline = m_Host.m_Time + 3600;

		Hash::Value hv;
		ps.get_Hash(hv, m_Addr.m_Permit);
		m_ClientKey.Sign(res.m_Signature, hv);

		return res;
	}

	ByteBuffer World::BuildDepositBundle(const Address& receiver, Amount assets) const
	{
		Bundle b;
		{
			Method::Erc20TransferFrom args;
			args.m_Token = m_Addr.m_Asset;
			args.m_Receiver = m_Addr.m_Executor;
			args.m_Amount = assets;

			auto& c = b.m_vCalls.emplace_back();
			c.m_Target = m_Addr.m_Executor;
			Abi::Encode(c.m_Payload, args);
		}
		{
			Method::Erc4626Deposit args;
			args.m_Vault = m_Addr.m_Vault;
			args.m_Assets = assets;
			args.m_Receiver = receiver;

			auto& c = b.m_vCalls.emplace_back();
			c.m_Target = m_Addr.m_Executor;
			Abi::Encode(c.m_Payload, args);
		}

		ByteBuffer res;
		b.Encode(res);
		return res;
	}

	ByteBuffer World::BuildRedeemBundle(const Address& receiver, Amount shares) const
	{
		Method::Erc4626Redeem args;
		args.m_Vault = m_Addr.m_Vault;
		args.m_Shares = shares;
		args.m_Receiver = receiver;

		Bundle b;
		auto& c = b.m_vCalls.emplace_back();
		c.m_Target = m_Addr.m_Executor;
		Abi::Encode(c.m_Payload, args);

		ByteBuffer res;
		b.Encode(res);
		return res;
	}

	void World::Deposit(const Address& proxy, Amount val)
	{
		PermitAuthorization auth = SignPermit(proxy, m_Addr.m_Asset, val);
		ByteBuffer payload = BuildDepositBundle(proxy, val);

		m_Host.Transact<ProxyFactory>(m_Client, m_Addr.m_Factory, [&](ProxyFactory& f) {
			f.Deposit(proxy, m_Addr.m_Executor, payload, auth);
		});
	}

	void World::Withdraw(const Address& proxy, Amount shares)
	{
		ByteBuffer payload = BuildRedeemBundle(proxy, shares);

		m_Host.Transact<YieldProxy>(m_Client, proxy, [&](YieldProxy& p) {
			p.Withdraw(m_Addr.m_Executor, payload, m_Addr.m_Vault, shares);
		});
	}

	void World::PublishRewards(const std::vector<std::pair<Address, Amount> >& v)
	{
		Merkle::FixedTree t;
		for (const auto& x : v)
			RewardDistributor::get_LeafHash(t.m_vLeafs.emplace_back(), x.first, m_Addr.m_RewardToken, x.second);

		Merkle::HashValue hvRoot;
		t.get_Root(hvRoot);

		m_Host.Transact<RewardDistributor>(m_Addr.m_Owner, m_Addr.m_Distributor, [&](RewardDistributor& d) {
			d.SetRoot(hvRoot);
		});

		m_vRewards = v;
	}

	void World::get_RewardProof(Merkle::Proof& proof, const Address& account, Amount& claimable) const
	{
		Merkle::FixedTree t;
		size_t iLeaf = m_vRewards.size();

		for (size_t i = 0; i < m_vRewards.size(); i++)
		{
			const auto& x = m_vRewards[i];
			RewardDistributor::get_LeafHash(t.m_vLeafs.emplace_back(), x.first, m_Addr.m_RewardToken, x.second);
			if (x.first == account)
			{
				iLeaf = i;
				claimable = x.second;
			}
		}

		if (iLeaf == m_vRewards.size())
			throw std::runtime_error("no rewards for the account");

		t.get_Proof(proof, iLeaf);
	}

	void World::ClaimReward(const Address& proxy, const Address& caller)
	{
		Merkle::Proof proof;
		Amount claimable = 0;
		get_RewardProof(proof, proxy, claimable);

		m_Host.Transact<YieldProxy>(caller, proxy, [&](YieldProxy& p) {
			p.ClaimReward(m_Addr.m_Distributor, m_Addr.m_RewardToken, claimable, proof);
		});
	}

} // namespace yieldproxy::sim
