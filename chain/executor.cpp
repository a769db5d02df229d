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

#include "executor.h"

namespace yieldproxy::chain
{
	struct Executor::InitiatorScope
	{
		Address& m_Ref;

		InitiatorScope(Address& ref, const Address& val)
			:m_Ref(ref)
		{
			if (m_Ref != Zero)
				throw RevertException("nested multicall");
			m_Ref = val;
		}

		~InitiatorScope()
		{
			m_Ref = Zero;
		}
	};

	Executor::Executor(Host& h, const Address& addr)
		:Contract(h, addr)
		,m_Initiator(Zero)
	{
	}

	void Executor::Multicall(const Bundle& b)
	{
		InitiatorScope scope(m_Initiator, get_Caller());

		LOG_DEBUG() << "Multicall by " << m_Initiator << ", " << b.m_vCalls.size() << " calls";

		for (const auto& c : b.m_vCalls)
		{
			if (c.m_Target == get_Address())
				Dispatch(c.m_Payload);
			else
				CallFar(c.m_Target, c.m_Payload);
		}
	}

	void Executor::OnCall(const Blob& payload)
	{
		Selector sel;
		if (!Abi::ReadSelector(payload, sel))
			throw RevertException("payload too short");

		if (Method::Multicall::s_Selector != sel)
			throw RevertException("adapter called outside of a bundle");

		Abi::Reader r(payload.Tail(Abi::s_SelectorSize));
		Bundle b;
		b.Decode(r);

		Multicall(b);
	}

	void Executor::Dispatch(const Blob& payload)
	{
		Selector sel;
		if (!Abi::ReadSelector(payload, sel))
			throw RevertException("payload too short");

		switch (sel)
		{
		case Method::Erc20TransferFrom::s_Selector:
			OnAdapter(Abi::Decode<Method::Erc20TransferFrom>(payload));
			break;

		case Method::Erc4626Deposit::s_Selector:
			OnAdapter(Abi::Decode<Method::Erc4626Deposit>(payload));
			break;

		case Method::Erc4626Redeem::s_Selector:
			OnAdapter(Abi::Decode<Method::Erc4626Redeem>(payload));
			break;

		case Method::UrdClaim::s_Selector:
			{
				Blob tail;
				const auto& r = Abi::Decode<Method::UrdClaim>(payload, &tail);
				OnAdapter(r, tail);
			}
			break;

		default:
			throw RevertException("unknown adapter");
		}
	}

	void Executor::OnAdapter(const Method::Erc20TransferFrom& r)
	{
		Far<IToken>(r.m_Token)->TransferFrom(m_Initiator, r.m_Receiver, r.m_Amount);
	}

	void Executor::OnAdapter(const Method::Erc4626Deposit& r)
	{
		Address asset = Far<IVault>(r.m_Vault)->get_Asset();
		Far<IToken>(asset)->Approve(r.m_Vault, r.m_Assets);
		Far<IVault>(r.m_Vault)->Deposit(r.m_Assets, r.m_Receiver);
	}

	void Executor::OnAdapter(const Method::Erc4626Redeem& r)
	{
		Far<IVault>(r.m_Vault)->Redeem(r.m_Shares, r.m_Receiver, m_Initiator);
	}

	void Executor::OnAdapter(const Method::UrdClaim& r, const Blob& tail)
	{
		if (uint64_t(tail.n) != uint64_t(r.m_ProofNodes) * sizeof(Method::ProofNode))
			throw RevertException("proof size mismatch");

		Abi::Reader rd(tail);

		Merkle::Proof proof;
		proof.resize(r.m_ProofNodes);
		for (auto& n : proof)
		{
			auto pn = rd.Read<Method::ProofNode>();
			n.first = !!pn.m_OnRight;
			n.second = pn.m_Hash;
		}
		rd.EnsureEnd();

		Amount val = Far<IRewardDistributor>(r.m_Distributor)->Claim(r.m_Account, r.m_Reward, r.m_Claimable, proof);
		LOG_DEBUG() << "Reward claimed for " << r.m_Account << ": " << val;
	}

	void Executor::BuildClaim(ByteBuffer& res, const Address& distributor, const Address& account, const Address& reward, Amount claimable, const Merkle::Proof& proof)
	{
		Method::UrdClaim args;
		args.m_Distributor = distributor;
		args.m_Account = account;
		args.m_Reward = reward;
		args.m_Claimable = claimable;
		args.m_ProofNodes = static_cast<uint32_t>(proof.size());

		ByteBuffer tail;
		for (const auto& n : proof)
		{
			Method::ProofNode pn;
			pn.m_OnRight = n.first;
			pn.m_Hash = n.second;

			const uint8_t* p = reinterpret_cast<const uint8_t*>(&pn);
			tail.insert(tail.end(), p, p + sizeof(pn));
		}

		Abi::Encode(res, args, tail);
	}

} // namespace yieldproxy::chain
