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

#include "yield_proxy.h"
#include "chain/executor.h"

namespace yieldproxy::proxy
{
	using namespace chain;

	YieldProxy::YieldProxy(Host& h, const Address& addr, const Immutables& imm)
		:Contract(h, addr)
		,m_Immutables(imm)
		,m_Ledger(get_Vars())
		,m_Access(m_Immutables.m_Factory, m_Ledger)
		,m_Forwarder(h, get_Address())
	{
	}

	void YieldProxy::EnsureInitialized() const
	{
		if (!m_Ledger.IsInitialized())
			throw ProxyException(ProxyError::NotInitialized);
	}

	void YieldProxy::EnsureCalldata(const Address& target, const Blob& payload, CallKind kind) const
	{
		Selector sel;
		if (!Abi::ReadSelector(payload, sel))
			throw ProxyException(ProxyError::CalldataTooShort);

		if (!CheckCalldata(target, sel, payload.Tail(Abi::s_SelectorSize), kind))
			throw ProxyException(ProxyError::CalldataNotAllowed);
	}

	Amount YieldProxy::get_OwnBalance(const Address& token) const
	{
		return Far<IToken>(token)->get_BalanceOf(get_Address());
	}

	void YieldProxy::PayOut(const Address& token, const Address& to, Amount val) const
	{
		Far<IToken>(token)->Transfer(to, val);
	}

	void YieldProxy::Initialize(const Address& client, uint32_t feeBps)
	{
		m_Access.EnsureFactory(get_Caller());

		if (!FeeSplit::IsValidFeeRate(feeBps))
			throw ProxyException(ProxyError::InvalidFeeRate);

		if (m_Ledger.IsInitialized())
			throw ProxyException(ProxyError::AlreadyInitialized);

		if (client == Zero)
			throw ProxyException(ProxyError::ZeroClient);

		m_Ledger.SetParams(client, static_cast<uint16_t>(feeBps));

		Events::Initialized ev;
		ev.m_Client = client;
		ev.m_FeeBps = static_cast<uint16_t>(feeBps);
		EmitLog_T(Events::Initialized::s_Tag, ev);

		LOG_INFO() << "Proxy " << get_Address() << " initialized, client=" << client << " feeBps=" << feeBps;
	}

	void YieldProxy::Deposit(const Address& target, const Blob& payload, const PermitAuthorization& auth)
	{
		m_Access.EnsureFactory(get_Caller());
		EnsureInitialized();

		const PermitSingle& ps = auth.m_Permit;
		Address asset = ps.m_Token;
		Amount amount = ps.m_Amount;

		if (asset == Zero)
			throw ProxyException(ProxyError::ZeroAddressAsset);
		if (!amount)
			throw ProxyException(ProxyError::ZeroDepositAmount);

		Amount total = m_Ledger.RecordDeposit(asset, amount);

		Address client = m_Ledger.get_Client();
		{
			auto pPermit = Far<IPermitTransfer>(m_Immutables.m_Permit);
			pPermit->Permit(client, ps, auth.m_Signature);
			pPermit->TransferFrom(client, get_Address(), amount, asset);
		}

		{
			auto pToken = Far<IToken>(asset);
			if (!pToken->get_Allowance(get_Address(), m_Immutables.m_Executor))
			{
				LOG_DEBUG() << "Proxy " << get_Address() << " grants unlimited allowance of " << asset << " to the executor";
				pToken->Approve(m_Immutables.m_Executor, s_AmountMax);
			}
		}

		m_Forwarder.Forward(target, payload);

		Events::Deposited ev;
		ev.m_Target = target;
		ev.m_Asset = asset;
		ev.m_Amount = amount;
		ev.m_TotalDeposited = total;
		EmitLog_T(Events::Deposited::s_Tag, ev);

		LOG_INFO() << "Proxy " << get_Address() << " deposited " << amount << " of " << asset << ", total " << total;
	}

	void YieldProxy::Withdraw(const Address& target, const Blob& payload, const Address& vault, Amount shares)
	{
		ReentrancyGuard::Scope scope(m_Guard);
		m_Access.EnsureClient(get_Caller());
		EnsureCalldata(target, payload, CallKind::Withdrawal);

		if (!shares)
			throw ProxyException(ProxyError::ZeroSharesWithdrawal);

		Address asset = Far<IVault>(vault)->get_Asset();
		Far<IToken>(vault)->Approve(target, shares);

		Amount before = get_OwnBalance(asset);
		m_Forwarder.Forward(target, payload);
		Amount released = get_OwnBalance(asset);
		Strict::Sub(released, before);

		FeeSplit::Result res = FeeSplit::ForWithdrawal(
			m_Ledger.get_Deposited(asset),
			m_Ledger.get_Withdrawn(asset),
			released,
			m_Ledger.get_FeeBps());

		Amount total = m_Ledger.RecordWithdrawal(asset, released);

		if (res.m_Fee)
			PayOut(asset, m_Immutables.m_Treasury, res.m_Fee);
		PayOut(asset, m_Ledger.get_Client(), res.m_Client);

		Events::Withdrawn ev;
		ev.m_Target = target;
		ev.m_Vault = vault;
		ev.m_Asset = asset;
		ev.m_Shares = shares;
		ev.m_Released = released;
		ev.m_TotalWithdrawn = total;
		ev.m_NewProfit = res.m_NewProfit;
		ev.m_Fee = res.m_Fee;
		ev.m_Client = res.m_Client;
		EmitLog_T(Events::Withdrawn::s_Tag, ev);

		LOG_INFO() << "Proxy " << get_Address() << " withdrew " << released << " of " << asset
			<< ", profit " << res.m_NewProfit << ", fee " << res.m_Fee << ", client " << res.m_Client;
	}

	void YieldProxy::CallAnyFunction(const Address& target, const Blob& payload)
	{
		ReentrancyGuard::Scope scope(m_Guard);
		m_Access.EnsureClient(get_Caller());
		EnsureCalldata(target, payload, CallKind::Unrestricted);

		m_Forwarder.Forward(target, payload);

		Events::CalledAsAnyFunction ev;
		ev.m_Target = target;
		EmitLog_T(Events::CalledAsAnyFunction::s_Tag, ev);

		LOG_INFO() << "Proxy " << get_Address() << " called " << target;
	}

	void YieldProxy::ClaimReward(const Address& distributor, const Address& reward, Amount claimable, const Merkle::Proof& proof)
	{
		ReentrancyGuard::Scope scope(m_Guard);

		Address caller = get_Caller();
		if (!m_Access.IsClient(caller))
		{
			EnsureInitialized();
			if (!Far<IProxyFactory>(m_Access.get_Factory())->IsClaimOperator(caller))
				throw UnauthorizedCallerException(caller, m_Ledger.get_Client());
		}

		Bundle b;
		auto& c = b.m_vCalls.emplace_back();
		c.m_Target = m_Immutables.m_Executor;
		Executor::BuildClaim(c.m_Payload, distributor, get_Address(), reward, claimable, proof);

		Amount before = get_OwnBalance(reward);
		Far<IExecutor>(m_Immutables.m_Executor)->Multicall(b);
		Amount claimed = get_OwnBalance(reward);
		Strict::Sub(claimed, before);

		if (!claimed)
			throw ProxyException(ProxyError::NothingClaimed);

		FeeSplit::Result res = FeeSplit::ForReward(claimed, m_Ledger.get_FeeBps());

		if (res.m_Fee)
			PayOut(reward, m_Immutables.m_Treasury, res.m_Fee);
		PayOut(reward, m_Ledger.get_Client(), res.m_Client);

		Events::ClaimedReward ev;
		ev.m_Distributor = distributor;
		ev.m_Reward = reward;
		ev.m_Claimed = claimed;
		ev.m_Fee = res.m_Fee;
		ev.m_Client = res.m_Client;
		EmitLog_T(Events::ClaimedReward::s_Tag, ev);

		LOG_INFO() << "Proxy " << get_Address() << " claimed " << claimed << " of " << reward
			<< ", fee " << res.m_Fee << ", client " << res.m_Client;
	}

	bool YieldProxy::CheckCalldata(const Address& target, Selector sel, const Blob& remainder, CallKind kind) const
	{
		return Far<IProxyFactory>(m_Access.get_Factory())->CheckCalldata(target, sel, remainder, kind);
	}

	uint32_t YieldProxy::ValidateSignature(const Hash::Value& hv, const Blob& signature) const
	{
		EnsureInitialized();

		if (!Far<ISignatureVerifier>(m_Immutables.m_Verifier)->IsValidSignatureNow(m_Ledger.get_Client(), hv, signature))
			throw ProxyException(ProxyError::InvalidSignature);

		return s_MagicValue;
	}

	bool YieldProxy::SupportsInterface(uint32_t id) const
	{
		return (InterfaceId::YieldProxy == id) || (InterfaceId::SignatureValidator == id);
	}

} // namespace yieldproxy::proxy
