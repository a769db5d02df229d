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
#include "access.h"
#include "forwarder.h"
#include "fee_split.h"
#include "events.h"

namespace yieldproxy::proxy
{
	// Custodial proxy of a single client. Holds the client's funds, forwards validated calls to the yield protocol
	// and splits the realized profit between the client and the treasury.
	class YieldProxy
		:public chain::Contract
		,public chain::ISignatureValidator
	{
	public:
		struct Immutables
		{
			Address m_Executor;
			Address m_Factory;
			Address m_Treasury;
			Address m_Permit;
			Address m_Verifier;
		};

		YieldProxy(chain::Host&, const Address& addr, const Immutables&);

		// factory only, once
		void Initialize(const Address& client, uint32_t feeBps);

		// factory only. Pulls the permitted amount from the client and forwards the payload
		void Deposit(const Address& target, const Blob& payload, const PermitAuthorization&);

		// client only. Lets target spend the shares, forwards the payload, splits what the proxy received
		void Withdraw(const Address& target, const Blob& payload, const Address& vault, Amount shares);

		// client only
		void CallAnyFunction(const Address& target, const Blob& payload);

		// client or a claim operator approved by the factory
		void ClaimReward(const Address& distributor, const Address& reward, Amount claimable, const Merkle::Proof&);

		bool CheckCalldata(const Address& target, Selector, const Blob& remainder, CallKind) const;

		uint32_t ValidateSignature(const Hash::Value&, const Blob& signature) const override;

		bool SupportsInterface(uint32_t id) const;

		// accessors
		const Immutables& get_Immutables() const { return m_Immutables; }
		const ProxyLedger& get_Ledger() const { return m_Ledger; }
		Address get_Client() const { return m_Ledger.get_Client(); }
		uint16_t get_FeeBps() const { return m_Ledger.get_FeeBps(); }
		Amount get_Deposited(const Address& asset) const { return m_Ledger.get_Deposited(asset); }
		Amount get_Withdrawn(const Address& asset) const { return m_Ledger.get_Withdrawn(asset); }
		Amount get_RealizedProfit(const Address& asset) const { return m_Ledger.get_RealizedProfit(asset); }

	private:
		const Immutables m_Immutables;
		ProxyLedger m_Ledger;
		AccessController m_Access;
		CalldataForwarder m_Forwarder;
		ReentrancyGuard m_Guard;

		void EnsureInitialized() const;
		void EnsureCalldata(const Address& target, const Blob& payload, CallKind) const;
		Amount get_OwnBalance(const Address& token) const;
		void PayOut(const Address& token, const Address& to, Amount) const;
	};

} // namespace yieldproxy::proxy
