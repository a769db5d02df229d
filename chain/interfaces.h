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
#include "abi.h"
#include "core/hash.h"
#include "core/merkle.h"

namespace yieldproxy::chain
{
	// Fungible token
	struct IToken
	{
		virtual ~IToken() = default;

		virtual Amount get_BalanceOf(const Address&) const = 0;
		virtual Amount get_Allowance(const Address& owner, const Address& spender) const = 0;
		virtual Amount get_TotalSupply() const = 0;

		virtual void Transfer(const Address& to, Amount) = 0;
		virtual void Approve(const Address& spender, Amount) = 0; // s_AmountMax is never decremented
		virtual void TransferFrom(const Address& from, const Address& to, Amount) = 0;
	};

	// Shares redeemable for the underlying asset. The shares themselves are IToken
	struct IVault
	{
		virtual ~IVault() = default;

		virtual Address get_Asset() const = 0;
		virtual Amount get_TotalAssets() const = 0;
		virtual Amount ConvertToAssets(Amount shares) const = 0;

		// pulls assets from the caller, returns minted shares
		virtual Amount Deposit(Amount assets, const Address& receiver) = 0;
		// burns the owner shares (caller must be the owner or have the allowance), returns released assets
		virtual Amount Redeem(Amount shares, const Address& receiver, const Address& owner) = 0;
	};

	// Cumulative merkle-rooted rewards
	struct IRewardDistributor
	{
		virtual ~IRewardDistributor() = default;

		// pays (claimable - already claimed) to the account, returns the paid amount (may be 0)
		virtual Amount Claim(const Address& account, const Address& reward, Amount claimable, const Merkle::Proof&) = 0;
		virtual Amount get_Claimed(const Address& account, const Address& reward) const = 0;
	};

	// Contract signer
	struct ISignatureValidator
	{
		static const uint32_t s_MagicValue = 0x1626ba7e;

		virtual ~ISignatureValidator() = default;

		// returns s_MagicValue if valid, throws otherwise
		virtual uint32_t ValidateSignature(const Hash::Value&, const Blob& signature) const = 0;
	};

	// Signature check for both key-owned accounts and contract signers
	struct ISignatureVerifier
	{
		virtual ~ISignatureVerifier() = default;

		virtual bool IsValidSignatureNow(const Address& signer, const Hash::Value&, const Blob& signature) = 0;
	};

#pragma pack (push, 1)

	// Signed authorization for IPermitTransfer
	struct PermitSingle
	{
		Address m_Token;
		Amount m_Amount;
		Timestamp m_Expiration; // of the resulting allowance, 0 = never
		uint64_t m_Nonce;
		Address m_Spender;
		Timestamp m_SigDeadline;

		// domain is the address of the permit contract
		void get_Hash(Hash::Value&, const Address& domain) const;
	};

#pragma pack (pop)

	// Pulls tokens from holders that approved this contract once, according to their signed permits
	struct IPermitTransfer
	{
		struct Allowance
		{
			Amount m_Amount;
			Timestamp m_Expiration;
			uint64_t m_Nonce;
		};

		virtual ~IPermitTransfer() = default;

		virtual void Permit(const Address& owner, const PermitSingle&, const Blob& signature) = 0;
		// caller is the spender
		virtual void TransferFrom(const Address& from, const Address& to, Amount, const Address& token) = 0;
		virtual Allowance get_Allowance(const Address& owner, const Address& token, const Address& spender) const = 0;
	};

	// Ordered list of calls, executed atomically
	struct Bundle
	{
		struct Call
		{
			Address m_Target;
			ByteBuffer m_Payload;
		};

		std::vector<Call> m_vCalls;

		void Encode(ByteBuffer&) const; // as a Multicall payload
		void Decode(Abi::Reader&);
	};

	struct IExecutor
	{
		virtual ~IExecutor() = default;

		// caller becomes the initiator for the duration of the bundle
		virtual void Multicall(const Bundle&) = 0;
		virtual const Address& get_Initiator() const = 0;
	};

	namespace Method
	{
#pragma pack (push, 1)

		// IToken
		struct Transfer {
			static const Selector s_Selector = 0xa9059cbb;
			Address m_To;
			Amount m_Amount;
		};

		struct Approve {
			static const Selector s_Selector = 0x095ea7b3;
			Address m_Spender;
			Amount m_Amount;
		};

		struct TransferFrom {
			static const Selector s_Selector = 0x23b872dd;
			Address m_From;
			Address m_To;
			Amount m_Amount;
		};

		// IVault
		struct VaultDeposit {
			static const Selector s_Selector = 0x6e553f65;
			Amount m_Assets;
			Address m_Receiver;
		};

		struct VaultRedeem {
			static const Selector s_Selector = 0xba087652;
			Amount m_Shares;
			Address m_Receiver;
			Address m_Owner;
		};

		// IExecutor, followed by the encoded calls
		struct Multicall {
			static const Selector s_Selector = 0x374f435d;
			uint32_t m_Calls;
		};

		// Executor adapters. Valid only as calls targeting the executor within a bundle
		struct Erc20TransferFrom {
			static const Selector s_Selector = 0xd96ca0b9;
			Address m_Token;
			Address m_Receiver;
			Amount m_Amount; // pulled from the initiator
		};

		struct Erc4626Deposit {
			static const Selector s_Selector = 0x6ef5eeae;
			Address m_Vault;
			Amount m_Assets; // held by the executor
			Address m_Receiver;
		};

		struct Erc4626Redeem {
			static const Selector s_Selector = 0xa7f6e606;
			Address m_Vault;
			Amount m_Shares; // of the initiator
			Address m_Receiver;
		};

		// followed by m_ProofNodes of ProofNode
		struct UrdClaim {
			static const Selector s_Selector = 0x7034b2a5;
			Address m_Distributor;
			Address m_Account;
			Address m_Reward;
			Amount m_Claimable;
			uint32_t m_ProofNodes;
		};

		struct ProofNode {
			uint8_t m_OnRight;
			Hash::Value m_Hash;
		};

#pragma pack (pop)
	} // namespace Method

} // namespace yieldproxy::chain
