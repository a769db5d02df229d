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

#include "permit_transfer.h"

namespace yieldproxy::chain
{
	PermitTransfer::PermitTransfer(Host& h, const Address& addr, const Address& verifier)
		:Contract(h, addr)
		,m_Verifier(verifier)
	{
	}

	IPermitTransfer::Allowance PermitTransfer::get_Allowance(const Address& owner, const Address& token, const Address& spender) const
	{
		AllowanceKey key;
		key.m_Owner = owner;
		key.m_Token = token;
		key.m_Spender = spender;

		Allowance ret;
		if (!LoadVar_T(key, ret))
			ZeroObject(ret);
		return ret;
	}

	void PermitTransfer::Permit(const Address& owner, const PermitSingle& ps, const Blob& signature)
	{
		if (get_Host().m_Time > ps.m_SigDeadline)
			throw RevertException("permit signature expired");

		Allowance a = get_Allowance(owner, ps.m_Token, ps.m_Spender);
		if (a.m_Nonce != ps.m_Nonce)
			throw RevertException("invalid permit nonce");

		Hash::Value hv;
		ps.get_Hash(hv, get_Address());

		if (!Far<ISignatureVerifier>(m_Verifier)->IsValidSignatureNow(owner, hv, signature))
			throw RevertException("invalid permit signature");

		a.m_Amount = ps.m_Amount;
		a.m_Expiration = ps.m_Expiration;
		a.m_Nonce++;

		AllowanceKey key;
		key.m_Owner = owner;
		key.m_Token = ps.m_Token;
		key.m_Spender = ps.m_Spender;
		SaveVar_T(key, a);
	}

	void PermitTransfer::TransferFrom(const Address& from, const Address& to, Amount amount, const Address& token)
	{
		Address spender = get_Caller();

		Allowance a = get_Allowance(from, token, spender);
		if (a.m_Expiration && (get_Host().m_Time > a.m_Expiration))
			throw RevertException("permit allowance expired");

		if (s_AmountMax != a.m_Amount)
		{
			if (a.m_Amount < amount)
				throw RevertException("insufficient permit allowance");

			a.m_Amount -= amount;

			AllowanceKey key;
			key.m_Owner = from;
			key.m_Token = token;
			key.m_Spender = spender;
			SaveVar_T(key, a);
		}

		Far<IToken>(token)->TransferFrom(from, to, amount);
	}

} // namespace yieldproxy::chain
