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

#include "signature_checker.h"
#include "core/ecdsa.h"

namespace yieldproxy::chain
{
	SignatureChecker::SignatureChecker(Host& h, const Address& addr)
		:Contract(h, addr)
	{
	}

	bool SignatureChecker::IsValidSignatureNow(const Address& signer, const Hash::Value& hv, const Blob& signature)
	{
		if (get_Host().IsContract(signer))
		{
			try
			{
				return ISignatureValidator::s_MagicValue == Far<ISignatureValidator>(signer)->ValidateSignature(hv, signature);
			}
			catch (const std::exception& e)
			{
				LOG_DEBUG() << "Contract signer " << signer << " rejected: " << e.what();
				return false;
			}
		}

		Address addr;
		if (!Ecdsa::RecoverSigner(addr, hv, signature))
			return false;

		return addr == signer;
	}

} // namespace yieldproxy::chain
