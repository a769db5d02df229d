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

#include "ecdsa.h"
#include <openssl/evp.h>
#include <openssl/core_names.h>
#include <openssl/param_build.h>

namespace yieldproxy {
namespace Ecdsa {

	namespace
	{
		const char s_szCurve[] = "secp256k1";

		struct PKeyCtx
		{
			EVP_PKEY_CTX* m_p;

			PKeyCtx(EVP_PKEY_CTX* p) :m_p(p)
			{
				if (!m_p)
					throw std::runtime_error("ecdsa: context allocation failed");
			}

			~PKeyCtx() { EVP_PKEY_CTX_free(m_p); }
		};

		struct PKeyGuard
		{
			EVP_PKEY* m_p = nullptr;
			~PKeyGuard() { EVP_PKEY_free(m_p); }
		};

		// returns false if the pubkey is malformed or not on the curve
		bool ImportPublic(PKeyGuard& res, const PublicKey& pk)
		{
			OSSL_PARAM_BLD* pBld = OSSL_PARAM_BLD_new();
			if (!pBld)
				throw std::runtime_error("ecdsa: param builder allocation failed");

			OSSL_PARAM* pParams = nullptr;
			if (OSSL_PARAM_BLD_push_utf8_string(pBld, OSSL_PKEY_PARAM_GROUP_NAME, s_szCurve, 0) &&
				OSSL_PARAM_BLD_push_octet_string(pBld, OSSL_PKEY_PARAM_PUB_KEY, pk.m_pData, pk.nBytes))
				pParams = OSSL_PARAM_BLD_to_param(pBld);

			OSSL_PARAM_BLD_free(pBld);

			if (!pParams)
				throw std::runtime_error("ecdsa: param build failed");

			bool bRes = false;
			{
				PKeyCtx ctx(EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr));
				bRes =
					(1 == EVP_PKEY_fromdata_init(ctx.m_p)) &&
					(1 == EVP_PKEY_fromdata(ctx.m_p, &res.m_p, EVP_PKEY_PUBLIC_KEY, pParams));
			}

			OSSL_PARAM_free(pParams);
			return bRes;
		}
	}

	PrivateKey::PrivateKey()
		:m_pKey(nullptr)
	{
	}

	PrivateKey::~PrivateKey()
	{
		EVP_PKEY_free(m_pKey);
	}

	void PrivateKey::Generate()
	{
		EVP_PKEY* pKey = EVP_PKEY_Q_keygen(nullptr, nullptr, "EC", s_szCurve);
		if (!pKey)
			throw std::runtime_error("ecdsa: keygen failed");

		EVP_PKEY_free(m_pKey);
		m_pKey = pKey;
	}

	void PrivateKey::get_PublicKey(PublicKey& pk) const
	{
		if (!m_pKey)
			throw std::runtime_error("ecdsa: no key");

		size_t n = 0;
		if ((1 != EVP_PKEY_get_octet_string_param(m_pKey, OSSL_PKEY_PARAM_PUB_KEY, pk.m_pData, pk.nBytes, &n)) || (n != pk.nBytes))
			throw std::runtime_error("ecdsa: pubkey export failed");
	}

	void PrivateKey::get_Address(Address& addr) const
	{
		PublicKey pk;
		get_PublicKey(pk);
		Ecdsa::get_Address(addr, pk);
	}

	void PrivateKey::SignRaw(ByteBuffer& sig, const Hash::Value& msg) const
	{
		if (!m_pKey)
			throw std::runtime_error("ecdsa: no key");

		PKeyCtx ctx(EVP_PKEY_CTX_new(m_pKey, nullptr));
		if (1 != EVP_PKEY_sign_init(ctx.m_p))
			throw std::runtime_error("ecdsa: sign init failed");

		size_t n = 0;
		if (1 != EVP_PKEY_sign(ctx.m_p, nullptr, &n, msg.m_pData, msg.nBytes))
			throw std::runtime_error("ecdsa: sign failed");

		sig.resize(n);
		if (1 != EVP_PKEY_sign(ctx.m_p, sig.data(), &n, msg.m_pData, msg.nBytes))
			throw std::runtime_error("ecdsa: sign failed");

		sig.resize(n);
	}

	void PrivateKey::Sign(ByteBuffer& sig, const Hash::Value& msg) const
	{
		PublicKey pk;
		get_PublicKey(pk);

		ByteBuffer der;
		SignRaw(der, msg);

		sig.assign(pk.m_pData, pk.m_pData + pk.nBytes);
		sig.insert(sig.end(), der.begin(), der.end());
	}

	void get_Address(Address& addr, const PublicKey& pk)
	{
		Hash::Processor() << pk >> addr;
	}

	bool VerifyRaw(const PublicKey& pk, const Hash::Value& msg, const Blob& sigDer)
	{
		if (!sigDer.n)
			return false;

		PKeyGuard key;
		if (!ImportPublic(key, pk))
			return false;

		PKeyCtx ctx(EVP_PKEY_CTX_new(key.m_p, nullptr));
		if (1 != EVP_PKEY_verify_init(ctx.m_p))
			return false;

		return 1 == EVP_PKEY_verify(ctx.m_p, static_cast<const uint8_t*>(sigDer.p), sigDer.n, msg.m_pData, msg.nBytes);
	}

	bool RecoverSigner(Address& addr, const Hash::Value& msg, const Blob& sig)
	{
		if (sig.n <= PublicKey::nBytes)
			return false;

		PublicKey pk;
		memcpy(pk.m_pData, sig.p, pk.nBytes);

		if (!VerifyRaw(pk, msg, sig.Tail(PublicKey::nBytes)))
			return false;

		get_Address(addr, pk);
		return true;
	}

} // namespace Ecdsa
} // namespace yieldproxy
