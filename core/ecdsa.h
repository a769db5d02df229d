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
#include "hash.h"

typedef struct evp_pkey_st EVP_PKEY;

namespace yieldproxy
{
	// ECDSA over secp256k1.
	// Account address is the trailing 20 bytes of sha256(uncompressed pubkey).
	// Signature blob: [65-byte uncompressed pubkey][DER signature]
	namespace Ecdsa
	{
		typedef uintBig_t<65> PublicKey;

		class PrivateKey
		{
			EVP_PKEY* m_pKey;

		public:
			PrivateKey();
			~PrivateKey();

			PrivateKey(const PrivateKey&) = delete;
			PrivateKey& operator = (const PrivateKey&) = delete;

			void Generate();
			bool IsValid() const { return m_pKey != nullptr; }

			void get_PublicKey(PublicKey&) const;
			void get_Address(Address&) const;

			// raw DER signature over the digest
			void SignRaw(ByteBuffer& sig, const Hash::Value& msg) const;

			// signature blob, suitable for RecoverSigner()
			void Sign(ByteBuffer& sig, const Hash::Value& msg) const;
		};

		void get_Address(Address&, const PublicKey&);

		bool VerifyRaw(const PublicKey&, const Hash::Value& msg, const Blob& sigDer);

		// verifies the blob, and on success returns the address derived from the embedded pubkey
		bool RecoverSigner(Address&, const Hash::Value& msg, const Blob& sig);

	} // namespace Ecdsa

} // namespace yieldproxy
