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

#include "hash.h"
#include <openssl/evp.h>
#include <new>

namespace yieldproxy
{
	Hash::Processor::Processor()
		:m_bInitialized(false)
	{
		m_pCtx = EVP_MD_CTX_new();
		if (!m_pCtx)
			throw std::bad_alloc();
	}

	Hash::Processor::~Processor()
	{
		EVP_MD_CTX_free(m_pCtx);
	}

	void Hash::Processor::Reset()
	{
		if (1 != EVP_DigestInit_ex(m_pCtx, EVP_sha256(), nullptr))
			throw std::runtime_error("sha256 init failed");
		m_bInitialized = true;
	}

	void Hash::Processor::Write(const void* p, uint32_t n)
	{
		if (!m_bInitialized)
			Reset();

		if (1 != EVP_DigestUpdate(m_pCtx, p, n))
			throw std::runtime_error("sha256 update failed");
	}

	void Hash::Processor::Write(bool b)
	{
		Write(uint8_t(b ? 1 : 0));
	}

	void Hash::Processor::Write(uint8_t x)
	{
		Write(&x, sizeof(x));
	}

	void Hash::Processor::Write(const Blob& v)
	{
		Write(v.n);
		Write(v.p, v.n);
	}

	void Hash::Processor::Finalize(Value& hv)
	{
		if (!m_bInitialized)
			Reset();

		unsigned int n = 0;
		if ((1 != EVP_DigestFinal_ex(m_pCtx, hv.m_pData, &n)) || (n != Value::nBytes))
			throw std::runtime_error("sha256 final failed");

		m_bInitialized = false;
	}

	void Hash::Processor::FinalizeTruncated(uint8_t* p, uint32_t nSize)
	{
		assert(nSize <= Value::nBytes);

		Value hv;
		Finalize(hv);
		memcpy(p, hv.m_pData + Value::nBytes - nSize, nSize);
	}

} // namespace yieldproxy
