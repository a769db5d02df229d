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

#include "core/ecdsa.h"
#include "core/merkle.h"
#include "utility/hex.h"
#include <stdio.h>

int g_TestsFailed = 0;

void TestFailed(const char* szExpr, uint32_t nLine)
{
	printf("Test failed! Line=%u, Expression: %s\n", nLine, szExpr);
	g_TestsFailed++;
	fflush(stdout);
}

#define verify_test(x) \
	do { \
		if (!(x)) \
			TestFailed(#x, __LINE__); \
	} while (false)

#define fail_test(msg) TestFailed(msg, __LINE__)

namespace yieldproxy {

void TestUintBig()
{
	uintBig_t<4> x = 0x1234abcdU;
	verify_test(x.str() == "1234abcd");

	uintBig_t<4> y;
	verify_test(y.Scan("0x1234ABCD"));
	verify_test(x == y);
	verify_test(!y.Scan("1234abc")); // odd length
	verify_test(!y.Scan("1234abcg"));

	uint32_t n = 0;
	x.Export(n);
	verify_test(0x1234abcdU == n);

	Address a(Zero);
	verify_test(a == Zero);
	a = uintBigFrom(uint64_t(7));
	verify_test(a != Zero);
	verify_test(a.m_pData[a.nBytes - 1] == 7);

	Address b = Zero;
	verify_test(b < a);

	std::ostringstream os;
	os << uintBig_t<2>(uint16_t(0x0a0b));
	verify_test(os.str() == "0x0a0b");

	verify_test(to_hex(x.m_pData, x.nBytes) == "1234abcd");
}

void TestArithmetics()
{
	verify_test(MulDiv(300000, 1300, 10000) == 39000);
	verify_test(MulDiv(s_AmountMax, s_AmountMax, s_AmountMax) == s_AmountMax);
	verify_test(MulDiv(7, 1, 2) == 3); // rounds down

	try {
		MulDiv(s_AmountMax, 2, 1);
		fail_test("overflow not detected");
	} catch (const std::overflow_error&) {
	}

	try {
		MulDiv(1, 1, 0);
		fail_test("division by zero not detected");
	} catch (const std::domain_error&) {
	}

	Amount v = s_AmountMax - 1;
	Strict::Add(v, Amount(1));
	verify_test(s_AmountMax == v);

	try {
		Strict::Add(v, Amount(1));
		fail_test("overflow not detected");
	} catch (const std::overflow_error&) {
	}

	v = 5;
	try {
		Strict::Sub(v, Amount(6));
		fail_test("underflow not detected");
	} catch (const std::underflow_error&) {
	}
	verify_test(5 == v);
}

void TestHash()
{
	Hash::Value hv, hvExp;

	Hash::Processor() >> hv;
	verify_test(hvExp.Scan("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"));
	verify_test(hv == hvExp);

	{
		Hash::Processor hp;
		hp.Write("abc", 3);
		hp >> hv;
	}
	verify_test(hvExp.Scan("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"));
	verify_test(hv == hvExp);

	// processor can be reused after finalization
	Hash::Processor hp;
	hp << uint32_t(1) >> hv;
	hp << uint32_t(1) >> hvExp;
	verify_test(hv == hvExp);

	hp << uint32_t(2) >> hvExp;
	verify_test(hv != hvExp);

	// truncated form keeps the trailing bytes
	Address addr;
	Hash::Processor() << uint32_t(1) >> addr;
	verify_test(!memcmp(addr.m_pData, hv.m_pData + hv.nBytes - addr.nBytes, addr.nBytes));

	// integers are width-fixed and big-endian
	Hash::Processor() << uint16_t(0x6162) << uint8_t(0x63) >> hv;
	verify_test(hvExp.Scan("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"));
	verify_test(hv == hvExp);
}

void TestEcdsa()
{
	Ecdsa::PrivateKey k1, k2;
	verify_test(!k1.IsValid());

	k1.Generate();
	k2.Generate();
	verify_test(k1.IsValid() && k2.IsValid());

	Ecdsa::PublicKey pk1, pk2;
	k1.get_PublicKey(pk1);
	k2.get_PublicKey(pk2);
	verify_test(pk1.m_pData[0] == 4); // uncompressed
	verify_test(pk1 != pk2);

	Address a1, a2, a;
	k1.get_Address(a1);
	k2.get_Address(a2);
	verify_test(a1 != a2);

	Ecdsa::get_Address(a, pk1);
	verify_test(a == a1);

	// trailing bytes of sha256 over the raw key
	Hash::Value hvPk;
	{
		Hash::Processor hp;
		hp.Write(pk1.m_pData, pk1.nBytes);
		hp >> hvPk;
	}
	verify_test(!memcmp(a1.m_pData, hvPk.m_pData + hvPk.nBytes - a1.nBytes, a1.nBytes));

	Hash::Value msg, msg2;
	Hash::Processor() << "message" >> msg;
	Hash::Processor() << "another message" >> msg2;

	ByteBuffer sigDer;
	k1.SignRaw(sigDer, msg);
	verify_test(Ecdsa::VerifyRaw(pk1, msg, sigDer));
	verify_test(!Ecdsa::VerifyRaw(pk2, msg, sigDer));
	verify_test(!Ecdsa::VerifyRaw(pk1, msg2, sigDer));

	ByteBuffer sig;
	k1.Sign(sig, msg);
	verify_test(sig.size() > Ecdsa::PublicKey::nBytes);

	verify_test(Ecdsa::RecoverSigner(a, msg, sig));
	verify_test(a == a1);

	verify_test(!Ecdsa::RecoverSigner(a, msg2, sig));

	// substituted key
	ByteBuffer sigBad = sig;
	memcpy(sigBad.data(), pk2.m_pData, pk2.nBytes);
	verify_test(!Ecdsa::RecoverSigner(a, msg, sigBad));

	// corrupted signature
	sigBad = sig;
	sigBad.back() ^= 1;
	verify_test(!Ecdsa::RecoverSigner(a, msg, sigBad));

	// truncated
	verify_test(!Ecdsa::RecoverSigner(a, msg, Blob(sig.data(), Ecdsa::PublicKey::nBytes)));
	verify_test(!Ecdsa::RecoverSigner(a, msg, Blob()));
}

void TestMerkle()
{
	for (uint32_t nLeafs = 1; nLeafs <= 7; nLeafs++)
	{
		Merkle::FixedTree t;
		for (uint32_t i = 0; i < nLeafs; i++)
			Hash::Processor() << "leaf" << i >> t.m_vLeafs.emplace_back();

		Merkle::HashValue hvRoot;
		t.get_Root(hvRoot);

		for (uint32_t i = 0; i < nLeafs; i++)
		{
			Merkle::Proof proof;
			t.get_Proof(proof, i);

			Merkle::HashValue hv = t.m_vLeafs[i];
			Merkle::Interpret(hv, proof);
			verify_test(hv == hvRoot);

			if (!proof.empty())
			{
				// wrong side
				proof[0].first = !proof[0].first;
				hv = t.m_vLeafs[i];
				Merkle::Interpret(hv, proof);
				verify_test(hv != hvRoot);
			}
		}
	}

	Merkle::FixedTree t;
	try {
		Merkle::HashValue hv;
		t.get_Root(hv);
		fail_test("empty tree accepted");
	} catch (const std::runtime_error&) {
	}
}

} // namespace yieldproxy

int main()
{
	try
	{
		yieldproxy::TestUintBig();
		yieldproxy::TestArithmetics();
		yieldproxy::TestHash();
		yieldproxy::TestEcdsa();
		yieldproxy::TestMerkle();
	}
	catch (const std::exception& ex)
	{
		printf("Exception: %s\n", ex.what());
		g_TestsFailed++;
	}

	return g_TestsFailed ? -1 : 0;
}
