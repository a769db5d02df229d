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

#include "proxy/sim/world.h"
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
namespace proxy {

	using namespace chain;

	// returns true if fn fails with the given code
	template <typename TFunc>
	bool ExpectError(ProxyError code, TFunc&& fn)
	{
		try
		{
			fn();
		}
		catch (const ProxyException& e)
		{
			if (e.code() == code)
				return true;

			printf("Unexpected error: %s (%s)\n", getErrorName(e.code()), e.what());
			return false;
		}

		return false;
	}

	template <typename T>
	bool get_LastEvent(const Host& h, const Address& aProxy, T& res)
	{
		const auto& v = h.get_Logs();
		for (auto it = v.rbegin(); v.rend() != it; it++)
			if (Events::Read(*it, aProxy, res))
				return true;
		return false;
	}

	template <typename T>
	size_t CountEvents(const Host& h, const Address& aProxy)
	{
		size_t n = 0;
		T ev;
		for (const auto& e : h.get_Logs())
			if (Events::Read(e, aProxy, ev))
				n++;
		return n;
	}

#pragma pack (push, 1)
	struct PayMethod {
		static const Selector s_Selector = 0x50a1e500;
		Address m_Token;
		Amount m_Amount;
	};

	struct ReenterMethod {
		static const Selector s_Selector = 0x3e3e3e3e;
		uint8_t m_Mode;
	};

	struct EmitMethod {
		static const Selector s_Selector = 0x0e0e0e0e;
		Amount m_Fee;
	};
#pragma pack (pop)

	// Pays the requested amount of its own funds to the caller
	class Payer
		:public Contract
	{
	public:
		using Contract::Contract;

		void OnCall(const Blob& payload) override
		{
			const auto& r = Abi::Decode<PayMethod>(payload);
			Address caller = get_Caller();
			Far<IToken>(r.m_Token)->Transfer(caller, r.m_Amount);
		}
	};

	// Calls back into the proxy that called it
	class Reentrant
		:public Contract
	{
	public:
		using Contract::Contract;

		struct Mode
		{
			static const uint8_t Withdraw = 0;
			static const uint8_t CallAny = 1;
			static const uint8_t Claim = 2;
		};

		void OnCall(const Blob& payload) override
		{
			uint8_t nMode = Abi::Decode<ReenterMethod>(payload).m_Mode;
			Address proxy = get_Caller();

			auto pProxy = Far<YieldProxy>(proxy);
			switch (nMode)
			{
			case Mode::Withdraw:
				pProxy->Withdraw(get_Address(), payload, get_Address(), 1);
				break;

			case Mode::CallAny:
				pProxy->CallAnyFunction(get_Address(), payload);
				break;

			default:
				pProxy->ClaimReward(get_Address(), get_Address(), 1, Merkle::Proof());
			}
		}
	};

	// Emits a record shaped like the proxy's withdrawal event
	class Impostor
		:public Contract
	{
	public:
		using Contract::Contract;

		void OnCall(const Blob& payload) override
		{
			Events::Withdrawn ev;
			ZeroObject(ev);
			ev.m_Fee = Abi::Decode<EmitMethod>(payload).m_Fee;
			EmitLog_T(Events::Withdrawn::s_Tag, ev);
		}
	};

	ByteBuffer MakePay(const Address& token, Amount val)
	{
		PayMethod args;
		args.m_Token = token;
		args.m_Amount = val;
		return Abi::Encode(args);
	}

	ByteBuffer MakeReenter(uint8_t nMode)
	{
		ReenterMethod args;
		args.m_Mode = nMode;
		return Abi::Encode(args);
	}

	void TestSimpleProfitSplit()
	{
		sim::World w;
		const auto& a = w.m_Addr;

		Address aProxy = w.CreateProxy(8700);
		auto& p = w.get_Proxy(aProxy);
		verify_test(p.get_Client() == w.m_Client);
		verify_test(p.get_FeeBps() == 8700);

		w.Mint(a.m_Asset, w.m_Client, 10000000);
		w.Deposit(aProxy, 10000000);

		verify_test(p.get_Deposited(a.m_Asset) == 10000000);
		verify_test(w.get_Shares(aProxy) == 10000000);
		verify_test(w.get_Balance(a.m_Asset, w.m_Client) == 0);
		verify_test(w.get_Balance(a.m_Asset, aProxy) == 0);

		Events::Deposited evD;
		verify_test(get_LastEvent(w.m_Host, aProxy, evD));
		verify_test(evD.m_Target == a.m_Executor);
		verify_test(evD.m_Asset == a.m_Asset);
		verify_test(evD.m_Amount == 10000000);
		verify_test(evD.m_TotalDeposited == 10000000);

		w.AddYield(300000);
		w.Withdraw(aProxy, 10000000);

		verify_test(w.get_Balance(a.m_Asset, a.m_Treasury) == 39000);
		verify_test(w.get_Balance(a.m_Asset, w.m_Client) == 10261000);
		verify_test(w.get_Balance(a.m_Asset, aProxy) == 0);
		verify_test(w.get_Shares(aProxy) == 0);
		verify_test(p.get_Withdrawn(a.m_Asset) == 10300000);
		verify_test(p.get_RealizedProfit(a.m_Asset) == 300000);

		Events::Withdrawn evW;
		verify_test(get_LastEvent(w.m_Host, aProxy, evW));
		verify_test(evW.m_Target == a.m_Executor);
		verify_test(evW.m_Vault == a.m_Vault);
		verify_test(evW.m_Asset == a.m_Asset);
		verify_test(evW.m_Shares == 10000000);
		verify_test(evW.m_Released == 10300000);
		verify_test(evW.m_TotalWithdrawn == 10300000);
		verify_test(evW.m_NewProfit == 300000);
		verify_test(evW.m_Fee == 39000);
		verify_test(evW.m_Client == 10261000);
	}

	void TestTwoStepExact()
	{
		sim::World w;
		const auto& a = w.m_Addr;

		Address aProxy = w.CreateProxy(8700);
		auto& p = w.get_Proxy(aProxy);

		w.Mint(a.m_Asset, w.m_Client, 10000000);
		w.Deposit(aProxy, 10000000);

		Address aPayer = sim::MakeAddress("payer");
		w.m_Host.Deploy<Payer>(aPayer);
		w.Mint(a.m_Asset, aPayer, 10300000);
		w.AllowCall(aPayer, PayMethod::s_Selector, CallKind::Withdrawal);

		ByteBuffer pay1 = MakePay(a.m_Asset, 10150000);
		w.m_Host.Transact<YieldProxy>(w.m_Client, aProxy, [&](YieldProxy& x) {
			x.Withdraw(aPayer, pay1, a.m_Vault, 1);
		});

		verify_test(w.get_Balance(a.m_Asset, a.m_Treasury) == 19500);
		verify_test(w.get_Balance(a.m_Asset, w.m_Client) == 10130500);
		verify_test(p.get_Withdrawn(a.m_Asset) == 10150000);

		ByteBuffer pay2 = MakePay(a.m_Asset, 150000);
		w.m_Host.Transact<YieldProxy>(w.m_Client, aProxy, [&](YieldProxy& x) {
			x.Withdraw(aPayer, pay2, a.m_Vault, 1);
		});

		// same aggregate as a single withdrawal
		verify_test(w.get_Balance(a.m_Asset, a.m_Treasury) == 39000);
		verify_test(w.get_Balance(a.m_Asset, w.m_Client) == 10261000);
		verify_test(p.get_Withdrawn(a.m_Asset) == 10300000);
		verify_test(p.get_RealizedProfit(a.m_Asset) == 300000);

		// nothing received: no fee, the zero remainder is still sent
		ByteBuffer pay3 = MakePay(a.m_Asset, 0);
		w.m_Host.Transact<YieldProxy>(w.m_Client, aProxy, [&](YieldProxy& x) {
			x.Withdraw(aPayer, pay3, a.m_Vault, 1);
		});

		Events::Withdrawn ev;
		verify_test(get_LastEvent(w.m_Host, aProxy, ev));
		verify_test(!ev.m_Released && !ev.m_Fee && !ev.m_Client);
		verify_test(w.get_Balance(a.m_Asset, a.m_Treasury) == 39000);
	}

	void TestTwoStepVault()
	{
		sim::World w;
		const auto& a = w.m_Addr;

		Address aProxy = w.CreateProxy(8700);

		w.Mint(a.m_Asset, w.m_Client, 10000000);
		w.Deposit(aProxy, 10000000);
		w.AddYield(300000);

		// 10,150,000 worth of shares, then the rest
		Amount shares = w.m_Host.get_Contract<Vault>(a.m_Vault).ConvertToShares(10150000);
		w.Withdraw(aProxy, shares);
		w.Withdraw(aProxy, w.get_Shares(aProxy));

		Amount fee = w.get_Balance(a.m_Asset, a.m_Treasury);
		verify_test((fee + 2 >= 39000) && (fee <= 39000));
		verify_test(fee + w.get_Balance(a.m_Asset, w.m_Client) == w.get_Proxy(aProxy).get_Withdrawn(a.m_Asset));
		verify_test(!w.get_Shares(aProxy));
	}

	void TestDeposit()
	{
		sim::World w;
		const auto& a = w.m_Addr;

		Address aProxy = w.CreateProxy(8700);
		auto& p = w.get_Proxy(aProxy);
		auto& asset = w.m_Host.get_Contract<Token>(a.m_Asset);
		auto& permit = w.m_Host.get_Contract<PermitTransfer>(a.m_Permit);

		w.Mint(a.m_Asset, w.m_Client, 20000000);

		verify_test(!asset.get_Allowance(aProxy, a.m_Executor));
		w.Deposit(aProxy, 4000000);
		verify_test(asset.get_Allowance(aProxy, a.m_Executor) == s_AmountMax);
		verify_test(permit.get_Allowance(w.m_Client, a.m_Asset, aProxy).m_Nonce == 1);

		// operator may route deposits too
		{
			PermitAuthorization auth = w.SignPermit(aProxy, a.m_Asset, 1000000);
			ByteBuffer payload = w.BuildDepositBundle(aProxy, 1000000);
			w.m_Host.Transact<ProxyFactory>(a.m_Operator, a.m_Factory, [&](ProxyFactory& f) {
				f.Deposit(aProxy, a.m_Executor, payload, auth);
			});
		}
		verify_test(p.get_Deposited(a.m_Asset) == 5000000);
		verify_test(asset.get_Allowance(aProxy, a.m_Executor) == s_AmountMax);

		// failure in the forwarded bundle reverts the pull, the ledger and the nonce
		{
			PermitAuthorization auth = w.SignPermit(aProxy, a.m_Asset, 1000000);
			ByteBuffer payload = w.BuildDepositBundle(aProxy, 1000001);
			try {
				w.m_Host.Transact<ProxyFactory>(w.m_Client, a.m_Factory, [&](ProxyFactory& f) {
					f.Deposit(aProxy, a.m_Executor, payload, auth);
				});
				fail_test("deposit with a failing bundle");
			} catch (const RevertException&) {
			}
		}
		verify_test(p.get_Deposited(a.m_Asset) == 5000000);
		verify_test(w.get_Balance(a.m_Asset, w.m_Client) == 15000000);
		verify_test(permit.get_Allowance(w.m_Client, a.m_Asset, aProxy).m_Nonce == 2);

		// signed by someone else
		{
			PermitAuthorization auth = w.SignPermit(aProxy, a.m_Asset, 1000000);
			Ecdsa::PrivateKey k;
			k.Generate();
			Hash::Value hv;
			auth.m_Permit.get_Hash(hv, a.m_Permit);
			k.Sign(auth.m_Signature, hv);

			ByteBuffer payload = w.BuildDepositBundle(aProxy, 1000000);
			try {
				w.m_Host.Transact<ProxyFactory>(w.m_Client, a.m_Factory, [&](ProxyFactory& f) {
					f.Deposit(aProxy, a.m_Executor, payload, auth);
				});
				fail_test("foreign permit signature");
			} catch (const RevertException&) {
			}
		}
		verify_test(p.get_Deposited(a.m_Asset) == 5000000);

		// validation
		ByteBuffer payload = w.BuildDepositBundle(aProxy, 1000000);

		verify_test(ExpectError(ProxyError::ZeroDepositAmount, [&]() {
			PermitAuthorization auth = w.SignPermit(aProxy, a.m_Asset, 0);
			w.m_Host.Transact<YieldProxy>(a.m_Factory, aProxy, [&](YieldProxy& x) {
				x.Deposit(a.m_Executor, payload, auth);
			});
		}));

		verify_test(ExpectError(ProxyError::ZeroAddressAsset, [&]() {
			PermitAuthorization auth = w.SignPermit(aProxy, Zero, 5);
			w.m_Host.Transact<YieldProxy>(a.m_Factory, aProxy, [&](YieldProxy& x) {
				x.Deposit(a.m_Executor, payload, auth);
			});
		}));

		verify_test(ExpectError(ProxyError::CalldataTooShort, [&]() {
			PermitAuthorization auth = w.SignPermit(aProxy, a.m_Asset, 1000000);
			ByteBuffer shortPayload(3, 0);
			w.m_Host.Transact<ProxyFactory>(w.m_Client, a.m_Factory, [&](ProxyFactory& f) {
				f.Deposit(aProxy, a.m_Executor, shortPayload, auth);
			});
		}));

		verify_test(ExpectError(ProxyError::CalldataNotAllowed, [&]() {
			PermitAuthorization auth = w.SignPermit(aProxy, a.m_Asset, 1000000);
			w.m_Host.Transact<ProxyFactory>(w.m_Client, a.m_Factory, [&](ProxyFactory& f) {
				f.Deposit(aProxy, a.m_Vault, payload, auth);
			});
		}));

		verify_test(p.get_Deposited(a.m_Asset) == 5000000);
	}

	void TestRewards()
	{
		sim::World w;
		const auto& a = w.m_Addr;

		Address aProxy = w.CreateProxy(8700);
		w.Mint(a.m_RewardToken, a.m_Distributor, 5000000);

		w.PublishRewards({ { aProxy, 1000000 } });
		w.ClaimReward(aProxy, w.m_Client);

		verify_test(w.get_Balance(a.m_RewardToken, a.m_Treasury) == 130000);
		verify_test(w.get_Balance(a.m_RewardToken, w.m_Client) == 870000);
		verify_test(w.get_Balance(a.m_RewardToken, aProxy) == 0);

		Events::ClaimedReward ev;
		verify_test(get_LastEvent(w.m_Host, aProxy, ev));
		verify_test(ev.m_Distributor == a.m_Distributor);
		verify_test(ev.m_Reward == a.m_RewardToken);
		verify_test(ev.m_Claimed == 1000000);
		verify_test(ev.m_Fee == 130000);
		verify_test(ev.m_Client == 870000);

		// rewards don't touch the ledger
		verify_test(!w.get_Proxy(aProxy).get_Deposited(a.m_RewardToken));
		verify_test(!w.get_Proxy(aProxy).get_Withdrawn(a.m_RewardToken));

		// the same cumulative amount again
		size_t nLogs = w.m_Host.get_Logs().size();
		verify_test(ExpectError(ProxyError::NothingClaimed, [&]() {
			w.ClaimReward(aProxy, w.m_Client);
		}));
		verify_test(w.m_Host.get_Logs().size() == nLogs);
		verify_test(w.get_Balance(a.m_RewardToken, a.m_Treasury) == 130000);

		// claim operator, the increment only
		w.PublishRewards({ { aProxy, 1500000 }, { a.m_Treasury, 1 } });
		w.ClaimReward(aProxy, a.m_Operator);
		verify_test(w.get_Balance(a.m_RewardToken, a.m_Treasury) == 195000);
		verify_test(w.get_Balance(a.m_RewardToken, w.m_Client) == 1305000);

		// neither the client nor an operator
		Address aStranger = sim::MakeAddress("stranger");
		bool bThrown = false;
		try {
			w.PublishRewards({ { aProxy, 2000000 } });
			w.ClaimReward(aProxy, aStranger);
		} catch (const UnauthorizedCallerException& e) {
			bThrown = true;
			verify_test(e.get_Caller() == aStranger);
			verify_test(e.get_Expected() == w.m_Client);
		}
		verify_test(bThrown);
		verify_test(w.get_Balance(a.m_RewardToken, w.m_Client) == 1305000);

		// leaf of zero
		sim::World w2;
		Address aProxy2 = w2.CreateProxy(8700);
		w2.PublishRewards({ { aProxy2, 0 } });
		verify_test(ExpectError(ProxyError::NothingClaimed, [&]() {
			w2.ClaimReward(aProxy2, w2.m_Client);
		}));
	}

	void TestInitialize()
	{
		sim::World w;
		const auto& a = w.m_Addr;

		YieldProxy::Immutables imm;
		imm.m_Executor = a.m_Executor;
		imm.m_Factory = a.m_Factory;
		imm.m_Treasury = a.m_Treasury;
		imm.m_Permit = a.m_Permit;
		imm.m_Verifier = a.m_Verifier;

		uint8_t nIdx = 0;
		auto fnDeploy = [&]() {
			Address addr = sim::MakeAddress("raw-proxy");
			addr.m_pData[0] = ++nIdx;
			w.m_Host.Deploy<YieldProxy>(addr, imm);
			return addr;
		};

		auto fnInit = [&](const Address& aProxy, const Address& aCaller, uint32_t feeBps) {
			w.m_Host.Transact<YieldProxy>(aCaller, aProxy, [&](YieldProxy& x) {
				x.Initialize(w.m_Client, feeBps);
			});
		};

		Address aProxy = fnDeploy();
		verify_test(ExpectError(ProxyError::InvalidFeeRate, [&]() { fnInit(aProxy, a.m_Factory, 0); }));
		verify_test(ExpectError(ProxyError::InvalidFeeRate, [&]() { fnInit(aProxy, a.m_Factory, 10001); }));
		verify_test(!w.get_Proxy(aProxy).get_Ledger().IsInitialized());

		bool bThrown = false;
		try {
			fnInit(aProxy, w.m_Client, 8700);
		} catch (const UnauthorizedCallerException& e) {
			bThrown = true;
			verify_test(e.get_Caller() == w.m_Client);
			verify_test(e.get_Expected() == a.m_Factory);
			verify_test(e.code() == ProxyError::UnauthorizedCaller);
		}
		verify_test(bThrown);

		fnInit(aProxy, a.m_Factory, 1);
		verify_test(w.get_Proxy(aProxy).get_FeeBps() == 1);

		// one-shot
		verify_test(ExpectError(ProxyError::AlreadyInitialized, [&]() { fnInit(aProxy, a.m_Factory, 5000); }));
		verify_test(w.get_Proxy(aProxy).get_FeeBps() == 1);
		verify_test(w.get_Proxy(aProxy).get_Client() == w.m_Client);

		Address aProxy2 = fnDeploy();
		fnInit(aProxy2, a.m_Factory, 10000);
		verify_test(w.get_Proxy(aProxy2).get_FeeBps() == 10000);

		Events::Initialized ev;
		verify_test(get_LastEvent(w.m_Host, aProxy2, ev));
		verify_test(ev.m_Client == w.m_Client);
		verify_test(ev.m_FeeBps == 10000);

		Address aProxy3 = fnDeploy();
		verify_test(ExpectError(ProxyError::ZeroClient, [&]() {
			w.m_Host.Transact<YieldProxy>(a.m_Factory, aProxy3, [&](YieldProxy& x) {
				x.Initialize(Zero, 8700);
			});
		}));

		// uninitialized proxy rejects the rest
		verify_test(ExpectError(ProxyError::NotInitialized, [&]() {
			PermitAuthorization auth = w.SignPermit(aProxy3, a.m_Asset, 1);
			ByteBuffer payload = w.BuildDepositBundle(aProxy3, 1);
			w.m_Host.Transact<YieldProxy>(a.m_Factory, aProxy3, [&](YieldProxy& x) {
				x.Deposit(a.m_Executor, payload, auth);
			});
		}));

		// fee bound via the factory
		verify_test(ExpectError(ProxyError::InvalidFeeRate, [&]() { w.CreateProxy(0); }));

		Address aDerived;
		ProxyFactory::DeriveProxyAddress(aDerived, a.m_Factory, w.m_Client);
		verify_test(!w.m_Host.IsContract(aDerived));
	}

	void TestRoleGating()
	{
		sim::World w;
		const auto& a = w.m_Addr;

		Address aProxy = w.CreateProxy(8700);
		auto& p = w.get_Proxy(aProxy);

		w.Mint(a.m_Asset, w.m_Client, 10000000);
		w.Deposit(aProxy, 10000000);
		w.AddYield(300000);

		Address aStranger = sim::MakeAddress("stranger");
		ByteBuffer redeem = w.BuildRedeemBundle(aProxy, 1000);

		size_t nLogs = w.m_Host.get_Logs().size();

		auto fnExpectUnauthorized = [&](const Address& aExpected, auto&& fn) {
			bool bThrown = false;
			try {
				fn();
			} catch (const UnauthorizedCallerException& e) {
				bThrown = true;
				verify_test(e.get_Caller() == aStranger);
				verify_test(e.get_Expected() == aExpected);
			}
			verify_test(bThrown);
		};

		fnExpectUnauthorized(w.m_Client, [&]() {
			w.m_Host.Transact<YieldProxy>(aStranger, aProxy, [&](YieldProxy& x) {
				x.Withdraw(a.m_Executor, redeem, a.m_Vault, 1000);
			});
		});

		fnExpectUnauthorized(w.m_Client, [&]() {
			w.m_Host.Transact<YieldProxy>(aStranger, aProxy, [&](YieldProxy& x) {
				x.CallAnyFunction(a.m_Executor, redeem);
			});
		});

		fnExpectUnauthorized(a.m_Factory, [&]() {
			PermitAuthorization auth = w.SignPermit(aProxy, a.m_Asset, 1);
			w.m_Host.Transact<YieldProxy>(aStranger, aProxy, [&](YieldProxy& x) {
				x.Deposit(a.m_Executor, w.BuildDepositBundle(aProxy, 1), auth);
			});
		});

		fnExpectUnauthorized(w.m_Client, [&]() {
			PermitAuthorization auth = w.SignPermit(aProxy, a.m_Asset, 1);
			w.m_Host.Transact<ProxyFactory>(aStranger, a.m_Factory, [&](ProxyFactory& f) {
				f.Deposit(aProxy, a.m_Executor, w.BuildDepositBundle(aProxy, 1), auth);
			});
		});

		fnExpectUnauthorized(a.m_Owner, [&]() {
			w.m_Host.Transact<ProxyFactory>(aStranger, a.m_Factory, [&](ProxyFactory& f) {
				f.SetOperator(aStranger, true);
			});
		});

		// the client itself can't bypass the factory
		verify_test(ExpectError(ProxyError::UnauthorizedCaller, [&]() {
			PermitAuthorization auth = w.SignPermit(aProxy, a.m_Asset, 1);
			w.m_Host.Transact<YieldProxy>(w.m_Client, aProxy, [&](YieldProxy& x) {
				x.Deposit(a.m_Executor, w.BuildDepositBundle(aProxy, 1), auth);
			});
		}));

		// state unchanged
		verify_test(w.m_Host.get_Logs().size() == nLogs);
		verify_test(p.get_Deposited(a.m_Asset) == 10000000);
		verify_test(!p.get_Withdrawn(a.m_Asset));
		verify_test(w.get_Shares(aProxy) == 10000000);
		verify_test(!w.m_Host.get_Contract<ProxyFactory>(a.m_Factory).IsClaimOperator(aStranger));

		// client-side validation
		verify_test(ExpectError(ProxyError::ZeroSharesWithdrawal, [&]() {
			w.m_Host.Transact<YieldProxy>(w.m_Client, aProxy, [&](YieldProxy& x) {
				x.Withdraw(a.m_Executor, redeem, a.m_Vault, 0);
			});
		}));

		verify_test(ExpectError(ProxyError::CalldataTooShort, [&]() {
			w.m_Host.Transact<YieldProxy>(w.m_Client, aProxy, [&](YieldProxy& x) {
				x.Withdraw(a.m_Executor, Blob(redeem.data(), 3), a.m_Vault, 1000);
			});
		}));

		// allowed for withdrawal, not for the unrestricted kind
		verify_test(ExpectError(ProxyError::CalldataNotAllowed, [&]() {
			w.m_Host.Transact<YieldProxy>(w.m_Client, aProxy, [&](YieldProxy& x) {
				x.CallAnyFunction(a.m_Executor, redeem);
			});
		}));

		verify_test(ExpectError(ProxyError::CalldataNotAllowed, [&]() {
			w.m_Host.Transact<YieldProxy>(w.m_Client, aProxy, [&](YieldProxy& x) {
				x.Withdraw(a.m_Vault, redeem, a.m_Vault, 1000);
			});
		}));

		verify_test(p.CheckCalldata(a.m_Executor, Method::Multicall::s_Selector, Blob(), CallKind::Withdrawal));
		verify_test(!p.CheckCalldata(a.m_Executor, Method::Multicall::s_Selector, Blob(), CallKind::Unrestricted));

		verify_test(w.m_Host.get_Logs().size() == nLogs);
	}

	void TestMonotonicity()
	{
		sim::World w;
		const auto& a = w.m_Addr;

		Address aProxy = w.CreateProxy(8700);
		auto& p = w.get_Proxy(aProxy);

		w.Mint(a.m_Asset, w.m_Client, 10000000);
		w.Deposit(aProxy, 6000000);
		verify_test(p.get_Deposited(a.m_Asset) == 6000000);
		w.Deposit(aProxy, 4000000);
		verify_test(p.get_Deposited(a.m_Asset) == 10000000);

		w.AddYield(1000000);

		Amount withdrawn = 0, profit = 0, fees = 0;
		const Amount pShares[] = { 3000000, 1, 4000000, 2999999 };

		for (Amount x : pShares)
		{
			w.Withdraw(aProxy, x);

			Amount w1 = p.get_Withdrawn(a.m_Asset);
			Amount p1 = p.get_RealizedProfit(a.m_Asset);
			Amount f1 = w.get_Balance(a.m_Asset, a.m_Treasury);

			verify_test(w1 >= withdrawn);
			verify_test(p1 >= profit);
			verify_test(f1 >= fees);
			verify_test(p.get_Deposited(a.m_Asset) == 10000000);

			withdrawn = w1;
			profit = p1;
			fees = f1;
		}

		verify_test(withdrawn == 11000000);
		verify_test(profit == 1000000);
		verify_test((fees <= 130000) && (fees + _countof(pShares) >= 130000));
	}

	void TestReentrancy()
	{
		sim::World w;
		const auto& a = w.m_Addr;

		Address aProxy = w.CreateProxy(8700);
		w.Mint(a.m_Asset, w.m_Client, 10000000);
		w.Deposit(aProxy, 10000000);

		Address aEvil = sim::MakeAddress("reentrant");
		w.m_Host.Deploy<Reentrant>(aEvil);
		w.AllowCall(aEvil, ReenterMethod::s_Selector, CallKind::Unrestricted);
		w.AllowCall(aEvil, ReenterMethod::s_Selector, CallKind::Withdrawal);

		size_t nLogs = w.m_Host.get_Logs().size();

		for (uint8_t nMode = 0; nMode < 3; nMode++)
		{
			ByteBuffer payload = MakeReenter(nMode);

			verify_test(ExpectError(ProxyError::ReentrantCall, [&]() {
				w.m_Host.Transact<YieldProxy>(w.m_Client, aProxy, [&](YieldProxy& x) {
					x.CallAnyFunction(aEvil, payload);
				});
			}));

			verify_test(ExpectError(ProxyError::ReentrantCall, [&]() {
				w.m_Host.Transact<YieldProxy>(w.m_Client, aProxy, [&](YieldProxy& x) {
					x.Withdraw(aEvil, payload, a.m_Vault, 1000);
				});
			}));
		}

		// outer calls reverted entirely
		verify_test(w.m_Host.get_Logs().size() == nLogs);
		verify_test(!w.get_Proxy(aProxy).get_Withdrawn(a.m_Asset));
		verify_test(!w.m_Host.get_Contract<Vault>(a.m_Vault).get_Allowance(aProxy, aEvil));

		// the guard is released after the failures
		Address aPayer = sim::MakeAddress("payer");
		w.m_Host.Deploy<Payer>(aPayer);
		w.Mint(a.m_Asset, aPayer, 5);
		w.AllowCall(aPayer, PayMethod::s_Selector, CallKind::Unrestricted);

		ByteBuffer pay = MakePay(a.m_Asset, 5);
		w.m_Host.Transact<YieldProxy>(w.m_Client, aProxy, [&](YieldProxy& x) {
			x.CallAnyFunction(aPayer, pay);
		});

		Events::CalledAsAnyFunction ev;
		verify_test(get_LastEvent(w.m_Host, aProxy, ev));
		verify_test(ev.m_Target == aPayer);
		verify_test(CountEvents<Events::CalledAsAnyFunction>(w.m_Host, aProxy) == 1);

		verify_test(w.get_Balance(a.m_Asset, aProxy) == 5);

		w.Withdraw(aProxy, 1000);
		verify_test(w.get_Proxy(aProxy).get_Withdrawn(a.m_Asset) == 1000);
	}

	void TestSignatures()
	{
		sim::World w;
		const auto& a = w.m_Addr;

		Address aProxy = w.CreateProxy(8700);
		auto& p = w.get_Proxy(aProxy);

		Hash::Value hv;
		Hash::Processor() << "order" << uint64_t(42) >> hv;

		ByteBuffer sig;
		w.m_ClientKey.Sign(sig, hv);
		verify_test(p.ValidateSignature(hv, sig) == ISignatureValidator::s_MagicValue);

		Ecdsa::PrivateKey k;
		k.Generate();
		ByteBuffer sigOther;
		k.Sign(sigOther, hv);

		verify_test(ExpectError(ProxyError::InvalidSignature, [&]() { p.ValidateSignature(hv, sigOther); }));
		verify_test(ExpectError(ProxyError::InvalidSignature, [&]() { p.ValidateSignature(hv, Blob()); }));

		Hash::Value hv2;
		Hash::Processor() << "order" << uint64_t(43) >> hv2;
		verify_test(ExpectError(ProxyError::InvalidSignature, [&]() { p.ValidateSignature(hv2, sig); }));

		// the proxy as a contract signer
		auto& checker = w.m_Host.get_Contract<SignatureChecker>(a.m_Verifier);
		verify_test(checker.IsValidSignatureNow(aProxy, hv, sig));
		verify_test(!checker.IsValidSignatureNow(aProxy, hv, sigOther));

		verify_test(p.SupportsInterface(InterfaceId::YieldProxy));
		verify_test(p.SupportsInterface(InterfaceId::SignatureValidator));
		verify_test(!p.SupportsInterface(0xffffffff));

		verify_test(p.get_Immutables().m_Executor == a.m_Executor);
		verify_test(p.get_Immutables().m_Permit == a.m_Permit);
		verify_test(p.get_Immutables().m_Treasury == a.m_Treasury);
		verify_test(p.get_Immutables().m_Factory == a.m_Factory);
	}

	void TestFactory()
	{
		sim::World w;
		const auto& a = w.m_Addr;

		Address aProxy = w.CreateProxy(8700);

		Address aExpected;
		ProxyFactory::DeriveProxyAddress(aExpected, a.m_Factory, w.m_Client);
		verify_test(aProxy == aExpected);

		auto& f = w.m_Host.get_Contract<ProxyFactory>(a.m_Factory);
		Address aRes;
		verify_test(f.get_Proxy(aRes, w.m_Client) && (aRes == aProxy));
		verify_test(!f.get_Proxy(aRes, a.m_Owner));

		// one proxy per client
		try {
			w.CreateProxy(5000);
			fail_test("second proxy for the same client");
		} catch (const RevertException&) {
		}
		verify_test(w.get_Proxy(aProxy).get_FeeBps() == 8700);

		verify_test(f.IsClaimOperator(a.m_Operator));
		w.m_Host.Transact<ProxyFactory>(a.m_Owner, a.m_Factory, [&](ProxyFactory& x) {
			x.SetOperator(a.m_Operator, false);
		});
		verify_test(!f.IsClaimOperator(a.m_Operator));

		Events::Initialized ev;
		for (const auto& e : w.m_Host.get_Logs())
			if (Events::Read(e, aProxy, ev))
				verify_test(Events::Describe(e, aProxy).find("feeBps=8700") != std::string::npos);
	}

	void TestForeignEvents()
	{
		sim::World w;
		const auto& a = w.m_Addr;

		Address aProxy = w.CreateProxy(8700);

		Address aImpostor = sim::MakeAddress("impostor");
		w.m_Host.Deploy<Impostor>(aImpostor);
		w.AllowCall(aImpostor, EmitMethod::s_Selector, CallKind::Unrestricted);

		EmitMethod args;
		args.m_Fee = 777;
		ByteBuffer payload = Abi::Encode(args);

		w.m_Host.Transact<YieldProxy>(w.m_Client, aProxy, [&](YieldProxy& x) {
			x.CallAnyFunction(aImpostor, payload);
		});

		const auto& v = w.m_Host.get_Logs();
		size_t nForged = 0;
		for (const auto& e : v)
		{
			if (e.m_Emitter != aImpostor)
				continue;

			nForged++;
			Events::Withdrawn ev;
			verify_test(!Events::Read(e, aProxy, ev));
			verify_test(Events::Describe(e, aProxy).empty());
			verify_test(Events::Read(e, aImpostor, ev) && (ev.m_Fee == 777));
		}
		verify_test(nForged == 1);

		Events::Withdrawn evW;
		verify_test(!get_LastEvent(w.m_Host, aProxy, evW));
		verify_test(CountEvents<Events::CalledAsAnyFunction>(w.m_Host, aProxy) == 1);
		verify_test(!CountEvents<Events::CalledAsAnyFunction>(w.m_Host, a.m_Factory));
	}

} // namespace proxy
} // namespace yieldproxy

int main()
{
	try
	{
		using namespace yieldproxy::proxy;
		TestSimpleProfitSplit();
		TestTwoStepExact();
		TestTwoStepVault();
		TestDeposit();
		TestRewards();
		TestInitialize();
		TestRoleGating();
		TestMonotonicity();
		TestReentrancy();
		TestSignatures();
		TestFactory();
		TestForeignEvents();
	}
	catch (const std::exception& ex)
	{
		printf("Exception: %s\n", ex.what());
		g_TestsFailed++;
	}

	return g_TestsFailed ? -1 : 0;
}
