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
#include "utility/options.h"
#include "utility/config.h"
#include "utility/helpers.h"
#include <boost/filesystem.hpp>

using namespace yieldproxy;
using namespace std;

#define FILES_PREFIX "proxy-sim"

#ifndef YP_PROJECT_VERSION
#	define YP_PROJECT_VERSION "0.0.0"
#endif

namespace
{
	struct Scenario
	{
		uint32_t m_FeeBps = 8700;
		Amount m_Deposit = 10000000;
		Amount m_Yield = 300000;
		std::vector<Amount> m_vWithdrawShares; // all the shares at once if empty
		Amount m_Reward = 1000000;

		void Load(const Config& cfg)
		{
			uint64_t feeBps = cfg.get_u64("fee_bps", m_FeeBps);
			if (!proxy::FeeSplit::IsValidFeeRate(feeBps))
				throw std::runtime_error("fee_bps must be in (0, " + std::to_string(proxy::FeeSplit::s_BpsMax) + "]");
			m_FeeBps = static_cast<uint32_t>(feeBps);
			m_Deposit = cfg.get_u64("deposit", m_Deposit);
			m_Yield = cfg.get_u64("yield", m_Yield);
			m_Reward = cfg.get_u64("reward", m_Reward);

			m_vWithdrawShares.clear();
			for (int64_t x : cfg.get_int_list("withdraw_shares"))
			{
				if (x <= 0)
					throw std::runtime_error("withdraw_shares: positive values expected");
				m_vWithdrawShares.push_back(static_cast<Amount>(x));
			}
		}
	};

	class Runner
	{
		sim::World m_World;
		size_t m_nLogsSeen = 0;
		Address m_Proxy = Zero;

		void Flush()
		{
			const auto& v = m_World.m_Host.get_Logs();
			for (; m_nLogsSeen < v.size(); m_nLogsSeen++)
			{
				std::string s = proxy::Events::Describe(v[m_nLogsSeen], m_Proxy);
				if (!s.empty())
					LOG_INFO() << "Event: " << s;
			}
		}

	public:
		void Run(const Scenario& sc)
		{
			const auto& addr = m_World.m_Addr;

			LOG_INFO() << "Client " << m_World.m_Client << ", fee rate " << sc.m_FeeBps << " bps";

			Address proxyAddr = m_World.CreateProxy(sc.m_FeeBps);
			m_Proxy = proxyAddr;
			Flush();

			m_World.Mint(addr.m_Asset, m_World.m_Client, sc.m_Deposit);
			m_World.Deposit(proxyAddr, sc.m_Deposit);
			Flush();

			if (sc.m_Yield)
			{
				m_World.AddYield(sc.m_Yield);
				LOG_INFO() << "Vault yield " << sc.m_Yield;
			}

			std::vector<Amount> vShares = sc.m_vWithdrawShares;
			if (vShares.empty())
				vShares.push_back(m_World.get_Shares(proxyAddr));

			for (Amount shares : vShares)
			{
				m_World.Withdraw(proxyAddr, shares);
				Flush();
			}

			if (sc.m_Reward)
			{
				m_World.Mint(addr.m_RewardToken, addr.m_Distributor, sc.m_Reward);
				m_World.PublishRewards({ { proxyAddr, sc.m_Reward } });
				m_World.ClaimReward(proxyAddr, m_World.m_Client);
				Flush();
			}

			const auto& p = m_World.get_Proxy(proxyAddr);

			cout << "Proxy:            " << proxyAddr << endl
				<< "Total deposited:  " << p.get_Deposited(addr.m_Asset) << endl
				<< "Total withdrawn:  " << p.get_Withdrawn(addr.m_Asset) << endl
				<< "Realized profit:  " << p.get_RealizedProfit(addr.m_Asset) << endl
				<< "Client asset:     " << m_World.get_Balance(addr.m_Asset, m_World.m_Client) << endl
				<< "Treasury asset:   " << m_World.get_Balance(addr.m_Asset, addr.m_Treasury) << endl
				<< "Client reward:    " << m_World.get_Balance(addr.m_RewardToken, m_World.m_Client) << endl
				<< "Treasury reward:  " << m_World.get_Balance(addr.m_RewardToken, addr.m_Treasury) << endl
				<< "Shares left:      " << m_World.get_Shares(proxyAddr) << endl;
		}
	};
}

int main(int argc, char* argv[])
{
	po::variables_map vm;
	try
	{
		auto options = createOptionsDescription();
		vm = getOptions(argc, argv, nullptr, options);

		if (vm.count(cli::HELP))
		{
			cout << options << endl;
			return 0;
		}

		if (vm.count(cli::VERSION))
		{
			cout << YP_PROJECT_VERSION << endl;
			return 0;
		}
	}
	catch (const po::error& e)
	{
		cerr << e.what() << endl;
		return 1;
	}

	LoggerConfig logCfg = getLoggerConfig(vm, FILES_PREFIX);
	if (logCfg.fileLevel != LOG_SINK_DISABLED)
		logCfg.path = boost::filesystem::system_complete(logCfg.path).string();

	auto logger = Logger::create(logCfg);

	int retCode = 0;
	try
	{
		Scenario sc;
		if (vm.count(cli::SCENARIO))
		{
			Config cfg;
			cfg.load(vm[cli::SCENARIO].as<string>());
			sc.Load(cfg);
		}

		LOG_INFO() << "Simulation started at " << format_timestamp("%Y-%m-%d %H:%M:%S", local_timestamp_msec());

		Runner r;
		r.Run(sc);

		LOG_INFO() << "Done";
	}
	catch (const std::exception& e)
	{
		LOG_ERROR() << "EXCEPTION: " << e.what();
		retCode = 255;
	}

	return retCode;
}
