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

namespace yieldproxy::chain
{
	// Bundling executor. Runs a list of calls on behalf of the initiator.
	// Calls that target the executor itself are dispatched to its adapters, which act on the initiator's funds.
	class Executor
		:public Contract
		,public IExecutor
	{
	public:
		Executor(Host&, const Address& addr);

		void Multicall(const Bundle&) override;
		const Address& get_Initiator() const override { return m_Initiator; }

		void OnCall(const Blob& payload) override;

		// payload builders
		static void BuildClaim(ByteBuffer&, const Address& distributor, const Address& account, const Address& reward, Amount claimable, const Merkle::Proof&);

	private:
		// set only for the duration of Multicall()
		Address m_Initiator;

		struct InitiatorScope;

		void Dispatch(const Blob& payload);

		void OnAdapter(const Method::Erc20TransferFrom&);
		void OnAdapter(const Method::Erc4626Deposit&);
		void OnAdapter(const Method::Erc4626Redeem&);
		void OnAdapter(const Method::UrdClaim&, const Blob& tail);
	};

} // namespace yieldproxy::chain
