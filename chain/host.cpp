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

#include "host.h"

namespace yieldproxy::chain
{
	Host::Host() = default;

	Host::~Host()
	{
		m_lstUndo.Clear(); // may reference contracts
		m_mapContracts.clear();
	}

	/////////////////////////////
	// Undo actions
	struct Host::Action_Var
		:public Action
	{
		ByteBuffer m_Key;
		ByteBuffer m_Value;

		void Undo(Host& h) override
		{
			h.SaveVarRaw(m_Key, m_Value, nullptr);
		}
	};

	struct Host::Action_Log
		:public Action
	{
		void Undo(Host& h) override
		{
			assert(!h.m_vLogs.empty());
			h.m_vLogs.pop_back();
		}
	};

	struct Host::Action_Deploy
		:public Action
	{
		Address m_Addr;

		void Undo(Host& h) override
		{
			h.m_mapContracts.erase(m_Addr);
		}
	};

	void Host::UndoChanges(size_t nTrg)
	{
		while (m_lstUndo.size() > nTrg)
		{
			auto& x = m_lstUndo.back();
			x.Undo(*this);
			m_lstUndo.Delete(x);
		}
	}

	void Host::Commit()
	{
		m_lstUndo.Clear();
	}

	void Host::CheckNoTransaction() const
	{
		if (!m_lstFrames.empty())
			throw RevertException("nested transaction");
	}

	/////////////////////////////
	// Storage
	bool Host::LoadVar(const Blob& key, ByteBuffer& res) const
	{
		const auto* pE = m_Vars.Find(key);
		if (!pE)
		{
			res.clear();
			return false;
		}

		res = pE->m_Data;
		return true;
	}

	void Host::SaveVar(const Blob& key, const Blob& val)
	{
		auto pUndo = std::make_unique<Action_Var>();
		SaveVarRaw(key, val, pUndo.get());
		m_lstUndo.Append(std::move(pUndo));
	}

	void Host::SaveVarRaw(const Blob& key, const Blob& val, Action_Var* pAction)
	{
		auto* pE = m_Vars.Find(key);

		if (pAction)
		{
			key.Export(pAction->m_Key);
			if (pE)
				pAction->m_Value.swap(pE->m_Data);
		}

		if (val.n)
		{
			if (!pE)
				pE = m_Vars.Create(key);

			val.Export(pE->m_Data);
		}
		else
		{
			if (pE)
				m_Vars.Delete(*pE);
		}
	}

	/////////////////////////////
	// Event log
	void Host::EmitLog(const Address& emitter, const Blob& key, const Blob& val)
	{
		auto& x = m_vLogs.emplace_back();
		x.m_Emitter = emitter;
		key.Export(x.m_Key);
		val.Export(x.m_Val);

		m_lstUndo.Append(std::make_unique<Action_Log>());
	}

	/////////////////////////////
	// Contracts
	Contract* Host::FindContract(const Address& addr) const
	{
		auto it = m_mapContracts.find(addr);
		return (m_mapContracts.end() == it) ? nullptr : it->second.get();
	}

	void Host::AddContract(const Address& addr, std::unique_ptr<Contract>&& p)
	{
		if (addr == Zero)
			throw RevertException("deploy at zero address");

		if (!m_mapContracts.emplace(addr, std::move(p)).second)
			throw RevertException("address already occupied");

		auto pUndo = std::make_unique<Action_Deploy>();
		pUndo->m_Addr = addr;
		m_lstUndo.Append(std::move(pUndo));

		LOG_DEBUG() << "Contract deployed at " << addr;
	}

	/////////////////////////////
	// Frames
	Host::FarCall::FarCall(Host& h, const Address& caller, const Address& callee)
		:m_Host(h)
	{
		if (h.m_lstFrames.size() >= Limits::FarCallDepth)
			throw RevertException("call depth exceeded");

		m_Frame.m_Caller = caller;
		m_Frame.m_Callee = callee;
		h.m_lstFrames.push_back(m_Frame);
	}

	Host::FarCall::~FarCall()
	{
		assert(&m_Host.m_lstFrames.back() == &m_Frame);
		m_Host.m_lstFrames.pop_back();
	}

	const Address& Host::get_Caller() const
	{
		if (m_lstFrames.empty())
			throw RevertException("no active call");

		return m_lstFrames.back().m_Caller;
	}

	void Host::CallFar(const Address& caller, const Address& target, const Blob& payload)
	{
		FarCall fc(*this, caller, target);

		Contract* pC = FindContract(target);
		if (!pC)
			throw RevertException("call to a non-contract address");

		pC->OnCall(payload);
	}

	/////////////////////////////
	// Contract
	void Contract::OnCall(const Blob&)
	{
		throw RevertException("method not supported");
	}

	/////////////////////////////
	// VarStore
	void VarStore::MakeKey(ByteBuffer& res, const Blob& key) const
	{
		res.resize(m_Owner.nBytes + key.n);
		memcpy(res.data(), m_Owner.m_pData, m_Owner.nBytes);
		if (key.n)
			memcpy(res.data() + m_Owner.nBytes, key.p, key.n);
	}

	bool VarStore::LoadRaw(const Blob& key, ByteBuffer& res) const
	{
		ByteBuffer k;
		MakeKey(k, key);
		return m_Host.LoadVar(k, res);
	}

	void VarStore::SaveRaw(const Blob& key, const Blob& val)
	{
		ByteBuffer k;
		MakeKey(k, key);
		m_Host.SaveVar(k, val);
	}

} // namespace yieldproxy::chain
