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
#include "core/common.h"
#include "utility/blobmap.h"
#include "utility/containers.h"
#include "utility/logger.h"
#include <boost/intrusive/list.hpp>
#include <map>
#include <stdexcept>

namespace yieldproxy::chain
{
	// Any failure inside a contract call. Aborts the whole transaction
	struct RevertException
		:public std::runtime_error
	{
		using std::runtime_error::runtime_error;
	};

	class Contract;

	// In-process execution environment: addressed contracts, call frames,
	// journaled storage and event log, all-or-nothing transactions.
	class Host
	{
	public:
		struct Limits
		{
			static const uint32_t FarCallDepth = 32;
		};

		Host();
		~Host();

		Host(const Host&) = delete;
		Host& operator = (const Host&) = delete;

		Timestamp m_Time = 0; // current time, seconds

		/////////////////////////////
		// Contracts
		template <typename T, typename... TArgs>
		T& Deploy(const Address& addr, TArgs&&... args);

		Contract* FindContract(const Address&) const;
		bool IsContract(const Address& addr) const { return FindContract(addr) != nullptr; }

		// throws if there's no contract at addr, or it doesn't implement T
		template <typename T>
		T& get_Contract(const Address& addr) const;

		/////////////////////////////
		// Call frames
		struct Frame
			:public boost::intrusive::list_base_hook<>
		{
			Address m_Caller;
			Address m_Callee;
		};

		class FarCall
		{
			Host& m_Host;
			Frame m_Frame;
		public:
			FarCall(Host&, const Address& caller, const Address& callee);
			~FarCall();

			FarCall(const FarCall&) = delete;
			FarCall& operator = (const FarCall&) = delete;
		};

		// immediate caller of the currently executing contract
		const Address& get_Caller() const;
		uint32_t get_Depth() const { return static_cast<uint32_t>(m_lstFrames.size()); }

		// dispatches an opaque payload to Contract::OnCall() of the target
		void CallFar(const Address& caller, const Address& target, const Blob& payload);

		/////////////////////////////
		// Transactions
		// Runs fn(T&) as called by sender. On any exception all the changes made since the beginning are undone, and the exception is rethrown.
		template <typename T, typename TFunc>
		void Transact(const Address& sender, const Address& target, TFunc&& fn);

		/////////////////////////////
		// Storage
		bool LoadVar(const Blob& key, ByteBuffer&) const;
		void SaveVar(const Blob& key, const Blob& val); // empty value deletes the variable

		/////////////////////////////
		// Event log
		struct LogEntry
		{
			Address m_Emitter;
			ByteBuffer m_Key;
			ByteBuffer m_Val;
		};

		void EmitLog(const Address& emitter, const Blob& key, const Blob& val);
		const std::vector<LogEntry>& get_Logs() const { return m_vLogs; }

		/////////////////////////////
		// Undo journal
		struct Action
			:public boost::intrusive::list_base_hook<>
		{
			virtual ~Action() = default;
			virtual void Undo(Host&) = 0;

			typedef intrusive::list_autoclear<Action> List;
		};

		size_t get_JournalSize() const { return m_lstUndo.size(); }
		uint64_t get_TxCount() const { return m_TxCount; } // submitted, including reverted
		void UndoChanges(size_t nTrg = 0);

	private:
		BlobMap::Set m_Vars;
		Action::List m_lstUndo;
		std::vector<LogEntry> m_vLogs;
		std::map<Address, std::unique_ptr<Contract> > m_mapContracts;
		boost::intrusive::list<Frame> m_lstFrames;
		uint64_t m_TxCount = 0;

		struct Action_Var;
		struct Action_Log;
		struct Action_Deploy;

		void SaveVarRaw(const Blob& key, const Blob& val, Action_Var*);
		void AddContract(const Address&, std::unique_ptr<Contract>&&);
		void CheckNoTransaction() const;
		void Commit();
	};

	// Storage view restricted to a single contract: all the keys are prefixed by its address
	class VarStore
	{
		Host& m_Host;
		const Address& m_Owner;

		void MakeKey(ByteBuffer&, const Blob& key) const;

	public:
		VarStore(Host& h, const Address& owner)
			:m_Host(h)
			,m_Owner(owner)
		{
		}

		bool LoadRaw(const Blob& key, ByteBuffer&) const;
		void SaveRaw(const Blob& key, const Blob& val);

		template <typename TKey, typename TVal>
		bool Load_T(const TKey& key, TVal& val) const
		{
			static_assert(std::is_trivially_copyable_v<TVal>);

			ByteBuffer buf;
			if (!LoadRaw(Blob(&key, sizeof(key)), buf) || (buf.size() != sizeof(val)))
				return false;

			memcpy(&val, buf.data(), sizeof(val));
			return true;
		}

		template <typename TKey, typename TVal>
		void Save_T(const TKey& key, const TVal& val)
		{
			static_assert(std::is_trivially_copyable_v<TVal>);
			SaveRaw(Blob(&key, sizeof(key)), Blob(&val, sizeof(val)));
		}

		template <typename TKey>
		void Del_T(const TKey& key)
		{
			SaveRaw(Blob(&key, sizeof(key)), Blob());
		}
	};

	// Base for everything deployed on the Host. All the mutable state must be kept in host vars, so that it's reverted with the transaction.
	class Contract
	{
	public:
		Contract(Host& h, const Address& addr)
			:m_Host(h)
			,m_Address(addr)
			,m_Vars(h, m_Address)
		{
		}

		virtual ~Contract() = default;

		Contract(const Contract&) = delete;
		Contract& operator = (const Contract&) = delete;

		const Address& get_Address() const { return m_Address; }

		// opaque entry point: big-endian selector followed by packed args
		virtual void OnCall(const Blob& payload);

		// Typed far call. Holds the call frame for its lifetime
		template <typename T>
		class FarRef
		{
			Host::FarCall m_Call;
			T& m_Target;
		public:
			FarRef(Host& h, const Address& caller, const Address& target)
				:m_Call(h, caller, target)
				,m_Target(h.get_Contract<T>(target))
			{
			}

			T* operator -> () const { return &m_Target; }
		};

	protected:
		Host& get_Host() const { return m_Host; }
		const Address& get_Caller() const { return m_Host.get_Caller(); }
		VarStore& get_Vars() { return m_Vars; }
		const VarStore& get_Vars() const { return m_Vars; }

		template <typename T>
		FarRef<T> Far(const Address& target) const
		{
			return FarRef<T>(m_Host, m_Address, target);
		}

		void CallFar(const Address& target, const Blob& payload) const
		{
			m_Host.CallFar(m_Address, target, payload);
		}

		template <typename TKey, typename TVal>
		bool LoadVar_T(const TKey& key, TVal& val) const { return m_Vars.Load_T(key, val); }

		template <typename TKey, typename TVal>
		void SaveVar_T(const TKey& key, const TVal& val) { m_Vars.Save_T(key, val); }

		template <typename TKey>
		void DelVar_T(const TKey& key) { m_Vars.Del_T(key); }

		template <typename TVal>
		void EmitLog_T(uint8_t nTag, const TVal& val)
		{
			static_assert(std::is_trivially_copyable_v<TVal>);
			m_Host.EmitLog(m_Address, Blob(&nTag, sizeof(nTag)), Blob(&val, sizeof(val)));
		}

	private:
		Host& m_Host;
		const Address m_Address;
		VarStore m_Vars;
	};

	/////////////////////////////
	// Host templates
	template <typename T, typename... TArgs>
	T& Host::Deploy(const Address& addr, TArgs&&... args)
	{
		auto p = std::make_unique<T>(*this, addr, std::forward<TArgs>(args)...);
		T& ret = *p;
		AddContract(addr, std::move(p));
		return ret;
	}

	template <typename T>
	T& Host::get_Contract(const Address& addr) const
	{
		Contract* pC = FindContract(addr);
		if (!pC)
			throw RevertException("no contract at the target address");

		T* pT = dynamic_cast<T*>(pC);
		if (!pT)
			throw RevertException("target doesn't implement the interface");

		return *pT;
	}

	template <typename T, typename TFunc>
	void Host::Transact(const Address& sender, const Address& target, TFunc&& fn)
	{
		CheckNoTransaction();
		LogScope scope("tx " + std::to_string(++m_TxCount));

		size_t nChanges = m_lstUndo.size();
		try
		{
			FarCall fc(*this, sender, target);
			fn(get_Contract<T>(target));
		}
		catch (const std::exception& e)
		{
			UndoChanges(nChanges);
			LOG_WARNING() << "Tx reverted, sender=" << sender << " target=" << target << ": " << e.what();
			throw;
		}

		Commit();
	}

} // namespace yieldproxy::chain
