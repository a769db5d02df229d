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
#include "common.h"
#include <boost/intrusive/list.hpp>

namespace yieldproxy {
namespace intrusive
{
	// Owning intrusive list: elements are heap-allocated and deleted on removal
	template <typename TEntry>
	struct list
		:public boost::intrusive::list<TEntry>
	{
		typedef boost::intrusive::list<TEntry> Base;

		void Delete(TEntry& x)
		{
			Base::erase(Base::s_iterator_to(x));
			delete& x;
		}

		void Clear()
		{
			while (!Base::empty())
				Delete(*Base::begin());
		}

		// takes ownership
		void Append(std::unique_ptr<TEntry>&& p)
		{
			assert(p);
			Base::push_back(*p.release());
		}
	};

	template <typename TEntry>
	struct list_autoclear
		:public list<TEntry>
	{
		~list_autoclear() { list<TEntry>::Clear(); }
	};

} // namespace intrusive
} // namespace yieldproxy
