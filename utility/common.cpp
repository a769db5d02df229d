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

#include "common.h"
#include "blobmap.h"
#include <algorithm>

// misc
bool memis0(const void* p, size_t n)
{
	for (size_t i = 0; i < n; i++)
		if (((const uint8_t*)p)[i])
			return false;
	return true;
}

namespace yieldproxy
{
	Blob::Blob(const ByteBuffer& bb)
	{
		if ((n = (uint32_t)bb.size()) != 0)
			p = &bb.at(0);
	}

	void Blob::Export(ByteBuffer& x) const
	{
		if (n)
		{
			x.resize(n);
			memcpy(&x.at(0), p, n);
		}
		else
			x.clear();
	}

	Blob Blob::Tail(uint32_t nOffset) const
	{
		if (nOffset >= n)
			return Blob();

		return Blob(static_cast<const uint8_t*>(p) + nOffset, n - nOffset);
	}

	int Blob::cmp(const Blob& x) const
	{
		int nRet = memcmp(p, x.p, std::min(n, x.n));
		if (nRet)
			return nRet;

		if (n < x.n)
			return -1;

		return (n > x.n);
	}

	///////////////////////
	// BlobMap
	BlobMap::Set::~Set()
	{
		Clear();
	}

	void BlobMap::Set::Clear()
	{
		while (!empty())
			Delete(*begin());
	}

	void BlobMap::Set::Delete(Entry& x)
	{
		erase(s_iterator_to(x));
		delete &x;
	}

	BlobMap::Entry* BlobMap::Set::Find(const Blob& key)
	{
		auto it = find(key, Comparator());
		return (end() == it) ? nullptr : &*it;
	}

	const BlobMap::Entry* BlobMap::Set::Find(const Blob& key) const
	{
		auto it = find(key, Comparator());
		return (end() == it) ? nullptr : &*it;
	}

	BlobMap::Entry* BlobMap::Set::Create(const Blob& key)
	{
		Entry* pItem = new (key.n) Entry;
		pItem->m_Size = key.n;
		memcpy(pItem->m_pBuf, key.p, key.n);

		insert(*pItem);
		return pItem;
	}

} // namespace yieldproxy
