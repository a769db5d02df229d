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

#include "merkle.h"

namespace yieldproxy {
namespace Merkle {

void Interpret(HashValue& out, const HashValue& hLeft, const HashValue& hRight)
{
	Hash::Processor() << hLeft << hRight >> out;
}

void Interpret(HashValue& hOld, const HashValue& hNew, bool bNewOnRight)
{
	if (bNewOnRight)
		Interpret(hOld, hOld, hNew);
	else
		Interpret(hOld, hNew, hOld);
}

void Interpret(HashValue& hash, const Node& n)
{
	Interpret(hash, n.second, n.first);
}

void Interpret(HashValue& hash, const Proof& p)
{
	for (Proof::const_iterator it = p.begin(); p.end() != it; it++)
		Interpret(hash, *it);
}

/////////////////////////////
// FixedTree
void FixedTree::get_Root(HashValue& hv) const
{
	if (m_vLeafs.empty())
		throw std::runtime_error("merkle: no leafs");

	std::vector<HashValue> vLevel = m_vLeafs;
	while (vLevel.size() > 1)
	{
		size_t n = 0;
		for (size_t i = 0; i < vLevel.size(); i += 2, n++)
		{
			if (i + 1 < vLevel.size())
				Interpret(vLevel[n], vLevel[i], vLevel[i + 1]);
			else
				vLevel[n] = vLevel[i];
		}
		vLevel.resize(n);
	}

	hv = vLevel.front();
}

void FixedTree::get_Proof(Proof& proof, size_t iLeaf) const
{
	if (iLeaf >= m_vLeafs.size())
		throw std::runtime_error("merkle: leaf out of range");

	proof.clear();

	std::vector<HashValue> vLevel = m_vLeafs;
	for (size_t iPos = iLeaf; vLevel.size() > 1; iPos >>= 1)
	{
		size_t iSibling = iPos ^ 1;
		if (iSibling < vLevel.size())
			proof.emplace_back((iSibling > iPos), vLevel[iSibling]);

		size_t n = 0;
		for (size_t i = 0; i < vLevel.size(); i += 2, n++)
		{
			if (i + 1 < vLevel.size())
				Interpret(vLevel[n], vLevel[i], vLevel[i + 1]);
			else
				vLevel[n] = vLevel[i];
		}
		vLevel.resize(n);
	}
}

} // namespace Merkle
} // namespace yieldproxy
