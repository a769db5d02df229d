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
#include "hash.h"

namespace yieldproxy {
namespace Merkle {

	typedef Hash::Value HashValue;
	typedef std::pair<bool, HashValue>	Node; // true if the sibling is on the right
	typedef std::vector<Node>		Proof;

	void Interpret(HashValue&, const Proof&);
	void Interpret(HashValue&, const Node&);
	void Interpret(HashValue&, const HashValue& hLeft, const HashValue& hRight);
	void Interpret(HashValue&, const HashValue& hNew, bool bNewOnRight);

	// Fixed set of leaves. An odd element at any level is promoted as-is
	struct FixedTree
	{
		std::vector<HashValue> m_vLeafs;

		void get_Root(HashValue&) const;
		void get_Proof(Proof&, size_t iLeaf) const;
	};

} // namespace Merkle
} // namespace yieldproxy
