// Copyright 2018-2020 The Beam Team
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

#include "hex.h"

namespace yieldproxy
{
    std::string to_hex(const void* bytes, size_t size)
    {
        static const char digits[] = "0123456789abcdef";

        std::string res;
        res.resize(size * 2);

        const uint8_t* ptr = (const uint8_t*)bytes;
        for (size_t i = 0; i < size; i++)
        {
            res[i * 2] = digits[ptr[i] >> 4];
            res[i * 2 + 1] = digits[ptr[i] & 0xF];
        }
        return res;
    }

    std::vector<uint8_t> from_hex(std::string_view str, bool* wholeStringIsNumber)
    {
        if ((str.size() >= 2) && (str[0] == '0') && ((str[1] == 'x') || (str[1] == 'X')))
            str.remove_prefix(2);

        size_t bias = (str.size() % 2) == 0 ? 0 : 1;
        std::vector<uint8_t> res((str.size() + bias) >> 1);

        if (wholeStringIsNumber) *wholeStringIsNumber = true;

        for (size_t i = 0; i < str.size(); ++i)
        {
            auto c = str[i];
            size_t j = (i + bias) >> 1;
            res[j] <<= 4;
            if (c >= '0' && c <= '9')
            {
                res[j] += (c - '0');
            }
            else if (c >= 'a' && c <= 'f')
            {
                res[j] += 10 + (c - 'a');
            }
            else if (c >= 'A' && c <= 'F')
            {
                res[j] += 10 + (c - 'A');
            }
            else {
                if (wholeStringIsNumber) *wholeStringIsNumber = false;
                break;
            }
        }

        return res;
    }

} //namespace
