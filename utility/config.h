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
#include <string>
#include <stdint.h>
#include <limits>
#include <unordered_map>
#include <vector>
#include <any>

namespace yieldproxy {

class Config;

/// Returns global config
const Config& config();

/// Assigns global config once configuration is done.
/// throws if already assigned!
void reset_global_config(Config&& c);

/// Key/value settings loaded from JSON. Nested objects are flattened to "a.b.c" keys,
/// '#' starts a comment till the end of line (outside of quotes)
class Config {
public:
    // types used when JSON config loaded
    using Int = int64_t;
    using StringList = std::vector<std::string>;
    using IntList = std::vector<int64_t>;
    using FloatList = std::vector<double>;
    using BoolList = std::vector<bool>;

    Config() = default;
    Config(const Config& r) = default;
    Config& operator=(const Config& r) = default;
    Config(Config&&) = default;
    Config& operator=(Config&&) = default;

    bool empty() const {
        return _values.empty();
    }

    /// Loads from json file and throws on error
    void load(const std::string& fileName);

    /// Parses json text (comments allowed) and throws on error
    void parse(const std::string& text);

    template<typename T> void set(const std::string& key, T&& value) {
        _values[key] = std::any(std::forward<T>(value));
    }

    bool has_key(const std::string& key) const {
        return _values.count(key) == 1;
    }

    template <typename T> const T& get(const std::string& key, const T& defValue=T()) const {
        auto it = _values.find(key);
        if (it == _values.end()) return defValue;
        const T* value = std::any_cast<T>(&it->second);
        return value ? *value : defValue;
    }

    const std::string& get_string(const std::string& key, const std::string& defValue=std::string()) const {
        return get<std::string>(key, defValue);
    }

    int get_int(
        const std::string& key,
        int defValue=0,
        int minValue=std::numeric_limits<int>::min(),
        int maxValue=std::numeric_limits<int>::max()
    ) const {
        Int val = get<Int>(key, defValue);
        if (val <= minValue) return minValue;
        if (val >= maxValue) return maxValue;
        return int(val);
    }

    /// Non-negative integer value, throws if the stored one is negative
    uint64_t get_u64(const std::string& key, uint64_t defValue=0) const;

    IntList get_int_list(const std::string& key) const {
        return get<IntList>(key);
    }

    BoolList get_bool_list(const std::string& key) const {
        return get<BoolList>(key);
    }

private:
    std::unordered_map<std::string, std::any> _values;
};

} //namespace
