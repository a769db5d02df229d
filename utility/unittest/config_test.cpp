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

#include "utility/config.h"
#include <iostream>
#include <fstream>
#include <stdexcept>
#include <unistd.h>

using namespace yieldproxy;
using namespace std;

static int error_count = 0;

#define CHECK(s) \
do {\
    if (!(s)) {\
        cout << "Check failed, line " << __LINE__ << ": " #s "\n";\
        ++error_count;\
    }\
} while(false)\

static const char* scenarioText = R"({
# comments may go after '#' character
        "fee_bps": 8700,
        "nullvalue": null, # null values ignored
        "vault" : {
            "name" : "usd#vault", # '#'s inside quotes are passed
            "yield" : -404040, # a comment
        # here is comment
            "enabled" : true,
            "flags": [true,true,false, true]
        },
        "withdraw_shares": [10150000, 150000]}
    )";

void load_config() {
    static const std::string fileName("/tmp/yp_config_test.json");
    unlink(fileName.c_str());

    std::ofstream file(fileName);
    file << scenarioText;
    file.close();

    Config cfg;
    cfg.load(fileName);
    reset_global_config(std::move(cfg));
}

void test_config() {
    load_config();

    bool thrown = false;
    try {
        load_config();
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    CHECK(thrown); // global config is assigned once

    CHECK(!config().has_key("slon"));
    CHECK(!config().has_key("nullvalue"));
    CHECK(config().has_key("vault.enabled"));
    CHECK(config().get_string("vault.name") == "usd#vault");
    CHECK(config().get_int("vault.yield", 0) == -404040);
    CHECK(config().get_int("fee_bps") == 8700);
    CHECK(config().get_u64("fee_bps") == 8700);
    CHECK(config().get_u64("missing", 17) == 17);

    auto v = config().get_int_list("withdraw_shares");
    CHECK(v.size() == 2 && v[0] == 10150000 && v[1] == 150000);
    CHECK(config().get_int_list("missing").empty());
    CHECK(config().get_bool_list("vault.flags") == std::vector<bool>({true,true,false,true}));

    thrown = false;
    try {
        config().get_u64("vault.yield");
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    CHECK(thrown); // negative
}

void test_parse_errors() {
    Config cfg;

    bool thrown = false;
    try {
        cfg.parse("# nothing but a comment\n");
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    CHECK(thrown);

    thrown = false;
    try {
        cfg.parse("[1, 2, 3]");
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    CHECK(thrown);

    thrown = false;
    try {
        cfg.load("/nonexistent/yp_config_test.json");
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    CHECK(thrown);

    cfg.parse(R"({ "deposit": 10000000 })");
    CHECK(cfg.get_u64("deposit") == 10000000);
}

int main() {
    try {
        test_config();
        test_parse_errors();
    }
    catch (const exception& e) {
        cout << "Exception: " << e.what() << '\n';
        ++error_count;
    }
    return error_count;
}
