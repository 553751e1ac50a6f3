// SPDX-License-Identifier: Apache-2.0
#include "server/directory/memory_directory.hpp"

#include <coro/coro.hpp>

#include <cassert>
#include <chrono>
#include <iostream>
#include <set>
#include <stdexcept>

using namespace eden::directory;

int main()
{
    MemoryUserAccounts users;
    auto first = coro::sync_wait(users.upsert_user(make_user_record(90000001, "Pilot One")));
    assert(first.uid == "90000001");
    assert(first.photo_url == "https://imageserver.eveonline.com/Character/90000001_512.jpg");
    assert(!first.disabled);

    // Upsert is idempotent and updates in place.
    auto again = coro::sync_wait(users.upsert_user(make_user_record(90000001, "Pilot One")));
    assert(again == first);
    auto renamed = coro::sync_wait(users.upsert_user(make_user_record(90000001, "Pilot Renamed")));
    assert(renamed.display_name == "Pilot Renamed");
    assert(users.user_count() == 1);
    assert(users.find_user("90000001")->display_name == "Pilot Renamed");

    auto custom = coro::sync_wait(users.create_custom_token("90000001"));
    assert(!custom.empty());
    assert(users.uid_for_token(custom) == "90000001");
    assert(coro::sync_wait(users.create_custom_token("90000001")) != custom);
    assert(users.custom_token_count() == 2);
    assert(!users.uid_for_token("never-issued"));

    // Zero lifetime: tokens are born expired and swept by the next insert.
    MemoryUserAccounts short_lived(std::chrono::seconds(0));
    auto stale = coro::sync_wait(short_lived.create_custom_token("90000002"));
    assert(!short_lived.uid_for_token(stale));
    coro::sync_wait(short_lived.create_custom_token("90000003"));
    coro::sync_wait(short_lived.create_custom_token("90000004"));
    assert(short_lived.custom_token_count() == 1);

    MemoryDirectory dir;
    assert(!coro::sync_wait(dir.get_character(1)));
    CharacterRecord c{1, "acc", "Pilot", "hash", std::nullopt};
    coro::sync_wait(dir.put_character(c));
    assert(coro::sync_wait(dir.get_character(1)) == c);

    SsoGrant g{"at", "rt", 42, "publicData"};
    coro::sync_wait(dir.set_character_grant(1, g));
    auto stored = coro::sync_wait(dir.get_character(1));
    assert(stored && stored->sso == g && stored->name == "Pilot");

    ProfileRecord p{"acc", 1, "Pilot", false};
    coro::sync_wait(dir.put_profile(p));
    assert(coro::sync_wait(dir.get_profile("acc")) == p);
    assert(!coro::sync_wait(dir.get_profile("missing")));

    dir.set_fail_writes(true);
    bool threw = false;
    try {
        coro::sync_wait(dir.put_profile(p));
    } catch (const std::runtime_error &) {
        threw = true;
    }
    assert(threw);
    dir.set_fail_writes(false);

    // Keys: 20 chars, unique, ordered by creation.
    std::set<std::string> keys;
    std::string prev;
    for (int i = 0; i < 1000; ++i) {
        auto k = dir.generate_key();
        assert(k.size() == 20);
        assert(k > prev);
        prev = k;
        keys.insert(k);
    }
    assert(keys.size() == 1000);

    std::cout << "unit_memory_directory OK" << std::endl;
    return 0;
}
