// SPDX-License-Identifier: Apache-2.0
#include "server/directory/directory.hpp"

#include <chrono>
#include <mutex>
#include <random>

namespace eden::directory {

namespace {
constexpr char PUSH_CHARS[] = "-0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ_abcdefghijklmnopqrstuvwxyz";
} // namespace

std::string generate_push_id()
{
    static std::mutex mtx;
    static std::mt19937_64 rng{std::random_device{}()};
    static int64_t last_ms = 0;
    static int last_rand[12] = {};

    int64_t now = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::system_clock::now().time_since_epoch())
                      .count();
    std::scoped_lock lk{mtx};
    std::string id(20, '-');
    int64_t ts = now;
    for (int i = 7; i >= 0; --i) {
        id[i] = PUSH_CHARS[ts % 64];
        ts /= 64;
    }
    if (now != last_ms) {
        std::uniform_int_distribution<int> dist(0, 63);
        for (int &r : last_rand)
            r = dist(rng);
    } else {
        // Same millisecond: increment the random part so ids stay strictly ordered.
        int i = 11;
        for (; i >= 0 && last_rand[i] == 63; --i)
            last_rand[i] = 0;
        if (i >= 0)
            ++last_rand[i];
    }
    last_ms = now;
    for (int i = 0; i < 12; ++i)
        id[8 + i] = PUSH_CHARS[last_rand[i]];
    return id;
}

UserRecord make_user_record(int64_t character_id, const std::string &character_name)
{
    UserRecord u;
    u.uid = std::to_string(character_id);
    u.display_name = character_name;
    u.photo_url = "https://imageserver.eveonline.com/Character/" + u.uid + "_512.jpg";
    u.disabled = false;
    return u;
}

} // namespace eden::directory
