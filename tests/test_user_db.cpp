/*
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 *
 * By contributing to this project, you agree to license your contributions
 * under the GPLv3 (or any later version) or any future licenses chosen by
 * the project author(s). Contributions include any modifications,
 * enhancements, or additions to the project. These contributions become
 * part of the project and are adopted by the project author(s).
 *
 * User store tests (in-memory SQLite).
 */

#include <cmath>
#include <cstring>
#include <string>
#include <vector>

#include "catch2/catch.hpp"
#include "test_helpers.h"

extern "C" {
#include "store/user_db.h"
}

namespace {

int collect_ids(const tts_user_record_t *user, void *ctx) {
   static_cast<std::vector<std::string> *>(ctx)->push_back(user->user_id);
   return 0;
}

}  // namespace

TEST_CASE("gain clamp", "[unit]") {
   REQUIRE(user_gain_clamp(-1.0) == USER_GAIN_MIN);
   REQUIRE(user_gain_clamp(7.5) == USER_GAIN_MAX);
   REQUIRE(user_gain_clamp(1.25) == 1.25);
   REQUIRE(user_gain_clamp(NAN) == USER_GAIN_DEFAULT);
}

TEST_CASE("user records", "[unit]") {
   herald::test::UserDbFixture db;
   REQUIRE(db.ok());
   REQUIRE(user_db_is_ready());

   tts_user_record_t record;

   SECTION("unknown users are not found") {
      REQUIRE(user_db_get_user("ghost", &record) == USER_DB_NOT_FOUND);
   }

   SECTION("stored gain is the clamped value") {
      double stored = 0.0;
      REQUIRE(user_db_set_volume_gain("u1", 9.0, &stored) == USER_DB_SUCCESS);
      REQUIRE(stored == USER_GAIN_MAX);
      REQUIRE(user_db_get_user("u1", &record) == USER_DB_SUCCESS);
      REQUIRE(record.volume_gain == USER_GAIN_MAX);
      REQUIRE(record.allow_tts == USER_PERMISSION_UNSET);

      REQUIRE(user_db_set_volume_gain("u1", 0.5, &stored) == USER_DB_SUCCESS);
      REQUIRE(user_db_get_user("u1", &record) == USER_DB_SUCCESS);
      REQUIRE(record.volume_gain == 0.5);
   }

   SECTION("voice assignment keeps gain unless given") {
      double gain = 2.0;
      REQUIRE(user_db_assign_voice("u2", "User2", "fish-sarah", "fishaudio", "happy", &gain) ==
              USER_DB_SUCCESS);
      REQUIRE(user_db_assign_voice("u2", NULL, "de_002", "tiktok", NULL, NULL) == USER_DB_SUCCESS);
      REQUIRE(user_db_get_user("u2", &record) == USER_DB_SUCCESS);
      REQUIRE(std::string(record.username) == "User2");
      REQUIRE(std::string(record.assigned_voice_id) == "de_002");
      REQUIRE(std::string(record.assigned_engine) == "tiktok");
      REQUIRE(std::string(record.emotion) == "happy");
      REQUIRE(record.volume_gain == 2.0);

      REQUIRE(user_db_remove_voice_assignment("u2") == USER_DB_SUCCESS);
      REQUIRE(user_db_get_user("u2", &record) == USER_DB_SUCCESS);
      REQUIRE(record.assigned_voice_id[0] == '\0');
      REQUIRE(record.volume_gain == 2.0);
   }

   SECTION("permission transitions") {
      REQUIRE(user_db_allow_user("u3", "User3") == USER_DB_SUCCESS);
      REQUIRE(user_db_get_user("u3", &record) == USER_DB_SUCCESS);
      REQUIRE(record.allow_tts == USER_PERMISSION_ALLOWED);

      REQUIRE(user_db_blacklist_user("u3", NULL) == USER_DB_SUCCESS);
      REQUIRE(user_db_get_user("u3", &record) == USER_DB_SUCCESS);
      REQUIRE(record.is_blacklisted);
      REQUIRE(record.allow_tts == USER_PERMISSION_DENIED);
      REQUIRE(std::string(record.username) == "User3");

      REQUIRE(user_db_unblacklist_user("u3") == USER_DB_SUCCESS);
      REQUIRE(user_db_unblacklist_user("nobody") == USER_DB_NOT_FOUND);
   }

   SECTION("stats, listing and deletion") {
      REQUIRE(user_db_allow_user("a", "A") == USER_DB_SUCCESS);
      REQUIRE(user_db_blacklist_user("b", "B") == USER_DB_SUCCESS);
      REQUIRE(user_db_assign_voice("c", "C", "de_002", "tiktok", NULL, NULL) == USER_DB_SUCCESS);

      user_db_stats_t stats;
      REQUIRE(user_db_get_stats(&stats) == USER_DB_SUCCESS);
      REQUIRE(stats.total == 3);
      REQUIRE(stats.allowed == 1);
      REQUIRE(stats.blacklisted == 1);
      REQUIRE(stats.with_voice == 1);

      std::vector<std::string> ids;
      REQUIRE(user_db_list_users(collect_ids, &ids) == USER_DB_SUCCESS);
      REQUIRE(ids.size() == 3);

      REQUIRE(user_db_delete_user("b") == USER_DB_SUCCESS);
      REQUIRE(user_db_delete_user("b") == USER_DB_NOT_FOUND);
   }

   SECTION("settings") {
      char value[USER_DB_SETTING_VALUE_MAX];
      REQUIRE(user_db_get_setting("missing", value, sizeof(value)) == USER_DB_NOT_FOUND);
      REQUIRE(user_db_set_setting("tts_openai_api_key", "abc") == USER_DB_SUCCESS);
      REQUIRE(user_db_set_setting("tts_openai_api_key", "def") == USER_DB_SUCCESS);
      REQUIRE(user_db_get_setting("tts_openai_api_key", value, sizeof(value)) == USER_DB_SUCCESS);
      REQUIRE(std::string(value) == "def");
   }
}

TEST_CASE("closed store fails cleanly", "[unit]") {
   tts_user_record_t record;
   REQUIRE_FALSE(user_db_is_ready());
   REQUIRE(user_db_get_user("u1", &record) == USER_DB_FAILURE);
   REQUIRE(user_db_set_volume_gain("", 1.0, NULL) == USER_DB_INVALID);
}
