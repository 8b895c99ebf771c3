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
 * Permission and cooldown gate tests.
 */

#include <memory>

#include "catch2/catch.hpp"
#include "herald.h"
#include "pipeline/permission_gate.h"
#include "test_helpers.h"

namespace herald {

namespace {

GateRequest request_from(const std::string &user_id, const std::string &source) {
   GateRequest request;
   request.user_id = user_id;
   request.username = user_id;
   request.source = source;
   return request;
}

}  // namespace

TEST_CASE("source classification", "[unit]") {
   REQUIRE(is_preview_source("preview"));
   REQUIRE_FALSE(is_preview_source("chat"));
   REQUIRE(is_event_source("event:gift"));
   REQUIRE_FALSE(is_event_source("chat"));
   REQUIRE(is_system_source("event:top-gifter"));
   REQUIRE(is_system_source("manual"));
   REQUIRE(is_system_source("preview"));
   REQUIRE_FALSE(is_system_source("chat"));

   REQUIRE(event_type_of_source("event:follow") == EVENT_FOLLOW);
   REQUIRE(event_type_of_source("event:gift-streak") == EVENT_TYPE_COUNT);
   REQUIRE(event_type_of_source("chat") == EVENT_TYPE_COUNT);
}

TEST_CASE("gate authorization", "[unit]") {
   test::UserDbFixture db;
   REQUIRE(db.ok());
   auto config = test::test_config();

   SECTION("global switch blocks every source") {
      config->tts_enabled = false;
      PermissionGate gate(config);
      REQUIRE(gate.evaluate(request_from("u1", "chat")).status == HERALD_ERR_DISABLED);
      REQUIRE(gate.evaluate(request_from("u1", "preview")).status == HERALD_ERR_DISABLED);
      REQUIRE(gate.evaluate(request_from("u1", "event:follow")).status == HERALD_ERR_DISABLED);
   }

   SECTION("preview bypasses a configuration that denies chat") {
      config->allow_all = false;
      PermissionGate gate(config);

      GateDecision chat = gate.evaluate(request_from("viewer", "chat"));
      GateDecision preview = gate.evaluate(request_from("viewer", "preview"));

      REQUIRE(chat.status == HERALD_ERR_PERMISSION_DENIED);
      REQUIRE(std::string(herald_status_name(chat.status)) == "permission_denied");
      REQUIRE(preview.allowed());
   }

   SECTION("explicit records win over the default policy") {
      config->allow_all = false;
      PermissionGate gate(config);
      REQUIRE(user_db_allow_user("vip", "Vip") == USER_DB_SUCCESS);
      REQUIRE(gate.evaluate(request_from("vip", "chat")).allowed());

      config->allow_all = true;
      gate.set_config(config);
      REQUIRE(user_db_deny_user("muted", "Muted") == USER_DB_SUCCESS);
      REQUIRE(gate.evaluate(request_from("muted", "chat")).status ==
              HERALD_ERR_PERMISSION_DENIED);
   }

   SECTION("blacklist overrides allow_all") {
      PermissionGate gate(config);
      REQUIRE(user_db_blacklist_user("troll", "Troll") == USER_DB_SUCCESS);
      REQUIRE(gate.evaluate(request_from("troll", "chat")).status ==
              HERALD_ERR_PERMISSION_DENIED);
      REQUIRE(gate.evaluate(request_from("troll", "preview")).allowed());

      REQUIRE(user_db_unblacklist_user("troll") == USER_DB_SUCCESS);
      REQUIRE(user_db_allow_user("troll", NULL) == USER_DB_SUCCESS);
      REQUIRE(gate.evaluate(request_from("troll", "chat")).allowed());
   }

   SECTION("minimum team level") {
      config->team_min_level = 2;
      PermissionGate gate(config);
      GateRequest low = request_from("fan", "chat");
      low.team_level = 1;
      GateRequest high = request_from("fan", "chat");
      high.team_level = 3;
      REQUIRE(gate.evaluate(low).status == HERALD_ERR_PERMISSION_DENIED);
      REQUIRE(gate.evaluate(high).allowed());
   }

   SECTION("authorization is repeatable") {
      config->allow_all = false;
      PermissionGate gate(config);
      GateRequest request = request_from("viewer", "chat");
      REQUIRE(gate.authorize(request).status == gate.authorize(request).status);
   }
}

TEST_CASE("event cooldowns", "[unit]") {
   int64_t now = 1700000000000LL;
   auto clock = [&now]() { return now; };
   auto config = test::test_config();
   config->event_types[EVENT_FOLLOW].cooldown_ms = 5000;
   config->event_types[EVENT_SHARE].cooldown_ms = 5000;

   SECTION("second follow inside the window is dropped") {
      PermissionGate gate(config, clock);
      REQUIRE(gate.evaluate(request_from("U1", "event:follow")).allowed());

      now += 3000;
      GateDecision second = gate.evaluate(request_from("U1", "event:follow"));
      REQUIRE(second.status == HERALD_ERR_ON_COOLDOWN);
      REQUIRE(second.remaining_ms == 2000);

      now += 2000;
      REQUIRE(gate.evaluate(request_from("U1", "event:follow")).allowed());
   }

   SECTION("re-checking right after acceptance reports the remaining window") {
      PermissionGate gate(config, clock);
      REQUIRE(gate.check_cooldown("U1", EVENT_FOLLOW).allowed());
      GateDecision again = gate.check_cooldown("U1", EVENT_FOLLOW);
      REQUIRE(again.status == HERALD_ERR_ON_COOLDOWN);
      REQUIRE(again.remaining_ms > 0);
      REQUIRE(again.remaining_ms <= 5000);
      REQUIRE(gate.cooldown_remaining("U1", EVENT_FOLLOW) == again.remaining_ms);
   }

   SECTION("keys are per user and per event type") {
      PermissionGate gate(config, clock);
      REQUIRE(gate.evaluate(request_from("U1", "event:follow")).allowed());
      REQUIRE(gate.evaluate(request_from("U2", "event:follow")).allowed());
      REQUIRE(gate.evaluate(request_from("U1", "event:share")).allowed());
      REQUIRE_FALSE(gate.evaluate(request_from("U1", "event:follow")).allowed());
   }

   SECTION("zero window and non-event sources never cool down") {
      PermissionGate gate(config, clock);
      REQUIRE(gate.evaluate(request_from("U1", "event:like")).allowed());
      REQUIRE(gate.evaluate(request_from("U1", "event:like")).allowed());
      REQUIRE(gate.evaluate(request_from("U1", "chat")).allowed());
      REQUIRE(gate.evaluate(request_from("U1", "chat")).allowed());
   }

   SECTION("denied requests do not start a cooldown") {
      config->allow_all = false;
      PermissionGate gate(config, clock);
      REQUIRE(gate.evaluate(request_from("U1", "event:follow")).status ==
              HERALD_ERR_PERMISSION_DENIED);
      REQUIRE(gate.cooldown_remaining("U1", EVENT_FOLLOW) == 0);
   }

   SECTION("reset forgets every cooldown") {
      PermissionGate gate(config, clock);
      REQUIRE(gate.evaluate(request_from("U1", "event:follow")).allowed());
      gate.reset_cooldowns();
      REQUIRE(gate.evaluate(request_from("U1", "event:follow")).allowed());
   }

   SECTION("cooldowns survive a restart through the user store") {
      test::UserDbFixture db;
      REQUIRE(db.ok());
      {
         PermissionGate first(config, clock);
         REQUIRE(first.evaluate(request_from("U1", "event:follow")).allowed());
      }
      now += 1000;
      PermissionGate second(config, clock);
      GateDecision decision = second.evaluate(request_from("U1", "event:follow"));
      REQUIRE(decision.status == HERALD_ERR_ON_COOLDOWN);
      REQUIRE(decision.remaining_ms == 4000);
   }
}

}  // namespace herald
