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
 * Live event trigger tests: templates, gift matching, session tracking and
 * reminders.
 */

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

#include "catch2/catch.hpp"
#include "events/event_trigger.h"
#include "test_helpers.h"

extern "C" {
#include "herald.h"
}

using namespace herald;
using herald::test::FakeEngine;
using herald::test::RecordingSink;
using herald::test::test_config;

namespace {

struct Harness {
   int64_t now = 0;
   std::shared_ptr<PipelineConfig> config;
   std::shared_ptr<RecordingSink> sink;
   std::shared_ptr<EngineRegistry> engines;
   std::shared_ptr<TtsQueue> queue;
   std::shared_ptr<PermissionGate> gate;
   std::shared_ptr<SpeechPipeline> pipeline;
   std::unique_ptr<EventTrigger> trigger;

   Harness()
       : config(test_config()),
         sink(std::make_shared<RecordingSink>()),
         engines(std::make_shared<EngineRegistry>()) {
      config->events_enabled = true;
      EventTypeSettings &gift = config->event_types[EVENT_GIFT];
      gift.enabled = true;
      gift.template_text = "{username} hat {giftCount}x {giftName} geschenkt!";
      gift.min_value = 1;
      EventTypeSettings &follow = config->event_types[EVENT_FOLLOW];
      follow.enabled = true;
      follow.template_text = "{nickname} folgt jetzt!";
      EventTypeSettings &like = config->event_types[EVENT_LIKE];
      like.enabled = true;
      like.template_text = "{username} hat {likeCount} Likes gegeben!";
      like.min_value = 5;

      engines->put(std::make_shared<FakeEngine>("tiktok"));
      auto clock = [this]() { return now; };
      queue = std::make_shared<TtsQueue>(config, engines, sink, clock);
      gate = std::make_shared<PermissionGate>(config, clock);
      pipeline = std::make_shared<SpeechPipeline>(config, engines, queue, gate, sink);
      trigger = std::make_unique<EventTrigger>(pipeline, gate, clock);
   }

   std::vector<std::string> queued_texts() {
      std::vector<std::string> texts;
      for (const auto &item : queue->info().items) {
         texts.push_back(item.text);
      }
      return texts;
   }

   bool queued(const std::string &text) {
      std::vector<std::string> texts = queued_texts();
      return std::find(texts.begin(), texts.end(), text) != texts.end();
   }
};

LiveEvent gift(const std::string &user, int64_t coins, const std::string &name = "Rose") {
   LiveEvent event;
   event.type = EVENT_GIFT;
   event.user_id = user;
   event.username = user;
   event.gift_name = name;
   event.coins = coins;
   event.repeat_count = 1;
   return event;
}

}  // namespace

TEST_CASE("template filling", "[unit]") {
   TemplateValues values = { { "username", "Max" }, { "giftName", "Rose" }, { "giftCount", "3" } };

   CHECK(fill_template("{username} hat {giftCount}x {giftName} geschenkt!", values) ==
         "Max hat 3x Rose geschenkt!");
   CHECK(fill_template("{username} und {unknown}", values) == "Max und {unknown}");
   CHECK(fill_template("ohne Platzhalter", values) == "ohne Platzhalter");
   CHECK(fill_template("offen {username", values) == "offen {username");
   CHECK(fill_template("{username}{username}", values) == "MaxMax");
   CHECK(fill_template("", values).empty());
}

TEST_CASE("basic event announcements", "[unit]") {
   Harness h;

   SECTION("gift below the minimum is ignored without trace") {
      h.config->event_types[EVENT_GIFT].min_value = 10;
      TriggerResult result = h.trigger->handle(gift("max", 5));
      CHECK_FALSE(result.dispatched);
      CHECK(h.queue->info().size == 0);
      CHECK(h.sink->events().empty());
   }

   SECTION("gift at the minimum is announced") {
      h.config->event_types[EVENT_GIFT].min_value = 10;
      TriggerResult result = h.trigger->handle(gift("max", 10));
      REQUIRE(result.dispatched);
      CHECK(result.speak.success());
      CHECK(result.text == "max hat 1x Rose geschenkt!");
      CHECK(h.queued("max hat 1x Rose geschenkt!"));
   }

   SECTION("missing names get neutral placeholders") {
      LiveEvent event;
      event.type = EVENT_GIFT;
      event.coins = 1;
      TriggerResult result = h.trigger->handle(event);
      CHECK(result.text == "Jemand hat 1x ein Geschenk geschenkt!");
   }

   SECTION("nickname falls back to the username") {
      LiveEvent event;
      event.type = EVENT_FOLLOW;
      event.user_id = "u1";
      event.username = "anna";
      CHECK(h.trigger->handle(event).text == "anna folgt jetzt!");

      event.user_id = "u2";
      event.nickname = "Anna B.";
      CHECK(h.trigger->handle(event).text == "Anna B. folgt jetzt!");
   }

   SECTION("likes below the minimum are ignored") {
      LiveEvent event;
      event.type = EVENT_LIKE;
      event.user_id = "u1";
      event.username = "anna";
      event.like_count = 3;
      CHECK_FALSE(h.trigger->handle(event).dispatched);

      event.like_count = 12;
      CHECK(h.trigger->handle(event).text == "anna hat 12 Likes gegeben!");
   }

   SECTION("disabled events and disabled types publish nothing") {
      h.config->event_types[EVENT_SHARE].enabled = false;
      LiveEvent share;
      share.type = EVENT_SHARE;
      share.username = "anna";
      CHECK_FALSE(h.trigger->handle(share).dispatched);

      h.config->events_enabled = false;
      CHECK_FALSE(h.trigger->handle(gift("max", 100)).dispatched);

      LiveEvent unknown;
      CHECK_FALSE(h.trigger->handle(unknown).dispatched);
      CHECK(h.sink->events().empty());
   }

   SECTION("per-user cooldown on follow") {
      h.config->event_types[EVENT_FOLLOW].cooldown_ms = 60000;
      LiveEvent event;
      event.type = EVENT_FOLLOW;
      event.user_id = "u1";
      event.username = "anna";

      REQUIRE(h.trigger->handle(event).speak.success());
      h.now += 1000;
      TriggerResult again = h.trigger->handle(event);
      CHECK(again.dispatched);
      CHECK(again.speak.status == HERALD_ERR_ON_COOLDOWN);
      CHECK(again.speak.retry_after_ms == 59000);

      event.user_id = "u2";
      CHECK(h.trigger->handle(event).speak.success());
   }

   SECTION("event speech can jump ahead of chat") {
      h.config->events_priority_over_chat = true;
      SpeakRequest chat;
      chat.text = "Hallo";
      chat.user_id = "viewer";
      REQUIRE(h.pipeline->speak(chat).success());

      TriggerResult result = h.trigger->handle(gift("max", 5));
      REQUIRE(result.speak.success());
      CHECK(result.speak.position == 1);
   }
}

TEST_CASE("gift matching", "[unit]") {
   Harness h;
   h.config->tiered_gifts_enabled = true;
   const char *tier_templates[] = { "T1 {username}", "T2 {username}", "T3 {coins}", "T4 {coins}" };
   for (size_t i = 0; i < h.config->gift_tiers.size(); i++) {
      h.config->gift_tiers[i].enabled = true;
      h.config->gift_tiers[i].min_coins = i == 0 ? 1 : (i == 1 ? 10 : (i == 2 ? 100 : 1000));
      h.config->gift_tiers[i].template_text = tier_templates[i];
   }

   SECTION("highest matching tier wins") {
      CHECK(h.trigger->handle(gift("max", 150)).text == "T3 150");
      CHECK(h.trigger->handle(gift("max", 5000)).text == "T4 5000");
      CHECK(h.trigger->handle(gift("max", 10)).text == "T2 max");
      CHECK(h.trigger->handle(gift("max", 1)).text == "T1 max");
   }

   SECTION("disabled tier falls through to the next lower one") {
      h.config->gift_tiers[2].enabled = false;
      CHECK(h.trigger->handle(gift("max", 150)).text == "T2 max");
   }

   SECTION("zero coins match no tier and fall back to the gift template") {
      h.config->event_types[EVENT_GIFT].min_value = 0;
      CHECK(h.trigger->handle(gift("max", 0)).text == "max hat 1x Rose geschenkt!");
   }

   SECTION("specific gift rule beats the tiers") {
      h.config->specific_gifts_enabled = true;
      h.config->specific_gifts.push_back({ "rose", "Eine Rose von {username}!", "fake-en" });

      TriggerResult result = h.trigger->handle(gift("max", 150, "Rose"));
      CHECK(result.text == "Eine Rose von max!");
      CHECK(result.speak.voice_id == "fake-en");

      CHECK(h.trigger->handle(gift("max", 150, "Lion")).text == "T3 150");
   }
}

TEST_CASE("gift session tracking", "[unit]") {
   Harness h;

   SECTION("combo is announced once when the streak reaches the threshold") {
      h.config->combo_enabled = true;
      h.config->combo_threshold = 3;
      h.config->combo_window_ms = 10000;
      h.config->combo_template = "{username} Combo {streak}";

      h.trigger->handle(gift("max", 1));
      h.now += 1000;
      h.trigger->handle(gift("max", 1));
      CHECK_FALSE(h.queued("max Combo 3"));
      h.now += 1000;
      h.trigger->handle(gift("max", 1));
      CHECK(h.queued("max Combo 3"));

      h.now += 1000;
      h.trigger->handle(gift("max", 1));
      CHECK_FALSE(h.queued("max Combo 4"));
   }

   SECTION("a gap longer than the window restarts the streak") {
      h.config->combo_enabled = true;
      h.config->combo_threshold = 2;
      h.config->combo_window_ms = 10000;
      h.config->combo_template = "{username} Combo {streak}";

      h.trigger->handle(gift("max", 1));
      h.now += 10001;
      h.trigger->handle(gift("max", 1));
      CHECK_FALSE(h.queued("max Combo 2"));
      h.now += 500;
      h.trigger->handle(gift("max", 1));
      CHECK(h.queued("max Combo 2"));
   }

   SECTION("top gifter changes are announced with the previous leader") {
      h.config->top_gifter_enabled = true;
      h.config->top_gifter_template = "{username} fuehrt mit {coins}, vorher {previousTopGifter}";

      h.trigger->handle(gift("anna", 10));
      CHECK(h.trigger->top_gifter() == "anna");
      CHECK(h.queued("anna fuehrt mit 10, vorher niemand"));

      h.trigger->handle(gift("ben", 20, "Lion"));
      CHECK(h.trigger->top_gifter() == "ben");
      CHECK(h.queued("ben fuehrt mit 20, vorher anna"));

      size_t before = h.queue->info().size;
      h.trigger->handle(gift("anna", 5, "Lion"));
      CHECK(h.trigger->top_gifter() == "ben");
      // Only the gift itself, no new leader announcement
      CHECK(h.queue->info().size == before + 1);

      h.trigger->reset_session();
      CHECK(h.trigger->top_gifter().empty());
   }
}

TEST_CASE("periodic reminders", "[unit]") {
   Harness h;

   SECTION("never the same message twice in a row") {
      h.config->reminder_messages = { "Folgen!", "Teilen!", "Liken!" };
      std::string previous = h.trigger->next_reminder();
      for (int i = 0; i < 50; i++) {
         std::string next = h.trigger->next_reminder();
         CHECK(next != previous);
         previous = next;
      }
   }

   SECTION("single message repeats") {
      h.config->reminder_messages = { "Folgen!" };
      CHECK(h.trigger->next_reminder() == "Folgen!");
      CHECK(h.trigger->next_reminder() == "Folgen!");
   }

   SECTION("no messages") {
      h.config->reminder_messages.clear();
      CHECK(h.trigger->next_reminder().empty());
      CHECK_FALSE(h.trigger->announce_reminder().dispatched);
   }

   SECTION("announcement goes through the pipeline") {
      h.config->reminder_messages = { "Vergesst nicht zu folgen!" };
      TriggerResult result = h.trigger->announce_reminder();
      REQUIRE(result.dispatched);
      CHECK(result.speak.success());
      CHECK(h.queued("Vergesst nicht zu folgen!"));
   }

   SECTION("start without reminders configured starts no thread") {
      h.config->reminder_enabled = false;
      CHECK(h.trigger->start() == SUCCESS);
      h.trigger->stop();
   }
}
