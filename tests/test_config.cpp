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
 * Configuration defaults, validation, TOML parsing and snapshot tests.
 */

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <string>

#include "catch2/catch.hpp"
#include "core/pipeline_config.h"

extern "C" {
#include "config/config_env.h"
#include "config/config_parser.h"
#include "config/config_validate.h"
#include "config/herald_config.h"
#include "herald.h"
}

using herald::PipelineConfigPtr;

namespace {

herald_config_t defaults() {
   herald_config_t config;
   config_set_defaults(&config);
   return config;
}

bool has_error(const config_error_t *errors, int count, const char *field) {
   for (int i = 0; i < count; i++) {
      if (strcmp(errors[i].field, field) == 0) {
         return true;
      }
   }
   return false;
}

/* Writes contents to a fresh temporary file and unlinks it on scope exit */
class TempToml {
 public:
   explicit TempToml(const std::string &contents) {
      char tmpl[] = "/tmp/herald_test_XXXXXX";
      int fd = mkstemp(tmpl);
      if (fd >= 0) {
         path_ = tmpl;
         FILE *fp = fdopen(fd, "w");
         if (fp) {
            fputs(contents.c_str(), fp);
            fclose(fp);
         } else {
            close(fd);
         }
      }
   }
   ~TempToml() {
      if (!path_.empty()) {
         unlink(path_.c_str());
      }
   }

   TempToml(const TempToml &) = delete;
   TempToml &operator=(const TempToml &) = delete;

   const char *path() const { return path_.c_str(); }

 private:
   std::string path_;
};

}  // namespace

TEST_CASE("config defaults", "[unit]") {
   herald_config_t config = defaults();

   CHECK(std::string(config.general.database_path) == "herald.db");
   CHECK(config.tts.enabled);
   CHECK(std::string(config.tts.default_engine) == "tiktok");
   CHECK(std::string(config.tts.default_voice) == "de_002");
   CHECK(config.tts.volume == 80);
   CHECK(config.tts.max_text_length == 300);
   REQUIRE(config.tts.prefix_filter_count == 2);
   CHECK(std::string(config.tts.prefix_filter[0]) == "!");
   CHECK(std::string(config.tts.prefix_filter[1]) == "/");
   CHECK(std::string(config.tts.profanity_filter) == "moderate");
   CHECK(config.permissions.allow_all);

   CHECK(config.queue.max_queue_size == 100);
   CHECK(config.queue.rate_limit == 3);
   CHECK(config.queue.pregen_await_ms == 2000);

   CHECK_FALSE(config.events.enabled);
   CHECK(config.events.types[EVENT_GIFT].enabled);
   CHECK(config.events.types[EVENT_FOLLOW].cooldown_sec == 60);
   CHECK_FALSE(config.events.types[EVENT_JOIN].enabled);
   CHECK(config.events.advanced.combo_threshold == 3);
   CHECK(config.events.advanced.combo_window_sec == 10);
   CHECK(config.events.advanced.reminder_count == 2);

   CHECK_FALSE(config.mqtt.enabled);
   CHECK(std::string(config.mqtt.broker) == "localhost");
   CHECK(config.mqtt.port == 1883);
   CHECK(std::string(config.mqtt.topic_prefix) == "herald");
   CHECK(std::string(config.mqtt.client_id) == APPLICATION_NAME);

   config_error_t errors[16];
   CHECK(config_validate(&config, NULL, errors, 16) == 0);
}

TEST_CASE("config validation", "[unit]") {
   herald_config_t config = defaults();
   config_error_t errors[16];

   SECTION("volume out of range") {
      config.tts.volume = 101;
      int n = config_validate(&config, NULL, errors, 16);
      REQUIRE(n == 1);
      CHECK(has_error(errors, n, "tts.volume"));
   }

   SECTION("speed out of range") {
      config.tts.speed = 0.1f;
      int n = config_validate(&config, NULL, errors, 16);
      CHECK(has_error(errors, n, "tts.speed"));
   }

   SECTION("max_text_length bounds") {
      config.tts.max_text_length = 9;
      int n = config_validate(&config, NULL, errors, 16);
      CHECK(has_error(errors, n, "tts.max_text_length"));

      config.tts.max_text_length = 5000;
      CHECK(config_validate(&config, NULL, errors, 16) == 0);
   }

   SECTION("unknown engine and modes") {
      strcpy(config.tts.default_engine, "espeak");
      strcpy(config.tts.performance_mode, "turbo");
      strcpy(config.tts.profanity_filter, "mild");
      int n = config_validate(&config, NULL, errors, 16);
      CHECK(n == 3);
      CHECK(has_error(errors, n, "tts.default_engine"));
      CHECK(has_error(errors, n, "tts.performance_mode"));
      CHECK(has_error(errors, n, "tts.profanity_filter"));
   }

   SECTION("stream endpoint must be a websocket url") {
      strcpy(config.streaming.endpoint, "https://api.fish.audio/v1/tts/live");
      int n = config_validate(&config, NULL, errors, 16);
      CHECK(has_error(errors, n, "streaming.endpoint"));

      strcpy(config.streaming.endpoint, "ws://localhost:8080/live");
      CHECK(config_validate(&config, NULL, errors, 16) == 0);
   }

   SECTION("combo threshold only checked when combo is enabled") {
      config.events.advanced.combo_threshold = 1;
      CHECK(config_validate(&config, NULL, errors, 16) == 0);

      config.events.advanced.combo_enabled = true;
      int n = config_validate(&config, NULL, errors, 16);
      CHECK(has_error(errors, n, "events.advanced.combo_threshold"));
   }

   SECTION("negative event cooldown names the event type") {
      config.events.types[EVENT_SHARE].cooldown_sec = -1;
      int n = config_validate(&config, NULL, errors, 16);
      CHECK(has_error(errors, n, "events.share.cooldown_sec"));
   }

   SECTION("reminders need at least one message") {
      config.events.advanced.reminder_enabled = true;
      config.events.advanced.reminder_count = 0;
      int n = config_validate(&config, NULL, errors, 16);
      CHECK(has_error(errors, n, "events.advanced.reminder_messages"));
   }

   SECTION("mqtt requires a broker when enabled") {
      config.mqtt.enabled = true;
      config.mqtt.broker[0] = '\0';
      int n = config_validate(&config, NULL, errors, 16);
      CHECK(has_error(errors, n, "mqtt.broker"));
   }

   SECTION("missing credential only warns") {
      secrets_config_t secrets;
      config_set_secrets_defaults(&secrets);
      strcpy(config.tts.default_engine, "fishaudio");
      CHECK(config_validate(&config, &secrets, errors, 16) == 0);
   }

   SECTION("errors are counted beyond the output capacity") {
      config.tts.volume = -1;
      config.events.volume = 200;
      config.queue.rate_limit = 0;
      CHECK(config_validate(&config, NULL, errors, 1) == 3);
      CHECK(config_validate(&config, NULL, NULL, 0) == 3);
   }

   SECTION("null configuration") {
      CHECK(config_validate(NULL, NULL, errors, 16) == 1);
      CHECK(std::string(errors[0].field) == "config");
   }
}

TEST_CASE("secrets store", "[unit]") {
   secrets_config_t secrets;
   config_set_secrets_defaults(&secrets);

   CHECK(secrets_get(&secrets, "tts_openai_api_key") == NULL);
   REQUIRE(secrets_set(&secrets, "tts_openai_api_key", "sk-1") == SUCCESS);
   REQUIRE(secrets_set(&secrets, "tts_openai_api_key", "sk-2") == SUCCESS);
   CHECK(secrets.count == 1);
   CHECK(std::string(secrets_get(&secrets, "tts_openai_api_key")) == "sk-2");
   CHECK(secrets_set(&secrets, "", "x") == FAILURE);
   CHECK(secrets_get(NULL, "tts_openai_api_key") == NULL);
}

TEST_CASE("config file parsing", "[unit]") {
   herald_config_t config = defaults();

   SECTION("sections override defaults") {
      TempToml file("[tts]\n"
                    "default_engine = \"fishaudio\"\n"
                    "volume = 55\n"
                    "speed = 2\n"
                    "message_prefix_filter = [\"#\"]\n"
                    "\n"
                    "[queue]\n"
                    "rate_limit = 5\n"
                    "\n"
                    "[events]\n"
                    "enabled = true\n"
                    "\n"
                    "[events.gift]\n"
                    "min_coins = 10\n"
                    "\n"
                    "[events.advanced]\n"
                    "combo_enabled = true\n"
                    "reminder_messages = [\"Eins\"]\n"
                    "\n"
                    "[events.advanced.tier2]\n"
                    "voice = \"de_001\"\n"
                    "\n"
                    "[[events.advanced.specific_gifts]]\n"
                    "gift_name = \"Rose\"\n"
                    "template = \"Rose von {username}\"\n"
                    "\n"
                    "[[events.advanced.specific_gifts]]\n"
                    "template = \"ohne Namen\"\n");

      REQUIRE(config_parse_file(file.path(), &config) == SUCCESS);

      CHECK(std::string(config.tts.default_engine) == "fishaudio");
      CHECK(config.tts.volume == 55);
      CHECK(config.tts.speed == Approx(2.0f));
      REQUIRE(config.tts.prefix_filter_count == 1);
      CHECK(std::string(config.tts.prefix_filter[0]) == "#");
      CHECK(config.queue.rate_limit == 5);
      CHECK(config.queue.max_queue_size == 100);
      CHECK(config.events.enabled);
      CHECK(config.events.types[EVENT_GIFT].min_value == 10);
      CHECK(config.events.advanced.combo_enabled);
      REQUIRE(config.events.advanced.reminder_count == 1);
      CHECK(std::string(config.events.advanced.reminder_messages[0]) == "Eins");
      CHECK(std::string(config.events.advanced.tiers[1].voice) == "de_001");
      REQUIRE(config.events.advanced.specific_gift_count == 1);
      CHECK(std::string(config.events.advanced.specific_gifts[0].gift_name) == "Rose");
   }

   SECTION("missing file fails") {
      CHECK(config_parse_file("/nonexistent/herald.toml", &config) == FAILURE);
   }

   SECTION("syntax error fails") {
      TempToml file("[tts\nvolume = \n");
      CHECK(config_parse_file(file.path(), &config) == FAILURE);
   }

   SECTION("secrets file") {
      TempToml file("[credentials]\n"
                    "tts_fishaudio_api_key = \"fa-key\"\n"
                    "tiktok_session_id = \"\"\n"
                    "\n"
                    "[mqtt]\n"
                    "username = \"bot\"\n");
      secrets_config_t secrets;
      config_set_secrets_defaults(&secrets);
      REQUIRE(config_parse_secrets(file.path(), &secrets) == SUCCESS);
      CHECK(std::string(secrets_get(&secrets, "tts_fishaudio_api_key")) == "fa-key");
      CHECK(std::string(secrets_get(&secrets, "tiktok_session_id")).empty());
      CHECK(std::string(secrets.mqtt_username) == "bot");
      CHECK(secrets.mqtt_password[0] == '\0');
   }

   SECTION("non-string credentials are skipped") {
      TempToml file("[credentials]\n"
                    "tts_google_api_key = 42\n"
                    "tts_openai_api_key = \"oa-key\"\n");
      secrets_config_t secrets;
      config_set_secrets_defaults(&secrets);
      REQUIRE(config_parse_secrets(file.path(), &secrets) == SUCCESS);
      CHECK(secrets_get(&secrets, "tts_google_api_key") == nullptr);
      CHECK(std::string(secrets_get(&secrets, "tts_openai_api_key")) == "oa-key");
   }

   SECTION("explicit --config path is loaded and reported") {
      TempToml file("[tts]\nvolume = 40\n");
      REQUIRE(config_load_from_search(file.path(), &config) == SUCCESS);
      CHECK(config.tts.volume == 40);
      CHECK(std::string(config_get_loaded_path()) == file.path());
   }

   SECTION("unreadable explicit path fails without searching elsewhere") {
      int volume = config.tts.volume;
      CHECK(config_load_from_search("/nonexistent/herald.toml", &config) == FAILURE);
      CHECK(config.tts.volume == volume);
   }
}

TEST_CASE("environment overrides", "[unit]") {
   herald_config_t config = defaults();
   secrets_config_t secrets;
   config_set_secrets_defaults(&secrets);

   setenv("HERALD_TTS_VOLUME", "42", 1);
   setenv("HERALD_QUEUE_RATE_LIMIT", "many", 1);
   setenv("HERALD_EVENTS_ENABLED", "yes", 1);
   setenv("FISHAUDIO_API_KEY", "env-key", 1);

   config_apply_env(&config, &secrets);

   unsetenv("HERALD_TTS_VOLUME");
   unsetenv("HERALD_QUEUE_RATE_LIMIT");
   unsetenv("HERALD_EVENTS_ENABLED");
   unsetenv("FISHAUDIO_API_KEY");

   CHECK(config.tts.volume == 42);
   CHECK(config.queue.rate_limit == 3);
   CHECK(config.events.enabled);
   REQUIRE(secrets_get(&secrets, "tts_fishaudio_api_key") != NULL);
   CHECK(std::string(secrets_get(&secrets, "tts_fishaudio_api_key")) == "env-key");
}

TEST_CASE("pipeline config snapshot", "[unit]") {
   herald_config_t config = defaults();
   config.events.types[EVENT_FOLLOW].cooldown_sec = 30;
   config.events.advanced.specific_gift_count = 2;
   config.events.advanced.specific_gifts[0].enabled = true;
   strcpy(config.events.advanced.specific_gifts[0].gift_name, "Rose");
   config.events.advanced.specific_gifts[1].enabled = false;
   strcpy(config.events.advanced.specific_gifts[1].gift_name, "Lion");

   PipelineConfigPtr snap = herald::make_pipeline_config(config);

   CHECK(snap->default_engine == "tiktok");
   CHECK(snap->mode == herald::PerformanceMode::BALANCED);
   CHECK(snap->profanity == PROFANITY_MODERATE);
   CHECK(snap->prefix_filters == std::vector<std::string>{ "!", "/" });
   CHECK(snap->rate_limit_window_ms == 60000);
   CHECK(snap->dedup_window_ms == 60000);
   CHECK(snap->event(EVENT_FOLLOW).cooldown_ms == 30000);
   CHECK(snap->event(EVENT_SUBSCRIBE).cooldown_ms == 0);
   CHECK(snap->combo_window_ms == 10000);
   CHECK(snap->reminder_interval_ms == 15 * 60 * 1000);
   CHECK(snap->reminder_messages.size() == 2);

   REQUIRE(snap->specific_gifts.size() == 1);
   CHECK(snap->specific_gifts[0].gift_name == "Rose");

   CHECK(snap->gift_tiers[0].min_coins == 1);
   CHECK(snap->gift_tiers[1].min_coins == 10);
   CHECK(snap->gift_tiers[2].min_coins == 100);
   CHECK(snap->gift_tiers[3].min_coins == 1000);
}
