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
 * Engine adapters and registry tests.
 */

#include <algorithm>
#include <map>
#include <string>
#include <vector>

#include "catch2/catch.hpp"
#include "test_helpers.h"
#include "tts/engine_registry.h"
#include "tts/tts_engines.h"

namespace herald {

using test::FakeHttpClient;

TEST_CASE("adapters reject blank credentials", "[unit]") {
   auto http = std::make_shared<FakeHttpClient>();

   SECTION("whitespace key names the requirement") {
      try {
         FishAudioEngine engine("   ", EngineSettings(), http);
         FAIL("constructor accepted a blank key");
      } catch (const TtsError &e) {
         REQUIRE(e.status() == HERALD_ERR_INVALID_CREDENTIAL);
         std::string message = e.what();
         REQUIRE(message.find("required") != std::string::npos);
         REQUIRE(message.find("non-empty") != std::string::npos);
      }
   }

   SECTION("every known engine validates its key") {
      for (const auto &id : engine_ids()) {
         INFO(id);
         try {
            create_engine(id, " \t\n", EngineSettings(), http);
            FAIL("blank credential accepted");
         } catch (const TtsError &e) {
            REQUIRE(e.status() == HERALD_ERR_INVALID_CREDENTIAL);
         }
      }
   }

   SECTION("keys are stored trimmed") {
      FishAudioEngine engine("  abc123 \n", EngineSettings(), http);
      REQUIRE(engine.api_key() == "abc123");
   }

   SECTION("unknown engine id") {
      try {
         create_engine("nope", "key", EngineSettings(), http);
         FAIL("unknown engine constructed");
      } catch (const TtsError &e) {
         REQUIRE(e.status() == HERALD_ERR_NOT_FOUND);
      }
   }
}

TEST_CASE("performance mode tuning", "[unit]") {
   REQUIRE(performance_mode_from_name("fast") == PerformanceMode::FAST);
   REQUIRE(performance_mode_from_name("quality") == PerformanceMode::QUALITY);
   REQUIRE(performance_mode_from_name("whatever") == PerformanceMode::BALANCED);

   REQUIRE(performance_mode_tuning(PerformanceMode::FAST).timeout_ms == 8000);
   REQUIRE(performance_mode_tuning(PerformanceMode::FAST).max_retries == 1);
   REQUIRE(performance_mode_tuning(PerformanceMode::BALANCED).timeout_ms == 15000);
   REQUIRE(performance_mode_tuning(PerformanceMode::BALANCED).max_retries == 2);
   REQUIRE(performance_mode_tuning(PerformanceMode::QUALITY).timeout_ms == 30000);
   REQUIRE(performance_mode_tuning(PerformanceMode::QUALITY).max_retries == 3);
}

TEST_CASE("fish audio adapter", "[unit]") {
   auto http = std::make_shared<FakeHttpClient>();
   EngineSettings settings;
   settings.retry_base_delay_ms = 0;

   SECTION("emotion markers") {
      REQUIRE(FishAudioEngine::apply_emotion("Hallo", "happy") == "(happy) Hallo");
      REQUIRE(FishAudioEngine::apply_emotion("(sad) Hallo", "happy") == "(sad) Hallo");
      REQUIRE(FishAudioEngine::apply_emotion("Hallo", "sleepy-ish") == "Hallo");
      REQUIRE(FishAudioEngine::apply_emotion("Hallo", "") == "Hallo");
   }

   SECTION("voice resolution") {
      FishAudioEngine engine("key", settings, http);
      REQUIRE(engine.resolve_reference_id("fish-sarah") == "933563129e564b19a115bedd57b7406a");
      REQUIRE(engine.resolve_reference_id("0123456789abcdef0123456789abcdef") ==
              "0123456789abcdef0123456789abcdef");
      REQUIRE(engine.resolve_reference_id("not-a-voice") ==
              FishAudioEngine::kDefaultReferenceId);

      REQUIRE(engine.accepts_voice("fish-christa"));
      REQUIRE(engine.accepts_voice("0123456789abcdef0123456789abcdef"));
      REQUIRE_FALSE(engine.accepts_voice("de_002"));
      REQUIRE(engine.get_default_voice_for_language("de") == FishAudioEngine::kDefaultVoice);
   }

   SECTION("streaming follows the performance mode") {
      REQUIRE(FishAudioEngine("key", settings, http).supports_streaming());
      settings.mode = PerformanceMode::QUALITY;
      REQUIRE_FALSE(FishAudioEngine("key", settings, http).supports_streaming());
   }

   SECTION("synthesis request carries the reference id and emotion") {
      FishAudioEngine engine("secret", settings, http);
      http->push(200, "ID3data");

      SynthesisOptions options;
      options.emotion = "happy";
      AudioBuffer audio = engine.synthesize("Hallo Chat", "fish-sarah", options);

      REQUIRE(std::string(audio.begin(), audio.end()) == "ID3data");
      std::vector<HttpRequest> requests = http->requests();
      REQUIRE(requests.size() == 1);
      REQUIRE(requests[0].url == "https://api.fish.audio/v1/tts");
      REQUIRE(test::json_field(requests[0].body, "text") == "(happy) Hallo Chat");
      REQUIRE(test::json_field(requests[0].body, "reference_id") ==
              "933563129e564b19a115bedd57b7406a");

      bool has_auth = false;
      for (const auto &header : requests[0].headers) {
         if (header == "Authorization: Bearer secret") {
            has_auth = true;
         }
      }
      REQUIRE(has_auth);
   }

   SECTION("server errors are retried") {
      FishAudioEngine engine("key", settings, http);
      http->push(503, "");
      http->push(200, "ok");
      AudioBuffer audio = engine.synthesize("Hallo", "fish-sarah", SynthesisOptions());
      REQUIRE(audio.size() == 2);
      REQUIRE(http->requests().size() == 2);
   }

   SECTION("client errors are not retried") {
      FishAudioEngine engine("key", settings, http);
      http->push(401, "unauthorized");
      REQUIRE_THROWS_AS(engine.synthesize("Hallo", "fish-sarah", SynthesisOptions()), TtsError);
      REQUIRE(http->requests().size() == 1);
   }

   SECTION("timeouts exhaust the retries") {
      settings.mode = PerformanceMode::FAST;
      FishAudioEngine engine("key", settings, http);
      http->push_timeout();
      http->push_timeout();
      try {
         engine.synthesize("Hallo", "fish-sarah", SynthesisOptions());
         FAIL("timeout not reported");
      } catch (const TtsError &e) {
         REQUIRE(e.status() == HERALD_ERR_TIMEOUT);
      }
      REQUIRE(http->requests().size() == 2);
   }
}

TEST_CASE("tiktok adapter", "[unit]") {
   SECTION("text split on word boundaries") {
      REQUIRE(TikTokEngine::split_text("kurz", 300) == std::vector<std::string>{ "kurz" });
      REQUIRE(TikTokEngine::split_text("aaa bbb ccc", 7) ==
              std::vector<std::string>{ "aaa bbb", "ccc" });
      REQUIRE(TikTokEngine::split_text("abcdefghij", 4) ==
              std::vector<std::string>{ "abcd", "efgh", "ij" });
   }

   SECTION("audio is decoded from the JSON envelope") {
      auto http = std::make_shared<FakeHttpClient>();
      http->push(200, "{\"status_code\":0,\"data\":{\"v_str\":\"SUQz\"}}");
      TikTokEngine engine("session", EngineSettings(), http);

      AudioBuffer audio = engine.synthesize("Hallo", "de_002", SynthesisOptions());
      REQUIRE(std::string(audio.begin(), audio.end()) == "ID3");
      REQUIRE(engine.get_default_voice_for_language("de") == "de_002");
   }
}

TEST_CASE("engine registry", "[unit]") {
   SECTION("credential resolution walks candidate keys") {
      std::map<std::string, std::string> store = { { "a", "   " },
                                                   { "b", "null" },
                                                   { "c", "  token  " } };
      auto lookup = [&store](const std::string &key) {
         auto it = store.find(key);
         return it != store.end() ? it->second : std::string();
      };
      REQUIRE(resolve_credential({ "a", "b", "c" }, lookup) == "token");
      REQUIRE(resolve_credential({ "a", "b" }, lookup).empty());
      REQUIRE(credential_keys_for("fishaudio").front() == "tts_fishaudio_api_key");
      REQUIRE(credential_keys_for("openai").front() == "tts_openai_api_key");
   }

   SECTION("fallback chains never include the failing engine") {
      for (const auto &id : engine_ids()) {
         const std::vector<std::string> &chain = fallback_chain(id);
         REQUIRE_FALSE(chain.empty());
         REQUIRE(std::find(chain.begin(), chain.end(), id) == chain.end());
      }
      REQUIRE(fallback_chain("tiktok").front() == "google");
      REQUIRE(fallback_chain("unknown").empty());
   }

   SECTION("load skips engines without a usable credential") {
      secrets_config_t secrets;
      config_set_secrets_defaults(&secrets);
      secrets_set(&secrets, "tts_fishaudio_api_key", "  fish-key ");
      secrets_set(&secrets, "tiktok_session_id", "   ");

      EngineRegistry registry;
      size_t loaded = registry.load(PipelineConfig(), secrets, std::make_shared<FakeHttpClient>());
      REQUIRE(loaded == 1);
      REQUIRE(registry.has("fishaudio"));
      REQUIRE_FALSE(registry.has("tiktok"));
      REQUIRE(registry.get("fishaudio")->api_key() == "fish-key");
   }

   SECTION("put replaces by id") {
      EngineRegistry registry;
      registry.put(std::make_shared<test::FakeEngine>("openai"));
      registry.put(std::make_shared<test::FakeEngine>("openai"));
      REQUIRE(registry.available() == std::vector<std::string>{ "openai" });
   }
}

}  // namespace herald
