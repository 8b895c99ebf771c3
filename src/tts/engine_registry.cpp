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
 * Engine registry.
 */

#include "tts/engine_registry.h"

#include "tts/tts_engines.h"

extern "C" {
#include "logging.h"
}

namespace herald {

namespace {

const std::vector<std::string> k_no_chain;

}  // namespace

const std::vector<std::string> &engine_ids() {
   static const std::vector<std::string> ids = { "tiktok", "google", "speechify", "elevenlabs",
                                                 "openai", "fishaudio", "siliconflow" };
   return ids;
}

bool is_known_engine(const std::string &engine_id) {
   for (const auto &id : engine_ids()) {
      if (id == engine_id) {
         return true;
      }
   }
   return false;
}

const std::vector<std::string> &fallback_chain(const std::string &engine_id) {
   static const std::map<std::string, std::vector<std::string>> chains = {
      { "tiktok", { "google", "openai", "fishaudio", "siliconflow", "elevenlabs", "speechify" } },
      { "google", { "tiktok", "openai", "fishaudio", "siliconflow", "elevenlabs", "speechify" } },
      { "elevenlabs",
        { "openai", "fishaudio", "siliconflow", "tiktok", "google", "speechify" } },
      { "speechify",
        { "openai", "fishaudio", "siliconflow", "tiktok", "google", "elevenlabs" } },
      { "openai", { "fishaudio", "siliconflow", "tiktok", "google", "elevenlabs", "speechify" } },
      { "fishaudio",
        { "siliconflow", "openai", "tiktok", "google", "elevenlabs", "speechify" } },
      { "siliconflow",
        { "fishaudio", "openai", "tiktok", "google", "elevenlabs", "speechify" } },
   };
   auto it = chains.find(engine_id);
   return it != chains.end() ? it->second : k_no_chain;
}

std::vector<std::string> credential_keys_for(const std::string &engine_id) {
   if (engine_id == "fishaudio") {
      return { "tts_fishaudio_api_key", "fishaudio_api_key" };
   }
   if (engine_id == "siliconflow") {
      return { "siliconflow_api_key", "tts_fishspeech_api_key",
               "streamalchemy_siliconflow_api_key" };
   }
   if (engine_id == "tiktok") {
      return { "tiktok_session_id" };
   }
   return { "tts_" + engine_id + "_api_key" };
}

std::string resolve_credential(const std::vector<std::string> &keys,
                               const std::function<std::string(const std::string &)> &lookup) {
   for (const auto &key : keys) {
      std::string value = trim_copy(lookup(key));
      if (!value.empty() && value != "null") {
         return value;
      }
   }
   return std::string();
}

std::shared_ptr<TtsEngine> create_engine(const std::string &engine_id,
                                         const std::string &credential,
                                         const EngineSettings &settings,
                                         std::shared_ptr<HttpClient> http) {
   if (engine_id == "fishaudio") {
      return std::make_shared<FishAudioEngine>(credential, settings, http);
   }
   if (engine_id == "siliconflow") {
      return std::make_shared<SiliconFlowEngine>(credential, settings, http);
   }
   if (engine_id == "tiktok") {
      return std::make_shared<TikTokEngine>(credential, settings, http);
   }
   if (engine_id == "openai") {
      return std::make_shared<OpenAiEngine>(credential, settings, http);
   }
   if (engine_id == "elevenlabs") {
      return std::make_shared<ElevenLabsEngine>(credential, settings, http);
   }
   if (engine_id == "google") {
      return std::make_shared<GoogleEngine>(credential, settings, http);
   }
   if (engine_id == "speechify") {
      return std::make_shared<SpeechifyEngine>(credential, settings, http);
   }
   throw TtsError(HERALD_ERR_NOT_FOUND, "unknown TTS engine: " + engine_id);
}

EngineSettings engine_settings_from(const PipelineConfig &config) {
   EngineSettings settings;
   settings.mode = config.mode;
   settings.timeout_override_ms = config.synthesis_timeout_ms;
   settings.default_emotion = config.fishaudio_emotion;
   settings.stream.url = config.stream_endpoint;
   settings.stream.model = config.stream_model;
   settings.stream.timeout_ms = config.stream_timeout_ms;
   return settings;
}

size_t EngineRegistry::load(const PipelineConfig &config,
                            const secrets_config_t &secrets,
                            std::shared_ptr<HttpClient> http) {
   if (!http) {
      http = make_curl_http_client();
   }
   EngineSettings settings = engine_settings_from(config);
   auto lookup = [&secrets](const std::string &key) {
      const char *value = secrets_get(&secrets, key.c_str());
      return value ? std::string(value) : std::string();
   };

   std::shared_ptr<EngineMap> engines = std::make_shared<EngineMap>();
   for (const auto &id : engine_ids()) {
      std::string credential = resolve_credential(credential_keys_for(id), lookup);
      if (credential.empty()) {
         LOG_INFO("Engine '%s' has no credential, not loaded", id.c_str());
         continue;
      }
      try {
         (*engines)[id] = create_engine(id, credential, settings, http);
         LOG_INFO("Engine '%s' loaded (%s mode)", id.c_str(), performance_mode_name(settings.mode));
      } catch (const TtsError &e) {
         LOG_ERROR("Engine '%s' failed to initialize: %s", id.c_str(), e.what());
      }
   }

   size_t count = engines->size();
   {
      std::lock_guard<std::mutex> lock(mutex_);
      engines_ = engines;
   }
   if (!count) {
      LOG_WARNING("No TTS engine has a usable credential");
   }
   return count;
}

void EngineRegistry::put(std::shared_ptr<TtsEngine> engine) {
   if (!engine) {
      return;
   }
   std::lock_guard<std::mutex> lock(mutex_);
   std::shared_ptr<EngineMap> next = std::make_shared<EngineMap>(*engines_);
   (*next)[engine->id()] = std::move(engine);
   engines_ = next;
}

std::shared_ptr<TtsEngine> EngineRegistry::get(const std::string &engine_id) const {
   std::lock_guard<std::mutex> lock(mutex_);
   auto it = engines_->find(engine_id);
   return it != engines_->end() ? it->second : nullptr;
}

std::vector<std::string> EngineRegistry::available() const {
   std::shared_ptr<const EngineMap> engines;
   {
      std::lock_guard<std::mutex> lock(mutex_);
      engines = engines_;
   }
   std::vector<std::string> ids;
   for (const auto &kv : *engines) {
      ids.push_back(kv.first);
   }
   return ids;
}

}  // namespace herald
