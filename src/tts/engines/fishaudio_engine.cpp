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
 * Fish.audio adapter (S1 model).
 *
 * REST:   POST https://api.fish.audio/v1/tts, raw audio in the response body
 * Stream: wss://api.fish.audio/v1/tts/live, see network/stream_client.h
 */

#include <json-c/json.h>

#include <cctype>
#include <cstring>

#include "tts/tts_engines.h"

extern "C" {
#include "logging.h"
}

namespace herald {

namespace {

#define FISHAUDIO_TTS_URL "https://api.fish.audio/v1/tts"
#define FISHAUDIO_MODEL "s1"
#define FISHAUDIO_OPUS_AUTO_BITRATE -1000

const char *const k_emotions[] = {
   /* basic */
   "neutral", "happy", "sad", "angry", "excited", "calm", "nervous", "confident", "surprised",
   "satisfied", "delighted", "scared", "worried", "upset", "frustrated", "depressed",
   "empathetic", "embarrassed", "disgusted", "moved", "proud", "relaxed", "grateful", "curious",
   "sarcastic",
   /* advanced */
   "disdainful", "unhappy", "anxious", "hysterical", "indifferent", "uncertain", "doubtful",
   "confused", "disappointed", "regretful", "guilty", "ashamed", "jealous", "envious", "hopeful",
   "optimistic", "pessimistic", "nostalgic", "lonely", "bored", "contemptuous", "sympathetic",
   "compassionate", "determined", "resigned",
};

const VoiceMap &catalog() {
   static const VoiceMap voices = {
      { "fish-egirl",
        { "E-girl (Energetic Female)", "en", "female", "Energetic young female voice",
          "8ef4a238714b45718ce04243307c57a7" } },
      { "fish-energetic-male",
        { "Energetic Male", "en", "male", "Energetic and dynamic male voice",
          "802e3bc2b27e49c2995d23ef70e6ac89" } },
      { "fish-sarah",
        { "Sarah (Warm Female)", "en", "female", "Warm and friendly female voice",
          "933563129e564b19a115bedd57b7406a" } },
      { "fish-adrian",
        { "Adrian (Professional Male)", "en", "male", "", "bf322df2096a46f18c579d0baa36f41d" } },
      { "fish-selene",
        { "Selene (Elegant Female)", "en", "female", "", "b347db033a6549378b48d00acb0d06cd" } },
      { "fish-ethan", { "Ethan (Calm Male)", "en", "male", "", "536d3a5e000945adb7038665781a4aca" } },
      { "fish-pupcid", { "PupCid", "de", "male", "", "2d4039641d67419fa132ca59fa2f61ad" } },
      { "fish-christa", { "Christa", "de", "female", "", "88b18e0d81474a0ca08e2ea6f9df5ff4" } },
      { "fish-stoisch", { "Stoisch", "de", "male", "", "dae27abda6be4299b86b300a8e3f326a" } },
      { "fish-christian", { "Christian", "de", "male", "", "36c6f4b9900241f294e71964a79d1fe2" } },
      { "fish-frau-tagesschau",
        { "Tagesschau Ansagerin", "de", "female", "", "285f00e53ff14eb1b111532fb39569d3" } },
      { "fish-documentary-de-male",
        { "Documentary DE Male", "de", "male", "", "50d4a16421c14e0081c5b4e05d76f234" } },
      { "fish-karo-female", { "Karo Female", "de", "female", "", "4133ab4e1c584423987f05b5502e7bba" } },
      { "fish-synchronstimme-1-frau",
        { "Synchronstimme 1 Frau", "de", "female", "", "6c0670e7ae4e41e3a3523c33e6e2650f" } },
   };
   return voices;
}

const std::string k_id = FishAudioEngine::kId;

}  // namespace

FishAudioEngine::FishAudioEngine(const std::string &api_key,
                                 EngineSettings settings,
                                 std::shared_ptr<HttpClient> http)
    : TtsEngine("Fish.audio", api_key, std::move(settings), std::move(http)) {
   ModeTuning tuning = performance_mode_tuning(settings_.mode);
   LOG_INFO("Fish.audio: performance mode '%s' (timeout %ld ms, %d retries)",
            performance_mode_name(settings_.mode), tuning.timeout_ms, tuning.max_retries);
}

const std::string &FishAudioEngine::id() const {
   return k_id;
}

const VoiceMap &FishAudioEngine::get_voices() const {
   return catalog();
}

std::string FishAudioEngine::get_default_voice_for_language(const std::string &) const {
   // S1 is multilingual: one default for every language
   return kDefaultVoice;
}

bool FishAudioEngine::accepts_voice(const std::string &voice_id) const {
   return is_reference_id(voice_id) || get_voices().count(voice_id) != 0;
}

bool FishAudioEngine::supports_streaming() const {
   return settings_.mode != PerformanceMode::QUALITY;
}

bool FishAudioEngine::is_reference_id(const std::string &value) {
   if (value.size() != 32) {
      return false;
   }
   for (char c : value) {
      if (!isxdigit((unsigned char)c)) {
         return false;
      }
   }
   return true;
}

bool FishAudioEngine::is_valid_emotion(const std::string &emotion) {
   for (const char *e : k_emotions) {
      if (emotion == e) {
         return true;
      }
   }
   return false;
}

std::string FishAudioEngine::apply_emotion(const std::string &text, const std::string &emotion) {
   if (emotion.empty() || !is_valid_emotion(emotion)) {
      return text;
   }
   std::string trimmed = trim_copy(text);
   if (!trimmed.empty() && trimmed[0] == '(') {
      return text;
   }
   return "(" + emotion + ") " + text;
}

std::string FishAudioEngine::resolve_reference_id(const std::string &voice_id) const {
   auto it = catalog().find(voice_id);
   if (it != catalog().end()) {
      return it->second.reference_id;
   }
   if (is_reference_id(voice_id)) {
      return voice_id;
   }
   LOG_WARNING("Fish.audio: unknown voice '%s', using default", voice_id.c_str());
   return kDefaultReferenceId;
}

AudioBuffer FishAudioEngine::synthesize(const std::string &text,
                                        const std::string &voice_id,
                                        const SynthesisOptions &options) {
   std::string reference_id = resolve_reference_id(voice_id);
   std::string emotion = options.emotion.empty() ? settings_.default_emotion : options.emotion;
   std::string spoken = apply_emotion(text, emotion);
   std::string format = options.format.empty() ? "mp3" : options.format;

   json_object *body = json_object_new_object();
   json_object_object_add(body, "text", json_object_new_string(spoken.c_str()));
   json_object_object_add(body, "reference_id", json_object_new_string(reference_id.c_str()));
   json_object_object_add(body, "format", json_object_new_string(format.c_str()));
   json_object_object_add(body, "mp3_bitrate", json_object_new_int(128));
   json_object_object_add(body, "normalize", json_object_new_boolean(1));
   json_object_object_add(body, "latency", json_object_new_string("normal"));
   json_object_object_add(body, "chunk_length", json_object_new_int(200));
   if (format == "opus") {
      json_object_object_add(body, "opus_bitrate", json_object_new_int(FISHAUDIO_OPUS_AUTO_BITRATE));
   }

   HttpRequest request;
   request.url = FISHAUDIO_TTS_URL;
   request.headers = { "Authorization: Bearer " + api_key_, "Content-Type: application/json",
                       "model: " FISHAUDIO_MODEL };
   request.body = json_object_to_json_string_ext(body, JSON_C_TO_STRING_PLAIN);
   json_object_put(body);

   LOG_INFO("Fish.audio: synthesizing %zu chars with voice=%s format=%s", text.size(),
            voice_id.c_str(), format.c_str());

   HttpResponse response = perform_with_retry(std::move(request), "synthesis");
   if (response.body.empty()) {
      throw TtsError(HERALD_ERR_SYNTHESIS, "Fish.audio returned an empty audio body");
   }
   return AudioBuffer(response.body.begin(), response.body.end());
}

std::unique_ptr<StreamSession> FishAudioEngine::open_stream(const std::string &text,
                                                            const std::string &voice_id,
                                                            const SynthesisOptions &options) {
   if (!supports_streaming()) {
      return TtsEngine::open_stream(text, voice_id, options);
   }

   StreamConfig config = settings_.stream;
   config.api_key = api_key_;
   if (config.model.empty()) {
      config.model = FISHAUDIO_MODEL;
   }

   std::unique_ptr<StreamTransport> transport = settings_.transport_factory
                                                    ? settings_.transport_factory()
                                                    : make_lws_transport();

   StreamParams params;
   params.reference_id = resolve_reference_id(voice_id);
   params.format = options.format.empty() ? "mp3" : options.format;
   params.latency = settings_.mode == PerformanceMode::FAST ? "balanced" : "normal";

   std::string emotion = options.emotion.empty() ? settings_.default_emotion : options.emotion;

   std::unique_ptr<StreamSession> session =
       std::make_unique<StreamSession>(std::move(transport), config);
   session->prepare(params, apply_emotion(text, emotion));
   return session;
}

}  // namespace herald
