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
 * OpenAI, ElevenLabs, Google Cloud and Speechify adapters. All four are a
 * single JSON POST; OpenAI and ElevenLabs answer with raw audio, Google and
 * Speechify with base64 inside a JSON envelope.
 */

#include <json-c/json.h>

#include "core/encoding.h"
#include "tts/tts_engines.h"

extern "C" {
#include "logging.h"
}

namespace herald {

namespace {

#define OPENAI_TTS_URL "https://api.openai.com/v1/audio/speech"
#define OPENAI_TTS_MODEL "tts-1"
#define ELEVENLABS_TTS_URL "https://api.elevenlabs.io/v1/text-to-speech/"
#define ELEVENLABS_MODEL "eleven_multilingual_v2"
#define GOOGLE_TTS_URL "https://texttospeech.googleapis.com/v1/text:synthesize?key="
#define SPEECHIFY_TTS_URL "https://api.sws.speechify.com/v1/audio/speech"

const std::string k_openai_id = OpenAiEngine::kId;
const std::string k_elevenlabs_id = ElevenLabsEngine::kId;
const std::string k_google_id = GoogleEngine::kId;
const std::string k_speechify_id = SpeechifyEngine::kId;

std::string to_json(json_object *obj) {
   std::string out = json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN);
   json_object_put(obj);
   return out;
}

AudioBuffer raw_audio(const HttpResponse &response, const char *provider) {
   if (response.body.empty()) {
      throw TtsError(HERALD_ERR_SYNTHESIS, std::string(provider) + " returned an empty audio body");
   }
   return AudioBuffer(response.body.begin(), response.body.end());
}

/**
 * Decode a base64 audio field from a JSON response body.
 */
AudioBuffer json_audio(const HttpResponse &response, const char *field, const char *provider) {
   json_object *root = json_tokener_parse(response.body.c_str());
   if (!root) {
      throw TtsError(HERALD_ERR_SYNTHESIS, std::string(provider) + " returned invalid JSON");
   }
   json_object *value = nullptr;
   AudioBuffer audio;
   bool ok = json_object_object_get_ex(root, field, &value) && value &&
             base64_decode(json_object_get_string(value), &audio) && !audio.empty();
   json_object_put(root);
   if (!ok) {
      throw TtsError(HERALD_ERR_SYNTHESIS,
                     std::string(provider) + " response has no " + field + " payload");
   }
   return audio;
}

std::string voice_or_default(const TtsEngine &engine,
                             const std::string &voice_id,
                             const std::string &fallback) {
   if (engine.get_voices().count(voice_id)) {
      return voice_id;
   }
   LOG_WARNING("%s: unknown voice '%s', using %s", engine.id().c_str(), voice_id.c_str(),
               fallback.c_str());
   return fallback;
}

}  // namespace

/* =============================================================================
 * OpenAI
 * ============================================================================= */

OpenAiEngine::OpenAiEngine(const std::string &api_key,
                           EngineSettings settings,
                           std::shared_ptr<HttpClient> http)
    : TtsEngine("OpenAI", api_key, std::move(settings), std::move(http)) {}

const std::string &OpenAiEngine::id() const {
   return k_openai_id;
}

const VoiceMap &OpenAiEngine::get_voices() const {
   static const VoiceMap voices = {
      { "alloy", { "Alloy", "multi", "neutral", "Balanced, versatile", "" } },
      { "echo", { "Echo", "multi", "male", "Warm, clear", "" } },
      { "fable", { "Fable", "multi", "male", "Expressive, British", "" } },
      { "onyx", { "Onyx", "multi", "male", "Deep, authoritative", "" } },
      { "nova", { "Nova", "multi", "female", "Friendly, energetic", "" } },
      { "shimmer", { "Shimmer", "multi", "female", "Soft, gentle", "" } },
   };
   return voices;
}

std::string OpenAiEngine::get_default_voice_for_language(const std::string &) const {
   return "nova";
}

AudioBuffer OpenAiEngine::synthesize(const std::string &text,
                                     const std::string &voice_id,
                                     const SynthesisOptions &options) {
   json_object *body = json_object_new_object();
   json_object_object_add(body, "model", json_object_new_string(OPENAI_TTS_MODEL));
   json_object_object_add(body, "input", json_object_new_string(text.c_str()));
   json_object_object_add(body, "voice",
                          json_object_new_string(voice_or_default(*this, voice_id, "nova").c_str()));
   json_object_object_add(body, "response_format",
                          json_object_new_string(options.format.empty() ? "mp3"
                                                                        : options.format.c_str()));
   json_object_object_add(body, "speed", json_object_new_double(options.speed));

   HttpRequest request;
   request.url = OPENAI_TTS_URL;
   request.headers = { "Authorization: Bearer " + api_key_, "Content-Type: application/json" };
   request.body = to_json(body);
   return raw_audio(perform_with_retry(std::move(request), "synthesis"), "OpenAI");
}

/* =============================================================================
 * ElevenLabs
 * ============================================================================= */

ElevenLabsEngine::ElevenLabsEngine(const std::string &api_key,
                                   EngineSettings settings,
                                   std::shared_ptr<HttpClient> http)
    : TtsEngine("ElevenLabs", api_key, std::move(settings), std::move(http)) {}

const std::string &ElevenLabsEngine::id() const {
   return k_elevenlabs_id;
}

const VoiceMap &ElevenLabsEngine::get_voices() const {
   static const VoiceMap voices = {
      { "21m00Tcm4TlvDq8ikWAM", { "Rachel", "multi", "female", "Calm, young", "" } },
      { "EXAVITQu4vr4xnSDxMaL", { "Bella", "multi", "female", "Soft", "" } },
      { "ErXwobaYiN019PkySvjV", { "Antoni", "multi", "male", "Well-rounded", "" } },
      { "pNInz6obpgDQGcFmaJgB", { "Adam", "multi", "male", "Deep", "" } },
      { "TxGEqnHWrfWFTfGW9XjX", { "Josh", "multi", "male", "Young, deep", "" } },
   };
   return voices;
}

std::string ElevenLabsEngine::get_default_voice_for_language(const std::string &) const {
   return "21m00Tcm4TlvDq8ikWAM";
}

bool ElevenLabsEngine::accepts_voice(const std::string &voice_id) const {
   return !trim_copy(voice_id).empty();
}

AudioBuffer ElevenLabsEngine::synthesize(const std::string &text,
                                         const std::string &voice_id,
                                         const SynthesisOptions &) {
   // Cloned voices are not in the catalog; any id is passed through
   std::string voice = voice_id.empty() ? get_default_voice_for_language("") : voice_id;

   json_object *settings = json_object_new_object();
   json_object_object_add(settings, "stability", json_object_new_double(0.5));
   json_object_object_add(settings, "similarity_boost", json_object_new_double(0.75));

   json_object *body = json_object_new_object();
   json_object_object_add(body, "text", json_object_new_string(text.c_str()));
   json_object_object_add(body, "model_id", json_object_new_string(ELEVENLABS_MODEL));
   json_object_object_add(body, "voice_settings", settings);

   HttpRequest request;
   request.url = ELEVENLABS_TTS_URL + url_encode(voice);
   request.headers = { "xi-api-key: " + api_key_, "Content-Type: application/json",
                       "Accept: audio/mpeg" };
   request.body = to_json(body);
   return raw_audio(perform_with_retry(std::move(request), "synthesis"), "ElevenLabs");
}

/* =============================================================================
 * Google Cloud Text-to-Speech
 * ============================================================================= */

GoogleEngine::GoogleEngine(const std::string &api_key,
                           EngineSettings settings,
                           std::shared_ptr<HttpClient> http)
    : TtsEngine("Google", api_key, std::move(settings), std::move(http)) {}

const std::string &GoogleEngine::id() const {
   return k_google_id;
}

const VoiceMap &GoogleEngine::get_voices() const {
   static const VoiceMap voices = {
      { "de-DE-Wavenet-A", { "German Female A", "de", "female", "WaveNet", "" } },
      { "de-DE-Wavenet-B", { "German Male B", "de", "male", "WaveNet", "" } },
      { "en-US-Wavenet-C", { "US Female C", "en", "female", "WaveNet", "" } },
      { "en-US-Wavenet-D", { "US Male D", "en", "male", "WaveNet", "" } },
      { "en-GB-Wavenet-A", { "UK Female A", "en", "female", "WaveNet", "" } },
      { "es-ES-Wavenet-B", { "Spanish Male B", "es", "male", "WaveNet", "" } },
      { "fr-FR-Wavenet-A", { "French Female A", "fr", "female", "WaveNet", "" } },
      { "it-IT-Wavenet-A", { "Italian Female A", "it", "female", "WaveNet", "" } },
      { "ja-JP-Wavenet-A", { "Japanese Female A", "ja", "female", "WaveNet", "" } },
   };
   return voices;
}

std::string GoogleEngine::get_default_voice_for_language(const std::string &lang) const {
   static const std::map<std::string, std::string> defaults = {
      { "de", "de-DE-Wavenet-A" }, { "en", "en-US-Wavenet-C" }, { "es", "es-ES-Wavenet-B" },
      { "fr", "fr-FR-Wavenet-A" }, { "it", "it-IT-Wavenet-A" }, { "ja", "ja-JP-Wavenet-A" },
   };
   auto it = defaults.find(lang);
   return it != defaults.end() ? it->second : "en-US-Wavenet-C";
}

AudioBuffer GoogleEngine::synthesize(const std::string &text,
                                     const std::string &voice_id,
                                     const SynthesisOptions &options) {
   std::string voice = voice_or_default(*this, voice_id, get_default_voice_for_language("en"));
   std::string language_code = voice.substr(0, 5);  // "de-DE-Wavenet-A" -> "de-DE"

   json_object *input = json_object_new_object();
   json_object_object_add(input, "text", json_object_new_string(text.c_str()));

   json_object *voice_obj = json_object_new_object();
   json_object_object_add(voice_obj, "languageCode", json_object_new_string(language_code.c_str()));
   json_object_object_add(voice_obj, "name", json_object_new_string(voice.c_str()));

   json_object *audio_config = json_object_new_object();
   json_object_object_add(audio_config, "audioEncoding", json_object_new_string("MP3"));
   json_object_object_add(audio_config, "speakingRate", json_object_new_double(options.speed));

   json_object *body = json_object_new_object();
   json_object_object_add(body, "input", input);
   json_object_object_add(body, "voice", voice_obj);
   json_object_object_add(body, "audioConfig", audio_config);

   HttpRequest request;
   request.url = GOOGLE_TTS_URL + url_encode(api_key_);
   request.headers = { "Content-Type: application/json" };
   request.body = to_json(body);
   return json_audio(perform_with_retry(std::move(request), "synthesis"), "audioContent", "Google");
}

/* =============================================================================
 * Speechify
 * ============================================================================= */

SpeechifyEngine::SpeechifyEngine(const std::string &api_key,
                                 EngineSettings settings,
                                 std::shared_ptr<HttpClient> http)
    : TtsEngine("Speechify", api_key, std::move(settings), std::move(http)) {}

const std::string &SpeechifyEngine::id() const {
   return k_speechify_id;
}

const VoiceMap &SpeechifyEngine::get_voices() const {
   static const VoiceMap voices = {
      { "george", { "George", "en", "male", "", "" } },
      { "henry", { "Henry", "en", "male", "", "" } },
      { "mrbeast", { "MrBeast", "en", "male", "", "" } },
      { "snoop", { "Snoop", "en", "male", "", "" } },
      { "kristy", { "Kristy", "en", "female", "", "" } },
      { "stefanie", { "Stefanie", "de", "female", "", "" } },
   };
   return voices;
}

std::string SpeechifyEngine::get_default_voice_for_language(const std::string &lang) const {
   return lang == "de" ? "stefanie" : "george";
}

AudioBuffer SpeechifyEngine::synthesize(const std::string &text,
                                        const std::string &voice_id,
                                        const SynthesisOptions &) {
   // Cloned voice ids are account specific and pass through unchecked
   std::string voice = voice_id.empty() ? get_default_voice_for_language("en") : voice_id;

   json_object *body = json_object_new_object();
   json_object_object_add(body, "input", json_object_new_string(text.c_str()));
   json_object_object_add(body, "voice_id", json_object_new_string(voice.c_str()));
   json_object_object_add(body, "audio_format", json_object_new_string("mp3"));

   HttpRequest request;
   request.url = SPEECHIFY_TTS_URL;
   request.headers = { "Authorization: Bearer " + api_key_, "Content-Type: application/json" };
   request.body = to_json(body);
   return json_audio(perform_with_retry(std::move(request), "synthesis"), "audio_data",
                     "Speechify");
}

}  // namespace herald
