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
 * SiliconFlow adapter (hosted fish-speech-1.5, OpenAI-compatible endpoint).
 */

#include <json-c/json.h>

#include <algorithm>

#include "tts/tts_engines.h"

extern "C" {
#include "logging.h"
}

namespace herald {

namespace {

#define SILICONFLOW_TTS_URL "https://api.siliconflow.com/v1/audio/speech"
#define SILICONFLOW_MODEL "fishaudio/fish-speech-1.5"

/* The API only accepts "default" as the voice parameter */
#define SILICONFLOW_API_VOICE "default"

const std::string k_id = SiliconFlowEngine::kId;

}  // namespace

SiliconFlowEngine::SiliconFlowEngine(const std::string &api_key,
                                     EngineSettings settings,
                                     std::shared_ptr<HttpClient> http)
    : TtsEngine("SiliconFlow", api_key, std::move(settings), std::move(http)) {}

const std::string &SiliconFlowEngine::id() const {
   return k_id;
}

const VoiceMap &SiliconFlowEngine::get_voices() const {
   static const VoiceMap voices = {
      { kDefaultVoice,
        { "Default Voice", "multi", "neutral", "Default SiliconFlow Fish Speech voice",
          SILICONFLOW_API_VOICE } },
   };
   return voices;
}

std::string SiliconFlowEngine::get_default_voice_for_language(const std::string &) const {
   return kDefaultVoice;
}

float SiliconFlowEngine::clamp_speed(float speed) {
   return std::max(0.25f, std::min(4.0f, speed));
}

AudioBuffer SiliconFlowEngine::synthesize(const std::string &text,
                                          const std::string &voice_id,
                                          const SynthesisOptions &options) {
   if (get_voices().find(voice_id) == get_voices().end()) {
      LOG_WARNING("SiliconFlow: unknown voice '%s', using default", voice_id.c_str());
   }
   std::string format = options.format.empty() ? "mp3" : options.format;
   float speed = clamp_speed(options.speed);

   json_object *body = json_object_new_object();
   json_object_object_add(body, "model", json_object_new_string(SILICONFLOW_MODEL));
   json_object_object_add(body, "input", json_object_new_string(text.c_str()));
   json_object_object_add(body, "voice", json_object_new_string(SILICONFLOW_API_VOICE));
   json_object_object_add(body, "response_format", json_object_new_string(format.c_str()));
   json_object_object_add(body, "speed", json_object_new_double(speed));

   HttpRequest request;
   request.url = SILICONFLOW_TTS_URL;
   request.headers = { "Authorization: Bearer " + api_key_, "Content-Type: application/json" };
   request.body = json_object_to_json_string_ext(body, JSON_C_TO_STRING_PLAIN);
   json_object_put(body);

   HttpResponse response = perform_with_retry(std::move(request), "synthesis");
   if (response.body.empty()) {
      throw TtsError(HERALD_ERR_SYNTHESIS, "SiliconFlow returned an empty audio body");
   }
   return AudioBuffer(response.body.begin(), response.body.end());
}

}  // namespace herald
