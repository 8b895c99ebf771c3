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
 * TikTok adapter. The credential is the web session id cookie. Parameters
 * travel in the query string of an empty POST; the JSON response carries
 * base64 mp3 in data.v_str.
 */

#include <json-c/json.h>

#include <cctype>

#include "core/encoding.h"
#include "tts/tts_engines.h"

extern "C" {
#include "logging.h"
}

namespace herald {

namespace {

#define TIKTOK_TIMEOUT_MS 10000
#define TIKTOK_USER_AGENT                                                             \
   "com.zhiliaoapp.musically/2022600030 (Linux; U; Android 7.1.2; es_ES; SM-G988N; " \
   "Build/NRD90M;tt-ok/3.12.13.1)"

const char *const k_endpoints[] = {
   "https://api16-normal-v6.tiktokv.com/media/api/text/speech/invoke/",
   "https://api16-normal-c-useast1a.tiktokv.com/media/api/text/speech/invoke/",
   "https://api22-normal-c-alisg.tiktokv.com/media/api/text/speech/invoke/",
};

const std::string k_id = TikTokEngine::kId;

bool is_safe_voice_id(const std::string &voice_id) {
   if (voice_id.empty()) {
      return false;
   }
   for (char c : voice_id) {
      if (!isalnum((unsigned char)c) && c != '_' && c != '-') {
         return false;
      }
   }
   return true;
}

/* encodeURIComponent-style encoding with spaces as '+' */
std::string encode_text(const std::string &text) {
   std::string encoded = url_encode(text);
   std::string out;
   out.reserve(encoded.size());
   for (size_t i = 0; i < encoded.size(); i++) {
      if (encoded.compare(i, 3, "%20") == 0) {
         out += '+';
         i += 2;
      } else {
         out += encoded[i];
      }
   }
   return out;
}

}  // namespace

TikTokEngine::TikTokEngine(const std::string &session_id,
                           EngineSettings settings,
                           std::shared_ptr<HttpClient> http)
    : TtsEngine("TikTok", session_id, std::move(settings), std::move(http)) {
   LOG_INFO("TikTok: session id loaded (%zu chars)", api_key_.size());
}

const std::string &TikTokEngine::id() const {
   return k_id;
}

const VoiceMap &TikTokEngine::get_voices() const {
   static const VoiceMap voices = {
      { "en_us_ghostface", { "Ghostface (Scream)", "en", "male", "character", "" } },
      { "en_us_c3po", { "C3PO", "en", "male", "character", "" } },
      { "en_us_stitch", { "Stitch", "en", "male", "character", "" } },
      { "en_male_narration", { "Male Narrator", "en", "male", "narration", "" } },
      { "en_female_emotional", { "Female Emotional", "en", "female", "emotional", "" } },
      { "en_us_001", { "US Female 1", "en", "female", "standard", "" } },
      { "en_us_002", { "US Female 2", "en", "female", "standard", "" } },
      { "en_us_006", { "US Male 1", "en", "male", "standard", "" } },
      { "en_us_007", { "US Male 2", "en", "male", "standard", "" } },
      { "en_uk_001", { "UK Male 1", "en", "male", "british", "" } },
      { "en_au_001", { "Australian Female", "en", "female", "australian", "" } },
      { "de_001", { "Deutsch Maennlich", "de", "male", "standard", "" } },
      { "de_002", { "Deutsch Weiblich", "de", "female", "standard", "" } },
      { "es_002", { "Espanol Male", "es", "male", "standard", "" } },
      { "es_mx_002", { "Espanol MX Female", "es", "female", "mexican", "" } },
      { "fr_001", { "Francais Male", "fr", "male", "standard", "" } },
      { "fr_002", { "Francais Female", "fr", "female", "standard", "" } },
      { "br_003", { "Portugues BR Female", "pt", "female", "brazilian", "" } },
      { "br_004", { "Portugues BR Male", "pt", "male", "brazilian", "" } },
      { "it_male_m18", { "Italiano Male", "it", "male", "standard", "" } },
      { "jp_001", { "Japanese Female", "ja", "female", "standard", "" } },
      { "jp_003", { "Japanese Male", "ja", "male", "standard", "" } },
      { "kr_002", { "Korean Male", "ko", "male", "standard", "" } },
      { "kr_003", { "Korean Female", "ko", "female", "standard", "" } },
      { "id_001", { "Indonesian Female", "id", "female", "standard", "" } },
      { "nl_001", { "Nederlands Male", "nl", "male", "standard", "" } },
      { "pl_001", { "Polski Female", "pl", "female", "standard", "" } },
      { "ru_female", { "Russian Female", "ru", "female", "standard", "" } },
      { "tr_female", { "Turkish Female", "tr", "female", "standard", "" } },
      { "ar_male", { "Arabic Male", "ar", "male", "standard", "" } },
      { "zh_CN_female", { "Chinese Female", "zh", "female", "standard", "" } },
      { "zh_CN_male", { "Chinese Male", "zh", "male", "standard", "" } },
   };
   return voices;
}

std::string TikTokEngine::get_default_voice_for_language(const std::string &lang) const {
   static const std::map<std::string, std::string> defaults = {
      { "de", "de_002" },      { "en", "en_us_001" }, { "es", "es_002" },
      { "fr", "fr_002" },      { "pt", "br_003" },    { "it", "it_male_m18" },
      { "ja", "jp_001" },      { "ko", "kr_003" },    { "zh", "zh_CN_female" },
      { "ru", "ru_female" },   { "ar", "ar_male" },   { "tr", "tr_female" },
      { "nl", "nl_001" },      { "pl", "pl_001" },    { "id", "id_001" },
   };
   auto it = defaults.find(lang);
   return it != defaults.end() ? it->second : "en_us_001";
}

std::vector<std::string> TikTokEngine::split_text(const std::string &text, size_t max_chars) {
   std::vector<std::string> chunks;
   if (text.size() <= max_chars || max_chars == 0) {
      chunks.push_back(text);
      return chunks;
   }

   std::string current;
   size_t pos = 0;
   while (pos < text.size()) {
      size_t space = text.find(' ', pos);
      std::string word = text.substr(pos, space == std::string::npos ? std::string::npos
                                                                      : space - pos);
      pos = (space == std::string::npos) ? text.size() : space + 1;
      if (word.empty()) {
         continue;
      }

      size_t needed = current.empty() ? word.size() : current.size() + 1 + word.size();
      if (needed <= max_chars) {
         current = current.empty() ? word : current + " " + word;
         continue;
      }
      if (!current.empty()) {
         chunks.push_back(current);
         current.clear();
      }
      while (word.size() > max_chars) {
         size_t cut = max_chars;
         while (cut > 0 && ((unsigned char)word[cut] & 0xC0) == 0x80) {
            cut--;
         }
         if (cut == 0) {
            cut = max_chars;
         }
         chunks.push_back(word.substr(0, cut));
         word.erase(0, cut);
      }
      current = word;
   }
   if (!current.empty()) {
      chunks.push_back(current);
   }
   return chunks;
}

AudioBuffer TikTokEngine::synthesize_chunk(const std::string &chunk, const std::string &voice_id) {
   std::string last_error = "no endpoint tried";

   for (const char *endpoint : k_endpoints) {
      HttpRequest request;
      request.url = std::string(endpoint) + "?text_speaker=" + voice_id +
                    "&req_text=" + encode_text(chunk) + "&speaker_map_type=0&aid=1233";
      request.headers = { "User-Agent: " TIKTOK_USER_AGENT, "Cookie: sessionid=" + api_key_ };
      request.timeout_ms = TIKTOK_TIMEOUT_MS;

      HttpResponse response = http_->perform(request);
      if (response.transport_error || response.timed_out) {
         last_error = response.timed_out ? "timeout" : response.error;
         LOG_WARNING("TikTok: endpoint %s failed: %s", endpoint, last_error.c_str());
         continue;
      }
      if (response.status < 200 || response.status >= 300) {
         last_error = "HTTP " + std::to_string(response.status);
         if (response.status == 401 || response.status == 403) {
            LOG_WARNING("TikTok: session id may be invalid or expired (HTTP %ld)", response.status);
         } else {
            LOG_WARNING("TikTok: endpoint %s returned HTTP %ld", endpoint, response.status);
         }
         continue;
      }

      json_object *root = json_tokener_parse(response.body.c_str());
      if (!root) {
         last_error = "invalid JSON response";
         continue;
      }

      json_object *status_obj = nullptr;
      json_object *data = nullptr;
      json_object *v_str = nullptr;
      int status_code = json_object_object_get_ex(root, "status_code", &status_obj)
                            ? json_object_get_int(status_obj)
                            : -1;
      bool have_audio = json_object_object_get_ex(root, "data", &data) && data &&
                        json_object_object_get_ex(data, "v_str", &v_str) && v_str &&
                        json_object_get_string_len(v_str) > 0;

      if (status_code == 0 && have_audio) {
         AudioBuffer audio;
         bool ok = base64_decode(json_object_get_string(v_str), &audio);
         json_object_put(root);
         if (!ok || audio.empty()) {
            last_error = "undecodable audio payload";
            continue;
         }
         return audio;
      }

      if (status_code == 1) {
         last_error = "session id may be invalid or expired (status_code 1)";
      } else {
         json_object *msg = nullptr;
         last_error = "status_code " + std::to_string(status_code);
         if (json_object_object_get_ex(root, "status_msg", &msg) && msg) {
            last_error += ": ";
            last_error += json_object_get_string(msg);
         }
      }
      json_object_put(root);
      LOG_WARNING("TikTok: endpoint %s rejected request: %s", endpoint, last_error.c_str());
   }

   LOG_ERROR("TikTok: all endpoints failed. Last error: %s", last_error.c_str());
   throw TtsError(last_error == "timeout" ? HERALD_ERR_TIMEOUT : HERALD_ERR_SYNTHESIS,
                  "All TikTok TTS endpoints failed. Last error: " + last_error);
}

AudioBuffer TikTokEngine::synthesize(const std::string &text,
                                     const std::string &voice_id,
                                     const SynthesisOptions &) {
   if (!is_safe_voice_id(voice_id)) {
      throw TtsError(HERALD_ERR_INVALID_PARAM, "Invalid voice ID format: " + voice_id);
   }

   std::vector<std::string> chunks = split_text(text, kMaxChunkChars);
   if (chunks.size() > 1) {
      LOG_INFO("TikTok: text split into %zu chunks", chunks.size());
   }

   // mp3 frames concatenate at the byte level
   AudioBuffer combined;
   for (const auto &chunk : chunks) {
      AudioBuffer part = synthesize_chunk(chunk, voice_id);
      combined.insert(combined.end(), part.begin(), part.end());
   }
   return combined;
}

}  // namespace herald
