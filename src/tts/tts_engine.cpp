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
 * TTS engine adapter base: credential validation and retrying HTTP.
 */

#include "tts/tts_engine.h"

#include <chrono>
#include <thread>

extern "C" {
#include "logging.h"
}

namespace herald {

const char *performance_mode_name(PerformanceMode mode) {
   switch (mode) {
      case PerformanceMode::FAST:
         return "fast";
      case PerformanceMode::QUALITY:
         return "quality";
      case PerformanceMode::BALANCED:
      default:
         return "balanced";
   }
}

PerformanceMode performance_mode_from_name(const std::string &name) {
   if (name == "fast") {
      return PerformanceMode::FAST;
   }
   if (name == "quality") {
      return PerformanceMode::QUALITY;
   }
   return PerformanceMode::BALANCED;
}

ModeTuning performance_mode_tuning(PerformanceMode mode) {
   switch (mode) {
      case PerformanceMode::FAST:
         return { 8000, 1 };
      case PerformanceMode::QUALITY:
         return { 30000, 3 };
      case PerformanceMode::BALANCED:
      default:
         return { 15000, 2 };
   }
}

std::string trim_copy(const std::string &value) {
   const char *ws = " \t\r\n\f\v";
   size_t first = value.find_first_not_of(ws);
   if (first == std::string::npos) {
      return std::string();
   }
   size_t last = value.find_last_not_of(ws);
   return value.substr(first, last - first + 1);
}

namespace {

std::string validated_key(const std::string &display_name, const std::string &api_key) {
   std::string trimmed = trim_copy(api_key);
   if (trimmed.empty()) {
      throw TtsError(HERALD_ERR_INVALID_CREDENTIAL,
                     display_name + " API key is required and must be a non-empty string");
   }
   return trimmed;
}

}  // namespace

TtsEngine::TtsEngine(const std::string &display_name,
                     const std::string &api_key,
                     EngineSettings settings,
                     std::shared_ptr<HttpClient> http)
    : display_name_(display_name),
      api_key_(validated_key(display_name, api_key)),
      settings_(std::move(settings)),
      http_(http ? std::move(http) : make_curl_http_client()) {}

bool TtsEngine::accepts_voice(const std::string &voice_id) const {
   return get_voices().count(voice_id) != 0;
}

std::unique_ptr<StreamSession> TtsEngine::open_stream(const std::string &,
                                                      const std::string &,
                                                      const SynthesisOptions &) {
   throw TtsError(HERALD_ERR_SYNTHESIS, display_name_ + " does not support streaming");
}

long TtsEngine::request_timeout_ms() const {
   if (settings_.timeout_override_ms > 0) {
      return settings_.timeout_override_ms;
   }
   return performance_mode_tuning(settings_.mode).timeout_ms;
}

HttpResponse TtsEngine::perform_with_retry(HttpRequest request, const char *what) {
   ModeTuning tuning = performance_mode_tuning(settings_.mode);
   request.timeout_ms = request_timeout_ms();

   int attempts = tuning.max_retries + 1;
   HttpResponse response;
   for (int attempt = 1; attempt <= attempts; attempt++) {
      response = http_->perform(request);

      if (!response.transport_error && !response.timed_out && response.status >= 200 &&
          response.status < 300) {
         return response;
      }

      bool retryable = response.timed_out || response.transport_error || response.status >= 500;
      if (!retryable) {
         LOG_WARNING("%s: %s failed with HTTP %ld", display_name_.c_str(), what, response.status);
         throw TtsError(HERALD_ERR_SYNTHESIS, display_name_ + " " + what + " failed: HTTP " +
                                                  std::to_string(response.status));
      }

      if (attempt < attempts) {
         long delay = settings_.retry_base_delay_ms << (attempt - 1);
         LOG_WARNING("%s: %s attempt %d/%d failed (%s), retrying in %ld ms",
                     display_name_.c_str(), what, attempt, attempts,
                     response.timed_out ? "timeout"
                                        : (response.transport_error ? response.error.c_str()
                                                                    : "server error"),
                     delay);
         if (delay > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));
         }
      }
   }

   if (response.timed_out) {
      LOG_ERROR("%s: %s timed out after %d attempts", display_name_.c_str(), what, attempts);
      throw TtsError(HERALD_ERR_TIMEOUT, display_name_ + " " + what + " timed out");
   }
   LOG_ERROR("%s: %s failed after %d attempts", display_name_.c_str(), what, attempts);
   throw TtsError(HERALD_ERR_SYNTHESIS,
                  display_name_ + " " + what + " failed: " +
                      (response.transport_error ? response.error
                                                : "HTTP " + std::to_string(response.status)));
}

}  // namespace herald
