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
 * TTS engine adapter interface.
 *
 * An adapter wraps one external synthesis provider. Adapters are built once
 * per configured provider and replaced wholesale when credentials rotate;
 * nothing in an adapter changes after construction, so synthesize() may be
 * called from several threads at once.
 */

#ifndef HERALD_TTS_ENGINE_H
#define HERALD_TTS_ENGINE_H

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "network/http_client.h"
#include "network/stream_client.h"
#include "tts/tts_error.h"

namespace herald {

using AudioBuffer = std::vector<uint8_t>;

/* =============================================================================
 * Performance Mode
 * ============================================================================= */

enum class PerformanceMode { FAST, BALANCED, QUALITY };

const char *performance_mode_name(PerformanceMode mode);

/**
 * Parse "fast" / "balanced" / "quality". Unknown names map to BALANCED.
 */
PerformanceMode performance_mode_from_name(const std::string &name);

struct ModeTuning {
   long timeout_ms;
   int max_retries;
};

/**
 * fast: 8 s / 1 retry, balanced: 15 s / 2 retries, quality: 30 s / 3 retries
 */
ModeTuning performance_mode_tuning(PerformanceMode mode);

/* =============================================================================
 * Voices and Options
 * ============================================================================= */

struct VoiceInfo {
   std::string name;
   std::string language;  // "de", "en", ... or "multi"
   std::string gender;
   std::string description;
   std::string reference_id;  // provider-side id when it differs from the key
};

using VoiceMap = std::map<std::string, VoiceInfo>;

struct SynthesisOptions {
   std::string emotion;  // Provider emotion marker; empty = none
   std::string format = "mp3";
   float speed = 1.0f;
};

/**
 * Construction settings shared by all adapters.
 */
struct EngineSettings {
   PerformanceMode mode = PerformanceMode::BALANCED;
   long retry_base_delay_ms = 1000;  // Doubled per attempt
   long timeout_override_ms = 0;     // 0 = use mode tuning
   std::string default_emotion;
   StreamConfig stream;              // api_key is filled by the adapter
   TransportFactory transport_factory;
};

/* =============================================================================
 * Adapter Interface
 * ============================================================================= */

class TtsEngine {
 public:
   virtual ~TtsEngine() = default;

   TtsEngine(const TtsEngine &) = delete;
   TtsEngine &operator=(const TtsEngine &) = delete;

   virtual const std::string &id() const = 0;

   /**
    * Synthesize text to encoded audio (mp3 unless options say otherwise).
    * @throws TtsError HERALD_ERR_SYNTHESIS or HERALD_ERR_TIMEOUT
    */
   virtual AudioBuffer synthesize(const std::string &text,
                                  const std::string &voice_id,
                                  const SynthesisOptions &options) = 0;

   virtual const VoiceMap &get_voices() const = 0;

   /**
    * Whether voice_id can be passed to synthesize(). Catalog membership
    * unless the provider takes free-form voice ids.
    */
   virtual bool accepts_voice(const std::string &voice_id) const;

   /**
    * Stable default voice for a language code ("de", "en", ...).
    */
   virtual std::string get_default_voice_for_language(const std::string &lang) const = 0;

   virtual bool supports_streaming() const { return false; }

   /**
    * Build a prepared, not yet started, streaming session for one
    * utterance. The caller runs StreamSession::start().
    * @throws TtsError if the engine cannot stream
    */
   virtual std::unique_ptr<StreamSession> open_stream(const std::string &text,
                                                      const std::string &voice_id,
                                                      const SynthesisOptions &options);

   PerformanceMode performance_mode() const { return settings_.mode; }
   const std::string &api_key() const { return api_key_; }

 protected:
   /**
    * Validates the credential: it must be non-empty after trimming.
    * @throws TtsError HERALD_ERR_INVALID_CREDENTIAL
    *         "<display_name> API key is required and must be a non-empty string"
    */
   TtsEngine(const std::string &display_name,
             const std::string &api_key,
             EngineSettings settings,
             std::shared_ptr<HttpClient> http);

   /**
    * Perform a request with the mode's timeout, retrying timeouts,
    * transport errors and 5xx with exponential backoff.
    *
    * @return The first 2xx response
    * @throws TtsError after the last attempt, or immediately on 4xx
    */
   HttpResponse perform_with_retry(HttpRequest request, const char *what);

   long request_timeout_ms() const;

   const std::string display_name_;
   const std::string api_key_;
   const EngineSettings settings_;
   std::shared_ptr<HttpClient> http_;
};

/**
 * Trim ASCII whitespace from both ends.
 */
std::string trim_copy(const std::string &value);

}  // namespace herald

#endif  // HERALD_TTS_ENGINE_H
