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
 * Concrete TTS provider adapters.
 */

#ifndef HERALD_TTS_ENGINES_H
#define HERALD_TTS_ENGINES_H

#include <string>
#include <vector>

#include "tts/tts_engine.h"

namespace herald {

/* =============================================================================
 * Fish.audio (REST + live WebSocket streaming)
 * ============================================================================= */

class FishAudioEngine : public TtsEngine {
 public:
   static constexpr const char *kId = "fishaudio";
   static constexpr const char *kDefaultVoice = "fish-sarah";
   static constexpr const char *kDefaultReferenceId = "933563129e564b19a115bedd57b7406a";

   FishAudioEngine(const std::string &api_key,
                   EngineSettings settings = EngineSettings(),
                   std::shared_ptr<HttpClient> http = nullptr);

   const std::string &id() const override;
   AudioBuffer synthesize(const std::string &text,
                          const std::string &voice_id,
                          const SynthesisOptions &options) override;
   const VoiceMap &get_voices() const override;
   std::string get_default_voice_for_language(const std::string &lang) const override;
   bool accepts_voice(const std::string &voice_id) const override;

   /**
    * Streaming is used unless the adapter runs in quality mode.
    */
   bool supports_streaming() const override;
   std::unique_ptr<StreamSession> open_stream(const std::string &text,
                                              const std::string &voice_id,
                                              const SynthesisOptions &options) override;

   /**
    * Catalog voice -> reference_id; a raw 32-hex id passes through;
    * anything else falls back to the default reference.
    */
   std::string resolve_reference_id(const std::string &voice_id) const;

   /**
    * Prefix "(emotion) " unless the text already starts with '(' or the
    * emotion is unknown.
    */
   static std::string apply_emotion(const std::string &text, const std::string &emotion);
   static bool is_valid_emotion(const std::string &emotion);
   static bool is_reference_id(const std::string &value);
};

/* =============================================================================
 * SiliconFlow (hosted fish-speech, single multilingual voice)
 * ============================================================================= */

class SiliconFlowEngine : public TtsEngine {
 public:
   static constexpr const char *kId = "siliconflow";
   static constexpr const char *kDefaultVoice = "siliconflow-default";

   SiliconFlowEngine(const std::string &api_key,
                     EngineSettings settings = EngineSettings(),
                     std::shared_ptr<HttpClient> http = nullptr);

   const std::string &id() const override;
   AudioBuffer synthesize(const std::string &text,
                          const std::string &voice_id,
                          const SynthesisOptions &options) override;
   const VoiceMap &get_voices() const override;
   std::string get_default_voice_for_language(const std::string &lang) const override;

   static float clamp_speed(float speed);
};

/* =============================================================================
 * TikTok (session-cookie API, regional endpoints)
 * ============================================================================= */

class TikTokEngine : public TtsEngine {
 public:
   static constexpr const char *kId = "tiktok";
   static constexpr size_t kMaxChunkChars = 300;

   TikTokEngine(const std::string &session_id,
                EngineSettings settings = EngineSettings(),
                std::shared_ptr<HttpClient> http = nullptr);

   const std::string &id() const override;
   AudioBuffer synthesize(const std::string &text,
                          const std::string &voice_id,
                          const SynthesisOptions &options) override;
   const VoiceMap &get_voices() const override;
   std::string get_default_voice_for_language(const std::string &lang) const override;

   /**
    * Split on word boundaries into chunks of at most max_chars bytes.
    * Words longer than max_chars are hard-split.
    */
   static std::vector<std::string> split_text(const std::string &text, size_t max_chars);

 private:
   AudioBuffer synthesize_chunk(const std::string &chunk, const std::string &voice_id);
};

/* =============================================================================
 * Plain REST providers
 * ============================================================================= */

class OpenAiEngine : public TtsEngine {
 public:
   static constexpr const char *kId = "openai";

   OpenAiEngine(const std::string &api_key,
                EngineSettings settings = EngineSettings(),
                std::shared_ptr<HttpClient> http = nullptr);

   const std::string &id() const override;
   AudioBuffer synthesize(const std::string &text,
                          const std::string &voice_id,
                          const SynthesisOptions &options) override;
   const VoiceMap &get_voices() const override;
   std::string get_default_voice_for_language(const std::string &lang) const override;
};

class ElevenLabsEngine : public TtsEngine {
 public:
   static constexpr const char *kId = "elevenlabs";

   ElevenLabsEngine(const std::string &api_key,
                    EngineSettings settings = EngineSettings(),
                    std::shared_ptr<HttpClient> http = nullptr);

   const std::string &id() const override;
   AudioBuffer synthesize(const std::string &text,
                          const std::string &voice_id,
                          const SynthesisOptions &options) override;
   const VoiceMap &get_voices() const override;
   std::string get_default_voice_for_language(const std::string &lang) const override;

   /* Cloned and library voices are addressed by id, not by catalog */
   bool accepts_voice(const std::string &voice_id) const override;
};

class GoogleEngine : public TtsEngine {
 public:
   static constexpr const char *kId = "google";

   GoogleEngine(const std::string &api_key,
                EngineSettings settings = EngineSettings(),
                std::shared_ptr<HttpClient> http = nullptr);

   const std::string &id() const override;
   AudioBuffer synthesize(const std::string &text,
                          const std::string &voice_id,
                          const SynthesisOptions &options) override;
   const VoiceMap &get_voices() const override;
   std::string get_default_voice_for_language(const std::string &lang) const override;
};

class SpeechifyEngine : public TtsEngine {
 public:
   static constexpr const char *kId = "speechify";

   SpeechifyEngine(const std::string &api_key,
                   EngineSettings settings = EngineSettings(),
                   std::shared_ptr<HttpClient> http = nullptr);

   const std::string &id() const override;
   AudioBuffer synthesize(const std::string &text,
                          const std::string &voice_id,
                          const SynthesisOptions &options) override;
   const VoiceMap &get_voices() const override;
   std::string get_default_voice_for_language(const std::string &lang) const override;
};

}  // namespace herald

#endif  // HERALD_TTS_ENGINES_H
