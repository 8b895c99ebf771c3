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
 * Speak pipeline implementation.
 */

#include "pipeline/speech_pipeline.h"

#include <vector>

#include "herald.h"
#include "tts/tts_engines.h"

extern "C" {
#include "core/string_utils.h"
#include "core/text_filter.h"
#include "logging.h"
#include "store/user_db.h"
}

namespace herald {

namespace {

#define ANNOUNCE_SUFFIX " sagt: "

/* Working buffer with room for the truncation ellipsis */
std::vector<char> make_buffer(const std::string &text) {
   std::vector<char> buf(text.size() + sizeof(TEXT_FILTER_ELLIPSIS) + 1, '\0');
   text.copy(buf.data(), text.size());
   return buf;
}

}  // namespace

SpeechPipeline::SpeechPipeline(PipelineConfigPtr config,
                               std::shared_ptr<EngineRegistry> engines,
                               std::shared_ptr<TtsQueue> queue,
                               std::shared_ptr<PermissionGate> gate,
                               std::shared_ptr<NotificationSink> sink)
    : config_(std::move(config)),
      engines_(std::move(engines)),
      queue_(std::move(queue)),
      gate_(std::move(gate)),
      sink_(std::move(sink)) {
   if (!sink_) {
      sink_ = std::make_shared<NullSink>();
   }
}

PipelineConfigPtr SpeechPipeline::config() const {
   std::lock_guard<std::mutex> lock(mutex_);
   return config_;
}

void SpeechPipeline::set_config(PipelineConfigPtr config) {
   if (!config) {
      return;
   }
   {
      std::lock_guard<std::mutex> lock(mutex_);
      config_ = config;
   }
   gate_->set_config(config);
   queue_->set_config(config);
   LOG_INFO("Pipeline: configuration replaced");
}

herald_status_t SpeechPipeline::prepare_text(const PipelineConfig &config,
                                             const SpeakRequest &request,
                                             std::string &text) const {
   std::vector<char> buf = make_buffer(text);

   int matches = text_filter_profanity(buf.data(), config.profanity);
   if (matches > 0 && config.profanity == PROFANITY_STRICT) {
      LOG_WARNING("Pipeline: message from %s dropped by profanity filter (%d matches)",
                  request.username.c_str(), matches);
      return HERALD_ERR_FILTERED;
   }

   if (config.strip_emojis) {
      str_strip_emoji(buf.data());
   }

   str_trim(buf.data());
   if (str_is_blank(buf.data())) {
      return HERALD_ERR_EMPTY_TEXT;
   }

   if (text_filter_truncate(buf.data(), buf.size(), config.max_text_length)) {
      LOG_WARNING("Pipeline: text from %s truncated to %zu characters", request.username.c_str(),
                  config.max_text_length);
   }
   text = buf.data();

   if (config.announce_username && request.source == HERALD_SOURCE_CHAT &&
       !request.username.empty()) {
      std::vector<char> announced = make_buffer(request.username + ANNOUNCE_SUFFIX + text);
      text_filter_truncate(announced.data(), announced.size(), config.max_text_length);
      text = announced.data();
   }
   return HERALD_OK;
}

SpeakResult SpeechPipeline::speak(const SpeakRequest &request) {
   SpeakResult result;
   PipelineConfigPtr config = this->config();

   // Global switch comes before anything else, previews included
   if (!config->tts_enabled) {
      LOG_INFO("Pipeline: TTS disabled, blocked request from %s", request.source.c_str());
      result.status = HERALD_ERR_DISABLED;
      return result;
   }

   if (request.source == HERALD_SOURCE_CHAT && !config->prefix_filters.empty()) {
      std::vector<const char *> prefixes;
      for (const auto &prefix : config->prefix_filters) {
         prefixes.push_back(prefix.c_str());
      }
      if (text_filter_matches_prefix(request.text.c_str(), prefixes.data(),
                                     (int)prefixes.size())) {
         LOG_INFO("Pipeline: message from %s starts with a filtered prefix",
                  request.username.c_str());
         result.status = HERALD_ERR_FILTERED;
         return result;
      }
   }

   std::vector<char> buf = make_buffer(request.text);
   if (text_filter_strip_mention(buf.data())) {
      LOG_INFO("Pipeline: removed leading @ from message by %s", request.username.c_str());
   }
   std::string text = buf.data();

   GateRequest gate_request;
   gate_request.user_id = request.user_id;
   gate_request.username = request.username;
   gate_request.source = request.source;
   gate_request.team_level = request.team_level;
   GateDecision decision = gate_->evaluate(gate_request);
   if (!decision.allowed()) {
      result.status = decision.status;
      result.retry_after_ms = decision.remaining_ms;
      return result;
   }

   result.status = prepare_text(*config, request, text);
   if (!result.success()) {
      return result;
   }

   /* Voice and engine */
   tts_user_record_t record;
   bool have_record = user_db_is_ready() &&
                      user_db_get_user(request.user_id.c_str(), &record) == USER_DB_SUCCESS;
   bool system = is_system_source(request.source);

   std::string engine_id = request.engine_id;
   std::string voice_id = request.voice_id;
   if (!system && have_record && record.assigned_engine[0]) {
      engine_id = record.assigned_engine;
   }
   if (!system && have_record && record.assigned_voice_id[0]) {
      voice_id = record.assigned_voice_id;
   }
   if (engine_id.empty()) {
      engine_id = config->default_engine;
   }
   if (voice_id.empty()) {
      voice_id = config->default_voice;
   }

   std::shared_ptr<TtsEngine> engine = engines_->get(engine_id);
   if (!engine) {
      LOG_WARNING("Pipeline: engine '%s' not available", engine_id.c_str());
      for (const auto &candidate : fallback_chain(engine_id)) {
         engine = engines_->get(candidate);
         if (engine) {
            LOG_INFO("Pipeline: falling back to engine '%s'", candidate.c_str());
            engine_id = candidate;
            break;
         }
      }
      if (!engine) {
         LOG_ERROR("Pipeline: no TTS engine available, configure at least one credential");
         result.status = HERALD_ERR_NOT_FOUND;
         return result;
      }
   }

   if (!engine->accepts_voice(voice_id)) {
      std::string fallback = engine->get_default_voice_for_language(config->fallback_language);
      LOG_WARNING("Pipeline: voice '%s' unknown to %s, using '%s'", voice_id.c_str(),
                  engine_id.c_str(), fallback.c_str());
      voice_id = fallback;
   }

   double gain = have_record ? user_gain_clamp(record.volume_gain) : USER_GAIN_DEFAULT;
   int base_volume = request.volume >= 0 ? request.volume : config->volume;

   QueueItem item;
   item.user_id = request.user_id;
   item.username = request.username;
   item.text = text;
   item.voice_id = voice_id;
   item.engine_id = engine_id;
   item.is_streaming = engine_id == FishAudioEngine::kId && engine->supports_streaming();
   item.options.emotion = have_record ? record.emotion : "";
   item.options.speed = config->speed;
   item.volume = base_volume * gain;
   item.speed = config->speed;
   item.priority = request.priority;
   item.source = request.source;
   item.bypass_duplicate_filter = request.bypass_duplicate_filter;

   EnqueueResult queued = queue_->enqueue(std::move(item));
   result.status = queued.status;
   result.id = queued.id;
   result.position = queued.position;
   result.estimated_wait_ms = queued.estimated_wait_ms;
   result.retry_after_ms = queued.retry_after_ms;
   result.engine_id = engine_id;
   result.voice_id = voice_id;
   return result;
}

herald_status_t SpeechPipeline::set_user_gain(const std::string &user_id,
                                              double gain,
                                              double *stored_out) {
   if (user_id.empty()) {
      return HERALD_ERR_INVALID_PARAM;
   }
   if (!user_db_is_ready()) {
      LOG_ERROR("Pipeline: user store not open, cannot set gain for %s", user_id.c_str());
      return HERALD_ERR_NOT_FOUND;
   }

   double stored = USER_GAIN_DEFAULT;
   int rc = user_db_set_volume_gain(user_id.c_str(), gain, &stored);
   if (rc == USER_DB_INVALID) {
      return HERALD_ERR_INVALID_PARAM;
   }
   if (rc != USER_DB_SUCCESS) {
      return HERALD_ERR_NOT_FOUND;
   }
   if (stored_out) {
      *stored_out = stored;
   }

   LOG_INFO("Pipeline: gain for %s set to %.2f", user_id.c_str(), stored);

   JsonPayload payload;
   payload.set("userId", user_id).set("gain", stored);
   sink_->publish("user:gain_updated", payload.str());
   return HERALD_OK;
}

}  // namespace herald
