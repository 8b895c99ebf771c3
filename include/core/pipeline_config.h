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
 * Immutable configuration snapshot for the speech pipeline.
 *
 * Built once from the parsed herald_config_t and shared read-only between
 * the queue, the gate and the event handler. Reconfiguration builds a new
 * snapshot and swaps the pointer; a snapshot is never modified after
 * make_pipeline_config() returns.
 */

#ifndef HERALD_PIPELINE_CONFIG_H
#define HERALD_PIPELINE_CONFIG_H

#include <array>
#include <memory>
#include <string>
#include <vector>

#include "config/herald_config.h"
#include "core/text_filter.h"
#include "events/event_type.h"
#include "tts/tts_engine.h"

namespace herald {

struct EventTypeSettings {
   bool enabled = false;
   std::string template_text;
   long cooldown_ms = 0;
   int min_value = 0;
};

struct GiftTriggerRule {
   std::string gift_name;
   std::string template_text;
   std::string voice;
};

struct GiftTier {
   bool enabled = false;
   int min_coins = 0;
   std::string template_text;
   std::string voice;
};

struct PipelineConfig {
   /* tts */
   bool tts_enabled = true;
   std::string default_engine = "tiktok";
   std::string default_voice = "de_002";
   int volume = 80;
   float speed = 1.0f;
   PerformanceMode mode = PerformanceMode::BALANCED;
   size_t max_text_length = 300;
   bool strip_emojis = false;
   bool announce_username = false;
   std::vector<std::string> prefix_filters;
   profanity_mode_t profanity = PROFANITY_MODERATE;
   std::string fallback_language = "de";
   bool auto_fallback = true;
   std::string fishaudio_emotion;

   /* permissions */
   bool allow_all = true;
   int team_min_level = 0;

   /* queue */
   size_t max_queue_size = 100;
   int rate_limit = 3;
   long rate_limit_window_ms = 60000;
   size_t pregen_lookahead = 3;
   long pregen_await_ms = 2000;
   long dedup_window_ms = 60000;
   long playback_ms_per_char = 100;
   long playback_buffer_ms = 2000;
   long synthesis_timeout_ms = 0;

   /* streaming */
   std::string stream_endpoint = "wss://api.fish.audio/v1/tts/live";
   std::string stream_model = "s1";
   int stream_timeout_ms = 30000;

   /* events */
   bool events_enabled = false;
   bool events_priority_over_chat = false;
   int events_volume = 80;
   std::string events_voice;
   std::array<EventTypeSettings, EVENT_TYPE_COUNT> event_types;

   bool specific_gifts_enabled = false;
   std::vector<GiftTriggerRule> specific_gifts;
   bool tiered_gifts_enabled = false;
   std::array<GiftTier, CONFIG_GIFT_TIERS> gift_tiers;
   bool top_gifter_enabled = false;
   std::string top_gifter_template;
   std::string top_gifter_voice;
   bool combo_enabled = false;
   int combo_threshold = 3;
   long combo_window_ms = 10000;
   std::string combo_template;
   std::string combo_voice;
   bool reminder_enabled = false;
   long reminder_interval_ms = 15 * 60 * 1000;
   std::vector<std::string> reminder_messages;
   std::string reminder_voice;

   const EventTypeSettings &event(event_type_t type) const { return event_types[type]; }
};

using PipelineConfigPtr = std::shared_ptr<const PipelineConfig>;

/**
 * Convert a parsed (and validated) C configuration into a snapshot.
 */
PipelineConfigPtr make_pipeline_config(const herald_config_t &config);

}  // namespace herald

#endif  // HERALD_PIPELINE_CONFIG_H
