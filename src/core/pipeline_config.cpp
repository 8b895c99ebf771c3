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
 */

#include "core/pipeline_config.h"

namespace herald {

namespace {

const int k_tier_min_coins[CONFIG_GIFT_TIERS] = { 1, 10, 100, 1000 };

long sec_to_ms(int sec) {
   return sec > 0 ? (long)sec * 1000L : 0L;
}

}  // namespace

PipelineConfigPtr make_pipeline_config(const herald_config_t &config) {
   std::shared_ptr<PipelineConfig> snap = std::make_shared<PipelineConfig>();

   const tts_config_t &tts = config.tts;
   snap->tts_enabled = tts.enabled;
   snap->default_engine = tts.default_engine;
   snap->default_voice = tts.default_voice;
   snap->volume = tts.volume;
   snap->speed = tts.speed;
   snap->mode = performance_mode_from_name(tts.performance_mode);
   snap->max_text_length = tts.max_text_length > 0 ? (size_t)tts.max_text_length : 300;
   snap->strip_emojis = tts.strip_emojis;
   snap->announce_username = tts.announce_username;
   for (int i = 0; i < tts.prefix_filter_count && i < CONFIG_PREFIX_FILTER_MAX; i++) {
      if (tts.prefix_filter[i][0] != '\0') {
         snap->prefix_filters.push_back(tts.prefix_filter[i]);
      }
   }
   snap->profanity = text_filter_profanity_mode(tts.profanity_filter);
   snap->fallback_language = tts.fallback_language;
   snap->auto_fallback = tts.enable_auto_fallback;
   snap->fishaudio_emotion = tts.default_fishaudio_emotion;

   snap->allow_all = config.permissions.allow_all;
   snap->team_min_level = config.permissions.team_min_level;

   const queue_config_t &queue = config.queue;
   snap->max_queue_size = queue.max_queue_size > 0 ? (size_t)queue.max_queue_size : 1;
   snap->rate_limit = queue.rate_limit;
   snap->rate_limit_window_ms = sec_to_ms(queue.rate_limit_window_sec);
   snap->pregen_lookahead = queue.pregen_lookahead > 0 ? (size_t)queue.pregen_lookahead : 0;
   snap->pregen_await_ms = queue.pregen_await_ms;
   snap->dedup_window_ms = sec_to_ms(queue.dedup_window_sec);
   snap->playback_ms_per_char = queue.playback_ms_per_char;
   snap->playback_buffer_ms = queue.playback_buffer_ms;
   snap->synthesis_timeout_ms = queue.synthesis_timeout_ms;

   snap->stream_endpoint = config.streaming.endpoint;
   snap->stream_model = config.streaming.model;
   snap->stream_timeout_ms = config.streaming.session_timeout_ms;

   const events_config_t &events = config.events;
   snap->events_enabled = events.enabled;
   snap->events_priority_over_chat = events.priority_over_chat;
   snap->events_volume = events.volume;
   snap->events_voice = events.voice;
   for (int t = 0; t < EVENT_TYPE_COUNT; t++) {
      EventTypeSettings &dst = snap->event_types[t];
      dst.enabled = events.types[t].enabled;
      dst.template_text = events.types[t].template_text;
      dst.cooldown_ms = sec_to_ms(events.types[t].cooldown_sec);
      dst.min_value = events.types[t].min_value;
   }

   const events_advanced_config_t &adv = events.advanced;
   snap->specific_gifts_enabled = adv.specific_gifts_enabled;
   for (int i = 0; i < adv.specific_gift_count && i < CONFIG_GIFT_RULES_MAX; i++) {
      const gift_trigger_rule_t &rule = adv.specific_gifts[i];
      if (!rule.enabled || rule.gift_name[0] == '\0') {
         continue;
      }
      snap->specific_gifts.push_back({ rule.gift_name, rule.template_text, rule.voice });
   }
   snap->tiered_gifts_enabled = adv.tiered_gifts_enabled;
   for (int i = 0; i < CONFIG_GIFT_TIERS; i++) {
      snap->gift_tiers[i].enabled = adv.tiers[i].enabled;
      snap->gift_tiers[i].min_coins = k_tier_min_coins[i];
      snap->gift_tiers[i].template_text = adv.tiers[i].template_text;
      snap->gift_tiers[i].voice = adv.tiers[i].voice;
   }
   snap->top_gifter_enabled = adv.top_gifter_enabled;
   snap->top_gifter_template = adv.top_gifter_template;
   snap->top_gifter_voice = adv.top_gifter_voice;
   snap->combo_enabled = adv.combo_enabled;
   snap->combo_threshold = adv.combo_threshold;
   snap->combo_window_ms = sec_to_ms(adv.combo_window_sec);
   snap->combo_template = adv.combo_template;
   snap->combo_voice = adv.combo_voice;
   snap->reminder_enabled = adv.reminder_enabled;
   snap->reminder_interval_ms = (long)adv.reminder_interval_min * 60L * 1000L;
   for (int i = 0; i < adv.reminder_count && i < CONFIG_REMINDERS_MAX; i++) {
      if (adv.reminder_messages[i][0] != '\0') {
         snap->reminder_messages.push_back(adv.reminder_messages[i]);
      }
   }
   snap->reminder_voice = adv.reminder_voice;

   return snap;
}

}  // namespace herald
