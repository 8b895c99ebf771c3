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
 * Event trigger handler implementation.
 */

#include "events/event_trigger.h"

#include <errno.h>
#include <sodium.h>
#include <string.h>
#include <strings.h>
#include <time.h>

#include <chrono>

#include "core/encoding.h"
#include "herald.h"

extern "C" {
#include "logging.h"
}

namespace herald {

namespace {

#define REMINDER_USER_ID "periodic-reminder"
#define REMINDER_USERNAME "System"
#define NO_PREVIOUS_GIFTER "niemand"

int64_t wall_now_ms() {
   return std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::system_clock::now().time_since_epoch())
       .count();
}

const std::string &or_default(const std::string &value, const std::string &fallback) {
   return value.empty() ? fallback : value;
}

}  // namespace

std::string fill_template(const std::string &text, const TemplateValues &values) {
   std::string out;
   out.reserve(text.size());

   size_t pos = 0;
   while (pos < text.size()) {
      size_t open = text.find('{', pos);
      if (open == std::string::npos) {
         break;
      }
      size_t close = text.find('}', open + 1);
      if (close == std::string::npos) {
         break;
      }
      out.append(text, pos, open - pos);
      auto it = values.find(text.substr(open + 1, close - open - 1));
      if (it != values.end()) {
         out += it->second;
      } else {
         out.append(text, open, close - open + 1);
      }
      pos = close + 1;
   }
   out.append(text, pos, std::string::npos);
   return out;
}

EventTrigger::EventTrigger(std::shared_ptr<SpeechPipeline> pipeline,
                           std::shared_ptr<PermissionGate> gate,
                           Clock clock)
    : pipeline_(std::move(pipeline)), gate_(std::move(gate)), clock_(std::move(clock)) {
   if (!clock_) {
      clock_ = wall_now_ms;
   }
   if (!encoding_init()) {
      LOG_WARNING("Events: reminder selection falls back to the first message");
   }

   pthread_mutex_init(&reminder_mutex_, NULL);
   pthread_condattr_t attr;
   pthread_condattr_init(&attr);
   pthread_condattr_setclock(&attr, CLOCK_MONOTONIC);
   pthread_cond_init(&reminder_cond_, &attr);
   pthread_condattr_destroy(&attr);
}

EventTrigger::~EventTrigger() {
   stop();
   pthread_cond_destroy(&reminder_cond_);
   pthread_mutex_destroy(&reminder_mutex_);
}

/* =============================================================================
 * Dispatch
 * ============================================================================= */

TriggerResult EventTrigger::dispatch(const PipelineConfig &config,
                                     const std::string &text,
                                     const std::string &user_id,
                                     const std::string &username,
                                     const std::string &kind,
                                     const std::string &voice) {
   TriggerResult result;
   result.dispatched = true;
   result.text = text;

   SpeakRequest request;
   request.text = text;
   request.user_id = user_id.empty() ? EVENT_SYSTEM_USER_ID : user_id;
   request.username = username.empty() ? EVENT_SYSTEM_USERNAME : username;
   request.source = HERALD_SOURCE_EVENT_PREFIX + kind;
   request.voice_id = voice.empty() ? config.events_voice : voice;
   request.volume = config.events_volume;
   request.priority = config.events_priority_over_chat ? Priority::HIGH : Priority::NORMAL;

   result.speak = pipeline_->speak(request);
   if (result.speak.success()) {
      LOG_INFO("Events: %s queued for %s (position %zu)", kind.c_str(), request.username.c_str(),
               result.speak.position);
   } else if (herald_status_is_policy(result.speak.status)) {
      LOG_INFO("Events: %s for %s not queued (%s)", kind.c_str(), request.username.c_str(),
               result.speak.reason());
   } else {
      LOG_WARNING("Events: %s for %s failed (%s)", kind.c_str(), request.username.c_str(),
                  result.speak.reason());
   }
   return result;
}

TriggerResult EventTrigger::handle(const LiveEvent &event) {
   PipelineConfigPtr config = pipeline_->config();
   if (!config->events_enabled || event.type >= EVENT_TYPE_COUNT) {
      return TriggerResult();
   }
   const EventTypeSettings &settings = config->event(event.type);
   if (!settings.enabled) {
      return TriggerResult();
   }

   if (event.type == EVENT_GIFT) {
      return handle_gift(*config, event);
   }

   static const std::string k_default_name = EVENT_DEFAULT_NAME;
   const std::string &username = or_default(event.username, k_default_name);
   TemplateValues values = {
      { "username", username },
      { "nickname", or_default(event.nickname, username) },
   };

   if (event.type == EVENT_LIKE) {
      int64_t likes = event.like_count > 0 ? event.like_count : 1;
      if (likes < settings.min_value) {
         return TriggerResult();
      }
      values["likeCount"] = std::to_string(likes);
   }

   return dispatch(*config, fill_template(settings.template_text, values), event.user_id,
                   event.username, event_type_name(event.type), "");
}

TriggerResult EventTrigger::handle_gift(const PipelineConfig &config, const LiveEvent &event) {
   static const std::string k_default_name = EVENT_DEFAULT_NAME;
   static const std::string k_default_gift = EVENT_DEFAULT_GIFT;

   const std::string &username = or_default(event.username, k_default_name);
   int64_t coins = event.coins > 0 ? event.coins : 0;
   TemplateValues values = {
      { "username", username },
      { "nickname", or_default(event.nickname, username) },
      { "giftName", or_default(event.gift_name, k_default_gift) },
      { "giftCount", std::to_string(event.repeat_count > 0 ? event.repeat_count : 1) },
      { "coins", std::to_string(coins) },
   };

   TriggerResult result;
   bool matched = false;

   if (config.specific_gifts_enabled && !event.gift_name.empty()) {
      for (const auto &rule : config.specific_gifts) {
         if (strcasecmp(rule.gift_name.c_str(), event.gift_name.c_str()) == 0) {
            result = dispatch(config, fill_template(rule.template_text, values), event.user_id,
                              event.username, "gift-specific", rule.voice);
            matched = true;
            break;
         }
      }
   }

   if (!matched && config.tiered_gifts_enabled) {
      for (size_t i = config.gift_tiers.size(); i-- > 0;) {
         const GiftTier &tier = config.gift_tiers[i];
         if (tier.enabled && coins >= tier.min_coins) {
            result = dispatch(config, fill_template(tier.template_text, values), event.user_id,
                              event.username, "gift-tiered", tier.voice);
            matched = true;
            break;
         }
      }
   }

   if (!matched) {
      // Below the minimum: ignored without trace
      if (coins < config.event(EVENT_GIFT).min_value) {
         return TriggerResult();
      }
      result = dispatch(config, fill_template(config.event(EVENT_GIFT).template_text, values),
                        event.user_id, event.username, event_type_name(EVENT_GIFT), "");
      if (result.speak.status == HERALD_ERR_ON_COOLDOWN) {
         return result;
      }
   }

   std::string gifter_id = event.user_id.empty() ? username : event.user_id;
   update_top_gifter(config, gifter_id, username, coins);
   update_streak(config, gifter_id, username);
   return result;
}

/* =============================================================================
 * Session Tracking
 * ============================================================================= */

void EventTrigger::update_top_gifter(const PipelineConfig &config,
                                     const std::string &user_id,
                                     const std::string &username,
                                     int64_t coins) {
   if (!config.top_gifter_enabled) {
      return;
   }

   std::string leader_id;
   Gifter leader;
   std::string previous = NO_PREVIOUS_GIFTER;
   {
      std::lock_guard<std::mutex> lock(state_mutex_);
      Gifter &gifter = gifters_[user_id];
      gifter.username = username;
      gifter.total_coins += coins;

      for (const auto &kv : gifters_) {
         if (kv.second.total_coins > leader.total_coins) {
            leader_id = kv.first;
            leader = kv.second;
         }
      }
      if (leader_id.empty() || leader_id == top_gifter_id_) {
         return;
      }
      auto prev = gifters_.find(top_gifter_id_);
      if (prev != gifters_.end()) {
         previous = prev->second.username;
      }
      top_gifter_id_ = leader_id;
   }

   TemplateValues values = {
      { "username", leader.username },
      { "coins", std::to_string(leader.total_coins) },
      { "previousTopGifter", previous },
   };
   dispatch(config, fill_template(config.top_gifter_template, values), leader_id, leader.username,
            "top-gifter", config.top_gifter_voice);
}

void EventTrigger::update_streak(const PipelineConfig &config,
                                 const std::string &user_id,
                                 const std::string &username) {
   if (!config.combo_enabled) {
      return;
   }

   int64_t now = clock_();
   int count = 0;
   {
      std::lock_guard<std::mutex> lock(state_mutex_);
      Streak &streak = streaks_[user_id];
      if (streak.count == 0 || now - streak.last_gift_ms > config.combo_window_ms) {
         streak.count = 1;
      } else {
         streak.count++;
      }
      streak.last_gift_ms = now;
      count = streak.count;
   }

   // Announced once, when the streak reaches the threshold
   if (count != config.combo_threshold) {
      return;
   }
   TemplateValues values = {
      { "username", username },
      { "streak", std::to_string(count) },
   };
   dispatch(config, fill_template(config.combo_template, values), user_id, username, "gift-streak",
            config.combo_voice);
}

std::string EventTrigger::top_gifter() const {
   std::lock_guard<std::mutex> lock(state_mutex_);
   auto it = gifters_.find(top_gifter_id_);
   return it != gifters_.end() ? it->second.username : std::string();
}

void EventTrigger::reset_session() {
   gate_->reset_cooldowns();
   {
      std::lock_guard<std::mutex> lock(state_mutex_);
      gifters_.clear();
      streaks_.clear();
      top_gifter_id_.clear();
      last_reminder_ = -1;
   }
   LOG_INFO("Events: session state reset");
}

/* =============================================================================
 * Periodic Reminders
 * ============================================================================= */

std::string EventTrigger::next_reminder() {
   PipelineConfigPtr config = pipeline_->config();
   const std::vector<std::string> &messages = config->reminder_messages;
   if (messages.empty()) {
      return std::string();
   }

   std::lock_guard<std::mutex> lock(state_mutex_);
   int index = 0;
   if (messages.size() > 1) {
      do {
         index = (int)randombytes_uniform((uint32_t)messages.size());
      } while (index == last_reminder_);
   }
   last_reminder_ = index;
   return messages[index];
}

TriggerResult EventTrigger::announce_reminder() {
   PipelineConfigPtr config = pipeline_->config();
   std::string message = next_reminder();
   if (message.empty()) {
      return TriggerResult();
   }
   return dispatch(*config, message, REMINDER_USER_ID, REMINDER_USERNAME, "periodic-reminder",
                   config->reminder_voice);
}

int EventTrigger::start() {
   if (thread_started_) {
      return SUCCESS;
   }
   PipelineConfigPtr config = pipeline_->config();
   if (!config->events_enabled || !config->reminder_enabled) {
      return SUCCESS;
   }
   if (config->reminder_messages.empty()) {
      LOG_WARNING("Events: periodic reminder enabled but no messages configured");
      return SUCCESS;
   }

   running_.store(true);
   int rc = pthread_create(&reminder_thread_, NULL, reminder_thread_entry, this);
   if (rc != 0) {
      LOG_ERROR("Events: failed to create reminder thread: %s", strerror(rc));
      running_.store(false);
      return FAILURE;
   }
   thread_started_ = true;
   LOG_INFO("Events: periodic reminders every %ld minutes",
            config->reminder_interval_ms / 60000);
   return SUCCESS;
}

void EventTrigger::stop() {
   if (!thread_started_) {
      return;
   }
   pthread_mutex_lock(&reminder_mutex_);
   running_.store(false);
   pthread_cond_signal(&reminder_cond_);
   pthread_mutex_unlock(&reminder_mutex_);

   pthread_join(reminder_thread_, NULL);
   thread_started_ = false;
}

void *EventTrigger::reminder_thread_entry(void *arg) {
   static_cast<EventTrigger *>(arg)->reminder_loop();
   return NULL;
}

void EventTrigger::reminder_loop() {
   pthread_mutex_lock(&reminder_mutex_);
   while (running_.load()) {
      long interval = pipeline_->config()->reminder_interval_ms;
      if (interval < 1000) {
         interval = 1000;
      }

      struct timespec ts;
      clock_gettime(CLOCK_MONOTONIC, &ts);
      ts.tv_sec += interval / 1000;
      ts.tv_nsec += (interval % 1000) * 1000000L;
      if (ts.tv_nsec >= 1000000000L) {
         ts.tv_sec++;
         ts.tv_nsec -= 1000000000L;
      }

      int rc = 0;
      while (running_.load() && rc != ETIMEDOUT) {
         rc = pthread_cond_timedwait(&reminder_cond_, &reminder_mutex_, &ts);
      }
      if (!running_.load()) {
         break;
      }

      pthread_mutex_unlock(&reminder_mutex_);
      announce_reminder();
      pthread_mutex_lock(&reminder_mutex_);
   }
   pthread_mutex_unlock(&reminder_mutex_);
}

}  // namespace herald
