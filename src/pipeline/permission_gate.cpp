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
 * Permission and cooldown gate.
 */

#include "pipeline/permission_gate.h"

#include <chrono>
#include <cstdlib>

#include "herald.h"

extern "C" {
#include "logging.h"
#include "store/user_db.h"
}

namespace herald {

namespace {

#define COOLDOWN_SETTING_PREFIX "cooldown:"

int64_t wall_now_ms() {
   return std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::system_clock::now().time_since_epoch())
       .count();
}

}  // namespace

bool is_preview_source(const std::string &source) {
   return source == HERALD_SOURCE_PREVIEW;
}

bool is_event_source(const std::string &source) {
   return source.compare(0, sizeof(HERALD_SOURCE_EVENT_PREFIX) - 1, HERALD_SOURCE_EVENT_PREFIX) ==
          0;
}

bool is_system_source(const std::string &source) {
   return is_event_source(source) || source == HERALD_SOURCE_PREVIEW ||
          source == HERALD_SOURCE_MANUAL;
}

event_type_t event_type_of_source(const std::string &source) {
   if (!is_event_source(source)) {
      return EVENT_TYPE_COUNT;
   }
   return event_type_from_name(source.c_str() + sizeof(HERALD_SOURCE_EVENT_PREFIX) - 1);
}

PermissionGate::PermissionGate(PipelineConfigPtr config, Clock clock)
    : config_(std::move(config)), clock_(std::move(clock)) {
   if (!clock_) {
      clock_ = wall_now_ms;
   }
}

void PermissionGate::set_config(PipelineConfigPtr config) {
   std::lock_guard<std::mutex> lock(mutex_);
   config_ = std::move(config);
}

PipelineConfigPtr PermissionGate::snapshot() const {
   std::lock_guard<std::mutex> lock(mutex_);
   return config_;
}

GateDecision PermissionGate::authorize(const GateRequest &request) const {
   GateDecision decision;
   PipelineConfigPtr config = snapshot();

   if (!config->tts_enabled) {
      decision.status = HERALD_ERR_DISABLED;
      return decision;
   }

   // Voice auditions from a configuration surface are never audience-gated
   if (is_preview_source(request.source)) {
      return decision;
   }

   tts_user_record_t record;
   bool have_record = user_db_is_ready() &&
                      user_db_get_user(request.user_id.c_str(), &record) == USER_DB_SUCCESS;

   if (have_record && record.is_blacklisted) {
      decision.status = HERALD_ERR_PERMISSION_DENIED;
   } else if (have_record && record.allow_tts == USER_PERMISSION_ALLOWED) {
      decision.status = HERALD_OK;
   } else if (have_record && record.allow_tts == USER_PERMISSION_DENIED) {
      decision.status = HERALD_ERR_PERMISSION_DENIED;
   } else if (config->allow_all && request.team_level >= config->team_min_level) {
      decision.status = HERALD_OK;
   } else {
      decision.status = HERALD_ERR_PERMISSION_DENIED;
   }

   if (!decision.allowed()) {
      LOG_INFO("Gate: %s (%s) denied for source %s", request.username.c_str(),
               request.user_id.c_str(), request.source.c_str());
   }
   return decision;
}

std::string PermissionGate::cooldown_key(const std::string &user_id, event_type_t type) const {
   return user_id + ":" + event_type_name(type);
}

int64_t PermissionGate::last_trigger_locked(const std::string &key) const {
   auto it = cooldowns_.find(key);
   if (it != cooldowns_.end()) {
      return it->second;
   }

   int64_t stamp = -1;
   if (user_db_is_ready()) {
      char value[USER_DB_SETTING_VALUE_MAX];
      std::string setting = COOLDOWN_SETTING_PREFIX + key;
      if (user_db_get_setting(setting.c_str(), value, sizeof(value)) == USER_DB_SUCCESS) {
         char *end = nullptr;
         long long parsed = strtoll(value, &end, 10);
         if (end != value && parsed >= reset_floor_ms_) {
            stamp = parsed;
         }
      }
   }
   cooldowns_[key] = stamp;
   return stamp;
}

int64_t PermissionGate::cooldown_remaining(const std::string &user_id, event_type_t type) const {
   if (type >= EVENT_TYPE_COUNT) {
      return 0;
   }
   PipelineConfigPtr config = snapshot();
   long window = config->event(type).cooldown_ms;
   if (window <= 0) {
      return 0;
   }

   std::lock_guard<std::mutex> lock(mutex_);
   int64_t last = last_trigger_locked(cooldown_key(user_id, type));
   if (last < 0) {
      return 0;
   }
   int64_t remaining = last + window - clock_();
   return remaining > 0 ? remaining : 0;
}

GateDecision PermissionGate::check_cooldown(const std::string &user_id, event_type_t type) {
   GateDecision decision;
   if (type >= EVENT_TYPE_COUNT) {
      return decision;
   }
   PipelineConfigPtr config = snapshot();
   long window = config->event(type).cooldown_ms;
   if (window <= 0) {
      return decision;
   }

   std::string key = cooldown_key(user_id, type);
   int64_t now = clock_();
   {
      std::lock_guard<std::mutex> lock(mutex_);
      int64_t last = last_trigger_locked(key);
      if (last >= 0 && now - last < window) {
         decision.status = HERALD_ERR_ON_COOLDOWN;
         decision.remaining_ms = last + window - now;
         LOG_INFO("Gate: %s on cooldown (%lld ms remaining)", key.c_str(),
                  (long long)decision.remaining_ms);
         return decision;
      }
      cooldowns_[key] = now;
   }

   if (user_db_is_ready()) {
      std::string setting = COOLDOWN_SETTING_PREFIX + key;
      std::string value = std::to_string(now);
      if (user_db_set_setting(setting.c_str(), value.c_str()) != USER_DB_SUCCESS) {
         LOG_WARNING("Gate: failed to persist cooldown for %s", key.c_str());
      }
   }
   return decision;
}

GateDecision PermissionGate::evaluate(const GateRequest &request) {
   GateDecision decision = authorize(request);
   if (!decision.allowed()) {
      return decision;
   }
   event_type_t type = event_type_of_source(request.source);
   if (type < EVENT_TYPE_COUNT) {
      return check_cooldown(request.user_id, type);
   }
   return decision;
}

void PermissionGate::reset_cooldowns() {
   std::lock_guard<std::mutex> lock(mutex_);
   cooldowns_.clear();
   // Persisted stamps from before the reset no longer count
   reset_floor_ms_ = clock_() + 1;
}

}  // namespace herald
