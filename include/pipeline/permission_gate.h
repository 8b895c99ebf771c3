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
 *
 * Evaluation order for one request:
 *   1. global enable flag (never bypassed)          -> HERALD_ERR_DISABLED
 *   2. "preview" source skips authorization, every
 *      other source needs the user store to allow   -> HERALD_ERR_PERMISSION_DENIED
 *   3. event sources pass the (user, event type)
 *      cooldown; passing records the trigger time   -> HERALD_ERR_ON_COOLDOWN
 */

#ifndef HERALD_PERMISSION_GATE_H
#define HERALD_PERMISSION_GATE_H

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>

#include "core/herald_status.h"
#include "core/pipeline_config.h"
#include "events/event_type.h"

namespace herald {

struct GateRequest {
   std::string user_id;
   std::string username;
   std::string source;  // "chat", "preview", "manual", "event:<type>"
   int team_level = 0;
};

struct GateDecision {
   herald_status_t status = HERALD_OK;
   int64_t remaining_ms = 0;  // HERALD_ERR_ON_COOLDOWN only

   bool allowed() const { return status == HERALD_OK; }
};

bool is_preview_source(const std::string &source);
bool is_event_source(const std::string &source);

/**
 * Sources raised by the application itself (events, previews, manual
 * announcements) rather than by an audience member.
 */
bool is_system_source(const std::string &source);

/**
 * "event:gift" -> EVENT_GIFT. EVENT_TYPE_COUNT for non-event sources.
 */
event_type_t event_type_of_source(const std::string &source);

class PermissionGate {
 public:
   using Clock = std::function<int64_t()>;  // wall clock, milliseconds

   explicit PermissionGate(PipelineConfigPtr config, Clock clock = Clock());

   void set_config(PipelineConfigPtr config);

   /**
    * Run the full gate. A passing event request starts its cooldown.
    */
   GateDecision evaluate(const GateRequest &request);

   /**
    * Authorization only (steps 1 and 2).
    */
   GateDecision authorize(const GateRequest &request) const;

   /**
    * Cooldown only. On success the trigger time is recorded.
    */
   GateDecision check_cooldown(const std::string &user_id, event_type_t type);

   /**
    * Remaining cooldown without recording anything.
    */
   int64_t cooldown_remaining(const std::string &user_id, event_type_t type) const;

   void reset_cooldowns();

 private:
   std::string cooldown_key(const std::string &user_id, event_type_t type) const;
   int64_t last_trigger_locked(const std::string &key) const;

   PipelineConfigPtr snapshot() const;

   mutable std::mutex mutex_;
   PipelineConfigPtr config_;
   Clock clock_;
   mutable std::map<std::string, int64_t> cooldowns_;  // "user:event" -> last trigger ms, -1 = never
   int64_t reset_floor_ms_ = 0;
};

}  // namespace herald

#endif  // HERALD_PERMISSION_GATE_H
