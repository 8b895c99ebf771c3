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
 * Event trigger handler: turns live events (gift, follow, share, subscribe,
 * like, join) into spoken announcements.
 *
 * Gifts are matched in order: specific gift-name rule, coin tier, then the
 * plain gift template with its minimum-coin filter. Every accepted gift also
 * feeds the session top-gifter ranking and the per-user combo streak.
 */

#ifndef HERALD_EVENT_TRIGGER_H
#define HERALD_EVENT_TRIGGER_H

#include <pthread.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "events/event_type.h"
#include "pipeline/permission_gate.h"
#include "pipeline/speech_pipeline.h"

namespace herald {

#define EVENT_SYSTEM_USER_ID "event-system"
#define EVENT_SYSTEM_USERNAME "Event"
#define EVENT_DEFAULT_NAME "Jemand"
#define EVENT_DEFAULT_GIFT "ein Geschenk"

/**
 * One upstream live event. Zero / empty means the field was absent.
 */
struct LiveEvent {
   event_type_t type = EVENT_TYPE_COUNT;
   std::string user_id;
   std::string username;
   std::string nickname;
   std::string gift_name;
   int64_t coins = 0;
   int repeat_count = 0;
   int64_t like_count = 0;
};

using TemplateValues = std::map<std::string, std::string>;

/**
 * Replace every {key} with its value. Unknown placeholders stay as written.
 */
std::string fill_template(const std::string &text, const TemplateValues &values);

struct TriggerResult {
   bool dispatched = false;  // false: type disabled or below its minimum
   std::string text;
   SpeakResult speak;
};

class EventTrigger {
 public:
   using Clock = std::function<int64_t()>;  // milliseconds

   EventTrigger(std::shared_ptr<SpeechPipeline> pipeline,
                std::shared_ptr<PermissionGate> gate,
                Clock clock = Clock());
   ~EventTrigger();

   EventTrigger(const EventTrigger &) = delete;
   EventTrigger &operator=(const EventTrigger &) = delete;

   /**
    * Handle one live event. Filtered events return dispatched = false and
    * publish nothing.
    */
   TriggerResult handle(const LiveEvent &event);

   /**
    * Start the periodic reminder thread when reminders are configured.
    * @return SUCCESS, or FAILURE if the thread could not be created
    */
   int start();
   void stop();

   /**
    * Pick the next reminder message (random, never the previous one twice
    * in a row). Empty when no messages are configured.
    */
   std::string next_reminder();

   /**
    * Speak one reminder now.
    */
   TriggerResult announce_reminder();

   /**
    * Forget cooldowns, session gifters, the top gifter and combo streaks.
    */
   void reset_session();

   std::string top_gifter() const;

 private:
   struct Gifter {
      std::string username;
      int64_t total_coins = 0;
   };

   struct Streak {
      int count = 0;
      int64_t last_gift_ms = 0;
   };

   TriggerResult handle_gift(const PipelineConfig &config, const LiveEvent &event);
   TriggerResult dispatch(const PipelineConfig &config,
                          const std::string &text,
                          const std::string &user_id,
                          const std::string &username,
                          const std::string &kind,
                          const std::string &voice);
   void update_top_gifter(const PipelineConfig &config,
                          const std::string &user_id,
                          const std::string &username,
                          int64_t coins);
   void update_streak(const PipelineConfig &config,
                      const std::string &user_id,
                      const std::string &username);

   static void *reminder_thread_entry(void *arg);
   void reminder_loop();

   std::shared_ptr<SpeechPipeline> pipeline_;
   std::shared_ptr<PermissionGate> gate_;
   Clock clock_;

   mutable std::mutex state_mutex_;
   std::map<std::string, Gifter> gifters_;
   std::string top_gifter_id_;
   std::map<std::string, Streak> streaks_;
   int last_reminder_ = -1;

   pthread_mutex_t reminder_mutex_;
   pthread_cond_t reminder_cond_;
   std::atomic<bool> running_{ false };
   bool thread_started_ = false;
   pthread_t reminder_thread_;
};

}  // namespace herald

#endif  // HERALD_EVENT_TRIGGER_H
