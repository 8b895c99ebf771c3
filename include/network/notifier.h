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
 * Lifecycle notification sink and JSON payload builder.
 *
 * Event names: playback:started, stream:chunk, stream:end, playback:ended,
 * playback:error, user:gain_updated, queue:item_added, queue:cleared.
 */

#ifndef HERALD_NOTIFIER_H
#define HERALD_NOTIFIER_H

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct json_object;

namespace herald {

/**
 * Destination for lifecycle notifications. publish() is called from the
 * playback thread and from API callers; implementations must be thread-safe
 * and must not block for long.
 */
class NotificationSink {
 public:
   virtual ~NotificationSink() = default;
   virtual void publish(const std::string &event, const std::string &payload_json) = 0;
};

/**
 * Sink that drops everything (no consumer attached).
 */
class NullSink : public NotificationSink {
 public:
   void publish(const std::string &, const std::string &) override {}
};

/**
 * Sink that forwards to several sinks in order.
 */
class FanoutSink : public NotificationSink {
 public:
   void add(std::shared_ptr<NotificationSink> sink);
   void publish(const std::string &event, const std::string &payload_json) override;

 private:
   std::mutex mutex_;
   std::vector<std::shared_ptr<NotificationSink>> sinks_;
};

/**
 * Owning wrapper around a json-c object used to build payloads.
 */
class JsonPayload {
 public:
   JsonPayload();
   ~JsonPayload();

   JsonPayload(const JsonPayload &) = delete;
   JsonPayload &operator=(const JsonPayload &) = delete;

   JsonPayload &set(const char *key, const std::string &value);
   JsonPayload &set(const char *key, const char *value);
   JsonPayload &set(const char *key, int64_t value);
   JsonPayload &set(const char *key, int value) { return set(key, (int64_t)value); }
   JsonPayload &set(const char *key, double value);
   JsonPayload &set(const char *key, bool value);
   JsonPayload &set_null(const char *key);

   std::string str() const;

 private:
   struct json_object *obj_;
};

}  // namespace herald

#endif  // HERALD_NOTIFIER_H
