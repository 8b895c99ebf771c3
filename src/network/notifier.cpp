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
 */

#include "network/notifier.h"

#include <json-c/json.h>

namespace herald {

void FanoutSink::add(std::shared_ptr<NotificationSink> sink) {
   if (!sink) {
      return;
   }
   std::lock_guard<std::mutex> lock(mutex_);
   sinks_.push_back(std::move(sink));
}

void FanoutSink::publish(const std::string &event, const std::string &payload_json) {
   std::vector<std::shared_ptr<NotificationSink>> sinks;
   {
      std::lock_guard<std::mutex> lock(mutex_);
      sinks = sinks_;
   }
   for (const auto &sink : sinks) {
      sink->publish(event, payload_json);
   }
}

JsonPayload::JsonPayload() : obj_(json_object_new_object()) {}

JsonPayload::~JsonPayload() {
   json_object_put(obj_);
}

JsonPayload &JsonPayload::set(const char *key, const std::string &value) {
   json_object_object_add(obj_, key, json_object_new_string_len(value.c_str(), (int)value.size()));
   return *this;
}

JsonPayload &JsonPayload::set(const char *key, const char *value) {
   json_object_object_add(obj_, key, value ? json_object_new_string(value) : nullptr);
   return *this;
}

JsonPayload &JsonPayload::set(const char *key, int64_t value) {
   json_object_object_add(obj_, key, json_object_new_int64(value));
   return *this;
}

JsonPayload &JsonPayload::set(const char *key, double value) {
   json_object_object_add(obj_, key, json_object_new_double(value));
   return *this;
}

JsonPayload &JsonPayload::set(const char *key, bool value) {
   json_object_object_add(obj_, key, json_object_new_boolean(value));
   return *this;
}

JsonPayload &JsonPayload::set_null(const char *key) {
   json_object_object_add(obj_, key, nullptr);
   return *this;
}

std::string JsonPayload::str() const {
   return json_object_to_json_string_ext(obj_, JSON_C_TO_STRING_PLAIN);
}

}  // namespace herald
