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
 * MQTT bridge (libmosquitto) and inbound payload parsing (json-c).
 */

#include "network/mqtt_bridge.h"

#include <json-c/json.h>
#include <string.h>

#include "herald.h"

extern "C" {
#include "logging.h"
}

namespace herald {

namespace {

std::string json_string(struct json_object *obj, const char *key) {
   struct json_object *value = NULL;
   if (!json_object_object_get_ex(obj, key, &value) || !value ||
       json_object_is_type(value, json_type_null)) {
      return std::string();
   }
   const char *str = json_object_get_string(value);
   return str ? str : std::string();
}

int64_t json_int(struct json_object *obj, const char *key, int64_t fallback) {
   struct json_object *value = NULL;
   if (!json_object_object_get_ex(obj, key, &value) || !value ||
       json_object_is_type(value, json_type_null)) {
      return fallback;
   }
   return json_object_get_int64(value);
}

/* Parses text into an object; caller releases with json_object_put() */
struct json_object *parse_object(const std::string &json) {
   struct json_object *root = json_tokener_parse(json.c_str());
   if (root && !json_object_is_type(root, json_type_object)) {
      json_object_put(root);
      return NULL;
   }
   return root;
}

}  // namespace

bool parse_speak_request(const std::string &json, SpeakRequest *out) {
   if (!out) {
      return false;
   }
   struct json_object *root = parse_object(json);
   if (!root) {
      return false;
   }

   SpeakRequest request;
   request.text = json_string(root, "text");
   request.user_id = json_string(root, "userId");
   request.username = json_string(root, "username");
   request.voice_id = json_string(root, "voiceId");
   request.engine_id = json_string(root, "engine");
   std::string source = json_string(root, "source");
   if (!source.empty()) {
      request.source = source;
   }
   request.team_level = (int)json_int(root, "teamLevel", 0);
   request.priority = json_string(root, "priority") == "high" ? Priority::HIGH : Priority::NORMAL;
   json_object_put(root);

   if (request.text.empty()) {
      return false;
   }
   *out = std::move(request);
   return true;
}

bool parse_live_event(event_type_t type, const std::string &json, LiveEvent *out) {
   if (!out || type >= EVENT_TYPE_COUNT) {
      return false;
   }
   struct json_object *root = parse_object(json);
   if (!root) {
      return false;
   }

   LiveEvent event;
   event.type = type;
   event.user_id = json_string(root, "userId");
   event.username = json_string(root, "username");
   if (event.username.empty()) {
      event.username = json_string(root, "uniqueId");
   }
   event.nickname = json_string(root, "nickname");
   event.gift_name = json_string(root, "giftName");
   event.coins = json_int(root, "coins", 0);
   if (event.coins <= 0) {
      event.coins = json_int(root, "diamondCount", 0);
   }
   event.repeat_count = (int)json_int(root, "repeatCount", 0);
   event.like_count = json_int(root, "likeCount", 0);
   json_object_put(root);

   *out = std::move(event);
   return true;
}

/* =============================================================================
 * Connection
 * ============================================================================= */

MqttBridge::MqttBridge(const mqtt_config_t &config, const secrets_config_t &secrets)
    : broker_(config.broker),
      port_(config.port),
      prefix_(config.topic_prefix),
      client_id_(config.client_id),
      username_(secrets.mqtt_username),
      password_(secrets.mqtt_password) {
   mosquitto_lib_init();
}

MqttBridge::~MqttBridge() {
   disconnect();
   mosquitto_lib_cleanup();
}

std::string MqttBridge::topic_for(const std::string &event) const {
   return prefix_.empty() ? event : prefix_ + "/" + event;
}

int MqttBridge::connect() {
   std::lock_guard<std::mutex> lock(mutex_);
   if (mosq_) {
      return SUCCESS;
   }

   mosq_ = mosquitto_new(client_id_.empty() ? NULL : client_id_.c_str(), true, this);
   if (!mosq_) {
      LOG_ERROR("MQTT: failed to create client");
      return FAILURE;
   }
   if (!username_.empty()) {
      int rc = mosquitto_username_pw_set(mosq_, username_.c_str(),
                                         password_.empty() ? NULL : password_.c_str());
      if (rc != MOSQ_ERR_SUCCESS) {
         LOG_ERROR("MQTT: failed to set credentials: %s", mosquitto_strerror(rc));
         mosquitto_destroy(mosq_);
         mosq_ = nullptr;
         return FAILURE;
      }
   }

   mosquitto_connect_callback_set(mosq_, on_connect);
   mosquitto_disconnect_callback_set(mosq_, on_disconnect);
   mosquitto_message_callback_set(mosq_, on_message);

   int rc = mosquitto_connect(mosq_, broker_.c_str(), port_, MQTT_KEEPALIVE_SEC);
   if (rc != MOSQ_ERR_SUCCESS) {
      LOG_ERROR("MQTT: unable to connect to %s:%d: %s", broker_.c_str(), port_,
                mosquitto_strerror(rc));
      mosquitto_destroy(mosq_);
      mosq_ = nullptr;
      return FAILURE;
   }

   rc = mosquitto_loop_start(mosq_);
   if (rc != MOSQ_ERR_SUCCESS) {
      LOG_ERROR("MQTT: failed to start network loop: %s", mosquitto_strerror(rc));
      mosquitto_disconnect(mosq_);
      mosquitto_destroy(mosq_);
      mosq_ = nullptr;
      return FAILURE;
   }
   loop_started_ = true;

   LOG_INFO("MQTT: connecting to %s:%d (prefix \"%s\")", broker_.c_str(), port_, prefix_.c_str());
   return SUCCESS;
}

void MqttBridge::disconnect() {
   struct mosquitto *mosq = nullptr;
   bool loop_started = false;
   {
      // Publishers see NULL from here on; the loop thread may still call in
      std::lock_guard<std::mutex> lock(mutex_);
      mosq = mosq_;
      loop_started = loop_started_;
      mosq_ = nullptr;
      loop_started_ = false;
   }
   if (!mosq) {
      return;
   }
   mosquitto_disconnect(mosq);
   if (loop_started) {
      mosquitto_loop_stop(mosq, false);
   }
   mosquitto_destroy(mosq);
   connected_.store(false);
   LOG_INFO("MQTT: disconnected");
}

void MqttBridge::on_connect(struct mosquitto *mosq, void *obj, int reason_code) {
   MqttBridge *self = static_cast<MqttBridge *>(obj);
   if (reason_code != 0) {
      LOG_ERROR("MQTT: connection refused: %s", mosquitto_connack_string(reason_code));
      return;
   }
   self->connected_.store(true);
   LOG_INFO("MQTT: connected");

   std::string speak_topic = self->topic_for(MQTT_SPEAK_TOPIC);
   std::string event_topic = self->topic_for(MQTT_EVENT_TOPIC "+");
   int rc = mosquitto_subscribe(mosq, NULL, speak_topic.c_str(), MQTT_QOS);
   if (rc == MOSQ_ERR_SUCCESS) {
      rc = mosquitto_subscribe(mosq, NULL, event_topic.c_str(), MQTT_QOS);
   }
   if (rc != MOSQ_ERR_SUCCESS) {
      LOG_ERROR("MQTT: subscribe failed: %s", mosquitto_strerror(rc));
   }
}

void MqttBridge::on_disconnect(struct mosquitto *, void *obj, int reason_code) {
   MqttBridge *self = static_cast<MqttBridge *>(obj);
   self->connected_.store(false);
   if (reason_code != 0) {
      LOG_WARNING("MQTT: connection lost (%d), reconnecting", reason_code);
   }
}

void MqttBridge::on_message(struct mosquitto *, void *obj, const struct mosquitto_message *msg) {
   if (!msg || !msg->topic || !msg->payload || msg->payloadlen <= 0) {
      return;
   }
   MqttBridge *self = static_cast<MqttBridge *>(obj);
   self->handle_message(msg->topic,
                        std::string(static_cast<const char *>(msg->payload), msg->payloadlen));
}

void MqttBridge::handle_message(const std::string &topic, const std::string &payload) {
   std::string speak_topic = topic_for(MQTT_SPEAK_TOPIC);
   std::string event_prefix = topic_for(MQTT_EVENT_TOPIC);

   if (topic == speak_topic) {
      SpeakRequest request;
      if (!parse_speak_request(payload, &request)) {
         LOG_WARNING("MQTT: malformed speak request on %s", topic.c_str());
         return;
      }
      if (speak_handler_) {
         speak_handler_(request);
      }
      return;
   }

   if (topic.compare(0, event_prefix.size(), event_prefix) == 0) {
      event_type_t type = event_type_from_name(topic.c_str() + event_prefix.size());
      LiveEvent event;
      if (!parse_live_event(type, payload, &event)) {
         LOG_WARNING("MQTT: malformed or unknown event on %s", topic.c_str());
         return;
      }
      if (event_handler_) {
         event_handler_(event);
      }
   }
}

/* =============================================================================
 * Notifications
 * ============================================================================= */

void MqttBridge::publish(const std::string &event, const std::string &payload_json) {
   std::lock_guard<std::mutex> lock(mutex_);
   if (!mosq_) {
      return;
   }
   std::string topic = topic_for(event);
   int rc = mosquitto_publish(mosq_, NULL, topic.c_str(), (int)payload_json.size(),
                              payload_json.data(), MQTT_QOS, false);
   if (rc != MOSQ_ERR_SUCCESS) {
      LOG_WARNING("MQTT: publish to %s failed: %s", topic.c_str(), mosquitto_strerror(rc));
   }
}

}  // namespace herald
