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
 * MQTT bridge.
 *
 * Outbound: every lifecycle notification is published as JSON on
 * <prefix>/<event> (QoS 1, at-least-once).
 *
 * Inbound: <prefix>/in/speak carries a speak request and
 * <prefix>/in/event/<type> carries one live event, both JSON.
 */

#ifndef HERALD_MQTT_BRIDGE_H
#define HERALD_MQTT_BRIDGE_H

#include <mosquitto.h>

#include <atomic>
#include <functional>
#include <mutex>
#include <string>

#include "config/herald_config.h"
#include "events/event_trigger.h"
#include "network/notifier.h"
#include "pipeline/speech_pipeline.h"

namespace herald {

#define MQTT_QOS 1
#define MQTT_KEEPALIVE_SEC 60
#define MQTT_SPEAK_TOPIC "in/speak"
#define MQTT_EVENT_TOPIC "in/event/"

/**
 * {"text", "userId", "username", "voiceId", "engine", "source",
 *  "teamLevel", "priority": "high"|"normal"}
 * @return false if the payload is not a JSON object with a text field
 */
bool parse_speak_request(const std::string &json, SpeakRequest *out);

/**
 * {"userId", "username"|"uniqueId", "nickname", "giftName",
 *  "coins"|"diamondCount", "repeatCount", "likeCount"}
 */
bool parse_live_event(event_type_t type, const std::string &json, LiveEvent *out);

class MqttBridge : public NotificationSink {
 public:
   using SpeakHandler = std::function<void(const SpeakRequest &)>;
   using EventHandler = std::function<void(const LiveEvent &)>;

   MqttBridge(const mqtt_config_t &config, const secrets_config_t &secrets);
   ~MqttBridge() override;

   MqttBridge(const MqttBridge &) = delete;
   MqttBridge &operator=(const MqttBridge &) = delete;

   void set_speak_handler(SpeakHandler handler) { speak_handler_ = std::move(handler); }
   void set_event_handler(EventHandler handler) { event_handler_ = std::move(handler); }

   /**
    * Connect and start the network loop thread.
    * @return SUCCESS or FAILURE
    */
   int connect();
   void disconnect();
   bool is_connected() const { return connected_.load(); }

   void publish(const std::string &event, const std::string &payload_json) override;

   std::string topic_for(const std::string &event) const;

 private:
   static void on_connect(struct mosquitto *mosq, void *obj, int reason_code);
   static void on_disconnect(struct mosquitto *mosq, void *obj, int reason_code);
   static void on_message(struct mosquitto *mosq, void *obj, const struct mosquitto_message *msg);

   void handle_message(const std::string &topic, const std::string &payload);

   std::string broker_;
   int port_;
   std::string prefix_;
   std::string client_id_;
   std::string username_;
   std::string password_;

   std::mutex mutex_;
   struct mosquitto *mosq_ = nullptr;
   std::atomic<bool> connected_{ false };
   bool loop_started_ = false;

   SpeakHandler speak_handler_;
   EventHandler event_handler_;
};

}  // namespace herald

#endif  // HERALD_MQTT_BRIDGE_H
