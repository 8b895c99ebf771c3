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
 * Fakes and fixtures shared by the unit tests.
 */

#ifndef HERALD_TEST_HELPERS_H
#define HERALD_TEST_HELPERS_H

#include <json-c/json.h>

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "core/pipeline_config.h"
#include "network/frame_codec.h"
#include "network/http_client.h"
#include "network/notifier.h"
#include "network/stream_client.h"
#include "tts/tts_engine.h"

extern "C" {
#include "config/herald_config.h"
#include "store/user_db.h"
}

namespace herald {
namespace test {

/* =============================================================================
 * HTTP
 * ============================================================================= */

class FakeHttpClient : public HttpClient {
 public:
   HttpResponse perform(const HttpRequest &request) override {
      std::lock_guard<std::mutex> lock(mutex_);
      requests_.push_back(request);
      if (responses_.empty()) {
         HttpResponse ok;
         ok.status = 200;
         ok.body = "audio";
         return ok;
      }
      HttpResponse response = responses_.front();
      responses_.pop_front();
      return response;
   }

   void push(long status, const std::string &body) {
      HttpResponse response;
      response.status = status;
      response.body = body;
      std::lock_guard<std::mutex> lock(mutex_);
      responses_.push_back(response);
   }

   void push_timeout() {
      HttpResponse response;
      response.timed_out = true;
      std::lock_guard<std::mutex> lock(mutex_);
      responses_.push_back(response);
   }

   std::vector<HttpRequest> requests() {
      std::lock_guard<std::mutex> lock(mutex_);
      return requests_;
   }

 private:
   std::mutex mutex_;
   std::deque<HttpResponse> responses_;
   std::vector<HttpRequest> requests_;
};

/* =============================================================================
 * Live stream transport
 * ============================================================================= */

/* Shared between a FakeTransport and the test that scripted it */
struct TransportScript {
   bool connect_ok = true;
   std::string url;
   std::vector<std::string> headers;
   std::vector<FrameValue> sent;
   std::deque<std::vector<uint8_t>> inbound;
   bool hang_when_empty = false;  // TIMEOUT instead of CLOSED once drained
   int64_t *clock = nullptr;      // advanced by the receive timeout while hanging
   int connect_delay_ms = 0;      // connect() blocks this long unless interrupted
   std::atomic<bool> connecting{ false };
   std::atomic<bool> interrupted{ false };
   std::atomic<bool> closed{ false };

   void push(const FrameValue &frame) { inbound.push_back(frame_encode(frame)); }
};

inline FrameValue audio_frame(const std::vector<uint8_t> &bytes) {
   FrameValue frame = FrameValue::map({});
   frame.set("event", FrameValue::str("audio"));
   frame.set("audio", FrameValue::bin(bytes));
   return frame;
}

inline FrameValue finish_frame(const std::string &reason) {
   FrameValue frame = FrameValue::map({});
   frame.set("event", FrameValue::str("finish"));
   frame.set("reason", FrameValue::str(reason));
   return frame;
}

inline FrameValue event_frame(const std::string &event, const std::string &message) {
   FrameValue frame = FrameValue::map({});
   frame.set("event", FrameValue::str(event));
   frame.set("message", FrameValue::str(message));
   return frame;
}

class FakeTransport : public StreamTransport {
 public:
   explicit FakeTransport(std::shared_ptr<TransportScript> script) : script_(std::move(script)) {}

   bool connect(const std::string &url,
                const std::vector<std::string> &headers,
                std::string *error) override {
      script_->url = url;
      script_->headers = headers;
      script_->connecting.store(true);
      auto deadline =
          std::chrono::steady_clock::now() + std::chrono::milliseconds(script_->connect_delay_ms);
      while (std::chrono::steady_clock::now() < deadline) {
         if (script_->interrupted.load()) {
            if (error) {
               *error = "interrupted";
            }
            return false;
         }
         std::this_thread::sleep_for(std::chrono::milliseconds(2));
      }
      if (!script_->connect_ok && error) {
         *error = "refused";
      }
      return script_->connect_ok;
   }

   bool send_binary(const std::vector<uint8_t> &frame) override {
      FrameValue value;
      if (!frame_decode(frame.data(), frame.size(), &value, nullptr)) {
         return false;
      }
      script_->sent.push_back(value);
      return true;
   }

   TransportStatus receive(std::vector<uint8_t> *frame, int timeout_ms) override {
      if (script_->interrupted.load()) {
         return TransportStatus::CLOSED;
      }
      if (script_->inbound.empty()) {
         if (script_->hang_when_empty) {
            if (script_->clock) {
               *script_->clock += timeout_ms;
            } else {
               std::this_thread::sleep_for(std::chrono::milliseconds(2));
            }
            return TransportStatus::TIMEOUT;
         }
         return TransportStatus::CLOSED;
      }
      *frame = script_->inbound.front();
      script_->inbound.pop_front();
      return TransportStatus::OK;
   }

   void interrupt() override { script_->interrupted.store(true); }
   void close() override { script_->closed.store(true); }

 private:
   std::shared_ptr<TransportScript> script_;
};

/* =============================================================================
 * Engine
 * ============================================================================= */

/**
 * Scripted adapter registered under a real engine id so that fallback
 * chains and streaming selection see it.
 */
class FakeEngine : public TtsEngine {
 public:
   explicit FakeEngine(const std::string &engine_id,
                       int latency_ms = 0,
                       bool fail = false)
       : TtsEngine("Fake " + engine_id, "test-key", EngineSettings(),
                   std::make_shared<FakeHttpClient>()),
         id_(engine_id),
         latency_ms_(latency_ms),
         fail_(fail) {}

   const std::string &id() const override { return id_; }

   AudioBuffer synthesize(const std::string &text,
                          const std::string &voice_id,
                          const SynthesisOptions &options) override {
      (void)options;
      calls_++;
      {
         std::lock_guard<std::mutex> lock(mutex_);
         texts_.push_back(text);
         voices_.push_back(voice_id);
      }
      if (latency_ms_ > 0) {
         std::this_thread::sleep_for(std::chrono::milliseconds(latency_ms_));
      }
      completed_++;
      if (fail_) {
         throw TtsError(HERALD_ERR_SYNTHESIS, id_ + " unavailable");
      }
      return AudioBuffer{ 'I', 'D', '3' };
   }

   const VoiceMap &get_voices() const override {
      static const VoiceMap voices = {
         { "fake-de", { "Fake DE", "de", "female", "", "" } },
         { "fake-en", { "Fake EN", "en", "male", "", "" } },
      };
      return voices;
   }

   std::string get_default_voice_for_language(const std::string &lang) const override {
      return lang == "en" ? "fake-en" : "fake-de";
   }

   bool supports_streaming() const override { return script_ != nullptr; }

   std::unique_ptr<StreamSession> open_stream(const std::string &text,
                                              const std::string &voice_id,
                                              const SynthesisOptions &options) override {
      (void)options;
      if (!script_) {
         return TtsEngine::open_stream(text, voice_id, options);
      }
      std::unique_ptr<StreamSession> session =
          std::make_unique<StreamSession>(std::make_unique<FakeTransport>(script_), StreamConfig());
      StreamParams params;
      params.reference_id = voice_id;
      session->prepare(params, text);
      return session;
   }

   void set_stream_script(std::shared_ptr<TransportScript> script) { script_ = std::move(script); }

   int calls() const { return calls_.load(); }

   /* Calls that have returned or thrown */
   int completed() const { return completed_.load(); }

   std::vector<std::string> texts() {
      std::lock_guard<std::mutex> lock(mutex_);
      return texts_;
   }

   std::vector<std::string> voices() {
      std::lock_guard<std::mutex> lock(mutex_);
      return voices_;
   }

 private:
   std::string id_;
   int latency_ms_;
   bool fail_;
   std::shared_ptr<TransportScript> script_;
   std::atomic<int> calls_{ 0 };
   std::atomic<int> completed_{ 0 };
   std::mutex mutex_;
   std::vector<std::string> texts_;
   std::vector<std::string> voices_;
};

/* =============================================================================
 * Notifications
 * ============================================================================= */

class RecordingSink : public NotificationSink {
 public:
   void publish(const std::string &event, const std::string &payload_json) override {
      std::lock_guard<std::mutex> lock(mutex_);
      events_.emplace_back(event, payload_json);
   }

   std::vector<std::pair<std::string, std::string>> events() {
      std::lock_guard<std::mutex> lock(mutex_);
      return events_;
   }

   size_t count(const std::string &event) {
      std::lock_guard<std::mutex> lock(mutex_);
      size_t n = 0;
      for (const auto &e : events_) {
         if (e.first == event) {
            n++;
         }
      }
      return n;
   }

   /* Payloads of one event type, in publish order */
   std::vector<std::string> payloads(const std::string &event) {
      std::lock_guard<std::mutex> lock(mutex_);
      std::vector<std::string> out;
      for (const auto &e : events_) {
         if (e.first == event) {
            out.push_back(e.second);
         }
      }
      return out;
   }

   bool wait_for(const std::string &event, size_t n, int timeout_ms) {
      auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
      while (std::chrono::steady_clock::now() < deadline) {
         if (count(event) >= n) {
            return true;
         }
         std::this_thread::sleep_for(std::chrono::milliseconds(5));
      }
      return count(event) >= n;
   }

   void clear() {
      std::lock_guard<std::mutex> lock(mutex_);
      events_.clear();
   }

 private:
   std::mutex mutex_;
   std::vector<std::pair<std::string, std::string>> events_;
};

/* String field of a JSON payload; empty when absent */
inline std::string json_field(const std::string &payload, const char *key) {
   std::string out;
   struct json_object *root = json_tokener_parse(payload.c_str());
   struct json_object *value = NULL;
   if (root && json_object_object_get_ex(root, key, &value) && value) {
      out = json_object_get_string(value);
   }
   if (root) {
      json_object_put(root);
   }
   return out;
}

/* =============================================================================
 * Fixtures
 * ============================================================================= */

/**
 * Snapshot with timing shrunk for tests: no playback padding and no
 * per-character estimate unless a test asks for it.
 */
inline std::shared_ptr<PipelineConfig> test_config() {
   std::shared_ptr<PipelineConfig> config = std::make_shared<PipelineConfig>();
   config->default_engine = "tiktok";
   config->default_voice = "fake-de";
   config->profanity = PROFANITY_OFF;
   config->playback_ms_per_char = 0;
   config->playback_buffer_ms = 0;
   config->pregen_await_ms = 500;
   return config;
}

/**
 * Opens the process-wide user store in memory for the test's lifetime.
 */
class UserDbFixture {
 public:
   UserDbFixture() { ok_ = user_db_init(USER_DB_MEMORY) == USER_DB_SUCCESS; }
   ~UserDbFixture() { user_db_shutdown(); }

   UserDbFixture(const UserDbFixture &) = delete;
   UserDbFixture &operator=(const UserDbFixture &) = delete;

   bool ok() const { return ok_; }

 private:
   bool ok_ = false;
};

/* Polls until pred() holds or timeout_ms passes */
template <typename Pred>
bool eventually(Pred pred, int timeout_ms) {
   auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
   while (std::chrono::steady_clock::now() < deadline) {
      if (pred()) {
         return true;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
   }
   return pred();
}

}  // namespace test
}  // namespace herald

#endif  // HERALD_TEST_HELPERS_H
