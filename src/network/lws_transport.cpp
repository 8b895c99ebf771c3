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
 * libwebsockets client transport for live TTS sessions.
 *
 * The context is serviced on the caller's thread: connect(), send_binary()
 * and receive() each pump lws_service() until their condition is met or
 * the timeout passes. interrupt() only sets a flag and wakes the loop with
 * lws_cancel_service(), which is the one lws call safe from another thread.
 */

#include <libwebsockets.h>

#include <atomic>
#include <chrono>
#include <cstring>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>

#include "network/stream_client.h"

extern "C" {
#include "logging.h"
}

namespace herald {

namespace {

#define LWS_SERVICE_SLICE_MS 10
#define LWS_CONNECT_TIMEOUT_MS 10000
#define LWS_MAX_MESSAGE_BYTES (8 * 1024 * 1024)

int64_t now_ms() {
   return std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::steady_clock::now().time_since_epoch())
       .count();
}

class LwsTransport : public StreamTransport {
 public:
   LwsTransport() = default;
   ~LwsTransport() override { close(); }

   bool connect(const std::string &url,
                const std::vector<std::string> &headers,
                std::string *error) override;
   bool send_binary(const std::vector<uint8_t> &frame) override;
   TransportStatus receive(std::vector<uint8_t> *frame, int timeout_ms) override;
   void interrupt() override;
   void close() override;

   static int callback(struct lws *wsi,
                       enum lws_callback_reasons reason,
                       void *user,
                       void *in,
                       size_t len);

 private:
   int on_event(struct lws *wsi, enum lws_callback_reasons reason, void *in, size_t len);
   bool pump_until(const std::function<bool()> &done, int timeout_ms);

   struct lws_context *context_ = nullptr;
   struct lws *wsi_ = nullptr;
   std::vector<std::string> headers_;

   bool connected_ = false;
   bool closed_ = false;
   bool failed_ = false;
   std::string fail_reason_;

   std::deque<std::vector<uint8_t>> outbox_;
   std::deque<std::vector<uint8_t>> inbox_;
   std::vector<uint8_t> partial_;

   std::atomic<bool> interrupted_{ false };
   std::mutex context_mutex_;  // guards context_ against interrupt() during close()
};

const struct lws_protocols k_protocols[] = {
   { "herald-tts-live", LwsTransport::callback, 0, 4096, 0, nullptr, 0 },
   LWS_PROTOCOL_LIST_TERM,
};

int LwsTransport::callback(struct lws *wsi,
                           enum lws_callback_reasons reason,
                           void *user,
                           void *in,
                           size_t len) {
   (void)user;
   struct lws_context *ctx = lws_get_context(wsi);
   LwsTransport *self = ctx ? static_cast<LwsTransport *>(lws_context_user(ctx)) : nullptr;
   if (!self) {
      return lws_callback_http_dummy(wsi, reason, user, in, len);
   }
   return self->on_event(wsi, reason, in, len);
}

int LwsTransport::on_event(struct lws *wsi,
                           enum lws_callback_reasons reason,
                           void *in,
                           size_t len) {
   switch (reason) {
      case LWS_CALLBACK_CLIENT_APPEND_HANDSHAKE_HEADER: {
         unsigned char **p = (unsigned char **)in;
         unsigned char *end = (*p) + len;
         for (const auto &h : headers_) {
            size_t colon = h.find(':');
            if (colon == std::string::npos) {
               continue;
            }
            // lws expects the name including the trailing colon
            std::string name = h.substr(0, colon + 1);
            std::string value = h.substr(colon + 1);
            size_t first = value.find_first_not_of(' ');
            value = (first == std::string::npos) ? "" : value.substr(first);
            if (lws_add_http_header_by_name(wsi, (const unsigned char *)name.c_str(),
                                            (const unsigned char *)value.c_str(),
                                            (int)value.size(), p, end)) {
               return -1;
            }
         }
         break;
      }

      case LWS_CALLBACK_CLIENT_ESTABLISHED:
         connected_ = true;
         break;

      case LWS_CALLBACK_CLIENT_CONNECTION_ERROR:
         failed_ = true;
         fail_reason_ = in ? std::string((const char *)in, len) : "connection error";
         wsi_ = nullptr;
         break;

      case LWS_CALLBACK_CLIENT_RECEIVE: {
         const uint8_t *data = (const uint8_t *)in;
         if (partial_.size() + len > LWS_MAX_MESSAGE_BYTES) {
            failed_ = true;
            fail_reason_ = "message too large";
            return -1;
         }
         partial_.insert(partial_.end(), data, data + len);
         if (lws_is_final_fragment(wsi) && lws_remaining_packet_payload(wsi) == 0) {
            inbox_.push_back(std::move(partial_));
            partial_.clear();
         }
         break;
      }

      case LWS_CALLBACK_CLIENT_WRITEABLE: {
         if (outbox_.empty()) {
            break;
         }
         std::vector<uint8_t> &msg = outbox_.front();
         std::vector<unsigned char> buf(LWS_PRE + msg.size());
         if (!msg.empty()) {
            std::memcpy(buf.data() + LWS_PRE, msg.data(), msg.size());
         }
         int n = lws_write(wsi, buf.data() + LWS_PRE, msg.size(), LWS_WRITE_BINARY);
         if (n < (int)msg.size()) {
            failed_ = true;
            fail_reason_ = "write failed";
            return -1;
         }
         outbox_.pop_front();
         if (!outbox_.empty()) {
            lws_callback_on_writable(wsi);
         }
         break;
      }

      case LWS_CALLBACK_CLIENT_CLOSED:
      case LWS_CALLBACK_WSI_DESTROY:
         closed_ = true;
         wsi_ = nullptr;
         break;

      default:
         break;
   }
   return 0;
}

bool LwsTransport::pump_until(const std::function<bool()> &done, int timeout_ms) {
   int64_t deadline = now_ms() + timeout_ms;
   while (!done()) {
      if (interrupted_.load() || failed_ || !context_) {
         return false;
      }
      if (now_ms() >= deadline) {
         return false;
      }
      lws_service(context_, LWS_SERVICE_SLICE_MS);
   }
   return true;
}

bool LwsTransport::connect(const std::string &url,
                           const std::vector<std::string> &headers,
                           std::string *error) {
   if (context_) {
      if (error) {
         *error = "already connected";
      }
      return false;
   }

   headers_ = headers;

   // lws_parse_uri modifies its input
   std::vector<char> uri(url.begin(), url.end());
   uri.push_back('\0');
   const char *scheme = nullptr;
   const char *address = nullptr;
   const char *path = nullptr;
   int port = 0;
   if (lws_parse_uri(uri.data(), &scheme, &address, &port, &path)) {
      if (error) {
         *error = "invalid url";
      }
      return false;
   }
   bool use_tls = strcmp(scheme, "wss") == 0 || strcmp(scheme, "https") == 0;
   std::string full_path = std::string("/") + path;

   struct lws_context_creation_info info;
   std::memset(&info, 0, sizeof(info));
   info.port = CONTEXT_PORT_NO_LISTEN;
   info.protocols = k_protocols;
   info.options = LWS_SERVER_OPTION_DO_SSL_GLOBAL_INIT;
   info.user = this;

   {
      std::lock_guard<std::mutex> lock(context_mutex_);
      context_ = lws_create_context(&info);
   }
   if (!context_) {
      if (error) {
         *error = "lws_create_context failed";
      }
      return false;
   }

   struct lws_client_connect_info ci;
   std::memset(&ci, 0, sizeof(ci));
   ci.context = context_;
   ci.address = address;
   ci.port = port;
   ci.path = full_path.c_str();
   ci.host = address;
   ci.origin = address;
   ci.ssl_connection = use_tls ? LCCSCF_USE_SSL : 0;
   ci.protocol = nullptr;
   ci.local_protocol_name = k_protocols[0].name;
   ci.pwsi = &wsi_;

   if (!lws_client_connect_via_info(&ci)) {
      if (error) {
         *error = "lws_client_connect_via_info failed";
      }
      close();
      return false;
   }

   if (!pump_until([this] { return connected_; }, LWS_CONNECT_TIMEOUT_MS)) {
      if (error) {
         *error = failed_ ? fail_reason_ : (interrupted_.load() ? "interrupted" : "timeout");
      }
      close();
      return false;
   }
   return true;
}

bool LwsTransport::send_binary(const std::vector<uint8_t> &frame) {
   if (!context_ || !wsi_ || closed_) {
      return false;
   }
   outbox_.push_back(frame);
   lws_callback_on_writable(wsi_);
   return pump_until([this] { return outbox_.empty() || closed_; }, LWS_CONNECT_TIMEOUT_MS) &&
          !closed_;
}

TransportStatus LwsTransport::receive(std::vector<uint8_t> *frame, int timeout_ms) {
   if (!inbox_.empty()) {
      *frame = std::move(inbox_.front());
      inbox_.pop_front();
      return TransportStatus::OK;
   }
   if (!context_ || closed_ || interrupted_.load()) {
      return TransportStatus::CLOSED;
   }

   pump_until([this] { return !inbox_.empty() || closed_; }, timeout_ms);
   if (!inbox_.empty()) {
      *frame = std::move(inbox_.front());
      inbox_.pop_front();
      return TransportStatus::OK;
   }
   if (failed_) {
      LOG_WARNING("Stream transport failed: %s", fail_reason_.c_str());
      return TransportStatus::ERROR;
   }
   if (closed_ || interrupted_.load()) {
      return TransportStatus::CLOSED;
   }
   return TransportStatus::TIMEOUT;
}

void LwsTransport::interrupt() {
   interrupted_.store(true);
   std::lock_guard<std::mutex> lock(context_mutex_);
   if (context_) {
      lws_cancel_service(context_);
   }
}

void LwsTransport::close() {
   std::lock_guard<std::mutex> lock(context_mutex_);
   if (context_) {
      lws_context_destroy(context_);
      context_ = nullptr;
   }
   wsi_ = nullptr;
   closed_ = true;
   outbox_.clear();
}

}  // namespace

std::unique_ptr<StreamTransport> make_lws_transport() {
   return std::make_unique<LwsTransport>();
}

}  // namespace herald
