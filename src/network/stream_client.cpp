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
 * Live TTS streaming session.
 */

#include "network/stream_client.h"

#include <chrono>

#include "core/encoding.h"
#include "network/frame_codec.h"
#include "tts/tts_error.h"

extern "C" {
#include "logging.h"
}

namespace herald {

namespace {

int64_t steady_now_ms() {
   return std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::steady_clock::now().time_since_epoch())
       .count();
}

StreamEvent make_error(herald_status_t status, const std::string &message) {
   StreamEvent ev;
   ev.kind = StreamEvent::Kind::ERROR;
   ev.status = status;
   ev.message = message;
   return ev;
}

}  // namespace

StreamSession::StreamSession(std::unique_ptr<StreamTransport> transport,
                             StreamConfig config,
                             Clock clock)
    : transport_(std::move(transport)), config_(std::move(config)), clock_(std::move(clock)) {
   if (!clock_) {
      clock_ = steady_now_ms;
   }
}

StreamSession::~StreamSession() {
   if (transport_) {
      transport_->close();
   }
}

bool StreamSession::send_frame(const FrameValue &frame) {
   return transport_->send_binary(frame_encode(frame));
}

std::vector<std::string> StreamSession::split_text(const std::string &text,
                                                   size_t max_chars) const {
   std::vector<std::string> chunks;
   if (max_chars == 0 || text.size() <= max_chars) {
      chunks.push_back(text);
      return chunks;
   }

   size_t pos = 0;
   while (pos < text.size()) {
      size_t end = pos + max_chars;
      if (end >= text.size()) {
         chunks.push_back(text.substr(pos));
         break;
      }
      // Prefer a space boundary; never split inside a UTF-8 sequence
      size_t cut = text.rfind(' ', end);
      if (cut == std::string::npos || cut <= pos) {
         cut = end;
         while (cut > pos && ((unsigned char)text[cut] & 0xC0) == 0x80) {
            cut--;
         }
         if (cut == pos) {
            cut = end;
         }
      } else {
         cut++;  // keep the space with the preceding chunk
      }
      chunks.push_back(text.substr(pos, cut - pos));
      pos = cut;
   }
   return chunks;
}

void StreamSession::prepare(const StreamParams &params, const std::string &text) {
   params_ = params;
   text_ = text;
   format_ = params.format;
   prepared_ = true;
}

void StreamSession::start(const StreamParams &params, const std::string &text) {
   if (started_) {
      throw TtsError(HERALD_ERR_INVALID_PARAM, "stream session already started");
   }
   prepare(params, text);
   start();
}

void StreamSession::start() {
   if (started_) {
      throw TtsError(HERALD_ERR_INVALID_PARAM, "stream session already started");
   }
   if (!prepared_) {
      throw TtsError(HERALD_ERR_INVALID_PARAM, "stream session not prepared");
   }
   if (!transport_) {
      throw TtsError(HERALD_ERR_SYNTHESIS, "stream session has no transport");
   }
   started_ = true;
   deadline_ms_ = clock_() + config_.timeout_ms;
   const StreamParams &params = params_;

   if (cancelled_.load()) {
      finish_with(make_error(HERALD_ERR_SYNTHESIS, "cancelled"));
      throw TtsError(HERALD_ERR_SYNTHESIS, "streaming session cancelled");
   }

   std::vector<std::string> headers;
   headers.push_back("Authorization: Bearer " + config_.api_key);
   headers.push_back("model: " + config_.model);

   std::string error;
   if (!transport_->connect(config_.url, headers, &error)) {
      if (cancelled_.load()) {
         finish_with(make_error(HERALD_ERR_SYNTHESIS, "cancelled"));
         throw TtsError(HERALD_ERR_SYNTHESIS, "streaming session cancelled");
      }
      LOG_WARNING("Stream: connect to %s failed: %s", config_.url.c_str(), error.c_str());
      finish_with(make_error(HERALD_ERR_SYNTHESIS, "connect failed: " + error));
      throw TtsError(HERALD_ERR_SYNTHESIS, "streaming connection failed: " + error);
   }

   FrameValue request = FrameValue::map({});
   request.set("text", FrameValue::str(""));
   request.set("reference_id", FrameValue::str(params.reference_id));
   request.set("format", FrameValue::str(params.format));
   if (params.format == "mp3") {
      request.set("mp3_bitrate", FrameValue::integer(params.mp3_bitrate));
   }
   request.set("normalize", FrameValue::boolean(params.normalize));
   request.set("latency", FrameValue::str(params.latency));
   request.set("chunk_length", FrameValue::integer(params.chunk_length));

   FrameValue start = FrameValue::map({});
   start.set("event", FrameValue::str("start"));
   start.set("request", request);

   bool ok = send_frame(start);
   for (const auto &chunk : split_text(text_, (size_t)params.chunk_length)) {
      if (!ok || cancelled_.load()) {
         break;
      }
      FrameValue frame = FrameValue::map({});
      frame.set("event", FrameValue::str("text"));
      frame.set("text", FrameValue::str(chunk));
      ok = send_frame(frame);
   }
   if (ok && !cancelled_.load()) {
      FrameValue flush = FrameValue::map({});
      flush.set("event", FrameValue::str("flush"));
      ok = send_frame(flush);
   }
   if (ok && !cancelled_.load()) {
      FrameValue stop = FrameValue::map({});
      stop.set("event", FrameValue::str("stop"));
      ok = send_frame(stop);
   }

   if (cancelled_.load()) {
      finish_with(make_error(HERALD_ERR_SYNTHESIS, "cancelled"));
      throw TtsError(HERALD_ERR_SYNTHESIS, "streaming session cancelled");
   }
   if (!ok) {
      finish_with(make_error(HERALD_ERR_SYNTHESIS, "send failed"));
      throw TtsError(HERALD_ERR_SYNTHESIS, "streaming send failed");
   }
}

StreamEvent StreamSession::finish_with(StreamEvent event) {
   if (!terminal_set_) {
      terminal_ = std::move(event);
      terminal_set_ = true;
      if (transport_) {
         transport_->close();
      }
   }
   return terminal_;
}

StreamEvent StreamSession::next() {
   if (terminal_set_) {
      return terminal_;
   }
   if (!started_) {
      return finish_with(make_error(HERALD_ERR_INVALID_PARAM, "session not started"));
   }

   for (;;) {
      if (cancelled_.load()) {
         return finish_with(make_error(HERALD_ERR_SYNTHESIS, "cancelled"));
      }

      int64_t remaining = deadline_ms_ - clock_();
      if (remaining <= 0) {
         LOG_WARNING("Stream: session timed out after %d ms", config_.timeout_ms);
         return finish_with(make_error(HERALD_ERR_TIMEOUT, "streaming session timed out"));
      }

      std::vector<uint8_t> raw;
      TransportStatus status = transport_->receive(&raw, (int)remaining);

      if (status == TransportStatus::TIMEOUT) {
         continue;  // deadline check above decides
      }
      if (status == TransportStatus::CLOSED) {
         if (cancelled_.load()) {
            return finish_with(make_error(HERALD_ERR_SYNTHESIS, "cancelled"));
         }
         return finish_with(
             make_error(HERALD_ERR_SYNTHESIS, "connection closed before finish"));
      }
      if (status == TransportStatus::ERROR) {
         return finish_with(make_error(HERALD_ERR_SYNTHESIS, "transport error"));
      }

      FrameValue frame;
      std::string decode_error;
      if (!frame_decode(raw.data(), raw.size(), &frame, &decode_error)) {
         return finish_with(
             make_error(HERALD_ERR_SYNTHESIS, "malformed frame: " + decode_error));
      }

      std::string event = frame.get_str("event");
      if (event == "audio") {
         const FrameValue *audio = frame.find("audio");
         if (!audio || audio->type() != FrameValue::Type::BIN) {
            return finish_with(make_error(HERALD_ERR_SYNTHESIS, "audio frame without payload"));
         }
         StreamEvent ev;
         ev.kind = StreamEvent::Kind::CHUNK;
         ev.chunk = base64_encode(audio->as_bin());
         ev.bytes = audio->as_bin().size();
         ev.is_first = (chunk_count_ == 0);
         chunk_count_++;
         total_bytes_ += ev.bytes;
         return ev;
      }
      if (event == "finish") {
         std::string reason = frame.get_str("reason", "stop");
         if (reason == "error") {
            return finish_with(make_error(HERALD_ERR_SYNTHESIS, "provider finished with error"));
         }
         StreamEvent ev;
         ev.kind = StreamEvent::Kind::END;
         ev.format = format_;
         return finish_with(ev);
      }
      if (event == "error") {
         std::string message = frame.get_str("message", frame.get_str("error", "provider error"));
         return finish_with(make_error(HERALD_ERR_SYNTHESIS, message));
      }
      if (event == "log") {
         LOG_INFO("Stream: provider log: %s", frame.get_str("message").c_str());
         continue;
      }
      LOG_WARNING("Stream: ignoring unknown event '%s'", event.c_str());
   }
}

void StreamSession::cancel() {
   cancelled_.store(true);
   if (transport_) {
      transport_->interrupt();
   }
}

StreamResult stream_synthesize(StreamSession &session,
                               const std::function<void(const StreamEvent &)> &on_chunk,
                               const std::function<void(const StreamResult &)> &on_end) {
   for (;;) {
      StreamEvent ev = session.next();
      switch (ev.kind) {
         case StreamEvent::Kind::CHUNK:
            if (on_chunk) {
               on_chunk(ev);
            }
            break;
         case StreamEvent::Kind::END: {
            StreamResult result;
            result.chunks = session.chunk_count();
            result.format = ev.format;
            result.total_bytes = session.total_bytes();
            if (on_end) {
               on_end(result);
            }
            return result;
         }
         case StreamEvent::Kind::ERROR:
            throw TtsError(ev.status, ev.message);
      }
   }
}

}  // namespace herald
