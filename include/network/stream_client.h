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
 * Live TTS streaming session over a framed duplex transport.
 *
 * One session carries one utterance:
 *
 *   outbound: start -> text... -> flush -> stop
 *   inbound:  audio... -> finish        (or error)
 *
 * Audio is surfaced as a finite lazy sequence via next(): zero or more
 * CHUNK events, then exactly one terminal END or ERROR event. Calling
 * next() after the terminal event returns the same terminal event again.
 */

#ifndef HERALD_STREAM_CLIENT_H
#define HERALD_STREAM_CLIENT_H

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "core/herald_status.h"

namespace herald {

class FrameValue;

/* =============================================================================
 * Transport
 * ============================================================================= */

enum class TransportStatus { OK, TIMEOUT, CLOSED, ERROR };

/**
 * Message-oriented duplex transport (one binary message per frame).
 *
 * Only interrupt() may be called from a thread other than the one driving
 * the session; it makes a blocked receive() return CLOSED promptly.
 */
class StreamTransport {
 public:
   virtual ~StreamTransport() = default;

   virtual bool connect(const std::string &url,
                        const std::vector<std::string> &headers,
                        std::string *error) = 0;
   virtual bool send_binary(const std::vector<uint8_t> &frame) = 0;
   virtual TransportStatus receive(std::vector<uint8_t> *frame, int timeout_ms) = 0;
   virtual void interrupt() = 0;
   virtual void close() = 0;
};

using TransportFactory = std::function<std::unique_ptr<StreamTransport>()>;

/**
 * libwebsockets client transport.
 */
std::unique_ptr<StreamTransport> make_lws_transport();

/* =============================================================================
 * Session
 * ============================================================================= */

struct StreamConfig {
   std::string url = "wss://api.fish.audio/v1/tts/live";
   std::string api_key;
   std::string model = "s1";
   int timeout_ms = 30000;  // Whole-session bound
};

struct StreamParams {
   std::string reference_id;
   std::string format = "mp3";
   std::string latency = "balanced";
   int mp3_bitrate = 128;
   bool normalize = true;
   int chunk_length = 200;  // Max characters per outbound text event
};

struct StreamEvent {
   enum class Kind { CHUNK, END, ERROR };

   Kind kind = Kind::ERROR;
   std::string chunk;  // base64 audio (CHUNK)
   size_t bytes = 0;   // decoded size of this chunk (CHUNK)
   bool is_first = false;
   std::string format;                      // END
   herald_status_t status = HERALD_OK;      // ERROR
   std::string message;                     // ERROR
};

struct StreamResult {
   size_t chunks = 0;
   std::string format;
   size_t total_bytes = 0;
};

class StreamSession {
 public:
   using Clock = std::function<int64_t()>;  // milliseconds, monotonic

   StreamSession(std::unique_ptr<StreamTransport> transport,
                 StreamConfig config,
                 Clock clock = Clock());
   ~StreamSession();

   StreamSession(const StreamSession &) = delete;
   StreamSession &operator=(const StreamSession &) = delete;

   /**
    * Record the utterance for start(). No network I/O.
    */
   void prepare(const StreamParams &params, const std::string &text);

   /**
    * Connect and send start, text, flush, stop for the prepared utterance.
    * cancel() from another thread aborts a connect or send in progress.
    * @throws TtsError (HERALD_ERR_SYNTHESIS) if the connection or a send
    *         fails or the session was cancelled; HERALD_ERR_INVALID_PARAM if
    *         not prepared or already started
    */
   void start();

   /* prepare() followed by start() */
   void start(const StreamParams &params, const std::string &text);

   /**
    * Next event of the sequence. Blocks until a frame arrives, the session
    * deadline passes (ERROR/HERALD_ERR_TIMEOUT) or cancel() is called.
    */
   StreamEvent next();

   /**
    * Abort the session. Thread-safe; a pending next() returns ERROR.
    */
   void cancel();

   bool done() const { return terminal_set_; }
   bool cancelled() const { return cancelled_.load(); }
   size_t chunk_count() const { return chunk_count_; }
   size_t total_bytes() const { return total_bytes_; }
   const std::string &format() const { return format_; }

 private:
   StreamEvent finish_with(StreamEvent event);
   bool send_frame(const FrameValue &frame);
   std::vector<std::string> split_text(const std::string &text, size_t max_chars) const;

   std::unique_ptr<StreamTransport> transport_;
   StreamConfig config_;
   Clock clock_;
   std::string format_;
   StreamParams params_;
   std::string text_;
   int64_t deadline_ms_ = 0;
   bool prepared_ = false;
   bool started_ = false;
   bool terminal_set_ = false;
   StreamEvent terminal_;
   size_t chunk_count_ = 0;
   size_t total_bytes_ = 0;
   std::atomic<bool> cancelled_{ false };
};

/**
 * Callback adapter over next(): drains the session, invoking on_chunk per
 * audio frame in arrival order and on_end once on completion.
 *
 * @throws TtsError with HERALD_ERR_SYNTHESIS or HERALD_ERR_TIMEOUT
 */
StreamResult stream_synthesize(StreamSession &session,
                               const std::function<void(const StreamEvent &)> &on_chunk,
                               const std::function<void(const StreamResult &)> &on_end);

}  // namespace herald

#endif  // HERALD_STREAM_CLIENT_H
