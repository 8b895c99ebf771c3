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
 * TTS queue manager and playback coordinator.
 *
 * Two worker threads share one ordered queue:
 *
 *   playback thread  - dequeues in priority-then-FIFO order, obtains audio
 *                      (pre-generated, awaited, on-demand or streamed) and
 *                      publishes the playback lifecycle; strictly one item
 *                      is "now playing"
 *   pre-gen thread   - schedules synthesis for up to pregen_lookahead
 *                      items ahead of the playback cursor, one provider
 *                      call at a time
 *
 * Provider calls (pre-generation and on-demand) run on detached workers
 * that hold their own references to the item, so neither thread ever
 * blocks on a provider. An item's audio is written at most once, by
 * whichever call lands first. Clearing or stopping cancels the open stream
 * and returns without waiting for outstanding calls; a result that lands
 * for an item that is gone is dropped.
 */

#ifndef HERALD_TTS_QUEUE_H
#define HERALD_TTS_QUEUE_H

#include <pthread.h>

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "core/herald_status.h"
#include "core/pipeline_config.h"
#include "core/rate_limiter.h"
#include "network/notifier.h"
#include "tts/engine_registry.h"

namespace herald {

#define QUEUE_DEDUP_MAX_ENTRIES 500
#define QUEUE_AVG_ITEM_MS 5000
#define QUEUE_RATE_LIMIT_SLOTS 1024

enum class Priority { NORMAL = 0, HIGH = 1 };

const char *priority_name(Priority priority);

/**
 * A request as handed to the queue. text is never modified after enqueue.
 */
struct QueueItem {
   std::string id;  // assigned by enqueue()
   std::string user_id;
   std::string username;
   std::string text;
   std::string voice_id;
   std::string engine_id;
   bool is_streaming = false;
   SynthesisOptions options;
   double volume = 80.0;  // config volume x user gain
   float speed = 1.0f;
   Priority priority = Priority::NORMAL;
   std::string source = "chat";
   int64_t enqueued_at_ms = 0;  // assigned by enqueue()
   bool bypass_duplicate_filter = false;
};

struct EnqueueResult {
   herald_status_t status = HERALD_OK;
   std::string id;
   size_t position = 0;           // 1-based
   size_t queue_size = 0;
   int64_t estimated_wait_ms = 0;
   int64_t retry_after_ms = 0;    // HERALD_ERR_RATE_LIMITED only

   bool ok() const { return status == HERALD_OK; }
};

struct QueueStats {
   uint64_t total_queued = 0;
   uint64_t total_played = 0;
   uint64_t total_dropped = 0;
   uint64_t total_rate_limited = 0;
   uint64_t total_duplicates_blocked = 0;
   uint64_t pregen_hits = 0;
   uint64_t pregen_misses = 0;
   uint64_t pregen_errors = 0;
   size_t queue_length = 0;
   bool pregen_in_flight = false;

   /* Hit percentage, or -1 when nothing has been played yet */
   double hit_rate() const;
};

struct QueueItemInfo {
   std::string id;
   std::string username;
   std::string text;  // first 50 characters
   std::string source;
   Priority priority = Priority::NORMAL;
   size_t position = 0;
   bool has_audio = false;
   bool pregenerating = false;
   int64_t estimated_wait_ms = 0;
};

struct QueueInfo {
   size_t size = 0;
   size_t max_size = 0;
   bool processing = false;
   bool has_current = false;
   QueueItemInfo current;
   std::vector<QueueItemInfo> items;
};

/**
 * Playback duration estimate: ceil(chars * ms_per_char / speed) + buffer.
 */
int64_t estimate_duration_ms(const std::string &text,
                             float speed,
                             long ms_per_char,
                             long buffer_ms);

class TtsQueue {
 public:
   using Clock = std::function<int64_t()>;  // milliseconds

   TtsQueue(PipelineConfigPtr config,
            std::shared_ptr<EngineRegistry> engines,
            std::shared_ptr<NotificationSink> sink,
            Clock clock = Clock());
   ~TtsQueue();

   TtsQueue(const TtsQueue &) = delete;
   TtsQueue &operator=(const TtsQueue &) = delete;

   /**
    * Admission: duplicate filter, queue size, per-user rate limit
    * (system sources exempt). Publishes queue:item_added on success.
    */
   EnqueueResult enqueue(QueueItem item);

   /**
    * Drop every waiting item, cancel the current stream, abandon in-flight
    * pre-generation, clear the duplicate cache and reset the statistics.
    * @return Number of waiting items removed
    */
   size_t clear();

   bool remove(const std::string &id);

   /**
    * End the current item early (stream cancelled, playback wait cut short).
    */
   bool skip_current();

   QueueInfo info() const;
   QueueStats stats() const;
   void reset_stats();

   void clear_user_rate_limit(const std::string &user_id);
   void clear_all_rate_limits();

   /**
    * Start the playback and pre-generation threads.
    * @return SUCCESS, or FAILURE if a thread could not be created
    */
   int start_processing();

   /**
    * Stop both threads. Provider calls still running are not awaited.
    * Waiting items stay queued and keep any audio that lands for them.
    */
   void stop_processing();

   bool is_processing() const { return running_.load(); }

   void set_config(PipelineConfigPtr config);

   /**
    * Synthesize on the item's engine, walking the fallback chain when
    * enable_auto_fallback is set.
    * @throws TtsError from the last engine tried
    */
   AudioBuffer synthesize(const QueueItem &item);

   struct Entry;

 private:
   struct Link;
   struct SynthesisJob;

   static void *playback_thread_entry(void *arg);
   static void *pregen_thread_entry(void *arg);
   static void *synthesis_thread_entry(void *arg);
   void playback_loop();
   void pregen_loop();

   bool launch_synthesis_locked(const std::shared_ptr<Entry> &entry, bool pregen);
   void finish_synthesis(const std::shared_ptr<Entry> &entry,
                         bool pregen,
                         bool ok,
                         AudioBuffer audio,
                         const std::string &error);
   bool cancelled_locked(const Entry &entry) const;

   void play_entry(const std::shared_ptr<Entry> &entry);
   bool play_streaming(const std::shared_ptr<Entry> &entry, const PipelineConfigPtr &config);
   void wait_playback_locked(int64_t duration_ms);
   bool timed_wait_locked(int64_t timeout_ms);

   void publish_started(const QueueItem &item, int64_t duration_ms, const AudioBuffer *audio);
   void publish_ended(const std::string &id);
   void publish_error(const std::string &id, const std::string &message);

   std::shared_ptr<Entry> next_pregen_candidate_locked(size_t lookahead) const;
   bool is_duplicate_locked(const std::string &key, int64_t now);
   QueueItemInfo describe_locked(const Entry &entry, size_t position) const;
   PipelineConfigPtr config_snapshot() const;

   mutable pthread_mutex_t mutex_;
   pthread_cond_t cond_;

   PipelineConfigPtr config_;
   std::shared_ptr<EngineRegistry> engines_;
   std::shared_ptr<NotificationSink> sink_;
   Clock clock_;

   std::deque<std::shared_ptr<Entry>> queue_;
   std::shared_ptr<Entry> current_;
   StreamSession *current_stream_ = nullptr;
   bool skip_requested_ = false;
   uint64_t next_seq_ = 0;

   std::map<std::string, int64_t> recent_;  // dedup key -> first seen
   std::deque<std::string> recent_order_;

   rate_limiter_t limiter_;
   std::vector<rate_limit_entry_t> limiter_entries_;

   QueueStats stats_;
   std::shared_ptr<Entry> pregen_entry_;  // item with a pre-generation call in flight

   std::shared_ptr<Link> link_;  // lets detached workers outlive the queue

   std::atomic<bool> running_{ false };
   bool threads_started_ = false;
   pthread_t playback_thread_;
   pthread_t pregen_thread_;
};

}  // namespace herald

#endif  // HERALD_TTS_QUEUE_H
