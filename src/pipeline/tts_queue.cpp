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
 */

#include "pipeline/tts_queue.h"

#include <errno.h>
#include <string.h>
#include <time.h>

#include <cctype>
#include <chrono>
#include <cmath>

#include "core/encoding.h"
#include "herald.h"
#include "pipeline/permission_gate.h"

extern "C" {
#include "core/string_utils.h"
#include "logging.h"
}

namespace herald {

namespace {

#define QUEUE_IDLE_WAIT_MS 500

enum class PregenState { NONE, IN_FLIGHT, DONE, FAILED };

int64_t wall_now_ms() {
   return std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::system_clock::now().time_since_epoch())
       .count();
}

int64_t mono_now_ms() {
   return std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::steady_clock::now().time_since_epoch())
       .count();
}

/* Lowercase, trimmed, inner whitespace collapsed */
std::string normalize_for_dedup(const std::string &text) {
   std::string out;
   out.reserve(text.size());
   bool pending_space = false;
   for (unsigned char c : text) {
      if (isspace(c)) {
         pending_space = !out.empty();
         continue;
      }
      if (pending_space) {
         out += ' ';
         pending_space = false;
      }
      out += (char)tolower(c);
   }
   return out;
}

std::string preview_text(const std::string &text, size_t max_chars) {
   size_t offset = utf8_offset(text.c_str(), max_chars);
   return text.substr(0, offset);
}

/*
 * Synthesize on the item's engine, then on its fallback chain.
 * Only reads the registry and the snapshot, so detached workers can call it.
 */
AudioBuffer synthesize_with_fallback(const EngineRegistry &engines,
                                     const PipelineConfig &config,
                                     const QueueItem &item) {
   std::vector<std::string> candidates = { item.engine_id };
   if (config.auto_fallback) {
      for (const auto &id : fallback_chain(item.engine_id)) {
         candidates.push_back(id);
      }
   }

   herald_status_t last_status = HERALD_ERR_NOT_FOUND;
   std::string last_error = "engine not available: " + item.engine_id;

   for (size_t i = 0; i < candidates.size(); i++) {
      std::shared_ptr<TtsEngine> engine = engines.get(candidates[i]);
      if (!engine) {
         continue;
      }
      std::string voice = (i == 0) ? item.voice_id
                                   : engine->get_default_voice_for_language(
                                         config.fallback_language);
      try {
         AudioBuffer audio = engine->synthesize(item.text, voice, item.options);
         if (i > 0) {
            LOG_WARNING("Queue: %s failed, used fallback %s (%s)", item.engine_id.c_str(),
                        candidates[i].c_str(), voice.c_str());
         }
         return audio;
      } catch (const TtsError &e) {
         last_status = e.status();
         last_error = e.what();
         LOG_WARNING("Queue: synthesis on %s failed: %s", candidates[i].c_str(), e.what());
      }
   }
   throw TtsError(last_status, last_error);
}

}  // namespace

struct TtsQueue::Entry {
   QueueItem item;
   uint64_t seq = 0;
   AudioBuffer audio;
   bool has_audio = false;
   PregenState pregen = PregenState::NONE;
   bool synthesizing = false;  // on-demand call in flight
   bool synthesis_failed = false;
   std::string synthesis_error;
   bool abandoned = false;  // cleared or removed; late results are dropped
};

/* Cleared to nullptr when the queue is destroyed; guards owner */
struct TtsQueue::Link {
   pthread_mutex_t mutex = PTHREAD_MUTEX_INITIALIZER;
   TtsQueue *owner = nullptr;
};

struct TtsQueue::SynthesisJob {
   std::shared_ptr<Link> link;
   std::shared_ptr<Entry> entry;
   std::shared_ptr<EngineRegistry> engines;
   PipelineConfigPtr config;
   bool pregen = false;
};

const char *priority_name(Priority priority) {
   return priority == Priority::HIGH ? "high" : "normal";
}

double QueueStats::hit_rate() const {
   uint64_t total = pregen_hits + pregen_misses;
   return total ? (double)pregen_hits * 100.0 / (double)total : -1.0;
}

int64_t estimate_duration_ms(const std::string &text,
                             float speed,
                             long ms_per_char,
                             long buffer_ms) {
   if (speed <= 0.0f) {
      speed = 1.0f;
   }
   size_t chars = utf8_strlen(text.c_str());
   double speech = std::ceil((double)chars * (double)ms_per_char / (double)speed);
   return (int64_t)speech + buffer_ms;
}

/* =============================================================================
 * Construction
 * ============================================================================= */

TtsQueue::TtsQueue(PipelineConfigPtr config,
                   std::shared_ptr<EngineRegistry> engines,
                   std::shared_ptr<NotificationSink> sink,
                   Clock clock)
    : config_(std::move(config)),
      engines_(std::move(engines)),
      sink_(std::move(sink)),
      clock_(std::move(clock)),
      limiter_entries_(QUEUE_RATE_LIMIT_SLOTS),
      link_(std::make_shared<Link>()) {
   link_->owner = this;
   if (!clock_) {
      clock_ = wall_now_ms;
   }
   if (!sink_) {
      sink_ = std::make_shared<NullSink>();
   }
   if (!engines_) {
      engines_ = std::make_shared<EngineRegistry>();
   }
   if (!encoding_init()) {
      LOG_ERROR("Queue: libsodium initialization failed, item ids will be weak");
   }

   pthread_mutex_init(&mutex_, NULL);
   pthread_condattr_t attr;
   pthread_condattr_init(&attr);
   pthread_condattr_setclock(&attr, CLOCK_MONOTONIC);
   pthread_cond_init(&cond_, &attr);
   pthread_condattr_destroy(&attr);

   rate_limiter_config_t rl = { config_->rate_limit, config_->rate_limit_window_ms,
                                QUEUE_RATE_LIMIT_SLOTS };
   rate_limiter_init(&limiter_, limiter_entries_.data(), &rl);
}

TtsQueue::~TtsQueue() {
   stop_processing();

   // Workers still inside a provider call report to nobody from here on
   pthread_mutex_lock(&link_->mutex);
   link_->owner = nullptr;
   pthread_mutex_unlock(&link_->mutex);

   rate_limiter_destroy(&limiter_);
   pthread_cond_destroy(&cond_);
   pthread_mutex_destroy(&mutex_);
}

PipelineConfigPtr TtsQueue::config_snapshot() const {
   pthread_mutex_lock(&mutex_);
   PipelineConfigPtr config = config_;
   pthread_mutex_unlock(&mutex_);
   return config;
}

void TtsQueue::set_config(PipelineConfigPtr config) {
   if (!config) {
      return;
   }
   pthread_mutex_lock(&mutex_);
   config_ = config;
   pthread_cond_broadcast(&cond_);
   pthread_mutex_unlock(&mutex_);
   rate_limiter_reconfigure(&limiter_, config->rate_limit, config->rate_limit_window_ms);
}

bool TtsQueue::timed_wait_locked(int64_t timeout_ms) {
   if (timeout_ms <= 0) {
      return false;
   }
   struct timespec ts;
   clock_gettime(CLOCK_MONOTONIC, &ts);
   ts.tv_sec += timeout_ms / 1000;
   ts.tv_nsec += (timeout_ms % 1000) * 1000000L;
   if (ts.tv_nsec >= 1000000000L) {
      ts.tv_sec++;
      ts.tv_nsec -= 1000000000L;
   }
   return pthread_cond_timedwait(&cond_, &mutex_, &ts) != ETIMEDOUT;
}

/* =============================================================================
 * Admission
 * ============================================================================= */

bool TtsQueue::is_duplicate_locked(const std::string &key, int64_t now) {
   long window = config_->dedup_window_ms;
   if (window <= 0) {
      return false;
   }
   while (!recent_order_.empty()) {
      auto it = recent_.find(recent_order_.front());
      if (it == recent_.end()) {
         recent_order_.pop_front();
      } else if (now - it->second > window) {
         recent_.erase(it);
         recent_order_.pop_front();
      } else {
         break;
      }
   }
   return recent_.count(key) != 0;
}

EnqueueResult TtsQueue::enqueue(QueueItem item) {
   EnqueueResult result;
   if (trim_copy(item.text).empty()) {
      result.status = HERALD_ERR_EMPTY_TEXT;
      return result;
   }

   int64_t now = clock_();
   std::string dedup_key = item.user_id + "|" + normalize_for_dedup(item.text);

   pthread_mutex_lock(&mutex_);
   PipelineConfigPtr config = config_;

   if (!item.bypass_duplicate_filter && is_duplicate_locked(dedup_key, now)) {
      stats_.total_duplicates_blocked++;
      pthread_mutex_unlock(&mutex_);
      LOG_INFO("Queue: duplicate from %s blocked", item.username.c_str());
      result.status = HERALD_ERR_DUPLICATE;
      return result;
   }

   if (queue_.size() >= config->max_queue_size) {
      stats_.total_dropped++;
      result.queue_size = queue_.size();
      pthread_mutex_unlock(&mutex_);
      LOG_WARNING("Queue: full (%zu), dropping message from %s", config->max_queue_size,
                  item.username.c_str());
      result.status = HERALD_ERR_QUEUE_FULL;
      return result;
   }

   if (!is_system_source(item.source)) {
      int64_t retry_after = 0;
      if (rate_limiter_check(&limiter_, item.user_id.c_str(), now, &retry_after)) {
         stats_.total_rate_limited++;
         pthread_mutex_unlock(&mutex_);
         LOG_INFO("Queue: rate limit exceeded for %s (retry in %lld ms)", item.username.c_str(),
                  (long long)retry_after);
         result.status = HERALD_ERR_RATE_LIMITED;
         result.retry_after_ms = retry_after;
         return result;
      }
   }

   item.id = "tts_" + std::to_string(wall_now_ms()) + "_" + random_token(7);
   item.enqueued_at_ms = now;

   if (!item.bypass_duplicate_filter && config->dedup_window_ms > 0) {
      recent_[dedup_key] = now;
      recent_order_.push_back(dedup_key);
      while (recent_order_.size() > QUEUE_DEDUP_MAX_ENTRIES) {
         recent_.erase(recent_order_.front());
         recent_order_.pop_front();
      }
   }

   std::shared_ptr<Entry> entry = std::make_shared<Entry>();
   entry->item = std::move(item);
   entry->seq = next_seq_++;

   // High before normal; equal priorities keep arrival order
   auto pos = queue_.end();
   if (entry->item.priority == Priority::HIGH) {
      for (auto it = queue_.begin(); it != queue_.end(); ++it) {
         if ((*it)->item.priority == Priority::NORMAL) {
            pos = it;
            break;
         }
      }
   }
   pos = queue_.insert(pos, entry);

   result.id = entry->item.id;
   result.position = (size_t)(pos - queue_.begin()) + 1;
   result.queue_size = queue_.size();
   result.estimated_wait_ms = (int64_t)result.position * QUEUE_AVG_ITEM_MS;
   stats_.total_queued++;

   pthread_cond_broadcast(&cond_);
   pthread_mutex_unlock(&mutex_);

   LOG_INFO("Queue: \"%s\" from %s (%s, position %zu/%zu)",
            preview_text(entry->item.text, 30).c_str(), entry->item.username.c_str(),
            priority_name(entry->item.priority), result.position, result.queue_size);

   JsonPayload payload;
   payload.set("id", entry->item.id)
       .set("userId", entry->item.user_id)
       .set("username", entry->item.username)
       .set("source", entry->item.source)
       .set("priority", priority_name(entry->item.priority))
       .set("position", (int64_t)result.position);
   sink_->publish("queue:item_added", payload.str());

   return result;
}

/* =============================================================================
 * Queue Operations
 * ============================================================================= */

size_t TtsQueue::clear() {
   pthread_mutex_lock(&mutex_);
   size_t count = queue_.size();
   for (auto &entry : queue_) {
      entry->abandoned = true;
   }
   queue_.clear();
   if (current_) {
      current_->abandoned = true;
      skip_requested_ = true;
   }
   if (current_stream_) {
      current_stream_->cancel();
   }
   pregen_entry_.reset();
   recent_.clear();
   recent_order_.clear();
   stats_ = QueueStats();
   pthread_cond_broadcast(&cond_);
   pthread_mutex_unlock(&mutex_);

   LOG_INFO("Queue: cleared %zu items, pre-generation abandoned", count);

   JsonPayload payload;
   payload.set("count", (int64_t)count);
   sink_->publish("queue:cleared", payload.str());
   return count;
}

bool TtsQueue::remove(const std::string &id) {
   pthread_mutex_lock(&mutex_);
   for (auto it = queue_.begin(); it != queue_.end(); ++it) {
      if ((*it)->item.id == id) {
         (*it)->abandoned = true;
         queue_.erase(it);
         pthread_cond_broadcast(&cond_);
         pthread_mutex_unlock(&mutex_);
         LOG_INFO("Queue: removed %s", id.c_str());
         return true;
      }
   }
   pthread_mutex_unlock(&mutex_);
   return false;
}

bool TtsQueue::skip_current() {
   pthread_mutex_lock(&mutex_);
   if (!current_) {
      pthread_mutex_unlock(&mutex_);
      return false;
   }
   skip_requested_ = true;
   if (current_stream_) {
      current_stream_->cancel();
   }
   pthread_cond_broadcast(&cond_);
   std::string id = current_->item.id;
   pthread_mutex_unlock(&mutex_);

   LOG_INFO("Queue: skipped %s", id.c_str());
   return true;
}

QueueItemInfo TtsQueue::describe_locked(const Entry &entry, size_t position) const {
   QueueItemInfo info;
   info.id = entry.item.id;
   info.username = entry.item.username;
   info.text = preview_text(entry.item.text, 50);
   info.source = entry.item.source;
   info.priority = entry.item.priority;
   info.position = position;
   info.has_audio = entry.has_audio;
   info.pregenerating = entry.pregen == PregenState::IN_FLIGHT;
   info.estimated_wait_ms = (int64_t)position * QUEUE_AVG_ITEM_MS;
   return info;
}

QueueInfo TtsQueue::info() const {
   QueueInfo info;
   pthread_mutex_lock(&mutex_);
   info.size = queue_.size();
   info.max_size = config_->max_queue_size;
   info.processing = running_.load();
   if (current_) {
      info.has_current = true;
      info.current = describe_locked(*current_, 0);
   }
   for (size_t i = 0; i < queue_.size(); i++) {
      info.items.push_back(describe_locked(*queue_[i], i + 1));
   }
   pthread_mutex_unlock(&mutex_);
   return info;
}

QueueStats TtsQueue::stats() const {
   pthread_mutex_lock(&mutex_);
   QueueStats stats = stats_;
   stats.queue_length = queue_.size();
   stats.pregen_in_flight = pregen_entry_ != nullptr;
   pthread_mutex_unlock(&mutex_);
   return stats;
}

void TtsQueue::reset_stats() {
   pthread_mutex_lock(&mutex_);
   stats_ = QueueStats();
   pthread_mutex_unlock(&mutex_);
   LOG_INFO("Queue: statistics reset");
}

void TtsQueue::clear_user_rate_limit(const std::string &user_id) {
   rate_limiter_reset(&limiter_, user_id.c_str());
   LOG_INFO("Queue: rate limit cleared for %s", user_id.c_str());
}

void TtsQueue::clear_all_rate_limits() {
   rate_limiter_reset_all(&limiter_);
   LOG_INFO("Queue: all rate limits cleared");
}

/* =============================================================================
 * Synthesis
 * ============================================================================= */

AudioBuffer TtsQueue::synthesize(const QueueItem &item) {
   PipelineConfigPtr config = config_snapshot();
   return synthesize_with_fallback(*engines_, *config, item);
}

bool TtsQueue::launch_synthesis_locked(const std::shared_ptr<Entry> &entry, bool pregen) {
   std::unique_ptr<SynthesisJob> job = std::make_unique<SynthesisJob>();
   job->link = link_;
   job->entry = entry;
   job->engines = engines_;
   job->config = config_;
   job->pregen = pregen;

   pthread_attr_t attr;
   pthread_attr_init(&attr);
   pthread_attr_setdetachstate(&attr, PTHREAD_CREATE_DETACHED);
   pthread_t thread;
   int rc = pthread_create(&thread, &attr, synthesis_thread_entry, job.get());
   pthread_attr_destroy(&attr);
   if (rc != 0) {
      LOG_ERROR("Queue: failed to start synthesis for %s: %s", entry->item.id.c_str(),
                strerror(rc));
      return false;
   }
   job.release();  // owned by the worker now
   return true;
}

void *TtsQueue::synthesis_thread_entry(void *arg) {
   std::unique_ptr<SynthesisJob> job(static_cast<SynthesisJob *>(arg));

   AudioBuffer audio;
   bool ok = false;
   std::string error;
   try {
      audio = synthesize_with_fallback(*job->engines, *job->config, job->entry->item);
      ok = true;
   } catch (const std::exception &e) {
      error = e.what();
   }

   pthread_mutex_lock(&job->link->mutex);
   if (job->link->owner) {
      job->link->owner->finish_synthesis(job->entry, job->pregen, ok, std::move(audio), error);
   } else {
      LOG_INFO("Queue: synthesis for %s finished after shutdown, discarded",
               job->entry->item.id.c_str());
   }
   pthread_mutex_unlock(&job->link->mutex);
   return NULL;
}

void TtsQueue::finish_synthesis(const std::shared_ptr<Entry> &entry,
                                bool pregen,
                                bool ok,
                                AudioBuffer audio,
                                const std::string &error) {
   pthread_mutex_lock(&mutex_);
   if (pregen && pregen_entry_ == entry) {
      pregen_entry_.reset();
   }
   if (!pregen) {
      entry->synthesizing = false;
   }

   if (entry->abandoned) {
      LOG_INFO("Queue: synthesis for %s discarded, item gone", entry->item.id.c_str());
   } else if (ok) {
      if (!entry->has_audio) {
         entry->audio = std::move(audio);
         entry->has_audio = true;
      }
      if (pregen) {
         entry->pregen = PregenState::DONE;
      }
   } else if (pregen) {
      entry->pregen = PregenState::FAILED;
      stats_.pregen_errors++;
      LOG_WARNING("Queue: pre-generation for %s failed: %s", entry->item.id.c_str(),
                  error.c_str());
   } else {
      entry->synthesis_failed = true;
      entry->synthesis_error = error;
   }
   pthread_cond_broadcast(&cond_);
   pthread_mutex_unlock(&mutex_);
}

/* =============================================================================
 * Notifications
 * ============================================================================= */

void TtsQueue::publish_started(const QueueItem &item, int64_t duration_ms, const AudioBuffer *audio) {
   JsonPayload payload;
   payload.set("id", item.id)
       .set("userId", item.user_id)
       .set("username", item.username)
       .set("text", item.text)
       .set("source", item.source)
       .set("duration", duration_ms)
       .set("volume", item.volume)
       .set("speed", (double)item.speed)
       .set("isStreaming", audio == nullptr);
   if (audio) {
      payload.set("audio", base64_encode(*audio))
          .set("format", item.options.format.empty() ? "mp3" : item.options.format);
   }
   sink_->publish("playback:started", payload.str());
}

void TtsQueue::publish_ended(const std::string &id) {
   JsonPayload payload;
   payload.set("id", id);
   sink_->publish("playback:ended", payload.str());
}

void TtsQueue::publish_error(const std::string &id, const std::string &message) {
   JsonPayload payload;
   payload.set("id", id).set("error", message);
   sink_->publish("playback:error", payload.str());
}

/* =============================================================================
 * Worker Threads
 * ============================================================================= */

int TtsQueue::start_processing() {
   if (threads_started_) {
      LOG_WARNING("Queue: processing already started");
      return SUCCESS;
   }
   running_.store(true);

   int rc = pthread_create(&playback_thread_, NULL, playback_thread_entry, this);
   if (rc != 0) {
      LOG_ERROR("Queue: failed to create playback thread: %s", strerror(rc));
      running_.store(false);
      return FAILURE;
   }
   rc = pthread_create(&pregen_thread_, NULL, pregen_thread_entry, this);
   if (rc != 0) {
      LOG_ERROR("Queue: failed to create pre-generation thread: %s", strerror(rc));
      running_.store(false);
      pthread_mutex_lock(&mutex_);
      pthread_cond_broadcast(&cond_);
      pthread_mutex_unlock(&mutex_);
      pthread_join(playback_thread_, NULL);
      return FAILURE;
   }
   threads_started_ = true;
   LOG_INFO("Queue: processing started (pre-generation lookahead %zu)",
            config_snapshot()->pregen_lookahead);
   return SUCCESS;
}

void TtsQueue::stop_processing() {
   if (!threads_started_) {
      return;
   }
   running_.store(false);

   pthread_mutex_lock(&mutex_);
   if (current_stream_) {
      current_stream_->cancel();
   }
   pthread_cond_broadcast(&cond_);
   pthread_mutex_unlock(&mutex_);

   // Neither thread waits on a provider, so both exit promptly
   pthread_join(playback_thread_, NULL);
   pthread_join(pregen_thread_, NULL);
   threads_started_ = false;

   LOG_INFO("Queue: processing stopped");
}

void *TtsQueue::playback_thread_entry(void *arg) {
   static_cast<TtsQueue *>(arg)->playback_loop();
   return NULL;
}

void *TtsQueue::pregen_thread_entry(void *arg) {
   static_cast<TtsQueue *>(arg)->pregen_loop();
   return NULL;
}

void TtsQueue::playback_loop() {
   LOG_INFO("Queue: playback thread started");

   pthread_mutex_lock(&mutex_);
   while (running_.load()) {
      if (queue_.empty()) {
         timed_wait_locked(QUEUE_IDLE_WAIT_MS);
         continue;
      }
      std::shared_ptr<Entry> entry = queue_.front();
      queue_.pop_front();
      current_ = entry;
      skip_requested_ = false;
      pthread_cond_broadcast(&cond_);
      pthread_mutex_unlock(&mutex_);

      try {
         play_entry(entry);
      } catch (const std::exception &e) {
         LOG_ERROR("Queue: playback of %s failed: %s", entry->item.id.c_str(), e.what());
         publish_error(entry->item.id, e.what());
      }

      pthread_mutex_lock(&mutex_);
      current_.reset();
      skip_requested_ = false;
      pthread_cond_broadcast(&cond_);
   }
   pthread_mutex_unlock(&mutex_);

   LOG_INFO("Queue: playback thread exiting");
}

void TtsQueue::wait_playback_locked(int64_t duration_ms) {
   int64_t deadline = mono_now_ms() + duration_ms;
   while (running_.load() && !skip_requested_) {
      int64_t remaining = deadline - mono_now_ms();
      if (remaining <= 0) {
         break;
      }
      timed_wait_locked(remaining);
   }
}

bool TtsQueue::cancelled_locked(const Entry &entry) const {
   return entry.abandoned || skip_requested_ || !running_.load();
}

void TtsQueue::play_entry(const std::shared_ptr<Entry> &entry) {
   PipelineConfigPtr config = config_snapshot();
   const QueueItem &item = entry->item;

   if (item.is_streaming && play_streaming(entry, config)) {
      return;
   }

   pthread_mutex_lock(&mutex_);
   if (!item.is_streaming) {
      if (entry->has_audio) {
         stats_.pregen_hits++;
      } else {
         stats_.pregen_misses++;
         // Bounded wait for a pre-generation already in flight for this item
         if (entry->pregen == PregenState::IN_FLIGHT && config->pregen_await_ms > 0) {
            int64_t deadline = mono_now_ms() + config->pregen_await_ms;
            while (!entry->has_audio && entry->pregen == PregenState::IN_FLIGHT &&
                   !cancelled_locked(*entry)) {
               int64_t remaining = deadline - mono_now_ms();
               if (remaining <= 0 || !timed_wait_locked(remaining)) {
                  break;
               }
            }
         }
      }
   }

   if (!entry->has_audio && !cancelled_locked(*entry)) {
      if (!entry->synthesizing) {
         entry->synthesizing = true;
         if (!launch_synthesis_locked(entry, false)) {
            entry->synthesizing = false;
            entry->synthesis_failed = true;
            entry->synthesis_error = "could not start synthesis";
         }
      }
      while (!entry->has_audio && !entry->synthesis_failed && !cancelled_locked(*entry)) {
         timed_wait_locked(QUEUE_IDLE_WAIT_MS);
      }
   }

   bool cancelled = cancelled_locked(*entry);
   bool have_audio = entry->has_audio;
   AudioBuffer audio;
   if (!cancelled && have_audio) {
      audio = entry->audio;
   }
   std::string error = entry->synthesis_error;
   pthread_mutex_unlock(&mutex_);

   if (cancelled) {
      publish_ended(item.id);
      return;
   }
   if (!have_audio) {
      LOG_ERROR("Queue: dropping %s, synthesis failed: %s", item.id.c_str(), error.c_str());
      publish_error(item.id, error);
      return;
   }

   int64_t duration = estimate_duration_ms(item.text, item.speed, config->playback_ms_per_char,
                                           config->playback_buffer_ms);
   publish_started(item, duration, &audio);

   pthread_mutex_lock(&mutex_);
   wait_playback_locked(duration);
   if (!entry->abandoned) {
      stats_.total_played++;
   }
   pthread_mutex_unlock(&mutex_);

   publish_ended(item.id);
}

bool TtsQueue::play_streaming(const std::shared_ptr<Entry> &entry, const PipelineConfigPtr &config) {
   const QueueItem &item = entry->item;
   std::shared_ptr<TtsEngine> engine = engines_->get(item.engine_id);
   if (!engine || !engine->supports_streaming()) {
      return false;
   }

   std::unique_ptr<StreamSession> session;
   try {
      session = engine->open_stream(item.text, item.voice_id, item.options);
   } catch (const std::exception &e) {
      LOG_WARNING("Queue: stream for %s could not be created (%s), using full synthesis",
                  item.id.c_str(), e.what());
      return false;
   }

   // Reachable by clear/skip/stop before any network I/O starts
   pthread_mutex_lock(&mutex_);
   current_stream_ = session.get();
   if (cancelled_locked(*entry)) {
      session->cancel();
   }
   pthread_mutex_unlock(&mutex_);

   try {
      session->start();
   } catch (const std::exception &e) {
      pthread_mutex_lock(&mutex_);
      current_stream_ = nullptr;
      pthread_mutex_unlock(&mutex_);
      if (session->cancelled()) {
         publish_ended(item.id);
         return true;
      }
      LOG_WARNING("Queue: stream for %s failed to open (%s), using full synthesis",
                  item.id.c_str(), e.what());
      return false;
   }

   int64_t started_at = mono_now_ms();
   StreamEvent event = session->next();

   if (event.kind != StreamEvent::Kind::CHUNK) {
      pthread_mutex_lock(&mutex_);
      current_stream_ = nullptr;
      pthread_mutex_unlock(&mutex_);
      if (session->cancelled()) {
         publish_ended(item.id);
         return true;
      }
      LOG_WARNING("Queue: stream for %s produced no audio (%s), using full synthesis",
                  item.id.c_str(), event.message.c_str());
      return false;
   }

   int64_t duration = estimate_duration_ms(item.text, item.speed, config->playback_ms_per_char,
                                           config->playback_buffer_ms);
   publish_started(item, duration, nullptr);

   bool failed = false;
   for (;;) {
      if (event.kind == StreamEvent::Kind::CHUNK) {
         JsonPayload payload;
         payload.set("id", item.id)
             .set("chunk", event.chunk)
             .set("isFirst", event.is_first)
             .set("volume", item.volume)
             .set("speed", (double)item.speed);
         sink_->publish("stream:chunk", payload.str());
      } else if (event.kind == StreamEvent::Kind::END) {
         JsonPayload payload;
         payload.set("id", item.id).set("format", event.format);
         sink_->publish("stream:end", payload.str());
         break;
      } else {
         if (!session->cancelled()) {
            LOG_ERROR("Queue: stream for %s aborted: %s", item.id.c_str(), event.message.c_str());
            publish_error(item.id, event.message);
            failed = true;
         }
         break;
      }
      event = session->next();
   }

   pthread_mutex_lock(&mutex_);
   current_stream_ = nullptr;
   if (!failed) {
      wait_playback_locked(duration - (mono_now_ms() - started_at));
      if (!entry->abandoned) {
         stats_.total_played++;
      }
   }
   pthread_mutex_unlock(&mutex_);

   if (!failed) {
      publish_ended(item.id);
   }
   LOG_INFO("Queue: streamed %s (%zu chunks, %zu bytes)", item.id.c_str(), session->chunk_count(),
            session->total_bytes());
   return true;
}

std::shared_ptr<TtsQueue::Entry> TtsQueue::next_pregen_candidate_locked(size_t lookahead) const {
   size_t limit = lookahead < queue_.size() ? lookahead : queue_.size();
   for (size_t i = 0; i < limit; i++) {
      const std::shared_ptr<Entry> &entry = queue_[i];
      if (!entry->has_audio && !entry->item.is_streaming && entry->pregen == PregenState::NONE) {
         return entry;
      }
   }
   return nullptr;
}

void TtsQueue::pregen_loop() {
   LOG_INFO("Queue: pre-generation thread started");

   pthread_mutex_lock(&mutex_);
   while (running_.load()) {
      std::shared_ptr<Entry> entry;
      if (!pregen_entry_) {
         entry = next_pregen_candidate_locked(config_->pregen_lookahead);
      }
      if (!entry) {
         timed_wait_locked(QUEUE_IDLE_WAIT_MS);
         continue;
      }
      entry->pregen = PregenState::IN_FLIGHT;
      if (launch_synthesis_locked(entry, true)) {
         pregen_entry_ = entry;
      } else {
         entry->pregen = PregenState::FAILED;
         stats_.pregen_errors++;
      }
   }
   pthread_mutex_unlock(&mutex_);

   LOG_INFO("Queue: pre-generation thread exiting");
}

}  // namespace herald
