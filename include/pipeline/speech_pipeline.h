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
 * Speak pipeline: text preparation, gating and voice resolution in front of
 * the queue. Every producer (chat, events, previews, manual announcements)
 * enters here.
 */

#ifndef HERALD_SPEECH_PIPELINE_H
#define HERALD_SPEECH_PIPELINE_H

#include <memory>
#include <mutex>
#include <string>

#include "core/herald_status.h"
#include "core/pipeline_config.h"
#include "herald.h"
#include "network/notifier.h"
#include "pipeline/permission_gate.h"
#include "pipeline/tts_queue.h"
#include "tts/engine_registry.h"

namespace herald {

struct SpeakRequest {
   std::string text;
   std::string user_id;
   std::string username;
   std::string voice_id;   // empty = resolve
   std::string engine_id;  // empty = resolve
   std::string source = HERALD_SOURCE_CHAT;
   int team_level = 0;
   Priority priority = Priority::NORMAL;
   int volume = -1;  // 0-100, -1 = [tts] volume
   bool bypass_duplicate_filter = false;
};

struct SpeakResult {
   herald_status_t status = HERALD_OK;
   std::string id;
   size_t position = 0;
   int64_t estimated_wait_ms = 0;
   int64_t retry_after_ms = 0;  // rate limit or cooldown remaining
   std::string engine_id;
   std::string voice_id;

   bool success() const { return status == HERALD_OK; }
   const char *reason() const { return herald_status_name(status); }
};

class SpeechPipeline {
 public:
   SpeechPipeline(PipelineConfigPtr config,
                  std::shared_ptr<EngineRegistry> engines,
                  std::shared_ptr<TtsQueue> queue,
                  std::shared_ptr<PermissionGate> gate,
                  std::shared_ptr<NotificationSink> sink);

   /**
    * Prepare, gate and enqueue one request. Policy rejections come back
    * in the result; nothing here throws for them.
    */
   SpeakResult speak(const SpeakRequest &request);

   /**
    * Store a per-user gain clamped to [0.0, 3.0] and publish
    * user:gain_updated.
    * @param stored_out Receives the clamped gain (may be NULL)
    */
   herald_status_t set_user_gain(const std::string &user_id, double gain, double *stored_out);

   /**
    * Swap the configuration snapshot on this pipeline, its queue and gate.
    */
   void set_config(PipelineConfigPtr config);

   PipelineConfigPtr config() const;

 private:
   /**
    * Filters and truncation. Returns HERALD_OK with text replaced, or the
    * rejection status.
    */
   herald_status_t prepare_text(const PipelineConfig &config,
                                const SpeakRequest &request,
                                std::string &text) const;

   mutable std::mutex mutex_;
   PipelineConfigPtr config_;
   std::shared_ptr<EngineRegistry> engines_;
   std::shared_ptr<TtsQueue> queue_;
   std::shared_ptr<PermissionGate> gate_;
   std::shared_ptr<NotificationSink> sink_;
};

}  // namespace herald

#endif  // HERALD_SPEECH_PIPELINE_H
