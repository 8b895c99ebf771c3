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
 * HERALD daemon entry point.
 */

#include "herald.h"

#include <getopt.h>
#include <signal.h>
#include <stdio.h>
#include <string.h>
#include <unistd.h>

#include <memory>
#include <string>

#include "core/encoding.h"
#include "core/pipeline_config.h"
#include "events/event_trigger.h"
#include "network/mqtt_bridge.h"
#include "network/notifier.h"
#include "pipeline/permission_gate.h"
#include "pipeline/speech_pipeline.h"
#include "pipeline/tts_queue.h"
#include "tts/engine_registry.h"

extern "C" {
#include "config/config_env.h"
#include "config/config_parser.h"
#include "config/config_validate.h"
#include "logging.h"
#include "store/user_db.h"
}

#define MAX_CONFIG_ERRORS 32

static volatile sig_atomic_t quit = 0;

sig_atomic_t get_quit(void) {
   return quit;
}

void herald_request_quit(void) {
   quit = 1;
}

static void signal_handler(int signal) {
   (void)signal;
   quit = 1;
}

static void print_usage(const char *prog) {
   printf("Usage: %s [options]\n\n", prog);
   printf("Options:\n");
   printf("  -c, --config=PATH    Configuration file (default: search herald.toml)\n");
   printf("  -d, --dump-config    Print the effective configuration and exit\n");
   printf("  -s, --say=TEXT       Queue a manual announcement after startup\n");
   printf("  -v, --version        Print version and exit\n");
   printf("  -h, --help           Show this help\n");
}

int main(int argc, char *argv[]) {
   const char *config_path = NULL;
   const char *say_text = NULL;
   int dump_config = 0;

   static struct option long_options[] = { { "config", required_argument, 0, 'c' },
                                           { "dump-config", no_argument, 0, 'd' },
                                           { "say", required_argument, 0, 's' },
                                           { "version", no_argument, 0, 'v' },
                                           { "help", no_argument, 0, 'h' },
                                           { 0, 0, 0, 0 } };

   int opt;
   while ((opt = getopt_long(argc, argv, "c:ds:vh", long_options, NULL)) != -1) {
      switch (opt) {
         case 'c':
            config_path = optarg;
            break;
         case 'd':
            dump_config = 1;
            break;
         case 's':
            say_text = optarg;
            break;
         case 'v':
            printf("%s %s\n", APPLICATION_NAME, HERALD_VERSION);
            return SUCCESS;
         case 'h':
            print_usage(argv[0]);
            return SUCCESS;
         default:
            print_usage(argv[0]);
            return FAILURE;
      }
   }

   /* Configuration */
   static herald_config_t config;
   static secrets_config_t secrets;
   config_set_defaults(&config);
   config_set_secrets_defaults(&secrets);

   if (config_load_from_search(config_path, &config) != 0 && config_path) {
      fprintf(stderr, "Failed to load configuration from %s\n", config_path);
      return FAILURE;
   }
   config_load_secrets_from_search(&secrets);
   config_apply_env(&config, &secrets);

   config_error_t errors[MAX_CONFIG_ERRORS];
   int error_count = config_validate(&config, &secrets, errors, MAX_CONFIG_ERRORS);
   if (error_count > 0) {
      config_print_errors(errors, error_count);
      return FAILURE;
   }

   if (dump_config) {
      config_dump(&config);
      return SUCCESS;
   }

   if (logging_init(config.general.log_file) != 0) {
      fprintf(stderr, "Could not open log file %s, logging to stdout\n", config.general.log_file);
   }
   LOG_INFO("%s %s starting (config: %s)", APPLICATION_NAME, HERALD_VERSION,
            config_get_loaded_path());

   struct sigaction action;
   memset(&action, 0, sizeof(action));
   action.sa_handler = signal_handler;
   sigemptyset(&action.sa_mask);
   sigaction(SIGINT, &action, NULL);
   sigaction(SIGTERM, &action, NULL);

   if (!herald::encoding_init()) {
      logging_close();
      return FAILURE;
   }

   if (user_db_init(config.general.database_path) != USER_DB_SUCCESS) {
      LOG_ERROR("Failed to open user database %s", config.general.database_path);
      logging_close();
      return FAILURE;
   }

   /* Pipeline */
   herald::PipelineConfigPtr snapshot = herald::make_pipeline_config(config);

   std::shared_ptr<herald::EngineRegistry> engines = std::make_shared<herald::EngineRegistry>();
   if (engines->load(*snapshot, secrets, nullptr) == 0) {
      LOG_WARNING("Starting without TTS engines; requests will be rejected");
   }

   std::shared_ptr<herald::FanoutSink> sink = std::make_shared<herald::FanoutSink>();
   std::shared_ptr<herald::MqttBridge> mqtt;
   if (config.mqtt.enabled) {
      mqtt = std::make_shared<herald::MqttBridge>(config.mqtt, secrets);
      sink->add(mqtt);
   }

   std::shared_ptr<herald::PermissionGate> gate = std::make_shared<herald::PermissionGate>(snapshot);
   std::shared_ptr<herald::TtsQueue> queue = std::make_shared<herald::TtsQueue>(snapshot, engines,
                                                                                sink);
   std::shared_ptr<herald::SpeechPipeline> pipeline =
       std::make_shared<herald::SpeechPipeline>(snapshot, engines, queue, gate, sink);
   std::shared_ptr<herald::EventTrigger> events =
       std::make_shared<herald::EventTrigger>(pipeline, gate);

   if (mqtt) {
      mqtt->set_speak_handler([pipeline](const herald::SpeakRequest &request) {
         herald::SpeakResult result = pipeline->speak(request);
         if (!result.success()) {
            LOG_INFO("Speak request from %s not queued: %s", request.username.c_str(),
                     result.reason());
         }
      });
      mqtt->set_event_handler([events](const herald::LiveEvent &event) { events->handle(event); });
      if (mqtt->connect() != SUCCESS) {
         LOG_WARNING("MQTT unavailable, notifications will not be delivered");
      }
   }

   if (queue->start_processing() != SUCCESS) {
      LOG_ERROR("Failed to start TTS queue");
      if (mqtt) {
         mqtt->disconnect();
      }
      user_db_shutdown();
      logging_close();
      return FAILURE;
   }
   if (events->start() != SUCCESS) {
      LOG_WARNING("Periodic reminders unavailable");
   }

   if (say_text) {
      herald::SpeakRequest request;
      request.text = say_text;
      request.user_id = APPLICATION_NAME;
      request.username = APPLICATION_NAME;
      request.source = HERALD_SOURCE_MANUAL;
      herald::SpeakResult result = pipeline->speak(request);
      if (!result.success()) {
         LOG_WARNING("Announcement not queued: %s", result.reason());
      }
   }

   LOG_INFO("%s ready", APPLICATION_NAME);
   while (!get_quit()) {
      sleep(1);
   }

   LOG_INFO("Shutting down");
   events->stop();
   queue->stop_processing();
   if (mqtt) {
      mqtt->disconnect();
   }

   herald::QueueStats stats = queue->stats();
   LOG_INFO("Played %llu of %llu queued, pre-generation hits %llu / misses %llu / errors %llu",
            (unsigned long long)stats.total_played, (unsigned long long)stats.total_queued,
            (unsigned long long)stats.pregen_hits, (unsigned long long)stats.pregen_misses,
            (unsigned long long)stats.pregen_errors);

   user_db_shutdown();
   logging_close();
   return SUCCESS;
}
