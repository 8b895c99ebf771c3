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
 * HERALD Configuration System - Main configuration struct definitions
 *
 * Thread Safety: A loaded configuration is treated as immutable. The daemon
 * hands components a shared, const snapshot and swaps the whole snapshot on
 * reload; nothing mutates a published instance.
 */

#ifndef HERALD_CONFIG_H
#define HERALD_CONFIG_H

#include <stdbool.h>
#include <stddef.h>

#include "events/event_type.h"

#ifdef __cplusplus
extern "C" {
#endif

/* =============================================================================
 * Buffer Size Constants
 * ============================================================================= */
#define CONFIG_PATH_MAX 256
#define CONFIG_NAME_MAX 64
#define CONFIG_ENGINE_MAX 32
#define CONFIG_TEMPLATE_MAX 256
#define CONFIG_API_KEY_MAX 256
#define CONFIG_CREDENTIAL_MAX 64

#define CONFIG_PREFIX_FILTER_MAX 8  /* Chat prefixes that suppress speech */
#define CONFIG_PREFIX_ENTRY_MAX 16
#define CONFIG_GIFT_RULES_MAX 16    /* Specific gift-name triggers */
#define CONFIG_GIFT_TIERS 4         /* tier1..tier4 */
#define CONFIG_REMINDERS_MAX 8      /* Periodic reminder messages */
#define SECRETS_MAX_ENTRIES 32

/* =============================================================================
 * General Configuration
 * ============================================================================= */
typedef struct {
   char log_file[CONFIG_PATH_MAX];      /* Empty = stdout, or path */
   char database_path[CONFIG_PATH_MAX]; /* SQLite user/settings store */
} general_config_t;

/* =============================================================================
 * TTS Configuration
 * ============================================================================= */
typedef struct {
   bool enabled;                                 /* Global switch; never bypassed */
   char default_engine[CONFIG_ENGINE_MAX];       /* "tiktok", "fishaudio", ... */
   char default_voice[CONFIG_NAME_MAX];          /* Voice id for default_engine */
   int volume;                                   /* Base volume 0-100 */
   float speed;                                  /* Playback speed multiplier */
   char performance_mode[16];                    /* "fast", "balanced", "quality" */
   int max_text_length;                          /* Characters before truncation */
   bool strip_emojis;                            /* Remove emoji before synthesis */
   bool announce_username;                       /* Prefix chat with "<user> sagt: " */
   char prefix_filter[CONFIG_PREFIX_FILTER_MAX][CONFIG_PREFIX_ENTRY_MAX];
   int prefix_filter_count;                      /* Entries used in prefix_filter */
   char profanity_filter[16];                    /* "off", "moderate", "strict" */
   char fallback_language[8];                    /* Language for fallback voices */
   bool enable_auto_fallback;                    /* Walk fallback chain on failure */
   char default_fishaudio_emotion[CONFIG_NAME_MAX]; /* Emotion marker for Fish.audio */
} tts_config_t;

/* =============================================================================
 * Permissions Configuration
 * ============================================================================= */
typedef struct {
   bool allow_all;     /* Allow users without an explicit record */
   int team_min_level; /* Minimum team/rank level when allow_all is set */
} permissions_config_t;

/* =============================================================================
 * Queue Configuration
 * ============================================================================= */
typedef struct {
   int max_queue_size;       /* Reject with queue_full beyond this */
   int rate_limit;           /* Requests per user per window */
   int rate_limit_window_sec;
   int pregen_lookahead;     /* Items ahead of playback to synthesize */
   int pregen_await_ms;      /* Wait for an in-flight pre-generation at dequeue */
   int dedup_window_sec;     /* Same user + same text inside this is a duplicate */
   int playback_ms_per_char; /* Duration estimate per character */
   int playback_buffer_ms;   /* Added to every duration estimate */
   int synthesis_timeout_ms; /* Upper bound for one on-demand synthesis (0 = engine default) */
} queue_config_t;

/* =============================================================================
 * Streaming Configuration
 * ============================================================================= */
typedef struct {
   char endpoint[CONFIG_PATH_MAX]; /* wss:// URL of the live TTS endpoint */
   char model[CONFIG_NAME_MAX];    /* Model header sent during handshake */
   int session_timeout_ms;         /* Abort if no finish/error within this */
} streaming_config_t;

/* =============================================================================
 * Event TTS Configuration
 * ============================================================================= */
typedef struct {
   bool enabled;
   char template_text[CONFIG_TEMPLATE_MAX]; /* Placeholders: {username}, {giftName}, ... */
   int cooldown_sec;                        /* 0 disables the cooldown */
   int min_value;                           /* min coins (gift) or min likes (like) */
} event_type_config_t;

typedef struct {
   bool enabled;
   char gift_name[CONFIG_NAME_MAX]; /* Matched case-insensitively */
   char template_text[CONFIG_TEMPLATE_MAX];
   char voice[CONFIG_NAME_MAX]; /* Empty = event default */
} gift_trigger_rule_t;

typedef struct {
   bool enabled;
   char template_text[CONFIG_TEMPLATE_MAX];
   char voice[CONFIG_NAME_MAX];
} gift_tier_config_t;

typedef struct {
   bool specific_gifts_enabled;
   gift_trigger_rule_t specific_gifts[CONFIG_GIFT_RULES_MAX];
   int specific_gift_count;

   bool tiered_gifts_enabled;
   gift_tier_config_t tiers[CONFIG_GIFT_TIERS]; /* >=1, >=10, >=100, >=1000 coins */

   bool top_gifter_enabled;
   char top_gifter_template[CONFIG_TEMPLATE_MAX];
   char top_gifter_voice[CONFIG_NAME_MAX];

   bool combo_enabled;
   int combo_threshold;  /* Gifts in a row before announcing */
   int combo_window_sec; /* Max gap between gifts in a streak */
   char combo_template[CONFIG_TEMPLATE_MAX];
   char combo_voice[CONFIG_NAME_MAX];

   bool reminder_enabled;
   int reminder_interval_min;
   char reminder_messages[CONFIG_REMINDERS_MAX][CONFIG_TEMPLATE_MAX];
   int reminder_count;
   char reminder_voice[CONFIG_NAME_MAX];
} events_advanced_config_t;

typedef struct {
   bool enabled;
   bool priority_over_chat;     /* Event speech jumps ahead of chat */
   int volume;                  /* 0-100 */
   char voice[CONFIG_NAME_MAX]; /* Empty = speak() default resolution */
   event_type_config_t types[EVENT_TYPE_COUNT];
   events_advanced_config_t advanced;
} events_config_t;

/* =============================================================================
 * MQTT Configuration
 * ============================================================================= */
typedef struct {
   bool enabled;
   char broker[CONFIG_PATH_MAX];
   int port;
   char topic_prefix[CONFIG_NAME_MAX]; /* Notifications go to <prefix>/<event> */
   char client_id[CONFIG_NAME_MAX];
} mqtt_config_t;

/* =============================================================================
 * Secrets Configuration (loaded separately from secrets.toml)
 *
 * Provider credentials are kept as named settings so that credential
 * resolution can walk a list of candidate keys.
 * ============================================================================= */
typedef struct {
   char key[CONFIG_NAME_MAX];
   char value[CONFIG_API_KEY_MAX];
} secret_entry_t;

typedef struct {
   secret_entry_t entries[SECRETS_MAX_ENTRIES];
   int count;
   char mqtt_username[CONFIG_CREDENTIAL_MAX];
   char mqtt_password[CONFIG_CREDENTIAL_MAX];
} secrets_config_t;

/* =============================================================================
 * Main Configuration Struct
 * ============================================================================= */
typedef struct {
   general_config_t general;
   tts_config_t tts;
   permissions_config_t permissions;
   queue_config_t queue;
   streaming_config_t streaming;
   events_config_t events;
   mqtt_config_t mqtt;
} herald_config_t;

/* =============================================================================
 * Configuration API
 * ============================================================================= */

/**
 * @brief Initialize config with default values
 *
 * Sets all fields to their compile-time defaults. Call this before parsing
 * any config files to ensure all values have sensible defaults.
 *
 * @param config Config struct to initialize
 */
void config_set_defaults(herald_config_t *config);

/**
 * @brief Initialize secrets with empty values
 */
void config_set_secrets_defaults(secrets_config_t *secrets);

/**
 * @brief Look up a named secret
 *
 * @return The stored value, or NULL if the key is not present
 */
const char *secrets_get(const secrets_config_t *secrets, const char *key);

/**
 * @brief Insert or replace a named secret
 *
 * @return 0 on success, 1 if the table is full or arguments are invalid
 */
int secrets_set(secrets_config_t *secrets, const char *key, const char *value);

#ifdef __cplusplus
}
#endif

#endif /* HERALD_CONFIG_H */
