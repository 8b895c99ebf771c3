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
 * TTS user database interface.
 * Provides SQLite-backed storage for per-user TTS permissions, voice
 * assignments, volume gain, and scalar settings (credentials, cooldowns).
 *
 * Thread Safety: All functions acquire the database mutex internally.
 * The database is opened with SQLITE_OPEN_FULLMUTEX for additional safety.
 */

#ifndef USER_DB_H
#define USER_DB_H

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>
#include <time.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Pass as path to user_db_init() for a private in-memory database
 */
#define USER_DB_MEMORY ":memory:"

#define USER_DB_ID_MAX 128
#define USER_DB_NAME_MAX 128
#define USER_DB_VOICE_MAX 64
#define USER_DB_SETTING_KEY_MAX 128
#define USER_DB_SETTING_VALUE_MAX 512

/**
 * @brief Per-user volume gain bounds
 */
#define USER_GAIN_MIN 0.0
#define USER_GAIN_MAX 3.0
#define USER_GAIN_DEFAULT 1.0

/**
 * @brief Explicit per-user permission states
 */
#define USER_PERMISSION_UNSET (-1)
#define USER_PERMISSION_DENIED 0
#define USER_PERMISSION_ALLOWED 1

/**
 * @brief Database error codes
 */
#define USER_DB_SUCCESS 0
#define USER_DB_FAILURE 1
#define USER_DB_NOT_FOUND 2
#define USER_DB_INVALID 3

/**
 * @brief Per-user TTS record
 */
typedef struct {
   char user_id[USER_DB_ID_MAX];
   char username[USER_DB_NAME_MAX];
   int allow_tts; /* USER_PERMISSION_ALLOWED / _DENIED / _UNSET */
   bool is_blacklisted;
   char assigned_voice_id[USER_DB_VOICE_MAX]; /* Empty = no assignment */
   char assigned_engine[USER_DB_VOICE_MAX];
   char emotion[USER_DB_VOICE_MAX];
   double volume_gain;
   time_t last_updated;
} tts_user_record_t;

/**
 * @brief Aggregate counts for status displays
 */
typedef struct {
   int total;
   int allowed;
   int blacklisted;
   int with_voice;
} user_db_stats_t;

/**
 * @brief Callback for user_db_list_users(); return non-zero to stop iteration
 */
typedef int (*user_db_list_callback_t)(const tts_user_record_t *user, void *ctx);

/* =============================================================================
 * Lifecycle
 * ============================================================================= */

/**
 * @brief Open (and create if needed) the user database
 *
 * @param db_path File path, or USER_DB_MEMORY
 * @return USER_DB_SUCCESS or USER_DB_FAILURE
 */
int user_db_init(const char *db_path);

/**
 * @brief Finalize statements and close the database
 */
void user_db_shutdown(void);

/**
 * @brief Check if the database is open
 */
bool user_db_is_ready(void);

/* =============================================================================
 * User Records
 * ============================================================================= */

/**
 * @brief Clamp a gain value into [USER_GAIN_MIN, USER_GAIN_MAX]
 *
 * NaN maps to USER_GAIN_DEFAULT.
 */
double user_gain_clamp(double gain);

/**
 * @brief Fetch a user record
 *
 * @return USER_DB_SUCCESS, USER_DB_NOT_FOUND or USER_DB_FAILURE
 */
int user_db_get_user(const char *user_id, tts_user_record_t *out);

/**
 * @brief Grant TTS permission (clears blacklist flag)
 */
int user_db_allow_user(const char *user_id, const char *username);

/**
 * @brief Revoke TTS permission
 */
int user_db_deny_user(const char *user_id, const char *username);

/**
 * @brief Blacklist a user (also revokes permission)
 */
int user_db_blacklist_user(const char *user_id, const char *username);

/**
 * @brief Remove a user from the blacklist
 *
 * @return USER_DB_NOT_FOUND if the user has no record
 */
int user_db_unblacklist_user(const char *user_id);

/**
 * @brief Assign a voice and engine to a user, creating the record if needed
 *
 * @param emotion Emotion marker, or NULL to keep the stored one
 * @param gain Volume gain (clamped), or NULL to keep the stored one
 */
int user_db_assign_voice(const char *user_id,
                         const char *username,
                         const char *voice_id,
                         const char *engine,
                         const char *emotion,
                         const double *gain);

/**
 * @brief Clear voice, engine and emotion for a user
 */
int user_db_remove_voice_assignment(const char *user_id);

/**
 * @brief Set a user's volume gain, clamped to the allowed range
 *
 * Creates a record for unknown users.
 *
 * @param stored_out Receives the clamped value actually stored (may be NULL)
 */
int user_db_set_volume_gain(const char *user_id, double gain, double *stored_out);

/**
 * @brief Delete a user record
 *
 * @return USER_DB_NOT_FOUND if nothing was deleted
 */
int user_db_delete_user(const char *user_id);

/**
 * @brief Iterate over all users, most recently updated first
 */
int user_db_list_users(user_db_list_callback_t callback, void *ctx);

/**
 * @brief Aggregate counts
 */
int user_db_get_stats(user_db_stats_t *stats);

/* =============================================================================
 * Settings (scalar key/value)
 * ============================================================================= */

/**
 * @brief Read a setting
 *
 * @return USER_DB_SUCCESS, USER_DB_NOT_FOUND or USER_DB_FAILURE
 */
int user_db_get_setting(const char *key, char *value, size_t value_size);

/**
 * @brief Insert or replace a setting
 */
int user_db_set_setting(const char *key, const char *value);

#ifdef __cplusplus
}
#endif

#endif /* USER_DB_H */
