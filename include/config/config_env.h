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
 * HERALD Configuration Environment - Environment variable overrides
 */

#ifndef CONFIG_ENV_H
#define CONFIG_ENV_H

#include "config/herald_config.h"

/* Forward declaration for json-c */
struct json_object;
typedef struct json_object json_object;

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Apply environment variable overrides to configuration
 *
 * Reads HERALD_* environment variables and applies them to the config.
 * Also reads standard provider credential variables.
 *
 * Environment variable format: HERALD_<SECTION>_<KEY>
 * Examples:
 *   HERALD_TTS_ENABLED=false
 *   HERALD_TTS_DEFAULT_ENGINE=fishaudio
 *   HERALD_QUEUE_MAX_QUEUE_SIZE=50
 *   HERALD_MQTT_BROKER=10.0.0.5
 *
 * Standard credentials (higher priority than secrets.toml):
 *   FISHAUDIO_API_KEY -> tts_fishaudio_api_key
 *   OPENAI_API_KEY    -> tts_openai_api_key
 *   TIKTOK_SESSION_ID -> tiktok_session_id
 *
 * @param config Config struct to modify
 * @param secrets Secrets struct to modify (may be NULL)
 */
void config_apply_env(herald_config_t *config, secrets_config_t *secrets);

/**
 * @brief Dump configuration to stdout
 *
 * Used by --dump-config CLI option. Secrets are never printed.
 *
 * @param config Configuration to dump
 */
void config_dump(const herald_config_t *config);

/**
 * @brief Convert configuration to a JSON object
 *
 * Caller must free the returned object with json_object_put().
 *
 * @param config Configuration to serialize
 * @return json_object* JSON object (caller owns), or NULL on error
 */
json_object *config_to_json(const herald_config_t *config);

/**
 * @brief Get secrets status as JSON (without revealing values)
 *
 * @param secrets Secrets to check
 * @return json_object* JSON object mapping key -> is_set, or NULL on error
 */
json_object *secrets_to_json_status(const secrets_config_t *secrets);

#ifdef __cplusplus
}
#endif

#endif /* CONFIG_ENV_H */
