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
 * HERALD Configuration Validation - range and enum checks on herald.toml values
 */

#ifndef CONFIG_VALIDATE_H
#define CONFIG_VALIDATE_H

#include <stddef.h>

#include "config/herald_config.h"

#ifdef __cplusplus
extern "C" {
#endif

/* One rejected field, named by its TOML path (e.g. "queue.rate_limit") */
typedef struct {
   char field[64];
   char message[256];
} config_error_t;

/**
 * @brief Check a loaded herald configuration before the daemon starts
 *
 * [tts]: default_engine must be one of the seven provider ids, volume
 * 0-100, speed 0.25-4.0, max_text_length 10-5000. performance_mode is
 * fast/balanced/quality and profanity_filter off/moderate/strict.
 *
 * [queue]: max_queue_size 1-10000, rate_limit 1-32 per window of
 * 1-86400 s, pregen_lookahead 0-16. Timing fields must not be negative.
 *
 * [streaming]: endpoint must be a ws:// or wss:// URL and the session
 * timeout at least one second.
 *
 * [events]: volume 0-100 and no negative cooldown. An enabled combo needs a
 * threshold of at least 2. Enabled reminders need an interval of at least
 * one minute and at least one message.
 *
 * [mqtt]: checked only when enabled. Needs a broker and a port 1-65535.
 *
 * A missing credential for the default engine is logged as a warning and
 * not counted.
 *
 * @param config Configuration to check
 * @param secrets Loaded secrets for the credential warning (can be NULL)
 * @param errors Receives up to max_errors entries
 * @param max_errors Capacity of errors
 * @return Total number of errors, which may exceed max_errors (0 = valid)
 */
int config_validate(const herald_config_t *config,
                    const secrets_config_t *secrets,
                    config_error_t *errors,
                    size_t max_errors);

/* Writes "field: message" lines to stderr */
void config_print_errors(const config_error_t *errors, int count);

#ifdef __cplusplus
}
#endif

#endif /* CONFIG_VALIDATE_H */
