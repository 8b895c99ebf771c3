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
 * HERALD Configuration Parser - herald.toml and secrets.toml loading
 */

#ifndef CONFIG_PARSER_H
#define CONFIG_PARSER_H

#include "config/herald_config.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Apply one herald.toml on top of an initialized config
 *
 * Reads [general], [tts], [permissions], [queue], [streaming], [events]
 * (including the per-event tables and [events.advanced]) and [mqtt].
 * Keys missing from the file keep their value. A key herald does not know
 * is logged as a warning.
 *
 * @return SUCCESS, or FAILURE if the file cannot be opened or is not valid TOML
 */
int config_parse_file(const char *path, herald_config_t *config);

/**
 * @brief Read provider credentials from secrets.toml
 *
 * String keys under [credentials] are stored by name, e.g.
 * tts_fishaudio_api_key or tiktok_session_id. Non-string values are skipped
 * with a warning. [mqtt] username and password are read as well.
 *
 * @return SUCCESS, or FAILURE if the file cannot be opened or parsed
 */
int config_parse_secrets(const char *path, secrets_config_t *secrets);

/* Non-zero if path (with a leading ~/ expanded) is readable. Not SUCCESS/FAILURE. */
int config_file_readable(const char *path);

/**
 * @brief Load the herald configuration
 *
 * An explicit path (--config) must be readable, no other location is tried.
 * Without one the first readable file wins:
 * 1. ./herald.toml
 * 2. ~/.config/herald/config.toml
 * 3. /etc/herald/config.toml
 *
 * @param explicit_path Path from --config, or NULL to search
 * @return SUCCESS, or FAILURE when nothing was found (config keeps its
 *         defaults) or the chosen file failed to parse
 */
int config_load_from_search(const char *explicit_path, herald_config_t *config);

/**
 * @brief Load secrets.toml from ./, ~/.config/herald/ or /etc/herald/
 *
 * @return SUCCESS, or FAILURE when no file was found or it failed to parse.
 *         Running without secrets is allowed.
 */
int config_load_secrets_from_search(secrets_config_t *secrets);

/* Path of the loaded config, or "(none - using defaults)" */
const char *config_get_loaded_path(void);

/* Path of the loaded secrets file, or "(none)" */
const char *config_get_secrets_path(void);

#ifdef __cplusplus
}
#endif

#endif /* CONFIG_PARSER_H */
