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
 * Pipeline status codes shared by the gate, queue, engines and events.
 */

#ifndef HERALD_STATUS_H
#define HERALD_STATUS_H

#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Outcome of a pipeline operation
 *
 * Policy outcomes (PERMISSION_DENIED, ON_COOLDOWN, DISABLED, FILTERED) are
 * expected and frequent; they are never logged as errors.
 */
typedef enum {
   HERALD_OK = 0,
   HERALD_ERR_INVALID_CREDENTIAL, /**< Adapter constructed with an empty key */
   HERALD_ERR_RATE_LIMITED,       /**< Too many requests in the window */
   HERALD_ERR_QUEUE_FULL,         /**< Queue at max_queue_size */
   HERALD_ERR_SYNTHESIS,          /**< Provider call failed */
   HERALD_ERR_TIMEOUT,            /**< Provider call or stream timed out */
   HERALD_ERR_PERMISSION_DENIED,  /**< User not authorized */
   HERALD_ERR_ON_COOLDOWN,        /**< (user, event) pair still cooling down */
   HERALD_ERR_DISABLED,           /**< Global switch or event type disabled */
   HERALD_ERR_FILTERED,           /**< Dropped by prefix or value filter */
   HERALD_ERR_DUPLICATE,          /**< Same user repeated the same text */
   HERALD_ERR_EMPTY_TEXT,         /**< Nothing left to speak after filtering */
   HERALD_ERR_INVALID_PARAM,      /**< Malformed request */
   HERALD_ERR_NOT_FOUND,          /**< Unknown item, engine or user */
   HERALD_STATUS_COUNT
} herald_status_t;

/**
 * @brief Stable snake_case reason string for a status
 *
 * These strings appear in notifications and API responses
 * ("permission_denied", "tts_disabled", "rate_limited", "on_cooldown", ...).
 */
const char *herald_status_name(herald_status_t status);

/**
 * @brief Whether a status is an expected policy outcome rather than a failure
 */
bool herald_status_is_policy(herald_status_t status);

#ifdef __cplusplus
}
#endif

#endif /* HERALD_STATUS_H */
