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
 * HERALD - project-wide constants and process control.
 */

#ifndef HERALD_H
#define HERALD_H

#include <signal.h>

#define APPLICATION_NAME "herald"
#define HERALD_VERSION "0.3.0"

/* Generic return codes used by the C modules */
#define SUCCESS 0
#define FAILURE 1

/* Source tags with special meaning in the pipeline */
#define HERALD_SOURCE_CHAT "chat"
#define HERALD_SOURCE_PREVIEW "preview"
#define HERALD_SOURCE_MANUAL "manual"
#define HERALD_SOURCE_EVENT_PREFIX "event:"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Retrieves the current value of the quit flag.
 *
 * Safe to call from signal handlers.
 *
 * @return Non-zero once shutdown has been requested.
 */
sig_atomic_t get_quit(void);

/**
 * @brief Request a clean shutdown of the daemon main loop.
 */
void herald_request_quit(void);

#ifdef __cplusplus
}
#endif

#endif  // HERALD_H
