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
 * Live event categories that can trigger speech.
 */

#ifndef EVENT_TYPE_H
#define EVENT_TYPE_H

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Upstream live event categories
 */
typedef enum {
   EVENT_GIFT = 0,
   EVENT_FOLLOW,
   EVENT_SHARE,
   EVENT_SUBSCRIBE,
   EVENT_LIKE,
   EVENT_JOIN,
   EVENT_TYPE_COUNT
} event_type_t;

/**
 * @brief Lowercase name of an event type ("gift", "follow", ...)
 */
const char *event_type_name(event_type_t type);

/**
 * @brief Parse an event type name
 *
 * @param name Event name (case-insensitive)
 * @return The event type, or EVENT_TYPE_COUNT if unknown
 */
event_type_t event_type_from_name(const char *name);

#ifdef __cplusplus
}
#endif

#endif /* EVENT_TYPE_H */
