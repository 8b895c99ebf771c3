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
 * String Utilities - small C string helpers shared by config, store and filters.
 */

#ifndef HERALD_STRING_UTILS_H
#define HERALD_STRING_UTILS_H

#include <stdbool.h>
#include <stddef.h>
#include <string.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Safe string copy with guaranteed null-termination
 *
 * Unlike strncpy, this always null-terminates the destination buffer
 * and doesn't waste cycles padding with zeros.
 *
 * @param dest Destination buffer
 * @param src Source string (NULL copies an empty string)
 * @param size Size of destination buffer
 */
static inline void safe_strncpy(char *dest, const char *src, size_t size) {
   if (size == 0) {
      return;
   }
   if (!src) {
      dest[0] = '\0';
      return;
   }
   size_t len = strlen(src);
   if (len >= size) {
      len = size - 1;
   }
   memcpy(dest, src, len);
   dest[len] = '\0';
}

/**
 * @brief Trim leading and trailing ASCII whitespace in place
 *
 * @param str String to trim (modified in place)
 * @return Length of the trimmed string
 */
size_t str_trim(char *str);

/**
 * @brief Check whether a string is NULL, empty or whitespace only
 */
bool str_is_blank(const char *str);

/**
 * @brief Case-insensitive substring search (portable implementation)
 *
 * @param haystack String to search in
 * @param needle Substring to find
 * @return Pointer to first occurrence, or NULL if not found
 */
const char *strcasestr_portable(const char *haystack, const char *needle);

/**
 * @brief Remove emoji and pictographic symbols from UTF-8 text in place
 *
 * Strips code points in the emoticon, pictograph, transport, dingbat,
 * flag and supplemental symbol blocks, plus variation selectors and
 * zero-width joiners. Runs of spaces left behind are collapsed.
 *
 * @param str UTF-8 string (modified in place)
 * @return New length of the string
 */
size_t str_strip_emoji(char *str);

/**
 * @brief Count UTF-8 code points in a string
 */
size_t utf8_strlen(const char *str);

/**
 * @brief Byte offset of the Nth code point (or strlen if shorter)
 */
size_t utf8_offset(const char *str, size_t chars);

#ifdef __cplusplus
}
#endif

#endif /* HERALD_STRING_UTILS_H */
