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
 * Text filtering utilities for chat messages before synthesis.
 */

#ifndef TEXT_FILTER_H
#define TEXT_FILTER_H

#include <stdbool.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

#define TEXT_FILTER_ELLIPSIS "..."

/**
 * @brief Profanity filter modes
 */
typedef enum {
   PROFANITY_OFF = 0,
   PROFANITY_MODERATE, /**< Mask matched words with asterisks */
   PROFANITY_STRICT,   /**< Drop the whole message on any match */
} profanity_mode_t;

/**
 * @brief Parse "off" / "moderate" / "strict" (unknown maps to PROFANITY_MODERATE)
 */
profanity_mode_t text_filter_profanity_mode(const char *name);

/**
 * @brief Check whether text starts with any of the given prefixes
 *
 * Leading whitespace is ignored. Empty prefixes never match.
 *
 * @param text Message text
 * @param prefixes Array of prefix strings
 * @param count Number of prefixes
 * @return true if the message should be suppressed
 */
bool text_filter_matches_prefix(const char *text, const char *const *prefixes, int count);

/**
 * @brief Remove a leading '@' (after leading whitespace) in place
 *
 * @return true if a character was removed
 */
bool text_filter_strip_mention(char *text);

/**
 * @brief Mask or detect profanity in place
 *
 * Matching is case-insensitive on whole words. In PROFANITY_MODERATE each
 * matched word is replaced by asterisks of the same byte length. In
 * PROFANITY_STRICT the text is left untouched.
 *
 * @param text Text to filter (modified in place for moderate mode)
 * @param mode Filter mode
 * @return Number of matched words
 */
int text_filter_profanity(char *text, profanity_mode_t mode);

/**
 * @brief Truncate to max_chars code points and append "..."
 *
 * @param text UTF-8 text (modified in place)
 * @param size Size of the buffer holding text
 * @param max_chars Maximum code points to keep before the ellipsis
 * @return true if the text was truncated
 */
bool text_filter_truncate(char *text, size_t size, size_t max_chars);

#ifdef __cplusplus
}
#endif

#endif /* TEXT_FILTER_H */
