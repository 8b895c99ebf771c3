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
 * CURL response buffer for provider calls. Bodies are binary audio or JSON
 * with base64 audio, so the cap is sized for a few minutes of mp3.
 */

#ifndef CURL_BUFFER_H
#define CURL_BUFFER_H

#include <stddef.h>
#include <stdlib.h>
#include <string.h>

#define CURL_BUFFER_INITIAL_CAPACITY 16384
#define CURL_BUFFER_MAX_CAPACITY (32 * 1024 * 1024)

/**
 * Buffer for accumulating a CURL response body
 * Initialize with curl_buffer_init() or: curl_buffer_t buf = {NULL, 0, 0};
 *
 * data is always null-terminated so JSON bodies can be parsed in place;
 * size excludes the terminator and is exact for binary bodies.
 */
typedef struct {
   char *data;
   size_t size;
   size_t capacity;
} curl_buffer_t;

/**
 * CURL write callback with exponential buffer growth
 *
 * @return Number of bytes handled, or 0 to abort the transfer when the
 *         body would exceed CURL_BUFFER_MAX_CAPACITY or allocation fails
 */
static inline size_t curl_buffer_write_callback(void *contents,
                                                size_t size,
                                                size_t nmemb,
                                                void *userp) {
   size_t total_size = size * nmemb;
   curl_buffer_t *buf = (curl_buffer_t *)userp;

   size_t required = buf->size + total_size + 1;
   if (required > CURL_BUFFER_MAX_CAPACITY) {
      return 0;
   }
   if (required > buf->capacity) {
      size_t new_capacity = buf->capacity ? buf->capacity : CURL_BUFFER_INITIAL_CAPACITY;
      while (new_capacity < required) {
         new_capacity *= 2;
      }
      if (new_capacity > CURL_BUFFER_MAX_CAPACITY) {
         new_capacity = CURL_BUFFER_MAX_CAPACITY;
      }

      char *new_data = (char *)realloc(buf->data, new_capacity);
      if (!new_data) {
         return 0;
      }
      buf->data = new_data;
      buf->capacity = new_capacity;
   }

   memcpy(&(buf->data[buf->size]), contents, total_size);
   buf->size += total_size;
   buf->data[buf->size] = '\0';

   return total_size;
}

static inline void curl_buffer_init(curl_buffer_t *buf) {
   buf->data = NULL;
   buf->size = 0;
   buf->capacity = 0;
}

static inline void curl_buffer_free(curl_buffer_t *buf) {
   if (buf->data) {
      free(buf->data);
      buf->data = NULL;
   }
   buf->size = 0;
   buf->capacity = 0;
}

#endif  // CURL_BUFFER_H
