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
 * Rolling-window rate limiter with per-key tracking and LRU eviction.
 */

#ifndef RATE_LIMITER_H
#define RATE_LIMITER_H

#include <pthread.h>
#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* Maximum key length (user ids are truncated to fit) */
#define RATE_LIMIT_KEY_SIZE 128

/* Upper bound on max_count; each entry keeps one timestamp per admitted request */
#define RATE_LIMIT_MAX_BURST 32

/* Default slot count for rate limiters */
#define RATE_LIMIT_DEFAULT_SLOTS 256

/**
 * @brief Rate limit entry for tracking a single key
 */
typedef struct {
   char key[RATE_LIMIT_KEY_SIZE];
   int64_t stamps_ms[RATE_LIMIT_MAX_BURST]; /* Admission times, oldest first */
   int count;
   int64_t last_access_ms; /* For LRU eviction */
} rate_limit_entry_t;

/**
 * @brief Rate limiter configuration
 */
typedef struct {
   int max_count;     /**< Maximum requests allowed in window (1..RATE_LIMIT_MAX_BURST) */
   int64_t window_ms; /**< Rolling window duration in milliseconds */
   int slot_count;    /**< Number of key slots to track */
} rate_limiter_config_t;

/**
 * @brief Rate limiter instance
 */
typedef struct {
   rate_limit_entry_t *entries; /**< Array of entries (caller-owned) */
   rate_limiter_config_t config;
   pthread_mutex_t mutex;
} rate_limiter_t;

/**
 * @brief Initialize a rate limiter
 *
 * @param limiter Rate limiter to initialize
 * @param entries Caller-owned array of config->slot_count entries
 * @param config Rate limiter configuration (max_count is clamped to RATE_LIMIT_MAX_BURST)
 */
void rate_limiter_init(rate_limiter_t *limiter,
                       rate_limit_entry_t *entries,
                       const rate_limiter_config_t *config);

/**
 * @brief Release the limiter mutex (entries remain caller-owned)
 */
void rate_limiter_destroy(rate_limiter_t *limiter);

/**
 * @brief Check the limit for a key and record the request if allowed
 *
 * @param limiter Rate limiter instance
 * @param key Key to check (copied internally)
 * @param now_ms Current time in milliseconds
 * @param retry_after_ms If limited, receives ms until the oldest admission expires (may be NULL)
 * @return true if rate limited (reject request), false if allowed
 */
bool rate_limiter_check(rate_limiter_t *limiter,
                        const char *key,
                        int64_t now_ms,
                        int64_t *retry_after_ms);

/**
 * @brief Forget all admissions recorded for one key
 */
void rate_limiter_reset(rate_limiter_t *limiter, const char *key);

/**
 * @brief Forget all admissions for every key
 */
void rate_limiter_reset_all(rate_limiter_t *limiter);

/**
 * @brief Update window and count limits, keeping recorded admissions
 */
void rate_limiter_reconfigure(rate_limiter_t *limiter, int max_count, int64_t window_ms);

#ifdef __cplusplus
}
#endif

#endif /* RATE_LIMITER_H */
