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
 * Logging - printf-style log macros with file/line/function context.
 *
 * Output goes to stdout by default or to a log file. An optional callback
 * receives every formatted line (used by embedders and tests).
 */

#ifndef LOGGING_H
#define LOGGING_H

#include <stdarg.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Log level enumeration
 */
typedef enum {
   LOG_LEVEL_INFO = 0,
   LOG_LEVEL_WARNING = 1,
   LOG_LEVEL_ERROR = 2,
} log_level_t;

/**
 * @brief Callback receiving each formatted log message
 *
 * @param level Message level
 * @param file Source file name (basename)
 * @param line Line number
 * @param func Function name
 * @param message Formatted message (no trailing newline)
 * @param user_data Pointer registered with logging_set_callback()
 */
typedef void (*log_callback_t)(log_level_t level,
                               const char *file,
                               int line,
                               const char *func,
                               const char *message,
                               void *user_data);

/**
 * @brief Initialize logging output
 *
 * @param log_file Path to append log lines to, or NULL/"" for stdout
 * @return 0 on success, 1 if the file could not be opened (stdout is used)
 */
int logging_init(const char *log_file);

/**
 * @brief Close the log file if one is open
 */
void logging_close(void);

/**
 * @brief Register a callback that receives every log message
 *
 * The callback is invoked in addition to the normal output. Pass NULL to
 * remove it.
 */
void logging_set_callback(log_callback_t callback, void *user_data);

/**
 * @brief Set the minimum level written (messages below it are dropped)
 */
void logging_set_level(log_level_t min_level);

/**
 * @brief Internal logging function - use the LOG_* macros instead
 */
void log_message(log_level_t level,
                 const char *file,
                 int line,
                 const char *func,
                 const char *fmt,
                 ...) __attribute__((format(printf, 5, 6)));

#define LOG_INFO(fmt, ...) \
   log_message(LOG_LEVEL_INFO, __FILE__, __LINE__, __func__, fmt, ##__VA_ARGS__)

#define LOG_WARNING(fmt, ...) \
   log_message(LOG_LEVEL_WARNING, __FILE__, __LINE__, __func__, fmt, ##__VA_ARGS__)

#define LOG_ERROR(fmt, ...) \
   log_message(LOG_LEVEL_ERROR, __FILE__, __LINE__, __func__, fmt, ##__VA_ARGS__)

#ifdef __cplusplus
}
#endif

#endif /* LOGGING_H */
