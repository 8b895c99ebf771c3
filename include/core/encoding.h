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
 * Base64 and random token helpers (libsodium).
 */

#ifndef HERALD_ENCODING_H
#define HERALD_ENCODING_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace herald {

/**
 * @brief Initialize libsodium
 *
 * Safe to call more than once. Every other function here calls it lazily,
 * so explicit initialization only moves the cost to startup.
 *
 * @return true on success
 */
bool encoding_init();

/**
 * @brief Standard (padded) base64 encoding
 */
std::string base64_encode(const uint8_t *data, size_t len);

inline std::string base64_encode(const std::vector<uint8_t> &data) {
   return base64_encode(data.data(), data.size());
}

/**
 * @brief Decode standard base64, ignoring whitespace
 *
 * @return false if the input is not valid base64
 */
bool base64_decode(const std::string &text, std::vector<uint8_t> *out);

/**
 * @brief Random lowercase alphanumeric string
 */
std::string random_token(size_t length);

}  // namespace herald

#endif  // HERALD_ENCODING_H
