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

#include "core/encoding.h"

#include <sodium.h>

extern "C" {
#include "logging.h"
}

namespace herald {

bool encoding_init() {
   // 0 = initialized now, 1 = already initialized, -1 = failure
   if (sodium_init() < 0) {
      LOG_ERROR("libsodium initialization failed");
      return false;
   }
   return true;
}

std::string base64_encode(const uint8_t *data, size_t len) {
   if (!data || len == 0) {
      return std::string();
   }
   encoding_init();

   const int variant = sodium_base64_VARIANT_ORIGINAL;
   size_t encoded_len = sodium_base64_ENCODED_LEN(len, variant);
   std::string out(encoded_len, '\0');
   sodium_bin2base64(&out[0], encoded_len, data, len, variant);
   out.resize(encoded_len - 1);  // drop the terminator
   return out;
}

bool base64_decode(const std::string &text, std::vector<uint8_t> *out) {
   if (!out) {
      return false;
   }
   out->clear();
   if (text.empty()) {
      return true;
   }
   encoding_init();

   // Decoded size never exceeds 3/4 of the input
   std::vector<uint8_t> buffer(text.size() / 4 * 3 + 3);
   size_t bin_len = 0;
   const char *end = nullptr;
   if (sodium_base642bin(buffer.data(), buffer.size(), text.c_str(), text.size(), " \t\r\n",
                         &bin_len, &end, sodium_base64_VARIANT_ORIGINAL) != 0) {
      return false;
   }
   if (end != text.c_str() + text.size()) {
      return false;
   }
   buffer.resize(bin_len);
   *out = std::move(buffer);
   return true;
}

std::string random_token(size_t length) {
   static const char alphabet[] = "abcdefghijklmnopqrstuvwxyz0123456789";
   encoding_init();

   std::string out;
   out.reserve(length);
   for (size_t i = 0; i < length; i++) {
      out += alphabet[randombytes_uniform(sizeof(alphabet) - 1)];
   }
   return out;
}

}  // namespace herald
