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
 * libcurl HTTP client for provider REST calls.
 */

#include "network/http_client.h"

#include <curl/curl.h>

#include <cstdio>

#include "network/curl_buffer.h"

extern "C" {
#include "logging.h"
}

namespace herald {

HttpResponse CurlHttpClient::perform(const HttpRequest &request) {
   HttpResponse response;

   CURL *curl = curl_easy_init();
   if (!curl) {
      response.transport_error = true;
      response.error = "curl_easy_init failed";
      return response;
   }

   struct curl_slist *headers = nullptr;
   for (const auto &h : request.headers) {
      struct curl_slist *next = curl_slist_append(headers, h.c_str());
      if (!next) {
         curl_slist_free_all(headers);
         curl_easy_cleanup(curl);
         response.transport_error = true;
         response.error = "out of memory building headers";
         return response;
      }
      headers = next;
   }

   curl_buffer_t buffer;
   curl_buffer_init(&buffer);

   curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
   curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
   curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curl_buffer_write_callback);
   curl_easy_setopt(curl, CURLOPT_WRITEDATA, &buffer);
   curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, request.timeout_ms);
   curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                    request.timeout_ms < 10000 ? request.timeout_ms : 10000L);
   curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
   curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
   if (request.is_post) {
      curl_easy_setopt(curl, CURLOPT_POST, 1L);
      curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
      curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, (long)request.body.size());
   } else {
      curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
   }

   CURLcode res = curl_easy_perform(curl);
   if (res != CURLE_OK) {
      response.timed_out = (res == CURLE_OPERATION_TIMEDOUT);
      response.transport_error = !response.timed_out;
      response.error = curl_easy_strerror(res);
   } else {
      curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
      if (buffer.data) {
         response.body.assign(buffer.data, buffer.size);
      }
   }

   curl_buffer_free(&buffer);
   curl_slist_free_all(headers);
   curl_easy_cleanup(curl);

   return response;
}

std::shared_ptr<HttpClient> make_curl_http_client() {
   return std::make_shared<CurlHttpClient>();
}

std::string url_encode(const std::string &value) {
   static const char hex[] = "0123456789ABCDEF";
   std::string out;
   out.reserve(value.size() * 3);
   for (unsigned char c : value) {
      if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
          c == '-' || c == '_' || c == '.' || c == '~') {
         out += (char)c;
      } else {
         out += '%';
         out += hex[c >> 4];
         out += hex[c & 0x0F];
      }
   }
   return out;
}

}  // namespace herald
