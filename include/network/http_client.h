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
 * HTTP client seam for provider REST calls.
 */

#ifndef HERALD_HTTP_CLIENT_H
#define HERALD_HTTP_CLIENT_H

#include <memory>
#include <string>
#include <vector>

namespace herald {

struct HttpRequest {
   std::string url;
   std::vector<std::string> headers;  // "Name: value"
   std::string body;
   long timeout_ms = 15000;
   bool is_post = true;
};

struct HttpResponse {
   long status = 0;
   std::string body;              // Raw bytes; may be binary audio
   bool transport_error = false;  // DNS, connect, TLS, reset
   bool timed_out = false;
   std::string error;
};

/**
 * Blocking HTTP transport used by engine adapters.
 *
 * perform() never throws; failures are described in the response.
 * Implementations must be safe to call from several threads at once.
 */
class HttpClient {
 public:
   virtual ~HttpClient() = default;
   virtual HttpResponse perform(const HttpRequest &request) = 0;
};

/**
 * libcurl implementation. One easy handle per call.
 * curl_global_init() must have been called by the process.
 */
class CurlHttpClient : public HttpClient {
 public:
   HttpResponse perform(const HttpRequest &request) override;
};

std::shared_ptr<HttpClient> make_curl_http_client();

/**
 * Percent-encode a query parameter value (RFC 3986 unreserved set kept).
 */
std::string url_encode(const std::string &value);

}  // namespace herald

#endif  // HERALD_HTTP_CLIENT_H
