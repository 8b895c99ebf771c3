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
 * MessagePack frame codec tests.
 */

#include <string>
#include <vector>

#include "catch2/catch.hpp"
#include "network/frame_codec.h"

using herald::FrameValue;
using herald::frame_decode;
using herald::frame_encode;

namespace {

std::vector<uint8_t> bytes(std::initializer_list<int> values) {
   std::vector<uint8_t> out;
   for (int v : values) {
      out.push_back((uint8_t)v);
   }
   return out;
}

bool decode(const std::vector<uint8_t> &data, FrameValue *out, std::string *error = nullptr) {
   return frame_decode(data.data(), data.size(), out, error);
}

}  // namespace

TEST_CASE("frame encoding", "[unit]") {
   SECTION("control frame layout") {
      FrameValue frame = FrameValue::map({});
      frame.set("event", FrameValue::str("flush"));
      CHECK(frame_encode(frame) ==
            bytes({ 0x81, 0xA5, 'e', 'v', 'e', 'n', 't', 0xA5, 'f', 'l', 'u', 's', 'h' }));
   }

   SECTION("integers use the smallest form") {
      CHECK(frame_encode(FrameValue::integer(5)) == bytes({ 0x05 }));
      CHECK(frame_encode(FrameValue::integer(200)) == bytes({ 0xCC, 0xC8 }));
      CHECK(frame_encode(FrameValue::integer(128000)) == bytes({ 0xCE, 0x00, 0x01, 0xF4, 0x00 }));
      CHECK(frame_encode(FrameValue::integer(-1)) == bytes({ 0xFF }));
      CHECK(frame_encode(FrameValue::integer(-100)) == bytes({ 0xD0, 0x9C }));
   }

   SECTION("scalars") {
      CHECK(frame_encode(FrameValue::nil()) == bytes({ 0xC0 }));
      CHECK(frame_encode(FrameValue::boolean(true)) == bytes({ 0xC3 }));
      CHECK(frame_encode(FrameValue::boolean(false)) == bytes({ 0xC2 }));
      CHECK(frame_encode(FrameValue::real(1.0)) ==
            bytes({ 0xCB, 0x3F, 0xF0, 0, 0, 0, 0, 0, 0 }));
   }

   SECTION("long strings and binary carry explicit lengths") {
      std::vector<uint8_t> encoded = frame_encode(FrameValue::str(std::string(40, 'x')));
      REQUIRE(encoded.size() == 42);
      CHECK(encoded[0] == 0xD9);
      CHECK(encoded[1] == 40);

      encoded = frame_encode(FrameValue::bin({ 1, 2, 3 }));
      CHECK(encoded == bytes({ 0xC4, 0x03, 1, 2, 3 }));
   }

   SECTION("set replaces an existing key") {
      FrameValue frame = FrameValue::map({});
      frame.set("text", FrameValue::str("a"));
      frame.set("text", FrameValue::str("b"));
      REQUIRE(frame.as_map().size() == 1);
      CHECK(frame.get_str("text") == "b");
   }

   SECTION("set on a non-map is ignored") {
      FrameValue value = FrameValue::integer(1);
      value.set("text", FrameValue::str("a"));
      CHECK(value.type() == FrameValue::Type::INT);
   }
}

TEST_CASE("frame decoding", "[unit]") {
   FrameValue value;
   std::string error;

   SECTION("audio frame from the server") {
      std::vector<uint8_t> data =
          bytes({ 0x82, 0xA5, 'e', 'v', 'e', 'n', 't', 0xA5, 'a', 'u', 'd', 'i', 'o', 0xA5, 'a',
                  'u', 'd', 'i', 'o', 0xC4, 0x02, 0xFF, 0xFB });
      REQUIRE(decode(data, &value));
      CHECK(value.get_str("event") == "audio");
      const FrameValue *audio = value.find("audio");
      REQUIRE(audio != nullptr);
      CHECK(audio->type() == FrameValue::Type::BIN);
      CHECK(audio->as_bin() == bytes({ 0xFF, 0xFB }));
   }

   SECTION("get_str falls back on missing or non-string values") {
      REQUIRE(decode(bytes({ 0x81, 0xA4, 'c', 'o', 'd', 'e', 0x2A }), &value));
      CHECK(value.get_str("code", "none") == "none");
      CHECK(value.get_str("reason", "none") == "none");
      CHECK(value.find("code")->as_int() == 42);
      CHECK(value.find("code")->as_float() == Approx(42.0));
   }

   SECTION("signed and unsigned integer forms") {
      REQUIRE(decode(bytes({ 0xD1, 0xFF, 0x38 }), &value));
      CHECK(value.as_int() == -200);
      REQUIRE(decode(bytes({ 0xCD, 0x01, 0x00 }), &value));
      CHECK(value.as_int() == 256);
      REQUIRE(decode(bytes({ 0xE0 }), &value));
      CHECK(value.as_int() == -32);
   }

   SECTION("float32 is widened") {
      REQUIRE(decode(bytes({ 0xCA, 0x3F, 0xC0, 0x00, 0x00 }), &value));
      CHECK(value.type() == FrameValue::Type::FLOAT);
      CHECK(value.as_float() == Approx(1.5));
   }

   SECTION("arrays") {
      REQUIRE(decode(bytes({ 0x93, 0x01, 0xC0, 0xA1, 'x' }), &value));
      REQUIRE(value.as_array().size() == 3);
      CHECK(value.as_array()[1].is_nil());
      CHECK(value.as_array()[2].as_str() == "x");
   }

   SECTION("trailing bytes are rejected") {
      CHECK_FALSE(decode(bytes({ 0xC0, 0xC0 }), &value, &error));
      CHECK(error == "trailing bytes after frame");
   }

   SECTION("truncated input is rejected") {
      CHECK_FALSE(decode(bytes({ 0xA5, 'a', 'b' }), &value, &error));
      CHECK(error == "truncated frame");
      CHECK_FALSE(decode(bytes({}), &value, &error));
   }

   SECTION("non-string map keys are rejected") {
      CHECK_FALSE(decode(bytes({ 0x81, 0x01, 0x02 }), &value, &error));
      CHECK(error == "map key is not a string");
   }

   SECTION("extension types are rejected") {
      CHECK_FALSE(decode(bytes({ 0xD4, 0x01, 0x00 }), &value, &error));
      CHECK(error == "unsupported type tag");
   }

   SECTION("declared lengths beyond the buffer are rejected") {
      CHECK_FALSE(decode(bytes({ 0x93, 0x01, 0x02 }), &value, &error));
      CHECK(error == "truncated frame");
      CHECK_FALSE(decode(bytes({ 0xC4, 0x05, 0x01 }), &value, &error));
      CHECK(error == "truncated frame");
   }

   SECTION("nesting is bounded") {
      std::vector<uint8_t> deep(64, 0x91);
      deep.push_back(0xC0);
      CHECK_FALSE(decode(deep, &value, &error));
      CHECK_FALSE(error.empty());
   }

   SECTION("nested maps are copied out of the unpacker") {
      REQUIRE(decode(bytes({ 0x81, 0xA1, 'r', 0x81, 0xA1, 'k', 0xA2, 'o', 'k' }), &value));
      const FrameValue *inner = value.find("r");
      REQUIRE(inner != nullptr);
      CHECK(inner->get_str("k") == "ok");
   }

   SECTION("failed decode leaves the output untouched") {
      value = FrameValue::str("keep");
      CHECK_FALSE(frame_decode(nullptr, 0, &value, &error));
      CHECK(error == "null argument");
      CHECK(value.as_str() == "keep");
   }
}
