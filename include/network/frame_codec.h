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
 * Binary object codec for live TTS frames (MessagePack via msgpack-c).
 *
 * Frames are maps keyed by strings. Values may be nil, bool, integers,
 * floats, str, bin, arrays and maps; extension types are rejected.
 */

#ifndef HERALD_FRAME_CODEC_H
#define HERALD_FRAME_CODEC_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace herald {

class FrameValue {
 public:
   enum class Type { NIL, BOOL, INT, FLOAT, STR, BIN, ARRAY, MAP };

   using Array = std::vector<FrameValue>;
   using Map = std::vector<std::pair<std::string, FrameValue>>;

   FrameValue() = default;

   static FrameValue nil() { return FrameValue(); }
   static FrameValue boolean(bool v);
   static FrameValue integer(int64_t v);
   static FrameValue real(double v);
   static FrameValue str(std::string v);
   static FrameValue bin(std::vector<uint8_t> v);
   static FrameValue array(Array v);
   static FrameValue map(Map v);

   Type type() const { return type_; }
   bool is_nil() const { return type_ == Type::NIL; }

   bool as_bool() const { return bool_; }
   int64_t as_int() const { return int_; }
   double as_float() const { return type_ == Type::INT ? (double)int_ : float_; }
   const std::string &as_str() const { return str_; }
   const std::vector<uint8_t> &as_bin() const { return bin_; }
   const Array &as_array() const { return array_; }
   const Map &as_map() const { return map_; }

   /**
    * Look up a key in a map value.
    * @return nullptr if this is not a map or the key is absent
    */
   const FrameValue *find(const std::string &key) const;

   /**
    * String value of a map entry, or fallback when missing or not a string.
    */
   std::string get_str(const std::string &key, const std::string &fallback = "") const;

   /**
    * Append (or replace) a map entry. No-op on non-map values.
    */
   void set(const std::string &key, FrameValue value);

 private:
   Type type_ = Type::NIL;
   bool bool_ = false;
   int64_t int_ = 0;
   double float_ = 0.0;
   std::string str_;
   std::vector<uint8_t> bin_;
   Array array_;
   Map map_;
};

/**
 * Encode a value. Integers use the smallest representation,
 * floats are always written as float64.
 *
 * @throws std::bad_alloc if the packer buffer cannot grow
 */
std::vector<uint8_t> frame_encode(const FrameValue &value);

/**
 * Decode exactly one value from a buffer.
 *
 * @param data Encoded bytes
 * @param len Buffer length
 * @param out Receives the value
 * @param error Receives a description on failure (may be nullptr)
 * @return true on success; trailing bytes after the value are an error
 */
bool frame_decode(const uint8_t *data, size_t len, FrameValue *out, std::string *error);

}  // namespace herald

#endif  // HERALD_FRAME_CODEC_H
