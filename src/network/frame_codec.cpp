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
 * Live TTS frames over msgpack-c. FrameValue is an owning copy of a
 * msgpack_object so decoded frames outlive the unpacker zone.
 */

#include "network/frame_codec.h"

#include <msgpack.h>

#include <new>

namespace herald {

/* =============================================================================
 * FrameValue
 * ============================================================================= */

FrameValue FrameValue::boolean(bool v) {
   FrameValue f;
   f.type_ = Type::BOOL;
   f.bool_ = v;
   return f;
}

FrameValue FrameValue::integer(int64_t v) {
   FrameValue f;
   f.type_ = Type::INT;
   f.int_ = v;
   return f;
}

FrameValue FrameValue::real(double v) {
   FrameValue f;
   f.type_ = Type::FLOAT;
   f.float_ = v;
   return f;
}

FrameValue FrameValue::str(std::string v) {
   FrameValue f;
   f.type_ = Type::STR;
   f.str_ = std::move(v);
   return f;
}

FrameValue FrameValue::bin(std::vector<uint8_t> v) {
   FrameValue f;
   f.type_ = Type::BIN;
   f.bin_ = std::move(v);
   return f;
}

FrameValue FrameValue::array(Array v) {
   FrameValue f;
   f.type_ = Type::ARRAY;
   f.array_ = std::move(v);
   return f;
}

FrameValue FrameValue::map(Map v) {
   FrameValue f;
   f.type_ = Type::MAP;
   f.map_ = std::move(v);
   return f;
}

const FrameValue *FrameValue::find(const std::string &key) const {
   if (type_ != Type::MAP) {
      return nullptr;
   }
   for (const auto &entry : map_) {
      if (entry.first == key) {
         return &entry.second;
      }
   }
   return nullptr;
}

std::string FrameValue::get_str(const std::string &key, const std::string &fallback) const {
   const FrameValue *v = find(key);
   if (!v || v->type() != Type::STR) {
      return fallback;
   }
   return v->as_str();
}

void FrameValue::set(const std::string &key, FrameValue value) {
   if (type_ != Type::MAP) {
      return;
   }
   for (auto &entry : map_) {
      if (entry.first == key) {
         entry.second = std::move(value);
         return;
      }
   }
   map_.emplace_back(key, std::move(value));
}

/* =============================================================================
 * Encoder
 * ============================================================================= */

namespace {

class Packer {
 public:
   Packer() {
      msgpack_sbuffer_init(&sbuf_);
      msgpack_packer_init(&pk_, &sbuf_, msgpack_sbuffer_write);
   }
   ~Packer() { msgpack_sbuffer_destroy(&sbuf_); }

   Packer(const Packer &) = delete;
   Packer &operator=(const Packer &) = delete;

   int pack(const FrameValue &v);

   std::vector<uint8_t> bytes() const {
      const uint8_t *p = (const uint8_t *)sbuf_.data;
      return std::vector<uint8_t>(p, p + sbuf_.size);
   }

 private:
   int pack_str(const std::string &s) {
      int rc = msgpack_pack_str(&pk_, s.size());
      return rc ? rc : msgpack_pack_str_body(&pk_, s.data(), s.size());
   }

   msgpack_sbuffer sbuf_;
   msgpack_packer pk_;
};

int Packer::pack(const FrameValue &v) {
   int rc = 0;
   switch (v.type()) {
      case FrameValue::Type::NIL:
         return msgpack_pack_nil(&pk_);
      case FrameValue::Type::BOOL:
         return v.as_bool() ? msgpack_pack_true(&pk_) : msgpack_pack_false(&pk_);
      case FrameValue::Type::INT:
         return msgpack_pack_int64(&pk_, v.as_int());
      case FrameValue::Type::FLOAT:
         return msgpack_pack_double(&pk_, v.as_float());
      case FrameValue::Type::STR:
         return pack_str(v.as_str());
      case FrameValue::Type::BIN:
         rc = msgpack_pack_bin(&pk_, v.as_bin().size());
         return rc ? rc : msgpack_pack_bin_body(&pk_, v.as_bin().data(), v.as_bin().size());
      case FrameValue::Type::ARRAY:
         rc = msgpack_pack_array(&pk_, v.as_array().size());
         for (const auto &item : v.as_array()) {
            if (rc) {
               break;
            }
            rc = pack(item);
         }
         return rc;
      case FrameValue::Type::MAP:
         rc = msgpack_pack_map(&pk_, v.as_map().size());
         for (const auto &entry : v.as_map()) {
            if (rc) {
               break;
            }
            rc = pack_str(entry.first);
            if (!rc) {
               rc = pack(entry.second);
            }
         }
         return rc;
   }
   return -1;
}

/* =============================================================================
 * Decoder
 * ============================================================================= */

bool convert(const msgpack_object &obj, FrameValue *out, std::string *error) {
   switch (obj.type) {
      case MSGPACK_OBJECT_NIL:
         *out = FrameValue::nil();
         return true;
      case MSGPACK_OBJECT_BOOLEAN:
         *out = FrameValue::boolean(obj.via.boolean);
         return true;
      case MSGPACK_OBJECT_POSITIVE_INTEGER:
         *out = FrameValue::integer((int64_t)obj.via.u64);
         return true;
      case MSGPACK_OBJECT_NEGATIVE_INTEGER:
         *out = FrameValue::integer(obj.via.i64);
         return true;
      case MSGPACK_OBJECT_FLOAT32:
      case MSGPACK_OBJECT_FLOAT64:
         *out = FrameValue::real(obj.via.f64);
         return true;
      case MSGPACK_OBJECT_STR:
         *out = FrameValue::str(std::string(obj.via.str.ptr, obj.via.str.size));
         return true;
      case MSGPACK_OBJECT_BIN: {
         const uint8_t *p = (const uint8_t *)obj.via.bin.ptr;
         *out = FrameValue::bin(std::vector<uint8_t>(p, p + obj.via.bin.size));
         return true;
      }
      case MSGPACK_OBJECT_ARRAY: {
         FrameValue::Array items;
         items.reserve(obj.via.array.size);
         for (uint32_t i = 0; i < obj.via.array.size; i++) {
            FrameValue item;
            if (!convert(obj.via.array.ptr[i], &item, error)) {
               return false;
            }
            items.push_back(std::move(item));
         }
         *out = FrameValue::array(std::move(items));
         return true;
      }
      case MSGPACK_OBJECT_MAP: {
         FrameValue::Map entries;
         entries.reserve(obj.via.map.size);
         for (uint32_t i = 0; i < obj.via.map.size; i++) {
            const msgpack_object_kv &kv = obj.via.map.ptr[i];
            if (kv.key.type != MSGPACK_OBJECT_STR) {
               *error = "map key is not a string";
               return false;
            }
            FrameValue value;
            if (!convert(kv.val, &value, error)) {
               return false;
            }
            entries.emplace_back(std::string(kv.key.via.str.ptr, kv.key.via.str.size),
                                 std::move(value));
         }
         *out = FrameValue::map(std::move(entries));
         return true;
      }
      default:
         *error = "unsupported type tag";
         return false;
   }
}

class Unpacked {
 public:
   Unpacked() { msgpack_unpacked_init(&result_); }
   ~Unpacked() { msgpack_unpacked_destroy(&result_); }

   Unpacked(const Unpacked &) = delete;
   Unpacked &operator=(const Unpacked &) = delete;

   msgpack_unpacked *get() { return &result_; }

 private:
   msgpack_unpacked result_;
};

}  // namespace

std::vector<uint8_t> frame_encode(const FrameValue &value) {
   Packer packer;
   if (packer.pack(value) != 0) {
      throw std::bad_alloc();
   }
   return packer.bytes();
}

bool frame_decode(const uint8_t *data, size_t len, FrameValue *out, std::string *error) {
   std::string message;
   if (!data || !out) {
      message = "null argument";
   } else {
      Unpacked unpacked;
      size_t offset = 0;
      msgpack_unpack_return rc =
          msgpack_unpack_next(unpacked.get(), (const char *)data, len, &offset);
      switch (rc) {
         case MSGPACK_UNPACK_SUCCESS:
         case MSGPACK_UNPACK_EXTRA_BYTES:
            if (offset != len) {
               message = "trailing bytes after frame";
            } else {
               FrameValue value;
               if (convert(unpacked.get()->data, &value, &message)) {
                  *out = std::move(value);
                  return true;
               }
            }
            break;
         case MSGPACK_UNPACK_CONTINUE:
            message = "truncated frame";
            break;
         case MSGPACK_UNPACK_NOMEM_ERROR:
            message = "frame exceeds decoder limits";
            break;
         default:
            message = "malformed frame";
            break;
      }
   }
   if (error) {
      *error = message;
   }
   return false;
}

}  // namespace herald
