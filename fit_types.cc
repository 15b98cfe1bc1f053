/*
    FIT base types and field values.

    Copyright (C) 2011 Paul Brook, paul@nowt.org
    Copyright (C) 2003-2011  Robert Lipe, robertlipe+source@gpsbabel.org
    Copyright (C) 2019 Martin Buck, mb-tmp-tvguho.pbz@gromit.dyndns.org
    Copyright (C) 2026 The RideLog Authors

    This program is free software; you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation; either version 2 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program; if not, write to the Free Software
    Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301, USA.

 */

#include "fit_types.h"

#include <array>       // for array
#include <cmath>       // for isfinite, trunc
#include <cstring>     // for memcpy
#include <limits>      // for numeric_limits
#include <type_traits> // for decay_t, is_same_v

#include "defs.h"      // for be_read16, le_read16, be_read32, le_read32, be_read64, le_read64

namespace ridelog
{

namespace
{

const std::array<FitBaseType, 17> kFitBaseTypes = {{
  // id,          size, kind,                   invalid,               name
  { kFitEnum,     1, FitBaseType::kUnsigned, 0xffU,                 "enum"    },
  { kFitSint8,    1, FitBaseType::kSigned,   0x7fU,                 "sint8"   },
  { kFitUint8,    1, FitBaseType::kUnsigned, 0xffU,                 "uint8"   },
  { kFitString,   1, FitBaseType::kString,   0x00U,                 "string"  },
  { kFitUint8z,   1, FitBaseType::kUnsigned, 0x00U,                 "uint8z"  },
  { kFitByte,     1, FitBaseType::kBytes,    0xffU,                 "byte"    },
  { kFitSint16,   2, FitBaseType::kSigned,   0x7fffU,               "sint16"  },
  { kFitUint16,   2, FitBaseType::kUnsigned, 0xffffU,               "uint16"  },
  { kFitSint32,   4, FitBaseType::kSigned,   0x7fffffffU,           "sint32"  },
  { kFitUint32,   4, FitBaseType::kUnsigned, 0xffffffffU,           "uint32"  },
  { kFitFloat32,  4, FitBaseType::kFloat,    0xffffffffU,           "float32" },
  { kFitFloat64,  8, FitBaseType::kFloat,    0xffffffffffffffffU,   "float64" },
  { kFitUint16z,  2, FitBaseType::kUnsigned, 0x0000U,               "uint16z" },
  { kFitUint32z,  4, FitBaseType::kUnsigned, 0x00000000U,           "uint32z" },
  { kFitSint64,   8, FitBaseType::kSigned,   0x7fffffffffffffffU,   "sint64"  },
  { kFitUint64,   8, FitBaseType::kUnsigned, 0xffffffffffffffffU,   "uint64"  },
  { kFitUint64z,  8, FitBaseType::kUnsigned, 0x0000000000000000U,   "uint64z" },
}};

uint64_t read_bits(const char* data, int size, bool big_endian)
{
  switch (size) {
  case 1:
    return static_cast<unsigned char>(data[0]);
  case 2:
    return big_endian ? be_read16(data) : le_read16(data);
  case 4:
    return big_endian ? be_read32(data) : le_read32(data);
  default:
    return big_endian ? be_read64(data) : le_read64(data);
  }
}

} // namespace

const FitBaseType* fit_base_type(uint8_t id)
{
  for (const auto& type : kFitBaseTypes) {
    if (type.id == id) {
      return &type;
    }
  }
  return nullptr;
}

FitFieldValue fit_decode_field(const FitBaseType* type, const char* data, int size, bool big_endian)
{
  if (type == nullptr) {
    return QByteArray(data, size);
  }

  if (type->kind == FitBaseType::kString) {
    QByteArray raw(data, size);
    auto nul = raw.indexOf('\0');
    if (nul >= 0) {
      raw.truncate(nul);
    }
    if (raw.isEmpty()) {
      return std::monostate();
    }
    return QString::fromUtf8(raw);
  }

  if ((size != type->size) || (type->kind == FitBaseType::kBytes)) {
    // Arrays and byte blobs.  An all 0xff byte blob is the invalid value.
    QByteArray raw(data, size);
    if ((type->kind == FitBaseType::kBytes) && (raw.count('\xff') == size)) {
      return std::monostate();
    }
    return raw;
  }

  uint64_t bits = read_bits(data, size, big_endian);
  if (bits == type->invalid) {
    return std::monostate();
  }

  switch (type->kind) {
  case FitBaseType::kSigned:
    switch (size) {
    case 1:
      return static_cast<int64_t>(static_cast<int8_t>(bits));
    case 2:
      return static_cast<int64_t>(static_cast<int16_t>(bits));
    case 4:
      return static_cast<int64_t>(static_cast<int32_t>(bits));
    default:
      return static_cast<int64_t>(bits);
    }
  case FitBaseType::kFloat:
    if (size == 4) {
      auto u32 = static_cast<uint32_t>(bits);
      float f;
      memcpy(&f, &u32, sizeof(f));
      return static_cast<double>(f);
    } else {
      double d;
      memcpy(&d, &bits, sizeof(d));
      return d;
    }
  default:
    return bits;
  }
}

std::optional<double> fit_value_to_double(const FitFieldValue& value)
{
  return std::visit([](const auto& v) -> std::optional<double> {
    using T = std::decay_t<decltype(v)>;
    if constexpr(std::is_same_v<T, int64_t> || std::is_same_v<T, uint64_t> || std::is_same_v<T, double>) {
      return static_cast<double>(v);
    } else {
      return std::nullopt;
    }
  }, value);
}

std::optional<int64_t> fit_value_to_integer(const FitFieldValue& value)
{
  if (const auto* i = std::get_if<int64_t>(&value)) {
    return *i;
  }
  if (const auto* u = std::get_if<uint64_t>(&value)) {
    if (*u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
      return std::nullopt;
    }
    return static_cast<int64_t>(*u);
  }
  if (const auto* d = std::get_if<double>(&value)) {
    // -2^63 is exact, 2^63 is the first value out of range.
    constexpr double kLimit = 9223372036854775808.0;
    if (!std::isfinite(*d) || *d < -kLimit || *d >= kLimit) {
      return std::nullopt;
    }
    return static_cast<int64_t>(std::trunc(*d));
  }
  return std::nullopt;
}

} // namespace ridelog
