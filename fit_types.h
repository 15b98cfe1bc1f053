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
#ifndef FIT_TYPES_H_INCLUDED_
#define FIT_TYPES_H_INCLUDED_

#include <cstdint>     // for uint8_t, int64_t, uint64_t
#include <optional>    // for optional
#include <variant>     // for variant, monostate

#include <QByteArray>  // for QByteArray
#include <QString>     // for QString

namespace ridelog
{

/*
 * A field value after the base type decode table has been applied.
 * monostate is the "invalid" sentinel, i.e. the field is absent.
 * Integers keep their signedness, arrays and opaque blobs stay raw.
 */
using FitFieldValue = std::variant<std::monostate, int64_t, uint64_t, double, QString, QByteArray>;

struct FitBaseType {
  enum Kind {
    kSigned,
    kUnsigned,
    kFloat,
    kString,
    kBytes
  };

  uint8_t id;
  uint8_t size;
  Kind kind;
  uint64_t invalid;  // raw bit pattern flagging "no value"
  const char* name;
};

// Base type ids as they appear in definition messages.
constexpr uint8_t kFitEnum = 0x00;
constexpr uint8_t kFitSint8 = 0x01;
constexpr uint8_t kFitUint8 = 0x02;
constexpr uint8_t kFitString = 0x07;
constexpr uint8_t kFitUint8z = 0x0a;
constexpr uint8_t kFitByte = 0x0d;
constexpr uint8_t kFitSint16 = 0x83;
constexpr uint8_t kFitUint16 = 0x84;
constexpr uint8_t kFitSint32 = 0x85;
constexpr uint8_t kFitUint32 = 0x86;
constexpr uint8_t kFitFloat32 = 0x88;
constexpr uint8_t kFitFloat64 = 0x89;
constexpr uint8_t kFitUint16z = 0x8b;
constexpr uint8_t kFitUint32z = 0x8c;
constexpr uint8_t kFitSint64 = 0x8e;
constexpr uint8_t kFitUint64 = 0x8f;
constexpr uint8_t kFitUint64z = 0x90;

// Returns nullptr for base types we have no entry for.
const FitBaseType* fit_base_type(uint8_t id);

// Decode size bytes at data.  A size that is not the base type size is an
// array and comes back as raw bytes, as does anything of unknown type.
FitFieldValue fit_decode_field(const FitBaseType* type, const char* data, int size, bool big_endian);

std::optional<double> fit_value_to_double(const FitFieldValue& value);

// The integer value of a field.  Floating point values are truncated;
// anything that does not fit an int64_t comes back empty.
std::optional<int64_t> fit_value_to_integer(const FitFieldValue& value);

} // namespace ridelog

#endif // FIT_TYPES_H_INCLUDED_
