/*
    Decoder for Garmin FIT activity recordings.

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

#include "fit_decoder.h"

#include <cstring>              // for memcmp
#include <optional>             // for optional, nullopt
#include <utility>              // for in_range
#include <variant>              // for holds_alternative

#include <QByteArray>           // for QByteArray
#include <QLatin1Char>          // for QLatin1Char
#include <QString>              // for QString, QStringLiteral
#include <Qt>                   // for hex, dec

#include "defs.h"               // for global_opts, le_read16, le_read32, be_read16
#include "errors.h"             // for MalformedHeaderError, TruncatedStreamError, UnsupportedVersionError
#include "src/core/logging.h"   // for Debug, Warning

#define MYNAME "fit"

namespace ridelog
{

namespace
{

constexpr double kSemicirclesToDegrees = 180.0 / 2147483648.0;

qint64 fit_time_to_msecs(uint32_t fit_time)
{
  return (static_cast<qint64>(fit_time) + FitDecoder::kFitEpochOffset) * 1000;
}

// Integer field values narrowed to the type we store them in.  A vendor may
// declare any base type for a field, so values that do not fit are absent.
template<typename T>
std::optional<T> fit_field_as(const FitFieldValue& value, int field_id)
{
  if (std::holds_alternative<std::monostate>(value)) {
    return std::nullopt;
  }
  std::optional<int64_t> i = fit_value_to_integer(value);
  if (!i || !std::in_range<T>(*i)) {
    if (global_opts.debug_level >= 1) {
      Debug(1) << MYNAME ": value of field " << field_id << " out of range, ignored";
    }
    return std::nullopt;
  }
  return static_cast<T>(*i);
}

void fit_warning(TrackBuilder& builder, const QString& message)
{
  Warning() << MYNAME ": " << message;
  builder.add_warning(message);
}

} // namespace

/*******************************************************************************
* fit_parse_header- validate the global FIT header and locate the data records
*******************************************************************************/
void
FitDecoder::fit_parse_header(const QByteArray& data, fit_data_t& fit_data)
{
  if (data.size() < kReadHeaderLen) {
    throw MalformedHeaderError(QStringLiteral(MYNAME ": File of %1 bytes is too short to hold a header.").arg(data.size()));
  }
  const char* buf = data.constData();

  int len = static_cast<uint8_t>(buf[0]);
  if (len < kReadHeaderLen || len > data.size()) {
    throw MalformedHeaderError(QStringLiteral(MYNAME ": Bad header length %1.").arg(len));
  }
  if (global_opts.debug_level >= 1) {
    Debug(1) << MYNAME ": header len=" << len;
  }

  if (memcmp(buf + 8, ".FIT", 4) != 0) {
    throw MalformedHeaderError(MYNAME ": .FIT signature missing.");
  }

  int ver = static_cast<uint8_t>(buf[1]);
  if ((ver >> 4) > 2) {
    throw UnsupportedVersionError(QStringLiteral(MYNAME ": Unsupported protocol version %1.%2.")
                                  .arg(ver >> 4).arg(ver & 0xf));
  }

  uint16_t profile = le_read16(buf + 2);
  uint32_t data_len = le_read32(buf + 4);
  if (global_opts.debug_level >= 1) {
    Debug(1) << MYNAME ": protocol version=" << ver;
    Debug(1) << MYNAME ": profile version=" << profile;
    Debug(1) << MYNAME ": data length=" << data_len;
  }

  // Header CRC may be omitted entirely, or be set to 0.
  if (len >= kReadHeaderCrcLen) {
    uint16_t hdr_crc = le_read16(buf + kReadHeaderLen);
    if (hdr_crc != 0) {
      if (crc16(buf, kReadHeaderCrcLen) != 0) {
        throw MalformedHeaderError(MYNAME ": Header CRC mismatch.");
      }
      if (global_opts.debug_level >= 1) {
        Debug(1) << MYNAME ": Header CRC verified.";
      }
    }
  }

  qint64 expected = static_cast<qint64>(len) + data_len;
  if (data.size() != expected && data.size() != expected + 2) {
    throw MalformedHeaderError(QStringLiteral(MYNAME ": File size %1 is not expected given header len %2 and data length %3.")
                               .arg(data.size()).arg(len).arg(data_len));
  }

  fit_data.builder.set_source_format(QStringLiteral("FIT %1.%2 profile %3.%4")
                                     .arg(ver >> 4).arg(ver & 0xf)
                                     .arg(profile / 100).arg(profile % 100, 2, 10, QLatin1Char('0')));

  if (data.size() == expected + 2) {
    if (crc16(buf, data.size()) != 0) {
      fit_warning(fit_data.builder, QStringLiteral("File CRC mismatch."));
    } else if (global_opts.debug_level >= 1) {
      Debug(1) << MYNAME ": File CRC verified.";
    }
  }

  fit_data.buf = buf;
  fit_data.pos = len;
  fit_data.end = expected;
}

const char*
FitDecoder::fit_getbytes(fit_data_t& fit_data, int size)
{
  qsizetype remaining = fit_data.end - fit_data.pos;
  if (remaining < size) {
    throw TruncatedRecordException(
      QStringLiteral("record truncated: expecting %1 bytes, but only %2 remain at file position 0x%3.")
      .arg(size).arg(remaining).arg(fit_data.pos, 0, 16).toStdString());
  }
  const char* p = fit_data.buf + fit_data.pos;
  fit_data.pos += size;
  return p;
}

uint8_t
FitDecoder::fit_getuint8(fit_data_t& fit_data)
{
  return static_cast<uint8_t>(*fit_getbytes(fit_data, 1));
}

uint16_t
FitDecoder::fit_getuint16(fit_data_t& fit_data, int endian)
{
  const char* p = fit_getbytes(fit_data, 2);
  if (endian) {
    return be_read16(p);
  } else {
    return le_read16(p);
  }
}

void
FitDecoder::fit_parse_definition_message(fit_data_t& fit_data, uint8_t header)
{
  int local_id = header & 0x0f;
  fit_message_def def;

  // first byte is reserved.
  (void) fit_getuint8(fit_data);

  // second byte is endianness
  def.endian = fit_getuint8(fit_data);
  if (def.endian > 1) {
    throw ReaderException(QStringLiteral("Bad endian field 0x%1 at file position 0x%2.")
                          .arg(def.endian, 0, 16).arg(fit_data.pos - 1, 0, 16).toStdString());
  }

  // next two bytes are the global message number
  def.global_id = fit_getuint16(fit_data, def.endian);

  int num_fields = fit_getuint8(fit_data);
  if (global_opts.debug_level >= 8) {
    Debug(8) << MYNAME ": definition message for global id " << def.global_id
             << " contains " << num_fields << " fields";
  }

  for (int i = 0; i < num_fields; ++i) {
    fit_field_t field;
    field.id = fit_getuint8(fit_data);
    field.size = fit_getuint8(fit_data);
    field.type = fit_getuint8(fit_data);
    if (global_opts.debug_level >= 8) {
      Debug(8) << MYNAME ": field " << i << "  ID: " << field.id << "  SIZE: "
               << field.size << "  TYPE: 0x" << Qt::hex << field.type << Qt::dec;
    }
    def.fields.append(field);
  }

  // Bit 5 of the header announces developer field definitions, since
  // protocol 2.0.  The third byte of each is the developer data index.
  if (header & 0x20) {
    int num_dev_fields = fit_getuint8(fit_data);
    if (global_opts.debug_level >= 8) {
      Debug(8) << MYNAME ": definition message contains " << num_dev_fields << " developer fields";
    }
    for (int i = 0; i < num_dev_fields; ++i) {
      fit_field_t field;
      field.id = fit_getuint8(fit_data);
      field.size = fit_getuint8(fit_data);
      field.type = fit_getuint8(fit_data);
      field.developer = true;
      def.fields.append(field);
    }
  }

  fit_data.message_def.insert(local_id, def);
}

// A compressed header carries the low five bits of the timestamp.
uint32_t
FitDecoder::fit_apply_time_offset(uint32_t last_timestamp, int time_offset)
{
  uint32_t timestamp = (last_timestamp & ~0x1fU) + time_offset;
  if (static_cast<uint32_t>(time_offset) < (last_timestamp & 0x1fU)) {
    timestamp += 0x20;
  }
  return timestamp;
}

void
FitDecoder::fit_parse_data(fit_data_t& fit_data, const fit_message_def& def, bool compressed, int time_offset) const
{
  std::optional<uint32_t> timestamp;
  if (compressed && fit_data.have_timestamp) {
    timestamp = fit_apply_time_offset(fit_data.last_timestamp, time_offset);
    fit_data.last_timestamp = *timestamp;
  }

  Sample sample;
  std::optional<double> enhanced_speed;
  std::optional<double> enhanced_altitude;
  std::optional<int> manufacturer;
  std::optional<int> product;
  bool retain = options_.unknown_fields == UnknownFieldPolicy::kRetain;

  if (global_opts.debug_level >= 7) {
    Debug(7) << MYNAME ": parsing fit data ID " << def.global_id << " with num_fields=" << def.fields.size();
  }
  if (def.global_id != kIdFileId && def.global_id != kIdDeviceSettings &&
      def.global_id != kIdRecord && global_opts.debug_level >= 6) {
    Debug(6) << MYNAME ": skipping message with global id " << def.global_id;
  }

  for (const auto& f : def.fields) {
    const char* raw = fit_getbytes(fit_data, f.size);

    if (f.developer) {
      if (retain && def.global_id == kIdRecord) {
        sample.extra.insert(Sample::kDeveloperKey | (f.type << 8) | f.id, QByteArray(raw, f.size));
      }
      continue;
    }

    FitFieldValue value = fit_decode_field(fit_base_type(f.type), raw, f.size, def.endian);
    std::optional<double> val = fit_value_to_double(value);

    if (f.id == kFieldTimestamp) {
      if (auto ts = fit_field_as<uint32_t>(value, f.id)) {
        uint32_t t = *ts;
        // system time is converted to UTC with the global utc offset
        if (t < kSystemTimeLimit) {
          t += fit_data.global_utc_offset;
        }
        if (global_opts.debug_level >= 7) {
          Debug(7) << MYNAME ": parsing fit data: timestamp=" << t;
        }
        timestamp = t;
        fit_data.last_timestamp = t;
        fit_data.have_timestamp = true;
      }
      continue;
    }

    switch (def.global_id) {
    case kIdFileId:
      switch (f.id) {
      case kFieldManufacturer:
        manufacturer = fit_field_as<int>(value, f.id);
        break;
      case kFieldProduct:
        product = fit_field_as<int>(value, f.id);
        break;
      case kFieldTimeCreated:
        if (auto created = fit_field_as<uint32_t>(value, f.id)) {
          fit_data.builder.set_time_created(fit_time_to_msecs(*created));
        }
        break;
      default:
        break;
      }
      break;

    case kIdDeviceSettings:
      if (f.id == kFieldUtcOffset) {
        if (auto offset = fit_field_as<uint32_t>(value, f.id)) {
          if (global_opts.debug_level >= 7) {
            Debug(7) << MYNAME ": parsing fit data: global utc_offset=" << *offset;
          }
          fit_data.global_utc_offset = *offset;
        }
      }
      break;

    case kIdRecord:
      if (global_opts.debug_level >= 7) {
        Debug(7) << MYNAME ": parsing fit data: field " << f.id << "=" << (val ? *val : -1);
      }
      switch (f.id) {
      case kFieldLatitude:
        if (val) {
          sample.latitude = *val * kSemicirclesToDegrees;
        }
        break;
      case kFieldLongitude:
        if (val) {
          sample.longitude = *val * kSemicirclesToDegrees;
        }
        break;
      case kFieldAltitude:
        if (val) {
          sample.altitude = (*val / 5.0) - 500;
        }
        break;
      case kFieldHeartRate:
        sample.heart_rate = fit_field_as<int>(value, f.id);
        break;
      case kFieldCadence:
        sample.cadence = fit_field_as<int>(value, f.id);
        break;
      case kFieldDistance:
        if (val) {
          sample.distance = *val / 100.0;
        }
        break;
      case kFieldSpeed:
        if (val) {
          sample.speed = *val / 1000.0;
        }
        break;
      case kFieldPower:
        sample.power = fit_field_as<int>(value, f.id);
        break;
      case kFieldEnhancedSpeed:
        if (val) {
          enhanced_speed = *val / 1000.0;
        }
        break;
      case kFieldEnhancedAltitude:
        if (val) {
          enhanced_altitude = (*val / 5.0) - 500;
        }
        break;
      default:
        if (retain && !std::holds_alternative<std::monostate>(value)) {
          sample.extra.insert(f.id, QByteArray(raw, f.size));
        }
        if (global_opts.debug_level >= 1) {
          Debug(1) << MYNAME ": unrecognized field in GARMIN FIT record: f.id=" << f.id;
        }
        break;
      }
      break;

    default:
      break;
    }
  }

  switch (def.global_id) {
  case kIdFileId:
    if (manufacturer || product) {
      fit_data.builder.set_device(manufacturer, product);
    }
    break;

  case kIdRecord:
    if (enhanced_speed) {
      sample.speed = enhanced_speed;
    }
    if (enhanced_altitude) {
      sample.altitude = enhanced_altitude;
    }
    if (!timestamp) {
      if (!fit_data.have_timestamp) {
        if (!fit_data.untimed_reported) {
          fit_data.untimed_reported = true;
          fit_warning(fit_data.builder, QStringLiteral("Dropping records that precede the first timestamp."));
        }
        break;
      }
      timestamp = fit_data.last_timestamp;
    }
    sample.timestamp = fit_time_to_msecs(*timestamp);
    fit_data.builder.add_sample(sample);
    break;

  default:
    break;
  }
}

void
FitDecoder::fit_parse_data_message(fit_data_t& fit_data, uint8_t header) const
{
  int local_id = header & 0x0f;
  if (fit_data.message_def.contains(local_id)) {
    fit_parse_data(fit_data, fit_data.message_def.value(local_id), false, 0);
  } else {
    throw ReaderException(
      QStringLiteral("Message %1 hasn't been defined before being used at file position 0x%2.")
      .arg(local_id).arg(fit_data.pos - 1, 0, 16).toStdString());
  }
}

void
FitDecoder::fit_parse_compressed_message(fit_data_t& fit_data, uint8_t header) const
{
  int local_id = (header >> 5) & 3;
  if (fit_data.message_def.contains(local_id)) {
    fit_parse_data(fit_data, fit_data.message_def.value(local_id), true, header & 0x1f);
  } else {
    throw ReaderException(
      QStringLiteral("Compressed message %1 hasn't been defined before being used at file position 0x%2.")
      .arg(local_id).arg(fit_data.pos - 1, 0, 16).toStdString());
  }
}

/*******************************************************************************
* fit_parse_record- parse each record in the file
*******************************************************************************/
void
FitDecoder::fit_parse_record(fit_data_t& fit_data) const
{
  qsizetype position = fit_data.pos;
  uint8_t header = fit_getuint8(fit_data);
  // bit 7 set -> compressed timestamp message, local type in bits 6..5
  // bit 6 set -> definition message, else data message
  // bit 5 -> definition message carries developer field definitions
  // bits 3..0 -> local message type
  if (header & 0x80) {
    if (global_opts.debug_level >= 6) {
      Debug(6) << MYNAME ": got compressed message at file position 0x" << Qt::hex << position
               << " ...local message type 0x" << ((header >> 5) & 3) << Qt::dec;
    }
    fit_parse_compressed_message(fit_data, header);
  } else if (header & 0x40) {
    if (global_opts.debug_level >= 6) {
      Debug(6) << MYNAME ": got definition message at file position 0x" << Qt::hex << position
               << " ...local message type 0x" << (header & 0x0f) << Qt::dec;
    }
    fit_parse_definition_message(fit_data, header);
  } else {
    if (global_opts.debug_level >= 6) {
      Debug(6) << MYNAME ": got data message at file position 0x" << Qt::hex << position
               << " ...local message type 0x" << (header & 0x0f) << Qt::dec;
    }
    fit_parse_data_message(fit_data, header);
  }
}

/*******************************************************************************
* decode- global entry point
* - validate the header
* - parse all the records in the data region
*******************************************************************************/
ActivityTrack
FitDecoder::decode(const QByteArray& data) const
{
  fit_data_t fit_data;
  fit_parse_header(data, fit_data);

  if (global_opts.debug_level >= 1) {
    Debug(1) << MYNAME ": starting to read " << (fit_data.end - fit_data.pos) << " bytes of data";
  }
  try {
    while (fit_data.pos < fit_data.end) {
      fit_parse_record(fit_data);
    }
  } catch (const TruncatedRecordException& e) {
    if (fit_data.builder.sample_count() == 0) {
      throw TruncatedStreamError(QStringLiteral(MYNAME ": %1").arg(e.what()));
    }
    fit_warning(fit_data.builder, QStringLiteral("%1 Keeping the %2 samples read so far.")
                .arg(e.what()).arg(fit_data.builder.sample_count()));
  } catch (const ReaderException& e) {
    fit_warning(fit_data.builder, QStringLiteral("%1 Keeping the %2 samples read so far.")
                .arg(e.what()).arg(fit_data.builder.sample_count()));
  }

  if (global_opts.debug_level >= 1) {
    Debug(1) << MYNAME ": decoded " << fit_data.builder.sample_count() << " samples";
  }
  return fit_data.builder.build();
}

uint16_t
FitDecoder::crc16(uint8_t data, uint16_t crc)
{
  static const uint16_t crc_table[] = {
    0x0000, 0xcc01, 0xd801, 0x1400, 0xf001, 0x3c00, 0x2800, 0xe401,
    0xa001, 0x6c00, 0x7800, 0xb401, 0x5000, 0x9c01, 0x8801, 0x4400
  };

  crc = (crc >> 4) ^ crc_table[crc & 0xf] ^ crc_table[data & 0xf];
  crc = (crc >> 4) ^ crc_table[crc & 0xf] ^ crc_table[(data >> 4) & 0xf];
  return crc;
}

uint16_t
FitDecoder::crc16(const char* data, qsizetype len, uint16_t crc)
{
  for (qsizetype i = 0; i < len; ++i) {
    crc = crc16(static_cast<uint8_t>(data[i]), crc);
  }
  return crc;
}

} // namespace ridelog
