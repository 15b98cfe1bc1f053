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
#ifndef FIT_DECODER_H_INCLUDED_
#define FIT_DECODER_H_INCLUDED_

#include <cstdint>              // for uint8_t, uint16_t, uint32_t
#include <stdexcept>            // for runtime_error

#include <QByteArray>           // for QByteArray
#include <QHash>                // for QHash
#include <QList>                // for QList
#include <QtGlobal>             // for qsizetype

#include "fit_types.h"          // for FitFieldValue
#include "track.h"              // for ActivityTrack, TrackBuilder, Sample

namespace ridelog
{

enum class UnknownFieldPolicy {
  kDrop,    // fields without a Sample column are discarded
  kRetain   // and kept as opaque bytes in Sample::extra
};

class FitDecoder
{
public:
  struct Options {
    UnknownFieldPolicy unknown_fields{UnknownFieldPolicy::kDrop};
  };

  FitDecoder() = default;
  explicit FitDecoder(const Options& options) : options_(options) {}

  /*
   * Decode a complete FIT file held in memory.
   *
   * Throws MalformedHeaderError, UnsupportedVersionError or
   * TruncatedStreamError when nothing usable can be recovered.  Damage
   * after the first sample stops the decode and is reported in the
   * warnings of the returned track.
   */
  ActivityTrack decode(const QByteArray& data) const;

  static uint16_t crc16(uint8_t data, uint16_t crc);
  static uint16_t crc16(const char* data, qsizetype len, uint16_t crc = 0);

  /* Constants */

  static constexpr int kReadHeaderLen = 12;
  static constexpr int kReadHeaderCrcLen = 14;

  // Seconds between the Unix epoch and the FIT epoch, 1989-12-31T00:00:00Z.
  static constexpr qint64 kFitEpochOffset = 631065600;

  // Timestamps below this are relative to device power up.
  static constexpr uint32_t kSystemTimeLimit = 0x10000000;

// constants for global IDs
  static constexpr int kIdFileId = 0;
  static constexpr int kIdDeviceSettings = 2;
  static constexpr int kIdRecord = 20;

// constants for message fields
// for all global IDs
  static constexpr int kFieldTimestamp = 253;
// for global ID: file id
  static constexpr int kFieldManufacturer = 1;
  static constexpr int kFieldProduct = 2;
  static constexpr int kFieldTimeCreated = 4;
// for global ID: device settings
  static constexpr int kFieldUtcOffset = 1;
// for global ID: record
  static constexpr int kFieldLatitude = 0;
  static constexpr int kFieldLongitude = 1;
  static constexpr int kFieldAltitude = 2;
  static constexpr int kFieldHeartRate = 3;
  static constexpr int kFieldCadence = 4;
  static constexpr int kFieldDistance = 5;
  static constexpr int kFieldSpeed = 6;
  static constexpr int kFieldPower = 7;
  static constexpr int kFieldEnhancedSpeed = 73;
  static constexpr int kFieldEnhancedAltitude = 78;

private:
  /* Types */

  struct fit_field_t {
    int id{};
    int size{};
    int type{};
    bool developer{false};  // type holds the developer data index
  };

  struct fit_message_def {
    int endian{};
    int global_id{};
    QList<fit_field_t> fields;
  };

  // Everything that lives for one call of decode().
  struct fit_data_t {
    const char* buf{nullptr};
    qsizetype pos{};
    qsizetype end{};
    uint32_t last_timestamp{};
    bool have_timestamp{false};
    bool untimed_reported{false};
    uint32_t global_utc_offset{};
    QHash<int, fit_message_def> message_def;
    TrackBuilder builder;
  };

  // Damage that makes the remainder of the data region unreadable.
  class ReaderException : public std::runtime_error
  {
    using std::runtime_error::runtime_error;
  };

  // The data region ended in the middle of a record.
  class TruncatedRecordException : public ReaderException
  {
    using ReaderException::ReaderException;
  };

  /* Member Functions */

  static void fit_parse_header(const QByteArray& data, fit_data_t& fit_data);
  static const char* fit_getbytes(fit_data_t& fit_data, int size);
  static uint8_t fit_getuint8(fit_data_t& fit_data);
  static uint16_t fit_getuint16(fit_data_t& fit_data, int endian);
  static void fit_parse_definition_message(fit_data_t& fit_data, uint8_t header);
  void fit_parse_data(fit_data_t& fit_data, const fit_message_def& def, bool compressed, int time_offset) const;
  void fit_parse_data_message(fit_data_t& fit_data, uint8_t header) const;
  void fit_parse_compressed_message(fit_data_t& fit_data, uint8_t header) const;
  void fit_parse_record(fit_data_t& fit_data) const;
  static uint32_t fit_apply_time_offset(uint32_t last_timestamp, int time_offset);

  /* Data Members */

  Options options_;
};

} // namespace ridelog

#endif // FIT_DECODER_H_INCLUDED_
