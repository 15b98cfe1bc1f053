/*
    Compact storage encoding for activity tracks.

    Copyright (C) 2020 Pierre Bernard, pierre.bernard@houdah.com
    Copyright (C) 2001-2020 Robert Lipe, robertlipe+source@gpsbabel.org
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

#include "track_codec.h"

#include <cstring>             // for memcmp
#include <optional>            // for optional

#include <QByteArray>          // for QByteArray, qCompress, qUncompress, qChecksum
#include <QDataStream>         // for QDataStream
#include <QIODevice>           // for QIODevice
#include <QString>             // for QString, QStringLiteral
#include <QStringList>         // for QStringList

#include "defs.h"              // for global_opts
#include "errors.h"            // for CorruptBlobError
#include "src/core/logging.h"  // for Debug

#define MYNAME "codec"

namespace ridelog
{

void TrackCodec::configure(QDataStream& stream)
{
  stream.setVersion(QDataStream::Qt_6_0);
  stream.setByteOrder(QDataStream::BigEndian);
  stream.setFloatingPointPrecision(QDataStream::DoublePrecision);
}

void TrackCodec::write_sample(QDataStream& stream, const Sample& sample)
{
  quint16 mask = 0;
  if (sample.latitude) {
    mask |= kHasLatitude;
  }
  if (sample.longitude) {
    mask |= kHasLongitude;
  }
  if (sample.altitude) {
    mask |= kHasAltitude;
  }
  if (sample.distance) {
    mask |= kHasDistance;
  }
  if (sample.speed) {
    mask |= kHasSpeed;
  }
  if (sample.power) {
    mask |= kHasPower;
  }
  if (sample.cadence) {
    mask |= kHasCadence;
  }
  if (sample.heart_rate) {
    mask |= kHasHeartRate;
  }
  if (!sample.extra.isEmpty()) {
    mask |= kHasExtra;
  }

  stream << mask;
  stream << static_cast<qint64>(sample.timestamp);
  if (sample.latitude) {
    stream << *sample.latitude;
  }
  if (sample.longitude) {
    stream << *sample.longitude;
  }
  if (sample.altitude) {
    stream << *sample.altitude;
  }
  if (sample.distance) {
    stream << *sample.distance;
  }
  if (sample.speed) {
    stream << *sample.speed;
  }
  if (sample.power) {
    stream << static_cast<qint32>(*sample.power);
  }
  if (sample.cadence) {
    stream << static_cast<qint32>(*sample.cadence);
  }
  if (sample.heart_rate) {
    stream << static_cast<qint32>(*sample.heart_rate);
  }
  if (!sample.extra.isEmpty()) {
    stream << static_cast<quint32>(sample.extra.size());
    for (auto it = sample.extra.cbegin(); it != sample.extra.cend(); ++it) {
      stream << static_cast<qint32>(it.key()) << it.value();
    }
  }
}

Sample TrackCodec::read_sample(QDataStream& stream)
{
  Sample sample;
  quint16 mask;
  qint64 timestamp;

  stream >> mask;
  stream >> timestamp;
  if (mask & ~kKnownFields) {
    throw CorruptBlobError(QStringLiteral(MYNAME ": unknown sample field mask 0x%1.").arg(mask, 0, 16));
  }
  sample.timestamp = timestamp;

  auto read_double = [&stream](std::optional<double>& field) {
    double value;
    stream >> value;
    field = value;
  };
  auto read_int = [&stream](std::optional<int>& field) {
    qint32 value;
    stream >> value;
    field = value;
  };

  if (mask & kHasLatitude) {
    read_double(sample.latitude);
  }
  if (mask & kHasLongitude) {
    read_double(sample.longitude);
  }
  if (mask & kHasAltitude) {
    read_double(sample.altitude);
  }
  if (mask & kHasDistance) {
    read_double(sample.distance);
  }
  if (mask & kHasSpeed) {
    read_double(sample.speed);
  }
  if (mask & kHasPower) {
    read_int(sample.power);
  }
  if (mask & kHasCadence) {
    read_int(sample.cadence);
  }
  if (mask & kHasHeartRate) {
    read_int(sample.heart_rate);
  }
  if (mask & kHasExtra) {
    quint32 count;
    stream >> count;
    for (quint32 i = 0; i < count && stream.status() == QDataStream::Ok; ++i) {
      qint32 key;
      QByteArray value;
      stream >> key >> value;
      sample.extra.insert(key, value);
    }
  }

  if (stream.status() != QDataStream::Ok) {
    throw CorruptBlobError(MYNAME ": sample record is truncated.");
  }
  return sample;
}

QByteArray TrackCodec::encode(const ActivityTrack& track)
{
  QByteArray body;
  {
    QDataStream stream(&body, QIODevice::WriteOnly);
    configure(stream);

    quint8 flags = 0;
    if (track.manufacturer_) {
      flags |= kHasManufacturer;
    }
    if (track.product_) {
      flags |= kHasProduct;
    }
    if (track.time_created_) {
      flags |= kHasTimeCreated;
    }

    stream << track.source_format_;
    stream << flags;
    if (track.manufacturer_) {
      stream << static_cast<qint32>(*track.manufacturer_);
    }
    if (track.product_) {
      stream << static_cast<qint32>(*track.product_);
    }
    if (track.time_created_) {
      stream << static_cast<qint64>(*track.time_created_);
    }
    stream << track.warnings_;

    stream << static_cast<quint32>(track.samples_.size());
    for (const auto& sample : track.samples_) {
      write_sample(stream, sample);
    }
  }

  QByteArray compressed = qCompress(body);

  QByteArray blob;
  QDataStream stream(&blob, QIODevice::WriteOnly);
  configure(stream);
  stream.writeRawData(kMagic, 4);
  stream << kVersion;
  stream << static_cast<quint16>(qChecksum(compressed));
  stream << static_cast<quint32>(body.size());
  stream.writeRawData(compressed.constData(), compressed.size());

  if (global_opts.debug_level >= 2) {
    Debug(2) << MYNAME ": encoded " << track.size() << " samples in " << blob.size()
             << " bytes, " << body.size() << " uncompressed";
  }
  return blob;
}

ActivityTrack TrackCodec::decode(const QByteArray& blob)
{
  if (blob.size() < kHeaderLen) {
    throw CorruptBlobError(QStringLiteral(MYNAME ": blob of %1 bytes is too short.").arg(blob.size()));
  }
  if (memcmp(blob.constData(), kMagic, 4) != 0) {
    throw CorruptBlobError(MYNAME ": bad magic, not a track blob.");
  }

  QDataStream header(blob);
  configure(header);
  header.skipRawData(4);
  quint16 version;
  quint16 crc;
  quint32 length;
  header >> version >> crc >> length;

  if (version != kVersion) {
    throw CorruptBlobError(QStringLiteral(MYNAME ": unsupported blob version %1.").arg(version));
  }

  QByteArray compressed = blob.mid(kHeaderLen);
  if (qChecksum(compressed) != crc) {
    throw CorruptBlobError(MYNAME ": checksum mismatch.");
  }

  QByteArray body = qUncompress(compressed);
  if (body.isEmpty() || static_cast<quint32>(body.size()) != length) {
    throw CorruptBlobError(QStringLiteral(MYNAME ": body length %1 does not match the stored %2.")
                           .arg(body.size()).arg(length));
  }

  QDataStream stream(body);
  configure(stream);

  ActivityTrack track;
  quint8 flags;
  stream >> track.source_format_;
  stream >> flags;
  if (flags & kHasManufacturer) {
    qint32 manufacturer;
    stream >> manufacturer;
    track.manufacturer_ = manufacturer;
  }
  if (flags & kHasProduct) {
    qint32 product;
    stream >> product;
    track.product_ = product;
  }
  if (flags & kHasTimeCreated) {
    qint64 time_created;
    stream >> time_created;
    track.time_created_ = time_created;
  }
  stream >> track.warnings_;

  quint32 count;
  stream >> count;
  if (stream.status() != QDataStream::Ok) {
    throw CorruptBlobError(MYNAME ": track record is truncated.");
  }
  qint64 remaining = body.size() - stream.device()->pos();
  if (count > remaining / kMinSampleLen) {
    throw CorruptBlobError(QStringLiteral(MYNAME ": %1 samples cannot fit in %2 bytes.").arg(count).arg(remaining));
  }

  track.samples_.reserve(count);
  for (quint32 i = 0; i < count; ++i) {
    track.samples_.append(read_sample(stream));
  }

  if (!stream.atEnd()) {
    throw CorruptBlobError(MYNAME ": trailing data after the last sample.");
  }

  if (global_opts.debug_level >= 2) {
    Debug(2) << MYNAME ": decoded " << track.size() << " samples";
  }
  return track;
}

} // namespace ridelog
