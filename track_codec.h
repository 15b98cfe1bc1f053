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
#ifndef TRACK_CODEC_H_INCLUDED_
#define TRACK_CODEC_H_INCLUDED_

#include <QByteArray>   // for QByteArray
#include <QDataStream>  // for QDataStream
#include <QtGlobal>     // for quint16, quint32

#include "track.h"      // for ActivityTrack, Sample

namespace ridelog
{

/*
 * Blob layout, all integers big endian:
 *
 *   char[4]  magic "RLTK"
 *   quint16  format version
 *   quint16  CRC-16 (ISO 3309) of the compressed body
 *   quint32  uncompressed body length
 *   ...      qCompress()ed QDataStream body
 *
 * The body holds the track provenance followed by the samples, each
 * prefixed by a mask of the optional fields that follow.  Doubles are
 * stored as IEEE-754 binary64, so a round trip is exact.
 */
class TrackCodec
{
public:
  static QByteArray encode(const ActivityTrack& track);

  // Throws CorruptBlobError on any mismatch.  Never repairs.
  static ActivityTrack decode(const QByteArray& blob);

  /* Constants */

  static constexpr char kMagic[] = "RLTK";
  static constexpr quint16 kVersion = 1;
  static constexpr int kHeaderLen = 12;

private:
  /* Types */

  enum SampleField : quint16 {
    kHasLatitude   = 1 << 0,
    kHasLongitude  = 1 << 1,
    kHasAltitude   = 1 << 2,
    kHasDistance   = 1 << 3,
    kHasSpeed      = 1 << 4,
    kHasPower      = 1 << 5,
    kHasCadence    = 1 << 6,
    kHasHeartRate  = 1 << 7,
    kHasExtra      = 1 << 8,
    kKnownFields   = (1 << 9) - 1
  };

  enum TrackField : quint8 {
    kHasManufacturer = 1 << 0,
    kHasProduct      = 1 << 1,
    kHasTimeCreated  = 1 << 2
  };

  // Smallest encoded sample, a mask and a timestamp.
  static constexpr int kMinSampleLen = 2 + 8;

  /* Member Functions */

  static void write_sample(QDataStream& stream, const Sample& sample);
  static Sample read_sample(QDataStream& stream);
  static void configure(QDataStream& stream);
};

} // namespace ridelog

#endif // TRACK_CODEC_H_INCLUDED_
