/*
    GPX 1.1 export of activity tracks.

    Copyright (C) 2002-2015 Robert Lipe, gpsbabel.org
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
#ifndef GPX_WRITER_H_INCLUDED_
#define GPX_WRITER_H_INCLUDED_

#include <QIODevice>  // for QIODevice
#include <QString>    // for QString

#include "track.h"    // for ActivityTrack, Sample

namespace ridelog
{

class XmlStreamWriter;

class GpxWriter
{
public:
  explicit GpxWriter(QString track_name = QStringLiteral("Ride"));

  /*
   * One trkpt per sample with a position, samples without one are left
   * out.  Throws NoGeodataError when no sample has a position.
   */
  QString write(const ActivityTrack& track) const;
  void write(const ActivityTrack& track, QIODevice* device) const;

  static constexpr int kLatLonPrecision = 9;
  static constexpr int kElevationPrecision = 3;

private:
  void gpx_write_header(XmlStreamWriter& writer, const ActivityTrack& track) const;
  static void gpx_write_trkpt(XmlStreamWriter& writer, const Sample& sample);

  QString track_name_;
};

} // namespace ridelog

#endif // GPX_WRITER_H_INCLUDED_
