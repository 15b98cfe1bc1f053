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

#include "gpx_writer.h"

#include <utility>                    // for move

#include <QBuffer>                    // for QBuffer
#include <QByteArray>                 // for QByteArray
#include <QIODevice>                  // for QIODevice
#include <QString>                    // for QString, QStringLiteral

#include "defs.h"                     // for global_opts, ridelog_version
#include "errors.h"                   // for NoGeodataError
#include "src/core/datetime.h"        // for DateTime
#include "src/core/logging.h"         // for Debug
#include "src/core/xmlstreamwriter.h" // for XmlStreamWriter

#define MYNAME "gpx"

namespace ridelog
{

GpxWriter::GpxWriter(QString track_name) : track_name_(std::move(track_name))
{
}

void
GpxWriter::gpx_write_header(XmlStreamWriter& writer, const ActivityTrack& track) const
{
  writer.writeStartElement(QStringLiteral("gpx"));
  writer.writeAttribute(QStringLiteral("version"), QStringLiteral("1.1"));
  writer.writeAttribute(QStringLiteral("creator"), QStringLiteral("RideLog %1").arg(ridelog_version));
  writer.writeAttribute(QStringLiteral("xmlns"), QStringLiteral("http://www.topografix.com/GPX/1/1"));
  writer.writeAttribute(QStringLiteral("xmlns:gpxtpx"),
                        QStringLiteral("http://www.garmin.com/xmlschemas/TrackPointExtension/v1"));
  writer.writeAttribute(QStringLiteral("xmlns:pwr"),
                        QStringLiteral("http://www.garmin.com/xmlschemas/PowerExtension/v1"));

  writer.writeStartElement(QStringLiteral("metadata"));
  writer.writeOptionalTextElement(QStringLiteral("name"), track_name_);
  qint64 created = track.time_created().value_or(track.at(0).timestamp);
  writer.writeTextElement(QStringLiteral("time"), DateTime::fromMSecs(created).toPrettyString());
  writer.writeEndElement(); // metadata
}

void
GpxWriter::gpx_write_trkpt(XmlStreamWriter& writer, const Sample& sample)
{
  writer.writeStartElement(QStringLiteral("trkpt"));
  writer.writeAttribute(QStringLiteral("lat"), QString::number(*sample.latitude, 'f', kLatLonPrecision));
  writer.writeAttribute(QStringLiteral("lon"), QString::number(*sample.longitude, 'f', kLatLonPrecision));
  if (sample.altitude) {
    writer.writeTextElement(QStringLiteral("ele"), QString::number(*sample.altitude, 'f', kElevationPrecision));
  }
  writer.writeTextElement(QStringLiteral("time"), DateTime::fromMSecs(sample.timestamp).toPrettyString());

  writer.stackOptionalStartElement(QStringLiteral("extensions"));
  writer.stackOptionalStartElement(QStringLiteral("gpxtpx:TrackPointExtension"));
  if (sample.heart_rate) {
    writer.stackTextElement(QStringLiteral("gpxtpx:hr"), QString::number(*sample.heart_rate));
  }
  if (sample.cadence) {
    writer.stackTextElement(QStringLiteral("gpxtpx:cad"), QString::number(*sample.cadence));
  }
  writer.stackEndElement(); // gpxtpx:TrackPointExtension
  if (sample.power) {
    writer.stackTextElement(QStringLiteral("pwr:PowerInWatts"), QString::number(*sample.power));
  }
  writer.stackEndElement(); // extensions

  writer.writeEndElement(); // trkpt
}

void
GpxWriter::write(const ActivityTrack& track, QIODevice* device) const
{
  if (!track.has_geodata()) {
    throw NoGeodataError(MYNAME ": track has no positions to export.");
  }

  XmlStreamWriter writer(device);
  writer.setAutoFormatting(true);
  writer.setAutoFormattingIndent(2);
  writer.writeStartDocument();

  gpx_write_header(writer, track);

  writer.writeStartElement(QStringLiteral("trk"));
  writer.writeOptionalTextElement(QStringLiteral("name"), track_name_);
  writer.writeStartElement(QStringLiteral("trkseg"));
  int written = 0;
  for (const auto& sample : track.samples()) {
    if (sample.has_position()) {
      gpx_write_trkpt(writer, sample);
      ++written;
    }
  }
  writer.writeEndElement(); // trkseg
  writer.writeEndElement(); // trk

  writer.writeEndElement(); // gpx
  writer.writeEndDocument();

  if (global_opts.debug_level >= 2) {
    Debug(2) << MYNAME ": wrote " << written << " of " << track.size() << " samples";
  }
}

QString
GpxWriter::write(const ActivityTrack& track) const
{
  QByteArray xml;
  QBuffer buffer(&xml);
  buffer.open(QIODevice::WriteOnly);
  write(track, &buffer);
  return QString::fromUtf8(xml);
}

} // namespace ridelog
