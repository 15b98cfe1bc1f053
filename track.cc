/*
    The normalized activity time series.

    Copyright (C) 2002-2013 Robert Lipe, robertlipe+source@gpsbabel.org
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

#include "track.h"

#include <algorithm>           // for any_of, count_if
#include <optional>            // for optional
#include <utility>             // for move

#include <QDebug>              // for QDebug, QDebugStateSaver
#include <QString>             // for QString

#include "src/core/datetime.h" // for DateTime
#include "src/core/logging.h"  // for Warning

namespace ridelog
{

bool ActivityTrack::has_geodata() const
{
  return std::any_of(samples_.cbegin(), samples_.cend(), [](const Sample& s) {
    return s.has_position();
  });
}

int ActivityTrack::geodata_count() const
{
  return std::count_if(samples_.cbegin(), samples_.cend(), [](const Sample& s) {
    return s.has_position();
  });
}

TrackBuilder::TrackBuilder(const QString& source_format)
{
  track_.source_format_ = source_format;
}

void TrackBuilder::set_source_format(const QString& format)
{
  track_.source_format_ = format;
}

void TrackBuilder::set_device(std::optional<int> manufacturer, std::optional<int> product)
{
  track_.manufacturer_ = manufacturer;
  track_.product_ = product;
}

void TrackBuilder::set_time_created(qint64 msecs)
{
  track_.time_created_ = msecs;
}

// Samples are kept in the order they are given.  A timestamp that goes
// backwards is reported once per track.
void TrackBuilder::add_sample(const Sample& sample)
{
  if (!track_.samples_.isEmpty() && !out_of_order_reported_ &&
      sample.timestamp < track_.samples_.constLast().timestamp) {
    out_of_order_reported_ = true;
    QString warning = QStringLiteral("sample %1 at %2 is earlier than its predecessor")
                      .arg(track_.samples_.size())
                      .arg(DateTime::fromMSecs(sample.timestamp).toPrettyString());
    Warning() << warning;
    add_warning(warning);
  }
  track_.samples_.append(sample);
}

void TrackBuilder::add_warning(const QString& warning)
{
  track_.warnings_.append(warning);
}

ActivityTrack TrackBuilder::build()
{
  ActivityTrack result = std::move(track_);
  track_ = ActivityTrack();
  out_of_order_reported_ = false;
  return result;
}

QDebug operator<<(QDebug debug, const Sample& sample)
{
  QDebugStateSaver saver(debug);
  debug.nospace() << "Sample(" << DateTime::fromMSecs(sample.timestamp).toPrettyString();
  if (sample.has_position()) {
    debug << " pos=" << *sample.latitude << "," << *sample.longitude;
  }
  if (sample.altitude) {
    debug << " alt=" << *sample.altitude;
  }
  if (sample.distance) {
    debug << " dist=" << *sample.distance;
  }
  if (sample.speed) {
    debug << " spd=" << *sample.speed;
  }
  if (sample.power) {
    debug << " pwr=" << *sample.power;
  }
  if (sample.cadence) {
    debug << " cad=" << *sample.cadence;
  }
  if (sample.heart_rate) {
    debug << " hr=" << *sample.heart_rate;
  }
  if (!sample.extra.isEmpty()) {
    debug << " extra=" << sample.extra.size();
  }
  debug << ')';
  return debug;
}

} // namespace ridelog
