/*
    Downsampling of track positions for map display.

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

#include "map_sampler.h"

#include <stdexcept>           // for invalid_argument

#include <QDebug>              // for QDebug, QDebugStateSaver
#include <QVector>             // for QVector

#include "defs.h"              // for global_opts
#include "errors.h"            // for NoGeodataError
#include "src/core/logging.h"  // for Debug

#define MYNAME "mapsample"

namespace ridelog
{

QVector<GeoPoint> sampleForMap(const ActivityTrack& track, int target_count)
{
  if (target_count < 1) {
    throw std::invalid_argument("sampleForMap: target_count must be at least 1.");
  }

  QVector<GeoPoint> positions;
  positions.reserve(track.geodata_count());
  for (const auto& s : track.samples()) {
    if (s.has_position()) {
      positions.append(GeoPoint{*s.latitude, *s.longitude, s.altitude});
    }
  }
  if (positions.isEmpty()) {
    throw NoGeodataError(MYNAME ": track has no positions to sample.");
  }

  const qsizetype n = positions.size();
  if (n <= target_count) {
    return positions;
  }
  if (target_count == 1) {
    return {positions.constFirst()};
  }

  // n > target_count, so the indices strictly increase and end at n - 1.
  QVector<GeoPoint> result;
  result.reserve(target_count);
  for (qsizetype i = 0; i < target_count; ++i) {
    result.append(positions.at(i * (n - 1) / (target_count - 1)));
  }

  if (global_opts.debug_level >= 2) {
    Debug(2) << MYNAME ": kept " << result.size() << " of " << n << " positions";
  }
  return result;
}

QDebug operator<<(QDebug debug, const GeoPoint& point)
{
  QDebugStateSaver saver(debug);
  debug.nospace() << "GeoPoint(" << point.latitude << "," << point.longitude;
  if (point.altitude) {
    debug << " alt=" << *point.altitude;
  }
  debug << ')';
  return debug;
}

} // namespace ridelog
