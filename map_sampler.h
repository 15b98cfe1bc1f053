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
#ifndef MAP_SAMPLER_H_INCLUDED_
#define MAP_SAMPLER_H_INCLUDED_

#include <optional>  // for optional

#include <QDebug>    // for QDebug
#include <QVector>   // for QVector

#include "track.h"   // for ActivityTrack

namespace ridelog
{

struct GeoPoint {
  double latitude{0.0};              /* Degrees */
  double longitude{0.0};             /* Degrees */
  std::optional<double> altitude;    /* Meters */

  bool operator==(const GeoPoint& other) const = default;
};

/*
 * Pick at most target_count positions at a uniform stride, always keeping
 * the first and the last.  A target of 1 gives the first position only.
 * Throws std::invalid_argument for target_count < 1 and NoGeodataError
 * when the track has no positions.
 */
QVector<GeoPoint> sampleForMap(const ActivityTrack& track, int target_count);

QDebug operator<<(QDebug debug, const GeoPoint& point);

} // namespace ridelog

#endif // MAP_SAMPLER_H_INCLUDED_
