/*
    Ride statistics derived from an activity track.

    Copyright (C) 2002-2010,2021,2023 Robert Lipe, robertlipe+source@gpsbabel.org
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
#ifndef ACTIVITY_SUMMARY_H_INCLUDED_
#define ACTIVITY_SUMMARY_H_INCLUDED_

#include <optional>         // for optional

#include <QDebug>           // for QDebug
#include <QVector>          // for QVector
#include <QtGlobal>         // for qint64

#include "engine_config.h"  // for AnalyticsConfig
#include "track.h"          // for ActivityTrack

namespace ridelog
{

struct ActivitySummary {
  double distance_meters{0.0};
  bool distance_incomplete{false};    /* some samples had no position */
  double elevation_gain{0.0};         /* Meters */
  double elevation_loss{0.0};         /* Meters */
  double active_seconds{0.0};
  double elapsed_seconds{0.0};
  qint64 start{0};                    /* Min time, msecs since the epoch */
  int sample_count{0};
  std::optional<double> max_alt;      /* Meters */
  std::optional<double> min_alt;      /* Meters */
  std::optional<double> max_spd;      /* Meters/sec */
  std::optional<double> avg_hrt;      /* Avg Heartrate */
  std::optional<double> avg_cad;      /* Avg Cadence */
  std::optional<double> avg_pwr;      /* Avg Power */
  std::optional<int> max_hrt;         /* Max Heartrate */
  std::optional<int> max_pwr;         /* Max Power */

  bool operator==(const ActivitySummary& other) const = default;
};

/*
 * Throws EmptyTrackError for a track without samples.
 */
ActivitySummary summarize(const ActivityTrack& track, const AnalyticsConfig& config = AnalyticsConfig());

/*
 * Meters covered at each sample, starting at 0 and never decreasing.
 * Device distance is used when it is usable, otherwise the great circle
 * distance between consecutive positions.
 */
QVector<double> cumulativeDistance(const ActivityTrack& track);

/*
 * Centered moving average.  The window is odd, an even window grows by
 * one, and it shrinks symmetrically near either end so a linear ramp
 * passes through unchanged.
 */
QVector<double> smoothAltitudes(const QVector<double>& altitudes, int window);

QDebug operator<<(QDebug debug, const ActivitySummary& summary);

} // namespace ridelog

#endif // ACTIVITY_SUMMARY_H_INCLUDED_
