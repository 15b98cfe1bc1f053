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

#include "activity_summary.h"

#include <algorithm>            // for max, min
#include <optional>             // for optional
#include <utility>              // for as_const

#include <QDebug>               // for QDebug, QDebugStateSaver
#include <QVector>              // for QVector

#include "defs.h"               // for global_opts
#include "errors.h"             // for EmptyTrackError
#include "grtcirc.h"            // for gcdist, radtometers
#include "src/core/datetime.h"  // for DateTime
#include "src/core/logging.h"   // for Debug

#define MYNAME "summary"

namespace ridelog
{

namespace
{

struct DistanceProfile {
  QVector<double> meters;
  QVector<bool> known;       /* the sample itself fixes the distance */
  bool from_device{false};
  bool incomplete{false};
};

// The device odometer is trusted when at least two samples carry it
// and it never runs backwards.
bool device_distance_usable(const QVector<Sample>& samples)
{
  int count = 0;
  std::optional<double> prev;
  for (const auto& s : samples) {
    if (s.distance) {
      if (prev && *s.distance < *prev) {
        return false;
      }
      prev = s.distance;
      ++count;
    }
  }
  return count >= 2;
}

DistanceProfile distance_profile(const ActivityTrack& track)
{
  const QVector<Sample>& samples = track.samples();
  DistanceProfile profile;
  profile.meters.reserve(samples.size());
  profile.known.reserve(samples.size());
  double current = 0.0;

  if (device_distance_usable(samples)) {
    profile.from_device = true;
    std::optional<double> first;
    for (const auto& s : samples) {
      if (s.distance) {
        if (!first) {
          first = s.distance;
        }
        current = *s.distance - *first;
      }
      profile.meters.append(current);
      profile.known.append(s.distance.has_value());
    }
  } else {
    const Sample* prev = nullptr;
    for (const auto& s : samples) {
      if (s.has_position()) {
        if (prev != nullptr) {
          current += radtometers(gcdist(*prev->latitude, *prev->longitude,
                                        *s.latitude, *s.longitude));
        }
        prev = &s;
      } else {
        profile.incomplete = true;
      }
      profile.meters.append(current);
      profile.known.append(s.has_position());
    }
  }
  return profile;
}

/*
 * An interval is stopped when the speed at its closing sample, or the
 * speed implied by the distance profile, is at or below the motion
 * threshold.  Only runs lasting min_stop_duration count.
 */
double stopped_seconds(const QVector<Sample>& samples, const DistanceProfile& profile,
                       const AnalyticsConfig& config)
{
  double total = 0.0;
  double run = 0.0;
  auto close_run = [&]() {
    if (run > 0 && run >= config.min_stop_duration) {
      total += run;
    }
    run = 0.0;
  };

  for (int i = 1; i < samples.size(); ++i) {
    double dt = (samples.at(i).timestamp - samples.at(i - 1).timestamp) / 1000.0;
    if (dt <= 0) {
      continue;
    }
    std::optional<double> speed = samples.at(i).speed;
    if (!speed && profile.known.at(i) && profile.known.at(i - 1)) {
      speed = (profile.meters.at(i) - profile.meters.at(i - 1)) / dt;
    }
    if (speed && *speed <= config.min_motion_speed) {
      run += dt;
    } else {
      close_run();
    }
  }
  close_run();
  return total;
}

} // namespace

QVector<double> smoothAltitudes(const QVector<double>& altitudes, int window)
{
  const int n = altitudes.size();
  const int half = std::max(window, 1) / 2;
  QVector<double> result;
  result.reserve(n);
  for (int i = 0; i < n; ++i) {
    int h = std::min({half, i, n - 1 - i});
    double sum = 0.0;
    for (int j = i - h; j <= i + h; ++j) {
      sum += altitudes.at(j);
    }
    result.append(sum / (2 * h + 1));
  }
  return result;
}

QVector<double> cumulativeDistance(const ActivityTrack& track)
{
  return distance_profile(track).meters;
}

ActivitySummary summarize(const ActivityTrack& track, const AnalyticsConfig& config)
{
  if (track.isEmpty()) {
    throw EmptyTrackError(MYNAME ": track has no samples.");
  }

  ActivitySummary tdata;
  tdata.sample_count = track.size();

  DistanceProfile profile = distance_profile(track);
  tdata.distance_meters = profile.meters.constLast();
  tdata.distance_incomplete = profile.incomplete;

  int pts_hrt = 0;
  double tot_hrt = 0.0;
  int pts_cad = 0;
  double tot_cad = 0.0;
  int pts_pwr = 0;
  double tot_pwr = 0.0;
  qint64 start = track.at(0).timestamp;
  qint64 end = start;
  QVector<double> altitudes;

  for (const auto& s : track.samples()) {
    if (s.speed) {
      if ((!tdata.max_spd) || (*s.speed > tdata.max_spd)) {
        tdata.max_spd = s.speed;
      }
    }

    if (s.altitude) {
      altitudes.append(*s.altitude);
      if ((!tdata.min_alt) || (*s.altitude < tdata.min_alt)) {
        tdata.min_alt = s.altitude;
      }
      if ((!tdata.max_alt) || (*s.altitude > tdata.max_alt)) {
        tdata.max_alt = s.altitude;
      }
    }

    if (s.heart_rate) {
      pts_hrt++;
      tot_hrt += *s.heart_rate;
      if ((!tdata.max_hrt) || (*s.heart_rate > tdata.max_hrt)) {
        tdata.max_hrt = s.heart_rate;
      }
    }

    if (s.cadence) {
      pts_cad++;
      tot_cad += *s.cadence;
    }

    if (s.power) {
      pts_pwr++;
      tot_pwr += *s.power;
      if ((!tdata.max_pwr) || (*s.power > tdata.max_pwr)) {
        tdata.max_pwr = s.power;
      }
    }

    start = std::min(start, s.timestamp);
    end = std::max(end, s.timestamp);
  }

  if (pts_hrt > 0) {
    tdata.avg_hrt = tot_hrt / pts_hrt;
  }
  if (pts_cad > 0) {
    tdata.avg_cad = tot_cad / pts_cad;
  }
  if (pts_pwr > 0) {
    tdata.avg_pwr = tot_pwr / pts_pwr;
  }

  tdata.start = start;
  tdata.elapsed_seconds = (end - start) / 1000.0;

  // Gain only accrues once the smoothed altitude has moved a full
  // threshold away from the last turning point.
  QVector<double> smoothed = smoothAltitudes(altitudes, config.elevation_smoothing_window);
  if (!smoothed.isEmpty()) {
    double ref = smoothed.constFirst();
    for (double alt : std::as_const(smoothed)) {
      if (alt - ref >= config.elevation_noise_threshold) {
        tdata.elevation_gain += alt - ref;
        ref = alt;
      } else if (ref - alt >= config.elevation_noise_threshold) {
        tdata.elevation_loss += ref - alt;
        ref = alt;
      }
    }
  }

  double stopped = stopped_seconds(track.samples(), profile, config);
  tdata.active_seconds = std::max(0.0, tdata.elapsed_seconds - stopped);

  if (global_opts.debug_level >= 2) {
    Debug(2) << MYNAME ": distance from " << (profile.from_device ? "device" : "positions")
             << ", stopped " << stopped << "s";
  }
  return tdata;
}

QDebug operator<<(QDebug debug, const ActivitySummary& summary)
{
  QDebugStateSaver saver(debug);
  debug.nospace() << "ActivitySummary(start=" << DateTime::fromMSecs(summary.start).toPrettyString()
                  << " samples=" << summary.sample_count
                  << " distance=" << summary.distance_meters
                  << (summary.distance_incomplete ? " (incomplete)" : "")
                  << " gain=" << summary.elevation_gain
                  << " active=" << summary.active_seconds
                  << " elapsed=" << summary.elapsed_seconds << ')';
  return debug;
}

} // namespace ridelog
