/*
    Engine configuration and its defaults.

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
#ifndef ENGINE_CONFIG_H_INCLUDED_
#define ENGINE_CONFIG_H_INCLUDED_

#include <QString>        // for QString
#include <QStringList>    // for QStringList

#include "fit_decoder.h"  // for FitDecoder, UnknownFieldPolicy

namespace ridelog
{

/* Stop detection and elevation filtering defaults. */
constexpr double kDefaultMinMotionSpeed = 0.5;          /* Meters/sec */
constexpr double kDefaultMinStopDuration = 10.0;        /* Seconds */
constexpr double kDefaultElevationNoiseThreshold = 1.0; /* Meters */
constexpr int kDefaultElevationSmoothingWindow = 5;     /* Samples */

/* Exporter defaults. */
constexpr int kDefaultMapSamples = 200;
constexpr int kDefaultRendererTimeoutMs = 10000;
constexpr int kDefaultRenderWidth = 600;
constexpr int kDefaultRenderHeight = 400;

QStringList default_column_names();

struct AnalyticsConfig {
  double min_motion_speed{kDefaultMinMotionSpeed};
  double min_stop_duration{kDefaultMinStopDuration};
  double elevation_noise_threshold{kDefaultElevationNoiseThreshold};
  int elevation_smoothing_window{kDefaultElevationSmoothingWindow};
};

class EngineConfig
{
public:
  EngineConfig();

  /*
   * Read an inifile on top of the defaults.  An empty filename searches
   * $RIDELOGINI, ./ridelog.ini, ~/.ridelog, /usr/local/etc and /etc and
   * keeps the defaults when none is found.  Throws ConfigError.
   */
  static EngineConfig load(const QString& filename = QString());

  AnalyticsConfig analytics;
  FitDecoder::Options decoder;
  QStringList default_columns;
  int map_samples{kDefaultMapSamples};
  QString gpx_track_name;
  QString renderer_url;                       /* empty disables rendering */
  int renderer_timeout_ms{kDefaultRendererTimeoutMs};
  int render_width{kDefaultRenderWidth};
  int render_height{kDefaultRenderHeight};
  int pool_max_threads{0};                    /* 0 is the ideal thread count */
  QString source;                             /* file the values came from */
};

} // namespace ridelog

#endif // ENGINE_CONFIG_H_INCLUDED_
