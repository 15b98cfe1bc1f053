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

#include "engine_config.h"

#include <cmath>               // for isfinite
#include <optional>            // for optional

#include <QString>             // for QString, QStringLiteral
#include <QStringList>         // for QStringList

#include "defs.h"              // for global_opts
#include "errors.h"            // for ConfigError
#include "inifile.h"           // for inifile_init, inifile_readstr, inifile_readint, inifile_readdouble
#include "src/core/logging.h"  // for Debug

#define MYNAME "config"

namespace ridelog
{

QStringList default_column_names()
{
  return {
    QStringLiteral("timestamp"),
    QStringLiteral("power"),
    QStringLiteral("distance"),
    QStringLiteral("speed"),
    QStringLiteral("altitude"),
    QStringLiteral("position_lat"),
    QStringLiteral("position_long")
  };
}

EngineConfig::EngineConfig() :
  default_columns(default_column_names()),
  gpx_track_name(QStringLiteral("Ride"))
{
}

static void check_positive(const char* key, double value, bool allow_zero)
{
  bool in_range = allow_zero ? value >= 0 : value > 0;
  if (!in_range || !std::isfinite(value)) {
    throw ConfigError(QStringLiteral(MYNAME ": %1 must be %2, got %3.")
                      .arg(QString(key), QString(allow_zero ? "non-negative" : "positive")).arg(value));
  }
}

EngineConfig EngineConfig::load(const QString& filename)
{
  EngineConfig config;
  auto ini = inifile_init(filename, MYNAME);
  if (!ini) {
    return config;
  }
  config.source = ini->source;

  AnalyticsConfig& a = config.analytics;
  a.min_motion_speed = inifile_readdouble_def(ini.get(), "analytics", "min_motion_speed", a.min_motion_speed);
  a.min_stop_duration = inifile_readdouble_def(ini.get(), "analytics", "min_stop_duration", a.min_stop_duration);
  a.elevation_noise_threshold = inifile_readdouble_def(ini.get(), "analytics", "elevation_noise_threshold",
                                                       a.elevation_noise_threshold);
  a.elevation_smoothing_window = inifile_readint_def(ini.get(), "analytics", "elevation_smoothing_window",
                                                     a.elevation_smoothing_window);
  check_positive("analytics/min_motion_speed", a.min_motion_speed, true);
  check_positive("analytics/min_stop_duration", a.min_stop_duration, true);
  check_positive("analytics/elevation_noise_threshold", a.elevation_noise_threshold, true);
  check_positive("analytics/elevation_smoothing_window", a.elevation_smoothing_window, false);

  QString policy = inifile_readstr(ini.get(), "decoder", "unknown_fields").toLower();
  if (policy == QLatin1String("retain")) {
    config.decoder.unknown_fields = UnknownFieldPolicy::kRetain;
  } else if (policy.isNull() || policy == QLatin1String("drop")) {
    config.decoder.unknown_fields = UnknownFieldPolicy::kDrop;
  } else {
    throw ConfigError(QStringLiteral(MYNAME ": decoder/unknown_fields must be drop or retain, got '%1'.").arg(policy));
  }

  QString columns = inifile_readstr(ini.get(), "export", "default_columns");
  if (!columns.isNull()) {
    config.default_columns.clear();
    const QStringList names = columns.split(',', Qt::SkipEmptyParts);
    for (const auto& name : names) {
      config.default_columns.append(name.trimmed());
    }
  }
  config.map_samples = inifile_readint_def(ini.get(), "export", "map_samples", config.map_samples);
  check_positive("export/map_samples", config.map_samples, false);
  QString track_name = inifile_readstr(ini.get(), "export", "gpx_track_name");
  if (!track_name.isNull()) {
    config.gpx_track_name = track_name;
  }

  config.renderer_url = inifile_readstr(ini.get(), "renderer", "url");
  config.renderer_timeout_ms = inifile_readint_def(ini.get(), "renderer", "timeout_ms", config.renderer_timeout_ms);
  config.render_width = inifile_readint_def(ini.get(), "renderer", "width", config.render_width);
  config.render_height = inifile_readint_def(ini.get(), "renderer", "height", config.render_height);
  check_positive("renderer/timeout_ms", config.renderer_timeout_ms, false);
  check_positive("renderer/width", config.render_width, false);
  check_positive("renderer/height", config.render_height, false);

  config.pool_max_threads = inifile_readint_def(ini.get(), "pool", "max_threads", config.pool_max_threads);
  check_positive("pool/max_threads", config.pool_max_threads, true);

  if (global_opts.debug_level >= 1) {
    Debug(1) << MYNAME ": loaded " << config.source;
  }
  return config;
}

} // namespace ridelog
