/*
    Copyright (C) 2002-2005 Robert Lipe, robertlipe+source@gpsbabel.org
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

#include <cstdio>                     // for printf, fflush, fprintf, stderr, stdin, stdout
#include <functional>                 // for function
#include <stdexcept>                  // for invalid_argument

#include <QByteArray>                 // for QByteArray
#include <QCoreApplication>           // for QCoreApplication
#include <QDebug>                     // for QDebug
#include <QFile>                      // for QFile
#include <QIODevice>                  // for QIODevice::ReadOnly, QIODevice::WriteOnly
#include <QList>                      // for QList
#include <QMessageLogContext>         // for QMessageLogContext
#include <QString>                    // for QString
#include <QStringList>                // for QStringList
#include <QTextStream>                // for QTextStream
#include <QUrl>                       // for QUrl
#include <QVector>                    // for QVector
#include <QtGlobal>                   // for qPrintable, qInstallMessageHandler, qSetMessagePattern

#include "activity_summary.h"         // for ActivitySummary, summarize
#include "column_extractor.h"         // for extractColumns, encodeColumnsCbor
#include "defs.h"                     // for global_opts, gbFatal, gbInfo, ridelog_version, kKilometersPerMeter, MPS_TO_KPH
#include "engine_config.h"            // for EngineConfig
#include "errors.h"                   // for DecodeError, DerivationError, CorruptBlobError, Error
#include "fit_decoder.h"              // for FitDecoder
#include "gpx_writer.h"               // for GpxWriter
#include "ingest_pool.h"              // for IngestPool, takeResult
#include "map_renderer.h"             // for HttpMapRenderer, renderActivityMap
#include "map_sampler.h"              // for sampleForMap
#include "src/core/datetime.h"        // for DateTime
#include "src/core/logging.h"         // for FatalMsg, Debug
#include "track.h"                    // for ActivityTrack
#include "track_codec.h"              // for TrackCodec

using namespace ridelog;

// be careful not to advance argn passed the end of the list, i.e. ensure argn < qargs.size()
#define FETCH_OPTARG qargs.at(argn).size() > 2 ? QString(qargs.at(argn)).remove(0,2) : qargs.size()>(argn+1) ? qargs.at(++argn) : QString()

/* Exit status by error category. */
static constexpr int kExitFailure = 1;
static constexpr int kExitDecode = 2;
static constexpr int kExitDerivation = 3;
static constexpr int kExitIntegrity = 4;

struct cli_options {
  QString command;
  QStringList inputs;
  QString config_file;
  QString output{QStringLiteral("-")};
  QString count_or_names;     /* -n */
};

static void
usage(const char* pname)
{
  printf("RideLog Version %s\n\n", ridelog_version);
  printf(
    "Usage:\n"
    "    %s [options] COMMAND [-o OUTFILE] [-n ARG] INFILE...\n"
    "\n"
    "    INFILE is a FIT recording or a stored track blob.  If '-' is used\n"
    "    for INFILE or OUTFILE, stdin or stdout will be used.\n"
    "\n"
    "Commands:\n"
    "  summary               Ride statistics for each INFILE\n"
    "  encode                Write the track as a storage blob\n"
    "  gpx                   Write the track as GPX 1.1\n"
    "  columns               Write raw columns as CBOR, -n name,name,...\n"
    "  mapsamples            Write downsampled positions, -n count\n"
    "  render                Render a map image, -n count\n"
    "\n"
    "Options:\n"
    "  -D level              Set debug level\n"
    "  -c file               Read configuration from file\n"
    "  -o file               Write output to file instead of stdout\n"
    "  -n arg                Column names or sample count\n"
    "  -V                    Print version and exit\n"
    "  -h, -?                Print this help and exit\n"
    , pname);
}

static void setMessagePattern(const QString& id = QString())
{
  if (id.isEmpty()) {
    qSetMessagePattern("%{if-category}%{category}: %{endif}ridelog: %{message}");
  } else {
    qSetMessagePattern(QStringLiteral("%{if-category}%{category}: %{endif}%1: %{message}").arg(id));
  }
}

static void MessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg)
{
  QString message = qFormatLogMessage(type, context, msg);
  /* flush any buffered standard output */
  fflush(stdout);
  fprintf(stderr, "%s\n", qPrintable(message));
  fflush(stderr);
}

static QByteArray
read_input(const QString& fname)
{
  QFile file(fname);
  bool ok = (fname == QLatin1String("-")) ? file.open(stdin, QIODevice::ReadOnly) : file.open(QIODevice::ReadOnly);
  if (!ok) {
    gbFatal(FatalMsg().noquote() << "Cannot open '" << fname << "' for read.  Error was '"
            << file.errorString() << "'.");
  }
  return file.readAll();
}

static void
write_output(const QString& fname, const QByteArray& data)
{
  QFile file(fname);
  bool ok = (fname == QLatin1String("-")) ? file.open(stdout, QIODevice::WriteOnly) : file.open(QIODevice::WriteOnly);
  if (!ok) {
    gbFatal(FatalMsg().noquote() << "Cannot open '" << fname << "' for write.  Error was '"
            << file.errorString() << "'.");
  }
  if (file.write(data) != data.size()) {
    gbFatal(FatalMsg().noquote() << "Error writing '" << fname << "': " << file.errorString());
  }
}

static bool
is_blob(const QByteArray& data)
{
  return data.startsWith(TrackCodec::kMagic);
}

static ActivityTrack
load_track(const QString& fname, const EngineConfig& config)
{
  QByteArray data = read_input(fname);
  if (is_blob(data)) {
    return TrackCodec::decode(data);
  }
  return FitDecoder(config.decoder).decode(data);
}

static QString
format_duration(double seconds)
{
  auto total = static_cast<qint64>(seconds + 0.5);
  return QStringLiteral("%1:%2:%3")
         .arg(total / SECONDS_PER_HOUR)
         .arg((total / 60) % 60, 2, 10, QLatin1Char('0'))
         .arg(total % 60, 2, 10, QLatin1Char('0'));
}

static void
print_summary(QTextStream& out, const ActivitySummary& summary)
{
  out << "start:          " << DateTime::fromMSecs(summary.start).toPrettyString() << '\n';
  out << "samples:        " << summary.sample_count << '\n';
  out << "distance:       " << QString::number(summary.distance_meters * kKilometersPerMeter, 'f', 3) << " km";
  if (summary.distance_incomplete) {
    out << " (incomplete, some samples have no position)";
  }
  out << '\n';
  out << "elevation gain: " << QString::number(summary.elevation_gain, 'f', 1) << " m\n";
  out << "elevation loss: " << QString::number(summary.elevation_loss, 'f', 1) << " m\n";
  out << "active time:    " << format_duration(summary.active_seconds) << '\n';
  out << "elapsed time:   " << format_duration(summary.elapsed_seconds) << '\n';
  if (summary.min_alt && summary.max_alt) {
    out << "altitude:       " << QString::number(*summary.min_alt, 'f', 1) << " - "
        << QString::number(*summary.max_alt, 'f', 1) << " m\n";
  }
  if (summary.max_spd) {
    out << "max speed:      " << QString::number(MPS_TO_KPH(*summary.max_spd), 'f', 1) << " km/h\n";
  }
  if (summary.avg_hrt) {
    out << "heart rate:     " << QString::number(*summary.avg_hrt, 'f', 0) << " avg, "
        << *summary.max_hrt << " max\n";
  }
  if (summary.avg_pwr) {
    out << "power:          " << QString::number(*summary.avg_pwr, 'f', 0) << " W avg, "
        << *summary.max_pwr << " W max\n";
  }
  if (summary.avg_cad) {
    out << "cadence:        " << QString::number(*summary.avg_cad, 'f', 0) << " rpm avg\n";
  }
}

static int
sample_count_arg(const cli_options& opts, const EngineConfig& config)
{
  if (opts.count_or_names.isEmpty()) {
    return config.map_samples;
  }
  bool ok;
  int count = opts.count_or_names.toInt(&ok);
  if (!ok) {
    gbFatal("Sample count '%s' is not a number.\n", CSTR(opts.count_or_names));
  }
  return count;
}

static void
run_summary(const cli_options& opts, const EngineConfig& config)
{
  IngestPool pool(config.pool_max_threads, config.decoder, config.analytics);

  // Submit everything first so the inputs are processed in parallel.
  QList<std::function<ActivitySummary()>> jobs;
  for (const auto& fname : opts.inputs) {
    QByteArray data = read_input(fname);
    if (is_blob(data)) {
      auto future = pool.submitSummary(data);
      jobs.append([future]() {
        return takeResult(future);
      });
    } else {
      auto future = pool.submitFitSummary(data);
      jobs.append([future]() {
        return takeResult(future);
      });
    }
  }

  QByteArray text;
  QTextStream out(&text);
  for (int i = 0; i < jobs.size(); ++i) {
    if (jobs.size() > 1) {
      out << (i ? "\n" : "") << opts.inputs.at(i) << ":\n";
    }
    print_summary(out, jobs.at(i)());
  }
  out.flush();
  write_output(opts.output, text);
}

static int
run(const cli_options& opts, const EngineConfig& config)
{
  if (opts.inputs.isEmpty()) {
    gbFatal("No input file given for '%s'.\n", CSTR(opts.command));
  }
  if (opts.command != QLatin1String("summary") && opts.inputs.size() > 1) {
    gbFatal("'%s' takes a single input file.\n", CSTR(opts.command));
  }

  if (opts.command == QLatin1String("summary")) {
    run_summary(opts, config);
    return 0;
  }

  ActivityTrack track = load_track(opts.inputs.constFirst(), config);
  if (global_opts.debug_level >= 1) {
    Debug(1) << "loaded " << track.size() << " samples from " << track.source_format();
  }

  if (opts.command == QLatin1String("encode")) {
    write_output(opts.output, TrackCodec::encode(track));
  } else if (opts.command == QLatin1String("gpx")) {
    write_output(opts.output, GpxWriter(config.gpx_track_name).write(track).toUtf8());
  } else if (opts.command == QLatin1String("columns")) {
    QStringList names = opts.count_or_names.split(',', Qt::SkipEmptyParts);
    write_output(opts.output, encodeColumnsCbor(extractColumns(track, names, config.default_columns)));
  } else if (opts.command == QLatin1String("mapsamples")) {
    QByteArray text;
    QTextStream out(&text);
    const QVector<GeoPoint> points = sampleForMap(track, sample_count_arg(opts, config));
    for (const auto& point : points) {
      out << QString::number(point.latitude, 'f', GpxWriter::kLatLonPrecision) << ' '
          << QString::number(point.longitude, 'f', GpxWriter::kLatLonPrecision);
      if (point.altitude) {
        out << ' ' << QString::number(*point.altitude, 'f', GpxWriter::kElevationPrecision);
      }
      out << '\n';
    }
    out.flush();
    write_output(opts.output, text);
  } else if (opts.command == QLatin1String("render")) {
    HttpMapRenderer renderer(QUrl(config.renderer_url), config.renderer_timeout_ms);
    MapRenderOptions render_options;
    render_options.width = config.render_width;
    render_options.height = config.render_height;
    write_output(opts.output, renderActivityMap(track, renderer, sample_count_arg(opts, config), render_options));
  } else {
    gbFatal("Unknown command '%s'.\n", CSTR(opts.command));
  }
  return 0;
}

int
main(int argc, char* argv[])
{
  const char* prog_name = argv[0]; /* may not match QCoreApplication::arguments().at(0)! */

#if (QT_VERSION < QT_VERSION_CHECK(6, 3, 0))
#error This version of Qt is not supported.
#endif

  // The event loop is needed by the map renderer.
  QCoreApplication app(argc, argv);

  qInstallMessageHandler(MessageHandler);
  setMessagePattern();

  const QStringList qargs = QCoreApplication::arguments();
  cli_options opts;

  int argn = 1;
  while (argn < qargs.size()) {
    const QString& arg = qargs.at(argn);
    if (arg.size() < 2 || arg.at(0).toLatin1() != '-') {
      // Positional.  The first one is the command.
      if (opts.command.isEmpty()) {
        opts.command = arg;
      } else {
        opts.inputs.append(arg);
      }
      argn++;
      continue;
    }

    QString optarg;
    int c = arg.at(1).toLatin1();
    switch (c) {
    case 'D':
      optarg = FETCH_OPTARG;
      {
        bool ok;
        global_opts.debug_level = optarg.toInt(&ok);
        if (!ok) {
          gbFatal("Debug level '%s' is not a number.\n", CSTR(optarg));
        }
      }
      break;
    case 'c':
      optarg = FETCH_OPTARG;
      opts.config_file = optarg;
      break;
    case 'o':
      optarg = FETCH_OPTARG;
      opts.output = optarg;
      break;
    case 'n':
      optarg = FETCH_OPTARG;
      opts.count_or_names = optarg;
      break;
    case 'V':
      gbInfo("RideLog Version %s\n", ridelog_version);
      return 0;
    case 'h':
    case '?':
      usage(prog_name);
      return 0;
    default:
      gbFatal("Unknown option '%s'.\n", CSTR(arg));
    }
    argn++;
  }

  if (opts.command.isEmpty()) {
    usage(prog_name);
    return kExitFailure;
  }

  try {
    EngineConfig config = EngineConfig::load(opts.config_file);
    return run(opts, config);
  } catch (const DecodeError& e) {
    gbFatal(FatalMsg().noquote() << e.what(), kExitDecode);
  } catch (const DerivationError& e) {
    gbFatal(FatalMsg().noquote() << e.what(), kExitDerivation);
  } catch (const CorruptBlobError& e) {
    gbFatal(FatalMsg().noquote() << e.what(), kExitIntegrity);
  } catch (const Error& e) {
    gbFatal(FatalMsg().noquote() << e.what(), kExitFailure);
  } catch (const std::invalid_argument& e) {
    gbFatal(FatalMsg().noquote() << e.what(), kExitFailure);
  }
}
