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
#ifndef TRACK_H_INCLUDED_
#define TRACK_H_INCLUDED_

#include <optional>      // for optional

#include <QByteArray>    // for QByteArray
#include <QDebug>        // for QDebug
#include <QMap>          // for QMap
#include <QString>       // for QString
#include <QStringList>   // for QStringList
#include <QVector>       // for QVector
#include <QtGlobal>      // for qint64

namespace ridelog
{

/*
 * One observation from a recording.  Only the timestamp is mandatory,
 * a missing sensor value is an empty optional and never zero.
 */
class Sample
{
public:
  /* Types */

  // Keys of retained fields the decoder had no column for.  Profile fields
  // use their field number, developer fields are tagged with kDeveloperKey.
  static constexpr int kDeveloperKey = 0x10000;

  /* Member Functions */

  bool has_position() const
  {
    return latitude.has_value() && longitude.has_value();
  }

  bool operator==(const Sample& other) const = default;

  /* Data Members */

  qint64 timestamp{0};               /* msecs since the Unix epoch, UTC */
  std::optional<double> latitude;    /* Degrees */
  std::optional<double> longitude;   /* Degrees */
  std::optional<double> altitude;    /* Meters */
  std::optional<double> distance;    /* Cumulative meters */
  std::optional<double> speed;       /* Meters/sec */
  std::optional<int> power;          /* Watts */
  std::optional<int> cadence;        /* Revolutions per minute */
  std::optional<int> heart_rate;     /* Beats/min */
  QMap<int, QByteArray> extra;       /* Opaque unknown fields */
};

/*
 * An ordered, immutable sequence of samples plus where they came from.
 * Tracks are values: copies share the sample storage and nothing can
 * modify it once TrackBuilder::build() has returned.
 */
class ActivityTrack
{
public:
  ActivityTrack() = default;

  const QVector<Sample>& samples() const {return samples_;}
  const Sample& at(int i) const {return samples_.at(i);}
  int size() const {return samples_.size();}
  bool isEmpty() const {return samples_.isEmpty();}

  const QString& source_format() const {return source_format_;}
  std::optional<int> manufacturer() const {return manufacturer_;}
  std::optional<int> product() const {return product_;}
  std::optional<qint64> time_created() const {return time_created_;}
  const QStringList& warnings() const {return warnings_;}

  bool has_geodata() const;
  int geodata_count() const;

  bool operator==(const ActivityTrack& other) const = default;

private:
  friend class TrackBuilder;
  friend class TrackCodec;

  QVector<Sample> samples_;
  QString source_format_;
  std::optional<int> manufacturer_;
  std::optional<int> product_;
  std::optional<qint64> time_created_;
  QStringList warnings_;
};

class TrackBuilder
{
public:
  explicit TrackBuilder(const QString& source_format = QString());

  void set_source_format(const QString& format);
  void set_device(std::optional<int> manufacturer, std::optional<int> product);
  void set_time_created(qint64 msecs);
  void add_sample(const Sample& sample);
  void add_warning(const QString& warning);

  int sample_count() const {return track_.samples_.size();}
  const QStringList& warnings() const {return track_.warnings_;}

  // Hands over the accumulated track and leaves the builder empty.
  ActivityTrack build();

private:
  ActivityTrack track_;
  bool out_of_order_reported_{false};
};

QDebug operator<<(QDebug debug, const Sample& sample);

} // namespace ridelog

#endif // TRACK_H_INCLUDED_
