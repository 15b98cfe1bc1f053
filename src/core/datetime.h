/*
    Copyright (C) 2012, 2013 Robert Lipe, robertlipe@gpsbabel.org
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

#ifndef DATETIME_H_INCLUDED_
#define DATETIME_H_INCLUDED_

#include <QtCore/QDateTime>
#include <QtCore/QString>
#include <QtCore/QTimeZone>
#include <QtCore/QtGlobal>

namespace ridelog
{

// Sample timestamps are carried as milliseconds since the Unix epoch.
// DateTime is only built where a calendar representation is needed.
class DateTime : public QDateTime
{
public:
  DateTime() = default;
  DateTime(const QDateTime& dt) : QDateTime(dt) {}

  static DateTime fromMSecs(qint64 msecs)
  {
    return QDateTime::fromMSecsSinceEpoch(msecs, QTimeZone::utc());
  }

  // Like toString, but with subsecond time that's included only when
  // the trailing digits aren't .000.  Always UTC.
  QString toPrettyString() const
  {
    if (time().msec()) {
      return toUTC().toString(QStringLiteral("yyyy-MM-ddTHH:mm:ss.zzzZ"));
    } else {
      return toUTC().toString(QStringLiteral("yyyy-MM-ddTHH:mm:ssZ"));
    }
  }
};

} // namespace ridelog

#endif // DATETIME_H_INCLUDED_
