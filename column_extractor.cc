/*
    Raw per-field columns for analysis clients.

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

#include "column_extractor.h"

#include <functional>          // for function
#include <optional>            // for optional

#include <QByteArray>          // for QByteArray
#include <QCborStreamWriter>   // for QCborStreamWriter
#include <QMetaType>           // for QMetaType
#include <QVariant>            // for QVariant

#include "defs.h"              // for global_opts
#include "src/core/logging.h"  // for Debug

#define MYNAME "columns"

namespace ridelog
{

namespace
{

using ColumnGetter = std::function<QVariant(const Sample&)>;

template<typename T>
QVariant optional_variant(const std::optional<T>& value)
{
  return value ? QVariant::fromValue(*value) : QVariant();
}

const QMap<QString, ColumnGetter>& column_getters()
{
  static const QMap<QString, ColumnGetter> getters = {
    {QStringLiteral("timestamp"), [](const Sample& s) {
        return QVariant::fromValue(s.timestamp);
      }
    },
    {QStringLiteral("position_lat"), [](const Sample& s) {
        return optional_variant(s.latitude);
      }
    },
    {QStringLiteral("position_long"), [](const Sample& s) {
        return optional_variant(s.longitude);
      }
    },
    {QStringLiteral("altitude"), [](const Sample& s) {
        return optional_variant(s.altitude);
      }
    },
    {QStringLiteral("distance"), [](const Sample& s) {
        return optional_variant(s.distance);
      }
    },
    {QStringLiteral("speed"), [](const Sample& s) {
        return optional_variant(s.speed);
      }
    },
    {QStringLiteral("power"), [](const Sample& s) {
        return optional_variant(s.power);
      }
    },
    {QStringLiteral("cadence"), [](const Sample& s) {
        return optional_variant(s.cadence);
      }
    },
    {QStringLiteral("heart_rate"), [](const Sample& s) {
        return optional_variant(s.heart_rate);
      }
    },
  };
  return getters;
}

} // namespace

QStringList known_column_names()
{
  return column_getters().keys();
}

ColumnMap extractColumns(const ActivityTrack& track, const QStringList& names,
                         const QStringList& default_names)
{
  const QStringList& requested = names.isEmpty() ? default_names : names;
  const auto& getters = column_getters();
  ColumnMap columns;

  for (const auto& name : requested) {
    auto getter = getters.constFind(name);
    if (getter == getters.cend()) {
      if (global_opts.debug_level >= 1) {
        Debug(1) << MYNAME ": ignoring unknown column " << name;
      }
      continue;
    }

    QVariantList column;
    column.reserve(track.size());
    bool any = false;
    for (const auto& sample : track.samples()) {
      QVariant value = (*getter)(sample);
      any = any || !value.isNull();
      column.append(value);
    }
    if (!any) {
      column.clear();
    }
    columns.insert(name, column);
  }
  return columns;
}

QByteArray encodeColumnsCbor(const ColumnMap& columns)
{
  QByteArray result;
  QCborStreamWriter writer(&result);
  writer.startMap();
  for (auto it = columns.cbegin(); it != columns.cend(); ++it) {
    writer.append(it.key());
    writer.startArray();
    for (const auto& value : it.value()) {
      if (value.isNull()) {
        writer.appendNull();
        continue;
      }
      switch (value.typeId()) {
      case QMetaType::Double:
        writer.append(value.toDouble());
        break;
      default:
        writer.append(value.toLongLong());
        break;
      }
    }
    writer.endArray();
  }
  writer.endMap();
  return result;
}

} // namespace ridelog
