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
#ifndef COLUMN_EXTRACTOR_H_INCLUDED_
#define COLUMN_EXTRACTOR_H_INCLUDED_

#include <QByteArray>       // for QByteArray
#include <QMap>             // for QMap
#include <QString>          // for QString
#include <QStringList>      // for QStringList
#include <QVariantList>     // for QVariantList

#include "engine_config.h"  // for default_column_names
#include "track.h"          // for ActivityTrack

namespace ridelog
{

using ColumnMap = QMap<QString, QVariantList>;

QStringList known_column_names();

/*
 * One column per requested name, aligned with the samples: entry i is
 * a null QVariant when sample i lacks the field.  A column no sample has
 * any value for is empty.  Unknown names are dropped, an empty request
 * selects default_names.  Timestamps are msecs since the epoch.
 */
ColumnMap extractColumns(const ActivityTrack& track, const QStringList& names,
                         const QStringList& default_names = default_column_names());

// CBOR indefinite length map of indefinite length arrays, nulls kept.
QByteArray encodeColumnsCbor(const ColumnMap& columns);

} // namespace ridelog

#endif // COLUMN_EXTRACTOR_H_INCLUDED_
