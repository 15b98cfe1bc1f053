/*
    Copyright (C) 2002-2014 Robert Lipe, robertlipe+source@gpsbabel.org
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

#include "src/core/logging.h"

#include <QDebug>   // for QDebug
#include <QString>  // for QString

#include "defs.h"
#include "gbversion.h"  // for VERSION

global_options global_opts;
const char ridelog_version[] = VERSION;

// Deeper debug levels are indented so nested decoder output lines up.
QDebug& operator<< (QDebug& debug, const DebugIndent& indent)
{
  if (indent.level_ > 1) {
    debug << QString(2 * (indent.level_ - 1), QLatin1Char(' '));
  }
  return debug;
}
