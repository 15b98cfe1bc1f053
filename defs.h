/*
    Common definitions for the activity engine.

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
#ifndef DEFS_H_INCLUDED_
#define DEFS_H_INCLUDED_

#include <cmath>                     // for M_PI
#include <cstdarg>                   // for va_list
#include <cstdint>                   // for int32_t, uint16_t, uint32_t

#include <QDebug>                    // for QDebug
#include <QString>                   // for QString
#include <QtGlobal>                  // for QtMsgType

#define CSTR(qstr) ((qstr).toUtf8().constData())

/*
 * Exact-in-decimal unit conversions used by the exporters and the
 * summary printer.
 */
constexpr double kMetersPerKilometer = 1000.0;
constexpr double kKilometersPerMeter = 1.0 / kMetersPerKilometer;
constexpr long SECONDS_PER_HOUR = 60L * 60;
constexpr double kKPHPerMPS = SECONDS_PER_HOUR / 1000.0;

/* meters/second to kilometers/hour */
constexpr double MPS_TO_KPH(double a) { return a * kKPHPerMPS;}

constexpr double RAD(double deg) { return deg * (M_PI / 180.0);}

/*
 * Process wide options.  These are written once while the command line is
 * parsed and only read afterwards, so worker threads may consult them.
 */
struct global_options {
  int debug_level{0};
};

extern global_options global_opts;
extern const char ridelog_version[];

/*
 *  From fatal.cc.  Only the command line front end terminates the process;
 *  library code throws the exceptions declared in errors.h.
 */
[[noreturn]] void gbFatal(QDebug& msginstance, int status = 1);
[[noreturn]] void gbFatal(const char* fmt, ...);
void gbInfo(const char* fmt, ...);
void gbVLegacyLog(QtMsgType type, const char* fmt, va_list args);

/*
 * Byte order helpers, from util.cc.
 */
uint16_t be_read16(const void* ptr);
uint32_t be_read32(const void* ptr);
uint64_t be_read64(const void* ptr);
uint16_t le_read16(const void* ptr);
uint32_t le_read32(const void* ptr);
uint64_t le_read64(const void* ptr);

#endif // DEFS_H_INCLUDED_
