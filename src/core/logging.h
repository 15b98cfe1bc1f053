/*
    Copyright (C) 2014 Robert Lipe, robertlipe+source@gpsbabel.org
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
#ifndef SRC_CORE_LOGGING_H_
#define SRC_CORE_LOGGING_H_

// A wrapper for QDebug that provides a sensible Warning() and FatalMsg()
// with convenient functions, stream operators and manipulators.

#include <memory>            // for unique_ptr

#include <QDebug>            // for QDebug
#include <QtGlobal>          // for QtCriticalMsg, QtWarningMsg

#include "defs.h"            // for global_opts


class Warning : public QDebug
{
public:
  explicit Warning() : QDebug(QtWarningMsg) {nospace().noquote();}
};

/*
 * To use a FatalMsg pass it to gbFatal(), e.g.
 * gbFatal(FatalMsg() << "bye bye");
 *
 * Only the command line front end does this.  Library code reports
 * failures by throwing one of the exceptions in errors.h.
 */
class FatalMsg : public QDebug
{
public:
  // We don't use QtFatalMsg here because we don't want the destructor to call abort.
  explicit FatalMsg() : QDebug(QtCriticalMsg) {}
};

class DebugIndent
{
public:
  explicit DebugIndent(int level) : level_(level) {}
  friend QDebug& operator<<(QDebug& debug, const DebugIndent& indent);

private:
  int level_;
};

QDebug& operator<< (QDebug& debug, const DebugIndent& indent);

class Debug : public QDebug
{
public:
  Debug() : QDebug(QtDebugMsg) {nospace().noquote();}
  explicit Debug(int level) : QDebug(QtDebugMsg) {nospace().noquote() << DebugIndent(level);}
};

class ConditionalDebug
{
public:
  explicit ConditionalDebug(int level)
  {
    if (level <= global_opts.debug_level) {
      debug_ = std::make_unique<Debug>(level);
    }
  }

  template<typename T>
  ConditionalDebug& operator<<(const T& value)
  {
    if (debug_) {
      *debug_ << value;
    }
    return *this;
  }

private:
  std::unique_ptr<Debug> debug_;
};

// gbDebug(foo) << blah; only logs if global_opts.debug_level >= foo.
inline ConditionalDebug gbDebug(int level)
{
  return ConditionalDebug(level);
}

#endif //  SRC_CORE_LOGGING_H_
