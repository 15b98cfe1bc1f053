/*
    Library for inifile like data files.

    Copyright (C) 2006 Olaf Klein, o.b.klein@gpsbabel.org
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
    Foundation, Inc., 59 Temple Place - Suite 330, Boston, MA 02111 USA

#include "inifile.h"

#include <utility>             // for move

#include <QtCore/QDir>         // for QDir
#include <QtCore/QFile>        // for QFile
#include <QtCore/QFileInfo>    // for QFileInfo
#include <QtCore/QIODevice>    // for QIODevice::ReadOnly, QIODevice
#include <QtCore/QTextStream>  // for QTextStream
#include <QtCore/QtGlobal>     // for qEnvironmentVariable, qPrintable

#include "defs.h"              // for global_opts
#include "errors.h"            // for ConfigError
#include "src/core/logging.h"  // for Debug, Warning

#define MYNAME "inifile"

namespace ridelog
{

/* internal procedures */

#define RIDELOG_INIFILE "ridelog.ini"
#define RIDELOG_SUBDIR ".ridelog"


static QString
find_ridelog_inifile(const QString& path)  /* can be empty */
{
  if (path.isNull()) {
    return QString();
  }
  QString inipath(QDir(path).filePath(RIDELOG_INIFILE));
  return QFile(inipath).open(QIODevice::ReadOnly) ? inipath : QString();
}

static QString
open_ridelog_inifile()
{
  QString envstr = qEnvironmentVariable("RIDELOGINI");
  if (!envstr.isNull()) {
    if (QFile(envstr).open(QIODevice::ReadOnly)) {
      return envstr;
    }
    Warning() << MYNAME ": inifile " << envstr << ", defined in environment, NOT found!";
    return QString();
  }
  QString name = find_ridelog_inifile("");  // Check in current directory first.
  if (name.isNull()) {
    // Use &&'s early-out behaviour to try successive file locations: first
    // ~/.ridelog, then /usr/local/etc, then /etc.
    (name = find_ridelog_inifile(QDir::home().filePath(RIDELOG_SUBDIR))).isNull()
    && (name = find_ridelog_inifile("/usr/local/etc")).isNull()
    && (name = find_ridelog_inifile("/etc")).isNull();
  }
  return name;
}

static void
inifile_load_file(QTextStream* stream, inifile_t* inifile, const char* myname)
{
  QString buf;
  InifileSection section;
  int line = 0;

  while (!(buf = stream->readLine()).isNull()) {
    ++line;
    buf = buf.trimmed();

    if (buf.isEmpty()) {
      continue;  /* skip empty lines */
    }
    if ((buf.at(0) == '#') || (buf.at(0) == ';')) {
      continue;  /* skip comments */
    }

    if (buf.at(0) == '[') {
      QString section_name;
      if (buf.contains(']')) {
        section_name = buf.mid(1, buf.indexOf(']') - 1).trimmed();
      }
      if (section_name.isEmpty()) {
        throw ConfigError(QStringLiteral("%1: invalid section header '%2' at line %3 of '%4'.")
                          .arg(QString(myname), buf).arg(line).arg(inifile->source));
      }

      // form lowercase key to implement CaseInsensitive matching.
      section_name = section_name.toLower();
      if (!inifile->sections.contains(section_name)) {
        inifile->sections.insert(section_name, InifileSection(section_name));
      }
      section = inifile->sections.value(section_name);
    } else {
      if (section.name.isEmpty()) {
        throw ConfigError(QStringLiteral("%1: missing section header in '%2'.")
                          .arg(QString(myname), inifile->source));
      }

      // Store key in lower case to implement CaseInsensitive matching.
      QString key = buf.section('=', 0, 0).trimmed().toLower();
      // Force the value to be non-null but possibly empty so a found key
      // without a value can be told apart from a missing key.
      QString value = buf.section('=', 1).append("").trimmed();
      section.entries.insert(key, value);

      // update the QHash sections with the modified InifileSection section.
      inifile->sections.insert(section.name, section);
    }
  }
}

static QString
inifile_find_value(const inifile_t* inifile, const QString& sec_name, const QString& key)
{
  if (inifile == nullptr) {
    return QString();
  }

  // CaseInsensitive matching implemented by forcing sec_name & key to lower case.
  return inifile->sections.value(sec_name.toLower()).entries.value(key.toLower());
}

/* public procedures */

std::unique_ptr<inifile_t>
inifile_init(const QString& filename, const char* myname)
{
  QString name;

  if (filename.isEmpty()) {
    name = open_ridelog_inifile();
    if (name.isEmpty()) {
      if (global_opts.debug_level >= 1) {
        Debug(1) << MYNAME ": no inifile found, using defaults";
      }
      return nullptr;
    }
  } else {
    name = filename;
  }

  QFile file(name);
  if (!file.open(QIODevice::ReadOnly)) {
    throw ConfigError(QStringLiteral("%1: Cannot open '%2' for read.  Error was '%3'.")
                      .arg(QString(myname), QFileInfo(file).absoluteFilePath(), file.errorString()));
  }
  QTextStream stream(&file);
  stream.setAutoDetectUnicode(true);

  auto result = std::make_unique<inifile_t>();
  result->source = QFileInfo(file).absoluteFilePath();
  if (global_opts.debug_level >= 1) {
    Debug(1) << MYNAME ": reading " << result->source;
  }
  inifile_load_file(&stream, result.get(), myname);

  file.close();
  return result;
}

QString
inifile_readstr(const inifile_t* inifile, const char* section, const char* key)
{
  return inifile_find_value(inifile, section, key);
}

std::optional<int>
inifile_readint(const inifile_t* inifile, const char* section, const char* key)
{
  const QString str = inifile_find_value(inifile, section, key);

  if (str.isNull()) {
    return std::nullopt;
  }

  bool ok;
  int value = str.toInt(&ok);
  if (!ok) {
    throw ConfigError(QStringLiteral(MYNAME ": %1/%2 in '%3' is not an integer: '%4'.")
                      .arg(QString(section), QString(key), inifile->source, str));
  }
  return value;
}

std::optional<double>
inifile_readdouble(const inifile_t* inifile, const char* section, const char* key)
{
  const QString str = inifile_find_value(inifile, section, key);

  if (str.isNull()) {
    return std::nullopt;
  }

  bool ok;
  double value = str.toDouble(&ok);
  if (!ok) {
    throw ConfigError(QStringLiteral(MYNAME ": %1/%2 in '%3' is not a number: '%4'.")
                      .arg(QString(section), QString(key), inifile->source, str));
  }
  return value;
}

int
inifile_readint_def(const inifile_t* inifile, const char* section, const char* key, const int def)
{
  return inifile_readint(inifile, section, key).value_or(def);
}

double
inifile_readdouble_def(const inifile_t* inifile, const char* section, const char* key, const double def)
{
  return inifile_readdouble(inifile, section, key).value_or(def);
}

} // namespace ridelog
