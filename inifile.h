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

#ifndef HAVE_INIFILE_H
#define HAVE_INIFILE_H

#include <memory>              // for unique_ptr
#include <optional>            // for optional
#include <utility>             // for move

#include <QtCore/QHash>        // for QHash
#include <QtCore/QString>      // for QString

namespace ridelog
{

class InifileSection
{
public:
  QString name;
  QHash<QString, QString> entries;

  InifileSection() = default;
  explicit InifileSection(QString nm) : name{std::move(nm)} {}
};

struct inifile_t {
  QHash<QString, InifileSection> sections;
  QString source;
};

/*
	inifile_init:
	  reads inifile filename into memory
	  myname represents the calling module

	  filename empty: try to find the global ridelog.ini, returns
	  nullptr if there is none.  Unreadable or malformed files throw
	  ConfigError.
 */
std::unique_ptr<inifile_t> inifile_init(const QString& filename, const char* myname);

/*
     inifile_readstr:
       returns a null QString if not found, otherwise a non-null but possibly
       empty QString with the value of key ...
 */
QString inifile_readstr(const inifile_t* inifile, const char* section, const char* key);

/*
     inifile_readint, inifile_readdouble:
       return an empty optional if the key isn't there.  A value that
       isn't a number throws ConfigError.
 */
std::optional<int> inifile_readint(const inifile_t* inifile, const char* section, const char* key);
std::optional<double> inifile_readdouble(const inifile_t* inifile, const char* section, const char* key);

/*
     inifile_readint_def:
       if found inifile_readint_def returns value of key, otherwise a default value "def"
 */
int inifile_readint_def(const inifile_t* inifile, const char* section, const char* key, int def);
double inifile_readdouble_def(const inifile_t* inifile, const char* section, const char* key, double def);

} // namespace ridelog

#endif
