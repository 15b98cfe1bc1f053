/*
    Exceptions raised by the activity engine.

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
#ifndef ERRORS_H_INCLUDED_
#define ERRORS_H_INCLUDED_

#include <stdexcept>  // for runtime_error

#include <QString>    // for QString

namespace ridelog
{

class Error : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
  explicit Error(const QString& what) : std::runtime_error(what.toStdString()) {}
};

/*
 * Decode time errors.  The input file is rejected.
 */
class DecodeError : public Error
{
  using Error::Error;
};

class MalformedHeaderError : public DecodeError
{
  using DecodeError::DecodeError;
};

class UnsupportedVersionError : public DecodeError
{
  using DecodeError::DecodeError;
};

class TruncatedStreamError : public DecodeError
{
  using DecodeError::DecodeError;
};

/*
 * Derivation time errors.  The file was fine but does not hold the data
 * a particular view needs.
 */
class DerivationError : public Error
{
  using Error::Error;
};

class EmptyTrackError : public DerivationError
{
  using DerivationError::DerivationError;
};

class NoGeodataError : public DerivationError
{
  using DerivationError::DerivationError;
};

/*
 * A stored blob failed its integrity checks.  Never repaired.
 */
class CorruptBlobError : public Error
{
  using Error::Error;
};

class MapRenderError : public Error
{
  using Error::Error;
};

class ConfigError : public Error
{
  using Error::Error;
};

} // namespace ridelog

#endif // ERRORS_H_INCLUDED_
