/*
    Byte order helpers.

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

#include <cstdint>  // for uint16_t, uint32_t, uint64_t

#include "defs.h"

uint16_t
be_read16(const void* ptr)
{
  const auto* i = static_cast<const unsigned char*>(ptr);
  return static_cast<uint16_t>(i[0] << 8 | i[1]);
}

uint32_t
be_read32(const void* ptr)
{
  const auto* i = static_cast<const unsigned char*>(ptr);
  return static_cast<uint32_t>(i[0]) << 24 | static_cast<uint32_t>(i[1]) << 16 |
         static_cast<uint32_t>(i[2]) << 8 | i[3];
}

uint64_t
be_read64(const void* ptr)
{
  const auto* i = static_cast<const unsigned char*>(ptr);
  return static_cast<uint64_t>(be_read32(i)) << 32 | be_read32(i + 4);
}

uint16_t
le_read16(const void* ptr)
{
  const auto* p = static_cast<const unsigned char*>(ptr);
  return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t
le_read32(const void* ptr)
{
  const auto* p = static_cast<const unsigned char*>(ptr);
  return p[0] | static_cast<uint32_t>(p[1]) << 8 |
         static_cast<uint32_t>(p[2]) << 16 | static_cast<uint32_t>(p[3]) << 24;
}

uint64_t
le_read64(const void* ptr)
{
  const auto* p = static_cast<const unsigned char*>(ptr);
  return static_cast<uint64_t>(le_read32(p + 4)) << 32 | le_read32(p);
}
