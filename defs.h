/*
    Copyright (C) 2002-2014 Robert Lipe, robertlipe+source@gpsbabel.org

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

#include <QDebug>                    // for QDebug
#include <QString>                   // for QString


#define CSTR(qstr) ((qstr).toUtf8().constData())

#ifndef CREATOR_NAME_URL
#  define CREATOR_NAME_URL "gpxstream - https://github.com/gpxstream/gpxstream"
#endif

/*
 * Process wide knobs.  The library only ever reads these; the command
 * line tool sets them while parsing its arguments.
 */
struct global_options {
  int debug_level{0};
};

extern global_options global_opts;
extern const char gpxstream_version[];

[[noreturn]] void fatal(QDebug& msginstance);
// cppcheck 2.10.3 fails to assign noreturn attribute to fatal if
// the noreturn attribute is listed before the gnu::format attribute.
[[gnu::format(printf, 1, 2)]] [[noreturn]] void fatal(const char*, ...);

#endif // DEFS_H_INCLUDED_
