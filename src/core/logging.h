/*
    Copyright (C) 2014 Robert Lipe, robertlipe+source@gpsbabel.org

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

#include "defs.h"

#include <QDebug>            // for QDebug
#include <QtGlobal>          // for QtCriticalMsg, QtWarningMsg


class Warning : public QDebug
{
public:
  explicit Warning() : QDebug(QtWarningMsg) {}
};

/*
 * To use a FatalMsg pass it to fatal(), e.g.
 * fatal(FatalMsg() << "bye bye");
 *
 * Only the command line tool does this.  The parser and writer report
 * problems by throwing gpxstream::Error and leave the decision to exit
 * to their caller.
 */
class FatalMsg : public QDebug
{
public:
  // We don't use QtFatalMsg here because we don't want the destructor to call abort.
  explicit FatalMsg() : QDebug(QtCriticalMsg) {}
};

// Two spaces per level, e.g. gsDebug(3) << DebugIndent(ctx.depth()) << tag.
class DebugIndent
{
public:
  explicit DebugIndent(int level) : level_(level) {}
  friend QDebug& operator<<(QDebug& debug, const DebugIndent& indent);

private:
  int level_;
};

QDebug& operator<< (QDebug& debug, const DebugIndent& indent);

class ConditionalDebug {
public:
  explicit ConditionalDebug(int level) : enabled_(level <= global_opts.debug_level) {
    if (enabled_) {
      debug_ = new QDebug(QtDebugMsg);
      debug_->nospace().noquote();
    } else {
      debug_ = nullptr;
    }
  }

  ConditionalDebug(const ConditionalDebug&) = delete;
  ConditionalDebug& operator=(const ConditionalDebug&) = delete;
  ConditionalDebug(ConditionalDebug&& other) noexcept : enabled_(other.enabled_), debug_(other.debug_) {
    other.debug_ = nullptr;
  }
  ConditionalDebug& operator=(ConditionalDebug&&) = delete;

  ~ConditionalDebug() {
    delete debug_;
  }

  template<typename T>
  ConditionalDebug& operator<<(const T& value) {
    if (debug_) {
      *debug_ << value;
    }
    return *this;
  }

private:
  bool enabled_;
  QDebug* debug_;
};

// gsDebug(foo) <<  blah; only blogs if global_opts.debug_level >= foo.
inline ConditionalDebug gsDebug(int level) {
  return ConditionalDebug(level);
}

#endif //  SRC_CORE_LOGGING_H_
