/*
    Copyright (C) 2002-2005 Robert Lipe, robertlipe+source@gpsbabel.org

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

#include <cstdio>                     // for printf, fflush, fprintf, stderr, stdout

#include <QCoreApplication>           // for QCoreApplication
#include <QDebug>                     // for QDebug
#include <QElapsedTimer>              // for QElapsedTimer
#include <QIODevice>                  // for QIODevice::ReadOnly, QIODevice::WriteOnly
#include <QMessageLogContext>         // for QMessageLogContext
#include <QString>                    // for QString
#include <QStringList>                // for QStringList
#include <QtGlobal>                   // for qPrintable, qFormatLogMessage, qInstallMessageHandler, qSetMessagePattern, QT_VERSION, QT_VERSION_CHECK

#include "defs.h"
#include "gpxstream.h"                // for read, write
#include "gpxtypes.h"                 // for Gpx, GpxVersion, version_from_string, version_to_string
#include "src/core/error.h"           // for Error
#include "src/core/file.h"            // for File
#include "src/core/logging.h"         // for FatalMsg, Warning


#define MYNAME "main"

// be careful not to advance argn passed the end of the list, i.e. ensure argn < qargs.size()
#define FETCH_OPTARG qargs.at(argn).size() > 2 ? QString(qargs.at(argn)).remove(0,2) : qargs.size()>(argn+1) ? qargs.at(++argn) : QString()

static QElapsedTimer timer;

static void
usage(const char* pname)
{
  printf("gpxstream Version %s.\n\n", gpxstream_version);
  printf(
    "Usage:\n"
    "    %s [options] INFILE [OUTFILE]\n"
    "\n"
    "    Reads a GPX 1.0 or GPX 1.1 file and optionally writes it back out.\n"
    "    If '-' is used for INFILE or OUTFILE, stdin or stdout will be used.\n"
    "\n"
    "Options:\n"
    "    -x version       Write GPX version 1.0 or 1.1 [same as input]\n"
    "    -c creator       Set the creator attribute of the output\n"
    "    -s               Print a summary of what was read\n"
    "    -D level         Set debug level [%d]\n"
    "    -h, -?           Print this help and exit\n"
    "    -V               Print gpxstream version and exit\n"
    "\n"
    , pname
    , global_opts.debug_level
  );
}

static void setMessagePattern()
{
  qSetMessagePattern("%{if-category}%{category}: %{endif}" MYNAME ": %{message}");
}

static void MessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg)
{
  QString message = qFormatLogMessage(type, context, msg);
  /* flush any buffered standard output */
  fflush(stdout);
  fprintf(stderr, "%s\n", qPrintable(message));
  fflush(stderr);
}

static void
print_summary(const gpxstream::Gpx& gpx)
{
  int trkpts = 0;
  int trksegs = 0;
  for (const auto& track : gpx.tracks) {
    trksegs += track.segments.size();
    for (const auto& segment : track.segments) {
      trkpts += segment.points.size();
    }
  }
  int rtepts = 0;
  for (const auto& route : gpx.routes) {
    rtepts += route.points.size();
  }

  printf("GPX %s", qPrintable(gpxstream::version_to_string(gpx.version)));
  if (gpx.creator) {
    printf(" created by %s", qPrintable(*gpx.creator));
  }
  printf("\n");
  if (gpx.metadata && gpx.metadata->name) {
    printf("name: %s\n", qPrintable(*gpx.metadata->name));
  }
  if (gpx.metadata && gpx.metadata->time) {
    printf("time: %s\n", qPrintable(gpx.metadata->time->toPrettyString()));
  }
  printf("waypoints: %d\n", static_cast<int>(gpx.waypoints.size()));
  printf("routes: %d (%d points)\n", static_cast<int>(gpx.routes.size()), rtepts);
  printf("tracks: %d (%d segments, %d points)\n", static_cast<int>(gpx.tracks.size()), trksegs, trkpts);
}

static gpxstream::Gpx
run_reader(const QString& fname)
{
  if (global_opts.debug_level > 0)  {
    timer.start();
  }
  gpxstream::File file(fname);
  file.open(QIODevice::ReadOnly);
  gpxstream::Gpx gpx = gpxstream::read(&file);
  file.close();
  if (global_opts.debug_level > 0)  {
    qDebug().noquote() << QStringLiteral("reader took %1 seconds.")
                        .arg(QString::number(timer.elapsed()/1000.0, 'f', 3));
  }
  return gpx;
}

static void
run_writer(const gpxstream::Gpx& gpx, const QString& ofname)
{
  if (global_opts.debug_level > 0)  {
    timer.start();
  }
  gpxstream::File file(ofname);
  file.open(QIODevice::WriteOnly);
  gpxstream::write(gpx, &file);
  file.close();
  if (global_opts.debug_level > 0)  {
    qDebug().noquote() << QStringLiteral("writer took %1 seconds.")
                        .arg(QString::number(timer.elapsed()/1000.0, 'f', 3));
  }
}

static int
run(const char* prog_name)
{
  int argn;
  QString argument;
  QString opt_version;
  QString opt_creator;
  bool opt_summary = false;

  // Use QCoreApplication::arguments() to process the command line.
  QStringList qargs = QCoreApplication::arguments();

  if (qargs.size() < 2) {
    usage(prog_name);
    return 0;
  }

  /*
   * Open-code getopts since POSIX-impaired OSes don't have one.
   */
  argn = 1;
  while (argn < qargs.size()) {
    // A lone '-' is stdin, not an option.
    if (qargs.at(argn).size() < 2 || qargs.at(argn).at(0).toLatin1() != '-') {
      break;
    }
    if (qargs.at(argn).at(1).toLatin1() == '-') {
      break;
    }

    int c = qargs.at(argn).at(1).toLatin1();

    switch (c) {
    case 'V':
      printf("\ngpxstream Version %s\n\n", gpxstream_version);
      return 0;
    case '?':
    case 'h':
      usage(prog_name);
      return 0;
    case 'x':
      opt_version = FETCH_OPTARG;
      if (gpxstream::version_from_string(opt_version) == gpxstream::GpxVersion::Unknown) {
        fatal(FatalMsg() << "Output version" << opt_version << "not supported, use 1.0 or 1.1.");
      }
      break;
    case 'c':
      opt_creator = FETCH_OPTARG;
      break;
    case 's':
      opt_summary = true;
      break;
    case 'D': {
      argument = FETCH_OPTARG;
      bool ok;
      global_opts.debug_level = argument.toInt(&ok);
      if (!ok) {
        fatal(FatalMsg() << "Debug level" << argument << "is not a number.");
      }
      break;
    }
    default:
      fatal("Unknown option '%s'.\n", CSTR(qargs.at(argn)));
      break;
    }
    argn++;
  }
  if (argn < qargs.size() && qargs.at(argn) == "--") {
    argn++;
  }

  /*
   * Input and output files are positional.
   */
  for (int i = 0; i < argn; i++) {
    qargs.removeFirst();
  }
  if (qargs.isEmpty()) {
    fatal("No input file specified.\n");
  }
  if (qargs.size() > 2) {
    fatal("Extra arguments on command line\n");
  }

  gpxstream::Gpx gpx = run_reader(qargs.at(0));

  if (opt_summary) {
    print_summary(gpx);
  }

  if (qargs.size() == 2) {
    if (!opt_version.isEmpty()) {
      gpxstream::GpxVersion version = gpxstream::version_from_string(opt_version);
      if (version != gpx.version) {
        gsDebug(1) << "Converting" << gpx.version << "to" << version;
      }
      gpx.version = version;
    }
    if (!opt_creator.isEmpty()) {
      gpx.creator = opt_creator;
    }
    run_writer(gpx, qargs.at(1));
  } else if (!opt_version.isEmpty() || !opt_creator.isEmpty()) {
    Warning() << "-x and -c only apply when an output file is given.";
  }

  return 0;
}

int
main(int argc, char* argv[])
{
  int rc = 0;
  const char* prog_name = argv[0]; /* may not match QCoreApplication::arguments().at(0)! */

#if (QT_VERSION < QT_VERSION_CHECK(6, 2, 0))
#error This version of Qt is not supported.
#endif

  QCoreApplication app(argc, argv);

  qInstallMessageHandler(MessageHandler);
  setMessagePattern();

  try {
    rc = run(prog_name);
  } catch (const gpxstream::Error& e) {
    fatal("%s\n", e.what());
  }

  return rc;
}
