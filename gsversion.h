/*
 * Version of the library and of the command line tool.
 */
#ifndef GSVERSION_H_INCLUDED_
#define GSVERSION_H_INCLUDED_

#define VERSION "1.0.0"

#endif // GSVERSION_H_INCLUDED_
