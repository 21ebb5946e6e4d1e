/******************************************************************************\
* Copyright (c) 2016, Robert van Engelen, Genivia Inc. All rights reserved.    *
*                                                                              *
* Redistribution and use in source and binary forms, with or without           *
* modification, are permitted provided that the following conditions are met:  *
*                                                                              *
*   (1) Redistributions of source code must retain the above copyright notice, *
*       this list of conditions and the following disclaimer.                  *
*                                                                              *
*   (2) Redistributions in binary form must reproduce the above copyright      *
*       notice, this list of conditions and the following disclaimer in the    *
*       documentation and/or other materials provided with the distribution.   *
*                                                                              *
*   (3) The name of the author may not be used to endorse or promote products  *
*       derived from this software without specific prior written permission.  *
*                                                                              *
* THIS SOFTWARE IS PROVIDED BY THE AUTHOR ``AS IS'' AND ANY EXPRESS OR IMPLIED *
* WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF         *
* MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO   *
* EVENT SHALL THE AUTHOR BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,       *
* SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, *
* PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS;  *
* OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY,     *
* WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR      *
* OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF       *
* ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.                                   *
\******************************************************************************/

/**
@file      debug.h
@brief     wildcard debug logs and assertions
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2016-2025, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt

Debug logging of the wildcard parser, compiler and matcher is compiled in
only when macro DEBUG is defined:

| Source files compiled with    | DBGLOG(...) entry added to    |
| ----------------------------- | ----------------------------- |
| `c++ -DDEBUG`                 | `DEBUG.log`                   |
| `c++ -DDEBUG=WILDCARD`        | `WILDCARD.log`                |
| `c++ -DDEBUG= `               | `stderr`                      |

`DBGLOG(format, ...)` creates a timestamped log entry with the source file
name and line number and a printf-formatted message.

`DBGLOGN(format, ...)` creates a log entry without a timestamp.

`DBGLOGA(format, ...)` appends the formatted string to the previous entry.

`DBGCHK(condition)` calls `assert(condition)` when compiled with DEBUG.

`DBGSTR(const char *s)` returns `s` or `"(NULL)"` when `s == NULL`.

Example
-------

~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~{.cpp}
    #include <wildcard/pattern.h>

    int main()
    {
      wildcard::Pattern pattern("Get-*", wildcard::option::ignore_case);
      DBGLOG("Pattern %s", pattern.str().c_str());
      bool found = pattern.match("get-childitem");
      DBGLOG("Found %d", found);
    }
~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~

Compiled with `-DDEBUG` this example logs the following in `DEBUG.log`,
interleaved with the entries of the library when it is compiled with DEBUG:

~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~{.txt}
    250301/101524.311402      example.cpp:7    Pattern Get-*
    250301/101524.311477      example.cpp:9    Found 1
~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~

@note to temporarily log a specific block of code without enabling DEBUG,
use a leading underscore, e.g. `_DBGLOG(format, ...)`.
*/

#ifndef WILDCARD_DEBUG_H
#define WILDCARD_DEBUG_H

#include <cassert>
#include <cstdio>

#undef DBGLOG
#undef DBGLOGN
#undef DBGLOGA

extern FILE *WILDCARD_DBGFD_;

extern "C" void WILDCARD_DBGOUT_(const char *log, const char *file, int line);

#define DBGXIFY(S) DBGIFY_(S)
#define DBGIFY_(S) #S
#if DEBUG + 0
# define DBGFILE "DEBUG.log"
#else
# define DBGFILE DBGXIFY(DEBUG) ".log"
#endif
#define DBGSTR(S) (S?S:"(NULL)")
#define _DBGLOG(...) \
( WILDCARD_DBGOUT_(DBGFILE, __FILE__, __LINE__), ::fprintf(WILDCARD_DBGFD_, "" __VA_ARGS__), ::fflush(WILDCARD_DBGFD_))
#define _DBGLOGN(...) \
( ::fprintf(WILDCARD_DBGFD_, "\n                                        " __VA_ARGS__), ::fflush(WILDCARD_DBGFD_) )
#define _DBGLOGA(...) \
( ::fprintf(WILDCARD_DBGFD_, "" __VA_ARGS__), ::fflush(WILDCARD_DBGFD_) )

#ifdef DEBUG

#define DBGCHK(c) assert(c)

#define DBGLOG _DBGLOG
#define DBGLOGN _DBGLOGN
#define DBGLOGA _DBGLOGA

#else

#define DBGCHK(c) (void)0

#define DBGLOG(...) (void)0
#define DBGLOGN(...) (void)0
#define DBGLOGA(...) (void)0

#endif

#endif
