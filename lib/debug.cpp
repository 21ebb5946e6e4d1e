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
@file      debug.cpp
@brief     wildcard debug logs
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2016-2025, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt

See `debug.h` for details.
*/

#include <wildcard/debug.h>
#include <cstring>
#include <ctime>
#include <sys/time.h>

FILE *WILDCARD_DBGFD_ = NULL;

extern "C" {

// open the log file once, or fall back to stderr when the name starts with a dot (-DDEBUG=) or when it cannot be opened
static FILE *WILDCARD_DBGOPEN_(const char *log)
{
  if (WILDCARD_DBGFD_ == NULL && (log[0] == '.' || (WILDCARD_DBGFD_ = ::fopen(log, "a")) == NULL))
    WILDCARD_DBGFD_ = stderr;
  return WILDCARD_DBGFD_;
}

void WILDCARD_DBGOUT_(const char *log, const char *file, int line)
{
  struct timeval tv;
  struct tm tm;
  const char *name = std::strrchr(file, '/');
  name = name != NULL ? name + 1 : file;
  FILE *fd = WILDCARD_DBGOPEN_(log);
  gettimeofday(&tv, NULL);
  localtime_r(&tv.tv_sec, &tm);
  ::fprintf(fd, "\n%02d%02d%02d/%02d%02d%02d.%06ld%18.18s:%-5d", tm.tm_year%100, tm.tm_mon+1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<long>(tv.tv_usec), name, line);
}

}
