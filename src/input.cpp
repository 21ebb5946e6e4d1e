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
@file      input.cpp
@brief     line input from files and standard input, optionally gzip compressed
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2016-2025, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#include "input.hpp"
#include <wildcard/debug.h>
#include <cstring>

LineInput::LineInput(FILE *file, const char *pathname, bool decompress)
  :
    file_(file),
    pathname_(pathname),
    err_(NULL),
    zip_(false),
    zend_(false),
    eof_(false),
    pos_(0),
    end_(0)
{
  std::memset(&strm_, 0, sizeof(strm_));

  DBGLOG("LineInput %s decompress=%d", DBGSTR(pathname), decompress);

  if (!decompress)
    return;

  // check the gzip magic bytes, pass the bytes read on as plain input when not compressed
  end_ = fread(zbuf_, 1, 2, file_);
  if (end_ == 2 && zbuf_[0] == 0x1f && zbuf_[1] == 0x8b)
  {
    strm_.zalloc = Z_NULL;
    strm_.zfree = Z_NULL;
    strm_.opaque = Z_NULL;
    strm_.next_in = zbuf_;
    strm_.avail_in = 2;

    // inflate gzip compressed data starting with a gzip header
    if (inflateInit2(&strm_, 16 + MAX_WBITS) != Z_OK)
    {
      err_ = strm_.msg != NULL ? strm_.msg : "inflateInit2 failed";
      eof_ = true;
    }
    else
    {
      zip_ = true;
    }

    end_ = 0;
  }
  else
  {
    std::memcpy(buf_, zbuf_, end_);
  }
}

LineInput::~LineInput()
{
  if (zip_)
    inflateEnd(&strm_);
}

bool LineInput::getline(std::string& line)
{
  line.clear();

  while (true)
  {
    if (pos_ >= end_ && !fill())
      break;

    const char *s = buf_ + pos_;
    const char *e = static_cast<const char*>(std::memchr(s, '\n', end_ - pos_));

    if (e != NULL)
    {
      line.append(s, e - s);
      pos_ += e - s + 1;
      if (!line.empty() && line[line.size() - 1] == '\r')
        line.resize(line.size() - 1);
      return true;
    }

    line.append(s, end_ - pos_);
    pos_ = end_;
  }

  // last line without a terminating \n
  if (line.empty())
    return false;
  if (line[line.size() - 1] == '\r')
    line.resize(line.size() - 1);
  return true;
}

bool LineInput::fill()
{
  pos_ = 0;
  end_ = 0;

  if (eof_ || err_ != NULL)
    return false;

  if (!zip_)
  {
    end_ = fread(buf_, 1, BUFSIZE, file_);
    if (end_ == 0)
    {
      if (ferror(file_))
        err_ = "error while reading";
      eof_ = true;
      return false;
    }
    return true;
  }

  while (end_ == 0)
  {
    if (strm_.avail_in == 0)
    {
      size_t len = fread(zbuf_, 1, BUFSIZE, file_);
      if (len == 0)
      {
        if (ferror(file_))
          err_ = "error while reading";
        else if (!zend_)
          err_ = "an error was detected in the gzip compressed data";
        if (err_ != NULL)
          DBGLOG("LineInput %s: %s", DBGSTR(pathname_), err_);
        eof_ = true;
        return false;
      }
      strm_.next_in = zbuf_;
      strm_.avail_in = static_cast<uInt>(len);
    }

    strm_.next_out = reinterpret_cast<Bytef*>(buf_);
    strm_.avail_out = static_cast<uInt>(BUFSIZE);

    int ret = inflate(&strm_, Z_NO_FLUSH);

    if (ret != Z_OK && ret != Z_STREAM_END && ret != Z_BUF_ERROR)
    {
      err_ = "an error was detected in the gzip compressed data";
      return false;
    }

    end_ = BUFSIZE - strm_.avail_out;

    // input may end here, but not in the middle of a gzip member
    zend_ = ret == Z_STREAM_END || (zend_ && ret == Z_BUF_ERROR && end_ == 0);

    // try to decompress the next concatenated gzip data
    if (ret == Z_STREAM_END && inflateReset(&strm_) != Z_OK)
    {
      err_ = "an error was detected in the gzip compressed data";
      eof_ = true;
    }
  }

  return true;
}
