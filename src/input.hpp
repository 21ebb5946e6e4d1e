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
@file      input.hpp
@brief     line input from files and standard input, optionally gzip compressed
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2016-2025, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#ifndef INPUT_HPP
#define INPUT_HPP

#include <zlib.h>
#include <cstdio>
#include <string>

// read lines from a FILE, inflate gzip compressed input when decompression is enabled and the input starts with the gzip magic bytes
class LineInput {

 public:

  static const size_t BUFSIZE = 65536;

  LineInput(FILE *file, const char *pathname, bool decompress);

  ~LineInput();

  // read the next line without its \n or \r\n, return false at the end of the input
  bool getline(std::string& line);

  // return the error message when reading or decompressing failed, NULL otherwise
  const char *error() const
  {
    return err_;
  }

 private:

  LineInput(const LineInput&);
  LineInput& operator=(const LineInput&);

  // refill the buffer, return false at the end of the input or on error
  bool fill();

  FILE         *file_;        // input file
  const char   *pathname_;    // pathname of the input file
  const char   *err_;         // error message or NULL
  bool          zip_;         // true if inflating gzip compressed input
  bool          zend_;        // true if the last gzip member inflated so far is complete
  bool          eof_;         // true if the end of the file was reached
  z_stream      strm_;        // zlib stream
  size_t        pos_;         // position of the next byte in buf_[]
  size_t        end_;         // end of the data in buf_[]
  char          buf_[BUFSIZE]; // decompressed or plain input
  unsigned char zbuf_[BUFSIZE]; // compressed input

};

#endif
