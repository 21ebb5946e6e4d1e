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
@file      wcmatch.hpp
@brief     select names matching wildcard patterns, global flags set by options
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2016-2025, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#ifndef WCMATCH_HPP
#define WCMATCH_HPP

// wcmatch version
#define WCMATCH_VERSION "1.0.0"

// wcmatch exit codes
#define EXIT_OK    0 // One or more names were selected
#define EXIT_FAIL  1 // No names were selected
#define EXIT_ERROR 2 // An error occurred

#include <wildcard/filter.h>
#include <cstdio>
#include <set>
#include <string>
#include <vector>

// wcmatch command-line options
extern bool flag_count;
extern bool flag_culture_invariant;
extern bool flag_decompress;
extern bool flag_dos;
extern bool flag_escape;
extern bool flag_has_wildcards;
extern bool flag_ignore_case;
extern bool flag_invert_match;
extern bool flag_regex;
extern bool flag_unescape;
extern bool flag_usage_warnings; // internal flag
extern bool flag_wql;
extern std::string flag_config;
extern std::string flag_escape_chars;
extern std::vector<std::string> flag_include;
extern std::vector<std::string> flag_exclude;
extern std::set<std::string> flag_config_files;

// command-line arguments
extern std::vector<std::string> arg_files;

// number of warnings and errors issued
extern size_t warnings;

// parse the command-line options and arguments, options are also parsed from config files
extern void options(int argc, const char **argv);

// select names from the input files or from standard input
extern bool wcmatch();

extern void usage(const char *message, const char *arg = NULL, const char *valid = NULL);
extern void help();
extern void version();
extern void warning(const char *message, const char *arg);
extern void error(const char *message, const char *arg);
extern void abort(const char *message, const std::string& what);

#endif
