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
@file      wcmatch.cpp
@brief     select names matching wildcard patterns
@author    Robert van Engelen - engelen@genivia.com
@copyright (c) 2016-2025, Robert van Engelen, Genivia Inc. All rights reserved.
@copyright (c) BSD-3 License - see LICENSE.txt

Usage:

    wcmatch [OPTIONS] [PATTERN] [FILE ...]

Reads names, one per line, from the FILEs or from standard input and writes
the names that match an include pattern and no exclude pattern.

Examples:

    ls | wcmatch -i '*.[ch]pp' -x 'test_*'
    wcmatch --regex 'a*b?'
    wcmatch -z -c 'lib*.so*' names.txt.gz
*/

#include "wcmatch.hpp"
#include "input.hpp"
#include <wildcard/pattern.h>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>

// wcmatch command-line options
bool flag_count                   = false;
bool flag_culture_invariant       = false;
bool flag_decompress              = false;
bool flag_dos                     = false;
bool flag_escape                  = false;
bool flag_has_wildcards           = false;
bool flag_ignore_case             = false;
bool flag_invert_match            = false;
bool flag_regex                   = false;
bool flag_unescape                = false;
bool flag_usage_warnings          = false;
bool flag_wql                     = false;
std::string flag_config;
std::string flag_escape_chars;
std::vector<std::string> flag_include;
std::vector<std::string> flag_exclude;
std::set<std::string> flag_config_files;

// command-line arguments
std::vector<std::string> arg_files;

// number of warnings and errors issued
size_t warnings = 0;

// depth of configuration files being loaded, config files may load one other config file
static int config_depth = 0;

static void load_config();

// trim white space from either end of the line
static void trim(std::string& line)
{
  size_t len = line.length();
  size_t pos;

  for (pos = 0; pos < len && isspace(static_cast<unsigned char>(line.at(pos))); ++pos)
    continue;

  if (pos > 0)
    line.erase(0, pos);

  len -= pos;

  for (pos = len; pos > 0 && isspace(static_cast<unsigned char>(line.at(pos - 1))); --pos)
    continue;

  if (len > pos)
    line.erase(pos, len - pos);
}

// get short option argument
static const char *getoptarg(int argc, const char **argv, const char *arg, int& i)
{
  if (*++arg == '=')
    ++arg;
  if (*arg != '\0')
    return arg;
  if (++i < argc)
    return argv[i];
  return "";
}

// get required non-empty long option argument after =
static const char *getloptarg(int argc, const char **argv, const char *arg, int& i)
{
  if (*arg != '\0')
    return arg;
  if (++i < argc)
    return argv[i];
  return "";
}

// --config[=FILE]
static void option_config(const char *file)
{
  if (config_depth > 1)
  {
    usage("recursive configuration --", "config");
    return;
  }

  std::string this_config(flag_config);
  flag_config.assign(file);
  load_config();
  flag_config.swap(this_config);
}

void options(int argc, const char **argv)
{
  bool options = true;

  for (int i = 1; i < argc; ++i)
  {
    const char *arg = argv[i];

    if (*arg == '-' && arg[1] != '\0' && options)
    {
      bool is_grouped = true;

      // parse a wcmatch command-line option
      while (is_grouped && *++arg != '\0')
      {
        switch (*arg)
        {
          case '-':
            is_grouped = false;
            if (*++arg == '\0')
            {
              options = false;
              continue;
            }

            switch (*arg)
            {
              case 'c':
                if (strcmp(arg, "config") == 0)
                  option_config("");
                else if (strncmp(arg, "config=", 7) == 0)
                  option_config(arg + 7);
                else if (strcmp(arg, "count") == 0)
                  flag_count = true;
                else if (strcmp(arg, "culture-invariant") == 0)
                  flag_culture_invariant = true;
                else
                  usage("invalid option --", arg, "--config, --count or --culture-invariant");
                break;

              case 'd':
                if (strcmp(arg, "decompress") == 0)
                  flag_decompress = true;
                else if (strcmp(arg, "dos") == 0)
                  flag_dos = true;
                else
                  usage("invalid option --", arg, "--decompress or --dos");
                break;

              case 'e':
                if (strcmp(arg, "escape") == 0)
                  flag_escape = true;
                else if (strncmp(arg, "escape=", 7) == 0)
                {
                  flag_escape = true;
                  flag_escape_chars.assign(arg + 7);
                }
                else if (strcmp(arg, "exclude") == 0)
                  flag_exclude.push_back(getloptarg(argc, argv, "", i));
                else if (strncmp(arg, "exclude=", 8) == 0)
                  flag_exclude.push_back(getloptarg(argc, argv, arg + 8, i));
                else
                  usage("invalid option --", arg, "--escape or --exclude=");
                break;

              case 'h':
                if (strcmp(arg, "has-wildcards") == 0)
                  flag_has_wildcards = true;
                else if (strcmp(arg, "help") == 0)
                  help();
                else
                  usage("invalid option --", arg, "--has-wildcards or --help");
                break;

              case 'i':
                if (strcmp(arg, "ignore-case") == 0)
                  flag_ignore_case = true;
                else if (strcmp(arg, "include") == 0)
                  flag_include.push_back(getloptarg(argc, argv, "", i));
                else if (strncmp(arg, "include=", 8) == 0)
                  flag_include.push_back(getloptarg(argc, argv, arg + 8, i));
                else if (strcmp(arg, "invert-match") == 0)
                  flag_invert_match = true;
                else
                  usage("invalid option --", arg, "--ignore-case, --include= or --invert-match");
                break;

              case 'r':
                if (strcmp(arg, "regex") == 0)
                  flag_regex = true;
                else
                  usage("invalid option --", arg, "--regex");
                break;

              case 'u':
                if (strcmp(arg, "unescape") == 0)
                  flag_unescape = true;
                else
                  usage("invalid option --", arg, "--unescape");
                break;

              case 'v':
                if (strcmp(arg, "version") == 0)
                  version();
                else
                  usage("invalid option --", arg, "--version");
                break;

              case 'w':
                if (strcmp(arg, "wql") == 0)
                  flag_wql = true;
                else
                  usage("invalid option --", arg, "--wql");
                break;

              default:
                usage("invalid option --", arg);
            }
            break;

          case 'c':
            flag_count = true;
            break;

          case 'e':
            flag_include.push_back(getoptarg(argc, argv, arg, i));
            is_grouped = false;
            break;

          case 'h':
            help();
            break;

          case 'I':
            flag_culture_invariant = true;
            break;

          case 'i':
            flag_ignore_case = true;
            break;

          case 'V':
            version();
            break;

          case 'v':
            flag_invert_match = true;
            break;

          case 'x':
            flag_exclude.push_back(getoptarg(argc, argv, arg, i));
            is_grouped = false;
            break;

          case 'z':
            flag_decompress = true;
            break;

          default:
            {
              char option[2] = { *arg, '\0' };
              usage("invalid option -", option, "-c, -e, -h, -I, -i, -V, -v, -x or -z");
            }
        }
      }
    }
    else
    {
      arg_files.push_back(arg);
    }
  }
}

// load a configuration file of long options without the leading --
static void load_config()
{
  // the default config file is .wcmatch when FILE is not specified
  bool is_default = flag_config.empty();
  if (is_default)
    flag_config = ".wcmatch";

  // open a local config file or in the home directory
  std::string config_file(flag_config);
  FILE *file = fopen(config_file.c_str(), "r");
  if (file == NULL)
  {
    const char *home_dir = getenv("HOME");
    if (home_dir != NULL && flag_config[0] != '~' && flag_config[0] != '/')
    {
      config_file.assign(home_dir).append("/").append(flag_config);
      file = fopen(config_file.c_str(), "r");
    }
  }

  if (file == NULL)
  {
    if (!is_default)
      error("option --config: cannot read", flag_config.c_str());
    return;
  }

  // parse each config file once
  if (!flag_config_files.insert(config_file).second)
  {
    fclose(file);
    return;
  }

  bool usage_warnings = flag_usage_warnings;
  bool errors = false;
  size_t lineno = 1;
  std::string line;
  LineInput input(file, config_file.c_str(), false);

  ++config_depth;

  while (input.getline(line))
  {
    trim(line);

    // parse option or skip empty lines and comments
    if (!line.empty() && line[0] != '#')
    {
      // construct an option argument to parse as argv[]
      line.insert(0, "--");
      const char *args[2] = { NULL, line.c_str() };

      size_t count = warnings;

      // warn about invalid options but do not exit
      flag_usage_warnings = true;

      options(2, args);

      if (warnings > count)
      {
        std::cerr << "wcmatch: error in " << config_file << " at line " << lineno << '\n';
        errors = true;
      }
    }

    ++lineno;
  }

  --config_depth;

  flag_usage_warnings = usage_warnings;

  if (input.error() != NULL)
    error("error while reading", config_file.c_str());

  fclose(file);

  if (errors)
    exit(EXIT_ERROR);
}

// parse options and arguments, the first argument is the pattern when no -e PATTERN is specified
static void init(int argc, const char **argv)
{
  options(argc, argv);

  if (flag_include.empty() && !arg_files.empty())
  {
    flag_include.push_back(arg_files.front());
    arg_files.erase(arg_files.begin());
  }

  if (flag_include.empty() && (flag_regex || flag_dos || flag_wql || flag_escape || flag_unescape || flag_has_wildcards))
    usage("no PATTERN specified");
}

static wildcard::option_type pattern_options()
{
  wildcard::option_type options = wildcard::option::none;
  if (flag_ignore_case)
    options |= wildcard::option::ignore_case;
  if (flag_culture_invariant)
    options |= wildcard::option::culture_invariant;
  return options;
}

// --regex, --dos, --wql, --escape, --unescape, --has-wildcards
static int convert()
{
  wildcard::option_type options = pattern_options();
  bool found = false;

  for (std::vector<std::string>::const_iterator i = flag_include.begin(); i != flag_include.end(); ++i)
  {
    if (flag_has_wildcards)
    {
      found = found || wildcard::Pattern::has_wildcards(*i);
    }
    else if (flag_escape)
    {
      std::cout << wildcard::Pattern::escape(*i, flag_escape_chars) << '\n';
    }
    else if (flag_unescape)
    {
      std::cout << wildcard::Pattern::unescape(*i) << '\n';
    }
    else
    {
      wildcard::Pattern pattern(*i, options);

      if (flag_regex)
      {
        // reject regex renderings that Boost.Regex does not accept
        boost::regex regex = pattern.regex();
        std::cout << regex.str() << '\n';
      }
      else if (flag_dos)
      {
        std::cout << pattern.dos_string() << '\n';
      }
      else
      {
        std::cout << pattern.wql() << '\n';
      }
    }
  }

  std::cout.flush();

  if (flag_has_wildcards)
    return found ? EXIT_OK : EXIT_FAIL;

  return EXIT_OK;
}

// select the names read from the input that are accepted by the filter, or rejected with -v
static size_t select_names(FILE *file, const char *pathname, const wildcard::Filter& filter)
{
  LineInput input(file, pathname, flag_decompress);
  std::string line;
  size_t count = 0;

  while (input.getline(line))
  {
    if (filter.accept(line) != flag_invert_match)
    {
      ++count;
      if (!flag_count)
      {
        fwrite(line.data(), 1, line.size(), stdout);
        putchar('\n');
      }
    }
  }

  if (input.error() != NULL)
  {
    errno = 0;
    warning(input.error(), pathname);
  }

  return count;
}

bool wcmatch()
{
  wildcard::Filter filter(pattern_options());

  for (std::vector<std::string>::const_iterator i = flag_include.begin(); i != flag_include.end(); ++i)
    filter.include(*i);

  for (std::vector<std::string>::const_iterator i = flag_exclude.begin(); i != flag_exclude.end(); ++i)
    filter.exclude(*i);

  size_t count = 0;

  if (arg_files.empty())
  {
    count += select_names(stdin, "(standard input)", filter);
  }
  else
  {
    for (std::vector<std::string>::const_iterator i = arg_files.begin(); i != arg_files.end(); ++i)
    {
      if (*i == "-")
      {
        count += select_names(stdin, "(standard input)", filter);
        continue;
      }

      errno = 0;
      FILE *file = fopen(i->c_str(), "rb");

      if (file == NULL)
      {
        warning("cannot read", i->c_str());
        continue;
      }

      count += select_names(file, i->c_str(), filter);

      fclose(file);
    }
  }

  if (flag_count)
    printf("%zu\n", count);

  fflush(stdout);

  return count > 0;
}

int main(int argc, const char **argv)
{
  try
  {
    init(argc, argv);
  }

  catch (std::exception& error)
  {
    abort("error: ", error.what());
  }

  int status = EXIT_FAIL;

  try
  {
    if (flag_regex || flag_dos || flag_wql || flag_escape || flag_unescape || flag_has_wildcards)
      status = convert();
    else
      status = wcmatch() ? EXIT_OK : EXIT_FAIL;
  }

  catch (wildcard::pattern_error& error)
  {
    abort("error: ", error.what());
  }

  catch (wildcard::conversion_error& error)
  {
    abort("error: ", error.what());
  }

  catch (std::exception& error)
  {
    abort("error: ", error.what());
  }

  return warnings > 0 ? EXIT_ERROR : status;
}

// print usage message and exit, or warn when reading a config file
void usage(const char *message, const char *arg, const char *valid)
{
  std::cerr << "wcmatch: " << message << (arg != NULL ? arg : "");
  if (valid != NULL)
    std::cerr << ", did you mean " << valid << "?";
  std::cerr << std::endl;
  std::cerr << "For more help on options, try `wcmatch --help'" << std::endl;

  // do not exit when reading a config file
  if (!flag_usage_warnings)
    exit(EXIT_ERROR);

  ++warnings;
}

// print help information and exit
void help()
{
  std::cout <<
    "Usage: wcmatch [OPTIONS] [PATTERN] [-e PATTERN] [-x PATTERN] [FILE ...]\n\n\
    Reads names, one per line, from the FILEs or from standard input when no\n\
    FILE or - is specified, and writes the names that match an include\n\
    PATTERN and no exclude PATTERN.  When no -e PATTERN is specified, the\n\
    first argument is the include PATTERN.\n\n\
    A wildcard PATTERN matches the entire name.  `*' matches any sequence of\n\
    characters, `?' matches any one character, `[abc]' and `[a-z]' match one\n\
    character in the list or range.  A backtick escapes the next character.\n\n\
    -c, --count\n\
            Only print the number of selected names.\n\
    --config[=FILE]\n\
            Use configuration FILE.  The default FILE is `.wcmatch' in the\n\
            working directory or in the home directory.  A configuration file\n\
            lists long options without the leading `--', one per line.  Lines\n\
            starting with a `#' are comments.\n\
    --dos\n\
            Print the DOS wildcard rendering of each PATTERN and exit.\n\
    -e PATTERN, --include=PATTERN\n\
            Select names that match PATTERN.  This option may be repeated.\n\
    --escape[=CHARS]\n\
            Print each PATTERN with its wildcard characters escaped, except\n\
            for those in CHARS, and exit.\n\
    --has-wildcards\n\
            Exit with status 0 when a PATTERN has unescaped wildcards, 1\n\
            otherwise.\n\
    -h, --help\n\
            Display this help and exit.\n\
    -I, --culture-invariant\n\
            Fold case independently of the current locale with -i.\n\
    -i, --ignore-case\n\
            Perform case insensitive matching.\n\
    --regex\n\
            Print the regex rendering of each PATTERN and exit.\n\
    --unescape\n\
            Print each PATTERN with its escapes removed and exit.\n\
    -V, --version\n\
            Display version information and exit.\n\
    -v, --invert-match\n\
            Select names that are not selected by the PATTERNs.\n\
    --wql\n\
            Print the WQL LIKE operand of each PATTERN and exit, fails when a\n\
            PATTERN has a bracket list.\n\
    -x PATTERN, --exclude=PATTERN\n\
            Do not select names that match PATTERN.  This option may be\n\
            repeated.\n\
    -z, --decompress\n\
            Decompress gzip compressed input.\n\n\
    The exit status is 0 if a name is selected, 1 if no names are selected\n\
    and 2 if an error occurred.\n\n";
  exit(EXIT_OK);
}

// print version info and exit
void version()
{
  std::cout << "wcmatch " WCMATCH_VERSION "; -z:zlib " ZLIB_VERSION "; --regex:boost_regex\n"
    "License: BSD-3-Clause" << std::endl;
  exit(EXIT_OK);
}

// print to standard error: warning message, display error if errno is set, like perror()
void warning(const char *message, const char *arg)
{
  const char *errmsg = errno ? strerror(errno) : NULL;
  fprintf(stderr, "wcmatch: warning: %s%s%s%c %s\n", message != NULL ? message : "", message != NULL ? " " : "", arg != NULL ? arg : "", errmsg != NULL ? ':' : ' ', errmsg != NULL ? errmsg : "");
  ++warnings;
}

// print to standard error: error message, assumes errno is set, like perror(), then exit
void error(const char *message, const char *arg)
{
  const char *errmsg = strerror(errno);
  fprintf(stderr, "wcmatch: error: %s%s%s: %s\n\n", message != NULL ? message : "", message != NULL ? " " : "", arg != NULL ? arg : "", errmsg);
  exit(EXIT_ERROR);
}

// print to standard error: abort message with exception details, then exit
void abort(const char *message, const std::string& what)
{
  fprintf(stderr, "wcmatch: %s%s\n\n", message != NULL ? message : "", what.c_str());
  exit(EXIT_ERROR);
}
