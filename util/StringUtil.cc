// vcdq, Value Change Dump Query Engine
// Copyright (c) 2025, Parallax Software, Inc.
// 
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
// 
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
// GNU General Public License for more details.
// 
// You should have received a copy of the GNU General Public License
// along with this program. If not, see <https://www.gnu.org/licenses/>.
// 
// The origin of this software must not be misrepresented; you must not
// claim that you wrote the original software.
// 
// Altered source versions must be plainly marked as such, and must not be
// misrepresented as being the original software.
// 
// This notice may not be removed or altered from any source distribution.


#include "StringUtil.hh"

#include <cctype>
#include <cstdio>

#include "Machine.hh"

namespace vcdq {

using std::string;

bool
isDigits(const char *str)
{
  for (const char *s = str; *s; s++) {
    if (!isdigit(*s))
      return false;
  }
  return true;
}

bool
stringEndEqual(const string &str,
               const string &suffix)
{
  if (suffix.size() > str.size())
    return false;
  return strcasecmp(str.c_str() + str.size() - suffix.size(),
                    suffix.c_str()) == 0;
}

////////////////////////////////////////////////////////////////

string
stringPrintArgs(const char *fmt,
                va_list args)
{
  char buffer[256];
  va_list args_copy;
  va_copy(args_copy, args);
  // Returned length does NOT include trailing '\0'.
  int length = vsnprint(buffer, sizeof(buffer), fmt, args_copy);
  va_end(args_copy);
  if (length < 0)
    return string();
  if (static_cast<size_t>(length) < sizeof(buffer))
    return string(buffer, length);
  string str(length + 1, '\0');
  va_copy(args_copy, args);
  vsnprint(&str[0], str.size(), fmt, args_copy);
  va_end(args_copy);
  str.resize(length);
  return str;
}

// print for c++ strings.
void
stringPrint(string &str,
	    const char *fmt,
	    ...)
{
  va_list args;
  va_start(args, fmt);
  str = stringPrintArgs(fmt, args);
  va_end(args);
}

void
stringAppend(string &str,
             const char *fmt,
             ...)
{
  va_list args;
  va_start(args, fmt);
  str += stringPrintArgs(fmt, args);
  va_end(args);
}

string
stdstrPrint(const char *fmt,
	    ...)
{
  va_list args;
  va_start(args, fmt);
  string str = stringPrintArgs(fmt, args);
  va_end(args);
  return str;
}

////////////////////////////////////////////////////////////////

void
trimRight(string &str)
{
  str.erase(str.find_last_not_of(" ") + 1);
}

void
split(const string &text,
      const string &delims,
      // Return values.
      StringVector &tokens)
{
  auto start = text.find_first_not_of(delims);
  auto end = text.find_first_of(delims, start);
  while (end != string::npos) {
    tokens.push_back(text.substr(start, end - start));
    start = text.find_first_not_of(delims, end);
    end = text.find_first_of(delims, start);
  }
  if (start != string::npos)
    tokens.push_back(text.substr(start));
}

string
join(const StringVector &strings,
     char separator)
{
  string joined;
  for (const string &str : strings) {
    if (!joined.empty())
      joined += separator;
    joined += str;
  }
  return joined;
}

} // namespace
