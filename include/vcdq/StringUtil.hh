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


#pragma once

#include <cstdarg>
#include <cstring>
#include <strings.h>
#include <string>
#include <vector>

#include "Machine.hh" // __attribute__

namespace vcdq {

inline bool
stringEq(const char *str1,
         const char *str2)
{
  return strcmp(str1, str2) == 0;
}

bool
isDigits(const char *str);

// Case insensitive compare of the end of str to suffix.
bool
stringEndEqual(const std::string &str,
               const std::string &suffix);

// Print to a std::string.
std::string
stdstrPrint(const char *fmt,
            ...) __attribute__((format (printf, 1, 2)));
void
stringPrint(std::string &str,
            const char *fmt,
            ...) __attribute__((format (printf, 2, 3)));
// Formated append to std::string.
void
stringAppend(std::string &str,
             const char *fmt,
             ...) __attribute__((format (printf, 2, 3)));
std::string
stringPrintArgs(const char *fmt,
                va_list args);

////////////////////////////////////////////////////////////////

// Trim right spaces.
void
trimRight(std::string &str);

using StringVector = std::vector<std::string>;

void
split(const std::string &text,
      const std::string &delims,
      // Return values.
      StringVector &tokens);

// Join with a single separator character.
std::string
join(const StringVector &strings,
     char separator);

} // namespace
