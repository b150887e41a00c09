#pragma once

#include <ostream>
#include <string>
#include <string_view>


namespace thirdparty
{
namespace cxxopts
{
static constexpr std::string_view name{ "cxxopts" };
static constexpr std::string_view url{ "https://github.com/jarro2783/cxxopts/" };
static constexpr std::string_view license{
    R"(Copyright (c) 2014 Jarryd Beck

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in
all copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
THE SOFTWARE.
)" };
}  // namespace cxxopts


namespace jsoncpp
{
static constexpr std::string_view name{ "JsonCpp" };
static constexpr std::string_view url{ "https://github.com/open-source-parsers/jsoncpp" };
/* Dual licensed. See the LICENSE file of the installed distribution for the full text. */
static constexpr std::string_view license{ "Public Domain or MIT License" };
}  // namespace jsoncpp


namespace curl
{
static constexpr std::string_view name{ "libcurl" };
static constexpr std::string_view url{ "https://curl.se/" };
/* See the COPYING file of the installed distribution for the full text. */
static constexpr std::string_view license{ "curl License (MIT/X derivate)" };
}  // namespace curl


namespace zlib
{
static constexpr std::string_view name{ "zlib" };
static constexpr std::string_view url{ "https://github.com/madler/zlib/" };
static constexpr std::string_view license{
    R"(Copyright notice:

 (C) 1995-2022 Jean-loup Gailly and Mark Adler

  This software is provided 'as-is', without any express or implied
  warranty.  In no event will the authors be held liable for any damages
  arising from the use of this software.

  Permission is granted to anyone to use this software for any purpose,
  including commercial applications, and to alter it and redistribute it
  freely, subject to the following restrictions:

  1. The origin of this software must not be misrepresented; you must not
     claim that you wrote the original software. If you use this software
     in a product, an acknowledgment in the product documentation would be
     appreciated but is not required.
  2. Altered source versions must be plainly marked as such, and must not be
     misrepresented as being the original software.
  3. This notice may not be removed or altered from any source distribution.

  Jean-loup Gailly        Mark Adler
  jloup@gzip.org          madler@alumni.caltech.edu
)" };
}  // namespace zlib


inline void
printAttributions( std::ostream& out )
{
    const auto printLicense =
        [&out] ( std::string_view name, std::string_view url, std::string_view license )
        {
            out << "# " << name << "\n\n" << url << "\n\n" << license << "\n\n";
        };

    printLicense( cxxopts::name, cxxopts::url, cxxopts::license );
    printLicense( jsoncpp::name, jsoncpp::url, jsoncpp::license );
    printLicense( curl::name, curl::url, curl::license );
    printLicense( zlib::name, zlib::url, zlib::license );
}
}  // namespace thirdparty

