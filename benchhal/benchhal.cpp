/***********************************************************************************************************************
*                                                                                                                      *
* libbenchhal v0.1                                                                                                     *
*                                                                                                                      *
* Copyright (c) 2012-2024 Andrew D. Zonenberg and contributors                                                         *
* All rights reserved.                                                                                                 *
*                                                                                                                      *
* Redistribution and use in source and binary forms, with or without modification, are permitted provided that the     *
* following conditions are met:                                                                                        *
*                                                                                                                      *
*    * Redistributions of source code must retain the above copyright notice, this list of conditions, and the         *
*      following disclaimer.                                                                                           *
*                                                                                                                      *
*    * Redistributions in binary form must reproduce the above copyright notice, this list of conditions and the       *
*      following disclaimer in the documentation and/or other materials provided with the distribution.                *
*                                                                                                                      *
*    * Neither the name of the author nor the names of any contributors may be used to endorse or promote products     *
*      derived from this software without specific prior written permission.                                           *
*                                                                                                                      *
* THIS SOFTWARE IS PROVIDED BY THE AUTHORS "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED   *
* TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL *
* THE AUTHORS BE HELD LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES        *
* (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR       *
* BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT *
* (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE       *
* POSSIBILITY OF SUCH DAMAGE.                                                                                          *
*                                                                                                                      *
***********************************************************************************************************************/

/**
	@file
	@author Andrew D. Zonenberg
	@brief Static initialization and string helpers shared by all drivers
 */

#include "benchhal.h"

#include <charconv>
#include <cmath>
#include <ctype.h>

using namespace std;

/**
	@brief Static initialization for SCPI transports
 */
void TransportStaticInit()
{
#if !defined(_WIN32) && !defined(__APPLE__)
	AddTransportClass(SCPITMCTransport);
#endif
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// String helpers

/**
	@brief Removes whitespace from the start and end of a string
 */
string Trim(const string& str)
{
	string ret;
	string tmp;

	//Skip leading spaces
	size_t i=0;
	for(; i<str.length() && isspace(static_cast<unsigned char>(str[i])); i++)
	{}

	//Read non-space stuff
	for(; i<str.length(); i++)
	{
		//Non-space
		char c = str[i];
		if(!isspace(static_cast<unsigned char>(c)))
		{
			ret = ret + tmp + c;
			tmp = "";
		}

		//Space. Save it, only append if we have non-space after
		else
			tmp += c;
	}

	return ret;
}

/**
	@brief Removes quotes from the start and end of a string
 */
string TrimQuotes(const string& str)
{
	string ret;
	string tmp;

	//Skip leading quotes
	size_t i=0;
	for(; i<str.length() && (str[i] == '\"'); i++)
	{}

	for(; i<str.length(); i++)
	{
		//Non-quote
		char c = str[i];
		if(c != '\"')
		{
			ret = ret + tmp + c;
			tmp = "";
		}

		//Quote. Save it, only append if we have non-quote after
		else
			tmp += c;
	}

	return ret;
}

/**
	@brief Formats a number with the fewest digits that parse back to the same value

	Values with a decimal exponent between -4 and 15 are printed in positional notation and always carry a fractional
	part ("5.0", "0.0001"). Anything else is printed in scientific notation with at least two exponent digits
	("1e-05", "1.5e+16").
 */
string to_string_shortest(double d)
{
	if(d == 0)
		return signbit(d) ? "-0.0" : "0.0";

	char buf[64];
	auto res = to_chars(buf, buf + sizeof(buf), d, chars_format::scientific);
	string sci(buf, res.ptr);

	size_t epos = sci.find('e');
	int exponent = stoi(sci.substr(epos + 1));
	if( (exponent < -4) || (exponent >= 16) )
		return sci;

	//Pull out the significant digits
	string sign;
	string digits;
	for(size_t i=0; i<epos; i++)
	{
		if(sci[i] == '-')
			sign = "-";
		else if(sci[i] != '.')
			digits += sci[i];
	}

	//Position of the decimal point relative to the first digit
	int point = exponent + 1;
	if(point <= 0)
		return sign + "0." + string(-point, '0') + digits;
	if(point >= static_cast<int>(digits.length()))
		return sign + digits + string(point - digits.length(), '0') + ".0";
	return sign + digits.substr(0, point) + "." + digits.substr(point);
}
