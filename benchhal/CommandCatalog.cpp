/***********************************************************************************************************************
*                                                                                                                      *
* libbenchhal v0.1                                                                                                     *
*                                                                                                                      *
* Copyright (c) 2024 libbenchhal contributors                                                                          *
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
	@author libbenchhal contributors
	@brief Implementation of CommandCatalog
 */

#include "benchhal.h"

#include <charconv>

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Command tables

/**
	@brief Returns the command table for a device profile

	The text here must match the instrument programming guides exactly, including spacing in channel lists.
 */
const CommandCatalog::TableType& CommandCatalog::GetTable(Profile profile)
{
	static const TableType u3606 =
	{
		{ OP_SELECT_SOURCE_VOLTAGE,		{ "SOUR:CURR:LIM {ilimit}", "SOUR:VOLT:RANG {vrange}" } },
		{ OP_SELECT_SOURCE_CURRENT,		{ "SOUR:VOLT:LIM {vlimit}", "SOUR:CURR:RANG {irange}" } },
		{ OP_SET_OUTPUT_VOLTAGE,		{ "SOUR:VOLT:LEV:IMM:AMPL {value}" } },
		{ OP_SET_OUTPUT_CURRENT,		{ "SOUR:CURR:LEV:IMM:AMPL {value}" } },
		{ OP_ENABLE_OUTPUT,				{ "OUTP:STAT ON" } },
		{ OP_DISABLE_OUTPUT,			{ "OUTP:STAT OFF" } },
		{ OP_SET_VOLTAGE_PROTECTION,	{ "VOLT:PROT {value} V" } },
		{ OP_SET_CURRENT_PROTECTION,	{ "CURR:PROT {value} A" } },

		{ OP_CONFIGURE_VOLTAGE_RAMP,	{ "VOLT:RAMP {value}", "VOLT:RAMP:STEP {steps}" } },
		{ OP_CONFIGURE_CURRENT_RAMP,	{ "CURR:RAMP {value}", "CURR:RAMP:STEP {steps}" } },
		{ OP_CONFIGURE_VOLTAGE_SCAN,	{ "VOLT:SCAN {value}", "VOLT:SCAN:STEP {steps}", "VOLT:SCAN:DWEL {dwell}" } },
		{ OP_CONFIGURE_CURRENT_SCAN,	{ "CURR:SCAN {value}", "CURR:SCAN:STEP {steps}", "CURR:SCAN:DWEL {dwell}" } },
		{ OP_CONFIGURE_SQUARE_WAVE,
			{
				"SQU:AMPL {amplitude}",
				"SQU:FREQ {frequency}",
				"SQU:DCYC {duty}",
				"SQU:PWID {width}"
			}
		},
		{ OP_SET_SOFT_START_STEPS,		{ "SST:STEP {steps}" } },

		{ OP_CONFIGURE_VOLTAGE,			{ "CONF:VOLT:{signal} {range}, {resolution}" } },
		{ OP_CONFIGURE_CURRENT,			{ "CONF:CURR:{signal} {range}, {resolution}" } },
		{ OP_CONFIGURE_RESISTANCE,		{ "CONF:RES {range}, {resolution}" } },

		{ OP_ENABLE_CONTINUOUS,			{ "INIT:CONT ON" } },
		{ OP_DISABLE_CONTINUOUS,		{ "INIT:CONT OFF" } },
		{ OP_READ,						{ "READ?" } },
		{ OP_FETCH,						{ "FETC?" } },
		{ OP_MEASURE_VOLTAGE,			{ "MEAS:VOLT:{signal}? {range}, {resolution}" } },
		{ OP_MEASURE_CURRENT,			{ "MEAS:CURR:{signal}? {range}, {resolution}" } },
		{ OP_MEASURE_RESISTANCE,		{ "MEAS:RES? {range}, {resolution}" } },
		{ OP_ABORT_MEASUREMENT,			{ "ABOR" } },

		{ OP_SELECT_CALC_FUNCTION,		{ "CALC:FUNC {function}" } },
		{ OP_ENABLE_CALC,				{ "CALC ON" } },
		{ OP_DISABLE_CALC,				{ "CALC OFF" } },
		{ OP_SET_DB_REFERENCE,			{ "CALC:DB:REF {value}" } },
		{ OP_SET_DBM_REFERENCE,			{ "CALC:DBM:REF {value}" } },
		{ OP_SET_HOLD_VARIATION,		{ "CALC:HOLD:VAR {value}" } },
		{ OP_SET_HOLD_THRESHOLD,		{ "CALC:HOLD:THR {value}" } },
		{ OP_SET_LIMITS,				{ "CALC:LIM:UPP {upper}", "CALC:LIM:LOW {lower}" } },
		{ OP_SET_NULL_OFFSET,			{ "CALC:NULL:OFFS {value}" } },
		{ OP_QUERY_CALC_FUNCTION,		{ "CALC:FUNC?" } },
		{ OP_QUERY_CALC_STATE,			{ "CALC?" } },
		{ OP_QUERY_CALC_AVERAGE,		{ "CALC:AVER:AVER?" } },
		{ OP_QUERY_CALC_MAXIMUM,		{ "CALC:AVER:MAX?" } },
		{ OP_QUERY_CALC_MINIMUM,		{ "CALC:AVER:MIN?" } },
		{ OP_QUERY_CALC_PRESENT,		{ "CALC:AVER:PRES?" } },

		{ OP_ENABLE_LOGGING,			{ "LOG ON" } },
		{ OP_DISABLE_LOGGING,			{ "LOG OFF" } },
		{ OP_DELETE_LOGGED_DATA,		{ "LOG:DATA:DEL" } },
		{ OP_RESET_LOG_INDEX,			{ "LOG:LOAD DATA" } },
		{ OP_QUERY_LOGGING_STATE,		{ "LOG?" } },
		{ OP_READ_LOGGED_DATA,			{ "LOG:DATA?" } },

		{ OP_RESET,						{ "*rst; status:preset; *cls" } },
		{ OP_CLEAR_STATUS,				{ "*CLS" } },
		{ OP_IDENTIFY,					{ "*IDN?" } },
		{ OP_QUERY_ERROR,				{ "SYST:ERR?" } },
		{ OP_OPERATION_COMPLETE,		{ "*OPC?" } },
		{ OP_WAIT,						{ "*WAI" } },
		{ OP_CALIBRATE,					{ "CAL?" } },

		{ OP_ENABLE_QUESTIONABLE,			{ "STAT:QUES:ENAB {mask}" } },
		{ OP_QUERY_QUESTIONABLE_ENABLE,		{ "STAT:QUES:ENAB?" } },
		{ OP_QUERY_QUESTIONABLE_EVENT,		{ "STAT:QUES?" } },
		{ OP_QUERY_QUESTIONABLE_CONDITION,	{ "STAT:QUES:COND?" } },

		{ OP_QUERY_OUTPUT_STATE,		{ "OUTP?" } },
		{ OP_QUERY_CONTINUOUS_STATE,	{ "INIT:CONT?" } },
		{ OP_QUERY_MEASUREMENT_CONFIG,	{ "CONF?" } },
		{ OP_QUERY_OUTPUT_VOLTAGE,		{ "VOLT?" } },
		{ OP_QUERY_OUTPUT_CURRENT,		{ "CURR?" } },
		{ OP_QUERY_VOLTAGE_LIMIT,		{ "VOLT:LIM?" } },
		{ OP_QUERY_CURRENT_LIMIT,		{ "CURR:LIM?" } },
		{ OP_QUERY_SENSED_VOLTAGE,		{ "SENS:VOLT?" } },
		{ OP_QUERY_SENSED_CURRENT,		{ "SENS:CURR?" } }
	};

	static const TableType u2723 =
	{
		{ OP_SELECT_SOURCE_VOLTAGE,
			{
				"SOUR:VOLT:RANG {vrange}, (@{chan})",
				"SOUR:CURR:RANG {irange}, (@{chan})",
				"SOUR:CURR:LIM {ilimit}, (@{chan})"
			}
		},
		{ OP_SELECT_SOURCE_CURRENT,
			{
				"SOUR:VOLT:RANG {vrange}, (@{chan})",
				"SOUR:CURR:RANG {irange}, (@{chan})",
				"SOUR:VOLT:LIM {vlimit}, (@{chan})"
			}
		},
		{ OP_SET_OUTPUT_VOLTAGE,		{ "SOUR:VOLT:LEV:IMM:AMPL {value}, (@{chan})" } },
		{ OP_SET_OUTPUT_CURRENT,		{ "SOUR:CURR:LEV:IMM:AMPL {value}, (@{chan})" } },
		{ OP_ENABLE_OUTPUT,				{ "OUTP 1, (@{chan})" } },
		{ OP_DISABLE_OUTPUT,			{ "OUTP 0, (@{chan})" } },
		{ OP_SET_TRIGGER_VOLTAGE,		{ "SOUR:VOLT:TRIG {value}, (@{chan})" } },
		{ OP_SET_TRIGGER_CURRENT,		{ "SOUR:CURR:TRIG {value}, (@{chan})" } },

		{ OP_INITIATE_TRANSIENT,		{ "INIT:TRAN (@{chan})" } },
		{ OP_ABORT_TRANSIENT,			{ "ABOR:TRAN (@{chan})" } },

		{ OP_BEGIN_MEMORY_LIST,			{ "MEM:LIST {list}, (@{chan})", "MEM:LIST:CLEAR (@{chan})" } },
		{ OP_MEMORY_VOLTAGE_RANGE,		{ "MEM:VOLT:RANG {vrange}, (@{chan})" } },
		{ OP_MEMORY_CURRENT_RANGE,		{ "MEM:CURR:RANG {irange}, (@{chan})" } },
		{ OP_MEMORY_VOLTAGE_LIMIT,		{ "MEM:VOLT:LIM {value}, (@{chan})" } },
		{ OP_MEMORY_CURRENT_LIMIT,		{ "MEM:CURR:LIM {value}, (@{chan})" } },
		{ OP_MEMORY_AUTO_DELAY,			{ "MEM:SOUR:DEL:AUTO ON, (@{chan})" } },
		{ OP_MEMORY_DELAY,				{ "MEM:SOUR:DEL SING,{delay},(@{chan})" } },
		{ OP_MEMORY_SOURCE_VOLTAGE,		{ "MEM:VOLT:SOUR {value}, (@{chan})" } },
		{ OP_MEMORY_SOURCE_CURRENT,		{ "MEM:CURR:SOUR {value}, (@{chan})" } },
		{ OP_MEMORY_OUTPUT_ON,			{ "MEM:OUTP ON, (@{chan})" } },
		{ OP_MEMORY_OUTPUT_OFF,			{ "MEM:OUTP OFF, (@{chan})" } },
		{ OP_MEMORY_MEASURE_VOLTAGE,	{ "MEM:VOLT:MEAS (@{chan})" } },
		{ OP_MEMORY_MEASURE_CURRENT,	{ "MEM:CURR:MEAS (@{chan})" } },
		{ OP_MEMORY_LOOP,				{ "MEM:CONF:POIN {start},{end},{loops},(@{chan})" } },
		{ OP_STORE_MEMORY_LIST,			{ "MEM:LIST:STOR (@{chan})" } },
		{ OP_TRIGGER_MEMORY_LIST,		{ "MEM:TRIG (@{chan})" } },
		{ OP_READ_MEMORY_LIST_DATA,		{ "MEM:LIST:DATA? (@{chan})" } },

		{ OP_SET_SWEEP_INTERVAL,		{ "SENS:SWE:TINT {interval}, (@{chan})" } },
		{ OP_SET_SWEEP_POINTS,			{ "SENS:SWE:POIN {points}, (@{chan})" } },
		{ OP_MEASURE_VOLTAGE,			{ "MEAS:SCAL:VOLT? (@{chan})" } },
		{ OP_MEASURE_CURRENT,			{ "MEAS:SCAL:CURR? (@{chan})" } },
		{ OP_MEASURE_VOLTAGE_ARRAY,		{ "MEAS:ARR:VOLT? (@{chan})" } },
		{ OP_MEASURE_CURRENT_ARRAY,		{ "MEAS:ARR:CURR? (@{chan})" } },

		{ OP_RESET,						{ "*rst; status:preset; *cls" } },
		{ OP_CLEAR_STATUS,				{ "*CLS" } },
		{ OP_IDENTIFY,					{ "*IDN?" } },
		{ OP_QUERY_ERROR,				{ "SYST:ERR?" } },
		{ OP_OPERATION_COMPLETE,		{ "*OPC?" } },
		{ OP_WAIT,						{ "*WAI" } },
		{ OP_CALIBRATE,					{ "CAL?" } },
		{ OP_QUERY_OPERATION_CONDITION,	{ "STAT:OPER:COND?" } },

		{ OP_QUERY_OUTPUT_STATE,		{ "OUTP? (@{chan})" } },
		{ OP_QUERY_VOLTAGE_APERTURE,	{ "SENS:VOLT:APER? (@{chan})" } },
		{ OP_QUERY_CURRENT_APERTURE,	{ "SENS:CURR:APER? (@{chan})" } }
	};

	if(profile == PROFILE_U2723)
		return u2723;
	return u3606;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

CommandCatalog::CommandCatalog(Profile profile)
	: m_profile(profile)
	, m_table(GetTable(profile))
{
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Translation

bool CommandCatalog::Supports(Operation op) const
{
	return m_table.find(op) != m_table.end();
}

/**
	@brief Expands an operation into the ordered list of commands to send

	@throws InvalidStateError if this profile has no such operation
	@throws ConfigurationError if a placeholder has no value in args
 */
vector<string> CommandCatalog::Translate(Operation op, const Arguments& args) const
{
	auto it = m_table.find(op);
	if(it == m_table.end())
	{
		throw InvalidStateError(
			GetProfileName(m_profile) + " does not support " + GetOperationName(op));
	}

	vector<string> ret;
	for(auto& pattern : it->second)
		ret.push_back(Substitute(pattern, args));
	return ret;
}

string CommandCatalog::Substitute(const string& pattern, const Arguments& args)
{
	string ret;
	size_t i = 0;
	while(i < pattern.length())
	{
		if(pattern[i] != '{')
		{
			ret += pattern[i];
			i++;
			continue;
		}

		size_t end = pattern.find('}', i);
		if(end == string::npos)
			throw ConfigurationError("Unterminated placeholder in \"" + pattern + "\"");

		auto name = pattern.substr(i+1, end - i - 1);
		auto it = args.find(name);
		if(it == args.end())
			throw ConfigurationError("No value for {" + name + "} in \"" + pattern + "\"");
		ret += it->second;

		i = end + 1;
	}
	return ret;
}

/**
	@brief Formats a numeric argument in the shortest form that round-trips exactly
 */
string CommandCatalog::FormatValue(double value)
{
	return to_string_shortest(value);
}

string CommandCatalog::GetProfileName(Profile profile)
{
	switch(profile)
	{
		case PROFILE_U2723:
			return "Keysight U2723";

		case PROFILE_U3606:
		default:
			return "Keysight U3606";
	}
}

string CommandCatalog::GetOperationName(Operation op)
{
	switch(op)
	{
		case OP_SELECT_SOURCE_VOLTAGE:		return "select source voltage mode";
		case OP_SELECT_SOURCE_CURRENT:		return "select source current mode";
		case OP_SET_OUTPUT_VOLTAGE:			return "set output voltage";
		case OP_SET_OUTPUT_CURRENT:			return "set output current";
		case OP_ENABLE_OUTPUT:				return "enable output";
		case OP_DISABLE_OUTPUT:				return "disable output";
		case OP_SET_VOLTAGE_PROTECTION:		return "set voltage protection";
		case OP_SET_CURRENT_PROTECTION:		return "set current protection";
		case OP_SET_TRIGGER_VOLTAGE:		return "set trigger voltage";
		case OP_SET_TRIGGER_CURRENT:		return "set trigger current";
		case OP_CONFIGURE_VOLTAGE_RAMP:		return "configure voltage ramp";
		case OP_CONFIGURE_CURRENT_RAMP:		return "configure current ramp";
		case OP_CONFIGURE_VOLTAGE_SCAN:		return "configure voltage scan";
		case OP_CONFIGURE_CURRENT_SCAN:		return "configure current scan";
		case OP_CONFIGURE_SQUARE_WAVE:		return "configure square wave";
		case OP_SET_SOFT_START_STEPS:		return "set soft start steps";
		case OP_CONFIGURE_VOLTAGE:			return "configure voltage measurement";
		case OP_CONFIGURE_CURRENT:			return "configure current measurement";
		case OP_CONFIGURE_RESISTANCE:		return "configure resistance measurement";
		case OP_ENABLE_CONTINUOUS:			return "enable continuous mode";
		case OP_DISABLE_CONTINUOUS:			return "disable continuous mode";
		case OP_READ:						return "read";
		case OP_FETCH:						return "fetch";
		case OP_SET_SWEEP_INTERVAL:			return "set sweep interval";
		case OP_SET_SWEEP_POINTS:			return "set sweep points";
		case OP_MEASURE_VOLTAGE:			return "measure voltage";
		case OP_MEASURE_CURRENT:			return "measure current";
		case OP_MEASURE_RESISTANCE:			return "measure resistance";
		case OP_MEASURE_VOLTAGE_ARRAY:		return "measure voltage array";
		case OP_MEASURE_CURRENT_ARRAY:		return "measure current array";
		case OP_ABORT_MEASUREMENT:			return "abort measurement";
		case OP_INITIATE_TRANSIENT:			return "initiate transient";
		case OP_ABORT_TRANSIENT:			return "abort transient";
		case OP_SELECT_CALC_FUNCTION:		return "select calculation function";
		case OP_ENABLE_CALC:				return "enable calculation";
		case OP_DISABLE_CALC:				return "disable calculation";
		case OP_SET_DB_REFERENCE:			return "set dB reference";
		case OP_SET_DBM_REFERENCE:			return "set dBm reference";
		case OP_SET_HOLD_VARIATION:			return "set hold variation";
		case OP_SET_HOLD_THRESHOLD:			return "set hold threshold";
		case OP_SET_LIMITS:					return "set limits";
		case OP_SET_NULL_OFFSET:			return "set null offset";
		case OP_QUERY_CALC_FUNCTION:		return "query calculation function";
		case OP_QUERY_CALC_STATE:			return "query calculation state";
		case OP_QUERY_CALC_AVERAGE:			return "query calculated average";
		case OP_QUERY_CALC_MAXIMUM:			return "query calculated maximum";
		case OP_QUERY_CALC_MINIMUM:			return "query calculated minimum";
		case OP_QUERY_CALC_PRESENT:			return "query calculated present value";
		case OP_ENABLE_LOGGING:				return "enable data logging";
		case OP_DISABLE_LOGGING:			return "disable data logging";
		case OP_DELETE_LOGGED_DATA:			return "delete logged data";
		case OP_RESET_LOG_INDEX:			return "reset log index";
		case OP_QUERY_LOGGING_STATE:		return "query data logging state";
		case OP_READ_LOGGED_DATA:			return "read logged data";
		case OP_BEGIN_MEMORY_LIST:			return "begin memory list";
		case OP_MEMORY_VOLTAGE_RANGE:		return "memory list voltage range";
		case OP_MEMORY_CURRENT_RANGE:		return "memory list current range";
		case OP_MEMORY_VOLTAGE_LIMIT:		return "memory list voltage limit";
		case OP_MEMORY_CURRENT_LIMIT:		return "memory list current limit";
		case OP_MEMORY_AUTO_DELAY:			return "memory list auto delay";
		case OP_MEMORY_DELAY:				return "memory list delay";
		case OP_MEMORY_SOURCE_VOLTAGE:		return "memory list source voltage";
		case OP_MEMORY_SOURCE_CURRENT:		return "memory list source current";
		case OP_MEMORY_OUTPUT_ON:			return "memory list output on";
		case OP_MEMORY_OUTPUT_OFF:			return "memory list output off";
		case OP_MEMORY_MEASURE_VOLTAGE:		return "memory list measure voltage";
		case OP_MEMORY_MEASURE_CURRENT:		return "memory list measure current";
		case OP_MEMORY_LOOP:				return "memory list loop";
		case OP_STORE_MEMORY_LIST:			return "store memory list";
		case OP_TRIGGER_MEMORY_LIST:		return "trigger memory list";
		case OP_READ_MEMORY_LIST_DATA:		return "read memory list data";
		case OP_RESET:						return "reset";
		case OP_CLEAR_STATUS:				return "clear status";
		case OP_IDENTIFY:					return "identify";
		case OP_QUERY_ERROR:				return "query error";
		case OP_OPERATION_COMPLETE:			return "operation complete";
		case OP_WAIT:						return "wait";
		case OP_CALIBRATE:					return "calibrate";
		case OP_ENABLE_QUESTIONABLE:		return "enable questionable status";
		case OP_QUERY_QUESTIONABLE_ENABLE:	return "query questionable enable register";
		case OP_QUERY_QUESTIONABLE_EVENT:	return "query questionable event register";
		case OP_QUERY_QUESTIONABLE_CONDITION:	return "query questionable condition register";
		case OP_QUERY_OPERATION_CONDITION:	return "query operation condition register";
		case OP_QUERY_OUTPUT_STATE:			return "query output state";
		case OP_QUERY_CONTINUOUS_STATE:		return "query continuous state";
		case OP_QUERY_MEASUREMENT_CONFIG:	return "query measurement configuration";
		case OP_QUERY_OUTPUT_VOLTAGE:		return "query output voltage";
		case OP_QUERY_OUTPUT_CURRENT:		return "query output current";
		case OP_QUERY_VOLTAGE_APERTURE:		return "query voltage aperture";
		case OP_QUERY_CURRENT_APERTURE:		return "query current aperture";
		case OP_QUERY_VOLTAGE_LIMIT:		return "query voltage limit";
		case OP_QUERY_CURRENT_LIMIT:		return "query current limit";
		case OP_QUERY_SENSED_VOLTAGE:		return "query sensed voltage";
		case OP_QUERY_SENSED_CURRENT:		return "query sensed current";
		default:							return "unknown operation";
	}
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Reply parsing

/**
	@brief Parses a single number in the instrument's native unit, e.g. "+3.600000E+00"
 */
double CommandCatalog::ParseScalar(const string& reply)
{
	auto str = Trim(reply);
	if(str.empty())
		throw CommunicationError("Empty reply where a number was expected");

	//from_chars doesn't accept an explicit plus sign
	size_t start = 0;
	if( (str[0] == '+') && (str.length() > 1) && (str[1] != '-') )
		start = 1;

	double value = 0;
	auto first = str.c_str() + start;
	auto last = str.c_str() + str.length();
	auto res = from_chars(first, last, value);
	if( (res.ec != errc()) || (res.ptr != last) )
		throw CommunicationError("Malformed numeric reply \"" + reply + "\"");

	return value;
}

/**
	@brief Parses an integer reply such as a status register, e.g. "+1280"
 */
long CommandCatalog::ParseInteger(const string& reply)
{
	auto str = Trim(reply);
	if(str.empty())
		throw CommunicationError("Empty reply where an integer was expected");

	size_t start = 0;
	if( (str[0] == '+') && (str.length() > 1) && (str[1] != '-') )
		start = 1;

	long value = 0;
	auto first = str.c_str() + start;
	auto last = str.c_str() + str.length();
	auto res = from_chars(first, last, value);
	if( (res.ec != errc()) || (res.ptr != last) )
		throw CommunicationError("Malformed integer reply \"" + reply + "\"");

	return value;
}

/**
	@brief Parses a comma separated list of numbers, preserving acquisition order
 */
vector<double> CommandCatalog::ParseArray(const string& reply)
{
	auto str = Trim(reply);
	if(str.empty())
		throw CommunicationError("Empty reply where an array was expected");

	vector<double> ret;
	size_t start = 0;
	while(true)
	{
		size_t comma = str.find(',', start);
		auto field = str.substr(start, (comma == string::npos) ? string::npos : comma - start);
		if(Trim(field).empty())
			throw CommunicationError("Empty field in array reply \"" + reply + "\"");
		ret.push_back(ParseScalar(field));

		if(comma == string::npos)
			break;
		start = comma + 1;
	}
	return ret;
}

/**
	@brief Parses a boolean status such as "1", "0", "ON" or "OFF"
 */
bool CommandCatalog::ParseFlag(const string& reply)
{
	auto str = Trim(reply);
	if( (str == "1") || (str == "+1") || (str == "ON") )
		return true;
	if( (str == "0") || (str == "+0") || (str == "OFF") )
		return false;

	throw CommunicationError("Malformed status reply \"" + reply + "\"");
}

/**
	@brief Returns a free-form reply with whitespace trimmed, rejecting empty replies
 */
string CommandCatalog::ParseText(const string& reply)
{
	auto str = Trim(reply);
	if(str.empty())
		throw CommunicationError("Empty reply");
	return str;
}
