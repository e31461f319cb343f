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
	@brief Declaration of CommandCatalog
 */

#ifndef CommandCatalog_h
#define CommandCatalog_h

/**
	@brief Maps abstract instrument operations to the exact SCPI text of one device profile, and parses replies

	Each operation expands to one or more command templates, sent in table order. Templates contain named
	placeholders in braces ({chan}, {value}, ...) which are substituted from an argument map. Channel numbers in
	arguments are one-based, as the instrument expects them.
 */
class CommandCatalog
{
public:

	enum Profile
	{
		PROFILE_U3606,		//Keysight U3606 DC supply + multimeter
		PROFILE_U2723		//Keysight U2723 three channel SMU
	};

	enum Operation
	{
		//Output configuration
		OP_SELECT_SOURCE_VOLTAGE,
		OP_SELECT_SOURCE_CURRENT,
		OP_SET_OUTPUT_VOLTAGE,
		OP_SET_OUTPUT_CURRENT,
		OP_ENABLE_OUTPUT,
		OP_DISABLE_OUTPUT,
		OP_SET_VOLTAGE_PROTECTION,
		OP_SET_CURRENT_PROTECTION,
		OP_SET_TRIGGER_VOLTAGE,
		OP_SET_TRIGGER_CURRENT,

		//Output waveform functions
		OP_CONFIGURE_VOLTAGE_RAMP,
		OP_CONFIGURE_CURRENT_RAMP,
		OP_CONFIGURE_VOLTAGE_SCAN,
		OP_CONFIGURE_CURRENT_SCAN,
		OP_CONFIGURE_SQUARE_WAVE,
		OP_SET_SOFT_START_STEPS,

		//Multimeter function
		OP_CONFIGURE_VOLTAGE,
		OP_CONFIGURE_CURRENT,
		OP_CONFIGURE_RESISTANCE,

		//Acquisition
		OP_ENABLE_CONTINUOUS,
		OP_DISABLE_CONTINUOUS,
		OP_READ,
		OP_FETCH,
		OP_SET_SWEEP_INTERVAL,
		OP_SET_SWEEP_POINTS,
		OP_MEASURE_VOLTAGE,
		OP_MEASURE_CURRENT,
		OP_MEASURE_RESISTANCE,
		OP_MEASURE_VOLTAGE_ARRAY,
		OP_MEASURE_CURRENT_ARRAY,
		OP_ABORT_MEASUREMENT,

		//Transient trigger system
		OP_INITIATE_TRANSIENT,
		OP_ABORT_TRANSIENT,

		//Math functions applied to multimeter readings
		OP_SELECT_CALC_FUNCTION,
		OP_ENABLE_CALC,
		OP_DISABLE_CALC,
		OP_SET_DB_REFERENCE,
		OP_SET_DBM_REFERENCE,
		OP_SET_HOLD_VARIATION,
		OP_SET_HOLD_THRESHOLD,
		OP_SET_LIMITS,
		OP_SET_NULL_OFFSET,
		OP_QUERY_CALC_FUNCTION,
		OP_QUERY_CALC_STATE,
		OP_QUERY_CALC_AVERAGE,
		OP_QUERY_CALC_MAXIMUM,
		OP_QUERY_CALC_MINIMUM,
		OP_QUERY_CALC_PRESENT,

		//Data logger
		OP_ENABLE_LOGGING,
		OP_DISABLE_LOGGING,
		OP_DELETE_LOGGED_DATA,
		OP_RESET_LOG_INDEX,
		OP_QUERY_LOGGING_STATE,
		OP_READ_LOGGED_DATA,

		//Memory list programs, one command per list step
		OP_BEGIN_MEMORY_LIST,
		OP_MEMORY_VOLTAGE_RANGE,
		OP_MEMORY_CURRENT_RANGE,
		OP_MEMORY_VOLTAGE_LIMIT,
		OP_MEMORY_CURRENT_LIMIT,
		OP_MEMORY_AUTO_DELAY,
		OP_MEMORY_DELAY,
		OP_MEMORY_SOURCE_VOLTAGE,
		OP_MEMORY_SOURCE_CURRENT,
		OP_MEMORY_OUTPUT_ON,
		OP_MEMORY_OUTPUT_OFF,
		OP_MEMORY_MEASURE_VOLTAGE,
		OP_MEMORY_MEASURE_CURRENT,
		OP_MEMORY_LOOP,
		OP_STORE_MEMORY_LIST,
		OP_TRIGGER_MEMORY_LIST,
		OP_READ_MEMORY_LIST_DATA,

		//Housekeeping
		OP_RESET,
		OP_CLEAR_STATUS,
		OP_IDENTIFY,
		OP_QUERY_ERROR,
		OP_OPERATION_COMPLETE,
		OP_WAIT,
		OP_CALIBRATE,

		//Status registers
		OP_ENABLE_QUESTIONABLE,
		OP_QUERY_QUESTIONABLE_ENABLE,
		OP_QUERY_QUESTIONABLE_EVENT,
		OP_QUERY_QUESTIONABLE_CONDITION,
		OP_QUERY_OPERATION_CONDITION,

		//Status queries
		OP_QUERY_OUTPUT_STATE,
		OP_QUERY_CONTINUOUS_STATE,
		OP_QUERY_MEASUREMENT_CONFIG,
		OP_QUERY_OUTPUT_VOLTAGE,
		OP_QUERY_OUTPUT_CURRENT,
		OP_QUERY_VOLTAGE_APERTURE,
		OP_QUERY_CURRENT_APERTURE,
		OP_QUERY_VOLTAGE_LIMIT,
		OP_QUERY_CURRENT_LIMIT,
		OP_QUERY_SENSED_VOLTAGE,
		OP_QUERY_SENSED_CURRENT
	};

	typedef std::map<std::string, std::string> Arguments;

	CommandCatalog(Profile profile);

	Profile GetProfile() const
	{ return m_profile; }

	bool Supports(Operation op) const;
	std::vector<std::string> Translate(Operation op, const Arguments& args = Arguments()) const;

	static std::string GetOperationName(Operation op);
	static std::string GetProfileName(Profile profile);

	//Argument formatting
	static std::string FormatValue(double value);

	//Reply parsing. All of these throw CommunicationError on an empty or malformed reply.
	static double ParseScalar(const std::string& reply);
	static long ParseInteger(const std::string& reply);
	static std::vector<double> ParseArray(const std::string& reply);
	static bool ParseFlag(const std::string& reply);
	static std::string ParseText(const std::string& reply);

protected:
	typedef std::map<Operation, std::vector<std::string> > TableType;

	static const TableType& GetTable(Profile profile);
	static std::string Substitute(const std::string& pattern, const Arguments& args);

	Profile m_profile;
	const TableType& m_table;
};

#endif
