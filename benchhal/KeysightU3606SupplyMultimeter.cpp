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
	@brief Implementation of KeysightU3606SupplyMultimeter
 */

#include "benchhal.h"

#include <math.h>

using namespace std;

//Output functions may run slightly past the regular output range
#define U3606_FUNCTION_MAX_VOLTAGE	31.5
#define U3606_FUNCTION_MAX_CURRENT	1.05

//Guards against a logger that never reports END
#define U3606_MAX_LOG_ENTRIES		100000

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// KeysightU3606Configuration

KeysightU3606Configuration::KeysightU3606Configuration()
	: hasOutput(false)
	, output(KeysightU3606SupplyMultimeter::GetDefaultOutputSettings(OUTPUT_NONE))
	, outputValue(0)
	, hasMeasurement(false)
	, measurement(KeysightU3606SupplyMultimeter::GetDefaultMeasurementSettings(QUANTITY_VOLTAGE))
{
}

/**
	@brief Checks the configuration against the model limits without touching any hardware

	@throws ConfigurationError if anything is out of range or missing
 */
void KeysightU3606Configuration::Validate() const
{
	auto& caps = KeysightU3606SupplyMultimeter::GetModelCapabilities();

	if(hasOutput)
	{
		SourceMeasureInstrument::ValidateOutputSettings(caps, output);
		SourceMeasureInstrument::ValidateOutputValue(caps, output.mode, outputValue);
	}
	if(hasMeasurement)
		SourceMeasureInstrument::ValidateMeasurementSettings(caps, measurement);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

KeysightU3606SupplyMultimeter::KeysightU3606SupplyMultimeter(SCPITransport* transport)
	: SCPIDevice(transport)
	, SourceMeasureInstrument(transport, CommandCatalog::PROFILE_U3606, GetModelCapabilities(), 1)
{
	if(m_model.find("U3606") == string::npos)
	{
		LogError("%s is not a U3606\n", m_model.c_str());
		throw ConfigurationError("Expected a U3606, found \"" + m_model + "\"");
	}

	m_channels[0]->SetDisplayName("Output");
}

KeysightU3606SupplyMultimeter::~KeysightU3606SupplyMultimeter()
{

}

/**
	@brief Limits from the U3606B programming guide (30 V / 1 A range, with 5% current overrange)
 */
const SourceCapabilities& KeysightU3606SupplyMultimeter::GetModelCapabilities()
{
	static SourceCapabilities caps;
	if(caps.voltageRanges.empty())
	{
		caps.minVoltage = 0;
		caps.maxVoltage = 30;
		caps.minCurrent = 0;
		caps.maxCurrent = 1.05;

		caps.voltageRanges = { "MAX", "MIN", "AUTO" };
		caps.currentRanges = { "MAX", "DEF", "MIN", "AUTO" };
		caps.meterRanges = { "AUTO", "MAX", "MIN" };
		caps.meterResolutions = { "MAX", "MIN" };

		caps.maxSweepInterval = 0;
		caps.maxSweepPoints = 0;
	}
	return caps;
}

/**
	@brief Power-on defaults: 1 A over-current limit in CV mode, 30 V over-voltage limit in CC mode, autoranging
 */
OutputSettings KeysightU3606SupplyMultimeter::GetDefaultOutputSettings(OutputMode mode)
{
	OutputSettings settings;
	settings.mode = mode;
	settings.voltageLimit = 30;
	settings.currentLimit = 1;
	settings.voltageRange = "AUTO";
	settings.currentRange = "AUTO";
	return settings;
}

MeasurementSettings KeysightU3606SupplyMultimeter::GetDefaultMeasurementSettings(MeasuredQuantity quantity)
{
	MeasurementSettings settings;
	settings.quantity = quantity;
	settings.signal = SIGNAL_DC;
	settings.range = "AUTO";
	settings.resolution = "MIN";
	return settings;
}

/**
	@brief Applies the initial configuration of a session. Never enables the output.
 */
void KeysightU3606SupplyMultimeter::ApplyConfiguration(const ConfigType& config)
{
	config.Validate();

	if(config.hasOutput)
		ConfigureDCSupply(config.output, config.outputValue);
	if(config.hasMeasurement)
		ConfigureMultimeter(config.measurement);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Device info

unsigned int KeysightU3606SupplyMultimeter::GetInstrumentTypes() const
{
	return INST_PSU | INST_DMM;
}

string KeysightU3606SupplyMultimeter::GetDriverName() const
{
	return GetDriverNameInternal();
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// DC supply

void KeysightU3606SupplyMultimeter::SetOutputMode(const OutputSettings& settings)
{
	DoSetOutputMode(0, settings);
}

void KeysightU3606SupplyMultimeter::ConfigureDCSupply(OutputMode mode, double value)
{
	DoConfigureOutput(0, GetDefaultOutputSettings(mode), value);
}

void KeysightU3606SupplyMultimeter::ConfigureDCSupply(const OutputSettings& settings, double value)
{
	DoConfigureOutput(0, settings, value);
}

void KeysightU3606SupplyMultimeter::SetDCSupplyOutputVoltage(double volts)
{
	DoSetOutputValue(0, OUTPUT_SOURCE_VOLTAGE, volts);
}

void KeysightU3606SupplyMultimeter::SetDCSupplyOutputCurrent(double amps)
{
	DoSetOutputValue(0, OUTPUT_SOURCE_CURRENT, amps);
}

void KeysightU3606SupplyMultimeter::EnableDCOutput()
{
	DoEnableOutput(0);
}

void KeysightU3606SupplyMultimeter::DisableDCOutput()
{
	DoDisableOutput(0);
}

void KeysightU3606SupplyMultimeter::SetOverVoltageProtection(double volts)
{
	DoSetProtection(OUTPUT_SOURCE_VOLTAGE, volts);
}

void KeysightU3606SupplyMultimeter::SetOverCurrentProtection(double amps)
{
	DoSetProtection(OUTPUT_SOURCE_CURRENT, amps);
}

/**
	@brief Sets how many steps the output takes to reach its level when it is enabled
 */
void KeysightU3606SupplyMultimeter::SetSoftStartSteps(unsigned int steps)
{
	RequireSupported(CommandCatalog::OP_SET_SOFT_START_STEPS);
	if(steps == 0)
		throw ConfigurationError("Soft start needs at least one step");

	CommandCatalog::Arguments args;
	args["steps"] = to_string(steps);
	DoCommand(CommandCatalog::OP_SET_SOFT_START_STEPS, 0, args);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// DC supply output functions

/**
	@brief Programs a ramp from zero to endValue in the given number of steps

	@param mode		Whether the ramp is in volts or amps. The output must already regulate that quantity.
	@param endValue	Final level, up to 31.5 V or 1.05 A
	@param steps	Number of steps, 1 to 10000
 */
void KeysightU3606SupplyMultimeter::ConfigureRamp(OutputMode mode, double endValue, unsigned int steps)
{
	auto op = (mode == OUTPUT_SOURCE_CURRENT) ?
		CommandCatalog::OP_CONFIGURE_CURRENT_RAMP : CommandCatalog::OP_CONFIGURE_VOLTAGE_RAMP;
	RequireSupported(op);
	ValidateOutputFunction(mode, endValue);
	if( (steps == 0) || (steps > 10000) )
		throw ConfigurationError("Ramp step count must be between 1 and 10000");

	PrepareOutputFunction(mode);

	CommandCatalog::Arguments args;
	args["value"] = CommandCatalog::FormatValue(endValue);
	args["steps"] = to_string(steps);
	Execute(op, args);

	LogVerbose("Ramp to %s in %u steps\n", Unit(GetFunctionUnit(mode)).PrettyPrint(endValue).c_str(), steps);
}

/**
	@brief Programs a staircase scan from zero to endValue

	@param mode			Whether the scan is in volts or amps. The output must already regulate that quantity.
	@param endValue		Final level, up to 31.5 V or 1.05 A
	@param steps		Number of steps, 1 to 100
	@param dwellSeconds	Time spent on each step, 1 to 99 seconds
 */
void KeysightU3606SupplyMultimeter::ConfigureScan(
	OutputMode mode,
	double endValue,
	unsigned int steps,
	double dwellSeconds)
{
	auto op = (mode == OUTPUT_SOURCE_CURRENT) ?
		CommandCatalog::OP_CONFIGURE_CURRENT_SCAN : CommandCatalog::OP_CONFIGURE_VOLTAGE_SCAN;
	RequireSupported(op);
	ValidateOutputFunction(mode, endValue);
	if( (steps == 0) || (steps > 100) )
		throw ConfigurationError("Scan step count must be between 1 and 100");
	if(!isfinite(dwellSeconds) || (dwellSeconds < 1) || (dwellSeconds > 99) )
		throw ConfigurationError("Scan dwell time must be between 1 and 99 seconds");

	PrepareOutputFunction(mode);

	CommandCatalog::Arguments args;
	args["value"] = CommandCatalog::FormatValue(endValue);
	args["steps"] = to_string(steps);
	args["dwell"] = CommandCatalog::FormatValue(dwellSeconds);
	Execute(op, args);

	LogVerbose("Scan to %s in %u steps of %s\n",
		Unit(GetFunctionUnit(mode)).PrettyPrint(endValue).c_str(),
		steps,
		Unit(Unit::UNIT_SECONDS).PrettyPrint(dwellSeconds).c_str());
}

/**
	@brief Programs the square wave output

	@param amplitude	Peak voltage, 0 to 30 V
	@param frequency	One of the frequencies the instrument supports, in Hz
	@param dutyCycle	High time in percent
	@param pulseWidth	High time in seconds, at most 1.6667 ms
 */
void KeysightU3606SupplyMultimeter::ConfigureSquareWave(
	double amplitude,
	double frequency,
	double dutyCycle,
	double pulseWidth)
{
	static const set<double> frequencies =
	{
		0.5, 2, 5, 6, 10, 15, 25, 30, 40, 50, 60, 75, 80, 100, 120, 150, 200, 240, 300, 400, 480, 600, 800,
		1200, 1600, 2400, 4800
	};

	RequireSupported(CommandCatalog::OP_CONFIGURE_SQUARE_WAVE);
	if(!isfinite(amplitude) || (amplitude < 0) || (amplitude > 30) )
		throw ConfigurationError("Square wave amplitude must be between 0 and 30 V");
	if(frequencies.find(frequency) == frequencies.end())
		throw ConfigurationError("Square wave frequency " + to_string_shortest(frequency) + " Hz is not supported");
	if(!isfinite(dutyCycle) || (dutyCycle < 0) || (dutyCycle > 100) )
		throw ConfigurationError("Square wave duty cycle must be between 0 and 100 %");
	if(!isfinite(pulseWidth) || (pulseWidth < 0) || (pulseWidth > 0.0016667) )
		throw ConfigurationError("Square wave pulse width must be between 0 and 1.6667 ms");

	PrepareOutputFunction(OUTPUT_NONE);

	CommandCatalog::Arguments args;
	args["amplitude"] = CommandCatalog::FormatValue(amplitude);
	args["frequency"] = CommandCatalog::FormatValue(frequency);
	args["duty"] = CommandCatalog::FormatValue(dutyCycle);
	args["width"] = CommandCatalog::FormatValue(pulseWidth);
	Execute(CommandCatalog::OP_CONFIGURE_SQUARE_WAVE, args);

	LogVerbose("Square wave %s at %s\n",
		Unit(Unit::UNIT_VOLTS).PrettyPrint(amplitude).c_str(),
		Unit(Unit::UNIT_HZ).PrettyPrint(frequency).c_str());
}

void KeysightU3606SupplyMultimeter::ValidateOutputFunction(OutputMode mode, double endValue) const
{
	if(mode == OUTPUT_NONE)
		throw ConfigurationError("No output mode specified");

	double vmax = (mode == OUTPUT_SOURCE_VOLTAGE) ? U3606_FUNCTION_MAX_VOLTAGE : U3606_FUNCTION_MAX_CURRENT;
	if(!isfinite(endValue) || (endValue < 0) || (endValue > vmax) )
	{
		Unit unit(GetFunctionUnit(mode));
		throw ConfigurationError("End value " + unit.PrettyPrint(endValue) + " is outside the range 0 to " +
			unit.PrettyPrint(vmax));
	}
}

/**
	@brief Checks the output mode (if any is required) and turns the output off ahead of reprogramming it
 */
void KeysightU3606SupplyMultimeter::PrepareOutputFunction(OutputMode mode)
{
	if( (mode != OUTPUT_NONE) && !m_state.CanSetOutputValue(0, mode) )
	{
		throw InvalidStateError(GetChannelName(0) + ": output is not configured to source " +
			((mode == OUTPUT_SOURCE_VOLTAGE) ? "voltage" : "current"));
	}

	DoDisableOutput(0);
}

Unit::UnitType KeysightU3606SupplyMultimeter::GetFunctionUnit(OutputMode mode)
{
	return (mode == OUTPUT_SOURCE_CURRENT) ? Unit::UNIT_AMPS : Unit::UNIT_VOLTS;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Multimeter

void KeysightU3606SupplyMultimeter::ConfigureMultimeter(MeasuredQuantity quantity, SignalType signal)
{
	auto settings = GetDefaultMeasurementSettings(quantity);
	settings.signal = signal;
	DoSetMeasurementMode(settings);
}

void KeysightU3606SupplyMultimeter::ConfigureMultimeter(const MeasurementSettings& settings)
{
	DoSetMeasurementMode(settings);
}

void KeysightU3606SupplyMultimeter::EnableContinuousMode()
{
	DoEnableContinuous(0);
}

void KeysightU3606SupplyMultimeter::DisableContinuousMode()
{
	DoDisableContinuous(0);
}

/**
	@brief Triggers one measurement with the current multimeter configuration
 */
double KeysightU3606SupplyMultimeter::Read()
{
	return DoRead(0);
}

/**
	@brief Returns the latest free-running measurement. Continuous mode must be enabled first.
 */
double KeysightU3606SupplyMultimeter::Fetch()
{
	return DoFetch(0);
}

double KeysightU3606SupplyMultimeter::Measure(MeasuredQuantity quantity, SignalType signal)
{
	auto settings = GetDefaultMeasurementSettings(quantity);
	settings.signal = signal;
	return DoMeasureScalar(0, quantity, &settings);
}

/**
	@brief Reconfigures the multimeter and takes one measurement. The new function stays selected afterwards.
 */
double KeysightU3606SupplyMultimeter::Measure(const MeasurementSettings& settings)
{
	return DoMeasureScalar(0, settings.quantity, &settings);
}

/**
	@brief Stops a measurement that is waiting for a trigger or still in progress
 */
void KeysightU3606SupplyMultimeter::AbortMeasurement()
{
	DoCommand(CommandCatalog::OP_ABORT_MEASUREMENT);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Math functions

string KeysightU3606SupplyMultimeter::GetCalcFunctionToken(CalcFunction func)
{
	switch(func)
	{
		case CALC_DB:		return "DB";
		case CALC_DBM:		return "DBM";
		case CALC_HOLD:		return "HOLD";
		case CALC_LIMIT:	return "LIM";
		case CALC_NULL:		return "NULL";

		case CALC_AVERAGE:
		default:
			return "AVER";
	}
}

/**
	@brief Selects the math function. The instrument turns the math subsystem off whenever the function changes.
 */
void KeysightU3606SupplyMultimeter::SelectCalcFunction(CalcFunction func)
{
	CommandCatalog::Arguments args;
	args["function"] = GetCalcFunctionToken(func);
	DoCommand(CommandCatalog::OP_SELECT_CALC_FUNCTION, 0, args);
}

KeysightU3606SupplyMultimeter::CalcFunction KeysightU3606SupplyMultimeter::GetCalcFunction()
{
	auto token = TrimQuotes(DoQueryText(CommandCatalog::OP_QUERY_CALC_FUNCTION));

	static const CalcFunction funcs[] = { CALC_AVERAGE, CALC_DB, CALC_DBM, CALC_HOLD, CALC_LIMIT, CALC_NULL };
	for(auto f : funcs)
	{
		if(token == GetCalcFunctionToken(f))
			return f;
	}

	LogError("Unknown math function \"%s\"\n", token.c_str());
	throw CommunicationError("Unknown math function \"" + token + "\"");
}

void KeysightU3606SupplyMultimeter::EnableCalc()
{
	DoCommand(CommandCatalog::OP_ENABLE_CALC);
}

void KeysightU3606SupplyMultimeter::DisableCalc()
{
	DoCommand(CommandCatalog::OP_DISABLE_CALC);
}

bool KeysightU3606SupplyMultimeter::IsCalcEnabled()
{
	return DoQueryFlag(CommandCatalog::OP_QUERY_CALC_STATE);
}

/**
	@brief Mean of every reading since averaging was enabled, or zero if there are none yet
 */
double KeysightU3606SupplyMultimeter::GetCalcAverage()
{
	return DoQueryScalar(CommandCatalog::OP_QUERY_CALC_AVERAGE);
}

double KeysightU3606SupplyMultimeter::GetCalcMaximum()
{
	return DoQueryScalar(CommandCatalog::OP_QUERY_CALC_MAXIMUM);
}

double KeysightU3606SupplyMultimeter::GetCalcMinimum()
{
	return DoQueryScalar(CommandCatalog::OP_QUERY_CALC_MINIMUM);
}

double KeysightU3606SupplyMultimeter::GetCalcPresent()
{
	return DoQueryScalar(CommandCatalog::OP_QUERY_CALC_PRESENT);
}

void KeysightU3606SupplyMultimeter::SetDbReference(double dbm)
{
	if(!isfinite(dbm) || (dbm < -120) || (dbm > 120) )
		throw ConfigurationError("dB reference must be between -120 and 120 dBm");

	CommandCatalog::Arguments args;
	args["value"] = CommandCatalog::FormatValue(dbm);
	DoCommand(CommandCatalog::OP_SET_DB_REFERENCE, 0, args);
}

/**
	@brief Selects the reference resistance for the dB and dBm functions
 */
void KeysightU3606SupplyMultimeter::SetDbmReference(unsigned int ohms)
{
	if( (ohms == 0) || (ohms > 9999) )
		throw ConfigurationError("dBm reference must be between 1 and 9999 ohms");

	CommandCatalog::Arguments args;
	args["value"] = to_string(ohms);
	DoCommand(CommandCatalog::OP_SET_DBM_REFERENCE, 0, args);
}

/**
	@brief Sets the hold variation. Zero selects data hold, anything else refresh hold.
 */
void KeysightU3606SupplyMultimeter::SetHoldVariation(double percent)
{
	if(!isfinite(percent) || (percent < 0) || (percent > 100) )
		throw ConfigurationError("Hold variation must be between 0 and 100 %");

	CommandCatalog::Arguments args;
	args["value"] = CommandCatalog::FormatValue(percent);
	DoCommand(CommandCatalog::OP_SET_HOLD_VARIATION, 0, args);
}

void KeysightU3606SupplyMultimeter::SetHoldThreshold(double percent)
{
	if(!isfinite(percent) || (percent < 0) || (percent > 9.9) )
		throw ConfigurationError("Hold threshold must be between 0 and 9.9 %");

	CommandCatalog::Arguments args;
	args["value"] = CommandCatalog::FormatValue(percent);
	DoCommand(CommandCatalog::OP_SET_HOLD_THRESHOLD, 0, args);
}

/**
	@brief Sets the limits used by the limit test, in the unit of the present measurement function
 */
void KeysightU3606SupplyMultimeter::SetLimits(double upper, double lower)
{
	if(!isfinite(upper) || !isfinite(lower) || (fabs(upper) > 1200) || (fabs(lower) > 1200) )
		throw ConfigurationError("Limits must be between -1200 and 1200");
	if(lower > upper)
		throw ConfigurationError("Lower limit is above the upper limit");

	CommandCatalog::Arguments args;
	args["upper"] = CommandCatalog::FormatValue(upper);
	args["lower"] = CommandCatalog::FormatValue(lower);
	DoCommand(CommandCatalog::OP_SET_LIMITS, 0, args);
}

void KeysightU3606SupplyMultimeter::SetNullOffset(double offset)
{
	if(!isfinite(offset) || (fabs(offset) > 1200) )
		throw ConfigurationError("Null offset must be between -1200 and 1200");

	CommandCatalog::Arguments args;
	args["value"] = CommandCatalog::FormatValue(offset);
	DoCommand(CommandCatalog::OP_SET_NULL_OFFSET, 0, args);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Data logger

/**
	@brief Starts logging. New entries are appended to whatever is already stored.

	The instrument ignores setting commands while it is logging.
 */
void KeysightU3606SupplyMultimeter::EnableDataLogging()
{
	DoCommand(CommandCatalog::OP_ENABLE_LOGGING);
	LogVerbose("Data logging started\n");
}

void KeysightU3606SupplyMultimeter::DisableDataLogging()
{
	DoCommand(CommandCatalog::OP_DISABLE_LOGGING);
	LogVerbose("Data logging stopped\n");
}

bool KeysightU3606SupplyMultimeter::IsDataLogging()
{
	return DoQueryFlag(CommandCatalog::OP_QUERY_LOGGING_STATE);
}

void KeysightU3606SupplyMultimeter::DeleteLoggedData()
{
	DoCommand(CommandCatalog::OP_DELETE_LOGGED_DATA);
}

/**
	@brief Moves the read position back to the first logged entry
 */
void KeysightU3606SupplyMultimeter::ResetLogIndex()
{
	DoCommand(CommandCatalog::OP_RESET_LOG_INDEX);
}

/**
	@brief Reads the entry at the read position and advances it. Returns "END" once every entry has been read.
 */
string KeysightU3606SupplyMultimeter::ReadLoggedEntry()
{
	return TrimQuotes(DoQueryText(CommandCatalog::OP_READ_LOGGED_DATA));
}

/**
	@brief Reads every logged entry from the start, in the order they were recorded

	The transport is held for the whole transfer since any other command moves the read position.
 */
vector<string> KeysightU3606SupplyMultimeter::ReadLoggedData()
{
	RequireSupported(CommandCatalog::OP_RESET_LOG_INDEX);
	RequireSupported(CommandCatalog::OP_READ_LOGGED_DATA);

	vector<string> ret;
	lock_guard<recursive_mutex> lock(m_transport->GetMutex());

	Execute(CommandCatalog::OP_RESET_LOG_INDEX, CommandCatalog::Arguments());
	while(true)
	{
		auto entry = TrimQuotes(CommandCatalog::ParseText(
			Query(CommandCatalog::OP_READ_LOGGED_DATA, CommandCatalog::Arguments())));
		if(entry == "END")
			break;

		if(ret.size() >= U3606_MAX_LOG_ENTRIES)
		{
			LogError("Data logger returned more than %d entries\n", U3606_MAX_LOG_ENTRIES);
			throw CommunicationError("Data logger never reported the end of the log");
		}
		ret.push_back(entry);
	}

	LogDebug("Read %zu logged entries\n", ret.size());
	return ret;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Status queries

bool KeysightU3606SupplyMultimeter::IsOutputEnabled()
{
	return DoQueryFlag(CommandCatalog::OP_QUERY_OUTPUT_STATE);
}

bool KeysightU3606SupplyMultimeter::IsContinuousModeEnabled()
{
	return DoQueryFlag(CommandCatalog::OP_QUERY_CONTINUOUS_STATE);
}

/**
	@brief Returns the multimeter function as the instrument reports it, for example "VOLT +1.000000E+01,+1.000000E-04"
 */
string KeysightU3606SupplyMultimeter::GetMeasurementConfiguration()
{
	return TrimQuotes(DoQueryText(CommandCatalog::OP_QUERY_MEASUREMENT_CONFIG));
}

double KeysightU3606SupplyMultimeter::GetOutputVoltageSetting()
{
	return DoQueryScalar(CommandCatalog::OP_QUERY_OUTPUT_VOLTAGE);
}

double KeysightU3606SupplyMultimeter::GetOutputCurrentSetting()
{
	return DoQueryScalar(CommandCatalog::OP_QUERY_OUTPUT_CURRENT);
}

double KeysightU3606SupplyMultimeter::GetVoltageLimitSetting()
{
	return DoQueryScalar(CommandCatalog::OP_QUERY_VOLTAGE_LIMIT);
}

double KeysightU3606SupplyMultimeter::GetCurrentLimitSetting()
{
	return DoQueryScalar(CommandCatalog::OP_QUERY_CURRENT_LIMIT);
}

/**
	@brief Gets the voltage measured at the output terminals
 */
double KeysightU3606SupplyMultimeter::GetSensedVoltage()
{
	return DoQueryScalar(CommandCatalog::OP_QUERY_SENSED_VOLTAGE);
}

double KeysightU3606SupplyMultimeter::GetSensedCurrent()
{
	return DoQueryScalar(CommandCatalog::OP_QUERY_SENSED_CURRENT);
}

/**
	@brief Sets the enable register of the questionable data group

	@param mask	Any combination of QuestionableBits
 */
void KeysightU3606SupplyMultimeter::EnableQuestionableEvents(unsigned int mask)
{
	if(mask & ~QUES_ALL)
		throw ConfigurationError("Questionable status mask " + to_string(mask) + " has undefined bits set");

	CommandCatalog::Arguments args;
	args["mask"] = to_string(mask);
	DoCommand(CommandCatalog::OP_ENABLE_QUESTIONABLE, 0, args);
}

unsigned int KeysightU3606SupplyMultimeter::GetQuestionableEnable()
{
	return DoQueryInteger(CommandCatalog::OP_QUERY_QUESTIONABLE_ENABLE);
}

/**
	@brief Reads (and clears) the latched questionable events
 */
unsigned int KeysightU3606SupplyMultimeter::GetQuestionableEvents()
{
	return DoQueryInteger(CommandCatalog::OP_QUERY_QUESTIONABLE_EVENT);
}

/**
	@brief Reads the live questionable conditions, without clearing anything
 */
unsigned int KeysightU3606SupplyMultimeter::GetQuestionableCondition()
{
	return DoQueryInteger(CommandCatalog::OP_QUERY_QUESTIONABLE_CONDITION);
}
