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
	@brief Implementation of KeysightU2723SourceMeasureUnit
 */

#include "benchhal.h"

#include <math.h>

using namespace std;

#define U2723_CHANNELS 3

//Memory list results wrap around and overwrite the oldest after this many
#define U2723_MAX_MEMORY_LIST_RESULTS 200

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Configuration

KeysightU2723ChannelConfiguration::KeysightU2723ChannelConfiguration()
	: hasOutput(false)
	, output(KeysightU2723SourceMeasureUnit::GetDefaultOutputSettings(OUTPUT_NONE))
	, outputValue(0)
	, sweepInterval(0)
	, sweepPoints(0)
{
}

KeysightU2723Configuration::KeysightU2723Configuration()
	: channels(U2723_CHANNELS)
{
}

/**
	@brief Defaults: first list, widest ranges, 5 V and 100 mA compliance
 */
KeysightU2723MemoryListSettings::KeysightU2723MemoryListSettings()
	: list(1)
	, voltageRange("R20V")
	, currentRange("R120mA")
	, voltageLimit(5)
	, currentLimit(0.1)
{
}

/**
	@brief Checks every channel against the model limits without touching any hardware

	@throws ConfigurationError if anything is out of range or missing
 */
void KeysightU2723Configuration::Validate() const
{
	auto& caps = KeysightU2723SourceMeasureUnit::GetModelCapabilities();

	if(channels.size() != U2723_CHANNELS)
		throw ConfigurationError("U2723 configuration must describe exactly 3 channels");

	for(size_t i=0; i<channels.size(); i++)
	{
		auto& chan = channels[i];
		try
		{
			if(chan.hasOutput)
			{
				SourceMeasureInstrument::ValidateOutputSettings(caps, chan.output);
				SourceMeasureInstrument::ValidateOutputValue(caps, chan.output.mode, chan.outputValue);
			}
			if(chan.sweepInterval || chan.sweepPoints)
			{
				if( (chan.sweepInterval == 0) || (chan.sweepPoints == 0) )
					throw ConfigurationError("sweep interval and point count must be set together");
				if( (chan.sweepInterval > caps.maxSweepInterval) || (chan.sweepPoints > caps.maxSweepPoints) )
					throw ConfigurationError("sweep configuration is out of range");
			}
		}
		catch(const ConfigurationError& e)
		{
			throw ConfigurationError("CH" + to_string(i+1) + ": " + e.what());
		}
	}
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

KeysightU2723SourceMeasureUnit::KeysightU2723SourceMeasureUnit(SCPITransport* transport)
	: SCPIDevice(transport)
	, SourceMeasureInstrument(transport, CommandCatalog::PROFILE_U2723, GetModelCapabilities(), U2723_CHANNELS)
{
	if(m_model.find("U2723") == string::npos)
	{
		LogError("%s is not a U2723\n", m_model.c_str());
		throw ConfigurationError("Expected a U2723, found \"" + m_model + "\"");
	}

	//Long array measurements block until the last point has been acquired
	m_transport->SetTimeout(chrono::milliseconds(120000));
}

KeysightU2723SourceMeasureUnit::~KeysightU2723SourceMeasureUnit()
{

}

/**
	@brief Limits from the U2720 series programming guide
 */
const SourceCapabilities& KeysightU2723SourceMeasureUnit::GetModelCapabilities()
{
	static SourceCapabilities caps;
	if(caps.voltageRanges.empty())
	{
		caps.minVoltage = -20;
		caps.maxVoltage = 20;
		caps.minCurrent = -0.12;
		caps.maxCurrent = 0.12;

		caps.voltageRanges = { "R2V", "R20V" };
		caps.currentRanges = { "R1uA", "R10uA", "R100uA", "R1mA", "R10mA", "R120mA" };

		caps.maxSweepInterval = 32767;
		caps.maxSweepPoints = 4096;
	}
	return caps;
}

/**
	@brief Defaults: widest ranges, 100 mA compliance when sourcing voltage, 5 V compliance when sourcing current
 */
OutputSettings KeysightU2723SourceMeasureUnit::GetDefaultOutputSettings(OutputMode mode)
{
	OutputSettings settings;
	settings.mode = mode;
	settings.voltageLimit = 5;
	settings.currentLimit = 0.1;
	settings.voltageRange = "R20V";
	settings.currentRange = "R120mA";
	return settings;
}

/**
	@brief Applies the initial configuration of a session. Never enables any output.
 */
void KeysightU2723SourceMeasureUnit::ApplyConfiguration(const ConfigType& config)
{
	config.Validate();

	for(size_t i=0; i<config.channels.size(); i++)
	{
		auto& chan = config.channels[i];
		if(chan.hasOutput)
			ConfigureChannel(i, chan.output, chan.outputValue);
		if(chan.sweepInterval && chan.sweepPoints)
			SetSweep(i, chan.sweepInterval, chan.sweepPoints);
	}
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Device info

unsigned int KeysightU2723SourceMeasureUnit::GetInstrumentTypes() const
{
	return INST_SMU;
}

string KeysightU2723SourceMeasureUnit::GetDriverName() const
{
	return GetDriverNameInternal();
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Source configuration

void KeysightU2723SourceMeasureUnit::SetOutputMode(size_t chan, OutputMode mode)
{
	DoSetOutputMode(chan, GetDefaultOutputSettings(mode));
}

void KeysightU2723SourceMeasureUnit::SetOutputMode(size_t chan, const OutputSettings& settings)
{
	DoSetOutputMode(chan, settings);
}

void KeysightU2723SourceMeasureUnit::ConfigureChannel(size_t chan, OutputMode mode, double value)
{
	DoConfigureOutput(chan, GetDefaultOutputSettings(mode), value);
}

void KeysightU2723SourceMeasureUnit::ConfigureChannel(size_t chan, const OutputSettings& settings, double value)
{
	DoConfigureOutput(chan, settings, value);
}

void KeysightU2723SourceMeasureUnit::SetSourceVoltage(size_t chan, double volts)
{
	DoSetOutputValue(chan, OUTPUT_SOURCE_VOLTAGE, volts);
}

void KeysightU2723SourceMeasureUnit::SetSourceCurrent(size_t chan, double amps)
{
	DoSetOutputValue(chan, OUTPUT_SOURCE_CURRENT, amps);
}

void KeysightU2723SourceMeasureUnit::EnableChannel(size_t chan)
{
	DoEnableOutput(chan);
}

void KeysightU2723SourceMeasureUnit::DisableChannel(size_t chan)
{
	DoDisableOutput(chan);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Transient trigger system

/**
	@brief Sets the voltage the channel switches to when its transient system is triggered
 */
void KeysightU2723SourceMeasureUnit::SetTriggerVoltage(size_t chan, double volts)
{
	DoSetTriggerLevel(chan, OUTPUT_SOURCE_VOLTAGE, volts);
}

void KeysightU2723SourceMeasureUnit::SetTriggerCurrent(size_t chan, double amps)
{
	DoSetTriggerLevel(chan, OUTPUT_SOURCE_CURRENT, amps);
}

/**
	@brief Arms the transient trigger system. Triggers are ignored until this is called.
 */
void KeysightU2723SourceMeasureUnit::InitiateTransient(size_t chan)
{
	DoCommand(CommandCatalog::OP_INITIATE_TRANSIENT, chan);
	LogDebug("%s: transient system initiated\n", GetChannelName(chan).c_str());
}

/**
	@brief Cancels any pending transient action and returns the trigger system to idle
 */
void KeysightU2723SourceMeasureUnit::AbortTransient(size_t chan)
{
	DoCommand(CommandCatalog::OP_ABORT_TRANSIENT, chan);
	LogDebug("%s: transient system aborted\n", GetChannelName(chan).c_str());
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Memory lists

/**
	@brief Stores a list that sources a voltage and takes one or more current measurements

	The list turns the output on before measuring and off again at the end. It is only executed by
	TriggerMemoryList(), results are read back with ReadMemoryListResults().

	@param chan		Channel to program
	@param volts	Source level
	@param count	Number of measurements, at most 200
	@param delayMs	Extra settling time before the first measurement, zero for none
	@param settings	List number, ranges and current limit
 */
void KeysightU2723SourceMeasureUnit::ProgramSourceVoltageMeasureCurrent(
	size_t chan,
	double volts,
	unsigned int count,
	unsigned int delayMs,
	const KeysightU2723MemoryListSettings& settings)
{
	ProgramSourceMeasure(chan, OUTPUT_SOURCE_VOLTAGE, volts, count, delayMs, settings);
}

void KeysightU2723SourceMeasureUnit::ProgramSourceCurrentMeasureVoltage(
	size_t chan,
	double amps,
	unsigned int count,
	unsigned int delayMs,
	const KeysightU2723MemoryListSettings& settings)
{
	ProgramSourceMeasure(chan, OUTPUT_SOURCE_CURRENT, amps, count, delayMs, settings);
}

/**
	@brief Stores a list that produces a current pulse, repeated loops times

	The list doesn't touch the output state, so the channel has to be enabled before the list is triggered.
	Negative peaks sink current.
 */
void KeysightU2723SourceMeasureUnit::ProgramCurrentPulse(
	size_t chan,
	double peakAmps,
	double widthMs,
	unsigned int loops,
	const KeysightU2723MemoryListSettings& settings)
{
	ProgramPulse(chan, OUTPUT_SOURCE_CURRENT, peakAmps, widthMs, loops, settings);
}

void KeysightU2723SourceMeasureUnit::ProgramVoltagePulse(
	size_t chan,
	double peakVolts,
	double widthMs,
	unsigned int loops,
	const KeysightU2723MemoryListSettings& settings)
{
	ProgramPulse(chan, OUTPUT_SOURCE_VOLTAGE, peakVolts, widthMs, loops, settings);
}

void KeysightU2723SourceMeasureUnit::ProgramSourceMeasure(
	size_t chan,
	OutputMode mode,
	double value,
	unsigned int count,
	unsigned int delayMs,
	const KeysightU2723MemoryListSettings& settings)
{
	ValidateMemoryList(chan, settings);
	ValidateOutputValue(m_caps, mode, value);
	if( (count == 0) || (count > U2723_MAX_MEMORY_LIST_RESULTS) )
	{
		throw ConfigurationError(GetChannelName(chan) + ": measurement count must be between 1 and " +
			to_string(U2723_MAX_MEMORY_LIST_RESULTS));
	}
	RequireIdle(chan);

	bool sourceVoltage = (mode == OUTPUT_SOURCE_VOLTAGE);
	auto sourceOp = sourceVoltage ?
		CommandCatalog::OP_MEMORY_SOURCE_VOLTAGE : CommandCatalog::OP_MEMORY_SOURCE_CURRENT;
	auto measureOp = sourceVoltage ?
		CommandCatalog::OP_MEMORY_MEASURE_CURRENT : CommandCatalog::OP_MEMORY_MEASURE_VOLTAGE;

	CommandCatalog::Arguments ranges;
	ranges["vrange"] = settings.voltageRange;
	ranges["irange"] = settings.currentRange;

	//Compliance on the quantity we don't regulate
	CommandCatalog::Arguments limit;
	if(sourceVoltage)
		limit["value"] = CommandCatalog::FormatValue(settings.currentLimit);
	else
		limit["value"] = CommandCatalog::FormatValue(settings.voltageLimit);

	CommandCatalog::Arguments level;
	level["value"] = CommandCatalog::FormatValue(value);

	CommandCatalog::Arguments none;

	vector<MemoryStep> steps;
	steps.push_back(MemoryStep(CommandCatalog::OP_MEMORY_VOLTAGE_RANGE, ranges));
	steps.push_back(MemoryStep(CommandCatalog::OP_MEMORY_CURRENT_RANGE, ranges));
	steps.push_back(MemoryStep(
		sourceVoltage ? CommandCatalog::OP_MEMORY_CURRENT_LIMIT : CommandCatalog::OP_MEMORY_VOLTAGE_LIMIT, limit));
	steps.push_back(MemoryStep(CommandCatalog::OP_MEMORY_AUTO_DELAY, none));
	steps.push_back(MemoryStep(sourceOp, level));
	steps.push_back(MemoryStep(CommandCatalog::OP_MEMORY_OUTPUT_ON, none));

	//The delay applies to the next source step, so repeat the level after it
	if(delayMs)
	{
		CommandCatalog::Arguments delay;
		delay["delay"] = to_string(delayMs);
		steps.push_back(MemoryStep(CommandCatalog::OP_MEMORY_DELAY, delay));
		steps.push_back(MemoryStep(sourceOp, level));
	}

	for(unsigned int i=0; i<count; i++)
		steps.push_back(MemoryStep(measureOp, none));
	steps.push_back(MemoryStep(CommandCatalog::OP_MEMORY_OUTPUT_OFF, none));

	SendMemoryList(chan, settings.list, steps, 0);

	Unit unit(sourceVoltage ? Unit::UNIT_VOLTS : Unit::UNIT_AMPS);
	LogVerbose("%s: list %u sources %s and takes %u measurements\n",
		GetChannelName(chan).c_str(), settings.list, unit.PrettyPrint(value).c_str(), count);
}

void KeysightU2723SourceMeasureUnit::ProgramPulse(
	size_t chan,
	OutputMode mode,
	double peak,
	double widthMs,
	unsigned int loops,
	const KeysightU2723MemoryListSettings& settings)
{
	ValidateMemoryList(chan, settings);
	ValidateOutputValue(m_caps, mode, peak);
	if(!isfinite(widthMs) || (widthMs <= 0) )
		throw ConfigurationError(GetChannelName(chan) + ": pulse width must be positive");
	if(loops == 0)
		throw ConfigurationError(GetChannelName(chan) + ": pulse needs at least one loop");
	RequireIdle(chan);

	auto sourceOp = (mode == OUTPUT_SOURCE_VOLTAGE) ?
		CommandCatalog::OP_MEMORY_SOURCE_VOLTAGE : CommandCatalog::OP_MEMORY_SOURCE_CURRENT;

	CommandCatalog::Arguments ranges;
	ranges["vrange"] = settings.voltageRange;
	ranges["irange"] = settings.currentRange;

	CommandCatalog::Arguments vlimit;
	vlimit["value"] = CommandCatalog::FormatValue(settings.voltageLimit);
	CommandCatalog::Arguments ilimit;
	ilimit["value"] = CommandCatalog::FormatValue(settings.currentLimit);

	CommandCatalog::Arguments width;
	width["delay"] = CommandCatalog::FormatValue(widthMs);

	CommandCatalog::Arguments high;
	high["value"] = CommandCatalog::FormatValue(peak);
	CommandCatalog::Arguments low;
	low["value"] = CommandCatalog::FormatValue(0.0);

	vector<MemoryStep> steps;
	steps.push_back(MemoryStep(CommandCatalog::OP_MEMORY_VOLTAGE_RANGE, ranges));
	steps.push_back(MemoryStep(CommandCatalog::OP_MEMORY_CURRENT_RANGE, ranges));
	steps.push_back(MemoryStep(CommandCatalog::OP_MEMORY_VOLTAGE_LIMIT, vlimit));
	steps.push_back(MemoryStep(CommandCatalog::OP_MEMORY_CURRENT_LIMIT, ilimit));
	steps.push_back(MemoryStep(CommandCatalog::OP_MEMORY_AUTO_DELAY, CommandCatalog::Arguments()));
	steps.push_back(MemoryStep(CommandCatalog::OP_MEMORY_DELAY, width));
	steps.push_back(MemoryStep(sourceOp, high));
	steps.push_back(MemoryStep(sourceOp, low));

	SendMemoryList(chan, settings.list, steps, loops);

	Unit unit((mode == OUTPUT_SOURCE_VOLTAGE) ? Unit::UNIT_VOLTS : Unit::UNIT_AMPS);
	LogVerbose("%s: list %u pulses %s for %s ms, %u times\n",
		GetChannelName(chan).c_str(),
		settings.list,
		unit.PrettyPrint(peak).c_str(),
		to_string_shortest(widthMs).c_str(),
		loops);
}

/**
	@brief Runs the active memory list of a channel
 */
void KeysightU2723SourceMeasureUnit::TriggerMemoryList(size_t chan)
{
	RequireChannel(chan);
	RequireSupported(CommandCatalog::OP_TRIGGER_MEMORY_LIST);
	RequireIdle(chan);

	Execute(CommandCatalog::OP_TRIGGER_MEMORY_LIST, ChannelArguments(chan));
	LogDebug("%s: memory list triggered\n", GetChannelName(chan).c_str());
}

/**
	@brief Reads the measurements taken by the last memory list run

	Steps that ran with the output off or without a measurement read back as +9.99999999E+10.
 */
vector<double> KeysightU2723SourceMeasureUnit::ReadMemoryListResults(size_t chan)
{
	return DoQueryArray(CommandCatalog::OP_READ_MEMORY_LIST_DATA, chan);
}

void KeysightU2723SourceMeasureUnit::ValidateMemoryList(
	size_t chan,
	const KeysightU2723MemoryListSettings& settings) const
{
	static const CommandCatalog::Operation ops[] =
	{
		CommandCatalog::OP_BEGIN_MEMORY_LIST,
		CommandCatalog::OP_MEMORY_VOLTAGE_RANGE,
		CommandCatalog::OP_MEMORY_CURRENT_RANGE,
		CommandCatalog::OP_MEMORY_VOLTAGE_LIMIT,
		CommandCatalog::OP_MEMORY_CURRENT_LIMIT,
		CommandCatalog::OP_MEMORY_AUTO_DELAY,
		CommandCatalog::OP_MEMORY_DELAY,
		CommandCatalog::OP_MEMORY_SOURCE_VOLTAGE,
		CommandCatalog::OP_MEMORY_SOURCE_CURRENT,
		CommandCatalog::OP_MEMORY_OUTPUT_ON,
		CommandCatalog::OP_MEMORY_OUTPUT_OFF,
		CommandCatalog::OP_MEMORY_MEASURE_VOLTAGE,
		CommandCatalog::OP_MEMORY_MEASURE_CURRENT,
		CommandCatalog::OP_MEMORY_LOOP,
		CommandCatalog::OP_STORE_MEMORY_LIST
	};

	RequireChannel(chan);
	for(auto op : ops)
		RequireSupported(op);

	if( (settings.list != 1) && (settings.list != 2) )
		throw ConfigurationError(GetChannelName(chan) + ": memory list must be 1 or 2");
	if(m_caps.voltageRanges.find(settings.voltageRange) == m_caps.voltageRanges.end())
		throw ConfigurationError("Invalid voltage range \"" + settings.voltageRange + "\"");
	if(m_caps.currentRanges.find(settings.currentRange) == m_caps.currentRanges.end())
		throw ConfigurationError("Invalid current range \"" + settings.currentRange + "\"");
	if(!isfinite(settings.voltageLimit) || (settings.voltageLimit <= 0) || (settings.voltageLimit > m_caps.maxVoltage))
	{
		throw ConfigurationError("Voltage limit " + Unit(Unit::UNIT_VOLTS).PrettyPrint(settings.voltageLimit) +
			" is not supported");
	}
	if(!isfinite(settings.currentLimit) || (settings.currentLimit <= 0) || (settings.currentLimit > m_caps.maxCurrent))
	{
		throw ConfigurationError("Current limit " + Unit(Unit::UNIT_AMPS).PrettyPrint(settings.currentLimit) +
			" is not supported");
	}
}

void KeysightU2723SourceMeasureUnit::RequireIdle(size_t chan) const
{
	if(!m_state.CanRead(chan))
	{
		throw InvalidStateError(
			GetChannelName(chan) + ": can't program or run a memory list while an acquisition is running");
	}
}

/**
	@brief Selects and clears a list, sends every step, then stores the list in nonvolatile memory

	@param loops	Number of times to repeat every step of the list, or zero to leave the loop setting alone
 */
void KeysightU2723SourceMeasureUnit::SendMemoryList(
	size_t chan,
	unsigned int list,
	const vector<MemoryStep>& steps,
	unsigned int loops)
{
	lock_guard<recursive_mutex> lock(m_transport->GetMutex());

	auto args = ChannelArguments(chan);
	args["list"] = to_string(list);
	Execute(CommandCatalog::OP_BEGIN_MEMORY_LIST, args);

	for(auto& step : steps)
	{
		auto stepArgs = ChannelArguments(chan);
		stepArgs.insert(step.second.begin(), step.second.end());
		Execute(step.first, stepArgs);
	}

	if(loops)
	{
		auto loopArgs = ChannelArguments(chan);
		loopArgs["start"] = "1";
		loopArgs["end"] = to_string(steps.size());
		loopArgs["loops"] = to_string(loops);
		Execute(CommandCatalog::OP_MEMORY_LOOP, loopArgs);
	}

	Execute(CommandCatalog::OP_STORE_MEMORY_LIST, ChannelArguments(chan));
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Measurement

void KeysightU2723SourceMeasureUnit::SetSweepInterval(size_t chan, unsigned int ms)
{
	DoSetSweepInterval(chan, ms);
}

void KeysightU2723SourceMeasureUnit::SetSweepPoints(size_t chan, unsigned int points)
{
	DoSetSweepPoints(chan, points);
}

/**
	@brief Sets both halves of the sweep configuration. Nothing is sent unless both are valid.
 */
void KeysightU2723SourceMeasureUnit::SetSweep(size_t chan, unsigned int ms, unsigned int points)
{
	RequireChannel(chan);
	ValidateSweep(ms, points);

	DoSetSweepInterval(chan, ms);
	DoSetSweepPoints(chan, points);
}

void KeysightU2723SourceMeasureUnit::ValidateSweep(unsigned int ms, unsigned int points)
{
	auto& caps = GetModelCapabilities();
	if( (ms == 0) || (ms > caps.maxSweepInterval) )
		throw ConfigurationError("Sweep interval must be between 1 and " + to_string(caps.maxSweepInterval) + " ms");
	if( (points == 0) || (points > caps.maxSweepPoints) )
		throw ConfigurationError("Sweep point count must be between 1 and " + to_string(caps.maxSweepPoints));
}

double KeysightU2723SourceMeasureUnit::MeasureVoltageScalar(size_t chan)
{
	return DoMeasureScalar(chan, QUANTITY_VOLTAGE);
}

double KeysightU2723SourceMeasureUnit::MeasureCurrentScalar(size_t chan)
{
	return DoMeasureScalar(chan, QUANTITY_CURRENT);
}

/**
	@brief Runs the configured sweep and returns one voltage sample per point, in acquisition order
 */
vector<double> KeysightU2723SourceMeasureUnit::MeasureVoltageArray(size_t chan)
{
	return DoMeasureArray(chan, QUANTITY_VOLTAGE);
}

vector<double> KeysightU2723SourceMeasureUnit::MeasureCurrentArray(size_t chan)
{
	return DoMeasureArray(chan, QUANTITY_CURRENT);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Status queries

bool KeysightU2723SourceMeasureUnit::IsChannelEnabled(size_t chan)
{
	return DoQueryFlag(CommandCatalog::OP_QUERY_OUTPUT_STATE, chan);
}

/**
	@brief Gets the integration time used for voltage measurements, in seconds
 */
double KeysightU2723SourceMeasureUnit::GetVoltageAperture(size_t chan)
{
	return DoQueryScalar(CommandCatalog::OP_QUERY_VOLTAGE_APERTURE, chan);
}

double KeysightU2723SourceMeasureUnit::GetCurrentAperture(size_t chan)
{
	return DoQueryScalar(CommandCatalog::OP_QUERY_CURRENT_APERTURE, chan);
}

/**
	@brief Reads the live operation condition register. Reading it doesn't clear anything.
 */
unsigned int KeysightU2723SourceMeasureUnit::GetOperationCondition()
{
	return DoQueryInteger(CommandCatalog::OP_QUERY_OPERATION_CONDITION);
}

/**
	@brief Checks whether the transient system of a channel has been triggered and is running
 */
bool KeysightU2723SourceMeasureUnit::IsTransientRunning(size_t chan)
{
	RequireChannel(chan);
	return (GetOperationCondition() & (OPER_TRANSIENT_RUNNING << chan)) != 0;
}

bool KeysightU2723SourceMeasureUnit::IsWaitingForTrigger(size_t chan)
{
	RequireChannel(chan);
	return (GetOperationCondition() & (OPER_WAITING_FOR_TRIGGER << chan)) != 0;
}
