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
	@brief Implementation of SourceMeasureInstrument
 */

#include "benchhal.h"

#include <math.h>

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

SourceMeasureInstrument::SourceMeasureInstrument(
	SCPITransport* transport,
	CommandCatalog::Profile profile,
	const SourceCapabilities& caps,
	size_t nchans)
	: SCPIDevice(transport)
	, SCPIInstrument(transport)
	, m_catalog(profile)
	, m_state(nchans)
	, m_caps(caps)
{
	for(size_t i=0; i<nchans; i++)
		m_channels.push_back(new InstrumentChannel(this, "CH" + to_string(i+1), i));

	m_serializers.push_back(sigc::mem_fun(*this, &SourceMeasureInstrument::DoSerializeConfiguration));
}

SourceMeasureInstrument::~SourceMeasureInstrument()
{

}

string SourceMeasureInstrument::GetChannelName(size_t chan) const
{
	auto c = GetChannel(chan);
	if(!c)
		return "CH?";
	return c->GetHwname();
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Output configuration

/**
	@brief Selects the regulation mode of an output, along with its ranges and compliance limit
 */
void SourceMeasureInstrument::DoSetOutputMode(size_t chan, const OutputSettings& settings)
{
	RequireChannel(chan);
	if(settings.mode == OUTPUT_NONE)
		throw ConfigurationError(GetChannelName(chan) + ": no output mode specified");

	auto op = (settings.mode == OUTPUT_SOURCE_VOLTAGE) ?
		CommandCatalog::OP_SELECT_SOURCE_VOLTAGE : CommandCatalog::OP_SELECT_SOURCE_CURRENT;
	RequireSupported(op);
	ValidateOutputSettings(m_caps, settings);

	if(!m_state.CanChangeOutputMode(chan))
	{
		throw InvalidStateError(
			GetChannelName(chan) + ": output mode can't be changed while the output is enabled or acquiring");
	}

	auto args = ChannelArguments(chan);
	args["vlimit"] = CommandCatalog::FormatValue(settings.voltageLimit);
	args["ilimit"] = CommandCatalog::FormatValue(settings.currentLimit);
	args["vrange"] = settings.voltageRange;
	args["irange"] = settings.currentRange;
	Execute(op, args);

	m_state.CommitOutputMode(chan, settings);

	if(settings.mode == OUTPUT_SOURCE_VOLTAGE)
	{
		LogVerbose("%s: source voltage, current limit %s\n",
			GetChannelName(chan).c_str(), Unit(Unit::UNIT_AMPS).PrettyPrint(settings.currentLimit).c_str());
	}
	else
	{
		LogVerbose("%s: source current, voltage limit %s\n",
			GetChannelName(chan).c_str(), Unit(Unit::UNIT_VOLTS).PrettyPrint(settings.voltageLimit).c_str());
	}
}

/**
	@brief Sets the regulated voltage or current. The channel must already be in the matching mode.
 */
void SourceMeasureInstrument::DoSetOutputValue(size_t chan, OutputMode regulated, double value)
{
	RequireChannel(chan);

	auto op = (regulated == OUTPUT_SOURCE_VOLTAGE) ?
		CommandCatalog::OP_SET_OUTPUT_VOLTAGE : CommandCatalog::OP_SET_OUTPUT_CURRENT;
	RequireSupported(op);
	ValidateOutputValue(m_caps, regulated, value);

	if(!m_state.CanSetOutputValue(chan, regulated))
	{
		throw InvalidStateError(GetChannelName(chan) + ": output is not configured to source " +
			((regulated == OUTPUT_SOURCE_VOLTAGE) ? "voltage" : "current"));
	}

	auto args = ChannelArguments(chan);
	args["value"] = CommandCatalog::FormatValue(value);
	Execute(op, args);

	m_state.CommitOutputValue(chan, value);

	Unit unit((regulated == OUTPUT_SOURCE_VOLTAGE) ? Unit::UNIT_VOLTS : Unit::UNIT_AMPS);
	LogVerbose("%s: output set to %s\n", GetChannelName(chan).c_str(), unit.PrettyPrint(value).c_str());
}

/**
	@brief Mode select followed by the value, with everything validated before the first command goes out
 */
void SourceMeasureInstrument::DoConfigureOutput(size_t chan, const OutputSettings& settings, double value)
{
	RequireChannel(chan);
	if(settings.mode == OUTPUT_NONE)
		throw ConfigurationError(GetChannelName(chan) + ": no output mode specified");
	ValidateOutputValue(m_caps, settings.mode, value);

	DoSetOutputMode(chan, settings);
	DoSetOutputValue(chan, settings.mode, value);
}

void SourceMeasureInstrument::DoEnableOutput(size_t chan)
{
	RequireChannel(chan);
	RequireSupported(CommandCatalog::OP_ENABLE_OUTPUT);

	if(!m_state.CanEnableOutput(chan))
		throw InvalidStateError(GetChannelName(chan) + ": can't enable an output with no output mode configured");

	Execute(CommandCatalog::OP_ENABLE_OUTPUT, ChannelArguments(chan));
	m_state.CommitOutputEnabled(chan, true);

	LogNotice("%s: output enabled\n", GetChannelName(chan).c_str());
}

/**
	@brief Turns an output off. Always legal, and leaves the rest of the channel configuration intact.
 */
void SourceMeasureInstrument::DoDisableOutput(size_t chan)
{
	RequireChannel(chan);
	RequireSupported(CommandCatalog::OP_DISABLE_OUTPUT);

	Execute(CommandCatalog::OP_DISABLE_OUTPUT, ChannelArguments(chan));
	m_state.CommitOutputEnabled(chan, false);

	LogNotice("%s: output disabled\n", GetChannelName(chan).c_str());
}

/**
	@brief Sets the over-voltage or over-current protection trip point
 */
void SourceMeasureInstrument::DoSetProtection(OutputMode regulated, double value)
{
	auto op = (regulated == OUTPUT_SOURCE_VOLTAGE) ?
		CommandCatalog::OP_SET_VOLTAGE_PROTECTION : CommandCatalog::OP_SET_CURRENT_PROTECTION;
	RequireSupported(op);

	if(!isfinite(value) || (value <= 0))
		throw ConfigurationError("Protection level must be positive");

	CommandCatalog::Arguments args;
	args["value"] = CommandCatalog::FormatValue(value);
	Execute(op, args);

	Unit unit((regulated == OUTPUT_SOURCE_VOLTAGE) ? Unit::UNIT_VOLTS : Unit::UNIT_AMPS);
	LogVerbose("Protection set to %s\n", unit.PrettyPrint(value).c_str());
}

/**
	@brief Sets the level a channel switches to when its transient system is triggered

	Like the immediate level, this is only legal in the matching output mode.
 */
void SourceMeasureInstrument::DoSetTriggerLevel(size_t chan, OutputMode regulated, double value)
{
	RequireChannel(chan);

	auto op = (regulated == OUTPUT_SOURCE_VOLTAGE) ?
		CommandCatalog::OP_SET_TRIGGER_VOLTAGE : CommandCatalog::OP_SET_TRIGGER_CURRENT;
	RequireSupported(op);
	ValidateOutputValue(m_caps, regulated, value);

	if(!m_state.CanSetOutputValue(chan, regulated))
	{
		throw InvalidStateError(GetChannelName(chan) + ": output is not configured to source " +
			((regulated == OUTPUT_SOURCE_VOLTAGE) ? "voltage" : "current"));
	}

	auto args = ChannelArguments(chan);
	args["value"] = CommandCatalog::FormatValue(value);
	Execute(op, args);

	Unit unit((regulated == OUTPUT_SOURCE_VOLTAGE) ? Unit::UNIT_VOLTS : Unit::UNIT_AMPS);
	LogVerbose("%s: trigger level %s\n", GetChannelName(chan).c_str(), unit.PrettyPrint(value).c_str());
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Measurement configuration and acquisition

void SourceMeasureInstrument::DoSetMeasurementMode(const MeasurementSettings& settings)
{
	CommandCatalog::Operation op;
	switch(settings.quantity)
	{
		case QUANTITY_CURRENT:
			op = CommandCatalog::OP_CONFIGURE_CURRENT;
			break;

		case QUANTITY_RESISTANCE:
			op = CommandCatalog::OP_CONFIGURE_RESISTANCE;
			break;

		case QUANTITY_VOLTAGE:
		default:
			op = CommandCatalog::OP_CONFIGURE_VOLTAGE;
			break;
	}
	RequireSupported(op);
	ValidateMeasurementSettings(m_caps, settings);

	if(!m_state.CanChangeMeasurementMode())
		throw InvalidStateError("Measurement mode can't be changed while an acquisition is running");

	Execute(op, MeterArguments(settings));
	m_state.CommitMeasurementMode(settings);

	LogVerbose("Multimeter configured for %s\n", InstrumentState::GetQuantityName(settings.quantity).c_str());
}

void SourceMeasureInstrument::DoEnableContinuous(size_t chan)
{
	RequireChannel(chan);
	RequireSupported(CommandCatalog::OP_ENABLE_CONTINUOUS);

	if(!m_state.CanEnableContinuous(chan))
		throw InvalidStateError(GetChannelName(chan) + ": can't start continuous acquisition while a sweep is armed");

	Execute(CommandCatalog::OP_ENABLE_CONTINUOUS, ChannelArguments(chan));
	m_state.CommitAcquisition(chan, ACQ_CONTINUOUS_RUNNING);

	LogDebug("%s: continuous acquisition running\n", GetChannelName(chan).c_str());
}

void SourceMeasureInstrument::DoDisableContinuous(size_t chan)
{
	RequireChannel(chan);
	RequireSupported(CommandCatalog::OP_DISABLE_CONTINUOUS);

	Execute(CommandCatalog::OP_DISABLE_CONTINUOUS, ChannelArguments(chan));
	m_state.CommitAcquisition(chan, ACQ_IDLE);

	LogDebug("%s: continuous acquisition stopped\n", GetChannelName(chan).c_str());
}

/**
	@brief Triggers a single acquisition and waits for the result
 */
double SourceMeasureInstrument::DoRead(size_t chan)
{
	RequireChannel(chan);
	RequireSupported(CommandCatalog::OP_READ);

	if(!m_state.CanRead(chan))
	{
		throw InvalidStateError(
			GetChannelName(chan) + ": can't trigger a read while continuous acquisition is running, use fetch");
	}

	AcquisitionGuard guard(m_state, chan, ACQ_TRIGGERED_ARMED);
	return CommandCatalog::ParseScalar(Query(CommandCatalog::OP_READ, ChannelArguments(chan)));
}

/**
	@brief Returns the most recent value of a free-running acquisition without retriggering
 */
double SourceMeasureInstrument::DoFetch(size_t chan)
{
	RequireChannel(chan);
	RequireSupported(CommandCatalog::OP_FETCH);

	if(!m_state.CanFetch(chan))
		throw InvalidStateError(GetChannelName(chan) + ": fetch requires continuous acquisition to be enabled");

	return CommandCatalog::ParseScalar(Query(CommandCatalog::OP_FETCH, ChannelArguments(chan)));
}

void SourceMeasureInstrument::DoSetSweepInterval(size_t chan, unsigned int ms)
{
	RequireChannel(chan);
	RequireSupported(CommandCatalog::OP_SET_SWEEP_INTERVAL);

	if( (ms == 0) || (ms > m_caps.maxSweepInterval) )
	{
		throw ConfigurationError(GetChannelName(chan) + ": sweep interval must be between 1 and " +
			to_string(m_caps.maxSweepInterval) + " ms");
	}
	if(!m_state.CanConfigureSweep(chan))
		throw InvalidStateError(GetChannelName(chan) + ": can't reconfigure a sweep that is in progress");

	auto args = ChannelArguments(chan);
	args["interval"] = to_string(ms);
	Execute(CommandCatalog::OP_SET_SWEEP_INTERVAL, args);

	m_state.CommitSweepInterval(chan, ms);
	LogVerbose("%s: sweep interval %s\n", GetChannelName(chan).c_str(), Unit(Unit::UNIT_MS).PrettyPrint(ms).c_str());
}

void SourceMeasureInstrument::DoSetSweepPoints(size_t chan, unsigned int points)
{
	RequireChannel(chan);
	RequireSupported(CommandCatalog::OP_SET_SWEEP_POINTS);

	if( (points == 0) || (points > m_caps.maxSweepPoints) )
	{
		throw ConfigurationError(GetChannelName(chan) + ": sweep point count must be between 1 and " +
			to_string(m_caps.maxSweepPoints));
	}
	if(!m_state.CanConfigureSweep(chan))
		throw InvalidStateError(GetChannelName(chan) + ": can't reconfigure a sweep that is in progress");

	auto args = ChannelArguments(chan);
	args["points"] = to_string(points);
	Execute(CommandCatalog::OP_SET_SWEEP_POINTS, args);

	m_state.CommitSweepPoints(chan, points);
	LogVerbose("%s: sweep of %u points\n", GetChannelName(chan).c_str(), points);
}

/**
	@brief Performs a single triggered measurement

	@param chan		Channel to measure
	@param quantity	What to measure
	@param meter	Multimeter settings for instruments whose measure command selects the meter function. The
					meter stays in that function afterwards, so the measurement mode is updated to match.
					If null, the measurement is taken by the source channel and must be compatible with its mode.
 */
double SourceMeasureInstrument::DoMeasureScalar(
	size_t chan,
	MeasuredQuantity quantity,
	const MeasurementSettings* meter)
{
	RequireChannel(chan);

	CommandCatalog::Operation op;
	switch(quantity)
	{
		case QUANTITY_CURRENT:
			op = CommandCatalog::OP_MEASURE_CURRENT;
			break;

		case QUANTITY_RESISTANCE:
			op = CommandCatalog::OP_MEASURE_RESISTANCE;
			break;

		case QUANTITY_VOLTAGE:
		default:
			op = CommandCatalog::OP_MEASURE_VOLTAGE;
			break;
	}
	RequireSupported(op);

	auto args = ChannelArguments(chan);
	if(meter)
	{
		ValidateMeasurementSettings(m_caps, *meter);
		auto margs = MeterArguments(*meter);
		args.insert(margs.begin(), margs.end());
	}
	else if(!m_state.IsQuantityMeasurable(chan, quantity))
	{
		throw InvalidStateError(GetChannelName(chan) + ": can't measure " +
			InstrumentState::GetQuantityName(quantity) + " while in " +
			InstrumentState::GetOutputModeName(m_state.GetChannel(chan).m_output.mode) + " mode");
	}

	if(!m_state.CanRead(chan))
	{
		throw InvalidStateError(
			GetChannelName(chan) + ": can't trigger a measurement while continuous acquisition is running");
	}

	double value;
	{
		AcquisitionGuard guard(m_state, chan, ACQ_TRIGGERED_ARMED);
		value = CommandCatalog::ParseScalar(Query(op, args));
	}

	if(meter)
		m_state.CommitMeasurementMode(*meter);
	return value;
}

/**
	@brief Triggers a sweep and blocks until every configured point has been acquired

	@return Exactly as many values as the configured point count, in acquisition order
 */
vector<double> SourceMeasureInstrument::DoMeasureArray(size_t chan, MeasuredQuantity quantity)
{
	RequireChannel(chan);

	auto op = (quantity == QUANTITY_CURRENT) ?
		CommandCatalog::OP_MEASURE_CURRENT_ARRAY : CommandCatalog::OP_MEASURE_VOLTAGE_ARRAY;
	RequireSupported(op);

	auto& state = m_state.GetChannel(chan);
	if(!state.IsSweepConfigured())
	{
		throw InvalidStateError(
			GetChannelName(chan) + ": sweep interval and point count must both be set before an array measurement");
	}
	if(!m_state.CanStartSweep(chan))
		throw InvalidStateError(GetChannelName(chan) + ": can't start a sweep while another acquisition is running");
	if(!m_state.IsQuantityMeasurable(chan, quantity))
	{
		throw InvalidStateError(GetChannelName(chan) + ": can't measure " +
			InstrumentState::GetQuantityName(quantity) + " while in " +
			InstrumentState::GetOutputModeName(state.m_output.mode) + " mode");
	}

	unsigned int points = state.m_sweepPoints;
	LogDebug("%s: sweeping %u points at %u ms\n", GetChannelName(chan).c_str(), points, state.m_sweepInterval);

	AcquisitionGuard guard(m_state, chan, ACQ_SWEEP_ARMED);
	auto values = CommandCatalog::ParseArray(Query(op, ChannelArguments(chan)));
	if(values.size() != points)
	{
		LogError("%s: expected %u samples, got %zu\n", GetChannelName(chan).c_str(), points, values.size());
		throw CommunicationError(GetChannelName(chan) + ": expected " + to_string(points) + " samples, got " +
			to_string(values.size()));
	}
	return values;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Unchecked commands and status queries

/**
	@brief Sends a command that has no effect on the state model

	@param op		Operation to send
	@param chan		Channel the command applies to
	@param extra	Values for any placeholders other than {chan}
 */
void SourceMeasureInstrument::DoCommand(
	CommandCatalog::Operation op,
	size_t chan,
	const CommandCatalog::Arguments& extra)
{
	RequireChannel(chan);
	RequireSupported(op);

	auto args = ChannelArguments(chan);
	args.insert(extra.begin(), extra.end());
	Execute(op, args);
}

bool SourceMeasureInstrument::DoQueryFlag(CommandCatalog::Operation op, size_t chan)
{
	RequireChannel(chan);
	RequireSupported(op);
	return CommandCatalog::ParseFlag(Query(op, ChannelArguments(chan)));
}

double SourceMeasureInstrument::DoQueryScalar(CommandCatalog::Operation op, size_t chan)
{
	RequireChannel(chan);
	RequireSupported(op);
	return CommandCatalog::ParseScalar(Query(op, ChannelArguments(chan)));
}

long SourceMeasureInstrument::DoQueryInteger(CommandCatalog::Operation op, size_t chan)
{
	RequireChannel(chan);
	RequireSupported(op);
	return CommandCatalog::ParseInteger(Query(op, ChannelArguments(chan)));
}

vector<double> SourceMeasureInstrument::DoQueryArray(CommandCatalog::Operation op, size_t chan)
{
	RequireChannel(chan);
	RequireSupported(op);
	return CommandCatalog::ParseArray(Query(op, ChannelArguments(chan)));
}

string SourceMeasureInstrument::DoQueryText(CommandCatalog::Operation op, size_t chan)
{
	RequireChannel(chan);
	RequireSupported(op);
	return CommandCatalog::ParseText(Query(op, ChannelArguments(chan)));
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Teardown and housekeeping

bool SourceMeasureInstrument::IsContinuousRunning(size_t chan) const
{
	return m_state.GetChannel(chan).m_acquisition == ACQ_CONTINUOUS_RUNNING;
}

void SourceMeasureInstrument::StopContinuous(size_t chan)
{
	DoDisableContinuous(chan);
}

void SourceMeasureInstrument::ForceOutputOff(size_t chan)
{
	DoDisableOutput(chan);
}

/**
	@brief Reads and clears one entry from the instrument error queue
 */
string SourceMeasureInstrument::QueryErrorQueue()
{
	return DoQueryText(CommandCatalog::OP_QUERY_ERROR);
}

/**
	@brief Returns the instrument to its power-on defaults and clears status, then forgets everything we configured
 */
void SourceMeasureInstrument::ResetToDefaults()
{
	Execute(CommandCatalog::OP_RESET, CommandCatalog::Arguments());
	Execute(CommandCatalog::OP_CLEAR_STATUS, CommandCatalog::Arguments());
	m_state.Reset();

	LogDebug("%s reset to defaults\n", GetName().c_str());
}

void SourceMeasureInstrument::ClearStatus()
{
	Execute(CommandCatalog::OP_CLEAR_STATUS, CommandCatalog::Arguments());
}

bool SourceMeasureInstrument::IsOperationComplete()
{
	return DoQueryFlag(CommandCatalog::OP_OPERATION_COMPLETE);
}

/**
	@brief Makes the instrument finish every pending command before it processes the next one (*WAI)
 */
void SourceMeasureInstrument::WaitForCompletion()
{
	DoCommand(CommandCatalog::OP_WAIT);
}

/**
	@brief Runs a calibration with the previously stored calibration value

	@return True if the instrument reports that calibration passed
 */
bool SourceMeasureInstrument::Calibrate()
{
	auto code = DoQueryInteger(CommandCatalog::OP_CALIBRATE);
	if(code != 0)
	{
		LogWarning("%s: calibration failed (code %ld)\n", GetName().c_str(), code);
		return false;
	}

	LogNotice("%s: calibration passed\n", GetName().c_str());
	return true;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Parameter validation

void SourceMeasureInstrument::ValidateOutputValue(const SourceCapabilities& caps, OutputMode regulated, double value)
{
	if(regulated == OUTPUT_SOURCE_VOLTAGE)
	{
		if(!isfinite(value) || (value < caps.minVoltage) || (value > caps.maxVoltage))
		{
			Unit volts(Unit::UNIT_VOLTS);
			throw ConfigurationError("Output voltage " + volts.PrettyPrint(value) + " is outside the range " +
				volts.PrettyPrint(caps.minVoltage) + " to " + volts.PrettyPrint(caps.maxVoltage));
		}
	}
	else if(regulated == OUTPUT_SOURCE_CURRENT)
	{
		if(!isfinite(value) || (value < caps.minCurrent) || (value > caps.maxCurrent))
		{
			Unit amps(Unit::UNIT_AMPS);
			throw ConfigurationError("Output current " + amps.PrettyPrint(value) + " is outside the range " +
				amps.PrettyPrint(caps.minCurrent) + " to " + amps.PrettyPrint(caps.maxCurrent));
		}
	}
	else
		throw ConfigurationError("No output mode specified");
}

void SourceMeasureInstrument::ValidateOutputSettings(const SourceCapabilities& caps, const OutputSettings& settings)
{
	//Only the limit on the unregulated quantity is used
	if(settings.mode == OUTPUT_SOURCE_VOLTAGE)
	{
		double imax = max(fabs(caps.minCurrent), fabs(caps.maxCurrent));
		if(!isfinite(settings.currentLimit) || (settings.currentLimit <= 0) || (settings.currentLimit > imax))
		{
			throw ConfigurationError("Current limit " + Unit(Unit::UNIT_AMPS).PrettyPrint(settings.currentLimit) +
				" is not supported");
		}
		if(caps.voltageRanges.find(settings.voltageRange) == caps.voltageRanges.end())
			throw ConfigurationError("Invalid voltage range \"" + settings.voltageRange + "\"");
		if(!settings.currentRange.empty() && (caps.currentRanges.find(settings.currentRange) == caps.currentRanges.end()))
			throw ConfigurationError("Invalid current range \"" + settings.currentRange + "\"");
	}
	else if(settings.mode == OUTPUT_SOURCE_CURRENT)
	{
		double vmax = max(fabs(caps.minVoltage), fabs(caps.maxVoltage));
		if(!isfinite(settings.voltageLimit) || (settings.voltageLimit <= 0) || (settings.voltageLimit > vmax))
		{
			throw ConfigurationError("Voltage limit " + Unit(Unit::UNIT_VOLTS).PrettyPrint(settings.voltageLimit) +
				" is not supported");
		}
		if(caps.currentRanges.find(settings.currentRange) == caps.currentRanges.end())
			throw ConfigurationError("Invalid current range \"" + settings.currentRange + "\"");
		if(!settings.voltageRange.empty() && (caps.voltageRanges.find(settings.voltageRange) == caps.voltageRanges.end()))
			throw ConfigurationError("Invalid voltage range \"" + settings.voltageRange + "\"");
	}
	else
		throw ConfigurationError("No output mode specified");
}

void SourceMeasureInstrument::ValidateMeasurementSettings(
	const SourceCapabilities& caps,
	const MeasurementSettings& settings)
{
	if(caps.meterRanges.find(settings.range) == caps.meterRanges.end())
		throw ConfigurationError("Invalid measurement range \"" + settings.range + "\"");
	if(caps.meterResolutions.find(settings.resolution) == caps.meterResolutions.end())
		throw ConfigurationError("Invalid measurement resolution \"" + settings.resolution + "\"");
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Helpers

/**
	@brief Rejects operations this instrument doesn't have, before anything else is checked
 */
void SourceMeasureInstrument::RequireSupported(CommandCatalog::Operation op) const
{
	if(!m_catalog.Supports(op))
	{
		throw InvalidStateError(
			CommandCatalog::GetProfileName(m_catalog.GetProfile()) + " does not support " +
			CommandCatalog::GetOperationName(op));
	}
}

void SourceMeasureInstrument::RequireChannel(size_t chan) const
{
	if(chan >= m_state.GetChannelCount())
		throw ConfigurationError("Channel index " + to_string(chan) + " is out of range");
}

CommandCatalog::Arguments SourceMeasureInstrument::ChannelArguments(size_t chan) const
{
	CommandCatalog::Arguments args;
	args["chan"] = to_string(chan + 1);
	return args;
}

CommandCatalog::Arguments SourceMeasureInstrument::MeterArguments(const MeasurementSettings& settings) const
{
	CommandCatalog::Arguments args;
	args["signal"] = (settings.signal == SIGNAL_AC) ? "AC" : "DC";
	args["range"] = settings.range;
	args["resolution"] = settings.resolution;
	return args;
}

/**
	@brief Sends every command of an operation, in order, holding the transport for the whole sequence
 */
void SourceMeasureInstrument::Execute(CommandCatalog::Operation op, const CommandCatalog::Arguments& args)
{
	auto cmds = m_catalog.Translate(op, args);

	lock_guard<recursive_mutex> lock(m_transport->GetMutex());
	for(auto& cmd : cmds)
		m_transport->SendCommandImmediate(cmd);
}

/**
	@brief Sends a single-command query and returns the raw reply
 */
string SourceMeasureInstrument::Query(CommandCatalog::Operation op, const CommandCatalog::Arguments& args)
{
	auto cmds = m_catalog.Translate(op, args);

	lock_guard<recursive_mutex> lock(m_transport->GetMutex());

	//Anything before the last command is setup
	for(size_t i=0; i+1 < cmds.size(); i++)
		m_transport->SendCommandImmediate(cmds[i]);
	return m_transport->SendCommandImmediateWithReply(cmds.back(), false);
}

void SourceMeasureInstrument::DoSerializeConfiguration(YAML::Node& node)
{
	node["profile"] = CommandCatalog::GetProfileName(m_catalog.GetProfile());
	m_state.Serialize(node);
}
