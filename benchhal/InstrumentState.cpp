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
	@brief Implementation of InstrumentState
 */

#include "benchhal.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// ChannelState

ChannelState::ChannelState()
	: m_outputValue(0)
	, m_outputValueSet(false)
	, m_enabled(false)
	, m_acquisition(ACQ_IDLE)
	, m_sweepInterval(0)
	, m_sweepPoints(0)
{
	m_output.mode = OUTPUT_NONE;
	m_output.voltageLimit = 0;
	m_output.currentLimit = 0;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

InstrumentState::InstrumentState(size_t nchans)
	: m_channels(nchans)
	, m_measurementConfigured(false)
{
	m_measurement.quantity = QUANTITY_VOLTAGE;
	m_measurement.signal = SIGNAL_DC;
}

/**
	@brief Returns to the power-on baseline: every output disabled and unconfigured, every channel idle
 */
void InstrumentState::Reset()
{
	size_t nchans = m_channels.size();
	m_channels.clear();
	m_channels.resize(nchans);

	m_measurementConfigured = false;
	m_measurement.quantity = QUANTITY_VOLTAGE;
	m_measurement.signal = SIGNAL_DC;
	m_measurement.range = "";
	m_measurement.resolution = "";
}

const ChannelState& InstrumentState::GetChannel(size_t chan) const
{
	if(chan >= m_channels.size())
		throw ConfigurationError("Channel index " + to_string(chan) + " is out of range");
	return m_channels[chan];
}

ChannelState& InstrumentState::GetMutableChannel(size_t chan)
{
	if(chan >= m_channels.size())
		throw ConfigurationError("Channel index " + to_string(chan) + " is out of range");
	return m_channels[chan];
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Legality predicates

/**
	@brief Output mode may only change while the output is off and nothing is acquiring
 */
bool InstrumentState::CanChangeOutputMode(size_t chan) const
{
	auto& state = GetChannel(chan);
	return !state.m_enabled && (state.m_acquisition == ACQ_IDLE);
}

/**
	@brief The value command is mode dependent, so it has to match the configured mode
 */
bool InstrumentState::CanSetOutputValue(size_t chan, OutputMode regulated) const
{
	return GetChannel(chan).m_output.mode == regulated;
}

bool InstrumentState::CanEnableOutput(size_t chan) const
{
	return GetChannel(chan).m_output.mode != OUTPUT_NONE;
}

bool InstrumentState::CanChangeMeasurementMode() const
{
	for(auto& state : m_channels)
	{
		if(state.m_acquisition != ACQ_IDLE)
			return false;
	}
	return true;
}

bool InstrumentState::CanEnableContinuous(size_t chan) const
{
	auto acq = GetChannel(chan).m_acquisition;
	return (acq == ACQ_IDLE) || (acq == ACQ_CONTINUOUS_RUNNING);
}

bool InstrumentState::CanRead(size_t chan) const
{
	return GetChannel(chan).m_acquisition == ACQ_IDLE;
}

bool InstrumentState::CanFetch(size_t chan) const
{
	return GetChannel(chan).m_acquisition == ACQ_CONTINUOUS_RUNNING;
}

bool InstrumentState::CanConfigureSweep(size_t chan) const
{
	return GetChannel(chan).m_acquisition != ACQ_SWEEP_ARMED;
}

bool InstrumentState::CanStartSweep(size_t chan) const
{
	auto& state = GetChannel(chan);
	return state.IsSweepConfigured() && (state.m_acquisition == ACQ_IDLE);
}

/**
	@brief Checks whether a source-measure channel measures the given quantity in its current mode

	A channel sourcing voltage measures current and vice versa. Unconfigured channels can measure either.
 */
bool InstrumentState::IsQuantityMeasurable(size_t chan, MeasuredQuantity quantity) const
{
	switch(GetChannel(chan).m_output.mode)
	{
		case OUTPUT_SOURCE_VOLTAGE:
			return quantity == QUANTITY_CURRENT;

		case OUTPUT_SOURCE_CURRENT:
			return quantity == QUANTITY_VOLTAGE;

		case OUTPUT_NONE:
		default:
			return quantity != QUANTITY_RESISTANCE;
	}
}

bool InstrumentState::IsAnyContinuousRunning() const
{
	for(auto& state : m_channels)
	{
		if(state.m_acquisition == ACQ_CONTINUOUS_RUNNING)
			return true;
	}
	return false;
}

bool InstrumentState::IsAnyOutputEnabled() const
{
	for(auto& state : m_channels)
	{
		if(state.m_enabled)
			return true;
	}
	return false;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Mutation

/**
	@brief Records new regulation settings. A value set for the previous mode no longer applies.
 */
void InstrumentState::CommitOutputMode(size_t chan, const OutputSettings& settings)
{
	auto& state = GetMutableChannel(chan);
	if(state.m_output.mode != settings.mode)
	{
		state.m_outputValue = 0;
		state.m_outputValueSet = false;
	}
	state.m_output = settings;
}

void InstrumentState::CommitOutputValue(size_t chan, double value)
{
	auto& state = GetMutableChannel(chan);
	state.m_outputValue = value;
	state.m_outputValueSet = true;
}

/**
	@brief Updates the enabled flag only. Mode, value, and sweep configuration are kept.
 */
void InstrumentState::CommitOutputEnabled(size_t chan, bool enabled)
{
	GetMutableChannel(chan).m_enabled = enabled;
}

void InstrumentState::CommitMeasurementMode(const MeasurementSettings& settings)
{
	m_measurement = settings;
	m_measurementConfigured = true;
}

void InstrumentState::CommitAcquisition(size_t chan, AcquisitionState state)
{
	GetMutableChannel(chan).m_acquisition = state;
}

void InstrumentState::CommitSweepInterval(size_t chan, unsigned int ms)
{
	GetMutableChannel(chan).m_sweepInterval = ms;
}

void InstrumentState::CommitSweepPoints(size_t chan, unsigned int points)
{
	GetMutableChannel(chan).m_sweepPoints = points;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Serialization

string InstrumentState::GetOutputModeName(OutputMode mode)
{
	switch(mode)
	{
		case OUTPUT_SOURCE_VOLTAGE:
			return "source_voltage";

		case OUTPUT_SOURCE_CURRENT:
			return "source_current";

		case OUTPUT_NONE:
		default:
			return "none";
	}
}

string InstrumentState::GetQuantityName(MeasuredQuantity quantity)
{
	switch(quantity)
	{
		case QUANTITY_CURRENT:
			return "current";

		case QUANTITY_RESISTANCE:
			return "resistance";

		case QUANTITY_VOLTAGE:
		default:
			return "voltage";
	}
}

string InstrumentState::GetAcquisitionStateName(AcquisitionState state)
{
	switch(state)
	{
		case ACQ_TRIGGERED_ARMED:
			return "triggered_armed";

		case ACQ_CONTINUOUS_RUNNING:
			return "continuous_running";

		case ACQ_SWEEP_ARMED:
			return "sweep_armed";

		case ACQ_IDLE:
		default:
			return "idle";
	}
}

void InstrumentState::Serialize(YAML::Node& node) const
{
	for(size_t i=0; i<m_channels.size(); i++)
	{
		auto& state = m_channels[i];
		YAML::Node chnode;

		chnode["mode"] = GetOutputModeName(state.m_output.mode);
		if(state.m_output.mode != OUTPUT_NONE)
		{
			chnode["voltagelimit"] = state.m_output.voltageLimit;
			chnode["currentlimit"] = state.m_output.currentLimit;
			chnode["voltagerange"] = state.m_output.voltageRange;
			chnode["currentrange"] = state.m_output.currentRange;
		}
		if(state.m_outputValueSet)
			chnode["value"] = state.m_outputValue;
		chnode["enabled"] = state.m_enabled;
		chnode["acquisition"] = GetAcquisitionStateName(state.m_acquisition);
		chnode["sweepinterval"] = state.m_sweepInterval;
		chnode["sweeppoints"] = state.m_sweepPoints;

		node["state"]["ch" + to_string(i)] = chnode;
	}

	if(m_measurementConfigured)
	{
		YAML::Node meas;
		meas["quantity"] = GetQuantityName(m_measurement.quantity);
		meas["signal"] = (m_measurement.signal == SIGNAL_AC) ? "ac" : "dc";
		meas["range"] = m_measurement.range;
		meas["resolution"] = m_measurement.resolution;
		node["state"]["measurement"] = meas;
	}
}
