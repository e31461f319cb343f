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
	@brief Declaration of InstrumentState
 */

#ifndef InstrumentState_h
#define InstrumentState_h

/**
	@brief What an output channel regulates
 */
enum OutputMode
{
	OUTPUT_NONE,				//Not configured yet
	OUTPUT_SOURCE_VOLTAGE,		//Constant voltage (PSU) or source-voltage-measure-current (SMU)
	OUTPUT_SOURCE_CURRENT		//Constant current (PSU) or source-current-measure-voltage (SMU)
};

/**
	@brief Physical quantity returned by a measurement
 */
enum MeasuredQuantity
{
	QUANTITY_VOLTAGE,
	QUANTITY_CURRENT,
	QUANTITY_RESISTANCE
};

enum SignalType
{
	SIGNAL_DC,
	SIGNAL_AC
};

/**
	@brief Acquisition state machine of a single channel

	IDLE -> TRIGGERED_ARMED -> IDLE for a single read
	IDLE -> CONTINUOUS_RUNNING -> IDLE for free-run acquisition
	IDLE -> SWEEP_ARMED -> IDLE for an array capture
 */
enum AcquisitionState
{
	ACQ_IDLE,
	ACQ_TRIGGERED_ARMED,
	ACQ_CONTINUOUS_RUNNING,
	ACQ_SWEEP_ARMED
};

/**
	@brief Output regulation settings of one channel

	Only the limit for the regulated mode is sent to the instrument: the current limit in source-voltage mode, the
	voltage limit in source-current mode. Range tokens are passed through verbatim (AUTO, R20V, etc).
 */
struct OutputSettings
{
	OutputMode mode;
	double voltageLimit;
	double currentLimit;
	std::string voltageRange;
	std::string currentRange;
};

/**
	@brief Multimeter function settings
 */
struct MeasurementSettings
{
	MeasuredQuantity quantity;
	SignalType signal;
	std::string range;
	std::string resolution;
};

/**
	@brief Last known configuration of a single output channel
 */
class ChannelState
{
public:
	ChannelState();

	bool IsSweepConfigured() const
	{ return (m_sweepInterval > 0) && (m_sweepPoints > 0); }

	OutputSettings m_output;
	double m_outputValue;
	bool m_outputValueSet;
	bool m_enabled;
	AcquisitionState m_acquisition;

	//Sweep configuration, zero means not set
	unsigned int m_sweepInterval;
	unsigned int m_sweepPoints;
};

/**
	@brief In-memory model of everything we've configured on one instrument

	The Can*() predicates are pure and are consulted by drivers before any command goes out. The Commit*() methods
	are called once the instrument has accepted the corresponding commands. Nothing here talks to hardware.

	Not thread safe: each instance belongs to exactly one instrument handle.
 */
class InstrumentState
{
public:
	InstrumentState(size_t nchans = 1);

	void Reset();

	size_t GetChannelCount() const
	{ return m_channels.size(); }

	const ChannelState& GetChannel(size_t chan) const;

	bool HasMeasurementMode() const
	{ return m_measurementConfigured; }

	const MeasurementSettings& GetMeasurementMode() const
	{ return m_measurement; }

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Legality predicates

	bool CanChangeOutputMode(size_t chan) const;
	bool CanSetOutputValue(size_t chan, OutputMode regulated) const;
	bool CanEnableOutput(size_t chan) const;
	bool CanChangeMeasurementMode() const;
	bool CanEnableContinuous(size_t chan) const;
	bool CanRead(size_t chan) const;
	bool CanFetch(size_t chan) const;
	bool CanConfigureSweep(size_t chan) const;
	bool CanStartSweep(size_t chan) const;
	bool IsQuantityMeasurable(size_t chan, MeasuredQuantity quantity) const;

	bool IsAnyContinuousRunning() const;
	bool IsAnyOutputEnabled() const;

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Mutation

	void CommitOutputMode(size_t chan, const OutputSettings& settings);
	void CommitOutputValue(size_t chan, double value);
	void CommitOutputEnabled(size_t chan, bool enabled);
	void CommitMeasurementMode(const MeasurementSettings& settings);
	void CommitAcquisition(size_t chan, AcquisitionState state);
	void CommitSweepInterval(size_t chan, unsigned int ms);
	void CommitSweepPoints(size_t chan, unsigned int points);

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Serialization

	void Serialize(YAML::Node& node) const;

	static std::string GetOutputModeName(OutputMode mode);
	static std::string GetQuantityName(MeasuredQuantity quantity);
	static std::string GetAcquisitionStateName(AcquisitionState state);

protected:
	ChannelState& GetMutableChannel(size_t chan);

	std::vector<ChannelState> m_channels;

	bool m_measurementConfigured;
	MeasurementSettings m_measurement;
};

#endif
