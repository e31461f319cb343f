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
	@brief Declaration of SourceMeasureInstrument
 */

#ifndef SourceMeasureInstrument_h
#define SourceMeasureInstrument_h

/**
	@brief Fixed limits and accepted range tokens of one instrument model
 */
struct SourceCapabilities
{
	//Limits on source values, in native units
	double minVoltage;
	double maxVoltage;
	double minCurrent;
	double maxCurrent;

	//Range tokens accepted by the instrument
	std::set<std::string> voltageRanges;
	std::set<std::string> currentRanges;
	std::set<std::string> meterRanges;
	std::set<std::string> meterResolutions;

	//Upper bounds on sweep configuration, zero if the instrument can't sweep
	unsigned int maxSweepInterval;
	unsigned int maxSweepPoints;
};

/**
	@brief Common base for supplies and source-measure units controlled through a CommandCatalog

	Every operation follows the same sequence: check the request against the InstrumentState, translate it through
	the catalog, send it, then commit the new state. Errors raised before sending leave both the instrument and the
	model untouched.

	Channel indexes are zero based. Drivers expose the operations under their own names.
 */
class SourceMeasureInstrument : public SCPIInstrument
{
public:
	SourceMeasureInstrument(
		SCPITransport* transport,
		CommandCatalog::Profile profile,
		const SourceCapabilities& caps,
		size_t nchans);
	virtual ~SourceMeasureInstrument();

	const InstrumentState& GetState() const
	{ return m_state; }

	const CommandCatalog& GetCatalog() const
	{ return m_catalog; }

	const SourceCapabilities& GetCapabilities() const
	{ return m_caps; }

	std::string GetChannelName(size_t chan) const;

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Teardown steps, in the order a session runs them

	bool IsContinuousRunning(size_t chan) const;
	void StopContinuous(size_t chan);
	void ForceOutputOff(size_t chan);
	std::string QueryErrorQueue();
	void ResetToDefaults();

	///@brief Forgets everything configured so far, without talking to the instrument
	void ResetState()
	{ m_state.Reset(); }

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Housekeeping

	void ClearStatus();
	bool IsOperationComplete();
	void WaitForCompletion();
	bool Calibrate();

protected:

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Validated operations

	void DoSetOutputMode(size_t chan, const OutputSettings& settings);
	void DoSetOutputValue(size_t chan, OutputMode regulated, double value);
	void DoConfigureOutput(size_t chan, const OutputSettings& settings, double value);
	void DoEnableOutput(size_t chan);
	void DoDisableOutput(size_t chan);
	void DoSetProtection(OutputMode regulated, double value);
	void DoSetTriggerLevel(size_t chan, OutputMode regulated, double value);

	void DoSetMeasurementMode(const MeasurementSettings& settings);
	void DoEnableContinuous(size_t chan);
	void DoDisableContinuous(size_t chan);
	double DoRead(size_t chan);
	double DoFetch(size_t chan);

	void DoSetSweepInterval(size_t chan, unsigned int ms);
	void DoSetSweepPoints(size_t chan, unsigned int points);
	double DoMeasureScalar(size_t chan, MeasuredQuantity quantity, const MeasurementSettings* meter = nullptr);
	std::vector<double> DoMeasureArray(size_t chan, MeasuredQuantity quantity);

	void DoCommand(
		CommandCatalog::Operation op,
		size_t chan = 0,
		const CommandCatalog::Arguments& extra = CommandCatalog::Arguments());

	bool DoQueryFlag(CommandCatalog::Operation op, size_t chan = 0);
	double DoQueryScalar(CommandCatalog::Operation op, size_t chan = 0);
	long DoQueryInteger(CommandCatalog::Operation op, size_t chan = 0);
	std::vector<double> DoQueryArray(CommandCatalog::Operation op, size_t chan = 0);
	std::string DoQueryText(CommandCatalog::Operation op, size_t chan = 0);

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Parameter validation, throws ConfigurationError

public:
	static void ValidateOutputValue(const SourceCapabilities& caps, OutputMode regulated, double value);
	static void ValidateOutputSettings(const SourceCapabilities& caps, const OutputSettings& settings);
	static void ValidateMeasurementSettings(const SourceCapabilities& caps, const MeasurementSettings& settings);

protected:

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Helpers

	void RequireSupported(CommandCatalog::Operation op) const;
	void RequireChannel(size_t chan) const;

	CommandCatalog::Arguments ChannelArguments(size_t chan) const;
	CommandCatalog::Arguments MeterArguments(const MeasurementSettings& settings) const;

	void Execute(CommandCatalog::Operation op, const CommandCatalog::Arguments& args);
	std::string Query(CommandCatalog::Operation op, const CommandCatalog::Arguments& args);

	void DoSerializeConfiguration(YAML::Node& node);

	/**
		@brief Returns a channel to idle when an acquisition leaves scope, whether or not it completed
	 */
	class AcquisitionGuard
	{
	public:
		AcquisitionGuard(InstrumentState& state, size_t chan, AcquisitionState armed)
		: m_state(state)
		, m_chan(chan)
		{ m_state.CommitAcquisition(m_chan, armed); }

		~AcquisitionGuard()
		{ m_state.CommitAcquisition(m_chan, ACQ_IDLE); }

	protected:
		InstrumentState& m_state;
		size_t m_chan;
	};

protected:
	CommandCatalog m_catalog;
	InstrumentState m_state;
	SourceCapabilities m_caps;
};

#endif
