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
	@brief Declaration of KeysightU2723SourceMeasureUnit
 */

#ifndef KeysightU2723SourceMeasureUnit_h
#define KeysightU2723SourceMeasureUnit_h

/**
	@brief Initial settings of one U2723 channel
 */
struct KeysightU2723ChannelConfiguration
{
	KeysightU2723ChannelConfiguration();

	bool hasOutput;
	OutputSettings output;
	double outputValue;

	//Zero means leave unconfigured
	unsigned int sweepInterval;
	unsigned int sweepPoints;
};

/**
	@brief Initial settings applied to a U2723 when a session opens
 */
struct KeysightU2723Configuration
{
	KeysightU2723Configuration();

	//Expected serial number, empty to accept any
	std::string serial;

	std::vector<KeysightU2723ChannelConfiguration> channels;

	void Validate() const;
};

/**
	@brief Settings shared by every step of a memory list program
 */
struct KeysightU2723MemoryListSettings
{
	KeysightU2723MemoryListSettings();

	//Each channel has two lists, 1 and 2
	unsigned int list;

	std::string voltageRange;
	std::string currentRange;

	//Compliance limits. Programs only send the ones they need.
	double voltageLimit;
	double currentLimit;
};

/**
	@brief Keysight U2723A three channel USB modular source-measure unit

	Each channel either sources voltage and measures current (SVMI) or sources current and measures voltage (SIMV).
	Channels are configured, enabled, and swept independently. Channel indexes are zero based (0 is CH1).
 */
class KeysightU2723SourceMeasureUnit : public SourceMeasureInstrument
{
public:
	KeysightU2723SourceMeasureUnit(SCPITransport* transport);
	virtual ~KeysightU2723SourceMeasureUnit();

	typedef KeysightU2723Configuration ConfigType;

	static const SourceCapabilities& GetModelCapabilities();
	static OutputSettings GetDefaultOutputSettings(OutputMode mode);

	void ApplyConfiguration(const ConfigType& config);

	//Device information
	virtual unsigned int GetInstrumentTypes() const override;
	virtual std::string GetDriverName() const override;

	static std::string GetDriverNameInternal()
	{ return "keysight_u2723"; }

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Source configuration

	void SetOutputMode(size_t chan, OutputMode mode);
	void SetOutputMode(size_t chan, const OutputSettings& settings);
	void ConfigureChannel(size_t chan, OutputMode mode, double value);
	void ConfigureChannel(size_t chan, const OutputSettings& settings, double value);
	void SetSourceVoltage(size_t chan, double volts);
	void SetSourceCurrent(size_t chan, double amps);
	void EnableChannel(size_t chan);
	void DisableChannel(size_t chan);

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Transient trigger system

	void SetTriggerVoltage(size_t chan, double volts);
	void SetTriggerCurrent(size_t chan, double amps);
	void InitiateTransient(size_t chan);
	void AbortTransient(size_t chan);

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Memory lists

	void ProgramSourceVoltageMeasureCurrent(
		size_t chan,
		double volts,
		unsigned int count = 1,
		unsigned int delayMs = 0,
		const KeysightU2723MemoryListSettings& settings = KeysightU2723MemoryListSettings());
	void ProgramSourceCurrentMeasureVoltage(
		size_t chan,
		double amps,
		unsigned int count = 1,
		unsigned int delayMs = 0,
		const KeysightU2723MemoryListSettings& settings = KeysightU2723MemoryListSettings());
	void ProgramCurrentPulse(
		size_t chan,
		double peakAmps,
		double widthMs,
		unsigned int loops = 1,
		const KeysightU2723MemoryListSettings& settings = KeysightU2723MemoryListSettings());
	void ProgramVoltagePulse(
		size_t chan,
		double peakVolts,
		double widthMs,
		unsigned int loops = 1,
		const KeysightU2723MemoryListSettings& settings = KeysightU2723MemoryListSettings());

	void TriggerMemoryList(size_t chan);
	std::vector<double> ReadMemoryListResults(size_t chan);

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Measurement

	void SetSweepInterval(size_t chan, unsigned int ms);
	void SetSweepPoints(size_t chan, unsigned int points);
	void SetSweep(size_t chan, unsigned int ms, unsigned int points);

	double MeasureVoltageScalar(size_t chan);
	double MeasureCurrentScalar(size_t chan);
	std::vector<double> MeasureVoltageArray(size_t chan);
	std::vector<double> MeasureCurrentArray(size_t chan);

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Status queries

	bool IsChannelEnabled(size_t chan);
	double GetVoltageAperture(size_t chan);
	double GetCurrentAperture(size_t chan);

	unsigned int GetOperationCondition();
	bool IsTransientRunning(size_t chan);
	bool IsWaitingForTrigger(size_t chan);

	///@brief Operation condition register bits for CH1. Shift left by the channel index for CH2 and CH3.
	enum OperationBits
	{
		OPER_TRANSIENT_RUNNING		= 0x04,
		OPER_WAITING_FOR_TRIGGER	= 0x20
	};

protected:
	static void ValidateSweep(unsigned int ms, unsigned int points);

	typedef std::pair<CommandCatalog::Operation, CommandCatalog::Arguments> MemoryStep;

	void ValidateMemoryList(size_t chan, const KeysightU2723MemoryListSettings& settings) const;
	void RequireIdle(size_t chan) const;
	void SendMemoryList(size_t chan, unsigned int list, const std::vector<MemoryStep>& steps, unsigned int loops);
	void ProgramSourceMeasure(
		size_t chan,
		OutputMode mode,
		double value,
		unsigned int count,
		unsigned int delayMs,
		const KeysightU2723MemoryListSettings& settings);
	void ProgramPulse(
		size_t chan,
		OutputMode mode,
		double peak,
		double widthMs,
		unsigned int loops,
		const KeysightU2723MemoryListSettings& settings);
};

#endif
