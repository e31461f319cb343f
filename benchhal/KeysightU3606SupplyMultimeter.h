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
	@brief Declaration of KeysightU3606SupplyMultimeter
 */

#ifndef KeysightU3606SupplyMultimeter_h
#define KeysightU3606SupplyMultimeter_h

/**
	@brief Initial settings applied to a U3606 when a session opens
 */
struct KeysightU3606Configuration
{
	KeysightU3606Configuration();

	//Expected serial number, empty to accept any
	std::string serial;

	bool hasOutput;
	OutputSettings output;
	double outputValue;

	bool hasMeasurement;
	MeasurementSettings measurement;

	void Validate() const;
};

/**
	@brief Keysight U3606A/B combined DC power supply and digital multimeter

	The supply output and the multimeter share a single channel (CH1). The multimeter function is independent of the
	output mode, so any quantity may be measured regardless of whether the supply regulates voltage or current.
 */
class KeysightU3606SupplyMultimeter : public SourceMeasureInstrument
{
public:
	KeysightU3606SupplyMultimeter(SCPITransport* transport);
	virtual ~KeysightU3606SupplyMultimeter();

	typedef KeysightU3606Configuration ConfigType;

	///@brief Math functions applied to multimeter readings
	enum CalcFunction
	{
		CALC_AVERAGE,		//Running mean, minimum and maximum
		CALC_DB,			//dB relative to the dB reference
		CALC_DBM,			//dBm into the reference resistance
		CALC_HOLD,			//Capture a stable reading
		CALC_LIMIT,			//Compare against upper / lower limits
		CALC_NULL			//Reading minus the null offset
	};

	///@brief Bits of the questionable data register group
	enum QuestionableBits
	{
		QUES_VOLTAGE_OVERLOAD		= 0x0001,
		QUES_CURRENT_OVERLOAD		= 0x0002,
		QUES_OUTPUT_OVERVOLTAGE		= 0x0004,
		QUES_OUTPUT_OVERCURRENT		= 0x0008,
		QUES_RESISTANCE_OVERLOAD	= 0x0200,
		QUES_LOWER_LIMIT_FAILED		= 0x0800,
		QUES_UPPER_LIMIT_FAILED		= 0x1000,

		QUES_ALL					= 0x1a0f
	};

	static const SourceCapabilities& GetModelCapabilities();
	static OutputSettings GetDefaultOutputSettings(OutputMode mode);
	static MeasurementSettings GetDefaultMeasurementSettings(MeasuredQuantity quantity);

	void ApplyConfiguration(const ConfigType& config);

	//Device information
	virtual unsigned int GetInstrumentTypes() const override;
	virtual std::string GetDriverName() const override;

	static std::string GetDriverNameInternal()
	{ return "keysight_u3606"; }

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// DC supply

	void SetOutputMode(const OutputSettings& settings);
	void ConfigureDCSupply(OutputMode mode, double value);
	void ConfigureDCSupply(const OutputSettings& settings, double value);
	void SetDCSupplyOutputVoltage(double volts);
	void SetDCSupplyOutputCurrent(double amps);
	void EnableDCOutput();
	void DisableDCOutput();
	void SetOverVoltageProtection(double volts);
	void SetOverCurrentProtection(double amps);
	void SetSoftStartSteps(unsigned int steps = 1);

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// DC supply output functions. Each one turns the output off before reprogramming it.

	void ConfigureRamp(OutputMode mode, double endValue, unsigned int steps = 100);
	void ConfigureScan(OutputMode mode, double endValue, unsigned int steps, double dwellSeconds = 2);
	void ConfigureSquareWave(
		double amplitude,
		double frequency = 600,
		double dutyCycle = 50,
		double pulseWidth = 0.000833);

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Multimeter

	void ConfigureMultimeter(MeasuredQuantity quantity, SignalType signal = SIGNAL_DC);
	void ConfigureMultimeter(const MeasurementSettings& settings);
	void EnableContinuousMode();
	void DisableContinuousMode();
	double Read();
	double Fetch();
	double Measure(MeasuredQuantity quantity, SignalType signal = SIGNAL_DC);
	double Measure(const MeasurementSettings& settings);
	void AbortMeasurement();

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Math functions

	void SelectCalcFunction(CalcFunction func);
	CalcFunction GetCalcFunction();
	void EnableCalc();
	void DisableCalc();
	bool IsCalcEnabled();

	double GetCalcAverage();
	double GetCalcMaximum();
	double GetCalcMinimum();
	double GetCalcPresent();

	void SetDbReference(double dbm);
	void SetDbmReference(unsigned int ohms);
	void SetHoldVariation(double percent);
	void SetHoldThreshold(double percent);
	void SetLimits(double upper, double lower);
	void SetNullOffset(double offset);

	static std::string GetCalcFunctionToken(CalcFunction func);

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Data logger

	void EnableDataLogging();
	void DisableDataLogging();
	bool IsDataLogging();
	void DeleteLoggedData();
	void ResetLogIndex();
	std::string ReadLoggedEntry();
	std::vector<std::string> ReadLoggedData();

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Status queries

	bool IsOutputEnabled();
	bool IsContinuousModeEnabled();
	std::string GetMeasurementConfiguration();
	double GetOutputVoltageSetting();
	double GetOutputCurrentSetting();
	double GetVoltageLimitSetting();
	double GetCurrentLimitSetting();
	double GetSensedVoltage();
	double GetSensedCurrent();

	void EnableQuestionableEvents(unsigned int mask);
	unsigned int GetQuestionableEnable();
	unsigned int GetQuestionableEvents();
	unsigned int GetQuestionableCondition();

protected:
	void ValidateOutputFunction(OutputMode mode, double endValue) const;
	void PrepareOutputFunction(OutputMode mode);
	static Unit::UnitType GetFunctionUnit(OutputMode mode);
};

#endif
