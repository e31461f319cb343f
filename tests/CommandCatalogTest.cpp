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
	@brief Tests for CommandCatalog translation and reply parsing
 */

#include "benchhal.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace std;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

typedef CommandCatalog::Arguments Args;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Translation

TEST(CommandCatalogTest, U3606ConstantVoltageSelectsLimitThenRange)
{
	CommandCatalog catalog(CommandCatalog::PROFILE_U3606);

	auto cmds = catalog.Translate(
		CommandCatalog::OP_SELECT_SOURCE_VOLTAGE,
		Args{{"ilimit", "1.0"}, {"vlimit", "30.0"}, {"vrange", "AUTO"}, {"irange", "AUTO"}});

	EXPECT_THAT(cmds, ElementsAre("SOUR:CURR:LIM 1.0", "SOUR:VOLT:RANG AUTO"));
}

TEST(CommandCatalogTest, U3606ConstantCurrentSelectsLimitThenRange)
{
	CommandCatalog catalog(CommandCatalog::PROFILE_U3606);

	auto cmds = catalog.Translate(
		CommandCatalog::OP_SELECT_SOURCE_CURRENT,
		Args{{"ilimit", "1.0"}, {"vlimit", "30.0"}, {"vrange", "AUTO"}, {"irange", "DEF"}});

	EXPECT_THAT(cmds, ElementsAre("SOUR:VOLT:LIM 30.0", "SOUR:CURR:RANG DEF"));
}

TEST(CommandCatalogTest, U3606OutputAndMultimeterCommands)
{
	CommandCatalog catalog(CommandCatalog::PROFILE_U3606);

	EXPECT_THAT(catalog.Translate(CommandCatalog::OP_SET_OUTPUT_VOLTAGE, Args{{"value", "3.6"}}),
		ElementsAre("SOUR:VOLT:LEV:IMM:AMPL 3.6"));
	EXPECT_THAT(catalog.Translate(CommandCatalog::OP_SET_OUTPUT_CURRENT, Args{{"value", "0.5"}}),
		ElementsAre("SOUR:CURR:LEV:IMM:AMPL 0.5"));
	EXPECT_THAT(catalog.Translate(CommandCatalog::OP_ENABLE_OUTPUT), ElementsAre("OUTP:STAT ON"));
	EXPECT_THAT(catalog.Translate(CommandCatalog::OP_DISABLE_OUTPUT), ElementsAre("OUTP:STAT OFF"));
	EXPECT_THAT(catalog.Translate(CommandCatalog::OP_SET_VOLTAGE_PROTECTION, Args{{"value", "12.0"}}),
		ElementsAre("VOLT:PROT 12.0 V"));
	EXPECT_THAT(catalog.Translate(CommandCatalog::OP_SET_CURRENT_PROTECTION, Args{{"value", "0.25"}}),
		ElementsAre("CURR:PROT 0.25 A"));

	auto meter = Args{{"signal", "DC"}, {"range", "AUTO"}, {"resolution", "MIN"}};
	EXPECT_THAT(catalog.Translate(CommandCatalog::OP_CONFIGURE_CURRENT, meter), ElementsAre("CONF:CURR:DC AUTO, MIN"));
	EXPECT_THAT(catalog.Translate(CommandCatalog::OP_CONFIGURE_VOLTAGE, meter), ElementsAre("CONF:VOLT:DC AUTO, MIN"));
	EXPECT_THAT(catalog.Translate(CommandCatalog::OP_CONFIGURE_RESISTANCE, meter), ElementsAre("CONF:RES AUTO, MIN"));
	EXPECT_THAT(catalog.Translate(CommandCatalog::OP_MEASURE_VOLTAGE, meter), ElementsAre("MEAS:VOLT:DC? AUTO, MIN"));
	EXPECT_THAT(catalog.Translate(CommandCatalog::OP_MEASURE_RESISTANCE, meter), ElementsAre("MEAS:RES? AUTO, MIN"));

	EXPECT_THAT(catalog.Translate(CommandCatalog::OP_ENABLE_CONTINUOUS), ElementsAre("INIT:CONT ON"));
	EXPECT_THAT(catalog.Translate(CommandCatalog::OP_DISABLE_CONTINUOUS), ElementsAre("INIT:CONT OFF"));
	EXPECT_THAT(catalog.Translate(CommandCatalog::OP_READ), ElementsAre("READ?"));
	EXPECT_THAT(catalog.Translate(CommandCatalog::OP_FETCH), ElementsAre("FETC?"));
	EXPECT_THAT(catalog.Translate(CommandCatalog::OP_RESET), ElementsAre("*rst; status:preset; *cls"));
	EXPECT_THAT(catalog.Translate(CommandCatalog::OP_IDENTIFY), ElementsAre("*IDN?"));
}

TEST(CommandCatalogTest, U2723SelectsRangesBeforeLimit)
{
	CommandCatalog catalog(CommandCatalog::PROFILE_U2723);
	auto args = Args{{"chan", "2"}, {"vrange", "R20V"}, {"irange", "R120mA"}, {"ilimit", "0.1"}, {"vlimit", "5.0"}};

	EXPECT_THAT(catalog.Translate(CommandCatalog::OP_SELECT_SOURCE_VOLTAGE, args),
		ElementsAre(
			"SOUR:VOLT:RANG R20V, (@2)",
			"SOUR:CURR:RANG R120mA, (@2)",
			"SOUR:CURR:LIM 0.1, (@2)"));

	EXPECT_THAT(catalog.Translate(CommandCatalog::OP_SELECT_SOURCE_CURRENT, args),
		ElementsAre(
			"SOUR:VOLT:RANG R20V, (@2)",
			"SOUR:CURR:RANG R120mA, (@2)",
			"SOUR:VOLT:LIM 5.0, (@2)"));
}

TEST(CommandCatalogTest, U2723ChannelCommands)
{
	CommandCatalog catalog(CommandCatalog::PROFILE_U2723);

	EXPECT_THAT(catalog.Translate(CommandCatalog::OP_SET_OUTPUT_VOLTAGE, Args{{"chan", "1"}, {"value", "3.6"}}),
		ElementsAre("SOUR:VOLT:LEV:IMM:AMPL 3.6, (@1)"));
	EXPECT_THAT(catalog.Translate(CommandCatalog::OP_ENABLE_OUTPUT, Args{{"chan", "3"}}),
		ElementsAre("OUTP 1, (@3)"));
	EXPECT_THAT(catalog.Translate(CommandCatalog::OP_DISABLE_OUTPUT, Args{{"chan", "3"}}),
		ElementsAre("OUTP 0, (@3)"));
	EXPECT_THAT(catalog.Translate(CommandCatalog::OP_SET_SWEEP_INTERVAL, Args{{"chan", "1"}, {"interval", "40"}}),
		ElementsAre("SENS:SWE:TINT 40, (@1)"));
	EXPECT_THAT(catalog.Translate(CommandCatalog::OP_SET_SWEEP_POINTS, Args{{"chan", "1"}, {"points", "150"}}),
		ElementsAre("SENS:SWE:POIN 150, (@1)"));
	EXPECT_THAT(catalog.Translate(CommandCatalog::OP_MEASURE_CURRENT, Args{{"chan", "2"}}),
		ElementsAre("MEAS:SCAL:CURR? (@2)"));
	EXPECT_THAT(catalog.Translate(CommandCatalog::OP_MEASURE_CURRENT_ARRAY, Args{{"chan", "1"}}),
		ElementsAre("MEAS:ARR:CURR? (@1)"));
	EXPECT_THAT(catalog.Translate(CommandCatalog::OP_QUERY_VOLTAGE_APERTURE, Args{{"chan", "1"}}),
		ElementsAre("SENS:VOLT:APER? (@1)"));
}

TEST(CommandCatalogTest, U3606OutputFunctions)
{
	CommandCatalog catalog(CommandCatalog::PROFILE_U3606);

	EXPECT_THAT(catalog.Translate(CommandCatalog::OP_CONFIGURE_VOLTAGE_RAMP, Args{{"value", "5.0"}, {"steps", "50"}}),
		ElementsAre("VOLT:RAMP 5.0", "VOLT:RAMP:STEP 50"));
	EXPECT_THAT(catalog.Translate(
			CommandCatalog::OP_CONFIGURE_CURRENT_SCAN,
			Args{{"value", "0.5"}, {"steps", "10"}, {"dwell", "2.0"}}),
		ElementsAre("CURR:SCAN 0.5", "CURR:SCAN:STEP 10", "CURR:SCAN:DWEL 2.0"));
	EXPECT_THAT(catalog.Translate(
			CommandCatalog::OP_CONFIGURE_SQUARE_WAVE,
			Args{{"amplitude", "5.0"}, {"frequency", "600.0"}, {"duty", "50.0"}, {"width", "0.000833"}}),
		ElementsAre("SQU:AMPL 5.0", "SQU:FREQ 600.0", "SQU:DCYC 50.0", "SQU:PWID 0.000833"));
	EXPECT_THAT(catalog.Translate(CommandCatalog::OP_SET_SOFT_START_STEPS, Args{{"steps", "1"}}),
		ElementsAre("SST:STEP 1"));
	EXPECT_THAT(catalog.Translate(CommandCatalog::OP_RESET_LOG_INDEX), ElementsAre("LOG:LOAD DATA"));
	EXPECT_THAT(catalog.Translate(CommandCatalog::OP_QUERY_QUESTIONABLE_CONDITION), ElementsAre("STAT:QUES:COND?"));
}

TEST(CommandCatalogTest, U2723TriggerAndMemoryListCommands)
{
	CommandCatalog catalog(CommandCatalog::PROFILE_U2723);

	EXPECT_THAT(catalog.Translate(CommandCatalog::OP_SET_TRIGGER_VOLTAGE, Args{{"chan", "1"}, {"value", "2.5"}}),
		ElementsAre("SOUR:VOLT:TRIG 2.5, (@1)"));
	EXPECT_THAT(catalog.Translate(CommandCatalog::OP_INITIATE_TRANSIENT, Args{{"chan", "2"}}),
		ElementsAre("INIT:TRAN (@2)"));
	EXPECT_THAT(catalog.Translate(CommandCatalog::OP_BEGIN_MEMORY_LIST, Args{{"chan", "3"}, {"list", "2"}}),
		ElementsAre("MEM:LIST 2, (@3)", "MEM:LIST:CLEAR (@3)"));
	EXPECT_THAT(catalog.Translate(CommandCatalog::OP_MEMORY_DELAY, Args{{"chan", "1"}, {"delay", "20"}}),
		ElementsAre("MEM:SOUR:DEL SING,20,(@1)"));
	EXPECT_THAT(catalog.Translate(
			CommandCatalog::OP_MEMORY_LOOP,
			Args{{"chan", "1"}, {"start", "1"}, {"end", "8"}, {"loops", "3"}}),
		ElementsAre("MEM:CONF:POIN 1,8,3,(@1)"));
	EXPECT_THAT(catalog.Translate(CommandCatalog::OP_QUERY_OPERATION_CONDITION), ElementsAre("STAT:OPER:COND?"));
}

TEST(CommandCatalogTest, UnsupportedOperationIsInvalidState)
{
	CommandCatalog smu(CommandCatalog::PROFILE_U2723);
	EXPECT_FALSE(smu.Supports(CommandCatalog::OP_FETCH));
	EXPECT_THROW(smu.Translate(CommandCatalog::OP_FETCH), InvalidStateError);

	CommandCatalog psu(CommandCatalog::PROFILE_U3606);
	EXPECT_FALSE(psu.Supports(CommandCatalog::OP_MEASURE_CURRENT_ARRAY));
	try
	{
		psu.Translate(CommandCatalog::OP_SET_SWEEP_POINTS, Args{{"chan", "1"}, {"points", "10"}});
		FAIL() << "sweep on a U3606 should have been rejected";
	}
	catch(const InvalidStateError& e)
	{
		EXPECT_THAT(e.what(), HasSubstr("Keysight U3606"));
		EXPECT_THAT(e.what(), HasSubstr("set sweep points"));
	}

	//Each model's extra subsystems stay on that model
	EXPECT_THROW(smu.Translate(CommandCatalog::OP_CONFIGURE_VOLTAGE_RAMP, Args{{"value", "1.0"}, {"steps", "1"}}),
		InvalidStateError);
	EXPECT_THROW(psu.Translate(CommandCatalog::OP_BEGIN_MEMORY_LIST, Args{{"chan", "1"}, {"list", "1"}}),
		InvalidStateError);
	EXPECT_FALSE(psu.Supports(CommandCatalog::OP_QUERY_OPERATION_CONDITION));
	EXPECT_FALSE(smu.Supports(CommandCatalog::OP_SELECT_CALC_FUNCTION));
}

TEST(CommandCatalogTest, MissingPlaceholderIsConfigurationError)
{
	CommandCatalog catalog(CommandCatalog::PROFILE_U2723);
	EXPECT_THROW(catalog.Translate(CommandCatalog::OP_ENABLE_OUTPUT), ConfigurationError);
}

TEST(CommandCatalogTest, NumbersUseShortestRoundTripForm)
{
	EXPECT_EQ("5.0", CommandCatalog::FormatValue(5));
	EXPECT_EQ("3.6", CommandCatalog::FormatValue(3.6));
	EXPECT_EQ("0.01", CommandCatalog::FormatValue(0.01));
	EXPECT_EQ("0.0001", CommandCatalog::FormatValue(0.0001));
	EXPECT_EQ("1e-05", CommandCatalog::FormatValue(0.00001));
	EXPECT_EQ("-0.12", CommandCatalog::FormatValue(-0.12));
	EXPECT_EQ("30.0", CommandCatalog::FormatValue(30));
	EXPECT_EQ("0.0", CommandCatalog::FormatValue(0));
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Parsing

TEST(CommandCatalogTest, ParseScalarAcceptsInstrumentFormats)
{
	EXPECT_DOUBLE_EQ(3.6, CommandCatalog::ParseScalar("+3.600000E+00\n"));
	EXPECT_DOUBLE_EQ(-0.0012, CommandCatalog::ParseScalar("-1.2E-03"));
	EXPECT_DOUBLE_EQ(42, CommandCatalog::ParseScalar("  42 "));
}

TEST(CommandCatalogTest, ParseScalarRejectsGarbage)
{
	EXPECT_THROW(CommandCatalog::ParseScalar(""), CommunicationError);
	EXPECT_THROW(CommandCatalog::ParseScalar("   \n"), CommunicationError);
	EXPECT_THROW(CommandCatalog::ParseScalar("3.6V"), CommunicationError);
	EXPECT_THROW(CommandCatalog::ParseScalar("overload"), CommunicationError);
}

TEST(CommandCatalogTest, ParseArrayPreservesOrder)
{
	EXPECT_THAT(CommandCatalog::ParseArray("+1.0E-03,+2.0E-03,+3.0E-03"), ElementsAre(0.001, 0.002, 0.003));
	EXPECT_THAT(CommandCatalog::ParseArray("5"), ElementsAre(5.0));
}

TEST(CommandCatalogTest, ParseArrayRejectsEmptyFields)
{
	EXPECT_THROW(CommandCatalog::ParseArray(""), CommunicationError);
	EXPECT_THROW(CommandCatalog::ParseArray("1.0,,2.0"), CommunicationError);
	EXPECT_THROW(CommandCatalog::ParseArray("1.0,2.0,"), CommunicationError);
}

TEST(CommandCatalogTest, ParseIntegerAcceptsSignedRegisters)
{
	EXPECT_EQ(1280, CommandCatalog::ParseInteger("+1280\n"));
	EXPECT_EQ(0, CommandCatalog::ParseInteger("+0"));
	EXPECT_EQ(-3, CommandCatalog::ParseInteger("-3"));
	EXPECT_THROW(CommandCatalog::ParseInteger(""), CommunicationError);
	EXPECT_THROW(CommandCatalog::ParseInteger("+"), CommunicationError);
	EXPECT_THROW(CommandCatalog::ParseInteger("12.5"), CommunicationError);
	EXPECT_THROW(CommandCatalog::ParseInteger("+-4"), CommunicationError);
}

TEST(CommandCatalogTest, ParseFlagAndText)
{
	EXPECT_TRUE(CommandCatalog::ParseFlag("1"));
	EXPECT_TRUE(CommandCatalog::ParseFlag("ON\n"));
	EXPECT_FALSE(CommandCatalog::ParseFlag("+0"));
	EXPECT_FALSE(CommandCatalog::ParseFlag("OFF"));
	EXPECT_THROW(CommandCatalog::ParseFlag("2"), CommunicationError);

	EXPECT_EQ("+0,\"No error\"", CommandCatalog::ParseText("+0,\"No error\"\n"));
	EXPECT_THROW(CommandCatalog::ParseText(" "), CommunicationError);
}
