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
	@brief Tests for InstrumentSession open / teardown behavior
 */

#include "benchhal.h"
#include "FakeSCPITransport.h"

#include <algorithm>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace std;
using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::Not;

typedef InstrumentSession<KeysightU3606SupplyMultimeter> SupplySession;
typedef InstrumentSession<KeysightU2723SourceMeasureUnit> SMUSession;

class InstrumentSessionTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		m_psuLink.defaultReplies["*IDN?"] = "Keysight Technologies,U3606B,MY12345678,1.02";
		m_smuLink.defaultReplies["*IDN?"] = "Agilent Technologies,U2723A,MY51230001,A.01.02";
	}

	KeysightU3606Configuration SupplyConfig()
	{
		KeysightU3606Configuration config;
		config.serial = "MY12345678";
		config.hasOutput = true;
		config.output = KeysightU3606SupplyMultimeter::GetDefaultOutputSettings(OUTPUT_SOURCE_VOLTAGE);
		config.outputValue = 3.6;
		config.hasMeasurement = true;
		config.measurement = KeysightU3606SupplyMultimeter::GetDefaultMeasurementSettings(QUANTITY_CURRENT);
		return config;
	}

	KeysightU2723Configuration SMUConfig()
	{
		KeysightU2723Configuration config;
		config.channels[0].hasOutput = true;
		config.channels[0].output = KeysightU2723SourceMeasureUnit::GetDefaultOutputSettings(OUTPUT_SOURCE_VOLTAGE);
		config.channels[0].outputValue = 3.6;
		config.channels[1].hasOutput = true;
		config.channels[1].output = KeysightU2723SourceMeasureUnit::GetDefaultOutputSettings(OUTPUT_SOURCE_CURRENT);
		config.channels[1].outputValue = 0.01;
		return config;
	}

	FakeInstrumentLink m_psuLink;
	FakeInstrumentLink m_smuLink;
};

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Normal lifecycle

TEST_F(InstrumentSessionTest, NoOpLifecycleLeavesOutputsDisabled)
{
	SupplySession session(new FakeSCPITransport(m_psuLink), SupplyConfig());
	session.Open();
	ASSERT_TRUE(session.IsOpen());
	session.Close();

	EXPECT_THAT(m_psuLink.sent, ElementsAre(
		"*IDN?",
		"OUTP:STAT OFF",
		"SOUR:CURR:LIM 1.0",
		"SOUR:VOLT:RANG AUTO",
		"SOUR:VOLT:LEV:IMM:AMPL 3.6",
		"CONF:CURR:DC AUTO, MIN",
		"OUTP:STAT OFF",
		"SYST:ERR?",
		"*rst; status:preset; *cls",
		"*CLS"));

	EXPECT_FALSE(session.IsOpen());
	EXPECT_TRUE(m_psuLink.transportDestroyed);
	EXPECT_THROW(session.GetDriver(), InvalidStateError);
}

TEST_F(InstrumentSessionTest, OpenLeavesSupplyOutputDisabled)
{
	SupplySession session(new FakeSCPITransport(m_psuLink), SupplyConfig());
	session.Open();

	auto& state = session.GetDriver().GetState().GetChannel(0);
	EXPECT_FALSE(state.m_enabled);
	EXPECT_EQ(OUTPUT_SOURCE_VOLTAGE, state.m_output.mode);
	EXPECT_DOUBLE_EQ(3.6, state.m_outputValue);

	//Configuration is the last thing sent by Open()
	EXPECT_EQ("CONF:CURR:DC AUTO, MIN", m_psuLink.sent.back());
	EXPECT_THAT(m_psuLink.sent, Not(Contains("OUTP:STAT ON")));

	session.Close();
	EXPECT_THAT(m_psuLink.sent, Not(Contains("OUTP:STAT ON")));
}

TEST_F(InstrumentSessionTest, OpenLeavesSMUOutputsDisabled)
{
	SMUSession session(new FakeSCPITransport(m_smuLink), SMUConfig());
	session.Open();

	auto& smu = session.GetDriver();
	for(size_t i=0; i<3; i++)
		EXPECT_FALSE(smu.GetState().GetChannel(i).m_enabled);
	EXPECT_EQ(OUTPUT_SOURCE_VOLTAGE, smu.GetState().GetChannel(0).m_output.mode);
	EXPECT_EQ(OUTPUT_SOURCE_CURRENT, smu.GetState().GetChannel(1).m_output.mode);
	EXPECT_EQ(OUTPUT_NONE, smu.GetState().GetChannel(2).m_output.mode);

	EXPECT_EQ("SOUR:CURR:LEV:IMM:AMPL 0.01, (@2)", m_smuLink.sent.back());

	session.Close();

	EXPECT_THAT(m_smuLink.sent, Not(Contains("OUTP 1, (@1)")));
	EXPECT_THAT(m_smuLink.sent, Not(Contains("OUTP 1, (@2)")));
	EXPECT_THAT(m_smuLink.sent, Not(Contains("OUTP 1, (@3)")));

	//Baseline at open plus teardown
	EXPECT_EQ(2u, m_smuLink.CountSent("OUTP 0, (@3)"));
	EXPECT_TRUE(m_smuLink.transportDestroyed);
}

TEST_F(InstrumentSessionTest, RunTearsDownAfterBody)
{
	m_psuLink.QueueReply("READ?", "+1.200000E-02");
	m_psuLink.QueueReply("READ?", "+1.500000E-02");

	vector<double> readings;
	SupplySession session(new FakeSCPITransport(m_psuLink), SupplyConfig());
	session.Run([&readings](KeysightU3606SupplyMultimeter& psu)
		{
			psu.EnableDCOutput();
			readings.push_back(psu.Read());
			psu.SetDCSupplyOutputVoltage(5.0);
			readings.push_back(psu.Read());
		});

	EXPECT_THAT(readings, ElementsAre(0.012, 0.015));
	EXPECT_EQ("OUTP:STAT OFF", m_psuLink.sent[m_psuLink.sent.size() - 4]);
	EXPECT_TRUE(m_psuLink.transportDestroyed);

	//Already closed
	session.Close();
}

TEST_F(InstrumentSessionTest, SMUChannelScenario)
{
	SMUSession session(new FakeSCPITransport(m_smuLink), SMUConfig());
	session.Run([](KeysightU2723SourceMeasureUnit& smu)
		{
			smu.EnableChannel(0);
			EXPECT_TRUE(smu.GetState().GetChannel(0).m_enabled);
			EXPECT_FALSE(smu.GetState().GetChannel(1).m_enabled);
		});

	auto& sent = m_smuLink.sent;
	auto enable = find(sent.begin(), sent.end(), "OUTP 1, (@1)");
	ASSERT_NE(sent.end(), enable);
	EXPECT_NE(sent.end(), find(enable, sent.end(), "OUTP 0, (@1)"));
}

TEST_F(InstrumentSessionTest, ContinuousStoppedBeforeOutputs)
{
	m_psuLink.QueueReply("FETC?", "+1.000000E-03");

	SupplySession session(new FakeSCPITransport(m_psuLink), SupplyConfig());
	session.Open();
	session.GetDriver().EnableDCOutput();
	session.GetDriver().EnableContinuousMode();
	session.GetDriver().Fetch();
	size_t mark = m_psuLink.sent.size();
	session.Close();

	EXPECT_THAT(m_psuLink.SentSince(mark), ElementsAre(
		"INIT:CONT OFF",
		"OUTP:STAT OFF",
		"SYST:ERR?",
		"*rst; status:preset; *cls",
		"*CLS"));
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Failure paths

TEST_F(InstrumentSessionTest, CommunicationErrorStillTearsDown)
{
	SupplySession session(new FakeSCPITransport(m_psuLink), SupplyConfig());

	//No scripted reply to READ?, so it times out
	EXPECT_THROW(
		session.Run([](KeysightU3606SupplyMultimeter& psu)
			{
				psu.EnableDCOutput();
				psu.Read();
			}),
		CommunicationError);

	auto& sent = m_psuLink.sent;
	auto read = find(sent.begin(), sent.end(), "READ?");
	ASSERT_NE(sent.end(), read);
	EXPECT_NE(sent.end(), find(read, sent.end(), "OUTP:STAT OFF"));
	EXPECT_EQ("*CLS", sent.back());
	EXPECT_FALSE(session.IsOpen());
	EXPECT_TRUE(m_psuLink.transportDestroyed);
}

TEST_F(InstrumentSessionTest, BodyErrorWinsOverTeardownError)
{
	m_psuLink.failingCommands.insert("*CLS");

	SupplySession session(new FakeSCPITransport(m_psuLink), SupplyConfig());
	EXPECT_THROW(
		session.Run([](KeysightU3606SupplyMultimeter& psu)
			{
				psu.Fetch();
			}),
		InvalidStateError);
	EXPECT_FALSE(session.IsOpen());
}

TEST_F(InstrumentSessionTest, TeardownIsBestEffort)
{
	m_smuLink.failingCommands.insert("OUTP 0, (@1)");

	auto config = SMUConfig();
	config.channels[0].hasOutput = false;

	SMUSession session(new FakeSCPITransport(m_smuLink), config);

	//The baseline disable at open fails on the first channel, which triggers teardown
	EXPECT_THROW(session.Open(), CommunicationError);
	EXPECT_FALSE(session.IsOpen());

	//Teardown retried channel 1 and still went on to the others
	EXPECT_EQ(2u, m_smuLink.CountSent("OUTP 0, (@1)"));
	EXPECT_EQ(1u, m_smuLink.CountSent("OUTP 0, (@2)"));
	EXPECT_EQ(1u, m_smuLink.CountSent("OUTP 0, (@3)"));
	EXPECT_EQ(1u, m_smuLink.CountSent("SYST:ERR?"));
	EXPECT_EQ(1u, m_smuLink.CountSent("*rst; status:preset; *cls"));
	EXPECT_TRUE(m_smuLink.transportDestroyed);
}

TEST_F(InstrumentSessionTest, CloseRethrowsFirstTeardownFailure)
{
	SMUSession session(new FakeSCPITransport(m_smuLink), SMUConfig());
	session.Open();
	session.GetDriver().EnableChannel(1);
	m_smuLink.failingCommands.insert("OUTP 0, (@2)");

	EXPECT_THROW(session.Close(), CommunicationError);

	EXPECT_EQ(2u, m_smuLink.CountSent("OUTP 0, (@2)"));
	EXPECT_EQ(2u, m_smuLink.CountSent("OUTP 0, (@3)"));
	EXPECT_EQ(1u, m_smuLink.CountSent("SYST:ERR?"));
	EXPECT_EQ(1u, m_smuLink.CountSent("*CLS"));
	EXPECT_FALSE(session.IsOpen());

	//Teardown only runs once
	session.Close();
	EXPECT_EQ(1u, m_smuLink.CountSent("*CLS"));
}

TEST_F(InstrumentSessionTest, InvalidConfigurationSendsNothing)
{
	auto config = SupplyConfig();
	config.outputValue = 40;

	{
		SupplySession session(new FakeSCPITransport(m_psuLink), config);
		EXPECT_THROW(session.Open(), ConfigurationError);
		EXPECT_THAT(m_psuLink.sent, IsEmpty());
	}
	EXPECT_TRUE(m_psuLink.transportDestroyed);
}

TEST_F(InstrumentSessionTest, SerialMismatchIsConfigurationError)
{
	auto config = SupplyConfig();
	config.serial = "MY00000000";

	SupplySession session(new FakeSCPITransport(m_psuLink), config);
	EXPECT_THROW(session.Open(), ConfigurationError);
	EXPECT_THAT(m_psuLink.sent, ElementsAre("*IDN?"));
	EXPECT_TRUE(m_psuLink.transportDestroyed);
	EXPECT_FALSE(session.IsOpen());
}

TEST_F(InstrumentSessionTest, ApplyFailureTearsDown)
{
	m_psuLink.failingCommands.insert("SOUR:VOLT:LEV:IMM:AMPL 3.6");

	SupplySession session(new FakeSCPITransport(m_psuLink), SupplyConfig());
	EXPECT_THROW(session.Open(), CommunicationError);
	EXPECT_EQ("*CLS", m_psuLink.sent.back());
	EXPECT_FALSE(session.IsOpen());
}

TEST_F(InstrumentSessionTest, OpenOnlyOnce)
{
	SupplySession session(new FakeSCPITransport(m_psuLink), SupplyConfig());
	session.Open();
	EXPECT_THROW(session.Open(), InvalidStateError);
	session.Close();
	EXPECT_THROW(session.Open(), InvalidStateError);
}

TEST_F(InstrumentSessionTest, DestructorTearsDownOpenSession)
{
	{
		SupplySession session(new FakeSCPITransport(m_psuLink), SupplyConfig());
		session.Open();
		session.GetDriver().EnableDCOutput();
	}

	EXPECT_EQ("OUTP:STAT ON", m_psuLink.sent[m_psuLink.sent.size() - 5]);
	EXPECT_EQ("OUTP:STAT OFF", m_psuLink.sent[m_psuLink.sent.size() - 4]);
	EXPECT_TRUE(m_psuLink.transportDestroyed);
}
