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
	@brief Tests for the InstrumentState legality predicates
 */

#include "benchhal.h"

#include <gtest/gtest.h>

using namespace std;

class InstrumentStateTest : public ::testing::Test
{
protected:
	InstrumentStateTest()
		: m_state(3)
	{}

	OutputSettings Settings(OutputMode mode)
	{
		OutputSettings settings;
		settings.mode = mode;
		settings.voltageLimit = 5;
		settings.currentLimit = 0.1;
		settings.voltageRange = "R20V";
		settings.currentRange = "R120mA";
		return settings;
	}

	InstrumentState m_state;
};

TEST_F(InstrumentStateTest, DefaultsAreSafe)
{
	ASSERT_EQ(3u, m_state.GetChannelCount());
	for(size_t i=0; i<3; i++)
	{
		auto& chan = m_state.GetChannel(i);
		EXPECT_EQ(OUTPUT_NONE, chan.m_output.mode);
		EXPECT_FALSE(chan.m_enabled);
		EXPECT_FALSE(chan.m_outputValueSet);
		EXPECT_EQ(ACQ_IDLE, chan.m_acquisition);
		EXPECT_FALSE(chan.IsSweepConfigured());
	}
	EXPECT_FALSE(m_state.HasMeasurementMode());
	EXPECT_FALSE(m_state.IsAnyOutputEnabled());
	EXPECT_THROW(m_state.GetChannel(3), ConfigurationError);
}

TEST_F(InstrumentStateTest, OutputModeLockedWhileEnabled)
{
	EXPECT_FALSE(m_state.CanEnableOutput(0));

	m_state.CommitOutputMode(0, Settings(OUTPUT_SOURCE_VOLTAGE));
	EXPECT_TRUE(m_state.CanEnableOutput(0));
	EXPECT_TRUE(m_state.CanChangeOutputMode(0));

	m_state.CommitOutputEnabled(0, true);
	EXPECT_FALSE(m_state.CanChangeOutputMode(0));
	EXPECT_TRUE(m_state.CanChangeOutputMode(1));

	m_state.CommitOutputEnabled(0, false);
	EXPECT_TRUE(m_state.CanChangeOutputMode(0));
}

TEST_F(InstrumentStateTest, OutputValueMustMatchMode)
{
	EXPECT_FALSE(m_state.CanSetOutputValue(0, OUTPUT_SOURCE_VOLTAGE));

	m_state.CommitOutputMode(0, Settings(OUTPUT_SOURCE_CURRENT));
	EXPECT_FALSE(m_state.CanSetOutputValue(0, OUTPUT_SOURCE_VOLTAGE));
	EXPECT_TRUE(m_state.CanSetOutputValue(0, OUTPUT_SOURCE_CURRENT));
}

TEST_F(InstrumentStateTest, DisableKeepsConfiguration)
{
	m_state.CommitOutputMode(1, Settings(OUTPUT_SOURCE_VOLTAGE));
	m_state.CommitOutputValue(1, 3.6);
	m_state.CommitSweepInterval(1, 40);
	m_state.CommitSweepPoints(1, 150);
	m_state.CommitOutputEnabled(1, true);
	m_state.CommitOutputEnabled(1, false);

	auto& chan = m_state.GetChannel(1);
	EXPECT_EQ(OUTPUT_SOURCE_VOLTAGE, chan.m_output.mode);
	EXPECT_DOUBLE_EQ(3.6, chan.m_outputValue);
	EXPECT_TRUE(chan.m_outputValueSet);
	EXPECT_TRUE(chan.IsSweepConfigured());
	EXPECT_FALSE(chan.m_enabled);
}

TEST_F(InstrumentStateTest, ModeChangeForgetsValue)
{
	m_state.CommitOutputMode(0, Settings(OUTPUT_SOURCE_VOLTAGE));
	m_state.CommitOutputValue(0, 3.6);

	//Same mode, new limits: value still applies
	m_state.CommitOutputMode(0, Settings(OUTPUT_SOURCE_VOLTAGE));
	EXPECT_TRUE(m_state.GetChannel(0).m_outputValueSet);

	m_state.CommitOutputMode(0, Settings(OUTPUT_SOURCE_CURRENT));
	EXPECT_FALSE(m_state.GetChannel(0).m_outputValueSet);
}

TEST_F(InstrumentStateTest, EnablingOneChannelLeavesOthersAlone)
{
	m_state.CommitOutputMode(0, Settings(OUTPUT_SOURCE_VOLTAGE));
	m_state.CommitOutputMode(1, Settings(OUTPUT_SOURCE_CURRENT));
	m_state.CommitOutputEnabled(0, true);

	EXPECT_TRUE(m_state.GetChannel(0).m_enabled);
	EXPECT_FALSE(m_state.GetChannel(1).m_enabled);
	EXPECT_FALSE(m_state.GetChannel(2).m_enabled);
	EXPECT_TRUE(m_state.IsAnyOutputEnabled());
}

TEST_F(InstrumentStateTest, FetchOnlyWhileContinuous)
{
	EXPECT_FALSE(m_state.CanFetch(0));
	EXPECT_TRUE(m_state.CanRead(0));

	m_state.CommitAcquisition(0, ACQ_CONTINUOUS_RUNNING);
	EXPECT_TRUE(m_state.CanFetch(0));
	EXPECT_FALSE(m_state.CanRead(0));
	EXPECT_TRUE(m_state.CanEnableContinuous(0));
	EXPECT_FALSE(m_state.CanChangeMeasurementMode());
	EXPECT_FALSE(m_state.CanChangeOutputMode(0));
	EXPECT_TRUE(m_state.IsAnyContinuousRunning());

	m_state.CommitAcquisition(0, ACQ_IDLE);
	EXPECT_FALSE(m_state.CanFetch(0));
	EXPECT_TRUE(m_state.CanChangeMeasurementMode());
}

TEST_F(InstrumentStateTest, SweepAndContinuousExcludeEachOther)
{
	EXPECT_FALSE(m_state.CanStartSweep(0));

	m_state.CommitSweepInterval(0, 40);
	EXPECT_FALSE(m_state.CanStartSweep(0));
	m_state.CommitSweepPoints(0, 150);
	EXPECT_TRUE(m_state.CanStartSweep(0));

	m_state.CommitAcquisition(0, ACQ_CONTINUOUS_RUNNING);
	EXPECT_FALSE(m_state.CanStartSweep(0));

	m_state.CommitAcquisition(0, ACQ_SWEEP_ARMED);
	EXPECT_FALSE(m_state.CanEnableContinuous(0));
	EXPECT_FALSE(m_state.CanConfigureSweep(0));
	EXPECT_TRUE(m_state.CanConfigureSweep(1));
}

TEST_F(InstrumentStateTest, MeasurableQuantityFollowsOutputMode)
{
	EXPECT_TRUE(m_state.IsQuantityMeasurable(0, QUANTITY_VOLTAGE));
	EXPECT_TRUE(m_state.IsQuantityMeasurable(0, QUANTITY_CURRENT));

	m_state.CommitOutputMode(0, Settings(OUTPUT_SOURCE_VOLTAGE));
	EXPECT_TRUE(m_state.IsQuantityMeasurable(0, QUANTITY_CURRENT));
	EXPECT_FALSE(m_state.IsQuantityMeasurable(0, QUANTITY_VOLTAGE));

	m_state.CommitOutputMode(1, Settings(OUTPUT_SOURCE_CURRENT));
	EXPECT_TRUE(m_state.IsQuantityMeasurable(1, QUANTITY_VOLTAGE));
	EXPECT_FALSE(m_state.IsQuantityMeasurable(1, QUANTITY_CURRENT));
}

TEST_F(InstrumentStateTest, ResetReturnsToBaseline)
{
	m_state.CommitOutputMode(2, Settings(OUTPUT_SOURCE_CURRENT));
	m_state.CommitOutputEnabled(2, true);
	m_state.CommitAcquisition(2, ACQ_CONTINUOUS_RUNNING);

	MeasurementSettings meter;
	meter.quantity = QUANTITY_CURRENT;
	meter.signal = SIGNAL_DC;
	meter.range = "AUTO";
	meter.resolution = "MIN";
	m_state.CommitMeasurementMode(meter);

	m_state.Reset();

	EXPECT_EQ(3u, m_state.GetChannelCount());
	EXPECT_FALSE(m_state.IsAnyOutputEnabled());
	EXPECT_FALSE(m_state.IsAnyContinuousRunning());
	EXPECT_EQ(OUTPUT_NONE, m_state.GetChannel(2).m_output.mode);
	EXPECT_FALSE(m_state.HasMeasurementMode());
}

TEST_F(InstrumentStateTest, SerializesEveryChannel)
{
	m_state.CommitOutputMode(0, Settings(OUTPUT_SOURCE_VOLTAGE));
	m_state.CommitOutputValue(0, 3.6);
	m_state.CommitOutputEnabled(0, true);

	YAML::Node node;
	m_state.Serialize(node);

	EXPECT_EQ("source_voltage", node["state"]["ch0"]["mode"].as<string>());
	EXPECT_DOUBLE_EQ(3.6, node["state"]["ch0"]["value"].as<double>());
	EXPECT_TRUE(node["state"]["ch0"]["enabled"].as<bool>());
	EXPECT_EQ("none", node["state"]["ch2"]["mode"].as<string>());
	EXPECT_EQ("idle", node["state"]["ch2"]["acquisition"].as<string>());
	EXPECT_FALSE(node["state"]["measurement"].IsDefined());
}
