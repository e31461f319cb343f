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
	@brief Tests for loading BenchConfig from YAML
 */

#include "benchhal.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace std;
using ::testing::Contains;
using ::testing::HasSubstr;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Loading

TEST(BenchConfigTest, EmptyDocumentHasNoKeys)
{
	auto config = BenchConfig::LoadString("");
	EXPECT_FALSE(config.HasKey("psu_device"));

	auto psu = config.GetSupplyConfiguration();
	EXPECT_TRUE(psu.serial.empty());
	EXPECT_FALSE(psu.hasOutput);
	EXPECT_FALSE(psu.hasMeasurement);
}

TEST(BenchConfigTest, NullValueCountsAsUnset)
{
	auto config = BenchConfig::LoadString("psu_constant_voltage_output: ~\npsu_device: /dev/usbtmc0\n");
	EXPECT_FALSE(config.HasKey("psu_constant_voltage_output"));
	EXPECT_TRUE(config.HasKey("psu_device"));
	EXPECT_FALSE(config.GetSupplyConfiguration().hasOutput);
}

TEST(BenchConfigTest, MalformedDocumentsAreRejected)
{
	EXPECT_THROW(BenchConfig::LoadString("psu_device: [unterminated"), ConfigurationError);
	EXPECT_THROW(BenchConfig::LoadString("- just\n- a list\n"), ConfigurationError);
	EXPECT_THROW(BenchConfig::LoadFile("/nonexistent/bench.yml"), ConfigurationError);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Power supply / multimeter

TEST(BenchConfigTest, SupplyConstantVoltage)
{
	auto config = BenchConfig::LoadString(
		"psu_serial_no: MY12345678\n"
		"psu_constant_voltage_output: 3.6\n"
		"psu_multimeter_mode: Current\n");

	auto psu = config.GetSupplyConfiguration();
	EXPECT_EQ("MY12345678", psu.serial);
	ASSERT_TRUE(psu.hasOutput);
	EXPECT_EQ(OUTPUT_SOURCE_VOLTAGE, psu.output.mode);
	EXPECT_DOUBLE_EQ(3.6, psu.outputValue);
	EXPECT_DOUBLE_EQ(1, psu.output.currentLimit);

	ASSERT_TRUE(psu.hasMeasurement);
	EXPECT_EQ(QUANTITY_CURRENT, psu.measurement.quantity);
	EXPECT_EQ(SIGNAL_DC, psu.measurement.signal);
	EXPECT_EQ("AUTO", psu.measurement.range);
	EXPECT_EQ("MIN", psu.measurement.resolution);

	EXPECT_NO_THROW(psu.Validate());
}

TEST(BenchConfigTest, SupplyConstantCurrentWithMeterOptions)
{
	auto config = BenchConfig::LoadString(
		"psu_constant_current_output: 0.5\n"
		"psu_multimeter_mode: voltage\n"
		"psu_multimeter_signal: AC\n"
		"psu_multimeter_range: max\n"
		"psu_multimeter_resolution: max\n");

	auto psu = config.GetSupplyConfiguration();
	EXPECT_EQ(OUTPUT_SOURCE_CURRENT, psu.output.mode);
	EXPECT_DOUBLE_EQ(0.5, psu.outputValue);
	EXPECT_EQ(QUANTITY_VOLTAGE, psu.measurement.quantity);
	EXPECT_EQ(SIGNAL_AC, psu.measurement.signal);
	EXPECT_EQ("MAX", psu.measurement.range);
	EXPECT_EQ("MAX", psu.measurement.resolution);
}

TEST(BenchConfigTest, SupplyRejectsBothOutputModes)
{
	auto config = BenchConfig::LoadString(
		"psu_constant_voltage_output: 3.6\n"
		"psu_constant_current_output: 0.5\n");
	EXPECT_THROW(config.GetSupplyConfiguration(), ConfigurationError);
}

TEST(BenchConfigTest, SupplyRejectsUnknownMeterMode)
{
	EXPECT_THROW(BenchConfig::LoadString("psu_multimeter_mode: frequency\n").GetSupplyConfiguration(),
		ConfigurationError);
	EXPECT_THROW(
		BenchConfig::LoadString("psu_multimeter_mode: voltage\npsu_multimeter_signal: rf\n").GetSupplyConfiguration(),
		ConfigurationError);
}

TEST(BenchConfigTest, BadNumberNamesTheKey)
{
	auto config = BenchConfig::LoadString("psu_constant_voltage_output: three\n");
	try
	{
		config.GetSupplyConfiguration();
		FAIL() << "non-numeric output value should have been rejected";
	}
	catch(const ConfigurationError& e)
	{
		EXPECT_THAT(e.what(), HasSubstr("'psu_constant_voltage_output' is not defined or invalid"));
	}
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Source-measure unit

TEST(BenchConfigTest, SourceMeasureChannels)
{
	auto config = BenchConfig::LoadString(
		"smu_serial_no: MY51230001\n"
		"smu_ch_1_source_voltage: 3.6\n"
		"smu_ch_2_source_current: 0.01\n"
		"smu_ch_2_current_range: R10mA\n");

	auto smu = config.GetSourceMeasureConfiguration();
	EXPECT_EQ("MY51230001", smu.serial);
	ASSERT_EQ(3u, smu.channels.size());

	EXPECT_TRUE(smu.channels[0].hasOutput);
	EXPECT_EQ(OUTPUT_SOURCE_VOLTAGE, smu.channels[0].output.mode);
	EXPECT_DOUBLE_EQ(3.6, smu.channels[0].outputValue);
	EXPECT_EQ("R120mA", smu.channels[0].output.currentRange);

	EXPECT_TRUE(smu.channels[1].hasOutput);
	EXPECT_EQ(OUTPUT_SOURCE_CURRENT, smu.channels[1].output.mode);
	EXPECT_DOUBLE_EQ(0.01, smu.channels[1].outputValue);
	EXPECT_EQ("R10mA", smu.channels[1].output.currentRange);

	EXPECT_FALSE(smu.channels[2].hasOutput);

	EXPECT_NO_THROW(smu.Validate());
}

TEST(BenchConfigTest, SourceMeasureRejectsBothModesOnOneChannel)
{
	auto config = BenchConfig::LoadString(
		"smu_ch_3_source_voltage: 1.0\n"
		"smu_ch_3_source_current: 0.001\n");
	try
	{
		config.GetSourceMeasureConfiguration();
		FAIL() << "conflicting channel modes should have been rejected";
	}
	catch(const ConfigurationError& e)
	{
		EXPECT_THAT(e.what(), HasSubstr("smu_ch_3_source_voltage"));
	}
}

TEST(BenchConfigTest, SourceMeasureUnknownRangeFailsValidation)
{
	auto config = BenchConfig::LoadString(
		"smu_ch_1_source_voltage: 1.0\n"
		"smu_ch_1_voltage_range: R200V\n");
	auto smu = config.GetSourceMeasureConfiguration();
	EXPECT_THROW(smu.Validate(), ConfigurationError);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Transports

TEST(BenchConfigTest, UsbtmcTransportIsRegistered)
{
	vector<string> names;
	SCPITransport::EnumTransports(names);
	EXPECT_THAT(names, Contains("usbtmc"));
}

TEST(BenchConfigTest, MissingDeviceIsConfigurationError)
{
	auto config = BenchConfig::LoadString("psu_serial_no: MY12345678\n");
	EXPECT_THROW(config.CreateSupplyTransport(), ConfigurationError);
}

TEST(BenchConfigTest, UnknownTransportIsConfigurationError)
{
	auto config = BenchConfig::LoadString(
		"smu_transport: carrier_pigeon\n"
		"smu_device: /dev/usbtmc1\n");
	EXPECT_THROW(config.CreateSourceMeasureTransport(), ConfigurationError);
}

TEST(BenchConfigTest, UnreachableDeviceGivesDisconnectedTransport)
{
	auto config = BenchConfig::LoadString("psu_device: /nonexistent/usbtmc99\n");
	unique_ptr<SCPITransport> transport(config.CreateSupplyTransport());
	ASSERT_NE(nullptr, transport);
	EXPECT_FALSE(transport->IsConnected());
	EXPECT_EQ("usbtmc", transport->GetName());
	EXPECT_EQ("/nonexistent/usbtmc99", transport->GetConnectionString());
}
