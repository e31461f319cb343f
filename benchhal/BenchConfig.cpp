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
	@brief Implementation of BenchConfig
 */

#include "benchhal.h"

#include <ctype.h>

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

BenchConfig::BenchConfig()
	: m_root(YAML::NodeType::Map)
{
}

BenchConfig::BenchConfig(const YAML::Node& root)
	: m_root(root)
{
	if(!m_root.IsMap() && !m_root.IsNull())
		throw ConfigurationError("Bench configuration must be a map of key/value pairs");
}

BenchConfig BenchConfig::LoadFile(const string& path)
{
	YAML::Node root;
	try
	{
		root = YAML::LoadFile(path);
	}
	catch(const YAML::Exception& e)
	{
		LogError("Failed to load %s: %s\n", path.c_str(), e.what());
		throw ConfigurationError("Can't load bench configuration " + path + ": " + e.what());
	}

	LogVerbose("Loaded bench configuration from %s\n", path.c_str());
	return BenchConfig(root);
}

BenchConfig BenchConfig::LoadString(const string& text)
{
	YAML::Node root;
	try
	{
		root = YAML::Load(text);
	}
	catch(const YAML::Exception& e)
	{
		throw ConfigurationError(string("Can't parse bench configuration: ") + e.what());
	}
	return BenchConfig(root);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Raw key access

bool BenchConfig::HasKey(const string& key) const
{
	if(!m_root.IsMap())
		return false;
	auto node = m_root[key];
	return node.IsDefined() && !node.IsNull();
}

string BenchConfig::GetString(const string& key) const
{
	if(!HasKey(key))
		throw ConfigurationError("'" + key + "' is not defined or invalid");

	auto node = m_root[key];
	if(!node.IsScalar())
		throw ConfigurationError("'" + key + "' is not defined or invalid");
	return Trim(node.as<string>());
}

string BenchConfig::GetString(const string& key, const string& defaultValue) const
{
	if(!HasKey(key))
		return defaultValue;
	return GetString(key);
}

double BenchConfig::GetDouble(const string& key) const
{
	if(!HasKey(key))
		throw ConfigurationError("'" + key + "' is not defined or invalid");

	try
	{
		return m_root[key].as<double>();
	}
	catch(const YAML::Exception& e)
	{
		LogDebug("Bad value for %s: %s\n", key.c_str(), e.what());
		throw ConfigurationError("'" + key + "' is not defined or invalid");
	}
}

string BenchConfig::ToLower(const string& str)
{
	string ret;
	for(auto c : str)
		ret += static_cast<char>(tolower(static_cast<unsigned char>(c)));
	return ret;
}

string BenchConfig::ToUpper(const string& str)
{
	string ret;
	for(auto c : str)
		ret += static_cast<char>(toupper(static_cast<unsigned char>(c)));
	return ret;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Transports

SCPITransport* BenchConfig::CreateTransport(const string& prefix) const
{
	auto transport = GetString(prefix + "_transport", "usbtmc");
	auto device = GetString(prefix + "_device");

	LogDebug("Creating %s transport for %s\n", transport.c_str(), device.c_str());
	return SCPITransport::CreateTransport(transport, device);
}

SCPITransport* BenchConfig::CreateSupplyTransport() const
{
	return CreateTransport("psu");
}

SCPITransport* BenchConfig::CreateSourceMeasureTransport() const
{
	return CreateTransport("smu");
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Power supply / multimeter

/**
	@brief Builds the U3606 session configuration from the psu_* keys

	At most one of psu_constant_voltage_output and psu_constant_current_output may be set. The multimeter is left
	unconfigured if psu_multimeter_mode is absent.
 */
KeysightU3606Configuration BenchConfig::GetSupplyConfiguration() const
{
	KeysightU3606Configuration config;

	config.serial = GetString("psu_serial_no", "");
	if(config.serial.empty())
		LogWarning("No serial number was specified for the power supply, set psu_serial_no to select one\n");

	bool cv = HasKey("psu_constant_voltage_output");
	bool cc = HasKey("psu_constant_current_output");
	if(cv && cc)
	{
		throw ConfigurationError(
			"'psu_constant_voltage_output' and 'psu_constant_current_output' can't both be set");
	}
	if(cv)
	{
		config.hasOutput = true;
		config.output = KeysightU3606SupplyMultimeter::GetDefaultOutputSettings(OUTPUT_SOURCE_VOLTAGE);
		config.outputValue = GetDouble("psu_constant_voltage_output");
	}
	else if(cc)
	{
		config.hasOutput = true;
		config.output = KeysightU3606SupplyMultimeter::GetDefaultOutputSettings(OUTPUT_SOURCE_CURRENT);
		config.outputValue = GetDouble("psu_constant_current_output");
	}

	if(HasKey("psu_multimeter_mode"))
	{
		auto mode = ToLower(GetString("psu_multimeter_mode"));
		MeasuredQuantity quantity;
		if(mode == "voltage")
			quantity = QUANTITY_VOLTAGE;
		else if(mode == "current")
			quantity = QUANTITY_CURRENT;
		else if(mode == "resistance")
			quantity = QUANTITY_RESISTANCE;
		else
			throw ConfigurationError("'psu_multimeter_mode' is not defined or invalid");

		config.hasMeasurement = true;
		config.measurement = KeysightU3606SupplyMultimeter::GetDefaultMeasurementSettings(quantity);

		auto signal = ToLower(GetString("psu_multimeter_signal", "dc"));
		if(signal == "ac")
			config.measurement.signal = SIGNAL_AC;
		else if(signal != "dc")
			throw ConfigurationError("'psu_multimeter_signal' is not defined or invalid");

		config.measurement.range = ToUpper(GetString("psu_multimeter_range", config.measurement.range));
		config.measurement.resolution =
			ToUpper(GetString("psu_multimeter_resolution", config.measurement.resolution));
	}

	return config;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Source-measure unit

/**
	@brief Builds the U2723 session configuration from the smu_* keys

	For each channel N, at most one of smu_ch_N_source_voltage and smu_ch_N_source_current may be set.
 */
KeysightU2723Configuration BenchConfig::GetSourceMeasureConfiguration() const
{
	KeysightU2723Configuration config;

	config.serial = GetString("smu_serial_no", "");
	if(config.serial.empty())
		LogWarning("No serial number was specified for the SMU, set smu_serial_no to select one\n");

	for(size_t i=0; i<config.channels.size(); i++)
	{
		string prefix = "smu_ch_" + to_string(i+1) + "_";
		auto& chan = config.channels[i];

		bool sv = HasKey(prefix + "source_voltage");
		bool si = HasKey(prefix + "source_current");
		if(sv && si)
		{
			throw ConfigurationError(
				"'" + prefix + "source_voltage' and '" + prefix + "source_current' can't both be set");
		}

		if(sv)
		{
			chan.hasOutput = true;
			chan.output = KeysightU2723SourceMeasureUnit::GetDefaultOutputSettings(OUTPUT_SOURCE_VOLTAGE);
			chan.outputValue = GetDouble(prefix + "source_voltage");
		}
		else if(si)
		{
			chan.hasOutput = true;
			chan.output = KeysightU2723SourceMeasureUnit::GetDefaultOutputSettings(OUTPUT_SOURCE_CURRENT);
			chan.outputValue = GetDouble(prefix + "source_current");
		}

		chan.output.voltageRange = GetString(prefix + "voltage_range", chan.output.voltageRange);
		chan.output.currentRange = GetString(prefix + "current_range", chan.output.currentRange);
	}

	return config;
}
