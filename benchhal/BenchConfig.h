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
	@brief Declaration of BenchConfig
 */

#ifndef BenchConfig_h
#define BenchConfig_h

/**
	@brief Bench setup loaded from a flat YAML map

	Example:

		psu_serial_no: MY12345678
		psu_device: /dev/usbtmc0
		psu_multimeter_mode: current
		psu_constant_voltage_output: 3.6

		smu_serial_no: MY87654321
		smu_device: /dev/usbtmc1
		smu_ch_1_source_voltage: 3.6
		smu_ch_2_source_current: 0.01

	Keys that are absent or null are treated as unset. Anything that is present but can't be converted is a
	ConfigurationError naming the key.
 */
class BenchConfig
{
public:
	BenchConfig();
	explicit BenchConfig(const YAML::Node& root);

	static BenchConfig LoadFile(const std::string& path);
	static BenchConfig LoadString(const std::string& text);

	bool HasKey(const std::string& key) const;

	//Power supply / multimeter
	KeysightU3606Configuration GetSupplyConfiguration() const;
	SCPITransport* CreateSupplyTransport() const;

	//Source-measure unit
	KeysightU2723Configuration GetSourceMeasureConfiguration() const;
	SCPITransport* CreateSourceMeasureTransport() const;

protected:
	std::string GetString(const std::string& key) const;
	std::string GetString(const std::string& key, const std::string& defaultValue) const;
	double GetDouble(const std::string& key) const;

	SCPITransport* CreateTransport(const std::string& prefix) const;

	static std::string ToLower(const std::string& str);
	static std::string ToUpper(const std::string& str);

	YAML::Node m_root;
};

#endif
