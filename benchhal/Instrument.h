/***********************************************************************************************************************
*                                                                                                                      *
* libbenchhal v0.1                                                                                                     *
*                                                                                                                      *
* Copyright (c) 2012-2024 Andrew D. Zonenberg and contributors                                                         *
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
	@author Andrew D. Zonenberg
	@brief Declaration of Instrument
 */

#ifndef Instrument_h
#define Instrument_h

#include "InstrumentChannel.h"

/**
	@brief An arbitrary bench instrument. PSU, DMM, SMU, etc

	An instrument has one or more channels, each of which may have different capabilities. For example, a combined
	supply and multimeter has a single output channel plus a multimeter input that shares its front end.

	All channels regardless of type occupy a single zero-based namespace.
 */
class Instrument
{
public:
	virtual ~Instrument();

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Instrument identification

	/*
		@brief Types of instrument.
	 */
	enum InstrumentTypes
	{
		//A multimeter
		INST_DMM 				=  0x02,

		//A power supply
		INST_PSU				=  0x04,

		//A source-measure unit
		INST_SMU				= 0x200
	};

	/**
		@brief Returns a bitfield describing the set of instrument types that this instrument supports.
	 */
	virtual unsigned int GetInstrumentTypes() const =0;

	//Device information
	virtual std::string GetName() const =0;
	virtual std::string GetVendor() const =0;
	virtual std::string GetSerial() const =0;

	/**
		@brief Gets the connection string for our transport
	 */
	virtual std::string GetTransportConnectionString() =0;

	/**
		@brief Gets the name of our transport
	 */
	virtual std::string GetTransportName() =0;

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Channel enumeration and identification

	/**
		@brief Gets the number of channels (of any type) this instrument has.
	 */
	size_t GetChannelCount() const
	{ return m_channels.size(); }

	/**
		@brief Gets a given channel on the instrument

		@param i		Channel index
	 */
	InstrumentChannel* GetChannel(size_t i) const
	{
		if(i >= m_channels.size())
			return nullptr;

		return m_channels[i];
	}

	InstrumentChannel* GetChannelByHwName(const std::string& name);

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Serialization

public:

	/**
		@brief Serializes this instrument's configuration and state to a YAML node.
	 */
	virtual YAML::Node SerializeConfiguration() const;

protected:

	/**
		@brief List of methods which need to be called to serialize this node's configuration
	 */
	std::list< sigc::slot<void(YAML::Node&)> > m_serializers;

protected:

	/**
		@brief Set of all channels on this instrument
	 */
	std::vector<InstrumentChannel*> m_channels;
};

#endif
