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
	@brief Implementation of SCPIDevice
 */

#include "benchhal.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

SCPIDevice::SCPIDevice(SCPITransport* transport, bool identify)
	: m_transport(transport)
{
	if(!m_transport)
		throw ConfigurationError("No transport supplied");

	if(!identify)
		return;

	try
	{
		Identify();
	}
	catch(...)
	{
		//Our destructor won't run, so release the transport before passing the error up
		delete m_transport;
		m_transport = nullptr;
		throw;
	}
}

SCPIDevice::~SCPIDevice()
{
	delete m_transport;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Identification

/**
	@brief Queries *IDN? and parses the manufacturer, model, serial, and firmware fields

	@throws CommunicationError if the reply doesn't have at least three fields
 */
void SCPIDevice::Identify()
{
	auto reply = Trim(m_transport->SendCommandImmediateWithReply("*IDN?", false));

	vector<string> fields;
	string tmp;
	for(auto c : reply)
	{
		if(c == ',')
		{
			fields.push_back(Trim(tmp));
			tmp = "";
		}
		else
			tmp += c;
	}
	fields.push_back(Trim(tmp));

	if( (fields.size() < 3) || fields[1].empty() )
	{
		LogError("Bad IDN response \"%s\" from %s\n", reply.c_str(), m_transport->GetConnectionString().c_str());
		throw CommunicationError("Malformed *IDN? reply \"" + reply + "\"");
	}

	m_vendor = fields[0];
	m_model = fields[1];
	m_serial = fields[2];
	if(fields.size() > 3)
		m_fwVersion = fields[3];

	LogVerbose("Identified %s %s (serial %s, firmware %s)\n",
		m_vendor.c_str(), m_model.c_str(), m_serial.c_str(), m_fwVersion.c_str());
}
