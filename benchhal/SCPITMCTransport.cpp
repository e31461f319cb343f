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
	@brief Implementation of SCPITMCTransport
 */

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <errno.h>
#include <fcntl.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <linux/usb/tmc.h>

#include "benchhal.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

SCPITMCTransport::SCPITMCTransport(const string& args)
	: m_devicePath(args)
	, m_handle(-1)
	, m_buf(nullptr)
	, m_max_read_size(2032)
{
	LogDebug("Connecting to SCPI instrument over USBTMC through %s\n", m_devicePath.c_str());

	m_handle = open(m_devicePath.c_str(), O_RDWR);
	if(m_handle < 0)
	{
		LogError("Couldn't open %s: %s\n", m_devicePath.c_str(), strerror(errno));
		return;
	}

	m_buf = new unsigned char[m_max_read_size];

	SetTimeout(m_timeout);
}

SCPITMCTransport::~SCPITMCTransport()
{
	if(IsConnected())
		close(m_handle);

	delete[] m_buf;
}

bool SCPITMCTransport::IsConnected()
{
	return (m_handle >= 0);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Actual transport code

string SCPITMCTransport::GetTransportName()
{
	return "usbtmc";
}

string SCPITMCTransport::GetConnectionString()
{
	return m_devicePath;
}

void SCPITMCTransport::SetTimeout(chrono::milliseconds timeout)
{
	m_timeout = timeout;
	if(!IsConnected())
		return;

	unsigned int ms = timeout.count();
	if(0 != ioctl(m_handle, USBTMC_IOCTL_SET_TIMEOUT, &ms))
		LogWarning("Couldn't set USBTMC timeout on %s to %u ms: %s\n", m_devicePath.c_str(), ms, strerror(errno));
	else
		LogTrace("USBTMC timeout set to %u ms\n", ms);
}

bool SCPITMCTransport::SendCommand(const string& cmd)
{
	if(!IsConnected())
		return false;

	LogTrace("Sending %s\n", cmd.c_str());

	//usbtmc sends each write() as one bulk-out message, terminate it ourselves
	string tmp = cmd + "\n";
	ssize_t result = write(m_handle, tmp.c_str(), tmp.length());

	return (result == static_cast<ssize_t>(tmp.length()));
}

/**
	@brief Reads one reply line

	@throws CommunicationError if the driver reports an error (including a timeout)
 */
string SCPITMCTransport::ReadReply(bool endOnSemicolon)
{
	string ret;

	if(!m_buf || !IsConnected())
		throw CommunicationError("Transport is not connected");

	//Keep reading until we get a full line. A short read means the instrument has nothing more to send.
	while(true)
	{
		ssize_t nread = read(m_handle, m_buf, m_max_read_size);
		if(nread < 0)
		{
			LogError("Read from %s failed: %s\n", m_devicePath.c_str(), strerror(errno));
			throw CommunicationError(string("USBTMC read failed: ") + strerror(errno));
		}

		ret.append(reinterpret_cast<const char*>(m_buf), nread);
		if( (static_cast<size_t>(nread) < m_max_read_size) || (ret.find('\n') != string::npos) )
			break;
	}

	//Trim off the terminator and anything after it
	size_t end = ret.find('\n');
	if(endOnSemicolon)
		end = min(end, ret.find(';'));
	if(end != string::npos)
		ret.resize(end);

	LogTrace("Got %s\n", ret.c_str());
	return ret;
}
