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
	@brief Declaration of the instrument control exception hierarchy
 */

#ifndef BenchException_h
#define BenchException_h

#include <stdexcept>

/**
	@brief Base class for all errors raised by instrument drivers and sessions
 */
class BenchException : public std::runtime_error
{
public:
	explicit BenchException(const std::string& what)
		: std::runtime_error(what)
	{}
};

/**
	@brief The requested operation is not legal given the current instrument state.

	Always raised before any command is sent to the instrument, so the instrument and the state model are unchanged.
 */
class InvalidStateError : public BenchException
{
public:
	explicit InvalidStateError(const std::string& what)
		: BenchException(what)
	{}
};

/**
	@brief The transport failed to deliver a command, or the reply was missing or malformed.

	Raised after a command was sent. The physical instrument may be ahead of the state model; nothing is
	resynchronized or retried.
 */
class CommunicationError : public BenchException
{
public:
	explicit CommunicationError(const std::string& what)
		: BenchException(what)
	{}
};

/**
	@brief Caller supplied configuration or parameters violate the instrument's constraints
 */
class ConfigurationError : public BenchException
{
public:
	explicit ConfigurationError(const std::string& what)
		: BenchException(what)
	{}
};

#endif
