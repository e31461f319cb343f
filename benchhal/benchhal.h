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
	@brief Main library include file
 */

#ifndef benchhal_h
#define benchhal_h

#include <vector>
#include <string>
#include <map>
#include <list>
#include <set>
#include <mutex>
#include <memory>
#include <chrono>
#include <functional>
#include <exception>
#include <stdint.h>

#include <sigc++/sigc++.h>

#include <yaml-cpp/yaml.h>

#include <log.h>

#include "BenchException.h"
#include "Unit.h"

#include "SCPITransport.h"

#if !defined(_WIN32) && !defined(__APPLE__)
//TMC is only supported on Linux for now
#include "SCPITMCTransport.h"
#endif

#include "SCPIDevice.h"
#include "InstrumentChannel.h"
#include "Instrument.h"
#include "SCPIInstrument.h"

#include "InstrumentState.h"
#include "CommandCatalog.h"
#include "SourceMeasureInstrument.h"
#include "KeysightU3606SupplyMultimeter.h"
#include "KeysightU2723SourceMeasureUnit.h"

#include "InstrumentSession.h"
#include "BenchConfig.h"

std::string Trim(const std::string& str);
std::string TrimQuotes(const std::string& str);

std::string to_string_shortest(double d);

void TransportStaticInit();

#endif
