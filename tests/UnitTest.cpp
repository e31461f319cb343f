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
	@brief Tests for Unit pretty-printing
 */

#include "benchhal.h"

#include <gtest/gtest.h>

using namespace std;

TEST(UnitTest, SuffixPerType)
{
	EXPECT_EQ("V", Unit(Unit::UNIT_VOLTS).ToString());
	EXPECT_EQ("A", Unit(Unit::UNIT_AMPS).ToString());
	EXPECT_EQ("s", Unit(Unit::UNIT_SECONDS).ToString());
	EXPECT_EQ("Hz", Unit(Unit::UNIT_HZ).ToString());
	EXPECT_EQ("ms", Unit(Unit::UNIT_MS).ToString());
	EXPECT_EQ("", Unit(Unit::UNIT_COUNTS).ToString());
}

TEST(UnitTest, PrettyPrintScalesSIUnits)
{
	EXPECT_EQ("3.6 V", Unit(Unit::UNIT_VOLTS).PrettyPrint(3.6));
	EXPECT_EQ("10 mA", Unit(Unit::UNIT_AMPS).PrettyPrint(0.01));
	EXPECT_EQ("-120 mA", Unit(Unit::UNIT_AMPS).PrettyPrint(-0.12));
	EXPECT_EQ("0 V", Unit(Unit::UNIT_VOLTS).PrettyPrint(0));
	EXPECT_EQ("4.8 kHz", Unit(Unit::UNIT_HZ).PrettyPrint(4800));
	EXPECT_EQ("833 μs", Unit(Unit::UNIT_SECONDS).PrettyPrint(0.000833));
}

TEST(UnitTest, SweepQuantitiesAreNotRescaled)
{
	//Sweep interval is always shown in the instrument's native milliseconds
	EXPECT_EQ("40 ms", Unit(Unit::UNIT_MS).PrettyPrint(40));
	EXPECT_EQ("32767 ms", Unit(Unit::UNIT_MS).PrettyPrint(32767));
	EXPECT_EQ("150", Unit(Unit::UNIT_COUNTS).PrettyPrint(150));
}

TEST(UnitTest, FixedSignificantFigures)
{
	EXPECT_EQ("3.600 V", Unit(Unit::UNIT_VOLTS).PrettyPrint(3.6, 4));
	EXPECT_EQ("1.05 A", Unit(Unit::UNIT_AMPS).PrettyPrint(1.05, 3));
}
