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
	@brief Declaration of InstrumentSession
 */

#ifndef InstrumentSession_h
#define InstrumentSession_h

/**
	@brief Scoped ownership of one instrument, from identification through teardown

	Open() identifies the instrument and applies the initial configuration but never enables an output. Close() runs
	the teardown sequence exactly once: continuous acquisition off, every output off, error queue drained, reset.
	Each teardown step is attempted even if an earlier one failed. The first failure is rethrown once all steps have
	run.

	Run() wraps a body in Open() / Close() so that teardown happens on every exit path.

	DriverType must provide a ConfigType with a serial field and a Validate() method, a constructor
	taking a transport, and ApplyConfiguration().
 */
template<class DriverType>
class InstrumentSession
{
public:
	typedef typename DriverType::ConfigType ConfigType;

	/**
		@brief Creates a session. Nothing is sent until Open() is called.

		@param transport	Transport connected to the instrument. The session takes ownership.
		@param config		Initial configuration
	 */
	InstrumentSession(SCPITransport* transport, const ConfigType& config)
		: m_transport(transport)
		, m_config(config)
		, m_driver(nullptr)
		, m_opened(false)
	{
	}

	/**
		@brief Last resort cleanup if the session is still open. Failures are logged and never thrown.
	 */
	~InstrumentSession()
	{
		if(m_driver)
		{
			LogWarning("Session for %s destroyed while open, tearing down\n", m_driver->GetName().c_str());
			Teardown();
		}

		//Never handed off to a driver
		delete m_transport;
	}

	InstrumentSession(const InstrumentSession&) =delete;
	InstrumentSession& operator=(const InstrumentSession&) =delete;

	bool IsOpen() const
	{ return m_driver != nullptr; }

	DriverType& GetDriver()
	{
		if(!m_driver)
			throw InvalidStateError("Instrument session is not open");
		return *m_driver;
	}

	const ConfigType& GetConfiguration() const
	{ return m_config; }

	/**
		@brief Identifies the instrument and applies the initial configuration

		The configuration is validated before anything is sent. Every output is left disabled. If applying the
		configuration fails, the instrument is torn down and the original error is rethrown.
	 */
	void Open()
	{
		if(m_opened)
			throw InvalidStateError("Instrument session has already been opened");
		m_config.Validate();
		m_opened = true;

		//The driver owns the transport from here on, even if construction fails
		auto transport = m_transport;
		m_transport = nullptr;
		m_driver = new DriverType(transport);

		if(!m_config.serial.empty() && (m_driver->GetSerial() != m_config.serial))
		{
			LogError("Expected serial number %s, found %s\n", m_config.serial.c_str(), m_driver->GetSerial().c_str());
			std::string found = m_driver->GetSerial();
			delete m_driver;
			m_driver = nullptr;
			throw ConfigurationError("Expected serial number " + m_config.serial + ", found " + found);
		}

		LogNotice("Opened %s %s (serial %s) via %s:%s\n",
			m_driver->GetVendor().c_str(),
			m_driver->GetName().c_str(),
			m_driver->GetSerial().c_str(),
			m_driver->GetTransportName().c_str(),
			m_driver->GetTransportConnectionString().c_str());

		try
		{
			LogIndenter li;

			//Start from a known safe baseline
			for(size_t i=0; i<m_driver->GetState().GetChannelCount(); i++)
				m_driver->ForceOutputOff(i);

			m_driver->ApplyConfiguration(m_config);
		}
		catch(const std::exception& e)
		{
			LogError("Failed to configure %s: %s\n", m_driver->GetName().c_str(), e.what());
			Teardown();
			throw;
		}
	}

	/**
		@brief Runs the teardown sequence and releases the instrument. Does nothing if already closed.

		@throws The first exception raised by a teardown step, after every step has been attempted
	 */
	void Close()
	{
		auto err = Teardown();
		if(err)
			std::rethrow_exception(err);
	}

	/**
		@brief Opens the session, runs body(driver), and closes the session on every exit path

		If the body throws, teardown failures are logged and the body's exception is the one rethrown.
	 */
	template<class BodyType>
	void Run(BodyType body)
	{
		Open();

		try
		{
			body(*m_driver);
		}
		catch(...)
		{
			Teardown();
			throw;
		}

		Close();
	}

protected:

	/**
		@brief Runs one teardown step, recording its failure instead of propagating it
	 */
	void RunTeardownStep(std::exception_ptr& first, const char* name, const std::function<void()>& step)
	{
		try
		{
			step();
		}
		catch(const std::exception& e)
		{
			LogError("Teardown step \"%s\" failed: %s\n", name, e.what());
			if(!first)
				first = std::current_exception();
		}
	}

	/**
		@brief Best-effort teardown in fixed order. Returns the first failure, or null if every step succeeded.
	 */
	std::exception_ptr Teardown()
	{
		std::exception_ptr first;
		if(!m_driver)
			return first;

		auto driver = m_driver;
		LogDebug("Tearing down %s\n", driver->GetName().c_str());
		LogIndenter li;

		size_t nchans = driver->GetState().GetChannelCount();
		for(size_t i=0; i<nchans; i++)
		{
			if(driver->IsContinuousRunning(i))
				RunTeardownStep(first, "continuous off", [driver, i]() { driver->StopContinuous(i); });
		}

		for(size_t i=0; i<nchans; i++)
			RunTeardownStep(first, "output off", [driver, i]() { driver->ForceOutputOff(i); });

		RunTeardownStep(first, "state snapshot", [driver]()
			{
				YAML::Emitter out;
				out << driver->SerializeConfiguration();
				LogDebug("Final state of %s:\n%s\n", driver->GetName().c_str(), out.c_str());
			});

		RunTeardownStep(first, "error queue", [driver]()
			{
				auto err = driver->QueryErrorQueue();
				LogNotice("%s error queue: %s\n", driver->GetName().c_str(), err.c_str());
			});

		RunTeardownStep(first, "reset", [driver]() { driver->ResetToDefaults(); });

		//Whatever made it to the hardware, the instrument is released in its baseline state
		driver->ResetState();

		m_driver = nullptr;
		delete driver;

		LogDebug("Teardown complete\n");
		return first;
	}

	///@brief Transport until Open() hands it to the driver
	SCPITransport* m_transport;

	ConfigType m_config;

	DriverType* m_driver;

	bool m_opened;
};

#endif
