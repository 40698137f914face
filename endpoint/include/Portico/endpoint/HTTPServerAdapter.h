//
// HTTPServerAdapter.h
//
// Library: endpoint
// Package: Lifecycle
// Module:  HTTPServerAdapter
//
// Definition of the HTTPServerAdapter class.
//
// Copyright (c) 2019-2020, Tekenlight Solutions Pvt Ltd.
// and Contributors.
//
// SPDX-License-Identifier:	BSL-1.0
//


#ifndef Endpoint_HTTPServerAdapter_INCLUDED
#define Endpoint_HTTPServerAdapter_INCLUDED


#include "Portico/endpoint/endpoint.h"
#include "Portico/endpoint/ServerAdapter.h"
#include "Poco/Net/HTTPServer.h"
#include "Poco/Net/HTTPServerParams.h"
#include "Poco/Net/ServerSocket.h"
#include "Poco/Net/Context.h"
#include "Poco/ThreadPool.h"
#include "Poco/Mutex.h"
#include "Poco/Logger.h"
#include <map>


namespace Portico {
namespace endpoint {


class Endpoint_API HTTPServerAdapter: public ServerAdapter
	/// A ServerAdapter running each listener on its own
	/// Poco::Net::HTTPServer.
	///
	/// Plain listeners are bound with a Poco::Net::ServerSocket,
	/// secure listeners with a Poco::Net::SecureServerSocket. The
	/// SSL library must have been initialized with
	/// Poco::Net::initializeSSL() before a secure listener is started.
	///
	/// The following listener options are understood:
	///   - ip: the address to bind to (default 0.0.0.0).
	///   - backlog: the listen backlog (default 64).
	///   - maxThreads, or acceptors: the number of request threads (default 16).
	///   - maxQueued, or maxConnections: the maximum number of queued
	///     connections (default 64).
	///   - keepAlive, maxKeepAliveRequests, keepAliveTimeout (seconds),
	///     timeout (seconds), serverName, softwareVersion: passed to the
	///     HTTPServerParams of the server.
	///   - keyfile, certfile, cacertfile, verificationMode (none, relaxed,
	///     strict, once) and cipherList: the SSL context of a secure
	///     listener. keyfile and certfile are required.
	///
	/// Listeners are stopped by reference; stopping aborts the
	/// connections the listener is still serving.
{
public:
	HTTPServerAdapter();
		/// Creates the HTTPServerAdapter.

	~HTTPServerAdapter();
		/// Stops all listeners still running and destroys the HTTPServerAdapter.

	std::string name() const;
		/// Returns "Poco::Net::HTTPServer".

	ListenerHandle::Ptr startListener(const ListenerSpec& spec);
		/// Binds the socket of the listener and starts a HTTPServer on it.
		///
		/// Throws an AddressInUseException if the port is already bound,
		/// a Poco::ExistsException if a listener with the same reference is
		/// running and a Poco::InvalidArgumentException if the listener has
		/// no dispatch target or an option is invalid.

	void stopListener(const std::string& ref);
		/// Stops the listener and waits for its threads to finish.

	void stopAll();
		/// Stops all running listeners.

	bool isListening(const std::string& ref) const;
		/// Returns true if a listener with the given reference is running.

	std::size_t count() const;
		/// Returns the number of running listeners.

protected:
	Poco::Net::ServerSocket createSocket(const ListenerSpec& spec) const;
		/// Creates the bound and listening socket of the listener.

	Poco::Net::Context::Ptr createContext(const ListenerSpec& spec) const;
		/// Creates the SSL context of a secure listener.

	Poco::Net::HTTPServerParams::Ptr createParams(const ListenerSpec& spec) const;
		/// Creates the server parameters of the listener.

	static int intOption(const ListenerSpec& spec, const std::string& name, int deflt);
	static bool boolOption(const ListenerSpec& spec, const std::string& name, bool deflt);

private:
	class Listener: public ListenerHandle
	{
	public:
		typedef Poco::AutoPtr<Listener> Ptr;

		Listener(const ListenerSpec& spec, const Poco::Net::ServerSocket& socket, Poco::Net::HTTPServerParams::Ptr pParams);

		void start();
		void stop();

	protected:
		~Listener();

	private:
		Poco::ThreadPool _threadPool;
		Poco::Net::HTTPServer _server;
	};

	typedef std::map<std::string, Listener::Ptr> ListenerMap;

	ListenerMap _listeners;
	mutable Poco::FastMutex _mutex;
	Poco::Logger& _logger;
};


} } // namespace Portico::endpoint


#endif // Endpoint_HTTPServerAdapter_INCLUDED
