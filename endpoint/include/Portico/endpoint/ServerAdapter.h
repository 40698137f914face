//
// ServerAdapter.h
//
// Library: endpoint
// Package: Lifecycle
// Module:  ServerAdapter
//
// Definition of the ServerAdapter and ListenerHandle classes.
//
// Copyright (c) 2019-2020, Tekenlight Solutions Pvt Ltd.
// and Contributors.
//
// SPDX-License-Identifier:	BSL-1.0
//


#ifndef Endpoint_ServerAdapter_INCLUDED
#define Endpoint_ServerAdapter_INCLUDED


#include "Portico/endpoint/endpoint.h"
#include "Portico/endpoint/ListenerSpec.h"
#include "Poco/RefCountedObject.h"
#include "Poco/AutoPtr.h"


namespace Portico {
namespace endpoint {


class Endpoint_API ListenerHandle: public Poco::RefCountedObject
	/// Represents a listener started by a ServerAdapter.
	///
	/// Adapters may subclass ListenerHandle to keep the
	/// server objects they need to stop the listener.
{
public:
	typedef Poco::AutoPtr<ListenerHandle> Ptr;

	ListenerHandle(const std::string& ref, ListenerSpec::Scheme scheme, int port);
		/// Creates the ListenerHandle.

	const std::string& ref() const;
		/// Returns the reference the listener was started with.

	ListenerSpec::Scheme scheme() const;

	int port() const;
		/// Returns the port the listener is bound to.

protected:
	virtual ~ListenerHandle();

private:
	ListenerHandle();
	ListenerHandle(const ListenerHandle&);
	ListenerHandle& operator = (const ListenerHandle&);

	std::string _ref;
	ListenerSpec::Scheme _scheme;
	int _port;
};


class Endpoint_API ServerAdapter
	/// The interface to the HTTP server implementation that
	/// runs the listeners of an endpoint.
	///
	/// LifecycleManager uses a ServerAdapter to bind and
	/// release listeners; everything beyond that (accepting
	/// connections, parsing requests, TLS) is up to the
	/// server behind the adapter.
{
public:
	ServerAdapter();
	virtual ~ServerAdapter();

	virtual std::string name() const = 0;
		/// Returns the name of the server implementation,
		/// used in status messages.

	virtual ListenerHandle::Ptr startListener(const ListenerSpec& spec) = 0;
		/// Starts a listener as described by spec and returns its handle.
		///
		/// Must throw an AddressInUseException, with the port as its code,
		/// if the port is already bound. Any other failure is reported by
		/// throwing another Poco::Exception.

	virtual void stopListener(const std::string& ref) = 0;
		/// Stops the listener started with the given reference.
		/// Stopping a listener that is not running does nothing.

private:
	ServerAdapter(const ServerAdapter&);
	ServerAdapter& operator = (const ServerAdapter&);
};


//
// inlines
//
inline const std::string& ListenerHandle::ref() const
{
	return _ref;
}


inline ListenerSpec::Scheme ListenerHandle::scheme() const
{
	return _scheme;
}


inline int ListenerHandle::port() const
{
	return _port;
}


} } // namespace Portico::endpoint


#endif // Endpoint_ServerAdapter_INCLUDED
