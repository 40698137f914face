//
// EndpointException.h
//
// Library: endpoint
// Package: EndpointCore
// Module:  EndpointException
//
// Definition of the EndpointException class and friends.
//
// Copyright (c) 2019-2020, Tekenlight Solutions Pvt Ltd.
// and Contributors.
//
// SPDX-License-Identifier:	BSL-1.0
//


#ifndef Endpoint_EndpointException_INCLUDED
#define Endpoint_EndpointException_INCLUDED


#include "Portico/endpoint/endpoint.h"
#include "Poco/Exception.h"


namespace Portico {
namespace endpoint {


POCO_DECLARE_EXCEPTION(Endpoint_API, EndpointException, Poco::RuntimeException)
POCO_DECLARE_EXCEPTION(Endpoint_API, EndpointConfigException, EndpointException)
POCO_DECLARE_EXCEPTION(Endpoint_API, EndpointExistsException, EndpointException)
POCO_DECLARE_EXCEPTION(Endpoint_API, ListenerStartException, EndpointException)

// Thrown by a ServerAdapter when the listening socket cannot be bound
// because the address is taken. The code carries the port.
POCO_DECLARE_EXCEPTION(Endpoint_API, AddressInUseException, EndpointException)


class Endpoint_API PortInUseException: public EndpointException
	/// Thrown by LifecycleManager::start() when a listener
	/// could not be started because its port is already bound.
{
public:
	explicit PortInUseException(int port);
		/// Creates the exception for the given port.

	PortInUseException(const PortInUseException& exc);

	~PortInUseException() noexcept;

	PortInUseException& operator = (const PortInUseException& exc);

	const char* name() const noexcept;
	const char* className() const noexcept;

	Poco::Exception* clone() const;
	void rethrow() const;

	int port() const;
		/// Returns the port that was already in use.

private:
	int _port;
};


//
// inlines
//
inline int PortInUseException::port() const
{
	return _port;
}


} } // namespace Portico::endpoint


#endif // Endpoint_EndpointException_INCLUDED
