//
// EndpointException.cpp
//
// Library: endpoint
// Package: EndpointCore
// Module:  EndpointException
//
// Copyright (c) 2019-2020, Tekenlight Solutions Pvt Ltd.
// and Contributors.
//
// SPDX-License-Identifier:	BSL-1.0
//


#include "Portico/endpoint/EndpointException.h"
#include "Poco/Format.h"
#include <typeinfo>


namespace Portico {
namespace endpoint {


POCO_IMPLEMENT_EXCEPTION(EndpointException, Poco::RuntimeException, "Endpoint exception")
POCO_IMPLEMENT_EXCEPTION(EndpointConfigException, EndpointException, "Invalid endpoint configuration")
POCO_IMPLEMENT_EXCEPTION(EndpointExistsException, EndpointException, "Endpoint already registered")
POCO_IMPLEMENT_EXCEPTION(ListenerStartException, EndpointException, "Something went wrong while starting endpoint")
POCO_IMPLEMENT_EXCEPTION(AddressInUseException, EndpointException, "Address already in use")


PortInUseException::PortInUseException(int port):
	EndpointException(Poco::format("Port %d is already in use", port), port),
	_port(port)
{
}


PortInUseException::PortInUseException(const PortInUseException& exc):
	EndpointException(exc),
	_port(exc._port)
{
}


PortInUseException::~PortInUseException() noexcept
{
}


PortInUseException& PortInUseException::operator = (const PortInUseException& exc)
{
	EndpointException::operator = (exc);
	_port = exc._port;
	return *this;
}


const char* PortInUseException::name() const noexcept
{
	return "Port in use";
}


const char* PortInUseException::className() const noexcept
{
	return typeid(*this).name();
}


Poco::Exception* PortInUseException::clone() const
{
	return new PortInUseException(*this);
}


void PortInUseException::rethrow() const
{
	throw *this;
}


} } // namespace Portico::endpoint
