//
// EndpointConfig.cpp
//
// Library: endpoint
// Package: Configuration
// Module:  EndpointConfig
//
// Copyright (c) 2019-2020, Tekenlight Solutions Pvt Ltd.
// and Contributors.
//
// SPDX-License-Identifier:	BSL-1.0
//


#include "Portico/endpoint/EndpointConfig.h"
#include "Portico/endpoint/EndpointException.h"
#include "Poco/NumberParser.h"
#include "Poco/NumberFormatter.h"
#include "Poco/String.h"
#include "Poco/Exception.h"


namespace Portico {
namespace endpoint {


ListenerConfig::ListenerConfig()
{
}


ListenerConfig::~ListenerConfig()
{
}


int ListenerConfig::portNumber(int deflt) const
{
	if (_port.isNull()) return deflt;

	int port = 0;
	if (!Poco::NumberParser::tryParse(Poco::trim(_port.value()), port))
		throw EndpointConfigException("Port is not a number", _port.value());
	if (port < 0 || port > 65535)
		throw EndpointConfigException("Port out of range", _port.value());

	return port;
}


void ListenerConfig::setPort(const std::string& port)
{
	_port = port;
}


void ListenerConfig::setPort(int port)
{
	_port = Poco::NumberFormatter::format(port);
}


bool ListenerConfig::has(const std::string& name) const
{
	return _options.find(name) != _options.end();
}


const std::string& ListenerConfig::get(const std::string& name) const
{
	Options::const_iterator it = _options.find(name);
	if (it == _options.end())
		throw Poco::NotFoundException("Listener option", name);
	return it->second;
}


std::string ListenerConfig::get(const std::string& name, const std::string& deflt) const
{
	Options::const_iterator it = _options.find(name);
	if (it == _options.end()) return deflt;
	return it->second;
}


void ListenerConfig::set(const std::string& name, const std::string& value)
{
	_options[name] = value;
}


void ListenerConfig::merge(const ListenerConfig& overrides)
{
	if (overrides.hasPort()) _port = overrides.port();

	for (Options::const_iterator it = overrides._options.begin(); it != overrides._options.end(); ++it)
	{
		_options[it->first] = it->second;
	}
}


UrlConfig::UrlConfig():
	host(ENDPOINT_DEFAULT_HOST)
{
}


TransportConfig::TransportConfig():
	longpollerWindowMs(ENDPOINT_LONGPOLLER_WINDOW_MS),
	websocketSerializer(ENDPOINT_WEBSOCKET_SERIALIZER)
{
}


EndpointConfig::EndpointConfig():
	debugErrors(false)
{
}


} } // namespace Portico::endpoint
