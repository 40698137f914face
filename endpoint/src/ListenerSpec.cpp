//
// ListenerSpec.cpp
//
// Library: endpoint
// Package: Lifecycle
// Module:  ListenerSpec
//
// Copyright (c) 2019-2020, Tekenlight Solutions Pvt Ltd.
// and Contributors.
//
// SPDX-License-Identifier:	BSL-1.0
//


#include "Portico/endpoint/ListenerSpec.h"
#include "Poco/Exception.h"


namespace Portico {
namespace endpoint {


ListenerSpec::ListenerSpec(Scheme scheme,
		const std::string& appId,
		const std::string& endpointId,
		int port,
		const ListenerConfig::Options& options,
		Poco::Net::HTTPRequestHandlerFactory::Ptr pDispatch):
	_scheme(scheme),
	_ref(reference(endpointId, scheme)),
	_appId(appId),
	_endpointId(endpointId),
	_port(port),
	_options(options),
	_pDispatch(pDispatch)
{
}


ListenerSpec::~ListenerSpec()
{
}


ListenerSpec ListenerSpec::build(Scheme scheme, const EndpointConfig& config, Poco::Net::HTTPRequestHandlerFactory::Ptr pDispatch)
{
	ListenerConfig listener;
	int deflt = ENDPOINT_DEFAULT_HTTP_PORT;

	if (scheme == SCHEME_PLAIN)
	{
		if (!config.hasHTTP())
			throw Poco::InvalidArgumentException("http is not configured for", config.endpointId);
		listener = config.http.value();
	}
	else
	{
		if (!config.hasHTTPS())
			throw Poco::InvalidArgumentException("https is not configured for", config.endpointId);
		if (config.hasHTTP()) listener = config.http.value();
		listener.merge(config.https.value());
		deflt = ENDPOINT_DEFAULT_HTTPS_PORT;
	}

	return ListenerSpec(scheme, config.appId, config.endpointId, listener.portNumber(deflt), listener.options(), pDispatch);
}


std::string ListenerSpec::reference(const std::string& endpointId, Scheme scheme)
{
	return endpointId + (scheme == SCHEME_SECURE ? ".HTTPS" : ".HTTP");
}


std::string ListenerSpec::schemeName(Scheme scheme)
{
	return scheme == SCHEME_SECURE ? "https" : "http";
}


bool ListenerSpec::has(const std::string& name) const
{
	return _options.find(name) != _options.end();
}


std::string ListenerSpec::get(const std::string& name, const std::string& deflt) const
{
	ListenerConfig::Options::const_iterator it = _options.find(name);
	if (it == _options.end()) return deflt;
	return it->second;
}


} } // namespace Portico::endpoint
