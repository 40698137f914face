//
// EndpointConfigResolver.cpp
//
// Library: endpoint
// Package: Configuration
// Module:  EndpointConfigResolver
//
// Copyright (c) 2019-2020, Tekenlight Solutions Pvt Ltd.
// and Contributors.
//
// SPDX-License-Identifier:	BSL-1.0
//


#include "Portico/endpoint/EndpointConfigResolver.h"
#include "Portico/endpoint/EndpointException.h"
#include "Poco/String.h"
#include "Poco/Exception.h"


using Poco::Util::AbstractConfiguration;


namespace Portico {
namespace endpoint {


EndpointConfigResolver::EndpointConfigResolver(AbstractConfiguration::Ptr pConfig):
	_pConfig(pConfig)
{
	poco_check_ptr (_pConfig);
}


EndpointConfigResolver::~EndpointConfigResolver()
{
}


EndpointConfig EndpointConfigResolver::buildDefaults(const std::string& appId, const std::string& endpointId)
{
	EndpointConfig config;
	config.appId = appId;
	config.endpointId = endpointId;
	config.debugErrors = false;
	config.renderErrors = errorView(endpointId);
	config.transports.longpollerWindowMs = ENDPOINT_LONGPOLLER_WINDOW_MS;
	config.transports.websocketSerializer = ENDPOINT_WEBSOCKET_SERIALIZER;
	config.url.host = ENDPOINT_DEFAULT_HOST;
	config.http.clear();
	config.https.clear();
	config.secretKeyBase.clear();
	return config;
}


std::string EndpointConfigResolver::errorView(const std::string& endpointId)
{
	std::string::size_type n = endpointId.find('.');
	std::string segment = endpointId.substr(0, n);
	if (segment.empty()) return ENDPOINT_ERROR_VIEW_SUFFIX;

	return segment + "." + ENDPOINT_ERROR_VIEW_SUFFIX;
}


std::string EndpointConfigResolver::prefix(const std::string& appId, const std::string& endpointId)
{
	return appId + "." + endpointId + ".";
}


EndpointConfig EndpointConfigResolver::resolveConfig(const std::string& appId, const std::string& endpointId) const
{
	if (appId.empty() || endpointId.empty())
		throw EndpointConfigException("Application and endpoint identifiers must not be empty");

	EndpointConfig config = buildDefaults(appId, endpointId);
	const std::string p = prefix(appId, endpointId);

	try
	{
		config.debugErrors = _pConfig->getBool(p + "debugErrors", config.debugErrors);
		config.renderErrors = _pConfig->getString(p + "renderErrors", config.renderErrors);
		if (_pConfig->has(p + "secretKeyBase"))
			config.secretKeyBase = _pConfig->getString(p + "secretKeyBase");

		config.transports.longpollerWindowMs =
			_pConfig->getInt(p + "transports.longpollerWindowMs", config.transports.longpollerWindowMs);
		config.transports.websocketSerializer =
			_pConfig->getString(p + "transports.websocketSerializer", config.transports.websocketSerializer);

		if (_pConfig->has(p + "url.scheme"))
			config.url.scheme = Poco::toLower(Poco::trim(_pConfig->getString(p + "url.scheme")));
		config.url.host = _pConfig->getString(p + "url.host", config.url.host);
		if (_pConfig->has(p + "url.port"))
			config.url.port = Poco::trim(_pConfig->getString(p + "url.port"));
		config.url.path = _pConfig->getString(p + "url.path", config.url.path);

		config.http = readListener(p + "http");
		config.https = readListener(p + "https");
	}
	catch (EndpointConfigException&)
	{
		throw;
	}
	catch (Poco::SyntaxException& exc)
	{
		throw EndpointConfigException(endpointId, exc);
	}

	if (!config.url.port.isNull())
	{
		ListenerConfig check;
		check.setPort(config.url.port.value());
		check.portNumber(0);
	}
	if (config.hasHTTP()) config.http.value().portNumber(0);
	if (config.hasHTTPS()) config.https.value().portNumber(0);

	return config;
}


Poco::Nullable<ListenerConfig> EndpointConfigResolver::readListener(const std::string& key) const
{
	Poco::Nullable<ListenerConfig> result;

	AbstractConfiguration::Keys keys;
	_pConfig->keys(key, keys);

	if (_pConfig->has(key))
	{
		std::string value = Poco::trim(_pConfig->getString(key));
		if (value.empty())
		{
			if (keys.empty()) return result;
		}
		else if (!_pConfig->getBool(key))
		{
			return result;
		}
	}
	else if (keys.empty())
	{
		return result;
	}

	ListenerConfig listener;
	for (AbstractConfiguration::Keys::const_iterator it = keys.begin(); it != keys.end(); ++it)
	{
		readOptions(key + "." + *it, *it, listener);
	}
	result = listener;
	return result;
}


void EndpointConfigResolver::readOptions(const std::string& key, const std::string& name, ListenerConfig& listener) const
{
	if (_pConfig->has(key))
	{
		if (name == "port")
			listener.setPort(Poco::trim(_pConfig->getString(key)));
		else
			listener.set(name, _pConfig->getString(key));
	}

	AbstractConfiguration::Keys keys;
	_pConfig->keys(key, keys);
	for (AbstractConfiguration::Keys::const_iterator it = keys.begin(); it != keys.end(); ++it)
	{
		readOptions(key + "." + *it, name + "." + *it, listener);
	}
}


} } // namespace Portico::endpoint
