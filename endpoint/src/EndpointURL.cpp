//
// EndpointURL.cpp
//
// Library: endpoint
// Package: Configuration
// Module:  EndpointURL
//
// Copyright (c) 2019-2020, Tekenlight Solutions Pvt Ltd.
// and Contributors.
//
// SPDX-License-Identifier:	BSL-1.0
//


#include "Portico/endpoint/EndpointURL.h"
#include "Poco/NumberFormatter.h"


namespace Portico {
namespace endpoint {


std::string EndpointURL::compute(const EndpointConfig& config)
{
	std::string scheme("http");
	std::string port("80");

	// A section without a port is served on the default listener port.
	if (config.hasHTTPS())
	{
		ListenerConfig secure;
		if (config.hasHTTP()) secure = config.http.value();
		secure.merge(config.https.value());
		scheme = "https";
		port = Poco::NumberFormatter::format(secure.portNumber(ENDPOINT_DEFAULT_HTTPS_PORT));
	}
	else if (config.hasHTTP())
	{
		scheme = "http";
		port = Poco::NumberFormatter::format(config.http.value().portNumber(ENDPOINT_DEFAULT_HTTP_PORT));
	}

	if (!config.url.scheme.isNull()) scheme = config.url.scheme.value();
	if (!config.url.port.isNull())
	{
		ListenerConfig explicitPort;
		explicitPort.setPort(config.url.port.value());
		port = Poco::NumberFormatter::format(explicitPort.portNumber(0));
	}

	std::string url = canonicalize(scheme, config.url.host, port);
	std::string path = computePath(config);
	if (path != "/") url += path;

	return url;
}


std::string EndpointURL::computePath(const EndpointConfig& config)
{
	const std::string& path = config.url.path;
	if (path.empty()) return "/";
	if (path[0] != '/') return "/" + path;
	return path;
}


std::string EndpointURL::canonicalize(const std::string& scheme, const std::string& host, const std::string& port)
{
	if ((scheme == "https" && port == "443") || (scheme == "http" && port == "80") || port.empty())
		return scheme + "://" + host;
	else
		return scheme + "://" + host + ":" + port;
}


} } // namespace Portico::endpoint
