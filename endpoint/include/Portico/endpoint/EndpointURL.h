//
// EndpointURL.h
//
// Library: endpoint
// Package: Configuration
// Module:  EndpointURL
//
// Definition of the EndpointURL class.
//
// Copyright (c) 2019-2020, Tekenlight Solutions Pvt Ltd.
// and Contributors.
//
// SPDX-License-Identifier:	BSL-1.0
//


#ifndef Endpoint_EndpointURL_INCLUDED
#define Endpoint_EndpointURL_INCLUDED


#include "Portico/endpoint/endpoint.h"
#include "Portico/endpoint/EndpointConfig.h"


namespace Portico {
namespace endpoint {


class Endpoint_API EndpointURL
	/// This class provides static methods to build the external
	/// URL of an endpoint from its configuration.
	///
	/// The scheme and port are taken from the https section if it
	/// is enabled, otherwise from the http section, and default
	/// to http on port 80. Every field of the url section that
	/// is set takes precedence over the derived values.
	///
	/// The port is left out for http on port 80 and for https
	/// on port 443.
{
public:
	static std::string compute(const EndpointConfig& config);
		/// Returns the canonical URL of the endpoint, for
		/// example "https://example.com" or "http://localhost:4000".

	static std::string computePath(const EndpointConfig& config);
		/// Returns the path of the endpoint, "/" unless the url
		/// section names one.

	static std::string canonicalize(const std::string& scheme, const std::string& host, const std::string& port);
		/// Renders scheme, host and port, dropping the default
		/// port of the scheme. An empty port is left out.

private:
	EndpointURL();
	~EndpointURL();
};


} } // namespace Portico::endpoint


#endif // Endpoint_EndpointURL_INCLUDED
