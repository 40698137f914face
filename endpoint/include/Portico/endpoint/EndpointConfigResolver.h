//
// EndpointConfigResolver.h
//
// Library: endpoint
// Package: Configuration
// Module:  EndpointConfigResolver
//
// Definition of the EndpointConfigResolver class.
//
// Copyright (c) 2019-2020, Tekenlight Solutions Pvt Ltd.
// and Contributors.
//
// SPDX-License-Identifier:	BSL-1.0
//


#ifndef Endpoint_EndpointConfigResolver_INCLUDED
#define Endpoint_EndpointConfigResolver_INCLUDED


#include "Portico/endpoint/endpoint.h"
#include "Portico/endpoint/EndpointConfig.h"
#include "Poco/Util/AbstractConfiguration.h"


namespace Portico {
namespace endpoint {


class Endpoint_API EndpointConfigResolver
	/// Builds EndpointConfig objects by overlaying the values of an
	/// application configuration onto the static endpoint defaults.
	///
	/// All keys of an endpoint live below the prefix
	/// <appId>.<endpointId>, for example:
	///
	///     myapp.MyApp.Endpoint.url.host = example.com
	///     myapp.MyApp.Endpoint.http.port = 8080
	///     myapp.MyApp.Endpoint.https.port = 8443
	///     myapp.MyApp.Endpoint.https.keyfile = priv/ssl/key.pem
	///
	/// The configuration is read on every call to resolveConfig(),
	/// so changes made to it at runtime are seen by the next
	/// resolution.
{
public:
	explicit EndpointConfigResolver(Poco::Util::AbstractConfiguration::Ptr pConfig);
		/// Creates the EndpointConfigResolver reading from the given configuration.

	~EndpointConfigResolver();

	EndpointConfig resolveConfig(const std::string& appId, const std::string& endpointId) const;
		/// Returns the defaults for the endpoint with every value found
		/// in the configuration applied on top. Scalar values of the url and
		/// transports sections override the defaults one by one; the http and
		/// https sections are taken as a whole.
		///
		/// Throws an EndpointConfigException if a value cannot be
		/// converted to its expected type.

	static EndpointConfig buildDefaults(const std::string& appId, const std::string& endpointId);
		/// Returns the static defaults of an endpoint: no debug errors,
		/// the error view of the endpoint's namespace, the default transport
		/// settings, host "localhost", http and https disabled and no
		/// secret key base.

	static std::string errorView(const std::string& endpointId);
		/// Returns the error view of the given endpoint, built from
		/// the first namespace segment of the endpoint identifier:
		/// "MyApp.Endpoint" gives "MyApp.ErrorView".

	static std::string prefix(const std::string& appId, const std::string& endpointId);
		/// Returns the configuration key prefix of the endpoint,
		/// including the trailing period.

protected:
	Poco::Nullable<ListenerConfig> readListener(const std::string& key) const;
	void readOptions(const std::string& key, const std::string& name, ListenerConfig& listener) const;

private:
	EndpointConfigResolver();
	EndpointConfigResolver(const EndpointConfigResolver&);
	EndpointConfigResolver& operator = (const EndpointConfigResolver&);

	Poco::Util::AbstractConfiguration::Ptr _pConfig;
};


} } // namespace Portico::endpoint


#endif // Endpoint_EndpointConfigResolver_INCLUDED
