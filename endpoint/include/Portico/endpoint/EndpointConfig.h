//
// EndpointConfig.h
//
// Library: endpoint
// Package: Configuration
// Module:  EndpointConfig
//
// Definition of the EndpointConfig and ListenerConfig classes.
//
// Copyright (c) 2019-2020, Tekenlight Solutions Pvt Ltd.
// and Contributors.
//
// SPDX-License-Identifier:	BSL-1.0
//


#ifndef Endpoint_EndpointConfig_INCLUDED
#define Endpoint_EndpointConfig_INCLUDED


#include "Portico/endpoint/endpoint.h"
#include "Poco/Nullable.h"
#include <map>
#include <string>


namespace Portico {
namespace endpoint {


class Endpoint_API ListenerConfig
	/// The contents of an http or https section of an
	/// endpoint configuration.
	///
	/// A ListenerConfig holds an optional port, kept in its raw
	/// string form until a listener is built from it, and any number
	/// of further transport options (bind address, thread limits,
	/// certificate files, ...) that are handed through to the
	/// ServerAdapter unchanged.
{
public:
	typedef std::map<std::string, std::string> Options;

	ListenerConfig();
		/// Creates an empty ListenerConfig without a port.

	~ListenerConfig();

	bool hasPort() const;
		/// Returns true if a port has been set.

	const std::string& port() const;
		/// Returns the raw port value.
		///
		/// Throws a Poco::NullValueException if no port has been set.

	int portNumber(int deflt) const;
		/// Returns the port as an integer, or deflt if no port
		/// has been set.
		///
		/// Throws an EndpointConfigException if the port is not
		/// a number in the range 0 to 65535.

	void setPort(const std::string& port);
	void setPort(int port);

	bool has(const std::string& name) const;
		/// Returns true if the option with the given name exists.

	const std::string& get(const std::string& name) const;
		/// Returns the value of the given option.
		///
		/// Throws a Poco::NotFoundException if the option does not exist.

	std::string get(const std::string& name, const std::string& deflt) const;
		/// Returns the value of the given option, or deflt
		/// if the option does not exist.

	void set(const std::string& name, const std::string& value);
		/// Sets the given option, replacing an existing value.

	const Options& options() const;
		/// Returns all options except the port.

	void merge(const ListenerConfig& overrides);
		/// Overlays overrides onto this ListenerConfig. The port and
		/// every option of overrides replace the values held here;
		/// everything else is kept.

private:
	Poco::Nullable<std::string> _port;
	Options _options;
};


struct Endpoint_API UrlConfig
	/// The url section of an endpoint configuration. Every field
	/// that is set takes precedence over the scheme and port
	/// derived from the http and https sections.
{
	UrlConfig();

	Poco::Nullable<std::string> scheme;
	std::string host;
	Poco::Nullable<std::string> port;
	std::string path;
};


struct Endpoint_API TransportConfig
{
	TransportConfig();

	int longpollerWindowMs;
	std::string websocketSerializer;
};


struct Endpoint_API EndpointConfig
	/// The fully resolved configuration of an endpoint.
	///
	/// An EndpointConfig is created by EndpointConfigResolver,
	/// which overlays the values found in the application
	/// configuration onto the static defaults, and is owned by
	/// the EndpointRegistry while the endpoint is registered.
{
	EndpointConfig();

	bool hasHTTP() const;
		/// Returns true if the http section is enabled.

	bool hasHTTPS() const;
		/// Returns true if the https section is enabled.

	std::string appId;
	std::string endpointId;
	bool debugErrors;
	std::string renderErrors;
	TransportConfig transports;
	UrlConfig url;
	Poco::Nullable<ListenerConfig> http;
	Poco::Nullable<ListenerConfig> https;
	Poco::Nullable<std::string> secretKeyBase;
};


//
// inlines
//
inline bool ListenerConfig::hasPort() const
{
	return !_port.isNull();
}


inline const std::string& ListenerConfig::port() const
{
	return _port.value();
}


inline const ListenerConfig::Options& ListenerConfig::options() const
{
	return _options;
}


inline bool EndpointConfig::hasHTTP() const
{
	return !http.isNull();
}


inline bool EndpointConfig::hasHTTPS() const
{
	return !https.isNull();
}


} } // namespace Portico::endpoint


#endif // Endpoint_EndpointConfig_INCLUDED
