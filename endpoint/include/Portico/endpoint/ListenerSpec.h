//
// ListenerSpec.h
//
// Library: endpoint
// Package: Lifecycle
// Module:  ListenerSpec
//
// Definition of the ListenerSpec class.
//
// Copyright (c) 2019-2020, Tekenlight Solutions Pvt Ltd.
// and Contributors.
//
// SPDX-License-Identifier:	BSL-1.0
//


#ifndef Endpoint_ListenerSpec_INCLUDED
#define Endpoint_ListenerSpec_INCLUDED


#include "Portico/endpoint/endpoint.h"
#include "Portico/endpoint/EndpointConfig.h"
#include "Poco/Net/HTTPRequestHandlerFactory.h"


namespace Portico {
namespace endpoint {


class Endpoint_API ListenerSpec
	/// Everything a ServerAdapter needs to start one listener
	/// of an endpoint: the scheme, the port, the remaining
	/// transport options and the factory that dispatches the
	/// requests received on the listener.
	///
	/// Listeners are identified by a reference made of the
	/// endpoint identifier and the scheme, for example
	/// "MyApp.Endpoint.HTTP" or "MyApp.Endpoint.HTTPS".
{
public:
	enum Scheme
	{
		SCHEME_PLAIN,
		SCHEME_SECURE
	};

	ListenerSpec(Scheme scheme,
		const std::string& appId,
		const std::string& endpointId,
		int port,
		const ListenerConfig::Options& options,
		Poco::Net::HTTPRequestHandlerFactory::Ptr pDispatch);
		/// Creates the ListenerSpec.

	~ListenerSpec();

	static ListenerSpec build(Scheme scheme, const EndpointConfig& config, Poco::Net::HTTPRequestHandlerFactory::Ptr pDispatch);
		/// Builds the ListenerSpec of the given scheme from the endpoint
		/// configuration.
		///
		/// The plain listener uses the http section and defaults to port 4000.
		/// The secure listener uses the http section overlaid with the https
		/// section, so https values win and every http option not repeated
		/// under https is inherited; its port defaults to 4040.
		///
		/// Throws a Poco::InvalidArgumentException if the section of the scheme
		/// is not enabled and an EndpointConfigException if the port is invalid.

	static std::string reference(const std::string& endpointId, Scheme scheme);
		/// Returns the listener reference of the given endpoint and scheme.

	static std::string schemeName(Scheme scheme);
		/// Returns "http" or "https".

	Scheme scheme() const;
	std::string schemeName() const;
	const std::string& ref() const;
	const std::string& appId() const;
	const std::string& endpointId() const;

	int port() const;
		/// Returns the port to bind. Zero lets the system choose.

	const ListenerConfig::Options& options() const;

	bool has(const std::string& name) const;
	std::string get(const std::string& name, const std::string& deflt) const;

	Poco::Net::HTTPRequestHandlerFactory::Ptr dispatch() const;
		/// Returns the factory creating the handlers for the
		/// requests received by the listener. May be null.

private:
	ListenerSpec();

	Scheme _scheme;
	std::string _ref;
	std::string _appId;
	std::string _endpointId;
	int _port;
	ListenerConfig::Options _options;
	Poco::Net::HTTPRequestHandlerFactory::Ptr _pDispatch;
};


//
// inlines
//
inline ListenerSpec::Scheme ListenerSpec::scheme() const
{
	return _scheme;
}


inline std::string ListenerSpec::schemeName() const
{
	return schemeName(_scheme);
}


inline const std::string& ListenerSpec::ref() const
{
	return _ref;
}


inline const std::string& ListenerSpec::appId() const
{
	return _appId;
}


inline const std::string& ListenerSpec::endpointId() const
{
	return _endpointId;
}


inline int ListenerSpec::port() const
{
	return _port;
}


inline const ListenerConfig::Options& ListenerSpec::options() const
{
	return _options;
}


inline Poco::Net::HTTPRequestHandlerFactory::Ptr ListenerSpec::dispatch() const
{
	return _pDispatch;
}


} } // namespace Portico::endpoint


#endif // Endpoint_ListenerSpec_INCLUDED
