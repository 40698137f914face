//
// LifecycleManager.h
//
// Library: endpoint
// Package: Lifecycle
// Module:  LifecycleManager
//
// Definition of the LifecycleManager class.
//
// Copyright (c) 2019-2020, Tekenlight Solutions Pvt Ltd.
// and Contributors.
//
// SPDX-License-Identifier:	BSL-1.0
//


#ifndef Endpoint_LifecycleManager_INCLUDED
#define Endpoint_LifecycleManager_INCLUDED


#include "Portico/endpoint/endpoint.h"
#include "Portico/endpoint/EndpointConfig.h"
#include "Portico/endpoint/EndpointConfigResolver.h"
#include "Portico/endpoint/EndpointRegistry.h"
#include "Portico/endpoint/ServerAdapter.h"
#include "Poco/Net/HTTPRequestHandlerFactory.h"
#include "Poco/Util/AbstractConfiguration.h"
#include "Poco/Logger.h"


namespace Portico {
namespace endpoint {


class Endpoint_API LifecycleManager
	/// Starts and stops the listeners of endpoints.
	///
	/// On start() the configuration of the endpoint is resolved
	/// from the application configuration and registered in the
	/// EndpointRegistry. Then a plain listener is started if the
	/// http section is enabled, and a secure listener if the https
	/// section is enabled. stop() shuts both down again and removes
	/// the registration.
	///
	/// start() and stop() are expected to be called once each, in
	/// that order, for an endpoint identifier. The LifecycleManager
	/// does no locking of its own; calls for the same endpoint must
	/// be serialized by the caller.
	///
	/// Status messages are written to the "Portico.Endpoint" logger.
{
public:
	LifecycleManager(ServerAdapter& adapter, EndpointRegistry& registry, Poco::Util::AbstractConfiguration::Ptr pConfig);
		/// Creates the LifecycleManager.
		///
		/// The adapter and the registry must outlive the LifecycleManager.

	~LifecycleManager();

	void start(const std::string& appId, const std::string& endpointId);
		/// Starts the endpoint without a dispatch target. Only useful
		/// with adapters that do not require one, or for endpoints
		/// that bind no listeners.

	void start(const std::string& appId, const std::string& endpointId, Poco::Net::HTTPRequestHandlerFactory::Ptr pDispatch);
		/// Registers the configuration of the endpoint and starts
		/// its listeners, handing the requests to pDispatch.
		///
		/// Throws an EndpointConfigException if the configuration is
		/// invalid, an EndpointExistsException if the endpoint is already
		/// registered, a PortInUseException if a port is already bound
		/// and a ListenerStartException if a listener fails to start
		/// for any other reason.
		///
		/// If start() fails, listeners already started by the call are
		/// stopped again and the endpoint is not left registered.

	void stop(const std::string& endpointId);
		/// Stops the listeners of the endpoint and removes its
		/// registration. Errors reported by the adapter are logged
		/// and do not prevent the removal. Does nothing if the
		/// endpoint is not registered.

	std::string computeUrl(const std::string& endpointId) const;
		/// Returns the URL of the registered endpoint.
		///
		/// Throws a Poco::NotFoundException if the endpoint is not registered.

	bool isRunning(const std::string& endpointId) const;
		/// Returns true if the endpoint is registered.

	const EndpointConfig& config(const std::string& endpointId) const;
		/// Returns the registered configuration of the endpoint.
		///
		/// Throws a Poco::NotFoundException if the endpoint is not registered.

	const EndpointRegistry::Handles& listeners(const std::string& endpointId) const;
		/// Returns the running listeners of the endpoint.
		///
		/// Throws a Poco::NotFoundException if the endpoint is not registered.

	EndpointConfig resolveConfig(const std::string& appId, const std::string& endpointId) const;
		/// Returns the configuration start() would register for the
		/// endpoint, without registering it.

protected:
	ListenerHandle::Ptr startListener(const ListenerSpec& spec);
	void stopListener(const std::string& ref);
	void rollback(const std::string& endpointId);

private:
	LifecycleManager();
	LifecycleManager(const LifecycleManager&);
	LifecycleManager& operator = (const LifecycleManager&);

	ServerAdapter& _adapter;
	EndpointRegistry& _registry;
	EndpointConfigResolver _resolver;
	Poco::Logger& _logger;
};


} } // namespace Portico::endpoint


#endif // Endpoint_LifecycleManager_INCLUDED
