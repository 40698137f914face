//
// LifecycleManager.cpp
//
// Library: endpoint
// Package: Lifecycle
// Module:  LifecycleManager
//
// Copyright (c) 2019-2020, Tekenlight Solutions Pvt Ltd.
// and Contributors.
//
// SPDX-License-Identifier:	BSL-1.0
//


#include "Portico/endpoint/LifecycleManager.h"
#include "Portico/endpoint/EndpointException.h"
#include "Portico/endpoint/EndpointURL.h"
#include "Poco/Format.h"
#include "Poco/Exception.h"


using Poco::Net::HTTPRequestHandlerFactory;


namespace Portico {
namespace endpoint {


LifecycleManager::LifecycleManager(ServerAdapter& adapter, EndpointRegistry& registry, Poco::Util::AbstractConfiguration::Ptr pConfig):
	_adapter(adapter),
	_registry(registry),
	_resolver(pConfig),
	_logger(Poco::Logger::get("Portico.Endpoint"))
{
}


LifecycleManager::~LifecycleManager()
{
}


void LifecycleManager::start(const std::string& appId, const std::string& endpointId)
{
	start(appId, endpointId, HTTPRequestHandlerFactory::Ptr());
}


void LifecycleManager::start(const std::string& appId, const std::string& endpointId, HTTPRequestHandlerFactory::Ptr pDispatch)
{
	EndpointConfig config = _resolver.resolveConfig(appId, endpointId);
	_registry.add(config);

	try
	{
		if (config.hasHTTP())
		{
			ListenerSpec spec = ListenerSpec::build(ListenerSpec::SCHEME_PLAIN, config, pDispatch);
			_registry.attach(endpointId, startListener(spec));
		}

		if (config.hasHTTPS())
		{
			ListenerSpec spec = ListenerSpec::build(ListenerSpec::SCHEME_SECURE, config, pDispatch);
			_registry.attach(endpointId, startListener(spec));
		}
	}
	catch (Poco::Exception& exc)
	{
		_logger.error(Poco::format("Could not start %s: %s", endpointId, exc.displayText()));
		rollback(endpointId);
		throw;
	}
}


void LifecycleManager::stop(const std::string& endpointId)
{
	const EndpointConfig* pConfig = _registry.find(endpointId);
	if (!pConfig) return;

	if (pConfig->hasHTTP())
		stopListener(ListenerSpec::reference(endpointId, ListenerSpec::SCHEME_PLAIN));

	if (pConfig->hasHTTPS())
		stopListener(ListenerSpec::reference(endpointId, ListenerSpec::SCHEME_SECURE));

	_registry.remove(endpointId);
}


std::string LifecycleManager::computeUrl(const std::string& endpointId) const
{
	return EndpointURL::compute(_registry.config(endpointId));
}


bool LifecycleManager::isRunning(const std::string& endpointId) const
{
	return _registry.has(endpointId);
}


const EndpointConfig& LifecycleManager::config(const std::string& endpointId) const
{
	return _registry.config(endpointId);
}


const EndpointRegistry::Handles& LifecycleManager::listeners(const std::string& endpointId) const
{
	return _registry.handles(endpointId);
}


EndpointConfig LifecycleManager::resolveConfig(const std::string& appId, const std::string& endpointId) const
{
	return _resolver.resolveConfig(appId, endpointId);
}


ListenerHandle::Ptr LifecycleManager::startListener(const ListenerSpec& spec)
{
	ListenerHandle::Ptr pHandle;
	try
	{
		pHandle = _adapter.startListener(spec);
	}
	catch (AddressInUseException&)
	{
		throw PortInUseException(spec.port());
	}
	catch (Poco::Exception& exc)
	{
		throw ListenerStartException(exc.displayText());
	}
	catch (std::exception& exc)
	{
		throw ListenerStartException(exc.what());
	}

	if (!pHandle)
		throw ListenerStartException("No listener handle returned for", spec.ref());

	_logger.information(Poco::format("Running %s with %s on port %d (%s)",
		spec.endpointId(), _adapter.name(), pHandle->port(), spec.schemeName()));

	return pHandle;
}


void LifecycleManager::stopListener(const std::string& ref)
{
	try
	{
		_adapter.stopListener(ref);
	}
	catch (Poco::Exception& exc)
	{
		_logger.warning(Poco::format("Could not stop listener %s: %s", ref, exc.displayText()));
	}
	catch (std::exception& exc)
	{
		_logger.warning(Poco::format("Could not stop listener %s: %s", ref, std::string(exc.what())));
	}
}


void LifecycleManager::rollback(const std::string& endpointId)
{
	const EndpointRegistry::Handles& handles = _registry.handles(endpointId);
	for (EndpointRegistry::Handles::const_iterator it = handles.begin(); it != handles.end(); ++it)
	{
		stopListener((*it)->ref());
	}
	_registry.remove(endpointId);
}


} } // namespace Portico::endpoint
