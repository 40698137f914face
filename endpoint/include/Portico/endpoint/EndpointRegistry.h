//
// EndpointRegistry.h
//
// Library: endpoint
// Package: Lifecycle
// Module:  EndpointRegistry
//
// Definition of the EndpointRegistry class.
//
// Copyright (c) 2019-2020, Tekenlight Solutions Pvt Ltd.
// and Contributors.
//
// SPDX-License-Identifier:	BSL-1.0
//


#ifndef Endpoint_EndpointRegistry_INCLUDED
#define Endpoint_EndpointRegistry_INCLUDED


#include "Portico/endpoint/endpoint.h"
#include "Portico/endpoint/EndpointConfig.h"
#include "Portico/endpoint/ServerAdapter.h"
#include <map>
#include <vector>


namespace Portico {
namespace endpoint {


class Endpoint_API EndpointRegistry
	/// The table of registered endpoints, keyed by endpoint
	/// identifier. Each entry holds the resolved configuration
	/// of the endpoint and the handles of its running listeners.
	///
	/// An EndpointRegistry is owned by whoever supervises the
	/// endpoints, usually together with a LifecycleManager.
	/// It does no locking; callers must serialize access for
	/// the same endpoint identifier.
{
public:
	typedef std::vector<ListenerHandle::Ptr> Handles;

	EndpointRegistry();
		/// Creates an empty EndpointRegistry.

	~EndpointRegistry();

	void add(const EndpointConfig& config);
		/// Registers config under its endpoint identifier.
		///
		/// Throws an EndpointExistsException if the identifier is
		/// already registered. The existing entry is left unchanged.

	bool has(const std::string& endpointId) const;
		/// Returns true if the endpoint is registered.

	const EndpointConfig& config(const std::string& endpointId) const;
		/// Returns the configuration of the endpoint.
		///
		/// Throws a Poco::NotFoundException if the endpoint is not registered.

	const EndpointConfig* find(const std::string& endpointId) const;
		/// Returns the configuration of the endpoint, or null
		/// if it is not registered.

	void attach(const std::string& endpointId, ListenerHandle::Ptr pHandle);
		/// Records a running listener of the endpoint.
		///
		/// Throws a Poco::NotFoundException if the endpoint is not registered.

	const Handles& handles(const std::string& endpointId) const;
		/// Returns the running listeners of the endpoint.
		///
		/// Throws a Poco::NotFoundException if the endpoint is not registered.

	bool remove(const std::string& endpointId);
		/// Removes the endpoint together with its listener handles.
		/// Returns false if the endpoint was not registered.

	std::vector<std::string> endpoints() const;
		/// Returns the identifiers of all registered endpoints.

	std::size_t size() const;

private:
	EndpointRegistry(const EndpointRegistry&);
	EndpointRegistry& operator = (const EndpointRegistry&);

	struct Entry
	{
		EndpointConfig config;
		Handles handles;
	};
	typedef std::map<std::string, Entry> EntryMap;

	EntryMap _entries;
};


//
// inlines
//
inline bool EndpointRegistry::has(const std::string& endpointId) const
{
	return _entries.find(endpointId) != _entries.end();
}


inline std::size_t EndpointRegistry::size() const
{
	return _entries.size();
}


} } // namespace Portico::endpoint


#endif // Endpoint_EndpointRegistry_INCLUDED
