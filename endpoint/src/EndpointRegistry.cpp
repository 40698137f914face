//
// EndpointRegistry.cpp
//
// Library: endpoint
// Package: Lifecycle
// Module:  EndpointRegistry
//
// Copyright (c) 2019-2020, Tekenlight Solutions Pvt Ltd.
// and Contributors.
//
// SPDX-License-Identifier:	BSL-1.0
//


#include "Portico/endpoint/EndpointRegistry.h"
#include "Portico/endpoint/EndpointException.h"
#include "Poco/Exception.h"


namespace Portico {
namespace endpoint {


EndpointRegistry::EndpointRegistry()
{
}


EndpointRegistry::~EndpointRegistry()
{
}


void EndpointRegistry::add(const EndpointConfig& config)
{
	if (has(config.endpointId))
		throw EndpointExistsException(config.endpointId);

	Entry entry;
	entry.config = config;
	_entries.insert(EntryMap::value_type(config.endpointId, entry));
}


const EndpointConfig& EndpointRegistry::config(const std::string& endpointId) const
{
	EntryMap::const_iterator it = _entries.find(endpointId);
	if (it == _entries.end())
		throw Poco::NotFoundException("Endpoint", endpointId);
	return it->second.config;
}


const EndpointConfig* EndpointRegistry::find(const std::string& endpointId) const
{
	EntryMap::const_iterator it = _entries.find(endpointId);
	if (it == _entries.end()) return 0;
	return &it->second.config;
}


void EndpointRegistry::attach(const std::string& endpointId, ListenerHandle::Ptr pHandle)
{
	poco_check_ptr (pHandle);

	EntryMap::iterator it = _entries.find(endpointId);
	if (it == _entries.end())
		throw Poco::NotFoundException("Endpoint", endpointId);
	it->second.handles.push_back(pHandle);
}


const EndpointRegistry::Handles& EndpointRegistry::handles(const std::string& endpointId) const
{
	EntryMap::const_iterator it = _entries.find(endpointId);
	if (it == _entries.end())
		throw Poco::NotFoundException("Endpoint", endpointId);
	return it->second.handles;
}


bool EndpointRegistry::remove(const std::string& endpointId)
{
	return _entries.erase(endpointId) > 0;
}


std::vector<std::string> EndpointRegistry::endpoints() const
{
	std::vector<std::string> result;
	for (EntryMap::const_iterator it = _entries.begin(); it != _entries.end(); ++it)
	{
		result.push_back(it->first);
	}
	return result;
}


} } // namespace Portico::endpoint
