//
// HTTPServerAdapter.cpp
//
// Library: endpoint
// Package: Lifecycle
// Module:  HTTPServerAdapter
//
// Copyright (c) 2019-2020, Tekenlight Solutions Pvt Ltd.
// and Contributors.
//
// SPDX-License-Identifier:	BSL-1.0
//


#include "Portico/endpoint/HTTPServerAdapter.h"
#include "Portico/endpoint/EndpointException.h"
#include "Poco/Net/SecureServerSocket.h"
#include "Poco/Net/SocketAddress.h"
#include "Poco/Net/NetException.h"
#include "Poco/Net/SocketDefs.h"
#include "Poco/NumberParser.h"
#include "Poco/Timespan.h"
#include "Poco/Format.h"
#include "Poco/Exception.h"
#include "Poco/ErrorHandler.h"
#include "Poco/Bugcheck.h"
#include <algorithm>
#include <vector>


using Poco::Net::ServerSocket;
using Poco::Net::SecureServerSocket;
using Poco::Net::SocketAddress;
using Poco::Net::Context;
using Poco::Net::HTTPServerParams;


namespace Portico {
namespace endpoint {


HTTPServerAdapter::Listener::Listener(const ListenerSpec& spec, const ServerSocket& socket, HTTPServerParams::Ptr pParams):
	ListenerHandle(spec.ref(), spec.scheme(), socket.address().port()),
	_threadPool(spec.ref(), 2, std::max(2, pParams->getMaxThreads())),
	_server(spec.dispatch(), _threadPool, socket, pParams)
{
}


HTTPServerAdapter::Listener::~Listener()
{
}


void HTTPServerAdapter::Listener::start()
{
	_server.start();
}


void HTTPServerAdapter::Listener::stop()
{
	_server.stopAll(true);
	_threadPool.joinAll();
}


HTTPServerAdapter::HTTPServerAdapter():
	_logger(Poco::Logger::get("Portico.HTTPServerAdapter"))
{
}


HTTPServerAdapter::~HTTPServerAdapter()
{
	try
	{
		stopAll();
	}
	catch (Poco::Exception& exc)
	{
		Poco::ErrorHandler::handle(exc);
	}
	catch (...)
	{
		poco_unexpected();
	}
}


std::string HTTPServerAdapter::name() const
{
	return "Poco::Net::HTTPServer";
}


ListenerHandle::Ptr HTTPServerAdapter::startListener(const ListenerSpec& spec)
{
	if (!spec.dispatch())
		throw Poco::InvalidArgumentException("No dispatch target for listener", spec.ref());

	Poco::FastMutex::ScopedLock lock(_mutex);

	if (_listeners.find(spec.ref()) != _listeners.end())
		throw Poco::ExistsException("Listener", spec.ref());

	ServerSocket socket = createSocket(spec);
	Listener::Ptr pListener = new Listener(spec, socket, createParams(spec));
	pListener->start();
	_listeners[spec.ref()] = pListener;

	_logger.debug(Poco::format("Listener %s bound to %s", spec.ref(), socket.address().toString()));

	return ListenerHandle::Ptr(pListener.get(), true);
}


void HTTPServerAdapter::stopListener(const std::string& ref)
{
	Listener::Ptr pListener;
	{
		Poco::FastMutex::ScopedLock lock(_mutex);

		ListenerMap::iterator it = _listeners.find(ref);
		if (it == _listeners.end()) return;
		pListener = it->second;
		_listeners.erase(it);
	}

	pListener->stop();
	_logger.debug(Poco::format("Listener %s stopped", ref));
}


void HTTPServerAdapter::stopAll()
{
	std::vector<std::string> refs;
	{
		Poco::FastMutex::ScopedLock lock(_mutex);

		for (ListenerMap::const_iterator it = _listeners.begin(); it != _listeners.end(); ++it)
		{
			refs.push_back(it->first);
		}
	}

	for (std::vector<std::string>::const_iterator it = refs.begin(); it != refs.end(); ++it)
	{
		stopListener(*it);
	}
}


bool HTTPServerAdapter::isListening(const std::string& ref) const
{
	Poco::FastMutex::ScopedLock lock(_mutex);

	return _listeners.find(ref) != _listeners.end();
}


std::size_t HTTPServerAdapter::count() const
{
	Poco::FastMutex::ScopedLock lock(_mutex);

	return _listeners.size();
}


ServerSocket HTTPServerAdapter::createSocket(const ListenerSpec& spec) const
{
	if (spec.port() < 0 || spec.port() > 65535)
		throw Poco::InvalidArgumentException("Port out of range", Poco::format("%d", spec.port()));

	SocketAddress address(spec.get("ip", "0.0.0.0"), static_cast<Poco::UInt16>(spec.port()));
	int backlog = intOption(spec, "backlog", 64);

	try
	{
		if (spec.scheme() == ListenerSpec::SCHEME_SECURE)
		{
			SecureServerSocket socket(createContext(spec));
			socket.bind(address, true, false);
			socket.listen(backlog);
			return socket;
		}
		else
		{
			ServerSocket socket;
			socket.bind(address, true, false);
			socket.listen(backlog);
			return socket;
		}
	}
	catch (Poco::Net::NetException& exc)
	{
		if (exc.code() == POCO_EADDRINUSE)
			throw AddressInUseException(address.toString(), spec.port());
		throw;
	}
}


Context::Ptr HTTPServerAdapter::createContext(const ListenerSpec& spec) const
{
	std::string keyfile = spec.get("keyfile", "");
	std::string certfile = spec.get("certfile", "");
	if (keyfile.empty() || certfile.empty())
		throw Poco::InvalidArgumentException("Secure listener requires keyfile and certfile", spec.ref());

	Context::VerificationMode mode = Context::VERIFY_RELAXED;
	std::string verification = spec.get("verificationMode", "relaxed");
	if (verification == "none")
		mode = Context::VERIFY_NONE;
	else if (verification == "relaxed")
		mode = Context::VERIFY_RELAXED;
	else if (verification == "strict")
		mode = Context::VERIFY_STRICT;
	else if (verification == "once")
		mode = Context::VERIFY_ONCE;
	else
		throw Poco::InvalidArgumentException("verificationMode", verification);

	return new Context(Context::SERVER_USE,
		keyfile,
		certfile,
		spec.get("cacertfile", ""),
		mode,
		9,
		false,
		spec.get("cipherList", "ALL:!ADH:!LOW:!EXP:!MD5:@STRENGTH"));
}


HTTPServerParams::Ptr HTTPServerAdapter::createParams(const ListenerSpec& spec) const
{
	HTTPServerParams::Ptr pParams = new HTTPServerParams;

	pParams->setMaxThreads(intOption(spec, "maxThreads", intOption(spec, "acceptors", 16)));
	pParams->setMaxQueued(intOption(spec, "maxQueued", intOption(spec, "maxConnections", 64)));
	pParams->setKeepAlive(boolOption(spec, "keepAlive", true));
	pParams->setMaxKeepAliveRequests(intOption(spec, "maxKeepAliveRequests", 0));
	pParams->setKeepAliveTimeout(Poco::Timespan(intOption(spec, "keepAliveTimeout", 10), 0));
	pParams->setTimeout(Poco::Timespan(intOption(spec, "timeout", 60), 0));
	if (spec.has("serverName"))
		pParams->setServerName(spec.get("serverName", ""));
	pParams->setSoftwareVersion(spec.get("softwareVersion", "Portico/1.0"));

	return pParams;
}


int HTTPServerAdapter::intOption(const ListenerSpec& spec, const std::string& name, int deflt)
{
	if (!spec.has(name)) return deflt;

	int value = 0;
	if (!Poco::NumberParser::tryParse(spec.get(name, ""), value))
		throw Poco::InvalidArgumentException(name, spec.get(name, ""));
	return value;
}


bool HTTPServerAdapter::boolOption(const ListenerSpec& spec, const std::string& name, bool deflt)
{
	if (!spec.has(name)) return deflt;

	bool value = false;
	if (!Poco::NumberParser::tryParseBool(spec.get(name, ""), value))
		throw Poco::InvalidArgumentException(name, spec.get(name, ""));
	return value;
}


} } // namespace Portico::endpoint
