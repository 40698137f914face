//
// ServerAdapter.cpp
//
// Library: endpoint
// Package: Lifecycle
// Module:  ServerAdapter
//
// Copyright (c) 2019-2020, Tekenlight Solutions Pvt Ltd.
// and Contributors.
//
// SPDX-License-Identifier:	BSL-1.0
//


#include "Portico/endpoint/ServerAdapter.h"


namespace Portico {
namespace endpoint {


ListenerHandle::ListenerHandle(const std::string& ref, ListenerSpec::Scheme scheme, int port):
	_ref(ref),
	_scheme(scheme),
	_port(port)
{
}


ListenerHandle::~ListenerHandle()
{
}


ServerAdapter::ServerAdapter()
{
}


ServerAdapter::~ServerAdapter()
{
}


} } // namespace Portico::endpoint
