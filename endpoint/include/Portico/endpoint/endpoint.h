//
// endpoint.h
//
// Library: endpoint
// Package: EndpointCore
// Module:  endpoint
//
// Basic definitions for the Portico endpoint library.
// This file must be the first file included by every other endpoint
// header file.
//
// Copyright (c) 2019-2020, Tekenlight Solutions Pvt Ltd.
// and Contributors.
//
// SPDX-License-Identifier:	BSL-1.0
//


#ifndef Endpoint_Endpoint_INCLUDED
#define Endpoint_Endpoint_INCLUDED


#include "Poco/Foundation.h"


//
// The following block is the standard way of creating macros which make exporting
// from a DLL simpler. All files within this DLL are compiled with the Endpoint_EXPORTS
// symbol defined on the command line. this symbol should not be defined on any project
// that uses this DLL. This way any other project whose source files include this file see
// Endpoint_API functions as being imported from a DLL, wheras this DLL sees symbols
// defined with this macro as being exported.
//
#if defined(_WIN32) && defined(POCO_DLL)
	#if defined(Endpoint_EXPORTS)
		#define Endpoint_API __declspec(dllexport)
	#else
		#define Endpoint_API __declspec(dllimport)
	#endif
#endif


#if !defined(Endpoint_API)
	#if !defined(POCO_NO_GCC_API_ATTRIBUTE) && defined (__GNUC__) && (__GNUC__ >= 4)
		#define Endpoint_API __attribute__ ((visibility ("default")))
	#else
		#define Endpoint_API
	#endif
#endif


#define ENDPOINT_DEFAULT_HTTP_PORT 4000
#define ENDPOINT_DEFAULT_HTTPS_PORT 4040
#define ENDPOINT_DEFAULT_HOST "localhost"
#define ENDPOINT_LONGPOLLER_WINDOW_MS 10000
#define ENDPOINT_WEBSOCKET_SERIALIZER "JSONSerializer"
#define ENDPOINT_ERROR_VIEW_SUFFIX "ErrorView"


#endif // Endpoint_Endpoint_INCLUDED
