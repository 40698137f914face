//
// EndpointServer.cpp
//
// This sample demonstrates the LifecycleManager and HTTPServerAdapter classes.
//
// Copyright (c) 2019-2020, Tekenlight Solutions Pvt Ltd.
// and Contributors.
//
// SPDX-License-Identifier:	BSL-1.0
//


#include "Portico/endpoint/LifecycleManager.h"
#include "Portico/endpoint/HTTPServerAdapter.h"
#include "Portico/endpoint/EndpointRegistry.h"
#include "Portico/endpoint/EndpointURL.h"
#include "Portico/endpoint/EndpointException.h"
#include "Poco/Net/HTTPRequestHandler.h"
#include "Poco/Net/HTTPRequestHandlerFactory.h"
#include "Poco/Net/HTTPServerRequest.h"
#include "Poco/Net/HTTPServerResponse.h"
#include "Poco/Net/SSLManager.h"
#include "Poco/Exception.h"
#include "Poco/Util/ServerApplication.h"
#include "Poco/Util/Option.h"
#include "Poco/Util/OptionSet.h"
#include "Poco/Util/HelpFormatter.h"
#include <iostream>


using Portico::endpoint::LifecycleManager;
using Portico::endpoint::HTTPServerAdapter;
using Portico::endpoint::EndpointRegistry;
using Portico::endpoint::EndpointURL;
using Portico::endpoint::EndpointException;
using Portico::endpoint::EndpointConfigException;
using Portico::endpoint::PortInUseException;
using Poco::Net::HTTPRequestHandler;
using Poco::Net::HTTPRequestHandlerFactory;
using Poco::Net::HTTPServerRequest;
using Poco::Net::HTTPServerResponse;
using Poco::Util::ServerApplication;
using Poco::Util::Application;
using Poco::Util::Option;
using Poco::Util::OptionSet;
using Poco::Util::HelpFormatter;


class EndpointStatusRequestHandler: public HTTPRequestHandler
	/// Return a HTML document naming the endpoint and its URL.
{
public:
	EndpointStatusRequestHandler(const std::string& endpointId, const std::string& url):
		_endpointId(endpointId),
		_url(url)
	{
	}

	void handleRequest(HTTPServerRequest& request, HTTPServerResponse& response)
	{
		Application& app = Application::instance();
		app.logger().information("Request from " + request.clientAddress().toString());

		response.setChunkedTransferEncoding(true);
		response.setContentType("text/html");

		std::ostream& ostr = response.send();
		ostr << "<html><head><title>" << _endpointId << "</title></head>";
		ostr << "<body><h1>" << _endpointId << "</h1>";
		ostr << "<p>Serving " << _url << "</p>";
		ostr << "<p>" << request.getMethod() << " " << request.getURI() << "</p>";
		ostr << "</body></html>";
	}

private:
	std::string _endpointId;
	std::string _url;
};


class EndpointStatusRequestHandlerFactory: public HTTPRequestHandlerFactory
{
public:
	EndpointStatusRequestHandlerFactory(const std::string& endpointId, const std::string& url):
		_endpointId(endpointId),
		_url(url)
	{
	}

	HTTPRequestHandler* createRequestHandler(const HTTPServerRequest& request)
	{
		return new EndpointStatusRequestHandler(_endpointId, _url);
	}

private:
	std::string _endpointId;
	std::string _url;
};


class EndpointServer: public Poco::Util::ServerApplication
	/// The main application class.
	///
	/// This class handles command-line arguments and
	/// configuration files.
	/// Start the EndpointServer executable with the help
	/// option (/help on Windows, --help on Unix) for
	/// the available command line options.
	///
	/// To use the sample configuration file (EndpointServer.properties),
	/// copy the file to the directory where the EndpointServer executable
	/// resides. In the configuration file, you can specify the endpoint
	/// to run and its http and https sections.
	///
	/// With the sample configuration, point a web browser
	/// to http://localhost:4000/.
{
public:
	EndpointServer(): _helpRequested(false)
	{
		Poco::Net::initializeSSL();
	}

	~EndpointServer()
	{
		Poco::Net::uninitializeSSL();
	}

protected:
	void initialize(Application& self)
	{
		loadConfiguration(); // load default configuration files, if present
		ServerApplication::initialize(self);
	}

	void uninitialize()
	{
		ServerApplication::uninitialize();
	}

	void defineOptions(OptionSet& options)
	{
		ServerApplication::defineOptions(options);

		options.addOption(
			Option("help", "h", "display help information on command line arguments")
				.required(false)
				.repeatable(false));
		options.addOption(
			Option("app", "a", "the application the endpoint belongs to")
				.required(false)
				.repeatable(false)
				.argument("id")
				.binding("EndpointServer.app"));
		options.addOption(
			Option("endpoint", "e", "the endpoint to run")
				.required(false)
				.repeatable(false)
				.argument("id")
				.binding("EndpointServer.endpoint"));
	}

	void handleOption(const std::string& name, const std::string& value)
	{
		ServerApplication::handleOption(name, value);

		if (name == "help")
			_helpRequested = true;
	}

	void displayHelp()
	{
		HelpFormatter helpFormatter(options());
		helpFormatter.setCommand(commandName());
		helpFormatter.setUsage("OPTIONS");
		helpFormatter.setHeader("A web server running the listeners of one endpoint.");
		helpFormatter.format(std::cout);
	}

	int main(const std::vector<std::string>& args)
	{
		if (_helpRequested)
		{
			displayHelp();
			return Application::EXIT_OK;
		}

		std::string appId = config().getString("EndpointServer.app", "portico");
		std::string endpointId = config().getString("EndpointServer.endpoint", "Portico.Endpoint");

		HTTPServerAdapter adapter;
		EndpointRegistry registry;
		LifecycleManager manager(adapter, registry, Poco::Util::AbstractConfiguration::Ptr(&config(), true));

		try
		{
			std::string url = EndpointURL::compute(manager.resolveConfig(appId, endpointId));
			HTTPRequestHandlerFactory::Ptr pDispatch(new EndpointStatusRequestHandlerFactory(endpointId, url));
			// start the listeners of the endpoint
			manager.start(appId, endpointId, pDispatch);
		}
		catch (EndpointConfigException& exc)
		{
			logger().fatal(exc.displayText());
			return Application::EXIT_CONFIG;
		}
		catch (PortInUseException& exc)
		{
			logger().fatal(exc.displayText());
			return Application::EXIT_UNAVAILABLE;
		}
		catch (EndpointException& exc)
		{
			logger().fatal(exc.displayText());
			return Application::EXIT_SOFTWARE;
		}

		logger().information("Serving " + endpointId + " at " + manager.computeUrl(endpointId));
		// wait for CTRL-C or kill
		waitForTerminationRequest();
		// Stop the listeners
		manager.stop(endpointId);

		return Application::EXIT_OK;
	}

private:
	bool _helpRequested;
};


int main(int argc, char** argv)
{
	EndpointServer app;
	return app.run(argc, argv);
}
