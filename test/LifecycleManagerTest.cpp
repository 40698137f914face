//
// LifecycleManagerTest.cpp
//
// Copyright (c) 2019-2020, Tekenlight Solutions Pvt Ltd.
// and Contributors.
//
// SPDX-License-Identifier:	BSL-1.0
//


#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "Portico/endpoint/LifecycleManager.h"
#include "Portico/endpoint/EndpointException.h"
#include "Poco/Util/MapConfiguration.h"
#include "Poco/Logger.h"
#include "Poco/Channel.h"
#include "Poco/Message.h"
#include "Poco/AutoPtr.h"
#include <vector>

using namespace testing;
using namespace Portico::endpoint;
using Poco::Util::AbstractConfiguration;
using Poco::Util::MapConfiguration;

namespace
{

class MockServerAdapter : public ServerAdapter
{
public:
	MOCK_CONST_METHOD0(name, std::string());
	MOCK_METHOD1(startListener, ListenerHandle::Ptr(const ListenerSpec&));
	MOCK_METHOD1(stopListener, void(const std::string&));
};

class LifecycleManagerTest : public Test
{
protected:
	LifecycleManagerTest():
		pMap(new MapConfiguration),
		manager(adapter, registry, AbstractConfiguration::Ptr(pMap.get(), true))
	{
		ON_CALL(adapter, name()).WillByDefault(Return(std::string("MockServer")));
		EXPECT_CALL(adapter, name()).Times(AnyNumber());
	}

	void set(const std::string& key, const std::string& value)
	{
		pMap->setString("myapp.MyApp.Endpoint." + key, value);
	}

	// Accepts every listener, recording what it was asked to start.
	void acceptListeners()
	{
		ON_CALL(adapter, startListener(_)).WillByDefault(Invoke([this](const ListenerSpec& spec) {
			started.push_back(spec);
			return ListenerHandle::Ptr(new ListenerHandle(spec.ref(), spec.scheme(), spec.port()));
		}));
	}

	Poco::AutoPtr<MapConfiguration> pMap;
	NiceMock<MockServerAdapter> adapter;
	EndpointRegistry registry;
	LifecycleManager manager;
	std::vector<ListenerSpec> started;
};

class CapturingChannel: public Poco::Channel
{
public:
	void log(const Poco::Message& msg)
	{
		messages.push_back(msg);
	}

	bool contains(Poco::Message::Priority prio, const std::string& text) const
	{
		for (std::vector<Poco::Message>::const_iterator it = messages.begin(); it != messages.end(); ++it)
		{
			if (it->getPriority() == prio && it->getText() == text) return true;
		}
		return false;
	}

	std::vector<Poco::Message> messages;
};

class LifecycleManagerLoggingTest : public LifecycleManagerTest
{
protected:
	void SetUp()
	{
		pChannel = new CapturingChannel;
		Poco::Logger& logger = Poco::Logger::get("Portico.Endpoint");
		logger.setChannel(pChannel.get());
		logger.setLevel(Poco::Message::PRIO_INFORMATION);
	}

	void TearDown()
	{
		Poco::Logger::get("Portico.Endpoint").setChannel(0);
	}

	Poco::AutoPtr<CapturingChannel> pChannel;
};

TEST_F(LifecycleManagerTest, Start_NoListenersConfigured_BindsNothing)
{
	set("http", "false");
	EXPECT_CALL(adapter, startListener(_)).Times(0);
	EXPECT_CALL(adapter, stopListener(_)).Times(0);

	manager.start("myapp", "MyApp.Endpoint");

	EXPECT_TRUE(manager.isRunning("MyApp.Endpoint"));
	EXPECT_TRUE(manager.listeners("MyApp.Endpoint").empty());

	manager.stop("MyApp.Endpoint");

	EXPECT_FALSE(manager.isRunning("MyApp.Endpoint"));
	EXPECT_FALSE(registry.has("MyApp.Endpoint"));
}

TEST_F(LifecycleManagerTest, Start_HttpOnly_StartsPlainListenerOnDefaultPort)
{
	acceptListeners();
	set("http.maxThreads", "4");
	EXPECT_CALL(adapter, startListener(_)).Times(1);

	manager.start("myapp", "MyApp.Endpoint");

	ASSERT_EQ(started.size(), 1u);
	EXPECT_EQ(started[0].scheme(), ListenerSpec::SCHEME_PLAIN);
	EXPECT_EQ(started[0].port(), 4000);
	EXPECT_EQ(started[0].ref(), "MyApp.Endpoint.HTTP");
	EXPECT_EQ(started[0].get("maxThreads", ""), "4");
	ASSERT_EQ(manager.listeners("MyApp.Endpoint").size(), 1u);
	EXPECT_EQ(manager.listeners("MyApp.Endpoint")[0]->port(), 4000);
}

TEST_F(LifecycleManagerTest, Start_HttpAndHttps_HttpsInheritsHttpOptions)
{
	acceptListeners();
	set("http.a", "1");
	set("http.b", "2");
	set("https.b", "3");
	set("https.port", "4040");
	EXPECT_CALL(adapter, startListener(_)).Times(2);

	manager.start("myapp", "MyApp.Endpoint");

	ASSERT_EQ(started.size(), 2u);
	EXPECT_EQ(started[0].scheme(), ListenerSpec::SCHEME_PLAIN);
	EXPECT_EQ(started[0].get("b", ""), "2");
	EXPECT_EQ(started[1].scheme(), ListenerSpec::SCHEME_SECURE);
	EXPECT_EQ(started[1].ref(), "MyApp.Endpoint.HTTPS");
	EXPECT_EQ(started[1].get("a", ""), "1");
	EXPECT_EQ(started[1].get("b", ""), "3");
	EXPECT_EQ(started[1].port(), 4040);
	EXPECT_EQ(manager.listeners("MyApp.Endpoint").size(), 2u);
}

TEST_F(LifecycleManagerTest, Start_StringPort_IsCoercedToInteger)
{
	acceptListeners();
	set("http.port", "8080");

	manager.start("myapp", "MyApp.Endpoint");

	ASSERT_EQ(started.size(), 1u);
	EXPECT_EQ(started[0].port(), 8080);
}

TEST_F(LifecycleManagerTest, Start_AddressInUse_ThrowsPortInUseAndLeavesNothingBound)
{
	set("http.port", "4000");
	set("https.port", "4040");
	EXPECT_CALL(adapter, startListener(_))
		.WillOnce(Throw(AddressInUseException("0.0.0.0:4000", 4000)));
	EXPECT_CALL(adapter, stopListener(_)).Times(0);

	try
	{
		manager.start("myapp", "MyApp.Endpoint");
		FAIL() << "start() should have thrown";
	}
	catch (PortInUseException& exc)
	{
		EXPECT_EQ(exc.port(), 4000);
		EXPECT_EQ(exc.message(), "Port 4000 is already in use");
	}

	EXPECT_FALSE(manager.isRunning("MyApp.Endpoint"));
	EXPECT_EQ(registry.size(), 0u);
}

TEST_F(LifecycleManagerTest, Start_HttpsFails_StopsHttpListenerAndThrows)
{
	set("http.port", "4000");
	set("https.port", "4040");
	InSequence seq;
	EXPECT_CALL(adapter, startListener(_))
		.WillOnce(Return(ListenerHandle::Ptr(new ListenerHandle("MyApp.Endpoint.HTTP", ListenerSpec::SCHEME_PLAIN, 4000))));
	EXPECT_CALL(adapter, startListener(_))
		.WillOnce(Throw(Poco::IOException("no certificate")));
	EXPECT_CALL(adapter, stopListener("MyApp.Endpoint.HTTP")).Times(1);

	try
	{
		manager.start("myapp", "MyApp.Endpoint");
		FAIL() << "start() should have thrown";
	}
	catch (ListenerStartException& exc)
	{
		EXPECT_NE(exc.message().find("no certificate"), std::string::npos);
	}

	EXPECT_FALSE(manager.isRunning("MyApp.Endpoint"));
}

TEST_F(LifecycleManagerTest, Start_AdapterReturnsNoHandle_Throws)
{
	set("http.port", "4000");
	EXPECT_CALL(adapter, startListener(_)).WillOnce(Return(ListenerHandle::Ptr()));

	EXPECT_THROW(manager.start("myapp", "MyApp.Endpoint"), ListenerStartException);
	EXPECT_FALSE(manager.isRunning("MyApp.Endpoint"));
}

TEST_F(LifecycleManagerTest, Start_InvalidConfig_FailsBeforeRegistration)
{
	set("http.port", "not-a-port");
	EXPECT_CALL(adapter, startListener(_)).Times(0);

	EXPECT_THROW(manager.start("myapp", "MyApp.Endpoint"), EndpointConfigException);
	EXPECT_FALSE(manager.isRunning("MyApp.Endpoint"));
}

TEST_F(LifecycleManagerTest, Start_Twice_FailsFastAndKeepsRunningState)
{
	acceptListeners();
	set("http.port", "4000");
	EXPECT_CALL(adapter, startListener(_)).Times(1);

	manager.start("myapp", "MyApp.Endpoint");
	EXPECT_THROW(manager.start("myapp", "MyApp.Endpoint"), EndpointExistsException);

	EXPECT_TRUE(manager.isRunning("MyApp.Endpoint"));
	EXPECT_EQ(manager.listeners("MyApp.Endpoint").size(), 1u);
}

TEST_F(LifecycleManagerTest, Stop_StopsEveryEnabledScheme)
{
	acceptListeners();
	set("http.port", "4000");
	set("https.port", "4040");
	manager.start("myapp", "MyApp.Endpoint");

	EXPECT_CALL(adapter, stopListener("MyApp.Endpoint.HTTP")).Times(1);
	EXPECT_CALL(adapter, stopListener("MyApp.Endpoint.HTTPS")).Times(1);

	manager.stop("MyApp.Endpoint");

	EXPECT_FALSE(manager.isRunning("MyApp.Endpoint"));
}

TEST_F(LifecycleManagerTest, Stop_AdapterError_StillDeregisters)
{
	acceptListeners();
	set("http.port", "4000");
	set("https.port", "4040");
	manager.start("myapp", "MyApp.Endpoint");

	EXPECT_CALL(adapter, stopListener("MyApp.Endpoint.HTTP")).WillOnce(Throw(Poco::IOException("gone")));
	EXPECT_CALL(adapter, stopListener("MyApp.Endpoint.HTTPS")).Times(1);

	EXPECT_NO_THROW(manager.stop("MyApp.Endpoint"));
	EXPECT_FALSE(registry.has("MyApp.Endpoint"));
}

TEST_F(LifecycleManagerTest, Stop_UnknownEndpoint_DoesNothing)
{
	EXPECT_CALL(adapter, stopListener(_)).Times(0);

	EXPECT_NO_THROW(manager.stop("MyApp.Endpoint"));
}

TEST_F(LifecycleManagerTest, StartThenStop_CanStartAgain)
{
	acceptListeners();
	set("http.port", "4000");

	manager.start("myapp", "MyApp.Endpoint");
	manager.stop("MyApp.Endpoint");
	manager.start("myapp", "MyApp.Endpoint");

	EXPECT_TRUE(manager.isRunning("MyApp.Endpoint"));
	EXPECT_EQ(started.size(), 2u);
}

TEST_F(LifecycleManagerTest, ComputeUrl_UsesRegisteredConfig)
{
	acceptListeners();
	set("url.host", "example.com");
	set("http.port", "4000");

	EXPECT_THROW(manager.computeUrl("MyApp.Endpoint"), Poco::NotFoundException);

	manager.start("myapp", "MyApp.Endpoint");

	EXPECT_EQ(manager.computeUrl("MyApp.Endpoint"), "http://example.com:4000");
	EXPECT_EQ(manager.config("MyApp.Endpoint").url.host, "example.com");
}

TEST_F(LifecycleManagerLoggingTest, Start_Success_LogsStatusLinePerListener)
{
	acceptListeners();
	set("http.port", "4000");
	set("https.port", "4040");

	manager.start("myapp", "MyApp.Endpoint");

	EXPECT_TRUE(pChannel->contains(Poco::Message::PRIO_INFORMATION,
		"Running MyApp.Endpoint with MockServer on port 4000 (http)"));
	EXPECT_TRUE(pChannel->contains(Poco::Message::PRIO_INFORMATION,
		"Running MyApp.Endpoint with MockServer on port 4040 (https)"));
}

TEST_F(LifecycleManagerLoggingTest, Start_Failure_LogsError)
{
	set("http.port", "4000");
	EXPECT_CALL(adapter, startListener(_))
		.WillOnce(Throw(AddressInUseException("0.0.0.0:4000", 4000)));

	EXPECT_THROW(manager.start("myapp", "MyApp.Endpoint"), PortInUseException);

	ASSERT_EQ(pChannel->messages.size(), 1u);
	EXPECT_EQ(pChannel->messages[0].getPriority(), Poco::Message::PRIO_ERROR);
	EXPECT_NE(pChannel->messages[0].getText().find("Could not start MyApp.Endpoint"), std::string::npos);
	EXPECT_NE(pChannel->messages[0].getText().find("Port 4000 is already in use"), std::string::npos);
}

TEST_F(LifecycleManagerTest, ResolveConfig_DoesNotRegister)
{
	set("http.port", "4000");

	EndpointConfig config = manager.resolveConfig("myapp", "MyApp.Endpoint");

	EXPECT_TRUE(config.hasHTTP());
	EXPECT_FALSE(manager.isRunning("MyApp.Endpoint"));
}

}
