/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

test_signal_bus.cpp implementation.*/

#include "server/signals/signal_bus.hpp"

#include <cassert>
#include <string>
#include <vector>

using namespace modevote::server::signals;

/*
=============
TestMutateOrder
=============
*/
static void TestMutateOrder()
{
	SignalBus bus;
	std::vector<std::string> calls;

	bus.SubscribeMutate([&](std::string_view command, int senderId) {
		calls.push_back("first:" + std::string(command) + ":" + std::to_string(senderId));
	});
	const SubscriptionId second = bus.SubscribeMutate([&](std::string_view command, int) {
		calls.push_back("second:" + std::string(command));
	});

	bus.DispatchMutate("help", 3);
	assert(calls.size() == 2);
	assert(calls[0] == "first:help:3");
	assert(calls[1] == "second:help");

	assert(bus.Unsubscribe(second));
	assert(!bus.Unsubscribe(second));
	calls.clear();
	bus.DispatchMutate("status", 1);
	assert(calls.size() == 1);
}

/*
=============
TestCheckReplacement
=============
*/
static void TestCheckReplacement()
{
	SignalBus bus;
	ReplacementQuery query{ "KFMod.Single", false };
	assert(bus.DispatchCheckReplacement(query));

	int lateCalls = 0;
	bus.SubscribeCheckReplacement([](ReplacementQuery& q) {
		q.superRelevant = true;
		return true;
	});
	bus.SubscribeCheckReplacement([](ReplacementQuery& q) {
		return q.className != "KFMod.Single";
	});
	bus.SubscribeCheckReplacement([&](ReplacementQuery&) {
		++lateCalls;
		return true;
	});

	assert(!bus.DispatchCheckReplacement(query));
	assert(query.superRelevant);
	assert(lateCalls == 0);

	ReplacementQuery other{ "KFMod.Dualies", false };
	assert(bus.DispatchCheckReplacement(other));
	assert(lateCalls == 1);
}

/*
=============
TestModifyLogin
=============
*/
static void TestModifyLogin()
{
	SignalBus bus;
	bus.SubscribeModifyLogin([](std::string& portal, std::string& options) {
		portal = "lobby";
		options += "?Name=Player";
	});
	bus.SubscribeModifyLogin([](std::string&, std::string& options) {
		options += "?Team=1";
	});

	std::string portal;
	std::string options = "?Class=Engineer";
	bus.DispatchModifyLogin(portal, options);
	assert(portal == "lobby");
	assert(options == "?Class=Engineer?Name=Player?Team=1");
}

/*
=============
TestSubscribeDuringDispatch

Changes made from inside a handler apply from the next dispatch on.
=============
*/
static void TestSubscribeDuringDispatch()
{
	SignalBus bus;
	int added = 0;
	int original = 0;

	bus.SubscribeMutate([&](std::string_view, int) {
		++original;
		bus.SubscribeMutate([&](std::string_view, int) { ++added; });
	});

	bus.DispatchMutate("a", 0);
	assert(original == 1);
	assert(added == 0);
	assert(bus.SubscriberCount() == 2);

	bus.DispatchMutate("b", 0);
	assert(original == 2);
	assert(added == 1);

	bus.Clear();
	assert(bus.SubscriberCount() == 0);
	bus.DispatchMutate("c", 0);
	assert(original == 2);
}

/*
=============
TestRemoveDuringDispatch

A handler removed while a dispatch is running is skipped for the rest of
that dispatch and dropped afterwards.
=============
*/
static void TestRemoveDuringDispatch()
{
	SignalBus bus;
	std::vector<std::string> calls;
	SubscriptionId victim = 0;

	const SubscriptionId self = bus.SubscribeMutate([&](std::string_view, int) {
		calls.push_back("self");
		assert(bus.Unsubscribe(self));
		assert(bus.Unsubscribe(victim));
	});
	victim = bus.SubscribeMutate([&](std::string_view, int) { calls.push_back("victim"); });
	bus.SubscribeMutate([&](std::string_view, int) { calls.push_back("last"); });

	bus.DispatchMutate("a", 0);
	assert(calls.size() == 2);
	assert(calls[0] == "self");
	assert(calls[1] == "last");
	assert(bus.SubscriberCount() == 1);

	calls.clear();
	bus.DispatchMutate("b", 0);
	assert(calls.size() == 1);
	assert(calls[0] == "last");
}

/*
=============
TestClearDuringDispatch
=============
*/
static void TestClearDuringDispatch()
{
	SignalBus bus;
	int later = 0;
	int added = 0;

	bus.SubscribeCheckReplacement([&](ReplacementQuery&) {
		bus.Clear();
		bus.SubscribeCheckReplacement([&](ReplacementQuery&) {
			++added;
			return true;
		});
		return true;
	});
	bus.SubscribeCheckReplacement([&](ReplacementQuery&) {
		++later;
		return false;
	});

	ReplacementQuery query{ "KFMod.Single", false };
	assert(bus.DispatchCheckReplacement(query));
	assert(later == 0);
	assert(added == 0);
	assert(bus.SubscriberCount() == 1);

	assert(bus.DispatchCheckReplacement(query));
	assert(added == 1);
}

/*
=============
TestNestedDispatch

Changes made inside a nested dispatch wait for the outermost one to end.
=============
*/
static void TestNestedDispatch()
{
	SignalBus bus;
	int inner = 0;
	bool nested = false;

	bus.SubscribeMutate([&](std::string_view command, int) {
		if (command != "outer")
			return;
		nested = true;
		bus.DispatchMutate("inner", 0);
		bus.SubscribeMutate([&](std::string_view, int) { ++inner; });
	});
	bus.SubscribeModifyLogin([&](std::string&, std::string&) {});

	bus.DispatchMutate("outer", 0);
	assert(nested);
	assert(inner == 0);
	assert(bus.SubscriberCount() == 3);

	bus.DispatchMutate("inner", 0);
	assert(inner == 1);
}

/*
=============
main
=============
*/
int main()
{
	TestMutateOrder();
	TestCheckReplacement();
	TestModifyLogin();
	TestSubscribeDuringDispatch();
	TestRemoveDuringDispatch();
	TestClearDuringDispatch();
	TestNestedDispatch();
	return 0;
}
