// Copyright (c) DarkMatter Projects 2023-2025
// Licensed under the GNU General Public License 2.0.
//
// signal_bus.hpp - Republishes host callbacks as subscribable signals.

#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace modevote::server::signals {

using SubscriptionId = uint32_t;

// Argument of the replacement-check callback. Handlers may flip
// superRelevant; the host reads it back after dispatch.
struct ReplacementQuery {
	std::string className;
	bool superRelevant{};
};

// Every subscriber runs once, in subscription order.
using MutateHandler = std::function<void(std::string_view command, int senderId)>;
// Subscribers run in order until one returns false.
using CheckReplacementHandler = std::function<bool(ReplacementQuery& query)>;
// Every subscriber runs once and may edit both strings.
using ModifyLoginHandler = std::function<void(std::string& portal, std::string& options)>;

/*
=================
SignalBus

Fixed set of host callback kinds. Dispatch is synchronous and runs over the
subscriber list in place. While a dispatch is running, new subscriptions are
parked until the outermost dispatch returns, and removed ones are only
flagged, so the list never reallocates under a running handler. A handler
removed mid-dispatch is not called again, including later in the same
dispatch.
=================
*/
class SignalBus {
	public:
	SubscriptionId SubscribeMutate(MutateHandler handler);
	SubscriptionId SubscribeCheckReplacement(CheckReplacementHandler handler);
	SubscriptionId SubscribeModifyLogin(ModifyLoginHandler handler);
	bool Unsubscribe(SubscriptionId id);
	void Clear();
	size_t SubscriberCount() const;

	void DispatchMutate(std::string_view command, int senderId);
	// Returns false as soon as a subscriber rejects the replacement.
	bool DispatchCheckReplacement(ReplacementQuery& query);
	void DispatchModifyLogin(std::string& portal, std::string& options);

	private:
	template<typename Handler>
	struct Subscriber {
		SubscriptionId id{};
		Handler handler;
		bool active = true;
	};

	template<typename Handler>
	struct Channel {
		std::vector<Subscriber<Handler>> subscribers;
		std::vector<Subscriber<Handler>> pending;
	};

	class DispatchScope;

	void FlushPending();

	SubscriptionId nextId_ = 1;
	int dispatchDepth_ = 0;
	Channel<MutateHandler> mutate_;
	Channel<CheckReplacementHandler> checkReplacement_;
	Channel<ModifyLoginHandler> modifyLogin_;
};

} // namespace modevote::server::signals
