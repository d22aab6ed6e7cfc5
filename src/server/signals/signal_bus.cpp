// Copyright (c) DarkMatter Projects 2023-2025
// Licensed under the GNU General Public License 2.0.
//
// signal_bus.cpp - Subscription bookkeeping and dispatch for host callbacks.

#include "signal_bus.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace modevote::server::signals {
namespace {

/*
=============
AddSubscriber
=============
*/
template<typename Channel, typename Handler>
void AddSubscriber(Channel& channel, SubscriptionId id, Handler handler, bool dispatching) {
	auto& target = dispatching ? channel.pending : channel.subscribers;
	target.push_back({ id, std::move(handler), true });
}

/*
=============
RemoveSubscriber

Inside a dispatch the entry is only deactivated; FlushPending erases it.
=============
*/
template<typename Channel>
bool RemoveSubscriber(Channel& channel, SubscriptionId id, bool dispatching) {
	auto it = std::find_if(channel.subscribers.begin(), channel.subscribers.end(), [id](const auto& entry) {
		return entry.active && entry.id == id;
	});
	if (it != channel.subscribers.end()) {
		if (dispatching)
			it->active = false;
		else
			channel.subscribers.erase(it);
		return true;
	}

	return std::erase_if(channel.pending, [id](const auto& entry) { return entry.id == id; }) > 0;
}

/*
=============
ClearChannel
=============
*/
template<typename Channel>
void ClearChannel(Channel& channel, bool dispatching) {
	channel.pending.clear();
	if (!dispatching) {
		channel.subscribers.clear();
		return;
	}

	for (auto& entry : channel.subscribers)
		entry.active = false;
}

/*
=============
CountActive
=============
*/
template<typename Channel>
size_t CountActive(const Channel& channel) {
	const auto active = std::count_if(channel.subscribers.begin(), channel.subscribers.end(), [](const auto& entry) {
		return entry.active;
	});
	return static_cast<size_t>(active) + channel.pending.size();
}

/*
=============
FlushChannel
=============
*/
template<typename Channel>
void FlushChannel(Channel& channel) {
	std::erase_if(channel.subscribers, [](const auto& entry) { return !entry.active; });
	std::move(channel.pending.begin(), channel.pending.end(), std::back_inserter(channel.subscribers));
	channel.pending.clear();
}

} // namespace

/*
=============
SignalBus::DispatchScope

Tracks dispatch nesting; the outermost scope applies deferred changes.
=============
*/
class SignalBus::DispatchScope {
	public:
	explicit DispatchScope(SignalBus& bus)
		: bus_(bus) {
		++bus_.dispatchDepth_;
	}

	~DispatchScope() {
		if (--bus_.dispatchDepth_ == 0)
			bus_.FlushPending();
	}

	DispatchScope(const DispatchScope&) = delete;
	DispatchScope& operator=(const DispatchScope&) = delete;

	private:
	SignalBus& bus_;
};

/*
=============
SignalBus::SubscribeMutate
=============
*/
SubscriptionId SignalBus::SubscribeMutate(MutateHandler handler) {
	const SubscriptionId id = nextId_++;
	AddSubscriber(mutate_, id, std::move(handler), dispatchDepth_ > 0);
	return id;
}

/*
=============
SignalBus::SubscribeCheckReplacement
=============
*/
SubscriptionId SignalBus::SubscribeCheckReplacement(CheckReplacementHandler handler) {
	const SubscriptionId id = nextId_++;
	AddSubscriber(checkReplacement_, id, std::move(handler), dispatchDepth_ > 0);
	return id;
}

/*
=============
SignalBus::SubscribeModifyLogin
=============
*/
SubscriptionId SignalBus::SubscribeModifyLogin(ModifyLoginHandler handler) {
	const SubscriptionId id = nextId_++;
	AddSubscriber(modifyLogin_, id, std::move(handler), dispatchDepth_ > 0);
	return id;
}

/*
=============
SignalBus::Unsubscribe
=============
*/
bool SignalBus::Unsubscribe(SubscriptionId id) {
	const bool dispatching = dispatchDepth_ > 0;
	return RemoveSubscriber(mutate_, id, dispatching)
		|| RemoveSubscriber(checkReplacement_, id, dispatching)
		|| RemoveSubscriber(modifyLogin_, id, dispatching);
}

/*
=============
SignalBus::Clear
=============
*/
void SignalBus::Clear() {
	const bool dispatching = dispatchDepth_ > 0;
	ClearChannel(mutate_, dispatching);
	ClearChannel(checkReplacement_, dispatching);
	ClearChannel(modifyLogin_, dispatching);
}

/*
=============
SignalBus::SubscriberCount
=============
*/
size_t SignalBus::SubscriberCount() const {
	return CountActive(mutate_) + CountActive(checkReplacement_) + CountActive(modifyLogin_);
}

/*
=============
SignalBus::FlushPending
=============
*/
void SignalBus::FlushPending() {
	FlushChannel(mutate_);
	FlushChannel(checkReplacement_);
	FlushChannel(modifyLogin_);
}

/*
=============
SignalBus::DispatchMutate

Iterates by index up to the size at entry; the list is not reshaped until
the outermost dispatch ends.
=============
*/
void SignalBus::DispatchMutate(std::string_view command, int senderId) {
	DispatchScope scope(*this);
	const size_t count = mutate_.subscribers.size();
	for (size_t i = 0; i < count; ++i) {
		const auto& entry = mutate_.subscribers[i];
		if (entry.active && entry.handler)
			entry.handler(command, senderId);
	}
}

/*
=============
SignalBus::DispatchCheckReplacement

An empty subscriber list keeps the replaced object.
=============
*/
bool SignalBus::DispatchCheckReplacement(ReplacementQuery& query) {
	DispatchScope scope(*this);
	const size_t count = checkReplacement_.subscribers.size();
	for (size_t i = 0; i < count; ++i) {
		const auto& entry = checkReplacement_.subscribers[i];
		if (entry.active && entry.handler && !entry.handler(query))
			return false;
	}
	return true;
}

/*
=============
SignalBus::DispatchModifyLogin
=============
*/
void SignalBus::DispatchModifyLogin(std::string& portal, std::string& options) {
	DispatchScope scope(*this);
	const size_t count = modifyLogin_.subscribers.size();
	for (size_t i = 0; i < count; ++i) {
		const auto& entry = modifyLogin_.subscribers[i];
		if (entry.active && entry.handler)
			entry.handler(portal, options);
	}
}

} // namespace modevote::server::signals
