/*
 * PeerRoom
 * In-memory PeerTransport for coordinator tests
 */

#include "loopback-transport.h"

#include <algorithm>

namespace peerroom
{

LoopbackLink::LoopbackLink(LoopbackTransport *owner, PeerId remoteId, ChannelKind kind, std::string connectionId)
    : owner_(owner), remoteId_(std::move(remoteId)), kind_(kind), connectionId_(std::move(connectionId))
{
}

const PeerId &LoopbackLink::peerId() const
{
	return remoteId_;
}

ChannelKind LoopbackLink::kind() const
{
	return kind_;
}

const std::string &LoopbackLink::connectionId() const
{
	return connectionId_;
}

bool LoopbackLink::isOpen() const
{
	return open_ && !closed_;
}

LoopbackNetwork::LoopbackNetwork(EventLoop &loop) : loop_(loop) {}

std::unique_ptr<LoopbackTransport> LoopbackNetwork::createTransport()
{
	std::unique_ptr<LoopbackTransport> transport(new LoopbackTransport(*this));
	live_.insert(transport.get());
	return transport;
}

bool LoopbackNetwork::isRegistered(const PeerId &peerId) const
{
	return registered_.count(peerId) > 0;
}

void LoopbackNetwork::dropPeer(const PeerId &peerId)
{
	auto it = registered_.find(peerId);
	if (it != registered_.end()) {
		it->second->kill();
	}
}

void LoopbackNetwork::holdRemoteCloses()
{
	holdCloses_ = true;
}

void LoopbackNetwork::releaseRemoteCloses()
{
	holdCloses_ = false;
	std::vector<std::shared_ptr<LoopbackLink>> held = std::move(heldCloses_);
	heldCloses_.clear();
	for (const auto &link : held) {
		loop_.post([this, link]() { closeRemoteEnd(link); });
	}
}

const std::vector<SentMessage> &LoopbackNetwork::sent() const
{
	return sent_;
}

std::vector<std::string> LoopbackNetwork::sentBetween(const PeerId &from, const PeerId &to) const
{
	std::vector<std::string> messages;
	for (const auto &entry : sent_) {
		if (entry.from == from && entry.to == to) {
			messages.push_back(entry.message);
		}
	}
	return messages;
}

void LoopbackNetwork::clearSent()
{
	sent_.clear();
}

bool LoopbackNetwork::isLive(const LoopbackTransport *transport) const
{
	return live_.count(transport) > 0;
}

std::string LoopbackNetwork::nextConnectionId(ChannelKind kind)
{
	return std::string(kind == ChannelKind::Media ? "mc_" : "dc_") + std::to_string(nextConnection_++);
}

void LoopbackNetwork::closeRemoteEnd(const std::shared_ptr<LoopbackLink> &link)
{
	if (holdCloses_) {
		heldCloses_.push_back(link);
		return;
	}
	auto other = link->other_.lock();
	if (!other || other->closed_) {
		return;
	}
	other->closed_ = true;
	other->open_ = false;
	if (isLive(other->owner_)) {
		other->owner_->emitLinkClosed(other);
	}
}

LoopbackTransport::LoopbackTransport(LoopbackNetwork &network) : network_(network) {}

LoopbackTransport::~LoopbackTransport()
{
	network_.live_.erase(this);
	auto it = network_.registered_.find(localId_);
	if (it != network_.registered_.end() && it->second == this) {
		network_.registered_.erase(it);
	}
}

bool LoopbackTransport::createPeer(const PeerId &localId, const TransportConfig &)
{
	localId_ = localId;
	log_.push_back("createPeer " + localId);

	LoopbackNetwork *network = &network_;
	network->loop_.post([network, self = this, localId]() {
		if (!network->isLive(self)) {
			return;
		}
		if (network->isRegistered(localId)) {
			self->emitError("unavailable-id");
			return;
		}
		network->registered_[localId] = self;
		self->registered_ = true;
		self->emitOpen(localId);
	});
	return true;
}

std::shared_ptr<LoopbackLink> LoopbackTransport::dial(const PeerId &peerId, ChannelKind kind,
                                                      const MediaStreamPtr &stream)
{
	if (!registered_) {
		return nullptr;
	}

	auto link = std::make_shared<LoopbackLink>(this, peerId, kind, network_.nextConnectionId(kind));
	link->offeredStream_ = stream;
	links_.push_back(link);

	LoopbackNetwork *network = &network_;
	network->loop_.post([network, self = this, link, peerId, kind, stream]() {
		if (!network->isLive(self) || link->closed_) {
			return;
		}

		auto it = network->registered_.find(peerId);
		if (it == network->registered_.end() || !network->isLive(it->second)) {
			self->emitLinkError(link, "peer-unavailable");
			return;
		}

		LoopbackTransport *target = it->second;
		auto remoteEnd = std::make_shared<LoopbackLink>(target, self->localId_, kind, link->connectionId_);
		remoteEnd->offeredStream_ = stream;
		remoteEnd->other_ = link;
		link->other_ = remoteEnd;
		target->links_.push_back(remoteEnd);

		if (kind == ChannelKind::Data) {
			target->emitIncomingDataLink(remoteEnd);
			target->openPair(remoteEnd, nullptr);
		} else {
			target->emitIncomingCall(remoteEnd);
		}
	});
	return link;
}

void LoopbackTransport::openPair(const std::shared_ptr<LoopbackLink> &link, const MediaStreamPtr &answerStream)
{
	LoopbackNetwork *network = &network_;
	network->loop_.post([network, link, answerStream]() {
		auto other = link->other_.lock();
		if (!other || link->closed_ || other->closed_) {
			return;
		}
		link->open_ = true;
		other->open_ = true;

		LoopbackTransport *dialer = other->owner_;
		LoopbackTransport *answerer = link->owner_;
		if (network->isLive(dialer)) {
			dialer->emitLinkOpen(other);
		}
		if (network->isLive(answerer)) {
			answerer->emitLinkOpen(link);
		}

		if (link->kind_ == ChannelKind::Media) {
			if (network->isLive(dialer)) {
				dialer->emitLinkStream(other, answerStream ? answerStream
				                                           : std::make_shared<MediaStream>(link->remoteId_));
			}
			if (network->isLive(answerer)) {
				const MediaStreamPtr offered = link->offeredStream_;
				answerer->emitLinkStream(link, offered ? offered : std::make_shared<MediaStream>(other->remoteId_));
			}
		}
	});
}

LinkPtr LoopbackTransport::connect(const PeerId &peerId)
{
	log_.push_back("connect " + peerId);
	return dial(peerId, ChannelKind::Data, nullptr);
}

LinkPtr LoopbackTransport::call(const PeerId &peerId, const MediaStreamPtr &localStream)
{
	log_.push_back("call " + peerId);
	return dial(peerId, ChannelKind::Media, localStream);
}

void LoopbackTransport::answer(const LinkPtr &link, const MediaStreamPtr &localStream)
{
	auto loopbackLink = std::dynamic_pointer_cast<LoopbackLink>(link);
	if (!loopbackLink || loopbackLink->closed_) {
		return;
	}
	log_.push_back("answer " + link->peerId());
	openPair(loopbackLink, localStream);
}

bool LoopbackTransport::send(const LinkPtr &link, const std::string &message)
{
	auto loopbackLink = std::dynamic_pointer_cast<LoopbackLink>(link);
	if (!loopbackLink || !loopbackLink->isOpen() || loopbackLink->kind_ != ChannelKind::Data) {
		return false;
	}

	log_.push_back("send " + link->peerId());
	network_.sent_.push_back({localId_, link->peerId(), message});

	LoopbackNetwork *network = &network_;
	network->loop_.post([network, loopbackLink, message]() {
		auto other = loopbackLink->other_.lock();
		if (!other || other->closed_ || !network->isLive(other->owner_)) {
			return;
		}
		other->owner_->emitLinkMessage(other, message);
	});
	return true;
}

void LoopbackTransport::close(const LinkPtr &link)
{
	auto loopbackLink = std::dynamic_pointer_cast<LoopbackLink>(link);
	if (!loopbackLink || loopbackLink->closed_) {
		return;
	}

	log_.push_back(std::string("close ") + link->peerId() + (link->kind() == ChannelKind::Data ? " data" : " media"));
	loopbackLink->closed_ = true;
	loopbackLink->open_ = false;

	LoopbackNetwork *network = &network_;
	network->loop_.post([network, self = this, loopbackLink]() {
		if (network->isLive(self)) {
			self->emitLinkClosed(loopbackLink);
		}
		network->closeRemoteEnd(loopbackLink);
	});
}

void LoopbackTransport::destroy()
{
	destroyCount_++;
	log_.push_back("destroy");

	const auto links = links_;
	for (const auto &link : links) {
		close(link);
	}

	auto it = network_.registered_.find(localId_);
	if (it != network_.registered_.end() && it->second == this) {
		network_.registered_.erase(it);
	}
	registered_ = false;
}

const PeerId &LoopbackTransport::localId() const
{
	return localId_;
}

size_t LoopbackTransport::openLinkCount() const
{
	return static_cast<size_t>(std::count_if(links_.begin(), links_.end(),
	                                         [](const std::shared_ptr<LoopbackLink> &link) { return link->isOpen(); }));
}

size_t LoopbackTransport::destroyCount() const
{
	return destroyCount_;
}

std::vector<std::string> LoopbackTransport::log() const
{
	return log_;
}

void LoopbackTransport::kill()
{
	network_.live_.erase(this);
	network_.registered_.erase(localId_);
	registered_ = false;

	LoopbackNetwork *network = &network_;
	for (const auto &link : links_) {
		if (link->closed_) {
			continue;
		}
		link->closed_ = true;
		link->open_ = false;
		network->loop_.post([network, link]() { network->closeRemoteEnd(link); });
	}
}

} // namespace peerroom
