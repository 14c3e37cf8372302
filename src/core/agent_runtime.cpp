#include "core/agent_runtime.h"
#include "core/fanout.h"
#include "core/message.h"
#include "core/tamper.h"
#include "network/framing.h"
#include "utils/logger.h"
#include <atomic>
#include <list>
#include <mutex>
#include <random>
#include <system_error>
#include <thread>
#include <poll.h>
#include <sys/socket.h>

namespace liarslie::core {

namespace {

struct Handler {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
};

}

struct AgentRuntime::Impl {
    std::shared_ptr<const AgentProfile> profile;
    utils::NetworkSettings net;
    ShutdownSignal shutdown;
    std::atomic<bool> running{false};
    std::atomic<uint16_t> boundPort{0};
    std::list<Handler> handlers;

    std::mutex rngMtx;
    std::mt19937_64 rng{std::random_device{}()};

    std::string tag() const { return "agent " + std::to_string(profile->agentId); }

    void acceptLoop(int listenFd, AgentRuntime* self);
    void reapHandlers(bool all);
    void serveConnection(network::Socket sock, AgentRuntime* self);

    Result<void> authorize(const network::Envelope& request, uint64_t targetId) const;
    std::vector<network::Envelope> fetchPeerValues(const std::vector<AgentDescriptor>& peers);
    std::optional<network::Envelope> signReply(const Message& msg) const;
};

void AgentRuntime::Impl::acceptLoop(int listenFd, AgentRuntime* self) {
    while (!shutdown.triggered()) {
        struct pollfd pfd;
        pfd.fd = listenFd;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int pr = poll(&pfd, 1, 100);
        reapHandlers(false);
        if (pr <= 0) continue;

        network::Socket conn(::accept(listenFd, nullptr, nullptr));
        if (!conn.valid()) continue;

        auto done = std::make_shared<std::atomic<bool>>(false);
        Handler h;
        h.done = done;
        try {
            h.thread = std::thread([this, self, sock = std::move(conn), done]() mutable {
                serveConnection(std::move(sock), self);
                *done = true;
            });
        } catch (const std::system_error& e) {
            // the closure owned the socket, so the connection is already closed
            LOG_WARN(tag() + ": dropping connection, cannot start handler: " + e.what());
            continue;
        }
        handlers.push_back(std::move(h));
    }
}

void AgentRuntime::Impl::reapHandlers(bool all) {
    for (auto it = handlers.begin(); it != handlers.end();) {
        if (all || *it->done) {
            if (it->thread.joinable()) it->thread.join();
            it = handlers.erase(it);
        } else {
            ++it;
        }
    }
}

void AgentRuntime::Impl::serveConnection(network::Socket sock, AgentRuntime* self) {
    auto timeout = network::setIoTimeout(sock.fd(), net.ioTimeoutMs);
    if (!timeout.ok()) {
        LOG_WARN(tag() + ": " + timeout.error().describe());
        return;
    }
    auto request = network::recvEnvelope(sock.fd(), net.maxFrameSize);
    if (!request.ok()) {
        LOG_DEBUG(tag() + ": dropping request: " + request.error().describe());
        return;
    }
    auto reply = self->handleRequest(request.value());
    if (!reply) return;
    auto sent = network::sendEnvelope(sock.fd(), *reply);
    if (!sent.ok()) {
        LOG_WARN(tag() + ": reply not delivered: " + sent.error().describe());
    }
}

Result<void> AgentRuntime::Impl::authorize(const network::Envelope& request, uint64_t targetId) const {
    auto verified = network::verifyEnvelope(request, profile->clientPublicKey);
    if (!verified.ok()) return verified;
    if (targetId != profile->agentId) {
        return makeError(ErrorCode::AUTH_ERROR,
                         "wrong recipient: addressed to agent " + std::to_string(targetId));
    }
    return {};
}

std::vector<network::Envelope> AgentRuntime::Impl::fetchPeerValues(const std::vector<AgentDescriptor>& peers) {
    std::vector<network::Envelope> collected;
    auto query = network::signEnvelope(serialize(buildQueryValue()), profile->keys);
    if (!query.ok()) {
        ErrorHandler::instance().handle(query.error());
        return collected;
    }
    const network::Envelope& request = query.value();
    const utils::NetworkSettings& settings = net;

    auto results = fanOut(peers, net.fanoutThreads, [&request, &settings](const AgentDescriptor& peer) {
        return network::roundTrip(peer.address, peer.port, request, settings);
    });

    for (size_t i = 0; i < results.size(); i++) {
        if (results[i].ok()) {
            collected.push_back(std::move(results[i].value()));
            continue;
        }
        Error err = results[i].error();
        err.context = tag() + " -> agent " + std::to_string(peers[i].agentId);
        ErrorHandler::instance().handle(err);
    }
    return collected;
}

std::optional<network::Envelope> AgentRuntime::Impl::signReply(const Message& msg) const {
    auto env = network::signEnvelope(serialize(msg), profile->keys);
    if (!env.ok()) {
        LOG_ERROR(tag() + ": cannot sign reply: " + env.error().describe());
        return std::nullopt;
    }
    return env.value();
}

AgentRuntime::AgentRuntime(std::shared_ptr<const AgentProfile> profile, const utils::NetworkSettings& net)
    : impl_(std::make_unique<Impl>()) {
    impl_->profile = std::move(profile);
    impl_->net = net;
}

AgentRuntime::~AgentRuntime() {
    stop();
}

Result<void> AgentRuntime::run(ReadySignal ready) {
    auto listener = network::listenOn(impl_->profile->address, impl_->profile->port);
    if (!listener.ok()) {
        LOG_ERROR(impl_->tag() + ": " + listener.error().describe());
        ready.fail(listener.error().describe());
        return listener.error();
    }
    impl_->boundPort = listener.value().localPort();
    impl_->running = true;
    LOG_INFO(impl_->tag() + " listening on " + impl_->profile->address + ":" +
             std::to_string(impl_->boundPort.load()) + (impl_->profile->liar ? " (liar)" : ""));
    ready.notify(impl_->profile->agentId);

    impl_->acceptLoop(listener.value().fd(), this);

    listener.value().close();
    impl_->reapHandlers(true);
    impl_->running = false;
    LOG_INFO(impl_->tag() + " stopped");
    return {};
}

void AgentRuntime::stop() {
    impl_->shutdown.trigger();
}

bool AgentRuntime::running() const {
    return impl_->running;
}

uint16_t AgentRuntime::boundPort() const {
    return impl_->boundPort;
}

ShutdownSignal& AgentRuntime::shutdownSignal() {
    return impl_->shutdown;
}

const AgentProfile& AgentRuntime::profile() const {
    return *impl_->profile;
}

std::optional<network::Envelope> AgentRuntime::handleRequest(const network::Envelope& request) {
    auto decoded = deserialize(request.payload);
    if (!decoded.ok()) {
        LOG_WARN(impl_->tag() + ": " + decoded.error().describe());
        return std::nullopt;
    }
    const Message& msg = decoded.value();
    const AgentProfile& self = *impl_->profile;

    switch (tagOf(msg)) {
        case MessageTag::QUERY_VALUE:
            return impl_->signReply(buildSendValue(self.agentId, self.value));

        case MessageTag::SEND_VALUE:
        case MessageTag::FWD_VALUES:
            LOG_WARN(impl_->tag() + ": protocol violation, unexpected " + std::string(messageName(msg)));
            return std::nullopt;

        case MessageTag::KILL_AGENT: {
            auto auth = impl_->authorize(request, std::get<KillAgent>(msg).agentId);
            if (!auth.ok()) {
                LOG_WARN(impl_->tag() + ": rejected KillAgent: " + auth.error().describe());
                return std::nullopt;
            }
            LOG_INFO(impl_->tag() + ": kill request accepted");
            impl_->shutdown.trigger();
            return std::nullopt;
        }

        case MessageTag::FETCH_VALUES: {
            const auto& fetch = std::get<FetchValues>(msg);
            auto auth = impl_->authorize(request, fetch.agentId);
            if (!auth.ok()) {
                LOG_WARN(impl_->tag() + ": rejected FetchValues: " + auth.error().describe());
                return std::nullopt;
            }
            auto values = impl_->fetchPeerValues(fetch.peers);
            LOG_DEBUG(impl_->tag() + ": collected " + std::to_string(values.size()) + "/" +
                      std::to_string(fetch.peers.size()) + " peer values");
            if (self.liar) {
                std::lock_guard<std::mutex> lock(impl_->rngMtx);
                values = tamperReplies(values, self.tamperProbability, self.maxValue, impl_->rng);
            }
            return impl_->signReply(buildFwdValues(self.agentId, values));
        }
    }
    return std::nullopt;
}

}
