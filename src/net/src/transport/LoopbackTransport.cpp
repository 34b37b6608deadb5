/**
 * @file LoopbackTransport.cpp
 * @brief LoopbackHub / LoopbackTransport implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <rpl/net/transport/LoopbackTransport.hpp>

#include <rpl/core/Log.hpp>

#include <algorithm>
#include <string>

namespace rpl::net::transport {

// -------------------------------------------------------------------------- //
//  LoopbackHub                                                               //
// -------------------------------------------------------------------------- //

LoopbackHub::LoopbackHub() = default;
LoopbackHub::~LoopbackHub() = default;

std::unique_ptr<LoopbackTransport> LoopbackHub::connect(protocol::ParticipantId id)
{
    if (!_inboxes.contains(id))
    {
        _inboxes.emplace(id, std::deque<std::vector<core::byte>>{});
        _order.push_back(id);
    }
    core::Log::info("NET", "LoopbackHub: participant " + std::to_string(id) + " connected");
    return std::make_unique<LoopbackTransport>(*this, id);
}

void LoopbackHub::disconnect(protocol::ParticipantId id)
{
    _inboxes.erase(id);
    _order.erase(std::remove(_order.begin(), _order.end(), id), _order.end());
    if (_authority == id)
        _authority = protocol::kNoParticipant;
    core::Log::info("NET", "LoopbackHub: participant " + std::to_string(id) + " disconnected");
}

void LoopbackHub::setAuthority(protocol::ParticipantId id) noexcept { _authority = id; }

protocol::ParticipantId LoopbackHub::authority() const noexcept { return _authority; }

bool LoopbackHub::isConnected(protocol::ParticipantId id) const { return _inboxes.contains(id); }

void LoopbackHub::setFilter(Filter filter) { _filter = std::move(filter); }

core::u64 LoopbackHub::droppedCount() const noexcept { return _dropped; }

core::usize LoopbackHub::pending(protocol::ParticipantId id) const
{
    auto it = _inboxes.find(id);
    return it == _inboxes.end() ? 0 : it->second.size();
}

std::deque<std::vector<core::byte>> *LoopbackHub::inbox(protocol::ParticipantId id)
{
    auto it = _inboxes.find(id);
    return it == _inboxes.end() ? nullptr : &it->second;
}

core::Expected<void> LoopbackHub::route(const protocol::Envelope &env, protocol::ParticipantId to)
{
    auto *box = inbox(to);
    if (!box)
    {
        return core::makeError(core::ErrorCode::kNetworkSendFailed,
                               "LoopbackHub: participant " + std::to_string(to) + " not connected");
    }
    if (_filter && !_filter(env, to))
    {
        ++_dropped;
        return {};
    }
    box->push_back(env.encode());
    return {};
}

// -------------------------------------------------------------------------- //
//  LoopbackTransport                                                         //
// -------------------------------------------------------------------------- //

LoopbackTransport::LoopbackTransport(LoopbackHub &hub, protocol::ParticipantId id)
    : _hub{hub}
    , _id{id}
{}

LoopbackTransport::~LoopbackTransport() = default;

session::SessionInfo LoopbackTransport::sessionInfo() const
{
    return session::SessionInfo{_hub.isConnected(_id), _id, _hub.authority()};
}

core::Expected<void> LoopbackTransport::broadcast(protocol::MessageKind kind,
                                                  protocol::EntityId entity,
                                                  const protocol::Bitstream &payload)
{
    if (!_hub.isConnected(_id))
    {
        return core::makeError(core::ErrorCode::kNetworkDisconnected, "LoopbackTransport: not connected");
    }

    const auto env = protocol::Envelope::make(kind, _id, entity, payload);
    for (const auto peer : _hub._order)
    {
        if (peer == _id)
            continue;
        RPL_TRY_VOID(_hub.route(env, peer));
    }
    return {};
}

core::Expected<void> LoopbackTransport::sendToAuthority(protocol::MessageKind kind,
                                                        protocol::EntityId entity,
                                                        const protocol::Bitstream &payload)
{
    const auto authority = _hub.authority();
    if (authority == protocol::kNoParticipant)
    {
        return core::makeError(core::ErrorCode::kNetworkSendFailed, "LoopbackTransport: no authority");
    }
    if (authority == _id)
    {
        return core::makeError(core::ErrorCode::kInvalidState,
                               "LoopbackTransport: local participant is the authority");
    }
    return _hub.route(protocol::Envelope::make(kind, _id, entity, payload), authority);
}

core::Expected<core::u32> LoopbackTransport::poll(const DeliverFn &deliver)
{
    auto *box = _hub.inbox(_id);
    if (!box)
        return core::makeError(core::ErrorCode::kNetworkDisconnected, "LoopbackTransport: not connected");

    // Only drain what is queued now; replies land in the next poll.
    core::usize count = box->size();
    core::u32 delivered = 0;
    while (count-- > 0 && !box->empty())
    {
        std::vector<core::byte> bytes = std::move(box->front());
        box->pop_front();

        auto env = protocol::Envelope::decode(bytes);
        if (!env)
        {
            core::Log::warn("NET", "LoopbackTransport: dropping undecodable message: " + env.error().describe());
            continue;
        }
        deliver(*env);
        ++delivered;
        box = _hub.inbox(_id);
        if (!box)
            break;
    }
    return delivered;
}

const char *LoopbackTransport::name() const noexcept { return "Loopback"; }

protocol::ParticipantId LoopbackTransport::localId() const noexcept { return _id; }

} // namespace rpl::net::transport
