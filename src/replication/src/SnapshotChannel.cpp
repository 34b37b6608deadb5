/**
 * @file SnapshotChannel.cpp
 * @brief SnapshotChannel implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <rpl/replication/SnapshotChannel.hpp>

#include <rpl/core/Log.hpp>

#include <string>

namespace rpl::replication {

SnapshotChannel::SnapshotChannel(EntityId entity, ObservedStream &stream)
    : _entity{entity}
    , _stream{stream}
{
    _stream.attach(*this);
}

SnapshotChannel::~SnapshotChannel()
{
    _stream.detach(*this);
}

void SnapshotChannel::bindSource(Source source) { _source = std::move(source); }
void SnapshotChannel::bindSink(Sink sink)       { _sink = std::move(sink); }

core::u32 SnapshotChannel::enforceExclusivity()
{
    const core::u32 stripped = _stream.retainOnly(*this);
    if (stripped > 0)
    {
        core::Log::info("REPL", "SnapshotChannel: entity " + std::to_string(_entity) + " stripped " +
                                    std::to_string(stripped) + " foreign observer(s)");
    }
    return stripped;
}

bool SnapshotChannel::isExclusive() const noexcept
{
    return _stream.observerCount() == 1 && _stream.contains(*this);
}

// -------------------------------------------------------------------------- //
//  Codec                                                                     //
// -------------------------------------------------------------------------- //

void SnapshotChannel::write(const Snapshot &snapshot, net::protocol::Bitstream &out)
{
    out.writeF32(snapshot.position.x);
    out.writeF32(snapshot.position.y);
    out.writeF32(snapshot.position.z);
    out.writeF32(snapshot.rotation.w);
    out.writeF32(snapshot.rotation.x);
    out.writeF32(snapshot.rotation.y);
    out.writeF32(snapshot.rotation.z);
    out.writeF32(snapshot.health);
    out.writeBool(snapshot.isDead);
}

core::Expected<Snapshot> SnapshotChannel::read(net::protocol::Bitstream &in)
{
    Snapshot s;
    s.position.x = RPL_TRY(in.readF32());
    s.position.y = RPL_TRY(in.readF32());
    s.position.z = RPL_TRY(in.readF32());
    s.rotation.w = RPL_TRY(in.readF32());
    s.rotation.x = RPL_TRY(in.readF32());
    s.rotation.y = RPL_TRY(in.readF32());
    s.rotation.z = RPL_TRY(in.readF32());
    s.health     = RPL_TRY(in.readF32());
    s.isDead     = RPL_TRY(in.readBool());
    return s;
}

// -------------------------------------------------------------------------- //
//  ISnapshotObserver                                                         //
// -------------------------------------------------------------------------- //

void SnapshotChannel::writeState(net::protocol::Bitstream &out)
{
    if (!_source)
    {
        core::Log::warn("REPL", "SnapshotChannel: entity " + std::to_string(_entity) + " has no source bound");
        return;
    }
    write(_source(), out);
    ++_written;
}

core::Expected<void> SnapshotChannel::readState(net::protocol::Bitstream &in)
{
    const Snapshot s = RPL_TRY(read(in));
    ++_read;
    if (_sink)
        _sink(s);
    return {};
}

std::string_view SnapshotChannel::observerName() const noexcept { return "SnapshotChannel"; }

} // namespace rpl::replication
