// /////////////////////////////////////////////////////////////////////////////
/// @file SnapshotChannel.hpp
/// @brief Fixed-shape (position, rotation, health, isDead) state channel.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rpl/replication/EntityState.hpp>
#include <rpl/replication/ISnapshotObserver.hpp>
#include <rpl/replication/ObservedStream.hpp>

#include <rpl/core/NonCopyable.hpp>

#include <functional>

namespace rpl::replication {

// /////////////////////////////////////////////////////////////////////////////
/// @class SnapshotChannel
/// @brief The single sanctioned writer/reader of an entity's stream.
///
/// Wire order: position (x, y, z), rotation (w, x, y, z), health as f32,
/// then isDead as one bit.  The authority binds a source that captures
/// ground truth; a replica binds a sink that receives decoded snapshots.
// /////////////////////////////////////////////////////////////////////////////
class SnapshotChannel final : public ISnapshotObserver, public core::NonCopyable<SnapshotChannel>
{
public:
    using Source = std::function<Snapshot()>;
    using Sink   = std::function<void(const Snapshot &)>;

    SnapshotChannel(EntityId entity, ObservedStream &stream);
    ~SnapshotChannel() override;

    void bindSource(Source source);
    void bindSink(Sink sink);

    /// @brief Strips every other observer from the stream.
    /// @return Number of observers stripped.
    core::u32 enforceExclusivity();

    /// @brief True when this channel is the only observer of its stream.
    [[nodiscard]] bool isExclusive() const noexcept;

    // --------------------------------------------------------------------- //
    //  Codec                                                                 //
    // --------------------------------------------------------------------- //

    static void write(const Snapshot &snapshot, net::protocol::Bitstream &out);
    [[nodiscard]] static core::Expected<Snapshot> read(net::protocol::Bitstream &in);

    // --------------------------------------------------------------------- //
    //  ISnapshotObserver                                                     //
    // --------------------------------------------------------------------- //

    void writeState(net::protocol::Bitstream &out) override;
    [[nodiscard]] core::Expected<void> readState(net::protocol::Bitstream &in) override;
    [[nodiscard]] std::string_view observerName() const noexcept override;

    [[nodiscard]] core::u64 snapshotsWritten() const noexcept { return _written; }
    [[nodiscard]] core::u64 snapshotsRead() const noexcept { return _read; }

private:
    EntityId        _entity;
    ObservedStream &_stream;
    Source          _source;
    Sink            _sink;
    core::u64       _written{0};
    core::u64       _read{0};
};

} // namespace rpl::replication
