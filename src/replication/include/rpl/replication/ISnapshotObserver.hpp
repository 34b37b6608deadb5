// /////////////////////////////////////////////////////////////////////////////
/// @file ISnapshotObserver.hpp
/// @brief Component that writes to or reads from an entity's state stream.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rpl/net/protocol/Bitstream.hpp>

#include <rpl/core/Expected.hpp>

#include <string_view>

namespace rpl::replication {

// /////////////////////////////////////////////////////////////////////////////
/// @class ISnapshotObserver
/// @brief Participant in an ObservedStream.
///
/// On the sending side writeState() appends fields; on the receiving side
/// readState() consumes them, in the same order.
// /////////////////////////////////////////////////////////////////////////////
class ISnapshotObserver
{
public:
    virtual ~ISnapshotObserver() = default;

    virtual void writeState(net::protocol::Bitstream &out) = 0;
    [[nodiscard]] virtual core::Expected<void> readState(net::protocol::Bitstream &in) = 0;
    [[nodiscard]] virtual std::string_view observerName() const noexcept = 0;
};

} // namespace rpl::replication
