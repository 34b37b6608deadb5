// /////////////////////////////////////////////////////////////////////////////
/// @file ObservedStream.hpp
/// @brief Per-entity list of components serialized on the state channel.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rpl/replication/ISnapshotObserver.hpp>

#include <rpl/core/NonCopyable.hpp>
#include <rpl/core/Types.hpp>

#include <string>
#include <vector>

namespace rpl::replication {

// /////////////////////////////////////////////////////////////////////////////
/// @class ObservedStream
/// @brief Ordered, non-owning observer list of one entity's channel.
///
/// Every observer writes (or reads) in registration order.  Nothing checks
/// that the sending and receiving lists match: one extra observer on either
/// side shifts every following field.
// /////////////////////////////////////////////////////////////////////////////
class ObservedStream final : public core::NonCopyable<ObservedStream>
{
public:
    ObservedStream();
    ~ObservedStream();

    /// @brief Appends @p observer (no-op if already attached).
    void attach(ISnapshotObserver &observer);

    /// @brief Inserts @p observer in front of the others.
    void attachFront(ISnapshotObserver &observer);

    bool detach(ISnapshotObserver &observer);

    [[nodiscard]] bool        contains(const ISnapshotObserver &observer) const noexcept;
    [[nodiscard]] core::usize observerCount() const noexcept;
    [[nodiscard]] std::vector<std::string> observerNames() const;

    /// @brief Detaches every observer but @p keep, attaching @p keep if absent.
    /// @return Number of observers removed.
    core::u32 retainOnly(ISnapshotObserver &keep);

    /// @brief Lets every observer write, in order.
    void serialize(net::protocol::Bitstream &out);

    /// @brief Lets every observer read, in order; stops at the first error.
    [[nodiscard]] core::Expected<void> deserialize(net::protocol::Bitstream &in);

private:
    std::vector<ISnapshotObserver *> _observers;
};

} // namespace rpl::replication
