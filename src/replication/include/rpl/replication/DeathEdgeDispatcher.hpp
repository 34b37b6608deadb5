// /////////////////////////////////////////////////////////////////////////////
/// @file DeathEdgeDispatcher.hpp
/// @brief Fires the local death callback once, on the alive-to-dead edge.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rpl/core/Types.hpp>

#include <functional>

namespace rpl::replication {

// /////////////////////////////////////////////////////////////////////////////
/// @class DeathEdgeDispatcher
/// @brief Edge detector over the isDead flag of applied snapshots.
///
/// The callback is invoked directly, never through an enabled check on the
/// controller it notifies.
// /////////////////////////////////////////////////////////////////////////////
class DeathEdgeDispatcher final
{
public:
    using Callback = std::function<void()>;

    explicit DeathEdgeDispatcher(Callback onDeath);

    /// @return true if the callback fired.
    bool onSnapshotApplied(bool previousIsDead, bool newIsDead);

    /// @brief Re-arms the dispatcher (pooled reactivation).
    void reset() noexcept;

    [[nodiscard]] bool      fired() const noexcept { return _fired; }
    [[nodiscard]] core::u32 fireCount() const noexcept { return _fireCount; }

private:
    Callback  _onDeath;
    bool      _fired{false};
    core::u32 _fireCount{0};
};

} // namespace rpl::replication
