// /////////////////////////////////////////////////////////////////////////////
/// @file AuthorityGuard.hpp
/// @brief Replica-side re-assertion of the last reconciled position.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rpl/replication/EntityState.hpp>
#include <rpl/replication/IReplicatedBody.hpp>

#include <rpl/core/NonCopyable.hpp>
#include <rpl/core/Types.hpp>

#include <array>
#include <string_view>

namespace rpl::replication {

/** @brief Points of the tick at which the guard runs. */
enum class GuardPhase : core::u8
{
    PrePhysics    = 0,
    PostCallbacks = 1
};

[[nodiscard]] std::string_view toString(GuardPhase phase) noexcept;

// /////////////////////////////////////////////////////////////////////////////
/// @class AuthorityGuard
/// @brief Stamps lastGoodPosition back into the body, unconditionally.
///
/// Does nothing until reconciliation has armed the presentation state.
/// Every write that differs from what the body held is counted and logged
/// at debug level as a foreign-mover diagnostic.
// /////////////////////////////////////////////////////////////////////////////
class AuthorityGuard final : public core::NonCopyable<AuthorityGuard>
{
public:
    AuthorityGuard(IReplicatedBody &body, const PresentationState &presentation);
    ~AuthorityGuard();

    /// @brief Overwrites the body position with lastGoodPosition.
    /// @return true if a foreign write was undone.
    bool enforce(GuardPhase phase);

    [[nodiscard]] core::u64 enforcements() const noexcept;
    [[nodiscard]] core::u64 corrections(GuardPhase phase) const noexcept;

private:
    IReplicatedBody         &_body;
    const PresentationState &_presentation;
    core::u64                _enforcements{0};
    std::array<core::u64, 2> _corrections{};
};

} // namespace rpl::replication
