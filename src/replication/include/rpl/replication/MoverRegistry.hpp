// /////////////////////////////////////////////////////////////////////////////
/// @file MoverRegistry.hpp
/// @brief Set of local movers attached to one entity.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rpl/replication/ILocalMover.hpp>

#include <rpl/core/NonCopyable.hpp>
#include <rpl/core/Types.hpp>

#include <vector>

namespace rpl::replication {

// /////////////////////////////////////////////////////////////////////////////
/// @class MoverRegistry
/// @brief Non-owning registry of ILocalMover instances.
// /////////////////////////////////////////////////////////////////////////////
class MoverRegistry final : public core::NonCopyable<MoverRegistry>
{
public:
    MoverRegistry();
    ~MoverRegistry();

    void add(ILocalMover &mover);
    bool remove(ILocalMover &mover);

    /// @brief Suspends every active mover.
    /// @return Number of movers that were active.
    core::u32 suspendAll();

    [[nodiscard]] core::usize size() const noexcept;
    [[nodiscard]] core::u32   activeCount() const noexcept;

private:
    std::vector<ILocalMover *> _movers;
};

} // namespace rpl::replication
