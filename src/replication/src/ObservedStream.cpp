/**
 * @file ObservedStream.cpp
 * @brief ObservedStream implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <rpl/replication/ObservedStream.hpp>

#include <rpl/core/Log.hpp>

#include <algorithm>

namespace rpl::replication {

ObservedStream::ObservedStream() = default;
ObservedStream::~ObservedStream() = default;

void ObservedStream::attach(ISnapshotObserver &observer)
{
    if (!contains(observer))
        _observers.push_back(&observer);
}

void ObservedStream::attachFront(ISnapshotObserver &observer)
{
    if (!contains(observer))
        _observers.insert(_observers.begin(), &observer);
}

bool ObservedStream::detach(ISnapshotObserver &observer)
{
    auto it = std::find(_observers.begin(), _observers.end(), &observer);
    if (it == _observers.end())
        return false;
    _observers.erase(it);
    return true;
}

bool ObservedStream::contains(const ISnapshotObserver &observer) const noexcept
{
    return std::find(_observers.begin(), _observers.end(), &observer) != _observers.end();
}

core::usize ObservedStream::observerCount() const noexcept { return _observers.size(); }

std::vector<std::string> ObservedStream::observerNames() const
{
    std::vector<std::string> names;
    names.reserve(_observers.size());
    for (const auto *o : _observers)
        names.emplace_back(o->observerName());
    return names;
}

core::u32 ObservedStream::retainOnly(ISnapshotObserver &keep)
{
    core::u32 stripped = 0;
    for (const auto *o : _observers)
    {
        if (o == &keep)
            continue;
        core::Log::info("REPL", "ObservedStream: stripped observer '" + std::string{o->observerName()} + "'");
        ++stripped;
    }
    _observers.assign(1, &keep);
    return stripped;
}

void ObservedStream::serialize(net::protocol::Bitstream &out)
{
    for (auto *o : _observers)
        o->writeState(out);
}

core::Expected<void> ObservedStream::deserialize(net::protocol::Bitstream &in)
{
    for (auto *o : _observers)
        RPL_TRY_VOID(o->readState(in));
    return {};
}

} // namespace rpl::replication
