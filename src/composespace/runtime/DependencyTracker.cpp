#include <composespace/runtime/DependencyTracker.hpp>
#include <composespace/runtime/StateCell.hpp>

#include "log/TaggedLogger.hpp"

#include <string>

namespace CS::Runtime {

DependencyTracker::Frame::Frame(Frame&& other) noexcept
    : tracker_(other.tracker_) {
    other.tracker_ = nullptr;
}

DependencyTracker::Frame::~Frame() {
    if (tracker_ != nullptr) {
        tracker_->popFrame();
    }
}

auto DependencyTracker::enter(ScopeId scope, DependencySet& dependencies) -> Frame {
    frames_.push_back(FrameState{scope, &dependencies});
    return Frame{this};
}

auto DependencyTracker::suspend() -> Frame {
    frames_.push_back(FrameState{kNoScope, nullptr});
    return Frame{this};
}

auto DependencyTracker::popFrame() noexcept -> void {
    if (!frames_.empty()) {
        frames_.pop_back();
    }
}

auto DependencyTracker::currentScope() const noexcept -> ScopeId {
    if (frames_.empty()) {
        return kNoScope;
    }
    return frames_.back().scope;
}

auto DependencyTracker::registerCell(StateCellBase& cell) -> CellId {
    auto const id = nextCellId_++;
    cells_.emplace(id, &cell);
    return id;
}

auto DependencyTracker::unregisterCell(StateCellBase& cell) -> void {
    cells_.erase(cell.id());
}

auto DependencyTracker::findCell(CellId id) const -> StateCellBase* {
    auto it = cells_.find(id);
    return it == cells_.end() ? nullptr : it->second;
}

auto DependencyTracker::recordRead(StateCellBase& cell) -> void {
    if (frames_.empty()) {
        return;
    }
    auto const& frame = frames_.back();
    if (frame.scope == kNoScope || frame.dependencies == nullptr) {
        return;
    }
    cell.readers_.insert(frame.scope);
    frame.dependencies->insert(cell.id());
}

auto DependencyTracker::recordWrite(StateCellBase& cell) -> void {
    if (cell.readers_.empty()) {
        return;
    }
    // Move the readers out first: invalidate() may flush synchronously, and
    // the re-executing scopes register themselves on the cell again.
    ReaderSet readers;
    readers.swap(cell.readers_);
    cs_log("cell " + std::to_string(cell.id()) + " v" + std::to_string(cell.version())
               + " invalidates " + std::to_string(readers.size()) + " scope(s)",
           "Tracker");
    for (auto scope : readers) {
        sink_.invalidate(scope);
    }
}

auto DependencyTracker::releaseDependencies(ScopeId scope, DependencySet& dependencies) -> void {
    for (auto cellId : dependencies) {
        if (auto* cell = this->findCell(cellId)) {
            cell->readers_.erase(scope);
        }
    }
    dependencies.clear();
}

StateCellBase::StateCellBase(DependencyTracker& tracker, ScopeId owner)
    : tracker_(tracker), owner_(owner) {
    id_ = tracker_.registerCell(*this);
}

StateCellBase::~StateCellBase() {
    tracker_.unregisterCell(*this);
}

auto StateCellBase::trackRead() -> void {
    tracker_.recordRead(*this);
}

auto StateCellBase::publishWrite() -> void {
    ++version_;
    tracker_.recordWrite(*this);
}

} // namespace CS::Runtime
