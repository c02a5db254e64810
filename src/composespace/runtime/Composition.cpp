#include <composespace/runtime/Composition.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <exception>
#include <set>
#include <string>
#include <utility>

namespace CS::Runtime {

namespace {

/**
 * Splices child scope output into its placeholders and assigns keys: the
 * explicit key, or the position among siblings after flattening.
 */
class TreeCapture {
public:
    explicit TreeCapture(Composition const& composition) : composition_(composition) {}

    auto run(ScopeId root) -> Expected<CapturedTree> {
        auto const* scope = composition_.findScope(root);
        if (scope == nullptr) {
            return std::unexpected(Error{Error::Code::InvalidState, "composition has no content"});
        }

        std::vector<Item> items;
        this->gather(scope->output(), {root}, "", items);

        if (items.size() == 1) {
            auto const& item = items.front();
            auto        key  = item.node->key.value_or(std::string{kRootKey});
            if (auto valid = validateKey(key); !valid) {
                return std::unexpected(valid.error());
            }
            this->recordRoot(item, key);
            auto node = this->build(*item.node, key, key);
            if (!node) {
                return std::unexpected(node.error());
            }
            tree_.root = std::move(*node);
        } else {
            // Several top-level nodes: wrap them so the tree keeps one root.
            tree_.root.type = std::string{kFragmentNodeType};
            tree_.root.key  = std::string{kRootKey};
            for (auto& [id, parent] : tree_.scope_parents) {
                if (parent.empty()) {
                    parent = tree_.root.key;
                }
            }
            if (auto placed = this->place(items, tree_.root.key, tree_.root); !placed) {
                return std::unexpected(placed.error());
            }
        }
        tree_.scope_parents[root] = "";
        return std::move(tree_);
    }

private:
    struct Item {
        EmittedNode const*   node;
        std::vector<ScopeId> owners;
    };

    static auto validateKey(std::string const& key) -> Expected<void> {
        if (key.find(kKeyPathSeparator) != std::string::npos) {
            return std::unexpected(Error{Error::Code::MalformedInput,
                                         "node key '" + key + "' contains the key path separator"});
        }
        return {};
    }

    auto gather(std::vector<EmittedNode> const& list,
                std::vector<ScopeId> const&     owners,
                std::string const&              parentPath,
                std::vector<Item>&              out) -> void {
        for (auto const& emitted : list) {
            if (emitted.scope == kNoScope) {
                out.push_back(Item{&emitted, owners});
                continue;
            }
            auto const* child = composition_.findScope(emitted.scope);
            if (child == nullptr) {
                continue;
            }
            auto chain = owners;
            chain.push_back(child->id());
            tree_.scope_parents[child->id()] = parentPath;
            tree_.scope_roots[child->id()];
            this->gather(child->output(), chain, parentPath, out);
        }
    }

    auto recordRoot(Item const& item, std::string const& path) -> void {
        for (auto owner : item.owners) {
            tree_.scope_roots[owner].push_back(path);
        }
    }

    auto place(std::vector<Item> const& items, std::string const& parentPath, ComponentNode& into) -> Expected<void> {
        std::set<std::string> seen;
        into.children.reserve(items.size());
        for (std::size_t index = 0; index < items.size(); ++index) {
            auto const& item = items[index];
            auto        key  = item.node->key.value_or(std::to_string(index));
            if (auto valid = validateKey(key); !valid) {
                return std::unexpected(valid.error());
            }
            if (!seen.insert(key).second) {
                return std::unexpected(Error{Error::Code::DuplicateKey,
                                             "sibling key '" + key + "' repeated under '" + parentPath + "'"});
            }
            auto path = joinKeyPath(parentPath, key);
            this->recordRoot(item, path);
            auto child = this->build(*item.node, std::move(key), path);
            if (!child) {
                return std::unexpected(child.error());
            }
            into.children.push_back(std::move(*child));
        }
        return {};
    }

    auto build(EmittedNode const& emitted, std::string key, std::string const& path) -> Expected<ComponentNode> {
        ComponentNode node;
        node.type  = emitted.type;
        node.props = emitted.props;
        node.key   = std::move(key);
        for (auto const& [name, handler] : emitted.handlers) {
            if (handler) {
                node.events.push_back(name);
            }
        }
        if (!node.events.empty()) {
            tree_.bindings[path] = emitted.handlers;
        }

        std::vector<Item> items;
        this->gather(emitted.children, {}, path, items);
        if (auto placed = this->place(items, path, node); !placed) {
            return std::unexpected(placed.error());
        }
        return node;
    }

    Composition const& composition_;
    CapturedTree       tree_;
};

// Drop paths that sit below another path in the set.
auto topMostPaths(std::set<std::string> const& paths) -> std::vector<std::string> {
    std::vector<std::string> result;
    for (auto const& path : paths) {
        bool covered = std::any_of(result.begin(), result.end(),
                                   [&](std::string const& kept) { return isWithinKeyPath(path, kept); });
        if (!covered) {
            result.push_back(path);
        }
    }
    return result;
}

} // namespace

Composition::Composition(CompositionOptions options)
    : options_(std::move(options)),
      renderer_(options_.renderer),
      diagnostics_(options_.diagnostics),
      scheduler_(*this, options_.scheduler, options_.diagnostics),
      tracker_(scheduler_) {}

Composition::~Composition() {
    this->dispose();
}

auto Composition::setContent(RenderFn root) -> Expected<void> {
    if (disposed_) {
        return std::unexpected(Error{Error::Code::InvalidState, "composition was disposed"});
    }
    Expected<void> result;
    scheduler_.batch([&] {
        if (root_ != kNoScope) {
            this->disposeScope(root_);
            root_ = kNoScope;
            committedRoots_.clear();
        }
        auto& scope = this->createScope(kNoScope, std::string{kRootKey}, "root", 0, std::move(root));
        root_       = scope.id();

        result = this->runScope(scope);
        if (auto committed = this->commitInitial(); !committed && result) {
            result = std::unexpected(committed.error());
        }
        (void)this->runEffects();
    });
    return result;
}

auto Composition::flush() -> FlushReport {
    return scheduler_.flush();
}

auto Composition::snapshot() const -> Expected<ComponentNode> {
    auto captured = this->capture();
    if (!captured) {
        return std::unexpected(captured.error());
    }
    return std::move(captured->root);
}

auto Composition::capture() const -> Expected<CapturedTree> {
    return TreeCapture{*this}.run(root_);
}

auto Composition::dispose() -> void {
    if (disposed_) {
        return;
    }
    disposing_ = true;
    if (root_ != kNoScope) {
        this->disposeScope(root_);
        root_ = kNoScope;
    }
    pendingEffects_.clear();
    committedRoots_.clear();
    rootObjects_.clear();
    disposed_ = true;
    cs_log("composition disposed", "Composition");
}

auto Composition::attachRenderer(Renderer* renderer) -> void {
    renderer_ = renderer;
    if (auto captured = this->capture()) {
        committedRoots_ = std::move(captured->scope_roots);
    }
}

auto Composition::findScope(ScopeId id) const -> RenderScope const* {
    auto it = scopes_.find(id);
    return it == scopes_.end() ? nullptr : it->second.get();
}

auto Composition::findMutable(ScopeId id) -> RenderScope* {
    auto it = scopes_.find(id);
    return it == scopes_.end() ? nullptr : it->second.get();
}

auto Composition::findChild(ScopeId parent, std::string const& key) const -> ScopeId {
    auto const* scope = this->findScope(parent);
    return scope == nullptr ? kNoScope : scope->findChild(key);
}

auto Composition::markDirty(ScopeId scope) -> bool {
    if (disposing_) {
        return false;
    }
    auto* target = this->findMutable(scope);
    if (target == nullptr || target->failed_) {
        return false;
    }
    target->dirty_ = true;
    return true;
}

auto Composition::scopeDepth(ScopeId scope) const -> std::optional<std::size_t> {
    if (auto const* target = this->findScope(scope)) {
        return target->depth();
    }
    return std::nullopt;
}

auto Composition::scopeNeedsExecution(ScopeId scope) const -> bool {
    auto const* target = this->findScope(scope);
    return target != nullptr && target->dirty() && !target->failed();
}

auto Composition::executeScope(ScopeId scope) -> Expected<void> {
    auto* target = this->findMutable(scope);
    if (target == nullptr) {
        return {};
    }
    return this->runScope(*target);
}

auto Composition::failScope(ScopeId scope, Error const& error) -> void {
    auto* target = this->findMutable(scope);
    if (target == nullptr) {
        return;
    }
    target->failed_    = true;
    target->dirty_     = false;
    target->lastError_ = error;
    scheduler_.forget(scope);
}

auto Composition::afterPass(std::span<ScopeId const> executed) -> std::vector<Error> {
    auto errors  = this->commit(executed);
    auto effects = this->runEffects();
    errors.insert(errors.end(), std::make_move_iterator(effects.begin()), std::make_move_iterator(effects.end()));
    return errors;
}

auto Composition::createScope(ScopeId parent, std::string key, std::string type, std::size_t depth, RenderFn fn)
        -> RenderScope& {
    auto const id    = nextScopeId_++;
    auto       scope = std::make_unique<RenderScope>(id, parent, std::move(key), std::move(type), depth, std::move(fn));
    auto&      ref   = *scope;
    scopes_.emplace(id, std::move(scope));
    return ref;
}

auto Composition::runScope(RenderScope& scope) -> Expected<void> {
    // Cleared up front: a write during the run to something this scope already
    // read marks it dirty again for the next pass.
    scope.dirty_ = false;
    tracker_.releaseDependencies(scope.id_, scope.dependencies_);

    std::vector<EmittedNode> output;
    Composer                 composer{*this, scope, output};
    std::optional<Error>     failure;
    {
        auto frame = tracker_.enter(scope.id_, scope.dependencies_);
        try {
            scope.fn_(composer);
        } catch (CompositionError const& ex) {
            failure = ex.error();
        } catch (std::exception const& ex) {
            failure = Error{Error::Code::RenderFailure, ex.what()};
        }
    }
    ++scope.executionCount_;
    cs_log("executed scope " + std::to_string(scope.id_) + " (" + scope.type_ + ")", "Scope", "DEBUG");

    if (failure) {
        // Keep the previous output and children; anything this run created is dropped.
        for (auto created : composer.created_) {
            if (std::find(scope.children_.begin(), scope.children_.end(), created) == scope.children_.end()) {
                this->disposeScope(created);
            }
        }
        scope.lastError_ = *failure;
        this->reportError(*failure, "scope:" + std::to_string(scope.id_));
        return std::unexpected(std::move(*failure));
    }

    for (auto previous : scope.children_) {
        if (std::find(composer.declared_.begin(), composer.declared_.end(), previous) == composer.declared_.end()) {
            this->disposeScope(previous);
        }
    }
    scope.children_ = std::move(composer.declared_);
    scope.childIndex_.clear();
    for (auto child : scope.children_) {
        if (auto const* live = this->findScope(child)) {
            scope.childIndex_.emplace(live->key(), child);
        }
    }
    scope.output_ = std::move(output);

    // Slots the run no longer reached.
    while (scope.slots_.size() > composer.slotCursor_) {
        this->releaseSlot(scope, *scope.slots_.back());
        scope.slots_.pop_back();
    }

    scope.suspended_ = composer.suspended_;
    scope.failed_    = false;
    scope.lastError_.reset();
    for (auto& effect : composer.effects_) {
        pendingEffects_.push_back(std::move(effect));
    }
    return {};
}

auto Composition::declareChild(Composer& parent, std::string key, ScopeOptions options, RenderFn fn) -> ScopeId {
    auto& owner = parent.scope_;

    RenderScope* child = nullptr;
    if (auto existing = owner.findChild(key); existing != kNoScope) {
        child = this->findMutable(existing);
        if (child != nullptr && child->type_ != options.type) {
            cs_log("child '" + key + "' changed type " + child->type_ + " -> " + options.type, "Scope");
            child = nullptr;
        }
    }

    bool const fresh = child == nullptr;
    if (fresh) {
        child = &this->createScope(owner.id_, key, options.type, owner.depth_ + 1, std::move(fn));
        parent.created_.push_back(child->id_);
    } else {
        child->fn_ = std::move(fn);
    }

    bool const skip = !fresh && !child->dirty_ && !child->failed_ && !child->lastError_ && options.inputs
                      && child->inputs_ == options.inputs && child->locals_ == parent.locals_;
    child->inputs_ = std::move(options.inputs);
    child->locals_ = parent.locals_;
    if (skip) {
        cs_log("skipping clean child '" + key + "' with unchanged inputs", "Scope", "DEBUG");
        return child->id_;
    }
    // A failing child keeps its previous output; the parent carries on.
    (void)this->runScope(*child);
    return child->id_;
}

auto Composition::disposeScope(ScopeId id) -> void {
    auto* scope = this->findMutable(id);
    if (scope == nullptr) {
        return;
    }
    auto children = scope->children_;
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
        this->disposeScope(*it);
    }
    for (auto it = scope->slots_.rbegin(); it != scope->slots_.rend(); ++it) {
        this->releaseSlot(*scope, **it);
    }
    scope->slots_.clear();
    tracker_.releaseDependencies(id, scope->dependencies_);
    scheduler_.forget(id);
    scopes_.erase(id);
}

auto Composition::releaseSlot(RenderScope& scope, Slot& slot) -> void {
    if (auto failure = slot.release()) {
        this->reportError(*failure, "scope:" + std::to_string(scope.id_));
    }
}

auto Composition::commitInitial() -> Expected<void> {
    auto captured = this->capture();
    if (!captured) {
        this->reportError(captured.error(), "composition");
        return std::unexpected(captured.error());
    }
    committedRoots_ = captured->scope_roots;
    if (renderer_ == nullptr || !options_.render_initial) {
        return {};
    }
    std::vector<Error> errors;
    this->pushSubtree(*captured, captured->root, captured->root.key, errors);
    if (!errors.empty()) {
        return std::unexpected(errors.front());
    }
    return {};
}

auto Composition::pushSubtree(CapturedTree const&  captured,
                              ComponentNode const& node,
                              std::string const&   mountPath,
                              std::vector<Error>&  errors) -> void {
    if (auto rendered = renderer_->createOrUpdate(node, mountPath); !rendered) {
        this->reportError(rendered.error(), "renderer");
        errors.push_back(rendered.error());
        return;
    }
    // Handler closures are rebuilt on every execution, so rebind them all.
    for (auto const& [path, handlers] : captured.bindings) {
        if (!isWithinKeyPath(path, mountPath)) {
            continue;
        }
        if (auto bound = renderer_->bindMarker(path, handlers); !bound) {
            this->reportError(bound.error(), "renderer");
            errors.push_back(bound.error());
        }
    }
}

auto Composition::commit(std::span<ScopeId const> executed) -> std::vector<Error> {
    std::vector<Error> errors;
    if (renderer_ == nullptr || executed.empty()) {
        return errors;
    }
    auto captured = this->capture();
    if (!captured) {
        this->reportError(captured.error(), "composition");
        errors.push_back(captured.error());
        return errors;
    }

    std::set<ScopeId> const executedSet(executed.begin(), executed.end());
    auto const&             wholeTree = captured->root.key;
    std::set<std::string>   paths;
    for (auto id : executed) {
        auto const* scope = this->findScope(id);
        if (scope == nullptr) {
            continue;
        }
        bool nested = false;
        for (auto parent = scope->parent(); parent != kNoScope;) {
            if (executedSet.contains(parent)) {
                nested = true;
                break;
            }
            auto const* ancestor = this->findScope(parent);
            parent               = ancestor == nullptr ? kNoScope : ancestor->parent();
        }
        if (nested) {
            continue;
        }

        auto const& roots    = captured->scope_roots[id];
        auto const  previous = committedRoots_.find(id);
        bool const  sameRoots = previous != committedRoots_.end() && previous->second == roots;
        if (id != root_ && sameRoots && !roots.empty()) {
            paths.insert(roots.begin(), roots.end());
            continue;
        }
        // The scope's node set changed, so its siblings' positional keys may
        // have too: update the node it is spliced into.
        auto const& parentPath = captured->scope_parents[id];
        paths.insert(parentPath.empty() ? wholeTree : parentPath);
    }

    for (auto const& path : topMostPaths(paths)) {
        auto const* node = findByKeyPath(captured->root, path);
        if (node == nullptr) {
            node = &captured->root;
        }
        auto const mountPath = node == &captured->root ? wholeTree : path;
        this->pushSubtree(*captured, *node, mountPath, errors);
    }
    committedRoots_ = std::move(captured->scope_roots);
    return errors;
}

auto Composition::runEffects() -> std::vector<Error> {
    std::vector<Error> errors;
    auto               queue = std::exchange(pendingEffects_, {});
    for (auto& effect : queue) {
        auto state = effect.state.lock();
        if (!state) {
            continue;
        }
        try {
            if (auto cleanup = std::exchange(state->cleanup, {})) {
                cleanup();
            }
            state->deps    = std::move(effect.deps);
            state->cleanup = effect.run();
        } catch (std::exception const& ex) {
            Error failure{Error::Code::RenderFailure,
                          "effect in scope " + std::to_string(effect.scope) + " threw: " + ex.what()};
            this->reportError(failure, "effect");
            errors.push_back(std::move(failure));
        }
    }
    return errors;
}

auto Composition::reportError(Error const& error, std::string_view origin) -> void {
    cs_log(std::string{origin} + ": " + describeError(error), "Composition", "ERROR");
    if (diagnostics_ != nullptr) {
        diagnostics_->report(error, origin);
    }
}

} // namespace CS::Runtime
