#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/Config.hpp"
#include "di/Scope.hpp"

namespace zen::di {

// Owns the root scope and the current-scope cursor, and indexes the scopes it
// creates by id and by name. Index entries are dropped when their scope
// disposes; a disposed scope is never returned by a lookup.
class ScopeManager {
public:
    // Restores the previous current scope when ended or destroyed. Must not
    // outlive the manager that issued it.
    class Session {
    public:
        Session() = default;
        ~Session();

        Session(Session&& other) noexcept;
        Session& operator=(Session&& other) noexcept;

        Session(const Session&) = delete;
        Session& operator=(const Session&) = delete;

        void end();
        bool active() const noexcept { return manager_ != nullptr; }
        const std::shared_ptr<Scope>& scope() const noexcept { return scope_; }

    private:
        friend class ScopeManager;

        Session(ScopeManager* manager, std::shared_ptr<Scope> scope, std::weak_ptr<Scope> previous);

        ScopeManager* manager_{nullptr};
        std::shared_ptr<Scope> scope_;
        std::weak_ptr<Scope> previous_;
    };

    struct Stats {
        std::size_t totalScopes{0};
        std::size_t namedScopes{0};
        std::size_t maxDepth{0};
        std::size_t totalBindings{0};
        std::size_t totalFactories{0};
    };

    explicit ScopeManager(common::Config config = {});
    ~ScopeManager();

    ScopeManager(const ScopeManager&) = delete;
    ScopeManager& operator=(const ScopeManager&) = delete;

    // Recreated when the previous root was disposed.
    std::shared_ptr<Scope> rootScope();

    // Falls back to the root when the current scope was disposed.
    std::shared_ptr<Scope> currentScope();
    void setCurrentScope(const std::shared_ptr<Scope>& scope);

    // parent defaults to the current scope.
    std::shared_ptr<Scope> createScope(std::optional<std::string> name = std::nullopt,
                                       std::shared_ptr<Scope> parent = nullptr);

    std::shared_ptr<Scope> findScopeByName(const std::string& name);
    std::shared_ptr<Scope> findScopeById(const std::string& id);

    Session beginSession(std::shared_ptr<Scope> scope);

    // Every live scope under the root, depth first.
    std::vector<std::shared_ptr<Scope>> allScopes();
    std::size_t depthOf(const Scope& scope) const;

    // Cycle check over the union of every scope's declared graph.
    bool detectCycles(InstanceId start);

    std::string debugHierarchy();
    Stats stats();

    // Disposes the whole tree and starts over with a fresh root.
    void reset();

private:
    struct Index {
        std::unordered_map<std::string, std::weak_ptr<Scope>> byName;
        std::unordered_map<std::string, std::weak_ptr<Scope>> byId;
    };

    void track(const std::shared_ptr<Scope>& scope);
    void createRoot();

    common::Config config_;
    std::shared_ptr<Index> index_;
    std::shared_ptr<Scope> root_;
    std::weak_ptr<Scope> current_;
};

}  // namespace zen::di
