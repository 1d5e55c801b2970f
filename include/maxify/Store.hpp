/**
 * @file Store.hpp
 * @brief Durable storage of project aggregates in SQLite
 *
 * A project is loaded and saved as one unit together with its metrics,
 * tasks and data points. Identity fields (name, organization) are stored
 * lower-case, so lookups by qualified name are case-insensitive.
 *
 * Example:
 * ```cpp
 * maxify::ProjectStore store("maxify.db");
 * store.transaction([&] {
 *     store.save(project);
 *     store.remove(old_project);
 * });
 * ```
 */

#ifndef MAXIFY_STORE_HPP
#define MAXIFY_STORE_HPP

#include "maxify/Project.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

struct sqlite3;

namespace maxify {

class ProjectStore;

/**
 * @brief RAII unit of work over a ProjectStore
 *
 * Begins a transaction on construction. commit() makes every write since
 * then durable; rollback() or destruction without commit() discards them.
 * Only one scope may be active per store.
 */
class ScopedTransaction {
public:
    /**
     * @throws StoreError if a scope is already active on this store
     */
    explicit ScopedTransaction(ProjectStore& store);
    ~ScopedTransaction();

    ScopedTransaction(const ScopedTransaction&) = delete;
    ScopedTransaction& operator=(const ScopedTransaction&) = delete;

    void commit();
    void rollback();

    bool active() const noexcept { return active_; }

private:
    ProjectStore& store_;
    bool active_;
};

class ProjectStore {
public:
    /**
     * @brief Open (or create) a store
     * @param path SQLite file path, or ":memory:"
     * @throws StoreError if the database cannot be opened or initialized
     */
    explicit ProjectStore(const std::string& path);
    ~ProjectStore();

    ProjectStore(const ProjectStore&) = delete;
    ProjectStore& operator=(const ProjectStore&) = delete;

    const std::string& path() const noexcept { return path_; }

    // ---- Queries ----

    /// Every project, ordered by organization then name
    std::vector<Project> all() const;

    /// Project by qualified name ("org/name" or "name"), case-insensitive
    std::optional<Project> get(const std::string& qualified_name) const;

    std::optional<Project> get(const std::string& name,
                               const std::optional<std::string>& organization) const;

    /// Projects for the given qualified names; unknown names are skipped
    std::vector<Project> all_named(const std::vector<std::string>& qualified_names) const;

    /// Qualified names starting with a case-insensitive prefix
    std::vector<std::string> matching_name(const std::string& prefix) const;

    bool contains(const std::string& qualified_name) const;

    std::size_t count() const;

    // ---- Mutations ----

    /**
     * @brief Insert or replace a project aggregate
     *
     * Lower-cases the project's name and organization and assigns its id.
     */
    void save(Project& project);

    /**
     * @brief Delete a project with its metrics, tasks and data points
     * @return false if the project was not stored
     */
    bool remove(const Project& project);

    /**
     * @return Number of projects deleted
     */
    std::size_t remove(const std::vector<Project>& projects);

    // ---- Transactions ----

    bool in_transaction() const noexcept { return in_transaction_; }

    /**
     * @brief Run fn inside a ScopedTransaction
     *
     * Commits when fn returns normally; any exception rolls back every
     * write made inside fn and is rethrown.
     */
    template <typename F>
    auto transaction(F&& fn) -> decltype(fn()) {
        ScopedTransaction tx(*this);
        if constexpr (std::is_void_v<decltype(fn())>) {
            fn();
            tx.commit();
        } else {
            auto result = fn();
            tx.commit();
            return result;
        }
    }

private:
    friend class ScopedTransaction;
    class WriteScope;

    std::string path_;
    sqlite3* db_ = nullptr;
    bool in_transaction_ = false;

    void create_schema();
    void execute(const char* sql);

    void begin();
    void commit();
    void rollback();

    std::optional<std::int64_t> find_id(const std::string& name,
                                        const std::string& organization) const;
    Project unpack(std::int64_t id) const;
    void delete_children(std::int64_t project_id);
};

} // namespace maxify

#endif // MAXIFY_STORE_HPP
