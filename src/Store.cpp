/**
 * @file Store.cpp
 * @brief SQLite implementation of the project store
 */

#include "maxify/Store.hpp"
#include "maxify/Errors.hpp"
#include "maxify/Log.hpp"
#include "maxify/Units.hpp"
#include "maxify/Util.hpp"

#include <sqlite3.h>

#include <chrono>
#include <map>

namespace maxify {

namespace {

constexpr const char* kSchema = R"(
    CREATE TABLE IF NOT EXISTS projects (
        id            INTEGER PRIMARY KEY AUTOINCREMENT,
        name          TEXT NOT NULL,
        organization  TEXT NOT NULL DEFAULT '',
        description   TEXT,
        UNIQUE (organization, name)
    );
    CREATE TABLE IF NOT EXISTS metrics (
        id              INTEGER PRIMARY KEY AUTOINCREMENT,
        project_id      INTEGER NOT NULL REFERENCES projects(id),
        position        INTEGER NOT NULL,
        name            TEXT NOT NULL,
        kind            TEXT NOT NULL,
        description     TEXT,
        allowed_values  TEXT,
        default_value   TEXT,
        UNIQUE (project_id, name)
    );
    CREATE TABLE IF NOT EXISTS tasks (
        id               INTEGER PRIMARY KEY AUTOINCREMENT,
        project_id       INTEGER NOT NULL REFERENCES projects(id),
        name             TEXT NOT NULL,
        description      TEXT,
        created_at       INTEGER NOT NULL,
        last_updated_at  INTEGER NOT NULL,
        UNIQUE (project_id, name)
    );
    CREATE TABLE IF NOT EXISTS scalar_points (
        task_id    INTEGER NOT NULL REFERENCES tasks(id),
        metric_id  INTEGER NOT NULL REFERENCES metrics(id),
        value      TEXT NOT NULL,
        timestamp  INTEGER NOT NULL,
        PRIMARY KEY (task_id, metric_id)
    );
    CREATE TABLE IF NOT EXISTS histogram_entries (
        id         TEXT NOT NULL,
        task_id    INTEGER NOT NULL REFERENCES tasks(id),
        metric_id  INTEGER NOT NULL REFERENCES metrics(id),
        value      TEXT NOT NULL,
        timestamp  INTEGER NOT NULL,
        PRIMARY KEY (task_id, metric_id, id)
    );
)";

/**
 * @brief Prepared statement, finalized on scope exit
 */
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            const int code = sqlite3_errcode(db_);
            throw StoreError("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)), code);
        }
    }

    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    sqlite3_stmt* get() const noexcept { return stmt_; }

    void bind(int idx, const std::string& text) {
        check(sqlite3_bind_text(stmt_, idx, text.c_str(), -1, SQLITE_TRANSIENT));
    }

    void bind(int idx, std::int64_t value) {
        check(sqlite3_bind_int64(stmt_, idx, value));
    }

    void bind(int idx, const std::optional<std::string>& text) {
        if (text) {
            bind(idx, *text);
        } else {
            check(sqlite3_bind_null(stmt_, idx));
        }
    }

    /**
     * @return true if a row is available, false when done
     */
    bool step() {
        const int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw StoreError("Statement failed: " + std::string(sqlite3_errmsg(db_)), rc);
    }

    /// Step a statement that returns no rows
    void run() {
        while (step()) {
        }
    }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;

    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw StoreError("Failed to bind parameter: " + std::string(sqlite3_errmsg(db_)), rc);
        }
    }
};

std::string get_text_column(sqlite3_stmt* stmt, int col) {
    auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? text : "";
}

std::optional<std::string> get_optional_text(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
        return std::nullopt;
    }
    return get_text_column(stmt, col);
}

std::int64_t get_int64_column(sqlite3_stmt* stmt, int col, std::int64_t default_val = 0) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
        return default_val;
    }
    return sqlite3_column_int64(stmt, col);
}

std::int64_t to_micros(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
}

TimePoint from_micros(std::int64_t micros) {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::microseconds(micros)));
}

// Values are stored as plain text: integers and decimals in their exact
// decimal form, durations as exact seconds, strings verbatim.
std::string encode_value(const Value& value) {
    switch (value_kind_of(value)) {
        case ValueKind::Integer:
            return std::to_string(std::get<std::int64_t>(value));
        case ValueKind::Decimal:
            return std::get<Decimal>(value).to_string();
        case ValueKind::Duration:
            return std::get<Duration>(value).seconds().to_string();
        case ValueKind::String:
        default:
            return std::get<std::string>(value);
    }
}

Value decode_value(ValueKind kind, const std::string& text) {
    try {
        switch (kind) {
            case ValueKind::Integer:
                return parse_integer(text);
            case ValueKind::Decimal:
                return Decimal::parse(text);
            case ValueKind::Duration:
                return Duration(Decimal::parse(text));
            case ValueKind::String:
            default:
                return text;
        }
    } catch (const ParsingError& e) {
        throw StoreError(std::string("Corrupt stored value: ") + e.what());
    }
}

std::optional<std::string> encode_allowed(const std::optional<std::vector<Value>>& values) {
    if (!values) {
        return std::nullopt;
    }
    Document arr = Document::array();
    for (const auto& v : *values) {
        arr.push_back(encode_value(v));
    }
    return arr.dump();
}

std::optional<std::vector<Value>> decode_allowed(ValueKind kind, const std::optional<std::string>& text) {
    if (!text) {
        return std::nullopt;
    }
    Document arr;
    try {
        arr = Document::parse(*text);
    } catch (const nlohmann::json::parse_error& e) {
        throw StoreError(std::string("Corrupt allowed values: ") + e.what());
    }
    if (!arr.is_array()) {
        throw StoreError("Corrupt allowed values: expected an array");
    }
    std::vector<Value> out;
    for (const auto& item : arr) {
        if (!item.is_string()) {
            throw StoreError("Corrupt allowed values: expected strings");
        }
        out.push_back(decode_value(kind, item.get<std::string>()));
    }
    return out;
}

std::string qualified(const std::string& name, const std::string& organization) {
    return organization.empty() ? name : organization + Project::separator + name;
}

} // anonymous namespace

// ============================================================================
// Write scopes
// ============================================================================

/**
 * @brief Implicit transaction for a single mutating call
 *
 * Joins the active ScopedTransaction if there is one.
 */
class ProjectStore::WriteScope {
public:
    explicit WriteScope(ProjectStore& store)
        : store_(store)
        , owns_(!store.in_transaction_)
    {
        if (owns_) {
            store_.begin();
        }
    }

    ~WriteScope() {
        if (owns_ && !done_) {
            try {
                store_.rollback();
            } catch (const StoreError& e) {
                log_error("Rollback failed: {}", e.what());
            }
        }
    }

    WriteScope(const WriteScope&) = delete;
    WriteScope& operator=(const WriteScope&) = delete;

    void commit() {
        if (owns_) {
            store_.commit();
        }
        done_ = true;
    }

private:
    ProjectStore& store_;
    bool owns_;
    bool done_ = false;
};

ScopedTransaction::ScopedTransaction(ProjectStore& store)
    : store_(store)
    , active_(false)
{
    if (store_.in_transaction_) {
        throw StoreError("A transaction is already active on this store");
    }
    store_.begin();
    active_ = true;
}

ScopedTransaction::~ScopedTransaction() {
    if (active_) {
        try {
            rollback();
        } catch (const StoreError& e) {
            log_error("Rollback failed: {}", e.what());
        }
    }
}

void ScopedTransaction::commit() {
    if (!active_) {
        throw StoreError("Transaction is no longer active");
    }
    store_.commit();
    active_ = false;
}

void ScopedTransaction::rollback() {
    if (!active_) {
        return;
    }
    active_ = false;
    store_.rollback();
}

// ============================================================================
// Connection
// ============================================================================

ProjectStore::ProjectStore(const std::string& path)
    : path_(path)
{
    const int rc = sqlite3_open_v2(path_.c_str(), &db_,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw StoreError("Cannot open store '" + path_ + "': " + msg, rc);
    }

    try {
        execute("PRAGMA foreign_keys = ON");
        create_schema();
    } catch (const StoreError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
    log_debug("Opened project store at '{}'", path_);
}

ProjectStore::~ProjectStore() {
    if (in_transaction_) {
        try {
            rollback();
        } catch (const StoreError& e) {
            log_error("Rollback on close failed: {}", e.what());
        }
    }
    sqlite3_close(db_);
}

void ProjectStore::execute(const char* sql) {
    char* err = nullptr;
    const int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errmsg(db_);
        sqlite3_free(err);
        throw StoreError("SQL error: " + msg, rc);
    }
}

void ProjectStore::create_schema() {
    execute(kSchema);
    log_debug("Store schema ready");
}

void ProjectStore::begin() {
    execute("BEGIN TRANSACTION");
    in_transaction_ = true;
}

void ProjectStore::commit() {
    execute("COMMIT");
    in_transaction_ = false;
}

void ProjectStore::rollback() {
    in_transaction_ = false;
    // SQLite may already have rolled back after certain errors.
    if (sqlite3_get_autocommit(db_) == 0) {
        execute("ROLLBACK");
    }
}

// ============================================================================
// Queries
// ============================================================================

std::optional<std::int64_t> ProjectStore::find_id(const std::string& name,
                                                  const std::string& organization) const {
    Statement stmt(db_, "SELECT id FROM projects WHERE name = ? AND organization = ?");
    stmt.bind(1, name);
    stmt.bind(2, organization);
    if (stmt.step()) {
        return get_int64_column(stmt.get(), 0);
    }
    return std::nullopt;
}

Project ProjectStore::unpack(std::int64_t id) const {
    Statement head(db_, "SELECT name, organization, description FROM projects WHERE id = ?");
    head.bind(1, id);
    if (!head.step()) {
        throw StoreError("Project row " + std::to_string(id) + " does not exist");
    }
    const std::string organization = get_text_column(head.get(), 1);
    Project project(get_text_column(head.get(), 0),
                    organization.empty() ? std::nullopt : std::optional<std::string>(organization),
                    get_optional_text(head.get(), 2));
    project.set_id(id);

    struct MetricRow {
        std::string name;
        ValueKind kind;
    };
    std::map<std::int64_t, MetricRow> metric_rows;

    Statement metrics(db_,
        "SELECT id, name, kind, description, allowed_values, default_value "
        "FROM metrics WHERE project_id = ? ORDER BY position");
    metrics.bind(1, id);
    while (metrics.step()) {
        sqlite3_stmt* row = metrics.get();
        const std::string name = get_text_column(row, 1);
        const ValueKind kind = parse_value_kind(get_text_column(row, 2));
        std::optional<Value> default_value;
        if (auto text = get_optional_text(row, 5)) {
            default_value = decode_value(kind, *text);
        }
        project.add_metric(Metric(name, kind,
                                  get_optional_text(row, 3),
                                  decode_allowed(kind, get_optional_text(row, 4)),
                                  std::move(default_value)));
        metric_rows.emplace(get_int64_column(row, 0), MetricRow{name, kind});
    }

    std::map<std::int64_t, std::string> task_names;
    Statement tasks(db_,
        "SELECT id, name, description, created_at, last_updated_at "
        "FROM tasks WHERE project_id = ? ORDER BY id");
    tasks.bind(1, id);
    while (tasks.step()) {
        sqlite3_stmt* row = tasks.get();
        const std::string name = get_text_column(row, 1);
        project.add_task(Task(name,
                              get_optional_text(row, 2),
                              from_micros(get_int64_column(row, 3)),
                              from_micros(get_int64_column(row, 4))));
        task_names.emplace(get_int64_column(row, 0), name);
    }

    auto load_points = [&](const char* sql, bool histogram) {
        Statement points(db_, sql);
        points.bind(1, id);
        while (points.step()) {
            sqlite3_stmt* row = points.get();
            const auto& metric = metric_rows.at(get_int64_column(row, 1));
            Task* task = project.find_task(task_names.at(get_int64_column(row, 0)));
            task->load_data_point(DataPoint{
                metric.name,
                decode_value(metric.kind, get_text_column(row, 2)),
                from_micros(get_int64_column(row, 3)),
                histogram ? get_text_column(row, 4) : std::string()});
        }
    };

    load_points(
        "SELECT p.task_id, p.metric_id, p.value, p.timestamp "
        "FROM scalar_points p JOIN tasks t ON t.id = p.task_id "
        "WHERE t.project_id = ? ORDER BY p.rowid", false);
    load_points(
        "SELECT h.task_id, h.metric_id, h.value, h.timestamp, h.id "
        "FROM histogram_entries h JOIN tasks t ON t.id = h.task_id "
        "WHERE t.project_id = ? ORDER BY h.rowid", true);

    return project;
}

std::vector<Project> ProjectStore::all() const {
    std::vector<std::int64_t> ids;
    {
        Statement stmt(db_, "SELECT id FROM projects ORDER BY organization, name");
        while (stmt.step()) {
            ids.push_back(get_int64_column(stmt.get(), 0));
        }
    }

    std::vector<Project> out;
    out.reserve(ids.size());
    for (auto id : ids) {
        out.push_back(unpack(id));
    }
    return out;
}

std::optional<Project> ProjectStore::get(const std::string& qualified_name) const {
    auto [organization, name] = Project::split_qualified_name(qualified_name);
    return get(name, organization);
}

std::optional<Project> ProjectStore::get(const std::string& name,
                                         const std::optional<std::string>& organization) const {
    auto id = find_id(to_lower(name), to_lower(organization.value_or("")));
    if (!id) {
        return std::nullopt;
    }
    return unpack(*id);
}

std::vector<Project> ProjectStore::all_named(const std::vector<std::string>& qualified_names) const {
    std::vector<Project> out;
    for (const auto& qn : qualified_names) {
        if (auto project = get(qn)) {
            out.push_back(std::move(*project));
        }
    }
    return out;
}

std::vector<std::string> ProjectStore::matching_name(const std::string& prefix) const {
    const std::string lower = to_lower(prefix);
    std::vector<std::string> out;
    Statement stmt(db_, "SELECT name, organization FROM projects ORDER BY organization, name");
    while (stmt.step()) {
        std::string qn = qualified(get_text_column(stmt.get(), 0), get_text_column(stmt.get(), 1));
        if (starts_with(qn, lower)) {
            out.push_back(std::move(qn));
        }
    }
    return out;
}

bool ProjectStore::contains(const std::string& qualified_name) const {
    auto [organization, name] = Project::split_qualified_name(qualified_name);
    return find_id(to_lower(name), to_lower(organization.value_or(""))).has_value();
}

std::size_t ProjectStore::count() const {
    Statement stmt(db_, "SELECT COUNT(*) FROM projects");
    if (!stmt.step()) {
        return 0;
    }
    return static_cast<std::size_t>(get_int64_column(stmt.get(), 0));
}

// ============================================================================
// Mutations
// ============================================================================

void ProjectStore::delete_children(std::int64_t project_id) {
    // Dependency order: data points, tasks, then metrics.
    static constexpr const char* statements[] = {
        "DELETE FROM scalar_points WHERE task_id IN (SELECT id FROM tasks WHERE project_id = ?)",
        "DELETE FROM histogram_entries WHERE task_id IN (SELECT id FROM tasks WHERE project_id = ?)",
        "DELETE FROM tasks WHERE project_id = ?",
        "DELETE FROM metrics WHERE project_id = ?",
    };
    for (const char* sql : statements) {
        Statement stmt(db_, sql);
        stmt.bind(1, project_id);
        stmt.run();
    }
}

void ProjectStore::save(Project& project) {
    project.normalize_identity();
    const std::string organization = project.organization().value_or("");

    WriteScope scope(*this);

    std::int64_t id = 0;
    if (auto existing = find_id(project.name(), organization)) {
        id = *existing;
        Statement update(db_, "UPDATE projects SET description = ? WHERE id = ?");
        update.bind(1, project.description());
        update.bind(2, id);
        update.run();
        delete_children(id);
    } else {
        Statement insert(db_, "INSERT INTO projects (name, organization, description) VALUES (?, ?, ?)");
        insert.bind(1, project.name());
        insert.bind(2, organization);
        insert.bind(3, project.description());
        insert.run();
        id = sqlite3_last_insert_rowid(db_);
    }

    std::map<std::string, std::int64_t> metric_ids;
    std::int64_t position = 0;
    for (const auto& metric : project.metrics()) {
        Statement insert(db_,
            "INSERT INTO metrics (project_id, position, name, kind, description, allowed_values, default_value) "
            "VALUES (?, ?, ?, ?, ?, ?, ?)");
        insert.bind(1, id);
        insert.bind(2, position++);
        insert.bind(3, metric.name());
        insert.bind(4, value_kind_name(metric.kind()));
        insert.bind(5, metric.description());
        insert.bind(6, encode_allowed(metric.allowed_values()));
        std::optional<std::string> default_text;
        if (metric.default_value()) {
            default_text = encode_value(*metric.default_value());
        }
        insert.bind(7, default_text);
        insert.run();
        metric_ids.emplace(metric.name(), sqlite3_last_insert_rowid(db_));
    }

    for (const auto& [name, task] : project.tasks()) {
        Statement insert(db_,
            "INSERT INTO tasks (project_id, name, description, created_at, last_updated_at) "
            "VALUES (?, ?, ?, ?, ?)");
        insert.bind(1, id);
        insert.bind(2, name);
        insert.bind(3, task.description());
        insert.bind(4, to_micros(task.created_at()));
        insert.bind(5, to_micros(task.last_updated_at()));
        insert.run();
        const std::int64_t task_id = sqlite3_last_insert_rowid(db_);

        for (const auto& point : task.data_points()) {
            auto metric_id = metric_ids.find(point.metric);
            if (metric_id == metric_ids.end()) {
                throw StoreError("Task '" + name + "' has data for unknown metric '" + point.metric + "'");
            }
            if (point.entry_id.empty()) {
                Statement p(db_,
                    "INSERT INTO scalar_points (task_id, metric_id, value, timestamp) VALUES (?, ?, ?, ?)");
                p.bind(1, task_id);
                p.bind(2, metric_id->second);
                p.bind(3, encode_value(point.value));
                p.bind(4, to_micros(point.timestamp));
                p.run();
            } else {
                Statement p(db_,
                    "INSERT INTO histogram_entries (id, task_id, metric_id, value, timestamp) VALUES (?, ?, ?, ?, ?)");
                p.bind(1, point.entry_id);
                p.bind(2, task_id);
                p.bind(3, metric_id->second);
                p.bind(4, encode_value(point.value));
                p.bind(5, to_micros(point.timestamp));
                p.run();
            }
        }
    }

    scope.commit();
    project.set_id(id);
    log_debug("Saved project '{}' ({} metric(s), {} task(s))",
              project.qualified_name(), project.metrics().size(), project.tasks().size());
}

bool ProjectStore::remove(const Project& project) {
    auto id = find_id(to_lower(project.name()), to_lower(project.organization().value_or("")));
    if (!id) {
        return false;
    }

    WriteScope scope(*this);
    delete_children(*id);
    Statement stmt(db_, "DELETE FROM projects WHERE id = ?");
    stmt.bind(1, *id);
    stmt.run();
    scope.commit();

    log_debug("Deleted project '{}'", project.qualified_name());
    return true;
}

std::size_t ProjectStore::remove(const std::vector<Project>& projects) {
    WriteScope scope(*this);
    std::size_t removed = 0;
    for (const auto& project : projects) {
        if (remove(project)) {
            ++removed;
        }
    }
    scope.commit();
    return removed;
}

} // namespace maxify
