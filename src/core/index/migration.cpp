#include "core/index/migration.h"
#include "core/shared/logging.h"
#include <sqlite3.h>
#include <string>

namespace dq {

int currentSchemaVersion(sqlite3* db)
{
    const char* sql = "SELECT value FROM settings WHERE key = 'schema_version'";
    sqlite3_stmt* stmt = nullptr;
    int version = 0;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            const char* val = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
            if (val) {
                try {
                    version = std::stoi(val);
                } catch (const std::exception&) {
                    LOG_WARN(dqStore, "Unparseable schema_version '%s'", val);
                    version = 0;
                }
            }
        }
    }
    sqlite3_finalize(stmt);
    return version;
}

bool applyMigrations(sqlite3* db, int targetVersion)
{
    int current = currentSchemaVersion(db);

    if (current > targetVersion) {
        LOG_ERROR(dqStore, "Schema version %d is newer than app version %d, downgrade not supported",
                  current, targetVersion);
        return false;
    }

    if (current == targetVersion) {
        return true;
    }

    auto exec = [db](const char* sql) -> bool {
        char* errMsg = nullptr;
        const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
        if (rc != SQLITE_OK) {
            LOG_ERROR(dqStore, "Migration SQL failed: %s", errMsg ? errMsg : "unknown");
            sqlite3_free(errMsg);
            return false;
        }
        return true;
    };

    if (current < 2 && targetVersion >= 2) {
        LOG_INFO(dqStore, "Applying schema migration 1 -> 2");

        if (!exec("SAVEPOINT migrate_v2")) {
            return false;
        }

        const bool ok = exec(R"(
            CREATE TABLE IF NOT EXISTS query_cache (
                id            INTEGER PRIMARY KEY AUTOINCREMENT,
                question      TEXT NOT NULL,
                role          TEXT NOT NULL,
                embedding     BLOB NOT NULL,
                answer        TEXT NOT NULL,
                sources       TEXT NOT NULL DEFAULT '[]',
                hit_count     INTEGER NOT NULL DEFAULT 1,
                last_hit_at   REAL,
                created_at    REAL NOT NULL,
                updated_at    REAL NOT NULL,
                UNIQUE(question, role)
            );
        )")
            && exec("CREATE INDEX IF NOT EXISTS idx_query_cache_role ON query_cache(role);")
            && exec("CREATE INDEX IF NOT EXISTS idx_query_cache_created ON query_cache(created_at);")
            && exec(R"(
            CREATE TABLE IF NOT EXISTS customer_queries (
                id              INTEGER PRIMARY KEY AUTOINCREMENT,
                question        TEXT NOT NULL,
                customer_name   TEXT,
                customer_email  TEXT,
                status          TEXT NOT NULL DEFAULT 'pending'
                    CHECK (status IN ('pending', 'responded', 'archived')),
                created_at      REAL NOT NULL
            );
        )")
            && exec("CREATE INDEX IF NOT EXISTS idx_customer_queries_status ON customer_queries(status);")
            && exec("INSERT OR REPLACE INTO settings (key, value) VALUES ('schema_version', '2');");

        if (!ok) {
            exec("ROLLBACK TO SAVEPOINT migrate_v2");
            exec("RELEASE SAVEPOINT migrate_v2");
            return false;
        }
        if (!exec("RELEASE SAVEPOINT migrate_v2")) {
            return false;
        }

        current = 2;
    }

    LOG_INFO(dqStore, "Schema at version %d", current);
    return true;
}

} // namespace dq
