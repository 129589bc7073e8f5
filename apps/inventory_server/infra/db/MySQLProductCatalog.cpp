#include "infra/db/MySQLProductCatalog.h"

#include <cppconn/exception.h>
#include <cppconn/prepared_statement.h>
#include <cppconn/resultset.h>

#include <algorithm>
#include <cctype>
#include <format>
#include <stdexcept>
#include <utility>

#include "MySQLConnPool.h"
#include "domain/InventoryErrors.h"
#include "infra/db/MySQLInventoryStore.h"

namespace {
// 标识符只能拼接进 SQL，不能走参数绑定
bool IsIdentifier(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isalnum(c) || c == '_'; });
}
}  // namespace

MySQLProductCatalog::MySQLProductCatalog(std::shared_ptr<MySQLConnPool> pool, Options options) : pool_(std::move(pool)), options_(std::move(options)) {
    if (!pool_)
        throw std::invalid_argument("MySQLProductCatalog: MySQLConnPool cannot be null");
    if (!IsIdentifier(options_.table) || !IsIdentifier(options_.skuColumn))
        throw std::invalid_argument(std::format("MySQLProductCatalog: invalid table/column '{}.{}'", options_.table, options_.skuColumn));
    query_ = std::format("SELECT 1 FROM {} WHERE {}=? LIMIT 1", options_.table, options_.skuColumn);
}

bool MySQLProductCatalog::ProductExists(const std::string& productRef) {
    auto conn = pool_->Acquire(options_.acquireTimeout);
    if (!conn)
        throw StorageFailure("no MySQL connection available for catalog lookup");
    try {
        auto stmt = conn->Prepare(query_);
        stmt->setString(1, productRef);
        std::unique_ptr<sql::ResultSet> rs(stmt->executeQuery());
        return rs->next();
    } catch (const sql::SQLException& e) {
        ThrowStoreError(e, conn.get(), "ProductExists " + productRef);
    }
}
