#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "domain/InventoryPorts.h"

class MySQLConnPool;

// 读取目录服务的商品表判断商品是否存在；表名与列名来自配置
class MySQLProductCatalog : public ProductCatalog {
public:
    struct Options {
        std::string table{"products"};
        std::string skuColumn{"sku"};
        std::chrono::milliseconds acquireTimeout{3000};
    };

    MySQLProductCatalog(std::shared_ptr<MySQLConnPool> pool, Options options);

    bool ProductExists(const std::string& productRef) override;

private:
    std::shared_ptr<MySQLConnPool> pool_;
    Options options_;
    std::string query_;
};
