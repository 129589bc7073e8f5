#pragma once

#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

#include "domain/InventoryPorts.h"

// 进程内商品目录；acceptAll 为 true 时任何商品都视为存在
class InMemoryProductCatalog : public ProductCatalog {
public:
    explicit InMemoryProductCatalog(bool acceptAll = false);
    InMemoryProductCatalog(const std::vector<std::string>& productRefs, bool acceptAll = false);

    bool ProductExists(const std::string& productRef) override;

    void AddProduct(const std::string& productRef);
    void RemoveProduct(const std::string& productRef);

private:
    std::mutex mutex_;
    std::unordered_set<std::string> products_;
    bool acceptAll_;
};
