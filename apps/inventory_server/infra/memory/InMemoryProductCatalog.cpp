#include "infra/memory/InMemoryProductCatalog.h"

InMemoryProductCatalog::InMemoryProductCatalog(bool acceptAll) : acceptAll_(acceptAll) {}

InMemoryProductCatalog::InMemoryProductCatalog(const std::vector<std::string>& productRefs, bool acceptAll) :
    products_(productRefs.begin(), productRefs.end()), acceptAll_(acceptAll) {}

bool InMemoryProductCatalog::ProductExists(const std::string& productRef) {
    if (acceptAll_)
        return true;
    std::lock_guard<std::mutex> lock(mutex_);
    return products_.count(productRef) > 0;
}

void InMemoryProductCatalog::AddProduct(const std::string& productRef) {
    std::lock_guard<std::mutex> lock(mutex_);
    products_.insert(productRef);
}

void InMemoryProductCatalog::RemoveProduct(const std::string& productRef) {
    std::lock_guard<std::mutex> lock(mutex_);
    products_.erase(productRef);
}
