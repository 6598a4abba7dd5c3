#include "mapping_store.hpp"

#include <mutex>
#include <utility>

namespace fhosts {

void MappingStore::replace(MappingTable mappings)
{
    MappingTable old;
    {
        std::unique_lock<std::shared_mutex> lock(_mutex);
        old = std::exchange(_table, std::move(mappings));
    }
    // old 在锁外析构
}

std::string MappingStore::lookup(const std::string& hostname) const
{
    std::shared_lock<std::shared_mutex> lock(_mutex);
    auto                                it = _table.find(hostname);
    if (it != _table.end())
        return it->second;
    return hostname;
}

size_t MappingStore::size() const
{
    std::shared_lock<std::shared_mutex> lock(_mutex);
    return _table.size();
}

MappingTable MappingStore::snapshot() const
{
    std::shared_lock<std::shared_mutex> lock(_mutex);
    return _table;
}

} // namespace fhosts
