#pragma once

#include <cstddef>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace fhosts {

using MappingTable = std::unordered_map<std::string, std::string>;

/**
 * @brief hostname -> targetHost 替换表，读多写少。
 *
 * replace 整表替换；lookup 在共享锁下读取，未命中时原样返回 hostname。
 * hostname 不做大小写归一化。
 */
class MappingStore {
public:
    MappingStore() = default;
    MappingStore(const MappingStore&)            = delete;
    MappingStore& operator=(const MappingStore&) = delete;

    void        replace(MappingTable mappings);
    std::string lookup(const std::string& hostname) const;
    size_t      size() const;
    MappingTable snapshot() const;

private:
    mutable std::shared_mutex _mutex;
    MappingTable              _table;
};

} // namespace fhosts
