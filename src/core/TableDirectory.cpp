#include "cmdreg/TableDirectory.hpp"

#include "cmdreg/Result.hpp"
#include "cmdreg/util/Logger.hpp"

#include <algorithm>

using namespace cmdreg;

TableDirectory& TableDirectory::instance() {
    static TableDirectory inst;
    return inst;
}

void TableDirectory::registerTable(const TableHandle& table) {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _tables.find(table->name());
        if (it != _tables.end() && !it->second.expired()) {
            throw TableExistsError(table->name());
        }
        _tables[table->name()] = table;
    }

    util::logger().log(
        util::LogLevel::Info,
        "Registered table",
        { {"table", table->name()} }
    );
}

void TableDirectory::unregisterTable(const CommandTable& table) {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _tables.find(table.name());
    if (it == _tables.end()) return;
    auto current = it->second.lock();
    if (!current || current.get() == &table) _tables.erase(it);
}

TableHandle TableDirectory::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _tables.find(name);
    if (it == _tables.end()) return nullptr;
    return it->second.lock();
}

TableHandle TableDirectory::get(const std::string& name) const {
    auto table = find(name);
    if (!table) throw TableNotFoundError(name);
    return table;
}

std::vector<std::string> TableDirectory::names() const {
    std::lock_guard<std::mutex> lock(_mutex);
    std::vector<std::string> v;
    v.reserve(_tables.size());
    for (const auto& kv : _tables) {
        if (!kv.second.expired()) v.push_back(kv.first);
    }
    std::sort(v.begin(), v.end());
    return v;
}
