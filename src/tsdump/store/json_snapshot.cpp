#include "tsdump/store/json_snapshot.h"
#include "tsdump/common/logger.h"
#include "tsdump/core/error.h"

#include <cstdio>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace tsdump {
namespace store {

namespace {

void load_uids(const json& j, const char* kind, MemoryStore& store,
               void (MemoryStore::*add)(const std::string&, const core::Bytes&)) {
    if (!j.contains(kind)) {
        return;
    }
    for (auto it = j.at(kind).begin(); it != j.at(kind).end(); ++it) {
        (store.*add)(it.value().get<std::string>(), core::from_hex(it.key()));
    }
}

json dump_uids(const UidTable& table) {
    json out = json::object();
    for (const auto& entry : table.names) {
        out[core::to_hex(entry.first)] = entry.second;
    }
    return out;
}

} // namespace

core::Result<size_t> JsonSnapshot::load_from_string(const std::string& text, MemoryStore& store) {
    size_t loaded = 0;
    try {
        auto j = json::parse(text);
        if (j.contains("uids")) {
            const auto& uids = j.at("uids");
            load_uids(uids, "metrics", store, &MemoryStore::add_metric);
            load_uids(uids, "tagk", store, &MemoryStore::add_tagk);
            load_uids(uids, "tagv", store, &MemoryStore::add_tagv);
        }
        if (j.contains("rows")) {
            for (const auto& row : j.at("rows")) {
                core::Bytes key = core::from_hex(row.at("key").get<std::string>());
                for (const auto& column : row.at("columns")) {
                    store.put(key, core::Column(core::from_hex(column.at("qualifier").get<std::string>()),
                                                core::from_hex(column.at("value").get<std::string>())));
                }
                ++loaded;
            }
        }
    } catch (const json::exception& e) {
        return core::Result<size_t>::error(std::string("Invalid snapshot: ") + e.what());
    } catch (const core::InvalidArgumentError& e) {
        return core::Result<size_t>::error(std::string("Invalid snapshot: ") + e.what());
    }
    return core::Result<size_t>(loaded);
}

core::Result<size_t> JsonSnapshot::load(const std::string& path, MemoryStore& store) {
    std::ifstream in(path);
    if (!in) {
        return core::Result<size_t>::error("Cannot open snapshot: " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    auto result = load_from_string(buffer.str(), store);
    if (result.ok()) {
        TSDUMP_INFO("Loaded {} rows from {}", result.value(), path);
    }
    return result;
}

std::string JsonSnapshot::dump(const MemoryStore& store) {
    json j;
    j["uids"]["metrics"] = dump_uids(store.metric_table());
    j["uids"]["tagk"] = dump_uids(store.tagk_table());
    j["uids"]["tagv"] = dump_uids(store.tagv_table());
    j["rows"] = json::array();
    for (const auto& row : store.rows()) {
        json columns = json::array();
        for (const auto& column : row.columns) {
            columns.push_back({{"qualifier", core::to_hex(column.qualifier)},
                               {"value", core::to_hex(column.value)}});
        }
        j["rows"].push_back({{"key", core::to_hex(row.key)}, {"columns", columns}});
    }
    return j.dump(2);
}

core::Result<void> JsonSnapshot::save(const std::string& path, const MemoryStore& store) {
    std::string text = dump(store);
    std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            return core::Result<void>::error("Cannot write snapshot: " + tmp);
        }
        out << text << '\n';
        if (!out) {
            return core::Result<void>::error("Failed writing snapshot: " + tmp);
        }
    }
    if (std::rename(tmp.c_str(), path.c_str()) != 0) {
        return core::Result<void>::error("Cannot replace snapshot: " + path);
    }
    TSDUMP_INFO("Saved {} rows to {}", store.row_count(), path);
    return core::Result<void>();
}

} // namespace store
} // namespace tsdump
