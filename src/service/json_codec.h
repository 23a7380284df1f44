#pragma once
#include <json/json.h>
#include <vector>
#include "db/descriptors.h"

namespace sqlscope::service {

// JSON shapes of the message protocol. Field names follow SQLite's pragma output
// (cid, notnull, dflt_value, pk, ...) so front ends can render them unchanged.

// Blobs become { "blob": <base64>, "size": n }.
Json::Value to_json(const db::Value& v);
Json::Value to_json(const db::TableDescriptor& t);
Json::Value to_json(const db::ColumnDescriptor& c);
Json::Value to_json(const db::IndexDescriptor& ix);
Json::Value to_json(const db::ForeignKeyDescriptor& fk);
Json::Value to_json(const db::DatabaseInfo& info);
// { kind: rows|mutation|error, columns, values, rowCount, error? }; rowCount is the row
// total for row sets and the affected count for mutations.
Json::Value to_json(const db::QueryResult& r);

template <typename T>
Json::Value to_json_array(const std::vector<T>& items) {
  Json::Value arr(Json::arrayValue);
  for (const auto& item : items) arr.append(to_json(item));
  return arr;
}

}
