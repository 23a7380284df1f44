#include "json_codec.h"
#include <drogon/utils/Utilities.h>

namespace sqlscope::service {

Json::Value to_json(const db::Value& v) {
  switch (db::value_type(v)) {
    case db::ValueType::Null:
      return Json::Value(Json::nullValue);
    case db::ValueType::Integer:
      return Json::Value(static_cast<Json::Int64>(std::get<int64_t>(v)));
    case db::ValueType::Real:
      return Json::Value(std::get<double>(v));
    case db::ValueType::Text:
      return Json::Value(std::get<std::string>(v));
    case db::ValueType::Blob: {
      const auto& b = std::get<db::Blob>(v);
      Json::Value j(Json::objectValue);
      j["blob"] = drogon::utils::base64Encode(b.data(), static_cast<unsigned int>(b.size()));
      j["size"] = static_cast<Json::UInt64>(b.size());
      return j;
    }
  }
  return Json::Value(Json::nullValue);
}

Json::Value to_json(const db::TableDescriptor& t) {
  Json::Value j(Json::objectValue);
  j["name"] = t.name;
  j["type"] = t.kind == db::TableKind::View ? "view" : "table";
  if (t.row_count) j["rowCount"] = static_cast<Json::Int64>(*t.row_count);
  return j;
}

Json::Value to_json(const db::ColumnDescriptor& c) {
  Json::Value j(Json::objectValue);
  j["cid"] = c.ordinal;
  j["name"] = c.name;
  j["type"] = c.declared_type;
  j["notnull"] = c.not_null;
  j["dflt_value"] = c.default_value ? to_json(*c.default_value) : Json::Value(Json::nullValue);
  j["pk"] = c.primary_key_index;
  j["isPrimaryKey"] = c.is_primary_key;
  return j;
}

Json::Value to_json(const db::IndexDescriptor& ix) {
  Json::Value j(Json::objectValue);
  j["name"] = ix.name;
  j["unique"] = ix.is_unique;
  j["origin"] = ix.origin;
  j["partial"] = ix.partial;
  Json::Value cols(Json::arrayValue);
  for (const auto& c : ix.columns) {
    Json::Value cj(Json::objectValue);
    cj["seqno"] = c.ordinal;
    cj["cid"] = c.table_column;
    cj["name"] = c.name.empty() ? Json::Value(Json::nullValue) : Json::Value(c.name);
    cols.append(cj);
  }
  j["columns"] = std::move(cols);
  return j;
}

Json::Value to_json(const db::ForeignKeyDescriptor& fk) {
  Json::Value j(Json::objectValue);
  j["id"] = fk.id;
  j["seq"] = fk.seq;
  j["table"] = fk.to_table;
  j["from"] = fk.from_column;
  j["to"] = fk.to_column.empty() ? Json::Value(Json::nullValue) : Json::Value(fk.to_column);
  j["on_update"] = fk.on_update;
  j["on_delete"] = fk.on_delete;
  j["match"] = fk.match;
  return j;
}

Json::Value to_json(const db::DatabaseInfo& info) {
  Json::Value j(Json::objectValue);
  for (const auto& setting : info.settings) {
    j[setting.first] = setting.second ? to_json(*setting.second) : Json::Value("N/A");
  }
  j["fileSize"] = info.file_size;
  if (info.file_size_bytes) j["fileSizeBytes"] = static_cast<Json::UInt64>(*info.file_size_bytes);
  j["filename"] = info.filename;
  return j;
}

Json::Value to_json(const db::QueryResult& r) {
  Json::Value j(Json::objectValue);
  if (!r.ok()) j["kind"] = "error";
  else j["kind"] = r.kind == db::ResultKind::Rows ? "rows" : "mutation";
  Json::Value cols(Json::arrayValue);
  for (const auto& c : r.columns) cols.append(c);
  j["columns"] = std::move(cols);
  Json::Value values(Json::arrayValue);
  for (const auto& row : r.rows) {
    Json::Value jr(Json::arrayValue);
    for (const auto& cell : row) jr.append(to_json(cell));
    values.append(std::move(jr));
  }
  j["values"] = std::move(values);
  if (!r.ok()) {
    j["rowCount"] = 0;
  } else if (r.kind == db::ResultKind::Rows) {
    j["rowCount"] = static_cast<Json::UInt64>(r.rows.size());
  } else {
    j["rowCount"] = static_cast<Json::Int64>(r.affected_count);
    j["affectedCount"] = static_cast<Json::Int64>(r.affected_count);
  }
  if (r.error) j["error"] = *r.error;
  return j;
}

}
