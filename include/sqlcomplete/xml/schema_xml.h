#pragma once

#include <flatbuffers/detached_buffer.h>

#include <memory>

#include "pugixml.hpp"
#include "sqlcomplete/catalog.h"
#include "sqlcomplete/proto/proto_generated.h"

namespace sqlcomplete::xml {

/// Pack a schema description as descriptor buffer.
///
/// The schema is described by the children of a node:
///   <database name="shop" />
///   <table name="users"><column name="id" /></table>
///   <view name="active_users"><column name="id" /></view>
///   <function schema="public" name="count_orders" />
///   <keyword name="RETURNING" />
///   <special name="\dt" />
/// Unknown children are logged and skipped.
std::unique_ptr<flatbuffers::DetachedBuffer> PackSchemaDescriptor(const pugi::xml_node& schema);
/// Load a schema description into a catalog
proto::StatusCode LoadCatalog(const pugi::xml_node& schema, Catalog& catalog);

}  // namespace sqlcomplete::xml
