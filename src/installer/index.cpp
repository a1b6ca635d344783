// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.


#include <string>

#include <stout/foreach.hpp>
#include <stout/hashmap.hpp>
#include <stout/json.hpp>
#include <stout/stringify.hpp>

#include "installer/constants.hpp"
#include "installer/index.hpp"

using std::string;

namespace curator {
namespace internal {
namespace installer {

namespace {

JSON::Object field(const string& type)
{
  JSON::Object object;
  object.values["type"] = type;
  return object;
}


JSON::Object disabledObject()
{
  JSON::Object object = field("object");
  object.values["enabled"] = false;
  return object;
}


JSON::Object properties(const JSON::Object& fields)
{
  JSON::Object object;
  object.values["properties"] = fields;
  return object;
}


JSON::Object sourceMappings()
{
  JSON::Object fields;
  fields.values["index"] = field("keyword");
  fields.values["query"] = disabledObject();
  return properties(fields);
}


JSON::Object destMappings()
{
  JSON::Object fields;
  fields.values["index"] = field("keyword");
  fields.values["pipeline"] = field("keyword");
  return properties(fields);
}


JSON::Object statsMappings()
{
  JSON::Object fields;
  fields.values["pages_processed"] = field("long");
  fields.values["documents_processed"] = field("long");
  fields.values["documents_indexed"] = field("long");
  fields.values["trigger_count"] = field("long");
  fields.values["index_time_in_ms"] = field("long");
  fields.values["index_total"] = field("long");
  fields.values["index_failures"] = field("long");
  fields.values["search_time_in_ms"] = field("long");
  fields.values["search_total"] = field("long");
  fields.values["search_failures"] = field("long");
  fields.values["exponential_avg_checkpoint_duration_ms"] = field("double");
  fields.values["exponential_avg_documents_indexed"] = field("double");
  fields.values["exponential_avg_documents_processed"] = field("double");
  return properties(fields);
}


void copySettings(
    const hashmap<string, string>& from,
    google::protobuf::Map<string, string>* to)
{
  foreachpair (const string& key, const string& value, from) {
    (*to)[key] = value;
  }
}

} // namespace {


string latestVersionedIndexName(const Flags& flags)
{
  return flags.index_prefix + flags.index_version;
}


string auditTemplateName(const Flags& flags)
{
  return flags.audit_index_prefix + flags.audit_template_version;
}


string auditIndexPattern(const Flags& flags)
{
  return flags.audit_index_prefix + "*";
}


string auditReadAlias(const Flags& flags)
{
  return flags.audit_index_prefix + AUDIT_READ_ALIAS_SUFFIX;
}


hashmap<string, string> settings()
{
  hashmap<string, string> settings;
  settings["index.number_of_shards"] = "1";
  settings["index.auto_expand_replicas"] = "0-1";
  return settings;
}


JSON::Object mappings(const Flags& flags)
{
  JSON::Object meta;
  meta.values["version"] = flags.version_id;

  JSON::Object fields;
  fields.values["doc_type"] = field("keyword");
  fields.values["id"] = field("keyword");
  fields.values["version"] = field("keyword");
  fields.values["description"] = field("text");
  fields.values["create_time"] = field("date");
  fields.values["source"] = sourceMappings();
  fields.values["dest"] = destMappings();
  fields.values["checkpoint"] = field("long");
  fields.values["timestamp_millis"] = field("long");
  fields.values["time_upper_bound_millis"] = field("long");
  fields.values["stats"] = statsMappings();

  JSON::Object object = properties(fields);
  object.values["dynamic"] = false;
  object.values["_meta"] = meta;
  return object;
}


JSON::Object auditMappings()
{
  JSON::Object raw;
  raw.values["raw"] = field("keyword");

  JSON::Object message = field("text");
  message.values["fields"] = raw;

  JSON::Object fields;
  fields.values["transform_id"] = field("keyword");
  fields.values["timestamp"] = field("date");
  fields.values["level"] = field("keyword");
  fields.values["message"] = message;
  fields.values["node_name"] = field("keyword");

  JSON::Object object = properties(fields);
  object.values["dynamic"] = false;
  return object;
}


IndexTemplateMetadata auditIndexTemplate(const Flags& flags)
{
  IndexTemplateMetadata metadata;
  metadata.set_name(auditTemplateName(flags));
  metadata.set_version(flags.version_id);
  metadata.add_index_patterns(auditIndexPattern(flags));
  metadata.add_aliases(auditReadAlias(flags));
  metadata.set_mappings(stringify(auditMappings()));
  copySettings(settings(), metadata.mutable_settings());
  return metadata;
}


CreateIndexRequest createIndexRequest(const Flags& flags)
{
  CreateIndexRequest request;
  request.set_index(latestVersionedIndexName(flags));
  request.set_mappings(stringify(mappings(flags)));
  request.set_origin(flags.origin);
  copySettings(settings(), request.mutable_settings());
  return request;
}


PutIndexTemplateRequest putAuditTemplateRequest(const Flags& flags)
{
  PutIndexTemplateRequest request;
  request.mutable_index_template()->CopyFrom(auditIndexTemplate(flags));
  request.set_create(true);
  request.set_origin(flags.origin);
  return request;
}

} // namespace installer {
} // namespace internal {
} // namespace curator {
