#pragma once

#include <string>
#include <string_view>

#include <google/protobuf/struct.pb.h>

namespace activity::util {

/*
  Module content is an opaque JSON object. The engine only ever
  replaces it as a whole, except for the top-level shallow merge
  applied by module updates.
*/
using Content = google::protobuf::Struct;

// Throws util::InvalidArgument if `json` is not a JSON object.
Content ParseContent(std::string_view json);

// Compact JSON with object keys sorted at every level. Equal documents
// always serialize to the same bytes.
std::string CanonicalJson(const Content& content);

// Fields of `patch` override fields of `base`; everything else is kept.
Content ShallowMerge(const Content& base, const Content& patch);

} // namespace activity::util
