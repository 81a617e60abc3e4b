#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/content.hpp"
#include "internal/util/time.hpp"

using activity::core::Outcome;
using google::protobuf::Struct;
using google::protobuf::Value;

namespace {

static void Usage() {
  std::cout << "Usage: activity-history [--config <config.yaml>] <command> [args]\n"
            << "  module create --slug <s> --title <t> --actor <id> [--description <d>] [--type <type>]\n"
            << "                [--status <status>] [--content <json>] [--branch <b>] [--message <m>]\n"
            << "  module update <slug> --actor <id> [--content <json>] [--title <t>] [--description <d>]\n"
            << "                [--status <status>] [--branch <b>] [--message <m>]\n"
            << "  module get (--slug <s> | --id <id>) [--branch <b>] [--commit <hash>]\n"
            << "  module search [--title <substr>] [--type <type>] [--status <status>] [--created-by <id>]\n"
            << "                [--branch <b>] [--page <n>] [--limit <n>]\n"
            << "  module delete <slug>\n"
            << "  module fork <source-slug> <new-slug> --actor <id> [--title <t>]\n"
            << "  module history <slug> [--branch <b>] [--limit <n>]\n"
            << "  commit get <hash>\n"
            << "  branch list\n"
            << "  branch default --actor <id>\n"
            << "  branch create <name> --actor <id> [--from <b>] [--description <d>]\n"
            << "  branch delete <name>\n"
            << "  mr create --title <t> --from <module-id> --to <module-id> --actor <id> [--description <d>]\n"
            << "  mr accept <id> --actor <id> [--reason <r>] [--resolved <json>]\n"
            << "  mr reject <id> --actor <id> [--reason <r>] [--stop-comments]\n"
            << "  mr close <id> --actor <id> [--reason <r>] [--stop-comments]\n"
            << "  mr comment <id> --text <t> --actor <id>\n"
            << "  mr comments <id>\n"
            << "  mr get <id>\n"
            << "  mr list --module <id> [--status <status>]\n"
            << "  mr delete <id> --actor <id>\n";
}

class UsageError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Positional arguments plus --flag value pairs. --stop-comments takes no value.
struct Args {
  std::vector<std::string>           positional;
  std::map<std::string, std::string> flags;

  std::optional<std::string> Get(const std::string& name) const {
    auto it = flags.find(name);
    if (it == flags.end()) return std::nullopt;
    return it->second;
  }

  std::string Require(const std::string& name) const {
    auto value = Get(name);
    if (!value) throw UsageError("missing --" + name);
    return *value;
  }

  std::optional<std::int64_t> GetInt(const std::string& name) const {
    auto value = Get(name);
    if (!value) return std::nullopt;
    try {
      return std::stoll(*value);
    } catch (const std::exception&) {
      throw UsageError("--" + name + " expects a number, got '" + *value + "'");
    }
  }

  std::int64_t RequireInt(const std::string& name) const {
    auto value = GetInt(name);
    if (!value) throw UsageError("missing --" + name);
    return *value;
  }

  bool Has(const std::string& name) const {
    return flags.count(name) > 0;
  }

  const std::string& Positional(std::size_t index, const char* what) const {
    if (index >= positional.size()) throw UsageError(std::string("missing ") + what);
    return positional[index];
  }
};

static Args ParseArgs(int argc, char** argv, int first) {
  Args args;
  for (int i = first; i < argc; ++i) {
    std::string token = argv[i];
    if (token.rfind("--", 0) != 0) {
      args.positional.push_back(token);
      continue;
    }
    auto name = token.substr(2);
    if (name == "stop-comments") {
      args.flags[name] = "true";
      continue;
    }
    if (i + 1 >= argc) throw UsageError("missing value for " + token);
    args.flags[name] = argv[++i];
  }
  return args;
}

static std::int64_t ParseId(const std::string& value) {
  try {
    return std::stoll(value);
  } catch (const std::exception&) {
    throw UsageError("expected a numeric id, got '" + value + "'");
  }
}

static activity::model::ModuleType ParseType(const std::string& value) {
  auto type = activity::model::ParseModuleType(value);
  if (!type) throw UsageError("unknown module type: " + value);
  return *type;
}

static activity::model::ModuleStatus ParseStatus(const std::string& value) {
  auto status = activity::model::ParseModuleStatus(value);
  if (!status) throw UsageError("unknown module status: " + value);
  return *status;
}

// ------------------------------------------------------------
// JSON rendering
// ------------------------------------------------------------

static Value Str(const std::string& s) {
  Value v;
  v.set_string_value(s);
  return v;
}

static Value Num(double n) {
  Value v;
  v.set_number_value(n);
  return v;
}

static Value Bool(bool b) {
  Value v;
  v.set_bool_value(b);
  return v;
}

static Value Null() {
  Value v;
  v.set_null_value(google::protobuf::NULL_VALUE);
  return v;
}

static Value Time(uint64_t ms) {
  return Str(activity::util::ToIso8601(ms));
}

template <typename T>
static Value Opt(const std::optional<T>& v) {
  return v ? Num(static_cast<double>(*v)) : Null();
}

static Value Obj(Struct s) {
  Value v;
  *v.mutable_struct_value() = std::move(s);
  return v;
}

template <typename T, typename Fn>
static Value List(const std::vector<T>& items, Fn&& render) {
  Value v;
  auto* list = v.mutable_list_value();
  for (const auto& item : items) *list->add_values() = render(item);
  return v;
}

static Value Render(const activity::db::model::ModuleRecord& m) {
  Struct s;
  auto&  f = *s.mutable_fields();
  f["id"]             = Num(static_cast<double>(m.id));
  f["slug"]           = Str(m.slug);
  f["title"]          = Str(m.title);
  f["description"]    = Str(m.description);
  f["type"]           = Str(std::string(activity::model::ToString(m.type)));
  f["status"]         = Str(std::string(activity::model::ToString(m.status)));
  f["createdBy"]      = Num(static_cast<double>(m.created_by));
  f["createdAt"]      = Time(m.created_at_ms);
  f["originModuleId"] = Opt(m.origin_module_id);
  f["forkedFromId"]   = Opt(m.forked_from_id);
  return Obj(std::move(s));
}

static Value Render(const activity::db::model::BranchRecord& b) {
  Struct s;
  auto&  f = *s.mutable_fields();
  f["id"]          = Num(static_cast<double>(b.id));
  f["name"]        = Str(b.name);
  f["description"] = Str(b.description);
  f["isDefault"]   = Bool(b.is_default);
  f["createdBy"]   = Num(static_cast<double>(b.created_by));
  f["createdAt"]   = Time(b.created_at_ms);
  return Obj(std::move(s));
}

static Value Render(const activity::db::model::VersionRecord& v) {
  Struct s;
  auto&  f = *s.mutable_fields();
  f["id"]            = Num(static_cast<double>(v.id));
  f["moduleId"]      = Num(static_cast<double>(v.module_id));
  f["branchId"]      = Num(static_cast<double>(v.branch_id));
  f["commitId"]      = Num(static_cast<double>(v.commit_id));
  f["title"]         = Str(v.title);
  f["description"]   = Str(v.description);
  f["contentHash"]   = Str(v.content_hash);
  f["isCurrentHead"] = Bool(v.is_current_head);
  f["createdAt"]     = Time(v.created_at_ms);
  f["content"]       = Obj(activity::util::ParseContent(v.content));
  return Obj(std::move(s));
}

static Value Render(const activity::model::Commit& commit) {
  const auto& h = activity::model::Header(commit);

  Struct s;
  auto&  f = *s.mutable_fields();
  f["id"]            = Num(static_cast<double>(h.id));
  f["hash"]          = Str(h.hash);
  f["message"]       = Str(h.message);
  f["author"]        = Num(static_cast<double>(h.author));
  f["committer"]     = Num(static_cast<double>(h.committer));
  f["moduleId"]      = Num(static_cast<double>(h.module_id));
  f["committedAt"]   = Time(h.committed_at_ms);
  f["isMergeCommit"] = Bool(activity::model::IsMerge(commit));
  if (const auto* merge = std::get_if<activity::model::MergeCommit>(&commit)) {
    f["parentCommitId"] = Num(static_cast<double>(merge->primary_parent_id));
    f["extraParentIds"] = List(merge->extra_parent_ids, [](std::int64_t id) { return Num(static_cast<double>(id)); });
  } else {
    f["parentCommitId"] = Opt(std::get<activity::model::LinearCommit>(commit).parent_id);
  }
  return Obj(std::move(s));
}

static Value Render(const activity::db::model::MergeRequestRecord& r) {
  Struct s;
  auto&  f = *s.mutable_fields();
  f["id"]            = Num(static_cast<double>(r.id));
  f["title"]         = Str(r.title);
  f["description"]   = Str(r.description);
  f["fromModuleId"]  = Num(static_cast<double>(r.from_module_id));
  f["toModuleId"]    = Num(static_cast<double>(r.to_module_id));
  f["status"]        = Str(std::string(activity::model::ToString(r.status)));
  f["createdBy"]     = Num(static_cast<double>(r.created_by));
  f["createdAt"]     = Time(r.created_at_ms);
  f["mergedBy"]      = Opt(r.merged_by);
  f["mergedAt"]      = r.merged_at_ms ? Time(*r.merged_at_ms) : Null();
  f["rejectedBy"]    = Opt(r.rejected_by);
  f["rejectedAt"]    = r.rejected_at_ms ? Time(*r.rejected_at_ms) : Null();
  f["closedBy"]      = Opt(r.closed_by);
  f["closedAt"]      = r.closed_at_ms ? Time(*r.closed_at_ms) : Null();
  f["reason"]        = Str(r.reason);
  f["allowComments"] = Bool(r.allow_comments);
  return Obj(std::move(s));
}

static Value Render(const activity::db::model::MergeRequestCommentRecord& c) {
  Struct s;
  auto&  f = *s.mutable_fields();
  f["id"]             = Num(static_cast<double>(c.id));
  f["mergeRequestId"] = Num(static_cast<double>(c.merge_request_id));
  f["author"]         = Num(static_cast<double>(c.author));
  f["text"]           = Str(c.text);
  f["createdAt"]      = Time(c.created_at_ms);
  return Obj(std::move(s));
}

static Value Render(const activity::core::ModuleRevision& r) {
  Struct s;
  auto&  f = *s.mutable_fields();
  f["module"]  = Render(r.module);
  f["version"] = Render(r.version);
  f["commit"]  = Render(r.commit);
  f["branch"]  = Render(r.branch);
  return Obj(std::move(s));
}

static Value Render(const activity::core::ModuleSnapshot& r) {
  Struct s;
  auto&  f = *s.mutable_fields();
  f["module"]  = Render(r.module);
  f["version"] = Render(r.version);
  f["branch"]  = Render(r.branch);
  return Obj(std::move(s));
}

static Value Render(const activity::core::Page<activity::core::SearchHit>& page) {
  Struct s;
  auto&  f = *s.mutable_fields();
  f["items"] = List(page.items, [](const activity::core::SearchHit& hit) {
    Struct item;
    (*item.mutable_fields())["module"]  = Render(hit.module);
    (*item.mutable_fields())["version"] = hit.version ? Render(*hit.version) : Null();
    return Obj(std::move(item));
  });
  f["total"]      = Num(static_cast<double>(page.total));
  f["page"]       = Num(page.page);
  f["limit"]      = Num(page.limit);
  f["totalPages"] = Num(page.total_pages);
  f["hasNext"]    = Bool(page.has_next);
  f["hasPrev"]    = Bool(page.has_prev);
  return Obj(std::move(s));
}

static Value Render(const activity::core::CreateBranchResult& r) {
  Struct s;
  auto&  f = *s.mutable_fields();
  f["branch"]             = Render(r.branch);
  f["sourceBranch"]       = Render(r.source_branch);
  f["copiedVersionCount"] = Num(static_cast<double>(r.copied_version_count));
  return Obj(std::move(s));
}

static Value Render(const activity::core::ForkModuleResult& r) {
  Struct s;
  auto&  f = *s.mutable_fields();
  f["module"]             = Render(r.module);
  f["sourceModule"]       = Render(r.source_module);
  f["copiedVersionCount"] = Num(static_cast<double>(r.copied_version_count));
  return Obj(std::move(s));
}

static Value Render(const activity::core::AcceptResult& r) {
  Struct summary;
  auto&  sf = *summary.mutable_fields();
  sf["copied"]        = Num(static_cast<double>(r.summary.copied));
  sf["fastForwarded"] = Num(static_cast<double>(r.summary.fast_forwarded));
  sf["merged"]        = Num(static_cast<double>(r.summary.merged));
  sf["unchanged"]     = Num(static_cast<double>(r.summary.unchanged));
  sf["skipped"]       = Num(static_cast<double>(r.summary.skipped));

  Struct s;
  (*s.mutable_fields())["mergeRequest"] = Render(r.request);
  (*s.mutable_fields())["summary"]      = Obj(std::move(summary));
  return Obj(std::move(s));
}

template <typename T>
static Value Render(const std::vector<T>& items) {
  return List(items, [](const T& item) { return Render(item); });
}

// Prints the value or the error; returns the process exit code.
template <typename T>
static int Emit(const Outcome<T>& outcome) {
  Value out;
  if (outcome) {
    out = Render(outcome.value());
  } else {
    Struct error;
    (*error.mutable_fields())["error"]   = Str(std::string(activity::core::ToString(outcome.error().kind)));
    (*error.mutable_fields())["message"] = Str(outcome.error().message);
    out = Obj(std::move(error));
  }

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(out, &json, options);
  if (!status.ok()) {
    std::cerr << "failed to render output: " << status.message() << "\n";
    return 2;
  }
  (outcome ? std::cout : std::cerr) << json;
  return outcome ? 0 : 1;
}

// ------------------------------------------------------------
// Commands
// ------------------------------------------------------------

static int RunModule(activity::factory::RuntimeDependencies& deps, const std::string& sub, const Args& args) {
  auto& revisions = *deps.revisions;

  if (sub == "create") {
    activity::core::CreateModuleArgs create;
    create.slug        = args.Require("slug");
    create.title       = args.Require("title");
    create.description = args.Get("description").value_or("");
    create.actor       = args.RequireInt("actor");
    if (auto type = args.Get("type")) create.type = ParseType(*type);
    if (auto status = args.Get("status")) create.status = ParseStatus(*status);
    if (auto content = args.Get("content")) create.content = activity::util::ParseContent(*content);
    create.branch  = args.Get("branch");
    create.message = args.Get("message");
    return Emit(revisions.CreateModule(create));
  }

  if (sub == "update") {
    activity::core::UpdateModuleArgs update;
    update.actor       = args.RequireInt("actor");
    update.title       = args.Get("title");
    update.description = args.Get("description");
    if (auto status = args.Get("status")) update.status = ParseStatus(*status);
    if (auto content = args.Get("content")) update.content = activity::util::ParseContent(*content);
    update.branch  = args.Get("branch");
    update.message = args.Get("message");
    return Emit(revisions.UpdateModule(args.Positional(0, "slug"), update));
  }

  if (sub == "get") {
    activity::core::GetModuleArgs get;
    get.slug        = args.Get("slug");
    get.id          = args.GetInt("id");
    get.branch      = args.Get("branch");
    get.commit_hash = args.Get("commit");
    return Emit(revisions.GetModule(get));
  }

  if (sub == "search") {
    activity::core::SearchModulesArgs search;
    search.title_contains = args.Get("title");
    if (auto type = args.Get("type")) search.type = ParseType(*type);
    if (auto status = args.Get("status")) search.status = ParseStatus(*status);
    search.created_by = args.GetInt("created-by");
    search.branch     = args.Get("branch");
    if (auto page = args.GetInt("page")) search.page = static_cast<std::uint32_t>(*page);
    if (auto limit = args.GetInt("limit")) search.limit = static_cast<std::uint32_t>(*limit);
    return Emit(revisions.SearchModules(search));
  }

  if (sub == "delete") {
    return Emit(revisions.DeleteModule(args.Positional(0, "slug")));
  }

  if (sub == "fork") {
    activity::core::ForkModuleArgs fork;
    fork.source_slug = args.Positional(0, "source slug");
    fork.new_slug    = args.Positional(1, "new slug");
    fork.actor       = args.RequireInt("actor");
    fork.title       = args.Get("title");
    return Emit(deps.branches->ForkModule(fork));
  }

  if (sub == "history") {
    std::optional<std::uint32_t> limit;
    if (auto value = args.GetInt("limit")) limit = static_cast<std::uint32_t>(*value);
    return Emit(revisions.GetHistory(args.Positional(0, "slug"), args.Get("branch"), limit));
  }

  throw UsageError("unknown module command: " + sub);
}

static int RunBranch(activity::factory::RuntimeDependencies& deps, const std::string& sub, const Args& args) {
  auto& branches = *deps.branches;

  if (sub == "list") return Emit(branches.ListBranches());
  if (sub == "default") return Emit(branches.GetOrCreateDefaultBranch(args.RequireInt("actor")));

  if (sub == "create") {
    activity::core::CreateBranchArgs create;
    create.name        = args.Positional(0, "branch name");
    create.from        = args.Get("from");
    create.actor       = args.RequireInt("actor");
    create.description = args.Get("description").value_or("");
    return Emit(branches.CreateBranch(create));
  }

  if (sub == "delete") return Emit(branches.DeleteBranch(args.Positional(0, "branch name")));

  throw UsageError("unknown branch command: " + sub);
}

static int RunMergeRequest(activity::factory::RuntimeDependencies& deps, const std::string& sub, const Args& args) {
  auto& requests = *deps.merge_requests;

  if (sub == "create") {
    activity::core::CreateMergeRequestArgs create;
    create.title          = args.Require("title");
    create.description    = args.Get("description").value_or("");
    create.from_module_id = args.RequireInt("from");
    create.to_module_id   = args.RequireInt("to");
    create.actor          = args.RequireInt("actor");
    return Emit(requests.Create(create));
  }

  if (sub == "list") {
    std::optional<activity::model::MergeRequestStatus> status;
    if (auto value = args.Get("status")) {
      status = activity::model::ParseMergeRequestStatus(*value);
      if (!status) throw UsageError("unknown merge request status: " + *value);
    }
    return Emit(requests.ListByModule(args.RequireInt("module"), status));
  }

  const auto id = ParseId(args.Positional(0, "merge request id"));

  if (sub == "accept") {
    std::optional<activity::util::Content> resolved;
    if (auto value = args.Get("resolved")) resolved = activity::util::ParseContent(*value);
    return Emit(requests.Accept(id, args.RequireInt("actor"), args.Get("reason"), resolved));
  }
  if (sub == "reject") return Emit(requests.Reject(id, args.RequireInt("actor"), args.Get("reason"), args.Has("stop-comments")));
  if (sub == "close") return Emit(requests.Close(id, args.RequireInt("actor"), args.Get("reason"), args.Has("stop-comments")));
  if (sub == "comment") return Emit(requests.Comment(id, args.Require("text"), args.RequireInt("actor")));
  if (sub == "comments") return Emit(requests.ListComments(id));
  if (sub == "get") return Emit(requests.GetById(id));
  if (sub == "delete") return Emit(requests.Delete(id, args.RequireInt("actor")));

  throw UsageError("unknown mr command: " + sub);
}

static int RunCommit(activity::factory::RuntimeDependencies& deps, const std::string& sub, const Args& args) {
  if (sub == "get") return Emit(deps.revisions->GetCommitByHash(args.Positional(0, "commit hash")));
  throw UsageError("unknown commit command: " + sub);
}

} // namespace

int main(int argc, char** argv) {
  int                                     first = 1;
  activity::runtime::config::RuntimeConfig config;

  try {
    if (argc >= 3 && std::string(argv[1]) == "--config") {
      config = activity::config::ConfigLoader::LoadFromYaml(argv[2]);
      first  = 3;
    }
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }

  if (argc - first < 2) {
    Usage();
    return 1;
  }

  const std::string group = argv[first];
  const std::string sub   = argv[first + 1];

  try {
    activity::observability::InitializeLogging(config);

    auto args = ParseArgs(argc, argv, first + 2);
    auto deps = activity::factory::BuildRuntime(config);

    int rc = 1;
    if (group == "module") {
      rc = RunModule(deps, sub, args);
    } else if (group == "branch") {
      rc = RunBranch(deps, sub, args);
    } else if (group == "mr") {
      rc = RunMergeRequest(deps, sub, args);
    } else if (group == "commit") {
      rc = RunCommit(deps, sub, args);
    } else {
      throw UsageError("unknown command: " + group);
    }

    activity::observability::ShutdownLogging();
    return rc;
  } catch (const UsageError& e) {
    std::cerr << e.what() << "\n";
    Usage();
    activity::observability::ShutdownLogging();
    return 1;
  } catch (const std::exception& e) {
    ACTIVITY_LOG_ERROR("Fatal error", {activity::observability::StringField("error", e.what())});
    activity::observability::ShutdownLogging();
    return 2;
  }
}
