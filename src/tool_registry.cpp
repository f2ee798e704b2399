#include "tool_registry.hpp"

#include "log.hpp"

#include <cmath>
#include <exception>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace pulsar_mcp {
namespace {

// Out-of-range values saturate; positions are clipped to the buffer later.
static int IntArg(const nlohmann::json& args, const char* key, int fallback) {
  if (!args.contains(key) || !args[key].is_number()) return fallback;
  const double v = args[key].get<double>();
  if (std::isnan(v)) return fallback;
  constexpr double kMin = static_cast<double>(std::numeric_limits<int>::min());
  constexpr double kMax = static_cast<double>(std::numeric_limits<int>::max());
  if (v <= kMin) return std::numeric_limits<int>::min();
  if (v >= kMax) return std::numeric_limits<int>::max();
  return static_cast<int>(v);
}

static bool BoolArg(const nlohmann::json& args, const char* key, bool fallback) {
  if (!args.contains(key) || !args[key].is_boolean()) return fallback;
  return args[key].get<bool>();
}

static std::string StringArg(const nlohmann::json& args, const char* key) {
  if (!args.contains(key) || !args[key].is_string()) return {};
  return args[key].get<std::string>();
}

static bool ParseRanges(const nlohmann::json& items, std::vector<Range>* out, std::string* err) {
  for (size_t i = 0; i < items.size(); i++) {
    const auto& r = items[i];
    bool ok = r.is_object();
    for (const char* key : {"startRow", "startColumn", "endRow", "endColumn"}) {
      if (!ok) break;
      ok = r.contains(key) && r[key].is_number();
    }
    if (!ok) {
      if (err) *err = "ranges[" + std::to_string(i) + "] must have numeric startRow, startColumn, endRow, endColumn";
      return false;
    }
    Range range;
    range.start = {IntArg(r, "startRow", 0), IntArg(r, "startColumn", 0)};
    range.end = {IntArg(r, "endRow", 0), IntArg(r, "endColumn", 0)};
    out->push_back(range);
  }
  return true;
}

static nlohmann::json Identity(const nlohmann::json& raw, const nlohmann::json&) {
  return raw;
}

static ToolFormatter Verb(const char* verb) {
  return [verb](const nlohmann::json& raw, const nlohmann::json&) { return nlohmann::json{{verb, raw}}; };
}

template <typename T>
static nlohmann::json ToJsonArray(const std::vector<T>& items) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& item : items) out.push_back(ToJson(item));
  return out;
}

}  // namespace

ExecutionResult ExecutionResult::Ok(nlohmann::json data) {
  ExecutionResult r;
  r.success = true;
  r.data = std::move(data);
  return r;
}

ExecutionResult ExecutionResult::Failure(std::string error) {
  ExecutionResult r;
  r.success = false;
  r.error = error.empty() ? std::string("Tool execution failed") : std::move(error);
  return r;
}

nlohmann::json ToJson(const ExecutionResult& r) {
  nlohmann::json j;
  j["success"] = r.success;
  j["data"] = r.data;
  j["error"] = r.success ? nlohmann::json(nullptr) : nlohmann::json(r.error);
  return j;
}

void ToolRegistry::Bind(ToolId id, ToolBinding binding) {
  bindings_[id] = std::move(binding);
}

bool ToolRegistry::HasTool(const std::string& name) const {
  auto id = ToolIdFromName(name);
  return id && bindings_.count(*id) > 0;
}

std::vector<ToolId> ToolRegistry::UnboundTools() const {
  std::vector<ToolId> out;
  for (const auto& def : ToolCatalog()) {
    if (bindings_.count(def.id) == 0) out.push_back(def.id);
  }
  return out;
}

ExecutionResult ToolRegistry::Execute(const std::string& name, const nlohmann::json& args) const {
  auto id = ToolIdFromName(name);
  if (!id) return ExecutionResult::Failure("Unknown tool: " + name);
  return Execute(*id, args);
}

ExecutionResult ToolRegistry::Execute(ToolId id, const nlohmann::json& args) const {
  const std::string& name = ToolName(id);
  auto it = bindings_.find(id);
  if (it == bindings_.end() || !host_) return ExecutionResult::Failure("Unknown tool: " + name);
  const ToolBinding& binding = it->second;

  if (!args.is_object()) return ExecutionResult::Failure("arguments must be an object");
  if (auto msg = ValidateArgs(binding.rules, args)) return ExecutionResult::Failure(*msg);

  LogDebug("tool", "call name=" + name + " arguments=" + TruncateForLog(args.dump(), 2000));

  ExecutionResult out;
  try {
    std::string err;
    auto raw = binding.execute(*host_, args, &err);
    if (!raw) {
      out = ExecutionResult::Failure(err.empty() ? "Tool call failed: " + name : err);
    } else if (!binding.false_is_failure.empty() && raw->is_boolean() && !raw->get<bool>()) {
      out = ExecutionResult::Failure(binding.false_is_failure);
    } else {
      out = ExecutionResult::Ok(binding.format ? binding.format(*raw, args) : *raw);
    }
  } catch (const std::exception& e) {
    out = ExecutionResult::Failure(e.what());
  } catch (...) {
    out = ExecutionResult::Failure("unknown exception in " + name);
  }

  LogDebug("tool", "result name=" + name + " ok=" + (out.success ? "1" : "0") +
                       " error=" + (out.success ? std::string("-") : out.error));
  return out;
}

ToolRegistry BuildDefaultToolRegistry(HostCapabilities* host) {
  using nlohmann::json;
  ToolRegistry reg(host);

  {
    ToolBinding b;
    b.execute = [](HostCapabilities& h, const json&, std::string*) -> std::optional<json> {
      auto editor = h.ActiveEditor();
      return editor ? ToJson(*editor) : json(nullptr);
    };
    b.format = Identity;
    reg.Bind(ToolId::kGetActiveEditor, std::move(b));
  }

  {
    ToolBinding b;
    b.rules = {{"text", validators::String}};
    b.execute = [](HostCapabilities& h, const json& args, std::string*) -> std::optional<json> {
      return json(h.InsertText(args["text"].get<std::string>()));
    };
    b.format = Verb("inserted");
    b.false_is_failure = "No active editor";
    reg.Bind(ToolId::kInsertText, std::move(b));
  }

  {
    ToolBinding b;
    b.rules = {{"path", validators::String}, {"row", validators::Number, false}, {"column", validators::Number, false}};
    b.execute = [](HostCapabilities& h, const json& args, std::string* err) -> std::optional<json> {
      std::optional<Position> pos;
      if (args.contains("row") && args["row"].is_number()) {
        pos = Position{IntArg(args, "row", 0), IntArg(args, "column", 0)};
      }
      if (!h.OpenFile(args["path"].get<std::string>(), pos, err)) return std::nullopt;
      return json(true);
    };
    b.format = Verb("opened");
    reg.Bind(ToolId::kOpenFile, std::move(b));
  }

  {
    ToolBinding b;
    b.execute = [](HostCapabilities& h, const json&, std::string*) -> std::optional<json> {
      return json(h.ProjectPaths());
    };
    b.format = Identity;
    reg.Bind(ToolId::kGetProjectPaths, std::move(b));
  }

  {
    ToolBinding b;
    b.rules = {{"path", validators::String, false}};
    b.execute = [](HostCapabilities& h, const json& args, std::string* err) -> std::optional<json> {
      bool saved = false;
      if (!h.SaveFile(StringArg(args, "path"), &saved, err)) return std::nullopt;
      return json(saved);
    };
    b.format = Verb("saved");
    b.false_is_failure = "File not found or no active editor";
    reg.Bind(ToolId::kSaveFile, std::move(b));
  }

  {
    ToolBinding b;
    b.rules = {{"ranges", validators::Array}};
    b.execute = [](HostCapabilities& h, const json& args, std::string* err) -> std::optional<json> {
      std::vector<Range> ranges;
      if (!ParseRanges(args["ranges"], &ranges, err)) return std::nullopt;
      return json(h.SetSelections(ranges));
    };
    b.format = [](const json& raw, const json& args) {
      return json{{"selectionsSet", raw}, {"count", args["ranges"].size()}};
    };
    reg.Bind(ToolId::kSetSelections, std::move(b));
  }

  {
    ToolBinding b;
    b.execute = [](HostCapabilities& h, const json&, std::string*) -> std::optional<json> {
      auto selections = h.Selections();
      return selections ? ToJsonArray(*selections) : json(nullptr);
    };
    b.format = Identity;
    reg.Bind(ToolId::kGetSelections, std::move(b));
  }

  {
    ToolBinding b;
    b.rules = {{"path", validators::String, false}, {"save", validators::Boolean, false}};
    b.execute = [](HostCapabilities& h, const json& args, std::string* err) -> std::optional<json> {
      bool closed = false;
      if (!h.CloseFile(StringArg(args, "path"), BoolArg(args, "save", false), &closed, err)) return std::nullopt;
      return json(closed);
    };
    b.format = Verb("closed");
    b.false_is_failure = "File not found or no active editor";
    reg.Bind(ToolId::kCloseFile, std::move(b));
  }

  {
    ToolBinding b;
    b.rules = {{"pattern", validators::String},
               {"isRegex", validators::Boolean, false},
               {"caseSensitive", validators::Boolean, false}};
    b.execute = [](HostCapabilities& h, const json& args, std::string* err) -> std::optional<json> {
      FindOptions opts;
      opts.is_regex = BoolArg(args, "isRegex", false);
      opts.case_sensitive = BoolArg(args, "caseSensitive", true);
      std::string find_err;
      auto matches = h.FindText(args["pattern"].get<std::string>(), opts, &find_err);
      if (!matches) {
        if (find_err.empty()) return json(nullptr);
        if (err) *err = find_err;
        return std::nullopt;
      }
      return ToJsonArray(*matches);
    };
    b.format = [](const json& raw, const json&) {
      if (raw.is_null()) return raw;
      return json{{"matches", raw}, {"count", raw.size()}};
    };
    reg.Bind(ToolId::kFindText, std::move(b));
  }

  {
    ToolBinding b;
    b.rules = {{"path", validators::String}};
    b.execute = [](HostCapabilities& h, const json& args, std::string*) -> std::optional<json> {
      return json(h.AddProjectPath(args["path"].get<std::string>()));
    };
    b.format = Verb("added");
    b.false_is_failure = "Invalid project path";
    reg.Bind(ToolId::kAddProjectPath, std::move(b));
  }

  {
    ToolBinding b;
    b.execute = [](HostCapabilities& h, const json&, std::string*) -> std::optional<json> {
      return ToJsonArray(h.OpenEditors());
    };
    b.format = Identity;
    reg.Bind(ToolId::kGetOpenEditors, std::move(b));
  }

  {
    ToolBinding b;
    b.rules = {{"row", validators::Number}, {"column", validators::Number, false}};
    b.execute = [](HostCapabilities& h, const json& args, std::string*) -> std::optional<json> {
      return json(h.GoToPosition(Position{IntArg(args, "row", 0), IntArg(args, "column", 0)}));
    };
    b.format = Verb("navigated");
    reg.Bind(ToolId::kGoToPosition, std::move(b));
  }

  {
    ToolBinding b;
    b.rules = {{"path", validators::String}};
    b.execute = [](HostCapabilities& h, const json& args, std::string* err) -> std::optional<json> {
      if (!h.RevealInTreeView(args["path"].get<std::string>(), err)) return std::nullopt;
      return json(true);
    };
    b.format = Verb("revealed");
    reg.Bind(ToolId::kRevealInTreeView, std::move(b));
  }

  {
    ToolBinding b;
    b.rules = {{"direction", validators::Enum({"left", "right", "up", "down"})},
               {"path", validators::String, false}};
    b.execute = [](HostCapabilities& h, const json& args, std::string* err) -> std::optional<json> {
      auto direction = ParseSplitDirection(args["direction"].get<std::string>());
      if (!direction) return json(false);
      if (!h.SplitPane(*direction, StringArg(args, "path"), err)) return std::nullopt;
      return json(true);
    };
    b.format = [](const json& raw, const json& args) {
      return json{{"split", raw}, {"direction", args["direction"]}};
    };
    reg.Bind(ToolId::kSplitPane, std::move(b));
  }

  {
    ToolBinding b;
    b.rules = {{"saveAll", validators::Boolean, false}};
    b.execute = [](HostCapabilities& h, const json& args, std::string* err) -> std::optional<json> {
      bool closed = false;
      if (!h.ClosePane(BoolArg(args, "saveAll", false), &closed, err)) return std::nullopt;
      return json(closed);
    };
    b.format = Verb("closed");
    reg.Bind(ToolId::kClosePane, std::move(b));
  }

  {
    ToolBinding b;
    b.execute = [](HostCapabilities& h, const json&, std::string*) -> std::optional<json> {
      return ToJson(h.Panels());
    };
    b.format = Identity;
    reg.Bind(ToolId::kGetPanelState, std::move(b));
  }

  auto unbound = reg.UnboundTools();
  if (!unbound.empty()) throw std::logic_error("tool has no registry binding: " + ToolName(unbound.front()));
  return reg;
}

}  // namespace pulsar_mcp
