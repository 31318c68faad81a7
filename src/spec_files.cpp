#include "spec_files.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <system_error>

#include "sync_error.hpp"

namespace fs = std::filesystem;

namespace {

std::vector<std::string> split_lines(const std::string& text) {
  std::vector<std::string> lines;
  std::string line;
  std::istringstream in(text);
  while(std::getline(in, line)) {
    if(!line.empty() && line.back() == '\r') line.pop_back();
    lines.push_back(line);
  }
  return lines;
}

bool starts_entry(const std::string& line) {
  if(line.empty()) return false;
  char c = line.front();
  if(std::isspace(static_cast<unsigned char>(c)) || c == '-' || c == '#') return false;
  return line.find(':') != std::string::npos;
}

std::string unquote(std::string value) {
  value = trim_copy(value);
  if(value.size() >= 2 &&
     ((value.front() == '"' && value.back() == '"') || (value.front() == '\'' && value.back() == '\''))) {
    char quote = value.front();
    std::string inner = value.substr(1, value.size() - 2);
    if(quote == '\'') {
      std::string out;
      for(std::size_t i = 0; i < inner.size(); ++i) {
        if(inner[i] == '\'' && i + 1 < inner.size() && inner[i + 1] == '\'') ++i;
        out.push_back(inner[i]);
      }
      return out;
    }
    std::string out;
    for(std::size_t i = 0; i < inner.size(); ++i) {
      if(inner[i] == '\\' && i + 1 < inner.size()) ++i;
      out.push_back(inner[i]);
    }
    return out;
  }
  return value;
}

std::string quote_if_needed(const std::string& value) {
  bool plain = !value.empty() &&
               value.find_first_of(":#[]{},&*!|>'\"%@`") == std::string::npos &&
               value.front() != '-' && value.front() != '?' &&
               !std::isspace(static_cast<unsigned char>(value.front())) &&
               !std::isspace(static_cast<unsigned char>(value.back()));
  if(plain) return value;
  std::string out = "\"";
  for(char c : value) {
    if(c == '"' || c == '\\') out.push_back('\\');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

// Text after "key:" on the entry's first line.
std::string inline_value(const FrontmatterEntry& entry) {
  const auto& first = entry.lines.front();
  auto colon = first.find(':');
  return trim_copy(first.substr(colon + 1));
}

std::vector<std::string> split_flow_list(const std::string& inner) {
  std::vector<std::string> out;
  std::string current;
  char quote = 0;
  for(char c : inner) {
    if(quote) {
      current.push_back(c);
      if(c == quote) quote = 0;
    } else if(c == '"' || c == '\'') {
      quote = c;
      current.push_back(c);
    } else if(c == ',') {
      auto item = unquote(current);
      if(!item.empty()) out.push_back(item);
      current.clear();
    } else {
      current.push_back(c);
    }
  }
  auto item = unquote(current);
  if(!item.empty()) out.push_back(item);
  return out;
}

} // namespace

SpecDocument::SpecDocument(std::string name, fs::path file, std::string content)
  : name_(std::move(name)), file_(std::move(file)), content_(std::move(content)) {
  parse();
}

void SpecDocument::parse() {
  frontmatter_.clear();
  has_frontmatter_ = false;
  body_ = content_;

  auto first_break = content_.find('\n');
  if(first_break == std::string::npos) return;
  if(trim_copy(content_.substr(0, first_break)) != "---") return;

  std::size_t pos = first_break + 1;
  std::vector<std::string> block;
  bool closed = false;
  while(pos <= content_.size()) {
    auto next = content_.find('\n', pos);
    auto line = content_.substr(pos, next == std::string::npos ? std::string::npos : next - pos);
    if(!line.empty() && line.back() == '\r') line.pop_back();
    pos = (next == std::string::npos) ? content_.size() + 1 : next + 1;
    if(line == "---") {
      closed = true;
      break;
    }
    block.push_back(line);
  }
  if(!closed) return;

  has_frontmatter_ = true;
  body_ = pos <= content_.size() ? content_.substr(pos) : std::string();
  for(const auto& line : block) {
    if(starts_entry(line)) {
      FrontmatterEntry entry;
      entry.key = trim_copy(line.substr(0, line.find(':')));
      entry.lines.push_back(line);
      frontmatter_.push_back(std::move(entry));
    } else if(frontmatter_.empty()) {
      // comment or blank line before the first key
      frontmatter_.push_back(FrontmatterEntry{"", {line}});
    } else {
      frontmatter_.back().lines.push_back(line);
    }
  }
}

const FrontmatterEntry* SpecDocument::find(const std::string& key) const {
  for(const auto& entry : frontmatter_) {
    if(!entry.key.empty() && entry.key == key) return &entry;
  }
  return nullptr;
}

FrontmatterEntry& SpecDocument::upsert(const std::string& key) {
  for(auto& entry : frontmatter_) {
    if(entry.key == key) return entry;
  }
  frontmatter_.push_back(FrontmatterEntry{key, {}});
  return frontmatter_.back();
}

std::optional<std::string> SpecDocument::scalar(const std::string& key) const {
  const auto* entry = find(key);
  if(!entry) return std::nullopt;
  auto value = inline_value(*entry);
  if(value.empty() || value == "~" || value == "null") return std::nullopt;
  if(value.front() == '[') return std::nullopt;
  // trailing comment
  if(value.front() != '"' && value.front() != '\'') {
    auto hash = value.find(" #");
    if(hash != std::string::npos) value = trim_copy(value.substr(0, hash));
  }
  return unquote(value);
}

std::vector<std::string> SpecDocument::list(const std::string& key) const {
  const auto* entry = find(key);
  if(!entry) return {};
  auto value = inline_value(*entry);
  if(!value.empty() && value.front() == '[') {
    auto close = value.rfind(']');
    return split_flow_list(value.substr(1, close == std::string::npos ? std::string::npos : close - 1));
  }
  if(!value.empty() && value != "~" && value != "null") {
    return {unquote(value)};
  }
  std::vector<std::string> out;
  for(std::size_t i = 1; i < entry->lines.size(); ++i) {
    auto line = trim_copy(entry->lines[i]);
    if(line.size() >= 1 && line.front() == '-') {
      auto item = unquote(line.substr(1));
      if(!item.empty()) out.push_back(item);
    }
  }
  return out;
}

std::string SpecDocument::title() const {
  for(const auto& line : split_lines(body_)) {
    if(line.rfind("# ", 0) == 0) {
      auto title = trim_copy(line.substr(2));
      if(!title.empty()) return title;
    }
  }
  return name_;
}

void SpecDocument::set_scalar(const std::string& key, const std::optional<std::string>& value) {
  if(!value) {
    frontmatter_.erase(std::remove_if(frontmatter_.begin(), frontmatter_.end(),
                                      [&](const FrontmatterEntry& e){ return e.key == key; }),
                       frontmatter_.end());
    return;
  }
  auto& entry = upsert(key);
  entry.lines = {key + ": " + quote_if_needed(*value)};
}

void SpecDocument::set_list(const std::string& key, const std::vector<std::string>& values) {
  auto& entry = upsert(key);
  if(values.empty()) {
    entry.lines = {key + ": []"};
    return;
  }
  entry.lines = {key + ":"};
  for(const auto& value : values) {
    entry.lines.push_back("- " + quote_if_needed(value));
  }
}

std::string SpecDocument::render() const {
  if(frontmatter_.empty() && !has_frontmatter_) {
    return body_;
  }
  std::string out = "---\n";
  for(const auto& entry : frontmatter_) {
    for(const auto& line : entry.lines) {
      out += line;
      out += '\n';
    }
  }
  out += "---\n";
  out += body_;
  return out;
}

SpecRecord SpecDocument::to_record() const {
  SpecRecord record;
  record.spec_name = name_;
  record.title = title();
  record.status = scalar("status").value_or("planned");
  record.priority = scalar("priority");
  record.tags = list("tags");
  record.assignee = scalar("assignee");
  record.content_md = wire_content();
  record.content_hash = sha256_hex(record.content_md);
  record.created_at = scalar("created_at");
  if(!record.created_at) record.created_at = scalar("created");
  record.updated_at = scalar("updated_at");
  record.completed_at = scalar("completed_at");
  record.depends_on = list("depends_on");
  record.parent = scalar("parent");
  record.file_path = file_.string();

  // Frontmatter and heading text come from the same bytes as content_md.
  auto repair = [](std::optional<std::string>& value) {
    if(value) *value = to_valid_utf8(*value);
  };
  record.spec_name = to_valid_utf8(record.spec_name);
  record.status = to_valid_utf8(record.status);
  repair(record.title);
  repair(record.priority);
  repair(record.assignee);
  repair(record.created_at);
  repair(record.updated_at);
  repair(record.completed_at);
  repair(record.parent);
  repair(record.file_path);
  for(auto& tag : record.tags) tag = to_valid_utf8(tag);
  for(auto& dep : record.depends_on) dep = to_valid_utf8(dep);
  return record;
}

std::string normalize_status(const std::string& value) {
  auto v = to_lower(trim_copy(value));
  if(v == "planned") return "planned";
  if(v == "in-progress" || v == "in_progress" || v == "inprogress") return "in-progress";
  if(v == "complete" || v == "completed") return "complete";
  if(v == "archived") return "archived";
  throw ValidationError("Invalid status: " + value + ". Valid values: planned, in-progress, complete, archived");
}

std::string normalize_priority(const std::string& value) {
  auto v = to_lower(trim_copy(value));
  if(v == "low") return "low";
  if(v == "medium" || v == "med") return "medium";
  if(v == "high") return "high";
  if(v == "critical" || v == "urgent") return "critical";
  throw ValidationError("Invalid priority: " + value + ". Valid values: low, medium, high, critical");
}

bool is_spec_dir_name(const std::string& name) {
  return !name.empty() && std::isdigit(static_cast<unsigned char>(name.front()));
}

std::optional<std::string> spec_name_for_path(const fs::path& specs_dir, const fs::path& path) {
  auto relative = path.lexically_normal().lexically_relative(specs_dir.lexically_normal());
  if(relative.empty()) return std::nullopt;
  auto first = relative.begin()->string();
  if(first == "." || first == ".." || !is_spec_dir_name(first)) return std::nullopt;
  return first;
}

std::string read_file(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  if(!in) {
    throw SyncError(ErrorKind::Internal, "unable to read " + path.string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

void write_file_atomic(const fs::path& path, const std::string& content) {
  auto tmp = path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if(!out) {
      throw SyncError(ErrorKind::Internal, "unable to write " + tmp.string());
    }
    out << content;
    out.flush();
    if(!out) {
      throw SyncError(ErrorKind::Internal, "short write to " + tmp.string());
    }
  }
  std::error_code ec;
  fs::rename(tmp, path, ec);
  if(ec) {
    fs::remove(tmp, ec);
    throw SyncError(ErrorKind::Internal, "unable to replace " + path.string());
  }
}

std::optional<SpecDocument> load_spec(const fs::path& specs_dir, const std::string& name) {
  if(!is_spec_dir_name(name) || name.find('/') != std::string::npos || name.find('\\') != std::string::npos) {
    return std::nullopt;
  }
  auto file = specs_dir / name / kSpecFileName;
  std::error_code ec;
  if(!fs::is_regular_file(file, ec)) return std::nullopt;
  return SpecDocument(name, file, read_file(file));
}

std::vector<SpecDocument> load_all_specs(const fs::path& specs_dir) {
  std::vector<SpecDocument> specs;
  std::error_code ec;
  for(fs::directory_iterator it(specs_dir, ec), end; !ec && it != end; it.increment(ec)) {
    if(!it->is_directory(ec)) continue;
    auto name = it->path().filename().string();
    if(auto doc = load_spec(specs_dir, name)) {
      specs.push_back(std::move(*doc));
    }
  }
  if(ec) {
    throw SyncError(ErrorKind::Internal, "unable to list " + specs_dir.string() + ": " + ec.message());
  }
  std::sort(specs.begin(), specs.end(),
            [](const SpecDocument& a, const SpecDocument& b){ return a.name() < b.name(); });
  return specs;
}

SpecDocument apply_metadata_update(const SpecDocument& doc, const MetadataUpdate& update, SystemTime now) {
  SpecDocument next = doc;
  auto stamp = format_timestamp(now);

  if(update.status) {
    auto status = normalize_status(*update.status);
    auto previous = doc.scalar("status");
    next.set_scalar("status", status);
    if(status == "complete" && (!previous || normalize_status(*previous) != "complete")) {
      next.set_scalar("completed_at", stamp);
    }
  }
  if(update.priority) {
    next.set_scalar("priority", normalize_priority(*update.priority));
  }
  if(update.tags) {
    next.set_list("tags", *update.tags);
  }
  if(update.depends_on) {
    next.set_list("depends_on", *update.depends_on);
  }
  if(update.parent) {
    next.set_scalar("parent", *update.parent);
  }
  next.set_scalar("updated_at", stamp);

  write_file_atomic(doc.file(), next.render());
  return SpecDocument(doc.name(), doc.file(), read_file(doc.file()));
}
