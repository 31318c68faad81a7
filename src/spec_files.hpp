#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "protocol.hpp"
#include "utils.hpp"

// spec_files.hpp
//
// The bridge's view of a specs directory: <specs_dir>/<NNN-name>/README.md
// with an optional "---" frontmatter block of `key: value` lines. Only the
// keys the sync needs are interpreted; every other line is carried through a
// rewrite untouched.

inline constexpr const char* kSpecFileName = "README.md";

struct FrontmatterEntry {
  std::string key;
  std::vector<std::string> lines;  // original text, first line holds "key:"
};

class SpecDocument {
public:
  SpecDocument() = default;
  SpecDocument(std::string name, std::filesystem::path file, std::string content);

  const std::string& name() const { return name_; }
  const std::filesystem::path& file() const { return file_; }
  const std::string& content() const { return content_; }
  const std::string& body() const { return body_; }
  bool has_frontmatter() const { return has_frontmatter_; }
  // Wire form of content(): invalid UTF-8 replaced with U+FFFD.
  std::string wire_content() const { return to_valid_utf8(content_); }
  std::string content_hash() const { return sha256_hex(wire_content()); }

  std::optional<std::string> scalar(const std::string& key) const;
  std::vector<std::string> list(const std::string& key) const;
  std::string title() const;

  // nullopt removes the key.
  void set_scalar(const std::string& key, const std::optional<std::string>& value);
  void set_list(const std::string& key, const std::vector<std::string>& values);

  // Re-renders content() from the (possibly edited) frontmatter and body.
  std::string render() const;

  SpecRecord to_record() const;

private:
  void parse();
  const FrontmatterEntry* find(const std::string& key) const;
  FrontmatterEntry& upsert(const std::string& key);

  std::string name_;
  std::filesystem::path file_;
  std::string content_;
  bool has_frontmatter_ = false;
  std::vector<FrontmatterEntry> frontmatter_;
  std::string body_;
};

struct MetadataUpdate {
  std::optional<std::string> status;
  std::optional<std::string> priority;
  std::optional<std::vector<std::string>> tags;
  std::optional<std::vector<std::string>> depends_on;
  std::optional<std::optional<std::string>> parent;
};

// Canonical status / priority spelling; throws ValidationError otherwise.
std::string normalize_status(const std::string& value);
std::string normalize_priority(const std::string& value);

bool is_spec_dir_name(const std::string& name);

// First path segment of `path` under `specs_dir`, if it names a spec dir.
std::optional<std::string> spec_name_for_path(const std::filesystem::path& specs_dir,
                                              const std::filesystem::path& path);

std::optional<SpecDocument> load_spec(const std::filesystem::path& specs_dir, const std::string& name);
std::vector<SpecDocument> load_all_specs(const std::filesystem::path& specs_dir);

// Validates and applies the update, stamps updated_at (and completed_at on
// a move to complete), writes the file atomically and returns the reloaded
// document.
SpecDocument apply_metadata_update(const SpecDocument& doc, const MetadataUpdate& update, SystemTime now);

// temp file + rename in the same directory
void write_file_atomic(const std::filesystem::path& path, const std::string& content);
std::string read_file(const std::filesystem::path& path);
