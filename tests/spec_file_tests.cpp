#include "test_runner_utils.hpp"

#include "spec_files.hpp"
#include "sync_error.hpp"
#include "utils.hpp"

namespace specsync::test {
namespace {

const char* kRichSpec =
  "---\n"
  "# owner notes\n"
  "status: in-progress\n"
  "priority: \"high\"\n"
  "tags: [api, 'sync engine']\n"
  "depends_on:\n"
  "  - 001-base\n"
  "  - 002-auth\n"
  "assignee: ~\n"
  "created: '2024-01-15'\n"
  "custom_field: keep me # trailing note\n"
  "---\n"
  "\n"
  "Intro paragraph.\n"
  "\n"
  "# Command channel\n"
  "\n"
  "Body.\n";

bool test_frontmatter_parse(TestContext&) {
  SpecDocument doc("003-channel", "/tmp/003-channel/README.md", kRichSpec);
  expect(doc.has_frontmatter(), "frontmatter detected");
  expect(doc.scalar("status") == std::optional<std::string>("in-progress"), "status");
  expect(doc.scalar("priority") == std::optional<std::string>("high"), "quoted scalar");
  expect(!doc.scalar("assignee"), "tilde is null");
  expect(doc.scalar("custom_field") == std::optional<std::string>("keep me"), "trailing comment dropped");
  expect(doc.list("tags") == std::vector<std::string>({"api", "sync engine"}), "flow list");
  expect(doc.list("depends_on") == std::vector<std::string>({"001-base", "002-auth"}), "block list");
  expect(doc.title() == "Command channel", "first heading is the title");

  auto record = doc.to_record();
  expect(record.created_at == std::optional<std::string>("2024-01-15"), "created fallback");
  expect(record.content_hash == sha256_hex(kRichSpec), "hash covers the whole file");
  expect(record.content_md == kRichSpec, "content carried verbatim");
  return true;
}

bool test_missing_frontmatter(TestContext&) {
  SpecDocument doc("004-plain", "/tmp/004-plain/README.md", "Just notes, no heading.\n");
  auto record = doc.to_record();
  expect(!doc.has_frontmatter(), "no frontmatter");
  expect(record.status == "planned", "default status");
  expect(record.title == std::optional<std::string>("004-plain"), "title falls back to the name");

  // an unterminated block is body text
  SpecDocument open("005-open", "/tmp/005-open/README.md", "---\nstatus: complete\n");
  return !open.has_frontmatter() && open.to_record().status == "planned";
}

bool test_rewrite_preserves_unknown_lines(TestContext&) {
  SpecDocument doc("003-channel", "/tmp/003-channel/README.md", kRichSpec);
  doc.set_scalar("status", std::string("complete"));
  doc.set_list("tags", {"api"});
  doc.set_scalar("parent", std::string("000-root: epic"));
  doc.set_scalar("assignee", std::nullopt);

  auto text = doc.render();
  SpecDocument again("003-channel", "/tmp/003-channel/README.md", text);
  expect(again.scalar("status") == std::optional<std::string>("complete"), "status rewritten");
  expect(again.list("tags") == std::vector<std::string>({"api"}), "tags rewritten");
  expect(again.scalar("parent") == std::optional<std::string>("000-root: epic"), "quoting round trip");
  expect(text.find("assignee") == std::string::npos, "null removes the key");
  expect(text.find("# owner notes") != std::string::npos, "comment kept");
  expect(text.find("custom_field: keep me # trailing note") != std::string::npos, "unknown key kept verbatim");
  expect(text.find("  - 002-auth") != std::string::npos, "untouched list kept verbatim");
  expect(again.body() == doc.body(), "body untouched");

  doc.set_list("tags", {});
  SpecDocument emptied("003-channel", "/tmp/x", doc.render());
  return emptied.list("tags").empty() && doc.render().find("tags: []") != std::string::npos;
}

bool test_normalization(TestContext&) {
  expect(normalize_status("In_Progress") == "in-progress", "status alias");
  expect(normalize_status("completed") == "complete", "complete alias");
  expect(normalize_priority("URGENT") == "critical", "priority alias");
  bool bad_status = false;
  try {
    normalize_status("done-ish");
  } catch(const ValidationError&) {
    bad_status = true;
  }
  bool bad_priority = false;
  try {
    normalize_priority("whenever");
  } catch(const ValidationError&) {
    bad_priority = true;
  }
  return bad_status && bad_priority;
}

bool test_directory_loading(TestContext&) {
  TempDir dir("spec_dirs");
  write_spec(dir.path(), "002-second", "planned");
  write_spec(dir.path(), "001-first", "complete");
  write_text(dir.path() / "specs" / "notes" / "README.md", "not a spec\n");
  write_text(dir.path() / "specs" / "010-empty" / "draft.md", "no readme\n");

  auto specs_dir = dir.path() / "specs";
  auto all = load_all_specs(specs_dir);
  expect(all.size() == 2, "only numbered dirs with a README");
  expect(all[0].name() == "001-first" && all[1].name() == "002-second", "sorted by name");

  expect(load_spec(specs_dir, "001-first").has_value(), "exact name");
  expect(!load_spec(specs_dir, "001").has_value(), "no prefix match");
  expect(!load_spec(specs_dir, "../001-first").has_value(), "no traversal");

  expect(spec_name_for_path(specs_dir, specs_dir / "001-first" / "README.md") ==
         std::optional<std::string>("001-first"), "path to spec name");
  expect(!spec_name_for_path(specs_dir, specs_dir / "notes" / "README.md"), "non-spec dir ignored");
  return !spec_name_for_path(specs_dir, dir.path() / "README.md");
}

bool test_metadata_update_on_disk(TestContext&) {
  TempDir dir("spec_update");
  auto file = write_spec(dir.path(), "001-foo", "planned", "priority: low\n");
  auto specs_dir = dir.path() / "specs";
  auto doc = load_spec(specs_dir, "001-foo");
  expect(doc.has_value(), "spec loads");

  auto now = *parse_timestamp("2024-06-01T10:00:00Z");
  MetadataUpdate update;
  update.status = "complete";
  update.priority = "High";
  update.depends_on = std::vector<std::string>{"000-root"};
  auto updated = apply_metadata_update(*doc, update, now);

  expect(updated.content() == read_text(file), "reloaded from disk");
  expect(updated.scalar("status") == std::optional<std::string>("complete"), "status");
  expect(updated.scalar("priority") == std::optional<std::string>("high"), "priority normalized");
  expect(updated.scalar("completed_at") == std::optional<std::string>("2024-06-01T10:00:00.000Z"), "completed stamp");
  expect(updated.scalar("updated_at") == std::optional<std::string>("2024-06-01T10:00:00.000Z"), "updated stamp");
  expect(updated.content_hash() != doc->content_hash(), "hash changes");
  expect(!std::filesystem::exists(file.string() + ".tmp"), "no temp file left");

  MetadataUpdate invalid;
  invalid.status = "shipped";
  auto before = read_text(file);
  try {
    apply_metadata_update(updated, invalid, now);
  } catch(const ValidationError&) {
    return read_text(file) == before;
  }
  return false;
}

bool test_utf8_repair(TestContext&) {
  const std::string replacement = "\xEF\xBF\xBD";
  expect(to_valid_utf8("plain ascii") == "plain ascii", "ascii untouched");
  expect(to_valid_utf8("caf\xC3\xA9 \xF0\x9F\x9A\x80") == "caf\xC3\xA9 \xF0\x9F\x9A\x80", "valid multibyte kept");
  expect(to_valid_utf8("Caf\xE9") == "Caf" + replacement, "latin-1 byte replaced");
  expect(to_valid_utf8("\xC0\xAF") == replacement + replacement, "overlong rejected");
  expect(to_valid_utf8("\xED\xA0\x80") == replacement + replacement + replacement, "surrogate rejected");
  return to_valid_utf8("x\xE2\x82") == "x" + replacement + replacement;
}

bool test_latin1_readme_record(TestContext&) {
  TempDir dir("spec_latin1");
  auto file = dir.path() / "specs" / "001-cafe" / "README.md";
  write_text(file, "---\nstatus: planned\ntags: [caf\xE9]\n---\n\n# Caf\xE9\n");
  auto doc = load_spec(dir.path() / "specs", "001-cafe");
  expect(doc.has_value(), "spec loads");

  auto record = doc->to_record();
  expect(record.content_md.find("Caf\xEF\xBF\xBD") != std::string::npos, "replacement on the wire");
  expect(record.content_hash == sha256_hex(record.content_md), "hash covers wire content");
  expect(record.content_hash == doc->content_hash(), "document and record hash agree");

  // strict serialization succeeds, and the decoder accepts what it produces
  auto text = json(record).dump();
  auto decoded = json::parse(text).get<SpecRecord>();
  expect(decoded.content_hash == record.content_hash, "decoded hash");
  expect(dump_json(json::array({std::string("bad \xFF")})) == "[\"bad \xEF\xBF\xBD\"]", "tags-like strings repaired");

  // metadata edits keep the original bytes on disk
  MetadataUpdate update;
  update.status = "complete";
  apply_metadata_update(*doc, update, *parse_timestamp("2024-06-01T10:00:00Z"));
  return read_text(file).find("# Caf\xE9\n") != std::string::npos;
}

} // namespace

void register_spec_file_tests(std::vector<TestCase>& tests) {
  tests.push_back({"spec_frontmatter_parse", test_frontmatter_parse});
  tests.push_back({"spec_missing_frontmatter", test_missing_frontmatter});
  tests.push_back({"spec_rewrite_preserves_unknown_lines", test_rewrite_preserves_unknown_lines});
  tests.push_back({"spec_normalization", test_normalization});
  tests.push_back({"spec_directory_loading", test_directory_loading});
  tests.push_back({"spec_metadata_update_on_disk", test_metadata_update_on_disk});
  tests.push_back({"spec_utf8_repair", test_utf8_repair});
  tests.push_back({"spec_latin1_readme_record", test_latin1_readme_record});
}

} // namespace specsync::test
