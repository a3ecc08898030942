// tests/inventory_test.cpp - Source metadata and discovery tests
#include "core/errors.hpp"
#include "core/inventory.hpp"
#include "defs.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using namespace modulate;
using namespace modulate::test;

namespace {

ErrorKind metadata_error(const fs::path &file) {
  try {
    parse_metadata(file);
  } catch (const OverlayError &e) {
    return e.kind();
  }
  ADD_FAILURE() << "expected OverlayError for " << file;
  return ErrorKind::StateInvalid;
}

} // namespace

TEST(Metadata, AcceptsSemanticVersions) {
  EXPECT_TRUE(is_valid_version("1.0.0"));
  EXPECT_TRUE(is_valid_version("0.12.3"));
  EXPECT_TRUE(is_valid_version("2.0.0-rc.1"));
  EXPECT_TRUE(is_valid_version("1.2.3-alpha-1+build.42"));

  EXPECT_FALSE(is_valid_version(""));
  EXPECT_FALSE(is_valid_version("1.0"));
  EXPECT_FALSE(is_valid_version("1.0.0.0"));
  EXPECT_FALSE(is_valid_version("01.0.0"));
  EXPECT_FALSE(is_valid_version("1.0.x"));
  EXPECT_FALSE(is_valid_version("1.0.0-"));
  EXPECT_FALSE(is_valid_version("1.0.0+"));
}

TEST(Metadata, AcceptsHyphenatedUuids) {
  EXPECT_TRUE(is_valid_uuid(UUID_A));
  EXPECT_TRUE(is_valid_uuid("6BA7B810-9DAD-11D1-80B4-00C04FD430C8"));

  EXPECT_FALSE(is_valid_uuid(""));
  EXPECT_FALSE(is_valid_uuid("6ba7b8109dad11d180b400c04fd430c8"));
  EXPECT_FALSE(is_valid_uuid("6ba7b810-9dad-11d1-80b4-00c04fd430cg"));
  EXPECT_FALSE(is_valid_uuid("6ba7b810-9dad-11d1-80b4_00c04fd430c8"));
}

TEST(Metadata, ParsesAllFields) {
  TempDir tmp;
  write_file(tmp / METADATA_FILE_NAME,
             "# sample\n"
             "name = \"Texture Pack\"\n"
             "version = \"1.4.0\"\n"
             "uuid = \"6BA7B810-9DAD-11D1-80B4-00C04FD430C8\"\n"
             "author = \"someone\"\n"
             "description = \"Better textures\"\n"
             "unknown = \"ignored\"\n");

  SourceMetadata metadata = parse_metadata(tmp / METADATA_FILE_NAME);
  EXPECT_EQ(metadata.name, "Texture Pack");
  EXPECT_EQ(metadata.version, "1.4.0");
  EXPECT_EQ(metadata.uuid, "6ba7b810-9dad-11d1-80b4-00c04fd430c8");
  EXPECT_EQ(metadata.author, "someone");
  EXPECT_EQ(metadata.description, "Better textures");
}

TEST(Metadata, MissingFileIsMetadataMissing) {
  TempDir tmp;
  EXPECT_EQ(metadata_error(tmp / METADATA_FILE_NAME), ErrorKind::MetadataMissing);
}

TEST(Metadata, BadFieldsAreMetadataInvalid) {
  TempDir tmp;
  fs::path file = tmp / METADATA_FILE_NAME;

  write_file(file, "version = \"1.0.0\"\nuuid = \"" + std::string(UUID_A) + "\"\n");
  EXPECT_EQ(metadata_error(file), ErrorKind::MetadataInvalid);

  write_file(file, "name = \"x\"\nversion = \"one\"\nuuid = \"" + std::string(UUID_A) + "\"\n");
  EXPECT_EQ(metadata_error(file), ErrorKind::MetadataInvalid);

  write_file(file, "name = \"x\"\nversion = \"1.0.0\"\nuuid = \"abc\"\n");
  EXPECT_EQ(metadata_error(file), ErrorKind::MetadataInvalid);
}

TEST(LoadSource, ScansTreeWithoutMetadataFile) {
  TempDir tmp;
  fs::path dir = make_source(tmp / "mod1", "mod1", UUID_A,
                             {{"a.txt", "a"}, {"common/x.txt", "x"}});

  Source source = load_source(dir);
  EXPECT_EQ(source.metadata.name, "mod1");
  EXPECT_EQ(source.root, fs::canonical(dir));
  EXPECT_EQ(source.tree.children.count(METADATA_FILE_NAME), 0u);
  EXPECT_EQ(source.tree.count_files(), 2u);
}

TEST(LoadSource, MissingDirectoryIsSourceNotFound) {
  TempDir tmp;
  try {
    load_source(tmp / "missing");
    FAIL() << "expected OverlayError";
  } catch (const OverlayError &e) {
    EXPECT_EQ(e.kind(), ErrorKind::SourceNotFound);
  }
}

TEST(DiscoverSources, SortedAndSkipsBrokenOnes) {
  TempDir tmp;
  make_source(tmp / "zeta", "zeta", UUID_C, {{"z.txt", "z"}});
  make_source(tmp / "alpha", "alpha", UUID_A, {{"a.txt", "a"}});
  write_file(tmp / "broken" / METADATA_FILE_NAME, "name = \"broken\"\n");
  write_file(tmp / "plain/file.txt", "not a source");
  write_file(tmp / "stray.txt", "stray");

  std::vector<Source> sources = discover_sources(tmp.path());
  ASSERT_EQ(sources.size(), 2u);
  EXPECT_EQ(sources[0].metadata.name, "alpha");
  EXPECT_EQ(sources[1].metadata.name, "zeta");
}

TEST(DiscoverSources, MissingDirectoryGivesNothing) {
  TempDir tmp;
  EXPECT_TRUE(discover_sources(tmp / "nope").empty());
}
