// core/inventory.cpp - Source inventory implementation
#include "inventory.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace modulate {

static bool is_numeric_identifier(const std::string &s) {
  if (s.empty()) {
    return false;
  }
  for (char c : s) {
    if (!std::isdigit(static_cast<unsigned char>(c)))
      return false;
  }
  return s.size() == 1 || s[0] != '0';
}

static bool is_dotted_identifiers(const std::string &s) {
  if (s.empty()) {
    return false;
  }
  std::stringstream ss(s);
  std::string part;
  size_t parts = 0;
  while (std::getline(ss, part, '.')) {
    if (part.empty())
      return false;
    for (char c : part) {
      if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-')
        return false;
    }
    ++parts;
  }
  return parts > 0 && s.back() != '.';
}

// MAJOR.MINOR.PATCH[-prerelease][+build]
bool is_valid_version(const std::string &version) {
  std::string core = version;
  std::string build;
  std::string pre;

  auto plus = core.find('+');
  if (plus != std::string::npos) {
    build = core.substr(plus + 1);
    core = core.substr(0, plus);
    if (!is_dotted_identifiers(build))
      return false;
  }
  auto dash = core.find('-');
  if (dash != std::string::npos) {
    pre = core.substr(dash + 1);
    core = core.substr(0, dash);
    if (!is_dotted_identifiers(pre))
      return false;
  }

  std::stringstream ss(core);
  std::string part;
  size_t parts = 0;
  while (std::getline(ss, part, '.')) {
    if (!is_numeric_identifier(part))
      return false;
    ++parts;
  }
  return parts == 3 && !core.empty() && core.back() != '.';
}

bool is_valid_uuid(const std::string &uuid) {
  if (uuid.size() != 36) {
    return false;
  }
  for (size_t i = 0; i < uuid.size(); ++i) {
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      if (uuid[i] != '-')
        return false;
    } else if (!std::isxdigit(static_cast<unsigned char>(uuid[i]))) {
      return false;
    }
  }
  return true;
}

SourceMetadata parse_metadata(const fs::path &metadata_file) {
  if (!fs::exists(metadata_file)) {
    throw OverlayError(ErrorKind::MetadataMissing, metadata_file.string());
  }

  std::ifstream file(metadata_file);
  if (!file.is_open()) {
    throw OverlayError(ErrorKind::MetadataInvalid,
                       "cannot open " + metadata_file.string());
  }

  SourceMetadata metadata;
  std::string line;
  while (std::getline(file, line)) {
    line = trim(line);
    if (line.empty() || line[0] == '#')
      continue;

    auto eq = line.find('=');
    if (eq == std::string::npos)
      continue;

    std::string key = trim(line.substr(0, eq));
    std::string value = trim(line.substr(eq + 1), " \t\"");

    if (key == "name")
      metadata.name = value;
    else if (key == "version")
      metadata.version = value;
    else if (key == "uuid")
      metadata.uuid = to_lower(value);
    else if (key == "author")
      metadata.author = value;
    else if (key == "description")
      metadata.description = value;
  }

  if (metadata.name.empty()) {
    throw OverlayError(ErrorKind::MetadataInvalid,
                       metadata_file.string() + ": missing name");
  }
  if (!is_valid_version(metadata.version)) {
    throw OverlayError(ErrorKind::MetadataInvalid,
                       metadata_file.string() + ": bad version '" +
                           metadata.version + "'");
  }
  if (!is_valid_uuid(metadata.uuid)) {
    throw OverlayError(ErrorKind::MetadataInvalid,
                       metadata_file.string() + ": bad uuid '" +
                           metadata.uuid + "'");
  }

  return metadata;
}

Source load_source(const fs::path &dir) {
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    throw OverlayError(ErrorKind::SourceNotFound,
                       dir.string() + " is not a directory");
  }

  Source source;
  source.root = fs::canonical(dir, ec);
  if (ec) {
    throw OverlayError(ErrorKind::SourceNotFound,
                       dir.string() + ": " + ec.message());
  }
  source.metadata = parse_metadata(source.root / METADATA_FILE_NAME);
  source.tree = scan_tree(source.root);
  return source;
}

std::vector<Source> discover_sources(const fs::path &mods_dir) {
  std::vector<Source> sources;

  if (!fs::exists(mods_dir)) {
    LOG_WARN("Mods directory " + mods_dir.string() + " does not exist");
    return sources;
  }

  std::vector<fs::path> candidates;
  std::error_code ec;
  for (fs::directory_iterator it(mods_dir, ec), end; !ec && it != end;
       it.increment(ec)) {
    std::error_code entry_ec;
    if (it->is_directory(entry_ec) &&
        fs::exists(it->path() / METADATA_FILE_NAME, entry_ec)) {
      candidates.push_back(it->path());
    }
  }
  if (ec) {
    LOG_ERROR("Failed to scan mods directory " + mods_dir.string() + ": " +
              ec.message());
  }

  std::sort(candidates.begin(), candidates.end());

  for (const auto &dir : candidates) {
    try {
      sources.push_back(load_source(dir));
      LOG_DEBUG("Found source " + sources.back().metadata.name + " at " +
                dir.string());
    } catch (const OverlayError &e) {
      LOG_WARN("Skipping " + dir.string() + ": " + e.what());
    }
  }

  return sources;
}

} // namespace modulate
