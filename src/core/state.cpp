// core/state.cpp - Runtime state implementation
#include "state.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include "errors.hpp"
#include <cstdio>
#include <fstream>
#include <sstream>

namespace modulate {

static std::string json_escape(const std::string &s) {
  std::ostringstream o;
  for (char c : s) {
    if (c == '"')
      o << "\\\"";
    else if (c == '\\')
      o << "\\\\";
    else if (c == '\b')
      o << "\\b";
    else if (c == '\f')
      o << "\\f";
    else if (c == '\n')
      o << "\\n";
    else if (c == '\r')
      o << "\\r";
    else if (c == '\t')
      o << "\\t";
    else if ((unsigned char)c < 0x20) {
      char buf[7];
      snprintf(buf, sizeof(buf), "\\u%04x", c);
      o << buf;
    } else
      o << c;
  }
  return o.str();
}

// Parses one quoted JSON string starting at `pos`.
static bool json_unescape(const std::string &line, size_t pos,
                          std::string &out) {
  if (pos >= line.size() || line[pos] != '"') {
    return false;
  }
  out.clear();
  for (size_t i = pos + 1; i < line.size(); ++i) {
    char c = line[i];
    if (c == '"') {
      return true;
    }
    if (c != '\\') {
      out += c;
      continue;
    }
    if (++i >= line.size()) {
      return false;
    }
    switch (line[i]) {
    case '"':
      out += '"';
      break;
    case '\\':
      out += '\\';
      break;
    case '/':
      out += '/';
      break;
    case 'b':
      out += '\b';
      break;
    case 'f':
      out += '\f';
      break;
    case 'n':
      out += '\n';
      break;
    case 'r':
      out += '\r';
      break;
    case 't':
      out += '\t';
      break;
    case 'u': {
      if (i + 4 >= line.size()) {
        return false;
      }
      unsigned int code = 0;
      if (std::sscanf(line.substr(i + 1, 4).c_str(), "%4x", &code) != 1 ||
          code > 0x7f) {
        return false;
      }
      out += static_cast<char>(code);
      i += 4;
      break;
    }
    default:
      return false;
    }
  }
  return false;
}

static std::string encode_entry(const TreeEntry &entry) {
  if (entry.type == NodeType::Directory) {
    return "d\t" + entry.path;
  }
  return "f\t" + entry.uuid + "\t" + entry.path;
}

static bool decode_entry(const std::string &text, TreeEntry &entry) {
  if (text.size() < 3 || text[1] != '\t') {
    return false;
  }
  if (text[0] == 'd') {
    entry.type = NodeType::Directory;
    entry.uuid.clear();
    entry.path = text.substr(2);
    return !entry.path.empty();
  }
  if (text[0] == 'f') {
    auto tab = text.find('\t', 2);
    if (tab == std::string::npos) {
      return false;
    }
    entry.type = NodeType::File;
    entry.uuid = text.substr(2, tab - 2);
    entry.path = text.substr(tab + 1);
    return !entry.path.empty();
  }
  return false;
}

static void flatten(const ProvenancedNode &node, const std::string &path,
                    const UuidOf &uuid_of, std::vector<TreeEntry> &out) {
  for (const auto &[name, child] : node.children) {
    std::string child_path = join_logical_path(path, name);
    if (child.is_dir()) {
      out.push_back({NodeType::Directory, child_path, ""});
      flatten(child, child_path, uuid_of, out);
    } else {
      out.push_back({NodeType::File, child_path, uuid_of(child.source)});
    }
  }
}

std::vector<TreeEntry> flatten_tree(const ProvenancedNode &tree,
                                    const UuidOf &uuid_of) {
  std::vector<TreeEntry> entries;
  flatten(tree, "", uuid_of, entries);
  return entries;
}

ProvenancedNode build_tree(const std::vector<TreeEntry> &entries,
                           const HandleOf &handle_of) {
  ProvenancedNode root = ProvenancedNode::empty_root();

  for (const auto &entry : entries) {
    std::vector<std::string> parts = split_logical_path(entry.path);
    if (parts.empty()) {
      throw OverlayError(ErrorKind::StateInvalid, "empty path in state");
    }

    ProvenancedNode *current = &root;
    for (size_t i = 0; i < parts.size(); ++i) {
      bool last = i + 1 == parts.size();
      bool want_dir = !last || entry.type == NodeType::Directory;

      auto it = current->children.find(parts[i]);
      if (it == current->children.end()) {
        ProvenancedNode child;
        child.name = parts[i];
        child.type = want_dir ? NodeType::Directory : NodeType::File;
        it = current->children.emplace(parts[i], std::move(child)).first;
      } else if (it->second.is_dir() != want_dir) {
        throw OverlayError(ErrorKind::StateInvalid,
                           "'" + entry.path + "' is both file and directory");
      }

      if (last && !want_dir) {
        it->second.source = handle_of(entry.uuid);
      }
      current = &it->second;
    }
  }

  return root;
}

static void write_array(std::ofstream &file, const std::string &key,
                        const std::vector<std::string> &items, bool trailing) {
  file << "  \"" << key << "\": [";
  if (items.empty()) {
    file << "]";
  } else {
    file << "\n";
    for (size_t i = 0; i < items.size(); ++i) {
      file << "    \"" << json_escape(items[i]) << "\"";
      if (i < items.size() - 1)
        file << ",";
      file << "\n";
    }
    file << "  ]";
  }
  file << (trailing ? ",\n" : "\n");
}

static std::vector<std::string> encode_entries(
    const std::vector<TreeEntry> &entries) {
  std::vector<std::string> items;
  for (const auto &entry : entries) {
    items.push_back(encode_entry(entry));
  }
  return items;
}

bool RuntimeState::save(const fs::path &path) const {
  if (path.has_parent_path() && !ensure_dir_exists(path.parent_path())) {
    return false;
  }

  fs::path tmp = path;
  tmp += ".tmp";
  {
    std::ofstream file(tmp);
    if (!file.is_open()) {
      LOG_ERROR("Failed to save runtime state to " + path.string());
      return false;
    }

    file << "{\n";
    file << "  \"version\": " << STATE_VERSION << ",\n";
    write_array(file, "active_sources", active_sources, true);
    write_array(file, "deployed", encode_entries(deployed), true);
    file << "  \"pending\": " << (has_pending ? "true" : "false") << ",\n";
    write_array(file, "pending_applied", encode_entries(pending_applied),
                false);
    file << "}\n";

    if (!file.good()) {
      LOG_ERROR("Failed to write runtime state to " + tmp.string());
      return false;
    }
  }

  std::error_code ec;
  fs::rename(tmp, path, ec);
  if (ec) {
    LOG_ERROR("Failed to replace " + path.string() + ": " + ec.message());
    return false;
  }
  return true;
}

static size_t parse_number(const std::string &line, const fs::path &path) {
  auto colon = line.find(':');
  std::string value = trim(line.substr(colon + 1), " \t,");
  try {
    size_t used = 0;
    unsigned long long n = std::stoull(value, &used);
    if (used != value.size()) {
      throw std::invalid_argument(value);
    }
    return static_cast<size_t>(n);
  } catch (const std::exception &) {
    throw OverlayError(ErrorKind::StateInvalid,
                       path.string() + ": bad number in '" + line + "'");
  }
}

RuntimeState load_runtime_state(const fs::path &path) {
  RuntimeState state;

  if (!fs::exists(path)) {
    return state;
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    throw OverlayError(ErrorKind::StateInvalid, "cannot open " + path.string());
  }

  std::vector<std::string> *array = nullptr;
  std::vector<std::string> deployed_items;
  std::vector<std::string> pending_items;
  bool saw_version = false;

  std::string line;
  while (std::getline(file, line)) {
    line = trim(line);
    if (line.empty() || line == "{" || line == "}") {
      continue;
    }

    if (array != nullptr) {
      if (line == "]" || line == "],") {
        array = nullptr;
        continue;
      }
      std::string item;
      if (!json_unescape(line, 0, item)) {
        throw OverlayError(ErrorKind::StateInvalid,
                           path.string() + ": bad array item '" + line + "'");
      }
      array->push_back(item);
      continue;
    }

    std::vector<std::string> *target = nullptr;
    if (line.find("\"active_sources\"") == 0)
      target = &state.active_sources;
    else if (line.find("\"deployed\"") == 0)
      target = &deployed_items;
    else if (line.find("\"pending_applied\"") == 0)
      target = &pending_items;

    if (target != nullptr) {
      if (line.find("[]") != std::string::npos) {
        continue;
      }
      if (line.back() != '[') {
        throw OverlayError(ErrorKind::StateInvalid,
                           path.string() + ": bad array '" + line + "'");
      }
      array = target;
    } else if (line.find("\"version\"") == 0) {
      if (parse_number(line, path) != static_cast<size_t>(STATE_VERSION)) {
        throw OverlayError(ErrorKind::StateInvalid,
                           path.string() + ": unsupported version");
      }
      saw_version = true;
    } else if (line.find("\"pending\"") == 0) {
      state.has_pending = line.find("true") != std::string::npos;
    } else {
      throw OverlayError(ErrorKind::StateInvalid,
                         path.string() + ": unexpected '" + line + "'");
    }
  }

  if (array != nullptr || !saw_version) {
    throw OverlayError(ErrorKind::StateInvalid,
                       path.string() + ": truncated state file");
  }

  for (const auto &item : deployed_items) {
    TreeEntry entry;
    if (!decode_entry(item, entry)) {
      throw OverlayError(ErrorKind::StateInvalid, "bad entry '" + item + "'");
    }
    state.deployed.push_back(entry);
  }
  for (const auto &item : pending_items) {
    TreeEntry entry;
    if (!decode_entry(item, entry)) {
      throw OverlayError(ErrorKind::StateInvalid, "bad entry '" + item + "'");
    }
    state.pending_applied.push_back(entry);
  }

  return state;
}

} // namespace modulate
