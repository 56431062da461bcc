#include "meshwx/node_directory.hpp"
#include "meshwx/errors.hpp"

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <utility>

namespace meshwx {

NodeDirectory::NodeDirectory(std::vector<Node> nodes)
: nodes_(std::move(nodes)) {}

const Node& NodeDirectory::resolve(const std::string& name) const {
  for (const auto& n : nodes_) {
    if (n.name == name) return n;
  }
  throw NotFoundError("unknown node '" + name + "'");
}

const Node* NodeDirectory::find_by_id(uint32_t id) const {
  for (const auto& n : nodes_) {
    if (n.id == id) return &n;
  }
  return nullptr;
}

bool NodeDirectory::contains(const std::string& name) const {
  for (const auto& n : nodes_) {
    if (n.name == name) return true;
  }
  return false;
}

std::vector<std::string> NodeDirectory::targets_for(uint32_t local_id, const std::string& selected) const {
  std::vector<std::string> out;
  if (find_by_id(local_id)) {
    for (const auto& n : nodes_) {
      if (n.id != local_id) out.push_back(n.name);
    }
    return out;
  }
  out.push_back(resolve(selected).name);
  return out;
}

// ---------- id text ----------

bool parse_node_id(const std::string& text, uint32_t& out) {
  if (text.empty()) return false;

  int base = 10;
  size_t start = 0;
  if (text[0] == '!') {
    base = 16; start = 1;
  } else if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
    base = 16; start = 2;
  }
  if (start >= text.size()) return false;

  for (size_t i = start; i < text.size(); ++i) {
    const unsigned char c = static_cast<unsigned char>(text[i]);
    if (base == 16 ? !std::isxdigit(c) : !std::isdigit(c)) return false;
  }

  errno = 0;
  char* end = nullptr;
  const unsigned long long v = std::strtoull(text.c_str() + start, &end, base);
  if (errno != 0 || *end != '\0' || v > 0xFFFFFFFFull) return false;
  out = static_cast<uint32_t>(v);
  return true;
}

std::string format_node_id(uint32_t id) {
  char buf[12];
  std::snprintf(buf, sizeof(buf), "!%08x", id);
  return buf;
}

} // namespace meshwx
