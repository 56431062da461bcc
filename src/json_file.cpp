#include "meshwx/json_file.hpp"
#include "meshwx/errors.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;
using nlohmann::json;

namespace meshwx {

bool read_json_file(const std::string& path, json& out) {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    if (ec) throw PersistenceError("stat " + path + ": " + ec.message());
    return false;
  }

  std::ifstream in(path);
  if (!in) throw PersistenceError("cannot open " + path);

  try {
    json j;
    in >> j;
    out = std::move(j);
  } catch (const json::parse_error& e) {
    throw PersistenceError("malformed JSON in " + path + ": " + e.what());
  }
  return true;
}

void atomic_write_json(const std::string& path, const json& doc, int indent) {
  const fs::path target(path);
  std::error_code ec;

  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path(), ec);
    if (ec) throw PersistenceError("mkdir " + target.parent_path().string() + ": " + ec.message());
  }

  fs::path tmp = target;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) throw PersistenceError("cannot create " + tmp.string());
    out << doc.dump(indent) << '\n';
    out.flush();
    if (!out) throw PersistenceError("short write to " + tmp.string());
  }

  fs::rename(tmp, target, ec);
  if (ec) {
    const std::string why = ec.message();
    fs::remove(tmp, ec);
    throw PersistenceError("rename onto " + path + ": " + why);
  }
}

} // namespace meshwx
