/**
 * @file node_directory.hpp
 * @brief Read-only name → node map loaded from the station configuration.
 *
 * Names are what people type and what the stats file is keyed by; ids are
 * what the radio understands. The directory is filled once at startup and
 * never changes afterwards, so it carries no lock.
 */
#ifndef MESHWX_NODE_DIRECTORY_HPP
#define MESHWX_NODE_DIRECTORY_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace meshwx {

struct Node {
  std::string name;
  uint32_t id{0};
  std::optional<std::vector<uint8_t>> public_key;  ///< present → PKI encryption
};

class NodeDirectory {
public:
  NodeDirectory() = default;
  explicit NodeDirectory(std::vector<Node> nodes);

  /// @throws NotFoundError for an unknown name.
  const Node& resolve(const std::string& name) const;

  const Node* find_by_id(uint32_t id) const;
  bool contains(const std::string& name) const;

  /**
   * @brief Destinations for one telemetry round.
   *
   * If @p local_id belongs to a configured node, every other configured node
   * is a target (the station is itself part of the roster). Otherwise the
   * single @p selected node is the target.
   *
   * @throws NotFoundError if @p selected is needed and unknown.
   */
  std::vector<std::string> targets_for(uint32_t local_id, const std::string& selected) const;

  const std::vector<Node>& nodes() const { return nodes_; }
  size_t size() const { return nodes_.size(); }

private:
  std::vector<Node> nodes_;
};

/// "!a1b2c3d4" (mesh notation), "0xa1b2c3d4" or decimal. False on junk.
bool parse_node_id(const std::string& text, uint32_t& out);

/// Mesh notation of a node id: "!" + 8 lowercase hex digits.
std::string format_node_id(uint32_t id);

} // namespace meshwx

#endif // MESHWX_NODE_DIRECTORY_HPP
