#pragma once

#include "types.hpp"

#include <cstddef>
#include <deque>
#include <map>
#include <string>
#include <vector>

namespace adapt {

// Read-only item bank keyed by id and grouped by topic. Items keep their
// insertion order within a topic; pointers stay valid for the catalog's lifetime.
class ItemCatalog {
public:
  ItemCatalog() = default;
  explicit ItemCatalog(std::vector<Item> items);

  ItemCatalog(const ItemCatalog&) = delete;
  ItemCatalog& operator=(const ItemCatalog&) = delete;
  ItemCatalog(ItemCatalog&&) = default;
  ItemCatalog& operator=(ItemCatalog&&) = default;

  // Throws std::invalid_argument on invalid parameters or a duplicate id.
  const Item& add(Item item);

  const Item* find(const std::string& id) const;
  const Item& at(const std::string& id) const;

  std::vector<const Item*> items_for_topic(const std::string& topic) const;
  const std::vector<std::string>& topics() const { return topics_; }
  std::vector<const Item*> all() const;

  std::size_t size() const { return items_.size(); }
  bool empty() const { return items_.empty(); }

private:
  std::deque<Item> items_;
  std::map<std::string, const Item*> by_id_;
  std::map<std::string, std::vector<const Item*>> by_topic_;
  std::vector<std::string> topics_;
};

} // namespace adapt
