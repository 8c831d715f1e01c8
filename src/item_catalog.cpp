#include "adapt/item_catalog.hpp"

#include <stdexcept>
#include <utility>

namespace adapt {

ItemCatalog::ItemCatalog(std::vector<Item> items) {
  for (auto& item : items) {
    add(std::move(item));
  }
}

const Item& ItemCatalog::add(Item item) {
  item.validate();
  if (by_id_.count(item.id) > 0) {
    throw std::invalid_argument("Duplicate item id: " + item.id);
  }
  items_.push_back(std::move(item));
  const Item* stored = &items_.back();
  by_id_.emplace(stored->id, stored);
  auto& bucket = by_topic_[stored->topic];
  if (bucket.empty()) {
    topics_.push_back(stored->topic);
  }
  bucket.push_back(stored);
  return *stored;
}

const Item* ItemCatalog::find(const std::string& id) const {
  auto it = by_id_.find(id);
  return it == by_id_.end() ? nullptr : it->second;
}

const Item& ItemCatalog::at(const std::string& id) const {
  const Item* item = find(id);
  if (!item) {
    throw std::out_of_range("Unknown item id: " + id);
  }
  return *item;
}

std::vector<const Item*> ItemCatalog::items_for_topic(const std::string& topic) const {
  auto it = by_topic_.find(topic);
  if (it == by_topic_.end()) {
    return {};
  }
  return it->second;
}

std::vector<const Item*> ItemCatalog::all() const {
  std::vector<const Item*> out;
  out.reserve(items_.size());
  for (const auto& item : items_) {
    out.push_back(&item);
  }
  return out;
}

} // namespace adapt
