#include <sentinel/common/critical.hpp>
#include <sentinel/execution/state_view.hpp>
#include <algorithm>
#include <iterator>

using namespace sentinel::schema;

namespace sentinel::execution {

namespace {

bool has_prefix(const bytes_t& key, const bytes_view_t& prefix) {
  return key.size() >= prefix.size() &&
         std::equal(std::begin(prefix), std::end(prefix), std::begin(key));
}

}  // namespace

state_view::state_view(const storage_t& storage) : storage_(&storage) {}

state_view::state_view(state_view* parent) : parent_(parent) {
  if (parent_ == nullptr) {
    sentinel::common::critical("state_view overlay requires a parent layer");
  }
}

std::optional<bytes_t> state_view::read(const bytes_view_t& key) const {
  auto it = writes_.find(make_bytes(key));
  if (it != std::end(writes_)) {
    return it->second;
  }
  if (parent_ != nullptr) {
    return parent_->read(key);
  }
  return storage_->read(key);
}

void state_view::write(const bytes_view_t& key, bytes_t value) {
  writes_[make_bytes(key)] = std::move(value);
}

void state_view::erase(const bytes_view_t& key) {
  writes_[make_bytes(key)] = std::nullopt;
}

std::vector<sentinel::storage::key_value_entry_t> state_view::list_by_prefix(
    const bytes_view_t& prefix) const {
  auto base = parent_ != nullptr ? parent_->list_by_prefix(prefix)
                                 : storage_->list_by_prefix(prefix);
  auto merged = std::map<bytes_t, bytes_t>{};
  for (auto& [key, value] : base) {
    merged.emplace(std::move(key), std::move(value));
  }
  for (auto it = writes_.lower_bound(make_bytes(prefix));
       it != std::end(writes_) && has_prefix(it->first, prefix); ++it) {
    if (it->second) {
      merged[it->first] = *it->second;
    } else {
      merged.erase(it->first);
    }
  }

  auto out = std::vector<sentinel::storage::key_value_entry_t>{};
  out.reserve(merged.size());
  for (auto& [key, value] : merged) {
    out.emplace_back(key, std::move(value));
  }
  return out;
}

void state_view::merge_into_parent() {
  if (parent_ == nullptr) {
    sentinel::common::critical("state_view has no parent layer to merge into");
  }
  for (auto& [key, value] : writes_) {
    parent_->writes_[key] = std::move(value);
  }
  writes_.clear();
}

std::vector<sentinel::storage::write_entry_t> state_view::take_writes() {
  auto out = std::vector<sentinel::storage::write_entry_t>{};
  out.reserve(writes_.size());
  for (auto& [key, value] : writes_) {
    out.emplace_back(key, std::move(value));
  }
  writes_.clear();
  return out;
}

const std::map<bytes_t, std::optional<bytes_t>>& state_view::writes() const {
  return writes_;
}

}  // namespace sentinel::execution
