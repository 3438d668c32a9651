#include "store/paste_store.hpp"
#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace pastebin {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

PasteStore::PasteStore(std::size_t device_paste_limit)
  : device_paste_limit_(device_paste_limit) {
  if (device_paste_limit_ == 0) {
    BOOST_LOG_TRIVIAL(error) << "Paste store: Invalid device paste limit: 0";
    throw std::invalid_argument("Paste store: Device paste limit must be at least 1");
  }
  BOOST_LOG_TRIVIAL(info) << "Paste store: Initialized with device paste limit: " << device_paste_limit_;
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

void PasteStore::insert(const std::string& id, Bytes content, const std::string& device_code) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  // Eviction sees the contents as they were before this insert
  purge_device_old(device_code);

  if (index_.count(id) != 0) {
    BOOST_LOG_TRIVIAL(warning) << "Paste store: Replacing live paste with id: " << id;
    erase_entry(id);
  }
  insert_locked(id, std::move(content), device_code);
}

bool PasteStore::try_insert(const std::string& id, Bytes content, const std::string& device_code) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  if (index_.count(id) != 0) {
    BOOST_LOG_TRIVIAL(debug) << "Paste store: Refusing insert, id already live: " << id;
    return false;
  }
  purge_device_old(device_code);
  insert_locked(id, std::move(content), device_code);
  return true;
}

std::optional<Bytes> PasteStore::lookup(const std::string& id, const std::string& device_code) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  auto it = index_.find(id);
  if (it == index_.end() || it->second->second.device_code != device_code) {
    BOOST_LOG_TRIVIAL(debug) << "Paste store: No paste " << id << " for device " << device_code;
    return std::nullopt;
  }
  return it->second->second.content;
}


//==============================================
// QUERY OPERATIONS
//==============================================

std::vector<std::string> PasteStore::list_ids(const std::string& device_code) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  auto it = device_index_.find(device_code);
  if (it == device_index_.end()) {
    return {};
  }
  return std::vector<std::string>(it->second.rbegin(), it->second.rend());
}

std::unordered_set<std::string> PasteStore::known_owners() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  std::unordered_set<std::string> owners;
  owners.reserve(device_index_.size());
  for (const auto& device : device_index_) {
    owners.insert(device.first);
  }
  return owners;
}

std::size_t PasteStore::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entries_.size();
}


//==============================================
// EVICTION SUPPORT
//==============================================

void PasteStore::insert_locked(const std::string& id, Bytes content, const std::string& device_code) {
  const std::size_t content_size = content.size();
  entries_.emplace_back(id, Paste{std::move(content), device_code});
  index_[id] = std::prev(entries_.end());
  device_index_[device_code].push_back(id);

  BOOST_LOG_TRIVIAL(info) << "Paste store: Stored " << content_size << " bytes with id: " << id;
}

void PasteStore::purge_device_old(const std::string& device_code) {
  auto it = device_index_.find(device_code);
  if (it == device_index_.end()) {
    return;
  }

  // Keep limit - 1 so the incoming paste brings the device back to the limit
  while (it->second.size() >= device_paste_limit_) {
    const std::string oldest = it->second.front();
    BOOST_LOG_TRIVIAL(debug) << "Paste store: Evicting paste " << oldest << " of device " << device_code;
    erase_entry(oldest);

    it = device_index_.find(device_code);
    if (it == device_index_.end()) {
      return;
    }
  }
}

void PasteStore::erase_entry(const std::string& id) {
  auto it = index_.find(id);
  if (it == index_.end()) {
    return;
  }

  const std::string owner = it->second->second.device_code;
  entries_.erase(it->second);
  index_.erase(it);

  auto device = device_index_.find(owner);
  if (device == device_index_.end()) {
    return;
  }
  auto& ids = device->second;
  ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
  if (ids.empty()) {
    device_index_.erase(device);
  }
}

} // namespace store
} // namespace pastebin
